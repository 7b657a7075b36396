//
// ArborException.hh
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "arbor/PlatformCompat.hh"
#include <stdexcept>
#include <string>

namespace arbor {

    // Error codes for conditions a caller can reasonably recover from.
    // Programming errors (bad Locations, ref-count underflow) go through betterassert instead.
    typedef enum {
        NoError = 0,
        MemoryError,        // Out of memory, or a Stash ran out of slots
        OutOfRange,         // Positional index past the end of a collection
        InvalidData,        // Bad input, e.g. an incompatible configuration
        NotFound,           // Key not found (only by APIs documented to throw)
        InternalError,      // This shouldn't happen
    } ErrorCode;


    class ArborException : public std::runtime_error {
    public:

        ArborException(ErrorCode code_, const std::string &what);

        [[noreturn]] static void _throw(ErrorCode code, const char *what, ...) __printflike(2,3);

        static ErrorCode getCode(const std::exception&) noexcept;

        const ErrorCode code;
    };

    #define throwIf(BAD, ERROR, MESSAGE, ...) \
     if (_usuallyTrue(!(BAD))) ; else arbor::ArborException::_throw(ERROR, MESSAGE, ##__VA_ARGS__)

}
