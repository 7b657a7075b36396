//
// ArborException.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "ArborException.hh"
#include <memory>
#include <new>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

namespace arbor {

    static const char* const kErrorNames[] = {
        "",
        "memory error",
        "index out of range",
        "invalid input data",
        "key not found",
        "internal Arbor library error",
    };


    ArborException::ArborException(ErrorCode code_, const std::string &what)
    :std::runtime_error(what)
    ,code(code_)
    { }


    __cold
    void ArborException::_throw(ErrorCode code, const char *what, ...) {
        std::string message = kErrorNames[code];
        if (what) {
            va_list args;
            va_start(args, what);
            char *msg;
            int len = vasprintf(&msg, what, args);
            va_end(args);
            if (len >= 0) {
                message += std::string(": ") + msg;
                free(msg);
            }
        }
        throw ArborException(code, message);
    }


    __cold
    ErrorCode ArborException::getCode(const std::exception &x) noexcept {
        auto arborx = dynamic_cast<const ArborException*>(&x);
        if (arborx)
            return arborx->code;
        else if (nullptr != dynamic_cast<const std::bad_alloc*>(&x))
            return MemoryError;
        else
            return InternalError;
    }

}
