//
// betterassert.cc
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "betterassert.hh"
#include <stdio.h>
#include <string.h>

namespace arbor {

    // Strips the directory from a path, unless the compiler already did (__FILE_NAME__).
    static const char* baseName(const char *file) {
        const char *slash = strrchr(file, '/');
        return slash ? slash + 1 : file;
    }


    __cold
    void _check_failed(CheckKind kind, const char *cond, const char *fn,
                       const char *file, int line)
    {
        const char *what = "Assertion";
        if (kind == CheckKind::kPrecondition)
            what = "Precondition";
        else if (kind == CheckKind::kPostcondition)
            what = "Postcondition";

        char buf[1024];
        snprintf(buf, sizeof(buf), "arbor: %s failed: `%s` in %s [%s:%d]",
                 what, cond, (fn ? fn : "?"), baseName(file), line);
        fprintf(stderr, "%s\n", buf);

        if (kind == CheckKind::kPrecondition)
            throw std::invalid_argument(buf);
        else
            throw assertion_failure(buf);
    }

}
