//
// PlatformCompat.hh
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
#include "arbor/CompilerSupport.h"

#ifdef _MSC_VER
    #define NOINLINE                        __declspec(noinline)
    #define ALWAYS_INLINE                   inline

    #include <BaseTsd.h>
    typedef SSIZE_T ssize_t;

    #define __printflike(A, B)

#else

    // Disables inlining a function. Use when the space savings are worth more than speed.
    #if __has_attribute(noinline)
    #  define NOINLINE                      __attribute((noinline))
    #else
    #  define NOINLINE
    #endif

    // Forces function to be inlined. Use with care for speed-critical code.
    #if __has_attribute(always_inline)
        #define ALWAYS_INLINE               __attribute__((always_inline)) inline
    #else
        #define ALWAYS_INLINE               inline
    #endif

    // Declares this function takes a printf-like format string, and the subsequent args should
    // be type-checked against it.
    #if __has_attribute(__format__) && !defined(__printflike)
    #  define __printflike(fmtarg, firstvararg) \
                            __attribute__((__format__ (__printf__, fmtarg, firstvararg)))
    #endif

#endif

#ifndef __printflike
    #define __printflike(A, B)
#endif

// Extra internal consistency checks (careful ref-counting, invariant checks after every
// structural operation) are enabled in debug builds.
#ifndef ARBOR_DEBUG
    #if defined(DEBUG) && DEBUG
        #define ARBOR_DEBUG 1
    #else
        #define ARBOR_DEBUG 0
    #endif
#endif
