//
// CompilerSupport.h
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#ifndef _ARBOR_COMPILER_SUPPORT_H
#define _ARBOR_COMPILER_SUPPORT_H

// The __has_xxx() macros are supported by [at least] Clang and GCC.
// Define them to return 0 on other compilers.

#ifndef __has_attribute
    #define __has_attribute(x) 0
#endif

#ifndef __has_builtin
    #define __has_builtin(x) 0
#endif


// NODISCARD expands to the C++17 `[[nodiscard]]` attribute.
#if (__cplusplus >= 201700L)
#  define NODISCARD                     [[nodiscard]]
#elif __has_attribute(warn_unused_result)
#  define NODISCARD                     __attribute__((warn_unused_result))
#else
#  define NODISCARD
#endif

// These have no effect on behavior, but they hint to the optimizer which branch of an 'if'
// statement to make faster.
#if __has_builtin(__builtin_expect)
#define _usuallyTrue(VAL)               __builtin_expect(VAL, true)
#define _usuallyFalse(VAL)              __builtin_expect(VAL, false)
#else
#define _usuallyTrue(VAL)               (VAL)
#define _usuallyFalse(VAL)              (VAL)
#endif


// ARBOR_PURE functions are _read-only_. They cannot write to memory (in a way that's detectable),
// and they cannot access volatile data or do I/O.
// Calling an ARBOR_PURE function twice in a row with the same arguments must return the same
// result.
#if __has_attribute(__pure__)
#  define ARBOR_PURE                    __attribute__((__pure__))
#else
#  define ARBOR_PURE
#endif

// ARBOR_CONST is even stricter than ARBOR_PURE. The function cannot access memory at all (except
// for reading immutable values like constants.) The return value can only depend on the
// parameters.
#if __has_attribute(__const__)
#  define ARBOR_CONST                   __attribute__((__const__))
#else
#  define ARBOR_CONST
#endif


// `__hot` marks a function as being a hot-spot, `__cold` as being rarely used (e.g. error
// handling.) They only affect optimized builds.
#if defined(__OPTIMIZE__) && (defined(__GNUC__) || __has_attribute(__hot__))
#   ifndef __hot
#       define __hot __attribute__((__hot__))
#   endif
#   ifndef __cold
#       define __cold __attribute__((__cold__))
#   endif
#else
#   ifndef __hot
#       define __hot
#   endif
#   ifndef __cold
#       define __cold
#   endif
#endif

#else // _ARBOR_COMPILER_SUPPORT_H
#warn "Compiler is not honoring #pragma once"
#endif
