//
// betterassert.hh
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

// Assertion macros that report the failed condition, function, file and line on stderr and then
// throw, instead of calling abort(). They're enabled in all builds regardless of `NDEBUG`.
//
// * `precondition()` checks a function's arguments or the state it's called in; a failure is the
//   caller's bug. A Location handed to the wrong Stash, or a stale one, fails here.
//   Throws `std::invalid_argument`.
// * `postcondition()` checks a function's result; a failure is the function's own bug.
//   Throws `arbor::assertion_failure`.
// * `assert_always()` checks intermediate state, e.g. a reference count about to underflow.
//   Throws `arbor::assertion_failure`.

#ifndef assert_always
    #include "arbor/PlatformCompat.hh"
    #include <stdexcept>
    #include <string>

    #if defined(__FILE_NAME__)
        #define _ARBOR_ASSERT_FILE __FILE_NAME__
    #else
        #define _ARBOR_ASSERT_FILE __FILE__
    #endif

    #define _ARBOR_CHECK(KIND, e) \
        ((void) (_usuallyTrue(!!(e)) ? ((void)0) \
                 : ::arbor::_check_failed(::arbor::CheckKind::KIND, #e, __PRETTY_FUNCTION__, \
                                          _ARBOR_ASSERT_FILE, __LINE__)))

    #define assert_always(e)    _ARBOR_CHECK(kAssertion, e)
    #define precondition(e)     _ARBOR_CHECK(kPrecondition, e)
    #define postcondition(e)    _ARBOR_CHECK(kPostcondition, e)

    namespace arbor {
        enum class CheckKind {
            kAssertion,
            kPrecondition,
            kPostcondition,
        };

        [[noreturn]] NOINLINE void _check_failed(CheckKind, const char *condition,
                                                 const char *fn, const char *file, int line);

        class assertion_failure : public std::logic_error {
        public:
            explicit assertion_failure(const std::string &what) :logic_error(what) { }
        };
    }
#endif // assert_always
