//
// RefCounted.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "arbor/RefCounted.hh"
#include <exception>
#include <stdio.h>
#include <typeinfo>

namespace arbor {

#if !ARBOR_DEBUG
    __hot void RefCounted::_release() const noexcept {
        if (--_refCount <= 0)
            delete this;
    }
#endif


    __hot void release(const RefCounted *r) noexcept {
        if (r) r->_release();
    }


    // Ref-count corruption is reported here. There's no way to recover (these are called from
    // noexcept contexts) so it's logged and then the process is terminated.
    __cold static void fail(const RefCounted *obj, const char *what, int refCount,
                            bool fatal =true)
    {
        fprintf(stderr, "WARNING: RefCounted object <%s @ %p> %s while it had an invalid "
                        "refCount of %d (0x%x)\n",
                typeid(*obj).name(), (const void*)obj, what, refCount, unsigned(refCount));
        if (fatal)
            std::terminate();
    }


    RefCounted::~RefCounted() {
        // Store a garbage value to detect use-after-free
        int32_t oldRef = _refCount.exchange(-9999999);
        if (_usuallyFalse(oldRef != 0)) {
#if ARBOR_DEBUG
            if (oldRef != kCarefulInitialRefCount)
#endif
            {
                // Probably a direct call to delete, which is illegal; or another thread retained
                // the object after this thread's release() set the ref-count to 0.
                fail(this, "destructed", oldRef, false);
            }
        }
    }


    // In debug builds, sanity-check the ref-count on retain and release. This can detect a
    // corrupted object (garbage out-of-range refcount), or a race where one thread releases the
    // last reference while another thread (that shouldn't have a reference) retains it.

    void RefCounted::_careful_retain() const noexcept {
        auto oldRef = _refCount++;

        // Special case: the initial retain of a new object that takes it to refCount 1
        if (oldRef == kCarefulInitialRefCount) {
            _refCount = 1;
            return;
        }

        if (oldRef <= 0 || oldRef >= 10000000)
            fail(this, "retained", oldRef);
    }


    void RefCounted::_careful_release() const noexcept {
        auto oldRef = _refCount--;

        if (oldRef <= 0 || oldRef >= 10000000)
            fail(this, "released", oldRef);

        // If the refCount just went to 0, delete the object:
        if (oldRef == 1) delete this;
    }

}
