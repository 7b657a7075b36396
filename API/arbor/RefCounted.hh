//
// RefCounted.hh
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
#include <atomic>
#include <stdint.h>
#include <utility>

namespace arbor {

    /** Simple thread-safe ref-counting implementation. A Stash is one of these, so that it stays
        alive exactly as long as some Tree (or collection) still points into it.
        Note: The ref-count starts at 0, so you must call retain() on an instance, or assign it
        to a Retained, right after constructing it. */
    class RefCounted {
    public:
        RefCounted()                            { }

        int refCount() const ARBOR_PURE         {return _refCount;}

    protected:
        RefCounted(const RefCounted &)          { }

        /** Destructor is accessible only so that it can be overridden.
            Never call delete, only release! Overrides should be made protected or private. */
        virtual ~RefCounted();

    private:
        template <typename T>
        friend T* retain(T*) noexcept;
        friend void release(const RefCounted*) noexcept;

#if ARBOR_DEBUG
        void _retain() const noexcept           {_careful_retain();}
        void _release() const noexcept          {_careful_release();}
#else
        ALWAYS_INLINE void _retain() const noexcept   { ++_refCount; }
        void _release() const noexcept;
#endif

        static constexpr int32_t kCarefulInitialRefCount = -6666666;
        void _careful_retain() const noexcept;
        void _careful_release() const noexcept;

        mutable std::atomic<int32_t> _refCount
#if ARBOR_DEBUG
                                               {kCarefulInitialRefCount};
#else
                                               {0};
#endif
    };


    /** Retains a RefCounted object and returns the object. Does nothing given a null pointer. */
    template <typename REFCOUNTED>
    ALWAYS_INLINE REFCOUNTED* retain(REFCOUNTED *r) noexcept {
        if (r) r->_retain();
        return r;
    }

    /** Releases a RefCounted object. Does nothing given a null pointer. */
    NOINLINE void release(const RefCounted *r) noexcept;


    /** A smart pointer that retains the RefCounted instance it holds. */
    template <typename T>
    class Retained {
    public:
        Retained() noexcept                      :_ref(nullptr) { }
        Retained(T *t) noexcept                  :_ref(retain(t)) { }

        Retained(const Retained &r) noexcept     :_ref(retain(r._ref)) { }
        Retained(Retained &&r) noexcept          :_ref(std::move(r).detach()) { }

        ~Retained()                              {release(_ref);}

        operator T* () const noexcept ARBOR_PURE     {return _ref;}
        T* operator-> () const noexcept ARBOR_PURE   {return _ref;}
        T* get() const noexcept ARBOR_PURE           {return _ref;}

        explicit operator bool () const ARBOR_PURE   {return (_ref != nullptr);}

        Retained& operator=(T *t) noexcept {
            auto oldRef = _ref;
            _ref = retain(t);
            release(oldRef);
            return *this;
        }

        Retained& operator=(const Retained &r) noexcept {
            return *this = r._ref;
        }

        Retained& operator= (Retained &&r) noexcept {
            // `r` is about to be destructed by the caller anyway, and will then release
            // my previous `_ref`.
            std::swap(_ref, r._ref);
            return *this;
        }

        T* detach() && noexcept                  {auto r = _ref; _ref = nullptr; return r;}

    private:
        T *_ref;
    };


    /** Easy instantiation of a ref-counted object: `auto f = retained(new Foo());`*/
    template <typename REFCOUNTED>
    inline Retained<REFCOUNTED> retained(REFCOUNTED *r) noexcept {
        return Retained<REFCOUNTED>(r);
    }

}
