//
// Location.hh
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
#include "arbor/Hash.hh"
#include <functional>
#include <iosfwd>
#include <stdint.h>

namespace arbor {
    class StashBase;

    /** An opaque handle to a node stored in a Stash.
        A Location names its Stash, a slot within it, and the slot's generation; the generation
        changes every time the slot is freed, so a stale Location can be told apart from a live
        one. Only a Stash can create a non-empty Location.
        A default-constructed Location is "none", i.e. an empty subtree. */
    class Location {
    public:
        constexpr Location() noexcept = default;

        bool none() const noexcept                  {return _stash == 0;}
        explicit operator bool() const noexcept     {return _stash != 0;}

        bool operator== (const Location &loc) const noexcept {
            return _stash == loc._stash && _index == loc._index && _generation == loc._generation;
        }
        bool operator!= (const Location &loc) const noexcept {return !(*this == loc);}

        hash_t hash() const noexcept {
            return MixHash((hash_t(_stash) << 32 | _index) ^ (hash_t(_generation) << 20));
        }

        uint32_t stashID() const noexcept           {return _stash;}

    private:
        friend class StashBase;
        friend std::ostream& operator<< (std::ostream&, Location);

        constexpr Location(uint32_t stash, uint32_t index, uint32_t generation) noexcept
        :_stash(stash), _index(index), _generation(generation) { }

        uint32_t _stash {0};            // ID of owning Stash; 0 means none
        uint32_t _index {0};            // Slot index in the Stash
        uint32_t _generation {0};       // Slot generation when this Location was minted
    };

    std::ostream& operator<< (std::ostream&, Location);

}

namespace std {
    template <>
    struct hash<arbor::Location> {
        size_t operator() (const arbor::Location &loc) const noexcept {return size_t(loc.hash());}
    };
}
