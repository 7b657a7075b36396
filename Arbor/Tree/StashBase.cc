//
// StashBase.cc
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "arbor/Stash.hh"
#include "ArborException.hh"
#include <ostream>
#include <stdio.h>

#define Warn(FMT, ...) fprintf(stderr, "WARNING: " FMT "\n", ##__VA_ARGS__)

namespace arbor {

    static std::atomic<uint32_t> sLastStashID {0};


    StashBase::StashBase(StashOptions options)
    :_id(++sLastStashID)
    ,_options(options)
    {
        throwIf(_id == 0, MemoryError, "Too many Stashes have been created");
    }


    StashBase::~StashBase() {
        if (size_t live = liveNodes(); live > 0)
            Warn("Stash #%u destructed with %zu live nodes; some Location was never released",
                 _id, live);
    }


    unsigned StashBase::chunkOf(uint32_t index, uint32_t *offset) noexcept {
        if (index < (1u << kFirstChunkBits)) {
            *offset = index;
            return 0;
        }
        unsigned highBit = 31 - __builtin_clz(index);
        *offset = index - (1u << highBit);
        return highBit - kFirstChunkBits + 1;
    }


    size_t StashBase::chunkSize(unsigned chunk) noexcept {
        return chunk == 0 ? (size_t(1) << kFirstChunkBits)
                          : (size_t(1) << (kFirstChunkBits + chunk - 1));
    }


    uint32_t StashBase::takeSlot(bool &isNew) {
        if (!_freeList.empty()) {
            uint32_t index = _freeList.back();
            _freeList.pop_back();
            isNew = false;
            return index;
        }
        uint32_t index = _slotCount.load(std::memory_order_relaxed);
        throwIf(index == UINT32_MAX, MemoryError, "Stash #%u is out of slots", _id);
        isNew = true;
        _slotCount.store(index + 1, std::memory_order_release);
        return index;
    }


    void StashBase::freeSlot(uint32_t index) {
        _freeList.push_back(index);
    }


    std::ostream& operator<< (std::ostream &out, Location loc) {
        if (!loc)
            return out << "@none";
        return out << '@' << loc._stash << ':' << loc._index << '.' << loc._generation;
    }

}
