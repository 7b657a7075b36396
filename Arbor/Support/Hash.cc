//
// Hash.cc
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "arbor/Hash.hh"

namespace arbor {

    __hot hash_t HashBytes(const void *bytes, size_t size, hash_t seed) noexcept {
        // FNV-1a hash function, 64-bit variant, with the offset basis perturbed by the seed.
        // <https://en.wikipedia.org/wiki/Fowler–Noll–Vo_hash_function#FNV-1a_hash>
        // FNV's high bits are weak for short inputs, and weights come from the high bits,
        // so the result goes through MixHash.
        auto byte = (const uint8_t*)bytes;
        hash_t h = 14695981039346656037ULL ^ MixHash(seed);
        for (size_t i = 0; i < size; i++, byte++) {
            h = (h ^ *byte) * 1099511628211ULL;
        }
        return MixHash(h ^ hash_t(size));
    }

}
