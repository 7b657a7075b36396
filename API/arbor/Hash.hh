//
// Hash.hh
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
#include "arbor/PlatformCompat.hh"
#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace arbor {

    using hash_t  = uint64_t;
    using level_t = unsigned;

    /** The highest possible weight: the number of bits in a hash_t. */
    static constexpr level_t kMaxLevel = 8 * sizeof(hash_t);

    /** Salts for the built-in configurations. Trees built with different salts never share
        structure; changing one of these breaks structural sharing with older trees. */
    static constexpr hash_t kSetSalt    = 0x5e7a5e7a9e3779b9;
    static constexpr hash_t kMapSalt    = 0x3a9c3a9c7f4a7c15;
    static constexpr hash_t kVectorSalt = 0x7ec7ec7ec2b2ae35;


    /** 64-bit avalanche finalizer (MurmurHash3's fmix64). It's a bijection, so distinct inputs
        always produce distinct outputs. */
    constexpr hash_t MixHash(hash_t h) noexcept {
        h ^= h >> 33;
        h *= 0xff51afd7ed558ccdULL;
        h ^= h >> 33;
        h *= 0xc4ceb9fe1a85ec53ULL;
        h ^= h >> 33;
        return h;
    }

    /** Combines two hashes; order-sensitive. */
    constexpr hash_t CombineHash(hash_t a, hash_t b) noexcept {
        return MixHash(a ^ (b + 0x9e3779b97f4a7c15ULL + (a << 6) + (a >> 2)));
    }

    /** Hashes a range of bytes with the given seed. */
    hash_t HashBytes(const void *bytes, size_t size, hash_t seed) noexcept ARBOR_PURE;


    /** The WeightFunction: the number of leading zero bits in a hash, from 0 to kMaxLevel.
        Over uniformly distributed hashes, P(weight >= k) = 2^-k. */
    inline level_t WeightOf(hash_t h) noexcept {
        if (h == 0)
            return kMaxLevel;
#if __has_builtin(__builtin_clzll)
        return level_t(__builtin_clzll(h));
#else
        level_t n = 0;
        for (; !(h & (hash_t(1) << (kMaxLevel - 1))); h <<= 1)
            ++n;
        return n;
#endif
    }


    /** The hash-function family used by the built-in configurations. Each specialization maps
        `(value, seed)` to a hash_t. There's no primary definition: an element type without a
        Hasher needs one supplied by its configuration. */
    template <class T, class Enable = void>
    struct Hasher;

    template <class T>
    struct Hasher<T, std::enable_if_t<std::is_integral<T>::value || std::is_enum<T>::value>> {
        hash_t operator() (T value, hash_t seed) const noexcept {
            return MixHash(hash_t(value) ^ MixHash(seed));
        }
    };

    template <class T>
    struct Hasher<T, std::enable_if_t<std::is_floating_point<T>::value>> {
        hash_t operator() (T value, hash_t seed) const noexcept {
            if (value == 0)
                value = 0;          // +0.0 and -0.0 compare equal, so must hash equal
            double d = double(value);
            uint64_t bits;
            memcpy(&bits, &d, sizeof(bits));
            return MixHash(bits ^ MixHash(seed));
        }
    };

    template <>
    struct Hasher<std::string_view> {
        hash_t operator() (std::string_view s, hash_t seed) const noexcept {
            return HashBytes(s.data(), s.size(), seed);
        }
    };

    template <>
    struct Hasher<std::string> {
        hash_t operator() (const std::string &s, hash_t seed) const noexcept {
            return HashBytes(s.data(), s.size(), seed);
        }
    };

    template <>
    struct Hasher<const char*> {
        hash_t operator() (const char *s, hash_t seed) const noexcept {
            return HashBytes(s, strlen(s), seed);
        }
    };

    template <class A, class B>
    struct Hasher<std::pair<A,B>> {
        hash_t operator() (const std::pair<A,B> &p, hash_t seed) const {
            return CombineHash(Hasher<A>{}(p.first, seed), Hasher<B>{}(p.second, seed));
        }
    };

}
