//
// Config.hh
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
#include "arbor/Aggregators.hh"
#include "arbor/Hash.hh"
#include <functional>
#include <utility>

namespace arbor {

    /** What `insert` does when the tree already has an element with an equal key. */
    enum class DuplicatePolicy {
        kKeepExisting,          // Leave the tree unchanged
        kReplace,               // Replace the existing element with the new one
    };

    /** Which version of an element survives a union, when both inputs have its key. */
    enum class MergePolicy {
        kPreferLeft,
        kPreferRight,
    };


    // A configuration is a stateless struct describing one kind of collection. Tree<CONFIG>
    // expects these members:
    //
    //     using element_type, key_type;
    //     using aggregators = AggregatorList<...>;     // must include Cardinality
    //     static constexpr bool   kOrdered;            // ordered by `less`, or positional
    //     static constexpr hash_t kSalt;
    //     static const key_type& keyOf(const element_type&);
    //     static bool   less(const key_type&, const key_type&);       // if kOrdered
    //     static hash_t hashKey(const key_type&, hash_t seed);        // determines the weight
    //     static hash_t hashElement(const element_type&, hash_t seed);
    //     static bool   same(const element_type&, const element_type&);
    //
    // The weight of an element is WeightOf(hashKey(keyOf(e), kSalt)).
    // To customize, derive from one of the configurations below and redeclare members; the
    // hash functions take the seed as a parameter so that a redeclared kSalt takes effect.


    /** Configuration of a sorted set of unique values. */
    template <class T, class Compare = std::less<T>, class Hash = Hasher<T>>
    struct SetConfig {
        using element_type = T;
        using key_type = T;
        using aggregators = AggregatorList<Cardinality, CheckSum, Max>;

        static constexpr bool   kOrdered = true;
        static constexpr hash_t kSalt = kSetSalt;

        static const key_type& keyOf(const element_type &e) noexcept   {return e;}
        static bool less(const key_type &a, const key_type &b)          {return Compare{}(a, b);}
        static hash_t hashKey(const key_type &k, hash_t seed)           {return Hash{}(k, seed);}
        static hash_t hashElement(const element_type &e, hash_t seed)   {return Hash{}(e, seed);}
        static bool same(const element_type &a, const element_type &b) {
            return !less(a, b) && !less(b, a);
        }
    };


    /** Configuration of a sorted map: elements are key/value pairs ordered by key. */
    template <class K, class V, class Compare = std::less<K>,
              class KeyHash = Hasher<K>, class ValueHash = Hasher<V>>
    struct MapConfig {
        using key_type = K;
        using mapped_type = V;
        using element_type = std::pair<K,V>;
        using aggregators = AggregatorList<Cardinality, CheckSum, Key, KeySum, ValSum>;

        static constexpr bool   kOrdered = true;
        static constexpr hash_t kSalt = kMapSalt;

        static const key_type& keyOf(const element_type &e) noexcept       {return e.first;}
        static const mapped_type& valueOf(const element_type &e) noexcept  {return e.second;}
        static bool less(const key_type &a, const key_type &b)          {return Compare{}(a, b);}
        static hash_t hashKey(const key_type &k, hash_t seed)           {return KeyHash{}(k, seed);}
        static hash_t hashValue(const mapped_type &v, hash_t seed)      {return ValueHash{}(v, seed);}
        static hash_t hashElement(const element_type &e, hash_t seed) {
            return CombineHash(hashKey(e.first, seed), hashValue(e.second, seed));
        }
        static bool same(const element_type &a, const element_type &b) {
            return !less(a.first, b.first) && !less(b.first, a.first) && a.second == b.second;
        }
    };


    /** Configuration of a vector: elements are ordered by position, not by value. */
    template <class T, class Hash = Hasher<T>>
    struct VectorConfig {
        using element_type = T;
        using key_type = T;
        using aggregators = AggregatorList<Cardinality, CheckSum>;

        static constexpr bool   kOrdered = false;
        static constexpr hash_t kSalt = kVectorSalt;

        static const key_type& keyOf(const element_type &e) noexcept   {return e;}
        static hash_t hashKey(const key_type &k, hash_t seed)           {return Hash{}(k, seed);}
        static hash_t hashElement(const element_type &e, hash_t seed)   {return Hash{}(e, seed);}
        static bool same(const element_type &a, const element_type &b) {return a == b;}
    };

}
