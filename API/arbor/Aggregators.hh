//
// Aggregators.hh
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
#include <optional>
#include <stddef.h>
#include <tuple>
#include <type_traits>
#include <utility>

namespace arbor {

    // An aggregator "kind" is a class template parameterized by a configuration, providing:
    //
    //     using value_type = ...;
    //     static value_type identity();
    //     static value_type lift(const CONFIG::element_type&);
    //     static value_type combine(const value_type&, const value_type&);
    //
    // `combine` must be associative with `identity` as its neutral element. It need not be
    // commutative; it's always called with its arguments in tree order.
    // Every node caches `combine(combine(left, lift(pivot)), right)` for each configured kind.


    /** An order-sensitive polynomial digest of a sequence of hashes: for hashes h1..hn,
        `sum` is h1·B^(n-1) + h2·B^(n-2) + ... + hn and `scale` is B^n (mod 2^64). */
    struct Digest {
        hash_t sum   = 0;
        hash_t scale = 1;

        /** The base B. Odd, so `scale` can never become zero. (It's the 64-bit FNV prime.) */
        static constexpr hash_t kBase = 1099511628211ULL;

        static constexpr Digest identity() noexcept     {return {};}
        static constexpr Digest of(hash_t h) noexcept   {return {h, kBase};}

        static constexpr Digest combine(const Digest &a, const Digest &b) noexcept {
            return {a.sum * b.scale + b.sum, a.scale * b.scale};
        }

        bool operator== (const Digest &d) const noexcept {return sum == d.sum && scale == d.scale;}
        bool operator!= (const Digest &d) const noexcept {return !(*this == d);}
    };


    /** Number of elements. Required by every configuration. */
    template <class CONFIG>
    struct Cardinality {
        using value_type = size_t;
        static value_type identity() noexcept                           {return 0;}
        static value_type lift(const typename CONFIG::element_type&) noexcept {return 1;}
        static value_type combine(value_type a, value_type b) noexcept  {return a + b;}
    };


    /** Digest of the (salted) element hashes, in order. Equal collections have equal checksums;
        unequal ones almost certainly don't. */
    template <class CONFIG>
    struct CheckSum {
        using value_type = Digest;
        static value_type identity() noexcept                           {return {};}
        static value_type lift(const typename CONFIG::element_type &e) {
            return Digest::of(CONFIG::hashElement(e, CONFIG::kSalt));
        }
        static value_type combine(const value_type &a, const value_type &b) noexcept {
            return Digest::combine(a, b);
        }
    };


    namespace impl {
        template <class CONFIG>
        bool elementLess(const typename CONFIG::element_type &a,
                         const typename CONFIG::element_type &b)
        {
            if constexpr (CONFIG::kOrdered)
                return CONFIG::less(CONFIG::keyOf(a), CONFIG::keyOf(b));
            else
                return a < b;
        }
    }


    /** The greatest element: by the configuration's key order, or by `operator<` for positional
        collections. */
    template <class CONFIG>
    struct Max {
        using value_type = std::optional<typename CONFIG::element_type>;
        static value_type identity()                                    {return std::nullopt;}
        static value_type lift(const typename CONFIG::element_type &e)  {return e;}
        static value_type combine(const value_type &a, const value_type &b) {
            if (!a)
                return b;
            else if (!b)
                return a;
            return impl::elementLess<CONFIG>(*a, *b) ? b : a;
        }
    };


    /** The greatest key. */
    template <class CONFIG>
    struct Key {
        using value_type = std::optional<typename CONFIG::key_type>;
        static value_type identity()                                    {return std::nullopt;}
        static value_type lift(const typename CONFIG::element_type &e)  {return CONFIG::keyOf(e);}
        static value_type combine(const value_type &a, const value_type &b) {
            if (!a)
                return b;
            else if (!b)
                return a;
            return CONFIG::less(*a, *b) ? b : a;
        }
    };


    /** Digest of the key hashes alone. Two maps with equal KeySums have the same set of keys. */
    template <class CONFIG>
    struct KeySum {
        using value_type = Digest;
        static value_type identity() noexcept                           {return {};}
        static value_type lift(const typename CONFIG::element_type &e) {
            return Digest::of(CONFIG::hashKey(CONFIG::keyOf(e), CONFIG::kSalt));
        }
        static value_type combine(const value_type &a, const value_type &b) noexcept {
            return Digest::combine(a, b);
        }
    };


    /** Digest of the value hashes alone, in key order. */
    template <class CONFIG>
    struct ValSum {
        using value_type = Digest;
        static value_type identity() noexcept                           {return {};}
        static value_type lift(const typename CONFIG::element_type &e) {
            return Digest::of(CONFIG::hashValue(CONFIG::valueOf(e), CONFIG::kSalt));
        }
        static value_type combine(const value_type &a, const value_type &b) noexcept {
            return Digest::combine(a, b);
        }
    };


#pragma mark - COMPOSITION:


    namespace impl {
        template <template <class> class A, template <class> class B>
        struct is_same_kind : std::false_type { };

        template <template <class> class A>
        struct is_same_kind<A, A> : std::true_type { };

        // Index of kind K in the list; equal to the list's length if absent.
        template <template <class> class K, template <class> class... Kinds>
        struct kind_index;

        template <template <class> class K>
        struct kind_index<K> : std::integral_constant<size_t, 0> { };

        template <template <class> class K, template <class> class First,
                  template <class> class... Rest>
        struct kind_index<K, First, Rest...>
            : std::integral_constant<size_t, is_same_kind<K, First>::value
                                                 ? 0 : 1 + kind_index<K, Rest...>::value> { };
    }


    /** The metadata cached in every node: one value per aggregator kind, combined componentwise. */
    template <class CONFIG, template <class> class... Kinds>
    class Meta {
    public:
        using element_type = typename CONFIG::element_type;
        using tuple_type = std::tuple<typename Kinds<CONFIG>::value_type...>;

        template <template <class> class K>
        static constexpr bool has = (impl::is_same_kind<K, Kinds>::value || ...);

        Meta()
        :_values(Kinds<CONFIG>::identity()...)
        { }

        static Meta identity()                          {return Meta();}

        static Meta lift(const element_type &e) {
            return Meta(std::in_place, Kinds<CONFIG>::lift(e)...);
        }

        static Meta combine(const Meta &a, const Meta &b) {
            return combine(a, b, std::make_index_sequence<sizeof...(Kinds)>{});
        }

        template <template <class> class K>
        const typename K<CONFIG>::value_type& get() const {
            static_assert(has<K>, "This aggregator kind is not in the configuration's list");
            return std::get<impl::kind_index<K, Kinds...>::value>(_values);
        }

        const tuple_type& values() const                {return _values;}

    private:
        explicit Meta(std::in_place_t, typename Kinds<CONFIG>::value_type... values)
        :_values(std::move(values)...)
        { }

        template <size_t... I>
        static Meta combine(const Meta &a, const Meta &b, std::index_sequence<I...>) {
            return Meta(std::in_place,
                        Kinds<CONFIG>::combine(std::get<I>(a._values), std::get<I>(b._values))...);
        }

        tuple_type _values;
    };


    /** The list of aggregator kinds a configuration caches in its nodes, e.g.
        `using aggregators = AggregatorList<Cardinality, CheckSum, Max>;` */
    template <template <class> class... Kinds>
    struct AggregatorList {
        template <class CONFIG>
        using meta = Meta<CONFIG, Kinds...>;

        static constexpr size_t count = sizeof...(Kinds);

        template <template <class> class K>
        static constexpr bool has = (impl::is_same_kind<K, Kinds>::value || ...);
    };

}
