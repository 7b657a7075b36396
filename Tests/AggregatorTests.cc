//
// AggregatorTests.cc
//
// Copyright 2018-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "ArborTests.hh"
#include <set>

using namespace std;


namespace {

    // An aggregator that adds up the elements.
    template <class CONFIG>
    struct Sum {
        using value_type = long;
        static value_type identity()                                    {return 0;}
        static value_type lift(const typename CONFIG::element_type &e)  {return e;}
        static value_type combine(value_type a, value_type b)           {return a + b;}
    };

    // A set without a CheckSum, so equality has to compare elements.
    struct SumSetConfig : SetConfig<int> {
        using aggregators = AggregatorList<Cardinality, Sum>;
    };

    // A vector that also tracks its greatest element.
    struct MaxVectorConfig : VectorConfig<int> {
        using aggregators = AggregatorList<Cardinality, CheckSum, Max>;
    };

    // A set with its own salt.
    struct SaltedSetConfig : SetConfig<int> {
        static constexpr hash_t kSalt = 0x1234567;
    };

}


TEST_CASE("Digest is an order-sensitive monoid", "[Aggregator]") {
    mt19937_64 rng(17);
    for (int i = 0; i < 100; i++) {
        Digest a = Digest::of(rng()), b = Digest::of(rng()), c = Digest::of(rng());
        CHECK(Digest::combine(Digest::combine(a, b), c) == Digest::combine(a, Digest::combine(b, c)));
        CHECK(Digest::combine(a, Digest::identity()) == a);
        CHECK(Digest::combine(Digest::identity(), a) == a);
        CHECK(Digest::combine(a, b) != Digest::combine(b, a));
    }
}


TEST_CASE("Meta composition", "[Aggregator]") {
    using Meta = IntStash::meta_type;
    static_assert(Meta::has<Cardinality>);
    static_assert(Meta::has<Max>);
    static_assert(!Meta::has<KeySum>);

    Meta m = Meta::combine(Meta::combine(Meta::lift(3), Meta::lift(9)), Meta::lift(4));
    CHECK(m.get<Cardinality>() == 3);
    CHECK(m.get<Max>() == 9);
    CHECK(m.get<CheckSum>() != Meta::combine(Meta::combine(Meta::lift(9), Meta::lift(3)),
                                             Meta::lift(4)).get<CheckSum>());

    Meta identity;
    CHECK(identity.get<Cardinality>() == 0);
    CHECK(!identity.get<Max>());
    CHECK(identity.get<CheckSum>() == Digest());
    CHECK(Meta::combine(identity, m).get<CheckSum>() == m.get<CheckSum>());
}


TEST_CASE("Cardinality tracks size", "[Aggregator]") {
    auto stash = IntStash::create();
    IntTree tree(stash);
    set<int> expected;
    mt19937 rng(5);
    for (int i = 0; i < 2000; i++) {
        int v = int(rng() % 500);
        if (rng() % 3 == 0) {
            tree = tree.remove(v);
            expected.erase(v);
        } else {
            tree = tree.insert(v);
            expected.insert(v);
        }
        REQUIRE(tree.size() == expected.size());
        REQUIRE(tree.aggregate<Cardinality>() == expected.size());
    }
    CHECK_NOTHROW(tree.checkInvariants());
}


TEST_CASE("CheckSum", "[Aggregator]") {
    auto stash = IntStash::create();
    IntTree a = buildTree(stash.get(), vector<int>{1, 2, 3});
    IntTree b = buildTree(stash.get(), vector<int>{3, 1, 2});
    IntTree c = buildTree(stash.get(), vector<int>{1, 2, 4});
    CHECK(a.checksum() == b.checksum());
    CHECK(a.checksum() != c.checksum());
    CHECK(a == b);
    CHECK(a != c);

    // The empty tree's checksum is the identity:
    CHECK(IntTree(stash).checksum() == Digest());

    // Order matters for vectors:
    using IntVecTree = Tree<VectorConfig<int>>;
    IntVecTree v12 = IntVecTree().pushBack(1).pushBack(2);
    IntVecTree v21 = IntVecTree().pushBack(2).pushBack(1);
    CHECK(v12.checksum() != v21.checksum());
    CHECK(v12 != v21);

    // A different salt gives different checksums:
    Tree<SaltedSetConfig> salted;
    for (int i : {1, 2, 3})
        salted = salted.insert(i);
    CHECK(salted.checksum() != a.checksum());
    CHECK_NOTHROW(salted.checkInvariants());
}


TEST_CASE("Max", "[Aggregator]") {
    auto stash = IntStash::create();
    IntTree tree = buildTree(stash.get(), shuffledRange(1, 100, 8));
    REQUIRE(tree.aggregate<Max>());
    CHECK(*tree.aggregate<Max>() == 100);
    tree = tree.remove(100);
    CHECK(*tree.aggregate<Max>() == 99);
    CHECK(!IntTree(stash).aggregate<Max>());

    // Positional collections use operator<:
    Tree<MaxVectorConfig> vec;
    vec = vec.pushBack(3).pushBack(9).pushBack(2);
    CHECK(*vec.aggregate<Max>() == 9);
    vec = vec.removeAt(1);
    CHECK(*vec.aggregate<Max>() == 3);
    CHECK_NOTHROW(vec.checkInvariants());

    // Max honors a custom comparator:
    Tree<SetConfig<int, greater<int>>> desc;
    for (int i : {5, 1, 7})
        desc = desc.insert(i);
    CHECK(*desc.aggregate<Max>() == 1);
    CHECK(desc.elements() == (vector<int>{7, 5, 1}));
}


TEST_CASE("Custom aggregator", "[Aggregator]") {
    using SumTree = Tree<SumSetConfig>;
    SumTree a;
    for (int i : shuffledRange(1, 100, 2))
        a = a.insert(i);
    CHECK(a.aggregate<Sum>() == 5050);
    CHECK(a.remove(50).aggregate<Sum>() == 5000);
    CHECK(a.size() == 100);
    CHECK_NOTHROW(a.checkInvariants());

    // Without a CheckSum, equality compares the elements:
    SumTree b;
    for (int i = 100; i >= 1; --i)
        b = b.insert(i);
    CHECK(a == b);
    CHECK(a != b.remove(7));
    CHECK(a != b.remove(7).insert(101));

    SumTree u = a.remove(7).unionWith(b.remove(8));
    CHECK(u.aggregate<Sum>() == 5050);
    CHECK(u == a);
}


TEST_CASE("Map aggregators", "[Aggregator]") {
    using MapTree = Tree<MapConfig<int,string>>;
    MapTree m1 = MapTree().insert({1, "a"}).insert({2, "b"});
    MapTree m2 = MapTree().insert({2, "y"}).insert({1, "x"});
    MapTree m3 = MapTree().insert({1, "a"}).insert({3, "b"});

    CHECK(m1.aggregate<KeySum>() == m2.aggregate<KeySum>());
    CHECK(m1.aggregate<ValSum>() != m2.aggregate<ValSum>());
    CHECK(m1.aggregate<KeySum>() != m3.aggregate<KeySum>());
    CHECK(m1.aggregate<ValSum>() == m3.aggregate<ValSum>());
    CHECK(m1.checksum() != m2.checksum());

    REQUIRE(m3.aggregate<Key>());
    CHECK(*m3.aggregate<Key>() == 3);
    CHECK_NOTHROW(m3.checkInvariants());
}
