//
// TreeTests.cc
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


class TreeTests {
public:
    Retained<IntStash> stash = IntStash::create();

    IntTree build(const vector<int> &values) {
        return buildTree(stash.get(), values);
    }

    void checkContents(const IntTree &tree, const set<int> &expected) {
        CHECK(tree.size() == expected.size());
        vector<int> actual;
        for (int i : tree)
            actual.push_back(i);
        CHECK(actual == vector<int>(expected.begin(), expected.end()));
        CHECK_NOTHROW(tree.checkInvariants());
    }
};


#pragma mark - HASH & WEIGHT:


TEST_CASE("WeightOf", "[Tree]") {
    CHECK(WeightOf(0) == 64);
    CHECK(WeightOf(1) == 63);
    CHECK(WeightOf(~hash_t(0)) == 0);
    CHECK(WeightOf(hash_t(1) << 63) == 0);
    CHECK(WeightOf(hash_t(1) << 40) == 23);
    CHECK(WeightOf(0x00FF000000000000) == 8);
}


TEST_CASE("Weight distribution is geometric", "[Tree]") {
    static constexpr int N = 100000;
    int atLeast1 = 0, atLeast4 = 0;
    for (int i = 0; i < N; i++) {
        level_t w = WeightOf(Hasher<int>{}(i, kSetSalt));
        if (w >= 1) ++atLeast1;
        if (w >= 4) ++atLeast4;
    }
    CHECK(atLeast1 > N * 0.47);
    CHECK(atLeast1 < N * 0.53);
    CHECK(atLeast4 > N * 0.055);
    CHECK(atLeast4 < N * 0.07);
}


TEST_CASE("Hashers", "[Tree]") {
    Hasher<int> intHash;
    CHECK(intHash(0, kSetSalt) != 0);
    CHECK(intHash(5, kSetSalt) == intHash(5, kSetSalt));
    CHECK(intHash(5, kSetSalt) != intHash(6, kSetSalt));
    CHECK(intHash(5, kSetSalt) != intHash(5, kMapSalt));

    string str = "hello";
    CHECK(Hasher<string>{}(str, 1) == Hasher<string_view>{}(string_view(str), 1));
    CHECK(Hasher<string>{}(str, 1) == Hasher<const char*>{}("hello", 1));
    CHECK(Hasher<string>{}("hello", 1) != Hasher<string>{}("hellp", 1));
    CHECK(Hasher<string>{}("", 1) != Hasher<string>{}("", 2));

    CHECK(Hasher<double>{}(0.0, 1) == Hasher<double>{}(-0.0, 1));

    Hasher<pair<int,string>> pairHash;
    CHECK(pairHash({1, "a"}, 1) != pairHash({1, "b"}, 1));
    CHECK(pairHash({1, "a"}, 1) != pairHash({2, "a"}, 1));
}


#pragma mark - BASIC OPERATIONS:


TEST_CASE_METHOD(TreeTests, "Empty Tree", "[Tree]") {
    IntTree tree(stash);
    CHECK(tree.empty());
    CHECK(tree.size() == 0);
    CHECK(tree.root().none());
    CHECK(tree.find(1) == nullptr);
    CHECK(!tree.contains(1));
    CHECK(tree.first() == nullptr);
    CHECK(tree.last() == nullptr);
    CHECK(tree.begin() == tree.end());
    CHECK(!IntTree::iterator(tree));
    CHECK(tree.rbegin() == tree.rend());
    CHECK(tree.checksum() == Digest());
    CHECK_NOTHROW(tree.checkInvariants());
    CHECK(tree.remove(1).empty());

    stringstream out;
    tree.dump(out);
    CHECK(out.str() == "(empty)\n");
}


TEST_CASE_METHOD(TreeTests, "Tree insert is persistent", "[Tree]") {
    IntTree t0(stash);
    IntTree t1 = t0.insert(5);
    IntTree t2 = t1.insert(3).insert(8);

    CHECK(t0.empty());
    CHECK(t1.size() == 1);
    CHECK(t2.size() == 3);
    CHECK(t1.contains(5));
    CHECK(!t1.contains(3));
    CHECK(t2.contains(3));
    REQUIRE(t2.find(8));
    CHECK(*t2.find(8) == 8);
    CHECK(*t2.first() == 3);
    CHECK(*t2.last() == 8);

    stringstream out;
    t2.dump(out);
    CHECK(out.str().find("5") != string::npos);
}


TEST_CASE_METHOD(TreeTests, "Tree insert of a duplicate allocates nothing", "[Tree]") {
    IntTree tree = build(range(1, 100));
    auto before = stash->allocations();
    IntTree again = tree.insert(50);
    CHECK(again.root() == tree.root());
    CHECK(stash->allocations() == before);

    IntTree removed = tree.remove(1000);
    CHECK(removed.root() == tree.root());
    CHECK(stash->allocations() == before);
}


TEST_CASE_METHOD(TreeTests, "Tree insert and remove", "[Tree]") {
    static constexpr int N = 1000;
    auto values = shuffledRange(1, N, 1234);
    set<int> expected;
    IntTree tree(stash);
    for (int v : values) {
        tree = tree.insert(v);
        expected.insert(v);
    }
    checkContents(tree, expected);

    auto removals = shuffledRange(1, N, 5678);
    for (size_t i = 0; i < removals.size(); i += 2) {
        tree = tree.remove(removals[i]);
        expected.erase(removals[i]);
    }
    checkContents(tree, expected);
    for (int v : values)
        CHECK(tree.contains(v) == (expected.count(v) > 0));
}


TEST_CASE_METHOD(TreeTests, "Tree canonical shape", "[Tree]") {
    IntTree ascending = build(range(1, 500));
    string shape = shapeOf(ascending);
    for (unsigned seed = 1; seed <= 5; seed++) {
        IntTree shuffled = build(shuffledRange(1, 500, seed));
        CHECK(shapeOf(shuffled) == shape);
        CHECK(shuffled.checksum() == ascending.checksum());
        CHECK(shuffled == ascending);
    }

    // Removing what was added gets back to the same shape too:
    IntTree bigger = build(range(1, 600));
    for (int i = 501; i <= 600; i++)
        bigger = bigger.remove(i);
    CHECK(shapeOf(bigger) == shape);
}


TEST_CASE("Tree canonical shape with interning", "[Tree]") {
    auto stash = IntStash::create({true, false});
    IntTree ascending = buildTree(stash.get(), range(1, 1000));
    IntTree shuffled = buildTree(stash.get(), shuffledRange(1, 1000, 99));
    CHECK(ascending.root() == shuffled.root());
    CHECK(stash->internHits() > 0);
}


TEST_CASE_METHOD(TreeTests, "Tree split and join", "[Tree]") {
    IntTree tree = build(shuffledRange(1, 1000, 42));

    auto parts = tree.splitAround(500);
    CHECK(parts.less.size() == 499);
    CHECK(parts.greater.size() == 500);
    REQUIRE(parts.equal);
    CHECK(*parts.equal == 500);
    CHECK(*parts.less.last() == 499);
    CHECK(*parts.greater.first() == 501);
    CHECK_NOTHROW(parts.less.checkInvariants());
    CHECK_NOTHROW(parts.greater.checkInvariants());

    // The original is untouched:
    CHECK(tree.size() == 1000);

    IntTree joined = IntTree::join(parts.less, parts.greater);
    IntTree expected = tree.remove(500);
    CHECK(shapeOf(joined) == shapeOf(expected));
    CHECK(joined == expected);

    // Splitting at a missing key:
    auto [lo, hi] = expected.split(500);
    CHECK(lo.size() == 499);
    CHECK(hi.size() == 500);
    CHECK(shapeOf(IntTree::join(lo, hi)) == shapeOf(expected));

    // Splitting at the ends:
    auto [none, all] = tree.split(0);
    CHECK(none.empty());
    CHECK(all.root() == tree.root());
}


TEST_CASE_METHOD(TreeTests, "Tree indexing", "[Tree]") {
    IntTree tree = build(shuffledRange(1, 300, 7));
    for (size_t i = 0; i < 300; i++) {
        CHECK(tree.at(i) == int(i + 1));
        CHECK(tree.indexOf(int(i + 1)) == i);
    }
    CHECK(!tree.indexOf(0));
    CHECK(!tree.indexOf(301));
    CHECK_THROWS_AS(tree.at(300), ArborException);

    try {
        (void)tree.at(1000);
        FAIL("Expected an exception");
    } catch (const ArborException &x) {
        CHECK(x.code == OutOfRange);
        CHECK(ArborException::getCode(x) == OutOfRange);
    }

    auto [front, back] = tree.splitAt(100);
    CHECK(front.size() == 100);
    CHECK(*front.last() == 100);
    CHECK(*back.first() == 101);
    IntTree rest = tree.removeAt(0);
    CHECK(rest.size() == 299);
    REQUIRE(rest.first() != nullptr);
    CHECK(*rest.first() == 2);
    CHECK_THROWS_AS(tree.removeAt(300), ArborException);
}


TEST_CASE_METHOD(TreeTests, "Tree iteration", "[Tree]") {
    IntTree tree = build(shuffledRange(1, 200, 3));

    int expected = 1;
    for (IntTree::iterator i(tree); i; ++i)
        CHECK(*i == expected++);
    CHECK(expected == 201);

    // Restartable:
    CHECK(vector<int>(tree.begin(), tree.end()) == range(1, 200));
    CHECK(tree.elements() == range(1, 200));

    // The iterator keeps its own reference to the tree:
    IntTree::iterator i(tree);
    tree = IntTree(stash);
    int count = 0;
    for (; i; ++i)
        ++count;
    CHECK(count == 200);
}


TEST_CASE_METHOD(TreeTests, "Tree reverse iteration", "[Tree]") {
    IntTree tree = build(shuffledRange(1, 200, 5));

    int expected = 200;
    for (IntTree::reverse_iterator i(tree); i; ++i)
        CHECK(*i == expected--);
    CHECK(expected == 0);

    vector<int> backward(tree.rbegin(), tree.rend());
    vector<int> forward = range(1, 200);
    reverse(forward.begin(), forward.end());
    CHECK(backward == forward);

    // A single element:
    IntTree single = build(vector<int>{42});
    auto r = single.rbegin();
    REQUIRE(r != single.rend());
    CHECK(*r == 42);
    CHECK(++r == single.rend());
}


TEST_CASE_METHOD(TreeTests, "Tree memory is reclaimed", "[Tree]") {
    {
        IntTree a = build(shuffledRange(1, 1000, 11));
        IntTree b = build(shuffledRange(500, 1500, 12));
        IntTree u = a.unionWith(b);
        IntTree n = a.intersectWith(b);
        IntTree d = a.differenceWith(b);
        auto parts = u.split(750);
        CHECK(stash->liveNodes() > 0);
    }
    CHECK(stash->liveNodes() == 0);
}


TEST_CASE("Tree across Stashes", "[Tree]") {
    auto stashA = IntStash::create(), stashB = IntStash::create();
    IntTree a = buildTree(stashA.get(), range(1, 100));
    IntTree b = buildTree(stashB.get(), range(50, 150));
    size_t liveInB = stashB->liveNodes();

    IntTree u = a.unionWith(b);
    CHECK(u.stash() == stashA.get());
    CHECK(u.size() == 150);
    CHECK(u.elements() == range(1, 150));
    CHECK_NOTHROW(u.checkInvariants());
    CHECK(stashB->liveNodes() == liveInB);

    CHECK(a.intersectWith(b).elements() == range(50, 100));
    CHECK(a.differenceWith(b).elements() == range(1, 49));

    // Equal contents compare equal regardless of Stash:
    IntTree b2 = buildTree(stashA.get(), range(50, 150));
    CHECK(b2 == b);
}


TEST_CASE("Tree with a map configuration", "[Tree]") {
    using MapTree = Tree<MapConfig<int,string>>;
    MapTree tree;
    tree = tree.insert({1, "one"}).insert({2, "two"});

    MapTree kept = tree.insert({1, "uno"}, DuplicatePolicy::kKeepExisting);
    CHECK(kept.root() == tree.root());
    CHECK(kept.find(1)->second == "one");

    MapTree replaced = tree.insert({1, "uno"}, DuplicatePolicy::kReplace);
    CHECK(replaced.root() != tree.root());
    CHECK(replaced.find(1)->second == "uno");
    CHECK(replaced.size() == 2);
    CHECK(replaced != tree);

    // Replacing with an identical element is a no-op:
    MapTree same = tree.insert({2, "two"}, DuplicatePolicy::kReplace);
    CHECK(same.root() == tree.root());

    stringstream out;
    tree.dump(out);
    CHECK(out.str().find("1: one") != string::npos);
}
