//
// MapTests.cc
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
#include <map>

using namespace std;


static const char* kDigits[10] = {"zero", "one", "two", "three", "four", "five", "six",
                                  "seven", "eight", "nine"};

static string spellOut(int i) {
    string result;
    do {
        result = string(kDigits[i % 10]) + (result.empty() ? "" : " ") + result;
        i /= 10;
    } while (i > 0);
    return result;
}


TEST_CASE("Empty Map", "[Map]") {
    Map<string,int> map;
    CHECK(map.empty());
    CHECK(map.size() == 0);
    CHECK(map.get("foo") == nullptr);
    CHECK(!map.remove("foo"));
    CHECK(!map.update("foo", [](int v) {return v + 1;}));
    CHECK(map.maxKey() == nullptr);
    CHECK(map.policy() == DuplicatePolicy::kReplace);
}


TEST_CASE("Map insert with replacement", "[Map]") {
    Map<string,int> map(DuplicatePolicy::kReplace);
    CHECK(map.insert("one", 1));
    CHECK(map.insert("two", 2));
    CHECK(map.size() == 2);
    REQUIRE(map.get("one"));
    CHECK(*map.get("one") == 1);

    CHECK(map.insert("one", 100));
    CHECK(*map.get("one") == 100);
    CHECK(map.size() == 2);

    // Same value again changes nothing:
    CHECK(!map.insert("one", 100));
}


TEST_CASE("Map insert without replacement", "[Map]") {
    Map<string,int> map(DuplicatePolicy::kKeepExisting);
    CHECK(map.insert("one", 1));
    CHECK(!map.insert("one", 100));
    CHECK(*map.get("one") == 1);
    CHECK(map.size() == 1);
}


TEST_CASE("Map remove and update", "[Map]") {
    Map<int,string> map;
    for (int i = 0; i < 100; i++)
        map.insert(i, spellOut(i));
    CHECK(map.size() == 100);
    CHECK(*map.get(42) == "four two");

    auto removed = map.remove(42);
    REQUIRE(removed);
    CHECK(*removed == "four two");
    CHECK(map.get(42) == nullptr);
    CHECK(map.size() == 99);
    CHECK(!map.remove(42));

    CHECK(map.update(7, [](const string &s) {return s + "!";}));
    CHECK(*map.get(7) == "seven!");
    CHECK(!map.update(42, [](const string &s) {return s;}));

    REQUIRE(map.maxKey());
    CHECK(*map.maxKey() == 99);
    CHECK_NOTHROW(map.tree().checkInvariants());
}


TEST_CASE("Map iteration", "[Map]") {
    Map<int,string> map;
    std::map<int,string> expected;
    for (int i : shuffledRange(0, 199, 77)) {
        map.insert(i, spellOut(i));
        expected[i] = spellOut(i);
    }
    auto e = expected.begin();
    for (auto &entry : map) {
        REQUIRE(e != expected.end());
        CHECK(entry.first == e->first);
        CHECK(entry.second == e->second);
        ++e;
    }
    CHECK(e == expected.end());

    auto r = expected.rbegin();
    for (auto i = map.rbegin(); i != map.rend(); ++i) {
        REQUIRE(r != expected.rend());
        CHECK(i->first == r->first);
        CHECK(i->second == r->second);
        ++r;
    }
    CHECK(r == expected.rend());
}


TEST_CASE("Map merge", "[Map]") {
    Map<string,int> a {{"x", 1}, {"y", 2}};
    Map<string,int> b {{"y", 20}, {"z", 30}};
    Map<string,int> merged = a;
    merged.merge(b);
    CHECK(merged.size() == 3);
    CHECK(*merged.get("x") == 1);
    CHECK(*merged.get("y") == 20);
    CHECK(*merged.get("z") == 30);

    // The originals are unchanged:
    CHECK(*a.get("y") == 2);
    CHECK(a.get("z") == nullptr);
}


TEST_CASE("Map key and value digests", "[Map]") {
    Map<string,int> a {{"x", 1}, {"y", 2}};
    Map<string,int> b {{"y", 5}, {"x", 6}};
    Map<string,int> c {{"p", 1}, {"q", 2}};

    CHECK(a.sameKeys(b));
    CHECK(!a.sameValues(b));
    CHECK(!a.sameKeys(c));
    CHECK(a.sameValues(c));
    CHECK(a != b);
    CHECK(a != c);

    Map<string,int> a2 {{"y", 2}, {"x", 1}};
    CHECK(a == a2);
    CHECK(a.sameKeys(a2));
    CHECK(a.sameValues(a2));
}


TEST_CASE("Maps as map values", "[Map]") {
    using Inner = Map<int,int>;
    Inner evens, odds;
    for (int i = 0; i < 20; i++)
        (i % 2 ? odds : evens).insert(i, i * i);

    Map<int,Inner> outer;
    CHECK(outer.insert(0, evens));
    CHECK(outer.insert(1, odds));
    CHECK(outer.size() == 2);
    REQUIRE(outer.get(1));
    CHECK(*outer.get(1)->get(7) == 49);

    // An equal inner map, built in another order, changes nothing:
    Inner evens2;
    for (int i = 18; i >= 0; i -= 2)
        evens2.insert(i, i * i);
    CHECK(Hasher<Inner>{}(evens2, 0) == Hasher<Inner>{}(evens, 0));
    CHECK(!outer.insert(0, evens2));

    // A different one does:
    evens2.insert(100, 0);
    CHECK(Hasher<Inner>{}(evens2, 0) != Hasher<Inner>{}(evens, 0));
    Map<int,Inner> outer2 = outer;
    CHECK(outer2.insert(0, evens2));
    CHECK(outer2 != outer);
    CHECK(!outer.sameValues(outer2));
    CHECK(outer.sameKeys(outer2));
    CHECK(outer.get(0)->size() == 10);
    CHECK(outer2.get(0)->size() == 11);
    CHECK_NOTHROW(outer2.tree().checkInvariants());
}
