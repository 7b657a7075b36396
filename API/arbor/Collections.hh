//
// Collections.hh
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
#include "arbor/Tree.hh"
#include <initializer_list>
#include <optional>
#include <utility>

namespace arbor {

    // Set, Map and Vector are thin mutable wrappers around a Tree. "Mutating" one replaces its
    // tree with a new version; copies made earlier are unaffected, and copying is O(1).


    /** A sorted set of unique values. */
    template <class T, class Compare = std::less<T>, class Hash = Hasher<T>>
    class Set {
    public:
        using config = SetConfig<T, Compare, Hash>;
        using tree_type = Tree<config>;
        using stash_type = typename tree_type::stash_type;
        using iterator = typename tree_type::iterator;
        using reverse_iterator = typename tree_type::reverse_iterator;

        Set() = default;
        explicit Set(stash_type *stash)                 :_tree(stash) { }
        explicit Set(tree_type tree)                    :_tree(std::move(tree)) { }

        Set(std::initializer_list<T> values) {
            for (auto &v : values)
                insert(v);
        }

        size_t size() const                             {return _tree.size();}
        bool empty() const                              {return _tree.empty();}
        bool contains(const T &value) const             {return _tree.contains(value);}

        /** The greatest value, or nullptr if empty. */
        const T* max() const {
            auto &m = _tree.template aggregate<Max>();
            return m ? &*m : nullptr;
        }

        /** Adds a value; returns false if it was already present. */
        bool insert(T value) {
            Location before = _tree.root();
            _tree = _tree.insert(std::move(value));
            return _tree.root() != before;
        }

        /** Removes a value, returning the stored one if it was present. */
        std::optional<T> remove(const T &value) {
            auto parts = _tree.splitAround(value);
            if (!parts.equal)
                return std::nullopt;
            _tree = tree_type::join(parts.less, parts.greater);
            return std::move(parts.equal);
        }

        Set unionWith(const Set &other) const           {return Set(_tree.unionWith(other._tree));}
        Set intersectWith(const Set &other) const       {return Set(_tree.intersectWith(other._tree));}
        Set differenceWith(const Set &other) const      {return Set(_tree.differenceWith(other._tree));}

        Set operator| (const Set &other) const          {return unionWith(other);}
        Set operator& (const Set &other) const          {return intersectWith(other);}
        Set operator- (const Set &other) const          {return differenceWith(other);}

        bool operator== (const Set &other) const        {return _tree == other._tree;}
        bool operator!= (const Set &other) const        {return _tree != other._tree;}

        iterator begin() const                          {return _tree.begin();}
        iterator end() const                            {return _tree.end();}
        reverse_iterator rbegin() const                 {return _tree.rbegin();}
        reverse_iterator rend() const                   {return _tree.rend();}

        const tree_type& tree() const                   {return _tree;}

    private:
        tree_type _tree;
    };


    /** A sorted map from keys to values. */
    template <class K, class V, class Compare = std::less<K>,
              class KeyHash = Hasher<K>, class ValueHash = Hasher<V>>
    class Map {
    public:
        using config = MapConfig<K, V, Compare, KeyHash, ValueHash>;
        using tree_type = Tree<config>;
        using stash_type = typename tree_type::stash_type;
        using iterator = typename tree_type::iterator;
        using reverse_iterator = typename tree_type::reverse_iterator;

        /** `policy` determines whether `insert` overwrites the value of an existing key. */
        explicit Map(DuplicatePolicy policy = DuplicatePolicy::kReplace)
        :_policy(policy)
        { }

        explicit Map(stash_type *stash, DuplicatePolicy policy = DuplicatePolicy::kReplace)
        :_tree(stash)
        ,_policy(policy)
        { }

        Map(std::initializer_list<std::pair<K,V>> entries,
            DuplicatePolicy policy = DuplicatePolicy::kReplace)
        :_policy(policy)
        {
            for (auto &e : entries)
                insert(e.first, e.second);
        }

        size_t size() const                             {return _tree.size();}
        bool empty() const                              {return _tree.empty();}
        DuplicatePolicy policy() const                  {return _policy;}
        bool contains(const K &key) const               {return _tree.contains(key);}

        /** The value for a key, or nullptr. */
        const V* get(const K &key) const {
            auto entry = _tree.find(key);
            return entry ? &entry->second : nullptr;
        }

        /** The greatest key, or nullptr if empty. */
        const K* maxKey() const {
            auto &k = _tree.template aggregate<Key>();
            return k ? &*k : nullptr;
        }

        /** Stores a value for a key, subject to the map's DuplicatePolicy. Returns true if the
            map changed. */
        bool insert(K key, V value) {
            Location before = _tree.root();
            _tree = _tree.insert({std::move(key), std::move(value)}, _policy);
            return _tree.root() != before;
        }

        /** Removes a key, returning its value if it was present. */
        std::optional<V> remove(const K &key) {
            auto parts = _tree.splitAround(key);
            if (!parts.equal)
                return std::nullopt;
            _tree = tree_type::join(parts.less, parts.greater);
            return std::move(parts.equal->second);
        }

        /** Replaces a key's value with `fn(oldValue)`. Returns false if the key is absent. */
        template <class FN>
        bool update(const K &key, FN fn) {
            auto entry = _tree.find(key);
            if (!entry)
                return false;
            V value = fn(entry->second);
            _tree = _tree.insert({key, std::move(value)}, DuplicatePolicy::kReplace);
            return true;
        }

        /** Adds all of `other`'s entries; where both have a key, `other`'s value wins. */
        void merge(const Map &other) {
            _tree = _tree.unionWith(other._tree, MergePolicy::kPreferRight);
        }

        /** True if both maps have the same set of keys. */
        bool sameKeys(const Map &other) const {
            return size() == other.size()
                && _tree.template aggregate<KeySum>() == other._tree.template aggregate<KeySum>();
        }

        /** True if both maps have the same values in the same key order. */
        bool sameValues(const Map &other) const {
            return size() == other.size()
                && _tree.template aggregate<ValSum>() == other._tree.template aggregate<ValSum>();
        }

        bool operator== (const Map &other) const        {return _tree == other._tree;}
        bool operator!= (const Map &other) const        {return _tree != other._tree;}

        iterator begin() const                          {return _tree.begin();}
        iterator end() const                            {return _tree.end();}
        reverse_iterator rbegin() const                 {return _tree.rbegin();}
        reverse_iterator rend() const                   {return _tree.rend();}

        const tree_type& tree() const                   {return _tree;}

    private:
        tree_type       _tree;
        DuplicatePolicy _policy;
    };


    /** A sequence of values, indexed by position. */
    template <class T, class Hash = Hasher<T>>
    class Vector {
    public:
        using config = VectorConfig<T, Hash>;
        using tree_type = Tree<config>;
        using stash_type = typename tree_type::stash_type;
        using iterator = typename tree_type::iterator;
        using reverse_iterator = typename tree_type::reverse_iterator;

        Vector() = default;
        explicit Vector(stash_type *stash)              :_tree(stash) { }
        explicit Vector(tree_type tree)                 :_tree(std::move(tree)) { }

        Vector(std::initializer_list<T> values) {
            for (auto &v : values)
                pushBack(v);
        }

        size_t size() const                             {return _tree.size();}
        bool empty() const                              {return _tree.empty();}

        /** The value at an index, or nullptr if the index is out of range. */
        const T* get(size_t index) const {
            return index < size() ? &_tree.at(index) : nullptr;
        }

        const T& operator[] (size_t index) const        {return _tree.at(index);}

        void pushBack(T value)                          {_tree = _tree.pushBack(std::move(value));}

        /** Removes and returns the last value. Throws OutOfRange if empty. */
        T popBack() {
            throwIf(empty(), OutOfRange, "popBack() of an empty Vector");
            T last = *_tree.last();
            _tree = _tree.popBack();
            return last;
        }

        /** Inserts a value before `index`; `index` may equal the size. */
        void insert(size_t index, T value)              {_tree = _tree.insertAt(index, std::move(value));}

        /** Removes and returns the value at an index. */
        T remove(size_t index) {
            T value = _tree.at(index);
            _tree = _tree.removeAt(index);
            return value;
        }

        void set(size_t index, T value)                 {_tree = _tree.replaceAt(index, std::move(value));}

        /** Replaces the value at an index with `fn(oldValue)`. */
        template <class FN>
        void update(size_t index, FN fn) {
            T value = fn(_tree.at(index));
            _tree = _tree.replaceAt(index, std::move(value));
        }

        /** Returns the values before `index` and those from `index` on. */
        std::pair<Vector,Vector> split(size_t index) const {
            auto parts = _tree.splitAt(index);
            return {Vector(std::move(parts.first)), Vector(std::move(parts.second))};
        }

        /** Appends all of `other`'s values. */
        void concat(const Vector &other)                {_tree = _tree.concat(other._tree);}

        /** Inserts all of `other`'s values before `index`. */
        void splice(size_t index, const Vector &other)  {_tree = _tree.splice(index, other._tree);}

        bool operator== (const Vector &other) const     {return _tree == other._tree;}
        bool operator!= (const Vector &other) const     {return _tree != other._tree;}

        iterator begin() const                          {return _tree.begin();}
        iterator end() const                            {return _tree.end();}
        reverse_iterator rbegin() const                 {return _tree.rbegin();}
        reverse_iterator rend() const                   {return _tree.rend();}

        const tree_type& tree() const                   {return _tree;}

    private:
        tree_type _tree;
    };


    template <class T, class C, class H>
    struct Hasher<Set<T,C,H>> {
        hash_t operator() (const Set<T,C,H> &s, hash_t seed) const {
            return Hasher<typename Set<T,C,H>::tree_type>{}(s.tree(), seed);
        }
    };

    template <class K, class V, class C, class KH, class VH>
    struct Hasher<Map<K,V,C,KH,VH>> {
        hash_t operator() (const Map<K,V,C,KH,VH> &m, hash_t seed) const {
            return Hasher<typename Map<K,V,C,KH,VH>::tree_type>{}(m.tree(), seed);
        }
    };

    template <class T, class H>
    struct Hasher<Vector<T,H>> {
        hash_t operator() (const Vector<T,H> &v, hash_t seed) const {
            return Hasher<typename Vector<T,H>::tree_type>{}(v.tree(), seed);
        }
    };

}
