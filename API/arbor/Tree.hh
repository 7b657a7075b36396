//
// Tree.hh
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
#include "arbor/TreeCore.hh"
#include "ArborException.hh"
#include <cstddef>
#include <iterator>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>
#include <vector>

namespace arbor {

    /** A persistent collection: an immutable balanced tree of elements stored in a Stash.
        A Tree is a small value (a root Location and a reference to its Stash); copying it is O(1)
        and never copies nodes. Operations that "modify" a tree return a new one, sharing all
        unchanged subtrees with the original.

        The CONFIG type describes the elements, their order and hashing, and the aggregate
        metadata kept in each node; see Config.hh. Ordered configurations support the key-based
        operations (insert, remove, find, union...), positional ones support insertAt, pushBack,
        concat and friends. Indexing, splitAt, removeAt and iteration work with both. */
    template <class CONFIG>
    class Tree {
    public:
        using config        = CONFIG;
        using element_type  = typename CONFIG::element_type;
        using key_type      = typename CONFIG::key_type;
        using stash_type    = Stash<CONFIG>;
        using meta_type     = typename stash_type::meta_type;

    private:
        using core_type     = impl::TreeCore<CONFIG>;
        using Subtree       = impl::Subtree<CONFIG>;

        static_assert(CONFIG::aggregators::template has<Cardinality>,
                      "A configuration's aggregators must include Cardinality");
        static_assert(std::is_same<std::remove_cv_t<decltype(CONFIG::kSalt)>, hash_t>::value,
                      "A configuration's kSalt must be a hash_t");
        static_assert(std::is_same<std::remove_cv_t<decltype(CONFIG::kOrdered)>, bool>::value,
                      "A configuration's kOrdered must be a bool");
        static_assert(std::is_copy_constructible<element_type>::value,
                      "Elements must be copy-constructible");
        static_assert(std::is_same<decltype(CONFIG::hashKey(std::declval<const key_type&>(),
                                                            hash_t())), hash_t>::value,
                      "A configuration's hashKey(key, seed) must return a hash_t");
        static_assert(std::is_same<decltype(CONFIG::hashElement(std::declval<const element_type&>(),
                                                                hash_t())), hash_t>::value,
                      "A configuration's hashElement(element, seed) must return a hash_t");
        static_assert(std::is_convertible<decltype(CONFIG::same(std::declval<const element_type&>(),
                                                                std::declval<const element_type&>())),
                                          bool>::value,
                      "A configuration's same(element, element) must return bool");

    public:
        /** An empty tree in the configuration's default Stash. */
        Tree()
        :Tree(stash_type::defaultStash())
        { }

        /** An empty tree in the given Stash. */
        explicit Tree(stash_type *stash)
        :_stash(stash)
        {
            precondition(stash != nullptr);
        }

        Tree(const Tree&) = default;
        Tree(Tree&&) noexcept = default;

        Tree& operator= (const Tree &t) {
            Tree copy(t);
            swap(copy);
            return *this;
        }

        Tree& operator= (Tree &&t) noexcept {
            swap(t);
            return *this;
        }

        void swap(Tree &t) noexcept {
            std::swap(_stash, t._stash);
            std::swap(_root, t._root);
        }

        stash_type* stash() const noexcept              {return _stash;}
        Location root() const noexcept                  {return _root.location();}
        bool empty() const noexcept                     {return _root.empty();}
        size_t size() const                             {return core().sizeOf(root());}

        /** The aggregated value of kind K over the whole tree (its identity if empty.) */
        template <template <class> class K>
        const typename K<CONFIG>::value_type& aggregate() const {
            return core().metaOf(root()).template get<K>();
        }

        Digest checksum() const                         {return aggregate<CheckSum>();}


        //-------- Lookup:

        const element_type* find(const key_type &key) const {
            static_assert(CONFIG::kOrdered, "find() requires an ordered configuration");
            return core().find(root(), key);
        }

        bool contains(const key_type &key) const        {return find(key) != nullptr;}

        const element_type* first() const               {return core().first(root());}
        const element_type* last() const                {return core().last(root());}

        /** The element at an index. Throws OutOfRange if there isn't one. */
        const element_type& at(size_t index) const {
            size_t n = size();
            throwIf(index >= n, OutOfRange, "Index %zu is out of range (size %zu)", index, n);
            return core().at(root(), index);
        }

        /** The index of the element with this key, if present. */
        std::optional<size_t> indexOf(const key_type &key) const {
            static_assert(CONFIG::kOrdered, "indexOf() requires an ordered configuration");
            return core().indexOf(root(), key);
        }


        //-------- Key-based operations (ordered configurations):

        NODISCARD Tree insert(element_type e,
                              DuplicatePolicy policy = DuplicatePolicy::kKeepExisting) const
        {
            static_assert(CONFIG::kOrdered, "insert() requires an ordered configuration");
            return Tree(_stash, core().insert(_root, std::move(e), policy));
        }

        NODISCARD Tree remove(const key_type &key) const {
            static_assert(CONFIG::kOrdered, "remove() requires an ordered configuration");
            return Tree(_stash, core().remove(_root, key));
        }

        struct SplitResult;

        /** Splits into the elements less than `key`, the element equal to it (if any), and the
            elements greater. */
        NODISCARD SplitResult splitAround(const key_type &key) const {
            static_assert(CONFIG::kOrdered, "splitAround() requires an ordered configuration");
            auto parts = core().split(_root, key);
            return {Tree(_stash, std::move(parts.less)),
                    std::move(parts.equal),
                    Tree(_stash, std::move(parts.greater))};
        }

        /** Splits into the elements less than `key` and those greater; an element equal to `key`
            is in neither. */
        NODISCARD std::pair<Tree,Tree> split(const key_type &key) const {
            auto parts = splitAround(key);
            return {std::move(parts.less), std::move(parts.greater)};
        }

        /** Concatenates two trees. In an ordered configuration every element of `left` must be
            less than every element of `right`. The result lives in `left`'s Stash. */
        NODISCARD static Tree join(const Tree &left, const Tree &right) {
#if ARBOR_DEBUG
            if constexpr (CONFIG::kOrdered) {
                if (!left.empty() && !right.empty())
                    precondition(CONFIG::less(CONFIG::keyOf(*left.last()),
                                              CONFIG::keyOf(*right.first())));
            }
#endif
            return Tree(left._stash, left.core().concat(left._root, left.rootOf(right)));
        }

        /** All elements in either tree. For a key in both, `policy` says whose element wins. */
        NODISCARD Tree unionWith(const Tree &other,
                                 MergePolicy policy = MergePolicy::kPreferLeft) const
        {
            static_assert(CONFIG::kOrdered, "unionWith() requires an ordered configuration");
            return Tree(_stash, core().unite(_root, rootOf(other), policy));
        }

        /** My elements whose keys are also in `other`. */
        NODISCARD Tree intersectWith(const Tree &other) const {
            static_assert(CONFIG::kOrdered, "intersectWith() requires an ordered configuration");
            return Tree(_stash, core().intersect(_root, rootOf(other)));
        }

        /** My elements whose keys are not in `other`. */
        NODISCARD Tree differenceWith(const Tree &other) const {
            static_assert(CONFIG::kOrdered, "differenceWith() requires an ordered configuration");
            return Tree(_stash, core().difference(_root, rootOf(other)));
        }


        //-------- Positional operations:

        NODISCARD std::pair<Tree,Tree> splitAt(size_t index) const {
            auto parts = core().cutAt(_root, index);
            return {Tree(_stash, std::move(parts.first)), Tree(_stash, std::move(parts.second))};
        }

        NODISCARD Tree removeAt(size_t index) const {
            size_t n = size();
            throwIf(index >= n, OutOfRange, "Index %zu is out of range (size %zu)", index, n);
            return Tree(_stash, core().removeAt(_root, index));
        }

        NODISCARD Tree insertAt(size_t index, element_type e) const {
            static_assert(!CONFIG::kOrdered, "insertAt() requires a positional configuration");
            size_t n = size();
            throwIf(index > n, OutOfRange, "Index %zu is out of range (size %zu)", index, n);
            return Tree(_stash, core().insertAt(_root, index, std::move(e)));
        }

        NODISCARD Tree replaceAt(size_t index, element_type e) const {
            static_assert(!CONFIG::kOrdered, "replaceAt() requires a positional configuration");
            size_t n = size();
            throwIf(index >= n, OutOfRange, "Index %zu is out of range (size %zu)", index, n);
            return Tree(_stash, core().replaceAt(_root, index, std::move(e)));
        }

        NODISCARD Tree pushBack(element_type e) const {
            static_assert(!CONFIG::kOrdered, "pushBack() requires a positional configuration");
            return Tree(_stash, core().append(_root, std::move(e)));
        }

        NODISCARD Tree popBack() const {
            throwIf(empty(), OutOfRange, "popBack() of an empty tree");
            return Tree(_stash, core().splitAt(_root, size() - 1).first);
        }

        NODISCARD Tree concat(const Tree &other) const {
            static_assert(!CONFIG::kOrdered, "concat() requires a positional configuration");
            return join(*this, other);
        }

        /** Inserts all of `other`'s elements before `index`. */
        NODISCARD Tree splice(size_t index, const Tree &other) const {
            static_assert(!CONFIG::kOrdered, "splice() requires a positional configuration");
            size_t n = size();
            throwIf(index > n, OutOfRange, "Index %zu is out of range (size %zu)", index, n);
            return Tree(_stash, core().spliceAt(_root, index, rootOf(other)));
        }


        //-------- Comparison:

        /** Equal contents. O(1) when CheckSum is configured (trusting the checksum), else
            O(n) unless both are the same node. */
        bool operator== (const Tree &other) const {
            return core().equals(_root, rootOf(other));
        }

        bool operator!= (const Tree &other) const       {return !(*this == other);}


        //-------- Iteration:

        template <bool REVERSE> class basic_iterator;
        using iterator          = basic_iterator<false>;
        using reverse_iterator  = basic_iterator<true>;

        iterator begin() const                          {return iterator(*this);}
        iterator end() const                            {return iterator();}
        reverse_iterator rbegin() const                 {return reverse_iterator(*this);}
        reverse_iterator rend() const                   {return reverse_iterator();}

        /** Copies all elements into a vector, in order. */
        std::vector<element_type> elements() const {
            std::vector<element_type> result;
            result.reserve(size());
            core().forEach(root(), [&](const element_type &e) {result.push_back(e);});
            return result;
        }


        //-------- Diagnostics:

        /** Writes the tree sideways (root at the left, greatest element at the top), with each
            node's weight and Location. */
        void dump(std::ostream &out) const {
            if (empty())
                out << "(empty)\n";
            else
                core().dump(out, root());
        }

        /** Verifies the structural invariants; throws `assertion_failure` if one is violated. */
        void checkInvariants() const {
            core().check(root());
        }

    private:
        Tree(stash_type *stash, Subtree root)
        :_stash(stash)
        ,_root(std::move(root))
        { }

        core_type core() const                          {return core_type(_stash);}

        /** The root of `other` as a Subtree in my Stash, importing it if it's in another one. */
        Subtree rootOf(const Tree &other) const {
            if (other._stash.get() == _stash.get())
                return other._root;
            return core().import(*other._stash.get(), other.root());
        }

        Retained<stash_type>    _stash;     // Declared first, so it's released last
        Subtree                 _root;
    };


    template <class CONFIG>
    struct Tree<CONFIG>::SplitResult {
        Tree                        less;
        std::optional<element_type> equal;
        Tree                        greater;
    };


    /** In-order iterator, or reverse-order if REVERSE is true. It holds a copy of the tree, so
        it stays valid regardless of what happens to the Tree it came from. Use it either as a
        standard iterator, or as `for (Tree::iterator i(tree); i; ++i) ...`. */
    template <class CONFIG>
    template <bool REVERSE>
    class Tree<CONFIG>::basic_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = element_type;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const element_type*;
        using reference         = const element_type&;

        basic_iterator() = default;

        explicit basic_iterator(const Tree &tree)
        :_tree(tree)
        {
            descend(tree.root());
        }

        explicit operator bool() const noexcept     {return !_path.empty();}

        reference operator* () const                {return node(_path.back()).pivot;}
        pointer operator-> () const                 {return &**this;}

        basic_iterator& operator++ () {
            precondition(!_path.empty());
            Location loc = _path.back();
            _path.pop_back();
            descend(REVERSE ? node(loc).left : node(loc).right);
            return *this;
        }

        basic_iterator operator++ (int) {
            basic_iterator prev = *this;
            ++*this;
            return prev;
        }

        bool operator== (const basic_iterator &i) const {
            if (_path.empty() || i._path.empty())
                return _path.empty() == i._path.empty();
            return _path.back() == i._path.back();
        }

        bool operator!= (const basic_iterator &i) const {return !(*this == i);}

    private:
        const typename stash_type::Node& node(Location loc) const {
            return _tree->stash()->get(loc);
        }

        void descend(Location loc) {
            while (loc) {
                _path.push_back(loc);
                loc = REVERSE ? node(loc).right : node(loc).left;
            }
        }

        std::optional<Tree>     _tree;
        std::vector<Location>   _path;      // Ancestors still to be visited
    };


    template <class CONFIG>
    std::ostream& operator<< (std::ostream &out, const Tree<CONFIG> &tree) {
        tree.dump(out);
        return out;
    }


    /** Trees hash by their checksum, so collections can be elements of other collections. */
    template <class CONFIG>
    struct Hasher<Tree<CONFIG>> {
        hash_t operator() (const Tree<CONFIG> &tree, hash_t seed) const {
            Digest d = tree.checksum();
            return CombineHash(MixHash(d.sum ^ MixHash(seed)), d.scale);
        }
    };

}
