//
// TreeCore.hh
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
#include "arbor/Config.hh"
#include "arbor/Stash.hh"
#include "betterassert.hh"
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace arbor::impl {

    /** An owning reference to a subtree: a Location plus the Stash it lives in. Copying it
        retains the Location, destroying it releases it. An empty Subtree is an empty tree.
        It does not keep the Stash itself alive; that's the owning Tree's job. */
    template <class CONFIG>
    class Subtree {
    public:
        using stash_type = Stash<CONFIG>;
        using Node = typename stash_type::Node;

        Subtree() noexcept = default;

        /** Takes over a reference the caller already owns. */
        static Subtree adopt(stash_type *stash, Location loc) noexcept {
            return Subtree(stash, loc);
        }

        /** Adds a reference to a Location the caller is only borrowing. */
        static Subtree borrow(stash_type *stash, Location loc) {
            if (loc)
                stash->retain(loc);
            return Subtree(stash, loc);
        }

        Subtree(const Subtree &s)
        :_stash(s._stash), _loc(s._loc)
        {
            if (_loc)
                _stash->retain(_loc);
        }

        Subtree(Subtree &&s) noexcept
        :_stash(s._stash), _loc(s._loc)
        {
            s._loc = Location();
        }

        ~Subtree() {
            if (_loc)
                _stash->release(_loc);
        }

        Subtree& operator= (Subtree &&s) noexcept {
            std::swap(_stash, s._stash);
            std::swap(_loc, s._loc);
            return *this;
        }

        Subtree& operator= (const Subtree &s) {
            Subtree copy(s);
            return *this = std::move(copy);
        }

        Location location() const noexcept          {return _loc;}
        bool empty() const noexcept                 {return !_loc;}
        explicit operator bool() const noexcept     {return bool(_loc);}

        const Node& node() const                    {return _stash->get(_loc);}

        /** Gives up ownership of the reference without releasing it. */
        Location detach() && noexcept {
            Location loc = _loc;
            _loc = Location();
            return loc;
        }

    private:
        Subtree(stash_type *stash, Location loc) noexcept
        :_stash(stash), _loc(loc)
        { }

        stash_type* _stash {nullptr};
        Location    _loc;
    };


    // Writes an element to a stream if it's printable, for Tree::dump.
    template <class T, class = void>
    struct is_streamable : std::false_type { };

    template <class T>
    struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>()
                                                 << std::declval<const T&>())>>
        : std::true_type { };

    template <class T>
    void writeElement(std::ostream &out, const T &value) {
        if constexpr (is_streamable<T>::value)
            out << value;
        else
            out << "<?>";
    }

    template <class K, class V>
    void writeElement(std::ostream &out, const std::pair<K,V> &kv) {
        writeElement(out, kv.first);
        out << ": ";
        writeElement(out, kv.second);
    }


    /** The tree algorithms, operating on Subtrees within one Stash.
        Everything here is functional: inputs are never modified, results share all the structure
        they can with the inputs, and a result equal to an input is usually that input itself.

        The trees are treaps whose priority is an element's weight (the leading zero bits of its
        key's salted hash). Nodes are max-heap ordered by weight; equal weights are broken in
        favor of the element ordered (or positioned) first. Since all of that is a function of
        the contents alone, a given set of elements always has exactly one shape.

        In a positional tree the same value can occur many times. Each node records in `repeat`
        how many equal elements come directly before it, and that count is mixed into its weight,
        so a run of equal values is spread out like distinct ones instead of forming a spine.
        Operations that bring equal elements together, or split a run, renumber the run that
        follows the seam.

        Nothing here recurses along a path whose length depends on the input's shape, except the
        ordered set operations (whose depth follows the keys' hashes). */
    template <class CONFIG>
    class TreeCore {
    public:
        using stash_type    = Stash<CONFIG>;
        using Node          = typename stash_type::Node;
        using element_type  = typename CONFIG::element_type;
        using key_type      = typename CONFIG::key_type;
        using meta_type     = typename Node::meta_type;
        using Subtree       = impl::Subtree<CONFIG>;

        struct SplitResult {
            Subtree                     less;
            std::optional<element_type> equal;
            Subtree                     greater;
        };

        explicit TreeCore(stash_type *stash)
        :_stash(stash)
        { }

        static const key_type& keyOf(const element_type &e)    {return CONFIG::keyOf(e);}

        static level_t weightOf(const element_type &e, uint32_t repeat = 0) {
            hash_t h = CONFIG::hashKey(CONFIG::keyOf(e), CONFIG::kSalt);
            return WeightOf(repeat == 0 ? h : CombineHash(h, repeat));
        }

        /** Does node `a` belong above node `b`? */
        static bool outranks(const Node &a, const Node &b) {
            return a.weight > b.weight
                || (a.weight == b.weight && CONFIG::less(keyOf(a.pivot), keyOf(b.pivot)));
        }

        Subtree sub(Location loc) const                 {return Subtree::borrow(_stash, loc);}

        static const meta_type& identityMeta() {
            static const meta_type sIdentity;
            return sIdentity;
        }

        const meta_type& metaOf(Location loc) const {
            return loc ? _stash->get(loc).meta : identityMeta();
        }

        size_t sizeOf(Location loc) const {
            return loc ? _stash->get(loc).meta.template get<Cardinality>() : 0;
        }


#pragma mark - NODES:


        /** Stores a node with precomputed metadata. */
        Subtree store(element_type pivot, level_t weight, uint32_t repeat,
                      Subtree left, Subtree right, meta_type meta)
        {
            Location loc = _stash->allocate(std::move(pivot), weight,
                                            left.location(), right.location(), std::move(meta),
                                            repeat);
            // The new node now owns the children's references:
            (void)std::move(left).detach();
            (void)std::move(right).detach();
            return Subtree::adopt(_stash, loc);
        }

        Subtree makeNode(element_type pivot, level_t weight, uint32_t repeat,
                         Subtree left, Subtree right)
        {
            meta_type meta = meta_type::combine(meta_type::combine(metaOf(left.location()),
                                                                   meta_type::lift(pivot)),
                                                metaOf(right.location()));
            return store(std::move(pivot), weight, repeat, std::move(left), std::move(right),
                         std::move(meta));
        }

        Subtree singleton(element_type e, uint32_t repeat = 0) {
            level_t weight = weightOf(e, repeat);
            return makeNode(std::move(e), weight, repeat, {}, {});
        }

        /** Returns `t` with new children; that's `t` itself if they're unchanged. */
        Subtree rebuild(const Subtree &t, Subtree left, Subtree right) {
            const Node &n = t.node();
            if (left.location() == n.left && right.location() == n.right)
                return t;
            return makeNode(n.pivot, n.weight, n.repeat, std::move(left), std::move(right));
        }


#pragma mark - LOOKUP:


        const element_type* find(Location loc, const key_type &key) const {
            while (loc) {
                const Node &n = _stash->get(loc);
                if (CONFIG::less(key, keyOf(n.pivot)))
                    loc = n.left;
                else if (CONFIG::less(keyOf(n.pivot), key))
                    loc = n.right;
                else
                    return &n.pivot;
            }
            return nullptr;
        }

        const Node* firstNode(Location loc) const {
            const Node *result = nullptr;
            for (; loc; loc = result->left)
                result = &_stash->get(loc);
            return result;
        }

        const Node* lastNode(Location loc) const {
            const Node *result = nullptr;
            for (; loc; loc = result->right)
                result = &_stash->get(loc);
            return result;
        }

        const element_type* first(Location loc) const {
            const Node *n = firstNode(loc);
            return n ? &n->pivot : nullptr;
        }

        const element_type* last(Location loc) const {
            const Node *n = lastNode(loc);
            return n ? &n->pivot : nullptr;
        }

        /** The element at an index, which must be less than the size. */
        const element_type& at(Location loc, size_t index) const {
            for (;;) {
                const Node &n = _stash->get(loc);
                size_t leftSize = sizeOf(n.left);
                if (index < leftSize) {
                    loc = n.left;
                } else if (index == leftSize) {
                    return n.pivot;
                } else {
                    index -= leftSize + 1;
                    loc = n.right;
                }
            }
        }

        /** The number of elements less than `key`, if `key` is present. */
        std::optional<size_t> indexOf(Location loc, const key_type &key) const {
            size_t rank = 0;
            while (loc) {
                const Node &n = _stash->get(loc);
                if (CONFIG::less(key, keyOf(n.pivot))) {
                    loc = n.left;
                } else if (CONFIG::less(keyOf(n.pivot), key)) {
                    rank += sizeOf(n.left) + 1;
                    loc = n.right;
                } else {
                    return rank + sizeOf(n.left);
                }
            }
            return std::nullopt;
        }

        /** Calls `fn(node)` for each node in order, until it returns false. */
        template <class FN>
        void forEachNode(Location loc, FN fn) const {
            std::vector<Location> path;
            for (;;) {
                for (; loc; loc = _stash->get(loc).left)
                    path.push_back(loc);
                if (path.empty())
                    break;
                const Node &n = _stash->get(path.back());
                path.pop_back();
                if (!fn(n))
                    break;
                loc = n.right;
            }
        }

        /** Calls `fn(element)` for each element in order. */
        template <class FN>
        void forEach(Location loc, FN fn) const {
            forEachNode(loc, [&](const Node &n) {
                fn(n.pivot);
                return true;
            });
        }


#pragma mark - SPLIT & JOIN:


        /** Partitions `t` into the elements less than `key` and those greater; the element equal
            to `key`, if any, is returned separately. */
        SplitResult split(const Subtree &t, const key_type &key) {
            std::vector<std::pair<Subtree,bool>> path;      // Nodes passed, and if we went left
            SplitResult result;
            Subtree cur = t;
            while (cur) {
                const Node &n = cur.node();
                bool goLeft = CONFIG::less(key, keyOf(n.pivot));
                if (!goLeft && !CONFIG::less(keyOf(n.pivot), key)) {
                    result = {sub(n.left), n.pivot, sub(n.right)};
                    break;
                }
                Subtree next = sub(goLeft ? n.left : n.right);
                path.emplace_back(std::move(cur), goLeft);
                cur = std::move(next);
            }
            for (; !path.empty(); path.pop_back()) {
                auto &[node, wentLeft] = path.back();
                const Node &n = node.node();
                if (wentLeft)
                    result.greater = rebuild(node, std::move(result.greater), sub(n.right));
                else
                    result.less = rebuild(node, sub(n.left), std::move(result.less));
            }
            return result;
        }

        /** Concatenates two trees; every element of `l` must precede every element of `r`.
            The heavier root wins, and on a tie the left one does. */
        Subtree join(const Subtree &l, const Subtree &r) {
            std::vector<std::pair<Subtree,bool>> path;      // Winning roots, and if from `l`
            Subtree a = l, b = r;
            while (a && b) {
                const Node &na = a.node(), &nb = b.node();
                if (na.weight >= nb.weight) {
                    Subtree next = sub(na.right);
                    path.emplace_back(std::move(a), true);
                    a = std::move(next);
                } else {
                    Subtree next = sub(nb.left);
                    path.emplace_back(std::move(b), false);
                    b = std::move(next);
                }
            }
            Subtree result = a ? std::move(a) : std::move(b);
            for (; !path.empty(); path.pop_back()) {
                auto &[node, fromLeft] = path.back();
                const Node &n = node.node();
                if (fromLeft)
                    result = rebuild(node, sub(n.left), std::move(result));
                else
                    result = rebuild(node, std::move(result), sub(n.right));
            }
            return result;
        }

        Subtree insert(const Subtree &t, element_type e, DuplicatePolicy policy) {
            if (const element_type *existing = find(t.location(), keyOf(e))) {
                if (policy == DuplicatePolicy::kKeepExisting || CONFIG::same(*existing, e))
                    return t;
            }
            SplitResult parts = split(t, keyOf(e));
            return join(join(parts.less, singleton(std::move(e))), parts.greater);
        }

        Subtree remove(const Subtree &t, const key_type &key) {
            if (!find(t.location(), key))
                return t;
            SplitResult parts = split(t, key);
            return join(parts.less, parts.greater);
        }


#pragma mark - SET OPERATIONS:


        /** True if two subtrees are known to have equal contents without looking inside:
            they're the same node, or have the same size and checksum. */
        bool sameContents(const Subtree &a, const Subtree &b) const {
            if (a.location() == b.location())
                return true;
            if constexpr (meta_type::template has<CheckSum>) {
                if (!a || !b)
                    return false;
                const meta_type &ma = a.node().meta, &mb = b.node().meta;
                return ma.template get<Cardinality>() == mb.template get<Cardinality>()
                    && ma.template get<CheckSum>() == mb.template get<CheckSum>();
            }
            return false;
        }

        Subtree unite(const Subtree &a, const Subtree &b, MergePolicy policy) {
            if (!a)
                return b;
            if (!b || sameContents(a, b))
                return a;
            const Node &na = a.node(), &nb = b.node();
            if (outranks(na, nb)) {
                SplitResult parts = split(b, keyOf(na.pivot));
                Subtree left  = unite(sub(na.left),  parts.less,    policy);
                Subtree right = unite(sub(na.right), parts.greater, policy);
                if (parts.equal && policy == MergePolicy::kPreferRight
                                && !CONFIG::same(na.pivot, *parts.equal))
                    return makeNode(std::move(*parts.equal), na.weight, 0,
                                    std::move(left), std::move(right));
                return rebuild(a, std::move(left), std::move(right));
            } else {
                SplitResult parts = split(a, keyOf(nb.pivot));
                Subtree left  = unite(parts.less,    sub(nb.left),  policy);
                Subtree right = unite(parts.greater, sub(nb.right), policy);
                if (parts.equal && policy == MergePolicy::kPreferLeft
                                && !CONFIG::same(*parts.equal, nb.pivot))
                    return makeNode(std::move(*parts.equal), nb.weight, 0,
                                    std::move(left), std::move(right));
                return rebuild(b, std::move(left), std::move(right));
            }
        }

        /** Elements of `a` whose keys are also in `b`. */
        Subtree intersect(const Subtree &a, const Subtree &b) {
            if (!a || !b)
                return {};
            if (sameContents(a, b))
                return a;
            const Node &na = a.node();
            SplitResult parts = split(b, keyOf(na.pivot));
            Subtree left  = intersect(sub(na.left),  parts.less);
            Subtree right = intersect(sub(na.right), parts.greater);
            if (parts.equal)
                return rebuild(a, std::move(left), std::move(right));
            return join(left, right);
        }

        /** Elements of `a` whose keys are not in `b`. */
        Subtree difference(const Subtree &a, const Subtree &b) {
            if (!a)
                return {};
            if (!b)
                return a;
            if (sameContents(a, b))
                return {};
            const Node &na = a.node();
            SplitResult parts = split(b, keyOf(na.pivot));
            Subtree left  = difference(sub(na.left),  parts.less);
            Subtree right = difference(sub(na.right), parts.greater);
            if (parts.equal)
                return join(left, right);
            return rebuild(a, std::move(left), std::move(right));
        }

        bool equals(const Subtree &a, const Subtree &b) const {
            if (a.location() == b.location())
                return true;
            if (sizeOf(a.location()) != sizeOf(b.location()))
                return false;
            if constexpr (meta_type::template has<CheckSum>) {
                return metaOf(a.location()).template get<CheckSum>()
                    == metaOf(b.location()).template get<CheckSum>();
            } else {
                std::vector<const element_type*> elements;
                forEach(a.location(), [&](const element_type &e) {elements.push_back(&e);});
                size_t i = 0;
                bool equal = true;
                forEachNode(b.location(), [&](const Node &n) {
                    equal = CONFIG::same(*elements[i++], n.pivot);
                    return equal;
                });
                return equal;
            }
        }


#pragma mark - POSITIONAL OPERATIONS:


        /** Splits `t` into its first `index` elements and the rest. The rest's leading run is
            not renumbered; see `cutAt`. */
        std::pair<Subtree,Subtree> splitAt(const Subtree &t, size_t index) {
            std::vector<std::pair<Subtree,bool>> path;      // Nodes passed, and if we went left
            std::pair<Subtree,Subtree> result;
            Subtree cur = t;
            for (;;) {
                if (index == 0) {
                    result.second = cur;
                    break;
                } else if (index >= sizeOf(cur.location())) {
                    result.first = cur;
                    break;
                }
                const Node &n = cur.node();
                size_t leftSize = sizeOf(n.left);
                if (index == leftSize) {
                    result = {sub(n.left), rebuild(cur, Subtree(), sub(n.right))};
                    break;
                }
                bool goLeft = (index < leftSize);
                if (!goLeft)
                    index -= leftSize + 1;
                Subtree next = sub(goLeft ? n.left : n.right);
                path.emplace_back(std::move(cur), goLeft);
                cur = std::move(next);
            }
            for (; !path.empty(); path.pop_back()) {
                auto &[node, wentLeft] = path.back();
                const Node &n = node.node();
                if (wentLeft)
                    result.second = rebuild(node, std::move(result.second), sub(n.right));
                else
                    result.first = rebuild(node, sub(n.left), std::move(result.first));
            }
            return result;
        }

        /** Renumbers the run of equal elements at the start of `t` to count up from `start`,
            rebuilding those nodes with their new weights. */
        Subtree renumber(const Subtree &t, uint32_t start) {
            if constexpr (CONFIG::kOrdered) {
                return t;
            } else {
                if (!t || firstNode(t.location())->repeat == start)
                    return t;
                std::vector<element_type> run;
                forEachNode(t.location(), [&](const Node &n) {
                    if (!run.empty() && !CONFIG::same(run.front(), n.pivot))
                        return false;
                    run.push_back(n.pivot);
                    return true;
                });
                Subtree result;
                uint32_t repeat = start;
                for (auto &e : run)
                    result = join(result, singleton(std::move(e), repeat++));
                return join(result, splitAt(t, run.size()).second);
            }
        }

        /** Concatenates two trees, renumbering `r`'s leading run to follow on from `l`. */
        Subtree concat(const Subtree &l, const Subtree &r) {
            if constexpr (CONFIG::kOrdered) {
                return join(l, r);
            } else {
                if (!r)
                    return l;
                uint32_t start = 0;
                if (const Node *tail = lastNode(l.location());
                        tail && CONFIG::same(tail->pivot, firstNode(r.location())->pivot))
                    start = tail->repeat + 1;
                return join(l, renumber(r, start));
            }
        }

        /** Splits `t` into its first `index` elements and the rest, both numbered as
            standalone trees. */
        std::pair<Subtree,Subtree> cutAt(const Subtree &t, size_t index) {
            auto parts = splitAt(t, index);
            parts.second = renumber(parts.second, 0);
            return parts;
        }

        /** Adds an element at the end. */
        Subtree append(const Subtree &t, element_type e) {
            uint32_t repeat = 0;
            if constexpr (!CONFIG::kOrdered) {
                if (const Node *tail = lastNode(t.location()); tail && CONFIG::same(tail->pivot, e))
                    repeat = tail->repeat + 1;
            }
            return join(t, singleton(std::move(e), repeat));
        }

        Subtree insertAt(const Subtree &t, size_t index, element_type e) {
            auto parts = splitAt(t, index);
            return concat(append(parts.first, std::move(e)), parts.second);
        }

        Subtree removeAt(const Subtree &t, size_t index) {
            auto parts = splitAt(t, index);
            return concat(parts.first, splitAt(parts.second, 1).second);
        }

        Subtree replaceAt(const Subtree &t, size_t index, element_type e) {
            auto parts = splitAt(t, index);
            Subtree rest = splitAt(parts.second, 1).second;
            return concat(append(parts.first, std::move(e)), rest);
        }

        Subtree spliceAt(const Subtree &t, size_t index, const Subtree &inserted) {
            auto parts = splitAt(t, index);
            return concat(concat(parts.first, inserted), parts.second);
        }


#pragma mark - IMPORT & DIAGNOSTICS:


        /** Copies a subtree from another Stash into this one, node for node. */
        Subtree import(stash_type &from, Location root) {
            if (!root)
                return {};
            std::vector<std::pair<Location,bool>> pending {{root, false}};   // (node, expanded)
            std::vector<Subtree> copied;
            while (!pending.empty()) {
                auto [loc, expanded] = pending.back();
                pending.pop_back();
                const Node &n = from.get(loc);
                if (!expanded) {
                    pending.emplace_back(loc, true);
                    if (n.right)
                        pending.emplace_back(n.right, false);
                    if (n.left)
                        pending.emplace_back(n.left, false);
                } else {
                    // The left subtree was copied first, so the right one is on top:
                    Subtree right, left;
                    if (n.right) {
                        right = std::move(copied.back());
                        copied.pop_back();
                    }
                    if (n.left) {
                        left = std::move(copied.back());
                        copied.pop_back();
                    }
                    copied.push_back(store(n.pivot, n.weight, n.repeat,
                                           std::move(left), std::move(right), n.meta));
                }
            }
            return std::move(copied.back());
        }

        /** Writes the tree sideways: the greatest element at the top, children indented. */
        void dump(std::ostream &out, Location root) const {
            std::vector<std::pair<Location,unsigned>> pending;     // (node, depth)
            Location loc = root;
            unsigned depth = 0;
            for (;;) {
                for (; loc; loc = _stash->get(loc).right)
                    pending.emplace_back(loc, depth++);
                if (pending.empty())
                    break;
                auto [cur, curDepth] = pending.back();
                pending.pop_back();
                const Node &n = _stash->get(cur);
                out << std::string(4 * curDepth, ' ') << '[' << n.weight << "] ";
                writeElement(out, n.pivot);
                out << "  " << cur << "\n";
                loc = n.left;
                depth = curDepth + 1;
            }
        }

        /** Verifies order, heap, tie-break, repeat and metadata invariants, throwing
            `assertion_failure` at the first violation. */
        void check(Location root) const {
            struct Bounds {Location loc; const element_type *lo, *hi;};    // exclusive bounds
            std::vector<Bounds> pending;
            if (root)
                pending.push_back({root, nullptr, nullptr});
            while (!pending.empty()) {
                Bounds b = pending.back();
                pending.pop_back();
                assert_always(_stash->owns(b.loc));
                const Node &n = _stash->get(b.loc);
                assert_always(n.weight == weightOf(n.pivot, n.repeat));
                if constexpr (CONFIG::kOrdered) {
                    assert_always(n.repeat == 0);
                    assert_always(!b.lo || CONFIG::less(keyOf(*b.lo), keyOf(n.pivot)));
                    assert_always(!b.hi || CONFIG::less(keyOf(n.pivot), keyOf(*b.hi)));
                }
                if (n.left)
                    assert_always(_stash->get(n.left).weight < n.weight);
                if (n.right)
                    assert_always(_stash->get(n.right).weight <= n.weight);
                assert_always(sizeOf(b.loc) == sizeOf(n.left) + 1 + sizeOf(n.right));
                if constexpr (meta_type::template has<CheckSum>) {
                    Digest expected = Digest::combine(
                                        Digest::combine(metaOf(n.left).template get<CheckSum>(),
                                                        CheckSum<CONFIG>::lift(n.pivot)),
                                        metaOf(n.right).template get<CheckSum>());
                    assert_always(n.meta.template get<CheckSum>() == expected);
                }
                if (n.left)
                    pending.push_back({n.left, b.lo, &n.pivot});
                if (n.right)
                    pending.push_back({n.right, &n.pivot, b.hi});
            }

            if constexpr (!CONFIG::kOrdered) {
                const Node *prev = nullptr;
                forEachNode(root, [&](const Node &n) {
                    uint32_t expected = 0;
                    if (prev && CONFIG::same(prev->pivot, n.pivot))
                        expected = prev->repeat + 1;
                    assert_always(n.repeat == expected);
                    prev = &n;
                    return true;
                });
            }
        }

    private:
        stash_type* const _stash;
    };

}
