//
// Stash.hh
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
#include "arbor/Location.hh"
#include "arbor/RefCounted.hh"
#include "arbor/Hash.hh"
#include "betterassert.hh"
#include <atomic>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace arbor {

    /** A tree node. Immutable once stored in a Stash. */
    template <class CONFIG>
    struct Node {
        using element_type = typename CONFIG::element_type;
        using meta_type = typename CONFIG::aggregators::template meta<CONFIG>;

        element_type pivot;
        level_t      weight;
        Location     left, right;
        meta_type    meta;
        uint32_t     repeat = 0;    // Positional trees: # of equal elements directly preceding
    };


    struct StashOptions {
        bool intern     = false;    // Share one Location between structurally identical nodes
        bool threadSafe = false;    // Guard allocation and freeing with a mutex
    };


    /** The part of a Stash that doesn't depend on the node type: identity, options, slot
        bookkeeping, locking and statistics. */
    class StashBase : public RefCounted {
    public:
        uint32_t id() const noexcept                    {return _id;}
        const StashOptions& options() const noexcept    {return _options;}

        /** True if the Location was minted by this Stash. (It may still be stale.) */
        bool owns(Location loc) const noexcept          {return loc._stash == _id;}

        /** Number of nodes currently stored. */
        size_t liveNodes() const noexcept               {return _liveNodes.load(std::memory_order_relaxed);}

        /** Number of nodes ever created (interned hits don't count.) */
        uint64_t allocations() const noexcept           {return _allocations.load(std::memory_order_relaxed);}

        /** Number of allocate() calls satisfied by an existing node. */
        uint64_t internHits() const noexcept            {return _internHits.load(std::memory_order_relaxed);}

        /** Number of slots ever handed out, live or free. */
        uint32_t slotCount() const noexcept             {return _slotCount.load(std::memory_order_acquire);}

    protected:
        // Slots are kept in chunks that never move. Chunk 0 holds slots [0, 64); chunk k > 0
        // holds slots [64·2^(k-1), 64·2^k). So 27 chunks cover the entire 32-bit index space.
        static constexpr unsigned kFirstChunkBits = 6;
        static constexpr unsigned kMaxChunks = 32 - kFirstChunkBits + 1;

        static unsigned chunkOf(uint32_t index, uint32_t *offset) noexcept;
        static size_t chunkSize(unsigned chunk) noexcept ARBOR_CONST;

        explicit StashBase(StashOptions);
        ~StashBase() override;

        static Location mint(uint32_t stash, uint32_t index, uint32_t generation) noexcept {
            return Location(stash, index, generation);
        }
        static uint32_t indexOf(Location loc) noexcept      {return loc._index;}
        static uint32_t generationOf(Location loc) noexcept {return loc._generation;}

        /** Returns the index of a free slot, reusing freed ones first. Call with the lock held.
            Sets `isNew` if the slot has never been used, and might lie in a missing chunk. */
        uint32_t takeSlot(bool &isNew);

        /** Puts a slot on the free list. Call with the lock held. */
        void freeSlot(uint32_t index);

        void noteAllocated() noexcept   {++_liveNodes; ++_allocations;}
        void noteFreed() noexcept       {--_liveNodes;}
        void noteInternHit() noexcept   {++_internHits;}

        /** Locks the stash's mutex, if it's thread-safe. */
        class Lock {
        public:
            explicit Lock(StashBase &stash)
            :_mutex(stash._options.threadSafe ? &stash._mutex : nullptr)
            {
                if (_mutex) _mutex->lock();
            }
            ~Lock()                                     {if (_mutex) _mutex->unlock();}
            Lock(const Lock&) = delete;
            Lock& operator=(const Lock&) = delete;
        private:
            std::mutex* const _mutex;
        };

        const uint32_t          _id;
        const StashOptions      _options;

    private:
        std::mutex              _mutex;
        std::vector<uint32_t>   _freeList;
        std::atomic<uint32_t>   _slotCount {0};
        std::atomic<size_t>     _liveNodes {0};
        std::atomic<uint64_t>   _allocations {0};
        std::atomic<uint64_t>   _internHits {0};
    };


    /** A reference-counted store of Nodes, addressed by Locations.
        Node reads never lock: a node stays put, and stays unchanged, for as long as anyone holds
        a reference to it. */
    template <class CONFIG>
    class Stash : public StashBase {
    public:
        using Config = CONFIG;
        using Node = arbor::Node<CONFIG>;
        using element_type = typename Node::element_type;
        using meta_type = typename Node::meta_type;

        static Retained<Stash> create(StashOptions options = {}) {
            return retained(new Stash(options));
        }

        /** The process-wide Stash used by Trees of this configuration that aren't given one.
            It's thread-safe, doesn't intern, and is never freed. */
        static Stash* defaultStash() {
            static Stash* const sStash = arbor::retain(new Stash(StashOptions{false, true}));
            return sStash;
        }

        /** Stores a new node with a reference count of 1, or under interning, retains and returns
            an identical existing node. The new node adopts the caller's references to its
            children, so don't release them afterwards. */
        NODISCARD Location allocate(element_type pivot, level_t weight,
                                    Location left, Location right, meta_type meta,
                                    uint32_t repeat = 0)
        {
            precondition(!left || owns(left));
            precondition(!right || owns(right));
            Node node {std::move(pivot), weight, left, right, std::move(meta), repeat};
            hash_t key = _options.intern ? internKey(node) : 0;

            Location loc;
            bool hit = false;
            {
                Lock lock(*this);
                if (_options.intern)
                    hit = lookup(key, node, loc);
                if (!hit) {
                    bool isNew;
                    uint32_t index = takeSlot(isNew);
                    Slot &slot = slotAt(index, isNew);
                    slot.node.emplace(std::move(node));
                    slot.internKey = key;
                    slot.refs.store(1, std::memory_order_release);
                    loc = mint(_id, index, slot.generation.load(std::memory_order_relaxed));
                    if (_options.intern)
                        _interned.emplace(key, loc);
                }
            }

            if (hit) {
                // The existing node already has its own references to these children:
                noteInternHit();
                if (left) release(left);
                if (right) release(right);
            } else {
                noteAllocated();
            }
            return loc;
        }

        /** Returns the node at a Location. Fails if the Location isn't from this Stash, or is
            stale (its node has been freed.) */
        const Node& get(Location loc) const {
            const Slot &slot = checkedSlot(loc);
            return *slot.node;
        }

        void retain(Location loc) {
            checkedSlot(loc).refs.fetch_add(1, std::memory_order_relaxed);
        }

        /** Releases a reference. At zero, the node is freed and its children released. */
        void release(Location loc) {
            auto old = checkedSlot(loc).refs.fetch_sub(1, std::memory_order_acq_rel);
            assert_always(old > 0);
            if (old == 1)
                free(loc);
        }

        uint32_t refCount(Location loc) const {
            return checkedSlot(loc).refs.load(std::memory_order_relaxed);
        }

    protected:
        explicit Stash(StashOptions options)
        :StashBase(options)
        {
            for (auto &chunk : _chunks)
                chunk.store(nullptr, std::memory_order_relaxed);
        }

        ~Stash() override {
            for (auto &chunk : _chunks)
                delete[] chunk.load(std::memory_order_relaxed);
        }

    private:
        struct Slot {
            std::atomic<uint32_t>   refs {0};
            std::atomic<uint32_t>   generation {0};
            std::optional<Node>     node;
            hash_t                  internKey {0};
        };

        Slot* slotPtr(uint32_t index) const noexcept {
            uint32_t offset;
            unsigned chunk = chunkOf(index, &offset);
            Slot *slots = _chunks[chunk].load(std::memory_order_acquire);
            return slots ? &slots[offset] : nullptr;
        }

        // Call with the lock held.
        Slot& slotAt(uint32_t index, bool mayNeedChunk) {
            uint32_t offset;
            unsigned chunk = chunkOf(index, &offset);
            Slot *slots = _chunks[chunk].load(std::memory_order_acquire);
            if (!slots) {
                assert_always(mayNeedChunk);
                slots = new Slot[chunkSize(chunk)];
                _chunks[chunk].store(slots, std::memory_order_release);
            }
            return slots[offset];
        }

        Slot& checkedSlot(Location loc) const {
            precondition(owns(loc));
            precondition(indexOf(loc) < slotCount());
            Slot *slot = slotPtr(indexOf(loc));
            precondition(slot != nullptr);
            precondition(slot->generation.load(std::memory_order_acquire) == generationOf(loc));
            precondition(slot->refs.load(std::memory_order_relaxed) > 0);
            return *slot;
        }

        static hash_t internKey(const Node &node) {
            hash_t h = CombineHash(CONFIG::hashElement(node.pivot, CONFIG::kSalt),
                                   node.weight + (hash_t(node.repeat) << 8));
            return CombineHash(CombineHash(h, node.left.hash()), node.right.hash());
        }

        // Call with the lock held. On success `loc` has been retained.
        bool lookup(hash_t key, const Node &node, Location &loc) {
            auto range = _interned.equal_range(key);
            for (auto i = range.first; i != range.second; ++i) {
                Slot *slot = slotPtr(indexOf(i->second));
                const Node &existing = *slot->node;
                if (existing.weight == node.weight && existing.repeat == node.repeat
                        && existing.left == node.left
                        && existing.right == node.right && CONFIG::same(existing.pivot, node.pivot)) {
                    // A node whose count already dropped to zero is being freed by another
                    // thread; it can't be resurrected.
                    uint32_t refs = slot->refs.load(std::memory_order_relaxed);
                    while (refs > 0) {
                        if (slot->refs.compare_exchange_weak(refs, refs + 1,
                                                             std::memory_order_acq_rel)) {
                            loc = i->second;
                            return true;
                        }
                    }
                }
            }
            return false;
        }

        // Frees a node whose ref-count reached zero, then any children that reach zero too.
        // Iterative, so freeing a long spine can't overflow the stack.
        void free(Location loc) {
            std::vector<Location> pending {loc};
            while (!pending.empty()) {
                Location cur = pending.back();
                pending.pop_back();

                std::optional<Node> dead;
                {
                    Lock lock(*this);
                    Slot &slot = *slotPtr(indexOf(cur));
                    dead.emplace(std::move(*slot.node));
                    slot.node.reset();
                    if (_options.intern)
                        unintern(slot.internKey, cur);
                    slot.generation.fetch_add(1, std::memory_order_release);
                    freeSlot(indexOf(cur));
                }
                noteFreed();

                for (Location child : {dead->left, dead->right}) {
                    if (child) {
                        auto old = checkedSlot(child).refs.fetch_sub(1, std::memory_order_acq_rel);
                        assert_always(old > 0);
                        if (old == 1)
                            pending.push_back(child);
                    }
                }
                // The pivot is destroyed here, outside the lock, since destroying it might
                // release nodes (of a nested collection) in this same Stash.
            }
        }

        void unintern(hash_t key, Location loc) {
            auto range = _interned.equal_range(key);
            for (auto i = range.first; i != range.second; ++i) {
                if (i->second == loc) {
                    _interned.erase(i);
                    return;
                }
            }
        }

        std::atomic<Slot*>                          _chunks[kMaxChunks];
        std::unordered_multimap<hash_t, Location>   _interned;
    };

}
