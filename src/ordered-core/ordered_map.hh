#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/hash.hh>
#include <ordered-core/impl/slot_buffer.hh>
#include <ordered-core/optional.hh>
#include <ordered-core/utility.hh>

#include <string>
#include <string_view>
#include <type_traits>


/// Mapping from string keys to values of type V that remembers insertion order.
/// set / get / remove / size are O(1) (amortized for set), iteration visits entries oldest first.
///
/// Layout:
///   _slots   - arena of slots; a slot holds one entry or sits on the free list
///   _buckets - bucket heads of the hash index; chains are threaded through the slots
///   _head/_tail - ends of the doubly linked insertion-order sequence (prev/next slot indices)
///
/// The arena owns every entry. Index, sequence and free list are non-owning slot indices,
/// so growing the arena never invalidates them.
/// Every key in the index has exactly one node in the sequence and vice versa.
///
/// Updating the value of an existing key keeps its position.
/// Removing a key unlinks it from index and sequence, destroys key and value,
/// bumps the slot generation and frees the slot.
/// A freed slot keeps a link to its successor at removal time. It is only handed out again by set
/// once no other freed slot links to it, so such a chain of removed slots always ends at a live
/// entry (or the end) until its first slot is reused.
///
/// V must be nothrow move constructible: growing the arena relocates every value.
///
/// === Iteration ===
///
///     for (auto c = map.first(); c.is_valid(); c.advance())
///         use(c.key(), c.value());
///
///     for (auto [key, value] : map)
///         use(key, value);
///
/// Cursors are independent: any number of them may walk the same map.
/// A cursor remembers the generation of its entry and snapshots its successor when it moves.
/// advance() then picks, in this order:
///   - the current successor, if the entry is still live
///   - the successor at the time the entry was removed, if its slot was not reused since
///     (removed successors are skipped the same way)
///   - the snapshotted successor, resolved the same way, if its slot was not reused since
/// Consequences:
///   - removing the entry the cursor points at is safe
///   - removing or appending any other entry is safe, in any number and order
///   - a cursor whose entry was removed while it was the last one ends the traversal on advance(),
///     entries appended after that removal are not visited
///   - caller obligation: if the current entry is removed AND its slot and the slot of the snapshotted
///     successor are both reused before the next advance() (at least two set calls in between),
///     the position is lost.
///     This is reported via OC_ASSERT; with assertions disabled the traversal ends.
///
/// Cursors and iterators are invalidated when the map is moved from, assigned to, or destroyed.
/// NOT thread-safe; wrap in oc::mutex if shared.
template <class V>
struct oc::ordered_map
{
    static_assert(!std::is_reference_v<V>, "ordered_map cannot store references, use pointers");
    static_assert(std::is_nothrow_move_constructible_v<V>, "values are relocated with a non-throwing move when the arena grows");

    /// Slot index sentinel for "no slot" (end of sequence, empty bucket, empty free list).
    static constexpr i32 no_slot = -1;

    /// Minimal bucket count once the index is allocated. Always a power of two.
    static constexpr isize min_bucket_count = 8;

    /// A view of one entry, yielded by range-based for.
    /// key is valid until the entry is removed; value is a reference into the map.
    template <class ValueT>
    struct basic_entry_ref
    {
        std::string_view key;
        ValueT& value;
    };
    using entry_ref = basic_entry_ref<V>;
    using const_entry_ref = basic_entry_ref<V const>;

    template <bool IsConst>
    struct basic_cursor;
    using cursor = basic_cursor<false>;
    using const_cursor = basic_cursor<true>;

    template <bool IsConst>
    struct basic_iterator;
    using iterator = basic_iterator<false>;
    using const_iterator = basic_iterator<true>;

    // lookup
public:
    /// Returns a copy of the value stored under key, or an empty optional if key is absent.
    /// O(1) expected.
    [[nodiscard]] oc::optional<V> get(std::string_view key) const
        requires std::is_copy_constructible_v<V>
    {
        if (auto const p = get_ptr(key))
            return oc::optional<V>(*p);
        return oc::nullopt;
    }

    /// Pointer to the value stored under key, nullptr if absent.
    /// Works for move-only V. The pointer is invalidated by any insertion (arena growth) or removal of key.
    [[nodiscard]] V* get_ptr(std::string_view key)
    {
        auto const s = find_slot(key, oc::hash_string(key));
        return s == no_slot ? nullptr : &_slots[s].entry.value().value;
    }
    [[nodiscard]] V const* get_ptr(std::string_view key) const
    {
        auto const s = find_slot(key, oc::hash_string(key));
        return s == no_slot ? nullptr : &_slots[s].entry.value().value;
    }

    [[nodiscard]] bool contains(std::string_view key) const { return find_slot(key, oc::hash_string(key)) != no_slot; }

    // queries
public:
    /// Number of entries. O(1).
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    // modifiers
public:
    /// Stores value under key.
    /// If key is new, the entry is appended at the end of the iteration order and true is returned.
    /// If key exists, only its value is assigned; the position is unchanged and false is returned.
    /// Amortized O(1).
    /// Strong exception guarantee: if constructing key/value or growing the index throws, the map is unchanged.
    template <class U>
    bool set(std::string_view key, U&& value)
    {
        static_assert(std::is_constructible_v<V, U&&>, "set: V is not constructible from the provided value");

        auto const hash = oc::hash_string(key);
        if (auto const s = find_slot(key, hash); s != no_slot)
        {
            auto& stored = _slots[s].entry.value().value;
            if constexpr (std::is_assignable_v<V&, U&&>)
                stored = oc::forward<U>(value);
            else
                stored = V(oc::forward<U>(value));
            return false;
        }

        if ((_size + 1) * 4 > _buckets.size() * 3) [[unlikely]]
            rehash(grown_bucket_count(_size + 1));

        auto const s = acquire_slot(key, oc::forward<U>(value));
        auto& slot = _slots[s];
        slot.hash = hash;

        // index
        auto& bucket = _buckets[bucket_of(hash)];
        slot.chain = bucket;
        bucket = s;

        // sequence
        slot.prev = _tail;
        slot.next = no_slot;
        if (_tail != no_slot)
            _slots[_tail].next = s;
        else
            _head = s;
        _tail = s;

        ++_size;
        return true;
    }

    /// Removes key if present. Returns false (and does nothing) if key is absent.
    /// O(1) expected.
    /// NOTE: key may point into the entry itself (e.g. a cursor's key()); it is not used after destruction.
    bool remove(std::string_view key)
    {
        auto const s = unlink(key);
        if (s == no_slot)
            return false;

        release_slot(s);
        return true;
    }

    /// Removes key and returns its value, or an empty optional if key is absent.
    [[nodiscard]] oc::optional<V> pop(std::string_view key)
    {
        auto const s = unlink(key);
        if (s == no_slot)
            return oc::nullopt;

        auto result = oc::optional<V>(oc::move(_slots[s].entry.value().value));
        release_slot(s);
        return result;
    }

    /// Removes all entries, keeps the allocated capacity.
    /// Cursors on this map end their traversal on the next advance().
    void clear()
    {
        // release in sequence order so removed slots keep a forward chain to the end
        auto s = _head;
        while (s != no_slot)
        {
            auto const next = _slots[s].next;
            release_slot(s);
            s = next;
        }

        for (auto& b : _buckets)
            b = no_slot;
        _head = no_slot;
        _tail = no_slot;
        _size = 0;
    }

    /// Ensures that count entries fit without growing the arena or rehashing.
    void reserve(isize count)
    {
        OC_ASSERT(count >= 0, "count must be non-negative");
        _slots.reserve(count);
        if (count * 4 > _buckets.size() * 3)
            rehash(grown_bucket_count(count));
    }

    // iteration
public:
    /// Cursor at the oldest entry (or at the end if the map is empty).
    [[nodiscard]] cursor first() { return cursor(this, _head); }
    [[nodiscard]] const_cursor first() const { return const_cursor(this, _head); }

    [[nodiscard]] iterator begin() { return iterator(first()); }
    [[nodiscard]] const_iterator begin() const { return const_iterator(first()); }
    [[nodiscard]] oc::sentinel end() const { return {}; }

    // debugging
public:
    /// Walks index, sequence and free list and checks that they describe the same set of entries.
    /// O(capacity). Always active (OC_ASSERT_ALWAYS); meant for tests and debugging sessions.
    void debug_check_invariants() const
    {
        isize seq_count = 0;
        auto prev = no_slot;
        for (auto s = _head; s != no_slot; s = _slots[s].next)
        {
            auto const& slot = _slots[s];
            OC_ASSERT_ALWAYS(slot.entry.has_value(), "sequence links a free slot");
            OC_ASSERT_ALWAYS(slot.prev == prev, "broken prev link");
            OC_ASSERT_ALWAYS(slot.hash == oc::hash_string(slot.entry.value().key), "stale cached hash");
            OC_ASSERT_ALWAYS(find_slot(slot.entry.value().key, slot.hash) == s, "sequence entry missing from index");
            prev = s;
            ++seq_count;
        }
        OC_ASSERT_ALWAYS(prev == _tail, "tail does not end the sequence");
        OC_ASSERT_ALWAYS(seq_count == _size, "size does not match sequence length");

        isize index_count = 0;
        for (auto const head : _buckets)
            for (auto s = head; s != no_slot; s = _slots[s].chain)
                ++index_count;
        OC_ASSERT_ALWAYS(index_count == _size, "index and sequence disagree on the entry count");

        isize reusable_count = 0;
        for (auto s = _free; s != no_slot; s = _slots[s].chain)
        {
            OC_ASSERT_ALWAYS(!_slots[s].entry.has_value(), "free list links a live slot");
            OC_ASSERT_ALWAYS(_slots[s].removed_refs == 0, "free list links a slot that removed slots still lead to");
            ++reusable_count;
        }

        // every free slot is either reusable or held back by removed slots linking to it
        auto refs = impl::slot_buffer<u32>::create_filled(_slots.size(), 0);
        isize free_count = 0;
        isize unreferenced_free_count = 0;
        for (isize s = 0; s < _slots.size(); ++s)
        {
            auto const& slot = _slots[s];
            if (slot.entry.has_value())
                continue;
            ++free_count;
            if (slot.removed_refs == 0)
                ++unreferenced_free_count;
            if (slot.next != no_slot)
                ++refs[slot.next];
        }
        for (isize s = 0; s < _slots.size(); ++s)
            OC_ASSERT_ALWAYS(refs[s] == _slots[s].removed_refs, "stale count of removed slots linking to a slot");

        OC_ASSERT_ALWAYS(reusable_count == unreferenced_free_count, "free list misses a reusable slot");
        OC_ASSERT_ALWAYS(free_count + _size == _slots.size(), "slot count does not add up");
    }

    // ordered_map has deep-copy value semantics (when V is copyable)
public:
    ordered_map() = default;
    ~ordered_map() = default;

    ordered_map(ordered_map const&) = default;

    // copies first so a failing copy (value or allocation) leaves *this untouched
    ordered_map& operator=(ordered_map const& rhs)
        requires std::is_copy_constructible_v<V>
    {
        if (this != &rhs)
            *this = ordered_map(rhs);
        return *this;
    }

    ordered_map(ordered_map&& rhs) noexcept
      : _slots(oc::move(rhs._slots)),
        _buckets(oc::move(rhs._buckets)),
        _head(oc::exchange(rhs._head, no_slot)),
        _tail(oc::exchange(rhs._tail, no_slot)),
        _free(oc::exchange(rhs._free, no_slot)),
        _size(oc::exchange(rhs._size, 0))
    {
    }

    ordered_map& operator=(ordered_map&& rhs) noexcept
    {
        if (this != &rhs)
        {
            _slots = oc::move(rhs._slots);
            _buckets = oc::move(rhs._buckets);
            _head = oc::exchange(rhs._head, no_slot);
            _tail = oc::exchange(rhs._tail, no_slot);
            _free = oc::exchange(rhs._free, no_slot);
            _size = oc::exchange(rhs._size, 0);
        }
        return *this;
    }

    // types
private:
    struct stored_entry
    {
        std::string key;
        V value;

        template <class U>
        stored_entry(std::string_view k, U&& v) : key(k), value(oc::forward<U>(v))
        {
        }
    };

    struct slot
    {
        oc::optional<stored_entry> entry;
        u64 hash = 0;

        // insertion order; for a free slot, next is the successor at removal time
        i32 prev = no_slot;
        i32 next = no_slot;

        // bucket chain while live, free list while free
        i32 chain = no_slot;

        // bumped on every removal
        u32 generation = 0;

        // free slots only: generation of next at removal time
        u32 removed_next_generation = 0;

        // number of free slots whose next is this slot; a free slot is only reused at 0
        u32 removed_refs = 0;

        slot() = default;

        template <class U>
        slot(std::string_view key, U&& value)
        {
            entry.emplace(key, oc::forward<U>(value));
        }
    };

    // helper
private:
    [[nodiscard]] isize bucket_of(u64 hash) const { return isize(hash & u64(_buckets.size() - 1)); }

    [[nodiscard]] i32 find_slot(std::string_view key, u64 hash) const
    {
        if (_buckets.empty())
            return no_slot;

        for (auto s = _buckets[bucket_of(hash)]; s != no_slot; s = _slots[s].chain)
        {
            auto const& slot = _slots[s];
            if (slot.hash == hash && slot.entry.value().key == key)
                return s;
        }
        return no_slot;
    }

    [[nodiscard]] static isize grown_bucket_count(isize min_entries)
    {
        auto count = min_bucket_count;
        while (min_entries * 4 > count * 3)
            count *= 2;
        return count;
    }

    // builds the new bucket array completely before swapping it in (strong guarantee)
    OC_COLD_FUNC void rehash(isize bucket_count)
    {
        auto buckets = impl::slot_buffer<i32>::create_filled(bucket_count, no_slot);
        auto const mask = u64(bucket_count - 1);
        for (auto s = _head; s != no_slot; s = _slots[s].next)
        {
            auto& slot = _slots[s];
            auto& bucket = buckets[isize(slot.hash & mask)];
            slot.chain = bucket;
            bucket = s;
        }
        _buckets = oc::move(buckets);
    }

    // constructs the entry in a recycled or new slot; a throwing constructor leaves the map unchanged
    template <class U>
    [[nodiscard]] i32 acquire_slot(std::string_view key, U&& value)
    {
        if (_free != no_slot)
        {
            auto const s = _free;
            auto& slot = _slots[s];
            slot.entry.emplace(key, oc::forward<U>(value));
            _free = slot.chain; // only unlink from the free list once construction succeeded

            // the removal-time link is gone now; its target may become reusable
            if (slot.next != no_slot)
                drop_removed_ref(slot.next);
            return s;
        }

        OC_ASSERT_ALWAYS(_slots.size() < isize(0x7fffffff), "ordered_map cannot address more than 2^31-1 slots");
        auto const s = i32(_slots.size());
        // the slot is built before the arena moves, so value may alias another entry
        _slots.emplace_back(key, oc::forward<U>(value));
        return s;
    }

    // removes key from index and sequence, returns its slot (entry still alive) or no_slot
    [[nodiscard]] i32 unlink(std::string_view key)
    {
        if (_buckets.empty())
            return no_slot;

        auto const hash = oc::hash_string(key);
        auto* link = &_buckets[bucket_of(hash)];
        while (*link != no_slot)
        {
            auto const s = *link;
            auto& slot = _slots[s];
            if (slot.hash == hash && slot.entry.value().key == key)
            {
                *link = slot.chain;

                if (slot.prev != no_slot)
                    _slots[slot.prev].next = slot.next;
                else
                    _head = slot.next;

                if (slot.next != no_slot)
                    _slots[slot.next].prev = slot.prev;
                else
                    _tail = slot.prev;

                --_size;
                return s;
            }
            link = &slot.chain;
        }
        return no_slot;
    }

    // destroys the entry of an unlinked slot and frees the slot
    // slot.next is kept (with its generation) so cursors standing on this slot can still advance.
    // The slot goes onto the free list right away unless other removed slots still lead to it.
    void release_slot(i32 s)
    {
        auto& slot = _slots[s];
        slot.entry.reset();
        if (slot.next != no_slot)
        {
            auto& next = _slots[slot.next];
            slot.removed_next_generation = next.generation;
            ++next.removed_refs;
        }
        else
            slot.removed_next_generation = 0;
        slot.prev = no_slot;
        ++slot.generation;

        if (slot.removed_refs == 0)
            push_free(s);
    }

    void push_free(i32 s)
    {
        _slots[s].chain = _free;
        _free = s;
    }

    void drop_removed_ref(i32 s)
    {
        auto& slot = _slots[s];
        OC_ASSERT(slot.removed_refs > 0, "unbalanced removed slot link");
        --slot.removed_refs;
        if (slot.removed_refs == 0 && !slot.entry.has_value())
            push_free(s);
    }

    [[nodiscard]] bool is_live(i32 s, u32 generation) const
    {
        auto const& slot = _slots[s];
        return slot.entry.has_value() && slot.generation == generation;
    }

    // successor of the entry (s, generation) for cursors; false if the position was lost
    [[nodiscard]] bool resolve_successor(i32 s, u32 generation, i32& out_next) const
    {
        if (is_live(s, generation))
        {
            out_next = _slots[s].next;
            return true;
        }

        // follow the removal-time successors of slots that were removed exactly once since we saw them
        while (true)
        {
            auto const& slot = _slots[s];
            if (slot.entry.has_value() || slot.generation != generation + 1)
                return false; // recycled

            if (slot.next == no_slot || is_live(slot.next, slot.removed_next_generation))
            {
                out_next = slot.next;
                return true;
            }

            generation = slot.removed_next_generation;
            s = slot.next;
        }
    }

    // the entry (s, generation) itself while it is live, else its successor as above
    [[nodiscard]] bool resolve_position(i32 s, u32 generation, i32& out_slot) const
    {
        if (s == no_slot || is_live(s, generation))
        {
            out_slot = s;
            return true;
        }
        return resolve_successor(s, generation, out_slot);
    }

    // members
private:
    impl::slot_buffer<slot> _slots;
    impl::slot_buffer<i32> _buckets;
    i32 _head = no_slot;
    i32 _tail = no_slot;
    i32 _free = no_slot;
    isize _size = 0;
};

/// Forward traversal handle over an ordered_map, see "Iteration" above.
/// Cheap to copy; copies are independent.
template <class V>
template <bool IsConst>
struct oc::ordered_map<V>::basic_cursor
{
    using map_t = std::conditional_t<IsConst, ordered_map const, ordered_map>;
    using value_t = std::conditional_t<IsConst, V const, V>;

    /// True while the cursor points at a live entry.
    /// False at the end, and also right after the current entry was removed (advance() is still allowed then).
    [[nodiscard]] bool is_valid() const { return _slot != no_slot && _map->is_live(_slot, _generation); }

    /// True once the traversal ran past the last entry.
    [[nodiscard]] bool is_end() const { return _slot == no_slot; }

    /// Key of the current entry. Precondition: is_valid().
    [[nodiscard]] std::string_view key() const
    {
        OC_ASSERT(is_valid(), "cursor does not point at a live entry");
        return _map->_slots[_slot].entry.value().key;
    }

    /// Value of the current entry. Precondition: is_valid().
    [[nodiscard]] value_t& value() const
    {
        OC_ASSERT(is_valid(), "cursor does not point at a live entry");
        return _map->_slots[_slot].entry.value().value;
    }

    /// Moves to the next entry in insertion order (or to the end).
    /// Precondition: !is_end().
    void advance()
    {
        OC_ASSERT(!is_end(), "cannot advance a cursor past the end");

        i32 next = no_slot;
        if (_map->resolve_successor(_slot, _generation, next))
        {
            position_at(next);
            return;
        }

        // slot was reused, fall back to the successor we saw when we got here
        if (_map->resolve_position(_next_slot, _next_generation, next))
        {
            position_at(next);
            return;
        }

        OC_ASSERT(false, "cursor lost its position: its entry was removed and its successor snapshot is stale");
        position_at(no_slot);
    }

    /// A const cursor can be made from a mutable one; it keeps the position and snapshot.
    operator basic_cursor<true>() const
        requires(!IsConst)
    {
        basic_cursor<true> c;
        c._map = _map;
        c._slot = _slot;
        c._generation = _generation;
        c._next_slot = _next_slot;
        c._next_generation = _next_generation;
        return c;
    }

    basic_cursor() = default;

private:
    basic_cursor(map_t* map, i32 slot) : _map(map) { position_at(slot); }

    void position_at(i32 slot)
    {
        _slot = slot;
        if (slot == no_slot)
            return;

        auto const& s = _map->_slots[slot];
        _generation = s.generation;
        _next_slot = s.next;
        _next_generation = s.next == no_slot ? 0 : _map->_slots[s.next].generation;
    }

    map_t* _map = nullptr;
    i32 _slot = no_slot;
    u32 _generation = 0;
    i32 _next_slot = no_slot;
    u32 _next_generation = 0;

    friend ordered_map;
    template <bool>
    friend struct basic_cursor;
};

/// Range-for adapter over a cursor. Compared against oc::sentinel.
/// Removing the current entry inside the loop body is safe (see cursor).
template <class V>
template <bool IsConst>
struct oc::ordered_map<V>::basic_iterator
{
    using entry_t = basic_entry_ref<typename basic_cursor<IsConst>::value_t>;

    [[nodiscard]] entry_t operator*() const { return entry_t{_cursor.key(), _cursor.value()}; }

    basic_iterator& operator++()
    {
        _cursor.advance();
        return *this;
    }

    [[nodiscard]] bool operator!=(oc::sentinel) const { return !_cursor.is_end(); }
    [[nodiscard]] bool operator==(oc::sentinel) const { return _cursor.is_end(); }

    explicit basic_iterator(basic_cursor<IsConst> c) : _cursor(c) {}

private:
    basic_cursor<IsConst> _cursor;
};
