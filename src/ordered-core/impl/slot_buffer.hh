#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/utility.hh>

#include <cstring>
#include <new>
#include <type_traits>


/// Growable contiguous storage of T addressed by index; the arena behind ordered_map.
///
/// ordered_map never hands out pointers into this buffer. Slots are referred to by index,
/// so reallocation only moves objects and never invalidates a handle.
/// Elements are only ever appended; "removing" a slot is the owner's business (free lists).
///
/// === Exception & reference guarantees ===
///
/// emplace_back: if constructing the new element throws, the buffer is unchanged.
/// The new element is constructed BEFORE old elements are relocated, so emplace_back(buf[i]) is safe.
/// Relocation requires a non-throwing move and cannot fail halfway.
/// Any reallocation invalidates pointers and references (never indices).
template <class T>
struct oc::impl::slot_buffer
{
    static_assert(std::is_nothrow_move_constructible_v<T>, "slots are relocated with a non-throwing move");

    /// Smallest non-zero capacity.
    static constexpr isize min_capacity = 8;

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T& operator[](isize i)
    {
        OC_ASSERT(0 <= i && i < _size, "slot index out of bounds");
        return _data[i];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        OC_ASSERT(0 <= i && i < _size, "slot index out of bounds");
        return _data[i];
    }

    [[nodiscard]] T* begin() { return _data; }
    [[nodiscard]] T* end() { return _data + _size; }
    [[nodiscard]] T const* begin() const { return _data; }
    [[nodiscard]] T const* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }
    [[nodiscard]] isize capacity() const { return _capacity; }

    // factories
public:
    /// Creates a buffer holding count copies of value.
    [[nodiscard]] static slot_buffer create_filled(isize count, T const& value)
    {
        OC_ASSERT(count >= 0, "count must be non-negative");
        slot_buffer r;
        if (count == 0)
            return r;

        // r owns the allocation: if a copy throws, its destructor cleans up [0, _size)
        r._data = allocate(count);
        r._capacity = count;
        while (r._size < count)
            r.construct_at_end(value);
        return r;
    }

    // modifiers
public:
    /// Appends a new element constructed from args, reallocating if necessary.
    /// Amortized O(1).
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        if (_size < _capacity) [[likely]]
            return construct_at_end(oc::forward<Args>(args)...);

        return emplace_back_grow(oc::forward<Args>(args)...);
    }

    /// Ensures capacity() >= count without changing size().
    void reserve(isize count)
    {
        if (count > _capacity)
            relocate_to(allocate(count), count);
    }

    /// Destroys all elements, keeps capacity.
    void clear()
    {
        destroy_range(_data, _data + _size);
        _size = 0;
    }

    // slot_buffer has deep-copy value semantics
public:
    slot_buffer() = default;

    slot_buffer(slot_buffer&& rhs) noexcept
      : _data(oc::exchange(rhs._data, nullptr)),
        _size(oc::exchange(rhs._size, 0)),
        _capacity(oc::exchange(rhs._capacity, 0))
    {
    }

    slot_buffer& operator=(slot_buffer&& rhs) noexcept
    {
        if (this != &rhs)
        {
            release();
            _data = oc::exchange(rhs._data, nullptr);
            _size = oc::exchange(rhs._size, 0);
            _capacity = oc::exchange(rhs._capacity, 0);
        }
        return *this;
    }

    // delegates so that a throwing copy runs ~slot_buffer on the part already built
    slot_buffer(slot_buffer const& rhs)
        requires std::is_copy_constructible_v<T>
      : slot_buffer()
    {
        if (rhs._size == 0)
            return;

        _data = allocate(rhs._size);
        _capacity = rhs._size;
        if constexpr (std::is_trivially_copyable_v<T>)
        {
            std::memcpy(static_cast<void*>(_data), rhs._data, rhs._size * sizeof(T));
            _size = rhs._size;
        }
        else
        {
            for (auto const& e : rhs)
                construct_at_end(e);
        }
    }

    slot_buffer& operator=(slot_buffer const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
            *this = slot_buffer(rhs); // copy first so a throwing copy leaves *this untouched
        return *this;
    }

    ~slot_buffer() { release(); }

    // helper
private:
    // precondition: _size < _capacity
    template <class... Args>
    T& construct_at_end(Args&&... args)
    {
        auto const p = new (oc::placement_new, _data + _size) T(oc::forward<Args>(args)...);
        ++_size; // _after_ so exceptions in T(...) leave state valid
        return *p;
    }

    template <class... Args>
    OC_COLD_FUNC T& emplace_back_grow(Args&&... args)
    {
        auto const new_capacity = oc::max(oc::max(_capacity * 2, _size + 1), min_capacity);
        auto const new_data = allocate(new_capacity);

        // construct the new element first: args may reference our current elements
        T* p;
        try
        {
            p = new (oc::placement_new, new_data + _size) T(oc::forward<Args>(args)...);
        }
        catch (...)
        {
            deallocate(new_data);
            throw;
        }

        relocate_to(new_data, new_capacity);
        ++_size;
        return *p;
    }

    // moves [0, _size) into new_data, destroys the originals and adopts the new storage
    void relocate_to(T* new_data, isize new_capacity)
    {
        if constexpr (std::is_trivially_copyable_v<T>)
        {
            if (_size > 0)
                std::memcpy(static_cast<void*>(new_data), _data, _size * sizeof(T));
        }
        else
        {
            for (isize i = 0; i < _size; ++i)
                new (oc::placement_new, new_data + i) T(oc::move(_data[i]));
            destroy_range(_data, _data + _size);
        }

        deallocate(_data);
        _data = new_data;
        _capacity = new_capacity;
    }

    void release()
    {
        destroy_range(_data, _data + _size);
        deallocate(_data);
        _data = nullptr;
        _size = 0;
        _capacity = 0;
    }

    // in reverse construction order
    static void destroy_range(T* begin, T* end)
    {
        if constexpr (!std::is_trivially_destructible_v<T>)
            while (end != begin)
                (--end)->~T();
    }

    [[nodiscard]] static T* allocate(isize count)
    {
        return static_cast<T*>(::operator new(count * sizeof(T), std::align_val_t(alignof(T))));
    }

    static void deallocate(T* p)
    {
        if (p != nullptr)
            ::operator delete(p, std::align_val_t(alignof(T)));
    }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
    isize _capacity = 0;
};
