#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>

#include <type_traits>

// Small building blocks shared by the containers, kept free of <utility> and <algorithm>:
//
//   oc::move / oc::forward / oc::exchange    value categories
//   oc::min / oc::max                        by reference, first argument wins ties
//   oc::placement_new, oc::storage_for<T>    manual object lifetime (optional, slot_buffer)
//   OC_DEFER { ... };                        run code at scope exit
//   oc::sentinel                             end marker for cursor-driven ranges

namespace oc
{
template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    static_assert(!std::is_lvalue_reference_v<T>, "cannot forward an rvalue as an lvalue");
    return static_cast<T&&>(value);
}

/// Sets obj to new_val and returns what obj held before.
/// Usage:
///   _head = oc::exchange(rhs._head, no_slot);
template <class T, class U = T>
[[nodiscard]] OC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old = oc::move(obj);
    obj = oc::forward<U>(new_val);
    return old;
}

template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return a < b ? b : a;
}

template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return b < a ? b : a;
}

/// Selects our placement operator new, so no header needs <new>.
/// Usage:
///   new (oc::placement_new, &storage.value) T(args...);
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new = {};

/// Raw, aligned room for one T. The owner decides when the T inside lives.
/// Trivially destructible iff T is, which keeps optional<int> trivial.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}

    constexpr ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    constexpr ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

namespace impl
{
template <class F>
struct deferred
{
    F f;
    explicit deferred(F func) : f(static_cast<F&&>(func)) {}
    ~deferred() noexcept(false) { f(); }

    deferred(deferred const&) = delete;
    deferred& operator=(deferred const&) = delete;
    deferred(deferred&&) = delete;
    deferred& operator=(deferred&&) = delete;
};

struct deferred_tag
{
};

template <class F>
deferred<F> operator+(deferred_tag, F&& f)
{
    return deferred<F>(oc::forward<F>(f));
}
} // namespace impl

/// Runs the block when the enclosing scope ends, also when it is left by an exception.
/// Captures by reference.
/// Usage:
///   OC_DEFER { _cv.notify_all(); };
#define OC_DEFER auto const OC_MACRO_JOIN(_oc_deferred_, __COUNTER__) = ::oc::impl::deferred_tag{} + [&]

/// End of a range whose iterator knows by itself when it is exhausted (see ordered_map::end()).
struct sentinel
{
};
} // namespace oc

// global scope, found by new-expressions with an oc::placement_new_t argument
[[nodiscard]] OC_FORCE_INLINE void* operator new(std::size_t, oc::placement_new_t, void* ptr) noexcept
{
    return ptr;
}
// only called if a constructor throws; nothing to free
OC_FORCE_INLINE void operator delete(void*, oc::placement_new_t, void*) noexcept {}
