#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/utility.hh>

#include <type_traits>

/// Tag for "no value". Only oc::nullopt exists; there is no default constructor,
/// so "opt = {}" is not ambiguous.
struct oc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace oc
{
inline constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace oc

/// A T or nothing.
/// ordered_map::get / pop and entry_stream::next answer with it: "absent" is a result, not an error.
///
/// Deliberately small:
///   - no operator* / operator->, read through value() (asserts on empty) or value_or()
///   - == against optional, T and nullopt; no ordering, no comparison with bool
///   - trivially copyable / destructible exactly when T is
///
/// Usage:
///   if (auto v = scores.get("alice"); v.has_value())
///       total += v.value();
///   auto const retries = settings.get("retries").value_or(3);
template <class T>
struct oc::optional
{
    static_assert(!std::is_reference_v<T>, "optional<T&> is not supported, use a pointer (e.g. ordered_map::get_ptr)");

    // construction
public:
    optional() = default;
    constexpr optional(nullopt_t) {}

    /// Holds T(value). Implicit when U converts implicitly to T.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) optional(U&& value) // NOLINT
    {
        construct(oc::forward<U>(value));
    }

    // T trivially copyable: everything is defaulted and optional<T> stays trivial
public:
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // T with real special members
public:
    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (rhs._has_value)
            construct(rhs._storage.value);
    }

    /// rhs ends up empty.
    optional(optional&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            construct(oc::move(rhs._storage.value));
            rhs.reset();
        }
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
            assign_from(rhs._has_value, rhs._storage.value);
        return *this;
    }

    /// Unlike the move constructor, rhs stays engaged (with a moved-from value), as in std::optional.
    optional& operator=(optional&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>
                                                 && std::is_nothrow_move_assignable_v<T>)
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this != &rhs)
            assign_from(rhs._has_value, oc::move(rhs._storage.value));
        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        reset();
    }

    // modifiers
public:
    void reset()
    {
        if constexpr (!std::is_trivially_destructible_v<T>)
            if (_has_value)
                _storage.value.~T();
        _has_value = false;
    }

    /// Replaces the content with T(args...). Empty afterwards if that constructor throws.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        reset();
        construct(oc::forward<Args>(args)...);
        return _storage.value;
    }

    // access
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }

    /// Precondition: has_value().
    [[nodiscard]] T& value() &
    {
        OC_ASSERT(_has_value, "value() called on an empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        OC_ASSERT(_has_value, "value() called on an empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        OC_ASSERT(_has_value, "value() called on an empty optional");
        return oc::move(_storage.value);
    }

    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        if (_has_value)
            return _storage.value;
        return static_cast<T>(oc::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        if (_has_value)
            return oc::move(_storage.value);
        return static_cast<T>(oc::forward<U>(fallback));
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value && rhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return lhs._has_value == rhs._has_value;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    // optional<int> == true would silently compare the int
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // helper
private:
    // precondition: empty
    template <class... Args>
    void construct(Args&&... args)
    {
        new (oc::placement_new, &_storage.value) T(oc::forward<Args>(args)...);
        _has_value = true; // only once T(...) succeeded
    }

    template <class U>
    void assign_from(bool rhs_has_value, U&& rhs_value)
    {
        if (!rhs_has_value)
            reset();
        else if (_has_value)
            _storage.value = oc::forward<U>(rhs_value);
        else
            construct(oc::forward<U>(rhs_value));
    }

    // members
private:
    oc::storage_for<T> _storage;
    bool _has_value = false;
};
