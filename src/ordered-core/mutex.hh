#pragma once

#include <ordered-core/fwd.hh>
#include <ordered-core/optional.hh>
#include <ordered-core/utility.hh>

#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <type_traits>

/// A T that can only be touched while its lock is held.
///
/// ordered_map is not thread-safe; share one as oc::mutex<oc::ordered_map<V>>.
/// entry_stream uses it for its channel.
///
/// Every access is a callback invoked under the lock. Results are returned by value (auto),
/// so a reference into the protected data cannot escape by accident.
///
/// Usage:
///   oc::mutex<oc::ordered_map<int>> hits;
///   hits.lock([&](oc::ordered_map<int>& m) { m.set(path, 1); });
///   auto const n = hits.lock([](oc::ordered_map<int> const& m) { return m.size(); });
template <class T>
struct oc::mutex
{
    /// f(value) under the lock.
    template <class F>
    auto lock(F&& f)
    {
        std::lock_guard guard(_mutex);
        return oc::forward<F>(f)(_value);
    }

    /// Blocks on cv until ready(value) holds, then returns f(value); both run under the lock.
    /// Works with std::condition_variable and std::condition_variable_any.
    template <class CondVarT, class Pred, class F>
    auto wait(CondVarT& cv, Pred&& ready, F&& f)
    {
        std::unique_lock guard(_mutex);
        cv.wait(guard, [&] { return ready(static_cast<T const&>(_value)); });
        return oc::forward<F>(f)(_value);
    }

    /// Like wait, but also wakes up when stop is requested.
    /// f only runs if ready(value) holds; a stop request that arrives first skips it.
    /// Returns whether f ran (void f) or optional<result of f>.
    ///
    /// Usage:
    ///   bool const pushed = channel.wait(cv, stop, [](auto const& c) { return !c.is_full(); },
    ///                                    [&](auto& c) { c.push(oc::move(e)); });
    template <class Pred, class F>
    auto wait(std::condition_variable_any& cv, std::stop_token stop, Pred&& ready, F&& f)
    {
        using result_t = decltype(oc::forward<F>(f)(_value));

        std::unique_lock guard(_mutex);
        auto const is_ready = cv.wait(guard, stop, [&] { return ready(static_cast<T const&>(_value)); });

        if constexpr (std::is_void_v<result_t>)
        {
            if (is_ready)
                oc::forward<F>(f)(_value);
            return is_ready;
        }
        else
        {
            if (!is_ready)
                return oc::optional<result_t>();
            return oc::optional<result_t>(oc::forward<F>(f)(_value));
        }
    }

    mutex() = default;

    /// Constructs the protected value from args.
    template <class... Args>
    explicit mutex(Args&&... args) : _value(oc::forward<Args>(args)...)
    {
    }

private:
    T _value;
    std::mutex _mutex;
};
