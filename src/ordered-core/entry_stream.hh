#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/impl/slot_buffer.hh>
#include <ordered-core/mutex.hh>
#include <ordered-core/optional.hh>
#include <ordered-core/ordered_map.hh>
#include <ordered-core/utility.hh>

#include <condition_variable>
#include <exception>
#include <stop_token>
#include <string>
#include <thread>


/// Asynchronous iteration over an ordered_map: a background thread copies the entries,
/// oldest first, into a bounded channel and next() pulls them out.
///
/// Prefer ordered_map::first() / range-for. This exists for consumers that want to overlap
/// copying with processing, and it is bounded by cancellation:
/// destroying the stream (or calling cancel()) requests stop on the producer's stop_token,
/// which wakes it even when it is blocked on a full channel, and then joins it.
/// Abandoning a stream early therefore never leaves a thread behind.
///
/// Caller obligations:
///   - the map must outlive the stream
///   - the map must not be mutated while the stream is alive (the producer reads it from another thread)
///
/// Exceptions thrown while copying an entry on the producer thread are rethrown by next().
///
/// Usage:
///   auto stream = oc::entry_stream<int>(map);
///   for (auto e = stream.next(); e.has_value(); e = stream.next())
///       process(e.value().key, e.value().value);
template <class V>
struct oc::entry_stream
{
    static_assert(std::is_copy_constructible_v<V>, "entry_stream copies values out of the map");

    /// Channel size used when none is given.
    static constexpr isize default_capacity = 32;

    /// An owned copy of one entry.
    struct streamed_entry
    {
        std::string key;
        V value;
    };

    /// Starts the producer thread.
    /// Precondition: capacity > 0.
    explicit entry_stream(oc::ordered_map<V> const& map, isize capacity = default_capacity)
      : _channel(capacity),
        _producer([this, &map](std::stop_token stop) { this->produce(stop, map); })
    {
    }

    /// Blocks until the next entry is available.
    /// Returns nullopt once every entry was delivered (or the stream was cancelled and drained).
    [[nodiscard]] oc::optional<streamed_entry> next()
    {
        auto e = _channel.wait(
            _cv, //
            [](channel const& c) { return c.count > 0 || c.producer_done; },
            [](channel& c) { return c.pop(); });
        _cv.notify_all();
        return e;
    }

    /// Stops the producer and waits for it to finish. Idempotent.
    /// Entries already in the channel can still be drained with next().
    void cancel()
    {
        _producer.request_stop();
        if (_producer.joinable())
            _producer.join();
    }

    ~entry_stream() { cancel(); }

    // the producer captures this
    entry_stream(entry_stream const&) = delete;
    entry_stream& operator=(entry_stream const&) = delete;
    entry_stream(entry_stream&&) = delete;
    entry_stream& operator=(entry_stream&&) = delete;

private:
    struct channel
    {
        impl::slot_buffer<oc::optional<streamed_entry>> ring;
        isize head = 0;
        isize count = 0;
        bool producer_done = false;
        std::exception_ptr error;

        explicit channel(isize capacity)
        {
            OC_ASSERT_ALWAYS(capacity > 0, "entry_stream needs a channel capacity of at least 1");
            ring = impl::slot_buffer<oc::optional<streamed_entry>>::create_filled(capacity, oc::nullopt);
        }

        [[nodiscard]] bool is_full() const { return count == ring.size(); }

        void push(streamed_entry&& e)
        {
            ring[(head + count) % ring.size()].emplace(oc::move(e));
            ++count;
        }

        // rethrows a producer failure once everything before it was delivered
        oc::optional<streamed_entry> pop()
        {
            if (count == 0)
            {
                if (error)
                    std::rethrow_exception(oc::exchange(error, nullptr));
                return oc::nullopt;
            }

            auto& cell = ring[head];
            auto r = oc::move(cell);
            cell.reset();
            head = (head + 1) % ring.size();
            --count;
            return r;
        }
    };

    void produce(std::stop_token stop, oc::ordered_map<V> const& map)
    {
        // wakes a consumer waiting in next(), however the loop below ends
        OC_DEFER
        {
            _channel.lock([](channel& ch) { ch.producer_done = true; });
            _cv.notify_all();
        };

        try
        {
            for (auto c = map.first(); c.is_valid() && !stop.stop_requested(); c.advance())
            {
                auto e = streamed_entry{std::string(c.key()), c.value()};
                auto const pushed = _channel.wait(
                    _cv, stop, //
                    [](channel const& ch) { return !ch.is_full(); },
                    [&](channel& ch) { ch.push(oc::move(e)); });
                if (!pushed)
                    break;

                _cv.notify_all();
            }
        }
        catch (...)
        {
            // handed to the consumer, next() rethrows it
            _channel.lock([](channel& ch) { ch.error = std::current_exception(); });
        }
    }

    oc::mutex<channel> _channel;
    std::condition_variable_any _cv;

    // last member: started after the channel exists, stopped and joined first
    std::jthread _producer;
};
