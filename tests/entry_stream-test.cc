#include <ordered-core/assert-handler.hh>
#include <ordered-core/entry_stream.hh>
#include <ordered-core/ordered_map.hh>

#include <nexus/test.hh>

#include <stdexcept>
#include <string>
#include <vector>

namespace
{
// copying throws once the shared budget runs out
struct copy_budget
{
    int value = 0;
    int* budget = nullptr;

    copy_budget(int v, int* b) : value(v), budget(b) {}
    copy_budget(copy_budget const& rhs) : value(rhs.value), budget(rhs.budget)
    {
        if (budget != nullptr && (*budget)-- <= 0)
            throw std::runtime_error("copy budget exhausted");
    }
    copy_budget(copy_budget&&) noexcept = default;
    copy_budget& operator=(copy_budget const&) = default;
    copy_budget& operator=(copy_budget&&) noexcept = default;
};

oc::ordered_map<int> make_numbers(int count)
{
    oc::ordered_map<int> m;
    for (auto i = 0; i < count; ++i)
        m.set("k" + std::to_string(i), i);
    return m;
}
} // namespace

TEST("entry_stream - delivers every entry in insertion order")
{
    auto m = make_numbers(100);
    m.remove("k10");
    m.set("k0", -1); // update keeps the position

    std::vector<std::string> keys;
    std::vector<int> values;
    {
        auto stream = oc::entry_stream<int>(m);
        for (auto e = stream.next(); e.has_value(); e = stream.next())
        {
            keys.push_back(e.value().key);
            values.push_back(e.value().value);
        }

        // stays exhausted
        CHECK(!stream.next().has_value());
    }

    REQUIRE(keys.size() == 99);
    CHECK(keys.front() == "k0");
    CHECK(values.front() == -1);
    CHECK(keys[10] == "k11");
    CHECK(keys.back() == "k99");
    CHECK(values.back() == 99);
}

TEST("entry_stream - empty map")
{
    oc::ordered_map<std::string> m;
    auto stream = oc::entry_stream<std::string>(m);
    CHECK(!stream.next().has_value());
}

TEST("entry_stream - capacity smaller than the map")
{
    auto m = make_numbers(50);
    auto stream = oc::entry_stream<int>(m, 1);

    auto expected = 0;
    for (auto e = stream.next(); e.has_value(); e = stream.next())
    {
        CHECK(e.value().value == expected);
        ++expected;
    }
    CHECK(expected == 50);
}

TEST("entry_stream - abandoning the stream early")
{
    auto m = make_numbers(100);

    SECTION("destroying after one entry")
    {
        // the producer is blocked on the full channel here, the destructor has to wake and join it
        auto stream = oc::entry_stream<int>(m, 1);
        auto e = stream.next();
        REQUIRE(e.has_value());
        CHECK(e.value().key == "k0");
    }

    SECTION("cancel, then drain what was already copied")
    {
        auto stream = oc::entry_stream<int>(m, 4);
        auto first = stream.next();
        REQUIRE(first.has_value());
        CHECK(first.value().value == 0);

        stream.cancel();
        stream.cancel(); // idempotent

        auto drained = 0;
        auto previous = 0;
        for (auto e = stream.next(); e.has_value(); e = stream.next())
        {
            CHECK(e.value().value == previous + 1); // still in order
            previous = e.value().value;
            ++drained;
        }
        CHECK(drained <= 5); // at most one full channel plus the entry in flight
        CHECK(!stream.next().has_value());
    }

    SECTION("never reading at all")
    {
        auto stream = oc::entry_stream<int>(m, 2);
    }

    // the map is untouched by streaming
    CHECK(m.size() == 100);
}

TEST("entry_stream - producer exception is rethrown by next")
{
    int budget = 3;

    oc::ordered_map<copy_budget> m;
    for (auto i = 0; i < 10; ++i)
        m.set(std::to_string(i), copy_budget(i, nullptr));

    // only the stored values should consume the budget
    for (auto [key, value] : m)
        value.budget = &budget;

    auto stream = oc::entry_stream<copy_budget>(m, 8);

    std::vector<int> received;
    bool threw = false;
    try
    {
        for (auto e = stream.next(); e.has_value(); e = stream.next())
            received.push_back(e.value().value.value);
    }
    catch (std::runtime_error const& err)
    {
        threw = true;
        CHECK(std::string(err.what()) == "copy budget exhausted");
    }

    CHECK(threw);
    CHECK(!received.empty());

    // everything copied before the failure arrives in order
    for (auto i = 0; i < int(received.size()); ++i)
        CHECK(received[i] == i);

    // after the error the stream is simply exhausted
    CHECK(!stream.next().has_value());
}

TEST("entry_stream - zero capacity is rejected in every build")
{
    auto m = make_numbers(3);

    bool fired = false;
    {
        auto handler = oc::impl::scoped_assertion_handler(
            [&](oc::impl::assertion_info const& info)
            {
                fired = true;
                CHECK(info.message == "entry_stream needs a channel capacity of at least 1");
                throw 0; // unwinds out of the constructor before the producer starts
            });
        try
        {
            auto stream = oc::entry_stream<int>(m, 0);
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    CHECK(fired);
}
