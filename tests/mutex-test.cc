#include <ordered-core/mutex.hh>
#include <ordered-core/ordered_map.hh>

#include <nexus/test.hh>

#include <condition_variable>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>


TEST("mutex - construction")
{
    SECTION("default construction")
    {
        auto m = oc::mutex<int>{};
        auto value = m.lock([](int const& val) { return val; });
        CHECK(value == 0);
    }

    SECTION("construction with initial value")
    {
        auto m = oc::mutex<int>{42};
        auto value = m.lock([](int const& val) { return val; });
        CHECK(value == 42);
    }

    SECTION("construction with multiple arguments")
    {
        auto m = oc::mutex<std::string>{3, 'x'};
        auto value = m.lock([](std::string const& val) { return val; });
        CHECK(value == "xxx");
    }
}

TEST("mutex - lock with return values")
{
    SECTION("return modified value")
    {
        auto m = oc::mutex<int>{42};
        auto value = m.lock([](int& val) { return val++; });
        CHECK(value == 42);
        auto new_value = m.lock([](int const& val) { return val; });
        CHECK(new_value == 43);
    }

    SECTION("return different type")
    {
        auto m = oc::mutex<int>{42};
        auto as_string = m.lock([](int const& val) { return std::to_string(val); });
        CHECK(as_string == "42");
    }
}

TEST("mutex - shared ordered_map")
{
    auto shared = oc::mutex<oc::ordered_map<int>>{};

    SECTION("sequential operations")
    {
        shared.lock([](oc::ordered_map<int>& m) { m.set("a", 1); });
        shared.lock([](oc::ordered_map<int>& m) { m.set("b", 2); });

        auto const size = shared.lock([](oc::ordered_map<int> const& m) { return m.size(); });
        CHECK(size == 2);

        auto const first = shared.lock([](oc::ordered_map<int> const& m) { return std::string(m.first().key()); });
        CHECK(first == "a");
    }

    SECTION("concurrent writers")
    {
        int const thread_count = 4;
        int const per_thread = 250;

        {
            std::vector<std::jthread> threads;
            for (auto t = 0; t < thread_count; ++t)
                threads.emplace_back(
                    [&shared, t]
                    {
                        for (auto i = 0; i < per_thread; ++i)
                            shared.lock([&](oc::ordered_map<int>& m)
                                        { m.set("t" + std::to_string(t) + "-" + std::to_string(i), i); });
                    });
        } // joined

        shared.lock(
            [&](oc::ordered_map<int> const& m)
            {
                CHECK(m.size() == thread_count * per_thread);
                m.debug_check_invariants();

                // per-thread insertion order is preserved
                for (auto t = 0; t < thread_count; ++t)
                {
                    auto const prefix = "t" + std::to_string(t) + "-";
                    auto expected = 0;
                    for (auto [key, value] : m)
                    {
                        if (!key.starts_with(prefix))
                            continue;
                        CHECK(value == expected);
                        ++expected;
                    }
                    CHECK(expected == per_thread);
                }
            });
    }
}

TEST("mutex - wait")
{
    struct state
    {
        bool ready = false;
        int payload = 0;
    };

    SECTION("wait until predicate holds")
    {
        auto m = oc::mutex<state>{};
        std::condition_variable cv;

        auto producer = std::jthread(
            [&]
            {
                m.lock(
                    [](state& s)
                    {
                        s.payload = 17;
                        s.ready = true;
                    });
                cv.notify_all();
            });

        auto const payload = m.wait(
            cv, //
            [](state const& s) { return s.ready; },
            [](state& s) { return s.payload; });
        CHECK(payload == 17);
    }

    SECTION("stop-aware wait returns the result")
    {
        auto m = oc::mutex<state>{state{true, 5}};
        std::condition_variable_any cv;
        std::stop_source source;

        auto const r = m.wait(
            cv, source.get_token(), //
            [](state const& s) { return s.ready; },
            [](state& s) { return s.payload; });
        REQUIRE(r.has_value());
        CHECK(r.value() == 5);
    }

    SECTION("stop-aware wait gives up on stop request")
    {
        auto m = oc::mutex<state>{};
        std::condition_variable_any cv;
        std::stop_source source;

        auto stopper = std::jthread([&] { source.request_stop(); });

        bool invoked = false;
        auto const done = m.wait(
            cv, source.get_token(), //
            [](state const& s) { return s.ready; },
            [&](state&) { invoked = true; });
        CHECK(!done);
        CHECK(!invoked);
    }

    SECTION("stop-aware wait with a non-void function returns nullopt when stopped")
    {
        auto m = oc::mutex<state>{};
        std::condition_variable_any cv;
        std::stop_source source;
        source.request_stop();

        auto const r = m.wait(
            cv, source.get_token(), //
            [](state const& s) { return s.ready; },
            [](state& s) { return s.payload; });
        CHECK(!r.has_value());
    }
}
