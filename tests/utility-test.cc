#include <ordered-core/utility.hh>

#include <nexus/test.hh>

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

// storage_for is only as trivial as its payload
static_assert(std::is_trivially_destructible_v<oc::storage_for<int>>);
static_assert(!std::is_trivially_destructible_v<oc::storage_for<std::string>>);
static_assert(sizeof(oc::storage_for<std::string>) == sizeof(std::string));
static_assert(alignof(oc::storage_for<double>) == alignof(double));

// move / forward keep value categories
static_assert(std::is_same_v<decltype(oc::move(std::declval<int&>())), int&&>);
static_assert(std::is_same_v<decltype(oc::forward<int&>(std::declval<int&>())), int&>);
static_assert(std::is_same_v<decltype(oc::forward<int>(std::declval<int&>())), int&&>);

TEST("utility - exchange replaces value and returns old")
{
    SECTION("int")
    {
        int x = 1;
        auto const old = oc::exchange(x, 2);
        CHECK(old == 1);
        CHECK(x == 2);
    }

    SECTION("move-only")
    {
        auto p = std::make_unique<int>(3);
        auto const old = oc::exchange(p, nullptr);
        CHECK(p == nullptr);
        CHECK(*old == 3);
    }
}

TEST("utility - max/min return references and handle equality")
{
    int a = 1;
    int b = 2;
    CHECK(&oc::max(a, b) == &b);
    CHECK(&oc::min(a, b) == &a);

    int c = 2;
    CHECK(&oc::max(b, c) == &b); // first on ties
    CHECK(&oc::min(b, c) == &b);
}

TEST("utility - OC_DEFER executes at scope exit")
{
    SECTION("basic defer")
    {
        int counter = 0;
        {
            OC_DEFER
            {
                counter = 42;
            };
            CHECK(counter == 0);
        }
        CHECK(counter == 42);
    }

    SECTION("multiple defers execute in reverse order")
    {
        int order = 0;
        int first = 0, second = 0;
        {
            OC_DEFER
            {
                first = ++order;
            };
            OC_DEFER
            {
                second = ++order;
            };
        }
        CHECK(second == 1);
        CHECK(first == 2);
    }

    SECTION("defer runs on early return")
    {
        int cleanup = 0;
        auto f = [&]() -> int
        {
            OC_DEFER
            {
                cleanup = 1;
            };
            return 42;
        };
        CHECK(f() == 42);
        CHECK(cleanup == 1);
    }

    SECTION("defer can throw exceptions")
    {
        bool caught = false;
        try
        {
            OC_DEFER
            {
                throw std::runtime_error("from defer");
            };
        }
        catch (std::runtime_error const& e)
        {
            caught = true;
            CHECK(std::string(e.what()) == "from defer");
        }
        CHECK(caught);
    }
}

TEST("utility - placement new constructs into storage_for")
{
    oc::storage_for<std::string> storage;
    auto* p = new (oc::placement_new, &storage.value) std::string("in place");
    CHECK(*p == "in place");
    CHECK(p == &storage.value);
    std::destroy_at(&storage.value);
}
