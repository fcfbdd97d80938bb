#include <ordered-core/hash.hh>

#include <nexus/test.hh>

#include <bit>
#include <set>
#include <string>

// usable at compile time
static_assert(oc::hash_string("abc") == oc::hash_string("abc"));
static_assert(oc::hash_string("abc") != oc::hash_string("abd"));
static_assert(oc::hash_mix(0) == 0);

TEST("hash - deterministic")
{
    auto const s = std::string("some key");
    CHECK(oc::hash_string(s) == oc::hash_string("some key"));
    CHECK(oc::hash_string(s) == oc::hash_string(std::string_view(s)));
}

TEST("hash - all bytes participate")
{
    SECTION("embedded zero bytes")
    {
        auto const a = std::string_view("a\0b", 3);
        auto const b = std::string_view("a\0c", 3);
        CHECK(oc::hash_string(a) != oc::hash_string(b));
        CHECK(oc::hash_string(a) != oc::hash_string("a"));
    }

    SECTION("empty string")
    {
        CHECK(oc::hash_string("") != oc::hash_string(std::string_view("\0", 1)));
    }

    SECTION("high bytes")
    {
        CHECK(oc::hash_string("\xff") != oc::hash_string("\x7f"));
    }
}

TEST("hash - low bits are spread")
{
    // ordered_map picks buckets from the low bits, sequential keys must not pile up
    std::set<oc::u64> buckets;
    for (auto i = 0; i < 64; ++i)
        buckets.insert(oc::hash_string(std::to_string(i)) & 63);

    CHECK(buckets.size() > 32);
}

TEST("hash - mix avalanches")
{
    // flipping a single input bit flips roughly half of the output bits
    for (auto bit = 0; bit < 64; ++bit)
    {
        auto const a = oc::hash_mix(0x0123456789abcdefull);
        auto const b = oc::hash_mix(0x0123456789abcdefull ^ (oc::u64(1) << bit));
        auto const flipped = std::popcount(a ^ b);
        CHECK(flipped > 10);
        CHECK(flipped < 54);
    }
}
