#pragma once

#include <ordered-core/fwd.hh>

#include <string_view>

// =========================================================================================================
// Key hashing
// =========================================================================================================
//
// hash_string(s)   - deterministic 64-bit hash of the bytes of s
// hash_mix(h)      - avalanche finalizer, spreads entropy into the low bits
//
// ordered_map selects buckets with "hash & (bucket_count - 1)", so the low bits must be well mixed.
// The hash is the same on every run and platform; nothing here is randomized per process.

namespace oc
{
/// 64-bit finalizer (the fmix64 step of MurmurHash3)
/// Every input bit affects every output bit with probability close to 1/2.
[[nodiscard]] constexpr u64 hash_mix(u64 h)
{
    h ^= h >> 33;
    h *= 0xff51afd7ed558ccdull;
    h ^= h >> 33;
    h *= 0xc4ceb9fe1a85ec53ull;
    h ^= h >> 33;
    return h;
}

/// FNV-1a over the bytes of s, followed by hash_mix
/// O(s.size()).
/// Usage:
///   auto const h = oc::hash_string("alpha");
///   auto const bucket = h & (bucket_count - 1);
[[nodiscard]] constexpr u64 hash_string(std::string_view s)
{
    u64 h = 0xcbf29ce484222325ull; // FNV offset basis
    for (char const c : s)
    {
        h ^= u64(u8(c));
        h *= 0x100000001b3ull; // FNV prime
    }
    return hash_mix(h);
}
} // namespace oc
