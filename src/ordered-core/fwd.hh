#pragma once

#include <cstddef>
#include <cstdint>

// Include this instead of a full header when a declaration is enough.

namespace oc
{
// fixed-width integers
// slot indices (i32), generations (u32) and hashes (u64) have a fixed size inside the arena
using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using byte = std::byte;

// sizes and indices are signed: "size - 1" must not wrap and -1 can mean "none"
using isize = i64;

using nullptr_t = std::nullptr_t;

// values
struct nullopt_t;
template <class T>
struct optional;

// containers
template <class V>
struct ordered_map;

// threading
template <class T>
struct mutex;
template <class V>
struct entry_stream;

namespace impl
{
template <class T>
struct slot_buffer;
} // namespace impl
} // namespace oc
