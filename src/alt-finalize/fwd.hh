#pragma once

#include <cstddef>
#include <cstdint>


namespace af
{

//
// Primitives
//

// Explicitly-sized primitive types
// Used wherever the range matters (sizes, offsets, byte dumps).
// Plain "int" is fine for small counts and loop counters.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type, sizes and indices are i64 so that "size - 1" cannot wrap around
using isize = i64;

//
// Lifetime
//

template <class T>
union storage_for;

template <class T>
struct finalizer;

struct unit;

template <class T>
struct manually_finalized;

template <class T>
struct finalize_guard;

//
// Diagnostics
//

struct debug_string_config;

} // namespace af
