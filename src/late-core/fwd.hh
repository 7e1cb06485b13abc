#pragma once

#include <cstddef>
#include <cstdint>


namespace lc
{

//
// Primitives
//

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

// signed size type, same reasoning as everywhere else: sizes take part in arithmetic
using isize = i64;

//
// Storage
//

struct placement_new_t;
struct in_place_t;
template <class T>
union storage_for;

//
// Container
//

struct nullopt_t;
template <class T>
struct optional;

//
// Late initialization
//

template <class T>
struct unchecked_cell;
template <class T>
struct checked_cell;

// only usable with LC_CONST_DEFAULT, see const_default.hh
template <class T>
struct const_default;

//
// Diagnostics
//

struct debug_string_config;

} // namespace lc
