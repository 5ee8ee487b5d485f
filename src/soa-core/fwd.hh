#pragma once

#include <cstddef>
#include <cstdint>


namespace soa
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

// signed size type
// Sizes, capacities, offsets and indices are all isize.
// Layout arithmetic subtracts and compares offsets a lot, and overflow checks against
// isize max are simpler to reason about than unsigned wrap-around.
// We only target 64-bit platforms.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;

enum class storage_error : u8;

//
// Layout
//

struct field_descriptor;
struct layout_extent;
template <isize N>
struct layout_plan;

//
// Records
//

template <class Record>
struct record_traits;
template <auto... Members>
struct record_fields;

//
// Views
//

template <class T>
struct span;
template <class Record>
struct row_view;
template <class Record>
struct slice_view;
template <class Record>
struct borrowed_record;
template <class Record>
struct row_iterator;

//
// Storage & container
//

template <class Record>
struct raw_storage;

template <class Record>
struct vector;

} // namespace soa
