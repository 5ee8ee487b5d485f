#pragma once

#include <soa-core/assert.hh>
#include <soa-core/fwd.hh>

#include <cstring>
#include <limits>
#include <new>

// =========================================================================================================
// Utility functions used throughout the storage engine
// =========================================================================================================
//
// Move semantics:
//   move(value)                       - cast value to rvalue reference for moving
//   forward<T>(value)                 - perfect forwarding for template arguments
//   exchange(obj, new_val)            - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b) / min(a, b)             - larger / smaller of two values (requires operator<)
//
// Alignment (value or pointer):
//   is_power_of_two(value)            - check if value is a power of 2
//   align_up(value, alignment)        - increment to next aligned boundary (power of 2)
//   is_aligned(value, alignment)      - check if aligned at boundary (power of 2)
//
// Checked size arithmetic:
//   try_mul_size(a, b, out)           - a * b without overflowing isize
//   try_add_size(a, b, out)           - a + b without overflowing isize
//   try_align_up_size(v, align, out)  - align_up without overflowing isize
//
// Raw memory:
//   placement_new                     - tag for "construct here" placement new
//   memcpy / memmove                  - byte copies that accept zero sizes and null pointers
//
// Template metaprogramming:
//   always_false_t<T...>              - always false for static_assert with type parameters
//   function_ptr<Signature>           - convert function signature to function pointer type


namespace soa
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] SOA_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] SOA_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] SOA_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto block = soa::exchange(_block, nullptr); // take ownership of the block
template <class T, class U = T>
[[nodiscard]] SOA_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
/// When a == b, min returns a
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Alignment (for values or pointers)
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    SOA_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Increment value to align at the given boundary
/// Usage:
///   isize offset = soa::align_up(20, 8); // = 24
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
///   the result must be representable (use try_align_up_size for untrusted sizes)
template <class T>
[[nodiscard]] constexpr T align_up(T value, isize alignment)
{
    SOA_ASSERT(alignment > 0 && is_power_of_two(alignment), "align_up: alignment must be a power of 2");
    return (T)(((isize)value + (alignment - 1)) & ~(alignment - 1));
}

/// Check if value is aligned at the given boundary
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr bool is_aligned(T value, isize alignment)
{
    SOA_ASSERT(alignment > 0 && is_power_of_two(alignment), "is_aligned: alignment must be a power of 2");
    return 0 == ((isize)value & (alignment - 1));
}

// =========================================================================================================
// Checked size arithmetic
// =========================================================================================================
// Layout sizes are derived from caller-provided capacities, so every step is checked.
// All functions return false on overflow and leave `out` unspecified.
// Inputs must be non-negative.

[[nodiscard]] constexpr bool try_mul_size(isize a, isize b, isize& out)
{
    SOA_ASSERT(a >= 0 && b >= 0, "try_mul_size: operands must be non-negative");
    if (b != 0 && a > std::numeric_limits<isize>::max() / b)
        return false;
    out = a * b;
    return true;
}

[[nodiscard]] constexpr bool try_add_size(isize a, isize b, isize& out)
{
    SOA_ASSERT(a >= 0 && b >= 0, "try_add_size: operands must be non-negative");
    if (a > std::numeric_limits<isize>::max() - b)
        return false;
    out = a + b;
    return true;
}

[[nodiscard]] constexpr bool try_align_up_size(isize value, isize alignment, isize& out)
{
    SOA_ASSERT(alignment > 0 && is_power_of_two(alignment), "try_align_up_size: alignment must be a power of 2");
    isize bumped = 0;
    if (!try_add_size(value, alignment - 1, bumped))
        return false;
    out = bumped & ~(alignment - 1);
    return true;
}

// =========================================================================================================
// Raw memory
// =========================================================================================================

/// Tag selecting the non-allocating placement new below
/// Usage:
///   new (soa::placement_new, ptr) T(args...);
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new{};

/// memcpy that accepts size == 0 together with null pointers
/// Precondition: [dest, dest + size) and [src, src + size) do not overlap
inline void memcpy(void* dest, void const* src, isize size)
{
    SOA_ASSERT(size >= 0, "memcpy: size must be non-negative");
    if (size > 0)
        std::memcpy(dest, src, size_t(size));
}

/// memmove that accepts size == 0 together with null pointers
/// Overlapping ranges are allowed
inline void memmove(void* dest, void const* src, isize size)
{
    SOA_ASSERT(size >= 0, "memmove: size must be non-negative");
    if (size > 0)
        std::memmove(dest, src, size_t(size));
}

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   soa::function_ptr<isize(byte**, isize)> -> isize (*)(byte**, isize)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

} // namespace soa

/// Non-allocating placement new selected by soa::placement_new
/// Avoids depending on the reserved global form and keeps call sites greppable
[[nodiscard]] inline void* operator new(std::size_t, soa::placement_new_t, void* buffer) noexcept
{
    return buffer;
}

/// Matching placement delete, called only if a constructor throws
inline void operator delete(void*, soa::placement_new_t, void*) noexcept {}
