#pragma once

#include <soa-core/fwd.hh>
#include <soa-core/utility.hh>

#include <type_traits>

// Lifetime helpers for a single field column.
// Every function works on one contiguous run of one field type; raw_storage applies them per field.

namespace soa::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) are valid and result in a no-op.
/// Trivially destructible types are optimized out at compile time.
template <class T>
void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Copy-constructs objects from [src_start, src_end) using placement new.
/// dest_end is incremented for each successfully constructed object.
/// IMPORTANT: Assumes the objects at [*dest_end, *dest_end + (src_end - src_start)) are NOT yet constructed.
/// If copy construction throws, dest_end points to the element that threw (not yet constructed).
/// Trivially copyable types are optimized to use memcpy at compile time.
///
/// Usage pattern:
///   auto obj_end = dest_column;
///   copy_create_objects_to(obj_end, src, src + count);
///   // [dest_column, obj_end) is now the constructed live range
template <class T>
void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        soa::memcpy(dest_end, src_start, size * isize(sizeof(T)));
        dest_end += size;
    }
    else
    {
        while (src_start != src_end)
        {
            new (soa::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Moves [src, src + count) into the uninitialized, non-overlapping range [dest, dest + count)
/// and ends the lifetime of the sources.
/// This is the cross-block relocation used when a column moves to a freshly allocated block.
template <class T>
void relocate_objects_disjoint(T* dest, T* src, isize count)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");
    SOA_ASSERT(count >= 0, "count must be non-negative");
    SOA_ASSERT(count == 0 || dest + count <= src || src + count <= dest, "ranges must not overlap");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        soa::memcpy(dest, src, count * isize(sizeof(T)));
    }
    else
    {
        for (isize i = 0; i < count; ++i)
        {
            new (soa::placement_new, dest + i) T(soa::move(src[i]));
            src[i].~T();
        }
    }
}

/// Moves [src, src + count) to [dest, dest + count) inside one column, ranges may overlap.
/// Slots of the destination outside the source range must be dead on entry,
/// slots of the source outside the destination range are dead on exit.
/// Walks front to back when moving towards lower indices and back to front otherwise,
/// so every element is read before its slot is overwritten.
template <class T>
void relocate_objects_overlapping(T* dest, T* src, isize count)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");
    SOA_ASSERT(count >= 0, "count must be non-negative");

    if (dest == src || count == 0)
        return;

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        soa::memmove(dest, src, count * isize(sizeof(T)));
    }
    else if (dest < src)
    {
        for (isize i = 0; i < count; ++i)
        {
            new (soa::placement_new, dest + i) T(soa::move(src[i]));
            src[i].~T();
        }
    }
    else
    {
        for (isize i = count - 1; i >= 0; --i)
        {
            new (soa::placement_new, dest + i) T(soa::move(src[i]));
            src[i].~T();
        }
    }
}
} // namespace soa::impl
