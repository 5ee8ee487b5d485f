#pragma once

#include <soa-core/assert.hh>
#include <soa-core/fwd.hh>

#include <type_traits>

/// Non-owning view over a contiguous sequence of T, similar to std::span.
/// Stores a pointer and runtime size.
/// This is the per-field building block of soa::slice_view: one span per field column.
/// Does not own the underlying memory; caller must ensure the referenced data outlives the span.
/// Spans into raw storage are invalidated by any grow / shrink of that storage.
template <class T>
struct soa::span
{
    // construction
public:
    /// Default span is empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    /// Creates a span viewing [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        SOA_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Creates a span viewing [begin, end).
    /// Precondition: begin <= end.
    constexpr explicit span(T* begin, T* end) : _data(begin), _size(end - begin)
    {
        SOA_ASSERT(begin <= end, "invalid pointer range");
    }

    /// Mutable spans convert to const spans.
    template <class U>
        requires(std::is_same_v<T, U const>)
    constexpr span(span<U> const& rhs) : _data(rhs.data()), _size(rhs.size())
    {
    }

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        SOA_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    /// Returns a reference to the first element.
    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front() const
    {
        SOA_ASSERT(_size > 0, "front() called on empty span");
        return _data[0];
    }

    /// Returns a reference to the last element.
    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back() const
    {
        SOA_ASSERT(_size > 0, "back() called on empty span");
        return _data[_size - 1];
    }

    /// Returns a pointer to the underlying contiguous storage.
    /// For views into empty raw storage this is a dangling, non-null sentinel.
    [[nodiscard]] constexpr T* data() const { return _data; }

    /// Returns the sub-span [offset, offset + count).
    /// Precondition: 0 <= offset, 0 <= count, offset + count <= size().
    [[nodiscard]] constexpr span subspan(isize offset, isize count) const
    {
        SOA_ASSERT(0 <= offset && 0 <= count && offset + count <= _size, "subspan out of bounds");
        return span(_data + offset, count);
    }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr isize size_bytes() const { return _size * isize(sizeof(T)); }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
