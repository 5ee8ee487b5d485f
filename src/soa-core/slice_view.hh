#pragma once

#include <soa-core/assert.hh>
#include <soa-core/fwd.hh>
#include <soa-core/record.hh>
#include <soa-core/row_view.hh>
#include <soa-core/span.hh>

#include <tuple>
#include <type_traits>
#include <utility>

/// Borrowed view of a row range [start, end): one soa::span per field, all of the same length.
/// Each span is a contiguous column and can be handed to vectorized code directly.
///
/// For zero-field records there are no columns; the view only carries the row count.
/// Same lifetime rule as row_view: invalidated by any relocation of the underlying storage.
template <class Record>
struct soa::slice_view
{
    using record_t = std::remove_const_t<Record>;
    using span_tuple = typename impl::field_tuples<Record>::spans;

    static constexpr isize field_count = field_count_of<record_t>;

    template <isize I>
    using field_t = impl::const_like_t<Record, field_type_of<record_t, I>>;

    // construction
public:
    slice_view() = default;

    /// Creates a view from one span per field.
    /// Precondition: all spans have length `size`.
    explicit slice_view(span_tuple columns, isize size) : _columns(columns), _size(size)
    {
        SOA_ASSERT(size >= 0, "slice size must be non-negative");
        SOA_ASSERT(sizes_match(std::make_index_sequence<size_t(field_count)>()), "all columns of a slice must have the same length");
    }

    /// Mutable slices convert to read-only slices.
    template <class U>
        requires(std::is_same_v<Record, U const> && !std::is_same_v<Record, U>)
    slice_view(slice_view<U> const& rhs) : slice_view(convert_columns(rhs, std::make_index_sequence<size_t(field_count)>()), rhs.size())
    {
    }

    // column access
public:
    /// Column of field I.
    template <isize I>
    [[nodiscard]] span<field_t<I>> get() const
    {
        static_assert(0 <= I && I < field_count, "field index out of range");
        return std::get<size_t(I)>(_columns);
    }

    /// Column selected by member pointer, e.g. slice.get<&particle::x>().
    template <auto Member>
        requires field_member_pointer<Member>
    [[nodiscard]] auto get() const
    {
        constexpr isize index = field_index_of<record_t, Member>;
        static_assert(index >= 0, "member is not a field of this record");
        return get<index>();
    }

    [[nodiscard]] span_tuple const& columns() const { return _columns; }

    // row access
public:
    /// Row i of the slice.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] row_view<Record> row(isize i) const
    {
        SOA_ASSERT(0 <= i && i < _size, "row index out of bounds");
        return row_at(i, std::make_index_sequence<size_t(field_count)>());
    }

    [[nodiscard]] row_view<Record> operator[](isize i) const { return row(i); }

    /// Iteration yields one row_view per row.
    [[nodiscard]] row_iterator<Record> begin() const { return row_iterator<Record>(*this, 0); }
    [[nodiscard]] row_iterator<Record> end() const { return row_iterator<Record>(*this, _size); }

    /// Rows [offset, offset + count) of this slice.
    [[nodiscard]] slice_view subslice(isize offset, isize count) const
    {
        SOA_ASSERT(0 <= offset && 0 <= count && offset + count <= _size, "subslice out of bounds");
        return subslice_at(offset, count, std::make_index_sequence<size_t(field_count)>());
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    // helpers
private:
    template <size_t... I>
    bool sizes_match(std::index_sequence<I...>) const
    {
        return ((std::get<I>(_columns).size() == _size) && ...);
    }

    template <size_t... I>
    row_view<Record> row_at(isize i, std::index_sequence<I...>) const
    {
        return row_view<Record>(typename row_view<Record>::pointer_tuple(std::get<I>(_columns).data() + i...));
    }

    template <size_t... I>
    slice_view subslice_at(isize offset, isize count, std::index_sequence<I...>) const
    {
        return slice_view(span_tuple(std::get<I>(_columns).subspan(offset, count)...), count);
    }

    template <class U, size_t... I>
    static span_tuple convert_columns(slice_view<U> const& rhs, std::index_sequence<I...>)
    {
        return span_tuple(std::get<I>(rhs.columns())...);
    }

    // members
private:
    span_tuple _columns = {};
    isize _size = 0;
};

/// Forward iterator over the rows of a slice.
/// Dereferencing yields a row_view by value, there is no addressable row object.
template <class Record>
struct soa::row_iterator
{
    using value_type = row_view<Record>;
    using difference_type = isize;

    row_iterator() = default;
    row_iterator(slice_view<Record> const& rows, isize index) : _rows(rows), _index(index) {}

    [[nodiscard]] row_view<Record> operator*() const { return _rows.row(_index); }

    row_iterator& operator++()
    {
        ++_index;
        return *this;
    }
    row_iterator operator++(int)
    {
        auto const old = *this;
        ++_index;
        return old;
    }

    [[nodiscard]] isize index() const { return _index; }

    /// Only iterators over the same slice are comparable.
    [[nodiscard]] bool operator==(row_iterator const& rhs) const { return _index == rhs._index; }

private:
    slice_view<Record> _rows;
    isize _index = 0;
};
