#pragma once

#include <soa-core/assert.hh>
#include <soa-core/fwd.hh>
#include <soa-core/record.hh>
#include <soa-core/utility.hh>

#include <concepts>
#include <ostream>
#include <tuple>
#include <type_traits>
#include <utility>

// Row views and the row view adapter.
//
// A row of SoA storage is not a Record object: its fields live in different columns.
// soa::row_view<Record> bundles one pointer per field at one index and offers typed access.
// soa::row_view<Record const> is the read-only flavor.
//
// Value operations that are defined on Record (operator==, operator<<) need a Record const&.
// soa::borrowed_record<Record> builds a transient snapshot of a row for exactly that purpose
// without ever taking ownership of the borrowed fields (see below).
//
// Lifetime: a row view is invalidated by any grow / shrink / deallocate of the storage it
// points into. Mutable row views require exclusive access, which the owner enforces by only
// handing them out from non-const access paths.

namespace soa
{
/// Records with a usable operator==.
template <class Record>
concept equality_comparable_record = requires(Record const& a, Record const& b) {
    { a == b } -> std::convertible_to<bool>;
};

/// Records that can be written to a std::ostream.
template <class Record>
concept streamable_record = requires(std::ostream& os, Record const& r) {
    { os << r } -> std::convertible_to<std::ostream&>;
};

/// Records a borrowed_record snapshot can be built for.
/// Either every field is trivially copyable (bitwise snapshot) or the record is copy constructible.
template <class Record>
concept snapshot_record = has_trivially_copyable_fields<Record> || std::is_copy_constructible_v<Record>;
} // namespace soa

/// Borrowed view of one row: one pointer per field, all at the same index.
/// Cheap to copy, does not own anything.
template <class Record>
struct soa::row_view
{
    using record_t = std::remove_const_t<Record>;
    using traits_t = record_traits<record_t>;
    using pointer_tuple = typename impl::field_tuples<Record>::pointers;

    static constexpr isize field_count = field_count_of<record_t>;
    static constexpr bool is_const = std::is_const_v<Record>;

    template <isize I>
    using field_t = impl::const_like_t<Record, field_type_of<record_t, I>>;

    // construction
public:
    row_view() = default;

    /// Creates a view from one pointer per field.
    explicit row_view(pointer_tuple fields) : _fields(fields) {}

    /// Mutable rows convert to read-only rows.
    template <class U>
        requires(std::is_same_v<Record, U const> && !std::is_same_v<Record, U>)
    row_view(row_view<U> const& rhs) : _fields(rhs.field_pointers())
    {
    }

    // field access
public:
    /// Field I of this row.
    template <isize I>
    [[nodiscard]] field_t<I>& get() const
    {
        static_assert(0 <= I && I < field_count, "field index out of range");
        return *std::get<size_t(I)>(_fields);
    }

    /// Field selected by member pointer, e.g. row.get<&particle::x>().
    template <auto Member>
        requires field_member_pointer<Member>
    [[nodiscard]] decltype(auto) get() const
    {
        constexpr isize index = field_index_of<record_t, Member>;
        static_assert(index >= 0, "member is not a field of this record");
        return get<index>();
    }

    [[nodiscard]] pointer_tuple const& field_pointers() const { return _fields; }

    /// Copies the row out into an owned record.
    [[nodiscard]] record_t to_record() const
        requires std::is_copy_constructible_v<record_t>
    {
        return to_record_impl(std::make_index_sequence<size_t(field_count)>());
    }

    /// Assigns all fields from a record (the row must refer to live slots).
    void assign(record_t const& r) const
        requires(!is_const)
    {
        assign_impl(r, std::make_index_sequence<size_t(field_count)>());
    }

    // comparison
public:
    /// Rows compare through Record::operator== when the record provides one, field by field otherwise.
    friend bool operator==(row_view const& a, row_view const& b)
    {
        if constexpr (equality_comparable_record<record_t> && snapshot_record<record_t>)
            return with_record(row_view<record_t const>(a),
                               [&](record_t const& ra)
                               { return with_record(row_view<record_t const>(b), [&](record_t const& rb) { return bool(ra == rb); }); });
        else
            return a.fields_equal(b.field_pointers(), std::make_index_sequence<size_t(field_count)>());
    }

    friend bool operator==(row_view const& a, record_t const& b)
    {
        if constexpr (equality_comparable_record<record_t> && snapshot_record<record_t>)
            return with_record(row_view<record_t const>(a), [&](record_t const& ra) { return bool(ra == b); });
        else
            return a.fields_equal_record(b, std::make_index_sequence<size_t(field_count)>());
    }

    /// Streams the row as its record would stream.
    /// Records without operator<< are printed field by field as "(f0, f1, ...)".
    friend std::ostream& operator<<(std::ostream& os, row_view const& row)
    {
        if constexpr (streamable_record<record_t> && snapshot_record<record_t>)
            return with_record(row_view<record_t const>(row), [&](record_t const& r) -> std::ostream& { return os << r; });
        else
            return row.print_fields(os, std::make_index_sequence<size_t(field_count)>());
    }

    // helpers
private:
    template <size_t... I>
    record_t to_record_impl(std::index_sequence<I...>) const
    {
        return soa::make_record<record_t>(static_cast<field_type_of<record_t, isize(I)> const&>(get<isize(I)>())...);
    }

    template <size_t... I>
    void assign_impl(record_t const& r, std::index_sequence<I...>) const
    {
        ((get<isize(I)>() = traits_t::template member<isize(I)>(r)), ...);
    }

    template <class Pointers, size_t... I>
    bool fields_equal(Pointers const& rhs, std::index_sequence<I...>) const
    {
        return ((get<isize(I)>() == *std::get<I>(rhs)) && ...);
    }

    template <size_t... I>
    bool fields_equal_record(record_t const& r, std::index_sequence<I...>) const
    {
        return ((get<isize(I)>() == traits_t::template member<isize(I)>(r)) && ...);
    }

    template <size_t... I>
    std::ostream& print_fields(std::ostream& os, std::index_sequence<I...>) const
    {
        os << '(';
        ((os << (I == 0 ? "" : ", ") << get<isize(I)>()), ...);
        return os << ')';
    }

    // members
private:
    pointer_tuple _fields = {};
};

/// Non-owning snapshot of a borrowed row, usable wherever a Record const& is required.
///
/// The snapshot lives in a union member, so the record destructor is never run implicitly.
/// - Records whose fields are all trivially copyable are snapshotted bit for bit and discarded
///   without any teardown. A user-declared ~Record() therefore never observes the snapshot,
///   and nothing borrowed is released.
/// - Other records are copy constructed from the row. The copy owns its own resources and is
///   destroyed normally when the adapter goes out of scope.
///
/// Usage:
///   soa::with_record(storage.row(i), [&](particle const& p) { log(p); });
template <class Record>
struct soa::borrowed_record
{
    static_assert(!std::is_const_v<Record>, "use borrowed_record<Record>, the snapshot is always read-only");
    static_assert(snapshot_record<Record>,
                  "borrowed_record requires trivially copyable fields or a copy constructible record");

    using traits_t = record_traits<Record>;

    static constexpr bool is_bitwise = has_trivially_copyable_fields<Record>;

    explicit borrowed_record(row_view<Record const> row)
    {
        construct(row, std::make_index_sequence<size_t(field_count_of<Record>)>());
    }

    ~borrowed_record()
    {
        if constexpr (!is_bitwise)
            _record.~Record();
    }

    borrowed_record(borrowed_record const&) = delete;
    borrowed_record(borrowed_record&&) = delete;
    borrowed_record& operator=(borrowed_record const&) = delete;
    borrowed_record& operator=(borrowed_record&&) = delete;

    [[nodiscard]] Record const& get() const { return _record; }
    [[nodiscard]] Record const& operator*() const { return _record; }
    [[nodiscard]] Record const* operator->() const { return &_record; }

private:
    template <size_t... I>
    void construct(row_view<Record const> const& row, std::index_sequence<I...>)
    {
        // trivially copyable fields copy bitwise, everything else through its copy constructor
        new (soa::placement_new, &_record) Record(soa::make_record<Record>(row.template get<isize(I)>()...));
    }

    union
    {
        Record _record;
    };
};

namespace soa
{
/// Calls f(Record const&) with a transient snapshot of the row and returns its result.
template <class Record, class F>
decltype(auto) with_record(row_view<Record const> row, F&& f)
{
    borrowed_record<Record> snapshot(row);
    return f(snapshot.get());
}

template <class Record, class F>
    requires(!std::is_const_v<Record>)
decltype(auto) with_record(row_view<Record> row, F&& f)
{
    return soa::with_record(row_view<Record const>(row), f);
}
} // namespace soa
