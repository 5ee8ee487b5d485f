#pragma once

#include <soa-core/fwd.hh>
#include <soa-core/layout.hh>
#include <soa-core/utility.hh>

#include <array>
#include <concepts>
#include <tuple>
#include <type_traits>
#include <utility>

// Record description
//
// A record is a plain aggregate whose data members become the columns of the storage.
// The storage engine never inspects a record itself, it only consumes the description below:
// the ordered field list (types, sizes, alignments) and the record <-> field values mapping.
//
// Usage:
//
//   struct particle
//   {
//       float x;
//       float y;
//       int id;
//   };
//
//   template <>
//   struct soa::record_traits<particle> : soa::record_fields<&particle::x, &particle::y, &particle::id>
//   {
//   };
//
// The member pointers must list every data member of the aggregate in declaration order,
// since records are rebuilt by aggregate initialization from the field values.
// A member wrapped as soa::aligned_field<&particle::x, 64> gets a column starting at a multiple of 64 bytes.
// Records without data members use soa::record_fields<> and take the zero-field path.

namespace soa
{
/// Field entry whose column starts at a multiple of ColumnAlign bytes.
/// Elements keep their natural stride, only the start of the column is over-aligned.
///
///   template <>
///   struct soa::record_traits<vec4> : soa::record_fields<soa::aligned_field<&vec4::x, 64>, &vec4::y, ...>
///   {
///   };
template <auto Member, isize ColumnAlign>
struct aligned_field_t
{
    static_assert(std::is_member_object_pointer_v<decltype(Member)>, "aligned_field expects a pointer to a data member");
    static_assert(ColumnAlign > 0 && (ColumnAlign & (ColumnAlign - 1)) == 0, "column alignment must be a power of 2");

    static constexpr auto member = Member;
    static constexpr isize column_align = ColumnAlign;
};

template <auto Member, isize ColumnAlign>
inline constexpr aligned_field_t<Member, ColumnAlign> aligned_field = {};
} // namespace soa

namespace soa::impl
{
/// Normalizes one record_fields entry: a plain member pointer or an aligned_field.
template <class E>
struct field_entry_traits
{
    static_assert(always_false_t<E>, "record_fields expects pointers to data members (e.g. &particle::x) or soa::aligned_field");
};
template <class E>
struct field_entry_traits<E const> : field_entry_traits<E>
{
};
template <class C, class F>
struct field_entry_traits<F C::*>
{
    using class_t = C;
    using field_t = F;

    static constexpr field_descriptor descriptor() { return field_descriptor::of<F>(); }
    static constexpr auto member(F C::* p) { return p; }
};
template <auto Member, isize ColumnAlign>
struct field_entry_traits<aligned_field_t<Member, ColumnAlign>> : field_entry_traits<decltype(Member)>
{
    using field_t = typename field_entry_traits<decltype(Member)>::field_t;

    static constexpr field_descriptor descriptor() { return field_descriptor::aligned_of<field_t, ColumnAlign>(); }
    static constexpr auto member(aligned_field_t<Member, ColumnAlign>) { return Member; }
};

template <auto Entry>
inline constexpr auto member_of = field_entry_traits<decltype(Entry)>::member(Entry);

template <auto A, auto B>
consteval bool is_same_member()
{
    if constexpr (std::is_same_v<decltype(A), decltype(B)>)
        return A == B;
    else
        return false;
}
} // namespace soa::impl

namespace soa
{
/// Zero-field record description: no descriptors, no columns.
template <>
struct record_fields<>
{
    static constexpr isize field_count = 0;
};

/// Description of a record from an ordered list of member pointers or aligned_field entries.
template <auto First, auto... Rest>
struct record_fields<First, Rest...>
{
    using record_t = typename impl::field_entry_traits<decltype(First)>::class_t;

    static_assert((std::is_same_v<record_t, typename impl::field_entry_traits<decltype(Rest)>::class_t> && ...),
                  "all member pointers of a record must belong to the same class");
    static_assert(std::is_aggregate_v<record_t>, "records must be aggregates (rebuilt via aggregate initialization)");

    static constexpr isize field_count = 1 + sizeof...(Rest);

    template <isize I>
    using field_t = std::tuple_element_t<size_t(I),
                                         std::tuple<typename impl::field_entry_traits<decltype(First)>::field_t,
                                                    typename impl::field_entry_traits<decltype(Rest)>::field_t...>>;

    /// Size, alignment and column alignment of every field, in declaration order.
    static constexpr std::array<field_descriptor, size_t(field_count)> descriptors = {
        impl::field_entry_traits<decltype(First)>::descriptor(),
        impl::field_entry_traits<decltype(Rest)>::descriptor()...,
    };

    /// Member pointer of field I.
    template <isize I>
    static constexpr auto member_pointer = std::get<size_t(I)>(std::tuple{impl::member_of<First>, impl::member_of<Rest>...});

    /// Index of the field selected by a member pointer, -1 if it is not part of the description.
    template <auto Member>
    static constexpr isize index_of = []
    {
        constexpr bool matches[] = {impl::is_same_member<Member, impl::member_of<First>>(),
                                    impl::is_same_member<Member, impl::member_of<Rest>>()...};
        for (isize i = 0; i < field_count; ++i)
            if (matches[i])
                return i;
        return isize(-1);
    }();

    /// Field I of a record (const-ness follows the record).
    template <isize I, class R>
        requires std::is_same_v<std::remove_cvref_t<R>, record_t>
    [[nodiscard]] static constexpr decltype(auto) member(R& r)
    {
        return (r.*member_pointer<I>);
    }

    /// Rebuilds a record from its field values, in declaration order.
    template <class... Fields>
    [[nodiscard]] static constexpr record_t make_record(Fields&&... fields)
    {
        static_assert(sizeof...(Fields) == size_t(field_count), "one value per field required");
        return record_t{soa::forward<Fields>(fields)...};
    }
};
} // namespace soa

namespace soa
{
/// A type with a record_traits specialization.
template <class Record>
concept described_record = requires {
    { record_traits<std::remove_cv_t<Record>>::field_count } -> std::convertible_to<isize>;
};

template <class Record>
constexpr isize field_count_of = record_traits<std::remove_cv_t<Record>>::field_count;

template <class Record, isize I>
using field_type_of = typename record_traits<std::remove_cv_t<Record>>::template field_t<I>;

/// True if every field of the record is trivially copyable.
/// Such records are relocated bitwise, both inside one block and across blocks.
template <class Record, class = std::make_index_sequence<size_t(field_count_of<Record>)>>
constexpr bool has_trivially_copyable_fields = false;
template <class Record, size_t... I>
constexpr bool has_trivially_copyable_fields<Record, std::index_sequence<I...>>
    = (std::is_trivially_copyable_v<field_type_of<Record, isize(I)>> && ...);

/// True if every field of the record is trivially destructible.
template <class Record, class = std::make_index_sequence<size_t(field_count_of<Record>)>>
constexpr bool has_trivially_destructible_fields = false;
template <class Record, size_t... I>
constexpr bool has_trivially_destructible_fields<Record, std::index_sequence<I...>>
    = (std::is_trivially_destructible_v<field_type_of<Record, isize(I)>> && ...);

/// Rebuilds a record from its field values, zero-field records are value initialized.
template <class Record, class... Fields>
[[nodiscard]] constexpr Record make_record(Fields&&... fields)
{
    if constexpr (field_count_of<Record> == 0)
    {
        static_assert(sizeof...(Fields) == 0, "zero-field records take no field values");
        return Record{};
    }
    else
    {
        return record_traits<Record>::make_record(soa::forward<Fields>(fields)...);
    }
}

/// Member pointer selecting a field, usable as get<&particle::x>().
template <auto Member>
concept field_member_pointer = std::is_member_object_pointer_v<decltype(Member)>;

/// Index of the field selected by a member pointer in the description of Record.
template <class Record, auto Member>
constexpr isize field_index_of = record_traits<std::remove_cv_t<Record>>::template index_of<Member>;
} // namespace soa

namespace soa::impl
{
template <class Record, class T>
using const_like_t = std::conditional_t<std::is_const_v<Record>, T const, T>;

/// Per-field pointer and span tuples of a record, const-qualified if Record is const.
template <class Record, class = std::make_index_sequence<size_t(field_count_of<Record>)>>
struct field_tuples;
template <class Record, size_t... I>
struct field_tuples<Record, std::index_sequence<I...>>
{
    using pointers = std::tuple<const_like_t<Record, field_type_of<Record, isize(I)>>*...>;
    using spans = std::tuple<span<const_like_t<Record, field_type_of<Record, isize(I)>>>...>;
};
} // namespace soa::impl
