#pragma once

#include <soa-core/assert.hh>
#include <soa-core/fwd.hh>
#include <soa-core/span.hh>

#include <array>

// Layout planning for a struct-of-arrays block.
//
// For a capacity `cap`, the block holds one array per field, packed in declaration order:
//
//   [ field 0: size0 * cap ][pad][ field 1: size1 * cap ][pad] ... [ field N-1 ][trailing pad]
//
// Each array starts at the first offset aligned to its column alignment after the previous array.
// The column alignment is the field alignment unless the field asks for more (field_descriptor::column_align).
// Elements inside a column are always packed at the field size.
// The block alignment is the largest column alignment and the total size is rounded up to it.
// This is the same fold as extending a struct layout by one array layout at a time.
//
// Consequences relied upon by raw_storage:
// - offsets are non-decreasing in declaration order
// - growing the capacity never decreases any offset, shrinking never increases one
// - capacity 0 yields total size 0 and all offsets 0 (valid to compute, never dereferenced)

/// Size and alignment of one record field, independent of any instance.
/// `align` is the element alignment and fixes the stride inside a column.
/// `column_align` over-aligns the start of the column (e.g. 64 for cache line / SIMD loads),
/// 0 means the column starts at the element alignment.
struct soa::field_descriptor
{
    isize size = 0;
    isize align = 1;
    isize column_align = 0;

    /// Descriptor of a concrete C++ type.
    template <class T>
    [[nodiscard]] static constexpr field_descriptor of()
    {
        return {isize(sizeof(T)), isize(alignof(T))};
    }

    /// Descriptor of a concrete C++ type whose column starts at a multiple of ColumnAlign.
    template <class T, isize ColumnAlign>
    [[nodiscard]] static constexpr field_descriptor aligned_of()
    {
        return {isize(sizeof(T)), isize(alignof(T)), ColumnAlign};
    }

    /// Alignment of the first byte of the column.
    [[nodiscard]] constexpr isize column_alignment() const { return column_align > align ? column_align : align; }

    constexpr bool operator==(field_descriptor const&) const = default;
};

/// Total size and alignment of one planned block.
struct soa::layout_extent
{
    isize total_size = 0;
    isize total_align = 1;

    constexpr bool operator==(layout_extent const&) const = default;
};

/// Computed block layout for N fields at one capacity.
/// Invariants: offsets[0] == 0, offsets[i] % column_alignment[i] == 0,
/// offsets[i] + size[i] * capacity <= total_size, total_size % total_align == 0.
template <soa::isize N>
struct soa::layout_plan
{
    isize total_size = 0;
    isize total_align = 1;
    std::array<isize, size_t(N)> offsets = {};

    [[nodiscard]] constexpr layout_extent extent() const { return {total_size, total_align}; }
};

namespace soa
{
/// Plans the block layout of `fields` at `capacity`.
/// Writes one offset per field to `out_offsets` and the block size / alignment to `out_extent`.
/// Returns false if any intermediate size is not representable in isize (outputs are then unspecified).
/// Preconditions:
///   !fields.empty(), out_offsets.size() == fields.size(), capacity >= 0,
///   every align is a power of two, every size is a non-negative multiple of its align,
///   every column_align is 0 or a power of two.
[[nodiscard]] bool try_plan_layout(span<field_descriptor const> fields,
                                   isize capacity,
                                   span<isize> out_offsets,
                                   layout_extent& out_extent);

/// Largest capacity for which planning `fields` is guaranteed to succeed.
/// Every capacity in [0, max_capacity_for(fields)] plans without overflow.
/// Fields of size 0 do not restrict the capacity.
[[nodiscard]] isize max_capacity_for(span<field_descriptor const> fields);

/// Typed convenience wrapper returning a layout_plan<N>.
template <size_t N>
[[nodiscard]] bool try_plan_layout(std::array<field_descriptor, N> const& fields, isize capacity, layout_plan<isize(N)>& out)
{
    static_assert(N > 0, "zero-field records have no layout");
    layout_extent extent;
    if (!soa::try_plan_layout(span<field_descriptor const>(fields.data(), isize(N)), capacity,
                              span<isize>(out.offsets.data(), isize(N)), extent))
        return false;
    out.total_size = extent.total_size;
    out.total_align = extent.total_align;
    return true;
}

/// Like try_plan_layout but treats overflow as fatal.
template <size_t N>
[[nodiscard]] layout_plan<isize(N)> plan_layout(std::array<field_descriptor, N> const& fields, isize capacity)
{
    layout_plan<isize(N)> plan;
    auto const ok = soa::try_plan_layout(fields, capacity, plan);
    SOA_ASSERT_ALWAYS(ok, "layout overflow: capacity too large for the record fields");
    return plan;
}

template <size_t N>
[[nodiscard]] isize max_capacity_for(std::array<field_descriptor, N> const& fields)
{
    return soa::max_capacity_for(span<field_descriptor const>(fields.data(), isize(N)));
}
} // namespace soa
