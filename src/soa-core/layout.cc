#include "layout.hh"

#include <soa-core/utility.hh>

#include <limits>

namespace
{
void check_descriptors(soa::span<soa::field_descriptor const> fields)
{
    SOA_ASSERT(!fields.empty(), "layout planning requires at least one field");
    for (auto const& f : fields)
    {
        SOA_ASSERT(f.align > 0 && soa::is_power_of_two(f.align), "field alignment must be a power of 2");
        SOA_ASSERT(f.size >= 0, "field size must be non-negative");
        SOA_ASSERT(f.size % f.align == 0, "field size must be a multiple of its alignment");
        SOA_ASSERT(f.column_align == 0 || soa::is_power_of_two(f.column_align), "column alignment must be 0 or a power of 2");
        SOA_UNUSED(f);
    }
}
} // namespace

bool soa::try_plan_layout(span<field_descriptor const> fields, isize capacity, span<isize> out_offsets, layout_extent& out_extent)
{
    check_descriptors(fields);
    SOA_ASSERT(capacity >= 0, "capacity must be non-negative");
    SOA_ASSERT(out_offsets.size() == fields.size(), "one offset per field required");

    // field 0 is an array at offset 0
    isize size = 0;
    if (!soa::try_mul_size(fields[0].size, capacity, size))
        return false;
    isize align = fields[0].column_alignment();
    out_offsets[0] = 0;

    // extend by one array per further field
    for (isize i = 1; i < fields.size(); ++i)
    {
        auto const& f = fields[i];

        isize offset = 0;
        if (!soa::try_align_up_size(size, f.column_alignment(), offset))
            return false;

        isize array_bytes = 0;
        if (!soa::try_mul_size(f.size, capacity, array_bytes))
            return false;

        if (!soa::try_add_size(offset, array_bytes, size))
            return false;

        out_offsets[i] = offset;
        align = soa::max(align, f.column_alignment());
    }

    // trailing padding to the block alignment
    isize total = 0;
    if (!soa::try_align_up_size(size, align, total))
        return false;

    out_extent.total_size = total;
    out_extent.total_align = align;
    return true;
}

soa::isize soa::max_capacity_for(span<field_descriptor const> fields)
{
    check_descriptors(fields);

    // the unpadded sum of all arrays bounds the planned size from below,
    // padding adds less than the column alignment per field plus less than the block alignment
    // at the end, and both are bounded by the sum of all column alignments
    isize bytes_per_element = 0;
    isize padding_bound = 0;
    for (auto const& f : fields)
    {
        bytes_per_element += f.size;
        padding_bound += 2 * f.column_alignment();
    }

    if (bytes_per_element == 0)
        return std::numeric_limits<isize>::max();

    // conservative: may be a few elements below the exact limit of the planner
    auto const limit = std::numeric_limits<isize>::max() - padding_bound;
    return limit / bytes_per_element;
}
