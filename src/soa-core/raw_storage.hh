#pragma once

#include <soa-core/assert.hh>
#include <soa-core/fwd.hh>
#include <soa-core/impl/field_lifetime_util.hh>
#include <soa-core/layout.hh>
#include <soa-core/memory_resource.hh>
#include <soa-core/record.hh>
#include <soa-core/row_view.hh>
#include <soa-core/slice_view.hh>
#include <soa-core/utility.hh>

#include <array>
#include <cstdint>
#include <limits>
#include <tuple>
#include <type_traits>
#include <utility>

// soa::raw_storage<Record> is the storage engine underneath soa::vector<Record>.
//
// It owns at most one byte block from a soa::memory_resource and places one column per field of
// Record inside it, following the layout plan for the current capacity (see <soa-core/layout.hh>).
// It knows the capacity but NOT the length: which slots are alive is the owner's business.
// Every operation that touches elements therefore takes the length (or an index range) as input.
//
// Core invariants:
// - _block == nullptr <=> _capacity == 0 (Empty state), otherwise Allocated(_capacity).
// - _offsets are the offsets of layout_plan(descriptors, _capacity); all zero when empty.
// - Column addresses are derived as _block + _offsets[i] at the point of use and never cached.
//   When empty, data<I>() yields a dangling, non-null pointer aligned for the column.
// - _block_bytes is the canonical size of the block as reported by the resource.
//   It may exceed the planned total size, never the other way round.
// - _custom_resource == nullptr means soa::default_memory_resource.
//
// Relocation:
// - Records whose fields are all trivially copyable are relocated bitwise inside one block:
//   grow resizes the block first, then moves columns in REVERSE declaration order;
//   shrink moves columns in FORWARD declaration order, then resizes the block.
//   Offsets are non-decreasing in declaration order and move away from the block start when the
//   capacity grows, so each memmove only overwrites bytes that were already moved or are dead.
// - "Resize the block" first asks the resource for an in-place resize. If that fails a fresh
//   block is allocated, the bytes that must survive are copied and the old block is returned.
// - Records with other fields are never moved bitwise: grow and shrink allocate a fresh block and
//   move-construct + destroy each live element into it. The ranges are disjoint, order is free.
//
// Error reporting:
// - try_allocate / try_grow / try_shrink return soa::storage_error and leave the storage unchanged
//   on failure.
// - allocate / grow / shrink treat every error as fatal (SOA_ASSERT_ALWAYS).
//   allocate uses the resource's fatal allocate_bytes, grow and shrink need the fallible calls
//   to keep the old block intact until the new one exists.
// - index and capacity contracts are checked with SOA_ASSERT only.
//
// The destructor returns a still-owned block to its resource but never runs element destructors.
// Owners destroy live elements (destroy / read) before the storage goes away.

/// Struct-of-arrays storage engine for records with at least one field.
template <class Record>
struct soa::raw_storage
{
    static_assert(!std::is_const_v<Record>, "raw_storage<Record const> is not supported");
    static_assert(described_record<Record>, "Record needs a soa::record_traits specialization (see <soa-core/record.hh>)");

    using record_t = Record;
    using traits_t = record_traits<Record>;

    static constexpr isize field_count = traits_t::field_count;
    static constexpr auto descriptors = traits_t::descriptors;

    /// Columns of this record may be moved with memmove / memcpy.
    static constexpr bool is_bitwise_relocatable = has_trivially_copyable_fields<Record>;

    /// Alignment of the block, the largest column alignment.
    static constexpr isize block_alignment = []
    {
        isize align = 1;
        for (auto const& d : descriptors)
            align = d.column_alignment() > align ? d.column_alignment() : align;
        return align;
    }();

    template <isize I>
    using field_t = field_type_of<Record, I>;

    using offset_array = std::array<isize, size_t(field_count)>;

    /// Ownership transfer type for release_raw_parts / from_raw_parts.
    struct raw_parts
    {
        byte* block = nullptr;
        isize block_bytes = 0;
        isize capacity = 0;
        memory_resource const* resource = nullptr;
    };

    // construction / ownership
public:
    raw_storage() = default;

    /// Empty storage that will allocate from `resource` (nullptr means the default resource).
    explicit raw_storage(memory_resource const* resource) : _custom_resource(resource) {}

    raw_storage(raw_storage&& rhs) noexcept
      : _block(soa::exchange(rhs._block, nullptr)),
        _block_bytes(soa::exchange(rhs._block_bytes, 0)),
        _capacity(soa::exchange(rhs._capacity, 0)),
        _offsets(soa::exchange(rhs._offsets, offset_array{})),
        _custom_resource(rhs._custom_resource)
    {
    }

    raw_storage& operator=(raw_storage&& rhs) noexcept
    {
        if (this != &rhs)
        {
            free_block();
            _block = soa::exchange(rhs._block, nullptr);
            _block_bytes = soa::exchange(rhs._block_bytes, 0);
            _capacity = soa::exchange(rhs._capacity, 0);
            _offsets = soa::exchange(rhs._offsets, offset_array{});
            _custom_resource = rhs._custom_resource;
        }
        return *this;
    }

    raw_storage(raw_storage const&) = delete;
    raw_storage& operator=(raw_storage const&) = delete;

    ~raw_storage() { free_block(); }

    /// Adopts a block obtained from release_raw_parts() or allocated by the caller.
    /// Preconditions:
    ///   parts.block was allocated from parts.resource (nullptr: default resource) with block_alignment
    ///   and canonical size parts.block_bytes >= planned total size of parts.capacity,
    ///   parts.block == nullptr <=> parts.capacity == 0.
    [[nodiscard]] static raw_storage from_raw_parts(raw_parts parts)
    {
        SOA_ASSERT((parts.block == nullptr) == (parts.capacity == 0), "a block requires a positive capacity and vice versa");
        SOA_ASSERT(parts.capacity >= 0, "capacity must be non-negative");
        SOA_ASSERT(soa::is_aligned(parts.block, block_alignment), "block is not aligned for the record fields");

        raw_storage s(parts.resource);
        if (parts.capacity > 0)
        {
            auto const plan = soa::plan_layout(descriptors, parts.capacity);
            SOA_ASSERT(parts.block_bytes >= plan.total_size, "block is too small for the capacity");
            s._block = parts.block;
            s._block_bytes = parts.block_bytes;
            s._capacity = parts.capacity;
            s._offsets = plan.offsets;
        }
        return s;
    }

    /// Gives up ownership of the block without freeing it. The storage is empty afterwards.
    /// The caller is responsible for any live elements and for returning the block to parts.resource.
    [[nodiscard]] raw_parts release_raw_parts()
    {
        raw_parts parts;
        parts.block = soa::exchange(_block, nullptr);
        parts.block_bytes = soa::exchange(_block_bytes, 0);
        parts.capacity = soa::exchange(_capacity, 0);
        parts.resource = _custom_resource;
        _offsets = {};
        return parts;
    }

    // allocation lifecycle
public:
    /// Allocates a block for `capacity` elements per field.
    /// Preconditions: the storage is empty, capacity > 0.
    [[nodiscard]] storage_error try_allocate(isize capacity)
    {
        SOA_ASSERT(_block == nullptr, "allocate requires empty storage");
        SOA_ASSERT(capacity > 0, "allocate requires a positive capacity");

        layout_plan<field_count> plan;
        if (!soa::try_plan_layout(descriptors, capacity, plan))
            return storage_error::overflow;

        auto const* resource = resource_or_default();
        byte* block = nullptr;
        auto const bytes = resource->try_allocate_bytes(&block, plan.total_size, plan.total_size, block_alignment, resource->userdata);
        if (bytes < 0)
            return storage_error::allocation_failure;

        _block = block;
        _block_bytes = bytes;
        _capacity = capacity;
        _offsets = plan.offsets;
        return storage_error::none;
    }

    /// Like try_allocate, but goes through the fatal allocate_bytes entry point of the resource.
    void allocate(isize capacity)
    {
        SOA_ASSERT(_block == nullptr, "allocate requires empty storage");
        SOA_ASSERT(capacity > 0, "allocate requires a positive capacity");

        auto const plan = soa::plan_layout(descriptors, capacity);

        auto const* resource = resource_or_default();
        byte* block = nullptr;
        auto const bytes = resource->allocate_bytes(&block, plan.total_size, plan.total_size, block_alignment, resource->userdata);
        SOA_ASSERT_ALWAYS(block != nullptr, "allocation failed: memory resource refused the block");

        _block = block;
        _block_bytes = bytes;
        _capacity = capacity;
        _offsets = plan.offsets;
    }

    /// Returns the block to the resource. Live elements must have been destroyed by the owner.
    /// No-op for capacity 0.
    /// Precondition: capacity is the current capacity.
    void deallocate(isize capacity)
    {
        SOA_ASSERT(capacity == _capacity, "deallocate requires the current capacity");
        if (capacity == 0)
            return;
        free_block();
    }

    /// Grows from old_capacity to new_capacity, keeping the first `length` elements of every field.
    /// Preconditions: the storage is allocated with old_capacity, new_capacity > old_capacity,
    /// 0 <= length <= old_capacity.
    [[nodiscard]] storage_error try_grow(isize old_capacity, isize new_capacity, isize length)
    {
        SOA_ASSERT(_block != nullptr, "grow requires allocated storage, use allocate first");
        SOA_ASSERT(old_capacity == _capacity, "old_capacity must be the current capacity");
        SOA_ASSERT(new_capacity > old_capacity, "grow requires a larger capacity");
        SOA_ASSERT(0 <= length && length <= old_capacity, "length out of range");

        layout_plan<field_count> plan;
        if (!soa::try_plan_layout(descriptors, new_capacity, plan))
            return storage_error::overflow;

        if constexpr (is_bitwise_relocatable)
        {
            auto const old_offsets = _offsets;
            auto const old_total = soa::plan_layout(descriptors, old_capacity).total_size;

            // the block must be large enough before any column moves up
            if (!try_resize_block(plan.total_size, old_total))
                return storage_error::allocation_failure;

            // back to front: field i lands on bytes of fields > i, which have already moved
            for (isize i = field_count - 1; i >= 0; --i)
            {
                SOA_ASSERT(plan.offsets[i] >= old_offsets[i], "growing moved a column towards the block start");
                soa::memmove(_block + plan.offsets[i], _block + old_offsets[i], length * descriptors[i].size);
            }
        }
        else
        {
            auto const error = relocate_to_fresh_block(plan, length);
            if (error != storage_error::none)
                return error;
        }

        _capacity = new_capacity;
        _offsets = plan.offsets;
        return storage_error::none;
    }

    void grow(isize old_capacity, isize new_capacity, isize length) { check_fatal(try_grow(old_capacity, new_capacity, length)); }

    /// Shrinks from old_capacity to new_capacity, keeping the first `length` elements of every field.
    /// Preconditions: the storage is allocated with old_capacity, 0 < new_capacity < old_capacity,
    /// 0 <= length <= new_capacity. Use deallocate to release the block entirely.
    [[nodiscard]] storage_error try_shrink(isize old_capacity, isize new_capacity, isize length)
    {
        SOA_ASSERT(_block != nullptr, "shrink requires allocated storage");
        SOA_ASSERT(old_capacity == _capacity, "old_capacity must be the current capacity");
        SOA_ASSERT(0 < new_capacity && new_capacity < old_capacity, "shrink requires a smaller, positive capacity");
        SOA_ASSERT(0 <= length && length <= new_capacity, "length out of range");

        layout_plan<field_count> plan;
        if (!soa::try_plan_layout(descriptors, new_capacity, plan))
            return storage_error::overflow;

        if constexpr (is_bitwise_relocatable)
        {
            auto const old_offsets = _offsets;

            // front to back while the block still has its old size:
            // field i lands on bytes of fields < i, which have already moved
            for (isize i = 0; i < field_count; ++i)
            {
                SOA_ASSERT(plan.offsets[i] <= old_offsets[i], "shrinking moved a column away from the block start");
                soa::memmove(_block + plan.offsets[i], _block + old_offsets[i], length * descriptors[i].size);
            }

            if (!try_resize_block(plan.total_size, plan.total_size))
            {
                // the block is unchanged, undo the column moves in grow order
                for (isize i = field_count - 1; i >= 0; --i)
                    soa::memmove(_block + old_offsets[i], _block + plan.offsets[i], length * descriptors[i].size);
                return storage_error::allocation_failure;
            }
        }
        else
        {
            auto const error = relocate_to_fresh_block(plan, length);
            if (error != storage_error::none)
                return error;
        }

        _capacity = new_capacity;
        _offsets = plan.offsets;
        return storage_error::none;
    }

    void shrink(isize old_capacity, isize new_capacity, isize length) { check_fatal(try_shrink(old_capacity, new_capacity, length)); }

    // element operations
public:
    /// Moves `count` elements of every field from index `src` to index `dst`. Ranges may overlap.
    /// Destination slots outside the source range must be dead, source slots outside the
    /// destination range are dead afterwards.
    void copy_within(isize src, isize dst, isize count)
    {
        SOA_ASSERT(_block != nullptr, "copy_within requires allocated storage");
        SOA_ASSERT(0 <= src && 0 <= dst && 0 <= count, "copy_within arguments must be non-negative");
        SOA_ASSERT(src + count <= _capacity && dst + count <= _capacity, "copy_within range exceeds the capacity");

        for_each_field(
            [&](auto field)
            {
                constexpr isize I = decltype(field)::value;
                impl::relocate_objects_overlapping(data<I>() + dst, data<I>() + src, count);
            });
    }

    /// Decomposes `record` and constructs each field in slot `index`.
    /// The slot must be dead: previous contents are overwritten without being destroyed.
    void write(isize index, Record record)
    {
        check_slot(index);
        write_impl(index, record, std::make_index_sequence<size_t(field_count)>());
    }

    /// Constructs each field of slot `index` from one argument per field.
    /// The slot must be dead.
    template <class... Args>
    void emplace(isize index, Args&&... fields)
    {
        static_assert(sizeof...(Args) == size_t(field_count), "one argument per field required");
        check_slot(index);
        emplace_impl(index, std::make_index_sequence<size_t(field_count)>(), soa::forward<Args>(fields)...);
    }

    /// Moves the fields of slot `index` out into a record and ends their lifetime.
    /// The slot must be alive and is dead afterwards.
    [[nodiscard]] Record read(isize index)
    {
        check_slot(index);
        return read_impl(index, std::make_index_sequence<size_t(field_count)>());
    }

    /// Destroys the fields of slots [start, end). The slots must be alive and are dead afterwards.
    void destroy(isize start, isize end)
    {
        SOA_ASSERT(0 <= start && start <= end && end <= _capacity, "destroy range out of bounds");

        for_each_field(
            [&](auto field)
            {
                constexpr isize I = decltype(field)::value;
                impl::destroy_objects_in_reverse(data<I>() + start, data<I>() + end);
            });
    }

    // views
public:
    /// Read-only view of slot `index`. The slot must be alive.
    [[nodiscard]] row_view<Record const> row(isize index) const
    {
        check_slot(index);
        return row_at<Record const>(index, std::make_index_sequence<size_t(field_count)>());
    }

    /// Mutable view of slot `index`. The slot must be alive.
    [[nodiscard]] row_view<Record> row_mut(isize index)
    {
        check_slot(index);
        return row_at<Record>(index, std::make_index_sequence<size_t(field_count)>());
    }

    /// Read-only per-field spans over [start, end). Bounds are checked in debug builds only.
    [[nodiscard]] slice_view<Record const> slice(isize start, isize end) const
    {
        check_range(start, end);
        return slice_at<Record const>(start, end, std::make_index_sequence<size_t(field_count)>());
    }

    /// Mutable per-field spans over [start, end). Bounds are checked in debug builds only.
    [[nodiscard]] slice_view<Record> slice_mut(isize start, isize end)
    {
        check_range(start, end);
        return slice_at<Record>(start, end, std::make_index_sequence<size_t(field_count)>());
    }

    // raw access
public:
    /// Base address of column I, aligned to the column alignment of field I.
    /// Dangling but non-null and aligned when the storage is empty.
    template <isize I>
    [[nodiscard]] field_t<I>* data()
    {
        static_assert(0 <= I && I < field_count, "field index out of range");
        if (_block == nullptr)
            return dangling<field_t<I>>(descriptors[I].column_alignment());
        return reinterpret_cast<field_t<I>*>(_block + _offsets[I]);
    }

    template <isize I>
    [[nodiscard]] field_t<I> const* data() const
    {
        static_assert(0 <= I && I < field_count, "field index out of range");
        if (_block == nullptr)
            return dangling<field_t<I> const>(descriptors[I].column_alignment());
        return reinterpret_cast<field_t<I> const*>(_block + _offsets[I]);
    }

    /// Start of the owned block, nullptr when empty.
    [[nodiscard]] byte* as_bytes() const { return _block; }

    // queries
public:
    [[nodiscard]] isize capacity() const { return _capacity; }
    [[nodiscard]] bool is_allocated() const { return _block != nullptr; }
    [[nodiscard]] isize block_bytes() const { return _block_bytes; }
    [[nodiscard]] offset_array const& offsets() const { return _offsets; }

    /// Memory resource used by this storage (never nullptr).
    [[nodiscard]] memory_resource const* resource() const { return resource_or_default(); }

    /// Custom resource this storage was seeded with, nullptr for the default.
    [[nodiscard]] memory_resource const* custom_resource() const { return _custom_resource; }

    /// Largest capacity this record can be planned for.
    [[nodiscard]] static isize max_capacity() { return soa::max_capacity_for(descriptors); }

    // helpers
private:
    template <class T>
    static T* dangling(isize column_alignment)
    {
        return reinterpret_cast<T*>(std::uintptr_t(column_alignment));
    }

    [[nodiscard]] memory_resource const* resource_or_default() const
    {
        return _custom_resource != nullptr ? _custom_resource : soa::default_memory_resource;
    }

    static void check_fatal(storage_error error)
    {
        SOA_ASSERT_ALWAYS(error != storage_error::overflow, "layout overflow: capacity too large for the record fields");
        SOA_ASSERT_ALWAYS(error != storage_error::allocation_failure, "allocation failed: memory resource refused the block");
    }

    void check_slot(isize index) const
    {
        SOA_ASSERT(_block != nullptr, "element access requires allocated storage");
        SOA_ASSERT(0 <= index && index < _capacity, "index out of bounds");
        SOA_UNUSED(index);
    }

    void check_range(isize start, isize end) const
    {
        SOA_ASSERT(0 <= start && start <= end && end <= _capacity, "slice range out of bounds");
        SOA_UNUSED(start);
        SOA_UNUSED(end);
    }

    void free_block()
    {
        if (_block != nullptr)
        {
            auto const* resource = resource_or_default();
            resource->deallocate_bytes(_block, _block_bytes, block_alignment, resource->userdata);
        }
        _block = nullptr;
        _block_bytes = 0;
        _capacity = 0;
        _offsets = {};
    }

    /// Resizes the block to new_bytes keeping its first keep_bytes bytes.
    /// Returns false (block unchanged) if the resource can provide neither an in-place resize nor a fresh block.
    bool try_resize_block(isize new_bytes, isize keep_bytes)
    {
        SOA_ASSERT(keep_bytes <= new_bytes && keep_bytes <= _block_bytes, "cannot keep more bytes than either block holds");

        auto const* resource = resource_or_default();
        auto const resized
            = resource->try_resize_bytes_in_place(_block, _block_bytes, new_bytes, new_bytes, block_alignment, resource->userdata);
        if (resized >= 0)
        {
            _block_bytes = resized;
            return true;
        }

        byte* fresh = nullptr;
        auto const allocated = resource->try_allocate_bytes(&fresh, new_bytes, new_bytes, block_alignment, resource->userdata);
        if (allocated < 0)
            return false;

        soa::memcpy(fresh, _block, keep_bytes);
        resource->deallocate_bytes(_block, _block_bytes, block_alignment, resource->userdata);
        _block = fresh;
        _block_bytes = allocated;
        return true;
    }

    /// Moves the first `length` elements of every column into a fresh block planned by `plan`.
    /// Used for records that cannot be relocated bitwise.
    storage_error relocate_to_fresh_block(layout_plan<field_count> const& plan, isize length)
    {
        auto const* resource = resource_or_default();
        byte* fresh = nullptr;
        auto const allocated = resource->try_allocate_bytes(&fresh, plan.total_size, plan.total_size, block_alignment, resource->userdata);
        if (allocated < 0)
            return storage_error::allocation_failure;

        for_each_field(
            [&](auto field)
            {
                constexpr isize I = decltype(field)::value;
                impl::relocate_objects_disjoint(reinterpret_cast<field_t<I>*>(fresh + plan.offsets[I]), data<I>(), length);
            });

        resource->deallocate_bytes(_block, _block_bytes, block_alignment, resource->userdata);
        _block = fresh;
        _block_bytes = allocated;
        return storage_error::none;
    }

    template <class F, size_t... I>
    static void for_each_field_impl(F& f, std::index_sequence<I...>)
    {
        (f(std::integral_constant<isize, isize(I)>()), ...);
    }

    template <class F>
    static void for_each_field(F&& f)
    {
        for_each_field_impl(f, std::make_index_sequence<size_t(field_count)>());
    }

    template <size_t... I>
    void write_impl(isize index, Record& record, std::index_sequence<I...>)
    {
        ((new (soa::placement_new, data<isize(I)>() + index) field_t<isize(I)>(soa::move(traits_t::template member<isize(I)>(record)))), ...);
    }

    template <size_t... I, class... Args>
    void emplace_impl(isize index, std::index_sequence<I...>, Args&&... fields)
    {
        ((new (soa::placement_new, data<isize(I)>() + index) field_t<isize(I)>(soa::forward<Args>(fields))), ...);
    }

    template <size_t... I>
    Record read_impl(isize index, std::index_sequence<I...>)
    {
        Record record = soa::make_record<Record>(soa::move(data<isize(I)>()[index])...);
        destroy(index, index + 1);
        return record;
    }

    template <class R, size_t... I>
    row_view<R> row_at(isize index, std::index_sequence<I...>) const
    {
        return row_view<R>(typename row_view<R>::pointer_tuple(const_cast<impl::const_like_t<R, field_t<isize(I)>>*>(data<isize(I)>()) + index...));
    }

    template <class R, size_t... I>
    slice_view<R> slice_at(isize start, isize end, std::index_sequence<I...>) const
    {
        using span_tuple = typename slice_view<R>::span_tuple;
        return slice_view<R>(
            span_tuple(span<impl::const_like_t<R, field_t<isize(I)>>>(const_cast<impl::const_like_t<R, field_t<isize(I)>>*>(data<isize(I)>()) + start, end - start)...),
            end - start);
    }

    // members
private:
    byte* _block = nullptr;
    isize _block_bytes = 0;
    isize _capacity = 0;
    offset_array _offsets = {};
    memory_resource const* _custom_resource = nullptr;
};

/// Zero-field records: there is nothing to store.
/// Every lifecycle operation is a no-op and the resource is never touched.
/// The owner tracks the length alone; the capacity is unbounded.
namespace soa
{
template <class Record>
    requires(field_count_of<Record> == 0)
struct raw_storage<Record>
{
    static_assert(!std::is_const_v<Record>, "raw_storage<Record const> is not supported");

    using record_t = Record;

    static constexpr isize field_count = 0;
    static constexpr bool is_bitwise_relocatable = true;

    struct raw_parts
    {
        byte* block = nullptr;
        isize block_bytes = 0;
        isize capacity = 0;
        memory_resource const* resource = nullptr;
    };

    raw_storage() = default;
    explicit raw_storage(memory_resource const* resource) : _custom_resource(resource) {}

    raw_storage(raw_storage&& rhs) noexcept : _custom_resource(rhs._custom_resource) {}
    raw_storage& operator=(raw_storage&& rhs) noexcept
    {
        _custom_resource = rhs._custom_resource;
        return *this;
    }
    raw_storage(raw_storage const&) = delete;
    raw_storage& operator=(raw_storage const&) = delete;

    [[nodiscard]] static raw_storage from_raw_parts(raw_parts parts)
    {
        SOA_ASSERT(parts.block == nullptr, "zero-field records own no block");
        return raw_storage(parts.resource);
    }

    [[nodiscard]] raw_parts release_raw_parts()
    {
        raw_parts parts;
        parts.resource = _custom_resource;
        return parts;
    }

    // allocation lifecycle
public:
    [[nodiscard]] storage_error try_allocate(isize capacity)
    {
        SOA_ASSERT(capacity > 0, "allocate requires a positive capacity");
        SOA_UNUSED(capacity);
        return storage_error::none;
    }
    void allocate(isize capacity) { (void)try_allocate(capacity); }

    void deallocate(isize capacity) { SOA_UNUSED(capacity); }

    [[nodiscard]] storage_error try_grow(isize old_capacity, isize new_capacity, isize length)
    {
        SOA_ASSERT(new_capacity > old_capacity, "grow requires a larger capacity");
        SOA_ASSERT(0 <= length && length <= old_capacity, "length out of range");
        SOA_UNUSED(old_capacity);
        SOA_UNUSED(new_capacity);
        SOA_UNUSED(length);
        return storage_error::none;
    }
    void grow(isize old_capacity, isize new_capacity, isize length) { (void)try_grow(old_capacity, new_capacity, length); }

    [[nodiscard]] storage_error try_shrink(isize old_capacity, isize new_capacity, isize length)
    {
        SOA_ASSERT(0 < new_capacity && new_capacity < old_capacity, "shrink requires a smaller, positive capacity");
        SOA_ASSERT(0 <= length && length <= new_capacity, "length out of range");
        SOA_UNUSED(old_capacity);
        SOA_UNUSED(new_capacity);
        SOA_UNUSED(length);
        return storage_error::none;
    }
    void shrink(isize old_capacity, isize new_capacity, isize length) { (void)try_shrink(old_capacity, new_capacity, length); }

    // element operations
public:
    void copy_within(isize src, isize dst, isize count)
    {
        SOA_ASSERT(0 <= src && 0 <= dst && 0 <= count, "copy_within arguments must be non-negative");
        SOA_UNUSED(src);
        SOA_UNUSED(dst);
        SOA_UNUSED(count);
    }

    /// The record carries no data; it is simply discarded.
    void write(isize index, Record record)
    {
        SOA_ASSERT(index >= 0, "index out of bounds");
        SOA_UNUSED(index);
        SOA_UNUSED(record);
    }

    void emplace(isize index) { write(index, Record{}); }

    /// Conjures a fresh record, no memory is read.
    [[nodiscard]] Record read(isize index)
    {
        SOA_ASSERT(index >= 0, "index out of bounds");
        SOA_UNUSED(index);
        return Record{};
    }

    void destroy(isize start, isize end)
    {
        SOA_ASSERT(0 <= start && start <= end, "destroy range out of bounds");
        SOA_UNUSED(start);
        SOA_UNUSED(end);
    }

    // views
public:
    [[nodiscard]] row_view<Record const> row(isize index) const
    {
        SOA_ASSERT(index >= 0, "index out of bounds");
        SOA_UNUSED(index);
        return {};
    }

    [[nodiscard]] row_view<Record> row_mut(isize index)
    {
        SOA_ASSERT(index >= 0, "index out of bounds");
        SOA_UNUSED(index);
        return {};
    }

    /// A view with the right row count and no columns.
    [[nodiscard]] slice_view<Record const> slice(isize start, isize end) const
    {
        SOA_ASSERT(0 <= start && start <= end, "slice range out of bounds");
        return slice_view<Record const>({}, end - start);
    }

    [[nodiscard]] slice_view<Record> slice_mut(isize start, isize end)
    {
        SOA_ASSERT(0 <= start && start <= end, "slice range out of bounds");
        return slice_view<Record>({}, end - start);
    }

    [[nodiscard]] byte* as_bytes() const { return nullptr; }

    // queries
public:
    [[nodiscard]] isize capacity() const { return std::numeric_limits<isize>::max(); }
    [[nodiscard]] bool is_allocated() const { return false; }
    [[nodiscard]] isize block_bytes() const { return 0; }

    [[nodiscard]] memory_resource const* resource() const
    {
        return _custom_resource != nullptr ? _custom_resource : soa::default_memory_resource;
    }
    [[nodiscard]] memory_resource const* custom_resource() const { return _custom_resource; }

    [[nodiscard]] static isize max_capacity() { return std::numeric_limits<isize>::max(); }

private:
    memory_resource const* _custom_resource = nullptr;
};
} // namespace soa
