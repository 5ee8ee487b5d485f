#include "memory_resource.hh"

#include <soa-core/assert.hh>
#include <soa-core/macros.hh>

#include <cstdlib>

namespace
{
/// System memory resource functions.
/// The system allocator is stateless, userdata is ignored.

soa::byte* system_aligned_alloc(soa::isize bytes, soa::isize alignment)
{
#ifdef SOA_OS_WINDOWS
    return static_cast<soa::byte*>(_aligned_malloc(size_t(bytes), size_t(alignment)));
#else
    // posix_memalign avoids the bytes % alignment == 0 requirement of std::aligned_alloc
    // but requires alignment >= sizeof(void*)
    void* raw_ptr = nullptr;
    soa::isize const effective_alignment = alignment < soa::isize(sizeof(void*)) ? soa::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, size_t(effective_alignment), size_t(bytes));
    return result == 0 ? static_cast<soa::byte*>(raw_ptr) : nullptr;
#endif
}

soa::isize system_try_allocate_bytes(soa::byte** out_ptr, soa::isize min_bytes, soa::isize max_bytes, soa::isize alignment, void* userdata)
{
    SOA_UNUSED(userdata);
    SOA_UNUSED(max_bytes);

    SOA_ASSERT(out_ptr != nullptr, "out_ptr must not be null");
    SOA_ASSERT(alignment > 0 && soa::is_power_of_two(alignment), "alignment must be a power of 2");
    SOA_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

    // Contract: min_bytes == 0 always yields nullptr
    if (min_bytes == 0)
    {
        *out_ptr = nullptr;
        return 0;
    }

    // the system allocator has no size classes, we always serve exactly min_bytes
    *out_ptr = system_aligned_alloc(min_bytes, alignment);
    return *out_ptr != nullptr ? min_bytes : -1;
}

soa::isize system_allocate_bytes(soa::byte** out_ptr, soa::isize min_bytes, soa::isize max_bytes, soa::isize alignment, void* userdata)
{
    auto const bytes = system_try_allocate_bytes(out_ptr, min_bytes, max_bytes, alignment, userdata);
    SOA_ASSERT_ALWAYS(bytes >= 0, "allocation failed: system allocator refused the request");
    return bytes;
}

void system_deallocate_bytes(soa::byte* p, soa::isize bytes, soa::isize alignment, void* userdata)
{
    SOA_UNUSED(bytes);
    SOA_UNUSED(alignment);
    SOA_UNUSED(userdata);

    // size and alignment exist for resources that need them (pools, arenas)
    // the platform free functions do not
#ifdef SOA_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

soa::isize system_try_resize_bytes_in_place(soa::byte* p,
                                            soa::isize old_bytes,
                                            soa::isize min_bytes,
                                            soa::isize max_bytes,
                                            soa::isize alignment,
                                            void* userdata)
{
    SOA_UNUSED(userdata);
    SOA_UNUSED(p);
    SOA_UNUSED(old_bytes);
    SOA_UNUSED(alignment);

    SOA_ASSERT(1 <= min_bytes && min_bytes <= max_bytes, "must have 1 <= min_bytes <= max_bytes");

    // posix_memalign / _aligned_malloc blocks cannot be resized without moving
    // raw_storage falls back to a fresh block and copies the surviving bytes
    return -1;
}

constinit soa::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .try_allocate_bytes = system_try_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .try_resize_bytes_in_place = system_try_resize_bytes_in_place,
    .userdata = nullptr,
};

} // namespace

constinit soa::memory_resource const* const soa::default_memory_resource = &system_memory_resource;

char const* soa::to_string(storage_error error)
{
    switch (error)
    {
    case storage_error::none:
        return "none";
    case storage_error::overflow:
        return "overflow";
    case storage_error::allocation_failure:
        return "allocation_failure";
    }
    return "<invalid storage_error>";
}
