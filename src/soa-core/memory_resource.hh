#pragma once

#include <soa-core/fwd.hh>
#include <soa-core/utility.hh>

// soa::memory_resource is the only way raw storage touches the heap.
//
// Every raw_storage<Record> owns exactly one byte block holding all field columns. The block is
// obtained from, resized through and returned to a memory resource. The resource pointer is stored
// in the storage, not as a template argument; a null resource means soa::default_memory_resource.
//
// The resource never moves a block on its own. "Resize" is either an in-place success or a
// reported failure, after which raw storage allocates a fresh block and copies what must survive.
// This keeps the overlap-safe relocation logic in one place (raw_storage) and lets custom
// resources (arenas, pools, tests) opt into in-place growth.

namespace soa
{
/// Default memory resource used when a storage carries no custom resource.
/// Stored in the data segment, so it is valid during static initialization.
extern soa::memory_resource const* const default_memory_resource;

/// Failure categories of the fallible (try_*) storage APIs.
/// The non-try APIs treat every non-none value as fatal.
enum class storage_error : u8
{
    /// success
    none = 0,

    /// the layout for the requested capacity is not representable in isize
    /// checked before any allocator call
    overflow,

    /// the memory resource refused to provide the requested block
    allocation_failure,
};

/// Human readable name of a storage_error, for diagnostics.
[[nodiscard]] char const* to_string(storage_error error);
} // namespace soa

/// Polymorphic memory resource interface powering soa::raw_storage.
/// POD struct of function pointers: no virtual dispatch, no non-trivial constructors.
struct soa::memory_resource
{
    /// Allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size, which will be in [min_bytes, max_bytes].
    /// The allocated pointer is stored in `*out_ptr`.
    /// min_bytes == 0 always sets *out_ptr to nullptr and returns 0.
    /// min_bytes > 0 always sets *out_ptr to non-null; failure is fatal.
    soa::function_ptr<isize(soa::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> allocate_bytes
        = nullptr;

    /// Like allocate_bytes, but returns -1 and sets *out_ptr to nullptr if the request cannot be served.
    soa::function_ptr<isize(soa::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> try_allocate_bytes
        = nullptr;

    /// Deallocate a block previously obtained from this resource.
    /// `bytes` must be the canonical size of the block (the last value returned by an allocate or resize call).
    /// `alignment` must match the value used during allocation.
    soa::function_ptr<void(soa::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// Attempt to resize an existing block in place without moving it.
    ///
    /// Preconditions:
    /// `p` was allocated from this resource with canonical size `old_bytes` and `alignment`.
    /// `1 <= min_bytes <= max_bytes`.
    ///
    /// Success (returns new_bytes in [min_bytes, max_bytes]):
    /// The block remains at `p`, the first min(old_bytes, new_bytes) bytes are preserved,
    /// and new_bytes becomes the canonical size.
    ///
    /// Failure (returns -1):
    /// The block remains valid and unchanged at `p` with size `old_bytes`.
    soa::function_ptr<isize(soa::byte* p, isize old_bytes, isize min_bytes, isize max_bytes, isize alignment, void* userdata)>
        try_resize_bytes_in_place = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};
