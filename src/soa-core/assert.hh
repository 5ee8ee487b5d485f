#pragma once

// Lean header with minimal dependencies, included by every engine header.
#include <soa-core/macros.hh>
#include <soa-core/source_location.hh>

// =========================================================================================================
// SOA_ASSERT - Runtime assertion with string literal message
//
// Protects preconditions and invariants of the storage engine:
//   - index / range bounds handed to raw storage and views
//   - capacity bookkeeping (grow with a larger capacity, deallocate with the current capacity)
//   - layout descriptor sanity (power-of-two alignment, size multiple of alignment)
//
// Active in SOA_DEBUG and SOA_RELWITHDEBINFO builds.
// Stripped in SOA_RELEASE builds unless SOA_ENABLE_ASSERT_IN_RELEASE is defined, so the
// per-element read/write/copy paths pay nothing in release.
//
// On failure the topmost assertion handler is invoked (see <soa-core/assert-handler.hh>),
// then the program breaks into an attached debugger and aborts.
//
// Error handling strategy:
//   - SOA_ASSERT        -> contract violations by the caller
//   - SOA_ASSERT_ALWAYS -> fatal resource conditions (allocation failure, layout overflow in non-try APIs)
//   - storage_error     -> expected failures reported by the try_* APIs
//
// Usage:
//   SOA_ASSERT(index < capacity, "index out of bounds");
//
#define SOA_ASSERT(cond, msg) SOA_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// SOA_ASSERT_ALWAYS - Always-active assertion
//
// Like SOA_ASSERT but remains active in all build configurations.
// Used where continuing would leave storage in an invalid state.
//
// Usage:
//   SOA_ASSERT_ALWAYS(block != nullptr, "allocation failed");
//
#define SOA_ASSERT_ALWAYS(cond, msg) SOA_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// SOA_BREAK_AND_ABORT - Debug break (if a debugger is attached) followed by program termination
//
#define SOA_BREAK_AND_ABORT() (SOA_IMPL_DEBUG_BREAK(), ::soa::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace soa::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (default: print to stderr)
// Note: does not abort, caller must follow with SOA_BREAK_AND_ABORT()
SOA_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, soa::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace soa::impl

#ifdef SOA_COMPILER_MSVC

#define SOA_IMPL_DEBUG_BREAK() (::soa::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(SOA_COMPILER_POSIX)

// SIGTRAP is 5 on all supported posix platforms
// declared here to avoid pulling in <csignal>
extern "C" int raise(int) noexcept;
#define SOA_IMPL_DEBUG_BREAK() (::soa::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define SOA_IMPL_DEBUG_BREAK() void(0)

#endif

#define SOA_IMPL_ASSERT_ALWAYS(cond, msg)                                                      \
    do                                                                                         \
    {                                                                                          \
        if (!(cond)) [[unlikely]]                                                              \
        {                                                                                      \
            ::soa::impl::handle_assert_failure(#cond, msg, ::soa::source_location::current()); \
            SOA_BREAK_AND_ABORT();                                                             \
        }                                                                                      \
    } while (false)

#if SOA_ASSERT_ENABLED

#define SOA_IMPL_ASSERT(cond, msg) SOA_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// the condition is not evaluated but must still compile
#define SOA_IMPL_ASSERT(cond, msg) \
    do                             \
    {                              \
        SOA_UNUSED(cond);          \
        SOA_UNUSED(msg);           \
    } while (false)

#endif
