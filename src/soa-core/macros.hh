#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: SOA_COMPILER_MSVC, SOA_COMPILER_CLANG, SOA_COMPILER_GCC, SOA_COMPILER_POSIX

#if defined(_MSC_VER)
#define SOA_COMPILER_MSVC
#elif defined(__clang__)
#define SOA_COMPILER_CLANG
#elif defined(__GNUC__)
#define SOA_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(SOA_COMPILER_CLANG) || defined(SOA_COMPILER_GCC)
#define SOA_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: SOA_OS_WINDOWS, SOA_OS_LINUX, SOA_OS_APPLE, SOA_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define SOA_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define SOA_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define SOA_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define SOA_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: SOA_DEBUG, SOA_RELEASE, SOA_RELWITHDEBINFO
// Optional:   SOA_ENABLE_ASSERT_IN_RELEASE
//
// SOA_ASSERT_ENABLED is 1 in debug / relwithdebinfo builds (and builds without a mode),
// 0 in release builds unless asserts are explicitly re-enabled.

#if defined(SOA_RELEASE) && !defined(SOA_ENABLE_ASSERT_IN_RELEASE)
#define SOA_ASSERT_ENABLED 0
#else
#define SOA_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// SOA_FORCE_INLINE - Force function to be inlined
#define SOA_FORCE_INLINE SOA_IMPL_FORCE_INLINE

// SOA_COLD_FUNC - Mark function as rarely executed (error paths, reallocation, assertions)
// Usage: SOA_COLD_FUNC void handle_error() { ... }
#define SOA_COLD_FUNC SOA_IMPL_COLD_FUNC

// SOA_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define SOA_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(SOA_COMPILER_MSVC)

#define SOA_IMPL_FORCE_INLINE __forceinline
#define SOA_IMPL_COLD_FUNC

#elif defined(SOA_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define SOA_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define SOA_IMPL_COLD_FUNC __attribute__((cold))

#endif
