#pragma once

// =========================================================================================================
// Toolchain and platform
// =========================================================================================================
// Exactly one of RC_COMPILER_MSVC, RC_COMPILER_CLANG, RC_COMPILER_GCC.
// RC_COMPILER_POSIX for the gcc-compatible front ends.
// At most one of RC_OS_WINDOWS, RC_OS_APPLE, RC_OS_LINUX, RC_OS_BSD (assert.cc and allocation.cc branch on it).

#if defined(_MSC_VER)
#define RC_COMPILER_MSVC
#elif defined(__clang__)
#define RC_COMPILER_CLANG
#define RC_COMPILER_POSIX
#elif defined(__GNUC__)
#define RC_COMPILER_GCC
#define RC_COMPILER_POSIX
#else
#error "ring-core supports MSVC, clang and gcc"
#endif

#if defined(_WIN32)
#define RC_OS_WINDOWS
#elif defined(__APPLE__)
#define RC_OS_APPLE
#elif defined(__linux__)
#define RC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define RC_OS_BSD
#endif

// =========================================================================================================
// Checked vs. unchecked builds
// =========================================================================================================
// CMake passes one of RC_DEBUG, RC_RELWITHDEBINFO, RC_RELEASE (see CMakeLists.txt) and optionally
// RC_ENABLE_ASSERT_IN_RELEASE.
//
// RC_ASSERT_ENABLED is always defined, to 0 or 1. With 1 (a "checked build") every RC_ASSERT is live,
// including the precondition checks of ring_layout::physical_unchecked and ringbuffer::operator[].
// With 0 those paths trust their callers.
// A translation unit compiled without any of the macros is checked.

#if !defined(RC_RELEASE) || defined(RC_ENABLE_ASSERT_IN_RELEASE)
#define RC_ASSERT_ENABLED 1
#else
#define RC_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Function attributes and helpers
// =========================================================================================================

// RC_FORCE_INLINE - hot index arithmetic (slot mapping, move/forward)
// RC_COLD_FUNC    - failure paths (assertion reporting)
#if defined(RC_COMPILER_MSVC)
#define RC_FORCE_INLINE __forceinline
#define RC_COLD_FUNC
#else
// gcc needs the extra 'inline' next to always_inline
#define RC_FORCE_INLINE __attribute__((always_inline)) inline
#define RC_COLD_FUNC __attribute__((cold))
#endif

// RC_UNUSED(expr) - marks expr as used without evaluating it (sizeof is unevaluated)
#define RC_UNUSED(expr) (void)(sizeof((expr)))
