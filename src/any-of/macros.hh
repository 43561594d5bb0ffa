#pragma once

// =========================================================================================================
// Platform
// =========================================================================================================
// Compiler, one of: AO_COMPILER_MSVC, AO_COMPILER_CLANG, AO_COMPILER_GCC
// AO_COMPILER_POSIX is additionally defined for clang and gcc (attribute syntax, raise()).
// Operating system, one of: AO_OS_WINDOWS, AO_OS_LINUX, AO_OS_APPLE, AO_OS_OTHER

#if defined(_MSC_VER)
#define AO_COMPILER_MSVC
#elif defined(__clang__)
#define AO_COMPILER_CLANG
#define AO_COMPILER_POSIX
#elif defined(__GNUC__)
#define AO_COMPILER_GCC
#define AO_COMPILER_POSIX
#else
#error "any-of supports MSVC, clang and gcc"
#endif

#if defined(_WIN32)
#define AO_OS_WINDOWS
#elif defined(__APPLE__)
#define AO_OS_APPLE
#elif defined(__linux__)
#define AO_OS_LINUX
#else
#define AO_OS_OTHER
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// CMake defines exactly one of AO_DEBUG, AO_RELWITHDEBINFO, AO_RELEASE.
// AO_ASSERT_ENABLED (0 or 1) controls AO_ASSERT only, extraction failures are always checked.
// Release builds drop AO_ASSERT unless AO_ENABLE_ASSERT_IN_RELEASE is set.

#ifndef AO_ASSERT_ENABLED
#if defined(AO_RELEASE) && !defined(AO_ENABLE_ASSERT_IN_RELEASE)
#define AO_ASSERT_ENABLED 0
#else
#define AO_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Attributes
// =========================================================================================================

// AO_FORCE_INLINE - for the tiny cast helpers in utility.hh (move, forward)
// AO_COLD_FUNC    - for the assertion failure path
#if defined(AO_COMPILER_MSVC)
#define AO_FORCE_INLINE __forceinline
#define AO_COLD_FUNC
#else
// gcc needs the extra 'inline', clang accepts it
#define AO_FORCE_INLINE __attribute__((always_inline)) inline
#define AO_COLD_FUNC __attribute__((cold))
#endif

// AO_UNUSED(expr) - type-checks expr without evaluating it
// Usage: AO_UNUSED(cond); (stripped AO_ASSERT)
#define AO_UNUSED(expr) (void)(sizeof((expr)))
