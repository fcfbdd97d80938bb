#pragma once

// =========================================================================================================
// Platform
// =========================================================================================================
// OC_COMPILER_MSVC | OC_COMPILER_CLANG | OC_COMPILER_GCC, plus OC_COMPILER_POSIX for the latter two
// OC_OS_LINUX on Linux (only the debugger check in assert.cc is OS specific)

#if defined(_MSC_VER)
#define OC_COMPILER_MSVC
#elif defined(__clang__)
#define OC_COMPILER_CLANG
#define OC_COMPILER_POSIX
#elif defined(__GNUC__)
#define OC_COMPILER_GCC
#define OC_COMPILER_POSIX
#else
#error "ordered-core supports MSVC, clang and gcc"
#endif

#if defined(__linux__)
#define OC_OS_LINUX
#endif

// =========================================================================================================
// Build flavour
// =========================================================================================================
// Our CMake sets OC_DEBUG / OC_RELEASE / OC_RELWITHDEBINFO and OC_ASSERT_ENABLED.
// Other builds get assertions unless NDEBUG is defined.

#ifndef OC_ASSERT_ENABLED
#ifdef NDEBUG
#define OC_ASSERT_ENABLED 0
#else
#define OC_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Helpers
// =========================================================================================================

#ifdef OC_COMPILER_MSVC
#define OC_FORCE_INLINE __forceinline
#define OC_COLD_FUNC
#else
// gcc wants the extra inline
#define OC_FORCE_INLINE __attribute__((always_inline)) inline
// growth paths and failure reporting
#define OC_COLD_FUNC __attribute__((cold))
#endif

// OC_MACRO_JOIN(a, b) pastes a and b after expanding them, so OC_MACRO_JOIN(x_, __COUNTER__) gives x_17
#define OC_MACRO_JOIN(a, b) OC_IMPL_MACRO_JOIN(a, b)
#define OC_IMPL_MACRO_JOIN(a, b) a##b

// OC_UNUSED(expr) type-checks expr without evaluating it
#define OC_UNUSED(expr) (void)(sizeof((expr)))
