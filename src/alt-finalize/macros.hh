#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: AF_COMPILER_MSVC, AF_COMPILER_CLANG, AF_COMPILER_GCC, AF_COMPILER_POSIX

#if defined(_MSC_VER)
#define AF_COMPILER_MSVC
#elif defined(__clang__)
#define AF_COMPILER_CLANG
#elif defined(__GNUC__)
#define AF_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(AF_COMPILER_CLANG) || defined(AF_COMPILER_GCC)
#define AF_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: AF_OS_WINDOWS, AF_OS_LINUX, AF_OS_APPLE

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define AF_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define AF_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define AF_OS_LINUX
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: AF_DEBUG, AF_RELEASE, AF_RELWITHDEBINFO, optionally AF_ENABLE_ASSERT_IN_RELEASE
// Derived here: AF_ASSERT_ENABLED (0 or 1)

#ifndef AF_ASSERT_ENABLED
#if defined(AF_DEBUG) || defined(AF_RELWITHDEBINFO) || defined(AF_ENABLE_ASSERT_IN_RELEASE)
#define AF_ASSERT_ENABLED 1
#elif !defined(AF_RELEASE) && !defined(NDEBUG)
// no build mode from CMake (e.g. header used standalone): follow NDEBUG
#define AF_ASSERT_ENABLED 1
#else
#define AF_ASSERT_ENABLED 0
#endif
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// AF_FORCE_INLINE - Force function to be inlined
#define AF_FORCE_INLINE AF_IMPL_FORCE_INLINE

// AF_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
#define AF_COLD_FUNC AF_IMPL_COLD_FUNC

// AF_UNUSED(expr) - Suppress unused warnings, expr is not evaluated
#define AF_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(AF_COMPILER_MSVC)

#define AF_IMPL_FORCE_INLINE __forceinline
#define AF_IMPL_COLD_FUNC

#else

// additional 'inline' is required on gcc
#define AF_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define AF_IMPL_COLD_FUNC __attribute__((cold))

#endif
