#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: SC_COMPILER_MSVC, SC_COMPILER_CLANG, SC_COMPILER_GCC, SC_COMPILER_MINGW, SC_COMPILER_POSIX

#if defined(_MSC_VER)
#define SC_COMPILER_MSVC
#elif defined(__clang__)
#define SC_COMPILER_CLANG
#elif defined(__GNUC__)
#define SC_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define SC_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(SC_COMPILER_CLANG) || defined(SC_COMPILER_GCC) || defined(SC_COMPILER_MINGW)
#define SC_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// Conditionally defined: SC_HAS_CPP_EXCEPTIONS
// From CMake: SC_DEBUG, SC_RELEASE, SC_RELWITHDEBINFO
// Derived: SC_ASSERT_ENABLED (0 or 1)

#ifdef SC_COMPILER_MSVC
#ifdef _CPPUNWIND
#define SC_HAS_CPP_EXCEPTIONS
#endif
#elif defined(SC_COMPILER_CLANG)
#if __EXCEPTIONS && __has_feature(cxx_exceptions)
#define SC_HAS_CPP_EXCEPTIONS
#endif
#elif defined(SC_COMPILER_GCC)
#if __EXCEPTIONS
#define SC_HAS_CPP_EXCEPTIONS
#endif
#endif

// SC_ASSERT is active in debug and relwithdebinfo builds
// release builds strip them unless SC_ENABLE_ASSERT_IN_RELEASE is defined
// the *_ALWAYS variants ignore this switch
#if defined(SC_RELEASE) && !defined(SC_ENABLE_ASSERT_IN_RELEASE)
#define SC_ASSERT_ENABLED 0
#else
#define SC_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: SC_OS_WINDOWS, SC_OS_LINUX, SC_OS_APPLE, SC_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define SC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define SC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define SC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define SC_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// SC_FORCE_INLINE - Force function to be inlined
#define SC_FORCE_INLINE SC_IMPL_FORCE_INLINE

// SC_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: SC_COLD_FUNC void handle_error() { ... }
#define SC_COLD_FUNC SC_IMPL_COLD_FUNC

// SC_BUILTIN_UNREACHABLE - Mark code path as unreachable (UB if reached)
// Usage: default: SC_BUILTIN_UNREACHABLE;
#define SC_BUILTIN_UNREACHABLE SC_IMPL_BUILTIN_UNREACHABLE

// SC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Usage: SC_UNUSED(result);
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define SC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(SC_COMPILER_MSVC)

#define SC_IMPL_FORCE_INLINE __forceinline
#define SC_IMPL_COLD_FUNC
#define SC_IMPL_BUILTIN_UNREACHABLE __assume(0)

#elif defined(SC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define SC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define SC_IMPL_COLD_FUNC __attribute__((cold))
#define SC_IMPL_BUILTIN_UNREACHABLE __builtin_unreachable()

#else
#error "Unknown compiler"
#endif
