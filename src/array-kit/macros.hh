#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: AK_COMPILER_MSVC, AK_COMPILER_CLANG, AK_COMPILER_GCC, AK_COMPILER_POSIX

#if defined(_MSC_VER)
#define AK_COMPILER_MSVC
#elif defined(__clang__)
#define AK_COMPILER_CLANG
#elif defined(__GNUC__)
#define AK_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(AK_COMPILER_CLANG) || defined(AK_COMPILER_GCC)
#define AK_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: AK_OS_WINDOWS, AK_OS_LINUX, AK_OS_APPLE, AK_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define AK_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define AK_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define AK_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define AK_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// AK_FORCE_INLINE - Force function to be inlined
// Used for ak::move / ak::forward, which must not leave a call in debug builds
#define AK_FORCE_INLINE AK_IMPL_FORCE_INLINE

// AK_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
#define AK_COLD_FUNC AK_IMPL_COLD_FUNC

// AK_MACRO_JOIN(a, b) - Concatenate two tokens at preprocessing time
// Usage: AK_MACRO_JOIN(AK_IMPL_SEQ_, 3) -> AK_IMPL_SEQ_3
// Note: Indirection ensures arguments are expanded before concatenation
#define AK_MACRO_JOIN(arg1, arg2) AK_IMPL_MACRO_JOIN(arg1, arg2)

// AK_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define AK_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(AK_COMPILER_MSVC)

#define AK_IMPL_FORCE_INLINE __forceinline
#define AK_IMPL_COLD_FUNC

#elif defined(AK_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define AK_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define AK_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif

#define AK_IMPL_MACRO_JOIN(arg1, arg2) arg1##arg2
