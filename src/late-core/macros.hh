#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: LC_COMPILER_MSVC, LC_COMPILER_CLANG, LC_COMPILER_GCC

#if defined(_MSC_VER)
#define LC_COMPILER_MSVC
#elif defined(__clang__)
#define LC_COMPILER_CLANG
#elif defined(__GNUC__)
#define LC_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

// =========================================================================================================
// Contract checks
// =========================================================================================================
// From CMake: LC_DEBUG, LC_RELEASE, LC_RELWITHDEBINFO, LC_ENABLE_ASSERT_IN_RELEASE

// LC_ASSERT_ENABLED - the single predicate that selects between checked and assumed contracts
// 1: contract violations are reported to the assertion handler and abort
// 0: contract violations are undefined behavior (LC_ASSERT is stripped, unreachable paths are assumed)
// Can be predefined to force either path regardless of build mode.
#ifndef LC_ASSERT_ENABLED
#if defined(LC_DEBUG) || defined(LC_RELWITHDEBINFO) || defined(LC_ENABLE_ASSERT_IN_RELEASE)
#define LC_ASSERT_ENABLED 1
#else
#define LC_ASSERT_ENABLED 0
#endif
#endif

// =========================================================================================================
// Hosting environment
// =========================================================================================================
// Conditionally defined: LC_OS_LINUX (hosted Linux, enables debugger detection)
// Bare-metal builds (-ffreestanding) never define it.

#if defined(__linux__) && defined(__STDC_HOSTED__) && __STDC_HOSTED__ == 1
#define LC_OS_LINUX
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// LC_FORCE_INLINE - Force function to be inlined
#define LC_FORCE_INLINE LC_IMPL_FORCE_INLINE

// LC_COLD_FUNC - Mark function as rarely executed (assertion reporting)
#define LC_COLD_FUNC LC_IMPL_COLD_FUNC

// LC_BUILTIN_UNREACHABLE - Mark code path as unreachable (UB if reached)
// Usage: default: LC_BUILTIN_UNREACHABLE;
#define LC_BUILTIN_UNREACHABLE LC_IMPL_BUILTIN_UNREACHABLE

// LC_UNUSED(expr) - Type-checks expr without evaluating it (sizeof is unevaluated context)
#define LC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(LC_COMPILER_MSVC)

#define LC_IMPL_FORCE_INLINE __forceinline
#define LC_IMPL_COLD_FUNC
#define LC_IMPL_BUILTIN_UNREACHABLE __assume(0)

#else

// additional 'inline' is required on gcc and makes no difference on clang
#define LC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define LC_IMPL_COLD_FUNC __attribute__((cold))
#define LC_IMPL_BUILTIN_UNREACHABLE __builtin_unreachable()

#endif
