#pragma once

// Lean header with minimal dependencies: included by fixed_array.hh and everything built on it.
#include <array-kit/config.hh>
#include <array-kit/macros.hh>

#include <source_location>

namespace ak
{
/// Source code location (file, line, column, function) captured by assertions
using source_location = std::source_location;
} // namespace ak

// =========================================================================================================
// AK_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// When assertions are active:
//   AK_ASSERT_ENABLED is set by the build (see config.hh).
//   Debug and RelWithDebInfo builds check, Release builds strip the check
//   unless ARRAY_KIT_ENABLE_ASSERT_IN_RELEASE is set.
//
// What assertions are for:
//   Preconditions that the type system cannot express, e.g. a runtime index
//   passed to fixed_array::operator[]. Everything that CAN be expressed at
//   compile time (pop on an empty array, tuple arity, repeat of a non-duplicable
//   type, lengths outside the unrolled table) is a static_assert or a requires
//   clause instead, so it never reaches this macro.
//
// Error handling strategy:
//   - Compile-time rejection -> preconditions on lengths and element capabilities
//   - Assertions             -> programmer errors on runtime values
//   - There are no recoverable errors in array-kit
//
// Usage:
//   AK_ASSERT(0 <= i && i < N, "index out of bounds");
//
#define AK_ASSERT(cond, msg) AK_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// AK_ASSERT_ALWAYS - Always-active assertion
//
// Like AK_ASSERT but remains active in all build configurations, including release builds.
//
// Usage:
//   AK_ASSERT_ALWAYS(ptr != nullptr, "critical invariant violated");
//
#define AK_ASSERT_ALWAYS(cond, msg) AK_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// AK_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
// Executes inline so the debugger stops at the assertion site.
//
#define AK_DEBUG_BREAK() AK_IMPL_DEBUG_BREAK()

// =========================================================================================================
// AK_BREAK_AND_ABORT - Debug break followed by program termination
//
#define AK_BREAK_AND_ABORT() (AK_DEBUG_BREAK(), ::ak::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace ak::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (see assert-handler.hh) or prints to stderr
// Note: does not abort, caller must follow with AK_BREAK_AND_ABORT()
AK_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, ak::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace ak::impl

#ifdef AK_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define AK_IMPL_DEBUG_BREAK() (::ak::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(AK_COMPILER_POSIX)

// SIGTRAP (5) signals a breakpoint to an attached debugger
// NOTE: declared here to avoid pulling <csignal> into every header
extern "C" int raise(int) noexcept;
#define AK_IMPL_DEBUG_BREAK() (::ak::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define AK_IMPL_DEBUG_BREAK() void(0)

#endif

#define AK_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::ak::impl::handle_assert_failure(#cond, msg, ::ak::source_location::current()); \
            AK_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if AK_ASSERT_ENABLED

#define AK_IMPL_ASSERT(cond, msg) AK_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but cond and msg still have to compile
#define AK_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        AK_UNUSED(cond);          \
        AK_UNUSED(msg);           \
    } while (false)

#endif
