#pragma once

// included by every variant header, keep it free of heavy includes
#include <any-of/macros.hh>

#include <source_location>

namespace ao
{
/// Type alias for std::source_location
/// Usage:
///   void log(ao::source_location loc = ao::source_location::current());
using source_location = std::source_location;
} // namespace ao

// =========================================================================================================
// Assertion macros
// =========================================================================================================
//
// All three report through the handler stack in assert-handler.hh:
//
//   AO_ASSERT(cond, msg)          internal invariants (e.g. value() on an empty optional)
//                                 compiled out when AO_ASSERT_ENABLED is 0 (see macros.hh),
//                                 the condition is still type-checked
//   AO_ASSERT_ALWAYS(cond, msg)   caller preconditions of the fatal extractions
//                                 (unwrap_*, expect_*, into_both, into_either, from_opt2),
//                                 active in every build configuration
//   AO_PANIC(msg)                 unconditional failure, reported with expression "panic"
//                                 msg may be a runtime string (expect_left forwards the caller's message)
//
// After the handler returns, an attached debugger is broken into and the process aborts.
// Every fatal extraction has a *_or / *_or_else sibling that never reaches these macros.
//
// Usage:
//   AO_ASSERT(_ptr != nullptr, "attempted to access value of empty optional");
//   AO_ASSERT_ALWAYS(is_both(), "into_both called on a value that is not both");
//   return ao::move(v).left_or_else([msg]() -> L { AO_PANIC(msg); });
//
#define AO_ASSERT(cond, msg) AO_IMPL_ASSERT(cond, msg)
#define AO_ASSERT_ALWAYS(cond, msg) AO_IMPL_ASSERT_ALWAYS(cond, msg)
#define AO_PANIC(msg) AO_IMPL_PANIC(msg)

// breaks only if a debugger is attached
#define AO_DEBUG_BREAK() AO_IMPL_DEBUG_BREAK()

#define AO_BREAK_AND_ABORT() (AO_DEBUG_BREAK(), ::ao::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace ao::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler or prints diagnostic information to stderr
// Note: does not abort, caller must follow with AO_BREAK_AND_ABORT()
AO_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, ao::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace ao::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef AO_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define AO_IMPL_DEBUG_BREAK() (::ao::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(AO_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define AO_IMPL_DEBUG_BREAK() (::ao::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define AO_IMPL_DEBUG_BREAK() void(0)

#endif

#define AO_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::ao::impl::handle_assert_failure(#cond, msg, ::ao::source_location::current()); \
            AO_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#define AO_IMPL_PANIC(msg)                                                              \
    do                                                                                  \
    {                                                                                   \
        ::ao::impl::handle_assert_failure("panic", msg, ::ao::source_location::current()); \
        AO_BREAK_AND_ABORT();                                                           \
    } while (false)

#if AO_ASSERT_ENABLED

#define AO_IMPL_ASSERT(cond, msg) AO_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// Stripped assertions still type-check condition and message
#define AO_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        AO_UNUSED(cond);          \
        AO_UNUSED(msg);           \
    } while (false)

#endif
