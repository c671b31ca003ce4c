#pragma once

// Lean header, safe to include from every other ring-core header.
#include <ring-core/macros.hh>
#include <ring-core/source_location.hh>

// =========================================================================================================
// RC_ASSERT - Runtime assertion with string literal message
//
// Guards preconditions and invariants of ring-core: logical index in range, physical slot inside the
// block, value() on an engaged optional, non-negative capacities, ...
// On failure the installed assertion handler (see <ring-core/assert-handler.hh>) receives the expression,
// the message and the source location. The default handler prints them to stderr.
// Afterwards a debugger break is raised (if one is attached) and the program aborts.
//
// When assertions are active:
//   RC_ASSERT_ENABLED is 1 in RC_DEBUG and RC_RELWITHDEBINFO builds.
//   In RC_RELEASE builds assertions are compiled out unless RC_ENABLE_ASSERT_IN_RELEASE is defined.
//   Compiled-out assertions do not evaluate their condition.
//
// Error handling in ring-core:
//   - Assertions      -> programmer errors (violated preconditions, corrupted bookkeeping)
//   - optional<T>     -> "nothing there" outcomes (pop/peek on an empty ring)
//   - result<T, E>    -> refused operations that hand data back (push on a full ring)
//   The library itself never throws; element constructors may.
//
// Usage:
//   RC_ASSERT(capacity >= 0, "capacity must be non-negative");
//   RC_ASSERT(0 <= i && i < size(), "logical index out of bounds");
//
#define RC_ASSERT(cond, msg) RC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// RC_ASSERT_ALWAYS - Always-active assertion
//
// Like RC_ASSERT but stays active in every build configuration.
// Used where continuing would corrupt memory regardless of build type, e.g. a failed allocation.
//
#define RC_ASSERT_ALWAYS(cond, msg) RC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// RC_DEBUG_BREAK - Break into an attached debugger, no-op otherwise
//
#define RC_DEBUG_BREAK() RC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// RC_BREAK_AND_ABORT - Debug break followed by program termination
//
#define RC_BREAK_AND_ABORT() (RC_DEBUG_BREAK(), ::rc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace rc::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler or prints to stderr
// Note: does not abort, caller must follow with RC_BREAK_AND_ABORT()
RC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, rc::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace rc::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef RC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define RC_IMPL_DEBUG_BREAK() (::rc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(RC_COMPILER_POSIX)

// raise(SIGTRAP) without pulling in <csignal> here, SIGTRAP is 5 on all supported platforms
extern "C" int raise(int) noexcept;
#define RC_IMPL_DEBUG_BREAK() (::rc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define RC_IMPL_DEBUG_BREAK() void(0)

#endif

#define RC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::rc::impl::handle_assert_failure(#cond, msg, ::rc::source_location::current()); \
            RC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if RC_ASSERT_ENABLED

#define RC_IMPL_ASSERT(cond, msg) RC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// still type-check condition and message so release-only breakage cannot sneak in
#define RC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        RC_UNUSED(cond);          \
        RC_UNUSED(msg);           \
    } while (false)

#endif
