#pragma once

// Lean header, safe to include from every lifetime primitive.
#include <alt-finalize/macros.hh>
#include <alt-finalize/source_location.hh>

// =========================================================================================================
// AF_ASSERT - Runtime assertion with string literal message
//
// Checks a precondition or invariant of the lifetime primitives, e.g. that a finalize_guard still owns
// its value before it is accessed or extracted.
// On failure the active assertion handler is called (see <alt-finalize/assert-handler.hh>), then the
// debugger is triggered if attached and the program aborts.
//
// Active when AF_ASSERT_ENABLED is 1, i.e. in AF_DEBUG and AF_RELWITHDEBINFO builds and in AF_RELEASE
// builds configured with AF_ENABLE_ASSERT_IN_RELEASE.
//
// Assertions guard against PROGRAMMER ERRORS only. They never report runtime conditions.
// Undefined behavior that cannot be checked cheaply (e.g. calling af::finalize_in_place twice on the
// same value) is not covered.
//
// Usage:
//   AF_ASSERT(_armed, "finalize_guard: value was already extracted");
//
#define AF_ASSERT(cond, msg) AF_IMPL_ASSERT(cond, msg)

// AF_ASSERT_ALWAYS - like AF_ASSERT but active in every build configuration
#define AF_ASSERT_ALWAYS(cond, msg) AF_IMPL_ASSERT_ALWAYS(cond, msg)

// AF_DEBUG_BREAK - break into the debugger if one is attached, otherwise no-op
#define AF_DEBUG_BREAK() AF_IMPL_DEBUG_BREAK()

// AF_BREAK_AND_ABORT - debugger break (if attached) followed by termination
#define AF_BREAK_AND_ABORT() (AF_DEBUG_BREAK(), ::af::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace af::impl
{
// Reports a failed assertion to the topmost handler
// Does not abort, the macro does that afterwards
AF_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, af::source_location location);

// Linux: /proc/self/status TracerPid, Windows: IsDebuggerPresent
bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace af::impl

// The break has to happen inside the macro so the debugger stops at the assertion site

#ifdef AF_COMPILER_MSVC

#define AF_IMPL_DEBUG_BREAK() (::af::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(AF_COMPILER_POSIX)

// SIGTRAP is 5, declared by hand to keep posix headers out of here
extern "C" int raise(int) noexcept;
#define AF_IMPL_DEBUG_BREAK() (::af::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define AF_IMPL_DEBUG_BREAK() void(0)

#endif

#define AF_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::af::impl::handle_assert_failure(#cond, msg, ::af::source_location::current()); \
            AF_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if AF_ASSERT_ENABLED

#define AF_IMPL_ASSERT(cond, msg) AF_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but cond and msg must still compile
#define AF_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        AF_UNUSED(cond);          \
        AF_UNUSED(msg);           \
    } while (false)

#endif
