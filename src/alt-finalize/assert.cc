#include "assert.hh"

#include <alt-finalize/assert-handler.hh>
#include <alt-finalize/fwd.hh>
#include <alt-finalize/stacktrace.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>

#ifdef AF_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef AF_OS_LINUX
#include <cstring>
#endif

namespace
{
// NOTE: not thread-safe, see assert-handler.hh
std::vector<std::move_only_function<void(af::impl::assertion_info const&)>> g_assertion_handlers;

// the only diagnostic output of the library
void default_assert_handler(af::impl::assertion_info const& info)
{
    std::cerr << "[alt-finalize] assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";

    std::cerr << "\nStacktrace:\n";
    auto trace = af::stacktrace::current();
    std::cerr << std::to_string(trace) << '\n';
    std::cerr.flush();
}
} // namespace

void af::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void af::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

af::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

af::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

AF_COLD_FUNC void af::impl::handle_assert_failure(char const* expression, char const* message, af::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // abort happens in the macro
}

bool af::impl::is_debugger_connected() noexcept
{
#ifdef AF_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(AF_OS_LINUX)
    auto* f = std::fopen("/proc/self/status", "r");
    if (!f)
        return false;

    char buf[1024];
    af::i32 pid = 0;
    while (std::fgets(buf, sizeof(buf), f))
    {
        if (std::strncmp(buf, "TracerPid:", 10) == 0)
        {
            if (std::sscanf(buf + 10, "%d", &pid) != 1)
                pid = 0;
            break;
        }
    }
    std::fclose(f);
    return pid != 0;
#else
    return false;
#endif
}

[[noreturn]] void af::impl::perform_abort() noexcept
{
    std::abort();
}
