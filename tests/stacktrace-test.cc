#include <alt-finalize/fwd.hh>
#include <alt-finalize/macros.hh>
#include <alt-finalize/stacktrace.hh>

#include <nexus/test.hh>

#include <string>
#include <type_traits>

static_assert(std::is_same_v<af::stacktrace, std::stacktrace>);
static_assert(std::is_same_v<af::stacktrace_entry, std::stacktrace_entry>);

TEST("stacktrace - current captures a printable trace")
{
    auto const trace = af::stacktrace::current();

    af::isize entries = 0;
    for (auto const& entry : trace)
    {
        AF_UNUSED(entry);
        ++entries;
    }
    CHECK(entries == af::isize(trace.size()));

    // same rendering the default assertion handler uses
    auto const text = std::to_string(trace);
    CHECK(trace.empty() || !text.empty());
}
