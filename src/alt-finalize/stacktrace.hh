#pragma once

#include <stacktrace>

namespace af
{
/// Snapshot of the call stack, printed by the default assertion handler
/// Usage:
///   auto trace = af::stacktrace::current();
///   std::cerr << std::to_string(trace) << '\n';
using stacktrace = std::stacktrace;

using stacktrace_entry = std::stacktrace_entry;
} // namespace af
