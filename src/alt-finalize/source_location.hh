#pragma once

#include <source_location>

namespace af
{
/// Source position (file, line, column, function) captured by the assertion macros
using source_location = std::source_location;
} // namespace af
