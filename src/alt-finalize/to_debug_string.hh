#pragma once

#include <alt-finalize/fwd.hh>

#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

namespace af
{
struct debug_string_config
{
    // not strict, collections stop appending once this is exceeded
    isize max_length = 100;
};

// Converts a value to a developer-facing debug string.
// Best-effort, non-semantic, and intended only for diagnostics.
//
// Strategy (in order):
//   - String-likes: wrap in double quotes "..."
//   - char: wrap in single quotes '...', control chars as \xHH
//   - bool: true/false
//   - arithmetic types via std::format
//   - Use to_string(v) if found by ADL
//   - Use v.to_string() if available
//   - For collections, recursively format elements as [v0, v1, ...]
//   - Otherwise emit raw memory dump 0xAABB_CCDD (grouped by alignment)
//
// No stability or completeness guarantees.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

//
// Implementation
//

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        auto s = std::string("\"");
        s += std::string_view(v);
        s += '\"';
        return s;
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        if (v < 32 || v == 127)
            return std::format("'\\x{:02X}'", static_cast<unsigned char>(v));
        return std::format("'{}'", v);
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return v ? "true" : "false";
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        return std::format("{}", v);
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto s = std::string("[");
        for (auto&& e : v)
        {
            if (isize(s.size()) >= cfg.max_length)
            {
                s += ", ...";
                break;
            }

            if (s.size() > 1)
                s += ", ";
            s += af::to_debug_string(e, cfg);
        }
        s += "]";
        return s;
    }
    else
    {
        auto s = std::string("0x");
        auto const align = isize(alignof(T));
        auto const p_v = reinterpret_cast<unsigned char const*>(&v);
        for (isize i = 0; i < isize(sizeof(T)); ++i)
        {
            if (i > 0 && i % align == 0)
                s += "_";
            s += std::format("{:02X}", p_v[i]);
        }
        return s;
    }
}
} // namespace af
