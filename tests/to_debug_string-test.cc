#include <alt-finalize/to_debug_string.hh>

#include <nexus/test.hh>

#include <array>
#include <string>
#include <vector>

namespace
{
struct with_adl
{
    std::vector<int> data = {10, 20, 30};

    auto begin() const { return data.begin(); }
    auto end() const { return data.end(); }
};

std::string to_string(with_adl const&)
{
    return "adl_to_string";
}

struct with_member
{
    std::vector<int> data = {40, 50};

    std::string to_string() const { return "member_to_string"; }
    auto begin() const { return data.begin(); }
    auto end() const { return data.end(); }
};

struct raw_bytes
{
    af::u16 a = 0x0102;
    af::u16 b = 0x0304;
};
} // namespace

TEST("to_debug_string - strings and chars are quoted")
{
    CHECK(af::to_debug_string("abc") == "\"abc\"");
    CHECK(af::to_debug_string(std::string()) == "\"\"");
    CHECK(af::to_debug_string('x') == "'x'");
    CHECK(af::to_debug_string('\n') == "'\\x0A'");
}

TEST("to_debug_string - primitives")
{
    CHECK(af::to_debug_string(true) == "true");
    CHECK(af::to_debug_string(false) == "false");
    CHECK(af::to_debug_string(42) == "42");
    CHECK(af::to_debug_string(af::i64(-7)) == "-7");
    CHECK(af::to_debug_string(0.5) == "0.5");
}

TEST("to_debug_string - ADL to_string takes precedence over iteration")
{
    CHECK(af::to_debug_string(with_adl{}) == "adl_to_string");
}

TEST("to_debug_string - member to_string takes precedence over iteration")
{
    CHECK(af::to_debug_string(with_member{}) == "member_to_string");
}

TEST("to_debug_string - collections")
{
    CHECK(af::to_debug_string(std::vector<int>{}) == "[]");
    CHECK(af::to_debug_string(std::array<int, 3>{1, 2, 3}) == "[1, 2, 3]");
    CHECK(af::to_debug_string(std::vector<std::string>{"a", "b"}) == "[\"a\", \"b\"]");

    SECTION("long collections are cut off")
    {
        auto const values = std::vector<int>(1000, 7);
        auto const s = af::to_debug_string(values, {.max_length = 10});
        CHECK(s.ends_with(", ...]"));
        CHECK(af::isize(s.size()) < 30);
    }
}

TEST("to_debug_string - raw memory dump groups by alignment")
{
    auto const s = af::to_debug_string(raw_bytes{});

    // byte order depends on the platform, grouping does not
    CHECK(s.starts_with("0x"));
    CHECK(s.size() == 2 + 4 + 1 + 4);
    CHECK(s[6] == '_');
}
