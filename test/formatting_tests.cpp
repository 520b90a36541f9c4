#include <catch2/catch_all.hpp>

#include "mimic/formatting.hpp"

#include <string>
#include <utility>
#include <vector>

namespace {

    struct Member {
        std::string indent;
        std::string eol;
    };

    // Builds {"key0": "v", ...} with one member per line, the given indents
    // and line endings, and `open` after '{' / before '}'.
    std::string members_to_json(const std::vector<Member>& members, std::string_view open = "\n", std::string_view close = "\n") {
        std::string out = "{";
        out += open;
        for (size_t i = 0; i < members.size(); i++) {
            out += members[i].indent + "\"key" + std::to_string(i) + "\": \"v\"";
            if (i + 1 < members.size()) out += ',';
            out += members[i].eol;
        }
        out += close;
        out += '}';
        return out;
    }

} // namespace


TEST_CASE("Detects Regular Space Indent") {
    auto f = Mimic::detect_formatting(members_to_json({
        { "  ", "\n" },
        { "    ", "\n" },
        { "      ", "\n" },
        { "    ", "\n" },
        { "  ", "\n" },
    }));
    REQUIRE(f.indent_unit == "  ");
}

TEST_CASE("Detects Regular Tab Indent") {
    auto f = Mimic::detect_formatting(members_to_json({
        { "\t", "\n" },
        { "\t\t", "\n" },
        { "\t\t\t", "\n" },
        { "\t\t", "\n" },
        { "\t", "\n" },
    }));
    REQUIRE(f.indent_unit == "\t");
}

TEST_CASE("More Space Lines Than Tab Lines Selects Spaces") {
    auto f = Mimic::detect_formatting(members_to_json({
        { "  ", "\n" },
        { "    ", "\n" },
        { "\t", "\n" },
    }));
    REQUIRE(f.indent_unit == "  ");
}

TEST_CASE("More Tab Lines Than Space Lines Selects Tabs") {
    auto f = Mimic::detect_formatting(members_to_json({
        { "\t", "\n" },
        { "\t\t", "\n" },
        { "  ", "\n" },
    }));
    REQUIRE(f.indent_unit == "\t");
}

TEST_CASE("No Indented Lines Means No Unit") {
    auto f = Mimic::detect_formatting(members_to_json({
        { "", "\n" },
        { "", "\n" },
    }));
    REQUIRE_FALSE(f.indent_unit.has_value());
}

TEST_CASE("Equal Counts Select the First Unit Seen") {
    // Two-space and four-space units alternate, separated by unindented lines.
    auto f = Mimic::detect_formatting("[\n  1,\n2,\n    3,\n4,\n  5,\n6,\n    7\n]");
    REQUIRE(f.indent_unit == "  ");

    auto g = Mimic::detect_formatting("[\n    1,\n2,\n  3,\n4,\n    5,\n6,\n  7\n]");
    REQUIRE(g.indent_unit == "    ");
}

TEST_CASE("Repeated Runs Count Toward the Previous Unit") {
    auto f = Mimic::detect_formatting("{\n    \"a\": 1,\n    \"b\": 2,\n    \"c\": 3\n}");
    REQUIRE(f.indent_unit == "    ");
}

TEST_CASE("Dedent Contributes the Difference") {
    // 8 -> 2 spaces gives a 6-space candidate, still outnumbered by 2-space steps
    auto f = Mimic::detect_formatting("{\n  \"a\": {\n    \"b\": {\n      \"c\": {\n        \"d\": 1\n  }}}\n}");
    REQUIRE(f.indent_unit == "  ");
}

TEST_CASE("Empty Lines Do Not Reset the Previous Run") {
    // Each 6-space line after a blank line repeats the 3-space step instead
    // of contributing a 6-space candidate of its own.
    auto f = Mimic::detect_formatting("{\n   \"a\": [\n\n      1,\n\n      2,\n\n      3\n   ]\n}");
    REQUIRE(f.indent_unit == "   ");
}

TEST_CASE("Mixed Leading Whitespace is Ignored") {
    auto f = Mimic::detect_formatting("{\n \t\"a\": 1,\n\t \"b\": 2\n}");
    REQUIRE_FALSE(f.indent_unit.has_value());
}

TEST_CASE("Detects Line Endings") {
    SECTION("LF") {
        auto f = Mimic::detect_formatting(members_to_json({ { "  ", "\n" }, { "  ", "\n" }, { "  ", "\n" } }));
        REQUIRE_FALSE(f.use_crlf);
    }

    SECTION("CRLF") {
        auto f = Mimic::detect_formatting(members_to_json({ { "  ", "\r\n" }, { "  ", "\r\n" }, { "  ", "\r\n" } }, "\r\n", "\r\n"));
        REQUIRE(f.use_crlf);
        REQUIRE(f.indent_unit == "  ");
    }

    SECTION("Mixed with CRLF majority") {
        auto f = Mimic::detect_formatting(members_to_json({ { "  ", "\r\n" }, { "  ", "\n" }, { "  ", "\r\n" } }, "\r\n", "\r\n"));
        REQUIRE(f.use_crlf);
    }

    SECTION("Tie resolves to LF") {
        auto f = Mimic::detect_formatting("[\r\n1\n]");
        REQUIRE_FALSE(f.use_crlf);
    }
}

TEST_CASE("Detects Trailing Newline") {
    REQUIRE(Mimic::detect_formatting("{}\n").has_trailing_newline);
    REQUIRE(Mimic::detect_formatting("{}\r\n").has_trailing_newline);
    REQUIRE_FALSE(Mimic::detect_formatting("{}").has_trailing_newline);
    REQUIRE_FALSE(Mimic::detect_formatting("{}\n ").has_trailing_newline);
}

TEST_CASE("Single Line Text Yields Defaults") {
    auto f = Mimic::detect_formatting(R"({"a":[1,2,3]})");
    REQUIRE(f == Mimic::Formatting{});
    REQUIRE(Mimic::detect_formatting("") == Mimic::Formatting{});
}
