#include <catch2/catch_test_macros.hpp>

#include "libkinda/source_scanner.hpp"

#include <string_view>

using libkinda::CharClass;

TEST_CASE("classify_line separates code, strings and comments", "[source_scanner]") {
    std::string_view line = R"(x = "a ~ish # b" + y  # ~maybe)";
    auto mask = libkinda::classify_line(line);
    REQUIRE(mask.size() == line.size());

    REQUIRE(mask[0] == CharClass::Code);
    REQUIRE(mask[line.find('"')] == CharClass::String);
    REQUIRE(mask[line.find('~')] == CharClass::String);
    REQUIRE(mask[line.find('#')] == CharClass::String);
    REQUIRE(mask[line.find('y')] == CharClass::Code);
    REQUIRE(libkinda::comment_start(mask) == line.rfind('#'));
    REQUIRE(mask.back() == CharClass::Comment);
}

TEST_CASE("classify_line honours escapes and quote kinds", "[source_scanner]") {
    std::string_view line = R"(s = 'it\'s "fine"' ~ish t)";
    auto mask = libkinda::classify_line(line);
    REQUIRE(mask[line.find('"')] == CharClass::String);
    REQUIRE(mask[line.find('~')] == CharClass::Code);
}

TEST_CASE("Triple-quoted strings carry state across lines", "[source_scanner]") {
    libkinda::QuoteState state;
    auto first = libkinda::classify_line(R"(doc = """starts ~here)", state);
    REQUIRE(state.in_string());
    REQUIRE(state.triple);
    REQUIRE(first.back() == CharClass::String);

    std::string_view middle = "~kinda int x = 1  # not a comment";
    auto inside = libkinda::classify_line(middle, state);
    REQUIRE(state.in_string());
    for (auto c : inside) {
        REQUIRE(c == CharClass::String);
    }

    std::string_view last = R"(ends""" + x ~ish y)";
    auto closing = libkinda::classify_line(last, state);
    REQUIRE_FALSE(state.in_string());
    REQUIRE(closing[last.find('"') + 2] == CharClass::String);
    REQUIRE(closing[last.find('~')] == CharClass::Code);
}

TEST_CASE("Unterminated single-quoted strings end with the line", "[source_scanner]") {
    libkinda::QuoteState state;
    (void)libkinda::classify_line("x = 'oops", state);
    REQUIRE_FALSE(state.in_string());
    REQUIRE(state == libkinda::QuoteState{});
}

TEST_CASE("Bracket helpers skip brackets inside strings", "[source_scanner]") {
    std::string_view text = R"(f(a, ")", [b, {c: d}]) + g)";
    auto mask = libkinda::classify_line(text);

    REQUIRE(libkinda::matching_close(text, mask, 1) == text.find(" + g") - 1);
    REQUIRE(libkinda::matching_open(text, mask, text.find(" + g") - 1) == std::size_t{1});
    REQUIRE(libkinda::brackets_balanced(text, mask));
    REQUIRE(libkinda::net_bracket_depth(text, mask) == 0);
    REQUIRE(libkinda::depth_at(text, mask, text.find('c')) == 3);
    REQUIRE_FALSE(libkinda::matching_close(text, mask, 0).has_value());

    std::string_view open = "values = [1, (2";
    auto open_mask = libkinda::classify_line(open);
    REQUIRE(libkinda::net_bracket_depth(open, open_mask) == 2);
    REQUIRE_FALSE(libkinda::brackets_balanced(open, open_mask));
    REQUIRE_FALSE(libkinda::brackets_balanced("(]", libkinda::classify_line("(]")));
}

TEST_CASE("find_top_level ignores nested and quoted occurrences", "[source_scanner]") {
    std::string_view text = R"(d[{1: 2}] == ":" : body)";
    auto mask = libkinda::classify_line(text);
    REQUIRE(libkinda::find_top_level(text, mask, ':') == text.rfind(':'));

    std::string_view header = "x in index_of(items in bag) in seq";
    auto header_mask = libkinda::classify_line(header);
    REQUIRE(libkinda::find_top_level_word(header, header_mask, "in") == std::size_t{2});
    REQUIRE(libkinda::find_top_level_word(header, header_mask, "in", 3) == header.rfind(" in ") + 1);
    REQUIRE_FALSE(libkinda::find_top_level_word(header, header_mask, "bag").has_value());
}

TEST_CASE("has_comparison_or_logical spots operators and keywords", "[source_scanner]") {
    auto check = [](std::string_view text) {
        return libkinda::has_comparison_or_logical(text, libkinda::classify_line(text), 0, text.size());
    };
    REQUIRE(check("a == b"));
    REQUIRE(check("a != b"));
    REQUIRE(check("a <= b"));
    REQUIRE(check("a > b"));
    REQUIRE(check("x and y"));
    REQUIRE(check("not ready"));
    REQUIRE(check("k in keys"));
    REQUIRE_FALSE(check("a = b"));
    REQUIRE_FALSE(check("a << 2"));
    REQUIRE_FALSE(check("a >> 2"));
    REQUIRE_FALSE(check("android + island"));
    REQUIRE_FALSE(check("s = '<'"));
}

TEST_CASE("Identifier helpers", "[source_scanner]") {
    REQUIRE(libkinda::is_identifier("count_2"));
    REQUIRE_FALSE(libkinda::is_identifier("2count"));
    REQUIRE(libkinda::is_dotted_name("self.state.value"));
    REQUIRE_FALSE(libkinda::is_dotted_name("self..value"));
    REQUIRE_FALSE(libkinda::is_dotted_name("self.value."));
    REQUIRE(libkinda::identifier_end("abc def", 0) == 3);
    REQUIRE(libkinda::identifier_end("(abc", 0) == 0);

    REQUIRE(libkinda::trim("\t  x = 1  ") == "x = 1");
    REQUIRE(libkinda::trim("   ").empty());
    REQUIRE(libkinda::leading_whitespace("  \tfoo") == "  \t");
    REQUIRE(libkinda::contains_word("if x:", libkinda::classify_line("if x:"), "if"));
    REQUIRE_FALSE(libkinda::contains_word("iffy = 1", libkinda::classify_line("iffy = 1"), "if"));
}
