#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "libkinda/construct_detector.hpp"
#include "libkinda/errors.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

using Catch::Matchers::ContainsSubstring;

namespace {

libkinda::StatementNode classify(std::string_view statement) {
    return libkinda::classify_statement(statement, libkinda::SourceLine{1, statement}, 0);
}

std::optional<libkinda::InlineNode> inline_marker(std::string_view text) {
    return libkinda::find_inline_marker(text, libkinda::classify_line(text), libkinda::SourceLine{1, text}, 0);
}

}  // namespace

TEST_CASE("Loop markers produce loop constructs", "[construct_detector]") {
    SECTION("sometimes_while strips outer parentheses") {
        auto node = classify("~sometimes_while (count < 10):");
        const auto& loop = std::get<libkinda::LoopConstruct>(node);
        REQUIRE(loop.kind == libkinda::LoopKind::SometimesWhile);
        REQUIRE(loop.expression == "count < 10");
        REQUIRE(loop.trailing.empty());
    }

    SECTION("maybe_for splits target and iterable") {
        auto node = classify("~maybe_for key, value in table.items():");
        const auto& loop = std::get<libkinda::LoopConstruct>(node);
        REQUIRE(loop.kind == libkinda::LoopKind::MaybeFor);
        REQUIRE(loop.target == "key, value");
        REQUIRE(loop.expression == "table.items()");
    }

    SECTION("kinda_repeat needs a parenthesized count") {
        auto node = classify("~kinda_repeat(n * 2): step()");
        const auto& loop = std::get<libkinda::LoopConstruct>(node);
        REQUIRE(loop.kind == libkinda::LoopKind::KindaRepeat);
        REQUIRE(loop.expression == "n * 2");
        REQUIRE(loop.trailing == " step()");
    }

    SECTION("eventually_until keeps colons inside brackets") {
        auto node = classify("~eventually_until lookup[{'k': 1}['k']]:");
        const auto& loop = std::get<libkinda::LoopConstruct>(node);
        REQUIRE(loop.kind == libkinda::LoopKind::EventuallyUntil);
        REQUIRE(loop.expression == "lookup[{'k': 1}['k']]");
    }
}

TEST_CASE("Gate markers produce conditional gates", "[construct_detector]") {
    auto leading = std::get<libkinda::ConditionalGate>(classify("~maybe ready:"));
    REQUIRE(leading.tier == libkinda::GateTier::Maybe);
    REQUIRE(leading.keyword == "if");
    REQUIRE(leading.condition == "ready");

    auto with_if = std::get<libkinda::ConditionalGate>(classify("if ~probably x > 1: go()"));
    REQUIRE(with_if.tier == libkinda::GateTier::Probably);
    REQUIRE(with_if.condition == "x > 1");
    REQUIRE(with_if.trailing == " go()");

    auto with_elif = std::get<libkinda::ConditionalGate>(classify("elif ~rarely flag:"));
    REQUIRE(with_elif.keyword == "elif");
    REQUIRE(with_elif.tier == libkinda::GateTier::Rarely);

    // Parenthesized gates inside an if are left to the inline rewrite.
    REQUIRE(std::holds_alternative<libkinda::PlainStatement>(classify("if ~sometimes(x) and y:")));
    REQUIRE(std::holds_alternative<libkinda::PlainStatement>(classify("~sometimes(x)")));
}

TEST_CASE("Declarations, reassignments and sorta print", "[construct_detector]") {
    auto decl = std::get<libkinda::FuzzyDeclaration>(classify("~kinda float ratio = 0.5 * scale"));
    REQUIRE(decl.type == libkinda::FuzzyType::Float);
    REQUIRE(decl.name == "ratio");
    REQUIRE(decl.expression == "0.5 * scale");

    auto binary = std::get<libkinda::FuzzyDeclaration>(classify("~kinda binary mood"));
    REQUIRE(binary.type == libkinda::FuzzyType::Binary);
    REQUIRE(binary.expression.empty());

    auto reassign = std::get<libkinda::FuzzyReassignment>(classify("self.count ~= self.count + 1"));
    REQUIRE(reassign.name == "self.count");
    REQUIRE(reassign.expression == "self.count + 1");

    auto print = std::get<libkinda::SortaPrint>(classify("~sorta print(\"score:\", score)"));
    REQUIRE(print.arguments == "\"score:\", score");
}

TEST_CASE("Tolerance assignments need a bare variable on the left", "[construct_detector]") {
    auto with_target = std::get<libkinda::ToleranceAssignment>(classify("value ~ish 20"));
    REQUIRE(with_target.variable == "value");
    REQUIRE(with_target.target == std::optional<std::string>("20"));

    auto bare = std::get<libkinda::ToleranceAssignment>(classify("value~ish"));
    REQUIRE_FALSE(bare.target.has_value());

    REQUIRE(std::holds_alternative<libkinda::PlainStatement>(classify("value ~ish 20 and ok")));
    REQUIRE(std::holds_alternative<libkinda::PlainStatement>(classify("total = value ~ish 20")));
}

TEST_CASE("resolve_tolerance_role follows the context cues", "[construct_detector]") {
    libkinda::RoleCues cues;
    REQUIRE(libkinda::resolve_tolerance_role(cues) == libkinda::ToleranceRole::Value);

    cues.bare_variable_lhs = true;
    REQUIRE(libkinda::resolve_tolerance_role(cues) == libkinda::ToleranceRole::Assignment);

    cues.has_right_operand = true;
    REQUIRE(libkinda::resolve_tolerance_role(cues) == libkinda::ToleranceRole::Assignment);

    cues.conditional_keyword = true;
    REQUIRE(libkinda::resolve_tolerance_role(cues) == libkinda::ToleranceRole::Comparison);

    cues = libkinda::RoleCues{};
    cues.has_right_operand = true;
    REQUIRE(libkinda::resolve_tolerance_role(cues) == libkinda::ToleranceRole::Comparison);

    cues.bare_variable_lhs = true;
    cues.nested = true;
    REQUIRE(libkinda::resolve_tolerance_role(cues) == libkinda::ToleranceRole::Comparison);
}

TEST_CASE("find_inline_marker returns the rightmost marker", "[construct_detector]") {
    auto node = inline_marker("if a ~ish b and ~maybe(c):");
    const auto& gate = std::get<libkinda::InlineGate>(*node);
    REQUIRE(gate.tier == libkinda::GateTier::Maybe);
    REQUIRE(gate.argument == "c");

    auto comparison = std::get<libkinda::ToleranceComparison>(*inline_marker("if a.b ~ish f(x, y):"));
    REQUIRE(comparison.left == "a.b");
    REQUIRE(comparison.right == "f(x, y)");
    REQUIRE(comparison.begin == 3);
    REQUIRE(comparison.end == std::string_view("if a.b ~ish f(x, y)").size());

    auto value = std::get<libkinda::ToleranceValue>(*inline_marker("total = -3~ish"));
    REQUIRE(value.operand == "-3");
    REQUIRE(value.begin == 8);

    auto nested = std::get<libkinda::ToleranceComparison>(*inline_marker("check(a ~ish b)"));
    REQUIRE(nested.left == "a");
    REQUIRE(nested.right == "b");

    auto bare_gate = std::get<libkinda::InlineGate>(*inline_marker("ok = ~sometimes and done"));
    REQUIRE(bare_gate.argument.empty());
}

TEST_CASE("welp spans the whole expression on each side", "[construct_detector]") {
    auto welp = std::get<libkinda::WelpFallback>(*inline_marker("x = a.b(c) + 1 ~welp 0"));
    REQUIRE(welp.primary == "a.b(c) + 1");
    REQUIRE(welp.fallback == "0");
    REQUIRE(welp.begin == 4);
    REQUIRE(welp.end == std::string_view("x = a.b(c) + 1 ~welp 0").size());

    auto in_call = std::get<libkinda::WelpFallback>(*inline_marker("f(x, y['k'] ~welp 'none', z)"));
    REQUIRE(in_call.primary == "y['k']");
    REQUIRE(in_call.fallback == "'none'");

    auto augmented = std::get<libkinda::WelpFallback>(*inline_marker("n += g() ~welp 1"));
    REQUIRE(augmented.primary == "g()");

    auto compared = std::get<libkinda::WelpFallback>(*inline_marker("if h() >= 2 ~welp False:"));
    REQUIRE(compared.primary == "h() >= 2");
    REQUIRE(compared.fallback == "False");
}

TEST_CASE("Statistical assertions keep their subject separate", "[construct_detector]") {
    auto eventually = std::get<libkinda::StatisticalAssertion>(classify("~assert_eventually(f(a, b) > 1, timeout=3)"));
    REQUIRE(eventually.kind == libkinda::AssertionKind::Eventually);
    REQUIRE(eventually.subject == "f(a, b) > 1");
    REQUIRE(eventually.arguments == "timeout=3");

    auto probability = std::get<libkinda::StatisticalAssertion>(classify("~assert_probability (coin())"));
    REQUIRE(probability.kind == libkinda::AssertionKind::Probability);
    REQUIRE(probability.subject == "coin()");
    REQUIRE(probability.arguments.empty());
    REQUIRE(libkinda::to_string(libkinda::AssertionKind::Probability) == "assert_probability");
}

TEST_CASE("find_inline_marker ignores strings, comments and bitwise not", "[construct_detector]") {
    REQUIRE_FALSE(inline_marker("print('~sometimes ~ish')").has_value());
    REQUIRE_FALSE(inline_marker("mask = ~flags").has_value());
    REQUIRE_FALSE(inline_marker("x = ~(a | b)").has_value());
    REQUIRE_FALSE(inline_marker("x = 1  # ~maybe").has_value());
}

TEST_CASE("Malformed markers raise TransformError with a position", "[construct_detector]") {
    SECTION("Missing block colon") {
        try {
            (void)classify("~sometimes_while x < 3");
            FAIL("expected TransformError");
        } catch (const libkinda::TransformError& e) {
            REQUIRE(e.line() == 1);
            REQUIRE(e.column() == 23);
            REQUIRE_THAT(e.reason(), ContainsSubstring("expected ':'"));
        }
    }

    SECTION("Misspelled marker suggests the closest word") {
        try {
            (void)inline_marker("x = ~probaly(y)");
            FAIL("expected TransformError");
        } catch (const libkinda::TransformError& e) {
            REQUIRE(e.column() == 5);
            REQUIRE(e.reason() == "unknown fuzzy marker '~probaly' (did you mean '~probably'?)");
        }
    }

    SECTION("Unknown fuzzy type") {
        REQUIRE_THROWS_AS(classify("~kinda string s = 'a'"), libkinda::TransformError);
        try {
            (void)classify("~kinda flaot f = 1.0");
            FAIL("expected TransformError");
        } catch (const libkinda::TransformError& e) {
            REQUIRE_THAT(e.reason(), ContainsSubstring("did you mean 'float'"));
            REQUIRE(e.column() == 8);
        }
    }

    SECTION("Other malformed statements") {
        REQUIRE_THROWS_AS(classify("~kinda int x"), libkinda::TransformError);
        REQUIRE_THROWS_AS(classify("~kinda binary b = 1"), libkinda::TransformError);
        REQUIRE_THROWS_AS(classify("~kinda_repeat 5:"), libkinda::TransformError);
        REQUIRE_THROWS_AS(classify("~maybe_for items:"), libkinda::TransformError);
        REQUIRE_THROWS_AS(classify("~sorta log(x)"), libkinda::TransformError);
        REQUIRE_THROWS_AS(classify("~sometimes x > 1"), libkinda::TransformError);
        REQUIRE_THROWS_AS(classify("x ~="), libkinda::TransformError);
        REQUIRE_THROWS_AS(inline_marker("y = 1 + ~kinda_repeat(3)"), libkinda::TransformError);
        REQUIRE_THROWS_AS(inline_marker("f(x ~= 2)"), libkinda::TransformError);
        REQUIRE_THROWS_AS(inline_marker("ok = ~maybe x"), libkinda::TransformError);
    }
}

TEST_CASE("marker_vocabulary lists every fuzzy word", "[construct_detector]") {
    const auto& words = libkinda::marker_vocabulary();
    REQUIRE(words.size() == 14);
    for (std::string_view expected : {"sometimes_while", "maybe_for", "kinda_repeat", "eventually_until", "sometimes",
                                      "maybe", "probably", "rarely", "kinda", "sorta", "ish", "welp",
                                      "assert_eventually", "assert_probability"}) {
        REQUIRE(std::find(words.begin(), words.end(), expected) != words.end());
    }
}
