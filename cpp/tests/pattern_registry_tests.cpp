#include <catch2/catch_test_macros.hpp>

#include "libkinda/pattern_registry.hpp"
#include "libkinda/runtime.hpp"

#include <stdexcept>
#include <string>
#include <vector>

TEST_CASE("PatternRegistry registers patterns once", "[pattern_registry]") {
    libkinda::PatternRegistry registry;
    auto& first = registry.register_pattern("ish", libkinda::PatternMode::Comparison);
    auto& again = registry.register_pattern("ish", libkinda::PatternMode::Comparison);
    auto& assign = registry.register_pattern("ish", libkinda::PatternMode::Assignment);

    REQUIRE(&first == &again);
    REQUIRE(&first != &assign);
    REQUIRE(assign.mode() == libkinda::PatternMode::Assignment);
    REQUIRE(registry.size() == 2);
    REQUIRE(registry.contains("ish", libkinda::PatternMode::Comparison));
    REQUIRE_FALSE(registry.contains("close", libkinda::PatternMode::Comparison));
    REQUIRE(registry.find("ish", libkinda::PatternMode::Assignment) == &assign);
    REQUIRE(registry.find("close", libkinda::PatternMode::Assignment) == nullptr);

    REQUIRE(registry.names() == std::vector<std::string>{"ish:comparison", "ish:assignment"});
    REQUIRE_THROWS_AS(registry.register_pattern("", libkinda::PatternMode::Comparison), std::invalid_argument);
}

TEST_CASE("PatternRegistry keeps gate patterns by name", "[pattern_registry]") {
    libkinda::PatternRegistry registry;
    using libkinda::ConstructKind;

    auto& either = registry.register_gate_pattern("either", libkinda::CompositionStrategy::Union,
                                                  {ConstructKind::Sometimes, ConstructKind::Maybe});
    auto& same = registry.register_gate_pattern("either", libkinda::CompositionStrategy::Intersection,
                                                {ConstructKind::Rarely});
    REQUIRE(&either == &same);
    REQUIRE(same.strategy() == libkinda::CompositionStrategy::Union);
    REQUIRE(registry.find_gate("either") == &either);
    REQUIRE(registry.find_gate("neither") == nullptr);
    REQUIRE(registry.size() == 1);

    REQUIRE_THROWS_AS(registry.register_gate_pattern("bad", libkinda::CompositionStrategy::Union, {}),
                      std::invalid_argument);
    REQUIRE(registry.find_gate("bad") == nullptr);

    registry.clear();
    REQUIRE(registry.size() == 0);
    REQUIRE(registry.names().empty());
}

TEST_CASE("Runtime registers the ish patterns on first use", "[pattern_registry]") {
    libkinda::RuntimeOptions opts;
    opts.seed = 31;
    opts.error_mode = libkinda::ErrorMode::Silent;
    libkinda::Runtime rt(opts);
    REQUIRE(rt.patterns().size() == 0);

    (void)libkinda::ish_comparison_composed(rt, libkinda::Value{1.0}, libkinda::Value{1.5});
    (void)libkinda::ish_comparison_composed(rt, libkinda::Value{2.0}, libkinda::Value{2.5});
    REQUIRE(rt.patterns().size() == 1);

    auto* pattern = rt.patterns().find("ish", libkinda::PatternMode::Comparison);
    REQUIRE(pattern != nullptr);
    REQUIRE(pattern->evaluations() == 2);

    (void)libkinda::ish_value_composed(rt, libkinda::Value{3.0});
    REQUIRE(rt.patterns().size() == 2);
}
