#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "libkinda/assertions.hpp"
#include "libkinda/errors.hpp"
#include "libkinda/primitives.hpp"
#include "libkinda/runtime.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace {

libkinda::RuntimeOptions seeded(std::uint64_t seed) {
    libkinda::RuntimeOptions opts;
    opts.seed = seed;
    opts.error_mode = libkinda::ErrorMode::Silent;
    return opts;
}

}  // namespace

TEST_CASE("welp_fallback returns the primary result when it succeeds", "[assertions]") {
    libkinda::Runtime rt(seeded(1));

    int value = libkinda::welp_fallback<int>(
        rt, [] { return 42; }, 0, [](int v) { return v < 0; });
    REQUIRE(value == 42);
    REQUIRE(rt.events().count(libkinda::ChaosEventKind::WelpFallback) == 0);

    libkinda::Value text = libkinda::welp_fallback(
        rt, [] { return libkinda::Value(std::string("ok")); }, libkinda::Value(std::string("fallback")));
    REQUIRE(std::get<std::string>(text) == "ok");
    REQUIRE(rt.events().total() == 0);
}

TEST_CASE("welp_fallback substitutes the fallback for failures and missing values", "[assertions]") {
    libkinda::Runtime rt(seeded(2));

    SECTION("A thrown exception") {
        int value = libkinda::welp_fallback<int>(
            rt, []() -> int { throw std::runtime_error("network down"); }, 7, [](int) { return false; });
        REQUIRE(value == 7);
        REQUIRE(rt.events().count(libkinda::ChaosEventKind::WelpFallback) == 1);
        REQUIRE(rt.events().count_for("welp") == 1);
        REQUIRE_THAT(rt.events().history().back().detail, Catch::Matchers::ContainsSubstring("network down"));
    }

    SECTION("None from the primary") {
        libkinda::Value value = libkinda::welp_fallback(
            rt, [] { return libkinda::Value{}; }, libkinda::Value(std::int64_t{3}));
        REQUIRE(std::get<std::int64_t>(value) == 3);
        REQUIRE(rt.events().count(libkinda::ChaosEventKind::WelpFallback) == 1);
        REQUIRE_THAT(rt.events().history().back().detail,
                     Catch::Matchers::ContainsSubstring("expression produced nothing"));
    }

    SECTION("A falsy result that is not None is kept") {
        libkinda::Value value = libkinda::welp_fallback(
            rt, [] { return libkinda::Value(std::int64_t{0}); }, libkinda::Value(std::int64_t{9}));
        REQUIRE(std::get<std::int64_t>(value) == 0);
        REQUIRE(rt.events().total() == 0);
    }

    SECTION("Strict mode reports the fallback as an error") {
        rt.events().set_mode(libkinda::ErrorMode::Strict);
        REQUIRE_THROWS_AS(libkinda::welp_fallback(
                              rt, [] { return libkinda::Value{}; }, libkinda::Value(std::int64_t{1})),
                          std::runtime_error);
    }
}

TEST_CASE("assert_eventually passes once the lower bound clears one half", "[assertions]") {
    libkinda::Runtime rt(seeded(3));
    libkinda::EventuallyOptions options;
    options.poll_interval_seconds = 0.0;

    int calls = 0;
    auto report = libkinda::assert_eventually(rt, [&] { ++calls; return true; }, options);
    // No bound is consulted before max(10, 3 / (1 - 0.95)) attempts.
    REQUIRE(report.attempts >= 59);
    REQUIRE(report.attempts <= 60);
    REQUIRE(report.successes == report.attempts);
    REQUIRE(static_cast<std::size_t>(calls) == report.attempts);
    REQUIRE(report.observed_rate == Catch::Approx(1.0));
    REQUIRE(report.lower_bound);
    REQUIRE(*report.lower_bound > 0.5);

    SECTION("A condition that mostly holds also passes") {
        int tick = 0;
        auto mostly = libkinda::assert_eventually(rt, [&] { return ++tick % 5 != 0; }, options);
        REQUIRE(mostly.observed_rate == Catch::Approx(0.8).margin(0.05));
    }
}

TEST_CASE("assert_eventually fails when the deadline passes first", "[assertions]") {
    libkinda::Runtime rt(seeded(4));
    libkinda::EventuallyOptions options;
    options.timeout_seconds = 0.05;
    options.poll_interval_seconds = 0.001;

    double before = rt.events().instability();
    REQUIRE_THROWS_AS(libkinda::assert_eventually(rt, [] { return false; }, options),
                      libkinda::StatisticalAssertionError);
    REQUIRE(rt.events().instability() > before);

    try {
        libkinda::assert_eventually(rt, [] { return false; }, options);
        FAIL("expected a StatisticalAssertionError");
    } catch (const libkinda::StatisticalAssertionError& e) {
        REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("assert_eventually failed"));
    }
}

TEST_CASE("Statistical assertions validate their options", "[assertions]") {
    libkinda::Runtime rt(seeded(5));
    auto always = [] { return true; };

    libkinda::EventuallyOptions no_time;
    no_time.timeout_seconds = 0.0;
    REQUIRE_THROWS_AS(libkinda::assert_eventually(rt, always, no_time), libkinda::InvalidConfiguration);

    libkinda::EventuallyOptions certain;
    certain.confidence = 1.0;
    REQUIRE_THROWS_AS(libkinda::assert_eventually(rt, always, certain), libkinda::InvalidConfiguration);

    libkinda::EventuallyOptions negative_poll;
    negative_poll.poll_interval_seconds = -0.1;
    REQUIRE_THROWS_AS(libkinda::assert_eventually(rt, always, negative_poll), libkinda::InvalidConfiguration);

    libkinda::ProbabilityOptions out_of_range;
    out_of_range.expected = 1.5;
    REQUIRE_THROWS_AS(libkinda::assert_probability(rt, always, out_of_range), libkinda::InvalidConfiguration);

    libkinda::ProbabilityOptions no_tolerance;
    no_tolerance.tolerance = 0.0;
    REQUIRE_THROWS_AS(libkinda::assert_probability(rt, always, no_tolerance), libkinda::InvalidConfiguration);

    libkinda::ProbabilityOptions no_samples;
    no_samples.samples = 0;
    REQUIRE_THROWS_AS(libkinda::assert_probability(rt, always, no_samples), libkinda::InvalidConfiguration);
}

TEST_CASE("assert_probability compares the observed rate with the expected one", "[assertions]") {
    libkinda::Runtime rt(seeded(6));
    auto coin = [&] { return libkinda::maybe(rt); };

    SECTION("The mood's maybe rate passes") {
        libkinda::ProbabilityOptions options;
        options.expected = rt.probability_for(libkinda::ConstructKind::Maybe);
        options.tolerance = 0.08;
        auto report = libkinda::assert_probability(rt, coin, options);
        REQUIRE(report.attempts == 1000);
        REQUIRE(report.observed_rate == Catch::Approx(options.expected).margin(0.08));
    }

    SECTION("A wrong expectation fails") {
        libkinda::ProbabilityOptions options;
        options.expected = 0.2;
        options.tolerance = 0.05;
        REQUIRE_THROWS_AS(libkinda::assert_probability(rt, coin, options), libkinda::StatisticalAssertionError);
    }

    SECTION("Sample counts are capped") {
        libkinda::ProbabilityOptions options;
        options.expected = 1.0;
        options.samples = 50000;
        auto report = libkinda::assert_probability(rt, [] { return true; }, options);
        REQUIRE(report.attempts == libkinda::kMaxAssertionSamples);
        REQUIRE(report.z_score == 0.0);
    }
}
