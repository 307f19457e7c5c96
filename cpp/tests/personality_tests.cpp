#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "libkinda/errors.hpp"
#include "libkinda/personality.hpp"

#include <stdexcept>

TEST_CASE("parse_mood accepts every mood name", "[personality]") {
    for (const auto& name : libkinda::mood_names()) {
        REQUIRE(libkinda::to_string(libkinda::parse_mood(name)) == name);
    }
    REQUIRE(libkinda::mood_names().size() == libkinda::kMoodCount);
    REQUIRE_THROWS_AS(libkinda::parse_mood("grumpy"), libkinda::InvalidConfiguration);
    REQUIRE_THROWS_AS(libkinda::parse_mood("Playful"), libkinda::InvalidConfiguration);
}

TEST_CASE("chaos multiplier covers levels 1 through 10", "[personality]") {
    REQUIRE(libkinda::chaos_multiplier(1) == Catch::Approx(0.2));
    REQUIRE(libkinda::chaos_multiplier(4) == Catch::Approx(0.8));
    REQUIRE(libkinda::chaos_multiplier(5) == Catch::Approx(1.1));
    REQUIRE(libkinda::chaos_multiplier(10) == Catch::Approx(2.2));
    REQUIRE_THROWS_AS(libkinda::chaos_multiplier(0), libkinda::InvalidConfiguration);
    REQUIRE_THROWS_AS(libkinda::chaos_multiplier(11), libkinda::InvalidConfiguration);

    double previous = 0.0;
    for (int level = libkinda::kMinChaosLevel; level <= libkinda::kMaxChaosLevel; ++level) {
        REQUIRE(libkinda::chaos_multiplier(level) > previous);
        previous = libkinda::chaos_multiplier(level);
    }
}

TEST_CASE("PersonalityContext defaults to playful at chaos 5", "[personality]") {
    libkinda::PersonalityContext ctx;
    REQUIRE(ctx.active().mood == libkinda::Mood::Playful);
    REQUIRE(ctx.active().chaos_level == libkinda::kDefaultChaosLevel);
    REQUIRE(ctx.depth() == 1);
    REQUIRE(ctx.amplifier() == Catch::Approx(1.1));

    using libkinda::ConstructKind;
    REQUIRE(ctx.probability_for(ConstructKind::Sometimes) == Catch::Approx(0.5));
    REQUIRE(ctx.probability_for(ConstructKind::Maybe) == Catch::Approx(0.59));
    REQUIRE(ctx.probability_for(ConstructKind::Probably) == Catch::Approx(0.68));
    REQUIRE(ctx.probability_for(ConstructKind::Rarely) == Catch::Approx(0.185));
    REQUIRE(ctx.probability_for(ConstructKind::LoopContinuation) == Catch::Approx(0.59));
    REQUIRE(ctx.probability_for(ConstructKind::LoopPerItem) == Catch::Approx(0.68));
    REQUIRE(ctx.probability_for(ConstructKind::ConfidenceThreshold) == Catch::Approx(0.78));

    REQUIRE(ctx.variance_for(ConstructKind::ToleranceWidth) == Catch::Approx(2.2));
    REQUIRE(ctx.variance_for(ConstructKind::ValueVariance) == Catch::Approx(2.75));
    REQUIRE(ctx.variance_for(ConstructKind::FloatDrift) == Catch::Approx(0.55));
    REQUIRE(ctx.variance_for(ConstructKind::RepeatVariance) == Catch::Approx(0.33));
    REQUIRE(ctx.variance_for(ConstructKind::IntFuzz) == Catch::Approx(2.0));
    REQUIRE(ctx.variance_for(ConstructKind::BoolUncertainty) == Catch::Approx(0.11));
}

TEST_CASE("Low chaos pulls probabilities toward certainty", "[personality]") {
    libkinda::PersonalityContext ctx;
    ctx.set_context(libkinda::Mood::Reliable, 1);
    REQUIRE(ctx.amplifier() == Catch::Approx(0.04));

    using libkinda::ConstructKind;
    REQUIRE(ctx.probability_for(ConstructKind::Sometimes) == Catch::Approx(0.998));
    REQUIRE(ctx.probability_for(ConstructKind::ConfidenceThreshold) == Catch::Approx(0.99));
    REQUIRE(ctx.variance_for(ConstructKind::IntFuzz) == 0.0);
    REQUIRE(ctx.variance_for(ConstructKind::FloatDrift) == 0.0);
    REQUIRE(ctx.variance_for(ConstructKind::ToleranceWidth) == Catch::Approx(0.04));
}

TEST_CASE("Resolved values stay in range for every mood and level", "[personality]") {
    libkinda::PersonalityContext ctx;
    for (const auto& name : libkinda::mood_names()) {
        for (int level = libkinda::kMinChaosLevel; level <= libkinda::kMaxChaosLevel; ++level) {
            ctx.set_context(name, level);
            for (std::size_t k = 0; k < libkinda::kConstructKindCount; ++k) {
                auto kind = static_cast<libkinda::ConstructKind>(k);
                if (libkinda::is_probability_kind(kind)) {
                    double p = ctx.probability_for(kind);
                    REQUIRE(p >= 0.0);
                    REQUIRE(p <= 1.0);
                } else {
                    REQUIRE(ctx.variance_for(kind) >= 0.0);
                }
            }
            double threshold = ctx.probability_for(libkinda::ConstructKind::ConfidenceThreshold);
            REQUIRE(threshold >= 0.5);
            REQUIRE(threshold <= 0.99);
            REQUIRE(ctx.variance_for(libkinda::ConstructKind::RepeatVariance) <= 1.0);
            REQUIRE(ctx.variance_for(libkinda::ConstructKind::BoolUncertainty) <= 0.5);
        }
    }
}

TEST_CASE("PersonalityContext rejects invalid settings without changing state", "[personality]") {
    libkinda::PersonalityContext ctx;
    ctx.set_context(libkinda::Mood::Snarky, 7);

    REQUIRE_THROWS_AS(ctx.set_context(libkinda::Mood::Chaotic, 0), libkinda::InvalidConfiguration);
    REQUIRE_THROWS_AS(ctx.set_context("cheerful", 5), libkinda::InvalidConfiguration);
    REQUIRE(ctx.active().mood == libkinda::Mood::Snarky);
    REQUIRE(ctx.active().chaos_level == 7);

    REQUIRE_THROWS_AS(ctx.probability_for(libkinda::ConstructKind::FloatDrift), std::invalid_argument);
    REQUIRE_THROWS_AS(ctx.variance_for(libkinda::ConstructKind::Sometimes), std::invalid_argument);
    REQUIRE_THROWS_AS(ctx.pop(), std::out_of_range);
}

TEST_CASE("ScopedPersonality restores the previous context", "[personality]") {
    libkinda::PersonalityContext ctx;
    ctx.set_context(libkinda::Mood::Friendly, 3);
    const auto before = ctx.active();

    SECTION("Normal exit") {
        {
            libkinda::ScopedPersonality outer(ctx, libkinda::Mood::Chaotic, 9);
            REQUIRE(ctx.active().mood == libkinda::Mood::Chaotic);
            {
                libkinda::ScopedPersonality inner(ctx, libkinda::Mood::Reliable, 2);
                REQUIRE(ctx.depth() == 3);
                REQUIRE(ctx.active().mood == libkinda::Mood::Reliable);
            }
            REQUIRE(ctx.active().mood == libkinda::Mood::Chaotic);
            REQUIRE(ctx.active().chaos_level == 9);
        }
        REQUIRE(ctx.active() == before);
        REQUIRE(ctx.depth() == 1);
    }

    SECTION("Exit by exception") {
        try {
            libkinda::ScopedPersonality scope(ctx, libkinda::Mood::Chaotic, 9);
            REQUIRE(ctx.active().mood == libkinda::Mood::Chaotic);
            throw std::runtime_error("boom");
        } catch (const std::runtime_error&) {
        }
        REQUIRE(ctx.active() == before);
        REQUIRE(ctx.depth() == 1);
    }

    SECTION("Invalid scope never enters") {
        REQUIRE_THROWS_AS(libkinda::ScopedPersonality(ctx, libkinda::Mood::Chaotic, 42), libkinda::InvalidConfiguration);
        REQUIRE(ctx.active() == before);
        REQUIRE(ctx.depth() == 1);
    }
}

TEST_CASE("Pinned values bypass the mood table inside a scope", "[personality]") {
    libkinda::PersonalityContext ctx;
    {
        libkinda::ScopedPersonality scope(ctx, libkinda::Mood::Playful, 5);
        scope.pin(libkinda::ConstructKind::Sometimes, 1.0).pin(libkinda::ConstructKind::FloatDrift, 0.0);
        REQUIRE(ctx.probability_for(libkinda::ConstructKind::Sometimes) == 1.0);
        REQUIRE(ctx.variance_for(libkinda::ConstructKind::FloatDrift) == 0.0);
        REQUIRE(ctx.probability_for(libkinda::ConstructKind::Maybe) == Catch::Approx(0.59));
        REQUIRE(ctx.depth() == 2);

        REQUIRE_THROWS_AS(scope.pin(libkinda::ConstructKind::Maybe, 1.5), libkinda::InvalidConfiguration);
        REQUIRE_THROWS_AS(scope.pin(libkinda::ConstructKind::ToleranceWidth, -1.0), libkinda::InvalidConfiguration);
        REQUIRE(ctx.probability_for(libkinda::ConstructKind::Sometimes) == 1.0);
    }
    REQUIRE(ctx.depth() == 1);
    REQUIRE(ctx.active().overrides.empty());
    REQUIRE(ctx.probability_for(libkinda::ConstructKind::Sometimes) == Catch::Approx(0.5));
}

TEST_CASE("Pinning an outer scope while an inner one is open is rejected", "[personality]") {
    libkinda::PersonalityContext ctx;
    libkinda::ScopedPersonality outer(ctx, libkinda::Mood::Playful, 5);
    {
        libkinda::ScopedPersonality inner(ctx, libkinda::Mood::Chaotic, 9);
        inner.pin(libkinda::ConstructKind::Maybe, 0.25);

        REQUIRE_THROWS_AS(outer.pin(libkinda::ConstructKind::Sometimes, 1.0), std::logic_error);
        REQUIRE(ctx.depth() == 3);
        REQUIRE(ctx.active().mood == libkinda::Mood::Chaotic);
        REQUIRE(ctx.probability_for(libkinda::ConstructKind::Maybe) == 0.25);
    }
    outer.pin(libkinda::ConstructKind::Sometimes, 1.0);
    REQUIRE(ctx.depth() == 2);
    REQUIRE(ctx.probability_for(libkinda::ConstructKind::Sometimes) == 1.0);
}

TEST_CASE("Mood profiles carry cascade strength and binary weights", "[personality]") {
    const auto& chaotic = libkinda::mood_profile(libkinda::Mood::Chaotic);
    REQUIRE(chaotic.cascade_strength == Catch::Approx(0.5));
    REQUIRE(chaotic.binary_weights[1] > chaotic.binary_weights[0]);

    const auto& reliable = libkinda::mood_profile(libkinda::Mood::Reliable);
    REQUIRE(reliable.cascade_strength == 0.0);
    REQUIRE(reliable.binary_weights[0] == Catch::Approx(0.8));
    REQUIRE(reliable.value(libkinda::ConstructKind::Sometimes) == Catch::Approx(0.95));
}
