#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "libkinda/value.hpp"

#include <cstdint>
#include <limits>
#include <string>

TEST_CASE("to_number converts numeric values", "[value]") {
    REQUIRE(libkinda::to_number(libkinda::Value{std::int64_t{7}}).value() == 7.0);
    REQUIRE(libkinda::to_number(libkinda::Value{2.5}).value() == 2.5);
    REQUIRE(libkinda::to_number(libkinda::Value{true}).value() == 1.0);
    REQUIRE(libkinda::to_number(libkinda::Value{false}).value() == 0.0);
    REQUIRE(libkinda::to_number(libkinda::Value{std::string("  3.5 ")}).value() == Catch::Approx(3.5));
    REQUIRE(libkinda::to_number(libkinda::Value{std::string("-12")}).value() == -12.0);
}

TEST_CASE("to_number rejects values without a numeric reading", "[value]") {
    REQUIRE_FALSE(libkinda::to_number(libkinda::Value{}).has_value());
    REQUIRE_FALSE(libkinda::to_number(libkinda::Value{std::string("abc")}).has_value());
    REQUIRE_FALSE(libkinda::to_number(libkinda::Value{std::string("")}).has_value());
    REQUIRE_FALSE(libkinda::to_number(libkinda::Value{std::string("12abc")}).has_value());
    REQUIRE_FALSE(libkinda::to_number(libkinda::Value{std::string("1e999")}).has_value());
    REQUIRE_FALSE(libkinda::to_number(libkinda::Value{std::numeric_limits<double>::quiet_NaN()}).has_value());
    REQUIRE_FALSE(libkinda::to_number(libkinda::Value{std::numeric_limits<double>::infinity()}).has_value());
}

TEST_CASE("from_number keeps integral values integral", "[value]") {
    auto rounded = libkinda::from_number(2.6, true);
    REQUIRE(libkinda::is_integral(rounded));
    REQUIRE(std::get<std::int64_t>(rounded) == 3);

    auto real = libkinda::from_number(2.6, false);
    REQUIRE_FALSE(libkinda::is_integral(real));
    REQUIRE(std::get<double>(real) == 2.6);

    REQUIRE_FALSE(libkinda::is_integral(libkinda::Value{true}));
}

TEST_CASE("to_display_string prints values like the host language", "[value]") {
    REQUIRE(libkinda::to_display_string(libkinda::Value{}) == "None");
    REQUIRE(libkinda::to_display_string(libkinda::Value{true}) == "True");
    REQUIRE(libkinda::to_display_string(libkinda::Value{false}) == "False");
    REQUIRE(libkinda::to_display_string(libkinda::Value{std::int64_t{-4}}) == "-4");
    REQUIRE(libkinda::to_display_string(libkinda::Value{2.5}) == "2.5");
    REQUIRE(libkinda::to_display_string(libkinda::Value{std::string("hi")}) == "hi");
}
