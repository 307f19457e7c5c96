#include "libkinda/primitives.hpp"

#include "libkinda/runtime.hpp"

#include <cmath>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace libkinda {

namespace {

[[nodiscard]] double resolve_tolerance(Runtime& runtime, std::optional<double> tolerance) {
    double tol = tolerance ? *tolerance : runtime.variance_for(ConstructKind::ToleranceWidth);
    if (!std::isfinite(tol) || tol < 0.0) {
        throw std::invalid_argument("tolerance must be a non-negative finite number");
    }
    return tol;
}

// Adds the integer fuzz, saturating at the ends of the int64 range.
[[nodiscard]] std::int64_t fuzz_integer(Runtime& runtime, std::int64_t value) {
    auto range = static_cast<std::int64_t>(runtime.variance_for(ConstructKind::IntFuzz));
    std::int64_t delta = runtime.random().uniform_int(-range, range);
    if (delta > 0 && value > std::numeric_limits<std::int64_t>::max() - delta) {
        return std::numeric_limits<std::int64_t>::max();
    }
    if (delta < 0 && value < std::numeric_limits<std::int64_t>::min() - delta) {
        return std::numeric_limits<std::int64_t>::min();
    }
    return value + delta;
}

}  // namespace

bool gate(Runtime& runtime, ConstructKind tier, bool condition) {
    if (!condition) {
        return false;
    }
    return runtime.random().bernoulli(runtime.probability_for(tier));
}

bool sometimes(Runtime& runtime, bool condition) {
    return gate(runtime, ConstructKind::Sometimes, condition);
}

bool maybe(Runtime& runtime, bool condition) {
    return gate(runtime, ConstructKind::Maybe, condition);
}

bool probably(Runtime& runtime, bool condition) {
    return gate(runtime, ConstructKind::Probably, condition);
}

bool rarely(Runtime& runtime, bool condition) {
    return gate(runtime, ConstructKind::Rarely, condition);
}

std::int64_t kinda_int(Runtime& runtime, double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("kinda_int requires a finite value");
    }
    auto rounded = round_to_int64(value);
    if (!rounded) {
        throw std::out_of_range("kinda_int value is outside the 64-bit integer range");
    }
    return fuzz_integer(runtime, *rounded);
}

double kinda_float(Runtime& runtime, double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("kinda_float requires a finite value");
    }
    double drift = runtime.variance_for(ConstructKind::FloatDrift);
    return value + runtime.random().uniform(-drift, drift);
}

bool kinda_bool(Runtime& runtime, bool value) {
    if (runtime.random().bernoulli(runtime.variance_for(ConstructKind::BoolUncertainty))) {
        return !value;
    }
    return value;
}

int kinda_binary(Runtime& runtime) {
    auto weights = runtime.personality().binary_weights();
    switch (runtime.random().weighted_index({weights[0], weights[1], weights[2]})) {
        case 0: return 1;
        case 1: return -1;
        default: return 0;
    }
}

Value fuzzy_assign(Runtime& runtime, const std::string& name, const Value& value) {
    (void)name;
    if (const auto* b = std::get_if<bool>(&value)) {
        return kinda_bool(runtime, *b);
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return fuzz_integer(runtime, *i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d)) {
            return kinda_float(runtime, *d);
        }
    }
    return value;
}

bool sorta_print(Runtime& runtime, const std::vector<Value>& values, std::ostream& out) {
    if (!gate(runtime, ConstructKind::SortaPrint)) {
        return false;
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out << ' ';
        }
        out << to_display_string(values[i]);
    }
    out << '\n';
    return true;
}

bool ish_comparison(Runtime& runtime, const Value& left, const Value& right, std::optional<double> tolerance) {
    auto l = to_number(left);
    auto r = to_number(right);
    if (!l || !r) {
        return false;
    }
    double tol = resolve_tolerance(runtime, tolerance);
    return probably(runtime, std::abs(*l - *r) <= tol);
}

Value ish_value(Runtime& runtime, const Value& value, const std::optional<Value>& target) {
    auto current = to_number(value);
    if (!current || std::holds_alternative<bool>(value)) {
        return value;
    }
    double variance = runtime.variance_for(ConstructKind::ValueVariance);
    double result = *current;
    if (target) {
        if (auto t = to_number(*target)) {
            result += 0.5 * (*t - *current);
        }
    }
    result += runtime.random().uniform(-variance, variance);
    return from_number(result, is_integral(value));
}

void record_welp(Runtime& runtime, const std::string& reason) {
    runtime.record_event(ChaosEventKind::WelpFallback, "welp", reason);
}

void record_welp_success(Runtime& runtime) noexcept {
    runtime.events().record_success();
}

Value welp_fallback(Runtime& runtime, const std::function<Value()>& primary, Value fallback) {
    return welp_fallback<Value>(runtime, primary, std::move(fallback),
                                [](const Value& v) { return std::holds_alternative<std::monostate>(v); });
}

}  // namespace libkinda
