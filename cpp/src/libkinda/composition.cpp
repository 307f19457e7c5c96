#include "libkinda/composition.hpp"

#include "libkinda/primitives.hpp"
#include "libkinda/runtime.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace libkinda {

namespace {

constexpr const char* kIshPatternName = "ish";

[[nodiscard]] CompositionFailure conversion_failure(const std::string& detail) {
    return CompositionFailure{FailureReason::ConversionFailure, detail};
}

[[nodiscard]] CompositionFailure internal_failure(const std::string& detail) {
    return CompositionFailure{FailureReason::InternalError, detail};
}

// Runs a composition step, turning argument and range errors into a typed failure.
template <typename T, typename Fn>
Composed<T> guarded(Fn&& fn) {
    try {
        return fn();
    } catch (const std::invalid_argument& e) {
        return internal_failure(e.what());
    } catch (const std::out_of_range& e) {
        return internal_failure(e.what());
    } catch (const std::domain_error& e) {
        return internal_failure(e.what());
    } catch (const std::range_error& e) {
        return internal_failure(e.what());
    }
}

[[nodiscard]] bool is_gate_tier(ConstructKind kind) noexcept {
    return kind == ConstructKind::Sometimes || kind == ConstructKind::Maybe ||
           kind == ConstructKind::Probably || kind == ConstructKind::Rarely;
}

}  // namespace

std::string to_string(PatternMode mode) {
    switch (mode) {
        case PatternMode::Comparison: return "comparison";
        case PatternMode::Assignment: return "assignment";
    }
    return "unknown";
}

std::string to_string(CompositionStrategy strategy) {
    switch (strategy) {
        case CompositionStrategy::Union: return "union";
        case CompositionStrategy::Intersection: return "intersection";
        case CompositionStrategy::Sequential: return "sequential";
        case CompositionStrategy::Weighted: return "weighted";
        case CompositionStrategy::Threshold: return "threshold";
    }
    return "unknown";
}

CompositionPattern::CompositionPattern(std::string name)
    : name_(std::move(name)) {
    if (name_.empty()) {
        throw std::invalid_argument("pattern name must be non-empty");
    }
}

ToleranceCompositionPattern::ToleranceCompositionPattern(std::string name, PatternMode mode)
    : CompositionPattern(std::move(name)), mode_(mode) {}

std::vector<ConstructKind> ToleranceCompositionPattern::components() const {
    if (mode_ == PatternMode::Comparison) {
        return {ConstructKind::FloatDrift, ConstructKind::ToleranceWidth, ConstructKind::Probably};
    }
    return {ConstructKind::FloatDrift, ConstructKind::ValueVariance, ConstructKind::Sometimes};
}

Composed<bool> ToleranceCompositionPattern::compare(Runtime& runtime,
                                                    const Value& left,
                                                    const Value& right,
                                                    std::optional<double> tolerance) {
    return tally(guarded<bool>([&]() -> Composed<bool> {
        if (mode_ != PatternMode::Comparison) {
            return internal_failure("pattern '" + name() + "' is not a comparison pattern");
        }
        auto l = to_number(left);
        auto r = to_number(right);
        if (!l || !r) {
            return conversion_failure("cannot compare '" + to_display_string(left) + "' with '" +
                                      to_display_string(right) + "'");
        }
        double tol = tolerance ? *tolerance : runtime.variance_for(ConstructKind::ToleranceWidth);
        if (!std::isfinite(tol) || tol < 0.0) {
            throw std::domain_error("tolerance must be a non-negative finite number");
        }
        double fuzzy_tolerance = std::abs(kinda_float(runtime, tol));
        double difference = kinda_float(runtime, std::abs(*l - *r));
        return probably(runtime, difference <= fuzzy_tolerance);
    }));
}

Composed<Value> ToleranceCompositionPattern::assign(Runtime& runtime,
                                                    const Value& current,
                                                    const std::optional<Value>& target) {
    return tally(guarded<Value>([&]() -> Composed<Value> {
        if (mode_ != PatternMode::Assignment) {
            return internal_failure("pattern '" + name() + "' is not an assignment pattern");
        }
        auto value = to_number(current);
        if (!value || std::holds_alternative<bool>(current)) {
            return conversion_failure("cannot adjust non-numeric value '" + to_display_string(current) + "'");
        }
        std::optional<double> goal;
        if (target) {
            goal = to_number(*target);
            if (!goal) {
                return conversion_failure("cannot move toward non-numeric target '" + to_display_string(*target) + "'");
            }
        }

        double result = *value;
        if (goal && sometimes(runtime)) {
            double blend = std::clamp(kinda_float(runtime, 0.5), 0.0, 1.0);
            double difference = kinda_float(runtime, *goal - *value);
            result += difference * blend;
        } else {
            double spread = std::abs(kinda_float(runtime, runtime.variance_for(ConstructKind::ValueVariance)));
            result += runtime.random().uniform(-spread, spread);
        }
        // An integer stays an integer only when the target is integral too.
        bool integral = is_integral(current) && (!target || is_integral(*target));
        return from_number(result, integral);
    }));
}

GateCompositionPattern::GateCompositionPattern(std::string name,
                                               CompositionStrategy strategy,
                                               std::vector<ConstructKind> gates,
                                               std::vector<double> weights,
                                               std::size_t threshold)
    : CompositionPattern(std::move(name)),
      strategy_(strategy),
      gates_(std::move(gates)),
      weights_(std::move(weights)),
      threshold_(threshold) {
    if (gates_.empty()) {
        throw std::invalid_argument("gate pattern requires at least one gate");
    }
    for (ConstructKind kind : gates_) {
        if (!is_gate_tier(kind)) {
            throw std::invalid_argument(to_string(kind) + " is not a gate tier");
        }
    }
    if (weights_.empty()) {
        weights_.assign(gates_.size(), 1.0);
    }
    if (weights_.size() != gates_.size()) {
        throw std::invalid_argument("gate weights size mismatch");
    }
    if (std::any_of(weights_.begin(), weights_.end(), [](double w) { return !(w >= 0.0); })) {
        throw std::invalid_argument("gate weights must be non-negative");
    }
    if (strategy_ == CompositionStrategy::Threshold && (threshold_ == 0 || threshold_ > gates_.size())) {
        throw std::invalid_argument("gate threshold must lie in [1, number of gates]");
    }
}

Composed<bool> GateCompositionPattern::evaluate(Runtime& runtime, bool condition) {
    return tally(guarded<bool>([&]() -> Composed<bool> {
        if (!condition) {
            return false;
        }
        switch (strategy_) {
            case CompositionStrategy::Union:
                return std::any_of(gates_.begin(), gates_.end(),
                                   [&](ConstructKind kind) { return gate(runtime, kind); });
            case CompositionStrategy::Intersection:
                return std::all_of(gates_.begin(), gates_.end(),
                                   [&](ConstructKind kind) { return gate(runtime, kind); });
            case CompositionStrategy::Sequential: {
                bool carried = condition;
                for (ConstructKind kind : gates_) {
                    carried = gate(runtime, kind, carried);
                }
                return carried;
            }
            case CompositionStrategy::Weighted: {
                double total = std::accumulate(weights_.begin(), weights_.end(), 0.0);
                if (!(total > 0.0)) {
                    return internal_failure("gate weights sum to zero");
                }
                double passed = 0.0;
                for (std::size_t i = 0; i < gates_.size(); ++i) {
                    if (gate(runtime, gates_[i])) {
                        passed += weights_[i];
                    }
                }
                return passed / total >= 0.5;
            }
            case CompositionStrategy::Threshold: {
                std::size_t passed = 0;
                for (ConstructKind kind : gates_) {
                    if (gate(runtime, kind)) {
                        ++passed;
                    }
                }
                return passed >= threshold_;
            }
        }
        return internal_failure("unknown composition strategy");
    }));
}

bool compose_comparison(Runtime& runtime,
                        ToleranceCompositionPattern& pattern,
                        const Value& left,
                        const Value& right,
                        std::optional<double> tolerance) {
    auto result = pattern.compare(runtime, left, right, tolerance);
    if (result.ok()) {
        runtime.events().record_success();
        return result.value();
    }
    runtime.report_failure(pattern.name(), result.failure());
    return ish_comparison(runtime, left, right, tolerance);
}

Value compose_assignment(Runtime& runtime,
                         ToleranceCompositionPattern& pattern,
                         const Value& current,
                         const std::optional<Value>& target) {
    auto result = pattern.assign(runtime, current, target);
    if (result.ok()) {
        runtime.events().record_success();
        return result.value();
    }
    runtime.report_failure(pattern.name(), result.failure());
    return ish_value(runtime, current, target);
}

bool compose_gate(Runtime& runtime, GateCompositionPattern& pattern, bool condition) {
    auto result = pattern.evaluate(runtime, condition);
    if (result.ok()) {
        runtime.events().record_success();
        return result.value();
    }
    runtime.report_failure(pattern.name(), result.failure());
    return sometimes(runtime, condition);
}

bool ish_comparison_composed(Runtime& runtime,
                             const Value& left,
                             const Value& right,
                             std::optional<double> tolerance) {
    auto& pattern = runtime.patterns().register_pattern(kIshPatternName, PatternMode::Comparison);
    return compose_comparison(runtime, pattern, left, right, tolerance);
}

Value ish_value_composed(Runtime& runtime, const Value& current, const std::optional<Value>& target) {
    auto& pattern = runtime.patterns().register_pattern(kIshPatternName, PatternMode::Assignment);
    return compose_assignment(runtime, pattern, current, target);
}

}  // namespace libkinda
