#include "libkinda/composition_validation.hpp"

#include "libkinda/composition.hpp"
#include "libkinda/primitives.hpp"
#include "libkinda/runtime.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace libkinda {

CompositionValidator::CompositionValidator(Runtime& runtime, ValidationOptions options)
    : runtime_(runtime), options_(options) {
    if (options_.trials == 0) {
        throw std::invalid_argument("validation requires at least one trial");
    }
    if (!(options_.max_rate_difference >= 0.0)) {
        throw std::invalid_argument("max_rate_difference must be non-negative");
    }
}

EquivalenceReport CompositionValidator::compare_tolerance(const Value& left,
                                                          const Value& right,
                                                          std::optional<double> tolerance) {
    EquivalenceReport report;
    report.trials = options_.trials;
    for (std::size_t i = 0; i < options_.trials; ++i) {
        if (ish_comparison_composed(runtime_, left, right, tolerance)) {
            ++report.composed_successes;
        }
        if (ish_comparison(runtime_, left, right, tolerance)) {
            ++report.direct_successes;
        }
    }
    report.comparison = compare_proportions(report.composed_successes, report.trials,
                                            report.direct_successes, report.trials);
    report.equivalent = std::abs(report.comparison.difference) <= options_.max_rate_difference;
    return report;
}

DivergenceBand CompositionValidator::divergence_band(std::optional<double> tolerance) const {
    double tol = tolerance ? *tolerance : runtime_.variance_for(ConstructKind::ToleranceWidth);
    if (!std::isfinite(tol) || tol < 0.0) {
        throw std::invalid_argument("tolerance must be a non-negative finite number");
    }
    double spread = 2.0 * runtime_.variance_for(ConstructKind::FloatDrift);
    return DivergenceBand{std::max(0.0, tol - spread), tol + spread};
}

SampleSummary CompositionValidator::assignment_spread(const Value& current,
                                                      const std::optional<Value>& target,
                                                      std::size_t samples) {
    if (samples == 0) {
        throw std::invalid_argument("assignment spread requires at least one sample");
    }
    Eigen::VectorXd values(static_cast<Eigen::Index>(samples));
    for (std::size_t i = 0; i < samples; ++i) {
        auto number = to_number(ish_value_composed(runtime_, current, target));
        if (!number) {
            throw std::invalid_argument("assignment spread requires a numeric value");
        }
        values(static_cast<Eigen::Index>(i)) = *number;
    }
    return summarize(values);
}

}  // namespace libkinda
