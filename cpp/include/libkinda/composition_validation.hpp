#pragma once

#include "libkinda/statistics.hpp"
#include "libkinda/value.hpp"

#include <cstddef>
#include <optional>

namespace libkinda {

class Runtime;

struct ValidationOptions {
    std::size_t trials = 2000;
    double max_rate_difference = 0.05;  // largest success-rate gap still called equivalent
};

struct EquivalenceReport {
    std::size_t trials = 0;
    std::size_t composed_successes = 0;
    std::size_t direct_successes = 0;
    ProportionComparison comparison;
    bool equivalent = false;
};

// Differences between the operands where composed and direct comparison may disagree.
// Both always pass the tolerance check at or below lower (when lower > 0) and always fail above upper.
struct DivergenceBand {
    double lower = 0.0;
    double upper = 0.0;
};

// Compares composed constructs against their direct implementations under the runtime's active context.
class CompositionValidator {
public:
    explicit CompositionValidator(Runtime& runtime, ValidationOptions options = {});

    [[nodiscard]] EquivalenceReport compare_tolerance(const Value& left,
                                                      const Value& right,
                                                      std::optional<double> tolerance = std::nullopt);

    // The composed comparison drifts both the tolerance and the difference by up to the float drift,
    // so the two implementations only match outside tolerance +/- twice the drift.
    [[nodiscard]] DivergenceBand divergence_band(std::optional<double> tolerance = std::nullopt) const;

    // Distribution of composed assignment results for a numeric value.
    [[nodiscard]] SampleSummary assignment_spread(const Value& current,
                                                  const std::optional<Value>& target,
                                                  std::size_t samples);

private:
    Runtime& runtime_;
    ValidationOptions options_;
};

}  // namespace libkinda
