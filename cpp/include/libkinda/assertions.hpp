#pragma once

#include <cstddef>
#include <functional>
#include <optional>

namespace libkinda {

class Runtime;

struct EventuallyOptions {
    double timeout_seconds = 5.0;
    double confidence = 0.95;             // one-sided level of the Wilson lower bound
    double poll_interval_seconds = 0.05;  // pause between attempts
};

struct ProbabilityOptions {
    double expected = 0.5;
    double tolerance = 0.1;
    std::size_t samples = 1000;
};

struct AssertionReport {
    std::size_t attempts = 0;
    std::size_t successes = 0;
    double observed_rate = 0.0;
    std::optional<double> lower_bound;  // assert_eventually only
    double z_score = 0.0;               // assert_probability only
};

// Samples the condition until the Wilson lower bound of its success rate exceeds 0.5.
// At least max(10, 3 / (1 - confidence)) attempts are made before the bound is consulted.
// Throws StatisticalAssertionError when the timeout passes first.
AssertionReport assert_eventually(Runtime& runtime,
                                  const std::function<bool()>& condition,
                                  const EventuallyOptions& options = {});

inline constexpr std::size_t kMaxAssertionSamples = 10000;

// Samples the event and requires the observed rate to lie within the tolerance of the expected one.
// Sample counts above kMaxAssertionSamples are reduced to it.
AssertionReport assert_probability(Runtime& runtime,
                                   const std::function<bool()>& event,
                                   const ProbabilityOptions& options = {});

}  // namespace libkinda
