#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <optional>
#include <vector>

namespace libkinda {

struct ConfidenceInterval {
    double lower = 0.0;
    double center = 0.0;
    double upper = 0.0;
};

struct ProportionComparison {
    double rate_a = 0.0;
    double rate_b = 0.0;
    double difference = 0.0;  // rate_a - rate_b
    double z_statistic = 0.0;
    double p_value = 1.0;
};

struct SampleSummary {
    std::size_t count = 0;
    double mean = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
};

[[nodiscard]] double normal_cdf(double x);

// Inverse of the standard normal CDF (Acklam's rational approximation, refined by one Halley step).
[[nodiscard]] double normal_quantile(double p);

// Critical value for a confidence level in (0, 1).
[[nodiscard]] double z_for_confidence(double level, bool two_sided = true);

/**
 * Wilson score interval for a binomial proportion.
 *
 * center = (p + z^2 / 2n) / (1 + z^2 / n)
 * margin = z * sqrt((p(1 - p) + z^2 / 4n) / n) / (1 + z^2 / n)
 *
 * @param successes Number of successful trials
 * @param trials Number of trials, must be positive
 * @param z Critical value
 */
[[nodiscard]] ConfidenceInterval wilson_interval(std::size_t successes, std::size_t trials, double z);

// Lower Wilson bound, or nothing when the computation is degenerate (no trials, non-finite result).
[[nodiscard]] std::optional<double> wilson_lower_bound(std::size_t successes, std::size_t trials, double z);

// Two-proportion z-test with pooled variance.
[[nodiscard]] ProportionComparison compare_proportions(std::size_t successes_a,
                                                       std::size_t trials_a,
                                                       std::size_t successes_b,
                                                       std::size_t trials_b);

[[nodiscard]] SampleSummary summarize(const Eigen::Ref<const Eigen::VectorXd>& samples);
[[nodiscard]] SampleSummary summarize(const std::vector<double>& samples);

}  // namespace libkinda
