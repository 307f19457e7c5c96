#include "libkinda/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace libkinda {

namespace {

constexpr double kQuantileLowRegion = 0.02425;

[[nodiscard]] double acklam_quantile(double p) {
    static constexpr double a[] = {-3.969683028665376e+01, 2.209460984245205e+02, -2.759285104469687e+02,
                                   1.383577518672690e+02, -3.066479806614716e+01, 2.506628277459239e+00};
    static constexpr double b[] = {-5.447609879822406e+01, 1.615858368580409e+02, -1.556989798598866e+02,
                                   6.680131188771972e+01, -1.328068155288572e+01};
    static constexpr double c[] = {-7.784894002430293e-03, -3.223964580411365e-01, -2.400758277161838e+00,
                                   -2.549732539343734e+00, 4.374664141464968e+00, 2.938163982698783e+00};
    static constexpr double d[] = {7.784695709041462e-03, 3.224671290700398e-01, 2.445134137142996e+00,
                                   3.754408661907416e+00};

    if (p < kQuantileLowRegion) {
        double q = std::sqrt(-2.0 * std::log(p));
        return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
               ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }
    if (p > 1.0 - kQuantileLowRegion) {
        double q = std::sqrt(-2.0 * std::log(1.0 - p));
        return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
               ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }
    double q = p - 0.5;
    double r = q * q;
    return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
           (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
}

}  // namespace

double normal_cdf(double x) {
    return 0.5 * std::erfc(-x / std::numbers::sqrt2);
}

double normal_quantile(double p) {
    if (!(p > 0.0 && p < 1.0)) {
        throw std::domain_error("normal quantile requires p in (0, 1)");
    }
    double x = acklam_quantile(p);
    double e = normal_cdf(x) - p;
    double u = e * std::sqrt(2.0 * std::numbers::pi) * std::exp(x * x / 2.0);
    return x - u / (1.0 + x * u / 2.0);
}

double z_for_confidence(double level, bool two_sided) {
    if (!(level > 0.0 && level < 1.0)) {
        throw std::invalid_argument("confidence level must lie in (0, 1)");
    }
    double tail = two_sided ? (1.0 - level) / 2.0 : 1.0 - level;
    return normal_quantile(1.0 - tail);
}

ConfidenceInterval wilson_interval(std::size_t successes, std::size_t trials, double z) {
    if (trials == 0) {
        throw std::invalid_argument("wilson interval requires at least one trial");
    }
    if (successes > trials) {
        throw std::invalid_argument("successes cannot exceed trials");
    }
    double n = static_cast<double>(trials);
    double p = static_cast<double>(successes) / n;
    double z2 = z * z;
    double denom = 1.0 + z2 / n;
    double center = (p + z2 / (2.0 * n)) / denom;
    double margin = z * std::sqrt((p * (1.0 - p) + z2 / (4.0 * n)) / n) / denom;
    return ConfidenceInterval{std::max(0.0, center - margin), center, std::min(1.0, center + margin)};
}

std::optional<double> wilson_lower_bound(std::size_t successes, std::size_t trials, double z) {
    if (trials == 0 || successes > trials || !std::isfinite(z)) {
        return std::nullopt;
    }
    double lower = wilson_interval(successes, trials, z).lower;
    if (!std::isfinite(lower)) {
        return std::nullopt;
    }
    return lower;
}

ProportionComparison compare_proportions(std::size_t successes_a,
                                         std::size_t trials_a,
                                         std::size_t successes_b,
                                         std::size_t trials_b) {
    if (trials_a == 0 || trials_b == 0) {
        throw std::invalid_argument("proportion comparison requires non-empty samples");
    }
    if (successes_a > trials_a || successes_b > trials_b) {
        throw std::invalid_argument("successes cannot exceed trials");
    }
    ProportionComparison result;
    double na = static_cast<double>(trials_a);
    double nb = static_cast<double>(trials_b);
    result.rate_a = static_cast<double>(successes_a) / na;
    result.rate_b = static_cast<double>(successes_b) / nb;
    result.difference = result.rate_a - result.rate_b;

    double pooled = static_cast<double>(successes_a + successes_b) / (na + nb);
    double se = std::sqrt(pooled * (1.0 - pooled) * (1.0 / na + 1.0 / nb));
    if (se > 0.0) {
        result.z_statistic = result.difference / se;
        result.p_value = std::erfc(std::abs(result.z_statistic) / std::numbers::sqrt2);
    }
    return result;
}

SampleSummary summarize(const Eigen::Ref<const Eigen::VectorXd>& samples) {
    SampleSummary summary;
    summary.count = static_cast<std::size_t>(samples.size());
    if (samples.size() == 0) {
        return summary;
    }
    summary.mean = samples.mean();
    summary.min = samples.minCoeff();
    summary.max = samples.maxCoeff();
    if (samples.size() > 1) {
        double ss = (samples.array() - summary.mean).square().sum();
        summary.stddev = std::sqrt(ss / static_cast<double>(samples.size() - 1));
    }
    return summary;
}

SampleSummary summarize(const std::vector<double>& samples) {
    Eigen::Map<const Eigen::VectorXd> view(samples.data(), static_cast<Eigen::Index>(samples.size()));
    return summarize(view);
}

}  // namespace libkinda
