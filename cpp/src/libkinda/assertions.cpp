#include "libkinda/assertions.hpp"

#include "libkinda/errors.hpp"
#include "libkinda/runtime.hpp"
#include "libkinda/statistics.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <thread>

namespace libkinda {

namespace {

constexpr double kEventuallyBar = 0.5;
constexpr std::size_t kMinEventuallyAttempts = 10;

[[noreturn]] void fail_assertion(Runtime& runtime, const std::string& message) {
    runtime.events().record_failure(runtime.personality().cascade_strength());
    throw StatisticalAssertionError(message);
}

}  // namespace

AssertionReport assert_eventually(Runtime& runtime,
                                  const std::function<bool()>& condition,
                                  const EventuallyOptions& options) {
    if (!std::isfinite(options.timeout_seconds) || options.timeout_seconds <= 0.0) {
        throw InvalidConfiguration("assert_eventually timeout must be positive");
    }
    if (!(options.confidence > 0.0 && options.confidence < 1.0)) {
        throw InvalidConfiguration("assert_eventually confidence must lie in (0, 1)");
    }
    if (!std::isfinite(options.poll_interval_seconds) || options.poll_interval_seconds < 0.0) {
        throw InvalidConfiguration("assert_eventually poll interval must be non-negative");
    }

    const auto min_attempts = std::max(kMinEventuallyAttempts,
                                       static_cast<std::size_t>(3.0 / (1.0 - options.confidence)));
    const double z = z_for_confidence(options.confidence, false);
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                              std::chrono::duration<double>(options.timeout_seconds));

    AssertionReport report;
    do {
        ++report.attempts;
        if (condition()) {
            ++report.successes;
        }
        if (report.attempts >= min_attempts) {
            report.lower_bound = wilson_lower_bound(report.successes, report.attempts, z);
            if (report.lower_bound && *report.lower_bound > kEventuallyBar) {
                report.observed_rate = static_cast<double>(report.successes) / static_cast<double>(report.attempts);
                runtime.events().record_success();
                return report;
            }
        }
        if (options.poll_interval_seconds > 0.0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(options.poll_interval_seconds));
        }
    } while (std::chrono::steady_clock::now() < deadline);

    report.observed_rate = static_cast<double>(report.successes) / static_cast<double>(report.attempts);
    std::ostringstream message;
    message << std::fixed << std::setprecision(3) << "assert_eventually failed: condition held in "
            << report.successes << "/" << report.attempts << " attempts (" << report.observed_rate
            << ") within " << options.timeout_seconds << "s at confidence " << options.confidence;
    fail_assertion(runtime, message.str());
}

AssertionReport assert_probability(Runtime& runtime,
                                   const std::function<bool()>& event,
                                   const ProbabilityOptions& options) {
    if (!(options.expected >= 0.0 && options.expected <= 1.0)) {
        throw InvalidConfiguration("assert_probability expected rate must lie in [0, 1]");
    }
    if (!std::isfinite(options.tolerance) || options.tolerance <= 0.0) {
        throw InvalidConfiguration("assert_probability tolerance must be positive");
    }
    if (options.samples == 0) {
        throw InvalidConfiguration("assert_probability needs at least one sample");
    }

    AssertionReport report;
    report.attempts = std::min(options.samples, kMaxAssertionSamples);
    for (std::size_t i = 0; i < report.attempts; ++i) {
        if (event()) {
            ++report.successes;
        }
    }
    double n = static_cast<double>(report.attempts);
    report.observed_rate = static_cast<double>(report.successes) / n;
    double difference = std::abs(report.observed_rate - options.expected);
    double standard_error = std::sqrt(options.expected * (1.0 - options.expected) / n);
    report.z_score = standard_error > 0.0 ? difference / standard_error : 0.0;

    if (difference <= options.tolerance) {
        runtime.events().record_success();
        return report;
    }
    std::ostringstream message;
    message << std::fixed << std::setprecision(3) << "assert_probability failed: observed "
            << report.observed_rate << ", expected " << options.expected << " +/- " << options.tolerance
            << " (difference " << difference << ", z-score " << std::setprecision(2) << report.z_score << ")";
    fail_assertion(runtime, message.str());
}

}  // namespace libkinda
