#include "libkinda/loops.hpp"

#include "libkinda/errors.hpp"
#include "libkinda/primitives.hpp"
#include "libkinda/runtime.hpp"
#include "libkinda/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace libkinda {

namespace {

// Once this many samples agree this strongly, the condition is checked every other cycle.
constexpr double kSettledVariance = 0.05;
constexpr std::size_t kSettledStride = 2;

// Margin kept between the threshold and the best bound a full ring can reach.
constexpr double kReachableMargin = 0.005;

}  // namespace

void validate_loop_options(const LoopOptions& options) {
    if (options.max_while_cycles == 0) {
        throw InvalidConfiguration("max_while_cycles must be positive");
    }
    if (options.confidence_capacity == 0) {
        throw InvalidConfiguration("confidence_capacity must be positive");
    }
    if (options.min_samples == 0 || options.min_samples > options.confidence_capacity) {
        throw InvalidConfiguration("min_samples must lie in [1, confidence_capacity]");
    }
    if (options.max_evaluations < options.min_samples) {
        throw InvalidConfiguration("max_evaluations must be at least min_samples");
    }
    if (!(options.confidence_level > 0.0 && options.confidence_level < 1.0)) {
        throw InvalidConfiguration("confidence_level must lie in (0, 1)");
    }
}

std::string to_string(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::None: return "none";
        case TerminationReason::ConditionFalse: return "condition false";
        case TerminationReason::ProbabilityDraw: return "probability draw";
        case TerminationReason::CycleCap: return "cycle cap";
        case TerminationReason::Confident: return "confident";
        case TerminationReason::Timeout: return "timeout";
    }
    return "unknown";
}

SometimesWhileLoop::SometimesWhileLoop(Runtime& runtime, std::string site)
    : runtime_(runtime),
      site_(std::move(site)),
      max_cycles_(runtime.options().loops.max_while_cycles) {}

bool SometimesWhileLoop::check(bool condition) {
    if (state_ == LoopState::Terminated) {
        return false;
    }
    state_ = LoopState::Evaluating;
    ++cycles_;
    if (!condition) {
        terminate(TerminationReason::ConditionFalse);
        return false;
    }
    if (!runtime_.random().bernoulli(runtime_.probability_for(ConstructKind::LoopContinuation))) {
        terminate(TerminationReason::ProbabilityDraw);
        return false;
    }
    if (iterations_ >= max_cycles_) {
        terminate(TerminationReason::CycleCap);
        runtime_.record_event(ChaosEventKind::LoopCapExceeded, "sometimes_while",
                              site_ + " stopped after " + std::to_string(iterations_) + " cycles");
        return false;
    }
    ++iterations_;
    state_ = LoopState::Continuing;
    return true;
}

void SometimesWhileLoop::terminate(TerminationReason reason) {
    state_ = LoopState::Terminated;
    reason_ = reason;
}

EventuallyUntilLoop::EventuallyUntilLoop(Runtime& runtime, std::string site)
    : runtime_(runtime),
      site_(std::move(site)),
      buffer_(runtime.options().loops.confidence_capacity),
      min_samples_(runtime.options().loops.min_samples),
      max_evaluations_(runtime.options().loops.max_evaluations),
      z_(z_for_confidence(runtime.options().loops.confidence_level, false)),
      adaptive_cadence_(runtime.options().loops.adaptive_cadence) {
    // An all-true ring of n outcomes bounds at n / (n + z^2); a threshold above that never clears.
    double capacity = static_cast<double>(buffer_.capacity());
    threshold_cap_ = capacity / (capacity + z_ * z_) - kReachableMargin;
}

double EventuallyUntilLoop::effective_threshold() const {
    return std::min(runtime_.probability_for(ConstructKind::ConfidenceThreshold), threshold_cap_);
}

bool EventuallyUntilLoop::should_continue(bool condition) {
    if (state_ == LoopState::Terminated) {
        return false;
    }
    state_ = LoopState::Evaluating;
    ++evaluations_;
    buffer_.push(condition);

    if (buffer_.size() >= min_samples_) {
        double threshold = effective_threshold();
        last_lower_bound_ = wilson_lower_bound(buffer_.successes(), buffer_.size(), z_);
        bool confident = false;
        if (last_lower_bound_) {
            confident = *last_lower_bound_ > threshold;
        } else {
            runtime_.record_event(ChaosEventKind::ConfidenceFallback, "eventually_until",
                                  site_ + " used the plain proportion check");
            confident = buffer_.proportion() >= threshold;
        }
        if (confident) {
            ++cycles_;
            terminate(TerminationReason::Confident);
            return false;
        }
    }
    return advance();
}

bool EventuallyUntilLoop::skip() {
    if (state_ == LoopState::Terminated) {
        return false;
    }
    return advance();
}

bool EventuallyUntilLoop::advance() {
    ++cycles_;
    if (cycles_ >= max_evaluations_) {
        terminate(TerminationReason::Timeout);
        runtime_.record_event(ChaosEventKind::LoopTimeout, "eventually_until",
                              site_ + " gave up after " + std::to_string(cycles_) + " cycles");
        return false;
    }
    state_ = LoopState::Continuing;
    return true;
}

bool EventuallyUntilLoop::due_for_evaluation() const noexcept {
    if (!adaptive_cadence_ || buffer_.size() < min_samples_) {
        return true;
    }
    if (buffer_.variance() >= kSettledVariance) {
        return true;
    }
    return cycles_ % kSettledStride == 0;
}

void EventuallyUntilLoop::terminate(TerminationReason reason) {
    state_ = LoopState::Terminated;
    reason_ = reason;
}

bool maybe_for_item_execute(Runtime& runtime) {
    return runtime.random().bernoulli(runtime.probability_for(ConstructKind::LoopPerItem));
}

std::int64_t kinda_repeat_count(Runtime& runtime, std::int64_t n) {
    if (n < 0) {
        throw std::invalid_argument("repeat count must be non-negative");
    }
    double variance = runtime.variance_for(ConstructKind::RepeatVariance);
    if (n == 0 || variance <= 0.0) {
        return n;
    }
    double target = static_cast<double>(n);
    double drawn = std::round(runtime.random().normal(target, target * variance / 2.0));

    double low = std::max(0.0, std::ceil(target * (1.0 - variance)));
    double high = std::floor(target * (1.0 + variance));
    if (low > high) {
        return n;
    }
    return static_cast<std::int64_t>(std::clamp(drawn, low, high));
}

LoopReport sometimes_while(Runtime& runtime,
                           const std::function<bool()>& condition,
                           const std::function<void()>& body,
                           const std::string& site) {
    SometimesWhileLoop loop(runtime, site);
    while (loop.check(condition())) {
        body();
    }
    return LoopReport{loop.cycles(), loop.iterations(), loop.reason()};
}

LoopReport eventually_until(Runtime& runtime,
                            const std::function<bool()>& condition,
                            const std::function<void()>& body,
                            const std::string& site) {
    EventuallyUntilLoop loop(runtime, site);
    std::size_t iterations = 0;
    while (true) {
        bool keep_going = loop.due_for_evaluation() ? loop.should_continue(condition()) : loop.skip();
        if (!keep_going) {
            break;
        }
        body();
        ++iterations;
    }
    return LoopReport{loop.cycles(), iterations, loop.reason()};
}

std::int64_t kinda_repeat(Runtime& runtime, std::int64_t n, const std::function<void(std::int64_t)>& body) {
    std::int64_t count = kinda_repeat_count(runtime, n);
    for (std::int64_t i = 0; i < count; ++i) {
        body(i);
    }
    return count;
}

}  // namespace libkinda
