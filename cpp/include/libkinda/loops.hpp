#pragma once

#include "libkinda/confidence_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace libkinda {

class Runtime;

struct LoopOptions {
    std::size_t max_while_cycles = 10000;     // sometimes_while body executions before forced exit
    std::size_t confidence_capacity = 100;    // eventually_until ring size
    std::size_t min_samples = 5;              // samples before the confidence bound is consulted
    std::size_t max_evaluations = 10000;      // eventually_until cycles before timeout
    double confidence_level = 0.95;           // one-sided level of the lower bound
    bool adaptive_cadence = true;             // thin condition checks once outcomes settle
};

void validate_loop_options(const LoopOptions& options);

enum class LoopState {
    Evaluating,
    Continuing,
    Terminated
};

enum class TerminationReason {
    None,
    ConditionFalse,
    ProbabilityDraw,
    CycleCap,
    Confident,
    Timeout
};

[[nodiscard]] std::string to_string(TerminationReason reason);

struct LoopReport {
    std::size_t cycles = 0;      // condition checks
    std::size_t iterations = 0;  // body executions
    TerminationReason reason = TerminationReason::None;
};

class SometimesWhileLoop {
public:
    SometimesWhileLoop(Runtime& runtime, std::string site);

    // One cycle: returns true when the body should run.
    bool check(bool condition);

    [[nodiscard]] LoopState state() const noexcept { return state_; }
    [[nodiscard]] TerminationReason reason() const noexcept { return reason_; }
    [[nodiscard]] std::size_t cycles() const noexcept { return cycles_; }
    [[nodiscard]] std::size_t iterations() const noexcept { return iterations_; }
    [[nodiscard]] const std::string& site() const noexcept { return site_; }

private:
    void terminate(TerminationReason reason);

    Runtime& runtime_;
    std::string site_;
    std::size_t max_cycles_;
    LoopState state_ = LoopState::Evaluating;
    TerminationReason reason_ = TerminationReason::None;
    std::size_t cycles_ = 0;
    std::size_t iterations_ = 0;
};

class EventuallyUntilLoop {
public:
    EventuallyUntilLoop(Runtime& runtime, std::string site);

    // Records one evaluation of the condition; returns true while the loop should keep going.
    bool should_continue(bool condition);

    // Counts a cycle whose condition check was skipped by the adaptive cadence.
    bool skip();

    // Whether the next cycle should evaluate the condition.
    [[nodiscard]] bool due_for_evaluation() const noexcept;

    // Resolved confidence threshold, capped below the bound a full ring of successes reaches.
    [[nodiscard]] double effective_threshold() const;

    [[nodiscard]] LoopState state() const noexcept { return state_; }
    [[nodiscard]] TerminationReason reason() const noexcept { return reason_; }
    [[nodiscard]] std::size_t cycles() const noexcept { return cycles_; }
    [[nodiscard]] std::size_t evaluations() const noexcept { return evaluations_; }
    [[nodiscard]] const ConfidenceBuffer& buffer() const noexcept { return buffer_; }
    [[nodiscard]] std::optional<double> last_lower_bound() const noexcept { return last_lower_bound_; }
    [[nodiscard]] const std::string& site() const noexcept { return site_; }

private:
    bool advance();
    void terminate(TerminationReason reason);

    Runtime& runtime_;
    std::string site_;
    ConfidenceBuffer buffer_;
    std::size_t min_samples_;
    std::size_t max_evaluations_;
    double z_;
    double threshold_cap_ = 1.0;
    bool adaptive_cadence_;
    LoopState state_ = LoopState::Evaluating;
    TerminationReason reason_ = TerminationReason::None;
    std::size_t cycles_ = 0;
    std::size_t evaluations_ = 0;
    std::optional<double> last_lower_bound_;
};

bool maybe_for_item_execute(Runtime& runtime);

// Draws the fuzzy iteration count once, clamped to n(1 +/- v) and never negative.
std::int64_t kinda_repeat_count(Runtime& runtime, std::int64_t n);

LoopReport sometimes_while(Runtime& runtime,
                           const std::function<bool()>& condition,
                           const std::function<void()>& body,
                           const std::string& site = "sometimes_while");

LoopReport eventually_until(Runtime& runtime,
                            const std::function<bool()>& condition,
                            const std::function<void()>& body,
                            const std::string& site = "eventually_until");

std::int64_t kinda_repeat(Runtime& runtime, std::int64_t n, const std::function<void(std::int64_t)>& body);

template <typename Range, typename Body>
std::size_t maybe_for(Runtime& runtime, const Range& items, Body&& body) {
    std::size_t executed = 0;
    for (const auto& item : items) {
        if (maybe_for_item_execute(runtime)) {
            body(item);
            ++executed;
        }
    }
    return executed;
}

}  // namespace libkinda
