#pragma once

#include "libkinda/personality.hpp"
#include "libkinda/value.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace libkinda {

class Runtime;

enum class PatternMode {
    Comparison,
    Assignment
};

enum class FailureReason {
    ConversionFailure,
    InternalError
};

[[nodiscard]] std::string to_string(PatternMode mode);

struct CompositionFailure {
    FailureReason reason = FailureReason::InternalError;
    std::string detail;
};

// Outcome of a composed construct: either a value or the reason the composition gave up.
template <typename T>
class Composed {
public:
    Composed(T value) : state_(std::move(value)) {}
    Composed(CompositionFailure failure) : state_(std::move(failure)) {}

    [[nodiscard]] bool ok() const noexcept { return std::holds_alternative<T>(state_); }

    [[nodiscard]] const T& value() const {
        if (!ok()) {
            throw std::logic_error("composed result holds a failure");
        }
        return std::get<T>(state_);
    }

    [[nodiscard]] const CompositionFailure& failure() const {
        if (ok()) {
            throw std::logic_error("composed result holds a value");
        }
        return std::get<CompositionFailure>(state_);
    }

private:
    std::variant<T, CompositionFailure> state_;
};

class CompositionPattern {
public:
    explicit CompositionPattern(std::string name);
    virtual ~CompositionPattern() = default;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::size_t evaluations() const noexcept { return evaluations_; }
    [[nodiscard]] std::size_t failures() const noexcept { return failures_; }

    // Primitive construct kinds this pattern draws from.
    [[nodiscard]] virtual std::vector<ConstructKind> components() const = 0;

protected:
    template <typename T>
    Composed<T> tally(Composed<T> result) {
        ++evaluations_;
        if (!result.ok()) {
            ++failures_;
        }
        return result;
    }

private:
    std::string name_;
    std::size_t evaluations_ = 0;
    std::size_t failures_ = 0;
};

/**
 * Tolerance ("ish") behavior synthesized from kinda_float, probably and sometimes.
 *
 * Comparison mode fuzzes both the tolerance and the absolute difference with independent
 * kinda_float draws, compares them, and passes the outcome through the probably gate.
 * Assignment mode either adds personality-scaled noise to the current value or, when a
 * target is given and a sometimes gate passes, moves a fuzzed fraction of the way toward it.
 */
class ToleranceCompositionPattern final : public CompositionPattern {
public:
    ToleranceCompositionPattern(std::string name, PatternMode mode);

    [[nodiscard]] PatternMode mode() const noexcept { return mode_; }

    [[nodiscard]] std::vector<ConstructKind> components() const override;

    Composed<bool> compare(Runtime& runtime,
                           const Value& left,
                           const Value& right,
                           std::optional<double> tolerance = std::nullopt);

    Composed<Value> assign(Runtime& runtime,
                           const Value& current,
                           const std::optional<Value>& target = std::nullopt);

private:
    PatternMode mode_;
};

enum class CompositionStrategy {
    Union,
    Intersection,
    Sequential,
    Weighted,
    Threshold
};

[[nodiscard]] std::string to_string(CompositionStrategy strategy);

// Combines several gate tiers into one probabilistic decision.
class GateCompositionPattern final : public CompositionPattern {
public:
    GateCompositionPattern(std::string name,
                           CompositionStrategy strategy,
                           std::vector<ConstructKind> gates,
                           std::vector<double> weights = {},
                           std::size_t threshold = 1);

    [[nodiscard]] CompositionStrategy strategy() const noexcept { return strategy_; }
    [[nodiscard]] std::vector<ConstructKind> components() const override { return gates_; }

    Composed<bool> evaluate(Runtime& runtime, bool condition = true);

private:
    CompositionStrategy strategy_;
    std::vector<ConstructKind> gates_;
    std::vector<double> weights_;
    std::size_t threshold_;
};

// Composed entry points. Failures are recorded on the runtime and answered by the direct implementation.
bool compose_comparison(Runtime& runtime,
                        ToleranceCompositionPattern& pattern,
                        const Value& left,
                        const Value& right,
                        std::optional<double> tolerance = std::nullopt);

Value compose_assignment(Runtime& runtime,
                         ToleranceCompositionPattern& pattern,
                         const Value& current,
                         const std::optional<Value>& target = std::nullopt);

bool compose_gate(Runtime& runtime, GateCompositionPattern& pattern, bool condition = true);

// Runtime surface for `~ish`, through the registry's "ish" patterns.
bool ish_comparison_composed(Runtime& runtime,
                             const Value& left,
                             const Value& right,
                             std::optional<double> tolerance = std::nullopt);

Value ish_value_composed(Runtime& runtime, const Value& current, const std::optional<Value>& target = std::nullopt);

}  // namespace libkinda
