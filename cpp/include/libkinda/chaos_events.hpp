#pragma once

#include <cstddef>
#include <deque>
#include <iosfwd>
#include <map>
#include <string>

namespace libkinda {

enum class ErrorMode {
    Strict,
    Warning,
    Silent
};

enum class ChaosEventKind {
    ConversionFailure,
    CompositionFailure,
    LoopCapExceeded,
    LoopTimeout,
    ConfidenceFallback,
    WelpFallback
};

[[nodiscard]] ErrorMode parse_error_mode(const std::string& name);
[[nodiscard]] std::string to_string(ErrorMode mode);
[[nodiscard]] std::string to_string(ChaosEventKind kind);

struct ChaosEvent {
    ChaosEventKind kind;
    std::string construct;
    std::string detail;
};

// Telemetry for recovered failures and forced loop terminations.
class ChaosEventLog {
public:
    static constexpr std::size_t kHistoryLimit = 1000;

    explicit ChaosEventLog(ErrorMode mode = ErrorMode::Warning);

    ChaosEventLog(ErrorMode mode, std::ostream& stream);

    // Strict mode throws std::runtime_error after recording.
    void record(ChaosEventKind kind, const std::string& construct, const std::string& detail, double cascade_strength = 0.0);

    void record_success() noexcept;

    // Raises instability for a failure that is reported by other means, such as a failed assertion.
    void record_failure(double cascade_strength) noexcept;

    void set_mode(ErrorMode mode) noexcept { mode_ = mode; }
    [[nodiscard]] ErrorMode mode() const noexcept { return mode_; }

    void set_stream(std::ostream& stream) noexcept { stream_ = &stream; }

    [[nodiscard]] std::size_t total() const noexcept { return total_; }
    [[nodiscard]] std::size_t count(ChaosEventKind kind) const;
    [[nodiscard]] std::size_t count_for(const std::string& construct) const;
    [[nodiscard]] const std::deque<ChaosEvent>& history() const noexcept { return history_; }

    // Bounded in [0, 1]; rises with failures, decays with successes.
    [[nodiscard]] double instability() const noexcept { return instability_; }

    [[nodiscard]] std::string summary() const;

    void clear() noexcept;

private:
    ErrorMode mode_;
    std::ostream* stream_;
    std::deque<ChaosEvent> history_;
    std::map<ChaosEventKind, std::size_t> by_kind_;
    std::map<std::string, std::size_t> by_construct_;
    std::size_t total_ = 0;
    double instability_ = 0.0;
};

}  // namespace libkinda
