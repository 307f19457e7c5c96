#pragma once

#include "libkinda/chaos_events.hpp"
#include "libkinda/composition.hpp"
#include "libkinda/loops.hpp"
#include "libkinda/pattern_registry.hpp"
#include "libkinda/personality.hpp"
#include "libkinda/random_source.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace libkinda {

struct RuntimeOptions {
    std::optional<std::uint64_t> seed;
    ErrorMode error_mode = ErrorMode::Warning;
    bool verbose = false;
    LoopOptions loops;
};

// Execution context shared by the primitives, composition patterns and loop state machines.
class Runtime {
public:
    Runtime();
    explicit Runtime(RuntimeOptions options);

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    void set_context(Mood mood, int chaos_level);
    void set_context(const std::string& mood, int chaos_level);

    void reseed(std::uint64_t seed);

    void set_loop_options(LoopOptions options);

    [[nodiscard]] PersonalityContext& personality() noexcept { return personality_; }
    [[nodiscard]] const PersonalityContext& personality() const noexcept { return personality_; }
    [[nodiscard]] RandomSource& random() noexcept { return random_; }
    [[nodiscard]] ChaosEventLog& events() noexcept { return events_; }
    [[nodiscard]] const ChaosEventLog& events() const noexcept { return events_; }
    [[nodiscard]] PatternRegistry& patterns() noexcept { return patterns_; }
    [[nodiscard]] const RuntimeOptions& options() const noexcept { return options_; }

    [[nodiscard]] double probability_for(ConstructKind kind) const { return personality_.probability_for(kind); }
    [[nodiscard]] double variance_for(ConstructKind kind) const { return personality_.variance_for(kind); }

    // Records a recovered composition failure against the construct.
    void report_failure(const std::string& construct, const CompositionFailure& failure);

    void record_event(ChaosEventKind kind, const std::string& construct, const std::string& detail);

private:
    RuntimeOptions options_;
    PersonalityContext personality_;
    RandomSource random_;
    ChaosEventLog events_;
    PatternRegistry patterns_;
};

// Process-wide runtime used by the language bindings.
Runtime& default_runtime();

}  // namespace libkinda
