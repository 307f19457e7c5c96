#pragma once

#include <Eigen/Dense>

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace libkinda {

enum class Mood {
    Reliable,
    Cautious,
    Professional,
    Friendly,
    Playful,
    Snarky,
    Chaotic
};

enum class ConstructKind {
    Sometimes,
    Maybe,
    Probably,
    Rarely,
    SortaPrint,
    LoopContinuation,
    LoopPerItem,
    RepeatVariance,
    ConfidenceThreshold,
    ToleranceWidth,
    ValueVariance,
    IntFuzz,
    FloatDrift,
    BoolUncertainty
};

inline constexpr std::size_t kConstructKindCount = 14;
inline constexpr std::size_t kMoodCount = 7;

inline constexpr int kMinChaosLevel = 1;
inline constexpr int kMaxChaosLevel = 10;
inline constexpr int kDefaultChaosLevel = 5;

[[nodiscard]] Mood parse_mood(const std::string& name);
[[nodiscard]] std::string to_string(Mood mood);
[[nodiscard]] std::string to_string(ConstructKind kind);
[[nodiscard]] std::vector<std::string> mood_names();

// Probability kinds resolve through probability_for, the rest through variance_for.
[[nodiscard]] bool is_probability_kind(ConstructKind kind) noexcept;

struct MoodProfile {
    using Table = Eigen::Array<double, static_cast<int>(kConstructKindCount), 1>;

    Mood mood = Mood::Playful;
    Table base = Table::Zero();
    double chaos_amplifier = 1.0;
    double cascade_strength = 0.0;
    // kinda_binary weights: positive, negative, neutral.
    std::array<double, 3> binary_weights{1.0 / 3.0, 1.0 / 3.0, 1.0 / 3.0};

    [[nodiscard]] double value(ConstructKind kind) const;
};

[[nodiscard]] const MoodProfile& mood_profile(Mood mood);

[[nodiscard]] double chaos_multiplier(int chaos_level);

struct ActiveContext {
    Mood mood = Mood::Playful;
    int chaos_level = kDefaultChaosLevel;
    // Pinned values for individual construct kinds, bypassing the mood table.
    std::map<ConstructKind, double> overrides;

    bool operator==(const ActiveContext& other) const = default;
};

void validate_context(const ActiveContext& context);

class PersonalityContext {
public:
    PersonalityContext();

    explicit PersonalityContext(ActiveContext base);

    // Replaces the innermost context.
    void set_context(Mood mood, int chaos_level);
    void set_context(const std::string& mood, int chaos_level);

    void push(ActiveContext context);
    void pop();

    // Drops every context above the given depth; never removes the base context.
    void restore_depth(std::size_t depth) noexcept;

    [[nodiscard]] const ActiveContext& active() const noexcept { return stack_.back(); }
    [[nodiscard]] std::size_t depth() const noexcept { return stack_.size(); }
    [[nodiscard]] const MoodProfile& profile() const;

    [[nodiscard]] double amplifier() const;

    [[nodiscard]] double probability_for(ConstructKind kind) const;
    [[nodiscard]] double variance_for(ConstructKind kind) const;

    [[nodiscard]] double cascade_strength() const;
    [[nodiscard]] std::array<double, 3> binary_weights() const;

private:
    std::vector<ActiveContext> stack_;
};

class ScopedPersonality {
public:
    ScopedPersonality(PersonalityContext& context, Mood mood, int chaos_level);
    ScopedPersonality(PersonalityContext& context, ActiveContext active);
    ~ScopedPersonality();

    ScopedPersonality(const ScopedPersonality&) = delete;
    ScopedPersonality& operator=(const ScopedPersonality&) = delete;

    // Pins a construct kind inside this scope only. Throws std::logic_error while an inner scope is open.
    ScopedPersonality& pin(ConstructKind kind, double value);

private:
    PersonalityContext& context_;
    std::size_t restore_depth_;
};

}  // namespace libkinda
