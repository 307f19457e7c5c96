#include "libkinda/personality.hpp"

#include "libkinda/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace libkinda {

namespace {

constexpr std::array<Mood, kMoodCount> kMoods = {
    Mood::Reliable, Mood::Cautious, Mood::Professional, Mood::Friendly,
    Mood::Playful, Mood::Snarky, Mood::Chaotic};

[[nodiscard]] std::size_t kind_index(ConstructKind kind) noexcept {
    return static_cast<std::size_t>(kind);
}

// Column order follows ConstructKind.
[[nodiscard]] MoodProfile make_profile(Mood mood,
                                       std::array<double, kConstructKindCount> values,
                                       double amplifier,
                                       double cascade,
                                       std::array<double, 3> binary) {
    MoodProfile profile;
    profile.mood = mood;
    for (std::size_t i = 0; i < kConstructKindCount; ++i) {
        profile.base(static_cast<Eigen::Index>(i)) = values[i];
    }
    profile.chaos_amplifier = amplifier;
    profile.cascade_strength = cascade;
    profile.binary_weights = binary;
    return profile;
}

[[nodiscard]] std::array<MoodProfile, kMoodCount> build_profiles() {
    //                   some  maybe prob  rare  sorta while for   rep   conf  tol  var  int  drift bool
    return {
        make_profile(Mood::Reliable,
                     {0.95, 0.95, 0.95, 0.85, 0.95, 0.90, 0.95, 0.10, 0.95, 1.0, 0.5, 0.0, 0.0, 0.02},
                     0.2, 0.0, {0.8, 0.1, 0.1}),
        make_profile(Mood::Cautious,
                     {0.70, 0.75, 0.80, 0.25, 0.85, 0.75, 0.85, 0.20, 0.90, 1.5, 1.5, 1.0, 0.2, 0.05},
                     0.6, 0.1, {0.5, 0.3, 0.2}),
        make_profile(Mood::Professional,
                     {0.85, 0.80, 0.90, 0.10, 0.90, 0.80, 0.85, 0.15, 0.85, 1.5, 1.0, 1.0, 0.1, 0.05},
                     0.5, 0.05, {0.6, 0.2, 0.2}),
        make_profile(Mood::Friendly,
                     {0.75, 0.70, 0.80, 0.20, 0.85, 0.70, 0.80, 0.25, 0.75, 2.0, 1.5, 1.0, 0.3, 0.08},
                     0.8, 0.15, {0.5, 0.3, 0.2}),
        make_profile(Mood::Playful,
                     {0.50, 0.60, 0.70, 0.15, 0.80, 0.60, 0.70, 0.30, 0.80, 2.0, 2.5, 2.0, 0.5, 0.10},
                     1.0, 0.2, {0.4, 0.4, 0.2}),
        make_profile(Mood::Snarky,
                     {0.60, 0.65, 0.75, 0.10, 0.70, 0.65, 0.70, 0.35, 0.75, 3.0, 3.0, 2.0, 0.8, 0.15},
                     1.2, 0.3, {0.3, 0.5, 0.2}),
        make_profile(Mood::Chaotic,
                     {0.30, 0.40, 0.50, 0.05, 0.60, 0.40, 0.50, 0.40, 0.70, 4.0, 5.0, 5.0, 2.0, 0.25},
                     1.8, 0.5, {0.2, 0.6, 0.2}),
    };
}

[[nodiscard]] double adjust_probability(double base, double amplifier) {
    double adjusted = base;
    if (amplifier < 1.0) {
        if (base >= 0.5) {
            adjusted = base + (1.0 - base) * (1.0 - amplifier);
        } else {
            adjusted = base * amplifier;
        }
    } else if (base > 0.5) {
        adjusted = base - (base - 0.5) * (amplifier - 1.0);
    } else {
        adjusted = base + (0.5 - base) * (amplifier - 1.0);
    }
    return std::clamp(adjusted, 0.0, 1.0);
}

[[nodiscard]] double adjust_threshold(double base, double amplifier) {
    double adjusted = base;
    if (amplifier > 1.0) {
        adjusted -= std::min(0.3, (amplifier - 1.0) * 0.2);
    } else {
        adjusted += (1.0 - amplifier) * 0.1;
    }
    return std::clamp(adjusted, 0.5, 0.99);
}

void validate_override(ConstructKind kind, double value) {
    if (!std::isfinite(value)) {
        throw InvalidConfiguration("override for " + to_string(kind) + " must be finite");
    }
    if (is_probability_kind(kind) && (value < 0.0 || value > 1.0)) {
        throw InvalidConfiguration("override for " + to_string(kind) + " must lie in [0, 1]");
    }
    if (!is_probability_kind(kind) && value < 0.0) {
        throw InvalidConfiguration("override for " + to_string(kind) + " must be non-negative");
    }
}

}  // namespace

Mood parse_mood(const std::string& name) {
    for (Mood mood : kMoods) {
        if (to_string(mood) == name) {
            return mood;
        }
    }
    throw InvalidConfiguration("unknown mood: " + name);
}

std::string to_string(Mood mood) {
    switch (mood) {
        case Mood::Reliable: return "reliable";
        case Mood::Cautious: return "cautious";
        case Mood::Professional: return "professional";
        case Mood::Friendly: return "friendly";
        case Mood::Playful: return "playful";
        case Mood::Snarky: return "snarky";
        case Mood::Chaotic: return "chaotic";
    }
    return "unknown";
}

std::string to_string(ConstructKind kind) {
    switch (kind) {
        case ConstructKind::Sometimes: return "sometimes";
        case ConstructKind::Maybe: return "maybe";
        case ConstructKind::Probably: return "probably";
        case ConstructKind::Rarely: return "rarely";
        case ConstructKind::SortaPrint: return "sorta_print";
        case ConstructKind::LoopContinuation: return "loop_continuation";
        case ConstructKind::LoopPerItem: return "loop_per_item";
        case ConstructKind::RepeatVariance: return "repeat_variance";
        case ConstructKind::ConfidenceThreshold: return "confidence_threshold";
        case ConstructKind::ToleranceWidth: return "tolerance_width";
        case ConstructKind::ValueVariance: return "value_variance";
        case ConstructKind::IntFuzz: return "int_fuzz";
        case ConstructKind::FloatDrift: return "float_drift";
        case ConstructKind::BoolUncertainty: return "bool_uncertainty";
    }
    return "unknown";
}

std::vector<std::string> mood_names() {
    std::vector<std::string> names;
    names.reserve(kMoods.size());
    for (Mood mood : kMoods) {
        names.push_back(to_string(mood));
    }
    return names;
}

bool is_probability_kind(ConstructKind kind) noexcept {
    switch (kind) {
        case ConstructKind::Sometimes:
        case ConstructKind::Maybe:
        case ConstructKind::Probably:
        case ConstructKind::Rarely:
        case ConstructKind::SortaPrint:
        case ConstructKind::LoopContinuation:
        case ConstructKind::LoopPerItem:
        case ConstructKind::ConfidenceThreshold:
            return true;
        default:
            return false;
    }
}

double MoodProfile::value(ConstructKind kind) const {
    return base(static_cast<Eigen::Index>(kind_index(kind)));
}

const MoodProfile& mood_profile(Mood mood) {
    static const std::array<MoodProfile, kMoodCount> profiles = build_profiles();
    for (const auto& profile : profiles) {
        if (profile.mood == mood) {
            return profile;
        }
    }
    throw InvalidConfiguration("unknown mood");
}

double chaos_multiplier(int chaos_level) {
    if (chaos_level < kMinChaosLevel || chaos_level > kMaxChaosLevel) {
        throw InvalidConfiguration("chaos level must be between 1 and 10, got " + std::to_string(chaos_level));
    }
    double level = static_cast<double>(chaos_level);
    if (chaos_level <= 2) {
        return 0.2 + (level - 1.0) * 0.2;
    }
    if (chaos_level <= 4) {
        return 0.4 + (level - 2.0) * 0.2;
    }
    if (chaos_level <= 6) {
        return 0.8 + (level - 4.0) * 0.3;
    }
    if (chaos_level <= 8) {
        return 1.4 + (level - 6.0) * 0.2;
    }
    return 1.8 + (level - 8.0) * 0.2;
}

void validate_context(const ActiveContext& context) {
    (void)mood_profile(context.mood);
    (void)chaos_multiplier(context.chaos_level);
    for (const auto& [kind, value] : context.overrides) {
        validate_override(kind, value);
    }
}

PersonalityContext::PersonalityContext()
    : PersonalityContext(ActiveContext{}) {}

PersonalityContext::PersonalityContext(ActiveContext base) {
    validate_context(base);
    stack_.push_back(std::move(base));
}

void PersonalityContext::set_context(Mood mood, int chaos_level) {
    ActiveContext next{mood, chaos_level, {}};
    validate_context(next);
    stack_.back() = std::move(next);
}

void PersonalityContext::set_context(const std::string& mood, int chaos_level) {
    set_context(parse_mood(mood), chaos_level);
}

void PersonalityContext::push(ActiveContext context) {
    validate_context(context);
    stack_.push_back(std::move(context));
}

void PersonalityContext::pop() {
    if (stack_.size() <= 1) {
        throw std::out_of_range("personality stack underflow");
    }
    stack_.pop_back();
}

void PersonalityContext::restore_depth(std::size_t depth) noexcept {
    depth = std::max<std::size_t>(depth, 1);
    while (stack_.size() > depth) {
        stack_.pop_back();
    }
}

const MoodProfile& PersonalityContext::profile() const {
    return mood_profile(active().mood);
}

double PersonalityContext::amplifier() const {
    return profile().chaos_amplifier * chaos_multiplier(active().chaos_level);
}

double PersonalityContext::probability_for(ConstructKind kind) const {
    if (!is_probability_kind(kind)) {
        throw std::invalid_argument(to_string(kind) + " is not a probability construct");
    }
    const auto& pinned = active().overrides;
    if (auto it = pinned.find(kind); it != pinned.end()) {
        return it->second;
    }
    double base = profile().value(kind);
    if (kind == ConstructKind::ConfidenceThreshold) {
        return adjust_threshold(base, amplifier());
    }
    return adjust_probability(base, amplifier());
}

double PersonalityContext::variance_for(ConstructKind kind) const {
    if (is_probability_kind(kind)) {
        throw std::invalid_argument(to_string(kind) + " is not a variance construct");
    }
    const auto& pinned = active().overrides;
    if (auto it = pinned.find(kind); it != pinned.end()) {
        return it->second;
    }
    double scaled = profile().value(kind) * amplifier();
    switch (kind) {
        case ConstructKind::RepeatVariance:
            return std::clamp(scaled, 0.0, 1.0);
        case ConstructKind::IntFuzz:
            return std::floor(scaled);
        case ConstructKind::BoolUncertainty:
            return std::clamp(scaled, 0.0, 0.5);
        default:
            return std::max(scaled, 0.0);
    }
}

double PersonalityContext::cascade_strength() const {
    return profile().cascade_strength;
}

std::array<double, 3> PersonalityContext::binary_weights() const {
    return profile().binary_weights;
}

ScopedPersonality::ScopedPersonality(PersonalityContext& context, Mood mood, int chaos_level)
    : ScopedPersonality(context, ActiveContext{mood, chaos_level, {}}) {}

ScopedPersonality::ScopedPersonality(PersonalityContext& context, ActiveContext active)
    : context_(context), restore_depth_(context.depth()) {
    context_.push(std::move(active));
}

ScopedPersonality::~ScopedPersonality() {
    context_.restore_depth(restore_depth_);
}

ScopedPersonality& ScopedPersonality::pin(ConstructKind kind, double value) {
    if (context_.depth() != restore_depth_ + 1) {
        throw std::logic_error("pin requires this personality scope to be the innermost one");
    }
    ActiveContext next = context_.active();
    next.overrides[kind] = value;
    validate_context(next);
    context_.restore_depth(restore_depth_);
    context_.push(std::move(next));
    return *this;
}

}  // namespace libkinda
