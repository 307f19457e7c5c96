#pragma once

#include "libkinda/source_scanner.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace libkinda {

enum class GateTier {
    Sometimes,
    Maybe,
    Probably,
    Rarely
};

enum class LoopKind {
    SometimesWhile,
    MaybeFor,
    KindaRepeat,
    EventuallyUntil
};

enum class FuzzyType {
    Int,
    Float,
    Bool,
    Binary
};

enum class AssertionKind {
    Eventually,
    Probability
};

enum class ToleranceRole {
    Comparison,
    Assignment,
    Value
};

[[nodiscard]] std::string to_string(GateTier tier);
[[nodiscard]] std::string to_string(LoopKind kind);
[[nodiscard]] std::string to_string(FuzzyType type);
[[nodiscard]] std::string to_string(ToleranceRole role);
[[nodiscard]] std::string to_string(AssertionKind kind);

// Every word recognized after the ~ sigil.
[[nodiscard]] const std::vector<std::string>& marker_vocabulary();

// Input line used for error reporting; number is 1-based.
struct SourceLine {
    std::size_t number = 0;
    std::string_view text;
};

struct LoopConstruct {
    LoopKind kind = LoopKind::SometimesWhile;
    std::string target;      // maybe_for loop variable
    std::string expression;  // condition, iterable or count
    std::string trailing;    // text after the block colon
};

struct ConditionalGate {
    GateTier tier = GateTier::Sometimes;
    std::string keyword;  // "if" or "elif"
    std::string condition;
    std::string trailing;
};

struct FuzzyDeclaration {
    FuzzyType type = FuzzyType::Int;
    std::string name;
    std::string expression;
};

struct FuzzyReassignment {
    std::string name;
    std::string expression;
};

struct SortaPrint {
    std::string arguments;
};

struct ToleranceAssignment {
    std::string variable;
    std::optional<std::string> target;
};

// `~assert_eventually(subject, ...)`; the subject is re-evaluated on every attempt.
struct StatisticalAssertion {
    AssertionKind kind = AssertionKind::Eventually;
    std::string subject;
    std::string arguments;  // remaining keyword arguments, passed through
};

struct PlainStatement {};

using StatementNode = std::variant<PlainStatement,
                                   LoopConstruct,
                                   ConditionalGate,
                                   FuzzyDeclaration,
                                   FuzzyReassignment,
                                   SortaPrint,
                                   ToleranceAssignment,
                                   StatisticalAssertion>;

// Inline nodes carry the [begin, end) span they replace.
struct ToleranceComparison {
    std::size_t begin = 0;
    std::size_t end = 0;
    std::string left;
    std::string right;
};

struct ToleranceValue {
    std::size_t begin = 0;
    std::size_t end = 0;
    std::string operand;
};

struct InlineGate {
    std::size_t begin = 0;
    std::size_t end = 0;
    GateTier tier = GateTier::Sometimes;
    std::string argument;
};

// `primary ~welp fallback`, binding looser than every other operator.
struct WelpFallback {
    std::size_t begin = 0;
    std::size_t end = 0;
    std::string primary;
    std::string fallback;
};

using InlineNode = std::variant<ToleranceComparison, ToleranceValue, InlineGate, WelpFallback>;

struct RoleCues {
    bool conditional_keyword = false;    // if / elif / while / assert / return in the statement
    bool comparison_or_logical = false;  // ==, <, and, not ... around the marker
    bool nested = false;                 // inside a call or collection literal
    bool bare_variable_lhs = false;      // statement is exactly `name ~ish ...`
    bool has_right_operand = false;
};

[[nodiscard]] ToleranceRole resolve_tolerance_role(const RoleCues& cues) noexcept;

// Statement-level detectors in priority order: loops, statistical assertions, gates, declarations,
// sorta print, reassignment, tolerance assignment. The statement excludes indentation and trailing comments;
// column_offset is its position within the line.
[[nodiscard]] StatementNode classify_statement(std::string_view statement,
                                               const SourceLine& line,
                                               std::size_t column_offset);

// Rightmost inline marker of the fragment, or nothing when only plain `~` operators remain.
[[nodiscard]] std::optional<InlineNode> find_inline_marker(std::string_view text,
                                                           const CharMask& mask,
                                                           const SourceLine& line,
                                                           std::size_t column_offset);

}  // namespace libkinda
