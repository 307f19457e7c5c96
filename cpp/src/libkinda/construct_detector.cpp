#include "libkinda/construct_detector.hpp"

#include "libkinda/errors.hpp"
#include "libkinda/fuzzy_match.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <utility>

namespace libkinda {

namespace {

constexpr std::array<std::pair<std::string_view, GateTier>, 4> kGateWords = {{
    {"sometimes", GateTier::Sometimes},
    {"maybe", GateTier::Maybe},
    {"probably", GateTier::Probably},
    {"rarely", GateTier::Rarely},
}};

constexpr std::array<std::pair<std::string_view, LoopKind>, 4> kLoopWords = {{
    {"sometimes_while", LoopKind::SometimesWhile},
    {"maybe_for", LoopKind::MaybeFor},
    {"kinda_repeat", LoopKind::KindaRepeat},
    {"eventually_until", LoopKind::EventuallyUntil},
}};

constexpr std::array<std::pair<std::string_view, FuzzyType>, 4> kTypeWords = {{
    {"int", FuzzyType::Int},
    {"float", FuzzyType::Float},
    {"bool", FuzzyType::Bool},
    {"binary", FuzzyType::Binary},
}};

constexpr std::array<std::pair<std::string_view, AssertionKind>, 2> kAssertionWords = {{
    {"assert_eventually", AssertionKind::Eventually},
    {"assert_probability", AssertionKind::Probability},
}};

// Keywords that end the primary expression of ~welp when scanning to the left.
constexpr std::array<std::string_view, 9> kWelpLeftStops = {"return", "yield", "if", "elif", "while",
                                                            "assert", "else", "in", "raise"};

constexpr std::array<std::string_view, 8> kOperandStopWords = {"and", "or", "not", "if", "else", "in", "is", "for"};
constexpr std::array<std::string_view, 5> kConditionalWords = {"if", "elif", "while", "assert", "return"};

[[noreturn]] void fail(const SourceLine& line, std::size_t column, const std::string& message) {
    throw TransformError(message, line.number, column, std::string(line.text));
}

[[nodiscard]] std::optional<GateTier> gate_from(std::string_view word) noexcept {
    for (const auto& [name, tier] : kGateWords) {
        if (name == word) {
            return tier;
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<LoopKind> loop_from(std::string_view word) noexcept {
    for (const auto& [name, kind] : kLoopWords) {
        if (name == word) {
            return kind;
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<AssertionKind> assertion_from(std::string_view word) noexcept {
    for (const auto& [name, kind] : kAssertionWords) {
        if (name == word) {
            return kind;
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::string_view marker_word(std::string_view text, std::size_t tilde) noexcept {
    std::size_t end = identifier_end(text, tilde + 1);
    return text.substr(tilde + 1, end - tilde - 1);
}

[[nodiscard]] std::size_t skip_spaces(std::string_view text, std::size_t pos) noexcept {
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
        ++pos;
    }
    return pos;
}

[[nodiscard]] bool is_stop_word(std::string_view word) noexcept {
    return std::find(kOperandStopWords.begin(), kOperandStopWords.end(), word) != kOperandStopWords.end();
}

[[nodiscard]] std::string strip_outer_parens(std::string_view text) {
    text = trim(text);
    if (text.size() >= 2 && text.front() == '(') {
        auto mask = classify_line(text);
        auto close = matching_close(text, mask, 0);
        if (close && *close == text.size() - 1) {
            return std::string(trim(text.substr(1, text.size() - 2)));
        }
    }
    return std::string(text);
}

// Unrecognized words this close to the vocabulary are treated as misspelled markers
// rather than the bitwise-not operator applied to a name.
[[nodiscard]] bool looks_misspelled(std::string_view word) {
    if (word.size() < 4) {
        return false;
    }
    std::size_t limit = word.size() <= 5 ? 1 : 2;
    for (const auto& candidate : marker_vocabulary()) {
        if (edit_distance(word, candidate) <= limit) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] std::string unknown_marker_message(std::string_view word) {
    std::string message = "unknown fuzzy marker '~" + std::string(word) + "'";
    auto close = suggestions(word, marker_vocabulary());
    if (!close.empty()) {
        message += " (did you mean '~" + close.front() + "'?)";
    }
    return message;
}

// End of the dotted name at the start of text, 0 when there is none.
[[nodiscard]] std::size_t dotted_name_end(std::string_view text) noexcept {
    std::size_t pos = 0;
    std::size_t end = 0;
    while (true) {
        std::size_t segment_end = identifier_end(text, pos);
        if (segment_end == pos) {
            return end;
        }
        end = segment_end;
        if (end >= text.size() || text[end] != '.') {
            return end;
        }
        pos = end + 1;
    }
}

[[nodiscard]] bool starts_operand(std::string_view text, const CharMask& mask, std::size_t k) {
    if (k >= text.size()) {
        return false;
    }
    if (mask[k] == CharClass::String) {
        return true;
    }
    if (!is_code(mask, k)) {
        return false;
    }
    char c = text[k];
    if (is_identifier_start(c)) {
        return !is_stop_word(text.substr(k, identifier_end(text, k) - k));
    }
    if (std::isdigit(static_cast<unsigned char>(c))) {
        return true;
    }
    if (c == '.' && k + 1 < text.size() && std::isdigit(static_cast<unsigned char>(text[k + 1]))) {
        return true;
    }
    if (c == '(' || c == '[' || c == '{') {
        return true;
    }
    if (c == '-' || c == '+' || c == '~') {
        return k + 1 < text.size() && text[k + 1] != ' ' && starts_operand(text, mask, k + 1);
    }
    return false;
}

[[nodiscard]] std::optional<std::size_t> operand_end(std::string_view text, const CharMask& mask, std::size_t k) {
    std::size_t i = k;
    while (i < text.size() && (text[i] == '-' || text[i] == '+' || text[i] == '~') && is_code(mask, i)) {
        ++i;
    }
    while (i < text.size()) {
        if (mask[i] == CharClass::String) {
            while (i < text.size() && mask[i] == CharClass::String) {
                ++i;
            }
            continue;
        }
        char c = text[i];
        if (c == '(' || c == '[' || c == '{') {
            auto close = matching_close(text, mask, i);
            if (!close) {
                return std::nullopt;
            }
            i = *close + 1;
            continue;
        }
        if (is_identifier_char(c) || c == '.') {
            ++i;
            continue;
        }
        break;
    }
    return i;
}

[[nodiscard]] std::optional<std::size_t> operand_start(std::string_view text, const CharMask& mask, std::size_t end) {
    std::size_t i = end;
    while (i > 0) {
        char c = text[i - 1];
        if (mask[i - 1] == CharClass::String) {
            while (i > 0 && mask[i - 1] == CharClass::String) {
                --i;
            }
            continue;
        }
        if (c == ')' || c == ']' || c == '}') {
            auto open = matching_open(text, mask, i - 1);
            if (!open) {
                return std::nullopt;
            }
            i = *open;
            continue;
        }
        if (is_identifier_char(c) || c == '.' || c == '~') {
            --i;
            continue;
        }
        break;
    }
    if (i > 0 && i < end && text[i - 1] == '-') {
        std::size_t before = i - 1;
        while (before > 0 && text[before - 1] == ' ') {
            --before;
        }
        if (before == 0 || std::strchr("=(,[{:+-*/%<>!", text[before - 1]) != nullptr) {
            --i;
        }
    }
    return i;
}

// Start of the ~welp primary: scans left at the marker's depth to an opening bracket, a separator,
// an assignment or a statement keyword.
[[nodiscard]] std::optional<std::size_t> welp_left_begin(std::string_view text, const CharMask& mask, std::size_t marker) {
    std::size_t i = marker;
    while (i > 0) {
        char c = text[i - 1];
        if (mask[i - 1] == CharClass::String) {
            while (i > 0 && mask[i - 1] == CharClass::String) {
                --i;
            }
            continue;
        }
        if (c == ')' || c == ']' || c == '}') {
            auto open = matching_open(text, mask, i - 1);
            if (!open) {
                return std::nullopt;
            }
            i = *open;
            continue;
        }
        if (c == '(' || c == '[' || c == '{' || c == ',' || c == ';' || c == ':') {
            break;
        }
        if (c == '=') {
            bool comparison = (i >= 2 && std::strchr("=!<>", text[i - 2]) != nullptr) || text[i] == '=';
            if (!comparison) {
                break;
            }
            i = i >= 2 ? i - 2 : 0;
            continue;
        }
        if (is_identifier_char(c)) {
            std::size_t end = i;
            while (i > 0 && is_identifier_char(text[i - 1])) {
                --i;
            }
            std::string_view word = text.substr(i, end - i);
            if (std::find(kWelpLeftStops.begin(), kWelpLeftStops.end(), word) != kWelpLeftStops.end()) {
                i = end;
                break;
            }
            continue;
        }
        --i;
    }
    while (i < marker && (text[i] == ' ' || text[i] == '\t')) {
        ++i;
    }
    return i;
}

// End of the ~welp fallback: a separator or closing bracket at depth zero, a comprehension's `for`,
// or the end of the code.
[[nodiscard]] std::optional<std::size_t> welp_right_end(std::string_view text, const CharMask& mask, std::size_t from) {
    std::size_t i = from;
    while (i < text.size()) {
        if (mask[i] == CharClass::Comment) {
            break;
        }
        if (mask[i] == CharClass::String) {
            ++i;
            continue;
        }
        char c = text[i];
        if (c == '(' || c == '[' || c == '{') {
            auto close = matching_close(text, mask, i);
            if (!close) {
                return std::nullopt;
            }
            i = *close + 1;
            continue;
        }
        if (c == ')' || c == ']' || c == '}' || c == ',' || c == ';' || c == ':') {
            break;
        }
        if (is_identifier_start(c) && (i == 0 || !is_identifier_char(text[i - 1]))) {
            std::size_t end = identifier_end(text, i);
            if (text.substr(i, end - i) == "for") {
                break;
            }
            i = end;
            continue;
        }
        ++i;
    }
    while (i > from && (text[i - 1] == ' ' || text[i - 1] == '\t')) {
        --i;
    }
    return i;
}

[[nodiscard]] LoopConstruct parse_loop(std::string_view statement,
                                       const CharMask& mask,
                                       LoopKind kind,
                                       std::size_t after,
                                       const SourceLine& line,
                                       std::size_t column) {
    std::string keyword = "~" + to_string(kind);
    if (!brackets_balanced(statement, mask)) {
        fail(line, column + 1, "unbalanced brackets in " + keyword + " header");
    }
    auto colon = find_top_level(statement, mask, ':', after);
    if (!colon) {
        fail(line, column + statement.size() + 1, "expected ':' to open the " + keyword + " block");
    }

    LoopConstruct loop;
    loop.kind = kind;
    loop.trailing = std::string(statement.substr(*colon + 1));
    std::string_view head = trim(statement.substr(after, *colon - after));
    std::size_t head_column = column + after + 1;

    switch (kind) {
        case LoopKind::SometimesWhile:
        case LoopKind::EventuallyUntil:
            if (head.empty()) {
                fail(line, head_column, keyword + " needs a condition");
            }
            loop.expression = strip_outer_parens(head);
            break;
        case LoopKind::KindaRepeat: {
            auto head_mask = classify_line(head);
            std::optional<std::size_t> close;
            if (!head.empty() && head.front() == '(') {
                close = matching_close(head, head_mask, 0);
            }
            if (!close || *close != head.size() - 1 || trim(head.substr(1, head.size() - 2)).empty()) {
                fail(line, head_column, "~kinda_repeat expects a count in parentheses");
            }
            loop.expression = std::string(trim(head.substr(1, head.size() - 2)));
            break;
        }
        case LoopKind::MaybeFor: {
            auto head_mask = classify_line(head);
            auto in_pos = find_top_level_word(head, head_mask, "in");
            if (!in_pos) {
                fail(line, head_column, "~maybe_for expects '<target> in <iterable>'");
            }
            loop.target = std::string(trim(head.substr(0, *in_pos)));
            loop.expression = std::string(trim(head.substr(*in_pos + 2)));
            if (loop.target.empty() || loop.expression.empty()) {
                fail(line, head_column, "~maybe_for expects '<target> in <iterable>'");
            }
            break;
        }
    }
    return loop;
}

[[nodiscard]] StatementNode parse_gate(std::string_view statement,
                                       const CharMask& mask,
                                       GateTier tier,
                                       std::string keyword,
                                       std::size_t marker,
                                       std::size_t after,
                                       const SourceLine& line,
                                       std::size_t column) {
    std::string name = "~" + to_string(tier);
    std::size_t next = skip_spaces(statement, after);
    bool parenthesized = next < statement.size() && statement[next] == '(';

    auto colon = find_top_level(statement, mask, ':', after);
    if (!colon) {
        if (marker == 0 && parenthesized) {
            return PlainStatement{};
        }
        fail(line, column + statement.size() + 1, "expected ':' after the " + name + " condition");
    }
    // `if ~maybe(x) and y:` keeps its own structure; only the gate call is rewritten.
    if (marker > 0 && parenthesized) {
        return PlainStatement{};
    }
    if (!brackets_balanced(statement, mask)) {
        fail(line, column + marker + 1, "unbalanced brackets in " + name + " condition");
    }

    ConditionalGate node;
    node.tier = tier;
    node.keyword = std::move(keyword);
    node.condition = strip_outer_parens(statement.substr(after, *colon - after));
    node.trailing = std::string(statement.substr(*colon + 1));
    return node;
}

[[nodiscard]] FuzzyDeclaration parse_declaration(std::string_view statement,
                                                 std::size_t after,
                                                 const SourceLine& line,
                                                 std::size_t column) {
    std::size_t type_begin = skip_spaces(statement, after);
    std::size_t type_end = identifier_end(statement, type_begin);
    if (type_begin == after || type_end == type_begin) {
        fail(line, column + after + 1, "expected a type after ~kinda");
    }
    std::string_view type_word = statement.substr(type_begin, type_end - type_begin);

    FuzzyDeclaration node;
    bool known = false;
    for (const auto& [name, type] : kTypeWords) {
        if (name == type_word) {
            node.type = type;
            known = true;
        }
    }
    if (!known) {
        std::string message = "unknown fuzzy type '" + std::string(type_word) + "'";
        auto close = suggestions(type_word, {"int", "float", "bool", "binary"}, 2);
        if (!close.empty()) {
            message += " (did you mean '" + close.front() + "'?)";
        }
        fail(line, column + type_begin + 1, message);
    }

    std::size_t name_begin = skip_spaces(statement, type_end);
    std::size_t name_end = identifier_end(statement, name_begin);
    if (name_begin == type_end || name_end == name_begin) {
        fail(line, column + name_begin + 1, "expected a variable name after ~kinda " + std::string(type_word));
    }
    node.name = std::string(statement.substr(name_begin, name_end - name_begin));

    std::string_view rest = trim(statement.substr(name_end));
    if (node.type == FuzzyType::Binary) {
        if (!rest.empty()) {
            fail(line, column + name_end + 1, "~kinda binary takes no value");
        }
        return node;
    }
    if (rest.empty() || rest.front() != '=' || (rest.size() > 1 && rest[1] == '=')) {
        fail(line, column + name_end + 1, "expected '=' after ~kinda " + std::string(type_word) + " " + node.name);
    }
    node.expression = std::string(trim(rest.substr(1)));
    if (node.expression.empty()) {
        fail(line, column + statement.size() + 1, "~kinda " + std::string(type_word) + " needs a value");
    }
    return node;
}

[[nodiscard]] StatisticalAssertion parse_assertion(std::string_view statement,
                                                   AssertionKind kind,
                                                   std::size_t after,
                                                   const SourceLine& line,
                                                   std::size_t column) {
    std::string keyword = "~" + to_string(kind);
    std::size_t open = skip_spaces(statement, after);
    auto mask = classify_line(statement);
    if (open >= statement.size() || statement[open] != '(') {
        fail(line, column + open + 1, "expected '(' after " + keyword);
    }
    auto close = matching_close(statement, mask, open);
    if (!close) {
        fail(line, column + open + 1, "unbalanced parentheses after " + keyword);
    }
    if (!trim(statement.substr(*close + 1)).empty()) {
        fail(line, column + *close + 2, "unexpected text after " + keyword + "(...)");
    }

    std::string_view inner = statement.substr(open + 1, *close - open - 1);
    auto inner_mask = classify_line(inner);
    auto comma = find_top_level(inner, inner_mask, ',');
    StatisticalAssertion node;
    node.kind = kind;
    node.subject = std::string(trim(inner.substr(0, comma.value_or(inner.size()))));
    if (comma) {
        node.arguments = std::string(trim(inner.substr(*comma + 1)));
    }
    if (node.subject.empty()) {
        fail(line, column + open + 2, keyword + " needs a condition to sample");
    }
    return node;
}

[[nodiscard]] SortaPrint parse_sorta(std::string_view statement,
                                     std::size_t after,
                                     const SourceLine& line,
                                     std::size_t column) {
    std::size_t word_begin = skip_spaces(statement, after);
    std::size_t word_end = identifier_end(statement, word_begin);
    std::size_t open = skip_spaces(statement, word_end);
    bool ok = word_begin > after && statement.substr(word_begin, word_end - word_begin) == "print" &&
              open < statement.size() && statement[open] == '(';
    if (ok) {
        auto mask = classify_line(statement);
        auto close = matching_close(statement, mask, open);
        if (close && trim(statement.substr(*close + 1)).empty()) {
            return SortaPrint{std::string(statement.substr(open + 1, *close - open - 1))};
        }
    }
    fail(line, column + after + 1, "~sorta expects print(...)");
}

}  // namespace

std::string to_string(GateTier tier) {
    for (const auto& [name, value] : kGateWords) {
        if (value == tier) {
            return std::string(name);
        }
    }
    return "unknown";
}

std::string to_string(LoopKind kind) {
    for (const auto& [name, value] : kLoopWords) {
        if (value == kind) {
            return std::string(name);
        }
    }
    return "unknown";
}

std::string to_string(FuzzyType type) {
    for (const auto& [name, value] : kTypeWords) {
        if (value == type) {
            return std::string(name);
        }
    }
    return "unknown";
}

std::string to_string(AssertionKind kind) {
    for (const auto& [name, value] : kAssertionWords) {
        if (value == kind) {
            return std::string(name);
        }
    }
    return "unknown";
}

std::string to_string(ToleranceRole role) {
    switch (role) {
        case ToleranceRole::Comparison: return "comparison";
        case ToleranceRole::Assignment: return "assignment";
        case ToleranceRole::Value: return "value";
    }
    return "unknown";
}

const std::vector<std::string>& marker_vocabulary() {
    static const std::vector<std::string> vocabulary = [] {
        std::vector<std::string> words;
        for (const auto& entry : kLoopWords) {
            words.emplace_back(entry.first);
        }
        for (const auto& entry : kGateWords) {
            words.emplace_back(entry.first);
        }
        words.emplace_back("kinda");
        words.emplace_back("sorta");
        words.emplace_back("ish");
        words.emplace_back("welp");
        for (const auto& entry : kAssertionWords) {
            words.emplace_back(entry.first);
        }
        return words;
    }();
    return vocabulary;
}

ToleranceRole resolve_tolerance_role(const RoleCues& cues) noexcept {
    if (!cues.has_right_operand) {
        return cues.bare_variable_lhs ? ToleranceRole::Assignment : ToleranceRole::Value;
    }
    if (cues.conditional_keyword || cues.comparison_or_logical || cues.nested) {
        return ToleranceRole::Comparison;
    }
    return cues.bare_variable_lhs ? ToleranceRole::Assignment : ToleranceRole::Comparison;
}

StatementNode classify_statement(std::string_view statement, const SourceLine& line, std::size_t column_offset) {
    if (statement.empty()) {
        return PlainStatement{};
    }
    auto mask = classify_line(statement);

    std::size_t marker = 0;
    std::string keyword = "if";
    for (std::string_view lead : {std::string_view("if"), std::string_view("elif")}) {
        std::size_t end = identifier_end(statement, 0);
        if (statement.substr(0, end) == lead) {
            std::size_t next = skip_spaces(statement, end);
            if (next > end && next < statement.size() && statement[next] == '~' &&
                gate_from(marker_word(statement, next))) {
                marker = next;
                keyword = std::string(lead);
            }
        }
    }

    if (statement[marker] == '~' && is_code(mask, marker)) {
        std::string_view word = marker_word(statement, marker);
        std::size_t after = marker + 1 + word.size();
        if (marker == 0) {
            if (auto kind = loop_from(word)) {
                return parse_loop(statement, mask, *kind, after, line, column_offset);
            }
            if (word == "kinda") {
                return parse_declaration(statement, after, line, column_offset);
            }
            if (word == "sorta") {
                return parse_sorta(statement, after, line, column_offset);
            }
            if (auto kind = assertion_from(word)) {
                return parse_assertion(statement, *kind, after, line, column_offset);
            }
        }
        if (auto tier = gate_from(word)) {
            return parse_gate(statement, mask, *tier, keyword, marker, after, line, column_offset);
        }
    }

    std::size_t name_end = dotted_name_end(statement);
    if (name_end == 0) {
        return PlainStatement{};
    }
    std::size_t op = skip_spaces(statement, name_end);
    std::string name(statement.substr(0, name_end));

    if (statement.substr(op, 2) == "~=" && is_code(mask, op)) {
        std::string expression(trim(statement.substr(op + 2)));
        if (expression.empty()) {
            fail(line, column_offset + op + 1, "'~=' needs a value");
        }
        return FuzzyReassignment{name, expression};
    }

    if (statement.substr(op, 4) == "~ish" && is_code(mask, op) &&
        (op + 4 >= statement.size() || !is_identifier_char(statement[op + 4]))) {
        std::string_view rest = trim(statement.substr(op + 4));
        RoleCues cues;
        cues.bare_variable_lhs = true;
        cues.has_right_operand = !rest.empty();
        cues.comparison_or_logical = has_comparison_or_logical(statement, mask, op + 4, statement.size());
        if (resolve_tolerance_role(cues) == ToleranceRole::Assignment) {
            if (!rest.empty() && rest.front() == '=') {
                fail(line, column_offset + op + 5, "unexpected '=' after ~ish");
            }
            ToleranceAssignment node;
            node.variable = name;
            if (!rest.empty()) {
                node.target = std::string(rest);
            }
            return node;
        }
    }
    return PlainStatement{};
}

std::optional<InlineNode> find_inline_marker(std::string_view text,
                                             const CharMask& mask,
                                             const SourceLine& line,
                                             std::size_t column_offset) {
    std::vector<std::size_t> markers;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '~' && is_code(mask, i)) {
            markers.push_back(i);
        }
    }

    for (auto it = markers.rbegin(); it != markers.rend(); ++it) {
        std::size_t p = *it;
        std::size_t column = column_offset + p + 1;
        if (p + 1 < text.size() && text[p + 1] == '=') {
            fail(line, column, "'~=' must follow a variable at the start of a statement");
        }
        std::string_view word = marker_word(text, p);
        std::size_t after = p + 1 + word.size();

        if (word == "welp") {
            auto begin = welp_left_begin(text, mask, p);
            if (!begin) {
                fail(line, column, "unbalanced brackets before ~welp");
            }
            std::size_t primary_end = p;
            while (primary_end > *begin && (text[primary_end - 1] == ' ' || text[primary_end - 1] == '\t')) {
                --primary_end;
            }
            if (primary_end == *begin) {
                fail(line, column, "~welp needs an expression on its left");
            }
            std::size_t next = skip_spaces(text, after);
            auto end = welp_right_end(text, mask, next);
            if (!end) {
                fail(line, column_offset + next + 1, "unbalanced brackets after ~welp");
            }
            if (*end <= next) {
                fail(line, column, "~welp needs a fallback value on its right");
            }
            return WelpFallback{*begin, *end, std::string(text.substr(*begin, primary_end - *begin)),
                                std::string(text.substr(next, *end - next))};
        }

        bool postfix = p > 0 && is_identifier_char(text[p - 1]);
        std::size_t next_word = skip_spaces(text, after);
        bool time_drift = word == "time" && text.substr(next_word, identifier_end(text, next_word) - next_word) == "drift";
        if (time_drift || (word == "drift" && postfix)) {
            fail(line, column, "time drift variables are not supported");
        }

        if (auto tier = gate_from(word)) {
            std::size_t next = skip_spaces(text, after);
            if (next < text.size() && text[next] == '(' && is_code(mask, next)) {
                auto close = matching_close(text, mask, next);
                if (!close) {
                    fail(line, column_offset + next + 1, "unbalanced parentheses after ~" + std::string(word));
                }
                return InlineGate{p, *close + 1, *tier, std::string(text.substr(next + 1, *close - next - 1))};
            }
            bool bare = next >= text.size() || std::strchr("),]}:", text[next]) != nullptr ||
                        (is_identifier_start(text[next]) &&
                         is_stop_word(text.substr(next, identifier_end(text, next) - next)));
            if (bare) {
                return InlineGate{p, after, *tier, {}};
            }
            fail(line, column, "expected '(' after ~" + std::string(word));
        }

        if (word == "ish") {
            std::size_t left_end = p;
            while (left_end > 0 && (text[left_end - 1] == ' ' || text[left_end - 1] == '\t')) {
                --left_end;
            }
            auto left_begin = operand_start(text, mask, left_end);
            if (!left_begin) {
                fail(line, column, "unbalanced brackets before ~ish");
            }
            if (*left_begin == left_end) {
                fail(line, column, "~ish needs a value on its left");
            }

            std::size_t next = skip_spaces(text, after);
            std::size_t right_end = after;
            bool has_right = starts_operand(text, mask, next);
            if (has_right) {
                auto end = operand_end(text, mask, next);
                if (!end) {
                    fail(line, column_offset + next + 1, "unbalanced brackets after ~ish");
                }
                right_end = *end;
                has_right = right_end > next;
            }

            RoleCues cues;
            cues.has_right_operand = has_right;
            cues.nested = depth_at(text, mask, *left_begin) > 0;
            cues.comparison_or_logical = has_comparison_or_logical(text, mask, 0, *left_begin) ||
                                         has_comparison_or_logical(text, mask, right_end, text.size());
            for (std::string_view conditional : kConditionalWords) {
                cues.conditional_keyword = cues.conditional_keyword || contains_word(text, mask, conditional);
            }

            std::string left(text.substr(*left_begin, left_end - *left_begin));
            if (resolve_tolerance_role(cues) == ToleranceRole::Value) {
                return ToleranceValue{*left_begin, after, left};
            }
            return ToleranceComparison{*left_begin, right_end, left, std::string(text.substr(next, right_end - next))};
        }

        if (loop_from(word) || assertion_from(word) || word == "kinda" || word == "sorta") {
            fail(line, column, "~" + std::string(word) + " must start a statement");
        }
        if (looks_misspelled(word)) {
            fail(line, column, unknown_marker_message(word));
        }
    }
    return std::nullopt;
}

}  // namespace libkinda
