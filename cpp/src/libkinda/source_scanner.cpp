#include "libkinda/source_scanner.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace libkinda {

namespace {

[[nodiscard]] bool is_open_bracket(char c) noexcept {
    return c == '(' || c == '[' || c == '{';
}

[[nodiscard]] bool is_close_bracket(char c) noexcept {
    return c == ')' || c == ']' || c == '}';
}

[[nodiscard]] bool brackets_pair(char open, char close) noexcept {
    return (open == '(' && close == ')') || (open == '[' && close == ']') || (open == '{' && close == '}');
}

[[nodiscard]] bool word_at(std::string_view text, const CharMask& mask, std::size_t pos, std::string_view word) {
    if (pos + word.size() > text.size() || text.substr(pos, word.size()) != word) {
        return false;
    }
    for (std::size_t i = pos; i < pos + word.size(); ++i) {
        if (!is_code(mask, i)) {
            return false;
        }
    }
    bool left_ok = pos == 0 || !is_identifier_char(text[pos - 1]);
    std::size_t after = pos + word.size();
    bool right_ok = after >= text.size() || !is_identifier_char(text[after]);
    return left_ok && right_ok;
}

[[nodiscard]] bool is_triple_quote(std::string_view line, std::size_t pos, char quote) noexcept {
    return pos + 2 < line.size() && line[pos] == quote && line[pos + 1] == quote && line[pos + 2] == quote;
}

constexpr std::array<std::string_view, 5> kLogicalWords = {"and", "or", "not", "in", "is"};

}  // namespace

CharMask classify_line(std::string_view line, QuoteState& state) {
    CharMask mask(line.size(), CharClass::Code);
    std::size_t i = 0;
    while (i < line.size()) {
        char c = line[i];
        if (state.in_string()) {
            mask[i] = CharClass::String;
            if (c == '\\' && i + 1 < line.size()) {
                mask[i + 1] = CharClass::String;
                i += 2;
                continue;
            }
            if (c == state.quote) {
                if (!state.triple) {
                    state = QuoteState{};
                } else if (is_triple_quote(line, i, state.quote)) {
                    mask[i + 1] = CharClass::String;
                    mask[i + 2] = CharClass::String;
                    state = QuoteState{};
                    i += 3;
                    continue;
                }
            }
            ++i;
            continue;
        }
        if (c == '#') {
            for (std::size_t j = i; j < line.size(); ++j) {
                mask[j] = CharClass::Comment;
            }
            break;
        }
        if (c == '"' || c == '\'') {
            bool triple = is_triple_quote(line, i, c);
            state = QuoteState{c, triple};
            std::size_t width = triple ? 3 : 1;
            for (std::size_t j = i; j < i + width; ++j) {
                mask[j] = CharClass::String;
            }
            i += width;
            continue;
        }
        ++i;
    }
    // Single-quoted strings never span lines.
    if (state.in_string() && !state.triple) {
        state = QuoteState{};
    }
    return mask;
}

CharMask classify_line(std::string_view line) {
    QuoteState state;
    return classify_line(line, state);
}

std::optional<std::size_t> comment_start(const CharMask& mask) noexcept {
    for (std::size_t i = 0; i < mask.size(); ++i) {
        if (mask[i] == CharClass::Comment) {
            return i;
        }
    }
    return std::nullopt;
}

bool is_identifier_start(char c) noexcept {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::size_t identifier_end(std::string_view text, std::size_t pos) noexcept {
    if (pos >= text.size() || !is_identifier_start(text[pos])) {
        return pos;
    }
    std::size_t end = pos + 1;
    while (end < text.size() && is_identifier_char(text[end])) {
        ++end;
    }
    return end;
}

bool is_identifier(std::string_view text) noexcept {
    return !text.empty() && identifier_end(text, 0) == text.size();
}

bool is_dotted_name(std::string_view text) noexcept {
    if (text.empty()) {
        return false;
    }
    std::size_t pos = 0;
    while (true) {
        std::size_t end = identifier_end(text, pos);
        if (end == pos) {
            return false;
        }
        if (end == text.size()) {
            return true;
        }
        if (text[end] != '.') {
            return false;
        }
        pos = end + 1;
    }
}

std::string_view trim(std::string_view text) noexcept {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

std::string_view leading_whitespace(std::string_view text) noexcept {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return text;
    }
    return text.substr(0, first);
}

std::optional<std::size_t> matching_close(std::string_view text, const CharMask& mask, std::size_t open) {
    if (open >= text.size() || !is_open_bracket(text[open]) || !is_code(mask, open)) {
        return std::nullopt;
    }
    std::vector<char> stack;
    for (std::size_t i = open; i < text.size(); ++i) {
        if (!is_code(mask, i)) {
            continue;
        }
        char c = text[i];
        if (is_open_bracket(c)) {
            stack.push_back(c);
        } else if (is_close_bracket(c)) {
            if (stack.empty() || !brackets_pair(stack.back(), c)) {
                return std::nullopt;
            }
            stack.pop_back();
            if (stack.empty()) {
                return i;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> matching_open(std::string_view text, const CharMask& mask, std::size_t close) {
    if (close >= text.size() || !is_close_bracket(text[close]) || !is_code(mask, close)) {
        return std::nullopt;
    }
    std::vector<char> stack;
    for (std::size_t i = close + 1; i-- > 0;) {
        if (!is_code(mask, i)) {
            continue;
        }
        char c = text[i];
        if (is_close_bracket(c)) {
            stack.push_back(c);
        } else if (is_open_bracket(c)) {
            if (stack.empty() || !brackets_pair(c, stack.back())) {
                return std::nullopt;
            }
            stack.pop_back();
            if (stack.empty()) {
                return i;
            }
        }
    }
    return std::nullopt;
}

int depth_at(std::string_view text, const CharMask& mask, std::size_t pos) {
    int depth = 0;
    for (std::size_t i = 0; i < pos && i < text.size(); ++i) {
        if (!is_code(mask, i)) {
            continue;
        }
        if (is_open_bracket(text[i])) {
            ++depth;
        } else if (is_close_bracket(text[i]) && depth > 0) {
            --depth;
        }
    }
    return depth;
}

int net_bracket_depth(std::string_view text, const CharMask& mask) {
    int depth = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!is_code(mask, i)) {
            continue;
        }
        if (is_open_bracket(text[i])) {
            ++depth;
        } else if (is_close_bracket(text[i])) {
            --depth;
        }
    }
    return depth;
}

bool brackets_balanced(std::string_view text, const CharMask& mask) {
    std::vector<char> stack;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!is_code(mask, i)) {
            continue;
        }
        char c = text[i];
        if (is_open_bracket(c)) {
            stack.push_back(c);
        } else if (is_close_bracket(c)) {
            if (stack.empty() || !brackets_pair(stack.back(), c)) {
                return false;
            }
            stack.pop_back();
        }
    }
    return stack.empty();
}

std::optional<std::size_t> find_top_level(std::string_view text, const CharMask& mask, char c, std::size_t from) {
    int depth = depth_at(text, mask, from);
    for (std::size_t i = from; i < text.size(); ++i) {
        if (!is_code(mask, i)) {
            continue;
        }
        char ch = text[i];
        if (ch == c && depth == 0) {
            return i;
        }
        if (is_open_bracket(ch)) {
            ++depth;
        } else if (is_close_bracket(ch) && depth > 0) {
            --depth;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> find_top_level_word(std::string_view text,
                                               const CharMask& mask,
                                               std::string_view word,
                                               std::size_t from) {
    int depth = depth_at(text, mask, from);
    for (std::size_t i = from; i < text.size(); ++i) {
        if (!is_code(mask, i)) {
            continue;
        }
        char ch = text[i];
        if (depth == 0 && word_at(text, mask, i, word)) {
            return i;
        }
        if (is_open_bracket(ch)) {
            ++depth;
        } else if (is_close_bracket(ch) && depth > 0) {
            --depth;
        }
    }
    return std::nullopt;
}

bool has_comparison_or_logical(std::string_view text, const CharMask& mask, std::size_t begin, std::size_t end) {
    end = std::min(end, text.size());
    for (std::size_t i = begin; i < end; ++i) {
        if (!is_code(mask, i)) {
            continue;
        }
        char c = text[i];
        char next = i + 1 < end ? text[i + 1] : '\0';
        char prev = i > 0 ? text[i - 1] : '\0';
        if ((c == '=' || c == '!') && next == '=') {
            return true;
        }
        if ((c == '<' || c == '>') && next != c && prev != c) {
            return true;
        }
        for (std::string_view word : kLogicalWords) {
            if (word_at(text, mask, i, word)) {
                return true;
            }
        }
    }
    return false;
}

bool contains_word(std::string_view text, const CharMask& mask, std::string_view word) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (word_at(text, mask, i, word)) {
            return true;
        }
    }
    return false;
}

}  // namespace libkinda
