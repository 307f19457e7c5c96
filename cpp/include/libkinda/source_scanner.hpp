#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace libkinda {

enum class CharClass : unsigned char {
    Code,
    String,
    Comment
};

using CharMask = std::vector<CharClass>;

// Quote state carried across lines for triple-quoted strings.
struct QuoteState {
    char quote = 0;
    bool triple = false;

    [[nodiscard]] bool in_string() const noexcept { return quote != 0; }
    bool operator==(const QuoteState& other) const = default;
};

// Classifies each byte of a line. Quote characters count as string bytes.
[[nodiscard]] CharMask classify_line(std::string_view line, QuoteState& state);
[[nodiscard]] CharMask classify_line(std::string_view line);

[[nodiscard]] inline bool is_code(const CharMask& mask, std::size_t i) noexcept {
    return i < mask.size() && mask[i] == CharClass::Code;
}

[[nodiscard]] std::optional<std::size_t> comment_start(const CharMask& mask) noexcept;

[[nodiscard]] bool is_identifier_start(char c) noexcept;
[[nodiscard]] bool is_identifier_char(char c) noexcept;

// End of the identifier starting at pos (pos itself when there is none).
[[nodiscard]] std::size_t identifier_end(std::string_view text, std::size_t pos) noexcept;

[[nodiscard]] bool is_identifier(std::string_view text) noexcept;

// Identifier segments joined by dots, e.g. self.count.
[[nodiscard]] bool is_dotted_name(std::string_view text) noexcept;

[[nodiscard]] std::string_view trim(std::string_view text) noexcept;
[[nodiscard]] std::string_view leading_whitespace(std::string_view text) noexcept;

// Index of the bracket closing the one at open, scanning only code bytes.
[[nodiscard]] std::optional<std::size_t> matching_close(std::string_view text, const CharMask& mask, std::size_t open);

// Index of the bracket opening the one at close, scanning backwards.
[[nodiscard]] std::optional<std::size_t> matching_open(std::string_view text, const CharMask& mask, std::size_t close);

// Bracket nesting depth just before pos.
[[nodiscard]] int depth_at(std::string_view text, const CharMask& mask, std::size_t pos);

// Opening minus closing brackets over the code bytes of the line.
[[nodiscard]] int net_bracket_depth(std::string_view text, const CharMask& mask);

[[nodiscard]] bool brackets_balanced(std::string_view text, const CharMask& mask);

// First code occurrence of c at bracket depth zero, at or after from.
[[nodiscard]] std::optional<std::size_t> find_top_level(std::string_view text, const CharMask& mask, char c, std::size_t from = 0);

// First whole-word code occurrence of word at bracket depth zero.
[[nodiscard]] std::optional<std::size_t> find_top_level_word(std::string_view text,
                                                             const CharMask& mask,
                                                             std::string_view word,
                                                             std::size_t from = 0);

// Whether [begin, end) holds a comparison operator or a logical keyword in code.
[[nodiscard]] bool has_comparison_or_logical(std::string_view text, const CharMask& mask, std::size_t begin, std::size_t end);

[[nodiscard]] bool contains_word(std::string_view text, const CharMask& mask, std::string_view word);

}  // namespace libkinda
