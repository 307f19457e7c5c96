#pragma once

#include <cstddef>
#include <vector>

namespace libkinda {

// Maps each output line to the input line it came from; 0 marks inserted lines. Lines are 1-based.
class SourceMap {
public:
    void append(std::size_t original_line);

    [[nodiscard]] std::size_t original_line(std::size_t output_line) const;

    // First output line produced from the given input line, 0 when none.
    [[nodiscard]] std::size_t output_line(std::size_t original_line) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return lines_.size(); }

    // True when every output line maps to the input line with the same number.
    [[nodiscard]] bool is_identity() const noexcept;

    [[nodiscard]] const std::vector<std::size_t>& lines() const noexcept { return lines_; }

private:
    std::vector<std::size_t> lines_;
};

}  // namespace libkinda
