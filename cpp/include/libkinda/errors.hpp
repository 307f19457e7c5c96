#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace libkinda {

class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& message)
        : std::invalid_argument(message) {}
};

// A statistical assertion whose sampled outcomes missed the requested behaviour.
class StatisticalAssertionError : public std::runtime_error {
public:
    explicit StatisticalAssertionError(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised for malformed or unrecognized fuzzy markers. Line and column are 1-based.
class TransformError : public std::runtime_error {
public:
    TransformError(const std::string& message, std::size_t line, std::size_t column, std::string text);

    [[nodiscard]] std::size_t line() const noexcept { return line_; }
    [[nodiscard]] std::size_t column() const noexcept { return column_; }
    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    std::string reason_;
    std::size_t line_;
    std::size_t column_;
    std::string text_;
};

}  // namespace libkinda
