#include "libkinda/errors.hpp"

#include <utility>

namespace libkinda {

namespace {

[[nodiscard]] std::string format_location(const std::string& message,
                                          std::size_t line,
                                          std::size_t column,
                                          const std::string& text) {
    std::string out = "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " + message;
    if (!text.empty()) {
        out += "\n    " + text;
    }
    return out;
}

}  // namespace

TransformError::TransformError(const std::string& message, std::size_t line, std::size_t column, std::string text)
    : std::runtime_error(format_location(message, line, column, text)),
      reason_(message),
      line_(line),
      column_(column),
      text_(std::move(text)) {}

}  // namespace libkinda
