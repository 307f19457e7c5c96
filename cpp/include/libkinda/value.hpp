#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace libkinda {

// Plain values exchanged with transformed code.
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

// Numeric view of a value: bools as 0/1, strings parsed in full, none otherwise.
[[nodiscard]] std::optional<double> to_number(const Value& value);

[[nodiscard]] bool is_integral(const Value& value) noexcept;

// Nearest 64-bit integer, or nothing when the rounded value falls outside the int64 range.
[[nodiscard]] std::optional<std::int64_t> round_to_int64(double number) noexcept;

// Integral results are rounded to the nearest integer; values beyond the int64 range stay real.
[[nodiscard]] Value from_number(double number, bool integral);

[[nodiscard]] std::string to_display_string(const Value& value);

}  // namespace libkinda
