#include "libkinda/value.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace libkinda {

namespace {

[[nodiscard]] std::optional<double> parse_number(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    auto last = text.find_last_not_of(" \t\r\n");
    std::string trimmed = text.substr(first, last - first + 1);

    errno = 0;
    char* end = nullptr;
    double parsed = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size() || errno == ERANGE || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace

std::optional<double> to_number(const Value& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? 1.0 : 0.0;
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        if (!std::isfinite(*d)) {
            return std::nullopt;
        }
        return *d;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return parse_number(*s);
    }
    return std::nullopt;
}

bool is_integral(const Value& value) noexcept {
    return std::holds_alternative<std::int64_t>(value);
}

std::optional<std::int64_t> round_to_int64(double number) noexcept {
    // 2^63 is exact in a double; the int64 range is [-2^63, 2^63).
    constexpr double kLimit = 9223372036854775808.0;
    double rounded = std::round(number);
    if (!(rounded >= -kLimit && rounded < kLimit)) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(rounded);
}

Value from_number(double number, bool integral) {
    if (integral) {
        if (auto rounded = round_to_int64(number)) {
            return *rounded;
        }
    }
    return number;
}

std::string to_display_string(const Value& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return "None";
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "True" : "False";
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    std::ostringstream out;
    out << std::get<double>(value);
    return out.str();
}

}  // namespace libkinda
