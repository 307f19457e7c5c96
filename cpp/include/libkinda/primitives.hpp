#pragma once

#include "libkinda/chaos_events.hpp"
#include "libkinda/personality.hpp"
#include "libkinda/value.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace libkinda {

class Runtime;

// Gate draw: the condition must hold and a draw against the tier probability must pass.
// A false condition never consumes a draw.
bool gate(Runtime& runtime, ConstructKind tier, bool condition = true);

bool sometimes(Runtime& runtime, bool condition = true);
bool maybe(Runtime& runtime, bool condition = true);
bool probably(Runtime& runtime, bool condition = true);
bool rarely(Runtime& runtime, bool condition = true);

// Rounds to the nearest integer and adds the integer fuzz; throws std::out_of_range beyond int64.
std::int64_t kinda_int(Runtime& runtime, double value);
double kinda_float(Runtime& runtime, double value);
bool kinda_bool(Runtime& runtime, bool value);

// 1, -1 or 0 drawn with the mood's positive/negative/neutral weights.
int kinda_binary(Runtime& runtime);

// Fuzzes by runtime type: integers, reals and bools get their kinda_* noise; other values pass through.
Value fuzzy_assign(Runtime& runtime, const std::string& name, const Value& value);

// Writes the values separated by spaces when the sorta-print gate passes. Returns whether it printed.
bool sorta_print(Runtime& runtime, const std::vector<Value>& values, std::ostream& out);

// Direct tolerance implementations. Non-numeric operands compare false and pass through unchanged.
bool ish_comparison(Runtime& runtime, const Value& left, const Value& right, std::optional<double> tolerance = std::nullopt);

Value ish_value(Runtime& runtime, const Value& value, const std::optional<Value>& target = std::nullopt);

void record_welp(Runtime& runtime, const std::string& reason);
void record_welp_success(Runtime& runtime) noexcept;

// Evaluates primary and returns its result, or the fallback when primary throws a std::exception
// or produces a value is_missing accepts. Each fallback is logged as a welp event.
template <typename T, typename Primary, typename IsMissing>
T welp_fallback(Runtime& runtime, Primary&& primary, T fallback, IsMissing&& is_missing) {
    std::string reason;
    try {
        T result = primary();
        if (!is_missing(result)) {
            record_welp_success(runtime);
            return result;
        }
        reason = "expression produced nothing";
    } catch (const std::exception& e) {
        reason = e.what();
    }
    record_welp(runtime, reason + ", using the fallback");
    return fallback;
}

// None counts as missing.
Value welp_fallback(Runtime& runtime, const std::function<Value()>& primary, Value fallback);

}  // namespace libkinda
