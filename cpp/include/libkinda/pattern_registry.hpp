#pragma once

#include "libkinda/composition.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace libkinda {

// Owns composition patterns for the lifetime of the runtime; patterns are created on first request.
class PatternRegistry {
public:
    ToleranceCompositionPattern& register_pattern(const std::string& name, PatternMode mode);

    // Returns the existing pattern when the name is already registered.
    GateCompositionPattern& register_gate_pattern(const std::string& name,
                                                  CompositionStrategy strategy,
                                                  std::vector<ConstructKind> gates,
                                                  std::vector<double> weights = {},
                                                  std::size_t threshold = 1);

    [[nodiscard]] ToleranceCompositionPattern* find(const std::string& name, PatternMode mode) noexcept;
    [[nodiscard]] GateCompositionPattern* find_gate(const std::string& name) noexcept;

    [[nodiscard]] bool contains(const std::string& name, PatternMode mode) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::vector<std::string> names() const;

    void clear() noexcept;

private:
    std::map<std::pair<std::string, PatternMode>, std::unique_ptr<ToleranceCompositionPattern>> tolerance_;
    std::map<std::string, std::unique_ptr<GateCompositionPattern>> gates_;
};

}  // namespace libkinda
