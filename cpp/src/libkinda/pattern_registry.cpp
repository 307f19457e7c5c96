#include "libkinda/pattern_registry.hpp"

#include <stdexcept>

namespace libkinda {

ToleranceCompositionPattern& PatternRegistry::register_pattern(const std::string& name, PatternMode mode) {
    if (name.empty()) {
        throw std::invalid_argument("pattern name must be non-empty");
    }
    auto key = std::make_pair(name, mode);
    auto it = tolerance_.find(key);
    if (it != tolerance_.end()) {
        return *it->second;
    }
    auto inserted = tolerance_.emplace(key, std::make_unique<ToleranceCompositionPattern>(name, mode));
    return *inserted.first->second;
}

GateCompositionPattern& PatternRegistry::register_gate_pattern(const std::string& name,
                                                               CompositionStrategy strategy,
                                                               std::vector<ConstructKind> gates,
                                                               std::vector<double> weights,
                                                               std::size_t threshold) {
    if (name.empty()) {
        throw std::invalid_argument("pattern name must be non-empty");
    }
    auto it = gates_.find(name);
    if (it != gates_.end()) {
        return *it->second;
    }
    auto pattern = std::make_unique<GateCompositionPattern>(name, strategy, std::move(gates), std::move(weights), threshold);
    auto inserted = gates_.emplace(name, std::move(pattern));
    return *inserted.first->second;
}

ToleranceCompositionPattern* PatternRegistry::find(const std::string& name, PatternMode mode) noexcept {
    auto it = tolerance_.find(std::make_pair(name, mode));
    return it == tolerance_.end() ? nullptr : it->second.get();
}

GateCompositionPattern* PatternRegistry::find_gate(const std::string& name) noexcept {
    auto it = gates_.find(name);
    return it == gates_.end() ? nullptr : it->second.get();
}

bool PatternRegistry::contains(const std::string& name, PatternMode mode) const noexcept {
    return tolerance_.contains(std::make_pair(name, mode));
}

std::size_t PatternRegistry::size() const noexcept {
    return tolerance_.size() + gates_.size();
}

std::vector<std::string> PatternRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(size());
    for (const auto& [key, pattern] : tolerance_) {
        out.push_back(key.first + ":" + to_string(key.second));
    }
    for (const auto& [name, pattern] : gates_) {
        out.push_back(name);
    }
    return out;
}

void PatternRegistry::clear() noexcept {
    tolerance_.clear();
    gates_.clear();
}

}  // namespace libkinda
