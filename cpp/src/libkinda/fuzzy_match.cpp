#include "libkinda/fuzzy_match.hpp"

#include <algorithm>
#include <utility>

namespace libkinda {

std::size_t edit_distance(std::string_view a, std::string_view b) {
    std::vector<std::size_t> previous(b.size() + 1);
    std::vector<std::size_t> current(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) {
        previous[j] = j;
    }
    for (std::size_t i = 1; i <= a.size(); ++i) {
        current[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            std::size_t substitution = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
        }
        std::swap(previous, current);
    }
    return previous[b.size()];
}

std::vector<std::string> suggestions(std::string_view word,
                                     const std::vector<std::string>& vocabulary,
                                     std::size_t max_distance) {
    std::vector<std::pair<std::size_t, std::string>> ranked;
    for (const auto& candidate : vocabulary) {
        std::size_t distance = edit_distance(word, candidate);
        if (distance <= max_distance) {
            ranked.emplace_back(distance, candidate);
        }
    }
    std::sort(ranked.begin(), ranked.end());
    std::vector<std::string> out;
    out.reserve(ranked.size());
    for (auto& entry : ranked) {
        out.push_back(std::move(entry.second));
    }
    return out;
}

}  // namespace libkinda
