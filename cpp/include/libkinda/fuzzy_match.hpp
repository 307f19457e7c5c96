#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace libkinda {

// Levenshtein distance.
[[nodiscard]] std::size_t edit_distance(std::string_view a, std::string_view b);

// Vocabulary entries within max_distance of word, closest first.
[[nodiscard]] std::vector<std::string> suggestions(std::string_view word,
                                                   const std::vector<std::string>& vocabulary,
                                                   std::size_t max_distance = 3);

}  // namespace libkinda
