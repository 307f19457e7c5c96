#include "libkinda/source_map.hpp"

#include <stdexcept>

namespace libkinda {

void SourceMap::append(std::size_t original_line) {
    lines_.push_back(original_line);
}

std::size_t SourceMap::original_line(std::size_t output_line) const {
    if (output_line == 0 || output_line > lines_.size()) {
        throw std::out_of_range("output line out of range");
    }
    return lines_[output_line - 1];
}

std::size_t SourceMap::output_line(std::size_t original_line) const noexcept {
    for (std::size_t i = 0; i < lines_.size(); ++i) {
        if (lines_[i] == original_line) {
            return i + 1;
        }
    }
    return 0;
}

bool SourceMap::is_identity() const noexcept {
    for (std::size_t i = 0; i < lines_.size(); ++i) {
        if (lines_[i] != i + 1) {
            return false;
        }
    }
    return true;
}

}  // namespace libkinda
