#include "libkinda/confidence_buffer.hpp"

#include <stdexcept>

namespace libkinda {

ConfidenceBuffer::ConfidenceBuffer(std::size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("confidence buffer capacity must be positive");
    }
    slots_.assign(capacity, 0);
}

void ConfidenceBuffer::push(bool outcome) {
    std::size_t tail = (head_ + size_) % slots_.size();
    if (full()) {
        successes_ -= slots_[head_];
        head_ = (head_ + 1) % slots_.size();
    } else {
        ++size_;
    }
    slots_[tail] = outcome ? 1 : 0;
    successes_ += slots_[tail];
}

void ConfidenceBuffer::clear() noexcept {
    head_ = 0;
    size_ = 0;
    successes_ = 0;
}

double ConfidenceBuffer::proportion() const noexcept {
    if (size_ == 0) {
        return 0.0;
    }
    return static_cast<double>(successes_) / static_cast<double>(size_);
}

double ConfidenceBuffer::variance() const noexcept {
    double p = proportion();
    return p * (1.0 - p);
}

bool ConfidenceBuffer::at(std::size_t i) const {
    if (i >= size_) {
        throw std::out_of_range("confidence buffer index out of range");
    }
    return slots_[(head_ + i) % slots_.size()] != 0;
}

}  // namespace libkinda
