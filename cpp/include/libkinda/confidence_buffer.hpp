#pragma once

#include <cstddef>
#include <vector>

namespace libkinda {

// Fixed-capacity ring of boolean outcomes; the oldest outcome is evicted first.
class ConfidenceBuffer {
public:
    static constexpr std::size_t kDefaultCapacity = 100;

    explicit ConfidenceBuffer(std::size_t capacity = kDefaultCapacity);

    void push(bool outcome);

    void clear() noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] bool full() const noexcept { return size_ == slots_.size(); }
    [[nodiscard]] std::size_t successes() const noexcept { return successes_; }

    // Proportion of true outcomes; zero when empty.
    [[nodiscard]] double proportion() const noexcept;

    // Bernoulli variance p(1 - p) of the buffered outcomes.
    [[nodiscard]] double variance() const noexcept;

    // Outcome at logical position i, 0 being the oldest.
    [[nodiscard]] bool at(std::size_t i) const;

private:
    std::vector<unsigned char> slots_;
    std::size_t head_ = 0;
    std::size_t size_ = 0;
    std::size_t successes_ = 0;
};

}  // namespace libkinda
