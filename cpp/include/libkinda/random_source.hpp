#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace libkinda {

class RandomSource {
public:
    RandomSource();

    explicit RandomSource(std::uint64_t seed);

    void reseed(std::uint64_t seed);

    [[nodiscard]] std::optional<std::uint64_t> seed() const noexcept { return seed_; }

    // Uniform draw in [0, 1).
    double uniform();

    double uniform(double low, double high);

    std::int64_t uniform_int(std::int64_t low, std::int64_t high);

    double normal(double mean, double stddev);

    bool bernoulli(double probability);

    std::size_t weighted_index(const std::vector<double>& weights);

private:
    std::mt19937_64 engine_;
    std::optional<std::uint64_t> seed_;
};

}  // namespace libkinda
