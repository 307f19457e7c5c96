#include "libkinda/random_source.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace libkinda {

RandomSource::RandomSource()
    : engine_(std::random_device{}()) {}

RandomSource::RandomSource(std::uint64_t seed)
    : engine_(seed), seed_(seed) {}

void RandomSource::reseed(std::uint64_t seed) {
    engine_.seed(seed);
    seed_ = seed;
}

double RandomSource::uniform() {
    return std::uniform_real_distribution<double>(0.0, 1.0)(engine_);
}

double RandomSource::uniform(double low, double high) {
    if (!std::isfinite(low) || !std::isfinite(high)) {
        throw std::invalid_argument("uniform bounds must be finite");
    }
    if (low > high) {
        std::swap(low, high);
    }
    if (low == high) {
        return low;
    }
    return std::uniform_real_distribution<double>(low, high)(engine_);
}

std::int64_t RandomSource::uniform_int(std::int64_t low, std::int64_t high) {
    if (low > high) {
        std::swap(low, high);
    }
    return std::uniform_int_distribution<std::int64_t>(low, high)(engine_);
}

double RandomSource::normal(double mean, double stddev) {
    if (!(stddev > 0.0)) {
        return mean;
    }
    return std::normal_distribution<double>(mean, stddev)(engine_);
}

bool RandomSource::bernoulli(double probability) {
    if (probability <= 0.0) {
        return false;
    }
    if (probability >= 1.0) {
        return true;
    }
    return uniform() < probability;
}

std::size_t RandomSource::weighted_index(const std::vector<double>& weights) {
    if (weights.empty()) {
        throw std::invalid_argument("weights must be non-empty");
    }
    double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (!(total > 0.0)) {
        throw std::invalid_argument("weights must sum to a positive value");
    }
    return std::discrete_distribution<std::size_t>(weights.begin(), weights.end())(engine_);
}

}  // namespace libkinda
