#pragma once

#include "exclusion_zone/utils/Range.h"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace exclusion_zone {
namespace utils {

// All generation randomness flows through one explicitly passed engine
using Rng = std::mt19937;

// Uniform integer in [range.start, range.end). An empty range yields range.start.
template<typename T>
T randomInRange(Rng& rng, const Range<T>& range) {
    if (range.empty()) return range.start;
    std::uniform_int_distribution<T> dist(range.start, range.end - 1);
    return dist(rng);
}

// Uniform integer in [minVal, maxVal] (inclusive)
template<typename T>
T randomInclusive(Rng& rng, T minVal, T maxVal) {
    if (maxVal <= minVal) return minVal;
    std::uniform_int_distribution<T> dist(minVal, maxVal);
    return dist(rng);
}

inline double randomReal(Rng& rng, double minVal, double maxVal) {
    if (!(minVal < maxVal)) return minVal;
    std::uniform_real_distribution<double> dist(minVal, maxVal);
    return dist(rng);
}

inline double randomUnit(Rng& rng) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

inline bool randomChance(Rng& rng, double probability) {
    if (probability <= 0.0) return false;
    if (probability >= 1.0) return true;
    return randomUnit(rng) < probability;
}

template<typename T>
void shuffle(Rng& rng, std::vector<T>& items) {
    std::shuffle(items.begin(), items.end(), rng);
}

} // namespace utils
} // namespace exclusion_zone
