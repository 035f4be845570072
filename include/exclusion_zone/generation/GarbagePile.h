#pragma once

#include "exclusion_zone/utils/Random.h"
#include "exclusion_zone/utils/Range.h"
#include "exclusion_zone/world/TileMatrix.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace exclusion_zone {
namespace generation {

struct GarbageSettings {
    size_t totalQuantity = 0;                       // Garbage units to place across all piles
    utils::Range<size_t> pileSize{3, 9};            // Pile diameter, rounded up to odd
    utils::Range<uint32_t> perTileQuantity{1, 4};   // Units dropped on one tile
    double spawnProbability = 1.0;                  // Chance at the pile center
    double probabilityStep = 0.2;                   // Chance lost per ring outwards

    static GarbageSettings defaultFor(size_t worldSize);
};

// Throws ConfigError on malformed ranges or probabilities
void validateGarbageSettings(const GarbageSettings& settings);

// Square matrix of side `diameter` (odd); ring d holds clamp(p - step * d, 0, 1)
std::vector<std::vector<double>> buildProbabilityMatrix(size_t diameter, double spawnProbability,
                                                        double probabilityStep);

// Consecutive empty piles after which the spawner gives up
constexpr size_t MAX_EMPTY_PILES = 1000;

// Returns the quantity actually placed
size_t spawnGarbage(world::TileMatrix& tiles, const GarbageSettings& settings, utils::Rng& rng);

} // namespace generation
} // namespace exclusion_zone
