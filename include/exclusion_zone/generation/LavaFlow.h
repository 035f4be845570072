#pragma once

#include "exclusion_zone/generation/ElevationField.h"
#include "exclusion_zone/utils/Random.h"
#include "exclusion_zone/utils/Range.h"
#include "exclusion_zone/world/Coordinate.h"
#include "exclusion_zone/world/TileMatrix.h"
#include <cstddef>
#include <vector>

namespace exclusion_zone {
namespace generation {

struct LavaSettings {
    size_t spawnPoints = 0;                 // Chains started from random mountain tiles
    utils::Range<size_t> flowRange{1, 1};   // Each chain walks flowRange.end - flowRange.start steps

    static LavaSettings defaultFor(size_t worldSize);
};

// Throws ConfigError unless 1 <= flowRange.start <= flowRange.end
void validateLavaSettings(const LavaSettings& settings);

// Lowest of the existing up, down, left, right neighbours; earlier wins on ties.
// Never compares against `from` itself, so the walk can climb.
world::Coordinate lowestNeighbour(const ElevationField& field, const world::Coordinate& from);

// Mark `start` and every step of the descent as Lava. Returns the visited chain in order.
std::vector<world::Coordinate> flowFrom(world::TileMatrix& tiles, const ElevationField& field,
                                        const world::Coordinate& start, size_t steps);

struct LavaStats {
    size_t chains = 0;
    size_t tilesVisited = 0;
};

LavaStats spawnLava(world::TileMatrix& tiles, const ElevationField& field,
                    const LavaSettings& settings, utils::Rng& rng);

} // namespace generation
} // namespace exclusion_zone
