#pragma once

#include "exclusion_zone/utils/Random.h"
#include "exclusion_zone/world/Coordinate.h"
#include "exclusion_zone/world/TileMatrix.h"
#include <array>
#include <cstddef>
#include <vector>

namespace exclusion_zone {
namespace generation {

// Number of classifier terrain kinds (DeepWater..Snow) with a rock probability
constexpr size_t ROCK_TERRAIN_COUNT = 7;

struct RockSettings {
    // DeepWater, ShallowWater, Sand, Grass, Hill, Mountain, Snow. Street and Lava never get rocks.
    std::array<double, ROCK_TERRAIN_COUNT> probabilities{{0.0, 0.0, 0.1, 0.25, 0.45, 0.5, 0.7}};
    size_t maxRocks = 0;

    static RockSettings defaultFor(size_t worldSize);
};

struct CoinSettings {
    size_t spawnPoints = 0;

    static CoinSettings defaultFor(size_t worldSize);
};

// Shared by bins, crates and banks
struct ContainerSettings {
    size_t spawnPoints = 0;

    static ContainerSettings defaultFor(size_t worldSize);
};

struct WaterSettings {
    double coverage = 1.0;  // Chance that a water tile gets water content
};

void validateRockSettings(const RockSettings& settings);
void validateWaterSettings(const WaterSettings& settings);

// Rock probability of a terrain kind
double rockProbability(const RockSettings& settings, world::TileType type);

// Tiles that can hold `kind` and are empty, row-major
std::vector<world::Coordinate> findEligibleTiles(const world::TileMatrix& tiles, world::ContentKind kind);

// Up to `count` distinct tiles, uniformly chosen among those that can hold `kind` and are empty
std::vector<world::Coordinate> pickRandomTiles(const world::TileMatrix& tiles, size_t count,
                                               world::ContentKind kind, utils::Rng& rng);

// Each spawner returns the number of tiles it filled
size_t spawnRocks(world::TileMatrix& tiles, const RockSettings& settings, utils::Rng& rng);
size_t spawnCoins(world::TileMatrix& tiles, const CoinSettings& settings, utils::Rng& rng);

// Capacity 1..upper with upper drawn from [2, max]. Throws ConfigError unless kind is Bin, Crate or Bank.
size_t spawnContainers(world::TileMatrix& tiles, const ContainerSettings& settings,
                       world::ContentKind kind, utils::Rng& rng);

size_t spawnWater(world::TileMatrix& tiles, const WaterSettings& settings, utils::Rng& rng);

} // namespace generation
} // namespace exclusion_zone
