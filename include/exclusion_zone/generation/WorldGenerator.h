#pragma once

#include "exclusion_zone/generation/Blob.h"
#include "exclusion_zone/generation/ContentScatter.h"
#include "exclusion_zone/generation/ElevationField.h"
#include "exclusion_zone/generation/GarbagePile.h"
#include "exclusion_zone/generation/LavaFlow.h"
#include "exclusion_zone/generation/RoadNetwork.h"
#include "exclusion_zone/generation/SpawnOrder.h"
#include "exclusion_zone/generation/TerrainClassifier.h"
#include "exclusion_zone/utils/ParallelFor.h"
#include "exclusion_zone/utils/Random.h"
#include "exclusion_zone/world/Coordinate.h"
#include "exclusion_zone/world/EnvironmentalConditions.h"
#include "exclusion_zone/world/TileMatrix.h"
#include <cstddef>
#include <cstdint>

namespace exclusion_zone {
namespace generation {

constexpr size_t MIN_WORLD_SIZE = 100;

struct WorldGeneratorSettings {
    size_t size = MIN_WORLD_SIZE;
    NoiseSettings noise;
    TerrainThresholds thresholds;
    StreetSettings streets;
    LavaSettings lava;
    BlobSettings fire;
    BlobSettings trees;
    GarbageSettings garbage;
    RockSettings rocks;
    CoinSettings coins;
    ContainerSettings bins;
    ContainerSettings crates;
    ContainerSettings banks;
    WaterSettings water;
    SpawnOrder spawnOrder = defaultSpawnOrder();

    // Every phase scaled to a world of `size`, noise seeded with `seed`
    static WorldGeneratorSettings defaultFor(size_t size, uint32_t seed);
};

// Throws ConfigError for a world below MIN_WORLD_SIZE or any infeasible phase settings
void validateWorldSettings(const WorldGeneratorSettings& settings);

enum class GenerationStage : uint8_t {
    Idle = 0,
    ElevationReady,
    TerrainClassified,
    StreetsPlaced,
    LavaPlaced,
    BlobsPlaced,
    GarbagePlaced,
    ContentPlaced,
    SpawnPointResolved,
    Done
};

const char* getGenerationStageName(GenerationStage stage);

struct GeneratedWorld {
    world::TileMatrix tiles;
    world::Coordinate spawnPoint;
    world::EnvironmentalConditions conditions;
};

// First walkable tile in row-major order, else the origin
world::Coordinate findSpawnPoint(const world::TileMatrix& tiles);

class WorldGenerator {
public:
    explicit WorldGenerator(const WorldGeneratorSettings& settings);

    // Validates, builds the elevation field, classifies terrain and runs the spawn order.
    // Content randomness is seeded from the noise seed.
    GeneratedWorld generate(utils::ProgressCallback callback = nullptr);

    GenerationStage getStage() const { return stage; }
    const ElevationField& getElevationField() const { return elevation; }
    const WorldGeneratorSettings& getSettings() const { return settings; }

private:
    void runPhase(SpawnKind kind, world::TileMatrix& tiles, utils::Rng& rng);

    WorldGeneratorSettings settings;
    ElevationField elevation;
    GenerationStage stage = GenerationStage::Idle;
};

} // namespace generation
} // namespace exclusion_zone
