#include "exclusion_zone/generation/WorldGenerator.h"
#include "exclusion_zone/utils/Errors.h"
#include <SDL3/SDL_log.h>
#include <chrono>
#include <string>
#include <utility>

namespace exclusion_zone {
namespace generation {

using world::ContentKind;
using world::Coordinate;

namespace {

double elapsedMs(std::chrono::high_resolution_clock::time_point start) {
    auto now = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(now - start).count();
}

GenerationStage stageAfter(SpawnKind kind) {
    switch (kind) {
        case SpawnKind::Street: return GenerationStage::StreetsPlaced;
        case SpawnKind::Lava: return GenerationStage::LavaPlaced;
        case SpawnKind::Fire:
        case SpawnKind::Tree: return GenerationStage::BlobsPlaced;
        case SpawnKind::Garbage: return GenerationStage::GarbagePlaced;
        default: return GenerationStage::ContentPlaced;
    }
}

} // namespace

const char* getGenerationStageName(GenerationStage stage) {
    switch (stage) {
        case GenerationStage::Idle: return "Idle";
        case GenerationStage::ElevationReady: return "ElevationReady";
        case GenerationStage::TerrainClassified: return "TerrainClassified";
        case GenerationStage::StreetsPlaced: return "StreetsPlaced";
        case GenerationStage::LavaPlaced: return "LavaPlaced";
        case GenerationStage::BlobsPlaced: return "BlobsPlaced";
        case GenerationStage::GarbagePlaced: return "GarbagePlaced";
        case GenerationStage::ContentPlaced: return "ContentPlaced";
        case GenerationStage::SpawnPointResolved: return "SpawnPointResolved";
        case GenerationStage::Done: return "Done";
        default: return "Unknown";
    }
}

WorldGeneratorSettings WorldGeneratorSettings::defaultFor(size_t size, uint32_t seed) {
    WorldGeneratorSettings settings;
    settings.size = size;
    settings.noise = NoiseSettings::fromSeed(seed);
    settings.streets = StreetSettings::defaultFor(size);
    settings.lava = LavaSettings::defaultFor(size);
    settings.fire = fireDefaults(size);
    settings.trees = treeDefaults(size);
    settings.garbage = GarbageSettings::defaultFor(size);
    settings.rocks = RockSettings::defaultFor(size);
    settings.coins = CoinSettings::defaultFor(size);
    settings.bins = ContainerSettings::defaultFor(size);
    settings.crates = ContainerSettings::defaultFor(size);
    settings.banks = ContainerSettings::defaultFor(size);
    return settings;
}

void validateWorldSettings(const WorldGeneratorSettings& settings) {
    if (settings.size < MIN_WORLD_SIZE) {
        throw ConfigError("World size " + std::to_string(settings.size) +
                          " is below the minimum of " + std::to_string(MIN_WORLD_SIZE));
    }

    // Only phases that will run need feasible settings
    for (SpawnKind kind : deduplicateSpawnOrder(settings.spawnOrder)) {
        switch (kind) {
            case SpawnKind::Street: validateStreetSettings(settings.streets, settings.size); break;
            case SpawnKind::Lava: validateLavaSettings(settings.lava); break;
            case SpawnKind::Fire: validateBlobSettings(settings.fire, settings.size); break;
            case SpawnKind::Tree: validateBlobSettings(settings.trees, settings.size); break;
            case SpawnKind::Garbage: validateGarbageSettings(settings.garbage); break;
            case SpawnKind::Rock: validateRockSettings(settings.rocks); break;
            case SpawnKind::Water: validateWaterSettings(settings.water); break;
            default: break;
        }
    }
}

Coordinate findSpawnPoint(const world::TileMatrix& tiles) {
    for (size_t r = 0; r < tiles.size(); ++r) {
        for (size_t c = 0; c < tiles.size(); ++c) {
            if (world::isWalkable(tiles.at(r, c).type)) {
                return Coordinate(r, c);
            }
        }
    }
    return Coordinate(0, 0);
}

WorldGenerator::WorldGenerator(const WorldGeneratorSettings& settings)
    : settings(settings) {
}

GeneratedWorld WorldGenerator::generate(utils::ProgressCallback callback) {
    validateWorldSettings(settings);
    stage = GenerationStage::Idle;

    auto totalStart = std::chrono::high_resolution_clock::now();
    SDL_Log("Generating %zux%zu world (seed %u)", settings.size, settings.size, settings.noise.seed);

    // Elevation takes the first 40% of the progress bar
    if (callback) callback(0.0f, "Generating elevation...");
    auto phaseStart = std::chrono::high_resolution_clock::now();
    utils::ProgressCallback elevationProgress = nullptr;
    if (callback) {
        elevationProgress = [&callback](float progress, const std::string& status) {
            callback(progress * 0.4f, status);
        };
    }
    elevation = generateElevationField(settings.size, settings.noise, elevationProgress);
    stage = GenerationStage::ElevationReady;
    SDL_Log("Elevation field ready in %.1f ms", elapsedMs(phaseStart));

    if (callback) callback(0.4f, "Classifying terrain...");
    phaseStart = std::chrono::high_resolution_clock::now();
    world::TileMatrix tiles = classifyTerrain(elevation, settings.thresholds);
    stage = GenerationStage::TerrainClassified;
    SDL_Log("Terrain classified in %.1f ms", elapsedMs(phaseStart));

    utils::Rng rng(settings.noise.seed);
    SpawnOrder order = deduplicateSpawnOrder(settings.spawnOrder);

    for (size_t i = 0; i < order.size(); ++i) {
        const char* name = getSpawnKindName(order[i]);
        if (callback) {
            float progress = 0.45f + 0.5f * static_cast<float>(i) / static_cast<float>(order.size());
            callback(progress, std::string("Spawning ") + name + "...");
        }

        phaseStart = std::chrono::high_resolution_clock::now();
        runPhase(order[i], tiles, rng);
        stage = stageAfter(order[i]);
        SDL_Log("Phase %s done in %.1f ms", name, elapsedMs(phaseStart));
    }

    if (callback) callback(0.95f, "Resolving spawn point...");
    Coordinate spawnPoint = findSpawnPoint(tiles);
    stage = GenerationStage::SpawnPointResolved;
    SDL_Log("Spawn point at (%zu, %zu)", spawnPoint.row, spawnPoint.col);

    GeneratedWorld result{std::move(tiles), spawnPoint,
                          world::EnvironmentalConditions::generatorDefault()};
    stage = GenerationStage::Done;

    SDL_Log("World generated in %.1f ms", elapsedMs(totalStart));
    if (callback) callback(1.0f, "World generation complete");
    return result;
}

void WorldGenerator::runPhase(SpawnKind kind, world::TileMatrix& tiles, utils::Rng& rng) {
    switch (kind) {
        case SpawnKind::Street:
            applyStreets(tiles, generateStreets(elevation, settings.streets));
            break;
        case SpawnKind::Lava:
            spawnLava(tiles, elevation, settings.lava, rng);
            break;
        case SpawnKind::Water:
            spawnWater(tiles, settings.water, rng);
            break;
        case SpawnKind::Bank:
            spawnContainers(tiles, settings.banks, ContentKind::Bank, rng);
            break;
        case SpawnKind::Bin:
            spawnContainers(tiles, settings.bins, ContentKind::Bin, rng);
            break;
        case SpawnKind::Crate:
            spawnContainers(tiles, settings.crates, ContentKind::Crate, rng);
            break;
        case SpawnKind::Garbage:
            spawnGarbage(tiles, settings.garbage, rng);
            break;
        case SpawnKind::Fire:
            spawnBlobs(tiles, settings.fire, world::Content::fire(), rng);
            break;
        case SpawnKind::Tree:
            spawnBlobs(tiles, settings.trees,
                       world::Content::tree(world::maxQuantity(ContentKind::Tree)), rng);
            break;
        case SpawnKind::Rock:
            spawnRocks(tiles, settings.rocks, rng);
            break;
        case SpawnKind::Coin:
            spawnCoins(tiles, settings.coins, rng);
            break;
    }
}

} // namespace generation
} // namespace exclusion_zone
