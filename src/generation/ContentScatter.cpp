#include "exclusion_zone/generation/ContentScatter.h"
#include "exclusion_zone/utils/Errors.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <string>

namespace exclusion_zone {
namespace generation {

using world::ContentKind;
using world::Coordinate;
using world::TileType;

RockSettings RockSettings::defaultFor(size_t worldSize) {
    RockSettings settings;
    settings.maxRocks = worldSize * worldSize / 20;
    return settings;
}

CoinSettings CoinSettings::defaultFor(size_t worldSize) {
    CoinSettings settings;
    settings.spawnPoints = worldSize * worldSize / 25;
    return settings;
}

ContainerSettings ContainerSettings::defaultFor(size_t worldSize) {
    ContainerSettings settings;
    settings.spawnPoints = worldSize / 25;
    return settings;
}

void validateRockSettings(const RockSettings& settings) {
    for (double p : settings.probabilities) {
        if (p < 0.0 || p > 1.0) {
            throw ConfigError("Rock probability " + std::to_string(p) + " is outside [0, 1]");
        }
    }
}

void validateWaterSettings(const WaterSettings& settings) {
    if (settings.coverage < 0.0 || settings.coverage > 1.0) {
        throw ConfigError("Water coverage " + std::to_string(settings.coverage) + " is outside [0, 1]");
    }
}

double rockProbability(const RockSettings& settings, TileType type) {
    switch (type) {
        case TileType::DeepWater: return settings.probabilities[0];
        case TileType::ShallowWater: return settings.probabilities[1];
        case TileType::Sand: return settings.probabilities[2];
        case TileType::Grass: return settings.probabilities[3];
        case TileType::Hill: return settings.probabilities[4];
        case TileType::Mountain: return settings.probabilities[5];
        case TileType::Snow: return settings.probabilities[6];
        default: return 0.0;
    }
}

std::vector<Coordinate> findEligibleTiles(const world::TileMatrix& tiles, ContentKind kind) {
    std::vector<Coordinate> eligible;
    for (size_t r = 0; r < tiles.size(); ++r) {
        for (size_t c = 0; c < tiles.size(); ++c) {
            const world::Tile& tile = tiles.at(r, c);
            if (world::canHold(tile.type, kind) && tile.content.isNone()) {
                eligible.emplace_back(r, c);
            }
        }
    }
    return eligible;
}

std::vector<Coordinate> pickRandomTiles(const world::TileMatrix& tiles, size_t count,
                                        ContentKind kind, utils::Rng& rng) {
    std::vector<Coordinate> eligible = findEligibleTiles(tiles, kind);

    if (eligible.size() < count) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Only %zu tiles can hold %s, %zu requested",
                    eligible.size(), world::getContentKindName(kind), count);
    }

    utils::shuffle(rng, eligible);
    eligible.resize(std::min(count, eligible.size()));
    return eligible;
}

size_t spawnRocks(world::TileMatrix& tiles, const RockSettings& settings, utils::Rng& rng) {
    validateRockSettings(settings);

    // Visit tiles in random order so the cap does not favour the top rows
    std::vector<Coordinate> candidates = findEligibleTiles(tiles, ContentKind::Rock);
    utils::shuffle(rng, candidates);
    const uint32_t maxRock = world::maxQuantity(ContentKind::Rock);

    size_t placed = 0;
    for (const auto& c : candidates) {
        if (placed >= settings.maxRocks) break;

        world::Tile& tile = tiles.at(c);
        if (!utils::randomChance(rng, rockProbability(settings, tile.type))) continue;

        tile.content = world::Content::rock(utils::randomInclusive<uint32_t>(rng, 1, maxRock));
        ++placed;
    }

    SDL_Log("Rocks: placed %zu (cap %zu)", placed, settings.maxRocks);
    return placed;
}

size_t spawnCoins(world::TileMatrix& tiles, const CoinSettings& settings, utils::Rng& rng) {
    const uint32_t maxCoin = world::maxQuantity(ContentKind::Coin);
    std::vector<Coordinate> points = pickRandomTiles(tiles, settings.spawnPoints, ContentKind::Coin, rng);

    for (const auto& c : points) {
        tiles.at(c).content = world::Content::coin(utils::randomInclusive<uint32_t>(rng, 1, maxCoin));
    }

    SDL_Log("Coins: placed %zu", points.size());
    return points.size();
}

size_t spawnContainers(world::TileMatrix& tiles, const ContainerSettings& settings,
                       ContentKind kind, utils::Rng& rng) {
    if (kind != ContentKind::Bin && kind != ContentKind::Crate && kind != ContentKind::Bank) {
        throw ConfigError(std::string("Content kind ") + world::getContentKindName(kind) +
                          " is not a container");
    }

    const uint32_t maxCapacity = world::maxQuantity(kind);
    std::vector<Coordinate> points = pickRandomTiles(tiles, settings.spawnPoints, kind, rng);

    for (const auto& c : points) {
        uint32_t upper = utils::randomInclusive<uint32_t>(rng, 2, maxCapacity);
        utils::Range<uint32_t> capacity(1, upper);

        switch (kind) {
            case ContentKind::Bin: tiles.at(c).content = world::Content::bin(capacity); break;
            case ContentKind::Crate: tiles.at(c).content = world::Content::crate(capacity); break;
            default: tiles.at(c).content = world::Content::bank(capacity); break;
        }
    }

    SDL_Log("%s: placed %zu", world::getContentKindName(kind), points.size());
    return points.size();
}

size_t spawnWater(world::TileMatrix& tiles, const WaterSettings& settings, utils::Rng& rng) {
    validateWaterSettings(settings);

    const uint32_t maxWater = world::maxQuantity(ContentKind::Water);
    size_t placed = 0;

    for (auto& tile : tiles.data()) {
        if (tile.type != TileType::DeepWater && tile.type != TileType::ShallowWater) continue;
        if (!tile.content.isNone()) continue;
        if (!utils::randomChance(rng, settings.coverage)) continue;

        tile.content = world::Content::water(utils::randomInRange(rng, utils::Range<uint32_t>(0, maxWater)));
        ++placed;
    }

    SDL_Log("Water: filled %zu tiles", placed);
    return placed;
}

} // namespace generation
} // namespace exclusion_zone
