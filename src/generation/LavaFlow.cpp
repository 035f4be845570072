#include "exclusion_zone/generation/LavaFlow.h"
#include "exclusion_zone/utils/Errors.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <string>

namespace exclusion_zone {
namespace generation {

using world::Coordinate;
using world::TileType;

LavaSettings LavaSettings::defaultFor(size_t worldSize) {
    LavaSettings settings;
    settings.spawnPoints = worldSize * worldSize / 500;
    settings.flowRange = utils::Range<size_t>(1, worldSize * worldSize / 25);
    return settings;
}

void validateLavaSettings(const LavaSettings& settings) {
    if (settings.flowRange.start < 1) {
        throw ConfigError("Lava flow range must start at 1 or more");
    }
    if (settings.flowRange.start > settings.flowRange.end) {
        throw ConfigError("Lava flow range start " + std::to_string(settings.flowRange.start) +
                          " is greater than end " + std::to_string(settings.flowRange.end));
    }
}

Coordinate lowestNeighbour(const ElevationField& field, const Coordinate& from) {
    const long long row = static_cast<long long>(from.row);
    const long long col = static_cast<long long>(from.col);
    const long long offsets[4][2] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};

    Coordinate best = from;
    bool found = false;
    double bestHeight = 0.0;

    for (const auto& offset : offsets) {
        long long r = row + offset[0];
        long long c = col + offset[1];
        if (!field.inBounds(r, c)) continue;

        double h = field.at(static_cast<size_t>(r), static_cast<size_t>(c));
        if (!found || h < bestHeight) {
            best = Coordinate(static_cast<size_t>(r), static_cast<size_t>(c));
            bestHeight = h;
            found = true;
        }
    }
    return best;
}

std::vector<Coordinate> flowFrom(world::TileMatrix& tiles, const ElevationField& field,
                                 const Coordinate& start, size_t steps) {
    std::vector<Coordinate> chain;
    chain.reserve(steps + 1);

    Coordinate current = start;
    size_t remaining = steps;
    while (true) {
        world::Tile& tile = tiles.at(current);
        tile.type = TileType::Lava;
        tile.content = world::Content::none();
        chain.push_back(current);

        if (remaining == 0) break;
        --remaining;
        current = lowestNeighbour(field, current);
    }
    return chain;
}

LavaStats spawnLava(world::TileMatrix& tiles, const ElevationField& field,
                    const LavaSettings& settings, utils::Rng& rng) {
    validateLavaSettings(settings);

    std::vector<Coordinate> mountains;
    for (size_t r = 0; r < tiles.size(); ++r) {
        for (size_t c = 0; c < tiles.size(); ++c) {
            if (tiles.at(r, c).type == TileType::Mountain) {
                mountains.emplace_back(r, c);
            }
        }
    }
    utils::shuffle(rng, mountains);

    size_t steps = settings.flowRange.end - settings.flowRange.start;
    size_t count = std::min(settings.spawnPoints, mountains.size());

    LavaStats stats;
    for (size_t i = 0; i < count; ++i) {
        stats.tilesVisited += flowFrom(tiles, field, mountains[i], steps).size();
        ++stats.chains;
    }

    SDL_Log("Lava: %zu chains from %zu mountain tiles, %zu steps visited",
            stats.chains, mountains.size(), stats.tilesVisited);
    return stats;
}

} // namespace generation
} // namespace exclusion_zone
