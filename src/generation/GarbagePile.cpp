#include "exclusion_zone/generation/GarbagePile.h"
#include "exclusion_zone/utils/Errors.h"
#include <SDL3/SDL_log.h>
#include <algorithm>

namespace exclusion_zone {
namespace generation {

using world::ContentKind;

GarbageSettings GarbageSettings::defaultFor(size_t worldSize) {
    GarbageSettings settings;
    settings.totalQuantity = worldSize * worldSize / 200;
    settings.perTileQuantity = utils::Range<uint32_t>(1, world::maxQuantity(ContentKind::Garbage) + 1);
    return settings;
}

void validateGarbageSettings(const GarbageSettings& settings) {
    if (settings.pileSize.start < 1 || settings.pileSize.start > settings.pileSize.end) {
        throw ConfigError("Garbage pile size range must satisfy 1 <= start <= end");
    }
    if (settings.perTileQuantity.start < 1 ||
        settings.perTileQuantity.start > settings.perTileQuantity.end) {
        throw ConfigError("Garbage per-tile quantity range must satisfy 1 <= start <= end");
    }
    if (settings.spawnProbability < 0.0 || settings.spawnProbability > 1.0) {
        throw ConfigError("Garbage spawn probability must be in [0, 1]");
    }
    if (settings.probabilityStep < 0.0) {
        throw ConfigError("Garbage probability step must not be negative");
    }
}

std::vector<std::vector<double>> buildProbabilityMatrix(size_t diameter, double spawnProbability,
                                                        double probabilityStep) {
    std::vector<std::vector<double>> matrix(diameter, std::vector<double>(diameter, 0.0));
    const size_t center = diameter / 2;

    for (size_t r = 0; r < diameter; ++r) {
        for (size_t c = 0; c < diameter; ++c) {
            size_t dr = r > center ? r - center : center - r;
            size_t dc = c > center ? c - center : center - c;
            double ring = static_cast<double>(std::max(dr, dc));
            matrix[r][c] = std::clamp(spawnProbability - probabilityStep * ring, 0.0, 1.0);
        }
    }
    return matrix;
}

size_t spawnGarbage(world::TileMatrix& tiles, const GarbageSettings& settings, utils::Rng& rng) {
    validateGarbageSettings(settings);

    const size_t size = tiles.size();
    if (settings.totalQuantity == 0 || size == 0) {
        return 0;
    }

    const uint32_t maxPerTile = world::maxQuantity(ContentKind::Garbage);
    size_t placed = 0;
    size_t piles = 0;
    size_t emptyPiles = 0;

    while (placed < settings.totalQuantity) {
        size_t diameter = utils::randomInRange(rng, settings.pileSize);
        if (diameter % 2 == 0) ++diameter;
        if (diameter > size) diameter = (size % 2 == 0) ? size - 1 : size;

        auto matrix = buildProbabilityMatrix(diameter, settings.spawnProbability,
                                             settings.probabilityStep);

        size_t originRow = utils::randomInclusive<size_t>(rng, 0, size - diameter);
        size_t originCol = utils::randomInclusive<size_t>(rng, 0, size - diameter);

        size_t placedInPile = 0;
        for (size_t r = 0; r < diameter && placed < settings.totalQuantity; ++r) {
            for (size_t c = 0; c < diameter && placed < settings.totalQuantity; ++c) {
                double u = utils::randomUnit(rng);
                if (!(u > 1.0 - matrix[r][c])) continue;

                world::Tile& tile = tiles.at(originRow + r, originCol + c);
                if (!world::canHold(tile.type, ContentKind::Garbage) || !tile.content.isNone()) {
                    continue;
                }

                size_t quantity = utils::randomInRange(rng, settings.perTileQuantity);
                quantity = std::min<size_t>(quantity, maxPerTile);
                quantity = std::min(quantity, settings.totalQuantity - placed);

                tile.content = world::Content::garbage(static_cast<uint32_t>(quantity));
                placed += quantity;
                placedInPile += quantity;
            }
        }

        ++piles;
        if (placedInPile == 0) {
            if (++emptyPiles >= MAX_EMPTY_PILES) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                            "Garbage: stopped after %zu empty piles, placed %zu of %zu",
                            emptyPiles, placed, settings.totalQuantity);
                break;
            }
        } else {
            emptyPiles = 0;
        }
    }

    SDL_Log("Garbage: placed %zu units in %zu piles", placed, piles);
    return placed;
}

} // namespace generation
} // namespace exclusion_zone
