#include "exclusion_zone/generation/Blob.h"
#include "exclusion_zone/utils/Errors.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <glm/glm.hpp>
#include <glm/gtc/noise.hpp>
#include <string>

namespace exclusion_zone {
namespace generation {

using world::Coordinate;

namespace {

BlobSettings sizedBlobDefaults(double radiusStart, double radiusEnd, size_t blobsStart, size_t blobsEnd) {
    BlobSettings settings;
    settings.radius = utils::Range<double>(radiusStart, radiusEnd);
    settings.blobs = utils::Range<size_t>(blobsStart, blobsEnd);

    size_t diameter = static_cast<size_t>(std::ceil(radiusEnd)) * 2;
    settings.tiles = utils::Range<size_t>(1, diameter * diameter * blobsEnd);
    settings.variation = utils::Range<double>(0.075, 0.125);
    return settings;
}

} // namespace

BlobSettings fireDefaults(size_t worldSize) {
    double size = static_cast<double>(worldSize);
    double radiusEnd = std::clamp(size / 100.0, 3.0, 15.0);
    size_t blobsEnd = std::max<size_t>(2, worldSize / 200);
    return sizedBlobDefaults(2.0, radiusEnd, 1, blobsEnd);
}

BlobSettings treeDefaults(size_t worldSize) {
    double size = static_cast<double>(worldSize);
    double radiusEnd = std::min(size / 50.0, 4.0);
    BlobSettings settings = sizedBlobDefaults(1.0, radiusEnd,
                                              static_cast<size_t>(size * 0.1),
                                              static_cast<size_t>(size * 0.15));
    settings.sparsity = 0.1;
    return settings;
}

size_t blobCenterMargin(double radius, double variation) {
    return static_cast<size_t>(std::ceil(radius * (1.0 + variation))) + 1;
}

void validateBlobSettings(const BlobSettings& settings, size_t worldSize) {
    const auto& radius = settings.radius;
    const auto& variation = settings.variation;
    const auto& tiles = settings.tiles;
    const auto& blobs = settings.blobs;

    if (radius.start < 0.0 || radius.start > radius.end) {
        throw ConfigError("Blob radius range [" + std::to_string(radius.start) + ", " +
                          std::to_string(radius.end) + ") is malformed");
    }
    if (variation.start < 0.0 || variation.start > variation.end || variation.end >= 1.0) {
        throw ConfigError("Blob variation range must satisfy 0 <= start <= end < 1");
    }
    if (blobs.start > blobs.end) {
        throw ConfigError("Blob count range start is greater than its end");
    }
    if (settings.sparsity < 0.0 || settings.sparsity >= 1.0) {
        throw ConfigError("Blob sparsity must be in [0, 1)");
    }
    if (tiles.end == 0) {
        throw ConfigError("Blob tile budget is empty, tiles.end must be greater than 0");
    }
    if (static_cast<size_t>(std::floor(radius.start)) * blobs.start > tiles.end) {
        throw ConfigError("tiles.end " + std::to_string(tiles.end) +
                          " is too small for radius.start " + std::to_string(radius.start) +
                          " and blobs.start " + std::to_string(blobs.start) +
                          ": the smallest placement would exceed the tile budget");
    }
    if (static_cast<size_t>(std::ceil(radius.end)) * blobs.end < tiles.start) {
        throw ConfigError("tiles.start " + std::to_string(tiles.start) +
                          " is too large for radius.end " + std::to_string(radius.end) +
                          " and blobs.end " + std::to_string(blobs.end) +
                          ": the largest placement could not reach it");
    }
    size_t margin = blobCenterMargin(radius.end, variation.end);
    if (2 * margin >= worldSize) {
        throw ConfigError("Blob radius " + std::to_string(radius.end) +
                          " does not fit in a world of size " + std::to_string(worldSize));
    }
}

Blob::Blob(size_t worldSize, double radius, double variation, utils::Rng& rng)
    : radius(radius)
    , variation(variation) {
    size_t margin = blobCenterMargin(radius, variation);
    if (2 * margin >= worldSize) {
        throw ConfigError("Blob of radius " + std::to_string(radius) +
                          " does not fit in a world of size " + std::to_string(worldSize));
    }

    center.row = utils::randomInRange(rng, utils::Range<size_t>(margin, worldSize - margin));
    center.col = utils::randomInRange(rng, utils::Range<size_t>(margin, worldSize - margin));

    buildBorder(rng);
    spread();
}

void Blob::buildBorder(utils::Rng& rng) {
    // Fresh noise region per blob
    glm::dvec2 noiseOffset(utils::randomReal(rng, 0.0, 1024.0), utils::randomReal(rng, 0.0, 1024.0));
    double minRadius = radius * (1.0 - variation);
    double maxRadius = radius * (1.0 + variation);

    borderPoints.clear();
    borderPoints.reserve(361);
    for (int degree = 0; degree <= 360; ++degree) {
        double angle = glm::radians(static_cast<double>(degree));
        double cosA = std::cos(angle);
        double sinA = std::sin(angle);

        double n = glm::perlin(glm::dvec2(cosA + 1.0, sinA + 1.0) + noiseOffset);
        double t = std::clamp((n + 1.0) * 0.5, 0.0, 1.0);
        double r = glm::mix(minRadius, maxRadius, t);

        double col = std::floor(static_cast<double>(center.col) + cosA * r);
        double row = std::floor(static_cast<double>(center.row) + sinA * r);
        borderPoints.emplace_back(static_cast<size_t>(row), static_cast<size_t>(col));
    }
}

void Blob::spread() {
    size_t minRow = center.row, maxRow = center.row;
    size_t minCol = center.col, maxCol = center.col;
    for (const auto& p : borderPoints) {
        minRow = std::min(minRow, p.row);
        maxRow = std::max(maxRow, p.row);
        minCol = std::min(minCol, p.col);
        maxCol = std::max(maxCol, p.col);
    }

    const size_t width = maxCol - minCol + 1;
    const size_t height = maxRow - minRow + 1;
    std::vector<bool> visited(width * height, false);
    auto isVisited = [&](size_t y, size_t x) { return visited[y * width + x]; };
    auto visit = [&](size_t y, size_t x) { visited[y * width + x] = true; };

    for (const auto& p : borderPoints) {
        visit(p.row - minRow, p.col - minCol);
    }

    std::vector<Coordinate> stack;
    stack.emplace_back(center.row - minRow, center.col - minCol);
    visit(center.row - minRow, center.col - minCol);

    while (!stack.empty()) {
        Coordinate current = stack.back();
        stack.pop_back();
        const size_t y = current.row;
        const size_t x = current.col;

        const bool up = y > 0;
        const bool down = y + 1 < height;
        const bool left = x > 0;
        const bool right = x + 1 < width;

        // A diagonal is only taken when both orthogonal cells are still open, so the fill
        // never slips between two diagonal border points
        if (up && left && !isVisited(y - 1, x - 1) && !isVisited(y - 1, x) && !isVisited(y, x - 1)) {
            visit(y - 1, x - 1);
            stack.emplace_back(y - 1, x - 1);
        }
        if (up && !isVisited(y - 1, x)) {
            visit(y - 1, x);
            stack.emplace_back(y - 1, x);
        }
        if (up && right && !isVisited(y - 1, x + 1) && !isVisited(y - 1, x) && !isVisited(y, x + 1)) {
            visit(y - 1, x + 1);
            stack.emplace_back(y - 1, x + 1);
        }
        if (right && !isVisited(y, x + 1)) {
            visit(y, x + 1);
            stack.emplace_back(y, x + 1);
        }
        if (down && right && !isVisited(y + 1, x + 1) && !isVisited(y + 1, x) && !isVisited(y, x + 1)) {
            visit(y + 1, x + 1);
            stack.emplace_back(y + 1, x + 1);
        }
        if (down && !isVisited(y + 1, x)) {
            visit(y + 1, x);
            stack.emplace_back(y + 1, x);
        }
        if (down && left && !isVisited(y + 1, x - 1) && !isVisited(y + 1, x) && !isVisited(y, x - 1)) {
            visit(y + 1, x - 1);
            stack.emplace_back(y + 1, x - 1);
        }
        if (left && !isVisited(y, x - 1)) {
            visit(y, x - 1);
            stack.emplace_back(y, x - 1);
        }
    }

    points.clear();
    for (size_t y = 0; y < height; ++y) {
        for (size_t x = 0; x < width; ++x) {
            if (isVisited(y, x)) {
                points.emplace_back(y + minRow, x + minCol);
            }
        }
    }
}

void Blob::limitToProperTiles(const world::TileMatrix& tiles, const world::Content& content) {
    size_t i = 0;
    while (i < points.size()) {
        const world::Tile& tile = tiles.at(points[i]);
        if (!world::canHold(tile.type, content.kind) || !tile.content.isNone()) {
            points[i] = points.back();
            points.pop_back();
        } else {
            ++i;
        }
    }
}

void Blob::thin(double probability, utils::Rng& rng) {
    if (probability <= 0.0) return;
    points.erase(std::remove_if(points.begin(), points.end(), [&](const Coordinate&) {
        return utils::randomChance(rng, probability);
    }), points.end());
}

BlobStats spawnBlobs(world::TileMatrix& tiles, const BlobSettings& settings,
                     const world::Content& content, utils::Rng& rng) {
    validateBlobSettings(settings, tiles.size());

    size_t tileBudget = settings.tiles.end;
    size_t blobBudget = settings.blobs.end;
    BlobStats stats;

    while (blobBudget >= 1) {
        double radius = utils::randomReal(rng, settings.radius.start, settings.radius.end);
        double variation = utils::randomReal(rng, settings.variation.start, settings.variation.end);

        Blob blob(tiles.size(), radius, variation, rng);
        blob.thin(settings.sparsity, rng);
        blob.limitToProperTiles(tiles, content);

        const auto& points = blob.getPoints();
        if (points.size() > tileBudget) {
            break;
        }

        tileBudget -= points.size();
        --blobBudget;

        for (const auto& p : points) {
            tiles.at(p).content = content;
        }
        ++stats.blobsPlaced;
        stats.tilesPlaced += points.size();
    }

    SDL_Log("Blobs (%s): placed %zu blobs covering %zu tiles",
            world::getContentKindName(content.kind), stats.blobsPlaced, stats.tilesPlaced);
    return stats;
}

} // namespace generation
} // namespace exclusion_zone
