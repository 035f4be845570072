// Organically shaped regions of one content kind (fire, forests)
//
// Semantic rules:
// - A blob is a noisy circle: 361 border points around a random center
// - The interior is flood-filled from the center, bounded by the border points
// - Only tiles that can hold the content and are still empty receive it
// - Blobs are placed until the blob budget runs out or a blob would overflow the tile budget

#pragma once

#include "exclusion_zone/utils/Random.h"
#include "exclusion_zone/utils/Range.h"
#include "exclusion_zone/world/Coordinate.h"
#include "exclusion_zone/world/TileMatrix.h"
#include <cstddef>
#include <vector>

namespace exclusion_zone {
namespace generation {

struct BlobSettings {
    utils::Range<size_t> tiles{1, 1};               // Total tiles the spawner may cover
    utils::Range<size_t> blobs{1, 1};               // Number of blobs
    utils::Range<double> radius{1.0, 1.0};          // Base radius of each blob
    utils::Range<double> variation{0.075, 0.125};   // Relative radius perturbation
    double sparsity = 0.0;                          // Chance of dropping each interior tile
};

// Fire: dense, few large blobs
BlobSettings fireDefaults(size_t worldSize);
// Trees: many small blobs with gaps
BlobSettings treeDefaults(size_t worldSize);

// Throws ConfigError when no placement could satisfy the budgets or a blob cannot fit
void validateBlobSettings(const BlobSettings& settings, size_t worldSize);

// Margin every blob center keeps from the world edges
size_t blobCenterMargin(double radius, double variation);

class Blob {
public:
    // Random center, noisy border, filled interior. Not yet filtered against the world.
    Blob(size_t worldSize, double radius, double variation, utils::Rng& rng);

    // Drop points whose tile cannot hold `content` or already holds something
    void limitToProperTiles(const world::TileMatrix& tiles, const world::Content& content);

    // Randomly drop a fraction of the points
    void thin(double probability, utils::Rng& rng);

    const world::Coordinate& getCenter() const { return center; }
    const std::vector<world::Coordinate>& getBorderPoints() const { return borderPoints; }
    const std::vector<world::Coordinate>& getPoints() const { return points; }

private:
    void buildBorder(utils::Rng& rng);
    void spread();

    double radius;
    double variation;
    world::Coordinate center;
    std::vector<world::Coordinate> borderPoints;
    std::vector<world::Coordinate> points;
};

struct BlobStats {
    size_t blobsPlaced = 0;
    size_t tilesPlaced = 0;
};

// Stamp blobs of `content` until a budget is exhausted. Validates first.
BlobStats spawnBlobs(world::TileMatrix& tiles, const BlobSettings& settings,
                     const world::Content& content, utils::Rng& rng);

} // namespace generation
} // namespace exclusion_zone
