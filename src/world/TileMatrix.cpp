#include "exclusion_zone/world/TileMatrix.h"

namespace exclusion_zone {
namespace world {

bool checkWorld(const TileMatrix& tiles) {
    for (const Tile& tile : tiles.data()) {
        // An empty tile is valid on every terrain
        if (tile.content.isNone()) continue;
        if (!canHold(tile.type, tile.content.kind)) {
            return false;
        }
        if (tile.content.amount() > maxQuantity(tile.content.kind)) {
            return false;
        }
    }
    return true;
}

std::map<TileType, double> terrainPercentages(const TileMatrix& tiles) {
    std::map<TileType, double> result;
    if (tiles.empty()) return result;

    for (const Tile& tile : tiles.data()) {
        result[tile.type] += 1.0;
    }

    double total = static_cast<double>(tiles.data().size());
    for (auto& [type, share] : result) {
        share /= total;
    }
    return result;
}

std::map<ContentKind, double> contentPercentages(const TileMatrix& tiles) {
    std::map<ContentKind, double> result;
    if (tiles.empty()) return result;

    for (const Tile& tile : tiles.data()) {
        result[tile.content.kind] += 1.0;
    }

    double total = static_cast<double>(tiles.data().size());
    for (auto& [kind, share] : result) {
        share /= total;
    }
    return result;
}

} // namespace world
} // namespace exclusion_zone
