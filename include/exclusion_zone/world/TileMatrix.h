#pragma once

#include "exclusion_zone/world/Grid.h"
#include "exclusion_zone/world/Tile.h"
#include <map>

namespace exclusion_zone {
namespace world {

using TileMatrix = Grid<Tile>;

// True when every tile holds content its terrain accepts and no quantity or
// capacity exceeds its kind's maximum
bool checkWorld(const TileMatrix& tiles);

// Share of tiles per terrain / content kind, in [0, 1]
std::map<TileType, double> terrainPercentages(const TileMatrix& tiles);
std::map<ContentKind, double> contentPercentages(const TileMatrix& tiles);

} // namespace world
} // namespace exclusion_zone
