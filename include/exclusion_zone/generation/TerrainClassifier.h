#pragma once

#include "exclusion_zone/generation/ElevationField.h"
#include "exclusion_zone/world/TileMatrix.h"

namespace exclusion_zone {
namespace generation {

// Upper bounds of each terrain band, as percentages of the observed height range.
// Anything at or above `mountain` becomes Snow.
struct TerrainThresholds {
    double deepWater = 4.0;
    double shallowWater = 10.0;
    double sand = 15.0;
    double grass = 45.0;
    double hill = 65.0;
    double mountain = 77.5;
};

struct ElevationRange {
    double min = 0.0;
    double max = 0.0;
};

ElevationRange findMinMax(const ElevationField& field);

// Map a percentage onto the observed range: p/100 * (max - min) + min
double percentageToValue(double percentage, const ElevationRange& range);

// Terrain of a single raw value. Thresholds are expected ascending.
world::TileType classifyValue(double value, const TerrainThresholds& thresholds,
                              const ElevationRange& range);

// Classify every cell; all tiles start with no content
world::TileMatrix classifyTerrain(const ElevationField& field, const TerrainThresholds& thresholds);

} // namespace generation
} // namespace exclusion_zone
