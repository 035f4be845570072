#include "exclusion_zone/generation/TerrainClassifier.h"
#include <algorithm>
#include <utility>

namespace exclusion_zone {
namespace generation {

using world::TileType;

ElevationRange findMinMax(const ElevationField& field) {
    ElevationRange range;
    const auto& values = field.data();
    if (values.empty()) return range;

    auto [minIt, maxIt] = std::minmax_element(values.begin(), values.end());
    range.min = *minIt;
    range.max = *maxIt;
    return range;
}

double percentageToValue(double percentage, const ElevationRange& range) {
    return percentage / 100.0 * (range.max - range.min) + range.min;
}

TileType classifyValue(double value, const TerrainThresholds& thresholds,
                       const ElevationRange& range) {
    const std::pair<double, TileType> bands[] = {
        {thresholds.deepWater, TileType::DeepWater},
        {thresholds.shallowWater, TileType::ShallowWater},
        {thresholds.sand, TileType::Sand},
        {thresholds.grass, TileType::Grass},
        {thresholds.hill, TileType::Hill},
        {thresholds.mountain, TileType::Mountain},
    };

    for (const auto& [percentage, type] : bands) {
        if (value < percentageToValue(percentage, range)) {
            return type;
        }
    }
    return TileType::Snow;
}

world::TileMatrix classifyTerrain(const ElevationField& field, const TerrainThresholds& thresholds) {
    world::TileMatrix tiles(field.size());
    ElevationRange range = findMinMax(field);

    const auto& values = field.data();
    auto& cells = tiles.data();
    for (size_t i = 0; i < values.size(); ++i) {
        cells[i].type = classifyValue(values[i], thresholds, range);
        cells[i].content = world::Content::none();
    }
    return tiles;
}

} // namespace generation
} // namespace exclusion_zone
