#pragma once

#include "exclusion_zone/utils/ParallelFor.h"
#include "exclusion_zone/world/Grid.h"
#include <cstddef>
#include <cstdint>
#include <glm/glm.hpp>
#include <vector>

namespace exclusion_zone {
namespace generation {

using ElevationField = world::Grid<double>;

// Parameters of the ridged multifractal that shapes the heightmap
struct NoiseSettings {
    uint32_t seed = 0;
    uint32_t octaves = 12;          // More octaves add detail and cost
    double frequency = 2.5;         // Cycles per unit length
    double lacunarity = 2.0;        // Frequency multiplier per octave
    double persistence = 1.25;      // Amplitude multiplier per octave
    double attenuation = 2.5;       // Divides the ridge weight carried to the next octave

    static NoiseSettings fromSeed(uint32_t seed);
    static NoiseSettings withRandomSeed();
};

// Ridged multifractal over glm's gradient noise.
// Each octave samples a lattice shifted by a seed-derived offset.
class RidgedMultiNoise {
public:
    explicit RidgedMultiNoise(const NoiseSettings& settings);

    double get(double x, double y) const;

private:
    NoiseSettings settings;
    std::vector<glm::dvec2> octaveOffsets;
};

// Sample the noise at (col/size, row/size) for every cell, one row per task
ElevationField generateElevationField(size_t size, const NoiseSettings& settings,
                                      utils::ProgressCallback callback = nullptr);

} // namespace generation
} // namespace exclusion_zone
