#include "exclusion_zone/generation/ElevationField.h"
#include <algorithm>
#include <cmath>
#include <glm/gtc/noise.hpp>
#include <random>

namespace exclusion_zone {
namespace generation {

NoiseSettings NoiseSettings::fromSeed(uint32_t seed) {
    NoiseSettings settings;
    settings.seed = seed;
    return settings;
}

NoiseSettings NoiseSettings::withRandomSeed() {
    std::random_device device;
    return fromSeed(device());
}

RidgedMultiNoise::RidgedMultiNoise(const NoiseSettings& s)
    : settings(s) {
    // glm::perlin has no seed, so each octave reads a different region of the lattice
    std::mt19937 rng(settings.seed);
    std::uniform_real_distribution<double> dist(0.0, 4096.0);
    octaveOffsets.reserve(settings.octaves);
    for (uint32_t i = 0; i < settings.octaves; ++i) {
        double ox = dist(rng);
        double oy = dist(rng);
        octaveOffsets.emplace_back(ox, oy);
    }
}

double RidgedMultiNoise::get(double x, double y) const {
    glm::dvec2 point(x * settings.frequency, y * settings.frequency);

    double result = 0.0;
    double weight = 1.0;
    double amplitude = 1.0;

    for (uint32_t i = 0; i < settings.octaves; ++i) {
        double signal = glm::perlin(point + octaveOffsets[i]);

        // Fold into ridges: 1 at zero crossings, falling off on both sides
        signal = 1.0 - std::abs(signal);
        signal *= signal;
        signal *= weight;

        weight = std::clamp(signal / settings.attenuation, 0.0, 1.0);

        result += signal * amplitude;
        amplitude *= settings.persistence;
        point *= settings.lacunarity;
    }

    return result * 1.25 - 1.0;
}

ElevationField generateElevationField(size_t size, const NoiseSettings& settings,
                                      utils::ProgressCallback callback) {
    ElevationField field(size, 0.0);
    if (size == 0) return field;

    RidgedMultiNoise noise(settings);
    double invSize = 1.0 / static_cast<double>(size);

    // Rows are independent; each task writes only its own row
    utils::parallel_for_progress(0, size, [&](size_t row) {
        double y = static_cast<double>(row) * invSize;
        for (size_t col = 0; col < size; ++col) {
            double x = static_cast<double>(col) * invSize;
            field.at(row, col) = noise.get(x, y);
        }
    }, callback, "Elevation rows");

    return field;
}

} // namespace generation
} // namespace exclusion_zone
