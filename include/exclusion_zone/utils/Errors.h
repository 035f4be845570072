#pragma once

#include <stdexcept>
#include <string>

namespace exclusion_zone {

// Settings that can never produce a valid world (infeasible budgets, world too small...)
// Always raised before the tile grid is touched.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Degenerate input to the geometry code, e.g. a Voronoi diagram over fewer than 3 seeds
class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace exclusion_zone
