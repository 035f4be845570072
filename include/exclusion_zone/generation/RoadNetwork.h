// Street network carved from the elevation field
//
// Semantic rules:
// - The field is cut into sliceCount x sliceCount slices, each contributing its highest cell
// - Peaks crowding a slice boundary are thinned so only the highest of a cluster survives
// - Survivors seed a Voronoi diagram bounded by the world; cell borders become streets
// - Every street is rasterized 4-connected so robots can walk it without diagonal moves

#pragma once

#include "exclusion_zone/generation/ElevationField.h"
#include "exclusion_zone/geom/Voronoi.h"
#include "exclusion_zone/world/Coordinate.h"
#include "exclusion_zone/world/TileMatrix.h"
#include <cstddef>
#include <vector>

namespace exclusion_zone {
namespace generation {

struct StreetSettings {
    size_t sliceCount = 10;         // Slices per axis
    double lowerThreshold = 0.0;    // Peaks below this elevation are ignored
    size_t bandWidth = 1;           // Width of the thinning band around each slice boundary

    static StreetSettings defaultFor(size_t worldSize);
};

// Throws ConfigError when the slices cannot partition the world
void validateStreetSettings(const StreetSettings& settings, size_t worldSize);

struct Peak {
    world::Coordinate position;
    double elevation = 0.0;
};

// Highest cell of each slice (first in row-major order on ties), dropping those below lowerThreshold.
// The last slice on each axis absorbs the remainder of size / sliceCount.
std::vector<Peak> findLocalMaxima(const ElevationField& field, size_t sliceCount, double lowerThreshold);

// Thin peaks around the interior slice boundaries
std::vector<Peak> combineLocalMaxima(const std::vector<Peak>& peaks, size_t worldSize,
                                     size_t sliceCount, size_t bandWidth);

// Unordered pair of grid points
struct Edge {
    world::Coordinate a;
    world::Coordinate b;

    Edge() = default;
    Edge(const world::Coordinate& first, const world::Coordinate& second) : a(first), b(second) {}

    bool operator==(const Edge& other) const {
        return (a == other.a && b == other.b) || (a == other.b && b == other.a);
    }

    bool operator!=(const Edge& other) const {
        return !(*this == other);
    }
};

// Symmetric: hash(a, b) == hash(b, a)
struct EdgeHash {
    size_t operator()(const Edge& e) const {
        world::CoordinateHash h;
        return h(e.a) ^ h(e.b);
    }
};

// Border segments of every cell snapped to the grid, each unordered pair once, in discovery order
std::vector<Edge> extractUniqueEdges(const geom::Voronoi& voronoi, size_t worldSize);

// Snap endpoints within 2 cells of a world border onto that border, then drop duplicates
std::vector<Edge> clampEdgesToBorder(const std::vector<Edge>& edges, size_t worldSize);

// DDA walk from `from` to `to`, inclusive. Every diagonal step gets one orthogonal
// intermediate point so consecutive points are exactly one step apart.
std::vector<world::Coordinate> rasterizeEdge(const world::Coordinate& from, const world::Coordinate& to);

// Full pipeline, one rasterized path per street segment.
// Throws GeometryError if fewer than 3 peaks survive or they are collinear.
std::vector<std::vector<world::Coordinate>> generateStreets(const ElevationField& field,
                                                            const StreetSettings& settings);

// Mark every path tile as Street, clearing content a street cannot hold. Returns tiles marked.
size_t applyStreets(world::TileMatrix& tiles, const std::vector<std::vector<world::Coordinate>>& paths);

} // namespace generation
} // namespace exclusion_zone
