#include "exclusion_zone/generation/RoadNetwork.h"
#include "exclusion_zone/utils/Errors.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>
#include <unordered_set>

namespace exclusion_zone {
namespace generation {

using world::Coordinate;

StreetSettings StreetSettings::defaultFor(size_t worldSize) {
    StreetSettings settings;
    settings.bandWidth = worldSize / 100;
    return settings;
}

void validateStreetSettings(const StreetSettings& settings, size_t worldSize) {
    if (settings.sliceCount == 0) {
        throw ConfigError("Street slice count must be at least 1");
    }
    if (settings.sliceCount > worldSize) {
        throw ConfigError("Street slice count " + std::to_string(settings.sliceCount) +
                          " exceeds world size " + std::to_string(worldSize));
    }
}

std::vector<Peak> findLocalMaxima(const ElevationField& field, size_t sliceCount, double lowerThreshold) {
    std::vector<Peak> peaks;
    size_t size = field.size();
    if (sliceCount == 0 || size == 0) return peaks;

    size_t sliceSize = std::max<size_t>(size / sliceCount, 1);
    auto sliceBounds = [&](size_t index, size_t& begin, size_t& end) {
        begin = std::min(index * sliceSize, size);
        end = (index + 1 == sliceCount) ? size : std::min(begin + sliceSize, size);
    };

    for (size_t sr = 0; sr < sliceCount; ++sr) {
        size_t rowBegin, rowEnd;
        sliceBounds(sr, rowBegin, rowEnd);
        for (size_t sc = 0; sc < sliceCount; ++sc) {
            size_t colBegin, colEnd;
            sliceBounds(sc, colBegin, colEnd);
            if (rowBegin >= rowEnd || colBegin >= colEnd) continue;

            Peak best{{rowBegin, colBegin}, field.at(rowBegin, colBegin)};
            for (size_t r = rowBegin; r < rowEnd; ++r) {
                for (size_t c = colBegin; c < colEnd; ++c) {
                    double h = field.at(r, c);
                    if (h > best.elevation) {
                        best = Peak{{r, c}, h};
                    }
                }
            }

            if (best.elevation >= lowerThreshold) {
                peaks.push_back(best);
            }
        }
    }
    return peaks;
}

namespace {

size_t absDiff(size_t a, size_t b) {
    return a > b ? a - b : b - a;
}

// Within one band, mark every peak that sits within bandWidth of a higher kept peak
void thinBand(const std::vector<Peak>& peaks, std::vector<bool>& removed, size_t boundary,
              size_t bandWidth, bool vertical) {
    double halfBand = static_cast<double>(bandWidth) / 2.0;

    std::vector<size_t> inBand;
    for (size_t i = 0; i < peaks.size(); ++i) {
        size_t axis = vertical ? peaks[i].position.col : peaks[i].position.row;
        if (static_cast<double>(absDiff(axis, boundary)) <= halfBand) {
            inBand.push_back(i);
        }
    }

    std::stable_sort(inBand.begin(), inBand.end(), [&](size_t a, size_t b) {
        return peaks[a].elevation > peaks[b].elevation;
    });

    std::vector<size_t> kept;
    for (size_t index : inBand) {
        size_t axis = vertical ? peaks[index].position.col : peaks[index].position.row;
        bool crowded = false;
        for (size_t k : kept) {
            size_t keptAxis = vertical ? peaks[k].position.col : peaks[k].position.row;
            if (absDiff(axis, keptAxis) <= bandWidth) {
                crowded = true;
                break;
            }
        }
        if (crowded) {
            removed[index] = true;
        } else {
            kept.push_back(index);
        }
    }
}

Coordinate snapToGrid(const glm::dvec2& point, size_t worldSize) {
    double maxIndex = static_cast<double>(worldSize - 1);
    double col = std::clamp(std::round(point.x), 0.0, maxIndex);
    double row = std::clamp(std::round(point.y), 0.0, maxIndex);
    return Coordinate(static_cast<size_t>(row), static_cast<size_t>(col));
}

size_t clampToBorder(size_t value, size_t worldSize) {
    if (value <= 2) return 0;
    if (value + 3 >= worldSize) return worldSize - 1;
    return value;
}

} // namespace

std::vector<Peak> combineLocalMaxima(const std::vector<Peak>& peaks, size_t worldSize,
                                     size_t sliceCount, size_t bandWidth) {
    if (sliceCount < 2 || worldSize == 0) return peaks;

    size_t sliceSize = worldSize / sliceCount;
    std::vector<bool> removed(peaks.size(), false);

    for (size_t k = 1; k < sliceCount; ++k) {
        size_t boundary = k * sliceSize;
        thinBand(peaks, removed, boundary, bandWidth, true);
        thinBand(peaks, removed, boundary, bandWidth, false);
    }

    std::vector<Peak> survivors;
    for (size_t i = 0; i < peaks.size(); ++i) {
        if (!removed[i]) survivors.push_back(peaks[i]);
    }
    return survivors;
}

std::vector<Edge> extractUniqueEdges(const geom::Voronoi& voronoi, size_t worldSize) {
    std::vector<Edge> edges;
    std::unordered_set<Edge, EdgeHash> seen;

    for (const auto& cell : voronoi.getCells()) {
        const auto& vertices = cell.vertices;
        for (size_t i = 0; i < vertices.size(); ++i) {
            Coordinate from = snapToGrid(vertices[i], worldSize);
            Coordinate to = snapToGrid(vertices[(i + 1) % vertices.size()], worldSize);
            if (from == to) continue;

            Edge edge(from, to);
            if (seen.insert(edge).second) {
                edges.push_back(edge);
            }
        }
    }
    return edges;
}

std::vector<Edge> clampEdgesToBorder(const std::vector<Edge>& edges, size_t worldSize) {
    std::vector<Edge> result;
    std::unordered_set<Edge, EdgeHash> seen;

    for (const auto& edge : edges) {
        Coordinate a(clampToBorder(edge.a.row, worldSize), clampToBorder(edge.a.col, worldSize));
        Coordinate b(clampToBorder(edge.b.row, worldSize), clampToBorder(edge.b.col, worldSize));
        if (a == b) continue;

        Edge clamped(a, b);
        if (seen.insert(clamped).second) {
            result.push_back(clamped);
        }
    }
    return result;
}

std::vector<Coordinate> rasterizeEdge(const Coordinate& from, const Coordinate& to) {
    std::vector<Coordinate> points;

    long long dCol = static_cast<long long>(to.col) - static_cast<long long>(from.col);
    long long dRow = static_cast<long long>(to.row) - static_cast<long long>(from.row);
    long long steps = std::max(std::llabs(dCol), std::llabs(dRow));

    if (steps == 0) {
        points.push_back(from);
        return points;
    }

    double colStep = static_cast<double>(dCol) / static_cast<double>(steps);
    double rowStep = static_cast<double>(dRow) / static_cast<double>(steps);
    points.reserve(static_cast<size_t>(steps) * 2 + 1);

    for (long long i = 0; i <= steps; ++i) {
        double t = static_cast<double>(i);
        Coordinate current(
            static_cast<size_t>(std::llround(static_cast<double>(from.row) + rowStep * t)),
            static_cast<size_t>(std::llround(static_cast<double>(from.col) + colStep * t)));

        if (!points.empty()) {
            const Coordinate& previous = points.back();
            if (previous.row != current.row && previous.col != current.col) {
                points.emplace_back(previous.row, current.col);
            }
        }
        points.push_back(current);
    }
    return points;
}

std::vector<std::vector<Coordinate>> generateStreets(const ElevationField& field,
                                                     const StreetSettings& settings) {
    size_t size = field.size();
    validateStreetSettings(settings, size);

    std::vector<Peak> peaks = findLocalMaxima(field, settings.sliceCount, settings.lowerThreshold);
    std::vector<Peak> survivors = combineLocalMaxima(peaks, size, settings.sliceCount, settings.bandWidth);

    std::vector<glm::dvec2> seeds;
    seeds.reserve(survivors.size());
    for (const auto& peak : survivors) {
        seeds.emplace_back(static_cast<double>(peak.position.col), static_cast<double>(peak.position.row));
    }

    double maxIndex = static_cast<double>(size - 1);
    geom::Voronoi voronoi(seeds, glm::dvec2(0.0, 0.0), glm::dvec2(maxIndex, maxIndex));

    std::vector<Edge> edges = clampEdgesToBorder(extractUniqueEdges(voronoi, size), size);

    std::vector<std::vector<Coordinate>> paths;
    paths.reserve(edges.size());
    for (const auto& edge : edges) {
        paths.push_back(rasterizeEdge(edge.a, edge.b));
    }

    SDL_Log("Streets: %zu peaks, %zu after band merge, %zu segments",
            peaks.size(), survivors.size(), paths.size());
    return paths;
}

size_t applyStreets(world::TileMatrix& tiles, const std::vector<std::vector<Coordinate>>& paths) {
    size_t marked = 0;
    for (const auto& path : paths) {
        for (const auto& point : path) {
            if (point.row >= tiles.size() || point.col >= tiles.size()) continue;

            world::Tile& tile = tiles.at(point);
            if (tile.type != world::TileType::Street) {
                tile.type = world::TileType::Street;
                ++marked;
            }
            if (!world::canHold(tile.type, tile.content.kind)) {
                tile.content = world::Content::none();
            }
        }
    }
    return marked;
}

} // namespace generation
} // namespace exclusion_zone
