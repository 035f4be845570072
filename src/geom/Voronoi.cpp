#include "exclusion_zone/geom/Voronoi.h"
#include "exclusion_zone/utils/Errors.h"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace exclusion_zone {
namespace geom {

namespace {

constexpr double EPSILON = 1e-9;

double cross(const glm::dvec2& a, const glm::dvec2& b) {
    return a.x * b.y - a.y * b.x;
}

bool makeTriangle(const std::vector<glm::dvec2>& points, size_t a, size_t b, size_t c, Triangle& out) {
    const glm::dvec2& pa = points[a];
    const glm::dvec2& pb = points[b];
    const glm::dvec2& pc = points[c];

    double d = 2.0 * (pa.x * (pb.y - pc.y) + pb.x * (pc.y - pa.y) + pc.x * (pa.y - pb.y));
    if (std::abs(d) < EPSILON) return false;

    double aSq = glm::dot(pa, pa);
    double bSq = glm::dot(pb, pb);
    double cSq = glm::dot(pc, pc);

    glm::dvec2 center(
        (aSq * (pb.y - pc.y) + bSq * (pc.y - pa.y) + cSq * (pa.y - pb.y)) / d,
        (aSq * (pc.x - pb.x) + bSq * (pa.x - pc.x) + cSq * (pb.x - pa.x)) / d);

    glm::dvec2 offset = pa - center;
    out = Triangle{a, b, c, center, glm::dot(offset, offset)};
    return true;
}

bool allCollinear(const std::vector<glm::dvec2>& seeds) {
    const glm::dvec2& origin = seeds[0];
    glm::dvec2 dir = seeds[1] - origin;
    double dirLen = glm::length(dir);
    for (size_t i = 2; i < seeds.size(); ++i) {
        glm::dvec2 v = seeds[i] - origin;
        if (std::abs(cross(dir, v)) > EPSILON * dirLen * glm::length(v)) {
            return false;
        }
    }
    return true;
}

} // namespace

bool Triangle::circumcircleContains(const glm::dvec2& p) const {
    glm::dvec2 offset = p - circumcenter;
    return glm::dot(offset, offset) < circumradiusSq * (1.0 - EPSILON);
}

std::vector<glm::dvec2> clipPolygon(const std::vector<glm::dvec2>& polygon,
                                    const glm::dvec2& origin, const glm::dvec2& normal) {
    std::vector<glm::dvec2> result;
    if (polygon.empty()) return result;
    result.reserve(polygon.size() + 1);

    for (size_t i = 0; i < polygon.size(); ++i) {
        const glm::dvec2& current = polygon[i];
        const glm::dvec2& next = polygon[(i + 1) % polygon.size()];

        double dCurrent = glm::dot(current - origin, normal);
        double dNext = glm::dot(next - origin, normal);
        bool currentInside = dCurrent <= 0.0;
        bool nextInside = dNext <= 0.0;

        if (currentInside) {
            result.push_back(current);
        }
        if (currentInside != nextInside) {
            double t = dCurrent / (dCurrent - dNext);
            result.push_back(current + (next - current) * t);
        }
    }
    return result;
}

Voronoi::Voronoi(const std::vector<glm::dvec2>& input,
                 const glm::dvec2& minCorner, const glm::dvec2& maxCorner)
    : minCorner(minCorner)
    , maxCorner(maxCorner)
    , seeds(input) {
    std::sort(seeds.begin(), seeds.end(), [](const glm::dvec2& a, const glm::dvec2& b) {
        return a.x < b.x || (a.x == b.x && a.y < b.y);
    });
    seeds.erase(std::unique(seeds.begin(), seeds.end()), seeds.end());

    if (seeds.size() < 3) {
        throw GeometryError("Voronoi diagram needs at least 3 distinct seeds, got " +
                            std::to_string(seeds.size()));
    }
    if (allCollinear(seeds)) {
        throw GeometryError("Voronoi seeds are collinear (" + std::to_string(seeds.size()) + " seeds)");
    }

    triangulate();
    buildCells();
}

void Voronoi::triangulate() {
    glm::dvec2 lo = seeds[0];
    glm::dvec2 hi = seeds[0];
    for (const auto& s : seeds) {
        lo = glm::min(lo, s);
        hi = glm::max(hi, s);
    }
    double delta = std::max(hi.x - lo.x, hi.y - lo.y);
    glm::dvec2 mid = (lo + hi) * 0.5;

    // Super triangle far enough away that it never shapes the real triangulation
    points = seeds;
    size_t s0 = points.size();
    points.emplace_back(mid.x - 20.0 * delta, mid.y - delta);
    points.emplace_back(mid.x, mid.y + 20.0 * delta);
    points.emplace_back(mid.x + 20.0 * delta, mid.y - delta);

    std::vector<Triangle> all;
    Triangle super{};
    if (!makeTriangle(points, s0, s0 + 1, s0 + 2, super)) {
        throw GeometryError("Degenerate Voronoi bounds");
    }
    all.push_back(super);

    for (size_t p = 0; p < seeds.size(); ++p) {
        const glm::dvec2& point = points[p];

        std::vector<Triangle> bad;
        std::vector<Triangle> kept;
        for (const auto& tri : all) {
            if (tri.circumcircleContains(point)) {
                bad.push_back(tri);
            } else {
                kept.push_back(tri);
            }
        }

        // Boundary of the cavity: edges of bad triangles not shared with another bad triangle
        std::vector<std::pair<size_t, size_t>> boundary;
        for (size_t i = 0; i < bad.size(); ++i) {
            const Triangle& tri = bad[i];
            std::pair<size_t, size_t> edges[3] = {{tri.a, tri.b}, {tri.b, tri.c}, {tri.c, tri.a}};
            for (const auto& edge : edges) {
                bool shared = false;
                for (size_t j = 0; j < bad.size(); ++j) {
                    if (j != i && bad[j].hasEdge(edge.first, edge.second)) {
                        shared = true;
                        break;
                    }
                }
                if (!shared) boundary.push_back(edge);
            }
        }

        for (const auto& edge : boundary) {
            Triangle tri{};
            if (makeTriangle(points, p, edge.first, edge.second, tri)) {
                kept.push_back(tri);
            }
        }
        all = std::move(kept);
    }

    size_t realCount = seeds.size();
    triangles.clear();
    for (const auto& tri : all) {
        if (tri.a < realCount && tri.b < realCount && tri.c < realCount) {
            triangles.push_back(tri);
        }
    }

    // Keep hull edges too: they live in triangles that touch the super triangle
    neighbours.assign(realCount, {});
    for (const auto& tri : all) {
        size_t v[3] = {tri.a, tri.b, tri.c};
        for (int i = 0; i < 3; ++i) {
            size_t p = v[i];
            size_t q = v[(i + 1) % 3];
            if (p < realCount && q < realCount) {
                neighbours[p].push_back(q);
                neighbours[q].push_back(p);
            }
        }
    }
    for (auto& list : neighbours) {
        std::sort(list.begin(), list.end());
        list.erase(std::unique(list.begin(), list.end()), list.end());
    }
}

void Voronoi::buildCells() {
    cells.clear();
    cells.reserve(seeds.size());

    for (size_t i = 0; i < seeds.size(); ++i) {
        const glm::dvec2& seed = seeds[i];

        // Counter-clockwise bounding rectangle
        std::vector<glm::dvec2> polygon = {
            {minCorner.x, minCorner.y},
            {maxCorner.x, minCorner.y},
            {maxCorner.x, maxCorner.y},
            {minCorner.x, maxCorner.y}
        };

        std::vector<bool> clipped(seeds.size(), false);
        clipped[i] = true;
        for (size_t n : neighbours[i]) {
            const glm::dvec2& other = seeds[n];
            polygon = clipPolygon(polygon, (seed + other) * 0.5, other - seed);
            clipped[n] = true;
        }

        // Near the hull the super triangle can hide a Delaunay edge, so every other
        // seed still gets a chance to cut the cell. Most of these leave it unchanged.
        for (size_t n = 0; n < seeds.size() && !polygon.empty(); ++n) {
            if (clipped[n]) continue;
            const glm::dvec2& other = seeds[n];
            polygon = clipPolygon(polygon, (seed + other) * 0.5, other - seed);
        }

        cells.push_back(Cell{seed, std::move(polygon)});
    }
}

} // namespace geom
} // namespace exclusion_zone
