// Bounded Voronoi diagram built from a Bowyer-Watson Delaunay triangulation
//
// - Seeds are de-duplicated before triangulating
// - Delaunay edges between two seeds give the cell adjacency
// - Each cell is the bounding rectangle clipped by the bisector against every neighbour
// - Fewer than 3 distinct seeds, or seeds on a single line, throw GeometryError

#pragma once

#include <cstddef>
#include <glm/glm.hpp>
#include <vector>

namespace exclusion_zone {
namespace geom {

// Triangle in the Delaunay triangulation, vertices are indices into the point list
struct Triangle {
    size_t a, b, c;
    glm::dvec2 circumcenter;
    double circumradiusSq;

    bool hasEdge(size_t p, size_t q) const {
        return (a == p && b == q) || (a == q && b == p) ||
               (b == p && c == q) || (b == q && c == p) ||
               (c == p && a == q) || (c == q && a == p);
    }

    bool circumcircleContains(const glm::dvec2& p) const;
};

// Voronoi cell: convex polygon in counter-clockwise order around its seed
struct Cell {
    glm::dvec2 seed;
    std::vector<glm::dvec2> vertices;
};

class Voronoi {
public:
    Voronoi(const std::vector<glm::dvec2>& seeds,
            const glm::dvec2& minCorner, const glm::dvec2& maxCorner);

    const std::vector<glm::dvec2>& getSeeds() const { return seeds; }
    const std::vector<Triangle>& getTriangles() const { return triangles; }
    const std::vector<Cell>& getCells() const { return cells; }

    // Indices of seeds sharing a Delaunay edge with seed `index`
    const std::vector<size_t>& getNeighbours(size_t index) const { return neighbours[index]; }

private:
    void triangulate();
    void buildCells();

    glm::dvec2 minCorner;
    glm::dvec2 maxCorner;
    std::vector<glm::dvec2> seeds;
    std::vector<glm::dvec2> points;   // seeds followed by the 3 super-triangle vertices
    std::vector<Triangle> triangles;  // only triangles between real seeds
    std::vector<std::vector<size_t>> neighbours;
    std::vector<Cell> cells;
};

// Keep the part of `polygon` on the side of the line through `origin` facing
// away from `normal` (dot(p - origin, normal) <= 0)
std::vector<glm::dvec2> clipPolygon(const std::vector<glm::dvec2>& polygon,
                                    const glm::dvec2& origin, const glm::dvec2& normal);

} // namespace geom
} // namespace exclusion_zone
