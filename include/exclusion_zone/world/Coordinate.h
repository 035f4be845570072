#pragma once

#include <cstddef>
#include <functional>

namespace exclusion_zone {
namespace world {

// Grid position, row-major. Ordered by (row, col).
struct Coordinate {
    size_t row = 0;
    size_t col = 0;

    Coordinate() = default;
    Coordinate(size_t r, size_t c) : row(r), col(c) {}

    bool operator==(const Coordinate& other) const {
        return row == other.row && col == other.col;
    }

    bool operator!=(const Coordinate& other) const {
        return !(*this == other);
    }

    bool operator<(const Coordinate& other) const {
        return row < other.row || (row == other.row && col < other.col);
    }
};

// Hash function for Coordinate to use in unordered containers
struct CoordinateHash {
    size_t operator()(const Coordinate& c) const {
        return std::hash<size_t>()(c.row) ^ (std::hash<size_t>()(c.col) * 0x9e3779b97f4a7c15ULL);
    }
};

inline size_t manhattanDistance(const Coordinate& a, const Coordinate& b) {
    size_t dr = a.row > b.row ? a.row - b.row : b.row - a.row;
    size_t dc = a.col > b.col ? a.col - b.col : b.col - a.col;
    return dr + dc;
}

} // namespace world
} // namespace exclusion_zone
