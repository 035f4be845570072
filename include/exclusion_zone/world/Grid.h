#pragma once

#include "exclusion_zone/world/Coordinate.h"
#include <cstddef>
#include <vector>

namespace exclusion_zone {
namespace world {

// Square row-major grid. Backs both the elevation field and the tile matrix.
template<typename T>
class Grid {
public:
    Grid() = default;

    explicit Grid(size_t size, const T& value = T{})
        : size_(size), cells_(size * size, value) {}

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    T& at(size_t row, size_t col) { return cells_[row * size_ + col]; }
    const T& at(size_t row, size_t col) const { return cells_[row * size_ + col]; }

    T& at(const Coordinate& c) { return at(c.row, c.col); }
    const T& at(const Coordinate& c) const { return at(c.row, c.col); }

    bool inBounds(long long row, long long col) const {
        return row >= 0 && col >= 0 &&
               row < static_cast<long long>(size_) && col < static_cast<long long>(size_);
    }

    std::vector<T>& data() { return cells_; }
    const std::vector<T>& data() const { return cells_; }

private:
    size_t size_ = 0;
    std::vector<T> cells_;
};

} // namespace world
} // namespace exclusion_zone
