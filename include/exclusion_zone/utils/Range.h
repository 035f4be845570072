#pragma once

#include <cstddef>

namespace exclusion_zone {
namespace utils {

/**
 * Range - half-open interval [start, end)
 * Used by every settings struct for counts, radii and quantities.
 */
template<typename T>
struct Range {
    T start{};
    T end{};

    Range() = default;
    Range(T s, T e) : start(s), end(e) {}

    bool empty() const { return !(start < end); }

    T length() const { return empty() ? T{} : end - start; }

    bool contains(T value) const { return !(value < start) && value < end; }

    bool operator==(const Range& other) const {
        return start == other.start && end == other.end;
    }

    bool operator!=(const Range& other) const {
        return !(*this == other);
    }
};

} // namespace utils
} // namespace exclusion_zone
