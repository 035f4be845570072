#pragma once

#include "exclusion_zone/world/Coordinate.h"
#include "exclusion_zone/world/TileMatrix.h"
#include <cstdint>
#include <string>
#include <vector>

namespace exclusion_zone {
namespace tools {

struct Rgb {
    uint8_t r, g, b;
};

Rgb getTileColor(world::TileType type);
Rgb getContentColor(world::ContentKind kind);

// RGB8 image, `scale` pixels per tile. Content is drawn inside the tile leaving a
// one pixel terrain border when scale >= 3; the spawn point is drawn black.
std::vector<unsigned char> renderWorldImage(const world::TileMatrix& tiles,
                                            const world::Coordinate& spawnPoint, uint32_t scale);

bool writeWorldPng(const std::string& path, const world::TileMatrix& tiles,
                   const world::Coordinate& spawnPoint, uint32_t scale);

} // namespace tools
} // namespace exclusion_zone
