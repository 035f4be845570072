#include "WorldImage.h"
#include <SDL3/SDL_log.h>
#include <lodepng.h>

namespace exclusion_zone {
namespace tools {

using world::ContentKind;
using world::TileType;

Rgb getTileColor(TileType type) {
    switch (type) {
        case TileType::DeepWater: return {5, 25, 90};
        case TileType::ShallowWater: return {45, 100, 160};
        case TileType::Sand: return {240, 230, 140};
        case TileType::Grass: return {74, 111, 40};
        case TileType::Street: return {90, 90, 90};
        case TileType::Hill: return {146, 104, 41};
        case TileType::Mountain: return {160, 160, 160};
        case TileType::Snow: return {250, 249, 246};
        case TileType::Lava: return {255, 129, 0};
        default: return {255, 0, 255};
    }
}

Rgb getContentColor(ContentKind kind) {
    switch (kind) {
        case ContentKind::Rock: return {240, 223, 206};
        case ContentKind::Tree: return {99, 73, 43};
        case ContentKind::Garbage: return {120, 140, 60};
        case ContentKind::Fire: return {255, 0, 0};
        case ContentKind::Coin: return {243, 199, 13};
        case ContentKind::Bin: return {57, 60, 65};
        case ContentKind::Crate: return {228, 199, 148};
        case ContentKind::Bank: return {227, 224, 205};
        case ContentKind::Water: return {30, 70, 140};
        default: return {255, 0, 255};
    }
}

std::vector<unsigned char> renderWorldImage(const world::TileMatrix& tiles,
                                            const world::Coordinate& spawnPoint, uint32_t scale) {
    const size_t tileCount = tiles.size();
    const size_t width = tileCount * scale;
    std::vector<unsigned char> image(width * width * 3, 0);

    auto fill = [&](size_t row, size_t col, size_t inset, const Rgb& color) {
        for (size_t y = row * scale + inset; y < (row + 1) * scale - inset; ++y) {
            for (size_t x = col * scale + inset; x < (col + 1) * scale - inset; ++x) {
                size_t index = (y * width + x) * 3;
                image[index + 0] = color.r;
                image[index + 1] = color.g;
                image[index + 2] = color.b;
            }
        }
    };

    const size_t contentInset = scale >= 3 ? 1 : 0;
    for (size_t r = 0; r < tileCount; ++r) {
        for (size_t c = 0; c < tileCount; ++c) {
            const world::Tile& tile = tiles.at(r, c);
            fill(r, c, 0, getTileColor(tile.type));

            // Water content on water tiles is the default state, not worth drawing
            if (!tile.content.isNone() && tile.content.kind != ContentKind::Water) {
                fill(r, c, contentInset, getContentColor(tile.content.kind));
            }
        }
    }

    if (spawnPoint.row < tileCount && spawnPoint.col < tileCount) {
        fill(spawnPoint.row, spawnPoint.col, 0, Rgb{0, 0, 0});
    }
    return image;
}

bool writeWorldPng(const std::string& path, const world::TileMatrix& tiles,
                   const world::Coordinate& spawnPoint, uint32_t scale) {
    if (scale == 0 || tiles.empty()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Cannot write empty world image: %s", path.c_str());
        return false;
    }

    std::vector<unsigned char> image = renderWorldImage(tiles, spawnPoint, scale);
    unsigned width = static_cast<unsigned>(tiles.size() * scale);

    unsigned error = lodepng::encode(path, image, width, width, LCT_RGB, 8);
    if (error) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PNG encode error %u: %s",
                     error, lodepng_error_text(error));
        return false;
    }

    SDL_Log("Saved world image: %s (%ux%u)", path.c_str(), width, width);
    return true;
}

} // namespace tools
} // namespace exclusion_zone
