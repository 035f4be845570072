#include "exclusion_zone/world/Tile.h"

namespace exclusion_zone {
namespace world {

namespace {

// Hold columns follow ContentKind order:
//                Rock   Tree   Garbage Fire   Coin   Bin    Crate  Bank   Water  None
const std::array<TileTypeProps, TILE_TYPE_COUNT> TILE_TYPE_PROPS = {{
    /* DeepWater    */ {false, 0,  {false, false, false, false, false, false, false, false, true,  true}},
    /* ShallowWater */ {true,  5,  {false, false, false, false, false, false, false, false, true,  true}},
    /* Sand         */ {true,  3,  {true,  false, true,  false, true,  true,  true,  false, false, true}},
    /* Grass        */ {true,  1,  {true,  true,  true,  true,  true,  true,  true,  true,  false, true}},
    /* Street       */ {true,  0,  {true,  false, true,  false, true,  true,  false, true,  false, true}},
    /* Hill         */ {true,  5,  {true,  true,  true,  true,  true,  true,  true,  false, false, true}},
    /* Mountain     */ {true,  10, {true,  false, true,  false, true,  true,  true,  false, false, true}},
    /* Snow         */ {true,  3,  {true,  false, true,  false, true,  false, true,  false, false, true}},
    /* Lava         */ {false, 0,  {false, false, false, false, false, false, false, false, false, true}},
}};

const std::array<ContentProps, CONTENT_KIND_COUNT> CONTENT_PROPS = {{
    /* Rock    */ {true,  false, 4,  1},
    /* Tree    */ {true,  false, 5,  3},
    /* Garbage */ {true,  false, 3,  4},
    /* Fire    */ {true,  false, 0,  5},
    /* Coin    */ {true,  true,  10, 0},
    /* Bin     */ {false, true,  10, 0},
    /* Crate   */ {false, true,  20, 0},
    /* Bank    */ {false, true,  50, 0},
    /* Water   */ {true,  true,  20, 3},
    /* None    */ {false, false, 0,  0},
}};

} // namespace

bool Content::hasQuantity() const {
    switch (kind) {
        case ContentKind::Rock:
        case ContentKind::Tree:
        case ContentKind::Garbage:
        case ContentKind::Coin:
        case ContentKind::Water:
            return true;
        default:
            return false;
    }
}

bool Content::hasCapacity() const {
    return kind == ContentKind::Bin || kind == ContentKind::Crate || kind == ContentKind::Bank;
}

uint32_t Content::amount() const {
    if (hasQuantity()) return quantity;
    if (hasCapacity()) return capacity.end;
    return 0;
}

const TileTypeProps& getTileTypeProps(TileType type) {
    return TILE_TYPE_PROPS[static_cast<size_t>(type)];
}

const ContentProps& getContentProps(ContentKind kind) {
    return CONTENT_PROPS[static_cast<size_t>(kind)];
}

const char* getTileTypeName(TileType type) {
    switch (type) {
        case TileType::DeepWater: return "DeepWater";
        case TileType::ShallowWater: return "ShallowWater";
        case TileType::Sand: return "Sand";
        case TileType::Grass: return "Grass";
        case TileType::Street: return "Street";
        case TileType::Hill: return "Hill";
        case TileType::Mountain: return "Mountain";
        case TileType::Snow: return "Snow";
        case TileType::Lava: return "Lava";
        default: return "Unknown";
    }
}

const char* getContentKindName(ContentKind kind) {
    switch (kind) {
        case ContentKind::Rock: return "Rock";
        case ContentKind::Tree: return "Tree";
        case ContentKind::Garbage: return "Garbage";
        case ContentKind::Fire: return "Fire";
        case ContentKind::Coin: return "Coin";
        case ContentKind::Bin: return "Bin";
        case ContentKind::Crate: return "Crate";
        case ContentKind::Bank: return "Bank";
        case ContentKind::Water: return "Water";
        case ContentKind::None: return "None";
        default: return "Unknown";
    }
}

} // namespace world
} // namespace exclusion_zone
