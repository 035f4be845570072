#pragma once

#include "exclusion_zone/utils/Range.h"
#include <array>
#include <cstddef>
#include <cstdint>

namespace exclusion_zone {
namespace world {

// Terrain kinds. The first seven are produced by the classifier in ascending
// elevation order; Street and Lava are carved by later phases.
enum class TileType : uint8_t {
    DeepWater = 0,
    ShallowWater,
    Sand,
    Grass,
    Street,
    Hill,
    Mountain,
    Snow,
    Lava,
    Count
};

enum class ContentKind : uint8_t {
    Rock = 0,
    Tree,
    Garbage,
    Fire,
    Coin,
    Bin,
    Crate,
    Bank,
    Water,
    None,
    Count
};

constexpr size_t TILE_TYPE_COUNT = static_cast<size_t>(TileType::Count);
constexpr size_t CONTENT_KIND_COUNT = static_cast<size_t>(ContentKind::Count);

// Tagged content value.
// Rock, Tree, Garbage, Coin and Water use `quantity`; Bin, Crate and Bank use `capacity`.
struct Content {
    ContentKind kind = ContentKind::None;
    uint32_t quantity = 0;
    utils::Range<uint32_t> capacity;

    static Content none() { return Content{}; }
    static Content fire() { return make(ContentKind::Fire); }
    static Content rock(uint32_t q) { return withQuantity(ContentKind::Rock, q); }
    static Content tree(uint32_t q) { return withQuantity(ContentKind::Tree, q); }
    static Content garbage(uint32_t q) { return withQuantity(ContentKind::Garbage, q); }
    static Content coin(uint32_t q) { return withQuantity(ContentKind::Coin, q); }
    static Content water(uint32_t q) { return withQuantity(ContentKind::Water, q); }
    static Content bin(utils::Range<uint32_t> c) { return withCapacity(ContentKind::Bin, c); }
    static Content crate(utils::Range<uint32_t> c) { return withCapacity(ContentKind::Crate, c); }
    static Content bank(utils::Range<uint32_t> c) { return withCapacity(ContentKind::Bank, c); }

    bool isNone() const { return kind == ContentKind::None; }
    bool hasQuantity() const;
    bool hasCapacity() const;

    // Quantity for counted kinds, upper capacity bound for containers, 0 otherwise
    uint32_t amount() const;

    bool operator==(const Content& other) const {
        return kind == other.kind && quantity == other.quantity && capacity == other.capacity;
    }

    bool operator!=(const Content& other) const {
        return !(*this == other);
    }

private:
    static Content make(ContentKind k) {
        Content c;
        c.kind = k;
        return c;
    }

    static Content withQuantity(ContentKind k, uint32_t q) {
        Content c = make(k);
        c.quantity = q;
        return c;
    }

    static Content withCapacity(ContentKind k, utils::Range<uint32_t> cap) {
        Content c = make(k);
        c.capacity = cap;
        return c;
    }
};

struct Tile {
    TileType type = TileType::Grass;
    Content content;
};

// Static properties of a terrain kind
struct TileTypeProps {
    bool walk;
    uint32_t cost;
    std::array<bool, CONTENT_KIND_COUNT> hold;
};

// Static properties of a content kind
struct ContentProps {
    bool destroy;
    bool store;
    uint32_t max;
    uint32_t cost;
};

const TileTypeProps& getTileTypeProps(TileType type);
const ContentProps& getContentProps(ContentKind kind);

inline bool canHold(TileType type, ContentKind kind) {
    return getTileTypeProps(type).hold[static_cast<size_t>(kind)];
}

inline bool isWalkable(TileType type) {
    return getTileTypeProps(type).walk;
}

inline uint32_t maxQuantity(ContentKind kind) {
    return getContentProps(kind).max;
}

const char* getTileTypeName(TileType type);
const char* getContentKindName(ContentKind kind);

} // namespace world
} // namespace exclusion_zone
