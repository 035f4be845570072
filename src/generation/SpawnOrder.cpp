#include "exclusion_zone/generation/SpawnOrder.h"
#include <array>

namespace exclusion_zone {
namespace generation {

namespace {

const std::array<SpawnKind, 11> ALL_SPAWN_KINDS = {{
    SpawnKind::Street, SpawnKind::Lava, SpawnKind::Water, SpawnKind::Bank,
    SpawnKind::Bin, SpawnKind::Crate, SpawnKind::Garbage, SpawnKind::Fire,
    SpawnKind::Tree, SpawnKind::Rock, SpawnKind::Coin
}};

} // namespace

const char* getSpawnKindName(SpawnKind kind) {
    switch (kind) {
        case SpawnKind::Street: return "Street";
        case SpawnKind::Lava: return "Lava";
        case SpawnKind::Water: return "Water";
        case SpawnKind::Bank: return "Bank";
        case SpawnKind::Bin: return "Bin";
        case SpawnKind::Crate: return "Crate";
        case SpawnKind::Garbage: return "Garbage";
        case SpawnKind::Fire: return "Fire";
        case SpawnKind::Tree: return "Tree";
        case SpawnKind::Rock: return "Rock";
        case SpawnKind::Coin: return "Coin";
        default: return "Unknown";
    }
}

bool parseSpawnKind(const std::string& name, SpawnKind& out) {
    for (SpawnKind kind : ALL_SPAWN_KINDS) {
        if (name == getSpawnKindName(kind)) {
            out = kind;
            return true;
        }
    }
    return false;
}

SpawnOrder defaultSpawnOrder() {
    return SpawnOrder(ALL_SPAWN_KINDS.begin(), ALL_SPAWN_KINDS.end());
}

SpawnOrder deduplicateSpawnOrder(const SpawnOrder& order) {
    std::array<bool, ALL_SPAWN_KINDS.size()> seen{};
    SpawnOrder result;
    result.reserve(order.size());

    for (SpawnKind kind : order) {
        size_t index = static_cast<size_t>(kind);
        if (index >= seen.size() || seen[index]) continue;
        seen[index] = true;
        result.push_back(kind);
    }
    return result;
}

} // namespace generation
} // namespace exclusion_zone
