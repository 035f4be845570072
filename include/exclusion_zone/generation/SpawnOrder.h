#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace exclusion_zone {
namespace generation {

// Phases the orchestrator can run after terrain classification
enum class SpawnKind : uint8_t {
    Street = 0,
    Lava,
    Water,
    Bank,
    Bin,
    Crate,
    Garbage,
    Fire,
    Tree,
    Rock,
    Coin
};

using SpawnOrder = std::vector<SpawnKind>;

const char* getSpawnKindName(SpawnKind kind);

// Case-sensitive inverse of getSpawnKindName
bool parseSpawnKind(const std::string& name, SpawnKind& out);

// Street, Lava, Water, Bank, Bin, Crate, Garbage, Fire, Tree, Rock, Coin
SpawnOrder defaultSpawnOrder();

// Keep the first occurrence of each kind, preserving order
SpawnOrder deduplicateSpawnOrder(const SpawnOrder& order);

} // namespace generation
} // namespace exclusion_zone
