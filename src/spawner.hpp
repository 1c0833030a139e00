#pragma once

#include "grid.hpp"
#include "rng.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

enum class SpawnKind : uint8_t {
    Goblin = 0,
    Orc,
    HealthPotion,
    FireballScroll,
    ConfusionScroll,
    MagicMissileScroll,
    Dagger,
    Shield,
    LongSword,
    TowerShield,
    Rations,
    MagicMappingScroll,
    BearTrap,
};

const char* spawnKindName(SpawnKind k);

struct SpawnEntry {
    SpawnKind kind = SpawnKind::Goblin;
    int weight = 1;
};

// Entity-creation collaborator. Called once per placed entity.
using SpawnFn = std::function<void(SpawnKind kind, int x, int y)>;

// Upper bound of the d(1, N+3) roll used to size each region's spawn batch.
constexpr int kMaxSpawnsPerArea = 4;

// Depth-weighted table. Entries whose weight drops to <= 0 are removed.
std::vector<SpawnEntry> roomSpawnTable(int depth);

// Weighted pick. Falls back to Goblin for an empty table.
SpawnKind pickSpawn(const std::vector<SpawnEntry>& table, RNG& rng);

// Scatters a depth-sized batch over distinct tiles of `area` (tile indices).
// Calls are made in ascending tile order.
void spawnRegion(const Grid& grid, const std::vector<int>& area, RNG& rng, int depth, const SpawnFn& spawn);

// Scatters over the Floor tiles strictly inside `room`.
void spawnRoom(const Grid& grid, const Rect& room, RNG& rng, int depth, const SpawnFn& spawn);
