#include "spawner.hpp"

#include <algorithm>
#include <map>

const char* spawnKindName(SpawnKind k) {
    switch (k) {
        case SpawnKind::Goblin:             return "Goblin";
        case SpawnKind::Orc:                return "Orc";
        case SpawnKind::HealthPotion:       return "Health Potion";
        case SpawnKind::FireballScroll:     return "Fireball Scroll";
        case SpawnKind::ConfusionScroll:    return "Confusion Scroll";
        case SpawnKind::MagicMissileScroll: return "Magic Missile Scroll";
        case SpawnKind::Dagger:             return "Dagger";
        case SpawnKind::Shield:             return "Shield";
        case SpawnKind::LongSword:          return "Long Sword";
        case SpawnKind::TowerShield:        return "Tower Shield";
        case SpawnKind::Rations:            return "Rations";
        case SpawnKind::MagicMappingScroll: return "Magic Mapping Scroll";
        case SpawnKind::BearTrap:           return "Bear Trap";
        default:                            return "Unknown";
    }
}

std::vector<SpawnEntry> roomSpawnTable(int depth) {
    depth = std::max(1, depth);

    std::vector<SpawnEntry> table = {
        {SpawnKind::Goblin, 10},
        {SpawnKind::Orc, 1 + depth},
        {SpawnKind::HealthPotion, 7},
        {SpawnKind::FireballScroll, 2 + depth},
        {SpawnKind::ConfusionScroll, 2 + depth},
        {SpawnKind::MagicMissileScroll, 4},
        {SpawnKind::Dagger, 3},
        {SpawnKind::Shield, 3},
        {SpawnKind::LongSword, depth - 1},
        {SpawnKind::TowerShield, depth - 1},
        {SpawnKind::Rations, 10},
        {SpawnKind::MagicMappingScroll, 2},
        {SpawnKind::BearTrap, 2},
    };

    table.erase(std::remove_if(table.begin(), table.end(), [](const SpawnEntry& e) { return e.weight <= 0; }), table.end());
    return table;
}

SpawnKind pickSpawn(const std::vector<SpawnEntry>& table, RNG& rng) {
    int total = 0;
    for (const auto& e : table) {
        if (e.weight > 0) total += e.weight;
    }
    if (total <= 0) return SpawnKind::Goblin;

    int roll = rng.range(0, total - 1);
    for (const auto& e : table) {
        if (e.weight <= 0) continue;
        roll -= e.weight;
        if (roll < 0) return e.kind;
    }
    return table.back().kind;
}

void spawnRegion(const Grid& grid, const std::vector<int>& area, RNG& rng, int depth, const SpawnFn& spawn) {
    if (area.empty()) return;

    const std::vector<SpawnEntry> table = roomSpawnTable(depth);

    std::vector<int> pool = area;
    const int batch = rng.rollDice(1, kMaxSpawnsPerArea + 3) + (depth - 1) - 3;
    const int n = std::min(static_cast<int>(pool.size()), batch);
    if (n <= 0) return;

    std::map<int, SpawnKind> points;
    for (int i = 0; i < n; ++i) {
        const int pick = (pool.size() == 1) ? 0 : rng.range(0, static_cast<int>(pool.size()) - 1);
        const int tile = pool[static_cast<size_t>(pick)];
        points[tile] = pickSpawn(table, rng);
        pool.erase(pool.begin() + pick);
    }

    if (!spawn) return;
    for (const auto& kv : points) {
        const Vec2i p = grid.posOf(kv.first);
        spawn(kv.second, p.x, p.y);
    }
}

void spawnRoom(const Grid& grid, const Rect& room, RNG& rng, int depth, const SpawnFn& spawn) {
    std::vector<int> area;
    for (int y = room.y1 + 1; y < room.y2; ++y) {
        for (int x = room.x1 + 1; x < room.x2; ++x) {
            if (!grid.inBounds(x, y)) continue;
            if (grid.at(x, y) == TileKind::Floor) area.push_back(grid.index(x, y));
        }
    }
    spawnRegion(grid, area, rng, depth, spawn);
}
