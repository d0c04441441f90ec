#include "content.hpp"
#include "common.hpp"

#include <algorithm>

namespace {

const std::array<MonsterDef, ENTITY_KIND_COUNT> kMonsterDefs = {{
    // kind               id        glyph hp  atk dmg    ai               spd regen range prefer xp
    { EntityKind::Goblin, "goblin", 'g',  5,  8,  1, 2, AiStyle::Melee,  1,  0,    0,    0,     8  },
    { EntityKind::Orc,    "orc",    'o',  10, 10, 2, 3, AiStyle::Melee,  1,  0,    0,    0,     14 },
    { EntityKind::Wolf,   "wolf",   'w',  6,  9,  1, 2, AiStyle::Runner, 2,  0,    0,    0,     10 },
    { EntityKind::Archer, "archer", 'a',  6,  8,  1, 2, AiStyle::Ranged, 1,  0,    7,    4,     12 },
    { EntityKind::Troll,  "troll",  'T',  20, 10, 3, 5, AiStyle::Melee,  1,  1,    0,    0,     24 },
}};

} // namespace

const MonsterDef& monsterDef(EntityKind k) {
    const size_t i = static_cast<size_t>(k);
    if (i >= kMonsterDefs.size()) return kMonsterDefs[0];
    return kMonsterDefs[i];
}

std::string monsterName(EntityKind k) {
    return toUpper(monsterDef(k).id);
}

std::vector<SpawnEntry> spawnTable(int depth) {
    depth = std::max(1, depth);
    std::vector<SpawnEntry> t;
    t.push_back({EntityKind::Goblin, std::max(2, 8 - std::min(depth, 6))});
    t.push_back({EntityKind::Wolf, std::max(1, depth)});
    t.push_back({EntityKind::Archer, std::max(1, depth)});
    t.push_back({EntityKind::Orc, std::max(1, 1 + depth / 2)});
    if (depth >= TROLL_MIN_DEPTH) {
        t.push_back({EntityKind::Troll, std::max(1, depth - 1)});
    }
    return t;
}

std::vector<EntityKind> depthSpawnBag(int depth) {
    std::vector<EntityKind> bag;
    for (const SpawnEntry& e : spawnTable(depth)) {
        for (int i = 0; i < e.weight; ++i) bag.push_back(e.kind);
    }
    if (bag.empty()) bag.push_back(EntityKind::Goblin);
    return bag;
}

EntityKind pickSpawnMonster(RNG& rng, int depth) {
    const std::vector<EntityKind> bag = depthSpawnBag(depth);
    return bag[static_cast<size_t>(rng.range(0, static_cast<int>(bag.size()) - 1))];
}

const char* attrName(Attr which) {
    switch (which) {
        case Attr::MU: return "MU";
        case Attr::KL: return "KL";
        case Attr::IN: return "IN";
        case Attr::CH: return "CH";
        case Attr::FF: return "FF";
        case Attr::GE: return "GE";
        case Attr::KO: return "KO";
        case Attr::KK: return "KK";
        default:       return "??";
    }
}

void applyDwarfSlayerModifiers(Attributes& a) {
    auto add = [&](Attr w, int v) { a[static_cast<size_t>(w)] += v; };
    // Dwarf
    add(Attr::KO, +2);
    add(Attr::KK, +2);
    add(Attr::GE, -1);
    add(Attr::CH, -1);
    // Slayer
    add(Attr::KK, +2);
    add(Attr::MU, +1);
}

Attributes rollAttributes(RNG& rng) {
    Attributes a{};
    for (int& v : a) v = rng.range(8, 14);
    applyDwarfSlayerModifiers(a);
    return a;
}

DerivedStats deriveStats(const Attributes& a) {
    DerivedStats d;
    d.maxHp = 20 + std::max(0, attr(a, Attr::KO) - 10) + attr(a, Attr::KK) / 5;
    d.atk = 6 + (attr(a, Attr::KK) + attr(a, Attr::GE)) / 4;
    d.par = 4 + (attr(a, Attr::GE) + attr(a, Attr::MU)) / 5;
    return d;
}

int xpThreshold(int level) {
    return 20 + level * 10;
}
