#pragma once

#include "rng.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

enum class EntityKind : uint8_t {
    Goblin = 0,
    Orc,
    Wolf,
    Archer,
    Troll,
};

constexpr int ENTITY_KIND_COUNT = 5;

enum class AiStyle : uint8_t {
    Melee = 0,
    Runner,  // takes two steps per turn while closing distance
    Ranged,  // shoots from range, keeps a preferred distance
};

// Static template for an enemy kind.
struct MonsterDef {
    EntityKind kind = EntityKind::Goblin;
    const char* id = "";
    char glyph = '?';
    int hp = 1;
    int atk = 8;
    int dmgMin = 1;
    int dmgMax = 2;
    AiStyle ai = AiStyle::Melee;
    int speed = 1;
    int regen = 0;
    int range = 0;
    int prefer = 0;
    int xp = 8;
};

const MonsterDef& monsterDef(EntityKind k);

// Upper-case display name ("GOBLIN").
std::string monsterName(EntityKind k);


// Depth-weighted spawn bag: each kind appears once per weight point.
// Trolls only join from TROLL_MIN_DEPTH on.
constexpr int TROLL_MIN_DEPTH = 2;

struct SpawnEntry {
    EntityKind kind = EntityKind::Goblin;
    int weight = 1;
};

std::vector<SpawnEntry> spawnTable(int depth);
std::vector<EntityKind> depthSpawnBag(int depth);
EntityKind pickSpawnMonster(RNG& rng, int depth);

// ------------------------------------------------------------
// Player attributes (eight classic values) and derived stats.
// ------------------------------------------------------------
enum class Attr : uint8_t {
    MU = 0, // courage
    KL,     // cleverness
    IN,     // intuition
    CH,     // charisma
    FF,     // dexterity (fingers)
    GE,     // agility
    KO,     // constitution
    KK,     // strength
};

constexpr int ATTR_COUNT = 8;

using Attributes = std::array<int, ATTR_COUNT>;

inline int attr(const Attributes& a, Attr which) { return a[static_cast<size_t>(which)]; }
const char* attrName(Attr which);

// Rolls 8..14 per attribute and applies the dwarf race and slayer profession modifiers.
Attributes rollAttributes(RNG& rng);
void applyDwarfSlayerModifiers(Attributes& a);

struct DerivedStats {
    int maxHp = 20;
    int atk = 6;
    int par = 4;
};

DerivedStats deriveStats(const Attributes& a);

// XP needed to advance from `level` to `level + 1`.
int xpThreshold(int level);
