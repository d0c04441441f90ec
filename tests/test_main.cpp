#include "cli.hpp"
#include "combat_rules.hpp"
#include "content.hpp"
#include "dungeon.hpp"
#include "game.hpp"
#include "keybinds.hpp"
#include "pathfinding.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "view.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

GameConfig quietConfig() {
    GameConfig c;
    c.enemiesPerFloor = 0;
    c.potionsPerFloor = 0;
    return c;
}

// Hand-built open room: walls on the border, floor inside.
Dungeon openRoom(int w, int h) {
    Dungeon d(w, h);
    for (int y = 1; y < h - 1; ++y) {
        for (int x = 1; x < w - 1; ++x) {
            d.at(x, y).type = TileType::Floor;
        }
    }
    return d;
}

// An arena run: no random spawns, every enemy awake, and a player who
// parries every blow so scripted fights cannot end the run.
Game arenaGame(uint32_t seed) {
    GameConfig cfg = quietConfig();
    cfg.activationRange = 0;
    Game g;
    g.setConfig(cfg);
    g.newGame(seed);
    g.playerMut().par = 20;
    return g;
}

Entity makeEnemy(EntityKind kind, Vec2i pos) {
    Entity e;
    e.id = 1000;
    e.kind = kind;
    e.pos = pos;
    e.hpMax = monsterDef(kind).hp;
    e.hp = e.hpMax;
    e.active = true;
    return e;
}

// Same 8-way steps-to-player field the enemy phase walks.
std::vector<int> costToPlayer(const Game& g) {
    const Dungeon& d = g.dungeon();
    return stepsToTarget(d.width, d.height, g.player().pos,
        [&](int x, int y) { return d.isWalkable(x, y); },
        [&](int x, int y, int dx, int dy) { return diagonalPassable(d, {x, y}, dx, dy); });
}

int costAt(const Game& g, const std::vector<int>& cost, Vec2i p) {
    return cost[static_cast<size_t>(p.y * g.dungeon().width + p.x)];
}

std::optional<Vec2i> tileAtCost(const Game& g, const std::vector<int>& cost, int want, int minDist2) {
    const Dungeon& d = g.dungeon();
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            if (costAt(g, cost, {x, y}) != want) continue;
            if (dist2({x, y}, g.player().pos) <= minDist2) continue;
            return Vec2i{x, y};
        }
    }
    return std::nullopt;
}

struct Step {
    int dx, dy;
    Action action;
};

constexpr Step ORTHO_STEPS[] = {
    {0, -1, Action::Up}, {0, 1, Action::Down}, {-1, 0, Action::Left}, {1, 0, Action::Right},
};

std::optional<Step> walkableNeighbor(const Game& g) {
    const Vec2i p = g.player().pos;
    for (const Step& s : ORTHO_STEPS) {
        if (g.dungeon().isWalkable(p.x + s.dx, p.y + s.dy)) return s;
    }
    return std::nullopt;
}

bool loggedContaining(const Game& g, const std::string& needle) {
    for (const auto& m : g.messages()) {
        if (m.text.find(needle) != std::string::npos) return true;
    }
    return false;
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    // Also validate range() stays within bounds.
    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }

    RNG zero(0u);
    expect(zero.nextU32() != 0u, "RNG with seed 0 must not get stuck at zero");

    expect(Game::levelSeed(77u, 1) != Game::levelSeed(77u, 2), "Level seeds differ per depth");
    expect(Game::levelSeed(77u, 3) == Game::levelSeed(77u, 3), "Level seed is a pure function");
}

void test_dungeon_always_connected() {
    for (uint32_t seed = 1; seed <= 300; ++seed) {
        RNG rng(hashCombine(seed, tag32("TEST")));
        Dungeon d(Game::MAP_W, Game::MAP_H);
        d.generate(rng);

        const std::string tag = " (seed " + std::to_string(seed) + ")";
        expect(d.rooms.size() >= 2, "At least two rooms" + tag);
        expect(d.isWalkable(d.start.x, d.start.y), "Start is walkable" + tag);
        expect(d.isStairs(d.stairsDown.x, d.stairsDown.y), "Stairs tile placed" + tag);
        expect(d.isFullyConnected(), "Every walkable tile reachable from start" + tag);

        const auto dist = d.distanceMap(d.start);
        const int toStairs = dist[static_cast<size_t>(d.stairsDown.y * d.width + d.stairsDown.x)];
        expect(toStairs >= 0, "Stairs reachable from start" + tag);

        bool borderSolid = true;
        for (int x = 0; x < d.width; ++x) {
            if (d.isWalkable(x, 0) || d.isWalkable(x, d.height - 1)) borderSolid = false;
        }
        for (int y = 0; y < d.height; ++y) {
            if (d.isWalkable(0, y) || d.isWalkable(d.width - 1, y)) borderSolid = false;
        }
        expect(borderSolid, "Map border stays wall" + tag);

        for (size_t i = 0; i < d.rooms.size(); ++i) {
            for (size_t j = i + 1; j < d.rooms.size(); ++j) {
                expect(!d.rooms[i].touches(d.rooms[j]), "Rooms never touch" + tag);
            }
        }
    }
}

void test_dungeon_small_map_fallback() {
    RNG rng(9u);
    Dungeon d(8, 8);
    d.generate(rng);
    expect(d.isFullyConnected(), "Tiny map still yields a connected layout");
    expect(d.isStairs(d.stairsDown.x, d.stairsDown.y), "Tiny map has stairs");
}

void test_generation_deterministic() {
    for (uint32_t seed : {1u, 42u, 0xC0FFEEu}) {
        RNG a(seed);
        RNG b(seed);
        Dungeon da(Game::MAP_W, Game::MAP_H);
        Dungeon db(Game::MAP_W, Game::MAP_H);
        da.generate(a);
        db.generate(b);

        bool same = da.start == db.start && da.stairsDown == db.stairsDown;
        for (size_t i = 0; same && i < da.tiles.size(); ++i) {
            same = da.tiles[i].type == db.tiles[i].type;
        }
        expect(same, "Same seed produces the same layout");
    }

    Game g1;
    Game g2;
    g1.newGame(555u);
    g2.newGame(555u);
    const Action script[] = {Action::Right, Action::Down, Action::Wait, Action::Left, Action::Rest, Action::Up};
    for (int i = 0; i < 60; ++i) {
        const Action a = script[i % 6];
        g1.handleAction(a);
        g2.handleAction(a);
    }
    expect(g1.player().pos == g2.player().pos, "Replaying a run gives the same player position");
    expect(g1.player().hp == g2.player().hp, "Replaying a run gives the same HP");
    expect(g1.turns() == g2.turns(), "Replaying a run gives the same turn count");
    expect(g1.monsters().size() == g2.monsters().size(), "Replaying a run gives the same enemies");
}

void test_fov_basics() {
    Dungeon d = openRoom(21, 21);
    d.computeFov(10, 10, 5);

    expect(d.at(10, 10).visible, "Own tile always visible");
    expect(d.at(13, 10).visible, "Tile within radius visible in open room");
    expect(!d.at(17, 10).visible, "Tile beyond radius not visible");
    expect(d.at(17, 10).explored == false, "Tiles never seen are not explored");

    bool withinRadius = true;
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            if (d.at(x, y).visible && dist2({x, y}, {10, 10}) > 25) withinRadius = false;
        }
    }
    expect(withinRadius, "Visible set bounded by the circular radius");

    // A wall column blocks the view behind it.
    for (int y = 1; y < 20; ++y) d.at(12, y).type = TileType::Wall;
    d.computeFov(10, 10, 8);
    expect(d.at(12, 10).visible, "Blocking wall itself is visible");
    expect(!d.at(14, 10).visible, "Tile behind a wall is not visible");
    expect(d.at(13, 10).explored, "Previously seen tile stays explored");

    d.resetVisibility();
    expect(d.exploredCount() == 0 && d.visibleCount() == 0, "resetVisibility clears view and memory");
}

void test_line_of_sight() {
    Dungeon d = openRoom(12, 12);
    expect(d.hasLineOfSight(1, 1, 10, 10), "Clear diagonal in open room");

    d.at(5, 5).type = TileType::Wall;
    expect(!d.hasLineOfSight(3, 5, 8, 5), "Wall on the line blocks sight");

    // Two walls meeting at a corner: no peeking through the gap.
    Dungeon c = openRoom(6, 6);
    c.at(2, 1).type = TileType::Wall;
    c.at(1, 2).type = TileType::Wall;
    expect(!c.hasLineOfSight(1, 1, 2, 2), "Diagonal gap between walls blocks sight");
    expect(!diagonalPassable(c, {1, 1}, 1, 1), "Diagonal gap between walls blocks movement");
}

void test_pathfinding_steps() {
    Dungeon d = openRoom(10, 10);
    const auto steps = stepsToTarget(d.width, d.height, {5, 5},
        [&](int x, int y) { return d.isWalkable(x, y); },
        [&](int x, int y, int dx, int dy) { return diagonalPassable(d, {x, y}, dx, dy); });

    expect(steps[static_cast<size_t>(5 * d.width + 5)] == 0, "Target cost is zero");
    expect(steps[static_cast<size_t>(2 * d.width + 2)] == 3, "8-way distance is Chebyshev in an open room");
    expect(steps[0] == -1, "Walls unreachable");

    expect(isAdjacent8({3, 3}, {4, 4}), "Diagonal neighbor is adjacent");
    expect(!isAdjacent8({3, 3}, {3, 3}), "A tile is not adjacent to itself");
}

void test_spawn_bag_rules() {
    for (EntityKind k : depthSpawnBag(1)) {
        expect(k != EntityKind::Troll, "No trolls at depth 1");
    }

    bool trollAt2 = false;
    for (EntityKind k : depthSpawnBag(2)) {
        if (k == EntityKind::Troll) trollAt2 = true;
    }
    expect(trollAt2, "Trolls join the bag from depth 2");

    int goblins1 = 0;
    for (EntityKind k : depthSpawnBag(1)) if (k == EntityKind::Goblin) ++goblins1;
    int goblins9 = 0;
    for (EntityKind k : depthSpawnBag(9)) if (k == EntityKind::Goblin) ++goblins9;
    expect(goblins1 == 7, "Depth 1 has seven goblin entries");
    expect(goblins9 == 2, "Goblin weight bottoms out at two");

    RNG rng(5u);
    for (int i = 0; i < 500; ++i) {
        expect(pickSpawnMonster(rng, 1) != EntityKind::Troll, "pickSpawnMonster honors depth gating");
    }

    expect(monsterName(EntityKind::Troll) == "TROLL", "Display names are upper case");
}

void test_attributes_and_stats() {
    Attributes a{};
    a.fill(10);
    const DerivedStats s = deriveStats(a);
    expect(s.maxHp == 22, "Max HP from KO 10 / KK 10");
    expect(s.atk == 11, "AT from KK 10 / GE 10");
    expect(s.par == 8, "PA from GE 10 / MU 10");

    Attributes m{};
    m.fill(10);
    applyDwarfSlayerModifiers(m);
    expect(attr(m, Attr::KK) == 14, "Dwarf and slayer both add strength");
    expect(attr(m, Attr::KO) == 12, "Dwarf adds constitution");
    expect(attr(m, Attr::GE) == 9 && attr(m, Attr::CH) == 9, "Dwarf loses agility and charisma");
    expect(attr(m, Attr::MU) == 11, "Slayer adds courage");

    RNG rng(77u);
    for (int i = 0; i < 200; ++i) {
        const Attributes r = rollAttributes(rng);
        expect(attr(r, Attr::KL) >= 8 && attr(r, Attr::KL) <= 14, "Unmodified attribute rolls 8..14");
        expect(attr(r, Attr::KK) >= 12 && attr(r, Attr::KK) <= 18, "Strength includes +4");
    }

    expect(xpThreshold(1) == 30 && xpThreshold(2) == 40, "XP thresholds grow by ten per level");
}

void test_combat_rules() {
    expect(playerHitTarget(11) == 9, "Hit target is AT - 2");
    expect(playerHitTarget(2) == 3, "Hit target floors at 3");
    expect(strengthDamageBonus(14) == 2 && strengthDamageBonus(8) == 0, "Strength bonus above 10");
    expect(potionHealAmount(10) == 6 && potionHealAmount(14) == 8, "Potion heal grows with KO");

    const DiceExpr dice = meleeDiceForMonster(EntityKind::Troll);
    expect(diceToString(dice) == "1d3+2", "Troll damage 3..5 as dice");
    expect(diceToString(playerDamageDice(14)) == "1d3+4", "Axe dice include the strength bonus");
    expect(diceToString(playerDamageDice(9)) == "1d3+2", "No strength bonus at KK 10 or below");

    RNG rng(1234u);
    for (int i = 0; i < 500; ++i) {
        const PlayerStrike fresh = rollPlayerStrike(rng, 11, 14, true);
        expect(fresh.hit == (fresh.natural <= 9), "Player hit decided by natural roll");
        if (fresh.hit) {
            expect(fresh.opener >= 1 && fresh.opener <= 2, "Opener applies to fresh enemies");
            expect(fresh.damage >= 3 + 2 + 1 && fresh.damage <= 5 + 2 + 2, "Damage range with KK 14 and opener");
        }

        const PlayerStrike worn = rollPlayerStrike(rng, 11, 10, false);
        if (worn.hit) {
            expect(worn.opener == 0, "No opener after the first hit");
            expect(worn.damage >= 3 && worn.damage <= 5, "Base damage 2 + 1d3");
        }

        const EnemyStrike e = rollEnemyStrike(rng, EntityKind::Orc, 8);
        expect(!(e.hit && e.parried), "A parried blow deals nothing");
        if (e.hit) expect(e.damage >= 2 && e.damage <= 3, "Orc damage within template range");
        else expect(e.damage == 0, "Missed or parried blows deal no damage");
    }

    const EnemyStrike never = rollEnemyStrike(rng, EntityKind::Goblin, 20);
    expect(!never.hit, "PA 20 parries every connecting blow");
}

void test_new_game_state() {
    Game g;
    g.setConfig(GameConfig{});
    g.newGame(2024u);

    const Player& p = g.player();
    expect(g.depth() == 1, "Runs start at depth 1");
    expect(g.turns() == 0, "Runs start at turn 0");
    expect(p.hp == p.hpMax && p.hpMax > 0, "Player starts at full HP");
    expect(p.pos == g.dungeon().start, "Player starts at the level start");
    expect(p.weapon == "AXE" && p.armor == "CLOTH", "Starting equipment");
    expect(g.phase() == GamePhase::AwaitingInput, "Awaiting input after newGame");
    expect(!g.messages().empty() && g.messages().back().text == "YOU SHOULDER YOUR AXE AND ENTER.",
           "Opening message logged");
    expect(static_cast<int>(g.monsters().size()) <= g.config().enemiesPerFloor, "Enemy count capped");
    expect(static_cast<int>(g.groundItems().size()) <= g.config().potionsPerFloor, "Potion count capped");

    for (const auto& m : g.monsters()) {
        expect(!(m.pos == g.dungeon().start) && !(m.pos == g.dungeon().stairsDown),
               "Enemies never spawn on start or stairs");
        expect(m.hp == monsterDef(m.kind).hp, "Enemies spawn at template HP");
    }
    expect(g.dungeon().at(p.pos.x, p.pos.y).visible, "FOV computed on entry");
}

void test_fog_monotonic_within_depth() {
    for (uint32_t seed : {3u, 31u, 313u}) {
        Game g;
        g.newGame(seed);

        std::vector<uint8_t> seen(g.dungeon().tiles.size(), 0);
        int depth = g.depth();
        RNG pick(seed);
        const Action moves[] = {Action::Up, Action::Down, Action::Left, Action::Right, Action::Wait};

        for (int step = 0; step < 400 && !g.isGameOver(); ++step) {
            g.handleAction(moves[pick.range(0, 4)]);
            if (g.depth() != depth) {
                depth = g.depth();
                std::fill(seen.begin(), seen.end(), 0);
            }

            const auto& tiles = g.dungeon().tiles;
            for (size_t i = 0; i < tiles.size(); ++i) {
                if (seen[i]) expect(tiles[i].explored, "Explored tile forgotten within a depth");
                if (tiles[i].explored) seen[i] = 1;
                if (tiles[i].visible) expect(tiles[i].explored, "Visible tiles are explored");
            }
        }
    }
}

void test_level_up_keeps_hp_capped() {
    Game g;
    g.setConfig(quietConfig());
    g.newGame(11u);

    Player& p = g.playerMut();
    const int maxBefore = p.hpMax;
    const int atBefore = p.atk;
    p.hp = p.hpMax;

    g.grantXp(30);
    expect(g.player().level == 2, "Reaching the threshold levels up");
    expect(g.player().xp == 0, "Threshold XP is consumed");
    expect(g.player().hpMax == maxBefore + 4, "Level up adds 4 max HP");
    expect(g.player().atk == atBefore + 1, "Level up adds 1 AT");
    expect(g.player().hp <= g.player().hpMax, "HP never exceeds max after level up");

    g.grantXp(5000);
    expect(g.player().level > 2, "Large XP grants chain level ups");
    expect(g.player().hp <= g.player().hpMax, "HP never exceeds max after chained level ups");
    expect(g.player().xp < g.player().xpNext, "Leftover XP stays below the next threshold");

    p.hp = 1;
    const int before = g.player().hp;
    g.grantXp(g.player().xpNext);
    expect(g.player().hp == before + 4, "Level up heals 4 when below max");
}

void test_descend_increments_depth_and_resets_fog() {
    Game g;
    g.setConfig(quietConfig());
    g.newGame(99u);

    // Walk around a bit so there is fog-of-war memory to lose.
    for (int i = 0; i < 10; ++i) g.handleAction(i % 2 ? Action::Right : Action::Down);
    const int exploredBefore = g.dungeon().exploredCount();
    expect(exploredBefore > 0, "Some tiles explored before descending");

    // Off the stairs nothing happens.
    g.playerMut().pos = g.dungeon().start;
    const uint32_t turnsOff = g.turns();
    expect(!g.handleAction(Action::Descend), "Descend off the stairs is refused");
    expect(g.depth() == 1 && g.turns() == turnsOff, "Refused descend costs no turn");

    for (int expectedDepth = 2; expectedDepth <= 5; ++expectedDepth) {
        g.playerMut().pos = g.dungeon().stairsDown;
        const uint32_t turns = g.turns();
        expect(g.handleAction(Action::Descend), "Descend on the stairs consumes a turn");
        expect(g.depth() == expectedDepth, "Descend increments depth by exactly one");
        expect(g.turns() == turns + 1, "Descend takes one turn");
        expect(g.player().pos == g.dungeon().start, "Player placed at the new start");
        expect(g.dungeon().exploredCount() == g.dungeon().visibleCount(),
               "Fog of war reset: only the current view is explored");
    }
}

void test_auto_descend_on_contact() {
    GameConfig cfg = quietConfig();
    cfg.autoDescend = true;
    Game g;
    g.setConfig(cfg);
    g.newGame(123u);

    const Dungeon& d = g.dungeon();
    const Vec2i s = d.stairsDown;
    const Action dirs[] = {Action::Down, Action::Up, Action::Right, Action::Left};
    const int off[4][2] = {{0, -1}, {0, 1}, {-1, 0}, {1, 0}};
    for (int i = 0; i < 4; ++i) {
        const int nx = s.x + off[i][0];
        const int ny = s.y + off[i][1];
        if (!d.isWalkable(nx, ny)) continue;
        g.playerMut().pos = {nx, ny};
        g.handleAction(dirs[i]);
        break;
    }
    expect(g.depth() == 2, "auto_descend descends on stepping onto the stairs");
}

void test_turn_costs() {
    Game g;
    g.setConfig(quietConfig());
    g.newGame(7u);

    const uint32_t t0 = g.turns();
    expect(!g.handleAction(Action::Potion), "Quaff with no potions is refused");
    expect(g.turns() == t0, "Refused quaff costs no turn");

    expect(!g.handleAction(Action::Inventory), "Inventory overlay costs no turn");
    expect(g.isInventoryOpen(), "Inventory overlay opens");
    expect(!g.handleAction(Action::Help), "Help overlay costs no turn");
    expect(g.isHelpOpen() && !g.isInventoryOpen(), "Overlays are exclusive");
    expect(!g.handleAction(Action::Help), "Help toggles closed");
    expect(!g.isHelpOpen(), "Help closed");
    expect(g.turns() == t0, "Overlays never advance the clock");

    g.playerMut().hp = 3;
    expect(g.handleAction(Action::Rest), "Rest consumes a turn");
    expect(g.player().hp == 4, "Rest heals one HP");
    expect(g.turns() == t0 + 1, "Rest advances the clock");

    g.playerMut().hp = g.player().hpMax;
    g.handleAction(Action::Rest);
    expect(g.player().hp == g.player().hpMax, "Rest never exceeds max HP");

    expect(g.handleAction(Action::Wait), "Wait consumes a turn");

    // Bumping a wall: find a floor tile next to a wall.
    const Dungeon& d = g.dungeon();
    bool tested = false;
    for (int y = 1; y < d.height - 1 && !tested; ++y) {
        for (int x = 1; x < d.width - 1 && !tested; ++x) {
            if (!d.isWalkable(x, y) || d.isWalkable(x, y - 1)) continue;
            g.playerMut().pos = {x, y};
            const uint32_t t = g.turns();
            expect(!g.handleAction(Action::Up), "Bumping a wall is refused");
            expect(g.turns() == t && g.player().pos == Vec2i{x, y}, "Bumping a wall costs no turn");
            tested = true;
        }
    }
    expect(tested, "Found a wall to bump");

    g.handleAction(Action::Quit);
    expect(g.quitRequested(), "Quit requests exit");
}

void test_potion_pickup_and_quaff() {
    GameConfig cfg = quietConfig();
    cfg.potionsPerFloor = 1;
    Game g;
    g.setConfig(cfg);
    g.newGame(4242u);

    expect(g.groundItems().size() == 1, "One potion placed");
    if (g.groundItems().empty()) return;

    const Vec2i item = g.groundItems().front().pos;
    const Dungeon& d = g.dungeon();
    const Action dirs[] = {Action::Down, Action::Up, Action::Right, Action::Left};
    const int off[4][2] = {{0, -1}, {0, 1}, {-1, 0}, {1, 0}};
    bool moved = false;
    for (int i = 0; i < 4 && !moved; ++i) {
        const int nx = item.x + off[i][0];
        const int ny = item.y + off[i][1];
        if (!d.isWalkable(nx, ny)) continue;
        g.playerMut().pos = {nx, ny};
        moved = g.handleAction(dirs[i]);
    }
    expect(moved, "Stepped onto the potion");
    expect(g.player().potions == 1, "Potion picked up on entry");
    expect(g.groundItems().empty(), "Potion removed from the floor");

    g.playerMut().hp = 2;
    const int heal = potionHealAmount(attr(g.player().attrs, Attr::KO));
    expect(g.handleAction(Action::Potion), "Quaff with a potion consumes a turn");
    expect(g.player().potions == 0, "Quaff uses the potion");
    expect(g.player().hp == std::min(g.player().hpMax, 2 + heal), "Quaff heals by the KO formula");
}

void test_enemies_respect_occupancy() {
    GameConfig cfg;
    cfg.enemiesPerFloor = 30;
    cfg.activationRange = 0;
    Game g;
    g.setConfig(cfg);
    g.newGame(8080u);

    for (int i = 0; i < 200 && !g.isGameOver(); ++i) {
        g.handleAction(Action::Wait);

        std::set<std::pair<int, int>> taken;
        for (const auto& m : g.monsters()) {
            expect(m.hp > 0, "Dead enemies are removed");
            expect(g.dungeon().isWalkable(m.pos.x, m.pos.y), "Enemies stay on walkable tiles");
            expect(!(m.pos == g.player().pos), "Enemies never share the player's tile");
            expect(taken.insert({m.pos.x, m.pos.y}).second, "Enemies never share a tile");
            expect(m.hp <= m.hpMax, "Enemy HP never exceeds max (troll regen)");
        }
    }
}

void test_idle_enemies_beyond_activation_range() {
    GameConfig cfg;
    cfg.enemiesPerFloor = 20;
    cfg.activationRange = 1;
    Game g;
    g.setConfig(cfg);
    g.newGame(6060u);

    // Only enemies more than one tile away are guaranteed idle.
    const Vec2i p = g.player().pos;
    std::vector<std::pair<int, Vec2i>> before;
    for (const auto& m : g.monsters()) {
        if (dist2(m.pos, p) > 1) before.push_back({m.id, m.pos});
    }
    expect(!before.empty(), "Some enemies start out of range");

    g.handleAction(Action::Wait);
    for (const auto& b : before) {
        bool still = false;
        for (const auto& m : g.monsters()) {
            if (m.id == b.first) still = m.pos == b.second;
        }
        expect(still, "Enemies outside the activation range do not move");
    }
}

void test_game_over_on_death() {
    GameConfig cfg;
    cfg.enemiesPerFloor = 40;
    cfg.activationRange = 0;
    cfg.potionsPerFloor = 0;
    Game g;
    g.setConfig(cfg);
    g.newGame(1u);
    g.playerMut().par = 0;

    for (int i = 0; i < 5000 && !g.isGameOver(); ++i) {
        g.playerMut().hp = std::min(g.player().hp, 3);
        g.handleAction(Action::Wait);
    }
    expect(g.isGameOver(), "Player eventually falls when swarmed");
    expect(g.phase() == GamePhase::GameOver, "Phase is GameOver");
    expect(g.player().hp <= 0, "Game over only at zero HP or below");
    expect(!g.endCause().empty(), "End cause recorded");

    const uint32_t t = g.turns();
    expect(!g.handleAction(Action::Wait), "No turns after game over");
    expect(g.turns() == t, "Clock stops after game over");
    expect(g.quitRequested(), "Any key after game over exits");
}

void test_message_log() {
    Game g;
    g.setConfig(quietConfig());
    g.newGame(10u);

    g.handleAction(Action::Rest);
    g.handleAction(Action::Rest);
    g.handleAction(Action::Rest);
    expect(g.messages().back().text == "YOU CATCH YOUR BREATH.", "Rest message logged");
    expect(g.messages().back().repeat == 3, "Identical messages coalesce");

    for (int i = 0; i < 300; ++i) {
        g.handleAction(Action::Rest);
        g.handleAction(Action::Potion);
    }
    expect(g.messages().size() <= Game::LOG_MAX, "Message log is capped");
}

void test_view_cells() {
    Game g;
    g.setConfig(quietConfig());
    g.newGame(321u);

    const Vec2i p = g.player().pos;
    const CellView self = viewCell(g, p.x, p.y);
    expect(self.glyph == 'S' && self.light == CellLight::Visible, "Player drawn as S");

    const Dungeon& d = g.dungeon();
    bool hiddenOk = true;
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            if (d.at(x, y).explored) continue;
            if (viewCell(g, x, y).light != CellLight::Hidden) hiddenOk = false;
        }
    }
    expect(hiddenOk, "Unexplored cells are hidden");

    const auto inv = inventoryLines(g);
    const std::string weapon =
        "WEAPON: AXE (" + diceToString(playerDamageDice(attr(g.player().attrs, Attr::KK))) + ")";
    expect(inv.size() > 2 && inv[2] == weapon, "Inventory shows the axe damage dice");

    const auto lines = sidePanelLines(g, 12);
    expect(!lines.empty() && lines.front().text.find("DEPTH 1") != std::string::npos, "Panel shows depth");
    expect(lines.size() <= 12, "Panel respects the line budget");
}

void test_settings_parse_and_clamp() {
    const fs::path dir = fs::temp_directory_path();
    const fs::path path = dir / "dwarfslayer_test_settings.ini";

    {
        std::ofstream f(path);
        f << "# comment\n"
          << "player_name = Gimli\n"
          << "fov_radius = 99\n"
          << "activation_range = -5 ; clamped\n"
          << "auto_descend = yes\n"
          << "enemies_per_floor = lots\n"
          << "potions_per_floor = 3\n"
          << "tile_size = 4\n"
          << "unknown_key = 1\n"
          << "no equals sign here\n";
    }

    const Settings s = loadSettings(path.string());
    expect(s.playerName == "GIMLI", "player_name parsed and upper-cased");
    expect(s.fovRadius == 20, "fov_radius clamped to 20");
    expect(s.activationRange == 0, "activation_range clamped to 0");
    expect(s.autoDescend, "auto_descend parsed");
    expect(s.enemiesPerFloor == 12, "Bad integer keeps default");
    expect(s.potionsPerFloor == 3, "potions_per_floor parsed");
    expect(s.tileSize == 8, "tile_size clamped to 8");

    const GameConfig c = toGameConfig(s);
    expect(c.fovRadius == 20 && c.autoDescend && c.potionsPerFloor == 3, "Settings flow into GameConfig");

    const Settings missing = loadSettings((dir / "dwarfslayer_no_such_file.ini").string());
    expect(missing.fovRadius == 8 && missing.enemiesPerFloor == 12, "Missing file yields defaults");

    expect(writeDefaultSettings(path.string()), "Default settings written");
    const Settings d = loadSettings(path.string());
    expect(d.fovRadius == 8 && d.activationRange == 12 && !d.autoDescend, "Default file round-trips defaults");

    std::error_code ec;
    fs::remove(path, ec);
}

void test_keybinds() {
    const KeyBinds def = KeyBinds::defaults();
    expect(def.mapKey('w') == Action::Up, "w moves up");
    expect(def.mapKey(KEY_CODE_LEFT) == Action::Left, "Left arrow moves left");
    expect(def.mapKey('R') == Action::Rest, "Upper-case R rests");
    expect(def.mapKey('P') == Action::Potion, "Upper-case P quaffs");
    expect(def.mapKey('Q') == Action::Quit, "Upper-case Q quits");
    expect(def.mapKey('.') == Action::Wait, "Period waits");
    expect(def.mapKey('>') == Action::Descend, "> descends");
    expect(def.mapKey('i') == Action::Inventory, "I opens inventory");
    expect(def.mapKey('?') == Action::Help, "? opens help");
    expect(def.mapKey('z') == Action::None, "Unbound key maps to nothing");

    const auto list = KeyBinds::parseKeyList("k, up, greater");
    expect(list.size() == 3, "Key list parsed");
    if (list.size() == 3) {
        expect(list[0] == 'k' && list[1] == KEY_CODE_UP && list[2] == '>', "Key names resolved");
    }
    expect(KeyBinds::parseKeyList("none").empty(), "none unbinds");
    expect(KeyBinds::parseActionName("bind_potion") == Action::Potion, "Action names parsed");
    expect(!KeyBinds::parseActionName("potion").has_value(), "Keys without bind_ prefix ignored");

    const fs::path path = fs::temp_directory_path() / "dwarfslayer_test_binds.ini";
    {
        std::ofstream f(path);
        f << "bind_potion = q\n"
          << "bind_quit = escape\n"
          << "bind_wait = space\n";
    }
    KeyBinds kb = KeyBinds::defaults();
    kb.loadOverridesFromIni(path.string());
    expect(kb.mapKey('q') == Action::Potion, "Rebound q quaffs");
    expect(kb.mapKey(KEY_CODE_ESCAPE) == Action::Quit, "Escape still quits");
    expect(kb.mapKey(' ') == Action::Wait, "Space waits after rebinding");
    expect(kb.mapKey('.') == Action::None, "Rebinding replaces the old keys");
    expect(kb.describeAction(Action::Wait) == "SPACE", "Bindings describe themselves");

    std::error_code ec;
    fs::remove(path, ec);
}

void test_kill_removes_enemy_and_grants_xp() {
    Game g = arenaGame(2718u);
    const auto step = walkableNeighbor(g);
    expect(step.has_value(), "Start has an open neighbor");
    if (!step) return;

    const Vec2i p = g.player().pos;
    g.monstersMut().push_back(makeEnemy(EntityKind::Goblin, {p.x + step->dx, p.y + step->dy}));

    for (int i = 0; i < 200 && g.kills() == 0; ++i) {
        expect(g.handleAction(step->action), "Attacking an adjacent enemy consumes a turn");
        expect(g.player().pos == p, "Attacking does not move the player");
    }

    expect(g.kills() == 1, "The goblin dies eventually");
    expect(g.monsters().empty(), "A slain enemy is removed the same turn");
    expect(g.player().xp == monsterDef(EntityKind::Goblin).xp, "A kill grants the template XP");
    expect(loggedContaining(g, "GOBLIN DIES!"), "The kill is logged");
}

void test_kill_xp_can_level_up() {
    Game g = arenaGame(1618u);
    const auto step = walkableNeighbor(g);
    if (!step) return;

    const Vec2i p = g.player().pos;
    g.playerMut().xp = g.player().xpNext - 1;
    g.monstersMut().push_back(makeEnemy(EntityKind::Goblin, {p.x + step->dx, p.y + step->dy}));
    g.monstersMut().back().hp = 1;

    for (int i = 0; i < 200 && g.kills() == 0; ++i) g.handleAction(step->action);
    expect(g.player().level == 2, "Kill XP crossing the threshold levels up");
    expect(g.player().hp <= g.player().hpMax, "HP stays capped after a kill level-up");
}

void test_archer_shoots_from_range() {
    Game g = arenaGame(3141u);
    const Dungeon& d = g.dungeon();
    const Vec2i p = g.player().pos;
    const int range = monsterDef(EntityKind::Archer).range;

    std::optional<Vec2i> spot;
    for (int y = 0; y < d.height && !spot; ++y) {
        for (int x = 0; x < d.width && !spot; ++x) {
            const int r2 = dist2({x, y}, p);
            if (!d.isWalkable(x, y) || r2 < 4 || r2 > range * range) continue;
            if (d.hasLineOfSight(x, y, p.x, p.y)) spot = Vec2i{x, y};
        }
    }
    expect(spot.has_value(), "Found a firing spot with line of sight");
    if (!spot) return;

    g.monstersMut().push_back(makeEnemy(EntityKind::Archer, *spot));
    const int hp = g.player().hp;
    for (int i = 0; i < 5; ++i) {
        g.handleAction(Action::Wait);
        expect(g.monsters().size() == 1 && g.monsters()[0].pos == *spot, "An archer in range holds its ground");
    }
    expect(loggedContaining(g, "ARCHER"), "The archer shoots at the player");
    expect(g.player().hp == hp, "Parried or missed arrows deal no damage");
}

void test_archer_backs_off_when_adjacent() {
    Game g = arenaGame(2236u);
    const auto step = walkableNeighbor(g);
    if (!step) return;

    const Vec2i p = g.player().pos;
    const Vec2i from{p.x + step->dx, p.y + step->dy};
    g.monstersMut().push_back(makeEnemy(EntityKind::Archer, from));

    g.handleAction(Action::Wait);
    const auto cost = costToPlayer(g);
    expect(g.monsters().size() == 1, "Archer still present");
    if (g.monsters().empty()) return;
    expect(!(g.monsters()[0].pos == from), "An adjacent archer steps away");
    expect(costAt(g, cost, g.monsters()[0].pos) > 1, "The archer retreats to a farther tile");
    expect(!loggedContaining(g, "ARCHER"), "An adjacent archer does not shoot");
}

void test_wolf_takes_two_steps() {
    Game g = arenaGame(1414u);
    const auto cost = costToPlayer(g);

    const auto spot = tileAtCost(g, cost, 5, 4);
    expect(spot.has_value(), "Found a tile five steps from the player");
    if (!spot) return;

    g.monstersMut().push_back(makeEnemy(EntityKind::Wolf, *spot));
    g.handleAction(Action::Wait);
    expect(costAt(g, cost, g.monsters()[0].pos) == 3, "A distant wolf closes two steps in one turn");

    // Goblins only manage one.
    Game h = arenaGame(1414u);
    h.monstersMut().push_back(makeEnemy(EntityKind::Goblin, *spot));
    h.handleAction(Action::Wait);
    expect(costAt(h, cost, h.monsters()[0].pos) == 4, "A goblin closes one step per turn");
}

void test_troll_regenerates() {
    Game g = arenaGame(1732u);
    const auto cost = costToPlayer(g);
    const auto spot = tileAtCost(g, cost, 8, 4);
    expect(spot.has_value(), "Found a tile eight steps from the player");
    if (!spot) return;

    g.monstersMut().push_back(makeEnemy(EntityKind::Troll, *spot));
    const int maxHp = g.monsters()[0].hpMax;
    g.monstersMut()[0].hp = maxHp - 3;

    for (int turn = 1; turn <= 6; ++turn) {
        g.handleAction(Action::Wait);
        expect(g.monsters()[0].hp == std::min(maxHp, maxHp - 3 + turn), "Trolls regenerate one HP per turn");
        expect(g.monsters()[0].hp <= maxHp, "Troll regeneration stops at max HP");
    }
}

void test_seed_argument() {
    auto seedOf = [](std::vector<std::string> args) {
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());
        return parseSeedArg(static_cast<int>(argv.size()), argv.data());
    };

    expect(seedOf({"dwarfslayer", "--seed", "42"}) == std::optional<uint32_t>(42u), "Decimal seed");
    expect(seedOf({"dwarfslayer", "--seed", "0x10"}) == std::optional<uint32_t>(16u), "Hex seed");
    expect(seedOf({"dwarfslayer", "--seed", "4294967295"}) == std::optional<uint32_t>(0xFFFFFFFFu),
           "Largest 32-bit seed accepted");
    expect(!seedOf({"dwarfslayer", "--seed", "4294967296"}), "Seed above 32 bits rejected");
    expect(!seedOf({"dwarfslayer", "--seed", "-1"}), "Negative seed rejected");
    expect(!seedOf({"dwarfslayer", "--seed", " 7"}), "Leading blanks rejected");
    expect(!seedOf({"dwarfslayer", "--seed", "12abc"}), "Trailing junk rejected");
    expect(!seedOf({"dwarfslayer"}), "No seed flag gives no seed");

    std::vector<std::string> args = {"dwarfslayer", "--seed", "-5"};
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    const LaunchOptions o = parseLaunchOptions(static_cast<int>(argv.size()), argv.data());
    expect(o.badSeed && !o.seed, "A rejected seed is reported as bad");
}

} // namespace

int main() {
    std::cout << "Running Dwarf Slayer tests...\n";

    test_rng_reproducible();
    test_dungeon_always_connected();
    test_dungeon_small_map_fallback();
    test_generation_deterministic();
    test_fov_basics();
    test_line_of_sight();
    test_pathfinding_steps();

    test_spawn_bag_rules();
    test_attributes_and_stats();
    test_combat_rules();

    test_new_game_state();
    test_fog_monotonic_within_depth();
    test_level_up_keeps_hp_capped();
    test_descend_increments_depth_and_resets_fog();
    test_auto_descend_on_contact();
    test_turn_costs();
    test_potion_pickup_and_quaff();
    test_enemies_respect_occupancy();
    test_idle_enemies_beyond_activation_range();
    test_game_over_on_death();
    test_kill_removes_enemy_and_grants_xp();
    test_kill_xp_can_level_up();
    test_archer_shoots_from_range();
    test_archer_backs_off_when_adjacent();
    test_wolf_takes_two_steps();
    test_troll_regenerates();
    test_message_log();
    test_view_cells();

    test_settings_parse_and_clamp();
    test_keybinds();
    test_seed_argument();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
