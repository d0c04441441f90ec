#include "game.hpp"

#include "combat_rules.hpp"

#include <algorithm>
#include <sstream>

Game::Game() : dung(MAP_W, MAP_H) {}

uint32_t Game::levelSeed(uint32_t runSeed, int depth) {
    return hashCombine(runSeed, tag32("LEVEL"), static_cast<uint32_t>(depth));
}

void Game::pushMsg(const std::string& s, MessageKind kind) {
    // Coalesce consecutive identical messages to reduce spam in combat.
    if (!msgs.empty()) {
        Message& last = msgs.back();
        if (last.text == s && last.kind == kind) {
            if (last.repeat < 9999) {
                ++last.repeat;
            }
            return;
        }
    }

    msgs.push_back({s, kind});
    if (msgs.size() > LOG_MAX) {
        msgs.erase(msgs.begin(), msgs.begin() + static_cast<std::ptrdiff_t>(msgs.size() - LOG_MAX));
    }
}

const Entity* Game::monsterAt(int x, int y) const {
    for (const auto& e : ents) {
        if (e.hp > 0 && e.pos.x == x && e.pos.y == y) return &e;
    }
    return nullptr;
}

Entity* Game::monsterAtMut(int x, int y) {
    for (auto& e : ents) {
        if (e.hp > 0 && e.pos.x == x && e.pos.y == y) return &e;
    }
    return nullptr;
}

bool Game::potionAt(int x, int y) const {
    for (const auto& g : ground) {
        if (g.pos.x == x && g.pos.y == y) return true;
    }
    return false;
}

bool Game::isOccupied(int x, int y) const {
    if (player_.pos.x == x && player_.pos.y == y) return true;
    return monsterAt(x, y) != nullptr;
}

void Game::newGame(uint32_t seed) {
    seed_ = seed;
    rng = RNG(hashCombine(seed, tag32("RUN")));

    depth_ = 1;
    turnCount = 0;
    killCount = 0;
    endCause_.clear();
    phase_ = GamePhase::AwaitingInput;
    quitReq = false;
    invOpen = false;
    helpOpen = false;
    msgs.clear();

    player_ = Player{};
    player_.attrs = rollAttributes(rng);
    const DerivedStats ds = deriveStats(player_.attrs);
    player_.hpMax = ds.maxHp;
    player_.hp = ds.maxHp;
    player_.atk = ds.atk;
    player_.par = ds.par;
    player_.level = 1;
    player_.xp = 0;
    player_.xpNext = xpThreshold(1);

    buildLevel();

    pushMsg("YOU SHOULDER YOUR AXE AND ENTER.", MessageKind::System);
}

void Game::buildLevel() {
    dung = Dungeon(MAP_W, MAP_H);
    RNG layoutRng(levelSeed(seed_, depth_));
    dung.generate(layoutRng);
    dung.resetVisibility();

    player_.pos = dung.start;

    ents.clear();
    ground.clear();
    spawnMonstersAndItems();

    recomputeFov();
}

void Game::spawnMonstersAndItems() {
    auto reserved = [&](const Vec2i& p) {
        return p == dung.start || p == dung.stairsDown;
    };

    int placed = 0;
    for (int tries = 0; tries < 200 && placed < cfg_.potionsPerFloor; ++tries) {
        const Vec2i p = dung.randomFloor(rng);
        if (reserved(p) || potionAt(p.x, p.y)) continue;
        ground.push_back({p});
        ++placed;
    }

    placed = 0;
    for (int tries = 0; tries < 300 && placed < cfg_.enemiesPerFloor; ++tries) {
        const Vec2i p = dung.randomFloor(rng);
        if (reserved(p) || monsterAt(p.x, p.y)) continue;

        Entity e;
        e.id = nextEntityId++;
        e.kind = pickSpawnMonster(rng, depth_);
        e.pos = p;
        e.hpMax = monsterDef(e.kind).hp;
        e.hp = e.hpMax;
        ents.push_back(e);
        ++placed;
    }
}

void Game::recomputeFov() {
    dung.computeFov(player_.pos.x, player_.pos.y, cfg_.fovRadius);
}

bool Game::descendStairs() {
    depth_ += 1;
    buildLevel();

    std::ostringstream ss;
    ss << "YOU DESCEND TO DEPTH " << depth_ << ".";
    pushMsg(ss.str(), MessageKind::System);
    return true;
}

void Game::grantXp(int amount) {
    if (amount <= 0) return;
    player_.xp += amount;

    std::ostringstream ss;
    ss << "YOU GAIN " << amount << " XP.";
    pushMsg(ss.str(), MessageKind::Success);

    while (player_.xp >= player_.xpNext) {
        player_.xp -= player_.xpNext;
        player_.level += 1;
        player_.xpNext = xpThreshold(player_.level);
        onPlayerLevelUp();
    }
}

void Game::onPlayerLevelUp() {
    Player& p = player_;

    p.hpMax += 4;
    p.atk += 1;
    const bool parUp = (p.level % 2 == 0);
    if (parUp) p.par += 1;

    p.hp = std::min(p.hpMax, p.hp + 4);

    std::ostringstream ss;
    ss << "*** LEVEL UP! LEVEL " << p.level << ". MAXHP+4, AT+1";
    if (parUp) ss << ", PA+1";
    ss << ".";
    pushMsg(ss.str(), MessageKind::Success);
}

bool Game::quaffPotion() {
    if (player_.potions <= 0) {
        pushMsg("YOU HAVE NO HEALING DRAUGHTS.", MessageKind::Warning);
        return false;
    }

    player_.potions -= 1;
    const int heal = potionHealAmount(attr(player_.attrs, Attr::KO));
    player_.hp = std::min(player_.hpMax, player_.hp + heal);
    pushMsg("YOU QUAFF A BITTER DWARF BREW. (+HP)", MessageKind::Loot);
    return true;
}

void Game::rest() {
    player_.hp = std::min(player_.hpMax, player_.hp + 1);
    pushMsg("YOU CATCH YOUR BREATH.", MessageKind::Info);
}

void Game::pickupAtPlayer() {
    auto it = std::find_if(ground.begin(), ground.end(), [&](const GroundItem& g) {
        return g.pos == player_.pos;
    });
    if (it == ground.end()) return;

    ground.erase(it);
    player_.potions += 1;
    pushMsg("YOU PICK UP A HEALING DRAUGHT.", MessageKind::Loot);
}
