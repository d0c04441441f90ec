#include "game.hpp"

#include "combat_rules.hpp"
#include "pathfinding.hpp"

#include <algorithm>
#include <sstream>

void Game::playerAttack(Entity& target) {
    const std::string name = monsterName(target.kind);

    const PlayerStrike s = rollPlayerStrike(rng, player_.atk, attr(player_.attrs, Attr::KK), target.fresh);
    if (!s.hit) {
        pushMsg("YOU MISS THE " + name + ".", MessageKind::Combat);
        return;
    }

    target.fresh = false;
    target.active = true;
    target.hp -= s.damage;

    std::ostringstream ss;
    ss << "YOU HIT THE " << name << " FOR " << s.damage << ".";
    pushMsg(ss.str(), MessageKind::Combat);

    if (target.hp <= 0) {
        pushMsg(name + " DIES!", MessageKind::Combat);
        killCount += 1;
        grantXp(monsterDef(target.kind).xp);
    }
}

void Game::enemyAttack(const Entity& m) {
    const std::string name = monsterName(m.kind);
    const bool ranged = monsterDef(m.kind).ai == AiStyle::Ranged && !isAdjacent8(m.pos, player_.pos);

    const EnemyStrike s = rollEnemyStrike(rng, m.kind, player_.par);
    if (s.parried) {
        pushMsg("YOU FEND OFF THE " + name + ".", MessageKind::Combat);
        return;
    }
    if (!s.hit) {
        pushMsg(ranged ? ("THE " + name + "'S ARROW MISSES.") : ("THE " + name + " MISSES."),
                MessageKind::Combat);
        return;
    }

    player_.hp -= s.damage;

    std::ostringstream ss;
    ss << name << (ranged ? " SHOOTS YOU (" : " HITS YOU (") << s.damage << ").";
    pushMsg(ss.str(), MessageKind::Combat);

    if (player_.hp <= 0) {
        endCause_ = "SLAIN BY A " + name + " ON DEPTH " + std::to_string(depth_);
        pushMsg("YOU FALL...", MessageKind::Warning);
        phase_ = GamePhase::GameOver;
    }
}
