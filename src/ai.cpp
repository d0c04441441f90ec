#include "game.hpp"

#include "pathfinding.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {

constexpr int DIRS8[8][2] = {
    {0,-1},{0,1},{-1,0},{1,0},
    {-1,-1},{1,-1},{-1,1},{1,1}
};

float distance(const Vec2i& a, const Vec2i& b) {
    return std::sqrt(static_cast<float>(dist2(a, b)));
}

} // namespace

void Game::monsterTurn() {
    const Dungeon& d = dung;
    const Vec2i target = player_.pos;

    // One distance field per enemy phase; every enemy chases the same target.
    const std::vector<int> costMap = stepsToTarget(
        d.width, d.height, target,
        [&](int x, int y) { return d.isWalkable(x, y); },
        [&](int x, int y, int dx, int dy) { return diagonalPassable(d, {x, y}, dx, dy); });

    auto costAt = [&](const Vec2i& p) {
        return costMap[static_cast<size_t>(p.y * d.width + p.x)];
    };

    auto canEnter = [&](const Entity& m, int dx, int dy) {
        const int nx = m.pos.x + dx;
        const int ny = m.pos.y + dy;
        if (!d.isWalkable(nx, ny)) return false;
        if (dx != 0 && dy != 0 && !diagonalPassable(d, m.pos, dx, dy)) return false;
        return !isOccupied(nx, ny);
    };

    // Greedy descent along the distance field; stays put if no neighbor is closer.
    auto stepToward = [&](Entity& m) {
        const int here = costAt(m.pos);
        Vec2i best = m.pos;
        int bestCost = (here < 0) ? std::numeric_limits<int>::max() : here;
        for (const auto& dv : DIRS8) {
            if (!canEnter(m, dv[0], dv[1])) continue;
            const Vec2i n{m.pos.x + dv[0], m.pos.y + dv[1]};
            const int c = costAt(n);
            if (c < 0 || c >= bestCost) continue;
            bestCost = c;
            best = n;
        }
        if (best == m.pos) return false;
        m.pos = best;
        return true;
    };

    auto stepAway = [&](Entity& m) {
        const int here = costAt(m.pos);
        Vec2i best = m.pos;
        int bestCost = here;
        for (const auto& dv : DIRS8) {
            if (!canEnter(m, dv[0], dv[1])) continue;
            const Vec2i n{m.pos.x + dv[0], m.pos.y + dv[1]};
            const int c = costAt(n);
            if (c > bestCost) {
                bestCost = c;
                best = n;
            }
        }
        if (best == m.pos) return false;
        m.pos = best;
        return true;
    };

    const int actRange = cfg_.activationRange;

    for (auto& m : ents) {
        if (phase_ == GamePhase::GameOver) break;
        if (m.hp <= 0) continue;

        if (!m.active) {
            if (actRange > 0 && dist2(m.pos, player_.pos) > actRange * actRange) continue;
            m.active = true;
        }

        const MonsterDef& def = monsterDef(m.kind);

        if (def.regen > 0 && m.hp < m.hpMax) {
            m.hp = std::min(m.hpMax, m.hp + def.regen);
        }

        float dist = distance(m.pos, player_.pos);

        if (def.ai == AiStyle::Ranged) {
            if (dist > 1.0f && dist <= static_cast<float>(def.range) &&
                d.hasLineOfSight(m.pos.x, m.pos.y, player_.pos.x, player_.pos.y)) {
                enemyAttack(m);
            } else if (dist < static_cast<float>(def.prefer)) {
                stepAway(m);
            } else {
                stepToward(m);
            }
            continue;
        }

        const int steps = (dist > 2.0f) ? std::max(1, def.speed) : 1;
        for (int i = 0; i < steps; ++i) {
            if (dist <= 1.5f) {
                enemyAttack(m);
                break;
            }
            if (!stepToward(m)) break;
            dist = distance(m.pos, player_.pos);
        }
    }
}

void Game::cleanupDead() {
    ents.erase(std::remove_if(ents.begin(), ents.end(), [](const Entity& e) { return e.hp <= 0; }),
               ents.end());
}
