#include "combat_rules.hpp"

#include <algorithm>
#include <sstream>

int rollDice(RNG& rng, DiceExpr d) {
    d.count = std::max(0, d.count);
    d.sides = std::max(0, d.sides);

    int sum = d.bonus;
    if (d.count <= 0 || d.sides <= 0) return sum;
    for (int i = 0; i < d.count; ++i) {
        sum += rng.range(1, d.sides);
    }
    return sum;
}

std::string diceToString(DiceExpr d, bool includeBonus) {
    std::ostringstream ss;
    ss << std::max(0, d.count) << "d" << std::max(0, d.sides);
    if (includeBonus && d.bonus != 0) {
        if (d.bonus > 0) ss << "+";
        ss << d.bonus;
    }
    return ss.str();
}

DiceExpr meleeDiceForMonster(EntityKind kind) {
    const MonsterDef& def = monsterDef(kind);
    const int lo = std::max(0, def.dmgMin);
    const int hi = std::max(lo, def.dmgMax);
    return {1, hi - lo + 1, lo - 1};
}

int playerHitTarget(int atk) {
    return std::max(3, atk - 2);
}

int strengthDamageBonus(int kk) {
    return std::max(0, (kk - 10) / 2);
}

DiceExpr playerDamageDice(int kk) {
    return {1, 3, 2 + strengthDamageBonus(kk)};
}

PlayerStrike rollPlayerStrike(RNG& rng, int atk, int kk, bool targetFresh) {
    PlayerStrike s;
    s.natural = rng.range(1, 20);
    s.hit = s.natural <= playerHitTarget(atk);
    if (!s.hit) return s;

    s.opener = targetFresh ? rng.range(1, 2) : 0;
    s.damage = std::max(1, rollDice(rng, playerDamageDice(kk)) + s.opener);
    return s;
}

EnemyStrike rollEnemyStrike(RNG& rng, EntityKind kind, int playerPar) {
    EnemyStrike s;
    const bool connects = rng.range(1, 20) <= monsterDef(kind).atk;
    if (!connects) return s;

    if (rng.range(1, 20) <= playerPar) {
        s.parried = true;
        return s;
    }

    s.hit = true;
    s.damage = std::max(0, rollDice(rng, meleeDiceForMonster(kind)));
    return s;
}

int potionHealAmount(int ko) {
    return std::max(4, 6 + std::max(0, (ko - 10) / 2));
}
