#pragma once

#include "content.hpp"
#include "rng.hpp"

#include <string>

// A tiny dice expression: `count` d `sides` + `bonus`.
// Examples:
//   {1,6,0}  => 1d6
//   {2,4,2}  => 2d4+2
struct DiceExpr {
    int count = 1;
    int sides = 4;
    int bonus = 0;
};

// Rolls the dice expression using the game's deterministic RNG.
int rollDice(RNG& rng, DiceExpr d);

// Pretty-prints a dice expression (e.g., "1d6+2").
std::string diceToString(DiceExpr d, bool includeBonus = true);

// Uniform damage in [dmgMin, dmgMax] expressed as dice (1d(max-min+1) + (min-1)).
DiceExpr meleeDiceForMonster(EntityKind kind);

// The player hits when 1d20 rolls at or under this value.
int playerHitTarget(int atk);

// KK above 10 adds one point of damage per two points.
int strengthDamageBonus(int kk);

// The axe: 1d3 + 2 plus the strength bonus (the opener is rolled separately).
DiceExpr playerDamageDice(int kk);

struct PlayerStrike {
    bool hit = false;
    int natural = 0; // 1..20
    int damage = 0;
    int opener = 0;  // bonus applied to the first hit on a fresh enemy
};

PlayerStrike rollPlayerStrike(RNG& rng, int atk, int kk, bool targetFresh);

struct EnemyStrike {
    bool hit = false;     // attack roll succeeded and the parry failed
    bool parried = false; // attack roll succeeded but the player parried
    int damage = 0;
};

// Enemy attack: 1d20 <= atk to connect, then the player parries on 1d20 <= par.
EnemyStrike rollEnemyStrike(RNG& rng, EntityKind kind, int playerPar);

// Healing draught strength; KO above 10 adds one point per two points.
int potionHealAmount(int ko);
