#pragma once

#include "fate_deck.hpp"
#include "rng.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class HeroCurse : uint8_t {
    Weakness = 0,   // -1 damage
    ShadowOfNav,    // +3 damage
};

// Hero-side inputs for a Fate-resolved check. Plain data; no engine access.
struct CombatHeroContext {
    int strength = 1;
    int wisdom = 1;
    int intelligence = 0;
    int heroDamageBonus = 0;
    std::vector<HeroCurse> activeCurses;

    bool hasCurse(HeroCurse c) const;
};

// Inclusive bounds for the random modifier used when no Fate card is available.
struct FateFallbackRange {
    int min = -1;
    int max = 2;
};

// Draws one Fate card, or falls back to a bounded random modifier when the deck
// is missing or entirely empty. Never fails.
struct FateRoll {
    int value = 0;
    bool usedFallback = false;
    std::optional<FateDrawResult> draw;
};

FateRoll rollFate(FateDeckManager* deck, double worldResonance, RNG& rng, FateFallbackRange fallback = {});

struct FateAttackResult {
    int baseStrength = 0;
    int cardPower = 0;
    int effortBonus = 0;
    int bonusDamage = 0;
    FateRoll fate;
    int totalAttack = 0;
    int defenseValue = 0;
    bool isHit = false;
    int damage = 0;
    std::vector<std::string> notes; // e.g. "WEAKNESS -1"
};

// totalAttack = strength + cardPower + effort + fate + bonusDamage.
// Hit when totalAttack >= defense; damage = max(1, totalAttack - defense + 2)
// plus curse/hero adjustments (floored at 1). A miss deals 0.
FateAttackResult calculateAttackWithFate(const CombatHeroContext& hero,
                                         FateDeckManager* deck,
                                         double worldResonance,
                                         int effortCards,
                                         int monsterDefense,
                                         int bonusDamage,
                                         int cardPower,
                                         RNG& rng,
                                         FateFallbackRange fallback = {});

struct SpiritAttackResult {
    int damage = 0;
    int baseStat = 0;
    int fateModifier = 0;
    int newWill = 0;
    bool isPacified = false;
    FateRoll fate;
};

// damage = max(1, max(wisdom, intelligence, 1) + effort + fate + bonusDamage).
SpiritAttackResult calculateSpiritAttack(const CombatHeroContext& hero,
                                         int enemyCurrentWill,
                                         FateDeckManager* deck,
                                         double worldResonance,
                                         int effortCards,
                                         int bonusDamage,
                                         RNG& rng,
                                         FateFallbackRange fallback = {});

enum class KeywordAffinity : uint8_t {
    None = 0,
    Weakness,
    Resistance,
};

// Weakness wins if a keyword is listed in both sets.
KeywordAffinity keywordAffinity(const std::set<FateKeyword>& weaknesses,
                                const std::set<FateKeyword>& strengths,
                                std::optional<FateKeyword> keyword);

double affinityMultiplier(KeywordAffinity a, double weaknessMultiplier = 1.5, double resistanceMultiplier = 0.67);

// Encounter strike damage:
//   max(1, trunc((stat + fate + bonuses) * multiplier) - effectiveDefense)
// The floor of 1 applies to every attack that connects.
int strikeDamage(int stat, int fateValue, int bonuses, double multiplier, int effectiveDefense);
