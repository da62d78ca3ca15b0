#include "combat_rules.hpp"

#include <algorithm>

bool CombatHeroContext::hasCurse(HeroCurse c) const {
    return std::find(activeCurses.begin(), activeCurses.end(), c) != activeCurses.end();
}

FateRoll rollFate(FateDeckManager* deck, double worldResonance, RNG& rng, FateFallbackRange fallback) {
    FateRoll roll;
    if (deck) {
        roll.draw = deck->drawAndResolve(worldResonance);
    }
    if (roll.draw) {
        roll.value = roll.draw->effectiveValue;
    } else {
        roll.usedFallback = true;
        roll.value = rng.range(std::min(fallback.min, fallback.max), std::max(fallback.min, fallback.max));
    }
    return roll;
}

FateAttackResult calculateAttackWithFate(const CombatHeroContext& hero,
                                         FateDeckManager* deck,
                                         double worldResonance,
                                         int effortCards,
                                         int monsterDefense,
                                         int bonusDamage,
                                         int cardPower,
                                         RNG& rng,
                                         FateFallbackRange fallback) {
    FateAttackResult r;
    r.baseStrength = hero.strength;
    r.cardPower = cardPower;
    r.effortBonus = std::max(0, effortCards);
    r.bonusDamage = bonusDamage;
    r.defenseValue = monsterDefense;

    r.fate = rollFate(deck, worldResonance, rng, fallback);

    r.totalAttack = r.baseStrength + r.cardPower + r.effortBonus + r.fate.value + r.bonusDamage;
    r.isHit = r.totalAttack >= monsterDefense;
    if (!r.isHit) return r;

    int dmg = std::max(1, r.totalAttack - monsterDefense + 2);
    if (hero.hasCurse(HeroCurse::Weakness)) {
        dmg = std::max(1, dmg - 1);
        r.notes.push_back("WEAKNESS -1");
    }
    if (hero.hasCurse(HeroCurse::ShadowOfNav)) {
        dmg += 3;
        r.notes.push_back("SHADOW OF NAV +3");
    }
    if (hero.heroDamageBonus > 0) {
        dmg += hero.heroDamageBonus;
        r.notes.push_back("HERO +" + std::to_string(hero.heroDamageBonus));
    }
    r.damage = std::max(1, dmg);
    return r;
}

SpiritAttackResult calculateSpiritAttack(const CombatHeroContext& hero,
                                         int enemyCurrentWill,
                                         FateDeckManager* deck,
                                         double worldResonance,
                                         int effortCards,
                                         int bonusDamage,
                                         RNG& rng,
                                         FateFallbackRange fallback) {
    SpiritAttackResult r;
    r.baseStat = std::max({hero.wisdom, hero.intelligence, 1});
    r.fate = rollFate(deck, worldResonance, rng, fallback);
    r.fateModifier = r.fate.value;

    r.damage = std::max(1, r.baseStat + std::max(0, effortCards) + r.fateModifier + bonusDamage);
    r.newWill = std::max(0, enemyCurrentWill - r.damage);
    r.isPacified = r.newWill <= 0;
    return r;
}

KeywordAffinity keywordAffinity(const std::set<FateKeyword>& weaknesses,
                                const std::set<FateKeyword>& strengths,
                                std::optional<FateKeyword> keyword) {
    if (!keyword) return KeywordAffinity::None;
    if (weaknesses.count(*keyword)) return KeywordAffinity::Weakness;
    if (strengths.count(*keyword)) return KeywordAffinity::Resistance;
    return KeywordAffinity::None;
}

double affinityMultiplier(KeywordAffinity a, double weaknessMultiplier, double resistanceMultiplier) {
    switch (a) {
        case KeywordAffinity::None:       return 1.0;
        case KeywordAffinity::Weakness:   return weaknessMultiplier;
        case KeywordAffinity::Resistance: return resistanceMultiplier;
    }
    return 1.0;
}

int strikeDamage(int stat, int fateValue, int bonuses, double multiplier, int effectiveDefense) {
    const int raw = stat + fateValue + bonuses;
    const int scaled = static_cast<int>(static_cast<double>(raw) * multiplier);
    return std::max(1, scaled - effectiveDefense);
}
