#include "disposition.hpp"

#include "common.hpp"

#include <algorithm>

int dispositionStreakBonus(int streakCount) {
    return std::max(0, streakCount - 1);
}

int dispositionSwitchPenalty(int streakCount) {
    if (streakCount < 3) return 0;
    return std::max(0, streakCount - 2);
}

namespace {

int threatBonus(std::optional<DispositionActionType> last, DispositionActionType cur) {
    return (last == DispositionActionType::Strike && cur == DispositionActionType::Influence) ? 2 : 0;
}

int resonanceBonus(ResonanceZone z, DispositionActionType a) {
    if (isNavZone(z) && a == DispositionActionType::Strike) return 2;
    if (isPravZone(z) && a == DispositionActionType::Influence) return 2;
    return 0;
}

int clampDisposition(int v) {
    return clampi(v, -100, 100);
}

} // namespace

int dispositionEffectivePower(int basePower,
                              int streakCount,
                              std::optional<DispositionActionType> lastActionType,
                              DispositionActionType currentActionType,
                              std::optional<FateKeyword> fateKeyword,
                              int fateModifier,
                              ResonanceZone zone,
                              int defendReduction,
                              int adaptPenalty) {
    // Surge multiplies only the base.
    const int surged = (fateKeyword == FateKeyword::Surge) ? basePower * 3 / 2 : basePower;

    int switchPen = 0;
    if (lastActionType && *lastActionType != currentActionType) {
        switchPen = dispositionSwitchPenalty(streakCount);
    }

    const int raw = surged + dispositionStreakBonus(streakCount) + threatBonus(lastActionType, currentActionType)
                  + fateModifier + resonanceBonus(zone, currentActionType)
                  - switchPen - defendReduction - adaptPenalty;
    return std::min(DISPOSITION_POWER_CAP, std::max(0, raw));
}

DispositionSimulation DispositionSimulation::makeStandard(int disposition, int heroHp, int energy) {
    DispositionSimulation s;
    s.disposition = clampDisposition(disposition);
    s.heroHp = heroHp;
    s.heroMaxHp = heroHp;
    s.energy = energy;
    s.startingEnergy = energy;
    return s;
}

bool DispositionSimulation::playStrike(int basePower, int fateModifier, std::optional<FateKeyword> fateKeyword) {
    if (outcome) return false;
    if (energy < 1) return false;

    const int power = dispositionEffectivePower(basePower, nextStreakCount_(DispositionActionType::Strike),
                                                lastActionType, DispositionActionType::Strike, fateKeyword,
                                                fateModifier, zone, defendReduction,
                                                currentAdaptPenalty_(DispositionActionType::Strike));
    energy -= 1;
    disposition = clampDisposition(disposition - power);
    defendReduction = 0;

    if (pleaBacklash > 0) {
        heroHp = std::max(0, heroHp - pleaBacklash);
        pleaBacklash = 0;
    }

    // Striking under Prav costs the hero unless warded.
    if (isPravZone(zone) && fateKeyword != FateKeyword::Ward) {
        heroHp = std::max(0, heroHp - 1);
    }

    updateMomentum_(DispositionActionType::Strike);
    resolveOutcome_();
    return true;
}

bool DispositionSimulation::playInfluence(int basePower, int fateModifier, std::optional<FateKeyword> fateKeyword) {
    if (outcome) return false;
    if (energy < 1) return false;

    const int power = dispositionEffectivePower(basePower, nextStreakCount_(DispositionActionType::Influence),
                                                lastActionType, DispositionActionType::Influence, fateKeyword,
                                                fateModifier, zone, 0,
                                                currentAdaptPenalty_(DispositionActionType::Influence));
    const int shift = std::max(0, power - provokePenalty);

    energy -= 1;
    disposition = clampDisposition(disposition + shift);
    provokePenalty = 0;

    updateMomentum_(DispositionActionType::Influence);
    resolveOutcome_();
    return true;
}

bool DispositionSimulation::playSacrifice() {
    if (outcome) return false;
    if (sacrificeUsedThisTurn) return false;

    const int cost = isNavZone(zone) ? 0 : 1;
    if (energy < cost) return false;

    energy = energy - cost + 1;
    sacrificeUsedThisTurn = true;
    enemySacrificeBuff += 1;

    updateMomentum_(DispositionActionType::Sacrifice);
    return true;
}

void DispositionSimulation::beginPlayerTurn() {
    energy = startingEnergy;
    sacrificeUsedThisTurn = false;
}

void DispositionSimulation::endPlayerTurn() {
    sacrificeUsedThisTurn = false;
}

void DispositionSimulation::applyEnemyAttack(int damage) {
    heroHp = std::max(0, heroHp - (damage + enemySacrificeBuff));
}

void DispositionSimulation::applyEnemyDefend(int value) {
    defendReduction = value;
}

void DispositionSimulation::applyEnemyProvoke(int value) {
    provokePenalty = value;
}

void DispositionSimulation::applyEnemyAdapt(int streakBonus) {
    adaptPenalty = std::max(3, streakBonus);
}

void DispositionSimulation::applyDispositionShift(int shift) {
    disposition = clampDisposition(disposition + shift);
    resolveOutcome_();
}

void DispositionSimulation::applyPleaBacklash(int hpLoss) {
    pleaBacklash = hpLoss;
}

int DispositionSimulation::nextStreakCount_(DispositionActionType a) const {
    return (streakType == a) ? streakCount + 1 : 1;
}

int DispositionSimulation::currentAdaptPenalty_(DispositionActionType a) const {
    if (adaptPenalty <= 0) return 0;
    if (streakType != a) return 0;
    return adaptPenalty;
}

void DispositionSimulation::updateMomentum_(DispositionActionType a) {
    if (streakType == a) {
        ++streakCount;
    } else {
        streakType = a;
        streakCount = 1;
    }
    lastActionType = a;
}

void DispositionSimulation::resolveOutcome_() {
    if (outcome) return;
    if (disposition <= -100) outcome = DispositionOutcome::Destroyed;
    else if (disposition >= 100) outcome = DispositionOutcome::Subjugated;
}

bool operator==(const DispositionSimulation& a, const DispositionSimulation& b) {
    return a.disposition == b.disposition && a.outcome == b.outcome &&
           a.streakType == b.streakType && a.streakCount == b.streakCount &&
           a.lastActionType == b.lastActionType && a.energy == b.energy &&
           a.startingEnergy == b.startingEnergy && a.sacrificeUsedThisTurn == b.sacrificeUsedThisTurn &&
           a.enemySacrificeBuff == b.enemySacrificeBuff && a.heroHp == b.heroHp &&
           a.heroMaxHp == b.heroMaxHp && a.zone == b.zone &&
           a.defendReduction == b.defendReduction && a.provokePenalty == b.provokePenalty &&
           a.adaptPenalty == b.adaptPenalty && a.pleaBacklash == b.pleaBacklash;
}
