#include "enemy_ai.hpp"

#include <algorithm>
#include <cstdlib>

const char* enemyModeName(EnemyMode m) {
    switch (m) {
        case EnemyMode::Normal:      return "normal";
        case EnemyMode::Weakened:    return "weakened";
        case EnemyMode::Survival:    return "survival";
        case EnemyMode::Desperation: return "desperation";
    }
    return "normal";
}

const char* enemyActionKindName(EnemyActionKind k) {
    switch (k) {
        case EnemyActionKind::Attack:  return "attack";
        case EnemyActionKind::Rage:    return "rage";
        case EnemyActionKind::Defend:  return "defend";
        case EnemyActionKind::Provoke: return "provoke";
        case EnemyActionKind::Plea:    return "plea";
        case EnemyActionKind::Adapt:   return "adapt";
        case EnemyActionKind::Summon:  return "summon";
    }
    return "attack";
}

int modeThresholdOffset(uint64_t seed) {
    return static_cast<int>(hash64(seed) % 11u);
}

EnemyModeState::EnemyModeState(uint64_t seed) {
    const int off = modeThresholdOffset(seed);
    survivalThreshold = -(65 + off);
    desperationThreshold = 65 + off;
}

bool operator==(const EnemyModeState& a, const EnemyModeState& b) {
    return a.survivalThreshold == b.survivalThreshold &&
           a.desperationThreshold == b.desperationThreshold &&
           a.currentMode == b.currentMode &&
           a.hysteresisCounter == b.hysteresisCounter &&
           a.previousDisposition == b.previousDisposition;
}

EnemyMode evaluateMode(EnemyModeState& state, int disposition) {
    const int swing = std::abs(disposition - state.previousDisposition);
    state.previousDisposition = disposition;

    EnemyMode next = EnemyMode::Normal;
    if (swing >= MODE_SWING_THRESHOLD) {
        next = EnemyMode::Weakened;
    } else if (state.hysteresisCounter > 0) {
        state.hysteresisCounter -= 1;
        return state.currentMode;
    } else if (disposition <= state.survivalThreshold) {
        next = EnemyMode::Survival;
    } else if (disposition >= state.desperationThreshold) {
        next = EnemyMode::Desperation;
    }

    if (next != state.currentMode && next != EnemyMode::Normal) {
        state.hysteresisCounter = 1;
    }
    state.currentMode = next;
    return next;
}

bool operator==(const EnemyAction& a, const EnemyAction& b) {
    return a.kind == b.kind && a.value == b.value && a.summonId == b.summonId;
}

bool operator!=(const EnemyAction& a, const EnemyAction& b) {
    return !(a == b);
}

namespace {

EnemyAction selectNormal(const DispositionSimulation& sim, int baseDamage, int baseProvoke) {
    if (sim.streakType && sim.streakCount >= MOMENTUM_STREAK_TRIGGER) {
        switch (*sim.streakType) {
            case DispositionActionType::Strike:
                return EnemyAction::defend(MOMENTUM_DEFEND_VALUE);
            case DispositionActionType::Influence:
                return EnemyAction::provoke(baseProvoke);
            case DispositionActionType::Sacrifice:
                return EnemyAction::adapt(std::max(3, dispositionStreakBonus(sim.streakCount)));
        }
    }
    return EnemyAction::attack(baseDamage);
}

} // namespace

EnemyAction selectEnemyAction(EnemyMode mode,
                              const DispositionSimulation& sim,
                              RNG& rng,
                              int baseDamage,
                              int baseProvoke) {
    switch (mode) {
        case EnemyMode::Normal:
            return selectNormal(sim, baseDamage, baseProvoke);

        case EnemyMode::Weakened:
            return EnemyAction::attack(std::max(1, baseDamage / 2));

        case EnemyMode::Survival: {
            const int roll = rng.range(0, 99);
            if (roll < 60) return EnemyAction::attack(baseDamage);
            if (roll < 90) return EnemyAction::rage(baseDamage * 2);
            return EnemyAction::attack(baseDamage);
        }

        case EnemyMode::Desperation: {
            const int roll = rng.range(0, 99);
            if (roll < 40) return EnemyAction::provoke(baseProvoke + DESPERATION_PROVOKE_BONUS);
            if (roll < 70) return EnemyAction::plea(PLEA_DISPOSITION_SHIFT);
            return EnemyAction::attack(baseDamage * 2);
        }
    }
    return EnemyAction::attack(baseDamage);
}

void resolveEnemyAction(const EnemyAction& action, DispositionSimulation& sim) {
    switch (action.kind) {
        case EnemyActionKind::Attack:
            sim.applyEnemyAttack(action.value);
            break;
        case EnemyActionKind::Rage:
            sim.applyEnemyAttack(action.value);
            sim.applyDispositionShift(RAGE_DISPOSITION_SHIFT);
            break;
        case EnemyActionKind::Defend:
            sim.applyEnemyDefend(action.value);
            break;
        case EnemyActionKind::Provoke:
            sim.applyEnemyProvoke(action.value);
            break;
        case EnemyActionKind::Plea:
            sim.applyDispositionShift(action.value);
            sim.applyPleaBacklash(PLEA_BACKLASH_HP);
            break;
        case EnemyActionKind::Adapt:
            sim.applyEnemyAdapt(action.value);
            break;
        case EnemyActionKind::Summon:
            // Roster growth happens in the encounter; nothing to apply here.
            break;
    }
}
