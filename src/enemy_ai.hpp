#pragma once

#include "disposition.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>

enum class EnemyMode : uint8_t {
    Normal = 0,
    Weakened,
    Survival,
    Desperation,
};

const char* enemyModeName(EnemyMode m);

// Per-enemy AI tracker. Thresholds are fixed at construction from the
// encounter seed; the rest mutates once per evaluateMode() call.
struct EnemyModeState {
    int survivalThreshold = -70;
    int desperationThreshold = 70;
    EnemyMode currentMode = EnemyMode::Normal;
    int hysteresisCounter = 0;
    int previousDisposition = 0;

    EnemyModeState() = default;
    explicit EnemyModeState(uint64_t seed);
};

bool operator==(const EnemyModeState& a, const EnemyModeState& b);

constexpr int MODE_SWING_THRESHOLD = 30;

// Band offset in [0,10]. Pinned to hash64(); part of the trace format.
int modeThresholdOffset(uint64_t seed);

EnemyMode evaluateMode(EnemyModeState& state, int disposition);

enum class EnemyActionKind : uint8_t {
    Attack = 0,
    Rage,
    Defend,
    Provoke,
    Plea,
    Adapt,
    Summon,
};

const char* enemyActionKindName(EnemyActionKind k);

struct EnemyAction {
    EnemyActionKind kind = EnemyActionKind::Attack;
    int value = 0;
    std::string summonId; // Summon only

    static EnemyAction attack(int dmg) { return {EnemyActionKind::Attack, dmg, {}}; }
    static EnemyAction rage(int dmg) { return {EnemyActionKind::Rage, dmg, {}}; }
    static EnemyAction defend(int v) { return {EnemyActionKind::Defend, v, {}}; }
    static EnemyAction provoke(int v) { return {EnemyActionKind::Provoke, v, {}}; }
    static EnemyAction plea(int shift) { return {EnemyActionKind::Plea, shift, {}}; }
    static EnemyAction adapt(int v) { return {EnemyActionKind::Adapt, v, {}}; }
    static EnemyAction summon(const std::string& id) { return {EnemyActionKind::Summon, 0, id}; }
};

bool operator==(const EnemyAction& a, const EnemyAction& b);
bool operator!=(const EnemyAction& a, const EnemyAction& b);

constexpr int DEFAULT_ENEMY_BASE_DAMAGE = 3;
constexpr int DEFAULT_ENEMY_BASE_PROVOKE = 3;
constexpr int MOMENTUM_STREAK_TRIGGER = 3;
constexpr int MOMENTUM_DEFEND_VALUE = 3;
constexpr int DESPERATION_PROVOKE_BONUS = 2;
constexpr int PLEA_DISPOSITION_SHIFT = 5;
constexpr int PLEA_BACKLASH_HP = 2;

// Survival and desperation consume exactly one rng.range(0, 99) draw;
// normal and weakened consume none.
EnemyAction selectEnemyAction(EnemyMode mode,
                              const DispositionSimulation& sim,
                              RNG& rng,
                              int baseDamage = DEFAULT_ENEMY_BASE_DAMAGE,
                              int baseProvoke = DEFAULT_ENEMY_BASE_PROVOKE);

void resolveEnemyAction(const EnemyAction& action, DispositionSimulation& sim);
