#pragma once

#include "fate_card.hpp"
#include "resonance.hpp"

#include <cstdint>
#include <optional>

// Single-enemy disposition duel. Disposition runs from -100 (destroyed) to
// +100 (subjugated); strikes push it down, influence pushes it up.
enum class DispositionOutcome : uint8_t {
    Destroyed = 0,
    Subjugated,
};

enum class DispositionActionType : uint8_t {
    Strike = 0,
    Influence,
    Sacrifice,
};

constexpr int DISPOSITION_POWER_CAP = 25;
constexpr int RAGE_DISPOSITION_SHIFT = 5;

// effective = min(25, max(0, surgedBase + streakBonus + threatBonus + fate
//                             + resonanceBonus - switchPenalty - defend - adapt))
int dispositionEffectivePower(int basePower,
                              int streakCount,
                              std::optional<DispositionActionType> lastActionType,
                              DispositionActionType currentActionType,
                              std::optional<FateKeyword> fateKeyword,
                              int fateModifier,
                              ResonanceZone zone,
                              int defendReduction,
                              int adaptPenalty);

int dispositionStreakBonus(int streakCount);
int dispositionSwitchPenalty(int streakCount);

struct DispositionSimulation {
    int disposition = 0;
    std::optional<DispositionOutcome> outcome;

    std::optional<DispositionActionType> streakType;
    int streakCount = 0;
    std::optional<DispositionActionType> lastActionType;

    int energy = 3;
    int startingEnergy = 3;
    bool sacrificeUsedThisTurn = false;
    int enemySacrificeBuff = 0;

    int heroHp = 100;
    int heroMaxHp = 100;
    ResonanceZone zone = ResonanceZone::Yav;

    // Pending enemy modifiers, each consumed by the next matching player action.
    int defendReduction = 0;
    int provokePenalty = 0;
    int adaptPenalty = 0;
    int pleaBacklash = 0;

    static DispositionSimulation makeStandard(int disposition = 0, int heroHp = 100, int energy = 3);

    // Player actions (cost 1 energy). Return false, unchanged, when rejected.
    bool playStrike(int basePower, int fateModifier = 0, std::optional<FateKeyword> fateKeyword = std::nullopt);
    bool playInfluence(int basePower, int fateModifier = 0, std::optional<FateKeyword> fateKeyword = std::nullopt);
    bool playSacrifice();

    void beginPlayerTurn();
    void endPlayerTurn();

    // Enemy effects.
    void applyEnemyAttack(int damage);
    void applyEnemyDefend(int value);
    void applyEnemyProvoke(int value);
    void applyEnemyAdapt(int streakBonus);
    void applyDispositionShift(int shift);
    void applyPleaBacklash(int hpLoss);

private:
    int nextStreakCount_(DispositionActionType a) const;
    int currentAdaptPenalty_(DispositionActionType a) const;
    void updateMomentum_(DispositionActionType a);
    void resolveOutcome_();
};

bool operator==(const DispositionSimulation& a, const DispositionSimulation& b);
