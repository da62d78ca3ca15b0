#pragma once

#include "encounter_types.hpp"
#include "resonance.hpp"
#include "rng.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

enum class MessageKind : uint8_t {
    Info = 0,
    Combat,
    Fate,
    Enemy,
    System,
    Warning,
};

struct Message {
    std::string text;
    MessageKind kind = MessageKind::Info;

    // Consecutive duplicate messages are compacted by incrementing this counter.
    int repeat = 1;
};

enum class AttackTrack : uint8_t {
    Physical = 0,
    Spiritual,
};

// One roster slot. Slots are never removed: a killed or pacified enemy stays
// in place so indices and ids remain stable for outcome maps.
struct EnemySlot {
    EncounterEnemy enemy;     // hp/wp/power/defense mutate in place
    std::string sourceId;     // summon pool id (empty for the initial roster)
    EntityOutcome outcome = EntityOutcome::Alive;
    EnemyModeState mode;
    std::optional<EnemyIntent> intent;

    int rageShield = 0;       // absorbed by the next spirit attack
    int provokePenalty = 0;   // subtracted from the next spirit attack
    int pleaBacklash = 0;     // hero hp lost on the next physical attack
    bool summonUsed = false;

    bool isAlive() const { return outcome == EntityOutcome::Alive; }
    bool hasSpiritTrack() const { return enemy.wp.has_value(); }

    // round(100 * wpLost / maxWp - 100 * hpLost / maxHp), clamped to [-100, 100].
    int disposition() const;
};

// hp reaching 0 always wins over wp reaching 0.
EntityOutcome settleEntityOutcome(EntityOutcome current, int hp, std::optional<int> wp);

// All mutable encounter state apart from the deck, RNG and resonance.
struct EncounterState {
    EncounterPhase phase = EncounterPhase::Intent;
    int round = 1;

    int heroHp = 0;
    int heroFaith = 0;

    std::vector<EnemySlot> enemies;

    std::vector<HeroCard> hand;
    std::vector<HeroCard> cardDiscard;

    // Reset when leaving enemyResolution.
    int turnAttackBonus = 0;
    int turnDefenseBonus = 0;
    int turnInfluenceBonus = 0;

    int heroAttackPenalty = 0; // debuff, consumed by the next physical attack

    bool finishActionUsed = false;
    bool mulliganDone = false;
    bool fled = false;

    std::optional<AttackTrack> lastAttackTrack;

    // Hero action momentum as seen by enemy AI.
    std::optional<DispositionActionType> momentumType;
    int momentumCount = 0;

    int tension = 0;
    int summonCounter = 0;
    std::vector<std::string> appliedCurses;

    std::optional<FateDrawResult> lastFateDraw;
};

// Exact, restorable picture of a running encounter (checkpoints).
struct EncounterSnapshot {
    EncounterState state;
    FateDeckState deck;
    RNGState rng;
    double resonance = 0.0;
};

// Turn-based encounter: intent -> playerAction -> enemyResolution -> roundEnd.
//
// The engine owns its RNG, Fate deck and resonance value; every random draw
// comes from that one stream in phase order. Rejected calls mutate nothing.
class EncounterEngine {
public:
    explicit EncounterEngine(EncounterContext ctx);

    EncounterEngine(const EncounterEngine&) = delete;
    EncounterEngine& operator=(const EncounterEngine&) = delete;

    ActionResult performAction(const PlayerAction& action);
    ActionResult advancePhase();
    ActionResult resolveEnemyAction(const std::string& enemyId);

    // Ends the encounter (if still running) and reports outcomes.
    EncounterResult finishEncounter();

    EncounterSnapshot saveSnapshot() const;
    void restoreSnapshot(const EncounterSnapshot& snap);

    const EncounterContext& context() const { return ctx_; }
    const EncounterState& state() const { return st_; }

    EncounterPhase phase() const { return st_.phase; }
    int round() const { return st_.round; }
    int heroHp() const { return st_.heroHp; }
    int heroFaith() const { return st_.heroFaith; }
    bool isFinished() const { return st_.phase == EncounterPhase::Finished; }
    bool mulliganDone() const { return st_.mulliganDone; }
    int tension() const { return st_.tension; }

    const std::vector<EnemySlot>& enemies() const { return st_.enemies; }
    const EnemySlot* findEnemy(const std::string& id) const;

    const std::vector<HeroCard>& hand() const { return st_.hand; }
    const std::vector<HeroCard>& cardDiscard() const { return st_.cardDiscard; }

    double resonance() const { return resonance_.value(); }
    ResonanceZone zone() const { return resonance_.activeZone(); }

    const FateDeckManager& fateDeck() const { return deck_; }
    const std::optional<FateDrawResult>& lastFateDrawResult() const { return st_.lastFateDraw; }

    RNGState rngState() const { return rng_.snapshot(); }

    EncounterOutcome currentOutcome() const;

    const std::deque<Message>& messages() const { return msgs_; }

private:
    // encounter.cpp
    void pushMsg(const std::string& s, MessageKind kind = MessageKind::Info);
    int findEnemyIndex(const std::string& id) const;
    std::vector<HeroCard> cardPool() const;
    bool drawHeroCard(std::vector<EncounterStateChange>& changes);
    void shiftResonance(double amount, const std::string& source, std::vector<EncounterStateChange>& changes);
    FateRoll drawFate(std::vector<EncounterStateChange>& changes);
    FateFallbackRange fallbackRange() const;
    void settleOutcome(EnemySlot& slot, std::vector<EncounterStateChange>& changes);
    bool checkTermination(std::vector<EncounterStateChange>& changes);
    void noteMomentum(DispositionActionType t);

    // encounter_combat.cpp
    ActionResult performPhysicalAttack(const std::string& targetId);
    ActionResult performSpiritAttack(const std::string& targetId);
    ActionResult playCard(const std::string& cardId, const std::string& targetId);
    ActionResult performMulligan(const std::vector<std::string>& cardIds);
    ActionResult performFlee();

    // encounter_enemy.cpp
    void generateIntents(std::vector<EncounterStateChange>& changes);
    EnemyIntent normalIntent(EnemySlot& slot, int disposition, int baseDamage);
    EnemyIntent intentFromAction(const EnemyAction& a) const;
    DispositionSimulation momentumView(int disposition) const;
    void resolveIntent(size_t idx, std::vector<EncounterStateChange>& changes);
    void resolvePendingIntents(std::vector<EncounterStateChange>& changes);
    void applyRegeneration(std::vector<EncounterStateChange>& changes);
    void summonEnemy(const std::string& poolId, std::vector<EncounterStateChange>& changes);

    EncounterContext ctx_;
    RNG rng_;
    ResonanceEngine resonance_;
    FateDeckManager deck_;
    EncounterState st_;
    std::deque<Message> msgs_;
};
