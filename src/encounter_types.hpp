#pragma once

#include "combat_rules.hpp"
#include "enemy_ai.hpp"
#include "fate_deck.hpp"
#include "settings.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class EncounterPhase : uint8_t {
    Intent = 0,
    PlayerAction,
    EnemyResolution,
    RoundEnd,
    Finished,
};

inline const char* encounterPhaseName(EncounterPhase p) {
    switch (p) {
        case EncounterPhase::Intent:          return "intent";
        case EncounterPhase::PlayerAction:    return "player_action";
        case EncounterPhase::EnemyResolution: return "enemy_resolution";
        case EncounterPhase::RoundEnd:        return "round_end";
        case EncounterPhase::Finished:        return "finished";
        default:                              return "intent";
    }
}

// Per-enemy outcome. Leaves Alive exactly once.
enum class EntityOutcome : uint8_t {
    Alive = 0,
    Killed,
    Pacified,
};

inline const char* entityOutcomeName(EntityOutcome o) {
    switch (o) {
        case EntityOutcome::Alive:    return "alive";
        case EntityOutcome::Killed:   return "killed";
        case EntityOutcome::Pacified: return "pacified";
        default:                      return "alive";
    }
}

// ------------------------------------------------------------
// Content-side definitions (plain data handed in by the caller)
// ------------------------------------------------------------

enum class EnemyAbilityKind : uint8_t {
    Armor = 0,      // flat physical defense
    Regeneration,   // heal at round end
    BonusDamage,    // added to attack intents
    ApplyCurse,     // ref = curse card id
    Summon,         // ref = summon pool id
};

const char* enemyAbilityKindName(EnemyAbilityKind k);
bool parseEnemyAbilityKind(const std::string& s, EnemyAbilityKind& out);

struct EnemyAbility {
    EnemyAbilityKind kind = EnemyAbilityKind::Armor;
    int value = 0;
    std::string ref;
};

struct EncounterEnemy {
    std::string id;
    std::string name;

    int hp = 10;
    int maxHp = 10;
    std::optional<int> wp;      // no will track: cannot be pacified
    std::optional<int> maxWp;

    int power = 3;
    int defense = 0;
    int spiritDefense = 0;

    std::set<FateKeyword> weaknesses;
    std::set<FateKeyword> strengths;
    std::vector<EnemyAbility> abilities;

    int abilityTotal(EnemyAbilityKind k) const;
    const EnemyAbility* findAbility(EnemyAbilityKind k) const;
};

struct EncounterHero {
    int hp = 20;
    int maxHp = 20;
    int strength = 5;
    int armor = 0;
    int wisdom = 3;
    int faith = 3;
    std::vector<HeroCurse> curses;
};

// Realm of a hero card. Faith cost is -1 inside the card's own realm and +1 in
// the opposing one.
enum class CardRealm : uint8_t {
    Neutral = 0,
    Nav,
    Yav,
    Prav,
};

const char* cardRealmName(CardRealm r);
bool parseCardRealm(const std::string& s, CardRealm& out);

enum class CardAbilityKind : uint8_t {
    Damage = 0,     // adds to this round's attack bonus
    Heal,
    TempStrength,
    TempDefense,
    TempWisdom,
    DrawCards,
    GainFaith,
};

const char* cardAbilityKindName(CardAbilityKind k);
bool parseCardAbilityKind(const std::string& s, CardAbilityKind& out);

struct CardAbility {
    CardAbilityKind kind = CardAbilityKind::Damage;
    int value = 0;
};

struct HeroCard {
    std::string id;
    std::string name;
    int power = 0;
    int defense = 0;
    int wisdom = 0;
    int faithCost = 0;
    CardRealm realm = CardRealm::Neutral;
    std::vector<CardAbility> abilities;
};

bool operator==(const HeroCard& a, const HeroCard& b);

int adjustedFaithCost(const HeroCard& card, ResonanceZone zone);

// Everything needed to build an engine. No file I/O happens past this point.
struct EncounterContext {
    uint64_t seed = 1;
    double resonance = 0.0;

    EncounterHero hero;
    std::vector<EncounterEnemy> enemies;

    // Initial Fate cards (shuffled at start) unless an exact deck state is given.
    std::vector<FateCard> fateCards;
    std::optional<FateDeckState> fateDeckState;

    std::vector<HeroCard> heroCards;
    std::map<std::string, EncounterEnemy> summonPool;
    std::map<std::string, FateCard> curseCards;

    BalanceConfig balance;
};

// Missing definitions (summon/curse references, duplicate enemy ids) are fatal
// here so that the engine never meets them mid-encounter.
bool validateEncounterContext(const EncounterContext& ctx, std::string* err = nullptr);

// ------------------------------------------------------------
// Intents
// ------------------------------------------------------------

enum class IntentType : uint8_t {
    Attack = 0,
    Rage,
    Ritual,
    Block,
    Buff,
    Heal,
    Summon,
    Provoke,
    Plea,
    Debuff,
};

const char* intentTypeName(IntentType t);

struct EnemyIntent {
    IntentType type = IntentType::Attack;
    int value = 0;
    std::string ref; // Summon: pool id
    EnemyMode mode = EnemyMode::Normal;

    bool dealsDamage() const { return type == IntentType::Attack || type == IntentType::Rage; }
};

bool operator==(const EnemyIntent& a, const EnemyIntent& b);

// ------------------------------------------------------------
// Player actions / results
// ------------------------------------------------------------

enum class PlayerActionKind : uint8_t {
    Attack = 0,
    SpiritAttack,
    UseCard,
    Wait,
    Flee,
    Mulligan,
};

const char* playerActionKindName(PlayerActionKind k);

struct PlayerAction {
    PlayerActionKind kind = PlayerActionKind::Wait;
    std::string targetId;
    std::string cardId;
    std::vector<std::string> cardIds; // Mulligan

    static PlayerAction attack(const std::string& target);
    static PlayerAction spiritAttack(const std::string& target);
    static PlayerAction useCard(const std::string& card, const std::string& target = std::string());
    static PlayerAction wait();
    static PlayerAction flee();
    static PlayerAction mulligan(const std::vector<std::string>& cards);
};

enum class ErrorCode : uint8_t {
    None = 0,
    InvalidPhase,
    InvalidTarget,
    NoSpiritTrack,
    ActionAlreadyUsed,
    MulliganAlreadyDone,
    UnknownCard,
    InsufficientFaith,
    NoPendingIntent,
    EncounterFinished,
};

// Stable tokens; part of the replay digest.
inline const char* errorCodeName(ErrorCode e) {
    switch (e) {
        case ErrorCode::None:                return "none";
        case ErrorCode::InvalidPhase:        return "invalid_phase";
        case ErrorCode::InvalidTarget:       return "invalid_target";
        case ErrorCode::NoSpiritTrack:       return "no_spirit_track";
        case ErrorCode::ActionAlreadyUsed:   return "action_already_used";
        case ErrorCode::MulliganAlreadyDone: return "mulligan_already_done";
        case ErrorCode::UnknownCard:         return "unknown_card";
        case ErrorCode::InsufficientFaith:   return "insufficient_faith";
        case ErrorCode::NoPendingIntent:     return "no_pending_intent";
        case ErrorCode::EncounterFinished:   return "encounter_finished";
        default:                             return "none";
    }
}

enum class StateChangeKind : uint8_t {
    HeroHpChanged = 0,
    EnemyHpChanged,
    EnemyWpChanged,
    FateDraw,
    FateFallback,
    WeaknessTriggered,
    ResistanceTriggered,
    EnemyKilled,
    EnemyPacified,
    EnemySummoned,
    CardPlayed,
    CardDrawn,
    FaithChanged,
    ResonanceShifted,
    TensionShifted,
    RageShieldApplied,
    IntentDeclared,
    IntentResolved,
    ModeChanged,
    CurseAdded,
    PhaseChanged,
    EncounterEnded,
};

const char* stateChangeKindName(StateChangeKind k);

// One typed event. Which fields carry meaning depends on `kind`:
//   HP/WP/faith: entityId, delta, value(new)
//   FateDraw: detail(card id), value(effective)
//   ResonanceShifted: delta, value(new, truncated), detail(source)
struct EncounterStateChange {
    StateChangeKind kind = StateChangeKind::PhaseChanged;
    std::string entityId;
    int delta = 0;
    int value = 0;
    std::string detail;
};

bool operator==(const EncounterStateChange& a, const EncounterStateChange& b);

struct ActionResult {
    bool success = false;
    std::vector<EncounterStateChange> changes;
    ErrorCode error = ErrorCode::None;
    std::string reason;

    static ActionResult ok(std::vector<EncounterStateChange> changes = {});
    static ActionResult fail(ErrorCode code, const std::string& reason);
};

// ------------------------------------------------------------
// Results
// ------------------------------------------------------------

enum class EncounterOutcome : uint8_t {
    Unresolved = 0,
    Victory,
    Defeat,
    Escaped,
};

inline const char* encounterOutcomeName(EncounterOutcome o) {
    switch (o) {
        case EncounterOutcome::Unresolved: return "unresolved";
        case EncounterOutcome::Victory:    return "victory";
        case EncounterOutcome::Defeat:     return "defeat";
        case EncounterOutcome::Escaped:    return "escaped";
        default:                           return "unresolved";
    }
}

// How the non-alive enemies went down.
enum class AggregateOutcome : uint8_t {
    None = 0,
    Killed,
    Pacified,
    Mixed,
};

inline const char* aggregateOutcomeName(AggregateOutcome a) {
    switch (a) {
        case AggregateOutcome::None:     return "none";
        case AggregateOutcome::Killed:   return "killed";
        case AggregateOutcome::Pacified: return "pacified";
        case AggregateOutcome::Mixed:    return "mixed";
        default:                         return "none";
    }
}

AggregateOutcome classifyOutcomes(const std::map<std::string, EntityOutcome>& perEntity);

struct EncounterResult {
    EncounterOutcome outcome = EncounterOutcome::Unresolved;
    AggregateOutcome aggregate = AggregateOutcome::None;
    std::map<std::string, EntityOutcome> perEntity;

    int hpDelta = 0;
    double resonanceDelta = 0.0;
    int tensionDelta = 0;
    std::map<std::string, bool> worldFlags; // "violent", "nonviolent"

    FateDeckState fateDeck;
    RNGState rng;
};
