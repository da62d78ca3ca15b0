#include "encounter_types.hpp"

#include "common.hpp"

#include <algorithm>
#include <utility>

const char* enemyAbilityKindName(EnemyAbilityKind k) {
    switch (k) {
        case EnemyAbilityKind::Armor:        return "armor";
        case EnemyAbilityKind::Regeneration: return "regeneration";
        case EnemyAbilityKind::BonusDamage:  return "bonus_damage";
        case EnemyAbilityKind::ApplyCurse:   return "apply_curse";
        case EnemyAbilityKind::Summon:       return "summon";
        default:                             return "armor";
    }
}

bool parseEnemyAbilityKind(const std::string& raw, EnemyAbilityKind& out) {
    const std::string s = toLower(trim(raw));
    if (s == "armor") { out = EnemyAbilityKind::Armor; return true; }
    if (s == "regeneration" || s == "regen") { out = EnemyAbilityKind::Regeneration; return true; }
    if (s == "bonus_damage" || s == "bonusdamage") { out = EnemyAbilityKind::BonusDamage; return true; }
    if (s == "apply_curse" || s == "curse") { out = EnemyAbilityKind::ApplyCurse; return true; }
    if (s == "summon") { out = EnemyAbilityKind::Summon; return true; }
    return false;
}

int EncounterEnemy::abilityTotal(EnemyAbilityKind k) const {
    int sum = 0;
    for (const auto& a : abilities) {
        if (a.kind == k) sum += a.value;
    }
    return sum;
}

const EnemyAbility* EncounterEnemy::findAbility(EnemyAbilityKind k) const {
    for (const auto& a : abilities) {
        if (a.kind == k) return &a;
    }
    return nullptr;
}

const char* cardRealmName(CardRealm r) {
    switch (r) {
        case CardRealm::Neutral: return "neutral";
        case CardRealm::Nav:     return "nav";
        case CardRealm::Yav:     return "yav";
        case CardRealm::Prav:    return "prav";
        default:                 return "neutral";
    }
}

bool parseCardRealm(const std::string& raw, CardRealm& out) {
    const std::string s = toLower(trim(raw));
    if (s == "neutral" || s.empty()) { out = CardRealm::Neutral; return true; }
    if (s == "nav") { out = CardRealm::Nav; return true; }
    if (s == "yav") { out = CardRealm::Yav; return true; }
    if (s == "prav") { out = CardRealm::Prav; return true; }
    return false;
}

const char* cardAbilityKindName(CardAbilityKind k) {
    switch (k) {
        case CardAbilityKind::Damage:       return "damage";
        case CardAbilityKind::Heal:         return "heal";
        case CardAbilityKind::TempStrength: return "temp_strength";
        case CardAbilityKind::TempDefense:  return "temp_defense";
        case CardAbilityKind::TempWisdom:   return "temp_wisdom";
        case CardAbilityKind::DrawCards:    return "draw";
        case CardAbilityKind::GainFaith:    return "gain_faith";
        default:                            return "damage";
    }
}

bool parseCardAbilityKind(const std::string& raw, CardAbilityKind& out) {
    const std::string s = toLower(trim(raw));
    if (s == "damage") { out = CardAbilityKind::Damage; return true; }
    if (s == "heal") { out = CardAbilityKind::Heal; return true; }
    if (s == "temp_strength" || s == "strength" || s == "attack") { out = CardAbilityKind::TempStrength; return true; }
    if (s == "temp_defense" || s == "defense" || s == "armor") { out = CardAbilityKind::TempDefense; return true; }
    if (s == "temp_wisdom" || s == "wisdom" || s == "influence") { out = CardAbilityKind::TempWisdom; return true; }
    if (s == "draw" || s == "draw_cards") { out = CardAbilityKind::DrawCards; return true; }
    if (s == "gain_faith" || s == "faith") { out = CardAbilityKind::GainFaith; return true; }
    return false;
}

bool operator==(const HeroCard& a, const HeroCard& b) {
    if (a.id != b.id || a.name != b.name || a.power != b.power || a.defense != b.defense ||
        a.wisdom != b.wisdom || a.faithCost != b.faithCost || a.realm != b.realm ||
        a.abilities.size() != b.abilities.size()) {
        return false;
    }
    for (size_t i = 0; i < a.abilities.size(); ++i) {
        if (a.abilities[i].kind != b.abilities[i].kind || a.abilities[i].value != b.abilities[i].value) return false;
    }
    return true;
}

int adjustedFaithCost(const HeroCard& card, ResonanceZone zone) {
    int cost = card.faithCost;
    if (cost <= 0) return 0;

    if (card.realm == CardRealm::Nav) {
        if (isNavZone(zone)) cost = std::max(0, cost - 1);
        else if (isPravZone(zone)) cost += 1;
    } else if (card.realm == CardRealm::Prav) {
        if (isPravZone(zone)) cost = std::max(0, cost - 1);
        else if (isNavZone(zone)) cost += 1;
    }
    return cost;
}

namespace {

bool checkEnemyRefs(const EncounterEnemy& e, const EncounterContext& ctx, std::string* err) {
    for (const auto& a : e.abilities) {
        if (a.kind == EnemyAbilityKind::Summon && ctx.summonPool.find(a.ref) == ctx.summonPool.end()) {
            if (err) *err = "enemy '" + e.id + "' summons unknown '" + a.ref + "'";
            return false;
        }
        if (a.kind == EnemyAbilityKind::ApplyCurse && ctx.curseCards.find(a.ref) == ctx.curseCards.end()) {
            if (err) *err = "enemy '" + e.id + "' applies unknown curse '" + a.ref + "'";
            return false;
        }
    }
    if (e.maxHp <= 0 || e.hp <= 0) {
        if (err) *err = "enemy '" + e.id + "' has no hit points";
        return false;
    }
    if (e.hp > e.maxHp) {
        if (err) *err = "enemy '" + e.id + "' starts above max hit points";
        return false;
    }
    if (e.wp.has_value() != e.maxWp.has_value()) {
        if (err) *err = "enemy '" + e.id + "' has a partial will track";
        return false;
    }
    if (e.wp && (*e.maxWp <= 0 || *e.wp <= 0)) {
        if (err) *err = "enemy '" + e.id + "' has no will";
        return false;
    }
    if (e.wp && *e.wp > *e.maxWp) {
        if (err) *err = "enemy '" + e.id + "' starts above max will";
        return false;
    }
    return true;
}

} // namespace

bool validateEncounterContext(const EncounterContext& ctx, std::string* err) {
    if (ctx.enemies.empty()) {
        if (err) *err = "encounter has no enemies";
        return false;
    }
    if (ctx.hero.maxHp <= 0 || ctx.hero.hp <= 0) {
        if (err) *err = "hero has no hit points";
        return false;
    }
    if (ctx.hero.hp > ctx.hero.maxHp) {
        if (err) *err = "hero starts above max hit points";
        return false;
    }

    std::set<std::string> ids;
    for (const auto& e : ctx.enemies) {
        if (e.id.empty()) {
            if (err) *err = "enemy with empty id";
            return false;
        }
        if (!ids.insert(e.id).second) {
            if (err) *err = "duplicate enemy id '" + e.id + "'";
            return false;
        }
        if (!checkEnemyRefs(e, ctx, err)) return false;
    }
    for (const auto& kv : ctx.summonPool) {
        if (!checkEnemyRefs(kv.second, ctx, err)) return false;
    }

    std::set<std::string> cardIds;
    for (const auto& c : ctx.heroCards) {
        if (!cardIds.insert(c.id).second) {
            if (err) *err = "duplicate hero card id '" + c.id + "'";
            return false;
        }
    }
    return true;
}

const char* intentTypeName(IntentType t) {
    switch (t) {
        case IntentType::Attack:  return "attack";
        case IntentType::Rage:    return "rage";
        case IntentType::Ritual:  return "ritual";
        case IntentType::Block:   return "block";
        case IntentType::Buff:    return "buff";
        case IntentType::Heal:    return "heal";
        case IntentType::Summon:  return "summon";
        case IntentType::Provoke: return "provoke";
        case IntentType::Plea:    return "plea";
        case IntentType::Debuff:  return "debuff";
        default:                  return "attack";
    }
}

bool operator==(const EnemyIntent& a, const EnemyIntent& b) {
    return a.type == b.type && a.value == b.value && a.ref == b.ref && a.mode == b.mode;
}

const char* playerActionKindName(PlayerActionKind k) {
    switch (k) {
        case PlayerActionKind::Attack:       return "attack";
        case PlayerActionKind::SpiritAttack: return "spirit";
        case PlayerActionKind::UseCard:      return "card";
        case PlayerActionKind::Wait:         return "wait";
        case PlayerActionKind::Flee:         return "flee";
        case PlayerActionKind::Mulligan:     return "mulligan";
        default:                             return "wait";
    }
}

PlayerAction PlayerAction::attack(const std::string& target) {
    PlayerAction a;
    a.kind = PlayerActionKind::Attack;
    a.targetId = target;
    return a;
}

PlayerAction PlayerAction::spiritAttack(const std::string& target) {
    PlayerAction a;
    a.kind = PlayerActionKind::SpiritAttack;
    a.targetId = target;
    return a;
}

PlayerAction PlayerAction::useCard(const std::string& card, const std::string& target) {
    PlayerAction a;
    a.kind = PlayerActionKind::UseCard;
    a.cardId = card;
    a.targetId = target;
    return a;
}

PlayerAction PlayerAction::wait() {
    PlayerAction a;
    a.kind = PlayerActionKind::Wait;
    return a;
}

PlayerAction PlayerAction::flee() {
    PlayerAction a;
    a.kind = PlayerActionKind::Flee;
    return a;
}

PlayerAction PlayerAction::mulligan(const std::vector<std::string>& cards) {
    PlayerAction a;
    a.kind = PlayerActionKind::Mulligan;
    a.cardIds = cards;
    return a;
}

const char* stateChangeKindName(StateChangeKind k) {
    switch (k) {
        case StateChangeKind::HeroHpChanged:       return "hero_hp";
        case StateChangeKind::EnemyHpChanged:      return "enemy_hp";
        case StateChangeKind::EnemyWpChanged:      return "enemy_wp";
        case StateChangeKind::FateDraw:            return "fate_draw";
        case StateChangeKind::FateFallback:        return "fate_fallback";
        case StateChangeKind::WeaknessTriggered:   return "weakness";
        case StateChangeKind::ResistanceTriggered: return "resistance";
        case StateChangeKind::EnemyKilled:         return "enemy_killed";
        case StateChangeKind::EnemyPacified:       return "enemy_pacified";
        case StateChangeKind::EnemySummoned:       return "enemy_summoned";
        case StateChangeKind::CardPlayed:          return "card_played";
        case StateChangeKind::CardDrawn:           return "card_drawn";
        case StateChangeKind::FaithChanged:        return "faith";
        case StateChangeKind::ResonanceShifted:    return "resonance";
        case StateChangeKind::TensionShifted:      return "tension";
        case StateChangeKind::RageShieldApplied:   return "rage_shield";
        case StateChangeKind::IntentDeclared:      return "intent";
        case StateChangeKind::IntentResolved:      return "intent_resolved";
        case StateChangeKind::ModeChanged:         return "mode";
        case StateChangeKind::CurseAdded:          return "curse_added";
        case StateChangeKind::PhaseChanged:        return "phase";
        case StateChangeKind::EncounterEnded:      return "ended";
        default:                                   return "phase";
    }
}

bool operator==(const EncounterStateChange& a, const EncounterStateChange& b) {
    return a.kind == b.kind && a.entityId == b.entityId && a.delta == b.delta &&
           a.value == b.value && a.detail == b.detail;
}

ActionResult ActionResult::ok(std::vector<EncounterStateChange> changes) {
    ActionResult r;
    r.success = true;
    r.changes = std::move(changes);
    return r;
}

ActionResult ActionResult::fail(ErrorCode code, const std::string& reason) {
    ActionResult r;
    r.success = false;
    r.error = code;
    r.reason = reason;
    return r;
}

AggregateOutcome classifyOutcomes(const std::map<std::string, EntityOutcome>& perEntity) {
    int killed = 0;
    int pacified = 0;
    for (const auto& kv : perEntity) {
        if (kv.second == EntityOutcome::Killed) ++killed;
        else if (kv.second == EntityOutcome::Pacified) ++pacified;
    }
    if (killed == 0 && pacified == 0) return AggregateOutcome::None;
    if (killed > pacified) return AggregateOutcome::Killed;
    if (pacified > killed) return AggregateOutcome::Pacified;
    return AggregateOutcome::Mixed;
}
