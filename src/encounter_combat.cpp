#include "encounter.hpp"

#include "common.hpp"
#include "keywords.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace {

constexpr int RESONANCE_PUSH_AMOUNT = 3;

std::string displayName(const EncounterEnemy& e) {
    return toUpper(e.name.empty() ? e.id : e.name);
}

KeywordEffect keywordEffectFor(const FateRoll& roll, ActionContext ctx, double matchMultiplier) {
    if (!roll.draw || !roll.draw->card.keyword) return KeywordEffect{};
    const FateCard& card = roll.draw->card;
    return resolveKeywordWithAlignment(*card.keyword, ctx,
                                       isSuitMatch(card.suit, ctx),
                                       isSuitMismatch(card.suit, ctx),
                                       matchMultiplier);
}

int curseAdjustment(const std::vector<HeroCurse>& curses) {
    int adj = 0;
    for (HeroCurse c : curses) {
        switch (c) {
            case HeroCurse::Weakness:    adj -= 1; break;
            case HeroCurse::ShadowOfNav: adj += 3; break;
        }
    }
    return adj;
}

} // namespace

// ------------------------------------------------------------
// Physical
// ------------------------------------------------------------

ActionResult EncounterEngine::performPhysicalAttack(const std::string& targetId) {
    const int idx = findEnemyIndex(targetId);
    if (idx < 0 || !st_.enemies[static_cast<size_t>(idx)].isAlive()) {
        return ActionResult::fail(ErrorCode::InvalidTarget, "no living enemy '" + targetId + "'");
    }

    std::vector<EncounterStateChange> changes;

    // Escalation: spiritual -> physical.
    bool surprise = false;
    if (st_.lastAttackTrack == AttackTrack::Spiritual) {
        surprise = true;
        shiftResonance(static_cast<double>(ctx_.balance.escalationResonanceShift), "escalation", changes);
        pushMsg("YOU TURN FROM WORDS TO STEEL.", MessageKind::Combat);
    }

    const FateRoll fate = drawFate(changes);
    const KeywordEffect kw = keywordEffectFor(fate, ActionContext::CombatPhysical, ctx_.balance.suitMatchMultiplier);

    EnemySlot& slot = st_.enemies[static_cast<size_t>(idx)];

    const std::optional<FateKeyword> keyword =
        fate.draw ? fate.draw->card.keyword : std::optional<FateKeyword>();
    const KeywordAffinity aff = keywordAffinity(slot.enemy.weaknesses, slot.enemy.strengths, keyword);
    if (aff != KeywordAffinity::None) {
        EncounterStateChange c;
        c.kind = (aff == KeywordAffinity::Weakness) ? StateChangeKind::WeaknessTriggered
                                                    : StateChangeKind::ResistanceTriggered;
        c.entityId = slot.enemy.id;
        c.detail = fateKeywordName(*keyword);
        changes.push_back(c);
    }

    double mult = affinityMultiplier(aff, ctx_.balance.weaknessMultiplier, ctx_.balance.resistanceMultiplier);
    if (surprise) mult *= ctx_.balance.surpriseMultiplier;

    const int bonuses = st_.turnAttackBonus + kw.bonusDamage + curseAdjustment(ctx_.hero.curses) - st_.heroAttackPenalty;
    st_.heroAttackPenalty = 0;

    const int defense = (kw.special == KeywordSpecial::IgnoreArmor)
        ? 0
        : std::max(0, slot.enemy.defense + slot.enemy.abilityTotal(EnemyAbilityKind::Armor));

    const int damage = strikeDamage(ctx_.hero.strength, fate.value, bonuses, mult, defense);
    slot.enemy.hp = std::max(0, slot.enemy.hp - damage);

    EncounterStateChange hc;
    hc.kind = StateChangeKind::EnemyHpChanged;
    hc.entityId = slot.enemy.id;
    hc.delta = -damage;
    hc.value = slot.enemy.hp;
    changes.push_back(hc);
    pushMsg("YOU STRIKE THE " + displayName(slot.enemy) + " FOR " + std::to_string(damage) + ".", MessageKind::Combat);

    if (slot.pleaBacklash > 0) {
        const int loss = std::min(st_.heroHp, slot.pleaBacklash);
        st_.heroHp -= loss;
        slot.pleaBacklash = 0;

        EncounterStateChange b;
        b.kind = StateChangeKind::HeroHpChanged;
        b.delta = -loss;
        b.value = st_.heroHp;
        b.detail = "plea_backlash";
        changes.push_back(b);
        pushMsg("STRIKING THE PLEADING FOE HURTS YOU.", MessageKind::Warning);
    }

    if (kw.special == KeywordSpecial::Ambush && st_.heroHp > 0) {
        const int heal = std::min(std::max(1, damage / 2), ctx_.hero.maxHp - st_.heroHp);
        if (heal > 0) {
            st_.heroHp += heal;
            EncounterStateChange h;
            h.kind = StateChangeKind::HeroHpChanged;
            h.delta = heal;
            h.value = st_.heroHp;
            h.detail = "ambush";
            changes.push_back(h);
        }
    }

    if (kw.special == KeywordSpecial::EchoStrike && !st_.cardDiscard.empty() &&
        static_cast<int>(st_.hand.size()) < ctx_.balance.maxHandSize) {
        st_.hand.push_back(st_.cardDiscard.back());
        st_.cardDiscard.pop_back();
        EncounterStateChange e;
        e.kind = StateChangeKind::CardDrawn;
        e.detail = st_.hand.back().id;
        changes.push_back(e);
    }

    settleOutcome(slot, changes);

    st_.lastAttackTrack = AttackTrack::Physical;
    noteMomentum(DispositionActionType::Strike);
    st_.finishActionUsed = true;

    checkTermination(changes);
    return ActionResult::ok(std::move(changes));
}

// ------------------------------------------------------------
// Spiritual
// ------------------------------------------------------------

ActionResult EncounterEngine::performSpiritAttack(const std::string& targetId) {
    const int idx = findEnemyIndex(targetId);
    if (idx < 0 || !st_.enemies[static_cast<size_t>(idx)].isAlive()) {
        return ActionResult::fail(ErrorCode::InvalidTarget, "no living enemy '" + targetId + "'");
    }
    if (!st_.enemies[static_cast<size_t>(idx)].hasSpiritTrack()) {
        return ActionResult::fail(ErrorCode::NoSpiritTrack, "'" + targetId + "' has no will to break");
    }

    std::vector<EncounterStateChange> changes;

    // De-escalation: physical -> spiritual. The enemy's will hardens.
    bool surprise = false;
    if (st_.lastAttackTrack == AttackTrack::Physical) {
        surprise = true;
        shiftResonance(static_cast<double>(ctx_.balance.deEscalationResonanceShift), "de_escalation", changes);

        EnemySlot& s = st_.enemies[static_cast<size_t>(idx)];
        s.rageShield = std::max(0, s.enemy.power) * st_.round;

        EncounterStateChange c;
        c.kind = StateChangeKind::RageShieldApplied;
        c.entityId = s.enemy.id;
        c.value = s.rageShield;
        changes.push_back(c);
        pushMsg("THE " + displayName(s.enemy) + " RAGES AGAINST YOUR WORDS.", MessageKind::Enemy);
    }

    const FateRoll fate = drawFate(changes);
    const KeywordEffect kw = keywordEffectFor(fate, ActionContext::CombatSpiritual, ctx_.balance.suitMatchMultiplier);

    int keywordBonus = kw.bonusDamage;
    if (kw.special == KeywordSpecial::WillPierce) keywordBonus += 1;
    if (kw.special == KeywordSpecial::ResonancePush) {
        shiftResonance(static_cast<double>(RESONANCE_PUSH_AMOUNT), "resonance_push", changes);
    }

    EnemySlot& slot = st_.enemies[static_cast<size_t>(idx)];

    const std::optional<FateKeyword> keyword =
        fate.draw ? fate.draw->card.keyword : std::optional<FateKeyword>();
    const KeywordAffinity aff = keywordAffinity(slot.enemy.weaknesses, slot.enemy.strengths, keyword);
    if (aff != KeywordAffinity::None) {
        EncounterStateChange c;
        c.kind = (aff == KeywordAffinity::Weakness) ? StateChangeKind::WeaknessTriggered
                                                    : StateChangeKind::ResistanceTriggered;
        c.entityId = slot.enemy.id;
        c.detail = fateKeywordName(*keyword);
        changes.push_back(c);
    }

    double mult = affinityMultiplier(aff, ctx_.balance.weaknessMultiplier, ctx_.balance.resistanceMultiplier);
    if (surprise) mult *= ctx_.balance.surpriseMultiplier;

    const int bonuses = st_.turnInfluenceBonus + keywordBonus - slot.provokePenalty;
    const int defense = std::max(0, slot.enemy.spiritDefense) + slot.rageShield;
    slot.provokePenalty = 0;
    slot.rageShield = 0;

    const int damage = strikeDamage(std::max(ctx_.hero.wisdom, 1), fate.value, bonuses, mult, defense);
    const int wp = slot.enemy.wp.value_or(0);
    slot.enemy.wp = std::max(0, wp - damage);

    EncounterStateChange wc;
    wc.kind = StateChangeKind::EnemyWpChanged;
    wc.entityId = slot.enemy.id;
    wc.delta = -damage;
    wc.value = *slot.enemy.wp;
    changes.push_back(wc);
    pushMsg("YOUR WORDS SHAKE THE " + displayName(slot.enemy) + " (" + std::to_string(damage) + ").", MessageKind::Combat);

    if (kw.special == KeywordSpecial::EchoPrayer && !st_.cardDiscard.empty() &&
        static_cast<int>(st_.hand.size()) < ctx_.balance.maxHandSize) {
        st_.hand.push_back(st_.cardDiscard.back());
        st_.cardDiscard.pop_back();
        EncounterStateChange e;
        e.kind = StateChangeKind::CardDrawn;
        e.detail = st_.hand.back().id;
        changes.push_back(e);
    }

    settleOutcome(slot, changes);

    st_.lastAttackTrack = AttackTrack::Spiritual;
    noteMomentum(DispositionActionType::Influence);
    st_.finishActionUsed = true;

    checkTermination(changes);
    return ActionResult::ok(std::move(changes));
}

// ------------------------------------------------------------
// Cards
// ------------------------------------------------------------

ActionResult EncounterEngine::playCard(const std::string& cardId, const std::string& targetId) {
    auto it = std::find_if(st_.hand.begin(), st_.hand.end(),
                           [&](const HeroCard& c) { return c.id == cardId; });
    if (it == st_.hand.end()) {
        return ActionResult::fail(ErrorCode::UnknownCard, "card '" + cardId + "' is not in hand");
    }
    if (!targetId.empty()) {
        const EnemySlot* t = findEnemy(targetId);
        if (!t || !t->isAlive()) {
            return ActionResult::fail(ErrorCode::InvalidTarget, "no living enemy '" + targetId + "'");
        }
    }

    const int cost = adjustedFaithCost(*it, resonance_.activeZone());
    if (cost > st_.heroFaith) {
        return ActionResult::fail(ErrorCode::InsufficientFaith,
                                  "needs " + std::to_string(cost) + " faith, have " + std::to_string(st_.heroFaith));
    }

    const HeroCard card = *it;
    st_.hand.erase(it);
    st_.cardDiscard.push_back(card);

    std::vector<EncounterStateChange> changes;
    if (cost > 0) {
        st_.heroFaith -= cost;
        EncounterStateChange f;
        f.kind = StateChangeKind::FaithChanged;
        f.delta = -cost;
        f.value = st_.heroFaith;
        changes.push_back(f);
    }

    EncounterStateChange played;
    played.kind = StateChangeKind::CardPlayed;
    played.detail = card.id;
    played.entityId = targetId;
    changes.push_back(played);
    pushMsg("YOU PLAY " + toUpper(card.name.empty() ? card.id : card.name) + ".");

    for (const CardAbility& a : card.abilities) {
        switch (a.kind) {
            case CardAbilityKind::Damage:
            case CardAbilityKind::TempStrength:
                st_.turnAttackBonus += a.value;
                break;
            case CardAbilityKind::TempDefense:
                st_.turnDefenseBonus += a.value;
                break;
            case CardAbilityKind::TempWisdom:
                st_.turnInfluenceBonus += a.value;
                break;
            case CardAbilityKind::Heal: {
                const int healed = std::max(0, std::min(a.value, ctx_.hero.maxHp - st_.heroHp));
                st_.heroHp += healed;
                EncounterStateChange h;
                h.kind = StateChangeKind::HeroHpChanged;
                h.delta = healed;
                h.value = st_.heroHp;
                changes.push_back(h);
                break;
            }
            case CardAbilityKind::DrawCards:
                for (int i = 0; i < a.value; ++i) {
                    if (static_cast<int>(st_.hand.size()) >= ctx_.balance.maxHandSize) break;
                    if (!drawHeroCard(changes)) break;
                }
                break;
            case CardAbilityKind::GainFaith: {
                st_.heroFaith += a.value;
                EncounterStateChange f;
                f.kind = StateChangeKind::FaithChanged;
                f.delta = a.value;
                f.value = st_.heroFaith;
                changes.push_back(f);
                break;
            }
        }
    }

    // Dual-use stats on the card itself.
    if (card.power > 0) st_.turnAttackBonus += card.power;
    if (card.defense > 0) st_.turnDefenseBonus += card.defense;
    if (card.wisdom > 0) st_.turnInfluenceBonus += card.wisdom;

    noteMomentum(DispositionActionType::Sacrifice);
    return ActionResult::ok(std::move(changes));
}

ActionResult EncounterEngine::performMulligan(const std::vector<std::string>& cardIds) {
    if (st_.mulliganDone) {
        return ActionResult::fail(ErrorCode::MulliganAlreadyDone, "mulligan already used");
    }
    for (const auto& id : cardIds) {
        const bool inHand = std::any_of(st_.hand.begin(), st_.hand.end(),
                                        [&](const HeroCard& c) { return c.id == id; });
        if (!inHand) {
            return ActionResult::fail(ErrorCode::UnknownCard, "card '" + id + "' is not in hand");
        }
    }

    st_.mulliganDone = true;

    std::vector<EncounterStateChange> changes;
    size_t returned = 0;
    for (size_t i = 0; i < st_.hand.size();) {
        if (std::find(cardIds.begin(), cardIds.end(), st_.hand[i].id) != cardIds.end()) {
            st_.cardDiscard.push_back(st_.hand[i]);
            st_.hand.erase(st_.hand.begin() + static_cast<std::ptrdiff_t>(i));
            ++returned;
        } else {
            ++i;
        }
    }
    for (size_t i = 0; i < returned; ++i) {
        if (!drawHeroCard(changes)) break;
    }

    pushMsg("YOU REDRAW " + std::to_string(returned) + " CARD" + (returned == 1 ? "." : "S."));
    return ActionResult::ok(std::move(changes));
}

ActionResult EncounterEngine::performFlee() {
    std::vector<EncounterStateChange> changes;
    st_.fled = true;
    st_.finishActionUsed = true;
    checkTermination(changes);
    return ActionResult::ok(std::move(changes));
}
