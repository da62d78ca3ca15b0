#include "encounter.hpp"

#include "common.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace {

constexpr size_t MESSAGE_LOG_CAP = 200;

FateDeckManager makeDeck(const EncounterContext& ctx, RNG& rng) {
    if (ctx.fateDeckState) return FateDeckManager(*ctx.fateDeckState, rng);
    return FateDeckManager(ctx.fateCards, rng);
}

int startingHeroHp(const EncounterHero& h) {
    return clampi(h.hp, 0, std::max(1, h.maxHp));
}

EnemySlot makeSlot(const EncounterEnemy& e, const std::string& sourceId, uint64_t seed) {
    EnemySlot s;
    s.enemy = e;
    s.sourceId = sourceId;
    s.mode = EnemyModeState(seed);
    return s;
}

} // namespace

int EnemySlot::disposition() const {
    double v = 0.0;
    if (enemy.maxWp && *enemy.maxWp > 0 && enemy.wp) {
        v += 100.0 * static_cast<double>(*enemy.maxWp - *enemy.wp) / static_cast<double>(*enemy.maxWp);
    }
    if (enemy.maxHp > 0) {
        v -= 100.0 * static_cast<double>(enemy.maxHp - enemy.hp) / static_cast<double>(enemy.maxHp);
    }
    return clampi(static_cast<int>(std::lround(v)), -100, 100);
}

EntityOutcome settleEntityOutcome(EntityOutcome current, int hp, std::optional<int> wp) {
    if (current != EntityOutcome::Alive) return current;
    if (hp <= 0) return EntityOutcome::Killed;
    if (wp && *wp <= 0) return EntityOutcome::Pacified;
    return EntityOutcome::Alive;
}

EncounterEngine::EncounterEngine(EncounterContext ctx)
    : ctx_(std::move(ctx)),
      rng_(ctx_.seed),
      resonance_(ctx_.resonance),
      deck_(makeDeck(ctx_, rng_)) {
    st_.heroHp = startingHeroHp(ctx_.hero);
    st_.heroFaith = std::max(0, ctx_.hero.faith);

    for (const auto& e : ctx_.enemies) {
        st_.enemies.push_back(makeSlot(e, std::string(), ctx_.seed));
    }

    const int handSize = std::min(ctx_.balance.startingHandSize, ctx_.balance.maxHandSize);
    for (int i = 0; i < handSize && i < static_cast<int>(ctx_.heroCards.size()); ++i) {
        st_.hand.push_back(ctx_.heroCards[static_cast<size_t>(i)]);
    }

    pushMsg("THE ENCOUNTER BEGINS.", MessageKind::System);

    std::vector<EncounterStateChange> ignored;
    generateIntents(ignored);
}

const EnemySlot* EncounterEngine::findEnemy(const std::string& id) const {
    const int idx = findEnemyIndex(id);
    if (idx < 0) return nullptr;
    return &st_.enemies[static_cast<size_t>(idx)];
}

int EncounterEngine::findEnemyIndex(const std::string& id) const {
    for (size_t i = 0; i < st_.enemies.size(); ++i) {
        if (st_.enemies[i].enemy.id == id) return static_cast<int>(i);
    }
    return -1;
}

void EncounterEngine::pushMsg(const std::string& s, MessageKind kind) {
    if (!msgs_.empty()) {
        Message& last = msgs_.back();
        if (last.text == s && last.kind == kind) {
            if (last.repeat < 9999) ++last.repeat;
            return;
        }
    }

    if (msgs_.size() >= MESSAGE_LOG_CAP) {
        msgs_.pop_front();
    }
    msgs_.push_back({s, kind, 1});
}

// ------------------------------------------------------------
// Dispatch
// ------------------------------------------------------------

ActionResult EncounterEngine::performAction(const PlayerAction& action) {
    if (isFinished()) {
        return ActionResult::fail(ErrorCode::EncounterFinished, "encounter is over");
    }

    // Mulligan is allowed in any phase (once).
    if (action.kind == PlayerActionKind::Mulligan) {
        return performMulligan(action.cardIds);
    }

    if (st_.phase != EncounterPhase::PlayerAction) {
        return ActionResult::fail(ErrorCode::InvalidPhase,
                                  std::string("not allowed during ") + encounterPhaseName(st_.phase));
    }

    switch (action.kind) {
        case PlayerActionKind::UseCard:
            return playCard(action.cardId, action.targetId);

        case PlayerActionKind::Attack:
        case PlayerActionKind::SpiritAttack:
        case PlayerActionKind::Wait:
        case PlayerActionKind::Flee:
            break;

        case PlayerActionKind::Mulligan:
            return performMulligan(action.cardIds);
    }

    if (st_.finishActionUsed) {
        return ActionResult::fail(ErrorCode::ActionAlreadyUsed, "already acted this round");
    }

    switch (action.kind) {
        case PlayerActionKind::Attack:
            return performPhysicalAttack(action.targetId);
        case PlayerActionKind::SpiritAttack:
            return performSpiritAttack(action.targetId);
        case PlayerActionKind::Flee:
            return performFlee();
        case PlayerActionKind::Wait:
        default:
            break;
    }

    // Wait: no draw, no RNG use.
    st_.finishActionUsed = true;
    pushMsg("YOU WAIT.");
    return ActionResult::ok();
}

ActionResult EncounterEngine::advancePhase() {
    if (isFinished()) {
        return ActionResult::fail(ErrorCode::EncounterFinished, "encounter is over");
    }

    std::vector<EncounterStateChange> changes;

    switch (st_.phase) {
        case EncounterPhase::Intent:
            st_.phase = EncounterPhase::PlayerAction;
            break;

        case EncounterPhase::PlayerAction:
            st_.phase = EncounterPhase::EnemyResolution;
            break;

        case EncounterPhase::EnemyResolution:
            resolvePendingIntents(changes);
            if (checkTermination(changes)) return ActionResult::ok(std::move(changes));
            st_.turnAttackBonus = 0;
            st_.turnDefenseBonus = 0;
            st_.turnInfluenceBonus = 0;
            st_.finishActionUsed = false;
            st_.phase = EncounterPhase::RoundEnd;
            break;

        case EncounterPhase::RoundEnd:
            applyRegeneration(changes);
            if (static_cast<int>(st_.hand.size()) < ctx_.balance.maxHandSize) {
                drawHeroCard(changes);
            }
            st_.round += 1;
            st_.phase = EncounterPhase::Intent;
            generateIntents(changes);
            break;

        case EncounterPhase::Finished:
            break;
    }

    EncounterStateChange c;
    c.kind = StateChangeKind::PhaseChanged;
    c.value = static_cast<int>(st_.phase);
    c.detail = encounterPhaseName(st_.phase);
    changes.push_back(c);
    return ActionResult::ok(std::move(changes));
}

// ------------------------------------------------------------
// Shared helpers
// ------------------------------------------------------------

std::vector<HeroCard> EncounterEngine::cardPool() const {
    std::vector<HeroCard> out;
    for (const auto& c : ctx_.heroCards) {
        auto same = [&](const HeroCard& h) { return h.id == c.id; };
        if (std::any_of(st_.hand.begin(), st_.hand.end(), same)) continue;
        if (std::any_of(st_.cardDiscard.begin(), st_.cardDiscard.end(), same)) continue;
        out.push_back(c);
    }
    return out;
}

bool EncounterEngine::drawHeroCard(std::vector<EncounterStateChange>& changes) {
    const std::vector<HeroCard> pool = cardPool();
    if (pool.empty()) return false;

    st_.hand.push_back(pool.front());

    EncounterStateChange c;
    c.kind = StateChangeKind::CardDrawn;
    c.detail = pool.front().id;
    changes.push_back(c);
    return true;
}

void EncounterEngine::shiftResonance(double amount, const std::string& source,
                                     std::vector<EncounterStateChange>& changes) {
    const ResonanceShift rec = resonance_.shift(amount, source);

    EncounterStateChange c;
    c.kind = StateChangeKind::ResonanceShifted;
    c.delta = static_cast<int>(std::lround(rec.amount));
    c.value = static_cast<int>(std::lround(rec.resultingValue));
    c.detail = source;
    changes.push_back(c);
}

FateFallbackRange EncounterEngine::fallbackRange() const {
    FateFallbackRange r;
    r.min = ctx_.balance.fateFallbackMin;
    r.max = ctx_.balance.fateFallbackMax;
    return r;
}

FateRoll EncounterEngine::drawFate(std::vector<EncounterStateChange>& changes) {
    FateRoll roll = rollFate(&deck_, resonance_.value(), rng_, fallbackRange());
    st_.lastFateDraw = roll.draw;

    EncounterStateChange c;
    if (!roll.draw) {
        c.kind = StateChangeKind::FateFallback;
        c.value = roll.value;
        changes.push_back(c);
        return roll;
    }

    c.kind = StateChangeKind::FateDraw;
    c.detail = roll.draw->card.id;
    c.value = roll.draw->effectiveValue;
    changes.push_back(c);
    pushMsg("FATE: " + toUpper(roll.draw->card.name.empty() ? roll.draw->card.id : roll.draw->card.name) +
            " (" + std::to_string(roll.draw->effectiveValue) + ").", MessageKind::Fate);

    for (const FateDrawEffect& fx : roll.draw->drawEffects) {
        switch (fx.kind) {
            case FateDrawEffectKind::ShiftResonance:
                shiftResonance(static_cast<double>(fx.amount), "fate:" + roll.draw->card.id, changes);
                break;
            case FateDrawEffectKind::ShiftTension: {
                st_.tension += fx.amount;
                EncounterStateChange t;
                t.kind = StateChangeKind::TensionShifted;
                t.delta = fx.amount;
                t.value = st_.tension;
                t.detail = roll.draw->card.id;
                changes.push_back(t);
                break;
            }
        }
    }
    return roll;
}

void EncounterEngine::settleOutcome(EnemySlot& slot, std::vector<EncounterStateChange>& changes) {
    const EntityOutcome before = slot.outcome;
    slot.outcome = settleEntityOutcome(slot.outcome, slot.enemy.hp, slot.enemy.wp);
    if (slot.outcome == before) return;

    slot.intent.reset();

    EncounterStateChange c;
    c.entityId = slot.enemy.id;
    const std::string who = toUpper(slot.enemy.name.empty() ? slot.enemy.id : slot.enemy.name);
    if (slot.outcome == EntityOutcome::Killed) {
        c.kind = StateChangeKind::EnemyKilled;
        pushMsg("YOU KILL THE " + who + "!", MessageKind::Combat);
    } else {
        c.kind = StateChangeKind::EnemyPacified;
        pushMsg("THE " + who + " YIELDS.", MessageKind::Combat);
    }
    changes.push_back(c);
}

EncounterOutcome EncounterEngine::currentOutcome() const {
    if (st_.fled) return EncounterOutcome::Escaped;
    if (st_.heroHp <= 0) return EncounterOutcome::Defeat;
    const bool anyAlive = std::any_of(st_.enemies.begin(), st_.enemies.end(),
                                      [](const EnemySlot& s) { return s.isAlive(); });
    if (!anyAlive) return EncounterOutcome::Victory;
    return EncounterOutcome::Unresolved;
}

bool EncounterEngine::checkTermination(std::vector<EncounterStateChange>& changes) {
    if (isFinished()) return true;

    const EncounterOutcome o = currentOutcome();
    if (o == EncounterOutcome::Unresolved) return false;

    st_.phase = EncounterPhase::Finished;

    EncounterStateChange c;
    c.kind = StateChangeKind::EncounterEnded;
    c.value = static_cast<int>(o);
    c.detail = encounterOutcomeName(o);
    changes.push_back(c);

    switch (o) {
        case EncounterOutcome::Victory: pushMsg("VICTORY.", MessageKind::System); break;
        case EncounterOutcome::Defeat:  pushMsg("YOU FALL.", MessageKind::System); break;
        case EncounterOutcome::Escaped: pushMsg("YOU ESCAPE.", MessageKind::System); break;
        default: break;
    }
    return true;
}

void EncounterEngine::noteMomentum(DispositionActionType t) {
    if (st_.momentumType == t) {
        st_.momentumCount += 1;
    } else {
        st_.momentumType = t;
        st_.momentumCount = 1;
    }
}

// ------------------------------------------------------------
// Results / checkpoints
// ------------------------------------------------------------

EncounterResult EncounterEngine::finishEncounter() {
    std::vector<EncounterStateChange> ignored;
    if (!checkTermination(ignored) && !isFinished()) {
        st_.phase = EncounterPhase::Finished;
        pushMsg("THE ENCOUNTER IS BROKEN OFF.", MessageKind::System);
    }

    EncounterResult r;
    r.outcome = currentOutcome();
    for (const auto& s : st_.enemies) {
        r.perEntity[s.enemy.id] = s.outcome;
    }
    r.aggregate = classifyOutcomes(r.perEntity);

    const bool anyKilled = std::any_of(st_.enemies.begin(), st_.enemies.end(),
                                       [](const EnemySlot& s) { return s.outcome == EntityOutcome::Killed; });
    const bool anyPacified = std::any_of(st_.enemies.begin(), st_.enemies.end(),
                                         [](const EnemySlot& s) { return s.outcome == EntityOutcome::Pacified; });
    if (anyKilled) r.worldFlags["violent"] = true;
    if (anyPacified && !anyKilled) r.worldFlags["nonviolent"] = true;

    r.hpDelta = st_.heroHp - startingHeroHp(ctx_.hero);
    r.resonanceDelta = resonance_.value() - ResonanceEngine(ctx_.resonance).value();
    r.tensionDelta = st_.tension;
    r.fateDeck = deck_.getState();
    r.rng = rng_.snapshot();
    return r;
}

EncounterSnapshot EncounterEngine::saveSnapshot() const {
    EncounterSnapshot snap;
    snap.state = st_;
    snap.deck = deck_.getState();
    snap.rng = rng_.snapshot();
    snap.resonance = resonance_.value();
    return snap;
}

void EncounterEngine::restoreSnapshot(const EncounterSnapshot& snap) {
    st_ = snap.state;
    deck_.restoreState(snap.deck);
    rng_.restore(snap.rng);
    resonance_.setValue(snap.resonance);
    pushMsg("CHECKPOINT RESTORED.", MessageKind::System);
}
