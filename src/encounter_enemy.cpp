#include "encounter.hpp"

#include "common.hpp"
#include "keywords.hpp"

#include <algorithm>
#include <utility>

namespace {

constexpr double LOW_HEALTH_FRACTION = 0.3;
constexpr int LOW_HEALTH_BLOCK = 3;
constexpr int LOW_HEALTH_HEAL_CAP = 5;
constexpr int RITUAL_ROUND_PERIOD = 3;
constexpr int SUMMON_FIRST_ROUND = 2;

std::string displayName(const EncounterEnemy& e) {
    return toUpper(e.name.empty() ? e.id : e.name);
}

EnemyIntent makeIntent(IntentType t, int value, const std::string& ref = std::string()) {
    EnemyIntent i;
    i.type = t;
    i.value = value;
    i.ref = ref;
    return i;
}

} // namespace

DispositionSimulation EncounterEngine::momentumView(int disposition) const {
    DispositionSimulation sim = DispositionSimulation::makeStandard(disposition, std::max(1, st_.heroHp));
    sim.heroHp = st_.heroHp;
    sim.heroMaxHp = ctx_.hero.maxHp;
    sim.streakType = st_.momentumType;
    sim.streakCount = st_.momentumCount;
    sim.lastActionType = st_.momentumType;
    sim.zone = resonance_.activeZone();
    return sim;
}

EnemyIntent EncounterEngine::intentFromAction(const EnemyAction& a) const {
    switch (a.kind) {
        case EnemyActionKind::Attack:  return makeIntent(IntentType::Attack, a.value);
        case EnemyActionKind::Rage:    return makeIntent(IntentType::Rage, a.value);
        case EnemyActionKind::Defend:  return makeIntent(IntentType::Block, a.value);
        case EnemyActionKind::Provoke: return makeIntent(IntentType::Provoke, a.value);
        case EnemyActionKind::Plea:    return makeIntent(IntentType::Plea, ctx_.balance.pleaBacklash);
        case EnemyActionKind::Adapt:   return makeIntent(IntentType::Debuff, a.value);
        case EnemyActionKind::Summon:  return makeIntent(IntentType::Summon, 0, a.summonId);
    }
    return makeIntent(IntentType::Attack, a.value);
}

EnemyIntent EncounterEngine::normalIntent(EnemySlot& slot, int disposition, int baseDamage) {
    const EncounterEnemy& e = slot.enemy;

    if (!slot.summonUsed && st_.round >= SUMMON_FIRST_ROUND) {
        if (const EnemyAbility* summon = e.findAbility(EnemyAbilityKind::Summon)) {
            if (rng_.range(0, 2) == 0) {
                slot.summonUsed = true;
                return makeIntent(IntentType::Summon, 0, summon->ref);
            }
        }
    }

    // Momentum reading never draws.
    const EnemyAction counter = selectEnemyAction(EnemyMode::Normal, momentumView(disposition), rng_,
                                                  baseDamage, ctx_.balance.baseProvoke);
    if (counter.kind != EnemyActionKind::Attack) {
        return intentFromAction(counter);
    }

    const double healthPct = static_cast<double>(e.hp) / static_cast<double>(std::max(1, e.maxHp));
    if (healthPct < LOW_HEALTH_FRACTION && st_.round > 2) {
        const int roll = rng_.range(0, 2);
        if (roll == 0) return makeIntent(IntentType::Block, LOW_HEALTH_BLOCK);
        if (roll == 1 && e.hp < e.maxHp) return makeIntent(IntentType::Heal, std::min(LOW_HEALTH_HEAL_CAP, e.maxHp - e.hp));
        if (roll == 2) return makeIntent(IntentType::Buff, 1);
    }

    if (st_.round % RITUAL_ROUND_PERIOD == 0) {
        if (rng_.range(0, 2) == 0) {
            return makeIntent(IntentType::Ritual, ctx_.balance.ritualResonanceShift);
        }
    }

    return makeIntent(IntentType::Attack, baseDamage);
}

void EncounterEngine::generateIntents(std::vector<EncounterStateChange>& changes) {
    for (EnemySlot& slot : st_.enemies) {
        if (!slot.isAlive()) {
            slot.intent.reset();
            continue;
        }

        const int disposition = slot.disposition();
        const EnemyMode before = slot.mode.currentMode;
        const EnemyMode mode = evaluateMode(slot.mode, disposition);
        if (mode != before) {
            EncounterStateChange m;
            m.kind = StateChangeKind::ModeChanged;
            m.entityId = slot.enemy.id;
            m.value = static_cast<int>(mode);
            m.detail = enemyModeName(mode);
            changes.push_back(m);
            pushMsg("THE " + displayName(slot.enemy) + " TURNS " + toUpper(enemyModeName(mode)) + ".", MessageKind::Enemy);
        }

        const int baseDamage = std::max(0, slot.enemy.power + slot.enemy.abilityTotal(EnemyAbilityKind::BonusDamage));

        EnemyIntent intent;
        if (mode == EnemyMode::Normal) {
            intent = normalIntent(slot, disposition, baseDamage);
        } else {
            intent = intentFromAction(selectEnemyAction(mode, momentumView(disposition), rng_,
                                                        baseDamage, ctx_.balance.baseProvoke));
        }
        intent.mode = mode;
        slot.intent = intent;

        EncounterStateChange c;
        c.kind = StateChangeKind::IntentDeclared;
        c.entityId = slot.enemy.id;
        c.value = intent.value;
        c.detail = intentTypeName(intent.type);
        changes.push_back(c);
    }
}

ActionResult EncounterEngine::resolveEnemyAction(const std::string& enemyId) {
    if (isFinished()) {
        return ActionResult::fail(ErrorCode::EncounterFinished, "encounter is over");
    }
    if (st_.phase != EncounterPhase::EnemyResolution) {
        return ActionResult::fail(ErrorCode::InvalidPhase,
                                  std::string("not allowed during ") + encounterPhaseName(st_.phase));
    }
    const int idx = findEnemyIndex(enemyId);
    if (idx < 0) {
        return ActionResult::fail(ErrorCode::InvalidTarget, "no enemy '" + enemyId + "'");
    }
    const EnemySlot& slot = st_.enemies[static_cast<size_t>(idx)];
    if (!slot.isAlive() || !slot.intent) {
        return ActionResult::fail(ErrorCode::NoPendingIntent, "'" + enemyId + "' has nothing to resolve");
    }

    std::vector<EncounterStateChange> changes;
    resolveIntent(static_cast<size_t>(idx), changes);
    checkTermination(changes);
    return ActionResult::ok(std::move(changes));
}

void EncounterEngine::resolvePendingIntents(std::vector<EncounterStateChange>& changes) {
    // Summons append slots mid-loop; they carry no intent until next round.
    for (size_t i = 0; i < st_.enemies.size(); ++i) {
        if (st_.heroHp <= 0) break;
        if (st_.enemies[i].isAlive() && st_.enemies[i].intent) {
            resolveIntent(i, changes);
        }
    }
}

void EncounterEngine::resolveIntent(size_t idx, std::vector<EncounterStateChange>& changes) {
    const EnemyIntent intent = *st_.enemies[idx].intent;
    st_.enemies[idx].intent.reset();

    const std::string who = displayName(st_.enemies[idx].enemy);

    EncounterStateChange r;
    r.kind = StateChangeKind::IntentResolved;
    r.entityId = st_.enemies[idx].enemy.id;
    r.value = intent.value;
    r.detail = intentTypeName(intent.type);
    changes.push_back(r);

    switch (intent.type) {
        case IntentType::Attack:
        case IntentType::Rage: {
            const FateRoll fate = drawFate(changes);
            int damage = 0;
            if (fate.draw && fate.draw->isCritical()) {
                pushMsg("FATE TURNS THE BLOW ASIDE.", MessageKind::Fate);
            } else {
                int keywordDefense = 0;
                if (fate.draw && fate.draw->card.keyword) {
                    const FateCard& card = fate.draw->card;
                    keywordDefense = resolveKeywordWithAlignment(*card.keyword, ActionContext::Defense,
                                                                 isSuitMatch(card.suit, ActionContext::Defense),
                                                                 isSuitMismatch(card.suit, ActionContext::Defense),
                                                                 ctx_.balance.suitMatchMultiplier).bonusValue;
                }
                damage = std::max(0, intent.value - fate.value - ctx_.hero.armor - st_.turnDefenseBonus - keywordDefense);
            }

            damage = std::min(damage, st_.heroHp);
            st_.heroHp -= damage;

            EncounterStateChange h;
            h.kind = StateChangeKind::HeroHpChanged;
            h.entityId = st_.enemies[idx].enemy.id;
            h.delta = -damage;
            h.value = st_.heroHp;
            changes.push_back(h);
            pushMsg("THE " + who + (intent.type == IntentType::Rage ? " RAGES AT YOU FOR " : " HITS YOU FOR ") +
                    std::to_string(damage) + ".", MessageKind::Enemy);

            if (damage > 0) {
                const EnemyAbility* curse = st_.enemies[idx].enemy.findAbility(EnemyAbilityKind::ApplyCurse);
                if (curse &&
                    std::find(st_.appliedCurses.begin(), st_.appliedCurses.end(), curse->ref) == st_.appliedCurses.end()) {
                    auto it = ctx_.curseCards.find(curse->ref);
                    if (it != ctx_.curseCards.end()) {
                        deck_.addCard(it->second);
                        st_.appliedCurses.push_back(curse->ref);

                        EncounterStateChange c;
                        c.kind = StateChangeKind::CurseAdded;
                        c.entityId = st_.enemies[idx].enemy.id;
                        c.detail = curse->ref;
                        changes.push_back(c);
                        pushMsg("A CURSE SLIPS INTO YOUR FATE.", MessageKind::Warning);
                    } else {
                        pushMsg("UNKNOWN CURSE '" + curse->ref + "'.", MessageKind::Warning);
                    }
                }
            }
            break;
        }

        case IntentType::Ritual:
            shiftResonance(static_cast<double>(intent.value), "ritual:" + st_.enemies[idx].enemy.id, changes);
            pushMsg("THE " + who + " PERFORMS A RITUAL.", MessageKind::Enemy);
            break;

        case IntentType::Block:
            st_.enemies[idx].enemy.defense += intent.value;
            pushMsg("THE " + who + " BRACES.", MessageKind::Enemy);
            break;

        case IntentType::Buff:
            st_.enemies[idx].enemy.power += intent.value;
            pushMsg("THE " + who + " GROWS STRONGER.", MessageKind::Enemy);
            break;

        case IntentType::Heal: {
            EncounterEnemy& e = st_.enemies[idx].enemy;
            const int healed = std::max(0, std::min(intent.value, e.maxHp - e.hp));
            e.hp += healed;

            EncounterStateChange h;
            h.kind = StateChangeKind::EnemyHpChanged;
            h.entityId = e.id;
            h.delta = healed;
            h.value = e.hp;
            changes.push_back(h);
            pushMsg("THE " + who + " RECOVERS.", MessageKind::Enemy);
            break;
        }

        case IntentType::Summon:
            summonEnemy(intent.ref, changes);
            break;

        case IntentType::Provoke:
            st_.enemies[idx].provokePenalty = intent.value;
            pushMsg("THE " + who + " TAUNTS YOU.", MessageKind::Enemy);
            break;

        case IntentType::Plea:
            st_.enemies[idx].pleaBacklash = intent.value;
            pushMsg("THE " + who + " BEGS FOR MERCY.", MessageKind::Enemy);
            break;

        case IntentType::Debuff:
            st_.heroAttackPenalty = intent.value;
            pushMsg("THE " + who + " READS YOUR MOVES.", MessageKind::Enemy);
            break;
    }
}

void EncounterEngine::summonEnemy(const std::string& poolId, std::vector<EncounterStateChange>& changes) {
    auto it = ctx_.summonPool.find(poolId);
    if (it == ctx_.summonPool.end()) {
        pushMsg("NOTHING ANSWERS THE CALL.", MessageKind::Warning);
        return;
    }

    st_.summonCounter += 1;
    EnemySlot slot;
    slot.enemy = it->second;
    slot.enemy.id = poolId + "#" + std::to_string(st_.summonCounter);
    slot.sourceId = poolId;
    slot.mode = EnemyModeState(ctx_.seed);
    st_.enemies.push_back(slot);

    EncounterStateChange c;
    c.kind = StateChangeKind::EnemySummoned;
    c.entityId = slot.enemy.id;
    c.detail = poolId;
    changes.push_back(c);
    pushMsg("A " + displayName(slot.enemy) + " JOINS THE FIGHT.", MessageKind::Enemy);
}

void EncounterEngine::applyRegeneration(std::vector<EncounterStateChange>& changes) {
    for (EnemySlot& slot : st_.enemies) {
        if (!slot.isAlive()) continue;
        const int regen = slot.enemy.abilityTotal(EnemyAbilityKind::Regeneration);
        if (regen <= 0) continue;

        const int healed = std::max(0, std::min(regen, slot.enemy.maxHp - slot.enemy.hp));
        if (healed == 0) continue;
        slot.enemy.hp += healed;

        EncounterStateChange h;
        h.kind = StateChangeKind::EnemyHpChanged;
        h.entityId = slot.enemy.id;
        h.delta = healed;
        h.value = slot.enemy.hp;
        changes.push_back(h);
    }
}
