#include "combat_rules.hpp"
#include "content.hpp"
#include "disposition.hpp"
#include "encounter.hpp"
#include "enemy_ai.hpp"
#include "fate_deck.hpp"
#include "fingerprint.hpp"
#include "replay.hpp"
#include "replay_runner.hpp"
#include "resonance.hpp"
#include "rng.hpp"
#include "settings.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

FateCard plainCard(const std::string& id, int value) {
    FateCard c;
    c.id = id;
    c.name = id;
    c.baseValue = value;
    return c;
}

EncounterEnemy makeEnemy(const std::string& id, int hp, std::optional<int> wp, int power) {
    EncounterEnemy e;
    e.id = id;
    e.name = id;
    e.hp = hp;
    e.maxHp = hp;
    e.wp = wp;
    e.maxWp = wp;
    e.power = power;
    return e;
}

HeroCard makeCard(const std::string& id, int power, int cost) {
    HeroCard c;
    c.id = id;
    c.name = id;
    c.power = power;
    c.faithCost = cost;
    return c;
}

// One wolf (hp 30, wp 20, power 2), six neutral Fate cards worth 0 and five
// hero cards. With every Fate value equal, shuffle order never changes a number.
EncounterContext basicContext(uint64_t seed = 1) {
    EncounterContext ctx;
    ctx.seed = seed;
    ctx.enemies.push_back(makeEnemy("wolf", 30, 20, 2));
    for (int i = 0; i < 6; ++i) ctx.fateCards.push_back(plainCard("f" + std::to_string(i), 0));

    ctx.heroCards.push_back(makeCard("c1", 2, 1));
    HeroCard heal = makeCard("c2", 0, 0);
    heal.abilities.push_back(CardAbility{CardAbilityKind::Heal, 3});
    ctx.heroCards.push_back(heal);
    HeroCard wis = makeCard("c3", 0, 0);
    wis.wisdom = 2;
    ctx.heroCards.push_back(wis);
    ctx.heroCards.push_back(makeCard("c4", 0, 0));
    ctx.heroCards.push_back(makeCard("c5", 0, 0));
    return ctx;
}

bool hasChange(const ActionResult& r, StateChangeKind k, const std::string& detail = std::string()) {
    return std::any_of(r.changes.begin(), r.changes.end(), [&](const EncounterStateChange& c) {
        return c.kind == k && (detail.empty() || c.detail == detail);
    });
}

// intent -> playerAction -> enemyResolution -> roundEnd -> intent (next round)
void waitOutRound(EncounterEngine& e) {
    e.advancePhase();
    e.performAction(PlayerAction::wait());
    e.advancePhase();
    e.advancePhase();
    e.advancePhase();
}

// ------------------------------------------------------------
// RNG / resonance
// ------------------------------------------------------------

void test_rng_reproducible() {
    RNG a(42u);
    RNG b(42u);
    for (int i = 0; i < 64; ++i) {
        expect(a.nextU64() == b.nextU64(), "RNG same seed diverged at " + std::to_string(i));
    }

    RNG c(43u);
    RNG d(42u);
    bool differs = false;
    for (int i = 0; i < 8; ++i) differs = differs || (c.nextU64() != d.nextU64());
    expect(differs, "RNG different seeds produce identical streams");

    RNG r(7u);
    for (int i = 0; i < 1000; ++i) {
        const int v = r.range(-3, 7);
        expect(v >= -3 && v <= 7, "RNG range() out of bounds");
    }

    RNG s(9u);
    std::vector<int> v = {1, 2, 3, 4, 5};
    const uint64_t before = s.draws;
    s.shuffle(v);
    expect(s.draws - before == 4, "shuffle consumes size-1 draws");

    const RNGState snap = s.snapshot();
    const uint64_t x = s.nextU64();
    s.restore(snap);
    expect(s.nextU64() == x, "RNG restore replays the same value");
}

void test_resonance_zones() {
    expect(ResonanceEngine::zoneFor(-100) == ResonanceZone::DeepNav, "-100 is deepNav");
    expect(ResonanceEngine::zoneFor(-61) == ResonanceZone::DeepNav, "-61 is deepNav");
    expect(ResonanceEngine::zoneFor(-60) == ResonanceZone::Nav, "-60 is nav");
    expect(ResonanceEngine::zoneFor(-21) == ResonanceZone::Nav, "-21 is nav");
    expect(ResonanceEngine::zoneFor(-20) == ResonanceZone::Yav, "-20 is yav");
    expect(ResonanceEngine::zoneFor(0) == ResonanceZone::Yav, "0 is yav");
    expect(ResonanceEngine::zoneFor(20) == ResonanceZone::Yav, "20 is yav");
    expect(ResonanceEngine::zoneFor(21) == ResonanceZone::Prav, "21 is prav");
    expect(ResonanceEngine::zoneFor(60) == ResonanceZone::Prav, "60 is prav");
    expect(ResonanceEngine::zoneFor(61) == ResonanceZone::DeepPrav, "61 is deepPrav");
    expect(ResonanceEngine::zoneFor(100) == ResonanceZone::DeepPrav, "100 is deepPrav");

    ResonanceEngine r(90.0);
    const ResonanceShift up = r.shift(25.0, "test");
    expect(r.value() == 100.0, "shift clamps at +100");
    expect(up.amount == 25.0 && up.resultingValue == 100.0, "shift record keeps requested amount");

    r.shift(-500.0, "test");
    expect(r.value() == -100.0, "shift clamps at -100");

    ResonanceEngine n(std::nan(""));
    expect(n.value() == 0.0, "NaN resonance collapses to 0");
    n.setValue(250.0);
    expect(n.value() == 100.0, "setValue clamps");
}

// ------------------------------------------------------------
// Fate deck
// ------------------------------------------------------------

void test_fate_deck_conserves_cards() {
    RNG rng(5u);
    std::vector<FateCard> cards;
    for (int i = 0; i < 5; ++i) cards.push_back(plainCard("c" + std::to_string(i), i));
    FateDeckManager deck(cards, rng);

    for (int i = 0; i < 12; ++i) {
        expect(deck.draw().has_value(), "draw from non-empty deck");
        expect(deck.totalCount() == 5, "draw+discard stays 5 after draw " + std::to_string(i));
    }

    FateDeckManager fresh(cards, rng);
    for (int i = 0; i < 5; ++i) fresh.draw();
    expect(fresh.drawCount() == 0 && fresh.discardCount() == 5, "five draws empty the pile");
    fresh.draw();
    expect(fresh.drawCount() == 4 && fresh.discardCount() == 1, "empty pile reshuffles before drawing");

    fresh.addCard(plainCard("boon", 3));
    expect(fresh.totalCount() == 6, "addCard grows the deck");
    expect(fresh.removeCard("boon"), "removeCard finds the added card");
    expect(fresh.totalCount() == 5, "removeCard shrinks the deck");
    expect(!fresh.removeCard("nope"), "removeCard of unknown id fails");
}

void test_fate_deck_sticky_survives_reshuffle() {
    RNG rng(11u);
    FateCard curse = plainCard("hex", -2);
    curse.isSticky = true;

    // A snapshot whose piles lost the curse still remembers it.
    FateDeckState st;
    st.drawPile.push_back(plainCard("a", 1));
    st.stickyCards.push_back(curse);
    FateDeckManager deck(st, rng);
    expect(deck.totalCount() == 1, "restored deck holds only the listed piles");

    deck.reshuffle();
    const auto& pile = deck.drawPile();
    const bool back = std::any_of(pile.begin(), pile.end(), [](const FateCard& c) { return c.id == "hex"; });
    expect(back, "sticky card returns on reshuffle");
    expect(deck.totalCount() == 2, "reshuffle restores the sticky card exactly once");

    deck.reshuffle();
    expect(deck.totalCount() == 2, "sticky card is not duplicated by a second reshuffle");
}

void test_fate_deck_empty_fallback() {
    RNG rng(3u);
    FateDeckManager deck(std::vector<FateCard>{}, rng);
    expect(!deck.draw().has_value(), "empty deck draws nothing");

    const uint64_t before = rng.draws;
    const FateRoll roll = rollFate(&deck, 0.0, rng, FateFallbackRange{-1, 2});
    expect(roll.usedFallback, "empty deck uses fallback");
    expect(roll.value >= -1 && roll.value <= 2, "fallback within bounds");
    expect(rng.draws == before + 1, "fallback consumes exactly one draw");

    const FateRoll none = rollFate(nullptr, 0.0, rng);
    expect(none.usedFallback && !none.draw, "missing deck uses fallback");
}

void test_fate_resonance_rules() {
    FateCard c = plainCard("dark", 1);
    c.resonanceRules.push_back(FateResonanceRule{ResonanceZone::Nav, 2});
    c.resonanceRules.push_back(FateResonanceRule{ResonanceZone::Prav, -1});

    expect(resolveFateCard(c, -30.0).effectiveValue == 3, "nav rule applies in nav");
    expect(resolveFateCard(c, 0.0).effectiveValue == 1, "no rule in yav");
    expect(resolveFateCard(c, 40.0).effectiveValue == 0, "prav rule applies in prav");
    expect(resolveFateCard(c, -80.0).effectiveValue == 1, "deepNav does not match a nav rule");
}

// ------------------------------------------------------------
// Combat math
// ------------------------------------------------------------

void test_affinity_and_floor() {
    expect(strikeDamage(5, 2, 0, 1.5, 3) == 7, "weakness scales before defense");
    expect(strikeDamage(5, 2, 0, 0.67, 3) == 1, "resistance scales before defense");
    expect(strikeDamage(1, 0, 0, 1.0, 10) == 1, "connecting attack deals at least 1");

    std::set<FateKeyword> weak = {FateKeyword::Surge};
    std::set<FateKeyword> strong = {FateKeyword::Surge, FateKeyword::Ward};
    expect(keywordAffinity(weak, strong, FateKeyword::Surge) == KeywordAffinity::Weakness,
           "weakness wins over strength");
    expect(keywordAffinity(weak, strong, FateKeyword::Ward) == KeywordAffinity::Resistance, "strength applies");
    expect(keywordAffinity(weak, strong, std::nullopt) == KeywordAffinity::None, "no keyword, no affinity");
}

void test_calculate_attack_with_fate() {
    CombatHeroContext hero;
    hero.strength = 5;

    RNG rng(1u);
    FateDeckManager hit(std::vector<FateCard>{plainCard("plus2", 2)}, rng);
    const FateAttackResult a = calculateAttackWithFate(hero, &hit, 0.0, 0, 5, 0, 0, rng);
    expect(a.totalAttack == 7, "5 + 2 totals 7");
    expect(a.isHit && a.damage == 4, "7 vs 5 hits for 4");

    FateDeckManager miss(std::vector<FateCard>{plainCard("minus2", -2)}, rng);
    const FateAttackResult b = calculateAttackWithFate(hero, &miss, 0.0, 0, 5, 0, 0, rng);
    expect(!b.isHit && b.damage == 0, "3 vs 5 misses");

    hero.activeCurses.push_back(HeroCurse::Weakness);
    FateDeckManager cursed(std::vector<FateCard>{plainCard("plus2", 2)}, rng);
    const FateAttackResult c = calculateAttackWithFate(hero, &cursed, 0.0, 0, 5, 0, 0, rng);
    expect(c.damage == 3, "weakness curse removes 1 damage");

    CombatHeroContext sage;
    sage.wisdom = 4;
    FateDeckManager spirit(std::vector<FateCard>{plainCard("zero", 0)}, rng);
    const SpiritAttackResult s = calculateSpiritAttack(sage, 4, &spirit, 0.0, 0, 0, rng);
    expect(s.damage == 4 && s.isPacified && s.newWill == 0, "spirit attack breaks will");
}

// ------------------------------------------------------------
// Enemy AI
// ------------------------------------------------------------

void test_mode_thresholds_vary_per_seed() {
    const uint64_t seeds[] = {1u, 7u, 42u, 100u, 255u, 1000u, 9999u, 123456u};
    std::set<int> distinct;
    for (uint64_t seed : seeds) {
        const EnemyModeState s(seed);
        expect(s.survivalThreshold >= -75 && s.survivalThreshold <= -65,
               "survival threshold out of band for seed " + std::to_string(seed));
        expect(s.desperationThreshold >= 65 && s.desperationThreshold <= 75,
               "desperation threshold out of band for seed " + std::to_string(seed));
        expect(s.survivalThreshold == -s.desperationThreshold, "thresholds are symmetric");
        expect(EnemyModeState(seed) == s, "thresholds are stable for a seed");
        distinct.insert(s.desperationThreshold);
    }
    expect(distinct.size() >= 2, "thresholds vary across seeds");
}

void test_mode_swing_forces_weakened() {
    EnemyModeState s(42u);
    expect(evaluateMode(s, 35) == EnemyMode::Weakened, "+35 swing forces weakened");
    expect(evaluateMode(s, 35) == EnemyMode::Weakened, "hysteresis holds weakened one evaluation");
    expect(evaluateMode(s, 35) == EnemyMode::Normal, "weakened releases after hysteresis");

    EnemyModeState t(42u);
    t.previousDisposition = 10;
    expect(evaluateMode(t, -20) == EnemyMode::Weakened, "-30 swing forces weakened");

    EnemyModeState u(42u);
    u.previousDisposition = 10;
    expect(evaluateMode(u, -19) == EnemyMode::Normal, "29 swing does not weaken");
}

void test_mode_hysteresis() {
    EnemyModeState s(7u);
    s.previousDisposition = -90;
    expect(evaluateMode(s, -100) == EnemyMode::Survival, "deep negative disposition enters survival");
    expect(s.hysteresisCounter == 1, "entering survival arms hysteresis");
    expect(evaluateMode(s, -75) == EnemyMode::Survival, "survival held for one evaluation");
    expect(evaluateMode(s, -55) == EnemyMode::Normal, "survival released once counter is spent");

    EnemyModeState d(7u);
    d.previousDisposition = 90;
    expect(evaluateMode(d, 100) == EnemyMode::Desperation, "high disposition enters desperation");
}

void test_desperation_never_defends() {
    const DispositionSimulation sim = DispositionSimulation::makeStandard(80);
    for (uint64_t seed = 1; seed <= 100; ++seed) {
        RNG rng(seed);
        const EnemyAction a = selectEnemyAction(EnemyMode::Desperation, sim, rng, 4, 3);
        expect(a.kind != EnemyActionKind::Defend, "desperation defended for seed " + std::to_string(seed));
        expect(rng.draws == 1, "desperation consumes one draw");
        if (a.kind == EnemyActionKind::Provoke) expect(a.value == 5, "desperation provoke is base + 2");
        if (a.kind == EnemyActionKind::Attack) expect(a.value == 8, "desperation attack doubles");
        if (a.kind == EnemyActionKind::Plea) expect(a.value == PLEA_DISPOSITION_SHIFT, "plea shift");
    }
}

void test_survival_and_weakened_actions() {
    const DispositionSimulation sim = DispositionSimulation::makeStandard(-80);
    for (uint64_t seed = 1; seed <= 100; ++seed) {
        RNG rng(seed);
        const EnemyAction a = selectEnemyAction(EnemyMode::Survival, sim, rng, 4, 3);
        expect(a.kind == EnemyActionKind::Attack || a.kind == EnemyActionKind::Rage,
               "survival only attacks or rages");
        if (a.kind == EnemyActionKind::Rage) expect(a.value == 8, "rage doubles");
        if (a.kind == EnemyActionKind::Attack) expect(a.value == 4, "survival attack is base");
    }

    RNG rng(1u);
    expect(selectEnemyAction(EnemyMode::Weakened, sim, rng, 5, 3) == EnemyAction::attack(2), "weakened halves");
    expect(selectEnemyAction(EnemyMode::Weakened, sim, rng, 1, 3) == EnemyAction::attack(1), "weakened floors at 1");
    expect(rng.draws == 0, "weakened makes no draw");
}

void test_normal_momentum_counters() {
    RNG rng(1u);
    DispositionSimulation sim = DispositionSimulation::makeStandard();

    sim.streakType = DispositionActionType::Strike;
    sim.streakCount = 3;
    expect(selectEnemyAction(EnemyMode::Normal, sim, rng, 4, 3) == EnemyAction::defend(MOMENTUM_DEFEND_VALUE),
           "strike streak is met with defend");

    sim.streakType = DispositionActionType::Influence;
    expect(selectEnemyAction(EnemyMode::Normal, sim, rng, 4, 6) == EnemyAction::provoke(6),
           "influence streak is met with provoke");

    sim.streakType = DispositionActionType::Sacrifice;
    expect(selectEnemyAction(EnemyMode::Normal, sim, rng, 4, 3) == EnemyAction::adapt(3),
           "sacrifice streak is met with adapt");

    sim.streakCount = 2;
    expect(selectEnemyAction(EnemyMode::Normal, sim, rng, 4, 3) == EnemyAction::attack(4),
           "short streak is ignored");
    expect(rng.draws == 0, "normal mode makes no draw");
}

void test_disposition_simulation() {
    DispositionSimulation sim = DispositionSimulation::makeStandard(0, 100, 3);
    expect(sim.playStrike(5), "strike accepted");
    expect(sim.disposition == -5 && sim.energy == 2, "strike lowers disposition");

    expect(sim.playInfluence(5), "influence accepted");
    expect(sim.disposition == 2, "threat bonus after a strike");

    expect(sim.playInfluence(5), "second influence accepted");
    expect(sim.energy == 0, "energy spent");
    expect(!sim.playStrike(5), "no energy, no strike");

    DispositionSimulation prav = DispositionSimulation::makeStandard(0, 10, 3);
    prav.zone = ResonanceZone::Prav;
    prav.playStrike(1);
    expect(prav.heroHp == 9, "striking under prav costs 1 hp");
    prav.playStrike(1, 0, FateKeyword::Ward);
    expect(prav.heroHp == 9, "ward prevents the prav cost");

    DispositionSimulation hit = DispositionSimulation::makeStandard(0);
    resolveEnemyAction(EnemyAction::rage(4), hit);
    expect(hit.heroHp == 96 && hit.disposition == RAGE_DISPOSITION_SHIFT, "rage hurts and shifts disposition");

    DispositionSimulation end = DispositionSimulation::makeStandard(98);
    end.applyDispositionShift(5);
    expect(end.outcome == DispositionOutcome::Subjugated, "disposition 100 subjugates");
}

// ------------------------------------------------------------
// Encounter engine
// ------------------------------------------------------------

void test_encounter_phase_rejections() {
    EncounterEngine e(basicContext());
    expect(e.phase() == EncounterPhase::Intent && e.round() == 1, "starts at round 1 intent");
    expect(e.enemies()[0].intent.has_value(), "intents declared at start");

    const uint64_t h0 = encounterStateHash(e);
    const ActionResult early = e.performAction(PlayerAction::attack("wolf"));
    expect(!early.success && early.error == ErrorCode::InvalidPhase, "attack outside playerAction rejected");
    const ActionResult res = e.resolveEnemyAction("wolf");
    expect(!res.success && res.error == ErrorCode::InvalidPhase, "resolve outside enemyResolution rejected");
    expect(encounterStateHash(e) == h0, "rejections mutate nothing");

    e.advancePhase();
    const ActionResult bad = e.performAction(PlayerAction::attack("ghost"));
    expect(!bad.success && bad.error == ErrorCode::InvalidTarget, "unknown target rejected");
    const ActionResult card = e.performAction(PlayerAction::useCard("c9"));
    expect(!card.success && card.error == ErrorCode::UnknownCard, "card not in hand rejected");
}

void test_wait_is_a_noop() {
    EncounterEngine e(basicContext());
    e.advancePhase();

    const int draw = e.fateDeck().drawCount();
    const int discard = e.fateDeck().discardCount();
    const uint64_t draws = e.rngState().draws;
    const int hp = e.heroHp();

    const ActionResult r = e.performAction(PlayerAction::wait());
    expect(r.success, "wait accepted");
    expect(e.fateDeck().drawCount() == draw && e.fateDeck().discardCount() == discard, "wait draws no Fate card");
    expect(e.rngState().draws == draws, "wait consumes no RNG");
    expect(e.heroHp() == hp && e.enemies()[0].enemy.hp == 30, "wait changes no hp");

    const ActionResult again = e.performAction(PlayerAction::attack("wolf"));
    expect(!again.success && again.error == ErrorCode::ActionAlreadyUsed, "one finishing action per round");
}

void test_weakness_and_resistance_in_combat() {
    FateCard surge = plainCard("surge", 0);
    surge.keyword = FateKeyword::Surge;

    EncounterContext weakCtx = basicContext();
    weakCtx.fateCards.assign(4, surge);
    weakCtx.enemies[0].weaknesses.insert(FateKeyword::Surge);
    EncounterEngine weak(weakCtx);
    weak.advancePhase();
    const ActionResult w = weak.performAction(PlayerAction::attack("wolf"));
    expect(w.success && hasChange(w, StateChangeKind::WeaknessTriggered), "weakness triggered");
    expect(weak.enemies()[0].enemy.hp == 20, "weakness: (5 + 2) * 1.5 = 10 damage");

    EncounterContext strongCtx = basicContext();
    strongCtx.fateCards.assign(4, surge);
    strongCtx.enemies[0].strengths.insert(FateKeyword::Surge);
    EncounterEngine strong(strongCtx);
    strong.advancePhase();
    const ActionResult s = strong.performAction(PlayerAction::attack("wolf"));
    expect(hasChange(s, StateChangeKind::ResistanceTriggered), "resistance triggered");
    expect(strong.enemies()[0].enemy.hp == 26, "resistance: (5 + 2) * 0.67 = 4 damage");
}

void test_kill_and_pacify_outcomes() {
    expect(settleEntityOutcome(EntityOutcome::Alive, 0, 0) == EntityOutcome::Killed, "hp 0 beats wp 0");
    expect(settleEntityOutcome(EntityOutcome::Alive, 4, 0) == EntityOutcome::Pacified, "wp 0 pacifies");
    expect(settleEntityOutcome(EntityOutcome::Alive, 4, std::nullopt) == EntityOutcome::Alive, "no wp track");
    expect(settleEntityOutcome(EntityOutcome::Pacified, 0, 0) == EntityOutcome::Pacified, "settled outcome sticks");

    EncounterContext killCtx = basicContext();
    killCtx.enemies[0] = makeEnemy("rat", 3, std::nullopt, 1);
    EncounterEngine k(killCtx);
    k.advancePhase();
    const ActionResult sp = k.performAction(PlayerAction::spiritAttack("rat"));
    expect(!sp.success && sp.error == ErrorCode::NoSpiritTrack, "no will track, no spirit attack");
    const ActionResult hit = k.performAction(PlayerAction::attack("rat"));
    expect(hasChange(hit, StateChangeKind::EnemyKilled), "rat killed");
    expect(k.isFinished() && k.currentOutcome() == EncounterOutcome::Victory, "killing the last enemy wins");
    const ActionResult after = k.performAction(PlayerAction::wait());
    expect(!after.success && after.error == ErrorCode::EncounterFinished, "finished encounter rejects actions");

    const EncounterResult kr = k.finishEncounter();
    expect(kr.aggregate == AggregateOutcome::Killed, "aggregate killed");
    expect(kr.worldFlags.count("violent") == 1 && kr.worldFlags.count("nonviolent") == 0, "violent flag");
    expect(kr.perEntity.at("rat") == EntityOutcome::Killed, "per-entity killed");

    EncounterContext pacCtx = basicContext();
    pacCtx.enemies[0] = makeEnemy("monk", 10, 3, 1);
    EncounterEngine p(pacCtx);
    p.advancePhase();
    const ActionResult talk = p.performAction(PlayerAction::spiritAttack("monk"));
    expect(hasChange(talk, StateChangeKind::EnemyPacified), "monk pacified");
    const EncounterResult pr = p.finishEncounter();
    expect(pr.outcome == EncounterOutcome::Victory && pr.aggregate == AggregateOutcome::Pacified, "aggregate pacified");
    expect(pr.worldFlags.count("nonviolent") == 1 && pr.worldFlags.count("violent") == 0, "nonviolent flag");

    std::map<std::string, EntityOutcome> mixed = {{"a", EntityOutcome::Killed}, {"b", EntityOutcome::Pacified}};
    expect(classifyOutcomes(mixed) == AggregateOutcome::Mixed, "equal counts are mixed");
    mixed["c"] = EntityOutcome::Alive;
    expect(classifyOutcomes(mixed) == AggregateOutcome::Mixed, "alive entries do not count");
    expect(classifyOutcomes({}) == AggregateOutcome::None, "empty is none");
}

void test_flee_and_defeat() {
    EncounterEngine f(basicContext());
    f.advancePhase();
    f.performAction(PlayerAction::flee());
    expect(f.isFinished() && f.currentOutcome() == EncounterOutcome::Escaped, "flee escapes");

    EncounterContext ctx = basicContext();
    ctx.hero.hp = 1;
    ctx.enemies[0].power = 10;
    EncounterEngine d(ctx);
    d.advancePhase();
    d.performAction(PlayerAction::wait());
    d.advancePhase();
    const ActionResult r = d.advancePhase();
    expect(hasChange(r, StateChangeKind::EncounterEnded, "defeat"), "hero falls during resolution");
    expect(d.heroHp() == 0 && d.finishEncounter().outcome == EncounterOutcome::Defeat, "defeat outcome");
}

void test_mulligan_once() {
    EncounterEngine e(basicContext());
    expect(e.hand().size() == 3 && e.hand()[0].id == "c1", "starting hand is the first three cards");

    const ActionResult bad = e.performAction(PlayerAction::mulligan({"c5"}));
    expect(!bad.success && bad.error == ErrorCode::UnknownCard, "mulligan of a card not in hand rejected");
    expect(!e.mulliganDone(), "rejected mulligan does not count");

    const ActionResult ok = e.performAction(PlayerAction::mulligan({"c1"}));
    expect(ok.success, "mulligan accepted during intent");
    expect(e.hand().size() == 3, "hand size preserved");
    expect(e.hand()[2].id == "c4", "replacement drawn from pool");
    expect(e.cardDiscard().size() == 1 && e.cardDiscard()[0].id == "c1", "returned card discarded");

    const ActionResult twice = e.performAction(PlayerAction::mulligan({"c2"}));
    expect(!twice.success && twice.error == ErrorCode::MulliganAlreadyDone, "second mulligan rejected");
}

void test_card_play_bonuses() {
    EncounterEngine e(basicContext());
    e.advancePhase();

    const ActionResult r = e.performAction(PlayerAction::useCard("c1", "wolf"));
    expect(r.success && hasChange(r, StateChangeKind::CardPlayed, "c1"), "card played");
    expect(e.heroFaith() == 2, "faith spent");

    e.performAction(PlayerAction::attack("wolf"));
    expect(e.enemies()[0].enemy.hp == 23, "card power adds to this round's attack");

    EncounterContext poor = basicContext();
    poor.hero.faith = 0;
    EncounterEngine p(poor);
    p.advancePhase();
    const ActionResult no = p.performAction(PlayerAction::useCard("c1"));
    expect(!no.success && no.error == ErrorCode::InsufficientFaith, "not enough faith");

    HeroCard navCard = makeCard("n", 0, 2);
    navCard.realm = CardRealm::Nav;
    expect(adjustedFaithCost(navCard, ResonanceZone::Nav) == 1, "own realm is cheaper");
    expect(adjustedFaithCost(navCard, ResonanceZone::Prav) == 3, "opposing realm is dearer");
    expect(adjustedFaithCost(navCard, ResonanceZone::Yav) == 2, "yav leaves cost alone");
}

void test_escalation_and_deescalation() {
    EncounterEngine e(basicContext());

    e.advancePhase();
    e.performAction(PlayerAction::spiritAttack("wolf"));
    expect(*e.enemies()[0].enemy.wp == 17, "spirit attack: wisdom 3");
    expect(e.resonance() == 0.0, "first attack does not shift resonance");
    e.advancePhase();
    e.advancePhase();
    e.advancePhase();
    expect(e.round() == 2 && e.heroHp() == 18, "round 2 after a 2-point hit");

    e.advancePhase();
    const ActionResult esc = e.performAction(PlayerAction::attack("wolf"));
    expect(hasChange(esc, StateChangeKind::ResonanceShifted, "escalation"), "escalation shift recorded");
    expect(e.resonance() == -5.0, "spiritual -> physical shifts resonance by -5");
    expect(e.enemies()[0].enemy.hp == 23, "surprise: 5 * 1.5 = 7");

    e.advancePhase();
    e.advancePhase();
    e.advancePhase();
    e.advancePhase();
    expect(e.round() == 3 && e.phase() == EncounterPhase::PlayerAction, "round 3 player action");

    const double before = e.resonance();
    const ActionResult de = e.performAction(PlayerAction::spiritAttack("wolf"));
    expect(hasChange(de, StateChangeKind::ResonanceShifted, "de_escalation"), "de-escalation shift recorded");
    expect(e.resonance() == before + 5.0, "physical -> spiritual shifts resonance by +5");
    expect(hasChange(de, StateChangeKind::RageShieldApplied), "rage shield raised");
    expect(*e.enemies()[0].enemy.wp == 16, "rage shield (power 2 x round 3) absorbs the blow");
    expect(e.enemies()[0].rageShield == 0, "rage shield is spent");
}

void test_card_streak_triggers_debuff() {
    EncounterEngine e(basicContext());
    e.advancePhase();
    e.performAction(PlayerAction::useCard("c1"));
    e.performAction(PlayerAction::useCard("c2"));
    e.performAction(PlayerAction::useCard("c3"));
    e.performAction(PlayerAction::wait());
    e.advancePhase();
    e.advancePhase();
    e.advancePhase();

    const auto& intent = e.enemies()[0].intent;
    expect(intent && intent->type == IntentType::Debuff && intent->value == 3, "card streak is met with debuff");

    e.advancePhase();
    e.performAction(PlayerAction::wait());
    e.advancePhase();
    e.advancePhase();
    expect(e.state().heroAttackPenalty == 3, "debuff resolved onto the hero");
    e.advancePhase();
    e.advancePhase();
    e.performAction(PlayerAction::attack("wolf"));
    expect(e.enemies()[0].enemy.hp == 28, "debuff consumed by the next strike");
    expect(e.state().heroAttackPenalty == 0, "debuff cleared");
}

void test_summon_grows_roster() {
    bool sawSummon = false;
    for (uint64_t seed = 1; seed <= 60 && !sawSummon; ++seed) {
        EncounterContext ctx = basicContext(seed);
        ctx.enemies[0].power = 1;
        ctx.enemies[0].abilities.push_back(EnemyAbility{EnemyAbilityKind::Summon, 0, "pup"});
        ctx.summonPool["pup"] = makeEnemy("pup", 4, std::nullopt, 1);

        EncounterEngine e(ctx);
        expect(e.enemies()[0].intent->type != IntentType::Summon, "no summon in round 1");
        waitOutRound(e);
        if (e.enemies()[0].intent->type != IntentType::Summon) continue;

        sawSummon = true;
        expect(e.enemies()[0].intent->ref == "pup", "summon references the pool");
        e.advancePhase();
        e.performAction(PlayerAction::wait());
        e.advancePhase();
        const ActionResult r = e.advancePhase();
        expect(hasChange(r, StateChangeKind::EnemySummoned), "summon resolved");
        expect(e.enemies().size() == 2, "roster grew");
        expect(e.enemies()[1].enemy.id == "pup#1" && e.enemies()[1].sourceId == "pup", "summoned id");
        expect(!e.enemies()[1].intent, "summoned enemy waits for the next intent phase");
    }
    expect(sawSummon, "some seed summons in round 2");
}

void test_curse_and_regeneration() {
    EncounterContext ctx = basicContext();
    ctx.enemies[0].power = 5;
    ctx.enemies[0].abilities.push_back(EnemyAbility{EnemyAbilityKind::ApplyCurse, 0, "hex"});
    FateCard hex = plainCard("hex", 0);
    hex.isSticky = true;
    ctx.curseCards["hex"] = hex;

    EncounterEngine e(ctx);
    e.advancePhase();
    e.performAction(PlayerAction::wait());
    e.advancePhase();
    const ActionResult r = e.advancePhase();
    expect(hasChange(r, StateChangeKind::CurseAdded, "hex"), "curse added on a damaging hit");
    expect(e.fateDeck().totalCount() == 7, "curse joins the deck");
    expect(e.heroHp() == 15, "hit for 5");

    e.advancePhase();
    waitOutRound(e);
    expect(e.fateDeck().totalCount() == 7, "curse is added once");

    EncounterContext rctx = basicContext();
    rctx.enemies[0] = makeEnemy("troll", 10, std::nullopt, 1);
    rctx.enemies[0].abilities.push_back(EnemyAbility{EnemyAbilityKind::Regeneration, 2, ""});
    EncounterEngine t(rctx);
    t.advancePhase();
    t.performAction(PlayerAction::attack("troll"));
    expect(t.enemies()[0].enemy.hp == 5, "troll hit for 5");
    t.advancePhase();
    t.advancePhase();
    t.advancePhase();
    expect(t.enemies()[0].enemy.hp == 7, "regeneration at round end");
}

void test_critical_fate_blocks_enemy_attack() {
    EncounterContext ctx = basicContext();
    ctx.enemies[0].power = 8;
    FateCard grace = plainCard("grace", 0);
    grace.isCritical = true;
    ctx.fateCards.assign(6, grace);

    EncounterEngine e(ctx);
    expect(e.enemies()[0].intent->value == 8, "wolf intends an 8-point attack");
    e.advancePhase();
    e.performAction(PlayerAction::wait());
    e.advancePhase();
    const ActionResult r = e.advancePhase();
    expect(hasChange(r, StateChangeKind::FateDraw, "grace"), "defense draw made");
    expect(e.heroHp() == 20, "critical draw turns the attack to 0 damage");

    EncounterContext plain = basicContext();
    plain.enemies[0].power = 8;
    EncounterEngine p(plain);
    p.advancePhase();
    p.performAction(PlayerAction::wait());
    p.advancePhase();
    p.advancePhase();
    expect(p.heroHp() == 12, "an ordinary draw lets the 8 through");
}

void test_enemy_ability_modifiers() {
    EncounterContext armored = basicContext();
    armored.enemies[0].abilities.push_back(EnemyAbility{EnemyAbilityKind::Armor, 2, ""});
    EncounterEngine a(armored);
    a.advancePhase();
    a.performAction(PlayerAction::attack("wolf"));
    expect(a.enemies()[0].enemy.hp == 27, "armor ability: 5 - 2 = 3 damage");

    EncounterContext bonus = basicContext();
    bonus.enemies[0].abilities.push_back(EnemyAbility{EnemyAbilityKind::BonusDamage, 3, ""});
    EncounterEngine b(bonus);
    const auto& intent = b.enemies()[0].intent;
    expect(intent && intent->type == IntentType::Attack && intent->value == 5, "bonus damage: power 2 + 3");
    b.advancePhase();
    b.performAction(PlayerAction::wait());
    b.advancePhase();
    b.advancePhase();
    expect(b.heroHp() == 15, "bonus damage reaches the hero");
}

void test_fate_draw_effects() {
    FateCard omen = plainCard("omen", 0);
    omen.onDrawEffects.push_back(FateDrawEffect{FateDrawEffectKind::ShiftResonance, 2});
    omen.onDrawEffects.push_back(FateDrawEffect{FateDrawEffectKind::ShiftTension, 1});
    EncounterContext ctx = basicContext();
    ctx.fateCards.assign(6, omen);

    EncounterEngine e(ctx);
    e.advancePhase();
    const ActionResult r = e.performAction(PlayerAction::attack("wolf"));
    expect(hasChange(r, StateChangeKind::ResonanceShifted, "fate:omen"), "resonance shift recorded");
    expect(hasChange(r, StateChangeKind::TensionShifted, "omen"), "tension shift recorded");
    expect(e.resonance() == 2.0 && e.tension() == 1, "one draw: resonance +2, tension +1");

    e.advancePhase();
    e.advancePhase();
    expect(e.resonance() == 4.0 && e.tension() == 2, "defense draw applies the effects too");
}

void test_resolve_single_enemy_action() {
    EncounterEngine e(basicContext());
    e.advancePhase();
    e.performAction(PlayerAction::wait());
    e.advancePhase();

    const ActionResult r = e.resolveEnemyAction("wolf");
    expect(r.success, "pending intent resolves");
    expect(hasChange(r, StateChangeKind::IntentResolved, "attack"), "resolution recorded");
    expect(hasChange(r, StateChangeKind::HeroHpChanged), "hero hit recorded");
    expect(e.heroHp() == 18 && !e.enemies()[0].intent, "hit for 2, intent spent");
    expect(e.phase() == EncounterPhase::EnemyResolution, "phase unchanged");

    const ActionResult again = e.resolveEnemyAction("wolf");
    expect(!again.success && again.error == ErrorCode::NoPendingIntent, "intent resolves only once");
    const ActionResult ghost = e.resolveEnemyAction("ghost");
    expect(!ghost.success && ghost.error == ErrorCode::InvalidTarget, "unknown enemy rejected");

    e.advancePhase();
    expect(e.phase() == EncounterPhase::RoundEnd && e.heroHp() == 18, "leaving the phase does not repeat it");
}

void test_keyword_specials_in_combat() {
    FateCard focus = plainCard("focus", 0);
    focus.keyword = FateKeyword::Focus;
    EncounterContext fctx = basicContext();
    fctx.fateCards.assign(6, focus);
    fctx.enemies[0].defense = 1;
    fctx.enemies[0].abilities.push_back(EnemyAbility{EnemyAbilityKind::Armor, 2, ""});
    EncounterEngine f(fctx);
    f.advancePhase();
    f.performAction(PlayerAction::attack("wolf"));
    expect(f.enemies()[0].enemy.hp == 24, "focus ignores defense and armor: 5 + 1 = 6");

    FateCard shadow = plainCard("shadow", 0);
    shadow.keyword = FateKeyword::Shadow;
    EncounterContext sctx = basicContext();
    sctx.fateCards.assign(6, shadow);
    sctx.hero.hp = 10;
    EncounterEngine s(sctx);
    s.advancePhase();
    const ActionResult amb = s.performAction(PlayerAction::attack("wolf"));
    expect(s.enemies()[0].enemy.hp == 24, "shadow strike: 5 + 1 = 6");
    expect(hasChange(amb, StateChangeKind::HeroHpChanged) && s.heroHp() == 13, "ambush heals half the damage");

    FateCard echo = plainCard("echo", 0);
    echo.keyword = FateKeyword::Echo;
    EncounterContext ectx = basicContext();
    ectx.fateCards.assign(6, echo);
    EncounterEngine ech(ectx);
    ech.advancePhase();
    ech.performAction(PlayerAction::useCard("c2"));
    expect(ech.hand().size() == 2 && ech.cardDiscard().size() == 1, "c2 played");
    const ActionResult strike = ech.performAction(PlayerAction::attack("wolf"));
    expect(hasChange(strike, StateChangeKind::CardDrawn, "c2"), "echo strike returns the last played card");
    expect(ech.hand().size() == 3 && ech.hand().back().id == "c2" && ech.cardDiscard().empty(), "c2 back in hand");
    expect(ech.enemies()[0].enemy.hp == 24, "echo strike: 5 + 1 = 6");
}

void test_hp_delta_from_clamped_start() {
    EncounterContext ctx = basicContext();
    ctx.hero.hp = 30;
    EncounterEngine idle(ctx);
    expect(idle.heroHp() == 20, "starting hp clamps to max");
    expect(idle.finishEncounter().hpDelta == 0, "no damage taken, no hp delta");

    EncounterEngine hit(ctx);
    waitOutRound(hit);
    expect(hit.finishEncounter().hpDelta == -2, "delta counts only the hit taken");
}

void test_escalation_tracks_last_attack_on_any_enemy() {
    EncounterContext ctx = basicContext();
    ctx.enemies.push_back(makeEnemy("boar", 30, std::nullopt, 2));
    EncounterEngine e(ctx);

    e.advancePhase();
    e.performAction(PlayerAction::spiritAttack("wolf"));
    e.advancePhase();
    e.advancePhase();
    e.advancePhase();
    e.advancePhase();
    expect(e.round() == 2 && e.phase() == EncounterPhase::PlayerAction, "round 2 player action");

    const ActionResult r = e.performAction(PlayerAction::attack("boar"));
    expect(hasChange(r, StateChangeKind::ResonanceShifted, "escalation"), "switching target still escalates");
    expect(e.resonance() == -5.0, "escalation shift applied");
    expect(e.enemies()[1].enemy.hp == 23, "surprise bonus on the other enemy: 5 * 1.5 = 7");
}

void test_snapshot_restore_reproduces() {
    EncounterEngine a(basicContext(77u));
    a.advancePhase();
    a.performAction(PlayerAction::spiritAttack("wolf"));
    a.advancePhase();
    const EncounterSnapshot snap = a.saveSnapshot();

    EncounterEngine b(basicContext(77u));
    b.restoreSnapshot(snap);
    expect(encounterStateHash(a) == encounterStateHash(b), "restored engine matches");

    for (EncounterEngine* e : {&a, &b}) {
        e->advancePhase();
        e->advancePhase();
        e->advancePhase();
        e->performAction(PlayerAction::attack("wolf"));
    }
    expect(canonicalEncounterState(a) == canonicalEncounterState(b), "continued runs stay identical");
    expect(a.messages().size() != b.messages().size(), "message logs differ");
}

// ------------------------------------------------------------
// Traces / replay
// ------------------------------------------------------------

const char* kTrace =
    "@fatecore_trace 1\n"
    "@game_version test\n"
    "@trace_id wolf_duel\n"
    "@end_header\n"
    "# opening\n"
    "s1 advance\n"
    "s2 spirit wolf\n"
    "s3 advance\n"
    "s4 advance\n"
    "s5 snapshot\n"
    "s6 advance\n"
    "s7 advance\n"
    "s8 attack wolf\n"
    "s9 advance\n"
    "s10 advance\n"
    "s11 advance\n"
    "s12 advance\n"
    "s13 card c1 wolf\n"
    "s14 attack wolf\n"
    "s15 mulligan c2,c3\n";

void test_trace_parse() {
    ActionTrace t;
    std::string err;
    expect(parseTraceText(kTrace, t, &err), "trace parses: " + err);
    expect(t.meta.traceId == "wolf_duel" && !t.meta.seed, "trace header");
    expect(t.steps.size() == 15, "trace step count");
    expect(t.steps[12].kind == TraceActionKind::Card && t.steps[12].card == "c1" && t.steps[12].target == "wolf",
           "card step args");
    expect(t.steps[14].cards == std::vector<std::string>({"c2", "c3"}), "mulligan list");
    expect(traceStepLine(t.steps[14]) == "s15 mulligan c2,c3", "step line");

    ActionTrace seeded = t;
    seeded.meta.seed = 9u;
    expect(traceFingerprint(seeded) == traceFingerprint(t), "seed is not part of the trace identity");
    seeded.steps.pop_back();
    expect(traceFingerprint(seeded) != traceFingerprint(t), "steps are part of the trace identity");

    ActionTrace bad;
    expect(!parseTraceText("@fatecore_trace 1\n@end_header\ns1 dance\n", bad, &err), "unknown action rejected");
    expect(err.find("line 3") != std::string::npos, "error names the line");
    expect(!parseTraceText("s1 advance\n", bad, &err), "missing header rejected");
    expect(!parseTraceText("@fatecore_trace 2\n@end_header\n", bad, &err), "newer format rejected");

    const fs::path path = fs::temp_directory_path() / "fatecore_test.trace";
    TraceWriter w;
    TraceMeta meta;
    meta.gameVersion = "test";
    meta.traceId = "roundtrip";
    meta.seed = 5u;
    expect(w.open(path, meta, &err), "trace writer opens");
    for (const auto& s : t.steps) w.writeStep(s);
    w.close();

    ActionTrace back;
    expect(loadTraceFile(path, back, &err), "written trace loads");
    expect(back.steps == t.steps && back.meta.seed == std::optional<uint64_t>(5u), "written trace matches");

    std::error_code ec;
    fs::remove(path, ec);
}

void test_replay_checkpoint_equivalence() {
    ActionTrace trace;
    std::string err;
    parseTraceText(kTrace, trace, &err);

    ReplayOptions linearOpt;
    linearOpt.honorSnapshotSteps = false;
    ReplayOptions checkedOpt;
    checkedOpt.checkpointSteps = {"s8", "s12"};

    ReplayReport linear;
    ReplayReport checked;
    expect(runReplay(basicContext(), trace, linearOpt, linear, &err), "linear replay runs: " + err);
    expect(runReplay(basicContext(), trace, checkedOpt, checked, &err), "checked replay runs: " + err);

    expect(linear.checkpointsTaken == 0 && checked.checkpointsTaken == 3, "checkpoint count");
    expect(linear.digests.size() == 15, "one digest per step");

    const ReplayComparison cmp = compareReplayReports(linear, checked);
    expect(cmp.equal, "checkpointed run matches: " + formatReplayComparison(cmp));
    expect(linear.digestFingerprint == checked.digestFingerprint, "digest fingerprints equal");
    expect(linear.finalStateFingerprint == checked.finalStateFingerprint, "final fingerprints equal");

    ReplayReport again;
    runReplay(basicContext(), trace, linearOpt, again, &err);
    expect(again.finalStateFingerprint == linear.finalStateFingerprint, "replay is repeatable");

    ActionTrace other = trace;
    other.meta.seed = 99u;
    ReplayReport diverged;
    runReplay(basicContext(), other, linearOpt, diverged, &err);
    expect(diverged.finalStateFingerprint != linear.finalStateFingerprint, "different seeds diverge");

    ReplayReport tampered = checked;
    tampered.digests[6].heroHp += 1;
    const ReplayComparison bad = compareReplayReports(linear, tampered);
    expect(!bad.equal && bad.failure == ReplayFailureKind::DigestMismatch && bad.firstDivergentStep == 6,
           "first divergent step located");

    expect(linear.digests[14].success, "mulligan step accepted");
    expect(!linear.digests[0].stepId.empty() && linear.digests[0].action == "advance", "digest labels");

    EncounterContext broken = basicContext();
    broken.enemies.clear();
    ReplayReport none;
    expect(!runReplay(broken, trace, linearOpt, none, &err), "invalid context rejected");
}

const char* kPinnedTrace =
    "@fatecore_trace 1\n"
    "@game_version test\n"
    "@trace_id pinned\n"
    "@end_header\n"
    "s1 advance\n"
    "s2 spirit wolf\n"
    "s2 expect result=ok wolf.wp=17 wolf.hp=30 resonance=0 deck=5/1\n"
    "s3 advance\n"
    "s4 advance\n"
    "s4 expect phase=round_end hp=18 wolf.intent=none outcome=unresolved\n"
    "s5 attack wolf\n"
    "s5 expect result=invalid_phase\n";

void test_trace_expectations_parse() {
    ActionTrace t;
    std::string err;
    expect(parseTraceText(kPinnedTrace, t, &err), "pinned trace parses: " + err);
    expect(t.steps.size() == 5, "expect lines are not steps");
    expect(t.steps[1].expect.size() == 5 && t.steps[1].expect[1].key == "wolf.wp" &&
           t.steps[1].expect[1].value == "17", "expectations attach to their step");
    expect(t.steps[0].expect.empty(), "unpinned step has none");
    expect(traceExpectLine(t.steps[4]) == "s5 expect result=invalid_phase", "expect line");
    expect(traceExpectLine(t.steps[0]).empty(), "no expect line for an unpinned step");

    ActionTrace stripped = t;
    for (auto& s : stripped.steps) s.expect.clear();
    expect(traceFingerprint(stripped) == traceFingerprint(t), "pinned values are not part of the trace identity");

    expect(isTraceExpectationKey("pup#1.status"), "summoned ids are valid key prefixes");
    expect(!isTraceExpectationKey("wolf.colour"), "unknown enemy field");
    expect(!isTraceExpectationKey("luck"), "unknown key");

    ActionTrace bad;
    expect(!parseTraceText("@fatecore_trace 1\n@end_header\ns1 advance\ns1 expect luck=3\n", bad, &err),
           "unknown expectation key rejected");
    expect(err.find("line 4") != std::string::npos, "expectation error names the line");
    expect(!parseTraceText("@fatecore_trace 1\n@end_header\ns1 advance\ns2 expect hp=3\n", bad, &err),
           "expectation for an unlisted step rejected");
    expect(!parseTraceText("@fatecore_trace 1\n@end_header\ns1 advance\ns1 expect hp\n", bad, &err),
           "expectation without a value rejected");
    expect(!parseTraceText("@fatecore_trace 1\n@expect_digest zz\n@end_header\n", bad, &err), "bad digest rejected");

    ActionTrace hdr;
    expect(parseTraceText("@fatecore_trace 1\n@expect_digest 0x00ff\n@expect_final_state 10\n@end_header\n", hdr, &err),
           "expectation header parses: " + err);
    expect(hdr.meta.expectDigest == std::optional<uint64_t>(0xffu) &&
           hdr.meta.expectFinalState == std::optional<uint64_t>(0x10u), "header values are hex");

    const fs::path path = fs::temp_directory_path() / "fatecore_test_pinned.trace";
    TraceWriter w;
    TraceMeta meta = t.meta;
    meta.expectDigest = 0xabcdu;
    expect(w.open(path, meta, &err), "pinned trace writer opens");
    for (const auto& s : t.steps) w.writeStep(s);
    w.close();

    ActionTrace back;
    expect(loadTraceFile(path, back, &err), "pinned trace loads: " + err);
    expect(back.steps == t.steps && back.meta.expectDigest == meta.expectDigest, "pinned trace written back");
    expect(back.steps[3].expect.size() == 4 && traceExpectLine(back.steps[3]) == traceExpectLine(t.steps[3]),
           "expectations written back");

    std::error_code ec;
    fs::remove(path, ec);
}

void test_replay_checks_expectations() {
    ActionTrace trace;
    std::string err;
    parseTraceText(kPinnedTrace, trace, &err);

    ReplayReport ok;
    expect(runReplay(basicContext(), trace, ReplayOptions{}, ok, &err), "pinned values hold: " + err);
    expect(ok.expectationsChecked == 10, "every pinned value checked");
    expect(ok.expectation.equal, "no expectation failure recorded");

    ActionTrace wrong = trace;
    wrong.steps[3].expect[1].value = "17";
    ReplayReport failed;
    err.clear();
    expect(!runReplay(basicContext(), wrong, ReplayOptions{}, failed, &err), "wrong pinned value fails the run");
    expect(failed.expectation.failure == ReplayFailureKind::ExpectationMismatch, "failure kind");
    expect(failed.expectation.firstDivergentStep == 3 && failed.expectation.stepId == "s4", "first failing step named");
    expect(failed.expectation.expectedLine == "hp=17" && failed.expectation.gotLine == "hp=18", "values reported");
    expect(err.find("(s4)") != std::string::npos && err.find("hp=18") != std::string::npos, "error names step and value");
    expect(failed.digests.size() == 4, "run stops at the failing step");

    ReplayOptions lax;
    lax.verifyExpectations = false;
    ReplayReport unchecked;
    expect(runReplay(basicContext(), wrong, lax, unchecked, &err), "checks can be switched off");
    expect(unchecked.expectationsChecked == 0, "nothing checked when off");

    ActionTrace digestPinned = trace;
    digestPinned.meta.expectDigest = ok.digestFingerprint;
    digestPinned.meta.expectFinalState = ok.finalStateFingerprint;
    ReplayOptions checkpointed;
    checkpointed.checkpointSteps = {"s2"};
    ReplayReport again;
    expect(runReplay(basicContext(), digestPinned, checkpointed, again, &err), "pinned digests hold: " + err);
    expect(again.expectationsChecked == 12, "header pins counted");

    digestPinned.meta.expectDigest = ok.digestFingerprint ^ 1u;
    ReplayReport drift;
    expect(!runReplay(basicContext(), digestPinned, ReplayOptions{}, drift, &err), "drifted digest fails");
    expect(drift.expectation.stepId.empty() && drift.expectation.firstDivergentStep == 5, "digest checked after the last step");
    expect(drift.expectation.expectedLine.rfind("digest=", 0) == 0, "digest mismatch labelled");
}

// ------------------------------------------------------------
// Content / balance
// ------------------------------------------------------------

void test_content_parse() {
    const std::string text =
        "seed = 7\n"
        "resonance = -30\n"
        "hero.hp = 25\n"
        "hero.strength = 6\n"
        "enemy.wolf.name = Grey Wolf\n"
        "enemy.wolf.hp = 12\n"
        "enemy.wolf.wp = 8\n"
        "enemy.wolf.power = 3\n"
        "enemy.wolf.weaknesses = surge\n"
        "enemy.wolf.abilities = summon:pup, apply_curse:hex\n"
        "summon.pup.hp = 4\n"
        "fate.plain.value = 0\n"
        "fate.plain.count = 3\n"
        "fate.dark.value = 1\n"
        "fate.dark.suit = nav\n"
        "fate.dark.keyword = shadow\n"
        "fate.dark.rules = nav:+2\n"
        "curse.hex.value = -1\n"
        "card.jab.power = 2\n"
        "card.jab.cost = 1\n"
        "balance.weakness_multiplier = 2.0\n"
        "bogus.key = 1\n";

    EncounterContent c;
    std::string err;
    std::string warns;
    expect(parseEncounterContentIni(text, c, &err, &warns), "content parses: " + err);
    const EncounterContext& ctx = c.context;
    expect(ctx.seed == 7u && ctx.resonance == -30.0, "seed and resonance");
    expect(ctx.hero.hp == 25 && ctx.hero.maxHp == 25 && ctx.hero.strength == 6, "hero fields");
    expect(ctx.enemies.size() == 1 && ctx.enemies[0].name == "Grey Wolf", "enemy parsed");
    expect(ctx.enemies[0].maxHp == 12 && ctx.enemies[0].maxWp == std::optional<int>(8), "max defaults to current");
    expect(ctx.enemies[0].weaknesses.count(FateKeyword::Surge) == 1, "weakness parsed");
    expect(ctx.summonPool.count("pup") == 1, "summon pool parsed");
    expect(ctx.fateCards.size() == 4, "fate count expands copies");
    expect(ctx.curseCards.at("hex").isSticky, "curses default to sticky");
    expect(ctx.heroCards.size() == 1 && ctx.heroCards[0].faithCost == 1, "hero card parsed");
    expect(ctx.balance.weaknessMultiplier == 2.0, "balance override");
    expect(warns.find("bogus.key") != std::string::npos, "unknown key warned");
    expect(c.sourceHash != 0, "source hash recorded");

    EncounterContent broken;
    expect(!parseEncounterContentIni("enemy.wolf.hp = 5\nenemy.wolf.abilities = summon:ghost\n", broken, &err),
           "undefined summon rejected");
    expect(err.find("Content error") != std::string::npos, "content error reported");

    EncounterContent empty;
    expect(!parseEncounterContentIni("seed = 3\n", empty, &err), "no enemies rejected");
}

void test_context_validation_limits() {
    std::string err;
    EncounterContext ok = basicContext();
    expect(validateEncounterContext(ok, &err), "basic context is valid: " + err);

    EncounterContext overHp = basicContext();
    overHp.enemies[0].hp = 31;
    expect(!validateEncounterContext(overHp, &err), "enemy hp above max rejected");
    expect(err.find("above max hit points") != std::string::npos, "enemy hp error text");

    EncounterContext noWill = basicContext();
    noWill.enemies[0].wp = 0;
    expect(!validateEncounterContext(noWill, &err), "zero will rejected");
    expect(err.find("has no will") != std::string::npos, "zero will error text");

    EncounterContext overWp = basicContext();
    overWp.enemies[0].wp = 25;
    expect(!validateEncounterContext(overWp, &err), "will above max rejected");
    expect(err.find("above max will") != std::string::npos, "will error text");

    EncounterContext overHero = basicContext();
    overHero.hero.hp = 25;
    expect(!validateEncounterContext(overHero, &err), "hero hp above max rejected");
    expect(err.find("hero starts above") != std::string::npos, "hero error text");

    EncounterContext badSummon = basicContext();
    EncounterEnemy pup = makeEnemy("pup", 4, std::nullopt, 1);
    pup.maxHp = 3;
    badSummon.summonPool["pup"] = pup;
    expect(!validateEncounterContext(badSummon, &err), "summon pool entries are checked too");

    ActionTrace trace;
    parseTraceText("@fatecore_trace 1\n@end_header\ns1 advance\n", trace, &err);
    ReplayReport rep;
    err.clear();
    expect(!runReplay(overHero, trace, ReplayOptions{}, rep, &err), "replay refuses an invalid context");
    expect(err.find("Replay context error") != std::string::npos, "replay context error reported");

    EncounterContent c;
    expect(!parseEncounterContentIni("hero.hp = 30\nhero.max_hp = 20\nenemy.wolf.hp = 5\n", c, &err),
           "content with hero above max rejected");
    expect(err.find("Content error") != std::string::npos, "content validation error reported");
}

void test_content_seed_is_decimal() {
    EncounterContent c;
    std::string err;
    std::string warns;
    expect(parseEncounterContentIni("seed = 010\nenemy.wolf.hp = 5\n", c, &err, &warns), "seed content parses: " + err);
    expect(c.context.seed == 10u, "leading zero seed stays decimal");

    EncounterContent hex;
    expect(parseEncounterContentIni("seed = 0x10\nenemy.wolf.hp = 5\n", hex, &err, &warns), "hex seed content parses");
    expect(warns.find("Invalid seed") != std::string::npos, "hex seed warned");
}

void test_balance_config() {
    BalanceConfig cfg;
    expect(applyBalanceKey(cfg, "weakness_multiplier", "2.0") && cfg.weaknessMultiplier == 2.0, "double key");
    expect(applyBalanceKey(cfg, "surprise_multiplier", "99") && cfg.surpriseMultiplier == 5.0, "values clamp");
    expect(!applyBalanceKey(cfg, "no_such_key", "1"), "unknown key rejected");
    expect(!applyBalanceKey(cfg, "max_hand_size", "lots"), "bad value rejected");

    BalanceConfig rev;
    applyBalanceKey(rev, "fate_fallback_min", "4");
    expect(rev.fateFallbackMin == 2 && rev.fateFallbackMax == 4, "reversed fallback range swaps");

    const fs::path path = fs::temp_directory_path() / "fatecore_test_balance.ini";
    expect(writeDefaultBalanceConfig(path.string()), "default balance written");
    std::string warns;
    const BalanceConfig loaded = loadBalanceConfig(path.string(), &warns);
    expect(loaded == BalanceConfig{}, "default file loads as defaults");
    expect(warns.empty(), "default file has no warnings");

    {
        std::ofstream f(path);
        f << "ritual_resonance_shift = -9\n";
        f << "mystery = 1\n";
    }
    const BalanceConfig custom = loadBalanceConfig(path.string(), &warns);
    expect(custom.ritualResonanceShift == -9, "custom value loaded");
    expect(warns.find("mystery") != std::string::npos, "unknown balance key warned");

    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

int main() {
    std::cout << "Running FateCore tests...\n";

    test_rng_reproducible();
    test_resonance_zones();

    test_fate_deck_conserves_cards();
    test_fate_deck_sticky_survives_reshuffle();
    test_fate_deck_empty_fallback();
    test_fate_resonance_rules();

    test_affinity_and_floor();
    test_calculate_attack_with_fate();

    test_mode_thresholds_vary_per_seed();
    test_mode_swing_forces_weakened();
    test_mode_hysteresis();
    test_desperation_never_defends();
    test_survival_and_weakened_actions();
    test_normal_momentum_counters();
    test_disposition_simulation();

    test_encounter_phase_rejections();
    test_wait_is_a_noop();
    test_weakness_and_resistance_in_combat();
    test_kill_and_pacify_outcomes();
    test_flee_and_defeat();
    test_mulligan_once();
    test_card_play_bonuses();
    test_escalation_and_deescalation();
    test_card_streak_triggers_debuff();
    test_summon_grows_roster();
    test_curse_and_regeneration();
    test_critical_fate_blocks_enemy_attack();
    test_enemy_ability_modifiers();
    test_fate_draw_effects();
    test_resolve_single_enemy_action();
    test_keyword_specials_in_combat();
    test_hp_delta_from_clamped_start();
    test_escalation_tracks_last_attack_on_any_enemy();
    test_snapshot_restore_reproduces();

    test_trace_parse();
    test_replay_checkpoint_equivalence();
    test_trace_expectations_parse();
    test_replay_checks_expectations();

    test_content_parse();
    test_context_validation_limits();
    test_content_seed_is_decimal();
    test_balance_config();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
