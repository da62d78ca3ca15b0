#include "fingerprint.hpp"

#include "common.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace {

void writeCard(std::ostringstream& ss, const FateCard& c) {
    ss << c.id << ":" << c.baseValue << (c.isCritical ? "!" : "") << (c.isSticky ? "*" : "");
}

void writeCards(std::ostringstream& ss, const char* label, const std::vector<FateCard>& cards) {
    ss << label << "=";
    for (size_t i = 0; i < cards.size(); ++i) {
        if (i) ss << ",";
        writeCard(ss, cards[i]);
    }
    ss << "\n";
}

void writeHeroCards(std::ostringstream& ss, const char* label, const std::vector<HeroCard>& cards) {
    ss << label << "=";
    for (size_t i = 0; i < cards.size(); ++i) {
        if (i) ss << ",";
        ss << cards[i].id;
    }
    ss << "\n";
}

void writeSlot(std::ostringstream& ss, const EnemySlot& s) {
    const EncounterEnemy& e = s.enemy;
    ss << "enemy " << e.id
       << " src=" << s.sourceId
       << " hp=" << e.hp << "/" << e.maxHp
       << " wp=" << (e.wp ? std::to_string(*e.wp) : std::string("-"))
       << "/" << (e.maxWp ? std::to_string(*e.maxWp) : std::string("-"))
       << " pow=" << e.power
       << " def=" << e.defense
       << " sdef=" << e.spiritDefense
       << " out=" << entityOutcomeName(s.outcome)
       << " mode=" << enemyModeName(s.mode.currentMode)
       << " thr=" << s.mode.survivalThreshold << "," << s.mode.desperationThreshold
       << " hyst=" << s.mode.hysteresisCounter
       << " prev=" << s.mode.previousDisposition
       << " shield=" << s.rageShield
       << " provoke=" << s.provokePenalty
       << " plea=" << s.pleaBacklash
       << " summoned=" << (s.summonUsed ? 1 : 0);
    if (s.intent) {
        ss << " intent=" << intentTypeName(s.intent->type) << ":" << s.intent->value;
        if (!s.intent->ref.empty()) ss << ":" << s.intent->ref;
    } else {
        ss << " intent=-";
    }
    ss << "\n";
}

} // namespace

std::string canonicalDouble(double v) {
    if (std::isnan(v)) v = 0.0;
    const long long milli = std::llround(v * 1000.0);
    std::ostringstream ss;
    ss << (milli < 0 ? "-" : "") << (std::llabs(milli) / 1000) << ".";
    const long long frac = std::llabs(milli) % 1000;
    if (frac < 100) ss << "0";
    if (frac < 10) ss << "0";
    ss << frac;
    return ss.str();
}

std::string canonicalEncounterState(const EncounterEngine& engine) {
    const EncounterState& st = engine.state();
    std::ostringstream ss;

    ss << "phase=" << encounterPhaseName(st.phase) << "\n";
    ss << "round=" << st.round << "\n";
    ss << "hero hp=" << st.heroHp << " faith=" << st.heroFaith << "\n";
    ss << "bonus atk=" << st.turnAttackBonus << " def=" << st.turnDefenseBonus
       << " inf=" << st.turnInfluenceBonus << " penalty=" << st.heroAttackPenalty << "\n";
    ss << "flags finish=" << (st.finishActionUsed ? 1 : 0) << " mulligan=" << (st.mulliganDone ? 1 : 0)
       << " fled=" << (st.fled ? 1 : 0) << "\n";
    ss << "track=";
    if (st.lastAttackTrack) ss << (*st.lastAttackTrack == AttackTrack::Physical ? "physical" : "spiritual");
    else ss << "-";
    ss << " momentum=";
    if (st.momentumType) ss << static_cast<int>(*st.momentumType) << "x" << st.momentumCount;
    else ss << "-";
    ss << "\n";
    ss << "resonance=" << canonicalDouble(engine.resonance()) << "\n";
    ss << "tension=" << st.tension << "\n";
    ss << "summons=" << st.summonCounter << "\n";

    ss << "curses=";
    for (size_t i = 0; i < st.appliedCurses.size(); ++i) {
        if (i) ss << ",";
        ss << st.appliedCurses[i];
    }
    ss << "\n";

    writeHeroCards(ss, "hand", st.hand);
    writeHeroCards(ss, "card_discard", st.cardDiscard);

    for (const auto& s : st.enemies) writeSlot(ss, s);

    const FateDeckManager& deck = engine.fateDeck();
    writeCards(ss, "fate_draw", deck.drawPile());
    writeCards(ss, "fate_discard", deck.discardPile());
    writeCards(ss, "fate_sticky", deck.getState().stickyCards);

    const RNGState rng = engine.rngState();
    ss << "rng=" << hex64(rng.state) << " draws=" << rng.draws << "\n";
    return ss.str();
}

uint64_t encounterStateHash(const EncounterEngine& engine) {
    const std::string s = canonicalEncounterState(engine);
    return fnv1a64Bytes(s.data(), s.size());
}

void FingerprintBuilder::addLine(const std::string& line) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(line.data());
    for (size_t i = 0; i < line.size(); ++i) {
        h_ ^= static_cast<uint64_t>(p[i]);
        h_ *= 1099511628211ull;
    }
    h_ ^= static_cast<uint64_t>('\n');
    h_ *= 1099511628211ull;
    ++lines_;
}

uint64_t fingerprintLines(const std::vector<std::string>& lines) {
    FingerprintBuilder b;
    for (const auto& l : lines) b.addLine(l);
    return b.value();
}
