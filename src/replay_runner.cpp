#include "replay_runner.hpp"

#include "common.hpp"
#include "fingerprint.hpp"

#include <algorithm>
#include <memory>
#include <sstream>

namespace {

ActionResult dispatchStep(EncounterEngine& engine, const TraceStep& step) {
    switch (step.kind) {
        case TraceActionKind::Advance:
            return engine.advancePhase();
        case TraceActionKind::Attack:
            return engine.performAction(PlayerAction::attack(step.target));
        case TraceActionKind::Spirit:
            return engine.performAction(PlayerAction::spiritAttack(step.target));
        case TraceActionKind::Card:
            return engine.performAction(PlayerAction::useCard(step.card, step.target));
        case TraceActionKind::Wait:
            return engine.performAction(PlayerAction::wait());
        case TraceActionKind::Flee:
            return engine.performAction(PlayerAction::flee());
        case TraceActionKind::Mulligan:
            return engine.performAction(PlayerAction::mulligan(step.cards));
        case TraceActionKind::Resolve:
            return engine.resolveEnemyAction(step.target);
        case TraceActionKind::Snapshot:
            // Checkpointing is handled by the runner.
            return ActionResult::ok();
    }
    return ActionResult::ok();
}

StepDigest digestOf(const EncounterEngine& engine, uint32_t index, const TraceStep& step, const ActionResult& r) {
    StepDigest d;
    d.index = index;
    d.stepId = step.id;
    d.action = traceActionKindName(step.kind);
    d.success = r.success;
    d.error = r.error;
    d.round = engine.round();
    d.phase = engine.phase();
    d.heroHp = engine.heroHp();
    d.heroFaith = engine.heroFaith();
    d.resonance = engine.resonance();
    d.tension = engine.tension();
    d.drawCount = engine.fateDeck().drawCount();
    d.discardCount = engine.fateDeck().discardCount();
    d.rng = engine.rngState();
    d.stateHash = encounterStateHash(engine);
    return d;
}

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

std::string intentText(const EnemySlot& slot) {
    if (!slot.intent) return "none";
    const EnemyIntent& i = *slot.intent;
    if (i.type == IntentType::Summon) return std::string("summon:") + i.ref;
    return std::string(intentTypeName(i.type)) + ":" + std::to_string(i.value);
}

// Current value of an expectation key, formatted the way trace files write it.
std::string observedValue(const EncounterEngine& engine, const ActionResult& r, const std::string& key) {
    if (key == "result") return r.success ? "ok" : errorCodeName(r.error);
    if (key == "round") return std::to_string(engine.round());
    if (key == "phase") return encounterPhaseName(engine.phase());
    if (key == "hp") return std::to_string(engine.heroHp());
    if (key == "faith") return std::to_string(engine.heroFaith());
    if (key == "resonance") return canonicalDouble(engine.resonance());
    if (key == "tension") return std::to_string(engine.tension());
    if (key == "deck") {
        return std::to_string(engine.fateDeck().drawCount()) + "/" + std::to_string(engine.fateDeck().discardCount());
    }
    if (key == "hand") {
        std::string ids;
        for (const auto& c : engine.hand()) {
            if (!ids.empty()) ids.push_back(',');
            ids += c.id;
        }
        return ids.empty() ? "-" : ids;
    }
    if (key == "outcome") return encounterOutcomeName(engine.currentOutcome());
    if (key == "state") return hex64(encounterStateHash(engine));

    const size_t dot = key.rfind('.');
    const EnemySlot* slot = (dot == std::string::npos) ? nullptr : engine.findEnemy(key.substr(0, dot));
    if (!slot) return "absent";
    const std::string field = key.substr(dot + 1);
    if (field == "hp") return std::to_string(slot->enemy.hp);
    if (field == "wp") return slot->enemy.wp ? std::to_string(*slot->enemy.wp) : "-";
    if (field == "status") return entityOutcomeName(slot->outcome);
    if (field == "intent") return intentText(*slot);
    if (field == "mode") return enemyModeName(slot->mode.currentMode);
    return "?";
}

// Trace files may write resonance as "5" or hashes with a 0x prefix.
std::string normalizedExpectation(const TraceExpectation& x) {
    if (x.key == "resonance") {
        try {
            size_t idx = 0;
            const double v = std::stod(x.value, &idx);
            if (idx == x.value.size()) return canonicalDouble(v);
        } catch (...) {
            return x.value;
        }
    }
    if (x.key == "state") {
        std::string v = toLower(x.value);
        if (v.rfind("0x", 0) == 0) v = v.substr(2);
        while (v.size() < 16) v.insert(v.begin(), '0');
        return v;
    }
    return x.value;
}

ReplayComparison expectationFailure(uint32_t index, const std::string& stepId, const std::string& key,
                                    const std::string& expected, const std::string& got) {
    ReplayComparison cmp;
    cmp.equal = false;
    cmp.failure = ReplayFailureKind::ExpectationMismatch;
    cmp.firstDivergentStep = index;
    cmp.stepId = stepId;
    cmp.expectedLine = key + "=" + expected;
    cmp.gotLine = key + "=" + got;
    return cmp;
}

} // namespace

std::string stepDigestLine(const StepDigest& d) {
    std::ostringstream ss;
    ss << d.index << " " << d.stepId << " " << d.action
       << " " << (d.success ? "ok" : errorCodeName(d.error))
       << " round=" << d.round
       << " phase=" << encounterPhaseName(d.phase)
       << " hp=" << d.heroHp
       << " faith=" << d.heroFaith
       << " resonance=" << canonicalDouble(d.resonance)
       << " tension=" << d.tension
       << " deck=" << d.drawCount << "/" << d.discardCount
       << " rng=" << hex64(d.rng.state) << ":" << d.rng.draws
       << " state=" << hex64(d.stateHash);
    return ss.str();
}

bool runReplay(const EncounterContext& ctx,
               const ActionTrace& trace,
               const ReplayOptions& opt,
               ReplayReport& out,
               std::string* err) {
    out = ReplayReport{};

    EncounterContext runCtx = ctx;
    if (trace.meta.seed) runCtx.seed = *trace.meta.seed;

    std::string verr;
    if (!validateEncounterContext(runCtx, &verr)) {
        setErr(err, "Replay context error: " + verr);
        return false;
    }

    if (opt.maxSteps != 0 && trace.steps.size() > opt.maxSteps) {
        std::ostringstream ss;
        ss << "Replay runner exceeded safety limit (steps=" << trace.steps.size()
           << ", maxSteps=" << opt.maxSteps << ").";
        setErr(err, ss.str());
        return false;
    }

    out.traceFingerprint = traceFingerprint(trace);

    auto engine = std::make_unique<EncounterEngine>(runCtx);
    FingerprintBuilder digestFp;

    for (size_t i = 0; i < trace.steps.size(); ++i) {
        const TraceStep& step = trace.steps[i];
        const ActionResult r = dispatchStep(*engine, step);

        const bool listed = std::find(opt.checkpointSteps.begin(), opt.checkpointSteps.end(), step.id)
                         != opt.checkpointSteps.end();
        const bool snapshotStep = (step.kind == TraceActionKind::Snapshot) && opt.honorSnapshotSteps;
        if (listed || snapshotStep) {
            // Save, throw the engine away, rebuild from the context, restore.
            const EncounterSnapshot snap = engine->saveSnapshot();
            engine = std::make_unique<EncounterEngine>(runCtx);
            engine->restoreSnapshot(snap);
            ++out.checkpointsTaken;
        }

        StepDigest d = digestOf(*engine, static_cast<uint32_t>(i), step, r);
        digestFp.addLine(stepDigestLine(d));
        out.digests.push_back(std::move(d));

        if (!opt.verifyExpectations) continue;
        for (const TraceExpectation& x : step.expect) {
            const std::string want = normalizedExpectation(x);
            const std::string got = observedValue(*engine, r, x.key);
            if (want != got) {
                out.expectation = expectationFailure(static_cast<uint32_t>(i), step.id, x.key, want, got);
                out.log = engine->messages();
                setErr(err, formatReplayComparison(out.expectation));
                return false;
            }
            ++out.expectationsChecked;
        }
    }

    out.digestFingerprint = digestFp.value();
    out.finalStateFingerprint = encounterStateHash(*engine);

    if (opt.verifyExpectations) {
        const uint32_t end = static_cast<uint32_t>(trace.steps.size());
        if (trace.meta.expectDigest && *trace.meta.expectDigest != out.digestFingerprint) {
            out.expectation = expectationFailure(end, std::string(), "digest",
                                                 hex64(*trace.meta.expectDigest), hex64(out.digestFingerprint));
        } else if (trace.meta.expectFinalState && *trace.meta.expectFinalState != out.finalStateFingerprint) {
            out.expectation = expectationFailure(end, std::string(), "final_state",
                                                 hex64(*trace.meta.expectFinalState), hex64(out.finalStateFingerprint));
        }
        if (!out.expectation.equal) {
            out.log = engine->messages();
            setErr(err, formatReplayComparison(out.expectation));
            return false;
        }
        if (trace.meta.expectDigest) ++out.expectationsChecked;
        if (trace.meta.expectFinalState) ++out.expectationsChecked;
    }

    out.result = engine->finishEncounter();
    out.log = engine->messages();
    return true;
}

ReplayComparison compareReplayReports(const ReplayReport& expected, const ReplayReport& got) {
    ReplayComparison cmp;

    if (expected.traceFingerprint != got.traceFingerprint) {
        cmp.equal = false;
        cmp.failure = ReplayFailureKind::TraceMismatch;
        cmp.expectedLine = hex64(expected.traceFingerprint);
        cmp.gotLine = hex64(got.traceFingerprint);
        return cmp;
    }

    const size_t n = std::min(expected.digests.size(), got.digests.size());
    for (size_t i = 0; i < n; ++i) {
        const std::string a = stepDigestLine(expected.digests[i]);
        const std::string b = stepDigestLine(got.digests[i]);
        if (a != b) {
            cmp.equal = false;
            cmp.failure = ReplayFailureKind::DigestMismatch;
            cmp.firstDivergentStep = static_cast<uint32_t>(i);
            cmp.expectedLine = a;
            cmp.gotLine = b;
            return cmp;
        }
    }

    if (expected.digests.size() != got.digests.size()) {
        cmp.equal = false;
        cmp.failure = ReplayFailureKind::StepCountMismatch;
        cmp.firstDivergentStep = static_cast<uint32_t>(n);
        cmp.expectedLine = std::to_string(expected.digests.size());
        cmp.gotLine = std::to_string(got.digests.size());
        return cmp;
    }

    if (expected.finalStateFingerprint != got.finalStateFingerprint) {
        cmp.equal = false;
        cmp.failure = ReplayFailureKind::FinalStateMismatch;
        cmp.expectedLine = hex64(expected.finalStateFingerprint);
        cmp.gotLine = hex64(got.finalStateFingerprint);
    }
    return cmp;
}

std::string formatReplayComparison(const ReplayComparison& cmp) {
    if (cmp.equal) return "REPLAY OK";

    std::ostringstream ss;
    switch (cmp.failure) {
        case ReplayFailureKind::DigestMismatch:
            ss << "REPLAY DESYNC at step " << cmp.firstDivergentStep
               << "\n  expected: " << cmp.expectedLine
               << "\n  got:      " << cmp.gotLine;
            break;
        case ReplayFailureKind::StepCountMismatch:
            ss << "REPLAY DESYNC: step count (expected " << cmp.expectedLine
               << ", got " << cmp.gotLine << ")";
            break;
        case ReplayFailureKind::ExpectationMismatch:
            if (cmp.stepId.empty()) {
                ss << "REPLAY EXPECTATION FAILED after the last step";
            } else {
                ss << "REPLAY EXPECTATION FAILED at step " << cmp.firstDivergentStep << " (" << cmp.stepId << ")";
            }
            ss << "\n  expected: " << cmp.expectedLine
               << "\n  got:      " << cmp.gotLine;
            break;
        default:
            ss << "REPLAY DESYNC: " << replayFailureKindName(cmp.failure)
               << " (expected 0x" << cmp.expectedLine
               << ", got 0x" << cmp.gotLine << ")";
            break;
    }
    return ss.str();
}
