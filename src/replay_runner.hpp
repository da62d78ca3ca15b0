#pragma once

#include "encounter.hpp"
#include "replay.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

// Headless replay runner: drives a fresh encounter engine with a recorded
// action trace and records a digest after every step.
//
// Useful for CI/regression testing and for diagnosing desyncs between an
// uninterrupted run and one that was checkpointed (saved, rebuilt, restored).

struct ReplayOptions {
    // Step ids after which a checkpoint is taken.
    std::vector<std::string> checkpointSteps;

    // If false, "snapshot" steps are digested but do not checkpoint.
    bool honorSnapshotSteps = true;

    // Optional safety limit (0 = unlimited).
    uint32_t maxSteps = 0;

    // Check the trace's expect lines and @expect_* header values.
    bool verifyExpectations = true;
};

// Observable state after one step. Everything here is part of the digest.
struct StepDigest {
    uint32_t index = 0;
    std::string stepId;
    std::string action;
    bool success = true;
    ErrorCode error = ErrorCode::None;

    int round = 0;
    EncounterPhase phase = EncounterPhase::Intent;
    int heroHp = 0;
    int heroFaith = 0;
    double resonance = 0.0;
    int tension = 0;

    int drawCount = 0;
    int discardCount = 0;

    RNGState rng;
    uint64_t stateHash = 0;
};

std::string stepDigestLine(const StepDigest& d);

// If two runs differ, we categorize the difference for tooling/CI purposes.
//
// This enum is intentionally small and stable; new categories should be appended.
enum class ReplayFailureKind : uint8_t {
    None = 0,
    TraceMismatch,
    StepCountMismatch,
    DigestMismatch,
    FinalStateMismatch,
    ExpectationMismatch,
};

inline const char* replayFailureKindName(ReplayFailureKind k) {
    switch (k) {
        case ReplayFailureKind::None:                return "None";
        case ReplayFailureKind::TraceMismatch:       return "TraceMismatch";
        case ReplayFailureKind::StepCountMismatch:   return "StepCountMismatch";
        case ReplayFailureKind::DigestMismatch:      return "DigestMismatch";
        case ReplayFailureKind::FinalStateMismatch:  return "FinalStateMismatch";
        case ReplayFailureKind::ExpectationMismatch: return "ExpectationMismatch";
    }
    return "None";
}

struct ReplayComparison {
    bool equal = true;
    ReplayFailureKind failure = ReplayFailureKind::None;

    // DigestMismatch / ExpectationMismatch details (first divergent step).
    uint32_t firstDivergentStep = 0;
    std::string stepId;
    std::string expectedLine;
    std::string gotLine;
};

struct ReplayReport {
    uint64_t traceFingerprint = 0;
    uint64_t digestFingerprint = 0;
    uint64_t finalStateFingerprint = 0;

    std::vector<StepDigest> digests;
    EncounterResult result;

    uint32_t checkpointsTaken = 0;
    uint32_t expectationsChecked = 0;

    // Set when a pinned value disagrees with the run (runReplay returns false).
    ReplayComparison expectation;

    // Message log of the final engine (presentation only; never compared).
    std::deque<Message> log;
};

// Build a fresh engine from `ctx` (the trace's @seed, if any, overrides
// ctx.seed) and play every step. Rejected actions are recorded in their
// digest, not treated as run failures. A failed expectation stops the run at
// that step and is reported in `out.expectation`.
bool runReplay(const EncounterContext& ctx,
               const ActionTrace& trace,
               const ReplayOptions& opt,
               ReplayReport& out,
               std::string* err = nullptr);

ReplayComparison compareReplayReports(const ReplayReport& expected, const ReplayReport& got);

std::string formatReplayComparison(const ReplayComparison& cmp);
