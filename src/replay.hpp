#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

// ------------------------------------------------------------
// Action traces (recording + playback input)
// ------------------------------------------------------------
//
// Human-readable, line-based file format (v1):
//
//   @fatecore_trace 1
//   @game_version dev
//   @trace_id wolf_duel
//   @seed 42            (optional; overrides the content seed)
//   @expect_digest <hex>        (optional; digest fingerprint of the run)
//   @expect_final_state <hex>   (optional; state hash after the last step)
//   @end_header
//
//   <stepId> advance
//   <stepId> attack <enemyId>
//   <stepId> spirit <enemyId>
//   <stepId> card <cardId> [<enemyId>]
//   <stepId> wait
//   <stepId> flee
//   <stepId> mulligan <cardId,cardId,...>
//   <stepId> resolve <enemyId>
//   <stepId> snapshot
//   <stepId> expect <key>=<value> [<key>=<value> ...]
//
// Lines starting with '#' are comments.
//
// An expect line pins observable state right after the named (already listed)
// step. Keys: result, round, phase, hp, faith, resonance, tension, deck
// (draw/discard), hand (ids, '-' when empty), outcome, state (hex hash), and
// per enemy <enemyId>.hp, .wp, .status, .intent, .mode.

enum class TraceActionKind : uint8_t {
    Advance = 0,
    Attack,
    Spirit,
    Card,
    Wait,
    Flee,
    Mulligan,
    Resolve,
    Snapshot,
};

const char* traceActionKindName(TraceActionKind k);
bool parseTraceActionKind(const std::string& s, TraceActionKind& out);

struct TraceExpectation {
    std::string key;
    std::string value;
};

bool isTraceExpectationKey(const std::string& key);

struct TraceStep {
    std::string id;
    TraceActionKind kind = TraceActionKind::Advance;
    std::string target;             // attack/spirit/resolve/card
    std::string card;               // card
    std::vector<std::string> cards; // mulligan

    // Checked after the step runs. Not part of the step's identity.
    std::vector<TraceExpectation> expect;
};

bool operator==(const TraceStep& a, const TraceStep& b);

struct TraceMeta {
    int formatVersion = 1;
    std::string gameVersion;
    std::string traceId;
    std::optional<uint64_t> seed;

    std::optional<uint64_t> expectDigest;
    std::optional<uint64_t> expectFinalState;
};

struct ActionTrace {
    TraceMeta meta;
    std::vector<TraceStep> steps;
};

// "<stepId> <action> [args]" exactly as written to a trace file.
std::string traceStepLine(const TraceStep& step);

// "<stepId> expect k=v ..." or empty when the step pins nothing.
std::string traceExpectLine(const TraceStep& step);

// Order-stable serialization of id + steps; the header's version and seed
// are not part of the trace identity.
std::string canonicalTraceText(const ActionTrace& trace);
uint64_t traceFingerprint(const ActionTrace& trace);

// ------------------------------------------------------------
// Writer (streaming)
// ------------------------------------------------------------
class TraceWriter {
public:
    bool open(const std::filesystem::path& path, const TraceMeta& meta, std::string* err = nullptr);
    void close();
    bool isOpen() const { return f_.is_open(); }
    std::filesystem::path path() const { return path_; }

    void writeStep(const TraceStep& step);

private:
    void writeLine_(const std::string& line);

    std::filesystem::path path_;
    std::ofstream f_;
};

// ------------------------------------------------------------
// Reader
// ------------------------------------------------------------
bool parseTraceText(const std::string& text, ActionTrace& out, std::string* err = nullptr);
bool loadTraceFile(const std::filesystem::path& path, ActionTrace& out, std::string* err = nullptr);
