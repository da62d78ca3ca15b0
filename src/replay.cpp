#include "replay.hpp"

#include "common.hpp"
#include "rng.hpp"

#include <sstream>

namespace {

bool startsWith(const std::string& s, const char* prefix) {
    const size_t n = std::char_traits<char>::length(prefix);
    return s.size() >= n && s.compare(0, n, prefix) == 0;
}

std::optional<int> parseInt(const std::string& s) {
    try {
        size_t idx = 0;
        int v = std::stoi(s, &idx, 10);
        if (idx != s.size()) return std::nullopt;
        return v;
    } catch (...) {
        return std::nullopt;
    }
}

std::optional<uint64_t> parseU64(const std::string& s) {
    try {
        if (s.empty() || s[0] == '-') return std::nullopt;
        size_t idx = 0;
        unsigned long long v = std::stoull(s, &idx, 10);
        if (idx != s.size()) return std::nullopt;
        return static_cast<uint64_t>(v);
    } catch (...) {
        return std::nullopt;
    }
}

std::optional<uint64_t> parseHex64(const std::string& raw) {
    std::string s = toLower(raw);
    if (startsWith(s, "0x")) s = s.substr(2);
    if (s.empty() || s.size() > 16) return std::nullopt;
    try {
        size_t idx = 0;
        unsigned long long v = std::stoull(s, &idx, 16);
        if (idx != s.size()) return std::nullopt;
        return static_cast<uint64_t>(v);
    } catch (...) {
        return std::nullopt;
    }
}

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

std::string joinComma(const std::vector<std::string>& v) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out.push_back(',');
        out += v[i];
    }
    return out;
}

} // namespace

const char* traceActionKindName(TraceActionKind k) {
    switch (k) {
        case TraceActionKind::Advance:  return "advance";
        case TraceActionKind::Attack:   return "attack";
        case TraceActionKind::Spirit:   return "spirit";
        case TraceActionKind::Card:     return "card";
        case TraceActionKind::Wait:     return "wait";
        case TraceActionKind::Flee:     return "flee";
        case TraceActionKind::Mulligan: return "mulligan";
        case TraceActionKind::Resolve:  return "resolve";
        case TraceActionKind::Snapshot: return "snapshot";
        default:                        return "advance";
    }
}

bool parseTraceActionKind(const std::string& raw, TraceActionKind& out) {
    const std::string s = toLower(raw);
    for (int i = 0; i <= static_cast<int>(TraceActionKind::Snapshot); ++i) {
        const TraceActionKind k = static_cast<TraceActionKind>(i);
        if (s == traceActionKindName(k)) {
            out = k;
            return true;
        }
    }
    if (s == "spirit_attack") { out = TraceActionKind::Spirit; return true; }
    if (s == "use_card") { out = TraceActionKind::Card; return true; }
    return false;
}

bool isTraceExpectationKey(const std::string& key) {
    static const char* const global[] = {
        "result", "round", "phase", "hp", "faith", "resonance",
        "tension", "deck", "hand", "outcome", "state",
    };
    for (const char* k : global) {
        if (key == k) return true;
    }

    // <enemyId>.<field>; summoned ids carry a '#', so split on the last dot.
    const size_t dot = key.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == key.size()) return false;
    const std::string field = key.substr(dot + 1);
    return field == "hp" || field == "wp" || field == "status" || field == "intent" || field == "mode";
}

bool operator==(const TraceStep& a, const TraceStep& b) {
    return a.id == b.id && a.kind == b.kind && a.target == b.target && a.card == b.card && a.cards == b.cards;
}

std::string traceStepLine(const TraceStep& step) {
    std::string line = step.id + " " + traceActionKindName(step.kind);
    switch (step.kind) {
        case TraceActionKind::Attack:
        case TraceActionKind::Spirit:
        case TraceActionKind::Resolve:
            line += " " + step.target;
            break;
        case TraceActionKind::Card:
            line += " " + step.card;
            if (!step.target.empty()) line += " " + step.target;
            break;
        case TraceActionKind::Mulligan:
            line += " " + joinComma(step.cards);
            break;
        default:
            break;
    }
    return line;
}

std::string traceExpectLine(const TraceStep& step) {
    if (step.expect.empty()) return std::string();
    std::string line = step.id + " expect";
    for (const auto& x : step.expect) {
        line += " " + x.key + "=" + x.value;
    }
    return line;
}

std::string canonicalTraceText(const ActionTrace& trace) {
    std::string out = "trace " + trace.meta.traceId + "\n";
    for (const auto& s : trace.steps) {
        out += traceStepLine(s);
        out.push_back('\n');
    }
    return out;
}

uint64_t traceFingerprint(const ActionTrace& trace) {
    const std::string s = canonicalTraceText(trace);
    return fnv1a64Bytes(s.data(), s.size());
}

bool TraceWriter::open(const std::filesystem::path& path, const TraceMeta& meta, std::string* err) {
    close();
    path_ = path;
    f_.open(path_, std::ios::out | std::ios::trunc);
    if (!f_) {
        setErr(err, "Failed to open trace for writing: " + path_.string());
        return false;
    }

    f_ << "@fatecore_trace " << meta.formatVersion << "\n";
    f_ << "@game_version " << meta.gameVersion << "\n";
    if (!meta.traceId.empty()) f_ << "@trace_id " << meta.traceId << "\n";
    if (meta.seed) f_ << "@seed " << *meta.seed << "\n";
    if (meta.expectDigest) f_ << "@expect_digest " << hex64(*meta.expectDigest) << "\n";
    if (meta.expectFinalState) f_ << "@expect_final_state " << hex64(*meta.expectFinalState) << "\n";
    f_ << "@end_header\n";
    f_.flush();
    return true;
}

void TraceWriter::close() {
    if (f_.is_open()) {
        f_.flush();
        f_.close();
    }
    path_.clear();
}

void TraceWriter::writeLine_(const std::string& line) {
    if (!f_) return;
    f_ << line << "\n";
}

void TraceWriter::writeStep(const TraceStep& step) {
    writeLine_(traceStepLine(step));
    if (!step.expect.empty()) writeLine_(traceExpectLine(step));
}

bool parseTraceText(const std::string& text, ActionTrace& out, std::string* err) {
    out = ActionTrace{};

    std::istringstream in(text);
    bool inHeader = true;
    bool sawMagic = false;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = trim(line);
        if (line.empty()) continue;
        if (line[0] == '#') continue;

        if (inHeader) {
            if (line == "@end_header") {
                inHeader = false;
                continue;
            }

            if (!startsWith(line, "@")) {
                setErr(err, "Trace parse error (expected header @key): line " + std::to_string(lineNo));
                return false;
            }

            std::istringstream iss(line);
            std::string key;
            iss >> key;
            std::string value;
            std::getline(iss, value);
            value = trim(value);

            if (key == "@fatecore_trace") {
                auto v = parseInt(value);
                if (!v.has_value() || *v <= 0) {
                    setErr(err, "Trace parse error (bad format version) line " + std::to_string(lineNo));
                    return false;
                }
                if (*v > 1) {
                    setErr(err, "Trace format " + std::to_string(*v) + " is newer than this build");
                    return false;
                }
                out.meta.formatVersion = *v;
                sawMagic = true;
                continue;
            }
            if (key == "@game_version") {
                out.meta.gameVersion = value;
                continue;
            }
            if (key == "@trace_id") {
                out.meta.traceId = value;
                continue;
            }
            if (key == "@seed") {
                auto v = parseU64(value);
                if (!v.has_value()) {
                    setErr(err, "Trace parse error (bad seed) line " + std::to_string(lineNo));
                    return false;
                }
                out.meta.seed = *v;
                continue;
            }
            if (key == "@expect_digest" || key == "@expect_final_state") {
                auto v = parseHex64(value);
                if (!v.has_value()) {
                    setErr(err, "Trace parse error (bad " + key.substr(1) + ") line " + std::to_string(lineNo));
                    return false;
                }
                if (key == "@expect_digest") out.meta.expectDigest = *v;
                else out.meta.expectFinalState = *v;
                continue;
            }

            // Unknown header keys are ignored for forward compat.
            continue;
        }

        // <stepId> <action> [args...]
        std::istringstream iss(line);
        TraceStep step;
        std::string action;
        if (!(iss >> step.id >> action)) {
            setErr(err, "Trace parse error (expected '<step> <action>') line " + std::to_string(lineNo));
            return false;
        }

        if (toLower(action) == "expect") {
            TraceStep* owner = nullptr;
            for (auto it = out.steps.rbegin(); it != out.steps.rend(); ++it) {
                if (it->id == step.id) {
                    owner = &*it;
                    break;
                }
            }
            if (!owner) {
                setErr(err, "Trace parse error (expect for unknown step '" + step.id + "') line " + std::to_string(lineNo));
                return false;
            }

            std::string tok;
            bool any = false;
            while (iss >> tok) {
                const size_t eq = tok.find('=');
                TraceExpectation x;
                if (eq != std::string::npos) {
                    x.key = toLower(tok.substr(0, eq));
                    x.value = tok.substr(eq + 1);
                }
                if (eq == std::string::npos || !isTraceExpectationKey(x.key)) {
                    setErr(err, "Trace parse error (bad expectation '" + tok + "') line " + std::to_string(lineNo));
                    return false;
                }
                owner->expect.push_back(std::move(x));
                any = true;
            }
            if (!any) {
                setErr(err, "Trace parse error (empty expect) line " + std::to_string(lineNo));
                return false;
            }
            continue;
        }
        if (!parseTraceActionKind(action, step.kind)) {
            setErr(err, "Trace parse error (unknown action '" + action + "') line " + std::to_string(lineNo));
            return false;
        }

        switch (step.kind) {
            case TraceActionKind::Attack:
            case TraceActionKind::Spirit:
            case TraceActionKind::Resolve:
                if (!(iss >> step.target)) {
                    setErr(err, "Trace parse error (missing target) line " + std::to_string(lineNo));
                    return false;
                }
                break;
            case TraceActionKind::Card:
                if (!(iss >> step.card)) {
                    setErr(err, "Trace parse error (missing card) line " + std::to_string(lineNo));
                    return false;
                }
                iss >> step.target;
                break;
            case TraceActionKind::Mulligan: {
                std::string list;
                std::getline(iss, list);
                step.cards = splitList(list);
                break;
            }
            default:
                break;
        }

        out.steps.push_back(std::move(step));
    }

    if (!sawMagic) {
        setErr(err, "Trace parse error (missing @fatecore_trace)");
        return false;
    }
    if (inHeader) {
        setErr(err, "Trace parse error (missing @end_header)");
        return false;
    }
    return true;
}

bool loadTraceFile(const std::filesystem::path& path, ActionTrace& out, std::string* err) {
    out = ActionTrace{};

    std::ifstream f(path);
    if (!f) {
        setErr(err, "Failed to open trace for reading: " + path.string());
        return false;
    }

    std::ostringstream oss;
    oss << f.rdbuf();
    return parseTraceText(oss.str(), out, err);
}
