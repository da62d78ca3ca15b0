#include "common.hpp"
#include "content.hpp"
#include "fingerprint.hpp"
#include "replay.hpp"
#include "replay_runner.hpp"
#include "settings.hpp"
#include "version.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " --content <encounter.ini> --trace <file.trace> [options]\n"
        << "  " << argv0 << " --write-default-balance <path>\n\n"
        << "Options:\n"
        << "  --content <path>        Encounter content INI (roster, hero, fate deck, cards).\n"
        << "  --trace <path>          Action trace to replay.\n"
        << "  --seed <n>              Override the seed (content and trace header).\n"
        << "  --checkpoint <a,b,...>  Step ids after which the checked run saves, rebuilds and restores.\n"
        << "  --balance <path>        Balance INI; replaces the content's balance values.\n"
        << "  --print-digests         Print the per-step digests of the linear run.\n"
        << "  --log                   Print the encounter message log of the linear run.\n"
        << "  --json-report <path>    Write a JSON summary report (useful for CI).\n"
        << "  --write-default-balance <path>  Write a commented default balance file and exit.\n"
        << "  --version               Print version.\n"
        << "  --help                  Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseU64(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        const uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (UINT64_MAX - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

static std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

static void writeJsonRun(std::ofstream& f, const char* name, const ReplayReport& r, bool last) {
    f << "    \"" << name << "\": {\n";
    f << "      \"steps\": " << r.digests.size() << ",\n";
    f << "      \"checkpoints\": " << r.checkpointsTaken << ",\n";
    f << "      \"expectationsChecked\": " << r.expectationsChecked << ",\n";
    f << "      \"digestFingerprint\": \"" << hex64(r.digestFingerprint) << "\",\n";
    f << "      \"finalStateFingerprint\": \"" << hex64(r.finalStateFingerprint) << "\",\n";
    f << "      \"outcome\": \"" << encounterOutcomeName(r.result.outcome) << "\",\n";
    f << "      \"aggregate\": \"" << aggregateOutcomeName(r.result.aggregate) << "\"\n";
    f << "    }" << (last ? "" : ",") << "\n";
}

static bool writeJsonReport(const std::filesystem::path& path,
                            const std::filesystem::path& tracePath,
                            const ActionTrace& trace,
                            uint64_t contentHash,
                            const ReplayReport& linear,
                            const ReplayReport& checked,
                            const ReplayComparison& cmp,
                            std::string* err) {
    std::ofstream f(path);
    if (!f) {
        if (err) *err = "Failed to open JSON report for writing: " + path.generic_string();
        return false;
    }

    f << "{\n";
    f << "  \"tool\": \"FateCoreHeadless\",\n";
    f << "  \"gameVersion\": \"" << jsonEscape(FATECORE_VERSION) << "\",\n";
    f << "  \"trace\": \"" << jsonEscape(tracePath.generic_string()) << "\",\n";
    f << "  \"traceId\": \"" << jsonEscape(trace.meta.traceId) << "\",\n";
    f << "  \"traceFingerprint\": \"" << hex64(linear.traceFingerprint) << "\",\n";
    f << "  \"contentHash\": \"" << hex64(contentHash) << "\",\n";
    f << "  \"ok\": " << (cmp.equal ? "true" : "false") << ",\n";
    if (!cmp.equal) {
        f << "  \"failure\": \"" << replayFailureKindName(cmp.failure) << "\",\n";
        f << "  \"firstDivergentStep\": " << cmp.firstDivergentStep << ",\n";
        if (!cmp.stepId.empty()) f << "  \"stepId\": \"" << jsonEscape(cmp.stepId) << "\",\n";
        f << "  \"expected\": \"" << jsonEscape(cmp.expectedLine) << "\",\n";
        f << "  \"got\": \"" << jsonEscape(cmp.gotLine) << "\",\n";
    }
    f << "  \"runs\": {\n";
    writeJsonRun(f, "linear", linear, false);
    writeJsonRun(f, "checkpointed", checked, true);
    f << "  }\n";
    f << "}\n";
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::filesystem::path contentPath;
    std::filesystem::path tracePath;
    std::filesystem::path balancePath;
    std::filesystem::path jsonReport;
    std::filesystem::path defaultBalanceOut;
    std::vector<std::string> checkpoints;
    bool haveSeed = false;
    uint64_t seed = 0;
    bool printDigests = false;
    bool printLog = false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << FATECORE_APPNAME << " " << FATECORE_VERSION << "\n";
            return 0;
        } else if (a == "--content") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--content requires a path\n";
                return 2;
            }
            contentPath = v;
        } else if (a == "--trace") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--trace requires a path\n";
                return 2;
            }
            tracePath = v;
        } else if (a == "--seed") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--seed requires a value\n";
                return 2;
            }
            if (!parseU64(v, seed)) {
                std::cerr << "Invalid --seed: " << v << "\n";
                return 2;
            }
            haveSeed = true;
        } else if (a == "--checkpoint") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--checkpoint requires a list of step ids\n";
                return 2;
            }
            for (const auto& id : splitList(v)) checkpoints.push_back(id);
        } else if (a == "--balance") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--balance requires a path\n";
                return 2;
            }
            balancePath = v;
        } else if (a == "--print-digests") {
            printDigests = true;
        } else if (a == "--log") {
            printLog = true;
        } else if (a == "--json-report") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--json-report requires a path\n";
                return 2;
            }
            jsonReport = v;
        } else if (a == "--write-default-balance") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--write-default-balance requires a path\n";
                return 2;
            }
            defaultBalanceOut = v;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (!defaultBalanceOut.empty()) {
        if (!writeDefaultBalanceConfig(defaultBalanceOut.string())) {
            std::cerr << "Failed to write balance file: " << defaultBalanceOut.generic_string() << "\n";
            return 1;
        }
        std::cout << "Wrote " << defaultBalanceOut.generic_string() << "\n";
        return 0;
    }

    if (contentPath.empty() || tracePath.empty()) {
        std::cerr << "Missing --content <file> or --trace <file>\n";
        printUsage(argv[0]);
        return 2;
    }

    EncounterContent content;
    std::string err;
    std::string warns;
    if (!loadEncounterContentIni(contentPath.string(), content, &err, &warns)) {
        std::cerr << "Failed to load content: " << contentPath.generic_string() << "\n";
        std::cerr << "  " << err << "\n";
        if (!warns.empty()) std::cerr << warns;
        return 1;
    }
    if (!warns.empty()) std::cout << warns;

    if (!balancePath.empty()) {
        std::string bwarns;
        content.context.balance = loadBalanceConfig(balancePath.string(), &bwarns);
        if (!bwarns.empty()) std::cout << bwarns;
    }

    ActionTrace trace;
    if (!loadTraceFile(tracePath, trace, &err)) {
        std::cerr << "Failed to load trace: " << tracePath.generic_string() << "\n";
        std::cerr << "  " << err << "\n";
        return 1;
    }
    if (haveSeed) trace.meta.seed = seed;

    ReplayOptions linearOpt;
    linearOpt.honorSnapshotSteps = false;

    ReplayOptions checkedOpt;
    checkedOpt.checkpointSteps = checkpoints;
    checkedOpt.honorSnapshotSteps = true;

    ReplayReport linear;
    ReplayReport checked;
    if (!runReplay(content.context, trace, linearOpt, linear, &err) ||
        !runReplay(content.context, trace, checkedOpt, checked, &err)) {
        const ReplayComparison& failed = !linear.expectation.equal ? linear.expectation : checked.expectation;
        if (failed.equal) {
            std::cerr << err << "\n";
            return 1;
        }
        std::cout << "Replay FAILED: " << tracePath.generic_string() << "\n";
        std::cout << "  " << formatReplayComparison(failed) << "\n";
        if (!jsonReport.empty()) {
            std::string jerr;
            if (!writeJsonReport(jsonReport, tracePath, trace, content.sourceHash, linear, checked, failed, &jerr)) {
                std::cerr << jerr << "\n";
            }
        }
        return 1;
    }

    if (printDigests) {
        for (const auto& d : linear.digests) std::cout << stepDigestLine(d) << "\n";
    }
    if (printLog) {
        for (const auto& m : linear.log) {
            std::cout << m.text;
            if (m.repeat > 1) std::cout << " (x" << m.repeat << ")";
            std::cout << "\n";
        }
    }

    const ReplayComparison cmp = compareReplayReports(linear, checked);
    if (cmp.equal) {
        std::cout << "Replay OK: " << tracePath.generic_string()
                  << " steps=" << linear.digests.size()
                  << " checkpoints=" << checked.checkpointsTaken
                  << " expectations=" << linear.expectationsChecked
                  << " outcome=" << encounterOutcomeName(linear.result.outcome)
                  << " trace=" << hex64(linear.traceFingerprint)
                  << " digests=" << hex64(linear.digestFingerprint)
                  << " final=" << hex64(linear.finalStateFingerprint)
                  << "\n";
    } else {
        std::cout << "Replay FAILED: " << tracePath.generic_string() << "\n";
        std::cout << "  " << formatReplayComparison(cmp) << "\n";
    }

    if (!jsonReport.empty()) {
        std::string jerr;
        if (!writeJsonReport(jsonReport, tracePath, trace, content.sourceHash, linear, checked, cmp, &jerr)) {
            std::cerr << jerr << "\n";
        }
    }

    return cmp.equal ? 0 : 1;
}
