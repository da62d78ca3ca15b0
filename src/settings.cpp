#include "settings.hpp"

#include "common.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>

namespace {

bool parseInt(const std::string& v, int& out) {
    try {
        size_t used = 0;
        const std::string s = trim(v);
        const int x = std::stoi(s, &used);
        if (used != s.size()) return false;
        out = x;
        return true;
    } catch (...) {
        return false;
    }
}

bool parseDouble(const std::string& v, double& out) {
    try {
        size_t used = 0;
        const std::string s = trim(v);
        const double x = std::stod(s, &used);
        if (used != s.size()) return false;
        out = x;
        return true;
    } catch (...) {
        return false;
    }
}

std::string stripComment(const std::string& line) {
    auto hash = line.find('#');
    auto semi = line.find(';');
    size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                          semi == std::string::npos ? line.size() : semi);
    return line.substr(0, cut);
}

} // namespace

bool operator==(const BalanceConfig& a, const BalanceConfig& b) {
    return a.weaknessMultiplier == b.weaknessMultiplier &&
           a.resistanceMultiplier == b.resistanceMultiplier &&
           a.suitMatchMultiplier == b.suitMatchMultiplier &&
           a.surpriseMultiplier == b.surpriseMultiplier &&
           a.escalationResonanceShift == b.escalationResonanceShift &&
           a.deEscalationResonanceShift == b.deEscalationResonanceShift &&
           a.startingHandSize == b.startingHandSize &&
           a.maxHandSize == b.maxHandSize &&
           a.fateFallbackMin == b.fateFallbackMin &&
           a.fateFallbackMax == b.fateFallbackMax &&
           a.baseProvoke == b.baseProvoke &&
           a.pleaBacklash == b.pleaBacklash &&
           a.ritualResonanceShift == b.ritualResonanceShift;
}

bool applyBalanceKey(BalanceConfig& cfg, const std::string& rawKey, const std::string& val) {
    const std::string key = toLower(trim(rawKey));
    int iv = 0;
    double dv = 0.0;

    if (key == "weakness_multiplier") {
        if (!parseDouble(val, dv)) return false;
        cfg.weaknessMultiplier = clampd(dv, 1.0, 5.0);
    } else if (key == "resistance_multiplier") {
        if (!parseDouble(val, dv)) return false;
        cfg.resistanceMultiplier = clampd(dv, 0.0, 1.0);
    } else if (key == "suit_match_multiplier") {
        if (!parseDouble(val, dv)) return false;
        cfg.suitMatchMultiplier = clampd(dv, 1.0, 5.0);
    } else if (key == "surprise_multiplier") {
        if (!parseDouble(val, dv)) return false;
        cfg.surpriseMultiplier = clampd(dv, 1.0, 5.0);
    } else if (key == "escalation_resonance_shift") {
        if (!parseInt(val, iv)) return false;
        cfg.escalationResonanceShift = std::clamp(iv, -100, 100);
    } else if (key == "de_escalation_resonance_shift") {
        if (!parseInt(val, iv)) return false;
        cfg.deEscalationResonanceShift = std::clamp(iv, -100, 100);
    } else if (key == "starting_hand_size") {
        if (!parseInt(val, iv)) return false;
        cfg.startingHandSize = std::clamp(iv, 0, 20);
    } else if (key == "max_hand_size") {
        if (!parseInt(val, iv)) return false;
        cfg.maxHandSize = std::clamp(iv, 1, 20);
    } else if (key == "fate_fallback_min") {
        if (!parseInt(val, iv)) return false;
        cfg.fateFallbackMin = std::clamp(iv, -10, 10);
    } else if (key == "fate_fallback_max") {
        if (!parseInt(val, iv)) return false;
        cfg.fateFallbackMax = std::clamp(iv, -10, 10);
    } else if (key == "base_provoke") {
        if (!parseInt(val, iv)) return false;
        cfg.baseProvoke = std::clamp(iv, 0, 50);
    } else if (key == "plea_backlash") {
        if (!parseInt(val, iv)) return false;
        cfg.pleaBacklash = std::clamp(iv, 0, 50);
    } else if (key == "ritual_resonance_shift") {
        if (!parseInt(val, iv)) return false;
        cfg.ritualResonanceShift = std::clamp(iv, -100, 100);
    } else {
        return false;
    }

    if (cfg.fateFallbackMax < cfg.fateFallbackMin) std::swap(cfg.fateFallbackMin, cfg.fateFallbackMax);
    return true;
}

BalanceConfig loadBalanceConfig(const std::string& path, std::string* warnings) {
    BalanceConfig cfg;

    std::ifstream f(path);
    if (!f) return cfg;

    std::ostringstream warn;
    std::string line;
    int lineNo = 0;
    while (std::getline(f, line)) {
        ++lineNo;
        line = trim(stripComment(line));
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            warn << "line " << lineNo << ": expected key = value\n";
            continue;
        }

        const std::string key = trim(line.substr(0, eq));
        const std::string val = trim(line.substr(eq + 1));
        if (!applyBalanceKey(cfg, key, val)) {
            warn << "line " << lineNo << ": ignored '" << key << "'\n";
        }
    }

    if (warnings) *warnings = warn.str();
    return cfg;
}

bool writeDefaultBalanceConfig(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# FateCore balance
#
# Lines are: key = value
# Comments start with # or ;
#
# Every value here feeds the deterministic encounter timeline. Recorded traces
# only reproduce under the balance file they were recorded with.

# Keyword affinity (enemy weak/resistant to the drawn Fate keyword)
weakness_multiplier = 1.5
resistance_multiplier = 0.67

# Fate suit aligned with the action context scales the keyword effect
suit_match_multiplier = 1.5

# First attack after switching between physical and spiritual
surprise_multiplier = 1.5
escalation_resonance_shift = -5
de_escalation_resonance_shift = 5

# Hero hand
starting_hand_size = 3
max_hand_size = 7

# Random modifier range when the Fate deck holds no cards
fate_fallback_min = -1
fate_fallback_max = 2

# Enemy behavior
base_provoke = 3
plea_backlash = 2
ritual_resonance_shift = -5
)INI";

    return static_cast<bool>(f);
}
