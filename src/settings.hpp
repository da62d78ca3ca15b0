#pragma once

#include <string>

// Tunable combat numbers (INI-ish: key = value).
// Carried by EncounterContext; everything here feeds the deterministic timeline,
// so a trace is only reproducible under the same balance values.
struct BalanceConfig {
    double weaknessMultiplier = 1.5;
    double resistanceMultiplier = 0.67;
    double suitMatchMultiplier = 1.5;
    double surpriseMultiplier = 1.5;

    int escalationResonanceShift = -5;   // spiritual -> physical
    int deEscalationResonanceShift = 5;  // physical -> spiritual

    int startingHandSize = 3;
    int maxHandSize = 7;

    // Bounded random modifier used when the Fate deck is empty.
    int fateFallbackMin = -1;
    int fateFallbackMax = 2;

    int baseProvoke = 3;
    int pleaBacklash = 2;
    int ritualResonanceShift = -5;
};

bool operator==(const BalanceConfig& a, const BalanceConfig& b);

// Applies one key (without any "balance." prefix). Values are clamped.
// Returns false for unknown keys or unparsable values.
bool applyBalanceKey(BalanceConfig& cfg, const std::string& key, const std::string& value);

// Loads a balance file. Missing file or bad lines keep the defaults.
// Unknown keys are reported in `warnings` (one line each) when non-null.
BalanceConfig loadBalanceConfig(const std::string& path, std::string* warnings = nullptr);

// Writes a commented default balance file. Returns true on success.
bool writeDefaultBalanceConfig(const std::string& path);
