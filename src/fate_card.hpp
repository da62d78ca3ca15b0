#pragma once

#include "resonance.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class FateSuit : uint8_t {
    Nav = 0,
    Yav,
    Prav,
    Neutral,
};

// Fixed keyword vocabulary. Interpreted per action context (see keywords.hpp).
enum class FateKeyword : uint8_t {
    Surge = 0,
    Focus,
    Echo,
    Shadow,
    Ward,
};

constexpr int FATE_KEYWORD_COUNT = 5;

// Zone -> value delta applied when the world sits in `zone` at draw time.
struct FateResonanceRule {
    ResonanceZone zone = ResonanceZone::Yav;
    int modifyValue = 0;
};

enum class FateDrawEffectKind : uint8_t {
    ShiftResonance = 0,
    // Forwarded to the world layer through EncounterResult; not interpreted here.
    ShiftTension,
};

struct FateDrawEffect {
    FateDrawEffectKind kind = FateDrawEffectKind::ShiftResonance;
    int amount = 0;
};

struct FateCard {
    std::string id;
    std::string name;

    int baseValue = 0; // the card's modifier
    bool isCritical = false;
    // Curses: survive every reshuffle.
    bool isSticky = false;

    std::optional<FateSuit> suit;
    std::optional<FateKeyword> keyword;

    std::vector<FateResonanceRule> resonanceRules;
    std::vector<FateDrawEffect> onDrawEffects;

    int modifier() const { return baseValue; }
};

bool operator==(const FateCard& a, const FateCard& b);
inline bool operator!=(const FateCard& a, const FateCard& b) { return !(a == b); }

const char* fateSuitName(FateSuit s);
const char* fateKeywordName(FateKeyword k);
const char* fateDrawEffectKindName(FateDrawEffectKind k);

bool parseFateSuit(const std::string& s, FateSuit& out);
bool parseFateKeyword(const std::string& s, FateKeyword& out);
bool parseFateDrawEffectKind(const std::string& s, FateDrawEffectKind& out);
