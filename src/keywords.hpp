#pragma once

#include "fate_card.hpp"

#include <cstdint>
#include <optional>

// Context in which a Fate keyword is interpreted.
enum class ActionContext : uint8_t {
    CombatPhysical = 0,
    CombatSpiritual,
    Exploration,
    Dialogue,
    Defense,
    SkillCheck,
};

enum class KeywordSpecial : uint8_t {
    None = 0,
    ResonancePush,
    Discovery,
    Persuade,
    IgnoreArmor,
    WillPierce,
    Detail,
    Counter,
    EchoStrike,
    EchoPrayer,
    EchoFind,
    EchoVoice,
    EchoShield,
    Ambush,
    Veil,
    Stealth,
    Intimidate,
    Evade,
    Parry,
    SpiritShield,
    SafePassage,
    Composure,
    Fortify,
};

struct KeywordEffect {
    int bonusDamage = 0;
    int bonusValue = 0;
    KeywordSpecial special = KeywordSpecial::None;
};

bool operator==(const KeywordEffect& a, const KeywordEffect& b);

const char* actionContextName(ActionContext c);
const char* keywordSpecialName(KeywordSpecial s);

// Base 5x6 interpretation matrix; a suit match scales numbers by matchMultiplier.
KeywordEffect resolveKeyword(FateKeyword keyword, ActionContext context,
                             bool isMatch = false, double matchMultiplier = 2.0);

// An opposing suit nullifies the keyword entirely.
KeywordEffect resolveKeywordWithAlignment(FateKeyword keyword, ActionContext context,
                                          bool isMatch, bool isMismatch,
                                          double matchMultiplier = 2.0);

// Suit alignment: yav matches everything, nav <-> physical/defense,
// prav <-> spiritual/dialogue. Neutral/absent suits neither match nor clash.
bool isSuitMatch(std::optional<FateSuit> suit, ActionContext context);
bool isSuitMismatch(std::optional<FateSuit> suit, ActionContext context);
