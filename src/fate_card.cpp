#include "fate_card.hpp"

#include "common.hpp"

bool operator==(const FateCard& a, const FateCard& b) {
    if (a.id != b.id || a.name != b.name) return false;
    if (a.baseValue != b.baseValue || a.isCritical != b.isCritical || a.isSticky != b.isSticky) return false;
    if (a.suit != b.suit || a.keyword != b.keyword) return false;
    if (a.resonanceRules.size() != b.resonanceRules.size()) return false;
    for (size_t i = 0; i < a.resonanceRules.size(); ++i) {
        if (a.resonanceRules[i].zone != b.resonanceRules[i].zone) return false;
        if (a.resonanceRules[i].modifyValue != b.resonanceRules[i].modifyValue) return false;
    }
    if (a.onDrawEffects.size() != b.onDrawEffects.size()) return false;
    for (size_t i = 0; i < a.onDrawEffects.size(); ++i) {
        if (a.onDrawEffects[i].kind != b.onDrawEffects[i].kind) return false;
        if (a.onDrawEffects[i].amount != b.onDrawEffects[i].amount) return false;
    }
    return true;
}

const char* fateSuitName(FateSuit s) {
    switch (s) {
        case FateSuit::Nav:     return "nav";
        case FateSuit::Yav:     return "yav";
        case FateSuit::Prav:    return "prav";
        case FateSuit::Neutral: return "neutral";
    }
    return "neutral";
}

const char* fateKeywordName(FateKeyword k) {
    switch (k) {
        case FateKeyword::Surge:  return "surge";
        case FateKeyword::Focus:  return "focus";
        case FateKeyword::Echo:   return "echo";
        case FateKeyword::Shadow: return "shadow";
        case FateKeyword::Ward:   return "ward";
    }
    return "surge";
}

const char* fateDrawEffectKindName(FateDrawEffectKind k) {
    switch (k) {
        case FateDrawEffectKind::ShiftResonance: return "resonance";
        case FateDrawEffectKind::ShiftTension:   return "tension";
    }
    return "resonance";
}

bool parseFateSuit(const std::string& s, FateSuit& out) {
    const std::string v = toLower(trim(s));
    if (v == "nav")     { out = FateSuit::Nav; return true; }
    if (v == "yav")     { out = FateSuit::Yav; return true; }
    if (v == "prav")    { out = FateSuit::Prav; return true; }
    if (v == "neutral") { out = FateSuit::Neutral; return true; }
    return false;
}

bool parseFateKeyword(const std::string& s, FateKeyword& out) {
    const std::string v = toLower(trim(s));
    for (int k = 0; k < FATE_KEYWORD_COUNT; ++k) {
        const FateKeyword kw = static_cast<FateKeyword>(k);
        if (v == fateKeywordName(kw)) {
            out = kw;
            return true;
        }
    }
    return false;
}

bool parseFateDrawEffectKind(const std::string& s, FateDrawEffectKind& out) {
    const std::string v = toLower(trim(s));
    if (v == "resonance" || v == "shift_resonance") { out = FateDrawEffectKind::ShiftResonance; return true; }
    if (v == "tension" || v == "shift_tension")     { out = FateDrawEffectKind::ShiftTension; return true; }
    return false;
}
