#include "keywords.hpp"

bool operator==(const KeywordEffect& a, const KeywordEffect& b) {
    return a.bonusDamage == b.bonusDamage && a.bonusValue == b.bonusValue && a.special == b.special;
}

const char* actionContextName(ActionContext c) {
    switch (c) {
        case ActionContext::CombatPhysical:  return "combat_physical";
        case ActionContext::CombatSpiritual: return "combat_spiritual";
        case ActionContext::Exploration:     return "exploration";
        case ActionContext::Dialogue:        return "dialogue";
        case ActionContext::Defense:         return "defense";
        case ActionContext::SkillCheck:      return "skill_check";
    }
    return "combat_physical";
}

const char* keywordSpecialName(KeywordSpecial s) {
    switch (s) {
        case KeywordSpecial::None:          return "none";
        case KeywordSpecial::ResonancePush: return "resonance_push";
        case KeywordSpecial::Discovery:     return "discovery";
        case KeywordSpecial::Persuade:      return "persuade";
        case KeywordSpecial::IgnoreArmor:   return "ignore_armor";
        case KeywordSpecial::WillPierce:    return "will_pierce";
        case KeywordSpecial::Detail:        return "detail";
        case KeywordSpecial::Counter:       return "counter";
        case KeywordSpecial::EchoStrike:    return "echo_strike";
        case KeywordSpecial::EchoPrayer:    return "echo_prayer";
        case KeywordSpecial::EchoFind:      return "echo_find";
        case KeywordSpecial::EchoVoice:     return "echo_voice";
        case KeywordSpecial::EchoShield:    return "echo_shield";
        case KeywordSpecial::Ambush:        return "ambush";
        case KeywordSpecial::Veil:          return "veil";
        case KeywordSpecial::Stealth:       return "stealth";
        case KeywordSpecial::Intimidate:    return "intimidate";
        case KeywordSpecial::Evade:         return "evade";
        case KeywordSpecial::Parry:         return "parry";
        case KeywordSpecial::SpiritShield:  return "spirit_shield";
        case KeywordSpecial::SafePassage:   return "safe_passage";
        case KeywordSpecial::Composure:     return "composure";
        case KeywordSpecial::Fortify:       return "fortify";
    }
    return "none";
}

namespace {

KeywordEffect fx(int dmg, int val, KeywordSpecial sp = KeywordSpecial::None) {
    KeywordEffect e;
    e.bonusDamage = dmg;
    e.bonusValue = val;
    e.special = sp;
    return e;
}

KeywordEffect baseEffect(FateKeyword keyword, ActionContext ctx) {
    using C = ActionContext;
    using S = KeywordSpecial;

    switch (keyword) {
        case FateKeyword::Surge:
            switch (ctx) {
                case C::CombatPhysical:  return fx(2, 0);
                case C::CombatSpiritual: return fx(1, 0, S::ResonancePush);
                case C::Exploration:     return fx(0, 1, S::Discovery);
                case C::Dialogue:        return fx(0, 1, S::Persuade);
                case C::Defense:         return fx(0, 1);
                case C::SkillCheck:      return fx(0, 1, S::Discovery);
            }
            break;
        case FateKeyword::Focus:
            switch (ctx) {
                case C::CombatPhysical:  return fx(1, 0, S::IgnoreArmor);
                case C::CombatSpiritual: return fx(1, 0, S::WillPierce);
                case C::Exploration:     return fx(0, 2, S::Detail);
                case C::Dialogue:        return fx(0, 2);
                case C::Defense:         return fx(0, 1, S::Counter);
                case C::SkillCheck:      return fx(0, 2, S::Detail);
            }
            break;
        case FateKeyword::Echo:
            switch (ctx) {
                case C::CombatPhysical:  return fx(1, 0, S::EchoStrike);
                case C::CombatSpiritual: return fx(1, 0, S::EchoPrayer);
                case C::Exploration:     return fx(0, 1, S::EchoFind);
                case C::Dialogue:        return fx(0, 1, S::EchoVoice);
                case C::Defense:         return fx(0, 2, S::EchoShield);
                case C::SkillCheck:      return fx(0, 1, S::EchoFind);
            }
            break;
        case FateKeyword::Shadow:
            switch (ctx) {
                case C::CombatPhysical:  return fx(1, 0, S::Ambush);
                case C::CombatSpiritual: return fx(0, 1, S::Veil);
                case C::Exploration:     return fx(0, 2, S::Stealth);
                case C::Dialogue:        return fx(0, 1, S::Intimidate);
                case C::Defense:         return fx(0, 1, S::Evade);
                case C::SkillCheck:      return fx(0, 2, S::Stealth);
            }
            break;
        case FateKeyword::Ward:
            switch (ctx) {
                case C::CombatPhysical:  return fx(0, 1, S::Parry);
                case C::CombatSpiritual: return fx(0, 1, S::SpiritShield);
                case C::Exploration:     return fx(0, 1, S::SafePassage);
                case C::Dialogue:        return fx(0, 1, S::Composure);
                case C::Defense:         return fx(0, 3, S::Fortify);
                case C::SkillCheck:      return fx(0, 1, S::SafePassage);
            }
            break;
    }
    return KeywordEffect{};
}

} // namespace

KeywordEffect resolveKeyword(FateKeyword keyword, ActionContext context, bool isMatch, double matchMultiplier) {
    KeywordEffect base = baseEffect(keyword, context);
    if (isMatch) {
        base.bonusDamage = static_cast<int>(base.bonusDamage * matchMultiplier);
        base.bonusValue = static_cast<int>(base.bonusValue * matchMultiplier);
    }
    return base;
}

KeywordEffect resolveKeywordWithAlignment(FateKeyword keyword, ActionContext context,
                                          bool isMatch, bool isMismatch, double matchMultiplier) {
    if (isMismatch) return KeywordEffect{};
    return resolveKeyword(keyword, context, isMatch, matchMultiplier);
}

bool isSuitMatch(std::optional<FateSuit> suit, ActionContext context) {
    if (!suit) return false;
    switch (*suit) {
        case FateSuit::Yav:
            return true;
        case FateSuit::Nav:
            return context == ActionContext::CombatPhysical || context == ActionContext::Defense;
        case FateSuit::Prav:
            return context == ActionContext::CombatSpiritual || context == ActionContext::Dialogue;
        case FateSuit::Neutral:
            return false;
    }
    return false;
}

bool isSuitMismatch(std::optional<FateSuit> suit, ActionContext context) {
    if (!suit) return false;
    switch (*suit) {
        case FateSuit::Yav:
        case FateSuit::Neutral:
            return false;
        case FateSuit::Nav:
            return context == ActionContext::CombatSpiritual || context == ActionContext::Dialogue;
        case FateSuit::Prav:
            return context == ActionContext::CombatPhysical || context == ActionContext::Defense;
    }
    return false;
}
