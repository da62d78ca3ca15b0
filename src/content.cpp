#include "content.hpp"

#include "common.hpp"
#include "rng.hpp"

#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>
#include <vector>

namespace {

void stripUtf8Bom(std::string& s) {
    if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

std::vector<std::string> splitDot(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == '.') {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::string joinTokensUnderscore(const std::vector<std::string>& toks, size_t start) {
    std::string out;
    for (size_t i = start; i < toks.size(); ++i) {
        if (!out.empty()) out.push_back('_');
        out += toks[i];
    }
    return out;
}

void appendWarning(std::string& w, int lineNo, const std::string& msg, int& warnCount, int warnLimit = 30) {
    if (warnCount < warnLimit) {
        w += "Line " + std::to_string(lineNo) + ": " + msg + "\n";
    } else if (warnCount == warnLimit) {
        w += "(more warnings omitted...)\n";
    }
    ++warnCount;
}

bool parseInt(const std::string& raw, int& out) {
    try {
        size_t idx = 0;
        const std::string s = trim(raw);
        const int v = std::stoi(s, &idx, 10);
        if (idx != s.size()) return false;
        out = v;
        return true;
    } catch (...) {
        return false;
    }
}

bool parseU64(const std::string& raw, uint64_t& out) {
    try {
        size_t idx = 0;
        const std::string s = trim(raw);
        if (s.empty() || s[0] == '-') return false;
        const unsigned long long v = std::stoull(s, &idx, 10);
        if (idx != s.size()) return false;
        out = static_cast<uint64_t>(v);
        return true;
    } catch (...) {
        return false;
    }
}

bool parseDouble(const std::string& raw, double& out) {
    try {
        size_t idx = 0;
        const std::string s = trim(raw);
        const double v = std::stod(s, &idx);
        if (idx != s.size()) return false;
        out = v;
        return true;
    } catch (...) {
        return false;
    }
}

bool parseBool(const std::string& raw, bool& out) {
    const std::string v = toLower(trim(raw));
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        out = false;
        return true;
    }
    return false;
}

// "name:value" -> (name, value). A missing value leaves `value` empty.
void splitPair(const std::string& tok, std::string& name, std::string& value) {
    const size_t colon = tok.find(':');
    if (colon == std::string::npos) {
        name = toLower(trim(tok));
        value.clear();
        return;
    }
    name = toLower(trim(tok.substr(0, colon)));
    value = trim(tok.substr(colon + 1));
}

bool parseKeywordSet(const std::string& val, std::set<FateKeyword>& out, std::string& bad) {
    out.clear();
    for (const auto& t : splitList(val)) {
        FateKeyword k;
        if (!parseFateKeyword(t, k)) {
            bad = t;
            return false;
        }
        out.insert(k);
    }
    return true;
}

bool parseEnemyAbilities(const std::string& val, std::vector<EnemyAbility>& out, std::string& bad) {
    out.clear();
    for (const auto& t : splitList(val)) {
        std::string name, arg;
        splitPair(t, name, arg);
        EnemyAbility a;
        if (!parseEnemyAbilityKind(name, a.kind)) {
            bad = t;
            return false;
        }
        if (a.kind == EnemyAbilityKind::ApplyCurse || a.kind == EnemyAbilityKind::Summon) {
            if (arg.empty()) {
                bad = t;
                return false;
            }
            a.ref = toLower(arg);
        } else if (!parseInt(arg, a.value)) {
            bad = t;
            return false;
        }
        out.push_back(a);
    }
    return true;
}

bool parseCardAbilities(const std::string& val, std::vector<CardAbility>& out, std::string& bad) {
    out.clear();
    for (const auto& t : splitList(val)) {
        std::string name, arg;
        splitPair(t, name, arg);
        CardAbility a;
        if (!parseCardAbilityKind(name, a.kind) || !parseInt(arg, a.value)) {
            bad = t;
            return false;
        }
        out.push_back(a);
    }
    return true;
}

bool parseRules(const std::string& val, std::vector<FateResonanceRule>& out, std::string& bad) {
    out.clear();
    for (const auto& t : splitList(val)) {
        std::string name, arg;
        splitPair(t, name, arg);
        FateResonanceRule r;
        if (!parseResonanceZone(name, r.zone) || !parseInt(arg, r.modifyValue)) {
            bad = t;
            return false;
        }
        out.push_back(r);
    }
    return true;
}

bool parseDrawEffects(const std::string& val, std::vector<FateDrawEffect>& out, std::string& bad) {
    out.clear();
    for (const auto& t : splitList(val)) {
        std::string name, arg;
        splitPair(t, name, arg);
        FateDrawEffect e;
        if (!parseFateDrawEffectKind(name, e.kind) || !parseInt(arg, e.amount)) {
            bad = t;
            return false;
        }
        out.push_back(e);
    }
    return true;
}

bool parseCurseList(const std::string& val, std::vector<HeroCurse>& out, std::string& bad) {
    out.clear();
    for (const auto& t : splitList(val)) {
        const std::string s = toLower(t);
        if (s == "weakness") out.push_back(HeroCurse::Weakness);
        else if (s == "shadow_of_nav" || s == "shadow") out.push_back(HeroCurse::ShadowOfNav);
        else {
            bad = t;
            return false;
        }
    }
    return true;
}

// Keeps first-appearance order of ids.
template <typename T>
struct OrderedDefs {
    std::vector<std::string> order;
    std::map<std::string, T> defs;

    T& at(const std::string& id) {
        auto it = defs.find(id);
        if (it == defs.end()) {
            order.push_back(id);
            it = defs.emplace(id, T{}).first;
        }
        return it->second;
    }
};

struct EnemyDraft {
    EncounterEnemy enemy;
    bool hasMaxHp = false;
    bool hasMaxWp = false;
};

struct FateDraft {
    FateCard card;
    int count = 1;
    bool stickySet = false;
};

// Returns empty string on success, else a warning message.
std::string applyEnemyField(EnemyDraft& d, const std::string& field, const std::string& val) {
    EncounterEnemy& e = d.enemy;
    int iv = 0;
    std::string bad;

    if (field == "name") {
        e.name = val;
    } else if (field == "hp") {
        if (!parseInt(val, iv) || iv <= 0) return "Invalid hp";
        e.hp = iv;
        if (!d.hasMaxHp) e.maxHp = iv;
    } else if (field == "max_hp" || field == "hp_max") {
        if (!parseInt(val, iv) || iv <= 0) return "Invalid max_hp";
        e.maxHp = iv;
        d.hasMaxHp = true;
    } else if (field == "wp" || field == "will") {
        if (!parseInt(val, iv) || iv <= 0) return "Invalid wp";
        e.wp = iv;
        if (!d.hasMaxWp) e.maxWp = iv;
    } else if (field == "max_wp" || field == "wp_max") {
        if (!parseInt(val, iv) || iv <= 0) return "Invalid max_wp";
        e.maxWp = iv;
        d.hasMaxWp = true;
        if (!e.wp) e.wp = iv;
    } else if (field == "power") {
        if (!parseInt(val, iv)) return "Invalid power";
        e.power = iv;
    } else if (field == "defense") {
        if (!parseInt(val, iv)) return "Invalid defense";
        e.defense = iv;
    } else if (field == "spirit_defense") {
        if (!parseInt(val, iv)) return "Invalid spirit_defense";
        e.spiritDefense = iv;
    } else if (field == "weaknesses") {
        if (!parseKeywordSet(val, e.weaknesses, bad)) return "Unknown keyword: " + bad;
    } else if (field == "strengths" || field == "resistances") {
        if (!parseKeywordSet(val, e.strengths, bad)) return "Unknown keyword: " + bad;
    } else if (field == "abilities") {
        if (!parseEnemyAbilities(val, e.abilities, bad)) return "Bad ability: " + bad;
    } else {
        return "Unknown enemy field: " + field;
    }
    return std::string();
}

std::string applyFateField(FateDraft& d, const std::string& field, const std::string& val) {
    FateCard& c = d.card;
    int iv = 0;
    bool bv = false;
    std::string bad;

    if (field == "name") {
        c.name = val;
    } else if (field == "value" || field == "modifier") {
        if (!parseInt(val, iv)) return "Invalid value";
        c.baseValue = iv;
    } else if (field == "critical") {
        if (!parseBool(val, bv)) return "Invalid bool for critical";
        c.isCritical = bv;
    } else if (field == "sticky") {
        if (!parseBool(val, bv)) return "Invalid bool for sticky";
        c.isSticky = bv;
        d.stickySet = true;
    } else if (field == "suit") {
        FateSuit s;
        if (!parseFateSuit(val, s)) return "Unknown suit: " + val;
        c.suit = s;
    } else if (field == "keyword") {
        FateKeyword k;
        if (!parseFateKeyword(val, k)) return "Unknown keyword: " + val;
        c.keyword = k;
    } else if (field == "rules") {
        if (!parseRules(val, c.resonanceRules, bad)) return "Bad rule: " + bad;
    } else if (field == "effects") {
        if (!parseDrawEffects(val, c.onDrawEffects, bad)) return "Bad effect: " + bad;
    } else if (field == "count") {
        if (!parseInt(val, iv) || iv < 0 || iv > 64) return "Invalid count";
        d.count = iv;
    } else {
        return "Unknown fate field: " + field;
    }
    return std::string();
}

std::string applyCardField(HeroCard& c, const std::string& field, const std::string& val) {
    int iv = 0;
    std::string bad;

    if (field == "name") {
        c.name = val;
    } else if (field == "power") {
        if (!parseInt(val, iv)) return "Invalid power";
        c.power = iv;
    } else if (field == "defense") {
        if (!parseInt(val, iv)) return "Invalid defense";
        c.defense = iv;
    } else if (field == "wisdom") {
        if (!parseInt(val, iv)) return "Invalid wisdom";
        c.wisdom = iv;
    } else if (field == "cost" || field == "faith_cost") {
        if (!parseInt(val, iv) || iv < 0) return "Invalid cost";
        c.faithCost = iv;
    } else if (field == "realm") {
        if (!parseCardRealm(val, c.realm)) return "Unknown realm: " + val;
    } else if (field == "abilities") {
        if (!parseCardAbilities(val, c.abilities, bad)) return "Bad ability: " + bad;
    } else {
        return "Unknown card field: " + field;
    }
    return std::string();
}

std::string applyHeroField(EncounterHero& h, bool& hasMaxHp, const std::string& field, const std::string& val) {
    int iv = 0;
    std::string bad;

    if (field == "hp") {
        if (!parseInt(val, iv) || iv <= 0) return "Invalid hp";
        h.hp = iv;
        if (!hasMaxHp) h.maxHp = iv;
    } else if (field == "max_hp" || field == "hp_max") {
        if (!parseInt(val, iv) || iv <= 0) return "Invalid max_hp";
        h.maxHp = iv;
        hasMaxHp = true;
    } else if (field == "strength") {
        if (!parseInt(val, iv)) return "Invalid strength";
        h.strength = iv;
    } else if (field == "armor") {
        if (!parseInt(val, iv)) return "Invalid armor";
        h.armor = iv;
    } else if (field == "wisdom") {
        if (!parseInt(val, iv)) return "Invalid wisdom";
        h.wisdom = iv;
    } else if (field == "faith") {
        if (!parseInt(val, iv) || iv < 0) return "Invalid faith";
        h.faith = iv;
    } else if (field == "curses") {
        if (!parseCurseList(val, h.curses, bad)) return "Unknown curse: " + bad;
    } else {
        return "Unknown hero field: " + field;
    }
    return std::string();
}

} // namespace

bool parseEncounterContentIni(const std::string& text, EncounterContent& out, std::string* err, std::string* outWarnings) {
    out = EncounterContent{};
    out.sourceHash = fnv1a64Bytes(text.data(), text.size());

    EncounterContext& ctx = out.context;
    bool heroHasMaxHp = false;

    OrderedDefs<EnemyDraft> enemies;
    OrderedDefs<EnemyDraft> summons;
    OrderedDefs<FateDraft> fates;
    OrderedDefs<FateDraft> curses;
    OrderedDefs<HeroCard> cards;

    std::istringstream iss(text);
    std::string line;

    std::string warnings;
    int warnCount = 0;

    for (int lineNo = 1; std::getline(iss, line); ++lineNo) {
        stripUtf8Bom(line);

        // Strip comments (# or ;) but do not attempt to handle quoted strings.
        size_t commentPos = std::string::npos;
        size_t pHash = line.find('#');
        size_t pSemi = line.find(';');
        if (pHash != std::string::npos) commentPos = pHash;
        if (pSemi != std::string::npos) commentPos = std::min(commentPos, pSemi);
        if (commentPos != std::string::npos) line = line.substr(0, commentPos);

        line = trim(std::move(line));
        if (line.empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            appendWarning(warnings, lineNo, "Expected key=value", warnCount);
            continue;
        }

        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));
        if (key.empty()) {
            appendWarning(warnings, lineNo, "Empty key", warnCount);
            continue;
        }

        const std::vector<std::string> toks = splitDot(key);
        if (toks.empty()) continue;
        const std::string& head = toks[0];

        std::string problem;

        if (head == "seed" && toks.size() == 1) {
            if (!parseU64(val, ctx.seed)) problem = "Invalid seed";
        } else if (head == "resonance" && toks.size() == 1) {
            double dv = 0.0;
            if (!parseDouble(val, dv)) problem = "Invalid resonance";
            else ctx.resonance = dv;
        } else if (head == "hero") {
            if (toks.size() < 2) problem = "Hero key should be hero.<field>";
            else problem = applyHeroField(ctx.hero, heroHasMaxHp, joinTokensUnderscore(toks, 1), val);
        } else if (head == "balance") {
            if (toks.size() < 2 || !applyBalanceKey(ctx.balance, joinTokensUnderscore(toks, 1), val)) {
                problem = "Ignored balance key: " + key;
            }
        } else if (head == "enemy" || head == "summon") {
            if (toks.size() < 3) {
                problem = "Key should be " + head + ".<id>.<field>";
            } else {
                EnemyDraft& d = (head == "enemy") ? enemies.at(toks[1]) : summons.at(toks[1]);
                d.enemy.id = toks[1];
                problem = applyEnemyField(d, joinTokensUnderscore(toks, 2), val);
            }
        } else if (head == "fate" || head == "curse") {
            if (toks.size() < 3) {
                problem = "Key should be " + head + ".<id>.<field>";
            } else {
                FateDraft& d = (head == "fate") ? fates.at(toks[1]) : curses.at(toks[1]);
                d.card.id = toks[1];
                problem = applyFateField(d, joinTokensUnderscore(toks, 2), val);
            }
        } else if (head == "card") {
            if (toks.size() < 3) {
                problem = "Key should be card.<id>.<field>";
            } else {
                HeroCard& c = cards.at(toks[1]);
                c.id = toks[1];
                problem = applyCardField(c, joinTokensUnderscore(toks, 2), val);
            }
        } else {
            problem = "Unknown key: " + key;
        }

        if (!problem.empty()) appendWarning(warnings, lineNo, problem, warnCount);
    }

    for (const auto& id : enemies.order) ctx.enemies.push_back(enemies.defs[id].enemy);
    for (const auto& id : summons.order) ctx.summonPool[id] = summons.defs[id].enemy;
    for (const auto& id : fates.order) {
        const FateDraft& d = fates.defs[id];
        for (int i = 0; i < d.count; ++i) ctx.fateCards.push_back(d.card);
    }
    for (const auto& id : curses.order) {
        const FateDraft& d = curses.defs[id];
        FateCard c = d.card;
        // Curses are sticky unless the file says otherwise.
        if (!d.stickySet) c.isSticky = true;
        ctx.curseCards[id] = c;
    }
    for (const auto& id : cards.order) ctx.heroCards.push_back(cards.defs[id]);

    if (outWarnings) *outWarnings = warnings;

    std::string verr;
    if (!validateEncounterContext(ctx, &verr)) {
        if (err) *err = "Content error: " + verr;
        return false;
    }
    return true;
}

bool loadEncounterContentIni(const std::string& path, EncounterContent& out, std::string* err, std::string* outWarnings) {
    out = EncounterContent{};

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (err) *err = "Could not open content file: " + path;
        return false;
    }

    std::string contents;
    {
        std::ostringstream oss;
        oss << f.rdbuf();
        contents = oss.str();
    }

    return parseEncounterContentIni(contents, out, err, outWarnings);
}
