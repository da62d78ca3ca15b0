#include "resonance.hpp"

#include "common.hpp"

#include <cmath>

const char* resonanceZoneName(ResonanceZone z) {
    switch (z) {
        case ResonanceZone::DeepNav:  return "deepNav";
        case ResonanceZone::Nav:      return "nav";
        case ResonanceZone::Yav:      return "yav";
        case ResonanceZone::Prav:     return "prav";
        case ResonanceZone::DeepPrav: return "deepPrav";
    }
    return "yav";
}

bool parseResonanceZone(const std::string& s, ResonanceZone& out) {
    const std::string v = toLower(trim(s));
    if (v == "deepnav" || v == "deep_nav") { out = ResonanceZone::DeepNav; return true; }
    if (v == "nav")                        { out = ResonanceZone::Nav; return true; }
    if (v == "yav")                        { out = ResonanceZone::Yav; return true; }
    if (v == "prav")                       { out = ResonanceZone::Prav; return true; }
    if (v == "deepprav" || v == "deep_prav") { out = ResonanceZone::DeepPrav; return true; }
    return false;
}

namespace {

double sanitize(double v) {
    // NaN collapses to neutral; infinities clamp like any other out-of-range value.
    if (std::isnan(v)) return 0.0;
    return clampd(v, RESONANCE_MIN, RESONANCE_MAX);
}

} // namespace

ResonanceEngine::ResonanceEngine(double initial) : value_(sanitize(initial)) {}

ResonanceShift ResonanceEngine::shift(double amount, const std::string& source) {
    if (!std::isnan(amount)) {
        value_ = sanitize(value_ + amount);
    }
    ResonanceShift rec;
    rec.amount = amount;
    rec.source = source;
    rec.resultingValue = value_;
    return rec;
}

void ResonanceEngine::setValue(double v) {
    value_ = sanitize(v);
}

ResonanceZone ResonanceEngine::zoneFor(double v) {
    v = sanitize(v);
    if (v < -60.0) return ResonanceZone::DeepNav;
    if (v < -20.0) return ResonanceZone::Nav;
    if (v <= 20.0) return ResonanceZone::Yav;
    if (v <= 60.0) return ResonanceZone::Prav;
    return ResonanceZone::DeepPrav;
}
