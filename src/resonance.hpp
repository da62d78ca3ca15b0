#pragma once

#include <cstdint>
#include <string>

// World moral polarity. Five zones from Nav (dark) through Yav (neutral) to Prav (light).
enum class ResonanceZone : uint8_t {
    DeepNav = 0,
    Nav,
    Yav,
    Prav,
    DeepPrav,
};

constexpr double RESONANCE_MIN = -100.0;
constexpr double RESONANCE_MAX = 100.0;

const char* resonanceZoneName(ResonanceZone z);
bool parseResonanceZone(const std::string& s, ResonanceZone& out);

inline bool isNavZone(ResonanceZone z) { return z == ResonanceZone::Nav || z == ResonanceZone::DeepNav; }
inline bool isPravZone(ResonanceZone z) { return z == ResonanceZone::Prav || z == ResonanceZone::DeepPrav; }

// Audit record for a single shift.
struct ResonanceShift {
    double amount = 0.0;         // requested delta (before clamping)
    std::string source;          // provenance tag: "fate:<card>", "escalation", "ritual:<enemy>"...
    double resultingValue = 0.0;
};

class ResonanceEngine {
public:
    explicit ResonanceEngine(double initial = 0.0);

    double value() const { return value_; }

    // Adds, clamps to [-100, 100] and returns the record.
    ResonanceShift shift(double amount, const std::string& source);

    // Direct clamp-and-set (save restore).
    void setValue(double v);

    ResonanceZone activeZone() const { return zoneFor(value_); }

    // Pure classification. Boundaries (integer view):
    //   deepNav [-100,-61]  nav [-60,-21]  yav [-20,20]  prav [21,60]  deepPrav [61,100]
    static ResonanceZone zoneFor(double v);

private:
    double value_ = 0.0;
};
