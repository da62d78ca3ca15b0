#pragma once

#include "encounter.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Canonical, order-stable text of everything that determines the future of an
// encounter (the message log is presentation and is left out). Two engines
// with equal canonical text behave identically from here on.
std::string canonicalEncounterState(const EncounterEngine& engine);

uint64_t encounterStateHash(const EncounterEngine& engine);

// Running FNV-1a over newline-terminated lines.
class FingerprintBuilder {
public:
    void addLine(const std::string& line);
    uint64_t value() const { return h_; }
    size_t lines() const { return lines_; }

private:
    uint64_t h_ = 14695981039346656037ull;
    size_t lines_ = 0;
};

uint64_t fingerprintLines(const std::vector<std::string>& lines);

// Fixed-point rendering (3 decimals) so doubles hash identically everywhere.
std::string canonicalDouble(double v);
