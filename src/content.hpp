#pragma once

#include "encounter_types.hpp"

#include <cstdint>
#include <string>

// Encounter definition file (INI-ish, dotted keys):
//
//   seed = 42
//   resonance = -10
//   hero.strength = 5
//   enemy.wolf.hp = 12
//   enemy.wolf.wp = 6
//   enemy.wolf.weaknesses = surge, focus
//   enemy.wolf.abilities = armor:1, summon:pup, apply_curse:rot
//   summon.pup.hp = 4
//   fate.strike.value = 2
//   fate.strike.rules = nav:+1, prav:-1
//   fate.strike.effects = resonance:-2, tension:1
//   fate.strike.count = 2
//   curse.rot.value = -2
//   card.blade.power = 2
//   card.blade.abilities = draw:1
//   balance.weakness_multiplier = 1.5
//
// Enemies, Fate cards and hero cards keep the order their ids first appear in.
struct EncounterContent {
    EncounterContext context;

    // Hash of the source text (FNV-1a 64-bit) for reproducibility.
    uint64_t sourceHash = 0;
};

// Parses content text. Bad values and unknown keys become line-numbered
// warnings; a reference to an undefined summon/curse (or any other context
// validation failure) fails the load.
bool parseEncounterContentIni(const std::string& text,
                              EncounterContent& out,
                              std::string* err = nullptr,
                              std::string* outWarnings = nullptr);

bool loadEncounterContentIni(const std::string& path,
                             EncounterContent& out,
                             std::string* err = nullptr,
                             std::string* outWarnings = nullptr);
