#pragma once

#include "battle.hpp"
#include "battle_error.hpp"

#include <string>

// Battle config file (INI-ish: key = value, comments with # or ;).
//
// Keys: max_team_turns, action_ap_cost, ap_threshold, normal_max_actors,
// start_team, seed, tick_every_team_turns. Out-of-range values are clamped;
// unknown keys and unparsable values are skipped with a warning.

// Returns false only if the file could not be read (InvalidConfig).
bool loadBattleConfig(const std::string& path, BattleConfig& out,
                      std::string* outWarnings = nullptr, BattleError* err = nullptr);

// Parses config text directly (used by loadBattleConfig and tests).
void parseBattleConfigText(const std::string& text, BattleConfig& out, std::string* outWarnings = nullptr);

// Writes a commented default config file. Returns true on success.
bool writeDefaultBattleConfig(const std::string& path);
