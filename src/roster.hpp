#pragma once

#include "battle_error.hpp"
#include "board.hpp"
#include "catalog.hpp"

#include <string>

// Roster file: one INI section per unit, named after its uid.
//
//   [A-1]
//   name = Vanguard
//   level = 50
//   str = 120
//   dex = 40
//   int = 20
//   vit = 80
//   weapon = Axe
//   weapon_passive = 1
//   offhand = Shield
//   offhand_passive = 0
//   skills = power_strike, thunderclap
//   gear = armour:base:300, hp:inc:10
//   k = 1414          ; optional K override
//
// Every unit is built (stats, HP/MP) and placed on the board.
// Malformed section names fail with InvalidSlot, malformed gear lines with
// UnsupportedModifierShape, unknown weapons/offhands/skills with UnknownKey
// and bad numbers with InvalidConfig. Unknown keys only warn.

bool loadRosterText(const std::string& text, const Catalog& catalog, Board& out,
                    std::string* outWarnings = nullptr, BattleError* err = nullptr);

bool loadRoster(const std::string& path, const Catalog& catalog, Board& out,
                std::string* outWarnings = nullptr, BattleError* err = nullptr);

// A balanced 4v4 sample roster using the built-in catalog.
const char* exampleRosterText();

bool writeExampleRoster(const std::string& path);
