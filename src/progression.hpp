#pragma once

#include "battle_error.hpp"

#include <vector>

// K is a level-scaled balance constant. It shapes the mitigation curve
// (defense / (defense + K)) and the skill-power formula.
struct KRange {
    int levelMin = 1; // inclusive
    int levelMax = 1; // inclusive
    int k = 0;
};

const std::vector<KRange>& defaultKTable();

// Looks up K for a level. Levels outside the table clamp to the nearest
// edge; level <= 0 is rejected.
bool kForLevel(int level, int& outK, BattleError* err = nullptr);
bool kForLevel(int level, const std::vector<KRange>& table, int& outK, BattleError* err = nullptr);
