#pragma once

#include <cstdint>
#include <string>

struct BattleState;

// FNV-1a 64 fingerprint of the mutable battle state: team-turn counter,
// starting team, RNG state, and every unit's hp/mp/ap, statuses and cooldowns.
// Used to check that two runs with the same seed stay in lockstep.
uint64_t battleStateHash(const BattleState& state);

// 16 lowercase hex digits.
std::string hashHex(uint64_t h);
