#pragma once

#include "battle_error.hpp"
#include "common.hpp"
#include "unit.hpp"

#include <map>
#include <vector>

// Two independent 3x3 formations. At most one unit per slot per team.
class Board {
public:
    // Fails with InvalidSlot for slots outside 1..9 or already occupied.
    // The unit's team/slot fields decide where it goes.
    bool place(Unit unit, BattleError* err = nullptr);

    Unit* get(Team team, int slot);
    const Unit* get(Team team, int slot) const;

    bool isAlive(Team team, int slot) const;

    // Ascending slot order.
    std::vector<int> aliveSlots(Team team) const;
    std::vector<Unit*> livingUnits(Team team);
    std::vector<const Unit*> livingUnits(Team team) const;
    int aliveCount(Team team) const;

    std::map<int, Unit>& units(Team team) { return team == Team::A ? teamA_ : teamB_; }
    const std::map<int, Unit>& units(Team team) const { return team == Team::A ? teamA_ : teamB_; }

private:
    std::map<int, Unit> teamA_;
    std::map<int, Unit> teamB_;
};
