#include "board.hpp"

#include "grid.hpp"

#include <string>
#include <utility>

bool Board::place(Unit unit, BattleError* err) {
    if (!isValidSlot(unit.slot)) {
        return setError(err, BattleErrorKind::InvalidSlot,
                        "slot " + std::to_string(unit.slot) + " is outside 1.." + std::to_string(GRID_SLOTS));
    }

    std::map<int, Unit>& side = units(unit.team);
    if (side.count(unit.slot) != 0) {
        return setError(err, BattleErrorKind::InvalidSlot, unit.uid() + " is already occupied");
    }

    const int slot = unit.slot;
    side.emplace(slot, std::move(unit));
    return true;
}

Unit* Board::get(Team team, int slot) {
    auto& side = units(team);
    auto it = side.find(slot);
    return (it == side.end()) ? nullptr : &it->second;
}

const Unit* Board::get(Team team, int slot) const {
    const auto& side = units(team);
    auto it = side.find(slot);
    return (it == side.end()) ? nullptr : &it->second;
}

bool Board::isAlive(Team team, int slot) const {
    const Unit* u = get(team, slot);
    return u && u->isAlive();
}

std::vector<int> Board::aliveSlots(Team team) const {
    std::vector<int> out;
    for (const auto& kv : units(team)) {
        if (kv.second.isAlive()) out.push_back(kv.first);
    }
    return out;
}

std::vector<Unit*> Board::livingUnits(Team team) {
    std::vector<Unit*> out;
    for (auto& kv : units(team)) {
        if (kv.second.isAlive()) out.push_back(&kv.second);
    }
    return out;
}

std::vector<const Unit*> Board::livingUnits(Team team) const {
    std::vector<const Unit*> out;
    for (const auto& kv : units(team)) {
        if (kv.second.isAlive()) out.push_back(&kv.second);
    }
    return out;
}

int Board::aliveCount(Team team) const {
    int n = 0;
    for (const auto& kv : units(team)) {
        if (kv.second.isAlive()) ++n;
    }
    return n;
}
