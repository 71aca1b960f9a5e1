#include "targeting.hpp"

#include "board.hpp"
#include "grid.hpp"
#include "rng.hpp"

#include <algorithm>

const char* targetSideName(TargetSide s) {
    switch (s) {
        case TargetSide::Enemy: return "enemy";
        case TargetSide::Ally:  return "ally";
        case TargetSide::Self:  return "self";
        case TargetSide::Both:  return "both";
    }
    return "enemy";
}

const char* targetLocationName(TargetLocation l) {
    switch (l) {
        case TargetLocation::Anywhere:  return "anywhere";
        case TargetLocation::Frontline: return "frontline";
        case TargetLocation::Self:      return "self";
    }
    return "frontline";
}

const char* targetScopeName(TargetScope s) {
    switch (s) {
        case TargetScope::Single:   return "single";
        case TargetScope::Team:     return "team";
        case TargetScope::AllAlive: return "all_alive";
    }
    return "single";
}

bool parseTargetSide(const std::string& raw, TargetSide& out) {
    const std::string s = toLower(trimCopy(raw));
    if (s == "enemy") out = TargetSide::Enemy;
    else if (s == "ally") out = TargetSide::Ally;
    else if (s == "self") out = TargetSide::Self;
    else if (s == "both") out = TargetSide::Both;
    else return false;
    return true;
}

bool parseTargetLocation(const std::string& raw, TargetLocation& out) {
    const std::string s = toLower(trimCopy(raw));
    if (s == "anywhere") out = TargetLocation::Anywhere;
    else if (s == "frontline") out = TargetLocation::Frontline;
    else if (s == "self") out = TargetLocation::Self;
    else return false;
    return true;
}

bool parseTargetScope(const std::string& raw, TargetScope& out) {
    const std::string s = toLower(trimCopy(raw));
    if (s == "single") out = TargetScope::Single;
    else if (s == "team") out = TargetScope::Team;
    else if (s == "all_alive" || s == "all") out = TargetScope::AllAlive;
    else return false;
    return true;
}

std::vector<int> exposedFrontlineSlots(const Board& board, Team team) {
    std::vector<int> out;
    for (int line = 0; line < GRID_COLS; ++line) {
        for (int slot : slotsInLine(line)) {
            if (board.isAlive(team, slot)) {
                out.push_back(slot);
                break;
            }
        }
    }
    return out;
}

std::optional<int> exposedInSameLine(const Board& board, Team team, int slot) {
    if (!isValidSlot(slot)) return std::nullopt;
    for (int s : slotsInLine(slotLine(slot))) {
        if (board.isAlive(team, s)) return s;
    }
    return std::nullopt;
}

std::vector<Team> resolveTargetTeams(Team actorTeam, TargetSide side) {
    switch (side) {
        case TargetSide::Self:
        case TargetSide::Ally:
            return {actorTeam};
        case TargetSide::Enemy:
            return {otherTeam(actorTeam)};
        case TargetSide::Both:
            return {actorTeam, otherTeam(actorTeam)};
    }
    return {otherTeam(actorTeam)};
}

std::vector<int> primaryCandidates(const Board& board, Team team, TargetLocation location) {
    switch (location) {
        case TargetLocation::Frontline: return exposedFrontlineSlots(board, team);
        case TargetLocation::Anywhere:  return board.aliveSlots(team);
        case TargetLocation::Self:      return {};
    }
    return {};
}

bool isLegalPrimary(const Board& board, Team team, int slot, TargetLocation location) {
    if (!board.isAlive(team, slot)) return false;
    if (location == TargetLocation::Anywhere) return true;
    if (location == TargetLocation::Frontline) {
        const std::vector<int> exposed = exposedFrontlineSlots(board, team);
        return std::find(exposed.begin(), exposed.end(), slot) != exposed.end();
    }
    return false;
}

TargetPick pickPrimaryTarget(const Board& board,
                             Team actorTeam,
                             int actorSlot,
                             const TargetingSpec& spec,
                             std::optional<Team> preferredTeam,
                             std::optional<int> preferredSlot,
                             RNG* rng) {
    TargetPick pick;

    if (spec.side == TargetSide::Self || spec.location == TargetLocation::Self) {
        pick.team = actorTeam;
        pick.slot = actorSlot;
        pick.ok = board.isAlive(actorTeam, actorSlot);
        pick.reason = pick.ok ? "self" : "no_candidates";
        return pick;
    }

    const std::vector<Team> teams = resolveTargetTeams(actorTeam, spec.side);
    pick.team = teams.front();
    if (preferredTeam && std::find(teams.begin(), teams.end(), *preferredTeam) != teams.end()) {
        pick.team = *preferredTeam;
    }

    const std::vector<int> cands = primaryCandidates(board, pick.team, spec.location);
    if (cands.empty()) {
        pick.reason = "no_candidates";
        return pick;
    }

    auto choose = [&]() -> int {
        if (rng) return cands[rng->choiceIndex(cands.size())];
        return cands.front();
    };

    if (preferredSlot) {
        if (isLegalPrimary(board, pick.team, *preferredSlot, spec.location)) {
            pick.ok = true;
            pick.slot = *preferredSlot;
            pick.reason = "preferred_ok";
            return pick;
        }

        if (!spec.allowRetarget) {
            pick.reason = "preferred_invalid";
            return pick;
        }

        if (spec.location == TargetLocation::Frontline) {
            const std::optional<int> same = exposedInSameLine(board, pick.team, *preferredSlot);
            if (same && isLegalPrimary(board, pick.team, *same, spec.location)) {
                pick.ok = true;
                pick.slot = *same;
                pick.reason = "retarget_same_line_exposed";
                return pick;
            }
        }

        pick.ok = true;
        pick.slot = choose();
        pick.reason = rng ? "retarget_random" : "retarget_first";
        return pick;
    }

    pick.ok = true;
    pick.slot = choose();
    pick.reason = rng ? "random" : "first";
    return pick;
}

std::vector<std::pair<Team, int>> resolveTargets(const Board& board,
                                                 Team actorTeam,
                                                 int actorSlot,
                                                 const TargetingSpec& spec,
                                                 std::optional<Team> preferredTeam,
                                                 std::optional<int> preferredSlot,
                                                 RNG* rng) {
    std::vector<std::pair<Team, int>> out;

    if (spec.scope == TargetScope::Single) {
        const TargetPick pick = pickPrimaryTarget(board, actorTeam, actorSlot, spec,
                                                  preferredTeam, preferredSlot, rng);
        if (pick.ok) out.emplace_back(pick.team, pick.slot);
        return out;
    }

    if (spec.scope == TargetScope::Team) {
        const std::vector<Team> teams = resolveTargetTeams(actorTeam, spec.side);
        Team team = teams.front();
        if (preferredTeam && std::find(teams.begin(), teams.end(), *preferredTeam) != teams.end()) {
            team = *preferredTeam;
        }
        for (int s : board.aliveSlots(team)) out.emplace_back(team, s);
        return out;
    }

    for (Team team : {Team::A, Team::B}) {
        for (int s : board.aliveSlots(team)) out.emplace_back(team, s);
    }
    return out;
}
