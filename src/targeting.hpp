#pragma once

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class Board;
struct RNG;

enum class TargetSide : uint8_t {
    Enemy = 0,
    Ally,
    Self,
    Both,
};

enum class TargetLocation : uint8_t {
    Anywhere = 0,
    Frontline,
    Self,
};

enum class TargetScope : uint8_t {
    Single = 0,
    Team,
    AllAlive,
};

const char* targetSideName(TargetSide s);
const char* targetLocationName(TargetLocation l);
const char* targetScopeName(TargetScope s);

bool parseTargetSide(const std::string& raw, TargetSide& out);
bool parseTargetLocation(const std::string& raw, TargetLocation& out);
bool parseTargetScope(const std::string& raw, TargetScope& out);

// One per action type (a weapon's basic attack, a skill).
struct TargetingSpec {
    TargetSide side = TargetSide::Enemy;
    TargetLocation location = TargetLocation::Frontline;
    TargetScope scope = TargetScope::Single;
    bool allowRetarget = true;
};

// Result of a single-target pick. A failed pick (ok=false) is an ordinary
// game condition; the caller decides whether to try something else.
struct TargetPick {
    bool ok = false;
    Team team = Team::A;
    int slot = 0;
    std::string reason;
};

// Foremost living slot of each line (1-4-7, 2-5-8, 3-6-9), in line order.
// A dead front unit simply exposes the next slot back.
std::vector<int> exposedFrontlineSlots(const Board& board, Team team);

// Exposed slot of the line that contains `slot`, if any unit in it lives.
std::optional<int> exposedInSameLine(const Board& board, Team team, int slot);

// Teams a side may address, in preference order (own team first for Both).
std::vector<Team> resolveTargetTeams(Team actorTeam, TargetSide side);

// Legal primary targets on `team` under a location policy.
// Self yields nothing here; self targeting is resolved against the actor.
std::vector<int> primaryCandidates(const Board& board, Team team, TargetLocation location);

bool isLegalPrimary(const Board& board, Team team, int slot, TargetLocation location);

// Preferred-target resolution:
//  1) the requested (team, slot) when alive and legal
//  2) with retargeting on a frontline spec, the exposed slot of the same line
//  3) a candidate drawn from `rng`, or the first candidate when rng is null
//  4) no candidates: ok=false, reason "no_candidates"
TargetPick pickPrimaryTarget(const Board& board,
                             Team actorTeam,
                             int actorSlot,
                             const TargetingSpec& spec,
                             std::optional<Team> preferredTeam = std::nullopt,
                             std::optional<int> preferredSlot = std::nullopt,
                             RNG* rng = nullptr);

// Full target list for any scope. Single wraps pickPrimaryTarget; Team is
// every living slot of the resolved team; AllAlive is both teams, A first.
std::vector<std::pair<Team, int>> resolveTargets(const Board& board,
                                                 Team actorTeam,
                                                 int actorSlot,
                                                 const TargetingSpec& spec,
                                                 std::optional<Team> preferredTeam = std::nullopt,
                                                 std::optional<int> preferredSlot = std::nullopt,
                                                 RNG* rng = nullptr);
