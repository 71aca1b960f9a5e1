#pragma once

#include "battle_error.hpp"
#include "catalog.hpp"
#include "common.hpp"
#include "status.hpp"

#include <string>
#include <vector>

class Board;
class LogSink;
struct Unit;

// Early-fairness opener: team-turns 1..4 of the battle allow 2/3/4/5 actors
// and ignore the AP threshold.
inline constexpr int OPENER_TEAM_TURNS = 4;

int openerMaxActors(int teamTurn);

struct TurnRule {
    int teamTurn = 1;
    int maxActors = 5;
    bool ignoreApThreshold = false;
    int apThreshold = 100;

    // "AP>=100" or "ignore AP>=100 (early fairness T2)"
    std::string note() const;
};

TurnRule turnRuleFor(int teamTurn, int apThreshold, int normalMaxActors);

// Odd team-turns belong to the starting team.
Team actingTeamForTurn(int teamTurn, Team startTeam);

bool isTickTurn(int teamTurn, int tickEvery = 2);

struct TickExpiry {
    std::string uid;
    std::vector<std::string> expired;
};

// Ticks every unit on both boards (statuses and cooldowns).
std::vector<TickExpiry> applyTwoTurnTick(Board& board);

// Skills start the battle on their full base cooldown.
bool seedBattleCooldowns(Board& board, const Catalog& catalog, BattleError* err = nullptr);

// round(ap_gain over unit mods + status lines, min 0), or 0 when the frame blocks AP gain.
int computeApGain(const Unit& u, const StatusFrame& frame);

struct ActorEntry {
    Unit* unit = nullptr;
    StatusFrame frame;
};

// Turn-start phase for the acting team: start-turn frame, DOT events,
// AP gain. Units killed by DOT drop out. Entries are in slot order.
bool startTeamTurn(Board& board, const Catalog& catalog, Team team, LogSink* log,
                   std::vector<ActorEntry>& out, BattleError* err = nullptr);

// AP desc, slot asc; act-capable only; AP-gated outside the opener; top maxActors.
std::vector<ActorEntry> selectActors(const std::vector<ActorEntry>& living, const TurnRule& rule);

// "A-2(AP=130), A-5(AP=120)" or "(none)"
std::string formatActorList(const std::vector<ActorEntry>& actors);
