#pragma once

#include "battle_error.hpp"
#include "board.hpp"
#include "catalog.hpp"
#include "common.hpp"
#include "rng.hpp"
#include "status.hpp"

#include <cstdint>
#include <string>
#include <vector>

class LogSink;

struct BattleConfig {
    int maxTeamTurns = 200;
    int actionApCost = 100;
    int apThreshold = 100;
    int normalMaxActors = 5;
    int tickEveryTeamTurns = 2;
    Team startTeam = Team::A;
    uint32_t seed = 1;
};

// Everything one run mutates. One instance per battle; batch runs use one each.
struct BattleState {
    Board board;
    RNG rng;
    int teamTurn = 0;
    Team startTeam = Team::A;
    LogSink* log = nullptr;
    bool battleStarted = false;
};

// Board + RNG seeded from the config, ready for BattleEngine::run().
BattleState makeBattleState(Board board, const BattleConfig& config, LogSink* log = nullptr);

enum class BattleOutcome : uint8_t {
    Undecided = 0,
    TeamAWins,
    TeamBWins,
    Draw,
};

const char* battleOutcomeName(BattleOutcome o);
BattleOutcome winFor(Team t);

// What the strategy sees for one actor's action.
struct BattleContext {
    BattleState& state;
    const Catalog& catalog;
    const BattleConfig& config;
    // Actor's frame, rebuilt right before the action.
    StatusFrame actorFrame;
};

// Decides and executes one actor's action. Spending AP is the strategy's job.
// Returning false aborts the run.
class ActionStrategy {
public:
    virtual ~ActionStrategy() = default;
    virtual bool act(BattleContext& ctx, Unit& actor, Team actingTeam, BattleError* err) = 0;
};

struct TeamTurnReport {
    int teamTurn = 0;
    Team team = Team::A;
    bool ticked = false;
    std::vector<std::string> actorUids;
    BattleOutcome outcome = BattleOutcome::Undecided;
};

// Battle-start procs (e.g. Orb's start_immunity). Applied once per battle.
bool applyBattleStartProcs(BattleState& state, const Catalog& catalog, BattleError* err = nullptr);

// Undecided while both teams have a living unit.
BattleOutcome checkVictory(const Board& board, Team actingTeam);

class BattleEngine {
public:
    BattleEngine(BattleConfig config, const Catalog& catalog, ActionStrategy& strategy);

    const BattleConfig& config() const { return config_; }

    // Seeds cooldowns and applies battle-start procs. Called by the first step;
    // calling it again is a no-op.
    bool prepare(BattleState& state, BattleError* err = nullptr);

    // Exactly one team-turn.
    bool stepTeamTurn(BattleState& state, TeamTurnReport& report, BattleError* err = nullptr);

    // Steps until a team is eliminated or maxTeamTurns is reached (draw).
    bool run(BattleState& state, BattleOutcome& outcome, BattleError* err = nullptr);

private:
    BattleConfig config_;
    const Catalog& catalog_;
    ActionStrategy& strategy_;
};
