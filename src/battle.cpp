#include "battle.hpp"

#include "battle_log.hpp"
#include "turn_order.hpp"

#include <sstream>
#include <utility>

namespace {

void logVictory(LogSink* log, BattleOutcome outcome) {
    if (outcome == BattleOutcome::TeamAWins) logLine(log, "==> Team A wins (Team B defeated)");
    else if (outcome == BattleOutcome::TeamBWins) logLine(log, "==> Team B wins (Team A defeated)");
}

} // namespace

BattleState makeBattleState(Board board, const BattleConfig& config, LogSink* log) {
    BattleState s;
    s.board = std::move(board);
    s.rng.reseed(config.seed);
    s.startTeam = config.startTeam;
    s.log = log;
    return s;
}

const char* battleOutcomeName(BattleOutcome o) {
    switch (o) {
        case BattleOutcome::Undecided: return "UNDECIDED";
        case BattleOutcome::TeamAWins: return "A";
        case BattleOutcome::TeamBWins: return "B";
        case BattleOutcome::Draw:      return "DRAW";
    }
    return "UNDECIDED";
}

BattleOutcome winFor(Team t) {
    return (t == Team::A) ? BattleOutcome::TeamAWins : BattleOutcome::TeamBWins;
}

bool applyBattleStartProcs(BattleState& state, const Catalog& catalog, BattleError* err) {
    for (Team team : {Team::A, Team::B}) {
        for (Unit* u : state.board.livingUnits(team)) {
            for (const Proc& p : collectProcs(*u, catalog)) {
                if (p.key != "start_immunity") continue;

                StatusApplyOptions opts;
                opts.duration = static_cast<int>(paramOr(p.params, "turns", 4.0));
                opts.sourceId = u->uid();

                bool applied = false;
                if (!applyStatusByKey(*u, catalog, "immunity", opts, applied, err)) return false;
                if (applied) {
                    logLine(state.log, "  [START] " + u->uid() + " gains immunity for " +
                                           std::to_string(*opts.duration) + " ticks");
                }
            }
        }
    }
    return true;
}

BattleOutcome checkVictory(const Board& board, Team actingTeam) {
    const Team enemy = otherTeam(actingTeam);
    if (board.aliveCount(enemy) == 0) return winFor(actingTeam);
    if (board.aliveCount(actingTeam) == 0) return winFor(enemy);
    return BattleOutcome::Undecided;
}

BattleEngine::BattleEngine(BattleConfig config, const Catalog& catalog, ActionStrategy& strategy)
    : config_(std::move(config)), catalog_(catalog), strategy_(strategy) {}

bool BattleEngine::prepare(BattleState& state, BattleError* err) {
    if (state.battleStarted) return true;

    if (!seedBattleCooldowns(state.board, catalog_, err)) return false;
    if (!applyBattleStartProcs(state, catalog_, err)) return false;

    state.battleStarted = true;
    return true;
}

bool BattleEngine::stepTeamTurn(BattleState& state, TeamTurnReport& report, BattleError* err) {
    if (!prepare(state, err)) return false;

    state.teamTurn += 1;
    const Team team = actingTeamForTurn(state.teamTurn, state.startTeam);

    report = TeamTurnReport{};
    report.teamTurn = state.teamTurn;
    report.team = team;

    LogSink* log = state.log;
    logLine(log, logRule());
    logLine(log, "TEAM TURN " + std::to_string(state.teamTurn) + " - Team " + teamName(team) + " starts");
    logLine(log, logRule());

    if (isTickTurn(state.teamTurn, config_.tickEveryTeamTurns)) {
        report.ticked = true;
        const std::vector<TickExpiry> expired = applyTwoTurnTick(state.board);
        logLine(log, "  [TICK] Two-turn rule tick: cooldowns/durations -1");
        for (const TickExpiry& e : expired) {
            std::string keys;
            for (const std::string& k : e.expired) {
                if (!keys.empty()) keys += ", ";
                keys += k;
            }
            logLine(log, "  [EXPIRE] " + e.uid + ": " + keys);
        }
    }

    std::vector<ActorEntry> living;
    if (!startTeamTurn(state.board, catalog_, team, log, living, err)) return false;

    report.outcome = checkVictory(state.board, team);
    if (report.outcome != BattleOutcome::Undecided) {
        logVictory(log, report.outcome);
        return true;
    }

    const TurnRule rule = turnRuleFor(state.teamTurn, config_.apThreshold, config_.normalMaxActors);
    const std::vector<ActorEntry> actors = selectActors(living, rule);
    logLine(log, "  Actors selected: max=" + std::to_string(rule.maxActors) + ", rule=" + rule.note() +
                     ": " + formatActorList(actors));

    for (const ActorEntry& entry : actors) {
        Unit& actor = *entry.unit;
        if (!actor.isAlive()) continue;

        BattleContext ctx{state, catalog_, config_, StatusFrame{}};
        if (!buildStartTurnFrame(actor, catalog_, ctx.actorFrame, err)) return false;
        if (!ctx.actorFrame.canAct) {
            logLine(log, "  [SKIP] " + actor.uid() + " cannot act");
            continue;
        }

        report.actorUids.push_back(actor.uid());

        BattleError local;
        if (!strategy_.act(ctx, actor, team, &local)) {
            if (local.kind == BattleErrorKind::None) local.kind = BattleErrorKind::ActionFailed;
            return setError(err, local.kind, actor.uid() + " action failed: " + local.message);
        }

        report.outcome = checkVictory(state.board, team);
        if (report.outcome != BattleOutcome::Undecided) {
            logVictory(log, report.outcome);
            return true;
        }
    }

    return true;
}

bool BattleEngine::run(BattleState& state, BattleOutcome& outcome, BattleError* err) {
    outcome = BattleOutcome::Undecided;
    if (!prepare(state, err)) return false;

    const BattleOutcome early = checkVictory(state.board, state.startTeam);
    if (early != BattleOutcome::Undecided) {
        logVictory(state.log, early);
        outcome = early;
        return true;
    }

    while (state.teamTurn < config_.maxTeamTurns) {
        TeamTurnReport report;
        if (!stepTeamTurn(state, report, err)) return false;
        if (report.outcome != BattleOutcome::Undecided) {
            outcome = report.outcome;
            return true;
        }
    }

    logLine(state.log, "==> Draw (no team defeated after " + std::to_string(config_.maxTeamTurns) + " team-turns)");
    outcome = BattleOutcome::Draw;
    return true;
}
