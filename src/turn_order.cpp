#include "turn_order.hpp"

#include "battle_log.hpp"
#include "board.hpp"
#include "unit.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

int openerMaxActors(int teamTurn) {
    switch (teamTurn) {
        case 1: return 2;
        case 2: return 3;
        case 3: return 4;
        case 4: return 5;
        default: return 0;
    }
}

std::string TurnRule::note() const {
    std::ostringstream ss;
    if (ignoreApThreshold) {
        ss << "ignore AP>=" << apThreshold << " (early fairness T" << teamTurn << ")";
    } else {
        ss << "AP>=" << apThreshold;
    }
    return ss.str();
}

TurnRule turnRuleFor(int teamTurn, int apThreshold, int normalMaxActors) {
    TurnRule r;
    r.teamTurn = teamTurn;
    r.apThreshold = apThreshold;
    if (teamTurn >= 1 && teamTurn <= OPENER_TEAM_TURNS) {
        r.maxActors = openerMaxActors(teamTurn);
        r.ignoreApThreshold = true;
    } else {
        r.maxActors = normalMaxActors;
        r.ignoreApThreshold = false;
    }
    return r;
}

Team actingTeamForTurn(int teamTurn, Team startTeam) {
    return (teamTurn % 2 == 1) ? startTeam : otherTeam(startTeam);
}

bool isTickTurn(int teamTurn, int tickEvery) {
    if (tickEvery <= 0) return false;
    return teamTurn > 0 && teamTurn % tickEvery == 0;
}

std::vector<TickExpiry> applyTwoTurnTick(Board& board) {
    std::vector<TickExpiry> out;
    for (Team team : {Team::A, Team::B}) {
        for (auto& kv : board.units(team)) {
            std::vector<std::string> expired = tickUnit(kv.second);
            if (!expired.empty()) out.push_back(TickExpiry{kv.second.uid(), std::move(expired)});
        }
    }
    return out;
}

bool seedBattleCooldowns(Board& board, const Catalog& catalog, BattleError* err) {
    for (Team team : {Team::A, Team::B}) {
        for (auto& kv : board.units(team)) {
            Unit& u = kv.second;
            for (const std::string& key : u.build.skills) {
                const SkillDef* def = catalog.requireSkill(key, err);
                if (!def) return false;
                u.cooldowns[key] = std::max(0, def->cooldown);
            }
        }
    }
    return true;
}

int computeApGain(const Unit& u, const StatusFrame& frame) {
    if (frame.blockApGain) return 0;

    const double gain = evaluateStat(STAT_AP_GAIN, 100.0, frameModifierLines(u, frame), 0.0);
    return static_cast<int>(std::lround(gain));
}

bool startTeamTurn(Board& board, const Catalog& catalog, Team team, LogSink* log,
                   std::vector<ActorEntry>& out, BattleError* err) {
    out.clear();

    for (Unit* u : board.livingUnits(team)) {
        ActorEntry entry;
        entry.unit = u;
        if (!buildStartTurnFrame(*u, catalog, entry.frame, err)) return false;

        for (const StatusEvent& ev : entry.frame.events) {
            if (ev.kind == StatusEventKind::Damage) {
                const double before = u->hp;
                u->hp -= ev.amount;
                std::ostringstream ss;
                ss << "  [DOT] " << u->uid() << " " << ev.statusKey << ": " << std::lround(ev.amount)
                   << " damage (HP " << std::lround(before) << " -> " << std::lround(std::max(0.0, u->hp)) << ")";
                logLine(log, ss.str());
            } else {
                logLine(log, "  [STATUS] " + ev.text);
            }
        }

        if (!u->isAlive()) {
            logLine(log, "  " + u->uid() + " is defeated");
            continue;
        }

        const int before = u->ap;
        const int gain = computeApGain(*u, entry.frame);
        u->ap = std::max(0, before + gain);
        {
            std::ostringstream ss;
            ss << "  AP gain: " << u->uid() << ": " << before << " -> " << u->ap << " (+" << gain << ")";
            if (entry.frame.blockApGain) ss << " [blocked]";
            logLine(log, ss.str());
        }

        out.push_back(std::move(entry));
    }
    return true;
}

std::vector<ActorEntry> selectActors(const std::vector<ActorEntry>& living, const TurnRule& rule) {
    std::vector<ActorEntry> ranked;
    for (const ActorEntry& e : living) {
        if (!e.unit || !e.unit->isAlive()) continue;
        if (!e.frame.canAct) continue;
        if (!rule.ignoreApThreshold && e.unit->ap < rule.apThreshold) continue;
        ranked.push_back(e);
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const ActorEntry& a, const ActorEntry& b) {
        if (a.unit->ap != b.unit->ap) return a.unit->ap > b.unit->ap;
        return a.unit->slot < b.unit->slot;
    });

    const size_t cap = static_cast<size_t>(std::max(0, rule.maxActors));
    if (ranked.size() > cap) ranked.resize(cap);
    return ranked;
}

std::string formatActorList(const std::vector<ActorEntry>& actors) {
    if (actors.empty()) return "(none)";
    std::ostringstream ss;
    for (size_t i = 0; i < actors.size(); ++i) {
        if (i) ss << ", ";
        ss << actors[i].unit->uid() << "(AP=" << actors[i].unit->ap << ")";
    }
    return ss.str();
}
