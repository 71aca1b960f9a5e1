#pragma once

#include "battle.hpp"
#include "battle_error.hpp"
#include "catalog.hpp"
#include "common.hpp"
#include "status.hpp"

#include <string>

// Combat primitives used by action strategies, plus the reference strategy
// the CLI runs.
//
// Game conditions (no AP, silenced, dead target, ...) come back as
// ActionResult{ok=false, reason}. A `false` return means a data defect
// (unknown key) and should abort the run.

struct ActionResult {
    bool ok = false;
    std::string reason;
    int targetsHit = 0;
    double totalDamage = 0.0;
};

// stat evaluated over the unit's modifier lines plus the frame's status lines.
double effectiveStat(const Unit& u, const std::string& stat, const StatusFrame& frame);

// clamp(accuracy - evasion, 5, 100), in percent.
double hitChancePct(double accuracy, double evasion);

// Weapon basic attack on (targetTeam, targetSlot), expanded by the weapon AoE.
// Costs config.actionApCost. One multi-hit roll per action.
bool resolveBasicAttack(BattleContext& ctx, Unit& actor, Team targetTeam, int targetSlot,
                        ActionResult& out, BattleError* err = nullptr);

struct CastCheck {
    bool ok = false;
    std::string reason;
};

CastCheck canCastActive(const Unit& u, const SkillDef& skill, const StatusFrame& frame);

// Spends AP/MP, sets the cooldown, then deals skill damage and applies the
// skill's status to every living target.
bool castActiveSkill(BattleContext& ctx, Unit& actor, const std::string& skillKey,
                     Team targetTeam, int targetSlot, ActionResult& out, BattleError* err = nullptr);

// First castable skill, else a basic attack, else skip. Targets the front
// slot of the actor's own line when legal, otherwise retargets through the RNG.
class ReferenceStrategy : public ActionStrategy {
public:
    bool act(BattleContext& ctx, Unit& actor, Team actingTeam, BattleError* err) override;
};
