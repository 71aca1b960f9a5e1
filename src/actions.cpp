#include "actions.hpp"

#include "aoe.hpp"
#include "battle_log.hpp"
#include "damage.hpp"
#include "grid.hpp"
#include "targeting.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

long shown(double v) {
    return std::lround(std::max(0.0, v));
}

bool applyStatusLogged(BattleContext& ctx, Unit& target, const std::string& key,
                       const StatusApplyOptions& opts, const std::string& via, BattleError* err) {
    bool applied = false;
    if (!applyStatusByKey(target, ctx.catalog, key, opts, applied, err)) return false;
    if (applied) {
        logLine(ctx.state.log, "    [" + via + "] " + target.uid() + " gains " + key);
    } else {
        logLine(ctx.state.log, "    [" + via + "] " + target.uid() + " resists " + key + " (immune)");
    }
    return true;
}

double skillPowerOf(const Unit& u, const StatusFrame& frame) {
    if (!u.stats) return 0.0;
    return effectiveStat(u, STAT_INT, frame) * static_cast<double>(u.stats->k) * SKILL_POWER_FACTOR;
}

void dealDamage(BattleContext& ctx, Unit& target, double amount, const std::string& what) {
    const double before = target.hp;
    target.hp -= amount;
    std::ostringstream ss;
    ss << "    -> " << target.uid() << ": " << shown(amount) << " " << what
       << " (HP " << shown(before) << " -> " << shown(target.hp) << ")";
    logLine(ctx.state.log, ss.str());
    if (!target.isAlive()) logLine(ctx.state.log, "    " + target.uid() + " is defeated");
}

// On-hit procs of a basic attack against the primary target.
bool resolveOnHitProcs(BattleContext& ctx, Unit& actor, Unit& target, double hitDamage,
                       double rawDamage, BattleError* err) {
    RNG& rng = ctx.state.rng;
    const std::vector<Proc> procs = collectProcs(actor, ctx.catalog, !ctx.actorFrame.ignorePassives);

    for (const Proc& p : procs) {
        const bool known = p.key == "stun_on_hit" || p.key == "bleed_on_hit" || p.key == "apply_slow" ||
                           p.key == "apply_dull_on_hit" || p.key == "apply_weaken_on_hit" ||
                           p.key == "apply_shred_on_hit" || p.key == "drain_enemy_ap_on_hit" ||
                           p.key == "pure_damage_on_hit";
        if (!known) continue;
        if (!target.isAlive()) break;
        if (!rng.chance(p.chancePct / 100.0)) continue;

        StatusApplyOptions opts;
        opts.sourceId = actor.uid();

        if (p.key == "stun_on_hit") {
            opts.duration = static_cast<int>(paramOr(p.params, "duration_turns", 1.0));
            if (!applyStatusLogged(ctx, target, "stun", opts, p.key, err)) return false;
        } else if (p.key == "bleed_on_hit") {
            opts.duration = static_cast<int>(paramOr(p.params, "duration", 1.0));
            opts.params["hit_damage"] = hitDamage;
            if (!applyStatusLogged(ctx, target, "bleeding", opts, p.key, err)) return false;
        } else if (p.key == "apply_slow") {
            opts.params["ap_base_delta"] = paramOr(p.params, "slow_ap_base_delta", -10.0);
            if (!applyStatusLogged(ctx, target, "slow", opts, p.key, err)) return false;
        } else if (p.key == "apply_dull_on_hit") {
            opts.params["accuracy_inc_pct"] = paramOr(p.params, "accuracy_inc_pct", -10.0);
            if (!applyStatusLogged(ctx, target, "dull", opts, p.key, err)) return false;
        } else if (p.key == "apply_weaken_on_hit") {
            opts.params["attack_damage_less_pct"] = paramOr(p.params, "attack_damage_less_pct", 10.0);
            if (!applyStatusLogged(ctx, target, "weaken", opts, p.key, err)) return false;
        } else if (p.key == "apply_shred_on_hit") {
            const double sp = skillPowerOf(actor, ctx.actorFrame);
            opts.params["armour_base_delta"] = -paramOr(p.params, "multiplier", 10.0) * sp;
            if (!applyStatusLogged(ctx, target, "shred", opts, p.key, err)) return false;
        } else if (p.key == "drain_enemy_ap_on_hit") {
            const int drain = static_cast<int>(std::lround(paramOr(p.params, "ap_drain_flat", 5.0)));
            const int before = target.ap;
            target.ap = std::max(0, target.ap - drain);
            logLine(ctx.state.log, "    [" + p.key + "] " + target.uid() + " AP " + std::to_string(before) +
                                       " -> " + std::to_string(target.ap));
        } else if (p.key == "pure_damage_on_hit") {
            // The mitigated share of the hit goes through anyway.
            const double extra = std::max(0.0, rawDamage - hitDamage);
            if (extra > 0.0) dealDamage(ctx, target, extra, "pure damage");
        }
    }
    return true;
}

} // namespace

double effectiveStat(const Unit& u, const std::string& stat, const StatusFrame& frame) {
    return evaluateStat(stat, statBaseValue(u, stat, !frame.ignorePassives), frameModifierLines(u, frame), 0.0);
}

double hitChancePct(double accuracy, double evasion) {
    return clampd(accuracy - evasion, 5.0, 100.0);
}

bool resolveBasicAttack(BattleContext& ctx, Unit& actor, Team targetTeam, int targetSlot,
                        ActionResult& out, BattleError* err) {
    out = ActionResult{};
    Board& board = ctx.state.board;
    LogSink* log = ctx.state.log;

    if (!actor.stats) {
        return setError(err, BattleErrorKind::ActionFailed, actor.uid() + " has no stats");
    }
    if (!ctx.actorFrame.canBasicAttack) {
        out.reason = "basic attack not allowed";
        return true;
    }
    if (actor.ap < ctx.config.actionApCost) {
        out.reason = "not enough AP (" + std::to_string(actor.ap) + " < " + std::to_string(ctx.config.actionApCost) + ")";
        return true;
    }
    if (!isValidSlot(targetSlot)) {
        return setError(err, BattleErrorKind::InvalidSlot, "target slot " + std::to_string(targetSlot));
    }
    if (!board.isAlive(targetTeam, targetSlot)) {
        out.reason = "target is not alive";
        return true;
    }

    AoeShape shape = AoeShape::Single;
    AoeRatios ratios;
    std::string weaponName = "bare hands";
    if (!actor.build.weaponKey.empty()) {
        const WeaponDef* w = ctx.catalog.requireWeapon(actor.build.weaponKey, err);
        if (!w) return false;
        shape = w->shape;
        ratios = w->ratios;
        weaponName = w->key;
    }

    actor.ap -= ctx.config.actionApCost;

    const StatusFrame& af = ctx.actorFrame;
    const double attack = effectiveStat(actor, STAT_ATTACK, af);
    const double accuracy = effectiveStat(actor, STAT_ACCURACY, af);
    const double critChance = effectiveStat(actor, STAT_CRIT_CHANCE, af);
    const double critDamage = effectiveStat(actor, STAT_CRIT_DAMAGE, af);
    const double mhr = effectiveStat(actor, STAT_MHR, af);
    const int k = actor.stats->k;

    RNG& rng = ctx.state.rng;
    const HitCount hits = totalHits(1, mhr, rng);

    {
        std::ostringstream ss;
        ss << "  " << actor.uid() << " attacks " << makeUid(targetTeam, targetSlot) << " with " << weaponName
           << " (" << aoeShapeName(shape) << ", hits=" << hits.total << ", AP " << actor.ap + ctx.config.actionApCost
           << " -> " << actor.ap << ")";
        logLine(log, ss.str());
    }

    out.ok = true;

    for (const AoeTarget& t : expandAoe(targetSlot, shape, ratios)) {
        Unit* def = board.get(targetTeam, t.slot);
        if (!def || !def->isAlive()) continue;

        StatusFrame df;
        if (!buildStartTurnFrame(*def, ctx.catalog, df, err)) return false;

        const double evasion = effectiveStat(*def, STAT_EVASION, df);
        if (!rng.chance(hitChancePct(accuracy, evasion) / 100.0)) {
            logLine(log, "    -> " + def->uid() + ": miss");
            continue;
        }

        const bool crit = rng.chance(critChance / 100.0);
        const double raw = rawAttackDamage(attack, t.ratio, crit, critDamage) * af.attackDamageMult *
                           df.damageTakenMult * static_cast<double>(hits.total);
        const double armour = effectiveStat(*def, STAT_ARMOUR, df);
        const double dmg = applyMitigation(raw, mitigation(armour, k));

        dealDamage(ctx, *def, dmg, crit ? "damage (crit)" : "damage");
        out.targetsHit += 1;
        out.totalDamage += dmg;

        if (t.slot == targetSlot) {
            if (!resolveOnHitProcs(ctx, actor, *def, dmg, raw, err)) return false;
        }
    }

    return true;
}

CastCheck canCastActive(const Unit& u, const SkillDef& skill, const StatusFrame& frame) {
    CastCheck c;
    if (!u.isAlive()) {
        c.reason = "caster is dead";
    } else if (!frame.canUseActiveSkills) {
        c.reason = "active skills locked";
    } else if (u.cooldown(skill.key) > 0) {
        c.reason = "cooldown remaining=" + std::to_string(u.cooldown(skill.key));
    } else if (u.ap < skill.apCost) {
        c.reason = "not enough AP (" + std::to_string(u.ap) + " < " + std::to_string(skill.apCost) + ")";
    } else if (u.mp < static_cast<double>(skill.mpCost)) {
        c.reason = "not enough MP (" + std::to_string(std::lround(u.mp)) + " < " + std::to_string(skill.mpCost) + ")";
    } else {
        c.ok = true;
        c.reason = "ok";
    }
    return c;
}

bool castActiveSkill(BattleContext& ctx, Unit& actor, const std::string& skillKey,
                     Team targetTeam, int targetSlot, ActionResult& out, BattleError* err) {
    out = ActionResult{};
    Board& board = ctx.state.board;
    LogSink* log = ctx.state.log;

    const SkillDef* skill = ctx.catalog.requireSkill(skillKey, err);
    if (!skill) return false;
    if (!actor.stats) {
        return setError(err, BattleErrorKind::ActionFailed, actor.uid() + " has no stats");
    }

    const CastCheck check = canCastActive(actor, *skill, ctx.actorFrame);
    if (!check.ok) {
        out.reason = check.reason;
        return true;
    }

    std::vector<std::pair<Team, int>> targets;
    std::vector<double> ratios;
    if (skill->targeting.scope == TargetScope::Single) {
        if (!isValidSlot(targetSlot)) {
            return setError(err, BattleErrorKind::InvalidSlot, "target slot " + std::to_string(targetSlot));
        }
        if (!board.isAlive(targetTeam, targetSlot)) {
            out.reason = "target is not alive";
            return true;
        }
        for (const AoeTarget& t : expandAoe(targetSlot, skill->shape, skill->ratios)) {
            targets.emplace_back(targetTeam, t.slot);
            ratios.push_back(t.ratio);
        }
    } else {
        targets = resolveTargets(board, actor.team, actor.slot, skill->targeting, targetTeam);
        ratios.assign(targets.size(), 1.0);
    }

    actor.ap = std::max(0, actor.ap - skill->apCost);
    actor.mp = std::max(0.0, actor.mp - static_cast<double>(skill->mpCost));
    actor.cooldowns[skill->key] = std::max(0, skill->cooldown);

    {
        std::ostringstream ss;
        ss << "  CAST: " << actor.uid() << " uses " << skill->name << " -> " << makeUid(targetTeam, targetSlot)
           << " (AoE=" << aoeShapeName(skill->shape) << " targets=" << targets.size() << ") AP-" << skill->apCost
           << " MP-" << skill->mpCost << " CD=" << skill->cooldown;
        logLine(log, ss.str());
    }

    RNG& rng = ctx.state.rng;
    const int k = actor.stats->k;
    out.ok = true;

    for (size_t i = 0; i < targets.size(); ++i) {
        Unit* def = board.get(targets[i].first, targets[i].second);
        if (!def || !def->isAlive()) continue;

        const bool hostile = def->team != actor.team;

        if (hostile && skill->ratio > 0.0) {
            StatusFrame df;
            if (!buildStartTurnFrame(*def, ctx.catalog, df, err)) return false;

            const double skillEvasion = effectiveStat(*def, STAT_SKILL_EVASION, df);
            if (rng.chance(skillEvasion / 100.0)) {
                logLine(log, "    -> " + def->uid() + ": evaded");
                continue;
            }

            const double raw = skillPowerOf(actor, ctx.actorFrame) * static_cast<double>(k) * skill->ratio * ratios[i] *
                               ctx.actorFrame.skillDamageMult * df.damageTakenMult;
            const double mr = effectiveStat(*def, STAT_MR, df);
            const double dmg = applyMitigation(raw, mitigation(mr, k));
            dealDamage(ctx, *def, dmg, "skill damage");
            out.targetsHit += 1;
            out.totalDamage += dmg;
        }

        if (skill->status && def->isAlive()) {
            const SkillStatus& st = *skill->status;
            if (rng.chance(st.chancePct / 100.0)) {
                StatusApplyOptions opts;
                opts.duration = st.duration;
                opts.params = st.params;
                opts.sourceId = actor.uid();
                if (!applyStatusLogged(ctx, *def, st.key, opts, skill->key, err)) return false;
            }
        }
    }

    return true;
}

bool ReferenceStrategy::act(BattleContext& ctx, Unit& actor, Team actingTeam, BattleError* err) {
    Board& board = ctx.state.board;
    RNG& rng = ctx.state.rng;

    // Front slot of the actor's own line.
    const int preferredSlot = slotsInLine(slotLine(actor.slot)).front();

    for (const std::string& key : actor.build.skills) {
        const SkillDef* skill = ctx.catalog.requireSkill(key, err);
        if (!skill) return false;
        if (!canCastActive(actor, *skill, ctx.actorFrame).ok) continue;

        const TargetPick pick = pickPrimaryTarget(board, actingTeam, actor.slot, skill->targeting,
                                                  std::nullopt, preferredSlot, &rng);
        if (!pick.ok) continue;

        ActionResult res;
        if (!castActiveSkill(ctx, actor, key, pick.team, pick.slot, res, err)) return false;
        if (res.ok) return true;
    }

    TargetingSpec spec;
    if (!actor.build.weaponKey.empty()) {
        const WeaponDef* w = ctx.catalog.requireWeapon(actor.build.weaponKey, err);
        if (!w) return false;
        spec = w->targeting();
    }

    std::string why;
    if (!ctx.actorFrame.canBasicAttack) {
        why = "basic attack not allowed";
    } else if (actor.ap < ctx.config.actionApCost) {
        why = "not enough AP";
    } else {
        const TargetPick pick = pickPrimaryTarget(board, actingTeam, actor.slot, spec,
                                                  std::nullopt, preferredSlot, &rng);
        if (!pick.ok) {
            why = "no legal target (" + pick.reason + ")";
        } else {
            ActionResult res;
            if (!resolveBasicAttack(ctx, actor, pick.team, pick.slot, res, err)) return false;
            if (res.ok) return true;
            why = res.reason;
        }
    }

    logLine(ctx.state.log, "  " + actor.uid() + " skips (" + why + ")");
    return true;
}
