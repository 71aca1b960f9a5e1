#include "status.hpp"

#include <algorithm>
#include <sstream>

namespace {

double lessToMult(double pct) {
    const double p = std::max(0.0, pct);
    return std::max(0.0, 1.0 - p / 100.0);
}

double moreToMult(double pct) {
    return std::max(0.0, 1.0 + pct / 100.0);
}

// Instance params first, then the catalog defaults, then `fallback`.
double statusParam(const StatusInstance& inst, const StatusDef& def, const std::string& key, double fallback) {
    auto it = inst.params.find(key);
    if (it != inst.params.end()) return it->second;
    return paramOr(def.params, key, fallback);
}

void contribute(const StatusInstance& inst, const StatusDef& def, StatusFrame& f, const std::string& uid) {
    const std::string& key = inst.key;

    if (key == STATUS_STUN || key == STATUS_IMMOBILIZED) {
        f.canAct = false;
    } else if (key == STATUS_SILENCE) {
        f.canUseActiveSkills = false;
    } else if (key == STATUS_DISARM) {
        f.canBasicAttack = false;
    } else if (key == STATUS_BREAK) {
        f.ignorePassives = true;
    } else if (key == STATUS_PANIC) {
        f.skillDamageMult *= lessToMult(statusParam(inst, def, "skill_damage_less_pct", 0.0));
    } else if (key == STATUS_WEAKEN) {
        f.attackDamageMult *= lessToMult(statusParam(inst, def, "attack_damage_less_pct", 0.0));
    } else if (key == STATUS_BRAND) {
        f.damageTakenMult *= moreToMult(statusParam(inst, def, "damage_taken_more_pct", 0.0));
    } else if (key == STATUS_DULL) {
        f.accuracyIncPctDelta += statusParam(inst, def, "accuracy_inc_pct", 0.0);
    } else if (key == STATUS_SLOW) {
        f.apGainBaseDelta += statusParam(inst, def, "ap_base_delta", 0.0);
    } else if (key == STATUS_CHILL) {
        f.apGainBaseDelta += statusParam(inst, def, "ap_base_delta", -5.0);
        f.mhrBaseDelta += statusParam(inst, def, "mhr_base_delta", -10.0);
    } else if (key == STATUS_SHRED) {
        f.armourBaseDelta += statusParam(inst, def, "armour_base_delta", 0.0);
    } else if (key == STATUS_SUNDER) {
        f.mrBaseDelta += statusParam(inst, def, "mr_base_delta", 0.0);
    } else if (key == STATUS_BLEEDING) {
        const double ratio = statusParam(inst, def, "dot_ratio_of_last_triggered_hit", 0.30);
        const double hit = statusParam(inst, def, "hit_damage", 0.0);
        const double amount = std::max(0.0, ratio * hit);
        if (amount > 0.0) {
            StatusEvent ev;
            ev.kind = StatusEventKind::Damage;
            ev.targetUid = uid;
            ev.statusKey = key;
            ev.amount = amount;
            ev.text = uid + " bleeds";
            f.events.push_back(std::move(ev));
        }
    }

    if (def.preventsAction) f.canAct = false;
    if (def.blocksApGain) f.blockApGain = true;
}

} // namespace

const std::vector<std::string>& statusPriority() {
    static const std::vector<std::string> order = {
        STATUS_STUN,
        STATUS_IMMOBILIZED,
        STATUS_SILENCE,
        STATUS_DISARM,
        STATUS_BREAK,
        STATUS_PANIC,
        STATUS_WEAKEN,
        STATUS_BRAND,
        STATUS_DULL,
        STATUS_SLOW,
        STATUS_CHILL,
        STATUS_SHRED,
        STATUS_SUNDER,
        STATUS_BLEEDING,
    };
    return order;
}

bool applyStatus(Unit& u, const StatusDef& def, const StatusApplyOptions& opts) {
    if (!def.positive && u.hasStatus(STATUS_IMMUNITY)) return false;

    const int duration = std::max(0, opts.duration.value_or(def.defaultDuration));
    const int maxStacks = std::max(1, def.maxStacks);

    StatusInstance* existing = u.findStatus(def.key);
    if (!existing) {
        StatusInstance inst;
        inst.key = def.key;
        inst.remaining = duration;
        inst.stacks = def.stackable ? std::clamp(opts.stacksAdd, 1, maxStacks) : 1;
        inst.params = opts.params;
        inst.sourceId = opts.sourceId;
        u.statuses.push_back(std::move(inst));
        return true;
    }

    if (def.stackable) {
        const int add = std::clamp(opts.stacksAdd, -maxStacks, maxStacks);
        existing->stacks = std::clamp(existing->stacks + add, 1, maxStacks);
    }
    if (def.refreshOnReapply) {
        existing->remaining = std::max(existing->remaining, duration);
    }
    for (const auto& kv : opts.params) existing->params[kv.first] = kv.second;
    if (!opts.sourceId.empty()) existing->sourceId = opts.sourceId;
    return true;
}

bool applyStatusByKey(Unit& u, const Catalog& catalog, const std::string& key,
                      const StatusApplyOptions& opts, bool& applied, BattleError* err) {
    applied = false;
    const StatusDef* def = catalog.requireStatus(key, err);
    if (!def) return false;
    applied = applyStatus(u, *def, opts);
    return true;
}

bool removeStatus(Unit& u, const std::string& key) {
    auto it = std::find_if(u.statuses.begin(), u.statuses.end(),
                           [&](const StatusInstance& s) { return s.key == key; });
    if (it == u.statuses.end()) return false;
    u.statuses.erase(it);
    return true;
}

void purgeExpiredStatuses(Unit& u) {
    u.statuses.erase(std::remove_if(u.statuses.begin(), u.statuses.end(),
                                    [](const StatusInstance& s) { return s.remaining <= 0; }),
                     u.statuses.end());
}

std::vector<std::string> tickUnit(Unit& u) {
    for (auto& kv : u.cooldowns) {
        if (kv.second > 0) --kv.second;
    }

    std::vector<std::string> expired;
    for (StatusInstance& s : u.statuses) {
        if (s.remaining > 0) --s.remaining;
        if (s.remaining <= 0) expired.push_back(s.key);
    }
    purgeExpiredStatuses(u);
    return expired;
}

bool buildStartTurnFrame(Unit& u, const Catalog& catalog, StatusFrame& out, BattleError* err) {
    purgeExpiredStatuses(u);

    StatusFrame f;
    const std::string uid = u.uid();

    // Priority keys first, then anything else in the order it was applied.
    std::vector<const StatusInstance*> ordered;
    ordered.reserve(u.statuses.size());
    for (const std::string& key : statusPriority()) {
        if (const StatusInstance* s = u.findStatus(key)) ordered.push_back(s);
    }
    for (const StatusInstance& s : u.statuses) {
        const auto& prio = statusPriority();
        if (std::find(prio.begin(), prio.end(), s.key) == prio.end()) ordered.push_back(&s);
    }

    for (const StatusInstance* inst : ordered) {
        const StatusDef* def = catalog.requireStatus(inst->key, err);
        if (!def) return false;
        contribute(*inst, *def, f, uid);
    }

    if (!f.canAct) {
        f.canBasicAttack = false;
        f.canUseActiveSkills = false;

        StatusEvent ev;
        ev.kind = StatusEventKind::Log;
        ev.targetUid = uid;
        ev.text = uid + " cannot act due to status";
        f.events.push_back(std::move(ev));
    }

    out = std::move(f);
    return true;
}

std::vector<ModifierLine> statusModifierLines(const StatusFrame& frame) {
    std::vector<ModifierLine> out;
    auto add = [&](const char* stat, ModifierTag tag, double v) {
        if (v != 0.0) out.push_back(ModifierLine{stat, tag, v, "status"});
    };
    add(STAT_AP_GAIN, ModifierTag::Base, frame.apGainBaseDelta);
    add(STAT_MHR, ModifierTag::Base, frame.mhrBaseDelta);
    add(STAT_ACCURACY, ModifierTag::Inc, frame.accuracyIncPctDelta);
    add(STAT_ARMOUR, ModifierTag::Base, frame.armourBaseDelta);
    add(STAT_MR, ModifierTag::Base, frame.mrBaseDelta);
    return out;
}

std::vector<ModifierLine> frameModifierLines(const Unit& u, const StatusFrame& frame) {
    std::vector<ModifierLine> mods = activeModifiers(u, !frame.ignorePassives);
    const std::vector<ModifierLine> extra = statusModifierLines(frame);
    mods.insert(mods.end(), extra.begin(), extra.end());
    return mods;
}

std::string describeStatuses(const Unit& u) {
    if (u.statuses.empty()) return "-";
    std::ostringstream ss;
    bool first = true;
    for (const StatusInstance& s : u.statuses) {
        if (!first) ss << ", ";
        first = false;
        ss << s.key << "(" << s.remaining << ")";
        if (s.stacks > 1) ss << "x" << s.stacks;
    }
    return ss.str();
}
