#include "catalog.hpp"

#include <utility>

namespace {

CatalogModifier mod(const char* stat, ModifierTag tag, double value, const char* source) {
    CatalogModifier m;
    m.stat = stat;
    m.tag = tag;
    m.value = value;
    m.source = source;
    return m;
}

// "X%K base" lines are written with value 1.0 and resolved per unit.
CatalogModifier kScaled(const char* stat, ModifierTag tag, double kPct, const char* source) {
    CatalogModifier m = mod(stat, tag, 1.0, source);
    m.kPct = kPct;
    return m;
}

Proc proc(const char* key, double chancePct, ParamBag params = {}) {
    Proc p;
    p.key = key;
    p.chancePct = chancePct;
    p.params = std::move(params);
    return p;
}

PassiveOption passive(const char* name, std::vector<CatalogModifier> mods, std::vector<Proc> procs = {}) {
    PassiveOption p;
    p.name = name;
    p.mods = std::move(mods);
    p.procs = std::move(procs);
    return p;
}

StatusDef status(const char* key, const char* name, bool positive, int defaultDuration = 1, ParamBag params = {}) {
    StatusDef s;
    s.key = key;
    s.name = name;
    s.positive = positive;
    s.defaultDuration = defaultDuration;
    s.params = std::move(params);
    return s;
}

std::vector<WeaponDef> builtinWeapons() {
    using T = ModifierTag;
    std::vector<WeaponDef> c;

    {
        WeaponDef w;
        w.key = "Sword";
        w.melee = true;
        w.shape = AoeShape::Single;
        w.location = TargetLocation::Frontline;
        w.ap.baseDelta = -20.0;
        w.defaultMods = {mod("skill_points", T::Special, 30.0, "Sword: default")};
        w.passives[1] = passive("Retaliate chance 20%", {}, {proc("retaliate_on_hit", 20.0)});
        w.passives[2] = passive("All attributes +10% increased", {
            mod(STAT_STR, T::Inc, 10.0, "Sword: passive2"),
            mod(STAT_DEX, T::Inc, 10.0, "Sword: passive2"),
            mod(STAT_INT, T::Inc, 10.0, "Sword: passive2"),
            mod(STAT_VIT, T::Inc, 10.0, "Sword: passive2"),
        });
        w.passives[3] = passive("Attack +5% per turn, up to 40%", {},
                                {proc("attack_ramp_per_turn", 100.0, {{"inc_per_turn_pct", 5.0}, {"cap_pct", 40.0}})});
        c.push_back(std::move(w));
    }
    {
        WeaponDef w;
        w.key = "Spear";
        w.melee = true;
        w.shape = AoeShape::Behind;
        w.location = TargetLocation::Frontline;
        w.ratios.nearRatio = 0.5;
        w.ap.baseDelta = -20.0;
        w.defaultProcs = {proc("retaliate_on_hit", 40.0)};
        w.passives[1] = passive("Bleeding chance 25%", {}, {proc("bleed_on_hit", 25.0, {{"duration", 1.0}})});
        w.passives[2] = passive("Spear throw", {},
                                {proc("spear_throw_mode", 100.0, {{"disable_retaliate", 1.0}, {"aim_row", 1.0}})});
        w.passives[3] = passive("Final damage +20% per member advantage",
                                {mod("fd_more_per_member_advantage_pct", T::Special, 20.0, "Spear: passive3")});
        c.push_back(std::move(w));
    }
    {
        WeaponDef w;
        w.key = "Axe";
        w.melee = true;
        w.shape = AoeShape::RowAdjacent;
        w.location = TargetLocation::Frontline;
        w.ratios.splash = 0.5;
        w.ap.lessPct = 30.0;
        w.defaultProcs = {proc("stun_on_hit", 20.0, {{"duration_turns", 1.0}})};
        w.passives[1] = passive("Damage vs non-melee +20%",
                                {mod("dmg_more_vs_non_melee_pct", T::Special, 20.0, "Axe: passive1")});
        w.passives[2] = passive("Final damage up to +20% when HP decreases",
                                {mod("fd_ramp_when_hp_low_pct", T::Special, 20.0, "Axe: passive2")});
        w.passives[3] = passive("Final damage +20% per member disadvantage",
                                {mod("fd_more_per_member_disadvantage_pct", T::Special, 20.0, "Axe: passive3")});
        c.push_back(std::move(w));
    }
    {
        WeaponDef w;
        w.key = "Gun";
        w.melee = false;
        w.shape = AoeShape::Line;
        w.location = TargetLocation::Frontline;
        w.ratios.nearRatio = 0.75;
        w.ratios.farRatio = 0.5;
        w.ap.baseDelta = -10.0;
        w.defaultProcs = {proc("pure_damage_on_hit", 20.0)};
        w.passives[1] = passive("Accuracy +10", {mod(STAT_ACCURACY, T::Base, 10.0, "Gun: passive1")});
        w.passives[2] = passive("Damage to cannon +20% more",
                                {mod("dmg_more_vs_cannon_pct", T::Special, 20.0, "Gun: passive2")});
        w.passives[3] = passive("Damage to caster +20% more",
                                {mod("dmg_more_vs_caster_pct", T::Special, 20.0, "Gun: passive3")});
        c.push_back(std::move(w));
    }
    {
        WeaponDef w;
        w.key = "Bow";
        w.melee = false;
        w.shape = AoeShape::Single;
        w.location = TargetLocation::Anywhere;
        w.ap.baseDelta = -5.0;
        w.defaultMods = {mod(STAT_CRIT_CHANCE, T::Base, 40.0, "Bow: default")};
        w.passives[1] = passive("Multi-hit rate +20 base", {mod(STAT_MHR, T::Base, 20.0, "Bow: passive1")});
        w.passives[2] = passive("AP gain +10 base", {mod(STAT_AP_GAIN, T::Base, 10.0, "Bow: passive2")});
        w.passives[3] = passive("Final damage +5% per distance",
                                {mod("fd_more_per_distance_pct", T::Special, 5.0, "Bow: passive3")});
        c.push_back(std::move(w));
    }
    {
        WeaponDef w;
        w.key = "Cannon";
        w.melee = false;
        w.shape = AoeShape::Cross;
        w.location = TargetLocation::Anywhere;
        w.ratios.splash = 0.5;
        w.ap.lessPct = 20.0;
        w.defaultProcs = {proc("ignore_guard_stance", 100.0)};
        w.passives[1] = passive("Shred = skill power x 10", {}, {proc("apply_shred_on_hit", 100.0, {{"multiplier", 10.0}})});
        w.passives[2] = passive("Dull 10%", {}, {proc("apply_dull_on_hit", 10.0)});
        w.passives[3] = passive("Weaken 10%", {}, {proc("apply_weaken_on_hit", 10.0)});
        c.push_back(std::move(w));
    }
    {
        WeaponDef w;
        w.key = "Staff";
        w.melee = false;
        w.shape = AoeShape::Cross;
        w.location = TargetLocation::Frontline;
        w.ratios.splash = 1.0;
        w.ap.lessPct = 20.0;
        w.defaultMods = {mod("skill_points", T::Special, 30.0, "Staff: default")};
        w.passives[1] = passive("Attack damage +10% increased", {mod(STAT_ATTACK, T::Inc, 10.0, "Staff: passive1")});
        w.passives[2] = passive("Spell crit chance +20 base", {mod("scc", T::Base, 20.0, "Staff: passive2")});
        w.passives[3] = passive("Healing crit +20%", {mod("healing_crit", T::Special, 20.0, "Staff: passive3")});
        c.push_back(std::move(w));
    }
    {
        WeaponDef w;
        w.key = "Wand";
        w.melee = false;
        w.shape = AoeShape::Single;
        w.location = TargetLocation::Frontline;
        w.ap.baseDelta = -10.0;
        w.defaultMods = {mod("skill_points", T::Special, 30.0, "Wand: default")};
        w.passives[1] = passive("Skill duration +1", {mod("skill_duration_plus", T::Special, 1.0, "Wand: passive1")});
        w.passives[2] = passive("Counterspell chance 10%", {}, {proc("counterspell_on_enemy_cast", 10.0)});
        w.passives[3] = passive("All skill mana cost -50%", {mod("mana_cost_less_pct", T::Special, 50.0, "Wand: passive3")});
        c.push_back(std::move(w));
    }
    return c;
}

std::vector<OffhandDef> builtinOffhands() {
    using T = ModifierTag;
    std::vector<OffhandDef> c;

    {
        OffhandDef o;
        o.key = "MaintainKit";
        o.defaultMods = {mod("weapon_damage_base_pct", T::Special, 0.40, "MaintainKit: default")};
        o.passives[1] = passive("Accuracy +10", {mod(STAT_ACCURACY, T::Base, 10.0, "MaintainKit: passive1")});
        o.passives[2] = passive("Attributes +10%K base each", {
            kScaled(STAT_STR, T::Base, 0.10, "MaintainKit: passive2"),
            kScaled(STAT_DEX, T::Base, 0.10, "MaintainKit: passive2"),
            kScaled(STAT_INT, T::Base, 0.10, "MaintainKit: passive2"),
            kScaled(STAT_VIT, T::Base, 0.10, "MaintainKit: passive2"),
        });
        o.passives[3] = passive("Basic attack AoE penalty -10%",
                                {mod("basic_aoe_penalty_reduction_pct", T::Special, 10.0, "MaintainKit: passive3")});
        c.push_back(std::move(o));
    }
    {
        OffhandDef o;
        o.key = "Shield";
        o.ap.lessPct = 20.0;
        o.defaultMods = {mod("block_chance", T::Base, 20.0, "Shield: default")};
        o.passives[1] = passive("Allies behind take 20% less skill damage",
                                {mod("allies_behind_skill_damage_less_pct", T::Special, 20.0, "Shield: passive1")});
        o.passives[2] = passive("Behind ally block chain", {},
                                {proc("block_chain_behind", 100.0, {{"behind_block_share_pct", 50.0}})});
        o.passives[3] = passive("Guard effectiveness +20%",
                                {mod("guard_effectiveness_pct", T::Special, 20.0, "Shield: passive3")});
        c.push_back(std::move(o));
    }
    {
        OffhandDef o;
        o.key = "Orb";
        o.defaultProcs = {proc("start_immunity", 100.0, {{"turns", 4.0}})};
        o.passives[1] = passive("Energy shield = INT x 20", {}, {proc("energy_shield", 100.0, {{"int_multiplier", 20.0}})});
        o.passives[2] = passive("Mana shield", {},
                                {proc("mana_shield", 100.0, {{"absorb_pct", 50.0}, {"mana_cost_multiplier", 2.0}})});
        o.passives[3] = passive("Skill check", {}, {proc("orb_skill_check", 100.0)});
        c.push_back(std::move(o));
    }
    {
        OffhandDef o;
        o.key = "Book";
        o.ap.lessPct = 10.0;
        o.defaultMods = {mod("skill_points", T::Special, 30.0, "Book: default")};
        o.passives[1] = passive("Talent point +1", {mod("talent_points", T::Special, 1.0, "Book: passive1")});
        o.passives[2] = passive("INT +10% increased", {mod(STAT_INT, T::Inc, 10.0, "Book: passive2")});
        o.passives[3] = passive("Ignore neglect effect", {}, {proc("ignore_neglect", 100.0)});
        c.push_back(std::move(o));
    }
    {
        OffhandDef o;
        o.key = "Quiver";
        o.defaultMods = {mod(STAT_ACCURACY, T::Base, 20.0, "Quiver: default")};
        o.passives[1] = passive("Critical damage +25", {mod(STAT_CRIT_DAMAGE, T::Base, 25.0, "Quiver: passive1")});
        o.passives[2] = passive("Apply slow (-10 AP) on hit", {},
                                {proc("apply_slow", 100.0, {{"slow_ap_base_delta", -10.0}})});
        o.passives[3] = passive("Split arrow",
                                {mod("split_arrow_damage_ratio", T::Special, 0.50, "Quiver: passive3")});
        c.push_back(std::move(o));
    }
    {
        OffhandDef o;
        o.key = "Bullet";
        o.defaultMods = {mod(STAT_ATTACK, T::Inc, 20.0, "Bullet: default")};
        o.passives[1] = passive("Critical damage +25", {mod(STAT_CRIT_DAMAGE, T::Base, 25.0, "Bullet: passive1")});
        o.passives[2] = passive("Enemy AP -5 per hit", {},
                                {proc("drain_enemy_ap_on_hit", 100.0, {{"ap_drain_flat", 5.0}})});
        o.passives[3] = passive("Stun chance 5%", {}, {proc("stun_on_hit", 5.0, {{"duration_turns", 1.0}})});
        c.push_back(std::move(o));
    }
    {
        OffhandDef o;
        o.key = "CannonBall";
        o.defaultMods = {
            mod(STAT_MHR, T::Base, -20.0, "CannonBall: default"),
            mod(STAT_ATTACK, T::Inc, 40.0, "CannonBall: default"),
        };
        o.passives[1] = passive("DEX -10% / STR +20% increased", {
            mod(STAT_DEX, T::Inc, -10.0, "CannonBall: passive1"),
            mod(STAT_STR, T::Inc, 20.0, "CannonBall: passive1"),
        });
        o.passives[2] = passive("Final damage +20% when army size equal",
                                {mod("final_damage_more_when_equal_army_pct", T::Special, 20.0, "CannonBall: passive2")});
        o.passives[3] = passive("Basic attack AoE penalty -10%",
                                {mod("basic_aoe_penalty_reduction_pct", T::Special, 10.0, "CannonBall: passive3")});
        c.push_back(std::move(o));
    }
    return c;
}

std::vector<StatusDef> builtinStatuses() {
    std::vector<StatusDef> c;
    c.push_back(status("immunity", "Immunity", true, 4));
    c.push_back(status("silence", "Silence", false));
    c.push_back(status("disarm", "Disarm", false));
    c.push_back(status("break", "Break", false));
    c.push_back(status("panic", "Panic", false, 1, {{"skill_damage_less_pct", 0.0}}));
    c.push_back(status("weaken", "Weaken", false, 1, {{"attack_damage_less_pct", 0.0}}));
    c.push_back(status("slow", "Slow", false, 1, {{"ap_base_delta", 0.0}}));
    c.push_back(status("bleeding", "Bleeding", false, 1, {{"dot_ratio_of_last_triggered_hit", 0.30}}));
    c.push_back(status("shred", "Shred", false, 1, {{"armour_base_delta", 0.0}}));
    c.push_back(status("sunder", "Sunder", false, 1, {{"mr_base_delta", 0.0}}));
    c.push_back(status("dull", "Dull", false, 1, {{"accuracy_inc_pct", 0.0}}));
    c.push_back(status("brand", "Brand", false, 1, {{"damage_taken_more_pct", 0.0}}));
    c.push_back(status("chill", "Chill", false, 1, {{"ap_base_delta", -5.0}, {"mhr_base_delta", -10.0}}));
    c.push_back(status("deliberate", "Deliberate", true, 1, {{"neglect_chance_base_delta", 0.0}}));

    StatusDef stun = status("stun", "Stun", false);
    stun.preventsAction = true;
    c.push_back(std::move(stun));

    StatusDef immobilized = status("immobilized", "Immobilized", false);
    immobilized.preventsAction = true;
    c.push_back(std::move(immobilized));
    return c;
}

SkillDef skill(const char* key, const char* name, int apCost, int mpCost, int cooldown, double ratio) {
    SkillDef s;
    s.key = key;
    s.name = name;
    s.apCost = apCost;
    s.mpCost = mpCost;
    s.cooldown = cooldown;
    s.ratio = ratio;
    return s;
}

SkillStatus skillStatus(const char* key, double chancePct, ParamBag params = {}) {
    SkillStatus st;
    st.key = key;
    st.chancePct = chancePct;
    st.params = std::move(params);
    return st;
}

std::vector<SkillDef> builtinSkills() {
    std::vector<SkillDef> c;
    {
        SkillDef s = skill("power_strike", "Power Strike", 100, 200, 3, 1.5);
        s.targeting.location = TargetLocation::Frontline;
        c.push_back(std::move(s));
    }
    {
        SkillDef s = skill("thunderclap", "Thunderclap", 100, 300, 5, 0.8);
        s.targeting.location = TargetLocation::Frontline;
        s.shape = AoeShape::RowAdjacent;
        s.ratios.splash = 0.5;
        s.status = skillStatus("stun", 30.0);
        c.push_back(std::move(s));
    }
    {
        SkillDef s = skill("frost_nova", "Frost Nova", 100, 300, 4, 1.0);
        s.targeting.location = TargetLocation::Anywhere;
        s.shape = AoeShape::Cross;
        s.ratios.splash = 0.5;
        s.status = skillStatus("chill", 100.0);
        c.push_back(std::move(s));
    }
    {
        SkillDef s = skill("shatter_bolt", "Shatter Bolt", 100, 300, 4, 1.0);
        s.targeting.location = TargetLocation::Frontline;
        s.shape = AoeShape::Line;
        s.status = skillStatus("sunder", 100.0, {{"mr_base_delta", -20.0}});
        c.push_back(std::move(s));
    }
    {
        SkillDef s = skill("crippling_shot", "Crippling Shot", 100, 200, 3, 0.8);
        s.targeting.location = TargetLocation::Anywhere;
        s.status = skillStatus("slow", 100.0, {{"ap_base_delta", -20.0}});
        c.push_back(std::move(s));
    }
    {
        SkillDef s = skill("hex", "Hex", 100, 200, 4, 0.5);
        s.targeting.location = TargetLocation::Anywhere;
        s.status = skillStatus("brand", 100.0, {{"damage_taken_more_pct", 20.0}});
        c.push_back(std::move(s));
    }
    {
        SkillDef s = skill("mind_spike", "Mind Spike", 100, 250, 4, 0.6);
        s.targeting.location = TargetLocation::Anywhere;
        s.status = skillStatus("silence", 50.0);
        c.push_back(std::move(s));
    }
    return c;
}

template <typename Def>
const Def* findIn(const std::map<std::string, Def>& m, const std::string& key) {
    auto it = m.find(key);
    return (it == m.end()) ? nullptr : &it->second;
}

template <typename Def>
const Def* requireIn(const std::map<std::string, Def>& m, const std::string& key, const char* what, BattleError* err) {
    const Def* d = findIn(m, key);
    if (!d) setError(err, BattleErrorKind::UnknownKey, std::string("unknown ") + what + " '" + key + "'");
    return d;
}

template <typename Def>
bool registerIn(std::map<std::string, Def>& m, Def def, const char* what, BattleError* err) {
    if (def.key.empty()) {
        return setError(err, BattleErrorKind::InvalidConfig, std::string("empty ") + what + " key");
    }
    if (m.count(def.key) != 0) {
        return setError(err, BattleErrorKind::InvalidConfig,
                        std::string("duplicate ") + what + " '" + def.key + "'");
    }
    const std::string key = def.key;
    m.emplace(key, std::move(def));
    return true;
}

template <typename Def>
std::vector<std::string> keysOf(const std::map<std::string, Def>& m) {
    std::vector<std::string> out;
    out.reserve(m.size());
    for (const auto& kv : m) out.push_back(kv.first);
    return out;
}

} // namespace

double paramOr(const ParamBag& params, const std::string& key, double fallback) {
    auto it = params.find(key);
    return (it == params.end()) ? fallback : it->second;
}

ModifierLine CatalogModifier::resolve(int k) const {
    ModifierLine line;
    line.stat = stat;
    line.tag = tag;
    line.value = kPct ? value * (*kPct * static_cast<double>(k)) : value;
    line.source = source;
    return line;
}

TargetingSpec WeaponDef::targeting() const {
    TargetingSpec spec;
    spec.side = TargetSide::Enemy;
    spec.location = location;
    spec.scope = TargetScope::Single;
    spec.allowRetarget = true;
    return spec;
}

Catalog Catalog::builtin() {
    Catalog c;
    for (WeaponDef& w : builtinWeapons()) c.weapons_.emplace(w.key, std::move(w));
    for (OffhandDef& o : builtinOffhands()) c.offhands_.emplace(o.key, std::move(o));
    for (StatusDef& s : builtinStatuses()) c.statuses_.emplace(s.key, std::move(s));
    for (SkillDef& s : builtinSkills()) c.skills_.emplace(s.key, std::move(s));
    return c;
}

const WeaponDef* Catalog::findWeapon(const std::string& key) const { return findIn(weapons_, key); }
const OffhandDef* Catalog::findOffhand(const std::string& key) const { return findIn(offhands_, key); }
const StatusDef* Catalog::findStatus(const std::string& key) const { return findIn(statuses_, key); }
const SkillDef* Catalog::findSkill(const std::string& key) const { return findIn(skills_, key); }

const WeaponDef* Catalog::requireWeapon(const std::string& key, BattleError* err) const {
    return requireIn(weapons_, key, "weapon", err);
}

const OffhandDef* Catalog::requireOffhand(const std::string& key, BattleError* err) const {
    return requireIn(offhands_, key, "offhand", err);
}

const StatusDef* Catalog::requireStatus(const std::string& key, BattleError* err) const {
    return requireIn(statuses_, key, "status", err);
}

const SkillDef* Catalog::requireSkill(const std::string& key, BattleError* err) const {
    return requireIn(skills_, key, "skill", err);
}

bool Catalog::registerWeapon(WeaponDef def, BattleError* err) {
    return registerIn(weapons_, std::move(def), "weapon", err);
}

bool Catalog::registerOffhand(OffhandDef def, BattleError* err) {
    return registerIn(offhands_, std::move(def), "offhand", err);
}

bool Catalog::registerStatus(StatusDef def, BattleError* err) {
    if (def.maxStacks < 1) def.maxStacks = 1;
    if (def.defaultDuration < 0) def.defaultDuration = 0;
    return registerIn(statuses_, std::move(def), "status", err);
}

bool Catalog::registerSkill(SkillDef def, BattleError* err) {
    return registerIn(skills_, std::move(def), "skill", err);
}

std::vector<std::string> Catalog::weaponKeys() const { return keysOf(weapons_); }
std::vector<std::string> Catalog::offhandKeys() const { return keysOf(offhands_); }
std::vector<std::string> Catalog::statusKeys() const { return keysOf(statuses_); }
std::vector<std::string> Catalog::skillKeys() const { return keysOf(skills_); }
