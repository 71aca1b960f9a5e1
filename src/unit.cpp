#include "unit.hpp"

#include "progression.hpp"

namespace {

void appendResolved(std::vector<ModifierLine>& out, const std::vector<CatalogModifier>& mods, int k,
                    bool passive = false) {
    for (const CatalogModifier& m : mods) {
        ModifierLine line = m.resolve(k);
        line.passive = passive;
        out.push_back(std::move(line));
    }
}

double attribute(const Unit& u, const char* stat, double base, double built, bool includePassives) {
    if (!u.stats) return base;
    if (includePassives) return built;
    return evaluateStat(stat, base, activeModifiers(u, false), 0.0);
}

void appendApAdjust(std::vector<ModifierLine>& out, const ApAdjust& ap, const std::string& source) {
    if (ap.baseDelta != 0.0) out.push_back(ModifierLine{STAT_AP_GAIN, ModifierTag::Base, ap.baseDelta, source + ": AP"});
    if (ap.lessPct != 0.0) out.push_back(ModifierLine{STAT_AP_GAIN, ModifierTag::Less, ap.lessPct, source + ": AP"});
    if (ap.morePct != 0.0) out.push_back(ModifierLine{STAT_AP_GAIN, ModifierTag::More, ap.morePct, source + ": AP"});
}

const PassiveOption* choosePassive(const std::map<int, PassiveOption>& passives, int choice,
                                   const std::string& owner, BattleError* err) {
    if (choice == 0) return nullptr;
    auto it = passives.find(choice);
    if (it == passives.end()) {
        setError(err, BattleErrorKind::UnknownKey,
                 "invalid passive " + std::to_string(choice) + " for '" + owner + "'");
        return nullptr;
    }
    return &it->second;
}

} // namespace

std::string makeUid(Team team, int slot) {
    return std::string(teamName(team)) + "-" + std::to_string(slot);
}

std::string Unit::uid() const {
    return makeUid(team, slot);
}

const StatusInstance* Unit::findStatus(const std::string& key) const {
    for (const StatusInstance& s : statuses) {
        if (s.key == key) return &s;
    }
    return nullptr;
}

StatusInstance* Unit::findStatus(const std::string& key) {
    for (StatusInstance& s : statuses) {
        if (s.key == key) return &s;
    }
    return nullptr;
}

bool Unit::hasStatus(const std::string& key) const {
    const StatusInstance* s = findStatus(key);
    return s && s->remaining > 0;
}

int Unit::cooldown(const std::string& skillKey) const {
    auto it = cooldowns.find(skillKey);
    return (it == cooldowns.end()) ? 0 : it->second;
}

bool resolveUnitK(const Unit& u, int& outK, BattleError* err) {
    if (u.build.kOverride) {
        if (*u.build.kOverride <= 0) {
            return setError(err, BattleErrorKind::InvalidConfig, u.uid() + ": K override must be positive");
        }
        outK = *u.build.kOverride;
        return true;
    }
    BattleError local;
    if (!kForLevel(u.base.level, outK, &local)) {
        return setError(err, local.kind, u.uid() + ": " + local.message);
    }
    return true;
}

bool collectModifiers(const Unit& u, const Catalog& catalog, int k,
                      std::vector<ModifierLine>& out, BattleError* err) {
    std::vector<ModifierLine> lines = u.build.gear;

    if (!u.build.weaponKey.empty()) {
        const WeaponDef* w = catalog.requireWeapon(u.build.weaponKey, err);
        if (!w) return false;
        appendResolved(lines, w->defaultMods, k);
        if (u.build.weaponPassive != 0) {
            const PassiveOption* p = choosePassive(w->passives, u.build.weaponPassive, w->key, err);
            if (!p) return false;
            appendResolved(lines, p->mods, k, true);
        }
        appendApAdjust(lines, w->ap, w->key);
    }

    if (!u.build.offhandKey.empty()) {
        const OffhandDef* o = catalog.requireOffhand(u.build.offhandKey, err);
        if (!o) return false;
        appendResolved(lines, o->defaultMods, k);
        if (u.build.offhandPassive != 0) {
            const PassiveOption* p = choosePassive(o->passives, u.build.offhandPassive, o->key, err);
            if (!p) return false;
            appendResolved(lines, p->mods, k, true);
        }
        appendApAdjust(lines, o->ap, o->key);
    }

    out = std::move(lines);
    return true;
}

std::vector<Proc> collectProcs(const Unit& u, const Catalog& catalog, bool includePassives) {
    std::vector<Proc> out;

    auto addFrom = [&](const std::vector<Proc>& defaults, const std::map<int, PassiveOption>& passives, int choice) {
        out.insert(out.end(), defaults.begin(), defaults.end());
        if (!includePassives || choice == 0) return;
        auto it = passives.find(choice);
        if (it != passives.end()) out.insert(out.end(), it->second.procs.begin(), it->second.procs.end());
    };

    if (const WeaponDef* w = catalog.findWeapon(u.build.weaponKey)) {
        addFrom(w->defaultProcs, w->passives, u.build.weaponPassive);
    }
    if (const OffhandDef* o = catalog.findOffhand(u.build.offhandKey)) {
        addFrom(o->defaultProcs, o->passives, u.build.offhandPassive);
    }
    return out;
}

std::vector<ModifierLine> activeModifiers(const Unit& u, bool includePassives) {
    if (includePassives) return u.mods;
    std::vector<ModifierLine> out;
    out.reserve(u.mods.size());
    for (const ModifierLine& m : u.mods) {
        if (!m.passive) out.push_back(m);
    }
    return out;
}

double statBaseValue(const Unit& u, const std::string& stat, bool includePassives) {
    const double str = attribute(u, STAT_STR, u.base.str, u.stats ? u.stats->str : 0.0, includePassives);
    const double dex = attribute(u, STAT_DEX, u.base.dex, u.stats ? u.stats->dex : 0.0, includePassives);
    const double intel = attribute(u, STAT_INT, u.base.intel, u.stats ? u.stats->intel : 0.0, includePassives);
    const double vit = attribute(u, STAT_VIT, u.base.vit, u.stats ? u.stats->vit : 0.0, includePassives);

    if (stat == STAT_HP) return vit * HP_PER_VIT;
    if (stat == STAT_MP) return intel * MP_PER_INT;
    if (stat == STAT_ATTACK) return str * ATTACK_PER_STR;
    if (stat == STAT_MR) return intel * MR_PER_INT;
    if (stat == STAT_MHR) return dex * MHR_PER_DEX;
    if (stat == STAT_CRIT_CHANCE) return u.base.critChance;
    if (stat == STAT_CRIT_DAMAGE) return u.base.critDamage;
    if (stat == STAT_ACCURACY) return u.base.accuracy;
    if (stat == STAT_EVASION) return u.base.evasion;
    if (stat == STAT_SKILL_EVASION) return u.base.skillEvasion;
    if (stat == STAT_AP_GAIN) return 100.0;
    if (stat == STAT_STR) return u.base.str;
    if (stat == STAT_DEX) return u.base.dex;
    if (stat == STAT_INT) return u.base.intel;
    if (stat == STAT_VIT) return u.base.vit;
    return 0.0;
}

bool recomputeStats(Unit& u, const Catalog& catalog, BattleError* err) {
    int k = 0;
    if (!resolveUnitK(u, k, err)) return false;

    std::vector<ModifierLine> mods;
    if (!collectModifiers(u, catalog, k, mods, err)) return false;

    UnitStats s;
    s.k = k;

    s.str = evaluateStat(STAT_STR, u.base.str, mods, 0.0);
    s.dex = evaluateStat(STAT_DEX, u.base.dex, mods, 0.0);
    s.intel = evaluateStat(STAT_INT, u.base.intel, mods, 0.0);
    s.vit = evaluateStat(STAT_VIT, u.base.vit, mods, 0.0);

    s.hpMax = evaluateStat(STAT_HP, s.vit * HP_PER_VIT, mods, 1.0);
    s.mpMax = evaluateStat(STAT_MP, s.intel * MP_PER_INT, mods, 0.0);
    s.attack = evaluateStat(STAT_ATTACK, s.str * ATTACK_PER_STR, mods, 0.0);
    s.armour = evaluateStat(STAT_ARMOUR, 0.0, mods, 0.0);
    s.mr = evaluateStat(STAT_MR, s.intel * MR_PER_INT, mods, 0.0);
    s.mhr = evaluateStat(STAT_MHR, s.dex * MHR_PER_DEX, mods, 0.0);
    s.critChance = evaluateStat(STAT_CRIT_CHANCE, u.base.critChance, mods, 0.0);
    s.critDamage = evaluateStat(STAT_CRIT_DAMAGE, u.base.critDamage, mods, 0.0);
    s.accuracy = evaluateStat(STAT_ACCURACY, u.base.accuracy, mods, 0.0);
    s.evasion = evaluateStat(STAT_EVASION, u.base.evasion, mods, 0.0);
    s.skillEvasion = evaluateStat(STAT_SKILL_EVASION, u.base.skillEvasion, mods, 0.0);
    s.apGain = evaluateStat(STAT_AP_GAIN, 100.0, mods, 0.0);
    s.skillPower = s.intel * static_cast<double>(k) * SKILL_POWER_FACTOR;

    const bool firstBuild = !u.stats.has_value();
    u.stats = s;
    u.mods = std::move(mods);

    if (firstBuild) {
        if (u.hp <= 0.0) u.hp = s.hpMax;
        if (u.mp <= 0.0) u.mp = s.mpMax;
    }
    return true;
}
