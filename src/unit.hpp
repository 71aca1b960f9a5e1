#pragma once

#include "battle_error.hpp"
#include "catalog.hpp"
#include "common.hpp"
#include "modifiers.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

// Attribute scaling used by the stat builder.
inline constexpr double ATTACK_PER_STR = 1.0;
inline constexpr double MHR_PER_DEX = 0.05;
inline constexpr double MP_PER_INT = 100.0;
inline constexpr double MR_PER_INT = 1.0;
inline constexpr double HP_PER_VIT = 50.0;
inline constexpr double SKILL_POWER_FACTOR = 0.000005125; // skill power = INT * K * factor

struct UnitBase {
    int level = 1;

    double str = 0.0;
    double dex = 0.0;
    double intel = 0.0;
    double vit = 0.0;

    double critChance = 5.0;
    double critDamage = 150.0;
    double accuracy = 100.0;
    double evasion = 0.0;
    double skillEvasion = 0.0;
};

struct UnitBuild {
    std::string weaponKey;
    int weaponPassive = 0; // 0 = none, else 1..3
    std::string offhandKey;
    int offhandPassive = 0;

    std::vector<ModifierLine> gear;
    std::vector<std::string> skills;

    std::optional<int> kOverride;
};

// Derived snapshot. A pure function of UnitBase + UnitBuild.
struct UnitStats {
    int k = 0;

    // Effective attributes (after attribute modifiers).
    double str = 0.0;
    double dex = 0.0;
    double intel = 0.0;
    double vit = 0.0;

    double hpMax = 1.0;
    double mpMax = 0.0;
    double attack = 0.0;
    double armour = 0.0;
    double mr = 0.0;
    double mhr = 0.0;
    double critChance = 0.0;
    double critDamage = 0.0;
    double accuracy = 0.0;
    double evasion = 0.0;
    double skillEvasion = 0.0;
    double apGain = 100.0;
    double skillPower = 0.0;
};

struct StatusInstance {
    std::string key;
    int remaining = 0;
    int stacks = 1;
    ParamBag params;
    std::string sourceId; // uid of whoever applied it, may be empty
};

struct Unit {
    Team team = Team::A;
    int slot = 1;
    std::string name;

    UnitBase base;
    UnitBuild build;

    std::optional<UnitStats> stats;
    // Resolved modifier lines of the last build (gear, weapon, offhand, AP adjustments).
    std::vector<ModifierLine> mods;

    double hp = 0.0;
    double mp = 0.0;
    int ap = 0;

    // Insertion order is kept; status resolution relies on it for unknown keys.
    std::vector<StatusInstance> statuses;
    std::map<std::string, int> cooldowns;

    std::string uid() const;
    bool isAlive() const { return hp > 0.0; }

    const StatusInstance* findStatus(const std::string& key) const;
    StatusInstance* findStatus(const std::string& key);
    bool hasStatus(const std::string& key) const;

    int cooldown(const std::string& skillKey) const;
};

std::string makeUid(Team team, int slot);

// K for this unit: the build's override when set, otherwise the level table.
bool resolveUnitK(const Unit& u, int& outK, BattleError* err = nullptr);

// Gear + weapon default/passive + offhand default/passive + AP adjustments,
// with K-scaled lines resolved.
bool collectModifiers(const Unit& u, const Catalog& catalog, int k,
                      std::vector<ModifierLine>& out, BattleError* err = nullptr);

// Weapon and offhand procs. Passive procs are left out when includePassives is false.
std::vector<Proc> collectProcs(const Unit& u, const Catalog& catalog, bool includePassives = true);

// Derivation base of a stat before any modifier line: attribute-derived for
// hp/mp/attack/mr/mhr, the unit's base value for the combat stats, 100 for
// ap_gain and 0 for anything else. Uses effective attributes once built;
// with includePassives false the attributes are re-derived without passive lines.
double statBaseValue(const Unit& u, const std::string& stat, bool includePassives = true);

// u.mods, minus the passive-sourced lines when includePassives is false.
std::vector<ModifierLine> activeModifiers(const Unit& u, bool includePassives);

// Rebuilds u.stats and u.mods. HP/MP are filled to max on the first build
// only, and only if they are not already positive.
bool recomputeStats(Unit& u, const Catalog& catalog, BattleError* err = nullptr);
