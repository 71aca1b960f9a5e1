#pragma once

#include "aoe.hpp"
#include "battle_error.hpp"
#include "modifiers.hpp"
#include "targeting.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Static game data: weapons, offhands, statuses and active skills.
//
// Everything is keyed by string. Lookups either return nullptr (find*) or
// fail with UnknownKey (require*); nothing falls back silently.

// Key/value parameter bag carried by procs and status instances.
using ParamBag = std::map<std::string, double>;

double paramOr(const ParamBag& params, const std::string& key, double fallback);

// A modifier template. Lines with kPct resolve to value * kPct * K for the
// owning unit's K (e.g. MaintainKit's "+10%K STR").
struct CatalogModifier {
    std::string stat;
    ModifierTag tag = ModifierTag::Base;
    double value = 0.0;
    std::optional<double> kPct;
    std::string source;

    ModifierLine resolve(int k) const;
};

// A non-stat effect: on hit, at battle start, ...
struct Proc {
    std::string key;
    double chancePct = 100.0;
    ParamBag params;
};

struct PassiveOption {
    std::string name;
    std::vector<CatalogModifier> mods;
    std::vector<Proc> procs;
};

// AP-gain adjustments a piece of equipment applies every team-turn.
struct ApAdjust {
    double baseDelta = 0.0;
    double lessPct = 0.0;
    double morePct = 0.0;
};

struct WeaponDef {
    std::string key;
    bool melee = true;
    AoeShape shape = AoeShape::Single;
    TargetLocation location = TargetLocation::Frontline;
    AoeRatios ratios;
    ApAdjust ap;

    std::vector<CatalogModifier> defaultMods;
    std::vector<Proc> defaultProcs;

    // Passive ids 1..3; a build picks at most one.
    std::map<int, PassiveOption> passives;

    TargetingSpec targeting() const;
};

struct OffhandDef {
    std::string key;
    ApAdjust ap;

    std::vector<CatalogModifier> defaultMods;
    std::vector<Proc> defaultProcs;
    std::map<int, PassiveOption> passives;
};

struct StatusDef {
    std::string key;
    std::string name;
    bool positive = false;

    bool stackable = false;
    int maxStacks = 1;
    bool refreshOnReapply = true;

    // In two-turn ticks.
    int defaultDuration = 1;

    ParamBag params;

    // Generic frame flags, OR-ed in for any status that sets them.
    bool preventsAction = false;
    bool blocksApGain = false;
};

// Status an active skill applies to each target it damages.
struct SkillStatus {
    std::string key;
    double chancePct = 100.0;
    std::optional<int> duration;
    ParamBag params;
};

struct SkillDef {
    std::string key;
    std::string name;

    int apCost = 100;
    int mpCost = 0;
    int cooldown = 0;

    TargetingSpec targeting;
    AoeShape shape = AoeShape::Single;
    AoeRatios ratios;

    // Damage = skill power * K * ratio (0 = no damage).
    double ratio = 0.0;

    std::optional<SkillStatus> status;
};

class Catalog {
public:
    // Shipped data tables.
    static Catalog builtin();

    const WeaponDef* findWeapon(const std::string& key) const;
    const OffhandDef* findOffhand(const std::string& key) const;
    const StatusDef* findStatus(const std::string& key) const;
    const SkillDef* findSkill(const std::string& key) const;

    const WeaponDef* requireWeapon(const std::string& key, BattleError* err = nullptr) const;
    const OffhandDef* requireOffhand(const std::string& key, BattleError* err = nullptr) const;
    const StatusDef* requireStatus(const std::string& key, BattleError* err = nullptr) const;
    const SkillDef* requireSkill(const std::string& key, BattleError* err = nullptr) const;

    // Custom entries. Empty or duplicate keys are rejected (InvalidConfig).
    bool registerWeapon(WeaponDef def, BattleError* err = nullptr);
    bool registerOffhand(OffhandDef def, BattleError* err = nullptr);
    bool registerStatus(StatusDef def, BattleError* err = nullptr);
    bool registerSkill(SkillDef def, BattleError* err = nullptr);

    std::vector<std::string> weaponKeys() const;
    std::vector<std::string> offhandKeys() const;
    std::vector<std::string> statusKeys() const;
    std::vector<std::string> skillKeys() const;

private:
    std::map<std::string, WeaponDef> weapons_;
    std::map<std::string, OffhandDef> offhands_;
    std::map<std::string, StatusDef> statuses_;
    std::map<std::string, SkillDef> skills_;
};
