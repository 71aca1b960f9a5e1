#pragma once

#include "battle_error.hpp"
#include "catalog.hpp"
#include "modifiers.hpp"
#include "unit.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Per-unit status state machine.
//
// Durations count two-turn ticks: a status applied with duration X on
// team-turn Y is gone by the start of team-turn Y + 2X (roughly).
//
// Resolution walks the active statuses in a fixed priority order and folds
// them into a StatusFrame. Frames are rebuilt every phase and never stored.

inline constexpr const char* STATUS_IMMUNITY = "immunity";
inline constexpr const char* STATUS_STUN = "stun";
inline constexpr const char* STATUS_IMMOBILIZED = "immobilized";
inline constexpr const char* STATUS_SILENCE = "silence";
inline constexpr const char* STATUS_DISARM = "disarm";
inline constexpr const char* STATUS_BREAK = "break";
inline constexpr const char* STATUS_PANIC = "panic";
inline constexpr const char* STATUS_WEAKEN = "weaken";
inline constexpr const char* STATUS_BRAND = "brand";
inline constexpr const char* STATUS_DULL = "dull";
inline constexpr const char* STATUS_SLOW = "slow";
inline constexpr const char* STATUS_CHILL = "chill";
inline constexpr const char* STATUS_SHRED = "shred";
inline constexpr const char* STATUS_SUNDER = "sunder";
inline constexpr const char* STATUS_BLEEDING = "bleeding";

// stun, immobilized, silence, disarm, break, panic, weaken, brand, dull,
// slow, chill, shred, sunder, bleeding.
const std::vector<std::string>& statusPriority();

enum class StatusEventKind : uint8_t {
    Damage = 0,
    Log,
};

struct StatusEvent {
    StatusEventKind kind = StatusEventKind::Log;
    std::string targetUid;
    std::string statusKey;
    double amount = 0.0;
    std::string text;
};

struct StatusFrame {
    bool canAct = true;
    bool canUseActiveSkills = true;
    bool canBasicAttack = true;
    bool ignorePassives = false;
    bool blockApGain = false;

    double attackDamageMult = 1.0; // weaken
    double skillDamageMult = 1.0;  // panic
    double damageTakenMult = 1.0;  // brand

    double apGainBaseDelta = 0.0;     // slow, chill
    double mhrBaseDelta = 0.0;        // chill
    double accuracyIncPctDelta = 0.0; // dull
    double armourBaseDelta = 0.0;     // shred
    double mrBaseDelta = 0.0;         // sunder

    std::vector<StatusEvent> events;
};

struct StatusApplyOptions {
    std::optional<int> duration; // default: the status kind's duration
    int stacksAdd = 1;
    ParamBag params;
    std::string sourceId;
};

// Returns false (and changes nothing) when an active immunity blocks a
// non-beneficial status.
bool applyStatus(Unit& u, const StatusDef& def, const StatusApplyOptions& opts = {});

// Catalog-checked variant. Returns false only for an unknown key; whether the
// status actually landed is reported through `applied`.
bool applyStatusByKey(Unit& u, const Catalog& catalog, const std::string& key,
                      const StatusApplyOptions& opts, bool& applied, BattleError* err = nullptr);

bool removeStatus(Unit& u, const std::string& key);

// Drops statuses whose remaining reached 0.
void purgeExpiredStatuses(Unit& u);

// One two-turn tick: every cooldown and status remaining -1 (floor 0).
// Expired statuses are removed and their keys returned.
std::vector<std::string> tickUnit(Unit& u);

// Start-of-turn frame for a unit. Fails with UnknownKey for a status the
// catalog does not know.
bool buildStartTurnFrame(Unit& u, const Catalog& catalog, StatusFrame& out, BattleError* err = nullptr);

// Frame deltas as modifier lines (ap_gain/mhr/armour/mr base, accuracy inc).
std::vector<ModifierLine> statusModifierLines(const StatusFrame& frame);

// The unit's own lines (passives dropped under ignorePassives) plus the frame's.
std::vector<ModifierLine> frameModifierLines(const Unit& u, const StatusFrame& frame);

// "stun(1), bleeding(2)" or "-".
std::string describeStatuses(const Unit& u);
