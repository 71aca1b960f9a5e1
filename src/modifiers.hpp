#pragma once

#include "battle_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Stat keys used by the builder, the scheduler and the combat primitives.
// Keys are plain strings so catalogs and roster files can name any stat;
// lines for stats nobody evaluates are simply carried along.
inline constexpr const char* STAT_HP = "hp";
inline constexpr const char* STAT_MP = "mp";
inline constexpr const char* STAT_ATTACK = "attack";
inline constexpr const char* STAT_ARMOUR = "armour";
inline constexpr const char* STAT_MR = "mr";
inline constexpr const char* STAT_MHR = "mhr";
inline constexpr const char* STAT_CRIT_CHANCE = "crit_chance";
inline constexpr const char* STAT_CRIT_DAMAGE = "crit_damage";
inline constexpr const char* STAT_ACCURACY = "accuracy";
inline constexpr const char* STAT_EVASION = "evasion";
inline constexpr const char* STAT_SKILL_EVASION = "skill_evasion";
inline constexpr const char* STAT_AP_GAIN = "ap_gain";
inline constexpr const char* STAT_STR = "str";
inline constexpr const char* STAT_DEX = "dex";
inline constexpr const char* STAT_INT = "int";
inline constexpr const char* STAT_VIT = "vit";

enum class ModifierTag : uint8_t {
    Base = 0, // +X flat
    Inc,      // +X% increased, additive with other inc lines
    More,     // +X% more, multiplicative
    Less,     // X% less, multiplicative (+20 and -20 both mean 20% less)
    Special,  // custom rule data, never evaluated
};

const char* modifierTagName(ModifierTag t);
bool parseModifierTag(const std::string& raw, ModifierTag& out);

struct ModifierLine {
    std::string stat;
    ModifierTag tag = ModifierTag::Base;
    double value = 0.0;
    std::string source; // provenance, for logs/debugging
    bool passive = false; // from a chosen weapon/offhand passive; dropped while broken
};

// Stat = (base + Σbase) * (1 + Σinc/100) * Π(1 + more/100) * Π(1 + less/100)
//
// Lines for other stats are ignored, and so are tags the formula does not
// know (Special). Pure: no side effects, no randomness.
double evaluateStat(const std::string& statKey,
                    double baseValue,
                    const std::vector<ModifierLine>& mods,
                    std::optional<double> clampMin = std::nullopt,
                    std::optional<double> clampMax = std::nullopt);

// Parses "stat:tag:value" (whitespace tolerant), e.g. "attack:inc:10".
bool parseModifierLine(const std::string& text, ModifierLine& out, BattleError* err = nullptr);
