#include "roster.hpp"

#include "grid.hpp"
#include "ini_utils.hpp"
#include "unit.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace {

struct PendingUnit {
    Unit unit;
    int line = 0;
};

std::string at(int lineNo, const std::string& msg) {
    return "Line " + std::to_string(lineNo) + ": " + msg;
}

bool parseSectionUid(const std::string& raw, Team& team, int& slot) {
    const std::string s = trimCopy(raw);
    const size_t dash = s.find('-');
    if (dash == std::string::npos) return false;
    if (!parseTeam(trimCopy(s.substr(0, dash)), team)) return false;
    int v = 0;
    if (!parseIniInt(s.substr(dash + 1), v)) return false;
    if (!isValidSlot(v)) return false;
    slot = v;
    return true;
}

bool setInt(const std::string& key, const std::string& val, int lineNo, int& out, BattleError* err) {
    if (!parseIniInt(val, out)) {
        return setError(err, BattleErrorKind::InvalidConfig, at(lineNo, "invalid integer for " + key + ": '" + val + "'"));
    }
    return true;
}

bool setDouble(const std::string& key, const std::string& val, int lineNo, double& out, BattleError* err) {
    if (!parseIniDouble(val, out)) {
        return setError(err, BattleErrorKind::InvalidConfig, at(lineNo, "invalid number for " + key + ": '" + val + "'"));
    }
    return true;
}

bool applyKey(Unit& u, const std::string& key, const std::string& val, int lineNo, const Catalog& catalog,
              std::string& warnings, int& warnCount, BattleError* err) {
    if (key == "name") {
        u.name = val;
    } else if (key == "level") {
        return setInt(key, val, lineNo, u.base.level, err);
    } else if (key == "str") {
        return setDouble(key, val, lineNo, u.base.str, err);
    } else if (key == "dex") {
        return setDouble(key, val, lineNo, u.base.dex, err);
    } else if (key == "int") {
        return setDouble(key, val, lineNo, u.base.intel, err);
    } else if (key == "vit") {
        return setDouble(key, val, lineNo, u.base.vit, err);
    } else if (key == "crit_chance") {
        return setDouble(key, val, lineNo, u.base.critChance, err);
    } else if (key == "crit_damage") {
        return setDouble(key, val, lineNo, u.base.critDamage, err);
    } else if (key == "accuracy") {
        return setDouble(key, val, lineNo, u.base.accuracy, err);
    } else if (key == "evasion") {
        return setDouble(key, val, lineNo, u.base.evasion, err);
    } else if (key == "skill_evasion") {
        return setDouble(key, val, lineNo, u.base.skillEvasion, err);
    } else if (key == "weapon") {
        u.build.weaponKey = val;
    } else if (key == "weapon_passive") {
        return setInt(key, val, lineNo, u.build.weaponPassive, err);
    } else if (key == "offhand") {
        u.build.offhandKey = val;
    } else if (key == "offhand_passive") {
        return setInt(key, val, lineNo, u.build.offhandPassive, err);
    } else if (key == "skills") {
        u.build.skills.clear();
        for (const std::string& s : splitIniList(val)) {
            if (!catalog.findSkill(s)) {
                return setError(err, BattleErrorKind::UnknownKey, at(lineNo, "unknown skill '" + s + "'"));
            }
            u.build.skills.push_back(s);
        }
    } else if (key == "gear") {
        u.build.gear.clear();
        for (const std::string& item : splitIniList(val)) {
            ModifierLine m;
            BattleError local;
            if (!parseModifierLine(item, m, &local)) {
                return setError(err, local.kind, at(lineNo, local.message));
            }
            m.source = u.uid() + ": gear";
            u.build.gear.push_back(std::move(m));
        }
    } else if (key == "k") {
        int k = 0;
        if (!setInt(key, val, lineNo, k, err)) return false;
        u.build.kOverride = k;
    } else {
        appendIniWarning(warnings, lineNo, "Unknown key: " + key, warnCount);
    }
    return true;
}

} // namespace

bool loadRosterText(const std::string& text, const Catalog& catalog, Board& out,
                    std::string* outWarnings, BattleError* err) {
    std::vector<PendingUnit> pending;
    PendingUnit* current = nullptr;

    std::string warnings;
    int warnCount = 0;

    std::istringstream iss(text);
    std::string line;
    for (int lineNo = 1; std::getline(iss, line); ++lineNo) {
        if (lineNo == 1) stripUtf8Bom(line);
        line = trimCopy(stripIniComment(line));
        if (line.empty()) continue;

        if (line.front() == '[') {
            if (line.back() != ']') {
                return setError(err, BattleErrorKind::InvalidSlot, at(lineNo, "malformed section '" + line + "'"));
            }
            Team team = Team::A;
            int slot = 0;
            if (!parseSectionUid(line.substr(1, line.size() - 2), team, slot)) {
                return setError(err, BattleErrorKind::InvalidSlot,
                                at(lineNo, "section must be [A-1]..[B-9], got '" + line + "'"));
            }
            PendingUnit p;
            p.unit.team = team;
            p.unit.slot = slot;
            p.unit.name = makeUid(team, slot);
            p.line = lineNo;
            pending.push_back(std::move(p));
            current = &pending.back();
            continue;
        }

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            appendIniWarning(warnings, lineNo, "Expected key=value", warnCount);
            continue;
        }
        if (!current) {
            appendIniWarning(warnings, lineNo, "Key outside of a unit section", warnCount);
            continue;
        }

        const std::string key = toLower(trimCopy(line.substr(0, eq)));
        const std::string val = trimCopy(line.substr(eq + 1));
        if (!applyKey(current->unit, key, val, lineNo, catalog, warnings, warnCount, err)) return false;
    }

    Board board;
    for (PendingUnit& p : pending) {
        BattleError local;
        if (!recomputeStats(p.unit, catalog, &local)) {
            return setError(err, local.kind, at(p.line, local.message));
        }
        if (!board.place(std::move(p.unit), &local)) {
            return setError(err, local.kind, at(p.line, local.message));
        }
    }

    out = std::move(board);
    if (outWarnings) *outWarnings = warnings;
    return true;
}

bool loadRoster(const std::string& path, const Catalog& catalog, Board& out,
                std::string* outWarnings, BattleError* err) {
    std::ifstream f(path);
    if (!f) {
        return setError(err, BattleErrorKind::InvalidConfig, "cannot read roster file: " + path);
    }
    std::ostringstream oss;
    oss << f.rdbuf();
    return loadRosterText(oss.str(), catalog, out, outWarnings, err);
}

const char* exampleRosterText() {
    return R"INI(# GridBattle roster
#
# One section per unit: [A-1]..[A-9], [B-1]..[B-9]
# Slots 1-3 are the front row, 7-9 the back row.

[A-1]
name = Vanguard
level = 50
str = 140
dex = 30
int = 10
vit = 90
weapon = Axe
weapon_passive = 1
offhand = Shield
skills = power_strike
gear = armour:base:400

[A-2]
name = Lancer
level = 50
str = 120
dex = 40
int = 10
vit = 80
weapon = Spear
weapon_passive = 1
offhand = Bullet
offhand_passive = 2
gear = armour:base:300

[A-5]
name = Archer
level = 50
str = 100
dex = 60
int = 20
vit = 60
weapon = Bow
weapon_passive = 1
offhand = Quiver
offhand_passive = 2
skills = crippling_shot

[A-8]
name = Sage
level = 50
str = 60
dex = 20
int = 140
vit = 60
weapon = Staff
weapon_passive = 1
offhand = Orb
skills = frost_nova, hex

[B-1]
name = Bulwark
level = 50
str = 120
dex = 30
int = 10
vit = 100
weapon = Sword
weapon_passive = 2
offhand = Shield
skills = thunderclap
gear = armour:base:400

[B-3]
name = Gunner
level = 50
str = 110
dex = 50
int = 20
vit = 70
weapon = Gun
weapon_passive = 1
offhand = Bullet
offhand_passive = 3

[B-5]
name = Bombard
level = 50
str = 130
dex = 30
int = 40
vit = 70
weapon = Cannon
weapon_passive = 1
offhand = CannonBall

[B-7]
name = Mystic
level = 50
str = 60
dex = 20
int = 140
vit = 60
weapon = Wand
offhand = Book
offhand_passive = 2
skills = shatter_bolt, mind_spike
)INI";
}

bool writeExampleRoster(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;
    f << exampleRosterText();
    return static_cast<bool>(f);
}
