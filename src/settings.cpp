#include "settings.hpp"

#include "ini_utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

void parseBattleConfigText(const std::string& text, BattleConfig& out, std::string* outWarnings) {
    BattleConfig c = out;
    std::string warnings;
    int warnCount = 0;

    std::istringstream iss(text);
    std::string line;
    for (int lineNo = 1; std::getline(iss, line); ++lineNo) {
        if (lineNo == 1) stripUtf8Bom(line);
        line = trimCopy(stripIniComment(line));
        if (line.empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            appendIniWarning(warnings, lineNo, "Expected key=value", warnCount);
            continue;
        }

        const std::string key = toLower(trimCopy(line.substr(0, eq)));
        const std::string val = trimCopy(line.substr(eq + 1));

        int v = 0;
        if (key == "max_team_turns") {
            if (parseIniInt(val, v)) c.maxTeamTurns = std::clamp(v, 1, 100000);
            else appendIniWarning(warnings, lineNo, "Invalid int for max_team_turns", warnCount);
        } else if (key == "action_ap_cost") {
            if (parseIniInt(val, v)) c.actionApCost = std::clamp(v, 0, 10000);
            else appendIniWarning(warnings, lineNo, "Invalid int for action_ap_cost", warnCount);
        } else if (key == "ap_threshold") {
            if (parseIniInt(val, v)) c.apThreshold = std::clamp(v, 0, 10000);
            else appendIniWarning(warnings, lineNo, "Invalid int for ap_threshold", warnCount);
        } else if (key == "normal_max_actors") {
            if (parseIniInt(val, v)) c.normalMaxActors = std::clamp(v, 1, 9);
            else appendIniWarning(warnings, lineNo, "Invalid int for normal_max_actors", warnCount);
        } else if (key == "tick_every_team_turns") {
            if (parseIniInt(val, v)) c.tickEveryTeamTurns = std::clamp(v, 1, 100);
            else appendIniWarning(warnings, lineNo, "Invalid int for tick_every_team_turns", warnCount);
        } else if (key == "start_team") {
            Team t = Team::A;
            if (parseTeam(val, t)) c.startTeam = t;
            else appendIniWarning(warnings, lineNo, "start_team must be A or B", warnCount);
        } else if (key == "seed") {
            uint32_t s = 0;
            if (parseIniU32(val, s)) c.seed = s;
            else appendIniWarning(warnings, lineNo, "Invalid seed", warnCount);
        } else {
            appendIniWarning(warnings, lineNo, "Unknown key: " + key, warnCount);
        }
    }

    out = c;
    if (outWarnings) *outWarnings = warnings;
}

bool loadBattleConfig(const std::string& path, BattleConfig& out, std::string* outWarnings, BattleError* err) {
    std::ifstream f(path);
    if (!f) {
        return setError(err, BattleErrorKind::InvalidConfig, "cannot read config file: " + path);
    }

    std::ostringstream oss;
    oss << f.rdbuf();
    parseBattleConfigText(oss.str(), out, outWarnings);
    return true;
}

bool writeDefaultBattleConfig(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# GridBattle battle config
#
# Lines are: key = value
# Comments start with # or ;

# Safety bound; the battle is a draw after this many team-turns.
max_team_turns = 200

# AP spent by a basic attack.
action_ap_cost = 100

# From team-turn 5 on, only units with AP >= ap_threshold may act.
ap_threshold = 100

# Actor cap from team-turn 5 on (team-turns 1..4 use 2/3/4/5).
normal_max_actors = 5

# Cooldowns and status durations tick down on every Nth team-turn.
tick_every_team_turns = 2

# Team acting on odd team-turns: A or B
start_team = A

# RNG seed (decimal or 0x hex).
seed = 1
)INI";

    return static_cast<bool>(f);
}
