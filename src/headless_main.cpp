#include "actions.hpp"
#include "aoe.hpp"
#include "battle.hpp"
#include "battle_log.hpp"
#include "catalog.hpp"
#include "roster.hpp"
#include "settings.hpp"
#include "state_hash.hpp"
#include "targeting.hpp"
#include "version.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " --roster <file.ini> [options]\n"
        << "  " << argv0 << " --write-default-config <file> | --write-example-roster <file>\n\n"
        << "Options:\n"
        << "  --roster <path>               Roster INI with [A-1]..[B-9] unit sections.\n"
        << "  --config <path>               Battle config INI (key = value).\n"
        << "  --seed <n>                    RNG seed (overrides the config). 0 plays as 305419896.\n"
        << "  --max-turns <n>               Max team-turns before a draw (overrides the config).\n"
        << "  --start <A|B>                 Team acting on odd team-turns (overrides the config).\n"
        << "  --log <path>                  Write the battle log to a file.\n"
        << "  --quiet                       Do not print the battle log.\n"
        << "  --batch <n>                   Run n battles with seeds seed..seed+n-1 and print totals.\n"
        << "  --json-report <path>          Write a JSON summary report (useful for CI).\n"
        << "  --write-default-config <path> Write a commented default config and exit.\n"
        << "  --write-example-roster <path> Write a sample roster and exit.\n"
        << "  --list-catalog                Print the built-in weapons, offhands, statuses and skills.\n"
        << "  --version                     Print version.\n"
        << "  --help                        Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

static std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

static void printCatalog(const Catalog& catalog) {
    std::cout << "Weapons:\n";
    for (const std::string& key : catalog.weaponKeys()) {
        const WeaponDef* w = catalog.findWeapon(key);
        std::cout << "  " << key << "  " << (w->melee ? "melee" : "ranged")
                  << " target=" << targetLocationName(w->location)
                  << " aoe=" << aoeShapeName(w->shape)
                  << " passives=" << w->passives.size() << "\n";
    }

    std::cout << "Offhands:\n";
    for (const std::string& key : catalog.offhandKeys()) {
        const OffhandDef* o = catalog.findOffhand(key);
        std::cout << "  " << key << "  passives=" << o->passives.size() << "\n";
    }

    std::cout << "Statuses:\n";
    for (const std::string& key : catalog.statusKeys()) {
        const StatusDef* d = catalog.findStatus(key);
        std::cout << "  " << key << "  " << (d->positive ? "beneficial" : "harmful")
                  << " duration=" << d->defaultDuration;
        if (d->stackable) std::cout << " maxStacks=" << d->maxStacks;
        std::cout << "\n";
    }

    std::cout << "Skills:\n";
    for (const std::string& key : catalog.skillKeys()) {
        const SkillDef* sk = catalog.findSkill(key);
        std::cout << "  " << key << "  AP=" << sk->apCost << " MP=" << sk->mpCost << " CD=" << sk->cooldown
                  << " target=" << targetSideName(sk->targeting.side) << "/"
                  << targetLocationName(sk->targeting.location) << "/"
                  << targetScopeName(sk->targeting.scope)
                  << " aoe=" << aoeShapeName(sk->shape);
        if (sk->status) std::cout << " status=" << sk->status->key << "(" << sk->status->chancePct << "%)";
        std::cout << "\n";
    }
}

struct RunResult {
    uint32_t seed = 0;
    bool ok = false;
    BattleOutcome outcome = BattleOutcome::Undecided;
    int teamTurns = 0;
    uint64_t hash = 0;
    std::string error;
};

static RunResult runOne(const Board& roster, const Catalog& catalog, const BattleConfig& cfg, LogSink* log) {
    RunResult rr;
    rr.seed = cfg.seed;

    ReferenceStrategy strategy;
    BattleEngine engine(cfg, catalog, strategy);
    BattleState state = makeBattleState(roster, cfg, log);

    BattleError err;
    rr.ok = engine.run(state, rr.outcome, &err);
    if (!rr.ok) rr.error = err.describe();
    rr.teamTurns = state.teamTurn;
    rr.hash = battleStateHash(state);
    return rr;
}

static bool writeJsonReport(const std::string& path,
                            const std::vector<RunResult>& results,
                            const BattleConfig& cfg,
                            const std::string& rosterPath,
                            std::string* err) {
    std::ofstream f(path);
    if (!f) {
        if (err) *err = "Failed to open JSON report for writing: " + path;
        return false;
    }

    size_t a = 0, b = 0, draws = 0, failed = 0;
    for (const auto& r : results) {
        if (!r.ok) ++failed;
        else if (r.outcome == BattleOutcome::TeamAWins) ++a;
        else if (r.outcome == BattleOutcome::TeamBWins) ++b;
        else ++draws;
    }

    f << "{\n";
    f << "  \"tool\": \"GridBattleHeadless\",\n";
    f << "  \"version\": \"" << jsonEscape(GRIDBATTLE_VERSION) << "\",\n";
    f << "  \"roster\": \"" << jsonEscape(rosterPath) << "\",\n";
    f << "  \"options\": {\n";
    f << "    \"maxTeamTurns\": " << cfg.maxTeamTurns << ",\n";
    f << "    \"actionApCost\": " << cfg.actionApCost << ",\n";
    f << "    \"apThreshold\": " << cfg.apThreshold << ",\n";
    f << "    \"normalMaxActors\": " << cfg.normalMaxActors << ",\n";
    f << "    \"tickEveryTeamTurns\": " << cfg.tickEveryTeamTurns << ",\n";
    f << "    \"startTeam\": \"" << teamName(cfg.startTeam) << "\"\n";
    f << "  },\n";
    f << "  \"summary\": {\n";
    f << "    \"runs\": " << results.size() << ",\n";
    f << "    \"teamA\": " << a << ",\n";
    f << "    \"teamB\": " << b << ",\n";
    f << "    \"draws\": " << draws << ",\n";
    f << "    \"failed\": " << failed << "\n";
    f << "  },\n";
    f << "  \"results\": [\n";

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        f << "    {\n";
        f << "      \"seed\": " << r.seed << ",\n";
        f << "      \"ok\": " << (r.ok ? "true" : "false") << ",\n";
        f << "      \"outcome\": \"" << battleOutcomeName(r.outcome) << "\",\n";
        f << "      \"teamTurns\": " << r.teamTurns << ",\n";
        f << "      \"stateHash\": \"" << hashHex(r.hash) << "\"";
        if (!r.ok) {
            f << ",\n";
            f << "      \"error\": \"" << jsonEscape(r.error) << "\"";
        }
        f << "\n";
        f << "    }";
        if (i + 1 < results.size()) f << ",";
        f << "\n";
    }

    f << "  ]\n";
    f << "}\n";
    return static_cast<bool>(f);
}

} // namespace

int main(int argc, char** argv) {
    std::string rosterPath;
    std::string configPath;
    std::string logPath;
    std::string jsonReport;
    std::string startOverride;
    bool quiet = false;
    bool haveSeed = false;
    bool haveMaxTurns = false;
    uint32_t seed = 0;
    uint32_t maxTurns = 0;
    uint32_t batch = 0;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << GRIDBATTLE_APPNAME << " " << GRIDBATTLE_VERSION << "\n";
            return 0;
        } else if (a == "--write-default-config") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--write-default-config requires a path\n";
                return 2;
            }
            if (!writeDefaultBattleConfig(v)) {
                std::cerr << "Failed to write config: " << v << "\n";
                return 1;
            }
            std::cout << "Wrote default config: " << v << "\n";
            return 0;
        } else if (a == "--write-example-roster") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--write-example-roster requires a path\n";
                return 2;
            }
            if (!writeExampleRoster(v)) {
                std::cerr << "Failed to write roster: " << v << "\n";
                return 1;
            }
            std::cout << "Wrote example roster: " << v << "\n";
            return 0;
        } else if (a == "--list-catalog") {
            printCatalog(Catalog::builtin());
            return 0;
        } else if (a == "--roster") {
            if (!argValue(i, argc, argv, rosterPath)) {
                std::cerr << "--roster requires a path\n";
                return 2;
            }
        } else if (a == "--config") {
            if (!argValue(i, argc, argv, configPath)) {
                std::cerr << "--config requires a path\n";
                return 2;
            }
        } else if (a == "--log") {
            if (!argValue(i, argc, argv, logPath)) {
                std::cerr << "--log requires a path\n";
                return 2;
            }
        } else if (a == "--json-report") {
            if (!argValue(i, argc, argv, jsonReport)) {
                std::cerr << "--json-report requires a path\n";
                return 2;
            }
        } else if (a == "--start") {
            if (!argValue(i, argc, argv, startOverride)) {
                std::cerr << "--start requires A or B\n";
                return 2;
            }
        } else if (a == "--seed") {
            std::string v;
            if (!argValue(i, argc, argv, v) || !parseU32(v, seed)) {
                std::cerr << "--seed requires a non-negative integer\n";
                return 2;
            }
            haveSeed = true;
        } else if (a == "--max-turns") {
            std::string v;
            if (!argValue(i, argc, argv, v) || !parseU32(v, maxTurns) || maxTurns == 0) {
                std::cerr << "--max-turns requires a positive integer\n";
                return 2;
            }
            haveMaxTurns = true;
        } else if (a == "--batch") {
            std::string v;
            if (!argValue(i, argc, argv, v) || !parseU32(v, batch) || batch == 0) {
                std::cerr << "--batch requires a positive integer\n";
                return 2;
            }
        } else if (a == "--quiet" || a == "-q") {
            quiet = true;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (rosterPath.empty()) {
        std::cerr << "Missing --roster <file>\n";
        printUsage(argv[0]);
        return 2;
    }

    BattleConfig cfg;
    if (!configPath.empty()) {
        std::string warns;
        BattleError err;
        if (!loadBattleConfig(configPath, cfg, &warns, &err)) {
            std::cerr << err.describe() << "\n";
            return 1;
        }
        if (!warns.empty()) std::cerr << warns;
    }
    if (haveSeed) cfg.seed = seed;
    if (haveMaxTurns) cfg.maxTeamTurns = static_cast<int>(std::min<uint32_t>(maxTurns, 100000u));
    if (!startOverride.empty() && !parseTeam(startOverride, cfg.startTeam)) {
        std::cerr << "--start must be A or B\n";
        return 2;
    }

    const Catalog catalog = Catalog::builtin();

    Board roster;
    {
        std::string warns;
        BattleError err;
        if (!loadRoster(rosterPath, catalog, roster, &warns, &err)) {
            std::cerr << "Failed to load roster: " << rosterPath << "\n";
            std::cerr << "  " << err.describe() << "\n";
            return 1;
        }
        if (!warns.empty()) std::cerr << warns;
    }

    std::vector<RunResult> results;

    if (batch == 0) {
        MemoryLog log;
        RunResult rr = runOne(roster, catalog, cfg, &log);
        results.push_back(rr);

        if (!quiet) std::cout << log.exportText();

        if (!logPath.empty()) {
            BattleError lerr;
            if (!log.exportToFile(logPath, &lerr)) std::cerr << lerr.describe() << "\n";
        }

        if (rr.ok) {
            std::cout << "Outcome: " << battleOutcomeName(rr.outcome)
                      << " seed=" << rr.seed
                      << " teamTurns=" << rr.teamTurns
                      << " stateHash=" << hashHex(rr.hash)
                      << "\n";
        } else {
            std::cout << "Battle FAILED: " << rr.error << "\n";
        }
    } else {
        size_t a = 0, b = 0, draws = 0, failed = 0;
        for (uint32_t n = 0; n < batch; ++n) {
            BattleConfig runCfg = cfg;
            runCfg.seed = cfg.seed + n;

            RunResult rr = runOne(roster, catalog, runCfg, nullptr);
            results.push_back(rr);

            if (!rr.ok) {
                ++failed;
                std::cout << "FAIL seed=" << rr.seed << "  " << rr.error << "\n";
                continue;
            }
            if (rr.outcome == BattleOutcome::TeamAWins) ++a;
            else if (rr.outcome == BattleOutcome::TeamBWins) ++b;
            else ++draws;

            if (!quiet) {
                std::cout << "seed=" << rr.seed
                          << " outcome=" << battleOutcomeName(rr.outcome)
                          << " teamTurns=" << rr.teamTurns
                          << "\n";
            }
        }
        std::cout << "Summary: runs=" << results.size() << " A=" << a << " B=" << b
                  << " draws=" << draws << " failed=" << failed << "\n";
    }

    if (!jsonReport.empty()) {
        std::string jerr;
        if (!writeJsonReport(jsonReport, results, cfg, rosterPath, &jerr)) {
            std::cerr << jerr << "\n";
        }
    }

    for (const auto& r : results) {
        if (!r.ok) return 1;
    }
    return 0;
}
