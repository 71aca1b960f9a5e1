#include "progression.hpp"

#include <string>

const std::vector<KRange>& defaultKTable() {
    static const std::vector<KRange> table = {
        {1, 9, 4},
        {10, 19, 126},
        {20, 29, 358},
        {30, 39, 657},
        {40, 49, 1012},
        {50, 59, 1414},
        {60, 69, 1859},
        {70, 79, 2343},
        {80, 89, 2862},
        {90, 99, 3415},
        {100, 100, 4000},
    };
    return table;
}

bool kForLevel(int level, int& outK, BattleError* err) {
    return kForLevel(level, defaultKTable(), outK, err);
}

bool kForLevel(int level, const std::vector<KRange>& table, int& outK, BattleError* err) {
    if (level <= 0) {
        return setError(err, BattleErrorKind::InvalidConfig,
                        "level must be >= 1 (got " + std::to_string(level) + ")");
    }
    if (table.empty()) {
        return setError(err, BattleErrorKind::InvalidConfig, "empty K table");
    }

    for (const KRange& r : table) {
        if (level >= r.levelMin && level <= r.levelMax) {
            outK = r.k;
            return true;
        }
    }

    outK = (level < table.front().levelMin) ? table.front().k : table.back().k;
    return true;
}
