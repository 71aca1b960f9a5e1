#include "aoe.hpp"

#include "common.hpp"
#include "grid.hpp"

#include <algorithm>

namespace {

void pushUnique(std::vector<AoeTarget>& out, int slot, double ratio) {
    for (const AoeTarget& t : out) {
        if (t.slot == slot) return;
    }
    out.push_back(AoeTarget{slot, ratio});
}

} // namespace

const char* aoeShapeName(AoeShape s) {
    switch (s) {
        case AoeShape::Single:      return "single";
        case AoeShape::RowAdjacent: return "row_adjacent";
        case AoeShape::Cross:       return "cross";
        case AoeShape::Line:        return "line";
        case AoeShape::Behind:      return "behind";
    }
    return "single";
}

bool parseAoeShape(const std::string& raw, AoeShape& out) {
    const std::string s = toLower(trimCopy(raw));
    if (s == "single" || s == "none") {
        out = AoeShape::Single;
    } else if (s == "row_adjacent" || s == "adjacent_1" || s == "adjacent") {
        out = AoeShape::RowAdjacent;
    } else if (s == "cross" || s == "cross_1" || s == "plus") {
        out = AoeShape::Cross;
    } else if (s == "line" || s == "line_2" || s == "column" || s == "pierce" || s == "behind_2" || s == "pierce_2") {
        out = AoeShape::Line;
    } else if (s == "behind" || s == "behind_1" || s == "pierce_1") {
        out = AoeShape::Behind;
    } else {
        return false;
    }
    return true;
}

std::vector<AoeTarget> expandAoe(int primarySlot, AoeShape shape, const AoeRatios& ratios) {
    std::vector<AoeTarget> out;
    if (!isValidSlot(primarySlot)) return out;

    out.push_back(AoeTarget{primarySlot, 1.0});

    switch (shape) {
        case AoeShape::Single:
            break;
        case AoeShape::RowAdjacent:
            for (int s : rowNeighbors(primarySlot)) pushUnique(out, s, ratios.splash);
            break;
        case AoeShape::Cross:
            for (int s : crossNeighbors(primarySlot)) pushUnique(out, s, ratios.splash);
            break;
        case AoeShape::Line:
            if (auto s1 = behindInLine(primarySlot, 1)) {
                pushUnique(out, *s1, ratios.nearRatio);
                if (auto s2 = behindInLine(primarySlot, 2)) pushUnique(out, *s2, ratios.farRatio);
            }
            break;
        case AoeShape::Behind:
            if (auto s1 = behindInLine(primarySlot, 1)) pushUnique(out, *s1, ratios.nearRatio);
            break;
    }

    return out;
}
