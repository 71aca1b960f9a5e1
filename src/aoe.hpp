#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Attack footprints over the defender's grid.
enum class AoeShape : uint8_t {
    Single = 0,
    RowAdjacent, // primary + left/right neighbours in the same row
    Cross,       // primary + left/right/up/down
    Line,        // primary + one and two rows behind in the same line
    Behind,      // primary + one row behind
};

const char* aoeShapeName(AoeShape s);

// Accepts canonical names plus the common aliases
// (adjacent_1, adjacent, plus, cross_1, pierce, column, line_2, behind_1, pierce_1...).
bool parseAoeShape(const std::string& raw, AoeShape& out);

// Splash/pierce ratios a weapon or skill carries with its shape.
struct AoeRatios {
    double splash = 0.5; // RowAdjacent / Cross neighbours
    double nearRatio = 0.75; // Line: one behind; Behind: the only extra slot
    double farRatio = 0.5; // Line: two behind
};

struct AoeTarget {
    int slot = 0;
    double ratio = 1.0;
};

// Primary first at ratio 1.0, then the shape's extra slots in a fixed order.
// Slots outside the grid are skipped and duplicates keep their first entry.
// Aliveness is not checked here; the caller filters dead/empty slots.
std::vector<AoeTarget> expandAoe(int primarySlot, AoeShape shape, const AoeRatios& ratios = {});
