#pragma once

#include <optional>
#include <vector>

// 3x3 formation grid shared by both teams.
//
//   Row 0 (front): 1 2 3
//   Row 1 (mid):   4 5 6
//   Row 2 (back):  7 8 9
//
// Lines are the vertical columns: 1-4-7, 2-5-8, 3-6-9. The numbering is the
// same for both teams; which side faces which is a targeting concern.

inline constexpr int GRID_ROWS = 3;
inline constexpr int GRID_COLS = 3;
inline constexpr int GRID_SLOTS = GRID_ROWS * GRID_COLS;

struct GridPos {
    int row = 0;
    int col = 0;
};

inline bool isValidSlot(int slot) {
    return slot >= 1 && slot <= GRID_SLOTS;
}

inline bool isValidPos(int row, int col) {
    return row >= 0 && row < GRID_ROWS && col >= 0 && col < GRID_COLS;
}

// The helpers below expect a valid slot; callers validate at the boundary
// (Board placement, roster loading, targeting requests).
inline GridPos slotToPos(int slot) {
    return GridPos{(slot - 1) / GRID_COLS, (slot - 1) % GRID_COLS};
}

inline int slotRow(int slot) { return slotToPos(slot).row; }
inline int slotCol(int slot) { return slotToPos(slot).col; }
inline int slotLine(int slot) { return slotCol(slot); }

// Empty when (row, col) falls outside the grid.
std::optional<int> posToSlot(int row, int col);

std::optional<int> leftOf(int slot);
std::optional<int> rightOf(int slot);
std::optional<int> upOf(int slot);
std::optional<int> downOf(int slot);

// steps=1 is the next row back in the same line; steps<=0 returns the slot itself.
std::optional<int> behindInLine(int slot, int steps = 1);

std::vector<int> slotsInRow(int row);
std::vector<int> slotsInLine(int line);

// Left/right neighbours in the same row.
std::vector<int> rowNeighbors(int slot);

// Left, right, up, down (only those inside the grid).
std::vector<int> crossNeighbors(int slot);
