#include "grid.hpp"

std::optional<int> posToSlot(int row, int col) {
    if (!isValidPos(row, col)) return std::nullopt;
    return row * GRID_COLS + col + 1;
}

std::optional<int> leftOf(int slot) {
    const GridPos p = slotToPos(slot);
    return posToSlot(p.row, p.col - 1);
}

std::optional<int> rightOf(int slot) {
    const GridPos p = slotToPos(slot);
    return posToSlot(p.row, p.col + 1);
}

std::optional<int> upOf(int slot) {
    const GridPos p = slotToPos(slot);
    return posToSlot(p.row - 1, p.col);
}

std::optional<int> downOf(int slot) {
    const GridPos p = slotToPos(slot);
    return posToSlot(p.row + 1, p.col);
}

std::optional<int> behindInLine(int slot, int steps) {
    if (steps <= 0) return slot;
    const GridPos p = slotToPos(slot);
    return posToSlot(p.row + steps, p.col);
}

std::vector<int> slotsInRow(int row) {
    std::vector<int> out;
    if (row < 0 || row >= GRID_ROWS) return out;
    for (int c = 0; c < GRID_COLS; ++c) out.push_back(row * GRID_COLS + c + 1);
    return out;
}

std::vector<int> slotsInLine(int line) {
    std::vector<int> out;
    if (line < 0 || line >= GRID_COLS) return out;
    for (int r = 0; r < GRID_ROWS; ++r) out.push_back(r * GRID_COLS + line + 1);
    return out;
}

std::vector<int> rowNeighbors(int slot) {
    std::vector<int> out;
    if (auto l = leftOf(slot)) out.push_back(*l);
    if (auto r = rightOf(slot)) out.push_back(*r);
    return out;
}

std::vector<int> crossNeighbors(int slot) {
    std::vector<int> out;
    for (auto n : {leftOf(slot), rightOf(slot), upOf(slot), downOf(slot)}) {
        if (n) out.push_back(*n);
    }
    return out;
}
