#include "sudoku_grid.hpp"
#include "sudoku_errors.hpp"
#include "puzzle_source.hpp"

#include <bit>
#include <string>

namespace {

std::string cell_name(int row, int col) {
    return "(" + std::to_string(row) + ", " + std::to_string(col) + ")";
}

}

SudokuGrid::SudokuGrid(const std::vector<std::optional<int>>& values) {
    if (values.size() != CELL_COUNT) {
        throw InvalidInput("expected " + std::to_string(CELL_COUNT) + " cells, got " +
                           std::to_string(values.size()));
    }

    // Precompute box indices to avoid repetitive calculation
    for (int i = 0; i < CELL_COUNT; ++i) {
        box_indices[i] = box_of(i / N, i % N);
    }

    for (int i = 0; i < CELL_COUNT; ++i) {
        if (!values[i]) continue;
        int v = *values[i];
        if (v < 1 || v > 9) {
            throw InvalidInput("clue " + std::to_string(v) + " at " + cell_name(i / N, i % N) +
                               " is outside 1..9");
        }
        // Clues are placed unchecked: a conflicting clue set is reported by is_valid().
        place(i, v);
        fixed[i] = true;
    }
}

SudokuGrid SudokuGrid::parse(std::string_view text) {
    return SudokuGrid(parse_puzzle(text));
}

int SudokuGrid::index(int row, int col) {
    if (row < 0 || row >= N || col < 0 || col >= N) {
        throw InvalidInput("cell " + cell_name(row, col) + " is outside the grid");
    }
    return row * N + col;
}

int SudokuGrid::value(int row, int col) const {
    return cells[index(row, col)];
}

bool SudokuGrid::is_fixed(int row, int col) const {
    return fixed[index(row, col)];
}

int SudokuGrid::clue_count() const {
    int count = 0;
    for (bool f : fixed) count += f ? 1 : 0;
    return count;
}

// Mark a number as used in the bitmasks and grid
void SudokuGrid::place(int idx, int val) {
    uint16_t bit = 1 << (val - 1);

    cells[idx] = static_cast<uint8_t>(val);
    row_mask[idx / N] |= bit;
    col_mask[idx % N] |= bit;
    box_mask[box_indices[idx]] |= bit;
}

// Unmark the current number of a cell
void SudokuGrid::remove(int idx) {
    uint16_t bit = 1 << (cells[idx] - 1);

    cells[idx] = 0;
    row_mask[idx / N] &= ~bit;
    col_mask[idx % N] &= ~bit;
    box_mask[box_indices[idx]] &= ~bit;
}

uint16_t SudokuGrid::used_mask(int idx) const {
    return row_mask[idx / N] | col_mask[idx % N] | box_mask[box_indices[idx]];
}

uint16_t SudokuGrid::candidates_of(int row, int col) const {
    int idx = index(row, col);
    if (cells[idx] != 0) return 0;
    // OR the masks together to get used numbers, then NOT to get available
    return ~used_mask(idx) & ALL_VALUES;
}

std::vector<int> SudokuGrid::candidate_values(int row, int col) const {
    std::vector<int> values;
    uint16_t mask = candidates_of(row, col);
    while (mask) {
        values.push_back(std::countr_zero(mask) + 1);
        mask &= (mask - 1);
    }
    return values;
}

void SudokuGrid::set(int row, int col, int value) {
    int idx = index(row, col);
    if (value < 1 || value > 9) {
        throw InvalidInput("value " + std::to_string(value) + " is outside 1..9");
    }
    if (cells[idx] == value) return;
    if (fixed[idx]) {
        throw ConstraintViolation("cell " + cell_name(row, col) + " holds clue " +
                                  std::to_string(cells[idx]));
    }

    // The cell's own previous value differs from `value`, so it cannot mask a conflict.
    uint16_t bit = 1 << (value - 1);
    if (used_mask(idx) & bit) {
        throw ConstraintViolation(std::to_string(value) + " already used in the row, column or box of " +
                                  cell_name(row, col));
    }

    if (cells[idx] != 0) remove(idx);
    place(idx, value);
}

void SudokuGrid::unset(int row, int col) {
    int idx = index(row, col);
    if (fixed[idx]) {
        throw InvalidOperation("cannot clear clue at " + cell_name(row, col));
    }
    if (cells[idx] != 0) remove(idx);
}

bool SudokuGrid::is_complete() const {
    for (uint8_t v : cells) {
        if (v == 0) return false;
    }
    return true;
}

bool SudokuGrid::is_valid() const {
    // Scan the cells instead of trusting the masks: duplicate clues share a bit.
    std::array<uint16_t, N> rows{}, cols{}, boxes{};
    for (int i = 0; i < CELL_COUNT; ++i) {
        if (cells[i] == 0) continue;
        uint16_t bit = 1 << (cells[i] - 1);
        int r = i / N;
        int c = i % N;
        int b = box_indices[i];
        if ((rows[r] & bit) || (cols[c] & bit) || (boxes[b] & bit)) return false;
        rows[r] |= bit;
        cols[c] |= bit;
        boxes[b] |= bit;
    }
    return true;
}

std::string SudokuGrid::render(bool bold_clues) const {
    static const std::string separator = "+-------+-------+-------+";
    std::string out;
    out.reserve(13 * 26 + 81 * 8);

    for (int r = 0; r < N; ++r) {
        if (r % 3 == 0) out += separator + "\n";
        for (int c = 0; c < N; ++c) {
            if (c % 3 == 0) out += "| ";
            int idx = r * N + c;
            if (cells[idx] == 0) {
                out += ". ";
            } else if (bold_clues && fixed[idx]) {
                out += "\x1b[1m";
                out += static_cast<char>('0' + cells[idx]);
                out += "\x1b[0m ";
            } else {
                out += static_cast<char>('0' + cells[idx]);
                out += ' ';
            }
        }
        out += "|\n";
    }
    out += separator;
    return out;
}

std::string SudokuGrid::to_string() const {
    std::string out(CELL_COUNT, '.');
    for (int i = 0; i < CELL_COUNT; ++i) {
        if (cells[i] != 0) out[i] = static_cast<char>('0' + cells[i]);
    }
    return out;
}

bool SudokuGrid::operator==(const SudokuGrid& other) const {
    return cells == other.cells;
}
