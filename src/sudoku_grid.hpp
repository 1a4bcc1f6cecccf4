#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class SudokuGrid {
public:
    static constexpr int N = 9;
    static constexpr int CELL_COUNT = 81;
    static constexpr uint16_t ALL_VALUES = 0x1FF;

    // 81 entries in row-major order, std::nullopt for an empty cell.
    // Every present entry becomes a clue. Throws InvalidInput on a wrong
    // length or a value outside [1,9].
    explicit SudokuGrid(const std::vector<std::optional<int>>& values);

    // Builds a grid from the flat text form, see parse_puzzle().
    static SudokuGrid parse(std::string_view text);

    // 0 when the cell is unresolved.
    int value(int row, int col) const;
    bool is_fixed(int row, int col) const;
    int clue_count() const;

    // Bit (v - 1) is set for every value v still possible in the cell.
    // Empty mask for a resolved cell.
    uint16_t candidates_of(int row, int col) const;
    std::vector<int> candidate_values(int row, int col) const;

    void set(int row, int col, int value);
    void unset(int row, int col);

    bool is_complete() const;
    bool is_valid() const;
    bool is_solved() const { return is_complete() && is_valid(); }

    std::string render(bool bold_clues = false) const;
    std::string to_string() const;

    bool operator==(const SudokuGrid& other) const;
    bool operator!=(const SudokuGrid& other) const { return !(*this == other); }

    static int box_of(int row, int col) { return (row / 3) * 3 + (col / 3); }

private:
    std::array<uint8_t, CELL_COUNT> cells{};
    std::array<bool, CELL_COUNT> fixed{};
    std::array<uint16_t, N> row_mask{};
    std::array<uint16_t, N> col_mask{};
    std::array<uint16_t, N> box_mask{};
    std::array<int, CELL_COUNT> box_indices{};

    static int index(int row, int col);
    void place(int idx, int val);
    void remove(int idx);
    uint16_t used_mask(int idx) const;
};
