#pragma once

#include <chrono>
#include <iosfwd>
#include <vector>

#include "sudoku_grid.hpp"

// Draws the grid in an ANSI terminal and redraws it in place while the
// solver runs. Clues are printed bold.
class SudokuTerminalView {
public:
    SudokuTerminalView(std::ostream& out, std::chrono::milliseconds step, bool quiet);
    ~SudokuTerminalView();

    SudokuTerminalView(const SudokuTerminalView&) = delete;
    SudokuTerminalView& operator=(const SudokuTerminalView&) = delete;

    // Puzzle followed by the "Solving..." status line.
    void show_puzzle(const SudokuGrid& puzzle);

    // Redraws the grid over the previous frame, then waits `step`.
    // Does nothing in quiet mode.
    void frame(const SudokuGrid& grid);

    // Final grid plus "Done!", or "No solution found" when `solutions` is empty.
    // Extra solutions are printed below the first one.
    void finish(const std::vector<SudokuGrid>& solutions);

    bool quiet() const { return quietMode; }

private:
    std::ostream& out;
    std::chrono::milliseconds stepDelay;
    bool quietMode;
    bool cursorHidden = false;

    void redraw(const SudokuGrid& grid);
    void show_cursor();
};
