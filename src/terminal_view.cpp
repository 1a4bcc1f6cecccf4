#include "terminal_view.hpp"

#include <ostream>
#include <string>
#include <thread>

namespace {

// Grid height in lines plus the status line under it.
constexpr int GRID_LINES = 13;
constexpr int FRAME_LINES = GRID_LINES + 1;

const char* const HIDE_CURSOR = "\x1b[?25l";
const char* const SHOW_CURSOR = "\x1b[?25h";
const char* const CLEAR_LINE = "\x1b[2K";
const char* const LIGHT_RED = "\x1b[91m";
const char* const LIGHT_GREEN = "\x1b[92m";
const char* const RESET = "\x1b[0m";

std::string cursor_up(int lines) {
    return "\x1b[" + std::to_string(lines) + "A";
}

}

SudokuTerminalView::SudokuTerminalView(std::ostream& out, std::chrono::milliseconds step, bool quiet)
    : out(out), stepDelay(step), quietMode(quiet) {}

SudokuTerminalView::~SudokuTerminalView() {
    show_cursor();
}

void SudokuTerminalView::show_puzzle(const SudokuGrid& puzzle) {
    out << puzzle.render(true) << "\n"
        << LIGHT_RED << "        Solving..." << RESET << "\n";
    out.flush();
}

void SudokuTerminalView::redraw(const SudokuGrid& grid) {
    out << cursor_up(FRAME_LINES) << "\r" << grid.render(true) << "\n\n";
}

void SudokuTerminalView::frame(const SudokuGrid& grid) {
    if (quietMode) return;
    if (!cursorHidden) {
        out << HIDE_CURSOR;
        cursorHidden = true;
    }
    redraw(grid);
    out.flush();
    if (stepDelay.count() > 0) {
        std::this_thread::sleep_for(stepDelay);
    }
}

void SudokuTerminalView::finish(const std::vector<SudokuGrid>& solutions) {
    if (solutions.empty()) {
        out << cursor_up(1) << "\r" << CLEAR_LINE
            << LIGHT_RED << "    No solution found" << RESET << "\n";
    } else {
        redraw(solutions.front());
        out << cursor_up(1) << "\r" << CLEAR_LINE
            << LIGHT_GREEN << "          Done!" << RESET << "\n";
        for (size_t i = 1; i < solutions.size(); ++i) {
            out << "\nSolution " << (i + 1) << ":\n" << solutions[i].render(true) << "\n";
        }
    }
    show_cursor();
    out.flush();
}

void SudokuTerminalView::show_cursor() {
    if (!cursorHidden) return;
    out << SHOW_CURSOR;
    out.flush();
    cursorHidden = false;
}
