#include "sudoku_solver.hpp"
#include "sudoku_errors.hpp"

#include <bit>
#include <utility>

/**
 * Constraint propagation + backtracking, driven one mutation at a time.
 * 1. Propagation: scan every empty cell; a cell without candidates kills the
 *    branch, the first cell with a single candidate is assigned (naked single).
 * 2. Search: once nothing is forced, branch on the cell with the fewest
 *    candidates (MRV, lowest row-major index on ties), values in ascending order.
 * The explicit frame stack replaces recursion so the search can pause after
 * every set/unset.
 */

SolveSteps::SolveSteps(const SudokuGrid& puzzle, size_t max_solutions)
    : grid(puzzle), limit(max_solutions) {
    if (!grid.is_valid()) {
        phase = Phase::Done;
        return;
    }
    stack.emplace_back();
}

std::optional<StepEvent> SolveSteps::next() {
    while (phase != Phase::Done) {
        std::optional<StepEvent> event = (phase == Phase::Propagate) ? propagate() : branch();
        if (event) return event;
    }
    return std::nullopt;
}

std::optional<StepEvent> SolveSteps::propagate() {
    int best_idx = -1;
    int min_candidates = 10;
    uint16_t best_mask = 0;

    for (int i = 0; i < SudokuGrid::CELL_COUNT; ++i) {
        int r = i / SudokuGrid::N;
        int c = i % SudokuGrid::N;
        if (grid.value(r, c) != 0) continue;

        uint16_t mask = grid.candidates_of(r, c);
        int count = std::popcount(mask);

        if (count == 0) {  // Dead end
            phase = Phase::Branch;
            return std::nullopt;
        }
        if (count < min_candidates) {
            min_candidates = count;
            best_mask = mask;
            best_idx = i;
        }
    }

    if (best_idx < 0) {
        found.push_back(grid);
        ++counters.solutions;
        phase = (limit != 0 && found.size() >= limit) ? Phase::Done : Phase::Branch;
        return std::nullopt;
    }

    if (min_candidates == 1) {
        stack.back().forced.push_back(best_idx);
        ++counters.forced;
        return assign(best_idx, std::countr_zero(best_mask) + 1);
    }

    Frame frame;
    frame.cell = best_idx;
    frame.remaining = best_mask;
    stack.push_back(std::move(frame));
    phase = Phase::Branch;
    return std::nullopt;
}

// Undo the current node step by step, then move to its next candidate or
// pop back to the parent once every candidate has been tried.
std::optional<StepEvent> SolveSteps::branch() {
    if (stack.empty()) {
        phase = Phase::Done;
        return std::nullopt;
    }

    Frame& top = stack.back();
    if (!top.forced.empty()) {
        int idx = top.forced.back();
        top.forced.pop_back();
        return clear(idx);
    }
    if (top.value != 0) {
        top.value = 0;
        return clear(top.cell);
    }
    if (top.remaining != 0) {
        int val = std::countr_zero(top.remaining) + 1;
        // Clear the lowest set bit to move to the next candidate
        top.remaining &= (top.remaining - 1);
        try {
            StepEvent event = assign(top.cell, val);
            top.value = val;
            ++counters.guesses;
            phase = Phase::Propagate;
            return event;
        } catch (const ConstraintViolation&) {
            // Not reached while values come from the candidate mask of this grid state.
            // A rejected value moves on to the next candidate.
            return std::nullopt;
        }
    }

    stack.pop_back();
    return std::nullopt;
}

StepEvent SolveSteps::assign(int idx, int value) {
    int r = idx / SudokuGrid::N;
    int c = idx % SudokuGrid::N;
    grid.set(r, c, value);
    return StepEvent{r, c, value};
}

StepEvent SolveSteps::clear(int idx) {
    int r = idx / SudokuGrid::N;
    int c = idx % SudokuGrid::N;
    grid.unset(r, c);
    ++counters.backtracks;
    return StepEvent{r, c, 0};
}

std::vector<SudokuGrid> SudokuSolver::solve(const SudokuGrid& puzzle, size_t max_solutions) {
    SolveSteps run(puzzle, max_solutions);
    while (run.next()) {
    }
    stats = run.stats();
    return run.take_solutions();
}

SolveSteps SudokuSolver::steps(const SudokuGrid& puzzle, size_t max_solutions) const {
    return SolveSteps(puzzle, max_solutions);
}

bool SudokuSolver::is_unique(const SudokuGrid& puzzle) {
    return solve(puzzle, 2).size() == 1;
}
