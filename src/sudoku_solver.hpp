#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

#include "sudoku_grid.hpp"

// One mutation of the working grid. value == 0 means the cell was cleared.
struct StepEvent {
    int row = 0;
    int col = 0;
    int value = 0;

    bool cleared() const { return value == 0; }
    bool operator==(const StepEvent& other) const {
        return row == other.row && col == other.col && value == other.value;
    }
};

struct SolveStats {
    size_t forced = 0;      // naked singles assigned by propagation
    size_t guesses = 0;     // candidate values tried at branch cells
    size_t backtracks = 0;  // assignments undone
    size_t solutions = 0;
};

// Lazy, single-pass stream of the assignments made while solving a puzzle.
// Each next() resumes the search exactly up to its next mutation. Destroying
// the object abandons the search; only completed solutions are ever recorded.
class SolveSteps {
public:
    // max_solutions == 0 enumerates every solution.
    SolveSteps(const SudokuGrid& puzzle, size_t max_solutions);

    SolveSteps(const SolveSteps&) = delete;
    SolveSteps& operator=(const SolveSteps&) = delete;
    SolveSteps(SolveSteps&&) = default;
    SolveSteps& operator=(SolveSteps&&) = default;

    std::optional<StepEvent> next();
    bool done() const { return phase == Phase::Done; }

    // Working grid as of the last returned event.
    const SudokuGrid& current() const { return grid; }
    const std::vector<SudokuGrid>& solutions() const { return found; }
    std::vector<SudokuGrid> take_solutions() { return std::move(found); }
    const SolveStats& stats() const { return counters; }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = StepEvent;
        using difference_type = std::ptrdiff_t;
        using pointer = const StepEvent*;
        using reference = const StepEvent&;

        iterator() = default;
        explicit iterator(SolveSteps* owner) : owner(owner) { ++(*this); }

        reference operator*() const { return *event; }
        pointer operator->() const { return &*event; }
        iterator& operator++() {
            event = owner->next();
            if (!event) owner = nullptr;
            return *this;
        }
        bool operator==(const iterator& other) const { return owner == other.owner; }
        bool operator!=(const iterator& other) const { return owner != other.owner; }

    private:
        SolveSteps* owner = nullptr;
        std::optional<StepEvent> event;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    enum class Phase { Propagate, Branch, Done };

    // One search node. The root frame has no branch cell.
    struct Frame {
        int cell = -1;
        uint16_t remaining = 0;   // candidates not tried yet
        int value = 0;            // candidate currently assigned to `cell`
        std::vector<int> forced;  // cells assigned by propagation below this node
    };

    SudokuGrid grid;
    size_t limit;
    Phase phase = Phase::Propagate;
    std::vector<Frame> stack;
    std::vector<SudokuGrid> found;
    SolveStats counters;

    std::optional<StepEvent> propagate();
    std::optional<StepEvent> branch();
    StepEvent assign(int idx, int value);
    StepEvent clear(int idx);
};

class SudokuSolver {
public:
    // Up to max_solutions solved grids (0 = all) in discovery order. A puzzle
    // whose clues already conflict has no solutions.
    std::vector<SudokuGrid> solve(const SudokuGrid& puzzle, size_t max_solutions = 1);

    // Same search, exposed one assignment at a time.
    SolveSteps steps(const SudokuGrid& puzzle, size_t max_solutions = 1) const;

    // True when the puzzle has exactly one solution.
    bool is_unique(const SudokuGrid& puzzle);

    // Counters of the last solve() or is_unique() call. Streams returned by
    // steps() keep their own counters in SolveSteps::stats().
    const SolveStats& last_stats() const { return stats; }

private:
    SolveStats stats;
};
