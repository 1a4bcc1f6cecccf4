#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "sudoku_grid.hpp"

// Square BGR image of the grid, cell_px pixels per cell. Clues are drawn in
// black, values placed by the solver in blue.
cv::Mat draw_board(const SudokuGrid& grid, int cell_px = 48);

// Writes one numbered PNG per recorded grid: <prefix>1.png, <prefix>2.png, ...
class FrameRecorder {
public:
    explicit FrameRecorder(std::string prefix, int cell_px = 48);

    std::string record(const SudokuGrid& grid);
    const std::vector<std::string>& files() const { return written; }

private:
    std::string outPrefix;
    int cellPx;
    int count = 0;
    std::vector<std::string> written;
};
