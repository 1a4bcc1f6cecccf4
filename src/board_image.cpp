#include "board_image.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <opencv2/opencv.hpp>

cv::Mat draw_board(const SudokuGrid& grid, int cell_px) {
    if (cell_px < 8) {
        throw std::invalid_argument("cell size must be at least 8 pixels");
    }

    const int N = SudokuGrid::N;
    const int margin = cell_px / 4;
    const int side = N * cell_px + 2 * margin;
    cv::Mat img(side, side, CV_8UC3, cv::Scalar(255, 255, 255));

    // Thin cell lines first, block lines on top
    const int block_thickness = std::max(2, cell_px / 16);
    for (int i = 1; i < N; ++i) {
        if (i % 3 == 0) continue;
        int pos = margin + i * cell_px;
        cv::line(img, {pos, margin}, {pos, side - margin}, cv::Scalar(160, 160, 160), 1);
        cv::line(img, {margin, pos}, {side - margin, pos}, cv::Scalar(160, 160, 160), 1);
    }
    for (int i = 0; i <= N; i += 3) {
        int pos = margin + i * cell_px;
        cv::line(img, {pos, margin}, {pos, side - margin}, cv::Scalar(0, 0, 0), block_thickness);
        cv::line(img, {margin, pos}, {side - margin, pos}, cv::Scalar(0, 0, 0), block_thickness);
    }

    const double scale = cell_px / 40.0;
    const int text_thickness = std::max(1, cell_px / 24);
    for (int r = 0; r < N; ++r) {
        for (int c = 0; c < N; ++c) {
            int v = grid.value(r, c);
            if (v == 0) continue;

            std::string text(1, static_cast<char>('0' + v));
            int baseline = 0;
            cv::Size size = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, scale, text_thickness, &baseline);
            cv::Point origin(margin + c * cell_px + (cell_px - size.width) / 2,
                             margin + r * cell_px + (cell_px + size.height) / 2);
            cv::Scalar color = grid.is_fixed(r, c) ? cv::Scalar(0, 0, 0) : cv::Scalar(200, 80, 0);
            cv::putText(img, text, origin, cv::FONT_HERSHEY_SIMPLEX, scale, color, text_thickness, cv::LINE_AA);
        }
    }
    return img;
}

FrameRecorder::FrameRecorder(std::string prefix, int cell_px)
    : outPrefix(std::move(prefix)), cellPx(cell_px) {}

std::string FrameRecorder::record(const SudokuGrid& grid) {
    std::string filename = outPrefix + std::to_string(++count) + ".png";
    if (!cv::imwrite(filename, draw_board(grid, cellPx))) {
        throw std::runtime_error("could not write frame " + filename);
    }
    written.push_back(filename);
    return filename;
}
