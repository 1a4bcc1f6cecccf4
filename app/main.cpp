#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <exception>

#include "board_image.hpp"
#include "puzzle_source.hpp"
#include "sudoku_errors.hpp"
#include "sudoku_grid.hpp"
#include "sudoku_solver.hpp"
#include "terminal_view.hpp"

struct Options {
    long step_ms = 0;
    bool quiet = false;
    std::optional<std::string> file;
    std::optional<std::string> puzzle;
    std::optional<std::string> id;
    std::optional<std::string> catalog;
    long count = 1;
    std::optional<std::string> frames;
};

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "  -s, --step MS         wait MS milliseconds between inserts\n"
              << "  -q, --quiet           no output until finished solving (faster)\n"
              << "  -f, --file PATH       load Sudoku from file\n"
              << "  -p, --puzzle STR      Sudoku given as 81 characters\n"
              << "  -i, --id NAME         load Sudoku from the catalog by identifier\n"
              << "  -c, --catalog PATH    catalog file for --id (\"<id> <puzzle>\" per line)\n"
              << "  -n, --count N         stop after N solutions, 0 = all (default 1)\n"
              << "  -o, --frames PREFIX   write every frame to PREFIX<n>.png\n"
              << "  -h, --help            show this message\n";
}

long parseNumber(const std::string& flag, const std::string& text) {
    size_t used = 0;
    long value = 0;
    try {
        value = std::stol(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != text.size() || value < 0) {
        throw InvalidInput(flag + " expects a non-negative number, got '" + text + "'");
    }
    return value;
}

// Returns std::nullopt when only the usage was requested.
std::optional<Options> parseArgs(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw InvalidInput(arg + " needs a value");
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") return std::nullopt;
        else if (arg == "-q" || arg == "--quiet") opts.quiet = true;
        else if (arg == "-s" || arg == "--step") opts.step_ms = parseNumber(arg, value());
        else if (arg == "-n" || arg == "--count") opts.count = parseNumber(arg, value());
        else if (arg == "-f" || arg == "--file") opts.file = value();
        else if (arg == "-p" || arg == "--puzzle") opts.puzzle = value();
        else if (arg == "-i" || arg == "--id") opts.id = value();
        else if (arg == "-c" || arg == "--catalog") opts.catalog = value();
        else if (arg == "-o" || arg == "--frames") opts.frames = value();
        else throw InvalidInput("unknown option " + arg);
    }

    int sources = (opts.file ? 1 : 0) + (opts.puzzle ? 1 : 0) + (opts.id ? 1 : 0);
    if (sources > 1) throw InvalidInput("use only one of --file, --puzzle and --id");
    if (opts.catalog && !opts.id) throw InvalidInput("--catalog needs --id");
    return opts;
}

SudokuGrid loadPuzzle(const Options& opts) {
    if (opts.file) return SudokuGrid(read_puzzle_file(*opts.file));
    if (opts.puzzle) return SudokuGrid::parse(*opts.puzzle);

    SudokuCatalog catalog;
    if (opts.catalog) catalog.load_file(*opts.catalog);
    return SudokuGrid::parse(catalog.at(opts.id.value_or(SudokuCatalog::DEFAULT_ID)));
}

int main(int argc, char* argv[]) {
    std::optional<Options> opts;
    std::optional<SudokuGrid> loaded;
    try {
        opts = parseArgs(argc, argv);
        if (!opts) {
            printUsage(argv[0]);
            return 0;
        }
        loaded = loadPuzzle(*opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 2;
    }
    const SudokuGrid& puzzle = *loaded;

    if (!puzzle.is_valid()) {
        std::cerr << "Warning: the clues repeat a digit in a row, column or box" << std::endl;
    }

    std::unique_ptr<FrameRecorder> recorder;
    if (opts->frames) recorder = std::make_unique<FrameRecorder>(*opts->frames);

    SudokuTerminalView view(std::cout, std::chrono::milliseconds(opts->step_ms), opts->quiet);
    view.show_puzzle(puzzle);

    SudokuSolver solver;
    std::vector<SudokuGrid> solutions;
    SolveStats stats;
    auto start = std::chrono::high_resolution_clock::now();

    try {
        if (view.quiet() && !recorder) {
            solutions = solver.solve(puzzle, static_cast<size_t>(opts->count));
            stats = solver.last_stats();
        } else {
            if (recorder) recorder->record(puzzle);
            SolveSteps steps = solver.steps(puzzle, static_cast<size_t>(opts->count));
            for ([[maybe_unused]] const StepEvent& event : steps) {
                view.frame(steps.current());
                if (recorder) recorder->record(steps.current());
            }
            solutions = steps.take_solutions();
            stats = steps.stats();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::micro> elapsed = end - start;

    view.finish(solutions);

    std::cout << "\nStatus: " << (solutions.empty() ? "Unsolvable" : "Solved") << "\n";
    std::cout << "Solutions: " << solutions.size() << "\n";
    std::cout << "Forced: " << stats.forced << ", guesses: " << stats.guesses
              << ", backtracks: " << stats.backtracks << "\n";
    std::cout << "Time: " << elapsed.count() << " microseconds\n";
    if (recorder) {
        std::cout << "Frames: " << recorder->files().size() << " written with prefix " << *opts->frames << "\n";
    }

    return solutions.empty() ? 1 : 0;
}
