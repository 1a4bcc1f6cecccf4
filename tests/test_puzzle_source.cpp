#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <string>

#include "puzzle_source.hpp"
#include "sudoku_errors.hpp"
#include "sudoku_grid.hpp"
#include "sudoku_solver.hpp"

static const char* README_PUZZLE =
    "xxxxxxx9xx9x7xx21xxx4x9xxxxx1xxx8xxx7xx42xxx5xx8xxxx748x1xxxx4xxxxxxxxxxxx9613xxx";

// Temporary file removed at scope exit.
struct TempFile {
    std::string path;
    explicit TempFile(const std::string& name, const std::string& content) : path(name) {
        std::ofstream out(path);
        out << content;
    }
    ~TempFile() { std::remove(path.c_str()); }
};

TEST_CASE("parse_puzzle reads digits as clues and anything else as empty", "[input]") {
    auto cells = parse_puzzle(README_PUZZLE);

    REQUIRE(cells.size() == 81);
    REQUIRE(cells[7] == 9);
    REQUIRE_FALSE(cells[0].has_value());

    SECTION("zero is an empty cell") {
        std::string text(81, '0');
        text[80] = '4';
        auto zeros = parse_puzzle(text);
        REQUIRE_FALSE(zeros[0].has_value());
        REQUIRE(zeros[80] == 4);
    }
}

TEST_CASE("parse_puzzle ignores line breaks", "[input]") {
    std::string rows;
    std::string flat(README_PUZZLE);
    for (int r = 0; r < 9; ++r) {
        rows += flat.substr(r * 9, 9) + "\r\n";
    }

    REQUIRE(parse_puzzle(rows) == parse_puzzle(flat));
}

TEST_CASE("parse_puzzle requires 81 cells", "[input][errors]") {
    REQUIRE_THROWS_AS(parse_puzzle(""), InvalidInput);
    REQUIRE_THROWS_AS(parse_puzzle(std::string(80, '.')), InvalidInput);
    REQUIRE_THROWS_AS(parse_puzzle(std::string(82, '.')), InvalidInput);
}

TEST_CASE("read_puzzle_file loads a grid from disk", "[input]") {
    std::string flat(README_PUZZLE);
    TempFile file("sudoku_test_puzzle.txt", flat.substr(0, 27) + "\n" + flat.substr(27) + "\n");

    SudokuGrid grid(read_puzzle_file(file.path));
    REQUIRE(grid == SudokuGrid::parse(README_PUZZLE));

    REQUIRE_THROWS_AS(read_puzzle_file("does/not/exist.txt"), InvalidInput);
}

TEST_CASE("SudokuCatalog resolves built-in and loaded identifiers", "[catalog]") {
    SudokuCatalog catalog;

    REQUIRE(catalog.at(SudokuCatalog::DEFAULT_ID) == README_PUZZLE);
    REQUIRE_FALSE(catalog.find("missing").has_value());
    REQUIRE_THROWS_AS(catalog.at("missing"), InvalidInput);

    catalog.load("# daily puzzles\n"
                 "\n"
                 "  monday " + std::string(81, '.') + "\n"
                 "readme 12345678" + std::string(73, '.') + "\r\n");

    REQUIRE(catalog.at("monday") == std::string(81, '.'));
    REQUIRE(catalog.at("readme").substr(0, 8) == "12345678");
    REQUIRE(catalog.ids().size() == 5);
}

TEST_CASE("SudokuCatalog rejects malformed lines", "[catalog][errors]") {
    SudokuCatalog catalog;

    REQUIRE_THROWS_AS(catalog.load("lonely\n"), InvalidInput);
    REQUIRE_THROWS_AS(catalog.load("short 123\n"), InvalidInput);
    REQUIRE_THROWS_AS(catalog.load_file("does/not/exist.cat"), InvalidInput);
}

TEST_CASE("Catalog puzzles are solved like any other input", "[catalog][solver]") {
    TempFile file("sudoku_test_catalog.txt",
                  "broken 55" + std::string(79, '.') + "\n");
    SudokuCatalog catalog;
    catalog.load_file(file.path);
    SudokuSolver solver;

    REQUIRE(solver.is_unique(SudokuGrid::parse(catalog.at("escargot"))));
    REQUIRE(solver.solve(SudokuGrid::parse(catalog.at("broken")), 1).empty());
    REQUIRE(solver.solve(SudokuGrid::parse(catalog.at("empty")), 3).size() == 3);
}

TEST_CASE("Multi-byte placeholders count as one cell each", "[input]") {
    std::string dotted;
    for (const char* p = README_PUZZLE; *p; ++p) {
        if (*p == 'x') {
            dotted += "\xC2\xB7";  // U+00B7 middle dot
        } else {
            dotted += *p;
        }
    }

    REQUIRE(SudokuGrid::parse(dotted) == SudokuGrid::parse(README_PUZZLE));
    REQUIRE(SudokuGrid::parse(dotted).clue_count() == 23);

    SudokuCatalog catalog;
    catalog.load("dotted " + dotted + "\n");
    REQUIRE(catalog.at("dotted") == dotted);
    REQUIRE_THROWS_AS(catalog.load("short " + dotted.substr(2) + "\n"), InvalidInput);
}
