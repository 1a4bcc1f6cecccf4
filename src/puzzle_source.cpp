#include "puzzle_source.hpp"
#include "sudoku_errors.hpp"

#include <fstream>
#include <sstream>

namespace {

// UTF-8 continuation bytes belong to the character started before them.
bool is_continuation(char ch) {
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

size_t count_cells(std::string_view text) {
    size_t count = 0;
    for (char ch : text) {
        if (ch == '\n' || ch == '\r' || is_continuation(ch)) continue;
        ++count;
    }
    return count;
}

}

std::vector<std::optional<int>> parse_puzzle(std::string_view text) {
    std::vector<std::optional<int>> values;
    values.reserve(81);

    for (char ch : text) {
        if (ch == '\n' || ch == '\r' || is_continuation(ch)) continue;
        if (ch >= '1' && ch <= '9') {
            values.push_back(ch - '0');
        } else {
            values.push_back(std::nullopt);
        }
    }

    if (values.size() != 81) {
        throw InvalidInput("puzzle has " + std::to_string(values.size()) + " cells, expected 81");
    }
    return values;
}

std::vector<std::optional<int>> read_puzzle_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InvalidInput("could not read puzzle file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_puzzle(buffer.str());
}

SudokuCatalog::SudokuCatalog() {
    add(DEFAULT_ID, "xxxxxxx9xx9x7xx21xxx4x9xxxxx1xxx8xxx7xx42xxx5xx8xxxx748x1xxxx4xxxxxxxxxxxx9613xxx");
    add("easy", "53..7....6..195....98....6.8...6...34..8.3..17...2...6.6....28....419..5....8..79");
    add("escargot", "1....7.9..3..2...8..96..5....53..9...1..8...26....4...3......1..4......7..7...3..");
    add("empty", std::string(81, '.'));
}

void SudokuCatalog::add(const std::string& id, const std::string& puzzle) {
    puzzles[id] = puzzle;
}

void SudokuCatalog::load(std::string_view text, const std::string& origin) {
    std::istringstream in{std::string(text)};
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t start = line.find_first_not_of(" \t");
        if (start == std::string::npos || line[start] == '#') continue;

        std::istringstream fields(line.substr(start));
        std::string id, puzzle;
        if (!(fields >> id >> puzzle)) {
            throw InvalidInput(origin + ":" + std::to_string(line_no) + ": expected '<id> <puzzle>'");
        }
        size_t cells = count_cells(puzzle);
        if (cells != 81) {
            throw InvalidInput(origin + ":" + std::to_string(line_no) + ": puzzle '" + id + "' has " +
                               std::to_string(cells) + " cells, expected 81");
        }
        add(id, puzzle);
    }
}

void SudokuCatalog::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InvalidInput("could not read catalog " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    load(buffer.str(), path);
}

std::optional<std::string> SudokuCatalog::find(const std::string& id) const {
    auto it = puzzles.find(id);
    if (it == puzzles.end()) return std::nullopt;
    return it->second;
}

std::string SudokuCatalog::at(const std::string& id) const {
    auto puzzle = find(id);
    if (!puzzle) {
        throw InvalidInput("unknown puzzle id '" + id + "'");
    }
    return *puzzle;
}

std::vector<std::string> SudokuCatalog::ids() const {
    std::vector<std::string> out;
    out.reserve(puzzles.size());
    for (const auto& kv : puzzles) out.push_back(kv.first);
    return out;
}
