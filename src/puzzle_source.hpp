#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Flat text form of a puzzle: newlines are ignored, '1'..'9' is a clue and
// any other character (a whole UTF-8 sequence) is an empty cell. Throws InvalidInput unless exactly
// 81 cells remain.
std::vector<std::optional<int>> parse_puzzle(std::string_view text);

// Reads a puzzle file in the flat text form.
std::vector<std::optional<int>> read_puzzle_file(const std::string& path);

// Puzzles looked up by identifier. Entries are plain puzzle strings; they are
// not assumed to be valid or unique and go through the normal grid checks.
class SudokuCatalog {
public:
    // Catalog preloaded with the built-in puzzles.
    SudokuCatalog();

    // Adds `<id> <puzzle>` lines from a file. '#' starts a comment line.
    // Later entries replace earlier ones with the same id.
    void load_file(const std::string& path);
    void load(std::string_view text, const std::string& origin = "<catalog>");
    void add(const std::string& id, const std::string& puzzle);

    std::optional<std::string> find(const std::string& id) const;
    std::string at(const std::string& id) const;
    std::vector<std::string> ids() const;

    static constexpr const char* DEFAULT_ID = "readme";

private:
    std::map<std::string, std::string> puzzles;
};
