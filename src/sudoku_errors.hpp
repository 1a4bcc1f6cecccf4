#pragma once

#include <stdexcept>
#include <string>

// Malformed puzzle data: wrong cell count, digit outside 1..9, bad coordinates,
// unreadable puzzle file or unknown catalog identifier.
class InvalidInput : public std::runtime_error {
public:
    explicit InvalidInput(const std::string& what) : std::runtime_error(what) {}
};

// Assignment that would repeat a value inside a row, column or box,
// or that tries to overwrite a clue with another value.
class ConstraintViolation : public std::runtime_error {
public:
    explicit ConstraintViolation(const std::string& what) : std::runtime_error(what) {}
};

// Mutation that is never allowed, e.g. clearing a clue.
class InvalidOperation : public std::runtime_error {
public:
    explicit InvalidOperation(const std::string& what) : std::runtime_error(what) {}
};
