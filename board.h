#ifndef BOARD_H
#define BOARD_H

// Copyright rafirafi 2018
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <string>
#include <vector>

#include "diagsolver_defs.h"

// Candidate digits of every cell, each set kept as ascending digit chars.
// An empty set marks a contradiction.
class board {
private:
    std::vector<std::string> cells_;

public:
    board() : cells_(kCells, std::string(kAllDigits)) {}

    const std::string &operator[](int cell) const { return cells_[cell]; }

    // raw write, engine code goes through assign_value()
    void set(int cell, const std::string &digits) { cells_[cell] = digits; }

    bool is_solved() const;
    bool is_contradictory() const;

    int count_singletons() const;
    int count_candidates() const;

    // '.' for cells not reduced to one digit
    std::string to_grid_string() const;

    // 2-D layout, '|' between boxes and a rule after rows C and F
    std::string to_text() const;

    bool operator==(const board &other) const { return cells_ == other.cells_; }
    bool operator!=(const board &other) const { return cells_ != other.cells_; }
};

// '1'-'9' fixes a cell, any other char leaves it open.
// false if grid is not kCells chars long, values untouched then
bool from_grid(const std::string &grid, board &values);

// every unit holds each digit exactly once
bool is_valid_solution(const board &values);

#endif // BOARD_H
