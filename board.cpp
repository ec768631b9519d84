// Copyright rafirafi 2018
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "board.h"

#include <algorithm>

#include "topology.h"

bool board::is_solved() const
{
    return std::all_of(cells_.begin(), cells_.end(), [](const std::string &digits) {
        return digits.size() == 1;
    });
}

bool board::is_contradictory() const
{
    return std::any_of(cells_.begin(), cells_.end(), [](const std::string &digits) {
        return digits.empty();
    });
}

int board::count_singletons() const
{
    return std::count_if(cells_.begin(), cells_.end(), [](const std::string &digits) {
        return digits.size() == 1;
    });
}

int board::count_candidates() const
{
    int total = 0;
    for (auto &digits : cells_) {
        total += digits.size();
    }
    return total;
}

std::string board::to_grid_string() const
{
    std::string grid(kCells, '.');
    for (int i = 0; i < kCells; i++) {
        if (cells_[i].size() == 1) {
            grid[i] = cells_[i][0];
        }
    }
    return grid;
}

std::string board::to_text() const
{
    size_t width = 0;
    for (auto &digits : cells_) {
        width = std::max(width, digits.size());
    }
    width += 1;

    std::string rule = std::string(width * kBoxSide, '-');
    std::string line = rule + "+" + rule + "+" + rule + "\n";

    std::string text;
    for (int row = 0; row < kSide; row++) {
        for (int col = 0; col < kSide; col++) {
            const std::string &digits = cells_[row * kSide + col];
            size_t pad = width - digits.size();
            text += std::string(pad / 2, ' ') + digits + std::string(pad - pad / 2, ' ');
            if (col % kBoxSide == kBoxSide - 1 && col != kSide - 1) {
                text += '|';
            }
        }
        text += '\n';
        if (row % kBoxSide == kBoxSide - 1 && row != kSide - 1) {
            text += line;
        }
    }
    return text;
}

/**************************************************************************************************/

bool from_grid(const std::string &grid, board &values)
{
    if ((int)grid.size() != kCells) {
        return false;
    }

    board result;
    for (int i = 0; i < kCells; i++) {
        if (is_digit_char(grid[i])) {
            result.set(i, std::string(1, grid[i]));
        }
    }
    values = result;
    return true;
}

bool is_valid_solution(const board &values)
{
    if (!values.is_solved()) {
        return false;
    }
    for (auto &unit : get_topology().units()) {
        std::vector<bool> seen(kSide, false);
        for (int cell : unit) {
            int d = values[cell][0] - '1';
            if (d < 0 || d >= kSide || seen[d]) {
                return false;
            }
            seen[d] = true;
        }
    }
    return true;
}
