#ifndef PROPAGATION_H
#define PROPAGATION_H

// Copyright rafirafi 2018
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <string>

#include "assignment_trace.h"
#include "board.h"

// All functions narrow 'values' in place. 'trace' may be null.

// only write primitive, records a snapshot when digits is a single digit
void assign_value(board &values, int cell, const std::string &digits, assignment_trace *trace);

// 'digits' minus every char of 'removed', order kept
std::string remove_digits(const std::string &digits, const std::string &removed);

// one pass : the digit of each solved cell is removed from its peers
void eliminate(board &values, assignment_trace *trace);

// a digit admitted by one cell only of a unit is committed to that cell,
// tallies come from the board as it was on entry
void only_choice(board &values, assignment_trace *trace);

// two cells of a unit with the same two candidates remove them from the
// other cells of the unit, pairs come from the board as it was on entry
void naked_twins(board &values, assignment_trace *trace);

// eliminate + only_choice until no new cell gets solved
// false as soon as a cell has no candidate left
bool reduce(board &values, assignment_trace *trace);

#endif // PROPAGATION_H
