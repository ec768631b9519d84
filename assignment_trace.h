#ifndef ASSIGNMENT_TRACE_H
#define ASSIGNMENT_TRACE_H

// Copyright rafirafi 2018
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <cstdio>

#include <vector>

#include "board.h"

// Append only log of board snapshots, one per cell narrowed to a single digit,
// in commitment order. Owned by whoever calls solve(), never read by the solver.
class assignment_trace {
private:
    std::vector<board> snapshots_;

public:
    void record(const board &values) { snapshots_.push_back(values); }

    size_t size() const { return snapshots_.size(); }
    bool empty() const { return snapshots_.empty(); }
    const board &operator[](size_t i) const { return snapshots_[i]; }

    std::vector<board>::const_iterator begin() const { return snapshots_.begin(); }
    std::vector<board>::const_iterator end() const { return snapshots_.end(); }

    void clear() { snapshots_.clear(); }
};

// one line per snapshot : "<grid_number> <event> " + kCells candidate sets, '-' if empty
bool write_trace(FILE *out, const assignment_trace &trace, int grid_number);

#endif // ASSIGNMENT_TRACE_H
