// Copyright rafirafi 2018
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "search.h"

#include <cassert>

#include <algorithm>

#include "propagation.h"

void naked_twins_refinement::refine(board &values, assignment_trace *trace) const
{
    naked_twins(values, trace);
}

const char *search_status_name(search_status status)
{
    switch (status) {
    case search_status::invalid_grid:
        return "invalid";
    case search_status::contradiction:
        return "contradiction";
    case search_status::exhausted:
        return "unsolved";
    case search_status::solved:
        return "solved";
    }
    return "unknown";
}

/**************************************************************************************************/

// fewest candidates above one, lowest cell index on ties, kNA if none
int find_branching_cell(const board &values)
{
    int best_cell = kNA;
    size_t best_count = kSide + 1;
    for (int cell = 0; cell < kCells; cell++) {
        size_t count = values[cell].size();
        if (count > 1 && count < best_count) {
            best_cell = cell;
            best_count = count;
        }
    }
    return best_cell;
}

search_status search(board &values, const refinement &refine,
                     assignment_trace *trace, search_stats *stats, int depth)
{
    if (stats) {
        stats->nodes++;
        stats->max_depth = std::max(stats->max_depth, depth);
    }

    if (!reduce(values, trace)) {
        if (stats) {
            stats->contradictions++;
        }
        return search_status::contradiction;
    }

    refine.refine(values, trace);
    if (values.is_contradictory()) {
        if (stats) {
            stats->contradictions++;
        }
        return search_status::contradiction;
    }

    if (values.is_solved()) {
        return search_status::solved;
    }

    int cell = find_branching_cell(values);
    assert(cell != kNA);

    const std::string options = values[cell];
    for (char digit : options) {
        board child = values;
        if (stats) {
            stats->guesses++;
        }
        assign_value(child, cell, std::string(1, digit), trace);

        if (search(child, refine, trace, stats, depth + 1) == search_status::solved) {
            values = child;
            return search_status::solved;
        }
    }

    return search_status::exhausted;
}

search_status solve(const std::string &grid, board &result, const refinement &refine,
                    assignment_trace *trace, search_stats *stats)
{
    board values;
    if (!from_grid(grid, values)) {
        return search_status::invalid_grid;
    }

    search_status status = search(values, refine, trace, stats);
    result = values;
    return status;
}
