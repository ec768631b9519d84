#ifndef SEARCH_H
#define SEARCH_H

// Copyright rafirafi 2018
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <string>

#include "assignment_trace.h"
#include "board.h"

// Step applied after each reduce() of the search, before the solved check
class refinement {
public:
    virtual ~refinement() {}
    virtual void refine(board &values, assignment_trace *trace) const = 0;
    virtual const char *name() const = 0;
};

class identity_refinement : public refinement {
public:
    void refine(board &, assignment_trace *) const override {}
    const char *name() const override { return "identity"; }
};

class naked_twins_refinement : public refinement {
public:
    void refine(board &values, assignment_trace *trace) const override;
    const char *name() const override { return "naked_twins"; }
};

enum class search_status {
    invalid_grid,   // solve() only
    contradiction,  // a cell lost all its candidates
    exhausted,      // every digit of the branching cell failed, board is reduced but not solved
    solved
};

const char *search_status_name(search_status status);

struct search_stats {
    int nodes = 0;
    int guesses = 0;
    int contradictions = 0;
    int max_depth = 0;
};

int find_branching_cell(const board &values);

// Depth first search, propagating at every node.
// On solved, 'values' holds the solution. On exhausted, it holds the reduced
// board the node branched from. On contradiction, its content is unspecified.
// Only search_status::solved is a solution. 'trace' and 'stats' may be null.
search_status search(board &values, const refinement &refine,
                     assignment_trace *trace, search_stats *stats, int depth = 0);

// from_grid() then search()
search_status solve(const std::string &grid, board &result, const refinement &refine,
                    assignment_trace *trace = nullptr, search_stats *stats = nullptr);

#endif // SEARCH_H
