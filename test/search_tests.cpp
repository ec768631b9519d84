// Copyright rafirafi 2018
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "search.h"

#include <string>

#include "test/test_diagsolver.h"

#include <boost/test/unit_test.hpp>

namespace {

const identity_refinement identity{};
const naked_twins_refinement twins{};

} // namespace

BOOST_AUTO_TEST_SUITE(search_tests)

BOOST_AUTO_TEST_CASE(refinement_variants)
{
    BOOST_CHECK_EQUAL(std::string(identity.name()), "identity");
    BOOST_CHECK_EQUAL(std::string(twins.name()), "naked_twins");

    board values;
    values.set(cell("A1"), "23");
    values.set(cell("A2"), "23");
    const board before = values;

    identity.refine(values, nullptr);
    BOOST_CHECK(values == before);

    twins.refine(values, nullptr);
    BOOST_CHECK_EQUAL(values[cell("A3")], "1456789");
}

BOOST_AUTO_TEST_CASE(branching_cell_fewest_candidates)
{
    board values;
    values.set(cell("C5"), "34");
    values.set(cell("B1"), "123");
    BOOST_CHECK_EQUAL(find_branching_cell(values), cell("C5"));

    // ties go to the first cell
    values.set(cell("A7"), "89");
    BOOST_CHECK_EQUAL(find_branching_cell(values), cell("A7"));

    // solved cells are never picked
    values.set(cell("A1"), "5");
    BOOST_CHECK_EQUAL(find_branching_cell(values), cell("A7"));

    BOOST_REQUIRE(from_grid(kDiagSolution, values));
    BOOST_CHECK_EQUAL(find_branching_cell(values), kNA);
}

BOOST_AUTO_TEST_CASE(solve_diagonal_example)
{
    for (const refinement *refine : {static_cast<const refinement *>(&twins),
                                     static_cast<const refinement *>(&identity)}) {
        board result;
        search_stats stats;
        search_status status = solve(kDiagGrid, result, *refine, nullptr, &stats);

        BOOST_REQUIRE(status == search_status::solved);
        BOOST_CHECK(is_valid_solution(result));
        BOOST_CHECK_EQUAL(result.to_grid_string(), kDiagSolution);
        BOOST_CHECK_EQUAL(stats.nodes, 1);
        BOOST_CHECK_EQUAL(stats.guesses, 0);
    }
}

BOOST_AUTO_TEST_CASE(solve_keeps_givens)
{
    board result;
    BOOST_REQUIRE(solve(kDiagGrid, result, twins) == search_status::solved);
    const std::string grid = kDiagGrid;
    for (int c = 0; c < kCells; c++) {
        if (grid[c] != '.') {
            BOOST_CHECK_EQUAL(result[c][0], grid[c]);
        }
    }
}

BOOST_AUTO_TEST_CASE(solve_empty_grid_by_branching)
{
    for (const refinement *refine : {static_cast<const refinement *>(&twins),
                                     static_cast<const refinement *>(&identity)}) {
        board result;
        search_stats stats;
        search_status status = solve(std::string(81, '.'), result, *refine, nullptr, &stats);

        BOOST_REQUIRE(status == search_status::solved);
        BOOST_CHECK(is_valid_solution(result));
        BOOST_CHECK_GT(stats.guesses, 0);
        BOOST_CHECK_GT(stats.nodes, 1);
        BOOST_CHECK_GT(stats.max_depth, 0);
    }
}

BOOST_AUTO_TEST_CASE(solved_grid_returned_unchanged)
{
    board result;
    search_stats stats;
    assignment_trace trace;
    search_status status = solve(kDiagSolution, result, twins, &trace, &stats);

    BOOST_CHECK(status == search_status::solved);
    BOOST_CHECK_EQUAL(result.to_grid_string(), kDiagSolution);
    BOOST_CHECK_EQUAL(stats.nodes, 1);
    BOOST_CHECK_EQUAL(stats.guesses, 0);
    BOOST_CHECK_EQUAL(stats.max_depth, 0);
    BOOST_CHECK(trace.empty());
}

BOOST_AUTO_TEST_CASE(row_conflict_is_contradiction)
{
    board result;
    search_stats stats;
    search_status status = solve(kRowConflictGrid, result, twins, nullptr, &stats);

    BOOST_CHECK(status == search_status::contradiction);
    BOOST_CHECK_EQUAL(stats.nodes, 1);
    BOOST_CHECK_EQUAL(stats.contradictions, 1);
    BOOST_CHECK_EQUAL(stats.guesses, 0);
}

BOOST_AUTO_TEST_CASE(unsolvable_grid_is_not_solved)
{
    board result;
    search_stats stats;
    search_status status = solve(kNoSolutionGrid, result, twins, nullptr, &stats);

    // every branch fails : the reduced board comes back, it is no solution
    BOOST_CHECK(status == search_status::exhausted);
    BOOST_CHECK(!result.is_solved());
    BOOST_CHECK(!result.is_contradictory());
    BOOST_CHECK_GT(stats.guesses, 0);
    BOOST_CHECK_GT(stats.contradictions, 0);

    status = solve(kNoSolutionGrid, result, identity);
    BOOST_CHECK(status != search_status::solved);
}

BOOST_AUTO_TEST_CASE(invalid_grid_rejected)
{
    board result;
    BOOST_REQUIRE(from_grid(kDiagSolution, result));
    const board before = result;
    search_stats stats;

    BOOST_CHECK(solve("2..3", result, twins, nullptr, &stats) == search_status::invalid_grid);
    BOOST_CHECK(result == before);
    BOOST_CHECK_EQUAL(stats.nodes, 0);
}

BOOST_AUTO_TEST_CASE(search_in_place)
{
    board values;
    BOOST_REQUIRE(from_grid(kDiagGrid, values));
    BOOST_CHECK(search(values, twins, nullptr, nullptr) == search_status::solved);
    BOOST_CHECK_EQUAL(values.to_grid_string(), kDiagSolution);
}

BOOST_AUTO_TEST_CASE(status_names)
{
    BOOST_CHECK_EQUAL(std::string(search_status_name(search_status::solved)), "solved");
    BOOST_CHECK_EQUAL(std::string(search_status_name(search_status::exhausted)), "unsolved");
    BOOST_CHECK_EQUAL(std::string(search_status_name(search_status::contradiction)), "contradiction");
    BOOST_CHECK_EQUAL(std::string(search_status_name(search_status::invalid_grid)), "invalid");
}

BOOST_AUTO_TEST_SUITE_END()
