// Copyright rafirafi 2018
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <cstdint>
#include <cstdio>
#include <ctime>

#include <string>

#include <unistd.h>

#include "assignment_trace.h"
#include "board.h"
#include "search.h"

namespace {

struct options {
    bool naked_twins = true;
    bool display = false;
    bool quiet = false;
    bool verbose = false;
    const char *trace_file = nullptr;
};

void usage(const char *prog)
{
    fprintf(stderr, "usage: %s [-n] [-d] [-q] [-v] [-t trace_file] [grid ...]\n"
                    "  -n  no naked twins refinement\n"
                    "  -d  display boards as a table\n"
                    "  -q  don't print solutions\n"
                    "  -v  print search statistics\n"
                    "  -t  write the assignment trace to trace_file\n"
                    "grids are read from stdin when none is given\n", prog);
}

// false on i/o error only
bool solve_grid(const std::string &grid, int grid_number, const options &opts,
                const refinement &refine, FILE *trace_out, bool &solved)
{
    assignment_trace trace;
    search_stats stats;
    board result;

    search_status status = solve(grid, result, refine, trace_out ? &trace : nullptr, &stats);
    solved = status == search_status::solved;

#ifndef NDEBUG
    if (solved && !is_valid_solution(result)) {
        fprintf(stderr, "%-30s grid %d : solution breaks a unit\n", __func__, grid_number);
        solved = false;
    }
#endif

    if (!opts.quiet) {
        if (solved) {
            printf("%s\n", result.to_grid_string().c_str());
        } else {
            printf("%s %s\n", grid.c_str(), search_status_name(status));
        }
    }
    if (opts.display && status != search_status::invalid_grid) {
        printf("%s\n", result.to_text().c_str());
    }
    if (opts.verbose) {
        fprintf(stderr, "%-30s grid %d %s | %s nodes %d guesses %d contradictions %d depth %d trace %d\n",
                __func__, grid_number, search_status_name(status), refine.name(),
                stats.nodes, stats.guesses, stats.contradictions, stats.max_depth, (int)trace.size());
    }

    if (trace_out && !write_trace(trace_out, trace, grid_number)) {
        fprintf(stderr, "%-30s grid %d : can't write trace\n", __func__, grid_number);
        return false;
    }
    return true;
}

void print_summary(int solved_grid_cnt, int grid_cnt, clock_t start)
{
    auto end = clock();
    uint64_t us = ((end - start)/(double)CLOCKS_PER_SEC) * 1000000;

    fprintf(stderr, "solved %d / %d %3.3f%% time grid % 3.3f us time total %lu us\n",
            solved_grid_cnt, grid_cnt, 100.f * solved_grid_cnt / (grid_cnt == 0 ? 1.f : (float)grid_cnt),
            (float)us / (float)(grid_cnt == 0 ? 1 : grid_cnt), (unsigned long)us);
    fflush(stderr);
}

} // namespace

/**************************************************************************************************/

int main(int argc, char *argv[])
{
    options opts;
    int opt;
    while ((opt = getopt(argc, argv, "ndqvt:h")) != -1) {
        switch (opt) {
        case 'n':
            opts.naked_twins = false;
            break;
        case 'd':
            opts.display = true;
            break;
        case 'q':
            opts.quiet = true;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 't':
            opts.trace_file = optarg;
            break;
        case 'h':
            usage(argv[0]);
            return 0;
        default:
            usage(argv[0]);
            return 1;
        }
    }

    FILE *trace_out = nullptr;
    if (opts.trace_file) {
        trace_out = fopen(opts.trace_file, "w");
        if (!trace_out) {
            fprintf(stderr, "can't open trace file %s\n", opts.trace_file);
            return 1;
        }
    }

    const identity_refinement identity{};
    const naked_twins_refinement twins{};
    const refinement &refine = opts.naked_twins ? static_cast<const refinement &>(twins)
                                                : static_cast<const refinement &>(identity);

    int grid_cnt = 0, solved_grid_cnt = 0;
    bool io_ok = true;
    auto start = clock();

    auto run = [&](const std::string &grid) {
        bool solved = false;
        grid_cnt++;
        io_ok = solve_grid(grid, grid_cnt, opts, refine, trace_out, solved) && io_ok;
        solved_grid_cnt += solved;

        if (grid_cnt && (grid_cnt % 2000 == 0)) {
            print_summary(solved_grid_cnt, grid_cnt, start);
        }
    };

    if (optind < argc) {
        for (int i = optind; i < argc; i++) {
            run(argv[i]);
        }
    } else {
        char grid_str[1024] = "";
        while (scanf(" %1023s", grid_str) == 1) {
            run(grid_str);
        }
    }

    print_summary(solved_grid_cnt, grid_cnt, start);

    if (trace_out && fclose(trace_out) != 0) {
        fprintf(stderr, "can't close trace file %s\n", opts.trace_file);
        return 1;
    }

    return io_ok ? 0 : 1;
}
