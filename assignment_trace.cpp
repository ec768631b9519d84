// Copyright rafirafi 2018
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "assignment_trace.h"

bool write_trace(FILE *out, const assignment_trace &trace, int grid_number)
{
    for (size_t event = 0; event < trace.size(); event++) {
        const board &values = trace[event];
        if (fprintf(out, "%d %d", grid_number, (int)event) < 0) {
            return false;
        }
        for (int i = 0; i < kCells; i++) {
            const char *digits = values[i].empty() ? "-" : values[i].c_str();
            if (fprintf(out, " %s", digits) < 0) {
                return false;
            }
        }
        if (fputc('\n', out) == EOF) {
            return false;
        }
    }
    return true;
}
