// Copyright rafirafi 2018
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "propagation.h"

#include <cassert>

#include <vector>

#include "topology.h"

void assign_value(board &values, int cell, const std::string &digits, assignment_trace *trace)
{
    assert(cell >= 0 && cell < kCells);
    values.set(cell, digits);

    if (trace && digits.size() == 1) {
        trace->record(values);
    }
}

std::string remove_digits(const std::string &digits, const std::string &removed)
{
    std::string result;
    for (char c : digits) {
        if (removed.find(c) == std::string::npos) {
            result += c;
        }
    }
    return result;
}

/**************************************************************************************************/

void eliminate(board &values, assignment_trace *trace)
{
    const topology &topo = get_topology();

    for (int cell = 0; cell < kCells; cell++) {
        if (values[cell].size() != 1) {
            continue;
        }
        // copy, values[cell] may not outlive the assignments below
        const std::string digit = values[cell];
        for (int peer : topo.peers_of(cell)) {
            if (values[peer].find(digit[0]) == std::string::npos) {
                continue;
            }
            assign_value(values, peer, remove_digits(values[peer], digit), trace);
        }
    }
}

void only_choice(board &values, assignment_trace *trace)
{
    const board snapshot = values;

    for (auto &unit : get_topology().units()) {
        for (int d = 0; d < kSide; d++) {
            const char digit = kAllDigits[d];
            int place = kNA, nb_places = 0;
            for (int cell : unit) {
                if (snapshot[cell].find(digit) != std::string::npos) {
                    place = cell;
                    nb_places++;
                }
            }
            if (nb_places != 1 || values[place] == std::string(1, digit)) {
                continue;
            }
            // another unit already forced a different digit here in this pass
            if (values[place].find(digit) == std::string::npos) {
                assign_value(values, place, std::string(), trace);
                continue;
            }
            assign_value(values, place, std::string(1, digit), trace);
        }
    }
}

void naked_twins(board &values, assignment_trace *trace)
{
    const board snapshot = values;

    for (auto &unit : get_topology().units()) {
        for (int i = 0; i < kSide; i++) {
            const std::string &pair = snapshot[unit[i]];
            if (pair.size() != 2) {
                continue;
            }
            for (int j = i + 1; j < kSide; j++) {
                if (snapshot[unit[j]] != pair) {
                    continue;
                }
                for (int k = 0; k < kSide; k++) {
                    if (k == i || k == j) {
                        continue;
                    }
                    int cell = unit[k];
                    std::string narrowed = remove_digits(values[cell], pair);
                    if (narrowed != values[cell]) {
                        assign_value(values, cell, narrowed, trace);
                    }
                }
            }
        }
    }
}

bool reduce(board &values, assignment_trace *trace)
{
    bool stalled = false;
    while (!stalled) {
        int solved_before = values.count_singletons();

        eliminate(values, trace);
        if (values.is_contradictory()) {
            return false;
        }

        only_choice(values, trace);
        if (values.is_contradictory()) {
            return false;
        }

        stalled = solved_before == values.count_singletons();
    }
    return true;
}
