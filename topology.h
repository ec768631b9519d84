#ifndef TOPOLOGY_H
#define TOPOLOGY_H

// Copyright rafirafi 2018
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <string>
#include <vector>

#include "diagsolver_defs.h"

// Cells are row-major indexes : A1 = 0, A2 = 1, ..., I9 = 80

// 9 rows, 9 columns, 9 boxes then diagonals A1->I9 and I1->A9
std::vector<std::vector<int> > build_units();

class topology {
private:
    std::vector<std::vector<int> > units_;     // kUnits units of kSide cells
    std::vector<std::vector<int> > units_of_;  // per cell, indexes into units_
    std::vector<std::vector<int> > peers_;     // per cell, ascending, cell excluded

public:
    topology();

    const std::vector<std::vector<int> > &units() const { return units_; }
    const std::vector<int> &unit(int u) const { return units_[u]; }
    const std::vector<int> &units_of(int cell) const { return units_of_[cell]; }
    const std::vector<int> &peers_of(int cell) const { return peers_[cell]; }

    bool is_peer(int cell, int other) const;
};

// built on first call, read only afterwards
const topology &get_topology();

std::string cell_name(int cell);

// "A1" -> 0, kNA if not a cell name
int cell_index(const std::string &name);

#endif // TOPOLOGY_H
