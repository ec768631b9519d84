// Copyright rafirafi 2018
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "topology.h"

#include <cassert>

#include <algorithm>

std::vector<std::vector<int> > build_units()
{
    std::vector<std::vector<int> > units;
    units.reserve(kUnits);

    for (int row = 0; row < kSide; row++) {
        units.push_back(std::vector<int>());
        for (int col = 0; col < kSide; col++) {
            units.back().push_back(row * kSide + col);
        }
    }
    for (int col = 0; col < kSide; col++) {
        units.push_back(std::vector<int>());
        for (int row = 0; row < kSide; row++) {
            units.back().push_back(row * kSide + col);
        }
    }
    for (int box = 0; box < kSide; box++) {
        int col_beg = (box % kBoxSide) * kBoxSide;
        int row_beg = (box / kBoxSide) * kBoxSide;
        units.push_back(std::vector<int>());
        for (int idx = 0; idx < kSide; idx++) {
            int col = col_beg + idx % kBoxSide;
            int row = row_beg + idx / kBoxSide;
            units.back().push_back(row * kSide + col);
        }
    }
    // A1 -> I9
    units.push_back(std::vector<int>());
    for (int i = 0; i < kSide; i++) {
        units.back().push_back(i * kSide + i);
    }
    // I1 -> A9
    units.push_back(std::vector<int>());
    for (int i = 0; i < kSide; i++) {
        units.back().push_back((kSide - 1 - i) * kSide + i);
    }

    assert((int)units.size() == kUnits);
    return units;
}

/**************************************************************************************************/

topology::topology()
    : units_(build_units()),
      units_of_(kCells),
      peers_(kCells)
{
    for (int u = 0; u < kUnits; u++) {
        for (int cell : units_[u]) {
            units_of_[cell].push_back(u);
        }
    }

    for (int cell = 0; cell < kCells; cell++) {
        std::vector<bool> seen(kCells, false);
        for (int u : units_of_[cell]) {
            for (int other : units_[u]) {
                seen[other] = true;
            }
        }
        seen[cell] = false;
        for (int other = 0; other < kCells; other++) {
            if (seen[other]) {
                peers_[cell].push_back(other);
            }
        }
    }
}

bool topology::is_peer(int cell, int other) const
{
    const std::vector<int> &peers = peers_[cell];
    return std::binary_search(peers.begin(), peers.end(), other);
}

const topology &get_topology()
{
    static const topology topo;
    return topo;
}

/**************************************************************************************************/

std::string cell_name(int cell)
{
    assert(cell >= 0 && cell < kCells);
    std::string name;
    name += kRowNames[cell / kSide];
    name += kColNames[cell % kSide];
    return name;
}

int cell_index(const std::string &name)
{
    if (name.size() != 2) {
        return kNA;
    }
    char row = name[0], col = name[1];
    if (row >= 'a' && row <= 'i') {
        row = row - 'a' + 'A';
    }
    if (row < 'A' || row > 'I' || !is_digit_char(col)) {
        return kNA;
    }
    return (row - 'A') * kSide + (col - '1');
}
