#ifndef DIAGSOLVER_DEFS_H
#define DIAGSOLVER_DEFS_H

// Copyright rafirafi 2018
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

static const constexpr int kNA = -1;

static const constexpr int kBoxSide = 3;                 // D
static const constexpr int kSide = kBoxSide * kBoxSide;  // N
static const constexpr int kCells = kSide * kSide;       // NN

// rows, cols, boxes, 2 diagonals
static const constexpr int kUnits = 3 * kSide + 2;

static const constexpr char kRowNames[] = "ABCDEFGHI";
static const constexpr char kColNames[] = "123456789";
static const constexpr char kAllDigits[] = "123456789";

inline bool is_digit_char(const char c)
{
    return c >= '1' && c <= '9';
}

#endif // DIAGSOLVER_DEFS_H
