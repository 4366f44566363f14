/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BOUNDARY_HPP
#define BOUNDARY_HPP

#include <cstddef>

// Corners of a drawable's bounding quad, in storage order
enum class Boundary : size_t {
  TopLeft = 0,
  TopRight = 1,
  BottomRight = 2,
  BottomLeft = 3
};

inline constexpr size_t BOUNDARY_COUNT = 4;

#endif // BOUNDARY_HPP
