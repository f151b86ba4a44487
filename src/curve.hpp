#pragma once

#include <array>
#include <string>
#include <vector>

#include "structures.hpp"

// ==================== Moore curve engine ====================

// Grid sizes the curve operations accept; anything else is snapped.
constexpr std::array<int, 6> kValidGridSizes = {2, 4, 8, 16, 32, 64};

// Snap an arbitrary positive grid size to the nearest supported size.
// Halfway values go to the larger size; everything is clamped to 2..64.
int snapGridSize(int grid);

// Grid the curve engine actually covers: 1 for grids <= 1, otherwise the
// snapped size.
int curveGridSize(int grid);

// Number of L-system rewrites for a grid: k iterations yield 4^(k+1)
// vertices on a 2^(k+1) grid, so a grid of size g needs log2(g) - 1.
int curveIterations(int grid);

// Curve order (log2 of the snapped grid), 0 for grids of size <= 1
int curveOrder(int grid);

// Expand the Moore L-system (axiom LFL+F+LFL) the given number of times.
std::string mooreLSystem(int iterations);

// Interpret an L-system string with a turtle starting at the origin facing
// up. Returns the start position followed by the position after every F.
std::vector<CurveVertex> turtlePath(const std::string& commands);

// Shift and scale a raw path onto integer coordinates 0..grid-1. An axis
// with zero extent collapses to 0.
std::vector<CurveVertex> normalizeToGrid(const std::vector<CurveVertex>& path, int grid);

// Closed Moore curve covering the (snapped) grid. Grids <= 1 yield the single
// vertex (0, 0). Results are cached per grid size.
std::vector<CurveVertex> mooreCurve(int grid);
