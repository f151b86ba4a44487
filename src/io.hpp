#pragma once

#include <string>
#include <vector>

#include "steps.hpp"
#include "structures.hpp"

// ==================== Point and tour files ====================

// Read "x y" lines into grid points with sequential ids. Blank lines and
// lines starting with '#' are skipped. Throws std::runtime_error when the
// file cannot be opened or a line is malformed.
std::vector<GridPoint> readPoints(const std::string& filename);

// Write the tour length on the first line, then the visited points in order.
void writeTour(const std::string& filename, const std::vector<GridPoint>& points, const Tour& tour);

// One line per step: kind, tour length and description, tab separated.
void writeTrace(const std::string& filename, const std::vector<GridPoint>& points, const StepTrace& trace);
