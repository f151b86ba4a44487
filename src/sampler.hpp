#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "structures.hpp"

// ==================== Random instances ====================

// Sample up to `count` distinct points with coordinates in 0..grid-1 and
// sequential ids from 0. Requests beyond the grid capacity (grid * grid) are
// clamped.
std::vector<GridPoint> generateRandomPoints(int grid, size_t count, std::mt19937& gen);

// Same with a seeded generator; seed 0 draws the seed from std::random_device.
std::vector<GridPoint> generateRandomPoints(int grid, size_t count, uint32_t seed = 0);
