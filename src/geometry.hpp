#pragma once

#include <string>
#include <vector>

#include "structures.hpp"

// ==================== Geometry helpers ====================

// Euclidean distance between two grid points
double pointDistance(const GridPoint& a, const GridPoint& b);

// Length of the closed tour (including the edge back to the start).
// Tours with fewer than two points have length 0.
double tourLength(const Tour& tour, const std::vector<GridPoint>& points);

// Mean of the point coordinates. The point set must not be empty.
Point centroid(const std::vector<GridPoint>& points);

// Check that the tour is a permutation of 0..n-1. On failure the reason is
// written to *why when given.
bool isValidTour(const Tour& tour, size_t n, std::string* why = nullptr);

// Identity tour 0, 1, ..., n-1
Tour identityTour(size_t n);
