#pragma once

#include <string>
#include <vector>

#include "structures.hpp"

// ==================== Lower bound ====================

struct LowerBound {
    double value;
    std::string method;
};

struct OptimalityVerdict {
    bool isOptimal;
    double lowerBound;
    double gap;          // tourDistance - lowerBound
    double relativeGap;  // tourDistance / lowerBound - 1, 0 when the bound is 0
    double gapPercent;   // relativeGap in percent
    std::string method;
};

// Weight of the minimum spanning tree over the given vertices of a full
// distance matrix (Prim, O(k^2)).
double mstWeight(const std::vector<std::vector<double>>& dist, const std::vector<size_t>& vertices);

// 1-tree bound: MST over vertices 1..n-1 plus the two cheapest edges from
// vertex 0. Never exceeds the length of any tour over the same points.
LowerBound oneTreeBound(const std::vector<GridPoint>& points);

// Compare a tour length with the 1-tree bound. The tour is proven optimal
// when it is within kImproveEpsilon of the bound.
OptimalityVerdict verifyOptimality(double tourDistance, const std::vector<GridPoint>& points);
