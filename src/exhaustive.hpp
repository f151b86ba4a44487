#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "steps.hpp"
#include "structures.hpp"

// ==================== Exhaustive optimizer ====================

struct ExhaustiveSolution {
    Tour tour;       // starts at index 0
    double distance; // closed tour length
};

// Exact optimum by enumerating the (n-1)! tours that start at point 0, with
// best-so-far pruning. The lexicographically first optimal tour is returned.
// Returns std::nullopt when the instance has more than maxPoints points.
std::optional<ExhaustiveSolution> exhaustiveTour(const std::vector<GridPoint>& points,
                                                 size_t maxPoints = kExhaustiveMaxPoints);

// Progressive form: a starting step, one step per strictly better tour found,
// and a final step with the optimum. Steps are handed to the sink as they are
// found; an infeasible instance yields a single step with feasible == false.
void exhaustiveTourSteps(const std::vector<GridPoint>& points, const StepSink& sink,
                         size_t maxPoints = kExhaustiveMaxPoints);

StepTrace exhaustiveTourSteps(const std::vector<GridPoint>& points,
                              size_t maxPoints = kExhaustiveMaxPoints);

// Single step stating the optimal distance, or the infeasibility
StepTrace exhaustiveVerificationSteps(const std::vector<GridPoint>& points,
                                      size_t maxPoints = kExhaustiveMaxPoints);

// tourDistance / optimalDistance; 1 when both are 0, infinity when only the
// optimum is 0
double optimalityRatio(double tourDistance, double optimalDistance);

// n! as an unsigned 64-bit count (exact up to 20!)
uint64_t factorial(size_t n);
