#pragma once

#include <vector>

#include "steps.hpp"
#include "structures.hpp"

// ==================== Tour improvers ====================

/*
* Both local searches are first-improvement searches bounded by an iteration
* cap. A move is accepted only if it shortens the tour by more than
* kImproveEpsilon, so the tour length never increases. Tours with fewer than
* four points are returned unchanged with an empty trace.
*
* When a sink is given, every accepted move is reported as an OptimizeStep
* right after it is applied. The ...Steps variants collect these steps.
*/

struct ImproveResult {
    Tour tour;
    double improvement; // total length removed from the input tour
};

// 2-opt: reverse tour[i+1..j] when reconnecting edges (i,i+1) and (j,j+1)
// shortens the tour. The scan restarts after every accepted move.
ImproveResult twoOpt(const std::vector<GridPoint>& points, const Tour& tour,
                     int maxIterations = kTwoOptMaxIterations,
                     const StepSink& sink = nullptr);

StepTrace twoOptSteps(const std::vector<GridPoint>& points, const Tour& tour,
                      int maxIterations = kTwoOptMaxIterations);

// Adjacent pair swap ("zigzag"): exchange the points at positions i+1 and i+2
// when that shortens the tour, and keep scanning.
ImproveResult pairSwap(const std::vector<GridPoint>& points, const Tour& tour,
                       int maxIterations = kPairSwapMaxIterations,
                       const StepSink& sink = nullptr);

StepTrace pairSwapSteps(const std::vector<GridPoint>& points, const Tour& tour,
                        int maxIterations = kPairSwapMaxIterations);

// Alternate pair swap and 2-opt passes until a round improves nothing or the
// round cap is reached. maxIterations caps every single pass.
ImproveResult combinedOpt(const std::vector<GridPoint>& points, const Tour& tour,
                          int maxRounds = kCombinedMaxRounds,
                          int maxIterations = kCombinedMaxIterations,
                          const StepSink& sink = nullptr);

StepTrace combinedOptSteps(const std::vector<GridPoint>& points, const Tour& tour,
                           int maxRounds = kCombinedMaxRounds,
                           int maxIterations = kCombinedMaxIterations);
