#pragma once

#include <optional>
#include <vector>

#include "steps.hpp"
#include "structures.hpp"

// ==================== Tour constructors ====================

struct SweepResult {
    Tour tour;
    std::optional<Point> centroid; // empty for an empty point set
};

struct CurveResult {
    Tour tour;
    std::vector<CurveVertex> curve;
    int grid; // snapped grid the curve was generated for
};

// Radial sweep: order points by polar angle around the centroid, starting
// from the "down" direction (screen coordinates) and sweeping clockwise.
// Ties keep input order.
SweepResult sweepTour(const std::vector<GridPoint>& points);

// Progressive sweep: one SweepStep per point, in tour order.
StepTrace sweepTourSteps(const std::vector<GridPoint>& points);

// For every point, the index of the nearest curve vertex (lowest index on
// ties).
std::vector<size_t> nearestCurvePositions(const std::vector<GridPoint>& points,
                                          const std::vector<CurveVertex>& curve);

// Curve projection: order points by the position of their nearest vertex on
// the Moore curve of the given grid. Points are expected on 0..grid-1.
CurveResult curveTour(const std::vector<GridPoint>& points, int grid);

// Progressive curve projection: a CurveStep, then one VisitStep per point.
StepTrace curveTourSteps(const std::vector<GridPoint>& points, int grid);
