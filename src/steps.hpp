#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "structures.hpp"

// ==================== Progressive steps ====================

/*
* A progressive operation reports its intermediate states as Steps.
* Every alternative carries a snapshot of the tour built so far (possibly
* empty) and a human readable description; the rest is specific to the
* operation that emitted it. Steps are values and are never mutated after
* emission.
*/

// One point appended by the radial sweep
struct SweepStep {
    Tour tour;
    std::string description;
    double angle;   // raw atan2 angle around the centroid, radians
    Point centroid;
};

// The generated curve, emitted once before the first VisitStep
struct CurveStep {
    Tour tour;
    std::string description;
    std::vector<CurveVertex> curve;
    int order; // log2 of the grid
    int grid;
};

// One point appended in curve order
struct VisitStep {
    Tour tour;
    std::string description;
    size_t curvePosition;
    double curveProgress; // percent along the curve
};

// 2-opt move: tour positions first..last (inclusive) were reversed
struct SegmentReversal {
    size_t first;
    size_t last;
};

// Adjacent pair move: points u and v exchanged their positions
struct PairSwap {
    size_t u;
    size_t v;
};

// std::monostate marks the "no improvement found" sentinel
typedef std::variant<std::monostate, SegmentReversal, PairSwap> Move;

struct OptimizeStep {
    Tour tour;
    std::string description;
    Move move;
    double improvement;
};

// Exhaustive search progress; feasible == false carries no tour
struct SolutionStep {
    Tour tour;
    std::string description;
    double distance;
    bool feasible;
};

typedef std::variant<SweepStep, CurveStep, VisitStep, OptimizeStep, SolutionStep> Step;
typedef std::vector<Step> StepTrace;

// Receives steps in emission order. Progressive operations that would
// materialize very long traces accept a sink instead.
typedef std::function<void(const Step&)> StepSink;

// Tour snapshot of any step
const Tour& stepTour(const Step& step);

// Description of any step
const std::string& stepDescription(const Step& step);

// Short tag: "sweep", "curve", "visit", "optimize" or "solution"
std::string stepKind(const Step& step);

// Closed length of the step's tour snapshot
double stepDistance(const Step& step, const std::vector<GridPoint>& points);

// Tour of the last step, or an empty tour for an empty trace
Tour finalTour(const StepTrace& trace);

// Sentinel an improver's caller shows when the improver returned an empty
// trace. With a known optimal distance the description compares against it,
// otherwise against the 1-tree lower bound.
OptimizeStep noImprovementStep(const std::vector<GridPoint>& points,
                               const Tour& tour,
                               const std::string& methodLabel,
                               std::optional<double> optimalDistance = std::nullopt);

// Fixed-point formatting used by step descriptions
std::string formatFixed(double value, int precision);
