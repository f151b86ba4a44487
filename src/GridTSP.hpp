#pragma once

#include <optional>
#include <string>
#include <vector>

#include "structures.hpp"
#include "geometry.hpp"
#include "steps.hpp"
#include "curve.hpp"
#include "construct.hpp"
#include "improve.hpp"
#include "exhaustive.hpp"
#include "bound.hpp"
#include "sampler.hpp"

// ==================== Pipeline ====================

enum class Constructor { Sweep, Curve, Exhaustive };
enum class Optimizer { None, TwoOpt, PairSwap, Combined };

struct PipelineOptions {
    Constructor constructor = Constructor::Curve;
    Optimizer optimizer = Optimizer::Combined;
    int grid = 16;
    int maxIterations = kCombinedMaxIterations;
    int maxRounds = kCombinedMaxRounds;
    bool recordTrace = false;
};

struct PipelineResult {
    bool feasible;          // false only when the exhaustive constructor refused
    Tour tour;
    double initialDistance; // length after construction
    double distance;        // length after improvement
    double improvement;
    OptimalityVerdict verdict;
    StepTrace trace;        // construction steps then improvement steps
};

// Construct a tour, improve it and check it against the 1-tree bound.
PipelineResult solveInstance(const std::vector<GridPoint>& points, const PipelineOptions& options);

std::optional<Constructor> parseConstructor(const std::string& name);
std::optional<Optimizer> parseOptimizer(const std::string& name);
std::string constructorName(Constructor constructor);
std::string optimizerName(Optimizer optimizer);
