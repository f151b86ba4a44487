#include "GridTSP.hpp"
#include "debug.hpp"

#include <iterator>

// Run the configured constructor; returns false when it could not produce a tour.
static bool constructTour(const std::vector<GridPoint>& points, const PipelineOptions& options,
                          Tour& tour, std::optional<double>& optimalDistance, StepTrace* trace) {
    switch (options.constructor) {
        case Constructor::Sweep:
            if (trace) {
                *trace = sweepTourSteps(points);
                tour = finalTour(*trace);
            } else {
                tour = sweepTour(points).tour;
            }
            return true;

        case Constructor::Curve:
            if (trace) {
                *trace = curveTourSteps(points, options.grid);
                tour = finalTour(*trace);
            } else {
                tour = curveTour(points, options.grid).tour;
            }
            return true;

        case Constructor::Exhaustive: {
            if (trace) {
                *trace = exhaustiveTourSteps(points);
                if (trace->empty()) return true;
                const SolutionStep& last = std::get<SolutionStep>(trace->back());
                if (!last.feasible) return false;
                tour = last.tour;
                optimalDistance = last.distance;
                return true;
            }
            std::optional<ExhaustiveSolution> solution = exhaustiveTour(points);
            if (!solution) return false;
            tour = solution->tour;
            optimalDistance = solution->distance;
            return true;
        }
    }
    return false;
}

PipelineResult solveInstance(const std::vector<GridPoint>& points, const PipelineOptions& options) {
    PipelineResult result{true, {}, 0.0, 0.0, 0.0, {}, {}};
    StepTrace* trace = options.recordTrace ? &result.trace : nullptr;

    std::optional<double> optimalDistance;
    if (!constructTour(points, options, result.tour, optimalDistance, trace)) {
        result.feasible = false;
        return result;
    }
    result.initialDistance = tourLength(result.tour, points);

    StepTrace improveSteps;
    StepSink sink = nullptr;
    if (trace) sink = [&improveSteps](const Step& step) { improveSteps.push_back(step); };

    ImproveResult improved{result.tour, 0.0};
    switch (options.optimizer) {
        case Optimizer::None:
            break;
        case Optimizer::TwoOpt:
            improved = twoOpt(points, result.tour, options.maxIterations, sink);
            break;
        case Optimizer::PairSwap:
            improved = pairSwap(points, result.tour, options.maxIterations, sink);
            break;
        case Optimizer::Combined:
            improved = combinedOpt(points, result.tour, options.maxRounds, options.maxIterations, sink);
            break;
    }

    if (trace && options.optimizer != Optimizer::None) {
        if (improveSteps.empty()) {
            improveSteps.push_back(noImprovementStep(points, improved.tour,
                                                     optimizerName(options.optimizer),
                                                     optimalDistance));
        }
        trace->insert(trace->end(), std::make_move_iterator(improveSteps.begin()),
                      std::make_move_iterator(improveSteps.end()));
    }

    result.tour = std::move(improved.tour);
    result.improvement = improved.improvement;
    result.distance = tourLength(result.tour, points);
    result.verdict = verifyOptimality(result.distance, points);

    DBG("Pipeline " << constructorName(options.constructor) << " + "
        << optimizerName(options.optimizer) << ": " << result.initialDistance
        << " -> " << result.distance);
    return result;
}

std::optional<Constructor> parseConstructor(const std::string& name) {
    if (name == "sweep") return Constructor::Sweep;
    if (name == "curve") return Constructor::Curve;
    if (name == "exhaustive") return Constructor::Exhaustive;
    return std::nullopt;
}

std::optional<Optimizer> parseOptimizer(const std::string& name) {
    if (name == "none") return Optimizer::None;
    if (name == "two-opt") return Optimizer::TwoOpt;
    if (name == "pair-swap") return Optimizer::PairSwap;
    if (name == "combined") return Optimizer::Combined;
    return std::nullopt;
}

std::string constructorName(Constructor constructor) {
    switch (constructor) {
        case Constructor::Sweep: return "sweep";
        case Constructor::Curve: return "curve";
        case Constructor::Exhaustive: return "exhaustive";
    }
    return "unknown";
}

std::string optimizerName(Optimizer optimizer) {
    switch (optimizer) {
        case Optimizer::None: return "none";
        case Optimizer::TwoOpt: return "two-opt";
        case Optimizer::PairSwap: return "pair-swap";
        case Optimizer::Combined: return "combined";
    }
    return "unknown";
}
