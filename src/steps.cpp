#include "steps.hpp"
#include "bound.hpp"
#include "exhaustive.hpp"
#include "geometry.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

const Tour& stepTour(const Step& step) {
    return std::visit([](const auto& s) -> const Tour& { return s.tour; }, step);
}

const std::string& stepDescription(const Step& step) {
    return std::visit([](const auto& s) -> const std::string& { return s.description; }, step);
}

// One tag per Step alternative
struct StepKindName {
    std::string operator()(const SweepStep&) const { return "sweep"; }
    std::string operator()(const CurveStep&) const { return "curve"; }
    std::string operator()(const VisitStep&) const { return "visit"; }
    std::string operator()(const OptimizeStep&) const { return "optimize"; }
    std::string operator()(const SolutionStep&) const { return "solution"; }
};

std::string stepKind(const Step& step) {
    return std::visit(StepKindName{}, step);
}

double stepDistance(const Step& step, const std::vector<GridPoint>& points) {
    return tourLength(stepTour(step), points);
}

Tour finalTour(const StepTrace& trace) {
    if (trace.empty()) return {};
    return stepTour(trace.back());
}

OptimizeStep noImprovementStep(const std::vector<GridPoint>& points,
                               const Tour& tour,
                               const std::string& methodLabel,
                               std::optional<double> optimalDistance) {
    double dist = tourLength(tour, points);
    std::string description;

    if (optimalDistance && std::abs(dist - *optimalDistance) < kImproveEpsilon) {
        description = methodLabel + ": Tour is already optimal (verified)";
    } else if (optimalDistance) {
        double ratio = optimalityRatio(dist, *optimalDistance);
        description = methodLabel + ": No improvements found (" +
                      formatFixed((ratio - 1.0) * 100.0, 1) + "% above optimal)";
    } else {
        OptimalityVerdict verdict = verifyOptimality(dist, points);
        if (verdict.isOptimal) {
            description = methodLabel + ": Tour is already optimal (verified by " +
                          verdict.method + " bound)";
        } else {
            description = methodLabel + ": No improvements found (" +
                          formatFixed(verdict.gapPercent, 1) + "% above lower bound)";
        }
    }

    return OptimizeStep{tour, description, std::monostate{}, 0.0};
}

std::string formatFixed(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}
