#include "exhaustive.hpp"
#include "debug.hpp"
#include "geometry.hpp"

#include <limits>
#include <string>

// Depth-first enumeration of the tours 0, p1, ..., p(n-1). Candidates are
// tried in increasing index order, so tours are visited lexicographically and
// the first tour reaching the optimum is the lexicographically first one.
struct PermutationSearch {
    // Partial sums within this margin of the incumbent count as ties
    static constexpr double tieTolerance = 1e-9;

    std::vector<std::vector<double>> dist;
    Tour path;
    std::vector<bool> used;
    Tour bestTour;
    double bestDistance = std::numeric_limits<double>::infinity();
    uint64_t checked = 0;
    std::function<void(const PermutationSearch&)> onImprove;

    explicit PermutationSearch(const std::vector<GridPoint>& points)
        : dist(points.size(), std::vector<double>(points.size(), 0.0)),
          path(points.size(), 0),
          used(points.size(), false) {
        for (size_t i = 0; i < points.size(); ++i) {
            for (size_t j = i + 1; j < points.size(); ++j) {
                dist[i][j] = dist[j][i] = bg::distance(points[i], points[j]);
            }
        }
    }

    void run() {
        path[0] = 0;
        used[0] = true;
        extend(1, 0.0);
    }

    void extend(size_t depth, double partial) {
        const size_t n = path.size();
        if (depth == n) {
            ++checked;
            double total = partial + dist[path[n - 1]][0];
            if (total < bestDistance - tieTolerance) {
                bestDistance = total;
                bestTour = path;
                if (onImprove) onImprove(*this);
            }
            return;
        }

        for (size_t v = 1; v < n; ++v) {
            if (used[v]) continue;

            double next = partial + dist[path[depth - 1]][v];
            if (next >= bestDistance - tieTolerance) {
                // Every completion of this prefix is at least as long
                checked += factorial(n - depth - 1);
                continue;
            }

            used[v] = true;
            path[depth] = v;
            extend(depth + 1, next);
            used[v] = false;
        }
    }
};

uint64_t factorial(size_t n) {
    uint64_t result = 1;
    for (size_t i = 2; i <= n; ++i) result *= i;
    return result;
}

double optimalityRatio(double tourDistance, double optimalDistance) {
    if (optimalDistance == 0.0) {
        return tourDistance == 0.0 ? 1.0 : std::numeric_limits<double>::infinity();
    }
    return tourDistance / optimalDistance;
}

std::optional<ExhaustiveSolution> exhaustiveTour(const std::vector<GridPoint>& points,
                                                 size_t maxPoints) {
    const size_t n = points.size();
    if (n <= 1) {
        return ExhaustiveSolution{n == 1 ? Tour{0} : Tour{}, 0.0};
    }
    if (n == 2) {
        return ExhaustiveSolution{{0, 1}, 2 * pointDistance(points[0], points[1])};
    }
    if (n > maxPoints) {
        DBG("Exhaustive search refused: " << n << " points (max " << maxPoints << ")");
        return std::nullopt;
    }

    PermutationSearch search(points);
    search.run();

    DBG("Exhaustive search: " << search.checked << " permutations, best " << search.bestDistance);
    return ExhaustiveSolution{std::move(search.bestTour), search.bestDistance};
}

void exhaustiveTourSteps(const std::vector<GridPoint>& points, const StepSink& sink,
                         size_t maxPoints) {
    const size_t n = points.size();
    if (n == 0) return;

    if (n == 1) {
        sink(SolutionStep{{0}, "Single point, trivial tour", 0.0, true});
        return;
    }

    if (n == 2) {
        double d = 2 * pointDistance(points[0], points[1]);
        sink(SolutionStep{{0, 1}, "Optimal tour found: distance " + formatFixed(d, 2), d, true});
        return;
    }

    if (n > maxPoints) {
        sink(SolutionStep{{}, "Too many points (" + std::to_string(n) +
                              ") for exhaustive search (max " + std::to_string(maxPoints) + ")",
                          0.0, false});
        return;
    }

    const uint64_t totalPermutations = factorial(n - 1);
    sink(SolutionStep{{}, "Progress: 0% | Starting exhaustive search over " +
                              std::to_string(totalPermutations) + " permutations",
                      0.0, true});

    size_t improvements = 0;
    PermutationSearch search(points);
    search.onImprove = [&](const PermutationSearch& s) {
        ++improvements;
        double progress = static_cast<double>(s.checked) / totalPermutations * 100.0;
        sink(SolutionStep{s.bestTour,
                          "Progress: " + formatFixed(progress, 1) + "% | Improvement #" +
                              std::to_string(improvements) + ": distance " +
                              formatFixed(s.bestDistance, 2) + " (checked " +
                              std::to_string(s.checked) + ")",
                          s.bestDistance, true});
    };
    search.run();

    sink(SolutionStep{search.bestTour,
                      "Progress: 100% | Optimal tour: distance " + formatFixed(search.bestDistance, 2) +
                          " (" + std::to_string(search.checked) + " permutations)",
                      search.bestDistance, true});
}

StepTrace exhaustiveTourSteps(const std::vector<GridPoint>& points, size_t maxPoints) {
    StepTrace steps;
    exhaustiveTourSteps(points, [&steps](const Step& step) { steps.push_back(step); }, maxPoints);
    return steps;
}

StepTrace exhaustiveVerificationSteps(const std::vector<GridPoint>& points, size_t maxPoints) {
    std::optional<ExhaustiveSolution> result = exhaustiveTour(points, maxPoints);
    if (!result) {
        return {SolutionStep{{}, "Too many points (" + std::to_string(points.size()) +
                                     ") for exhaustive verification (max " +
                                     std::to_string(maxPoints) + ")",
                             0.0, false}};
    }

    return {SolutionStep{result->tour,
                         "Optimal tour distance: " + formatFixed(result->distance, 2) +
                             " (verified by exhaustive search)",
                         result->distance, true}};
}
