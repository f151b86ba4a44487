#include "improve.hpp"
#include "debug.hpp"
#include "geometry.hpp"

#include <algorithm>
#include <cassert>
#include <string>

// Called by a scan for every move it applied: the move, its gain and the
// step description.
typedef std::function<void(const Move&, double, std::string)> MoveCallback;

// Shared iteration harness. The scan walks the tour once, applies the moves
// it accepts in place and returns whether it applied any.
template <typename Scan>
static ImproveResult runLocalSearch(const std::vector<GridPoint>& points, const Tour& initial,
                                    int maxIterations, const StepSink& sink, Scan scan) {
    ImproveResult result{initial, 0.0};
    if (initial.size() < 4) return result;

    assert(isValidTour(initial, points.size()));

    MoveCallback onMove = [&](const Move& move, double gain, std::string description) {
        result.improvement += gain;
        if (sink) sink(OptimizeStep{result.tour, std::move(description), move, gain});
    };

    bool improved = true;
    int iteration = 0;
    while (improved && iteration < maxIterations) {
        ++iteration;
        improved = scan(result.tour, onMove);
    }

    DBG("Local search finished after " << iteration << " iterations, improvement "
        << result.improvement);
    return result;
}

static StepTrace collectSteps(const std::function<void(const StepSink&)>& run) {
    StepTrace steps;
    run([&steps](const Step& step) { steps.push_back(step); });
    return steps;
}

ImproveResult twoOpt(const std::vector<GridPoint>& points, const Tour& tour,
                     int maxIterations, const StepSink& sink) {
    auto scan = [&points](Tour& t, const MoveCallback& onMove) {
        const size_t n = t.size();
        for (size_t i = 0; i + 1 < n; ++i) {
            for (size_t j = i + 2; j < n; ++j) {
                // Edges (0,1) and (n-1,0) share point 0
                if (i == 0 && j == n - 1) continue;

                const GridPoint& a = points[t[i]];
                const GridPoint& b = points[t[i + 1]];
                const GridPoint& c = points[t[j]];
                const GridPoint& d = points[t[(j + 1) % n]];

                double currentDist = bg::distance(a, b) + bg::distance(c, d);
                double newDist = bg::distance(a, c) + bg::distance(b, d);

                if (newDist < currentDist - kImproveEpsilon) {
                    std::reverse(t.begin() + i + 1, t.begin() + j + 1);
                    double gain = currentDist - newDist;
                    onMove(SegmentReversal{i + 1, j}, gain,
                           "2-opt: reversed segment [" + std::to_string(i + 1) + ", " +
                           std::to_string(j) + "], saved " + formatFixed(gain, 2) + " units");
                    return true;
                }
            }
        }
        return false;
    };

    return runLocalSearch(points, tour, maxIterations, sink, scan);
}

StepTrace twoOptSteps(const std::vector<GridPoint>& points, const Tour& tour, int maxIterations) {
    return collectSteps([&](const StepSink& sink) { twoOpt(points, tour, maxIterations, sink); });
}

ImproveResult pairSwap(const std::vector<GridPoint>& points, const Tour& tour,
                       int maxIterations, const StepSink& sink) {
    auto scan = [&points](Tour& t, const MoveCallback& onMove) {
        const size_t n = t.size();
        bool swapped = false;
        for (size_t i = 0; i + 2 < n; ++i) {
            const GridPoint& p1 = points[t[i]];
            const GridPoint& p2 = points[t[i + 1]];
            const GridPoint& p3 = points[t[i + 2]];
            const GridPoint& p4 = points[t[(i + 3) % n]];

            // The middle edge (p2,p3) keeps its length
            double currentDist = bg::distance(p1, p2) + bg::distance(p3, p4);
            double newDist = bg::distance(p1, p3) + bg::distance(p2, p4);

            if (newDist < currentDist - kImproveEpsilon) {
                std::swap(t[i + 1], t[i + 2]);
                double gain = currentDist - newDist;
                onMove(PairSwap{t[i + 1], t[i + 2]}, gain,
                       "Pair swap: swapped points " + std::to_string(t[i + 1]) + " and " +
                       std::to_string(t[i + 2]) + ", saved " + formatFixed(gain, 2) + " units");
                swapped = true;
            }
        }
        return swapped;
    };

    return runLocalSearch(points, tour, maxIterations, sink, scan);
}

StepTrace pairSwapSteps(const std::vector<GridPoint>& points, const Tour& tour, int maxIterations) {
    return collectSteps([&](const StepSink& sink) { pairSwap(points, tour, maxIterations, sink); });
}

ImproveResult combinedOpt(const std::vector<GridPoint>& points, const Tour& tour,
                          int maxRounds, int maxIterations, const StepSink& sink) {
    ImproveResult result{tour, 0.0};
    if (tour.size() < 4) return result;

    bool improved = true;
    int round = 0;
    while (improved && round < maxRounds) {
        improved = false;
        ++round;

        ImproveResult swapPass = pairSwap(points, result.tour, maxIterations, sink);
        if (swapPass.improvement > kImproveEpsilon) {
            result.tour = std::move(swapPass.tour);
            result.improvement += swapPass.improvement;
            improved = true;
        }

        ImproveResult twoOptPass = twoOpt(points, result.tour, maxIterations, sink);
        if (twoOptPass.improvement > kImproveEpsilon) {
            result.tour = std::move(twoOptPass.tour);
            result.improvement += twoOptPass.improvement;
            improved = true;
        }
    }

    DBG("Combined optimization: " << round << " rounds, improvement " << result.improvement);
    return result;
}

StepTrace combinedOptSteps(const std::vector<GridPoint>& points, const Tour& tour,
                           int maxRounds, int maxIterations) {
    return collectSteps([&](const StepSink& sink) {
        combinedOpt(points, tour, maxRounds, maxIterations, sink);
    });
}
