#include "benchmark.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <iomanip>
#include <numeric>
#include <random>

TimingStats summarizeTimings(const std::vector<double>& values) {
    const double n = static_cast<double>(values.size());
    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;

    double variance = 0.0;
    for (double v : values) variance += (v - mean) * (v - mean);
    variance /= n;

    auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    return {mean, std::sqrt(variance), *lo, *hi};
}

// Run fn `runs` times; fn returns the tour length it produced
static BenchmarkRow measure(size_t size, const std::string& name, int runs,
                            const std::function<double()>& fn) {
    std::vector<double> times;
    times.reserve(runs);
    double distanceSum = 0.0;

    for (int r = 0; r < runs; ++r) {
        auto startTime = std::chrono::high_resolution_clock::now();
        distanceSum += fn();
        auto endTime = std::chrono::high_resolution_clock::now();
        times.push_back(std::chrono::duration<double, std::milli>(endTime - startTime).count());
    }

    return {size, name, summarizeTimings(times), distanceSum / runs};
}

std::vector<BenchmarkRow> runBenchmark(const Settings& settings, std::ostream& log) {
    std::vector<size_t> sizes = settings.benchmarkSizes;
    if (sizes.empty()) sizes = {10, 25, 50, 100, 200};
    const int runs = std::max(1, settings.benchmarkRuns);
    const int grid = snapGridSize(settings.gridSize);

    std::mt19937 gen(settings.seed != 0 ? settings.seed : std::random_device{}());

    std::vector<BenchmarkRow> rows;
    log << "Benchmark: grid " << grid << ", " << runs << " runs per size\n";

    for (size_t size : sizes) {
        std::vector<GridPoint> points = generateRandomPoints(grid, size, gen);
        const Tour sweep = sweepTour(points).tour;
        const Tour curve = curveTour(points, grid).tour;

        rows.push_back(measure(points.size(), "sweep", runs, [&] {
            return tourLength(sweepTour(points).tour, points);
        }));
        rows.push_back(measure(points.size(), "curve", runs, [&] {
            return tourLength(curveTour(points, grid).tour, points);
        }));
        rows.push_back(measure(points.size(), "two-opt", runs, [&] {
            return tourLength(twoOpt(points, curve, settings.maxIterations).tour, points);
        }));
        rows.push_back(measure(points.size(), "pair-swap", runs, [&] {
            return tourLength(pairSwap(points, sweep, settings.maxIterations).tour, points);
        }));
    }

    log << std::fixed << std::setprecision(3);
    for (const auto& row : rows) {
        log << "n=" << row.size << " " << row.algorithm
            << ": mean " << row.timeMs.mean << " ms"
            << " (sd " << row.timeMs.stdDev << ", min " << row.timeMs.min
            << ", max " << row.timeMs.max << "), distance " << row.meanDistance << "\n";
    }
    return rows;
}
