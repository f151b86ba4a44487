#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "settings.hpp"

// ==================== Benchmarks ====================

struct TimingStats {
    double mean;
    double stdDev; // population standard deviation
    double min;
    double max;
};

struct BenchmarkRow {
    size_t size;
    std::string algorithm;
    TimingStats timeMs;
    double meanDistance;
};

// Statistics over a non-empty list of samples
TimingStats summarizeTimings(const std::vector<double>& values);

// Time the constructors and improvers over random instances of every
// configured size and log one line per algorithm and size.
std::vector<BenchmarkRow> runBenchmark(const Settings& settings, std::ostream& log);
