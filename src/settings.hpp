#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "GridTSP.hpp"

// Driver settings, read from a plain "key value" file
struct Settings {
    std::vector<std::filesystem::path> inputFiles; // empty = sample numPoints points
    std::filesystem::path outputDir = "./output";
    std::optional<std::filesystem::path> logFile; // optional log file
    int gridSize = 16;
    size_t numPoints = 20;
    uint32_t seed = 0; // 0 = nondeterministic
    Constructor constructor = Constructor::Curve;
    Optimizer optimizer = Optimizer::Combined;
    int maxIterations = kCombinedMaxIterations;
    int maxRounds = kCombinedMaxRounds;
    bool writeTrace = false;
    bool benchmark = false;
    std::vector<size_t> benchmarkSizes; // empty = default sizes
    int benchmarkRuns = 5;
};

// Read settings from a file. A missing file yields the defaults; a malformed
// value throws std::runtime_error naming the line.
Settings loadSettings(const std::string& settingsFile);

// Options of the solving pipeline implied by the settings
PipelineOptions pipelineOptions(const Settings& settings);

// Human readable summary of the run the settings describe
void printSettings(const Settings& settings, std::ostream& out);
