#include "GridTSP.hpp"
#include "benchmark.hpp"
#include "io.hpp"
#include "settings.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

// A named point set to solve
struct Instance {
    std::string name;
    std::vector<GridPoint> points;
};

static std::vector<Instance> loadInstances(const Settings& settings, std::ostream& logStream) {
    std::vector<Instance> instances;
    if (settings.inputFiles.empty()) {
        int grid = snapGridSize(settings.gridSize);
        instances.push_back({"random", generateRandomPoints(grid, settings.numPoints, settings.seed)});
        logStream << "Sampled " << instances.back().points.size() << " points on a "
                  << grid << "x" << grid << " grid\n";
        return instances;
    }

    for (const auto& file : settings.inputFiles) {
        try {
            instances.push_back({file.stem().string(), readPoints(file.string())});
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            logStream << "Skipping input file: " << file << "\n";
        }
    }
    return instances;
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    // Load settings
    const std::string settingsFile = argc > 1 ? argv[1] : "settings.txt";
    Settings settings;
    try {
        settings = loadSettings(settingsFile);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    printSettings(settings, std::cout);

    // Run log: the configured file, else stdout
    std::ofstream logFile;
    if (settings.logFile) {
        logFile.open(*settings.logFile);
        if (!logFile) {
            std::cerr << "Cannot open log file " << *settings.logFile << ", logging to stdout\n";
        }
    }
    std::ostream& logStream = logFile.is_open() ? static_cast<std::ostream&>(logFile) : std::cout;

    if (settings.benchmark) {
        runBenchmark(settings, logStream);
        return 0;
    }

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(settings.outputDir, ec);
    if (ec) {
        std::cerr << "Failed to create output directory " << settings.outputDir << ": " << ec.message() << "\n";
        return 1;
    }
    logStream << "Output directory: " << settings.outputDir << "\n";

    const PipelineOptions options = pipelineOptions(settings);
    size_t processed = 0;

    for (const auto& instance : loadInstances(settings, logStream)) {
        logStream << "Processing instance: " << instance.name
                  << " (" << instance.points.size() << " points)\n";

        auto startTime = std::chrono::high_resolution_clock::now();

        try {
            PipelineResult result = solveInstance(instance.points, options);
            if (!result.feasible) {
                logStream << "Constructor " << constructorName(options.constructor)
                          << " cannot handle " << instance.points.size() << " points (max "
                          << kExhaustiveMaxPoints << ")\n";
                continue;
            }

            const fs::path outputFile = settings.outputDir / (instance.name + ".tour");
            writeTour(outputFile.string(), instance.points, result.tour);
            if (settings.writeTrace) {
                const fs::path traceFile = settings.outputDir / (instance.name + ".trace");
                writeTrace(traceFile.string(), instance.points, result.trace);
            }

            auto endTime = std::chrono::high_resolution_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count();

            logStream << std::fixed << std::setprecision(4);
            logStream << "Finished instance: " << instance.name
                      << " in " << duration << " ms"
                      << ", constructed=" << result.initialDistance
                      << ", distance=" << result.distance
                      << ", improvement=" << result.improvement
                      << ", " << result.verdict.method << " bound=" << result.verdict.lowerBound
                      << ", gap=" << result.verdict.gapPercent << "%"
                      << (result.verdict.isOptimal ? " (proven optimal)" : "") << "\n";
            ++processed;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            logStream << "Failed to process instance: " << instance.name << "\n";
        }
    }

    return processed > 0 ? 0 : 1;
}
