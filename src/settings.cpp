#include "settings.hpp"

#include <fstream>
#include <iostream>
#include <ostream>
#include <sstream>
#include <stdexcept>

// Parse the value of `key` on line `lineNo`, failing loudly on junk
template <typename T>
static T readValue(std::istringstream& iss, const std::string& key, size_t lineNo) {
    T value;
    if (!(iss >> value)) {
        throw std::runtime_error("settings line " + std::to_string(lineNo) +
                                 ": missing or invalid value for '" + key + "'");
    }
    return value;
}

// Unsigned values; a leading minus sign is an error rather than a wrapped count
template <typename T>
static T readUnsigned(std::istringstream& iss, const std::string& key, size_t lineNo) {
    iss >> std::ws;
    if (iss.peek() == '-') {
        throw std::runtime_error("settings line " + std::to_string(lineNo) +
                                 ": negative value for '" + key + "'");
    }
    return readValue<T>(iss, key, lineNo);
}

Settings loadSettings(const std::string& settingsFile) {
    Settings s;
    std::ifstream in(settingsFile);
    if (!in) {
        std::cerr << "No settings file found. Using defaults." << std::endl;
        return s;
    }

    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key) || key[0] == '#') continue;

        if (key == "inputFile") {
            s.inputFiles.emplace_back(readValue<std::string>(iss, key, lineNo));
        } else if (key == "outputDir") {
            s.outputDir = readValue<std::string>(iss, key, lineNo);
        } else if (key == "logFile") {
            s.logFile = readValue<std::string>(iss, key, lineNo);
        } else if (key == "gridSize") {
            s.gridSize = readValue<int>(iss, key, lineNo);
        } else if (key == "numPoints") {
            s.numPoints = readUnsigned<size_t>(iss, key, lineNo);
        } else if (key == "seed") {
            s.seed = readUnsigned<uint32_t>(iss, key, lineNo);
        } else if (key == "constructor") {
            std::string name = readValue<std::string>(iss, key, lineNo);
            auto constructor = parseConstructor(name);
            if (!constructor) {
                throw std::runtime_error("settings line " + std::to_string(lineNo) +
                                         ": unknown constructor '" + name + "'");
            }
            s.constructor = *constructor;
        } else if (key == "optimizer") {
            std::string name = readValue<std::string>(iss, key, lineNo);
            auto optimizer = parseOptimizer(name);
            if (!optimizer) {
                throw std::runtime_error("settings line " + std::to_string(lineNo) +
                                         ": unknown optimizer '" + name + "'");
            }
            s.optimizer = *optimizer;
        } else if (key == "maxIterations") {
            s.maxIterations = readValue<int>(iss, key, lineNo);
        } else if (key == "maxRounds") {
            s.maxRounds = readValue<int>(iss, key, lineNo);
        } else if (key == "writeTrace") {
            s.writeTrace = readValue<int>(iss, key, lineNo) != 0;
        } else if (key == "benchmark") {
            s.benchmark = readValue<int>(iss, key, lineNo) != 0;
        } else if (key == "benchmarkSize") {
            s.benchmarkSizes.push_back(readUnsigned<size_t>(iss, key, lineNo));
        } else if (key == "benchmarkRuns") {
            s.benchmarkRuns = readValue<int>(iss, key, lineNo);
        }
    }
    return s;
}

void printSettings(const Settings& settings, std::ostream& out) {
    const PipelineOptions options = pipelineOptions(settings);
    out << "gridtsp settings:\n";
    if (settings.benchmark) {
        out << "  mode: benchmark, " << settings.benchmarkRuns << " runs per size\n";
    } else if (settings.inputFiles.empty()) {
        out << "  instances: " << settings.numPoints << " random points, seed "
            << (settings.seed != 0 ? std::to_string(settings.seed) : std::string("random")) << "\n";
    } else {
        out << "  instances: " << settings.inputFiles.size() << " point file(s)\n";
        for (const auto& f : settings.inputFiles) out << "    " << f.string() << "\n";
    }
    out << "  grid: " << settings.gridSize << " -> " << options.grid << "\n"
        << "  pipeline: " << constructorName(options.constructor) << " + "
        << optimizerName(options.optimizer) << "\n"
        << "  caps: " << options.maxIterations << " iterations per pass, "
        << options.maxRounds << " combined rounds\n"
        << "  output: " << settings.outputDir.string()
        << (settings.writeTrace ? " (tours and traces)" : " (tours)") << "\n"
        << "  log: " << (settings.logFile ? settings.logFile->string() : std::string("stdout")) << "\n";
}

PipelineOptions pipelineOptions(const Settings& settings) {
    PipelineOptions options;
    options.constructor = settings.constructor;
    options.optimizer = settings.optimizer;
    options.grid = snapGridSize(settings.gridSize);
    options.maxIterations = settings.maxIterations;
    options.maxRounds = settings.maxRounds;
    options.recordTrace = settings.writeTrace;
    return options;
}
