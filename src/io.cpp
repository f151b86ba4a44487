#include "io.hpp"
#include "geometry.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::vector<GridPoint> readPoints(const std::string& filename) {
    std::vector<GridPoint> points;
    std::ifstream infile(filename);
    if (!infile) throw std::runtime_error("Cannot open file: " + filename);

    std::string line;
    size_t lineNo = 0;
    while (std::getline(infile, line)) {
        ++lineNo;
        auto start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos || line[start] == '#') continue;

        std::istringstream iss(line);
        int x, y;
        if (!(iss >> x >> y)) {
            throw std::runtime_error(filename + ":" + std::to_string(lineNo) + ": expected 'x y'");
        }
        if (x < 0 || y < 0) {
            throw std::runtime_error(filename + ":" + std::to_string(lineNo) + ": negative coordinate");
        }
        points.emplace_back(x, y, points.size());
    }
    return points;
}

void writeTour(const std::string& filename, const std::vector<GridPoint>& points, const Tour& tour) {
    std::ofstream outFile(filename);
    if (!outFile) throw std::runtime_error("Failed to open output file: " + filename);

    outFile << std::fixed << std::setprecision(4);
    outFile << tourLength(tour, points) << "\n";
    for (size_t idx : tour) {
        outFile << points[idx].x << " " << points[idx].y << "\n";
    }
}

void writeTrace(const std::string& filename, const std::vector<GridPoint>& points, const StepTrace& trace) {
    std::ofstream outFile(filename);
    if (!outFile) throw std::runtime_error("Failed to open trace file: " + filename);

    outFile << std::fixed << std::setprecision(4);
    for (const Step& step : trace) {
        outFile << stepKind(step) << "\t" << stepDistance(step, points) << "\t"
                << stepDescription(step) << "\n";
    }
}
