#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "GridTSP.hpp"
#include "io.hpp"

namespace fs = std::filesystem;

static fs::path tempFile(const std::string& name) {
    return fs::temp_directory_path() / name;
}

static std::string readAll(const fs::path& file) {
    std::ifstream in(file);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

TEST_CASE("read points skips comments and blank lines", "[io]") {
    fs::path file = tempFile("gridtsp_points.txt");
    {
        std::ofstream out(file);
        out << "# square\n0 0\n\n10 0\n   # indented comment\n10 10\n0 10\n";
    }

    std::vector<GridPoint> points = readPoints(file.string());
    REQUIRE(points.size() == 4);
    REQUIRE(points[2].x == 10);
    REQUIRE(points[2].y == 10);
    for (size_t i = 0; i < points.size(); ++i) REQUIRE(points[i].id == i);

    fs::remove(file);
}

TEST_CASE("read points rejects bad input", "[io]") {
    REQUIRE_THROWS_AS(readPoints(tempFile("gridtsp_missing_points.txt").string()), std::runtime_error);

    fs::path malformed = tempFile("gridtsp_malformed_points.txt");
    {
        std::ofstream out(malformed);
        out << "1 2\nthree four\n";
    }
    REQUIRE_THROWS_AS(readPoints(malformed.string()), std::runtime_error);
    fs::remove(malformed);

    fs::path negative = tempFile("gridtsp_negative_points.txt");
    {
        std::ofstream out(negative);
        out << "1 2\n-1 4\n";
    }
    REQUIRE_THROWS_AS(readPoints(negative.string()), std::runtime_error);
    fs::remove(negative);
}

TEST_CASE("tour and trace files", "[io]") {
    std::vector<GridPoint> square = {{0, 0, 0}, {10, 0, 1}, {10, 10, 2}, {0, 10, 3}};

    fs::path tourFile = tempFile("gridtsp_square.tour");
    writeTour(tourFile.string(), square, {0, 1, 2, 3});
    REQUIRE(readAll(tourFile) == "40.0000\n0 0\n10 0\n10 10\n0 10\n");
    fs::remove(tourFile);

    fs::path traceFile = tempFile("gridtsp_square.trace");
    StepTrace trace = exhaustiveVerificationSteps(square);
    writeTrace(traceFile.string(), square, trace);
    REQUIRE(readAll(traceFile) ==
            "solution\t40.0000\tOptimal tour distance: 40.00 (verified by exhaustive search)\n");
    fs::remove(traceFile);
}
