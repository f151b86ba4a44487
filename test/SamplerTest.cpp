#include <catch2/catch.hpp>

#include <algorithm>
#include <set>
#include <utility>

#include "sampler.hpp"

TEST_CASE("sampled points are distinct and on the grid", "[sampler]") {
    for (int grid : {2, 8, 16, 64}) {
        std::vector<GridPoint> points = generateRandomPoints(grid, 50, 42u);
        CAPTURE(grid);

        const size_t expected = std::min<size_t>(50, static_cast<size_t>(grid * grid));
        REQUIRE(points.size() == expected);

        std::set<std::pair<int, int>> cells;
        for (size_t i = 0; i < points.size(); ++i) {
            REQUIRE(points[i].id == i);
            REQUIRE(points[i].x >= 0);
            REQUIRE(points[i].x < grid);
            REQUIRE(points[i].y >= 0);
            REQUIRE(points[i].y < grid);
            cells.insert({points[i].x, points[i].y});
        }
        REQUIRE(cells.size() == points.size());
    }
}

TEST_CASE("requests beyond the grid capacity are clamped", "[sampler]") {
    std::vector<GridPoint> full = generateRandomPoints(4, 100, 1u);
    REQUIRE(full.size() == 16);

    REQUIRE(generateRandomPoints(8, 0, 1u).empty());
    REQUIRE(generateRandomPoints(0, 10, 1u).empty());
}

TEST_CASE("a fixed seed reproduces the sample", "[sampler]") {
    std::vector<GridPoint> a = generateRandomPoints(32, 20, 1234u);
    std::vector<GridPoint> b = generateRandomPoints(32, 20, 1234u);
    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a[i].x == b[i].x);
        REQUIRE(a[i].y == b[i].y);
    }
}

TEST_CASE("a shared generator keeps drawing fresh samples", "[sampler]") {
    std::mt19937 gen(7);
    std::vector<GridPoint> first = generateRandomPoints(64, 10, gen);
    std::vector<GridPoint> second = generateRandomPoints(64, 10, gen);
    REQUIRE(first.size() == 10);
    REQUIRE(second.size() == 10);

    bool differs = false;
    for (size_t i = 0; i < first.size(); ++i) {
        if (first[i].x != second[i].x || first[i].y != second[i].y) differs = true;
    }
    REQUIRE(differs);
}
