#include <catch2/catch.hpp>

#include <algorithm>
#include <random>

#include "bound.hpp"
#include "construct.hpp"
#include "exhaustive.hpp"
#include "geometry.hpp"
#include "sampler.hpp"

static const std::vector<GridPoint> square = {{0, 0, 0}, {10, 0, 1}, {10, 10, 2}, {0, 10, 3}};
static const std::vector<GridPoint> line = {{0, 0, 0}, {1, 0, 1}, {2, 0, 2}, {3, 0, 3}};

TEST_CASE("MST weight with Prim", "[bound]") {
    std::vector<std::vector<double>> dist = {
        {0, 1, 4, 3},
        {1, 0, 2, 5},
        {4, 2, 0, 1},
        {3, 5, 1, 0},
    };
    REQUIRE(mstWeight(dist, {0, 1, 2, 3}) == Approx(4.0));
    REQUIRE(mstWeight(dist, {0, 3}) == Approx(3.0));
    REQUIRE(mstWeight(dist, {2}) == 0.0);
    REQUIRE(mstWeight(dist, {}) == 0.0);
}

TEST_CASE("1-tree bound of small instances", "[bound]") {
    LowerBound squareBound = oneTreeBound(square);
    REQUIRE(squareBound.value == Approx(40.0));
    REQUIRE(squareBound.method == "1-tree");

    REQUIRE(oneTreeBound(line).value == Approx(5.0));
    REQUIRE(oneTreeBound({{0, 0, 0}, {3, 4, 1}}).value == Approx(10.0));
    REQUIRE(oneTreeBound({{7, 7, 0}}).value == 0.0);
    REQUIRE(oneTreeBound({}).value == 0.0);
}

TEST_CASE("optimality verdicts", "[bound]") {
    OptimalityVerdict squareVerdict = verifyOptimality(40.0, square);
    REQUIRE(squareVerdict.isOptimal);
    REQUIRE(squareVerdict.gap == Approx(0.0).margin(1e-9));

    OptimalityVerdict lineVerdict = verifyOptimality(6.0, line);
    REQUIRE_FALSE(lineVerdict.isOptimal);
    REQUIRE(lineVerdict.lowerBound == Approx(5.0));
    REQUIRE(lineVerdict.gap == Approx(1.0));
    REQUIRE(lineVerdict.relativeGap == Approx(0.2));
    REQUIRE(lineVerdict.gapPercent == Approx(20.0));
    REQUIRE(lineVerdict.method == "1-tree");

    OptimalityVerdict pairVerdict = verifyOptimality(10.0, {{0, 0, 0}, {3, 4, 1}});
    REQUIRE(pairVerdict.isOptimal);
    REQUIRE(pairVerdict.lowerBound == Approx(10.0));

    // Within the improvement epsilon of the bound
    REQUIRE(verifyOptimality(40.0005, square).isOptimal);
    REQUIRE_FALSE(verifyOptimality(40.01, square).isOptimal);

    OptimalityVerdict empty = verifyOptimality(0.0, {});
    REQUIRE(empty.isOptimal);
    REQUIRE(empty.relativeGap == 0.0);
}

TEST_CASE("1-tree never exceeds a tour", "[bound]") {
    for (uint32_t seed = 1; seed <= 10; ++seed) {
        std::vector<GridPoint> points = generateRandomPoints(16, 9, seed);
        const double bound = oneTreeBound(points).value;
        CAPTURE(seed);

        REQUIRE(bound <= exhaustiveTour(points)->distance + 1e-9);
        REQUIRE(bound <= tourLength(sweepTour(points).tour, points) + 1e-9);
        REQUIRE(bound <= tourLength(curveTour(points, 16).tour, points) + 1e-9);

        Tour shuffled = identityTour(points.size());
        std::mt19937 gen(seed);
        std::shuffle(shuffled.begin(), shuffled.end(), gen);
        REQUIRE(bound <= tourLength(shuffled, points) + 1e-9);
    }
}
