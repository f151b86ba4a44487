#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

#include "construct.hpp"
#include "geometry.hpp"
#include "sampler.hpp"

static const std::vector<GridPoint> square = {{0, 0, 0}, {10, 0, 1}, {10, 10, 2}, {0, 10, 3}};
static const std::vector<GridPoint> triangle = {{0, 0, 0}, {5, 0, 1}, {2, 4, 2}};

TEST_CASE("sweep starts below the centroid and turns clockwise", "[construct][sweep]") {
    SweepResult squareSweep = sweepTour(square);
    REQUIRE(squareSweep.tour == Tour{3, 0, 1, 2});
    REQUIRE(squareSweep.centroid.has_value());
    REQUIRE(bg::get<0>(*squareSweep.centroid) == Approx(5.0));
    REQUIRE(bg::get<1>(*squareSweep.centroid) == Approx(5.0));

    REQUIRE(sweepTour(triangle).tour == Tour{2, 0, 1});
}

TEST_CASE("sweep keeps input order on equal angles", "[construct][sweep]") {
    // Points 1 and 2 lie on the same ray from the centroid (2, 0)
    std::vector<GridPoint> ray = {{0, 0, 0}, {3, 0, 1}, {4, 0, 2}, {1, 0, 3}};
    Tour tour = sweepTour(ray).tour;
    REQUIRE(isValidTour(tour, ray.size()));

    auto pos = [&tour](size_t idx) { return std::find(tour.begin(), tour.end(), idx) - tour.begin(); };
    REQUIRE(pos(1) < pos(2));
}

TEST_CASE("sweep of an empty set", "[construct][sweep]") {
    SweepResult empty = sweepTour({});
    REQUIRE(empty.tour.empty());
    REQUIRE_FALSE(empty.centroid.has_value());
    REQUIRE(sweepTourSteps({}).empty());
}

TEST_CASE("progressive sweep grows the tour one point at a time", "[construct][sweep]") {
    StepTrace steps = sweepTourSteps(square);
    REQUIRE(steps.size() == square.size());

    for (size_t i = 0; i < steps.size(); ++i) {
        const SweepStep& step = std::get<SweepStep>(steps[i]);
        REQUIRE(step.tour.size() == i + 1);
        REQUIRE(bg::get<0>(step.centroid) == Approx(5.0));
    }
    REQUIRE(finalTour(steps) == sweepTour(square).tour);

    // First visited point is (0, 10), at 135 degrees from the centroid
    const SweepStep& first = std::get<SweepStep>(steps.front());
    REQUIRE(first.angle == Approx(3 * std::numbers::pi / 4));
    REQUIRE(first.description == "Progress: 25.0% | Angle: 135.0 deg | Point 3 (0, 10)");

    const SweepStep& last = std::get<SweepStep>(steps.back());
    REQUIRE(last.description == "Progress: 100.0% | Angle: 45.0 deg | Point 2 (10, 10)");
}

TEST_CASE("nearest curve vertex prefers the lowest index on ties", "[construct][curve]") {
    std::vector<CurveVertex> curve = {{5, 5}, {2, 0}, {0, 0}};
    std::vector<GridPoint> points = {{1, 0, 0}, {5, 4, 1}, {0, 0, 2}};

    std::vector<size_t> positions = nearestCurvePositions(points, curve);
    REQUIRE(positions == std::vector<size_t>{1, 0, 2});
}

TEST_CASE("curve projection orders points along the Moore curve", "[construct][curve]") {
    CurveResult result = curveTour(square, 16);
    REQUIRE(result.grid == 16);
    REQUIRE(result.curve.size() == 256);
    REQUIRE(result.tour == Tour{3, 0, 1, 2});

    REQUIRE(curveTour(triangle, 8).tour == Tour{2, 0, 1});

    std::vector<GridPoint> line = {{0, 0, 0}, {1, 0, 1}, {2, 0, 2}, {3, 0, 3}};
    REQUIRE(curveTour(line, 4).tour == Tour{0, 1, 2, 3});
}

TEST_CASE("curve projection snaps the grid", "[construct][curve]") {
    CurveResult result = curveTour(triangle, 6);
    REQUIRE(result.grid == 8);
    REQUIRE(result.curve.size() == 64);
}

TEST_CASE("two points form the same cycle under both constructors", "[construct]") {
    std::vector<GridPoint> pair = {{0, 0, 0}, {3, 4, 1}};

    REQUIRE(sweepTour(pair).tour == Tour{0, 1});

    // The curve reaches (3, 4) before (0, 0), so the tour starts at point 1.
    // [1, 0] and [0, 1] are the same cycle; both orders are correct here.
    Tour curve = curveTour(pair, 8).tour;
    REQUIRE(curve == Tour{1, 0});
    REQUIRE(tourLength(curve, pair) == Approx(10.0));
    for (int grid : {16, 64}) {
        REQUIRE(curveTour(pair, grid).tour == Tour{1, 0});
    }
}

TEST_CASE("progressive curve projection", "[construct][curve]") {
    StepTrace steps = curveTourSteps(square, 16);
    REQUIRE(steps.size() == square.size() + 1);

    const CurveStep& header = std::get<CurveStep>(steps.front());
    REQUIRE(header.tour.empty());
    REQUIRE(header.order == 4);
    REQUIRE(header.grid == 16);
    REQUIRE(header.curve.size() == 256);
    REQUIRE(header.description == "Moore curve generated (order 4, 16x16 grid)");

    size_t lastPosition = 0;
    for (size_t i = 1; i < steps.size(); ++i) {
        const VisitStep& visit = std::get<VisitStep>(steps[i]);
        REQUIRE(visit.tour.size() == i);
        REQUIRE(visit.curvePosition >= lastPosition);
        REQUIRE(visit.curveProgress >= 0.0);
        REQUIRE(visit.curveProgress <= 100.0);
        lastPosition = visit.curvePosition;
    }
    REQUIRE(finalTour(steps) == curveTour(square, 16).tour);
    REQUIRE(curveTourSteps({}, 16).empty());
}

TEST_CASE("constructors emit permutations on random instances", "[construct]") {
    for (uint32_t seed = 1; seed <= 5; ++seed) {
        for (int grid : {8, 16, 32}) {
            std::vector<GridPoint> points = generateRandomPoints(grid, 40, seed);
            CAPTURE(seed, grid);
            REQUIRE(isValidTour(sweepTour(points).tour, points.size()));
            REQUIRE(isValidTour(curveTour(points, grid).tour, points.size()));
        }
    }
}
