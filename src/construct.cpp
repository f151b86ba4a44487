#include "construct.hpp"
#include "curve.hpp"
#include "debug.hpp"
#include "geometry.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numbers>
#include <numeric>
#include <string>

#include <boost/geometry/index/rtree.hpp>

namespace bgi = boost::geometry::index;

// Tour order of the sweep together with the raw angle of every point
struct SweepOrder {
    Tour tour;
    std::vector<double> angles;
    Point center;
};

static SweepOrder computeSweep(const std::vector<GridPoint>& points) {
    SweepOrder order;
    order.center = centroid(points);
    const double cx = bg::get<0>(order.center);
    const double cy = bg::get<1>(order.center);

    // Start at the bottom (positive y in screen coordinates)
    const double startAngle = std::numbers::pi / 2;

    std::vector<double> sortAngles(points.size());
    order.angles.resize(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        double rawAngle = std::atan2(points[i].y - cy, points[i].x - cx);
        double normalized = rawAngle - startAngle;
        if (normalized < 0) normalized += 2 * std::numbers::pi;
        order.angles[i] = rawAngle;
        sortAngles[i] = normalized;
    }

    order.tour = identityTour(points.size());
    std::stable_sort(order.tour.begin(), order.tour.end(), [&](size_t a, size_t b) {
        return sortAngles[a] < sortAngles[b];
    });
    return order;
}

static std::string pointLabel(const std::vector<GridPoint>& points, size_t idx) {
    return "Point " + std::to_string(idx) + " (" + std::to_string(points[idx].x) + ", " +
           std::to_string(points[idx].y) + ")";
}

// Curve positions and the tour obtained by sorting on them
static Tour orderByCurve(const std::vector<size_t>& positions) {
    Tour tour = identityTour(positions.size());
    std::stable_sort(tour.begin(), tour.end(), [&](size_t a, size_t b) {
        return positions[a] < positions[b];
    });
    return tour;
}

SweepResult sweepTour(const std::vector<GridPoint>& points) {
    if (points.empty()) return {{}, std::nullopt};

    SweepOrder order = computeSweep(points);
    return {std::move(order.tour), order.center};
}

StepTrace sweepTourSteps(const std::vector<GridPoint>& points) {
    StepTrace steps;
    if (points.empty()) return steps;

    SweepOrder order = computeSweep(points);
    steps.reserve(points.size());

    Tour tour;
    tour.reserve(points.size());
    for (size_t i = 0; i < order.tour.size(); ++i) {
        const size_t idx = order.tour[i];
        const double angle = order.angles[idx];
        tour.push_back(idx);

        double sweepDeg = std::fmod(angle * 180.0 / std::numbers::pi + 360.0, 360.0);
        double progress = static_cast<double>(i + 1) / order.tour.size() * 100.0;
        std::string description = "Progress: " + formatFixed(progress, 1) + "% | Angle: " +
                                  formatFixed(sweepDeg, 1) + " deg | " + pointLabel(points, idx);

        steps.push_back(SweepStep{tour, std::move(description), angle, order.center});
    }

    return steps;
}

std::vector<size_t> nearestCurvePositions(const std::vector<GridPoint>& points,
                                          const std::vector<CurveVertex>& curve) {
    std::vector<size_t> positions(points.size(), 0);
    if (curve.empty()) return positions;

    bgi::rtree<PointValue, bgi::rstar<16>> rtree;
    for (size_t i = 0; i < curve.size(); ++i) {
        rtree.insert(std::make_pair(Point(curve[i].x, curve[i].y), i));
    }

    constexpr double tieTolerance = 1e-9;
    for (size_t k = 0; k < points.size(); ++k) {
        const Point query(points[k].x, points[k].y);

        std::vector<PointValue> nearest;
        rtree.query(bgi::nearest(query, 1), std::back_inserter(nearest));
        const double best = bg::distance(query, nearest.front().first);

        // Several vertices may share the minimum distance; keep the earliest
        const double reach = best + tieTolerance;
        bg::model::box<Point> window(
            Point(bg::get<0>(query) - reach, bg::get<1>(query) - reach),
            Point(bg::get<0>(query) + reach, bg::get<1>(query) + reach));
        std::vector<PointValue> candidates;
        rtree.query(bgi::intersects(window), std::back_inserter(candidates));

        size_t position = nearest.front().second;
        for (const auto& c : candidates) {
            if (bg::distance(query, c.first) <= reach && c.second < position) {
                position = c.second;
            }
        }
        positions[k] = position;
    }

    return positions;
}

CurveResult curveTour(const std::vector<GridPoint>& points, int grid) {
    if (points.empty()) return {{}, {}, curveGridSize(grid)};

    std::vector<CurveVertex> curve = mooreCurve(grid);
    Tour tour = orderByCurve(nearestCurvePositions(points, curve));
    return {std::move(tour), std::move(curve), curveGridSize(grid)};
}

StepTrace curveTourSteps(const std::vector<GridPoint>& points, int grid) {
    StepTrace steps;
    if (points.empty()) return steps;

    const int snapped = curveGridSize(grid);
    const int order = curveOrder(grid);
    std::vector<CurveVertex> curve = mooreCurve(grid);
    const std::vector<size_t> positions = nearestCurvePositions(points, curve);
    const Tour sorted = orderByCurve(positions);
    const size_t curveSize = curve.size();

    DBG("Curve projection of " << points.size() << " points on a " << snapped << " grid");

    std::string header = "Moore curve generated (order " + std::to_string(order) + ", " +
                         std::to_string(snapped) + "x" + std::to_string(snapped) + " grid)";
    steps.push_back(CurveStep{{}, std::move(header), std::move(curve), order, snapped});

    Tour tour;
    tour.reserve(points.size());
    for (size_t idx : sorted) {
        tour.push_back(idx);
        const size_t position = positions[idx];
        double progress = curveSize > 1 ? static_cast<double>(position) / (curveSize - 1) * 100.0 : 0.0;
        std::string description = "Progress: " + formatFixed(progress, 1) + "% | " + pointLabel(points, idx);
        steps.push_back(VisitStep{tour, std::move(description), position, progress});
    }

    return steps;
}
