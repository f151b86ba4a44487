#include "geometry.hpp"

#include <cassert>
#include <numeric>

double pointDistance(const GridPoint& a, const GridPoint& b) {
    return bg::distance(a, b);
}

double tourLength(const Tour& tour, const std::vector<GridPoint>& points) {
    if (tour.size() < 2) return 0.0;

    double total = 0.0;
    for (size_t i = 0; i < tour.size(); ++i) {
        const GridPoint& p1 = points[tour[i]];
        const GridPoint& p2 = points[tour[(i + 1) % tour.size()]]; // Wrap around to the start
        total += bg::distance(p1, p2);
    }
    return total;
}

Point centroid(const std::vector<GridPoint>& points) {
    assert(!points.empty());

    bg::model::multi_point<Point> cloud;
    cloud.reserve(points.size());
    for (const auto& p : points) {
        cloud.emplace_back(static_cast<double>(p.x), static_cast<double>(p.y));
    }

    Point c;
    bg::centroid(cloud, c);
    return c;
}

bool isValidTour(const Tour& tour, size_t n, std::string* why) {
    if (tour.size() != n) { if (why) *why = "wrong size"; return false; }

    HashSet<size_t> seen;
    seen.reserve(n);
    for (size_t v : tour) {
        if (v >= n) { if (why) *why = "index out of range"; return false; }
        if (!seen.insert(v).second) { if (why) *why = "repeated index"; return false; }
    }
    return true;
}

Tour identityTour(size_t n) {
    Tour tour(n);
    std::iota(tour.begin(), tour.end(), 0);
    return tour;
}
