#include "bound.hpp"
#include "debug.hpp"
#include "geometry.hpp"

#include <limits>

static const char* kOneTreeMethod = "1-tree";

double mstWeight(const std::vector<std::vector<double>>& dist, const std::vector<size_t>& vertices) {
    const size_t n = vertices.size();
    if (n <= 1) return 0.0;

    std::vector<bool> inTree(n, false);
    std::vector<double> minEdge(n, std::numeric_limits<double>::infinity());
    minEdge[0] = 0.0;

    double total = 0.0;
    for (size_t count = 0; count < n; ++count) {
        // Cheapest vertex not yet in the tree
        size_t u = n;
        for (size_t i = 0; i < n; ++i) {
            if (!inTree[i] && (u == n || minEdge[i] < minEdge[u])) u = i;
        }

        inTree[u] = true;
        total += minEdge[u];

        for (size_t v = 0; v < n; ++v) {
            if (inTree[v]) continue;
            double d = dist[vertices[u]][vertices[v]];
            if (d < minEdge[v]) minEdge[v] = d;
        }
    }

    return total;
}

LowerBound oneTreeBound(const std::vector<GridPoint>& points) {
    const size_t n = points.size();
    if (n <= 1) return {0.0, kOneTreeMethod};
    if (n == 2) return {2 * pointDistance(points[0], points[1]), kOneTreeMethod};

    std::vector<std::vector<double>> dist(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            dist[i][j] = dist[j][i] = bg::distance(points[i], points[j]);
        }
    }

    std::vector<size_t> rest;
    rest.reserve(n - 1);
    for (size_t i = 1; i < n; ++i) rest.push_back(i);
    double tree = mstWeight(dist, rest);

    // Two cheapest edges from vertex 0
    double min1 = std::numeric_limits<double>::infinity();
    double min2 = std::numeric_limits<double>::infinity();
    for (size_t i = 1; i < n; ++i) {
        double d = dist[0][i];
        if (d < min1) {
            min2 = min1;
            min1 = d;
        } else if (d < min2) {
            min2 = d;
        }
    }

    DBG("1-tree: mst " << tree << ", root edges " << min1 << " + " << min2);
    return {tree + min1 + min2, kOneTreeMethod};
}

OptimalityVerdict verifyOptimality(double tourDistance, const std::vector<GridPoint>& points) {
    LowerBound bound = oneTreeBound(points);
    double gap = tourDistance - bound.value;
    double relativeGap = bound.value > 0 ? tourDistance / bound.value - 1.0 : 0.0;

    return {gap <= kImproveEpsilon, bound.value, gap, relativeGap, relativeGap * 100.0, bound.method};
}
