#include "curve.hpp"
#include "debug.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

int snapGridSize(int grid) {
    if (grid <= kValidGridSizes.front()) return kValidGridSizes.front();
    if (grid >= kValidGridSizes.back()) return kValidGridSizes.back();

    // Nearest on the linear scale; a tie goes to the larger size
    auto upper = std::lower_bound(kValidGridSizes.begin(), kValidGridSizes.end(), grid);
    int above = *upper;
    int below = *(upper - 1);
    return (grid - below < above - grid) ? below : above;
}

int curveGridSize(int grid) {
    return grid <= 1 ? 1 : snapGridSize(grid);
}

int curveOrder(int grid) {
    if (grid <= 1) return 0;
    int snapped = snapGridSize(grid);
    int order = 0;
    while ((1 << order) < snapped) ++order;
    return order;
}

int curveIterations(int grid) {
    return std::max(0, curveOrder(grid) - 1);
}

std::string mooreLSystem(int iterations) {
    std::string sequence = "LFL+F+LFL";

    for (int i = 0; i < iterations; ++i) {
        std::string next;
        next.reserve(sequence.size() * 4);
        for (char c : sequence) {
            if (c == 'L') {
                next += "-RF+LFL+FR-";
            } else if (c == 'R') {
                next += "+LF-RFR-FL+";
            } else {
                next += c;
            }
        }
        sequence = std::move(next);
    }

    return sequence;
}

std::vector<CurveVertex> turtlePath(const std::string& commands) {
    // Direction: 0=up, 1=right, 2=down, 3=left (screen coordinates, y grows down)
    static constexpr int dx[4] = {0, 1, 0, -1};
    static constexpr int dy[4] = {-1, 0, 1, 0};

    std::vector<CurveVertex> path;
    path.reserve(std::count(commands.begin(), commands.end(), 'F') + 1);

    int x = 0, y = 0;
    int direction = 0;
    path.push_back({x, y});

    for (char c : commands) {
        if (c == 'F') {
            x += dx[direction];
            y += dy[direction];
            path.push_back({x, y});
        } else if (c == '+') {
            direction = (direction + 1) % 4;
        } else if (c == '-') {
            direction = (direction + 3) % 4;
        }
        // L and R only drive the rewriting
    }

    return path;
}

std::vector<CurveVertex> normalizeToGrid(const std::vector<CurveVertex>& path, int grid) {
    if (path.empty()) return {};

    int minX = path[0].x, maxX = path[0].x;
    int minY = path[0].y, maxY = path[0].y;
    for (const auto& v : path) {
        minX = std::min(minX, v.x);
        maxX = std::max(maxX, v.x);
        minY = std::min(minY, v.y);
        maxY = std::max(maxY, v.y);
    }

    const double width = maxX - minX;
    const double height = maxY - minY;
    const double scale = std::max(0, grid - 1);

    auto project = [scale](int v, int lo, double extent) {
        if (extent <= 0.0) return 0;
        return static_cast<int>(std::lround((v - lo) / extent * scale));
    };

    std::vector<CurveVertex> normalized;
    normalized.reserve(path.size());
    for (const auto& v : path) {
        normalized.push_back({project(v.x, minX, width), project(v.y, minY, height)});
    }
    return normalized;
}

std::vector<CurveVertex> mooreCurve(int grid) {
    if (grid <= 1) return {{0, 0}};

    const int snapped = snapGridSize(grid);

    static std::mutex cacheMutex;
    static HashMap<int, std::vector<CurveVertex>> cache;

    std::lock_guard<std::mutex> lock(cacheMutex);
    auto it = cache.find(snapped);
    if (it != cache.end()) return it->second;

    const int iterations = curveIterations(snapped);
    std::vector<CurveVertex> curve = normalizeToGrid(turtlePath(mooreLSystem(iterations)), snapped);
    DBG("Moore curve: grid " << snapped << ", iterations " << iterations
        << ", vertices " << curve.size());

    cache.emplace(snapped, curve);
    return curve;
}
