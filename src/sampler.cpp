#include "sampler.hpp"

#include <algorithm>

std::vector<GridPoint> generateRandomPoints(int grid, size_t count, std::mt19937& gen) {
    std::vector<GridPoint> points;
    if (grid <= 0) return points;

    const size_t capacity = static_cast<size_t>(grid) * static_cast<size_t>(grid);
    const size_t target = std::min(count, capacity);
    points.reserve(target);

    std::uniform_int_distribution<int> coord(0, grid - 1);
    HashSet<int64_t> used;
    used.reserve(target);

    while (points.size() < target) {
        int x = coord(gen);
        int y = coord(gen);
        int64_t key = static_cast<int64_t>(y) * grid + x;
        if (used.insert(key).second) {
            points.emplace_back(x, y, points.size());
        }
    }
    return points;
}

std::vector<GridPoint> generateRandomPoints(int grid, size_t count, uint32_t seed) {
    if (seed == 0) {
        std::random_device rd;
        seed = rd();
    }
    std::mt19937 gen(seed);
    return generateRandomPoints(grid, count, gen);
}
