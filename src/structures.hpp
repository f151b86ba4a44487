#pragma once

#include <cstddef>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/register/point.hpp>

// Choose Abseil or std hash containers
#if GRIDTSP_USE_ABSEIL_HASH_SET
template<typename T>
using HashSet = absl::flat_hash_set<T>;
template<typename K, typename V>
using HashMap = absl::flat_hash_map<K, V>;
#else
template<typename T>
using HashSet = std::unordered_set<T>;
template<typename K, typename V>
using HashMap = std::unordered_map<K, V>;
#endif

namespace bg = boost::geometry;

// Floating point model used for centroids and spatial indexing
typedef bg::model::point<double, 2, bg::cs::cartesian> Point;

// ==================== Structures ====================

// Input point on the integer grid. The id is assigned by the caller or the
// sampler and is stable for the lifetime of the point set.
struct GridPoint {
    int x;
    int y;
    size_t id;

    GridPoint(int x_ = 0, int y_ = 0, size_t id_ = 0) : x(x_), y(y_), id(id_) {}
};

// Vertex of a space-filling curve. Raw turtle paths may hold negative
// coordinates; normalized curves lie on 0..g-1.
struct CurveVertex {
    int x;
    int y;

    bool operator==(const CurveVertex& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const CurveVertex& other) const {
        return !(*this == other);
    }
};

BOOST_GEOMETRY_REGISTER_POINT_2D(GridPoint, int, bg::cs::cartesian, x, y)
BOOST_GEOMETRY_REGISTER_POINT_2D(CurveVertex, int, bg::cs::cartesian, x, y)

// A tour is a permutation of point indices, read as a closed cycle.
typedef std::vector<size_t> Tour;

typedef std::pair<Point, size_t> PointValue;

// ==================== Constants ====================

// Minimum gain for a local-search move to be accepted
constexpr double kImproveEpsilon = 1e-3;

// Default caps of the local searches
constexpr int kTwoOptMaxIterations = 50;
constexpr int kPairSwapMaxIterations = 100;
constexpr int kCombinedMaxIterations = 50;
constexpr int kCombinedMaxRounds = 100;

// Largest instance the exhaustive optimizer accepts
constexpr size_t kExhaustiveMaxPoints = 12;
