#pragma once

#include "pipeviz/core/Types.h"

#include <vector>

namespace pipeviz {

/// Utility functions for cleaning up routed polylines
class PathCleanup {
public:
    /// Tolerance for floating point comparisons
    static constexpr float EPSILON = 0.1f;

    static bool isPointDuplicate(const Point& a, const Point& b);

    /// True when b lies on the straight segment a-c
    static bool isCollinear(const Point& a, const Point& b, const Point& c);

    /// Drop consecutive duplicates; the first and last point always survive
    static void removeDuplicates(std::vector<Point>& points);

    /// Drop interior points that sit on a straight run
    static void removeCollinear(std::vector<Point>& points);
};

}  // namespace pipeviz
