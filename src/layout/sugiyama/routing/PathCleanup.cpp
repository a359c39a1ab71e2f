#include "PathCleanup.h"

#include <cmath>

namespace pipeviz {

bool PathCleanup::isPointDuplicate(const Point& a, const Point& b) {
    return std::abs(a.x - b.x) < EPSILON && std::abs(a.y - b.y) < EPSILON;
}

bool PathCleanup::isCollinear(const Point& a, const Point& b, const Point& c) {
    float cross = (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
    if (std::abs(cross) > EPSILON) {
        return false;
    }
    // b must lie between a and c, otherwise it is a spike
    float dot = (b.x - a.x) * (c.x - b.x) + (b.y - a.y) * (c.y - b.y);
    return dot >= 0.0f;
}

void PathCleanup::removeDuplicates(std::vector<Point>& points) {
    if (points.size() < 2) return;

    std::vector<Point> cleaned;
    cleaned.reserve(points.size());
    cleaned.push_back(points.front());
    for (size_t i = 1; i + 1 < points.size(); ++i) {
        if (!isPointDuplicate(cleaned.back(), points[i])) {
            cleaned.push_back(points[i]);
        }
    }
    // Keep the exact end point; drop a bend sitting on top of it
    if (cleaned.size() > 1 && isPointDuplicate(cleaned.back(), points.back())) {
        cleaned.pop_back();
    }
    cleaned.push_back(points.back());
    points = std::move(cleaned);
}

void PathCleanup::removeCollinear(std::vector<Point>& points) {
    if (points.size() < 3) return;

    std::vector<Point> cleaned;
    cleaned.reserve(points.size());
    cleaned.push_back(points.front());
    for (size_t i = 1; i + 1 < points.size(); ++i) {
        if (!isCollinear(cleaned.back(), points[i], points[i + 1])) {
            cleaned.push_back(points[i]);
        }
    }
    cleaned.push_back(points.back());
    points = std::move(cleaned);
}

}  // namespace pipeviz
