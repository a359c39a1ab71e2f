#pragma once

#include "pipeviz/core/PipelineGraph.h"
#include "pipeviz/core/Types.h"
#include "pipeviz/layout/config/LayoutResult.h"

#include <optional>
#include <unordered_map>
#include <vector>

namespace pipeviz {

/// Geometry helpers over a finished layout
class LayoutUtils {
public:
    /// Result of edge hit test
    struct EdgeHitResult {
        bool hit = false;              ///< True if point is near the edge
        int segmentIndex = -1;         ///< Index of the segment hit (0 = source to first bend)
        Point closestPoint{0, 0};      ///< Closest point on the edge segment
        float distance = 0.0f;         ///< Distance from query point to closest point
    };

    /// Check if a point is near an edge polyline
    static EdgeHitResult hitTestEdge(const Point& point, const EdgeLayout& edge, float threshold);

    /// Calculate distance from a point to a line segment
    /// @param outClosestPoint Output: closest point on segment to query point
    static float pointToSegmentDistance(
        const Point& point,
        const Point& segmentStart,
        const Point& segmentEnd,
        Point& outClosestPoint);

    /// Node whose box contains the point; ties go to the lowest id
    static std::optional<NodeId> hitTestNode(const Point& point, const LayoutResult& layout);

    /// Nearest edge within threshold; ties go to the lowest id
    static std::optional<EdgeId> hitTestEdges(const Point& point, const LayoutResult& layout,
                                              float threshold);

    /// Midpoint along the polyline (edge labels, metric badges)
    static Point edgeMidpoint(const EdgeLayout& edge);

    /**
     * @brief Background box of an expanded modular pipeline
     *
     * Union of the boxes of its visible members (nested expanded groups
     * included), grown by padding per nesting level.
     * @return std::nullopt when the pipeline is collapsed, hidden or has no
     *         laid-out member
     */
    static std::optional<Rect> groupBounds(NodeId pipeline, const PipelineGraph& graph,
                                           const LayoutResult& layout, float padding);

    /// groupBounds() of every expanded pipeline with laid-out members
    static std::unordered_map<NodeId, Rect> allGroupBounds(const PipelineGraph& graph,
                                                           const LayoutResult& layout,
                                                           float padding);
};

}  // namespace pipeviz
