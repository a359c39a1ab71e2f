#include "pipeviz/layout/util/LayoutUtils.h"

#include <algorithm>
#include <cmath>

namespace pipeviz {

namespace {
    constexpr float EPSILON_LEN2 = 1e-6f;
}

float LayoutUtils::pointToSegmentDistance(
    const Point& point,
    const Point& segmentStart,
    const Point& segmentEnd,
    Point& outClosestPoint)
{
    float dx = segmentEnd.x - segmentStart.x;
    float dy = segmentEnd.y - segmentStart.y;
    float len2 = dx * dx + dy * dy;

    float t = 0.0f;
    if (len2 > EPSILON_LEN2) {
        t = std::max(0.0f, std::min(1.0f,
            ((point.x - segmentStart.x) * dx + (point.y - segmentStart.y) * dy) / len2));
    }

    outClosestPoint = {segmentStart.x + t * dx, segmentStart.y + t * dy};
    return point.distanceTo(outClosestPoint);
}

LayoutUtils::EdgeHitResult LayoutUtils::hitTestEdge(
    const Point& point,
    const EdgeLayout& edge,
    float threshold)
{
    EdgeHitResult result;
    float minDist = threshold;
    int segmentIndex = 0;

    edge.forEachSegment([&](const Point& p1, const Point& p2) {
        Point closest;
        float dist = pointToSegmentDistance(point, p1, p2, closest);

        if (dist < minDist) {
            minDist = dist;
            result.hit = true;
            result.segmentIndex = segmentIndex;
            result.closestPoint = closest;
            result.distance = dist;
        }
        ++segmentIndex;
    });

    return result;
}

std::optional<NodeId> LayoutUtils::hitTestNode(const Point& point, const LayoutResult& layout) {
    std::optional<NodeId> hit;
    for (const auto& [id, node] : layout.nodeLayouts()) {
        if (node.bounds().contains(point) && (!hit || id < *hit)) {
            hit = id;
        }
    }
    return hit;
}

std::optional<EdgeId> LayoutUtils::hitTestEdges(const Point& point, const LayoutResult& layout,
                                                float threshold) {
    std::optional<EdgeId> hit;
    float best = threshold;
    for (const auto& [id, edge] : layout.edgeLayouts()) {
        EdgeHitResult result = hitTestEdge(point, edge, threshold);
        if (!result.hit) continue;
        if (result.distance < best || (result.distance == best && hit && id < *hit)) {
            best = result.distance;
            hit = id;
        }
    }
    return hit;
}

Point LayoutUtils::edgeMidpoint(const EdgeLayout& edge) {
    float total = 0.0f;
    edge.forEachSegment([&](const Point& a, const Point& b) { total += a.distanceTo(b); });
    if (total < 0.001f) {
        return edge.sourcePoint;
    }

    float remaining = total / 2.0f;
    Point result = edge.targetPoint;
    bool found = false;
    edge.forEachSegment([&](const Point& a, const Point& b) {
        if (found) return;
        float length = a.distanceTo(b);
        if (remaining <= length && length > 0.0f) {
            result = a + (b - a) * (remaining / length);
            found = true;
        } else {
            remaining -= length;
        }
    });
    return result;
}

std::optional<Rect> LayoutUtils::groupBounds(NodeId pipeline, const PipelineGraph& graph,
                                             const LayoutResult& layout, float padding) {
    if (!graph.isPipeline(pipeline) || graph.isCollapsed(pipeline) ||
        graph.isHiddenByCollapse(pipeline) || graph.isExplicitlyHidden(pipeline)) {
        return std::nullopt;
    }

    Rect box;
    bool any = false;
    auto unite = [&](const Rect& rect) {
        box = any ? box.united(rect) : rect;
        any = true;
    };

    for (NodeId child : graph.getChildren(pipeline)) {
        if (const NodeLayout* node = layout.getNodeLayout(child)) {
            unite(node->bounds());
        } else if (graph.isPipeline(child)) {
            if (auto nested = groupBounds(child, graph, layout, padding)) {
                unite(*nested);
            }
        }
    }

    if (!any) {
        return std::nullopt;
    }
    return box.expanded(padding);
}

std::unordered_map<NodeId, Rect> LayoutUtils::allGroupBounds(const PipelineGraph& graph,
                                                             const LayoutResult& layout,
                                                             float padding) {
    std::unordered_map<NodeId, Rect> result;
    for (NodeId pipeline : graph.pipelines()) {
        if (auto box = groupBounds(pipeline, graph, layout, padding)) {
            result.emplace(pipeline, *box);
        }
    }
    return result;
}

}  // namespace pipeviz
