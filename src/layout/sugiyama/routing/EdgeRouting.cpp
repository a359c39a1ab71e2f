#include "EdgeRouting.h"
#include "PathCleanup.h"
#include "pipeviz/layout/api/LayoutInternalError.h"

#include <algorithm>

namespace pipeviz {

namespace {

EdgeLayout fromPoints(const EffectiveEdge& edge, std::vector<Point> points) {
    EdgeLayout layout;
    layout.id = edge.id;
    layout.from = edge.from;
    layout.to = edge.to;
    layout.synthetic = edge.synthetic;
    layout.sourcePoint = points.front();
    layout.targetPoint = points.back();
    layout.bendPoints.assign(points.begin() + 1, points.end() - 1);
    return layout;
}

}  // namespace

EdgeLayout EdgeRouting::route(const EffectiveEdge& edge,
                              const std::vector<size_t>& chain,
                              const LayeredGraph& layered,
                              const std::vector<float>& centerX,
                              const LayoutResult& nodes,
                              const RankGeometry& geometry,
                              const LayoutOptions& options) {
    const NodeLayout* source = nodes.getNodeLayout(edge.from);
    const NodeLayout* target = nodes.getNodeLayout(edge.to);
    if (!source || !target || chain.size() < 2) {
        throw LayoutInternalError("Edge " + std::to_string(edge.id) + " has no placed endpoints");
    }

    const Rect sourceRect = source->bounds();
    const Rect targetRect = target->bounds();
    const float stub = std::max(0.0f, std::min(options.edgeStubLength,
                                               options.rankSeparation / 2.0f));

    std::vector<Point> points;
    points.reserve(chain.size() + 4);
    points.push_back({sourceRect.center().x, sourceRect.bottom()});
    points.push_back({sourceRect.center().x, sourceRect.bottom() + stub});
    for (size_t i = 1; i + 1 < chain.size(); ++i) {
        const LayeredNode& dummy = layered.nodes[chain[i]];
        points.push_back({centerX[chain[i]], geometry.middle(dummy.rank)});
    }
    points.push_back({targetRect.center().x, targetRect.top() - stub});
    points.push_back({targetRect.center().x, targetRect.top()});

    PathCleanup::removeDuplicates(points);
    PathCleanup::removeCollinear(points);
    points = smooth(points, options.smoothingIterations);
    PathCleanup::removeDuplicates(points);

    return fromPoints(edge, std::move(points));
}

EdgeLayout EdgeRouting::straight(const EffectiveEdge& edge, const LayoutResult& nodes) {
    const NodeLayout* source = nodes.getNodeLayout(edge.from);
    const NodeLayout* target = nodes.getNodeLayout(edge.to);
    if (!source || !target) {
        throw LayoutInternalError("Edge " + std::to_string(edge.id) + " has no placed endpoints");
    }

    const Rect s = source->bounds();
    const Rect t = target->bounds();
    // Leave through the side facing the target
    Point start = t.top() >= s.bottom() ? Point{s.center().x, s.bottom()}
                                        : Point{s.center().x, s.top()};
    Point end = t.top() >= s.bottom() ? Point{t.center().x, t.top()}
                                      : Point{t.center().x, t.bottom()};
    return fromPoints(edge, {start, end});
}

std::vector<Point> EdgeRouting::smooth(const std::vector<Point>& points, int iterations) {
    std::vector<Point> current = points;
    for (int iteration = 0; iteration < iterations && current.size() > 2; ++iteration) {
        std::vector<Point> next;
        next.reserve(current.size() * 2);
        next.push_back(current.front());
        for (size_t i = 0; i + 1 < current.size(); ++i) {
            const Point& a = current[i];
            const Point& b = current[i + 1];
            // The first and last segments keep their outer end fixed
            if (i > 0) {
                next.push_back(a * 0.75f + b * 0.25f);
            }
            if (i + 2 < current.size()) {
                next.push_back(a * 0.25f + b * 0.75f);
            }
        }
        next.push_back(current.back());
        current = std::move(next);
    }
    return current;
}

}  // namespace pipeviz
