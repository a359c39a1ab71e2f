#pragma once

#include "../../core/Types.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace pipeviz {

/// Positioned node in the layout result
struct NodeLayout {
    NodeId id = INVALID_NODE;
    Point position;           // Top-left corner
    Size size;
    int rank = 0;             // Layer index, 0 = top
    int order = 0;            // Position within the rank, 0 = leftmost
    NodeKind kind = NodeKind::Task;

    Point center() const {
        return {position.x + size.width / 2, position.y + size.height / 2};
    }

    Rect bounds() const {
        return {position.x, position.y, size.width, size.height};
    }
};

/// Routed edge: source boundary point, smoothed interior points, target boundary point
struct EdgeLayout {
    EdgeId id = INVALID_EDGE;
    NodeId from = INVALID_NODE;
    NodeId to = INVALID_NODE;
    bool synthetic = false;

    Point sourcePoint;
    Point targetPoint;
    std::vector<Point> bendPoints;

    /// Get all points in order (source -> bends -> target)
    std::vector<Point> allPoints() const {
        std::vector<Point> result;
        result.reserve(bendPoints.size() + 2);
        result.push_back(sourcePoint);
        result.insert(result.end(), bendPoints.begin(), bendPoints.end());
        result.push_back(targetPoint);
        return result;
    }

    /// Iterate over all segments without allocation
    template<typename Func>
    void forEachSegment(Func&& callback) const {
        Point prev = sourcePoint;
        for (const auto& bp : bendPoints) {
            callback(prev, bp);
            prev = bp;
        }
        callback(prev, targetPoint);
    }

    size_t pointCount() const { return bendPoints.size() + 2; }
};

/// Complete layout of one effective graph
///
/// Nodes are keyed by effective node id, edges by effective edge id.
class LayoutResult {
public:
    LayoutResult() = default;

    void setNodeLayout(NodeId id, const NodeLayout& layout);
    const NodeLayout* getNodeLayout(NodeId id) const;
    NodeLayout* getNodeLayout(NodeId id);
    bool hasNodeLayout(NodeId id) const;

    void setEdgeLayout(EdgeId id, const EdgeLayout& layout);
    const EdgeLayout* getEdgeLayout(EdgeId id) const;
    EdgeLayout* getEdgeLayout(EdgeId id);
    bool hasEdgeLayout(EdgeId id) const;

    const std::unordered_map<NodeId, NodeLayout>& nodeLayouts() const { return nodeLayouts_; }
    const std::unordered_map<EdgeId, EdgeLayout>& edgeLayouts() const { return edgeLayouts_; }

    Rect computeBounds() const;
    Rect computeBounds(float padding) const;

    void setRankCount(int count) { rankCount_ = count; }
    int rankCount() const { return rankCount_; }

    /// Nodes of one rank sorted by order
    std::vector<NodeId> nodesInRank(int rank) const;

    size_t nodeCount() const { return nodeLayouts_.size(); }
    size_t edgeCount() const { return edgeLayouts_.size(); }
    bool empty() const { return nodeLayouts_.empty(); }

    void translate(float dx, float dy);
    void clear();

    // Serialization (JSON format, see LayoutSerializer)
    std::string toJson() const;
    static LayoutResult fromJson(const std::string& json);

private:
    std::unordered_map<NodeId, NodeLayout> nodeLayouts_;
    std::unordered_map<EdgeId, EdgeLayout> edgeLayouts_;
    int rankCount_ = 0;
};

}  // namespace pipeviz
