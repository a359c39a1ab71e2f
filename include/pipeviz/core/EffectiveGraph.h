#pragma once

#include "Types.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pipeviz {

/// A node of the effective graph: a visible pipeline node or a collapsed modular pipeline
struct EffectiveNode {
    NodeId id = INVALID_NODE;
    std::string key;
    std::string label;
    NodeKind kind = NodeKind::Task;
};

/// An edge of the effective graph after collapse substitution
struct EffectiveEdge {
    EdgeId id = INVALID_EDGE;        ///< First original edge that maps onto this one
    NodeId from = INVALID_NODE;
    NodeId to = INVALID_NODE;
    bool synthetic = false;          ///< At least one endpoint was rewritten to a container
    std::vector<EdgeId> sourceEdges; ///< All original edges merged into this one

    bool sameEndpoints(const EffectiveEdge& other) const {
        return from == other.from && to == other.to;
    }
};

using EffectiveEdgeSet = std::vector<EffectiveEdge>;

/// Immutable-by-convention view handed to the layout engine
///
/// Node order is the model's insertion order, edge order is the order of the
/// first original edge of each effective edge. Both orders are part of the
/// determinism contract of the layout engine.
class EffectiveGraph {
public:
    EffectiveGraph() = default;

    /// Build from precomputed sets; throws std::invalid_argument on unknown endpoints
    EffectiveGraph(std::vector<EffectiveNode> nodes, EffectiveEdgeSet edges);

    // Incremental construction (synthetic graphs, tests)
    NodeId addNode(const std::string& label, NodeKind kind = NodeKind::Task);
    NodeId addNode(const EffectiveNode& node);
    EdgeId addEdge(NodeId from, NodeId to);

    const std::vector<EffectiveNode>& nodes() const { return nodes_; }
    const EffectiveEdgeSet& edges() const { return edges_; }
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    bool contains(NodeId id) const { return index_.count(id) > 0; }
    const EffectiveNode* node(NodeId id) const;

    /// Position of the node in nodes() (insertion order)
    std::optional<size_t> indexOf(NodeId id) const;

    std::vector<NodeId> successors(NodeId id) const;
    std::vector<NodeId> predecessors(NodeId id) const;
    const EffectiveEdge* findEdge(NodeId from, NodeId to) const;

    /// Nodes reachable from id following edges in the given direction (id excluded)
    std::vector<NodeId> reachable(NodeId id, EdgeDirection direction) const;

    bool isAcyclic() const;

private:
    void indexEdge(size_t edgeIndex);

    std::vector<EffectiveNode> nodes_;
    EffectiveEdgeSet edges_;
    std::unordered_map<NodeId, size_t> index_;
    std::vector<std::vector<size_t>> out_;   ///< Edge indices per node index
    std::vector<std::vector<size_t>> in_;
};

}  // namespace pipeviz
