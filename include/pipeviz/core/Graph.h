#pragma once

#include "Types.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace pipeviz {

struct NodeData {
    NodeId id = INVALID_NODE;
    std::string key;                 ///< Stable id from the snapshot
    std::string label;               ///< Display name
    NodeKind kind = NodeKind::Task;
    std::vector<std::string> tags;   ///< Sorted, unique

    NodeData() = default;
    NodeData(std::string k, std::string lbl, NodeKind nodeKind = NodeKind::Task)
        : key(std::move(k)), label(std::move(lbl)), kind(nodeKind) {}

    bool hasTag(const std::string& tag) const;
    bool isModularPipeline() const { return kind == NodeKind::ModularPipeline; }
};

struct EdgeData {
    EdgeId id = INVALID_EDGE;
    NodeId from = INVALID_NODE;
    NodeId to = INVALID_NODE;

    EdgeData() = default;
    EdgeData(NodeId f, NodeId t) : from(f), to(t) {}
};

/// Directed graph storage with stable, sequential ids
///
/// Node ids are assigned in insertion order and never reused. Each node also
/// carries its snapshot key, which is unique across the graph.
class Graph {
public:
    Graph() = default;
    virtual ~Graph() = default;

    // Node operations
    NodeId addNode(const std::string& key, const std::string& label,
                   NodeKind kind = NodeKind::Task);
    virtual NodeId addNode(const NodeData& data);
    bool hasNode(NodeId id) const;

    // Node access API:
    // - getNode(): throws std::out_of_range if ID is invalid.
    // - tryGetNode(): returns std::nullopt if ID is invalid (copy, safe for stale ids).
    // - findNode(): resolves a snapshot key.
    const NodeData& getNode(NodeId id) const;
    std::optional<NodeData> tryGetNode(NodeId id) const;
    std::optional<NodeId> findNode(const std::string& key) const;

    // Edge operations
    EdgeId addEdge(NodeId from, NodeId to);
    virtual EdgeId addEdge(const EdgeData& data);
    bool hasEdge(EdgeId id) const;

    const EdgeData& getEdge(EdgeId id) const;
    std::optional<EdgeData> tryGetEdge(EdgeId id) const;

    // Queries
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }

    std::vector<NodeId> nodes() const;
    std::vector<EdgeId> edges() const;

    std::vector<NodeId> successors(NodeId id) const;
    std::vector<NodeId> predecessors(NodeId id) const;
    const std::vector<EdgeId>& outEdges(NodeId id) const;
    const std::vector<EdgeId>& inEdges(NodeId id) const;

    size_t inDegree(NodeId id) const { return inEdges(id).size(); }
    size_t outDegree(NodeId id) const { return outEdges(id).size(); }

    std::optional<EdgeId> findEdge(NodeId from, NodeId to) const;

    /// Kahn's algorithm over all edges; nullopt when the graph has a cycle
    std::optional<std::vector<NodeId>> topologicalOrder() const;

    virtual void clear();

protected:
    std::vector<NodeData> nodes_;
    std::vector<EdgeData> edges_;
    std::unordered_map<std::string, NodeId> keyIndex_;

    // Adjacency lists, indexed by NodeId
    std::vector<std::vector<EdgeId>> outEdges_;
    std::vector<std::vector<EdgeId>> inEdges_;
};

}  // namespace pipeviz
