#include "pipeviz/core/EffectiveGraph.h"

#include <queue>
#include <stdexcept>

namespace pipeviz {

EffectiveGraph::EffectiveGraph(std::vector<EffectiveNode> nodes, EffectiveEdgeSet edges) {
    nodes_.reserve(nodes.size());
    for (auto& node : nodes) {
        addNode(node);
    }
    edges_ = std::move(edges);
    for (size_t i = 0; i < edges_.size(); ++i) {
        if (!contains(edges_[i].from) || !contains(edges_[i].to)) {
            throw std::invalid_argument("Effective edge references a node outside the graph");
        }
        indexEdge(i);
    }
}

NodeId EffectiveGraph::addNode(const std::string& label, NodeKind kind) {
    EffectiveNode node;
    node.id = static_cast<NodeId>(nodes_.size());
    while (contains(node.id)) {
        ++node.id;
    }
    node.key = label;
    node.label = label;
    node.kind = kind;
    return addNode(node);
}

NodeId EffectiveGraph::addNode(const EffectiveNode& node) {
    if (node.id == INVALID_NODE || contains(node.id)) {
        throw std::invalid_argument("Invalid or duplicate effective node id");
    }
    index_.emplace(node.id, nodes_.size());
    nodes_.push_back(node);
    out_.emplace_back();
    in_.emplace_back();
    return node.id;
}

EdgeId EffectiveGraph::addEdge(NodeId from, NodeId to) {
    if (!contains(from) || !contains(to)) {
        throw std::invalid_argument("Invalid node ID in edge");
    }
    EffectiveEdge edge;
    edge.id = static_cast<EdgeId>(edges_.size());
    edge.from = from;
    edge.to = to;
    edge.sourceEdges.push_back(edge.id);
    edges_.push_back(edge);
    indexEdge(edges_.size() - 1);
    return edge.id;
}

void EffectiveGraph::indexEdge(size_t edgeIndex) {
    const EffectiveEdge& edge = edges_[edgeIndex];
    out_[index_.at(edge.from)].push_back(edgeIndex);
    in_[index_.at(edge.to)].push_back(edgeIndex);
}

const EffectiveNode* EffectiveGraph::node(NodeId id) const {
    auto it = index_.find(id);
    return it != index_.end() ? &nodes_[it->second] : nullptr;
}

std::optional<size_t> EffectiveGraph::indexOf(NodeId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::vector<NodeId> EffectiveGraph::successors(NodeId id) const {
    std::vector<NodeId> result;
    auto it = index_.find(id);
    if (it == index_.end()) return result;
    for (size_t edgeIndex : out_[it->second]) {
        result.push_back(edges_[edgeIndex].to);
    }
    return result;
}

std::vector<NodeId> EffectiveGraph::predecessors(NodeId id) const {
    std::vector<NodeId> result;
    auto it = index_.find(id);
    if (it == index_.end()) return result;
    for (size_t edgeIndex : in_[it->second]) {
        result.push_back(edges_[edgeIndex].from);
    }
    return result;
}

const EffectiveEdge* EffectiveGraph::findEdge(NodeId from, NodeId to) const {
    auto it = index_.find(from);
    if (it == index_.end()) return nullptr;
    for (size_t edgeIndex : out_[it->second]) {
        if (edges_[edgeIndex].to == to) {
            return &edges_[edgeIndex];
        }
    }
    return nullptr;
}

std::vector<NodeId> EffectiveGraph::reachable(NodeId id, EdgeDirection direction) const {
    std::vector<NodeId> result;
    auto start = index_.find(id);
    if (start == index_.end()) return result;

    std::vector<bool> seen(nodes_.size(), false);
    std::queue<size_t> queue;
    seen[start->second] = true;
    queue.push(start->second);

    while (!queue.empty()) {
        size_t current = queue.front();
        queue.pop();

        auto visit = [&](NodeId neighbor) {
            size_t idx = index_.at(neighbor);
            if (!seen[idx]) {
                seen[idx] = true;
                result.push_back(neighbor);
                queue.push(idx);
            }
        };

        if (direction != EdgeDirection::In) {
            for (size_t edgeIndex : out_[current]) visit(edges_[edgeIndex].to);
        }
        if (direction != EdgeDirection::Out) {
            for (size_t edgeIndex : in_[current]) visit(edges_[edgeIndex].from);
        }
    }
    return result;
}

bool EffectiveGraph::isAcyclic() const {
    std::vector<size_t> remaining(nodes_.size());
    std::queue<size_t> ready;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        remaining[i] = in_[i].size();
        if (remaining[i] == 0) ready.push(i);
    }

    size_t processed = 0;
    while (!ready.empty()) {
        size_t current = ready.front();
        ready.pop();
        ++processed;
        for (size_t edgeIndex : out_[current]) {
            size_t next = index_.at(edges_[edgeIndex].to);
            if (--remaining[next] == 0) ready.push(next);
        }
    }
    return processed == nodes_.size();
}

}  // namespace pipeviz
