#include "pipeviz/core/Graph.h"

#include <algorithm>
#include <queue>

namespace pipeviz {

namespace {
    const std::vector<EdgeId> kNoEdges;
}

bool NodeData::hasTag(const std::string& tag) const {
    return std::binary_search(tags.begin(), tags.end(), tag);
}

NodeId Graph::addNode(const std::string& key, const std::string& label, NodeKind kind) {
    return addNode(NodeData{key, label, kind});
}

NodeId Graph::addNode(const NodeData& data) {
    if (keyIndex_.count(data.key) > 0) {
        throw std::invalid_argument("Duplicate node key: " + data.key);
    }

    NodeId id = static_cast<NodeId>(nodes_.size());

    NodeData nodeData = data;
    nodeData.id = id;
    std::sort(nodeData.tags.begin(), nodeData.tags.end());
    nodeData.tags.erase(std::unique(nodeData.tags.begin(), nodeData.tags.end()),
                        nodeData.tags.end());

    keyIndex_.emplace(nodeData.key, id);
    nodes_.push_back(std::move(nodeData));
    outEdges_.emplace_back();
    inEdges_.emplace_back();

    return id;
}

bool Graph::hasNode(NodeId id) const {
    return id < nodes_.size();
}

const NodeData& Graph::getNode(NodeId id) const {
    if (!hasNode(id)) {
        throw std::out_of_range("Invalid node ID: " + std::to_string(id));
    }
    return nodes_[id];
}

std::optional<NodeData> Graph::tryGetNode(NodeId id) const {
    if (!hasNode(id)) {
        return std::nullopt;
    }
    return nodes_[id];
}

std::optional<NodeId> Graph::findNode(const std::string& key) const {
    auto it = keyIndex_.find(key);
    if (it == keyIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

EdgeId Graph::addEdge(NodeId from, NodeId to) {
    return addEdge(EdgeData{from, to});
}

EdgeId Graph::addEdge(const EdgeData& data) {
    if (!hasNode(data.from) || !hasNode(data.to)) {
        throw std::invalid_argument("Invalid node ID in edge");
    }

    EdgeId id = static_cast<EdgeId>(edges_.size());

    EdgeData edgeData = data;
    edgeData.id = id;
    edges_.push_back(edgeData);

    outEdges_[data.from].push_back(id);
    inEdges_[data.to].push_back(id);

    return id;
}

bool Graph::hasEdge(EdgeId id) const {
    return id < edges_.size();
}

const EdgeData& Graph::getEdge(EdgeId id) const {
    if (!hasEdge(id)) {
        throw std::out_of_range("Invalid edge ID: " + std::to_string(id));
    }
    return edges_[id];
}

std::optional<EdgeData> Graph::tryGetEdge(EdgeId id) const {
    if (!hasEdge(id)) {
        return std::nullopt;
    }
    return edges_[id];
}

std::vector<NodeId> Graph::nodes() const {
    std::vector<NodeId> result(nodes_.size());
    for (size_t i = 0; i < nodes_.size(); ++i) {
        result[i] = static_cast<NodeId>(i);
    }
    return result;
}

std::vector<EdgeId> Graph::edges() const {
    std::vector<EdgeId> result(edges_.size());
    for (size_t i = 0; i < edges_.size(); ++i) {
        result[i] = static_cast<EdgeId>(i);
    }
    return result;
}

std::vector<NodeId> Graph::successors(NodeId id) const {
    std::vector<NodeId> result;
    for (EdgeId edgeId : outEdges(id)) {
        result.push_back(edges_[edgeId].to);
    }
    return result;
}

std::vector<NodeId> Graph::predecessors(NodeId id) const {
    std::vector<NodeId> result;
    for (EdgeId edgeId : inEdges(id)) {
        result.push_back(edges_[edgeId].from);
    }
    return result;
}

const std::vector<EdgeId>& Graph::outEdges(NodeId id) const {
    if (!hasNode(id)) return kNoEdges;
    return outEdges_[id];
}

const std::vector<EdgeId>& Graph::inEdges(NodeId id) const {
    if (!hasNode(id)) return kNoEdges;
    return inEdges_[id];
}

std::optional<EdgeId> Graph::findEdge(NodeId from, NodeId to) const {
    for (EdgeId edgeId : outEdges(from)) {
        if (edges_[edgeId].to == to) {
            return edgeId;
        }
    }
    return std::nullopt;
}

std::optional<std::vector<NodeId>> Graph::topologicalOrder() const {
    std::vector<size_t> remaining(nodes_.size());
    std::queue<NodeId> ready;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        remaining[i] = inEdges_[i].size();
        if (remaining[i] == 0) {
            ready.push(static_cast<NodeId>(i));
        }
    }

    std::vector<NodeId> order;
    order.reserve(nodes_.size());
    while (!ready.empty()) {
        NodeId current = ready.front();
        ready.pop();
        order.push_back(current);
        for (EdgeId edgeId : outEdges_[current]) {
            NodeId next = edges_[edgeId].to;
            if (--remaining[next] == 0) {
                ready.push(next);
            }
        }
    }

    if (order.size() != nodes_.size()) {
        return std::nullopt;
    }
    return order;
}

void Graph::clear() {
    nodes_.clear();
    edges_.clear();
    keyIndex_.clear();
    outEdges_.clear();
    inEdges_.clear();
}

}  // namespace pipeviz
