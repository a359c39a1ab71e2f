#pragma once

#include "../core/EffectiveGraph.h"
#include "../core/Types.h"

#include <vector>

namespace pipeviz {

/// Node of the layered graph: an effective node or an edge dummy
struct LayeredNode {
    NodeId id = INVALID_NODE;    ///< Effective node id; INVALID_NODE for dummies
    size_t edgeIndex = 0;        ///< Owning effective edge (dummies only)
    bool dummy = false;
    int rank = 0;
    Size size;
};

/**
 * @brief Proper layered graph built from ranks: every edge spans exactly one rank
 *
 * Indices 0..n-1 are the effective nodes in effective-graph order, dummies
 * follow in edge order. up/down list the adjacent-rank neighbours of each
 * index in edge order.
 */
struct LayeredGraph {
    std::vector<LayeredNode> nodes;
    std::vector<std::vector<size_t>> up;      ///< Neighbours one rank above
    std::vector<std::vector<size_t>> down;    ///< Neighbours one rank below
    std::vector<std::vector<size_t>> ranks;   ///< Node indices per rank, current order
    std::vector<std::vector<size_t>> chains;  ///< Per effective edge: source, dummies..., target
    size_t realNodeCount = 0;

    int rankCount() const { return static_cast<int>(ranks.size()); }
    size_t dummyCount() const { return nodes.size() - realNodeCount; }

    /**
     * @brief Insert dummies and build adjacency
     * @param graph Effective graph
     * @param nodeRanks Rank per effective node (effective-graph order)
     * @param sizes Size per effective node
     * @param dummySize Size given to dummies
     * @throws LayoutInternalError if an edge does not point to a strictly higher rank
     */
    static LayeredGraph build(const EffectiveGraph& graph,
                              const std::vector<int>& nodeRanks,
                              const std::vector<Size>& sizes,
                              Size dummySize = {});
};

}  // namespace pipeviz
