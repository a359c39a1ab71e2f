#include "pipeviz/layout/LayeredGraph.h"
#include "pipeviz/layout/api/LayoutInternalError.h"

#include <algorithm>
#include <string>

namespace pipeviz {

LayeredGraph LayeredGraph::build(const EffectiveGraph& graph,
                                 const std::vector<int>& nodeRanks,
                                 const std::vector<Size>& sizes,
                                 Size dummySize) {
    if (nodeRanks.size() != graph.nodeCount() || sizes.size() != graph.nodeCount()) {
        throw LayoutInternalError("Rank or size table does not match the effective graph");
    }

    LayeredGraph layered;
    layered.realNodeCount = graph.nodeCount();

    int maxRank = -1;
    for (size_t i = 0; i < graph.nodeCount(); ++i) {
        LayeredNode node;
        node.id = graph.nodes()[i].id;
        node.rank = nodeRanks[i];
        node.size = sizes[i];
        layered.nodes.push_back(node);
        maxRank = std::max(maxRank, node.rank);
    }
    layered.up.resize(layered.nodes.size());
    layered.down.resize(layered.nodes.size());

    auto link = [&layered](size_t upper, size_t lower) {
        layered.down[upper].push_back(lower);
        layered.up[lower].push_back(upper);
    };

    const auto& edges = graph.edges();
    layered.chains.resize(edges.size());
    for (size_t e = 0; e < edges.size(); ++e) {
        size_t source = *graph.indexOf(edges[e].from);
        size_t target = *graph.indexOf(edges[e].to);
        int sourceRank = nodeRanks[source];
        int targetRank = nodeRanks[target];
        if (sourceRank >= targetRank) {
            throw LayoutInternalError("Edge " + std::to_string(edges[e].id) +
                                      " does not point to a higher rank");
        }

        auto& chain = layered.chains[e];
        chain.push_back(source);
        size_t previous = source;
        for (int r = sourceRank + 1; r < targetRank; ++r) {
            LayeredNode dummy;
            dummy.dummy = true;
            dummy.edgeIndex = e;
            dummy.rank = r;
            dummy.size = dummySize;
            size_t index = layered.nodes.size();
            layered.nodes.push_back(dummy);
            layered.up.emplace_back();
            layered.down.emplace_back();
            link(previous, index);
            chain.push_back(index);
            previous = index;
        }
        link(previous, target);
        chain.push_back(target);
    }

    layered.ranks.resize(static_cast<size_t>(maxRank + 1));
    for (size_t i = 0; i < layered.nodes.size(); ++i) {
        layered.ranks[static_cast<size_t>(layered.nodes[i].rank)].push_back(i);
    }
    return layered;
}

}  // namespace pipeviz
