#include "LayerAssignment.h"
#include "pipeviz/layout/api/LayoutInternalError.h"

#include <algorithm>
#include <queue>

namespace pipeviz {

std::vector<int> LongestPathLayerAssignment::assignRanks(const EffectiveGraph& graph) const {
    const size_t count = graph.nodeCount();
    std::vector<int> ranks(count, 0);
    std::vector<size_t> remaining(count, 0);

    for (const auto& edge : graph.edges()) {
        ++remaining[*graph.indexOf(edge.to)];
    }

    std::queue<size_t> ready;
    for (size_t i = 0; i < count; ++i) {
        if (remaining[i] == 0) ready.push(i);
    }

    size_t processed = 0;
    while (!ready.empty()) {
        size_t current = ready.front();
        ready.pop();
        ++processed;

        for (NodeId succ : graph.successors(graph.nodes()[current].id)) {
            size_t next = *graph.indexOf(succ);
            ranks[next] = std::max(ranks[next], ranks[current] + 1);
            if (--remaining[next] == 0) {
                ready.push(next);
            }
        }
    }

    if (processed != count) {
        throw LayoutInternalError("Effective graph contains a cycle; " +
                                  std::to_string(count - processed) + " nodes unranked");
    }
    return ranks;
}

}  // namespace pipeviz
