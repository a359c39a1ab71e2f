#include "CrossingMinimization.h"

#include <algorithm>
#include <numeric>
#include <utility>

namespace pipeviz {

namespace {

std::vector<int> positionsOf(const LayeredGraph& graph,
                             const std::vector<std::vector<size_t>>& ranks) {
    std::vector<int> position(graph.nodes.size(), 0);
    for (const auto& rank : ranks) {
        for (size_t i = 0; i < rank.size(); ++i) {
            position[rank[i]] = static_cast<int>(i);
        }
    }
    return position;
}

/// Fenwick tree over lower-rank positions for inversion counting
class FenwickTree {
public:
    explicit FenwickTree(size_t size) : tree_(size + 1, 0) {}

    void add(size_t index) {
        for (size_t i = index + 1; i < tree_.size(); i += i & (~i + 1)) {
            ++tree_[i];
        }
    }

    /// Number of inserted values <= index
    int prefix(size_t index) const {
        int sum = 0;
        for (size_t i = index + 1; i > 0; i -= i & (~i + 1)) {
            sum += tree_[i];
        }
        return sum;
    }

private:
    std::vector<int> tree_;
};

}  // namespace

CrossingMinimizationResult BarycenterCrossingMinimization::minimize(
    const LayeredGraph& graph,
    std::vector<std::vector<size_t>> ranks,
    CrossingStrategy strategy,
    int passes) const {

    CrossingMinimizationResult result;
    std::vector<int> position = positionsOf(graph, ranks);
    int bestCount = countCrossings(graph, ranks);

    result.ranks = ranks;
    result.crossingCount = bestCount;

    if (ranks.size() < 2 || strategy == CrossingStrategy::None) {
        return result;
    }

    for (int pass = 0; pass < passes && bestCount > 0; ++pass) {
        sweep(graph, ranks, position, strategy, true);
        sweep(graph, ranks, position, strategy, false);
        ++result.passes;

        int count = countCrossings(graph, ranks);
        if (count < bestCount) {
            bestCount = count;
            result.ranks = ranks;
        }
    }

    result.crossingCount = bestCount;
    return result;
}

int BarycenterCrossingMinimization::countCrossings(
    const LayeredGraph& graph,
    const std::vector<std::vector<size_t>>& ranks) const {

    std::vector<int> position = positionsOf(graph, ranks);
    int total = 0;
    for (size_t r = 0; r + 1 < ranks.size(); ++r) {
        total += countCrossingsBetween(graph, ranks, position, r);
    }
    return total;
}

int BarycenterCrossingMinimization::countCrossingsBetween(
    const LayeredGraph& graph,
    const std::vector<std::vector<size_t>>& ranks,
    const std::vector<int>& position,
    size_t rank) const {

    std::vector<std::pair<int, int>> segments;
    for (size_t upper : ranks[rank]) {
        for (size_t lower : graph.down[upper]) {
            segments.emplace_back(position[upper], position[lower]);
        }
    }
    std::sort(segments.begin(), segments.end());

    // Two segments cross when their lower ends are inverted
    FenwickTree tree(ranks[rank + 1].size());
    int crossings = 0;
    int inserted = 0;
    for (const auto& [upperPos, lowerPos] : segments) {
        crossings += inserted - tree.prefix(static_cast<size_t>(lowerPos));
        tree.add(static_cast<size_t>(lowerPos));
        ++inserted;
    }
    return crossings;
}

void BarycenterCrossingMinimization::sweep(
    const LayeredGraph& graph,
    std::vector<std::vector<size_t>>& ranks,
    std::vector<int>& position,
    CrossingStrategy strategy,
    bool downward) const {

    auto reorder = [&](size_t r) {
        auto& rank = ranks[r];
        std::vector<std::pair<float, size_t>> keyed;
        keyed.reserve(rank.size());
        for (size_t node : rank) {
            const auto& neighbors = downward ? graph.up[node] : graph.down[node];
            keyed.emplace_back(sortKey(neighbors, position, position[node], strategy), node);
        }

        std::stable_sort(keyed.begin(), keyed.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });

        for (size_t i = 0; i < keyed.size(); ++i) {
            rank[i] = keyed[i].second;
            position[rank[i]] = static_cast<int>(i);
        }
    };

    if (downward) {
        for (size_t r = 1; r < ranks.size(); ++r) reorder(r);
    } else {
        for (size_t r = ranks.size() - 1; r-- > 0;) reorder(r);
    }
}

float BarycenterCrossingMinimization::sortKey(const std::vector<size_t>& neighbors,
                                             const std::vector<int>& position,
                                             int ownPosition,
                                             CrossingStrategy strategy) {
    if (neighbors.empty()) {
        return static_cast<float>(ownPosition);
    }

    std::vector<int> positions;
    positions.reserve(neighbors.size());
    for (size_t neighbor : neighbors) {
        positions.push_back(position[neighbor]);
    }

    if (strategy == CrossingStrategy::Median) {
        std::sort(positions.begin(), positions.end());
        size_t mid = positions.size() / 2;
        if (positions.size() % 2 == 1) {
            return static_cast<float>(positions[mid]);
        }
        return (positions[mid - 1] + positions[mid]) / 2.0f;
    }

    float sum = std::accumulate(positions.begin(), positions.end(), 0.0f);
    return sum / static_cast<float>(positions.size());
}

}  // namespace pipeviz
