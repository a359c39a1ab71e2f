#include "pipeviz/layout/CoordinateRelaxation.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace pipeviz {

CoordinateRelaxation::CoordinateRelaxation(const LayeredGraph& graph, const LayoutOptions& options)
    : graph_(graph)
    , nodeSeparation_(options.nodeSeparation)
    , edgeSeparation_(options.edgeSeparation)
    , tolerance_(options.relaxationTolerance)
    , maxIterations_(std::max(0, options.relaxationMaxIterations)) {
    initialPlacement();
    converged_ = graph_.nodes.empty();
}

float CoordinateRelaxation::gap(size_t left, size_t right) const {
    const LayeredNode& a = graph_.nodes[left];
    const LayeredNode& b = graph_.nodes[right];
    float separation = (a.dummy || b.dummy) ? edgeSeparation_ : nodeSeparation_;
    return (a.size.width + b.size.width) / 2.0f + separation;
}

void CoordinateRelaxation::initialPlacement() {
    x_.assign(graph_.nodes.size(), 0.0f);

    std::vector<float> widths(graph_.ranks.size(), 0.0f);
    for (size_t r = 0; r < graph_.ranks.size(); ++r) {
        const auto& rank = graph_.ranks[r];
        if (rank.empty()) continue;
        x_[rank[0]] = graph_.nodes[rank[0]].size.width / 2.0f;
        for (size_t i = 1; i < rank.size(); ++i) {
            x_[rank[i]] = x_[rank[i - 1]] + gap(rank[i - 1], rank[i]);
        }
        widths[r] = x_[rank.back()] + graph_.nodes[rank.back()].size.width / 2.0f;
    }

    float widest = widths.empty() ? 0.0f : *std::max_element(widths.begin(), widths.end());
    for (size_t r = 0; r < graph_.ranks.size(); ++r) {
        float shift = (widest - widths[r]) / 2.0f;
        for (size_t node : graph_.ranks[r]) {
            x_[node] += shift;
        }
    }
}

bool CoordinateRelaxation::next() {
    if (done()) {
        return false;
    }

    float maxMove = 0.0f;
    const size_t rankCount = graph_.ranks.size();
    bool downward = iterations_ % 2 == 0;
    for (size_t i = 0; i < rankCount; ++i) {
        size_t r = downward ? i : rankCount - 1 - i;
        maxMove = std::max(maxMove, relaxRank(r));
    }

    ++iterations_;
    lastDisplacement_ = maxMove;
    if (maxMove < tolerance_) {
        converged_ = true;
    }
    return true;
}

float CoordinateRelaxation::relaxRank(size_t r) {
    const auto& rank = graph_.ranks[r];
    if (rank.empty()) return 0.0f;

    // Targets relative to the packed offsets turn separation into monotonicity
    std::vector<float> offset(rank.size(), 0.0f);
    std::vector<float> target(rank.size(), 0.0f);
    for (size_t i = 0; i < rank.size(); ++i) {
        if (i > 0) {
            offset[i] = offset[i - 1] + gap(rank[i - 1], rank[i]);
        }

        size_t node = rank[i];
        float sum = 0.0f;
        size_t count = 0;
        for (size_t neighbor : graph_.up[node]) {
            sum += x_[neighbor];
            ++count;
        }
        for (size_t neighbor : graph_.down[node]) {
            sum += x_[neighbor];
            ++count;
        }
        float desired = count > 0 ? sum / static_cast<float>(count) : x_[node];
        target[i] = desired - offset[i];
    }

    // Pool adjacent violators: non-decreasing fit with unit weights
    struct Block {
        double sum;
        size_t count;
        size_t end;
        double mean() const { return sum / static_cast<double>(count); }
    };
    std::vector<Block> blocks;
    for (size_t i = 0; i < target.size(); ++i) {
        blocks.push_back(Block{target[i], 1, i + 1});
        while (blocks.size() > 1 && blocks[blocks.size() - 2].mean() > blocks.back().mean()) {
            Block last = blocks.back();
            blocks.pop_back();
            blocks.back().sum += last.sum;
            blocks.back().count += last.count;
            blocks.back().end = last.end;
        }
    }

    float maxMove = 0.0f;
    size_t i = 0;
    for (const Block& block : blocks) {
        float value = static_cast<float>(block.mean());
        for (; i < block.end; ++i) {
            float updated = value + offset[i];
            maxMove = std::max(maxMove, std::abs(updated - x_[rank[i]]));
            x_[rank[i]] = updated;
        }
    }
    return maxMove;
}

std::vector<float> CoordinateRelaxation::normalizedCenters() const {
    std::vector<float> result = x_;
    if (result.empty()) return result;

    float minLeft = std::numeric_limits<float>::max();
    for (size_t i = 0; i < result.size(); ++i) {
        minLeft = std::min(minLeft, result[i] - graph_.nodes[i].size.width / 2.0f);
    }
    for (float& x : result) {
        x -= minLeft;
    }
    return result;
}

}  // namespace pipeviz
