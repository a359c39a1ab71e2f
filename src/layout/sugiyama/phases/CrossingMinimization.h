#pragma once

#include "pipeviz/layout/api/ICrossingMinimization.h"

namespace pipeviz {

/// Layer-sweep crossing minimization (barycenter or median)
///
/// Each pass is a downward sweep (upper rank fixed) followed by an upward
/// sweep. Sorting is stable, so equal keys keep the incoming order, and the
/// ordering with the fewest crossings seen so far is the one returned.
class BarycenterCrossingMinimization : public ICrossingMinimization {
public:
    BarycenterCrossingMinimization() = default;

    const char* algorithmName() const override { return "LayerSweep"; }

    CrossingMinimizationResult minimize(
        const LayeredGraph& graph,
        std::vector<std::vector<size_t>> ranks,
        CrossingStrategy strategy,
        int passes) const override;

    int countCrossings(
        const LayeredGraph& graph,
        const std::vector<std::vector<size_t>>& ranks) const override;

    /// Crossings between rank r and rank r + 1
    int countCrossingsBetween(const LayeredGraph& graph,
                              const std::vector<std::vector<size_t>>& ranks,
                              const std::vector<int>& position,
                              size_t rank) const;

private:
    void sweep(const LayeredGraph& graph,
               std::vector<std::vector<size_t>>& ranks,
               std::vector<int>& position,
               CrossingStrategy strategy,
               bool downward) const;

    static float sortKey(const std::vector<size_t>& neighbors,
                         const std::vector<int>& position,
                         int ownPosition,
                         CrossingStrategy strategy);
};

}  // namespace pipeviz
