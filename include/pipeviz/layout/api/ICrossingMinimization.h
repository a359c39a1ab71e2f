#pragma once

#include "../LayeredGraph.h"
#include "../config/LayoutEnums.h"

#include <vector>

namespace pipeviz {

/// Result of crossing minimization operation
struct CrossingMinimizationResult {
    std::vector<std::vector<size_t>> ranks;   ///< Reordered ranks (layered node indices)
    int crossingCount = 0;                    ///< Crossings of the returned ordering
    int passes = 0;                           ///< Sweep passes executed
};

/// Abstract interface for in-rank ordering
class ICrossingMinimization {
public:
    virtual ~ICrossingMinimization() = default;

    /**
     * @brief Reorder ranks to reduce crossings
     * @param graph Layered graph (adjacency)
     * @param ranks Initial ordering
     * @param strategy Sweep heuristic
     * @param passes Number of down+up sweep pairs
     */
    virtual CrossingMinimizationResult minimize(
        const LayeredGraph& graph,
        std::vector<std::vector<size_t>> ranks,
        CrossingStrategy strategy,
        int passes) const = 0;

    /// Count total crossings of an ordering
    virtual int countCrossings(
        const LayeredGraph& graph,
        const std::vector<std::vector<size_t>>& ranks) const = 0;

    virtual const char* algorithmName() const = 0;
};

}  // namespace pipeviz
