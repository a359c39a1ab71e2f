#pragma once

#include "../../core/EffectiveGraph.h"

#include <vector>

namespace pipeviz {

/// Abstract interface for rank assignment
///
/// Implementations must give every edge a target rank strictly greater than
/// its source rank.
class ILayerAssignment {
public:
    virtual ~ILayerAssignment() = default;

    /// Rank per node, in graph.nodes() order
    /// @throws LayoutInternalError if the graph is cyclic
    virtual std::vector<int> assignRanks(const EffectiveGraph& graph) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace pipeviz
