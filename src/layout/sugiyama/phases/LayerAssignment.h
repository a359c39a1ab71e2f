#pragma once

#include "pipeviz/layout/api/ILayerAssignment.h"

namespace pipeviz {

/// Longest-path rank assignment
///
/// Sources get rank 0; every other node sits one rank below its deepest
/// predecessor. Nodes are visited in Kahn order seeded by graph order.
class LongestPathLayerAssignment : public ILayerAssignment {
public:
    LongestPathLayerAssignment() = default;

    const char* algorithmName() const override { return "LongestPath"; }

    std::vector<int> assignRanks(const EffectiveGraph& graph) const override;
};

}  // namespace pipeviz
