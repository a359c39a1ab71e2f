#pragma once

#include "pipeviz/core/EffectiveGraph.h"
#include "pipeviz/layout/LayeredGraph.h"
#include "pipeviz/layout/config/LayoutOptions.h"
#include "pipeviz/layout/config/LayoutResult.h"

#include <vector>

namespace pipeviz {

/// Vertical extent shared by all ranks
struct RankGeometry {
    float rankHeight = 0.0f;   ///< Tallest node + rank separation
    float tallest = 0.0f;      ///< Tallest node height

    float top(int rank) const { return static_cast<float>(rank) * rankHeight; }
    float middle(int rank) const { return top(rank) + tallest / 2.0f; }
};

/// Routes effective edges through their dummy chains
///
/// Path: source bottom-centre, a short vertical stub, one point per dummy,
/// a stub above the target, target top-centre. Interior corners are cut
/// with Chaikin smoothing; the two boundary points never move.
class EdgeRouting {
public:
    static EdgeLayout route(const EffectiveEdge& edge,
                            const std::vector<size_t>& chain,
                            const LayeredGraph& layered,
                            const std::vector<float>& centerX,
                            const LayoutResult& nodes,
                            const RankGeometry& geometry,
                            const LayoutOptions& options);

    /// Straight connection between two placed nodes (fallback layout)
    static EdgeLayout straight(const EffectiveEdge& edge, const LayoutResult& nodes);

    /// Chaikin corner cutting with fixed end points
    static std::vector<Point> smooth(const std::vector<Point>& points, int iterations);
};

}  // namespace pipeviz
