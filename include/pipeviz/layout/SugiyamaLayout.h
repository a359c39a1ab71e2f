#pragma once

#include "api/ILayout.h"
#include "config/LayoutOptions.h"
#include "config/LayoutResult.h"

#include <memory>

namespace pipeviz {

class ILayerAssignment;
class ICrossingMinimization;
class ICoordinateAssignment;

/// Statistics of the last layout pass
struct LayoutStats {
    int layerCount = 0;
    int maxLayerWidth = 0;          ///< Most effective nodes in one rank
    int edgeCrossings = 0;
    int dummyNodes = 0;
    int passes = 0;                 ///< Crossing-minimization passes run
    int relaxationIterations = 0;
    bool converged = false;         ///< Relaxation stopped below tolerance
    bool fellBack = false;          ///< Degenerate single-column layout was returned
};

/// Sugiyama-style layered layout of an effective graph
///
/// Implements the classic layered graph drawing approach:
/// 1. Rank Assignment - Longest path from the sources, dummies on long edges
/// 2. Crossing Minimization - Layer sweeps seeded by the previous layout
/// 3. X Assignment - Bounded relaxation with minimum separation
/// 4. Y Assignment - Fixed rank height
/// 5. Edge Routing - Smoothed polylines through the dummy chains
///
/// The input is never cyclic while the pipeline model holds its invariants. If
/// a phase still fails, the error is logged and a single-column layout returned.
class SugiyamaLayout : public ILayout {
public:
    SugiyamaLayout();
    explicit SugiyamaLayout(const LayoutOptions& options);
    ~SugiyamaLayout() override;

    // Non-copyable, movable
    SugiyamaLayout(const SugiyamaLayout&) = delete;
    SugiyamaLayout& operator=(const SugiyamaLayout&) = delete;
    SugiyamaLayout(SugiyamaLayout&&) noexcept;
    SugiyamaLayout& operator=(SugiyamaLayout&&) noexcept;

    void setOptions(const LayoutOptions& options) override;
    const LayoutOptions& options() const override { return options_; }

    LayoutResult layout(const EffectiveGraph& graph,
                        const LayoutResult* previous = nullptr) override;

    const LayoutStats& lastStats() const { return stats_; }

    /// Algorithm injection (for swapping implementations)
    void setLayerAssignment(std::shared_ptr<ILayerAssignment> impl);
    void setCrossingMinimization(std::shared_ptr<ICrossingMinimization> impl);
    void setCoordinateAssignment(std::shared_ptr<ICoordinateAssignment> impl);

private:
    LayoutOptions options_;
    LayoutStats stats_;

    std::shared_ptr<ILayerAssignment> layerAssignment_;
    std::shared_ptr<ICrossingMinimization> crossingMinimization_;
    std::shared_ptr<ICoordinateAssignment> coordinateAssignment_;

    struct LayoutState;
    std::unique_ptr<LayoutState> state_;

    void measureNodes();
    void assignRanks();
    void seedOrder(const LayoutResult* previous);
    void minimizeCrossings();
    void assignCoordinates();
    void routeEdges();

    LayoutResult fallbackLayout() const;
};

}  // namespace pipeviz
