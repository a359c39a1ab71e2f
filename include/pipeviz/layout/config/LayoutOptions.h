#pragma once

#include "../../core/Types.h"
#include "LayoutEnums.h"

#include <algorithm>
#include <string>

namespace pipeviz {

/// Tunable constants of the layered layout (pixels unless noted)
struct LayoutOptions {
    // Spacing
    float nodeSeparation = 30.0f;    ///< Minimum horizontal gap between two nodes of a rank
    float edgeSeparation = 12.0f;    ///< Minimum gap when either neighbour is an edge dummy
    float rankSeparation = 64.0f;    ///< Vertical gap between the tallest nodes of adjacent ranks

    // Node sizing from label length
    float nodeHeight = 36.0f;
    float pipelineNodeHeight = 48.0f;
    float charWidth = 7.0f;
    float labelPadding = 24.0f;
    float minNodeWidth = 60.0f;
    float maxNodeWidth = 280.0f;

    // Crossing minimization
    CrossingStrategy crossingStrategy = CrossingStrategy::Barycenter;
    int sweepPasses = 8;             ///< Each pass is one downward plus one upward sweep

    // X relaxation
    int relaxationMaxIterations = 200;
    float relaxationTolerance = 0.5f;   ///< Converged when no node moves further than this

    // Edge routing
    float edgeStubLength = 12.0f;    ///< Straight run leaving the source / entering the target
    int smoothingIterations = 2;     ///< Corner-cutting rounds

    // Group boxes around expanded modular pipelines
    float groupPadding = 16.0f;

    /// Rendered size of a node with the given label
    Size nodeSize(const std::string& label, NodeKind kind) const {
        float width = labelPadding + charWidth * static_cast<float>(label.size());
        width = std::clamp(width, minNodeWidth, std::max(minNodeWidth, maxNodeWidth));
        float height = kind == NodeKind::ModularPipeline ? pipelineNodeHeight : nodeHeight;
        return {width, height};
    }

    // Presets
    static LayoutOptions compact();
    static LayoutOptions balanced();
    static LayoutOptions spacious();

    // Builder pattern
    LayoutOptions& setNodeSeparation(float gap) { nodeSeparation = gap; return *this; }
    LayoutOptions& setEdgeSeparation(float gap) { edgeSeparation = gap; return *this; }
    LayoutOptions& setRankSeparation(float gap) { rankSeparation = gap; return *this; }
    LayoutOptions& setNodeHeight(float h) { nodeHeight = h; return *this; }
    LayoutOptions& setCrossingStrategy(CrossingStrategy s) { crossingStrategy = s; return *this; }
    LayoutOptions& setSweepPasses(int passes) { sweepPasses = passes; return *this; }
    LayoutOptions& setRelaxation(int maxIterations, float tolerance) {
        relaxationMaxIterations = maxIterations;
        relaxationTolerance = tolerance;
        return *this;
    }
    LayoutOptions& setSmoothingIterations(int iterations) {
        smoothingIterations = iterations;
        return *this;
    }
    LayoutOptions& setEdgeStubLength(float length) { edgeStubLength = length; return *this; }
    LayoutOptions& setGroupPadding(float padding) { groupPadding = padding; return *this; }
};

}  // namespace pipeviz
