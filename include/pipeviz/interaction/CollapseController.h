#pragma once

#include "pipeviz/core/EffectiveGraph.h"
#include "pipeviz/core/PipelineGraph.h"
#include "pipeviz/layout/config/LayoutResult.h"

#include <optional>
#include <string>
#include <vector>

namespace pipeviz {

/// Display state of one modular pipeline
enum class CollapseState {
    Expanded,
    Collapsed
};

const char* toString(CollapseState state);

/// Re-layout needed after a collapse transition
///
/// The engine always lays out the whole effective graph, seeded with the
/// previous layout; affectedRanks tells the host which part of the drawing
/// will move.
struct RelayoutRequest {
    bool needed = false;
    std::vector<int> affectedRanks;   ///< Sorted ranks of the previous layout touched by the change
    bool wholeGraph = false;          ///< No previous layout to compare with
};

/// Result of a toggle/collapse/expand command
struct ToggleOutcome {
    bool applied = false;
    /// State of the one pipeline a toggle/collapse/expand targeted; unset for
    /// bulk commands and for targets that are not modular pipelines
    std::optional<CollapseState> from;
    std::optional<CollapseState> to;
    RelayoutRequest relayout;
    EffectiveEdgeSet edges;           ///< Effective edges after the command
    std::string reason;               ///< Why the command was not applied

    static ToggleOutcome refused(std::optional<CollapseState> state, EffectiveEdgeSet edges,
                                 const std::string& reason) {
        ToggleOutcome outcome;
        outcome.from = state;
        outcome.to = state;
        outcome.edges = std::move(edges);
        outcome.reason = reason;
        return outcome;
    }
};

/**
 * @brief Expanded <-> Collapsed state machine of every modular pipeline
 *
 * Transitions happen only on explicit commands. A child keeps its own flag
 * while a collapsed ancestor hides it, so expanding the ancestor brings back
 * whatever the child showed before.
 *
 * A transition whose effective graph would contain a cycle is refused and
 * leaves the model untouched.
 */
class CollapseController {
public:
    explicit CollapseController(PipelineGraph& graph);

    CollapseState state(NodeId pipeline) const;

    /// Flip one pipeline
    /// @param previous Layout currently on screen (nullptr if none)
    ToggleOutcome toggle(NodeId pipeline, const LayoutResult* previous = nullptr);
    ToggleOutcome collapse(NodeId pipeline, const LayoutResult* previous = nullptr);
    ToggleOutcome expand(NodeId pipeline, const LayoutResult* previous = nullptr);

    /// Collapse every top-level pipeline; nested flags are left alone
    ToggleOutcome collapseAll(const LayoutResult* previous = nullptr);

    /// Expand every pipeline at every depth
    ToggleOutcome expandAll(const LayoutResult* previous = nullptr);

    /// Restore the collapse flags the snapshot was loaded with
    ToggleOutcome resetToDefaults(const LayoutResult* previous = nullptr);

private:
    ToggleOutcome transition(NodeId pipeline, CollapseState target, const LayoutResult* previous);
    ToggleOutcome applyMany(const std::vector<std::pair<NodeId, bool>>& changes,
                            const LayoutResult* previous, const char* what);

    RelayoutRequest relayoutFor(const std::vector<NodeId>& pipelines,
                                const LayoutResult* previous) const;

    PipelineGraph& graph_;
};

}  // namespace pipeviz
