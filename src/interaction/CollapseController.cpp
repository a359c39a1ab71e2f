#include "pipeviz/interaction/CollapseController.h"
#include "pipeviz/common/Logger.h"

#include <set>

namespace pipeviz {

const char* toString(CollapseState state) {
    return state == CollapseState::Collapsed ? "collapsed" : "expanded";
}

CollapseController::CollapseController(PipelineGraph& graph)
    : graph_(graph) {}

CollapseState CollapseController::state(NodeId pipeline) const {
    return graph_.isCollapsed(pipeline) ? CollapseState::Collapsed : CollapseState::Expanded;
}

ToggleOutcome CollapseController::toggle(NodeId pipeline, const LayoutResult* previous) {
    CollapseState target = state(pipeline) == CollapseState::Collapsed ? CollapseState::Expanded
                                                                      : CollapseState::Collapsed;
    return transition(pipeline, target, previous);
}

ToggleOutcome CollapseController::collapse(NodeId pipeline, const LayoutResult* previous) {
    return transition(pipeline, CollapseState::Collapsed, previous);
}

ToggleOutcome CollapseController::expand(NodeId pipeline, const LayoutResult* previous) {
    return transition(pipeline, CollapseState::Expanded, previous);
}

ToggleOutcome CollapseController::transition(NodeId pipeline, CollapseState target,
                                             const LayoutResult* previous) {
    if (!graph_.isPipeline(pipeline)) {
        LOG_DEBUG("Collapse command on non-pipeline node {}", pipeline);
        return ToggleOutcome::refused(std::nullopt, graph_.effectiveEdges(),
                                      "not a modular pipeline");
    }

    CollapseState current = state(pipeline);
    if (current == target) {
        return ToggleOutcome::refused(current, graph_.effectiveEdges(),
                                      std::string("already ") + toString(current));
    }

    bool collapsed = target == CollapseState::Collapsed;
    if (!graph_.canSetCollapsed(pipeline, collapsed)) {
        const std::string& key = graph_.getNode(pipeline).key;
        LOG_WARN("Refusing to {} '{}': effective graph would contain a cycle",
                 collapsed ? "collapse" : "expand", key);
        return ToggleOutcome::refused(current, graph_.effectiveEdges(),
                                      "effective graph would contain a cycle");
    }

    // Ranks must be read before the model changes representatives
    RelayoutRequest relayout = relayoutFor({pipeline}, previous);

    ToggleOutcome outcome;
    outcome.edges = graph_.setCollapsed(pipeline, collapsed);
    outcome.applied = true;
    outcome.from = current;
    outcome.to = target;
    outcome.relayout = std::move(relayout);

    LOG_DEBUG("Pipeline '{}' {} -> {}", graph_.getNode(pipeline).key, toString(current),
              toString(target));
    return outcome;
}

ToggleOutcome CollapseController::collapseAll(const LayoutResult* previous) {
    std::vector<std::pair<NodeId, bool>> changes;
    for (NodeId pipeline : graph_.topLevelPipelines()) {
        changes.emplace_back(pipeline, true);
    }
    return applyMany(changes, previous, "collapse all");
}

ToggleOutcome CollapseController::expandAll(const LayoutResult* previous) {
    std::vector<std::pair<NodeId, bool>> changes;
    for (NodeId pipeline : graph_.pipelines()) {
        changes.emplace_back(pipeline, false);
    }
    return applyMany(changes, previous, "expand all");
}

ToggleOutcome CollapseController::resetToDefaults(const LayoutResult* previous) {
    std::vector<std::pair<NodeId, bool>> changes;
    for (NodeId pipeline : graph_.pipelines()) {
        changes.emplace_back(pipeline, graph_.defaultCollapsed(pipeline));
    }
    return applyMany(changes, previous, "reset collapse state");
}

ToggleOutcome CollapseController::applyMany(const std::vector<std::pair<NodeId, bool>>& changes,
                                            const LayoutResult* previous, const char* what) {
    std::vector<NodeId> touched;
    for (const auto& [pipeline, collapsed] : changes) {
        if (graph_.isCollapsed(pipeline) != collapsed) {
            touched.push_back(pipeline);
        }
    }
    if (touched.empty()) {
        return ToggleOutcome::refused(std::nullopt, graph_.effectiveEdges(),
                                      "nothing to change");
    }

    RelayoutRequest relayout = relayoutFor(touched, previous);
    uint64_t before = graph_.stateVersion();
    EffectiveEdgeSet edges = graph_.setCollapsedMany(changes);
    if (graph_.stateVersion() == before) {
        LOG_WARN("Refusing to {}: effective graph would contain a cycle", what);
        return ToggleOutcome::refused(std::nullopt, std::move(edges),
                                      "effective graph would contain a cycle");
    }

    ToggleOutcome outcome;
    outcome.applied = true;
    outcome.edges = std::move(edges);
    outcome.relayout = std::move(relayout);
    return outcome;
}

RelayoutRequest CollapseController::relayoutFor(const std::vector<NodeId>& pipelines,
                                                const LayoutResult* previous) const {
    RelayoutRequest request;
    request.needed = true;
    if (!previous || previous->empty()) {
        request.wholeGraph = true;
        return request;
    }

    std::set<int> ranks;
    auto addRank = [&](NodeId id) {
        if (const NodeLayout* node = previous->getNodeLayout(id)) {
            ranks.insert(node->rank);
        }
    };

    for (NodeId pipeline : pipelines) {
        if (auto rep = graph_.representative(pipeline)) {
            addRank(*rep);
        }
        for (NodeId member : graph_.nodesInPipeline(pipeline)) {
            addRank(member);
        }
    }

    request.affectedRanks.assign(ranks.begin(), ranks.end());
    return request;
}

}  // namespace pipeviz
