#pragma once

#include "EffectiveGraph.h"
#include "FilterState.h"
#include "Graph.h"
#include "LoadError.h"
#include "PipelineSnapshot.h"
#include "RunMetricStore.h"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pipeviz {

/**
 * @brief Validated pipeline model with a modular-pipeline forest
 *
 * Snapshot nodes (tasks, datasets, parameters) get the first ids in snapshot
 * order; modular pipelines follow as NodeKind::ModularPipeline nodes. Raw edges
 * only ever connect snapshot nodes ("leaves"). A modular pipeline becomes part
 * of the effective graph only while it is collapsed and not itself hidden by a
 * collapsed ancestor.
 *
 * Every mutation returns the new effective edge set. Mutations that would make
 * the effective graph cyclic are refused and leave the state unchanged.
 */
class PipelineGraph : public Graph {
public:
    PipelineGraph() = default;
    ~PipelineGraph() override = default;

    using Graph::addNode;
    using Graph::addEdge;

    /// Validate a snapshot and build the model; throws LoadError
    static PipelineGraph build(const PipelineSnapshot& snapshot);

    NodeId addNode(const NodeData& data) override;
    EdgeId addEdge(const EdgeData& data) override;

    // =========================================================================
    // Hierarchy
    // =========================================================================

    bool isPipeline(NodeId id) const;
    std::vector<NodeId> pipelines() const;
    std::vector<NodeId> topLevelPipelines() const;

    std::optional<NodeId> getParent(NodeId id) const;
    std::vector<NodeId> getChildren(NodeId id) const;

    /// Enclosing modular pipelines, innermost first
    std::vector<NodeId> membership(NodeId id) const;

    /// All nested members of a pipeline (nodes and pipelines), pre-order
    std::vector<NodeId> nodesInPipeline(NodeId pipeline) const;

    /// Nested snapshot nodes of a pipeline, ascending id
    const std::vector<NodeId>& leavesOf(NodeId pipeline) const;

    bool isAncestorOf(NodeId ancestor, NodeId descendant) const;

    // =========================================================================
    // Edge reachability (raw graph)
    // =========================================================================

    std::vector<NodeId> neighbors(NodeId id, EdgeDirection direction) const;
    std::vector<NodeId> ancestors(NodeId id) const;
    std::vector<NodeId> descendants(NodeId id) const;

    // =========================================================================
    // State
    // =========================================================================

    bool isCollapsed(NodeId pipeline) const;
    bool defaultCollapsed(NodeId pipeline) const;

    /// True when a collapsed ancestor hides the node or pipeline
    bool isHiddenByCollapse(NodeId id) const;

    /// True when setVisibility(id, false) was called on the node or an ancestor
    bool isExplicitlyHidden(NodeId id) const;

    /// True when the active filters reject the node (pipelines aggregate members)
    bool isFilteredOut(NodeId id) const;

    /// Member of the current effective graph
    bool isVisible(NodeId id) const;

    /// Effective node that stands for id (itself or a collapsed container)
    std::optional<NodeId> representative(NodeId id) const;

    const FilterState& filters() const { return filters_; }
    std::optional<NodeId> focusedPipeline() const { return focusedPipeline_; }

    /// Incremented on every applied mutation
    uint64_t stateVersion() const { return stateVersion_; }

    // =========================================================================
    // Mutations
    // =========================================================================

    EffectiveEdgeSet setVisibility(NodeId id, bool visible);
    EffectiveEdgeSet setCollapsed(NodeId pipeline, bool collapsed);
    EffectiveEdgeSet setTagFilter(std::set<std::string> tags);
    EffectiveEdgeSet setSearchFilter(std::string search);
    EffectiveEdgeSet setKindFilter(std::set<NodeKind> kinds);
    EffectiveEdgeSet setRegisteredPipeline(std::optional<std::string> pipelineId);
    EffectiveEdgeSet setFocusedPipeline(std::optional<NodeId> pipeline);

    /// Apply collapse flags for several pipelines at once; refused as a whole if cyclic
    EffectiveEdgeSet setCollapsedMany(const std::vector<std::pair<NodeId, bool>>& changes);

    /// True when setCollapsed(pipeline, collapsed) would keep the effective graph acyclic
    bool canSetCollapsed(NodeId pipeline, bool collapsed) const;

    // =========================================================================
    // Effective graph
    // =========================================================================

    std::vector<NodeId> visibleNodes() const;
    EffectiveEdgeSet effectiveEdges() const;
    EffectiveGraph effectiveGraph() const;

    // =========================================================================
    // Snapshot extras
    // =========================================================================

    const std::vector<RegisteredPipelineSpec>& registeredPipelines() const {
        return registeredPipelines_;
    }

    /// Registered pipelines a snapshot node belongs to (empty = all)
    const std::vector<std::string>& registeredPipelinesOf(NodeId id) const;

    const RunMetricStore& runMetrics() const { return runMetrics_; }

    void clear() override;

private:
    struct HierarchyInfo {
        NodeId parent = INVALID_NODE;
        std::vector<NodeId> children;
        std::vector<NodeId> leaves;       ///< Pipelines only
        bool collapsed = false;
        bool defaultCollapsed = false;
        bool explicitlyHidden = false;
        std::vector<std::string> registered;  ///< Leaves only
    };

    /// Result of one effective-graph computation
    struct Projection {
        std::vector<NodeId> rep;      ///< Representative per NodeId (INVALID_NODE = outside scope)
        std::vector<bool> visible;    ///< Per NodeId
        std::vector<NodeId> nodes;    ///< Visible nodes, ascending id
        EffectiveEdgeSet edges;
    };

    void setParent(NodeId child, NodeId parent);
    void collectLeaves();
    void validateCollapseStates() const;

    bool passesLeafFilters(NodeId leaf) const;
    bool passesPipelineFilters(NodeId pipeline) const;

    Projection project(const std::vector<bool>& collapsed,
                       std::optional<NodeId> focus) const;
    const Projection& current() const;
    std::vector<bool> collapseFlags() const;

    /// Flags must stay acyclic once the pipeline focus is cleared
    bool acyclicWithoutFocus(const std::vector<bool>& flags) const;
    EffectiveGraph toEffectiveGraph(const Projection& projection) const;

    void bumpVersion();

    std::vector<HierarchyInfo> hierarchy_;   ///< Indexed by NodeId
    FilterState filters_;
    std::optional<NodeId> focusedPipeline_;
    std::vector<RegisteredPipelineSpec> registeredPipelines_;
    RunMetricStore runMetrics_;
    uint64_t stateVersion_ = 0;

    // Projection of the current state, rebuilt lazily when stateVersion_ moves
    mutable Projection cached_;
    mutable uint64_t cachedVersion_ = UINT64_MAX;
};

}  // namespace pipeviz
