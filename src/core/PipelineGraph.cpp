#include "pipeviz/core/PipelineGraph.h"
#include "pipeviz/common/Logger.h"

#include <algorithm>
#include <queue>
#include <unordered_map>
#include <unordered_set>

namespace pipeviz {

namespace {
    const std::vector<NodeId> kNoNodes;
    const std::vector<std::string> kNoPipelines;

    uint64_t edgeKey(NodeId from, NodeId to) {
        return (static_cast<uint64_t>(from) << 32) | to;
    }
}

// =============================================================================
// Build
// =============================================================================

PipelineGraph PipelineGraph::build(const PipelineSnapshot& snapshot) {
    PipelineGraph graph;
    std::unordered_set<std::string> ids;

    for (const auto& spec : snapshot.nodes) {
        if (spec.id.empty()) {
            throw LoadError(LoadError::Kind::MalformedSnapshot, "", "Node without id");
        }
        if (spec.kind == NodeKind::ModularPipeline) {
            throw LoadError(LoadError::Kind::MalformedSnapshot, spec.id,
                            "Node '" + spec.id + "' uses the modular pipeline kind");
        }
        if (!ids.insert(spec.id).second) {
            throw LoadError(LoadError::Kind::DuplicateId, spec.id,
                            "Duplicate node id '" + spec.id + "'");
        }
        NodeData data{spec.id, spec.name.empty() ? spec.id : spec.name, spec.kind};
        data.tags = spec.tags;
        NodeId id = graph.addNode(data);
        graph.hierarchy_[id].registered = spec.pipelines;
    }

    std::unordered_set<std::string> registeredIds;
    for (const auto& registered : snapshot.registeredPipelines) {
        if (!registeredIds.insert(registered.id).second) {
            throw LoadError(LoadError::Kind::DuplicateId, registered.id,
                            "Duplicate registered pipeline '" + registered.id + "'");
        }
        graph.registeredPipelines_.push_back(registered);
    }
    if (!registeredIds.empty()) {
        for (const auto& spec : snapshot.nodes) {
            for (const auto& pipelineId : spec.pipelines) {
                if (registeredIds.count(pipelineId) == 0) {
                    throw LoadError(LoadError::Kind::UnknownMember, pipelineId,
                                    "Node '" + spec.id + "' references unknown pipeline '" +
                                        pipelineId + "'");
                }
            }
        }
    }

    for (const auto& spec : snapshot.modularPipelines) {
        if (spec.id.empty()) {
            throw LoadError(LoadError::Kind::MalformedSnapshot, "", "Modular pipeline without id");
        }
        if (!ids.insert(spec.id).second) {
            throw LoadError(LoadError::Kind::DuplicateId, spec.id,
                            "Modular pipeline id '" + spec.id + "' is already in use");
        }
        NodeId id = graph.addNode(NodeData{spec.id, spec.name.empty() ? spec.id : spec.name,
                                           NodeKind::ModularPipeline});
        graph.hierarchy_[id].collapsed = spec.collapsed;
        graph.hierarchy_[id].defaultCollapsed = spec.collapsed;
    }

    for (const auto& spec : snapshot.modularPipelines) {
        NodeId pipeline = *graph.findNode(spec.id);
        for (const auto& member : spec.members) {
            auto memberId = graph.findNode(member);
            if (!memberId) {
                throw LoadError(LoadError::Kind::UnknownMember, member,
                                "Modular pipeline '" + spec.id + "' lists unknown member '" +
                                    member + "'");
            }
            if (*memberId == pipeline) {
                throw LoadError(LoadError::Kind::MembershipCycle, spec.id,
                                "Modular pipeline '" + spec.id + "' contains itself");
            }
            NodeId currentParent = graph.hierarchy_[*memberId].parent;
            if (currentParent == pipeline) {
                continue;
            }
            if (currentParent != INVALID_NODE) {
                throw LoadError(LoadError::Kind::AmbiguousMembership, member,
                                "'" + member + "' is a direct member of both '" +
                                    graph.nodes_[currentParent].key + "' and '" + spec.id + "'");
            }
            graph.setParent(*memberId, pipeline);
        }
    }

    // Each node has at most one parent, so a cycle is a parent chain returning to its start
    const size_t pipelineCount = snapshot.modularPipelines.size();
    for (NodeId pipeline : graph.pipelines()) {
        NodeId current = graph.hierarchy_[pipeline].parent;
        for (size_t steps = 0; current != INVALID_NODE && steps <= pipelineCount; ++steps) {
            if (current == pipeline) {
                throw LoadError(LoadError::Kind::MembershipCycle, graph.nodes_[pipeline].key,
                                "Modular pipeline '" + graph.nodes_[pipeline].key +
                                    "' is nested inside itself");
            }
            current = graph.hierarchy_[current].parent;
        }
    }
    graph.collectLeaves();

    for (const auto& spec : snapshot.edges) {
        auto source = graph.findNode(spec.source);
        auto target = graph.findNode(spec.target);
        if (!source || !target) {
            const std::string& missing = source ? spec.target : spec.source;
            throw LoadError(LoadError::Kind::DanglingEdge, missing,
                            "Edge " + spec.source + " -> " + spec.target +
                                " references unknown node '" + missing + "'");
        }
        if (graph.isPipeline(*source) || graph.isPipeline(*target)) {
            const std::string& offending = graph.isPipeline(*source) ? spec.source : spec.target;
            throw LoadError(LoadError::Kind::DanglingEdge, offending,
                            "Edge " + spec.source + " -> " + spec.target +
                                " ends on modular pipeline '" + offending + "'");
        }
        if (*source == *target) {
            throw LoadError(LoadError::Kind::GraphCycle, spec.source,
                            "Self-loop on '" + spec.source + "'");
        }
        graph.addEdge(*source, *target);
    }

    if (!graph.topologicalOrder()) {
        throw LoadError(LoadError::Kind::GraphCycle, "", "Pipeline edges contain a cycle");
    }
    graph.validateCollapseStates();

    for (const auto& series : snapshot.runMetrics) {
        if (!graph.findNode(series.node)) {
            LOG_WARN("Skipping run metric '{}' of unknown node '{}'", series.metric, series.node);
            continue;
        }
        graph.runMetrics_.add(series);
    }

    LOG_INFO("Loaded pipeline: {} nodes, {} edges, {} modular pipelines",
             snapshot.nodes.size(), graph.edgeCount(), pipelineCount);
    return graph;
}

NodeId PipelineGraph::addNode(const NodeData& data) {
    NodeId id = Graph::addNode(data);
    hierarchy_.emplace_back();
    bumpVersion();
    return id;
}

EdgeId PipelineGraph::addEdge(const EdgeData& data) {
    EdgeId id = Graph::addEdge(data);
    bumpVersion();
    return id;
}

void PipelineGraph::setParent(NodeId child, NodeId parent) {
    hierarchy_[child].parent = parent;
    hierarchy_[parent].children.push_back(child);
}

void PipelineGraph::collectLeaves() {
    for (auto& info : hierarchy_) {
        info.leaves.clear();
    }
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        if (isPipeline(id)) continue;
        for (NodeId a = hierarchy_[id].parent; a != INVALID_NODE; a = hierarchy_[a].parent) {
            hierarchy_[a].leaves.push_back(id);
        }
    }
}

void PipelineGraph::validateCollapseStates() const {
    auto check = [this](const std::vector<bool>& flags, const std::string& state) {
        if (!toEffectiveGraph(project(flags, std::nullopt)).isAcyclic()) {
            throw LoadError(LoadError::Kind::GraphCycle, state,
                            "Effective graph is cyclic with " + state + " collapsed");
        }
    };

    check(collapseFlags(), "the default pipelines");

    const std::vector<bool> expanded(nodes_.size(), false);
    for (NodeId pipeline : pipelines()) {
        std::vector<bool> flags = expanded;
        flags[pipeline] = true;
        check(flags, nodes_[pipeline].key);
    }

    std::vector<bool> topLevel = expanded;
    for (NodeId pipeline : topLevelPipelines()) {
        topLevel[pipeline] = true;
    }
    check(topLevel, "all top-level pipelines");
}

// =============================================================================
// Hierarchy
// =============================================================================

bool PipelineGraph::isPipeline(NodeId id) const {
    return hasNode(id) && nodes_[id].kind == NodeKind::ModularPipeline;
}

std::vector<NodeId> PipelineGraph::pipelines() const {
    std::vector<NodeId> result;
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        if (isPipeline(id)) result.push_back(id);
    }
    return result;
}

std::vector<NodeId> PipelineGraph::topLevelPipelines() const {
    std::vector<NodeId> result;
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        if (isPipeline(id) && hierarchy_[id].parent == INVALID_NODE) result.push_back(id);
    }
    return result;
}

std::optional<NodeId> PipelineGraph::getParent(NodeId id) const {
    if (!hasNode(id) || hierarchy_[id].parent == INVALID_NODE) {
        return std::nullopt;
    }
    return hierarchy_[id].parent;
}

std::vector<NodeId> PipelineGraph::getChildren(NodeId id) const {
    if (!hasNode(id)) return {};
    return hierarchy_[id].children;
}

std::vector<NodeId> PipelineGraph::membership(NodeId id) const {
    std::vector<NodeId> result;
    if (!hasNode(id)) return result;
    for (NodeId a = hierarchy_[id].parent; a != INVALID_NODE; a = hierarchy_[a].parent) {
        result.push_back(a);
    }
    return result;
}

std::vector<NodeId> PipelineGraph::nodesInPipeline(NodeId pipeline) const {
    std::vector<NodeId> result;
    if (!isPipeline(pipeline)) return result;

    std::vector<NodeId> stack(hierarchy_[pipeline].children.rbegin(),
                              hierarchy_[pipeline].children.rend());
    while (!stack.empty()) {
        NodeId current = stack.back();
        stack.pop_back();
        result.push_back(current);
        const auto& children = hierarchy_[current].children;
        stack.insert(stack.end(), children.rbegin(), children.rend());
    }
    return result;
}

const std::vector<NodeId>& PipelineGraph::leavesOf(NodeId pipeline) const {
    if (!isPipeline(pipeline)) return kNoNodes;
    return hierarchy_[pipeline].leaves;
}

bool PipelineGraph::isAncestorOf(NodeId ancestor, NodeId descendant) const {
    if (!hasNode(ancestor) || !hasNode(descendant)) return false;
    for (NodeId a = hierarchy_[descendant].parent; a != INVALID_NODE; a = hierarchy_[a].parent) {
        if (a == ancestor) return true;
    }
    return false;
}

// =============================================================================
// Edge reachability
// =============================================================================

std::vector<NodeId> PipelineGraph::neighbors(NodeId id, EdgeDirection direction) const {
    std::vector<NodeId> result;
    if (!hasNode(id)) return result;

    // A pipeline's neighbours are the outside nodes adjacent to its members
    std::vector<NodeId> sources = isPipeline(id) ? hierarchy_[id].leaves
                                                 : std::vector<NodeId>{id};
    std::unordered_set<NodeId> inside(sources.begin(), sources.end());
    std::unordered_set<NodeId> seen;

    auto visit = [&](NodeId neighbor) {
        if (inside.count(neighbor) == 0 && seen.insert(neighbor).second) {
            result.push_back(neighbor);
        }
    };

    for (NodeId source : sources) {
        if (direction != EdgeDirection::Out) {
            for (NodeId pred : predecessors(source)) visit(pred);
        }
        if (direction != EdgeDirection::In) {
            for (NodeId succ : successors(source)) visit(succ);
        }
    }
    return result;
}

std::vector<NodeId> PipelineGraph::ancestors(NodeId id) const {
    std::vector<NodeId> result;
    if (!hasNode(id)) return result;

    std::vector<NodeId> start = isPipeline(id) ? hierarchy_[id].leaves : std::vector<NodeId>{id};
    std::unordered_set<NodeId> seen(start.begin(), start.end());
    std::queue<NodeId> queue;
    for (NodeId s : start) queue.push(s);

    while (!queue.empty()) {
        NodeId current = queue.front();
        queue.pop();
        for (NodeId pred : predecessors(current)) {
            if (seen.insert(pred).second) {
                result.push_back(pred);
                queue.push(pred);
            }
        }
    }
    return result;
}

std::vector<NodeId> PipelineGraph::descendants(NodeId id) const {
    std::vector<NodeId> result;
    if (!hasNode(id)) return result;

    std::vector<NodeId> start = isPipeline(id) ? hierarchy_[id].leaves : std::vector<NodeId>{id};
    std::unordered_set<NodeId> seen(start.begin(), start.end());
    std::queue<NodeId> queue;
    for (NodeId s : start) queue.push(s);

    while (!queue.empty()) {
        NodeId current = queue.front();
        queue.pop();
        for (NodeId succ : successors(current)) {
            if (seen.insert(succ).second) {
                result.push_back(succ);
                queue.push(succ);
            }
        }
    }
    return result;
}

// =============================================================================
// State queries
// =============================================================================

bool PipelineGraph::isCollapsed(NodeId pipeline) const {
    return isPipeline(pipeline) && hierarchy_[pipeline].collapsed;
}

bool PipelineGraph::defaultCollapsed(NodeId pipeline) const {
    return isPipeline(pipeline) && hierarchy_[pipeline].defaultCollapsed;
}

bool PipelineGraph::isHiddenByCollapse(NodeId id) const {
    if (!hasNode(id)) return false;
    for (NodeId a = hierarchy_[id].parent; a != INVALID_NODE; a = hierarchy_[a].parent) {
        if (hierarchy_[a].collapsed) return true;
    }
    return false;
}

bool PipelineGraph::isExplicitlyHidden(NodeId id) const {
    if (!hasNode(id)) return false;
    for (NodeId a = id; a != INVALID_NODE; a = hierarchy_[a].parent) {
        if (hierarchy_[a].explicitlyHidden) return true;
    }
    return false;
}

bool PipelineGraph::isFilteredOut(NodeId id) const {
    if (!hasNode(id)) return false;
    return isPipeline(id) ? !passesPipelineFilters(id) : !passesLeafFilters(id);
}

bool PipelineGraph::isVisible(NodeId id) const {
    if (!hasNode(id)) return false;
    return current().visible[id];
}

std::optional<NodeId> PipelineGraph::representative(NodeId id) const {
    if (!hasNode(id)) return std::nullopt;
    const Projection& projection = current();
    NodeId rep = projection.rep[id];
    if (rep == INVALID_NODE || !projection.visible[rep]) {
        return std::nullopt;
    }
    return rep;
}

const std::vector<std::string>& PipelineGraph::registeredPipelinesOf(NodeId id) const {
    if (!hasNode(id)) return kNoPipelines;
    return hierarchy_[id].registered;
}

bool PipelineGraph::passesLeafFilters(NodeId leaf) const {
    const NodeData& node = nodes_[leaf];
    return filters_.matchesTags(node) && filters_.matchesSearch(node.label) &&
           filters_.matchesKind(node.kind) &&
           filters_.matchesRegisteredPipeline(hierarchy_[leaf].registered);
}

bool PipelineGraph::passesPipelineFilters(NodeId pipeline) const {
    if (!filters_.isActive()) return true;

    bool nameMatches = filters_.matchesSearch(nodes_[pipeline].label);
    for (NodeId leaf : hierarchy_[pipeline].leaves) {
        const NodeData& node = nodes_[leaf];
        if (isExplicitlyHidden(leaf)) continue;
        if (!filters_.matchesTags(node) || !filters_.matchesKind(node.kind) ||
            !filters_.matchesRegisteredPipeline(hierarchy_[leaf].registered)) {
            continue;
        }
        if (nameMatches || filters_.matchesSearch(node.label)) {
            return true;
        }
    }
    return false;
}

// =============================================================================
// Projection
// =============================================================================

PipelineGraph::Projection PipelineGraph::project(const std::vector<bool>& collapsed,
                                                 std::optional<NodeId> focus) const {
    const size_t count = nodes_.size();
    Projection projection;
    projection.rep.assign(count, INVALID_NODE);
    projection.visible.assign(count, false);

    // Focus limits the scope to the pipeline's members plus their direct neighbours
    std::vector<bool> inScope(count, !focus.has_value());
    if (focus) {
        for (NodeId leaf : hierarchy_[*focus].leaves) {
            inScope[leaf] = true;
            for (NodeId pred : predecessors(leaf)) inScope[pred] = true;
            for (NodeId succ : successors(leaf)) inScope[succ] = true;
        }
    }

    // Outermost collapsed ancestor; under focus only collapses strictly inside it count
    auto outermostCollapsed = [&](NodeId id) {
        NodeId rep = INVALID_NODE;
        if (focus && !isAncestorOf(*focus, id)) {
            return rep;
        }
        for (NodeId a = hierarchy_[id].parent; a != INVALID_NODE; a = hierarchy_[a].parent) {
            if (focus && a == *focus) break;
            if (collapsed[a]) rep = a;
        }
        return rep;
    };

    std::vector<int> pipelineState(count, -1);   // -1 unknown, 0 hidden, 1 visible
    auto pipelineVisible = [&](NodeId pipeline) {
        if (pipelineState[pipeline] < 0) {
            pipelineState[pipeline] =
                (!isExplicitlyHidden(pipeline) && passesPipelineFilters(pipeline)) ? 1 : 0;
        }
        return pipelineState[pipeline] == 1;
    };

    for (NodeId id = 0; id < count; ++id) {
        if (isPipeline(id)) {
            if (focus && (id == *focus || !isAncestorOf(*focus, id))) continue;
            NodeId outer = outermostCollapsed(id);
            if (outer != INVALID_NODE) {
                projection.rep[id] = outer;
            } else if (collapsed[id]) {
                projection.rep[id] = id;
                projection.visible[id] = pipelineVisible(id);
            }
            continue;
        }

        if (!inScope[id]) continue;
        NodeId outer = outermostCollapsed(id);
        if (outer != INVALID_NODE) {
            projection.rep[id] = outer;
        } else {
            projection.rep[id] = id;
            projection.visible[id] = !isExplicitlyHidden(id) && passesLeafFilters(id);
        }
    }

    for (NodeId id = 0; id < count; ++id) {
        if (projection.visible[id]) {
            projection.nodes.push_back(id);
        }
    }

    std::unordered_map<uint64_t, size_t> edgeIndex;
    for (const EdgeData& edge : edges_) {
        NodeId source = projection.rep[edge.from];
        NodeId target = projection.rep[edge.to];
        if (source == INVALID_NODE || target == INVALID_NODE) continue;
        if (!projection.visible[source] || !projection.visible[target]) continue;
        if (source == target) continue;

        bool synthetic = source != edge.from || target != edge.to;
        auto [it, inserted] = edgeIndex.emplace(edgeKey(source, target), projection.edges.size());
        if (inserted) {
            EffectiveEdge effective;
            effective.id = edge.id;
            effective.from = source;
            effective.to = target;
            effective.synthetic = synthetic;
            effective.sourceEdges.push_back(edge.id);
            projection.edges.push_back(std::move(effective));
        } else {
            EffectiveEdge& existing = projection.edges[it->second];
            existing.sourceEdges.push_back(edge.id);
            existing.synthetic = existing.synthetic || synthetic;
        }
    }

    return projection;
}

const PipelineGraph::Projection& PipelineGraph::current() const {
    if (cachedVersion_ != stateVersion_) {
        cached_ = project(collapseFlags(), focusedPipeline_);
        cachedVersion_ = stateVersion_;
    }
    return cached_;
}

std::vector<bool> PipelineGraph::collapseFlags() const {
    std::vector<bool> flags(nodes_.size(), false);
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        flags[id] = hierarchy_[id].collapsed;
    }
    return flags;
}

EffectiveGraph PipelineGraph::toEffectiveGraph(const Projection& projection) const {
    std::vector<EffectiveNode> nodes;
    nodes.reserve(projection.nodes.size());
    for (NodeId id : projection.nodes) {
        const NodeData& data = nodes_[id];
        nodes.push_back(EffectiveNode{id, data.key, data.label, data.kind});
    }
    return EffectiveGraph(std::move(nodes), projection.edges);
}

std::vector<NodeId> PipelineGraph::visibleNodes() const {
    return current().nodes;
}

EffectiveEdgeSet PipelineGraph::effectiveEdges() const {
    return current().edges;
}

EffectiveGraph PipelineGraph::effectiveGraph() const {
    return toEffectiveGraph(current());
}

// =============================================================================
// Mutations
// =============================================================================

void PipelineGraph::bumpVersion() {
    ++stateVersion_;
}

EffectiveEdgeSet PipelineGraph::setVisibility(NodeId id, bool visible) {
    if (!hasNode(id)) {
        LOG_DEBUG("Ignoring visibility change of unknown node {}", id);
        return effectiveEdges();
    }
    if (hierarchy_[id].explicitlyHidden != !visible) {
        hierarchy_[id].explicitlyHidden = !visible;
        bumpVersion();
    }
    return effectiveEdges();
}

EffectiveEdgeSet PipelineGraph::setCollapsed(NodeId pipeline, bool collapsed) {
    return setCollapsedMany({{pipeline, collapsed}});
}

EffectiveEdgeSet PipelineGraph::setCollapsedMany(
    const std::vector<std::pair<NodeId, bool>>& changes) {
    std::vector<bool> flags = collapseFlags();
    bool changed = false;
    for (const auto& [pipeline, collapsed] : changes) {
        if (!isPipeline(pipeline)) {
            LOG_DEBUG("Ignoring collapse of non-pipeline node {}", pipeline);
            continue;
        }
        if (flags[pipeline] != collapsed) {
            flags[pipeline] = collapsed;
            changed = true;
        }
    }
    if (!changed) {
        return effectiveEdges();
    }

    Projection projection = project(flags, focusedPipeline_);
    if (!toEffectiveGraph(projection).isAcyclic() || !acyclicWithoutFocus(flags)) {
        LOG_WARN("Refusing collapse change: effective graph would contain a cycle");
        return effectiveEdges();
    }

    for (NodeId id = 0; id < nodes_.size(); ++id) {
        hierarchy_[id].collapsed = flags[id];
    }
    bumpVersion();
    cached_ = std::move(projection);
    cachedVersion_ = stateVersion_;
    return cached_.edges;
}

bool PipelineGraph::canSetCollapsed(NodeId pipeline, bool collapsed) const {
    if (!isPipeline(pipeline)) return false;
    if (hierarchy_[pipeline].collapsed == collapsed) return true;
    std::vector<bool> flags = collapseFlags();
    flags[pipeline] = collapsed;
    return toEffectiveGraph(project(flags, focusedPipeline_)).isAcyclic() &&
           acyclicWithoutFocus(flags);
}

bool PipelineGraph::acyclicWithoutFocus(const std::vector<bool>& flags) const {
    // Collapses outside the focused pipeline are stored but not projected
    if (!focusedPipeline_) return true;
    return toEffectiveGraph(project(flags, std::nullopt)).isAcyclic();
}

EffectiveEdgeSet PipelineGraph::setTagFilter(std::set<std::string> tags) {
    filters_.tags = std::move(tags);
    bumpVersion();
    return effectiveEdges();
}

EffectiveEdgeSet PipelineGraph::setSearchFilter(std::string search) {
    filters_.search = std::move(search);
    bumpVersion();
    return effectiveEdges();
}

EffectiveEdgeSet PipelineGraph::setKindFilter(std::set<NodeKind> kinds) {
    filters_.kinds = std::move(kinds);
    bumpVersion();
    return effectiveEdges();
}

EffectiveEdgeSet PipelineGraph::setRegisteredPipeline(std::optional<std::string> pipelineId) {
    if (pipelineId) {
        auto it = std::find_if(registeredPipelines_.begin(), registeredPipelines_.end(),
                               [&](const RegisteredPipelineSpec& p) { return p.id == *pipelineId; });
        if (it == registeredPipelines_.end()) {
            LOG_DEBUG("Ignoring unknown registered pipeline '{}'", *pipelineId);
            return effectiveEdges();
        }
    }
    filters_.registeredPipeline = std::move(pipelineId);
    bumpVersion();
    return effectiveEdges();
}

EffectiveEdgeSet PipelineGraph::setFocusedPipeline(std::optional<NodeId> pipeline) {
    if (pipeline && !isPipeline(*pipeline)) {
        LOG_DEBUG("Ignoring focus on non-pipeline node {}", *pipeline);
        return effectiveEdges();
    }
    if (pipeline == focusedPipeline_) {
        return effectiveEdges();
    }

    Projection projection = project(collapseFlags(), pipeline);
    if (!toEffectiveGraph(projection).isAcyclic()) {
        LOG_WARN("Refusing pipeline focus: effective graph would contain a cycle");
        return effectiveEdges();
    }

    focusedPipeline_ = pipeline;
    bumpVersion();
    cached_ = std::move(projection);
    cachedVersion_ = stateVersion_;
    return cached_.edges;
}

void PipelineGraph::clear() {
    Graph::clear();
    hierarchy_.clear();
    filters_ = FilterState{};
    focusedPipeline_.reset();
    registeredPipelines_.clear();
    runMetrics_.clear();
    bumpVersion();
}

}  // namespace pipeviz
