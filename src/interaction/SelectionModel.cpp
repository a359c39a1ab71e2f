#include "pipeviz/interaction/SelectionModel.h"
#include "pipeviz/common/Logger.h"
#include "pipeviz/layout/util/LayoutUtils.h"

#include <unordered_set>

namespace pipeviz {

SelectionModel::SelectionModel(const PipelineGraph& graph)
    : graph_(graph) {}

std::optional<NodeId> SelectionModel::resolve(std::optional<NodeId> stored) const {
    if (!stored) return std::nullopt;
    return graph_.representative(*stored);
}

bool SelectionModel::setFocus(std::optional<NodeId> id) {
    if (!id) {
        bool changed = focus_.has_value();
        focus_.reset();
        return changed;
    }

    if (!graph_.representative(*id)) {
        LOG_DEBUG("Ignoring focus on unknown or hidden node {}", *id);
        return false;
    }
    if (focus_ == id) {
        return false;
    }
    // Stored as requested; resolve() maps it to whatever currently stands for it
    focus_ = *id;
    return true;
}

std::optional<NodeId> SelectionModel::focus() const {
    return resolve(focus_);
}

bool SelectionModel::select(std::optional<NodeId> id) {
    if (!id) {
        bool changed = selection_.has_value();
        selection_.reset();
        return changed;
    }

    if (!graph_.representative(*id)) {
        LOG_DEBUG("Ignoring selection of unknown or hidden node {}", *id);
        return false;
    }
    if (selection_ == id) {
        return false;
    }
    selection_ = *id;
    return true;
}

std::optional<NodeId> SelectionModel::selection() const {
    return resolve(selection_);
}

void SelectionModel::clear() {
    focus_.reset();
    selection_.reset();
}

InteractionFlags SelectionModel::deriveFlags() const {
    InteractionFlags flags;
    flags.focus = focus();
    flags.selection = selection();

    EffectiveGraph effective = graph_.effectiveGraph();

    std::unordered_set<NodeId> related;
    if (flags.focus) {
        for (NodeId id : effective.reachable(*flags.focus, EdgeDirection::In)) related.insert(id);
        for (NodeId id : effective.reachable(*flags.focus, EdgeDirection::Out)) related.insert(id);
    }

    for (NodeId id : graph_.nodes()) {
        NodeFlags node;
        node.visible = effective.contains(id);
        node.filteredOut = graph_.isFilteredOut(id);
        if (node.visible) {
            node.focused = flags.focus == id;
            node.highlighted = related.count(id) > 0;
            node.faded = flags.focus.has_value() && !node.focused && !node.highlighted;
            node.selected = flags.selection == id;
        }
        flags.nodes.emplace(id, node);
    }

    auto lit = [&](NodeId id) { return flags.focus == id || related.count(id) > 0; };
    for (const EffectiveEdge& edge : effective.edges()) {
        EdgeFlags edgeFlags;
        if (flags.focus) {
            edgeFlags.highlighted = lit(edge.from) && lit(edge.to);
            edgeFlags.faded = !edgeFlags.highlighted;
        }
        flags.edges.emplace(edge.id, edgeFlags);
    }

    return flags;
}

HitResult SelectionModel::hitTest(const Point& point, const LayoutResult& layout,
                                  float edgeThreshold) {
    HitResult result;
    if (auto node = LayoutUtils::hitTestNode(point, layout)) {
        result.kind = HitResult::Kind::Node;
        result.node = *node;
        return result;
    }
    if (auto edge = LayoutUtils::hitTestEdges(point, layout, edgeThreshold)) {
        result.kind = HitResult::Kind::Edge;
        result.edge = *edge;
    }
    return result;
}

}  // namespace pipeviz
