#pragma once

#include "pipeviz/core/EffectiveGraph.h"
#include "pipeviz/core/PipelineGraph.h"
#include "pipeviz/layout/config/LayoutResult.h"

#include <optional>
#include <unordered_map>

namespace pipeviz {

/// Derived interaction state of one model node
struct NodeFlags {
    bool visible = false;       ///< Member of the effective graph
    bool filteredOut = false;   ///< Rejected by the active filters
    bool highlighted = false;   ///< Ancestor or descendant of the focused node
    bool focused = false;
    bool faded = false;         ///< Focus is active and the node is unrelated to it
    bool selected = false;
};

/// Derived interaction state of one effective edge
struct EdgeFlags {
    bool highlighted = false;   ///< Both ends are focused or highlighted
    bool faded = false;
};

/// Flags for every model node and every effective edge
struct InteractionFlags {
    std::unordered_map<NodeId, NodeFlags> nodes;
    std::unordered_map<EdgeId, EdgeFlags> edges;
    std::optional<NodeId> focus;
    std::optional<NodeId> selection;

    const NodeFlags* node(NodeId id) const {
        auto it = nodes.find(id);
        return it != nodes.end() ? &it->second : nullptr;
    }
    const EdgeFlags* edge(EdgeId id) const {
        auto it = edges.find(id);
        return it != edges.end() ? &it->second : nullptr;
    }
};

/// What lies under a point of the drawing
struct HitResult {
    enum class Kind { None, Node, Edge };

    Kind kind = Kind::None;
    NodeId node = INVALID_NODE;
    EdgeId edge = INVALID_EDGE;

    bool hit() const { return kind != Kind::None; }
};

/**
 * @brief Focus and selection over the current effective graph
 *
 * Focus and selection keep the node id they were set with. Reads map it to
 * its current representative: a member hidden by a collapse reads as its
 * visible container and reads as itself again once expanded; an id that is
 * not visible at all reads as "none".
 */
class SelectionModel {
public:
    explicit SelectionModel(const PipelineGraph& graph);

    /// Focus a node (nullopt clears); unknown or invisible ids are ignored
    /// @return true if the focus changed
    bool setFocus(std::optional<NodeId> id);
    std::optional<NodeId> focus() const;

    /// Select a node (nullopt clears); unknown or invisible ids are ignored
    bool select(std::optional<NodeId> id);
    std::optional<NodeId> selection() const;

    void clear();

    InteractionFlags deriveFlags() const;

    /// Node first, then the nearest edge within edgeThreshold
    static HitResult hitTest(const Point& point, const LayoutResult& layout,
                             float edgeThreshold = 4.0f);

private:
    std::optional<NodeId> resolve(std::optional<NodeId> stored) const;

    const PipelineGraph& graph_;
    std::optional<NodeId> focus_;
    std::optional<NodeId> selection_;
};

}  // namespace pipeviz
