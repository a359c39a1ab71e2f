#pragma once

#include "../core/PipelineGraph.h"
#include "../core/Types.h"
#include "../interaction/SelectionModel.h"
#include "../layout/config/LayoutResult.h"

#include <optional>
#include <string>
#include <vector>

namespace pipeviz {

/// Node box
struct RectPrimitive {
    NodeId node = INVALID_NODE;
    Rect rect;
    NodeKind kind = NodeKind::Task;
    bool highlighted = false;
    bool focused = false;
    bool faded = false;
    bool selected = false;
    std::optional<double> metricLevel;   ///< Normalized run metric in [0, 1], if shown
};

/// Edge polyline, source first
struct PathPrimitive {
    EdgeId edge = INVALID_EDGE;
    std::vector<Point> points;
    bool synthetic = false;
    bool highlighted = false;
    bool faded = false;
};

struct LabelPrimitive {
    NodeId node = INVALID_NODE;
    Point anchor;                        ///< Text centre
    std::string text;
    bool faded = false;
};

/// Background of an expanded modular pipeline
struct GroupBox {
    NodeId pipeline = INVALID_NODE;
    Rect rect;
    std::string label;
    int depth = 0;                       ///< 0 = top-level pipeline
};

/**
 * @brief Framework-neutral drawing of one layout
 *
 * Draw order is groups, paths, rects, labels. Every vector is sorted by id
 * (groups by depth, then id) so two builds of the same state compare equal.
 */
struct DrawList {
    std::vector<GroupBox> groups;
    std::vector<PathPrimitive> paths;
    std::vector<RectPrimitive> rects;
    std::vector<LabelPrimitive> labels;
    Rect bounds;

    bool empty() const { return rects.empty() && paths.empty() && groups.empty(); }
    size_t primitiveCount() const {
        return groups.size() + paths.size() + rects.size() + labels.size();
    }
};

/// Run metric shown as node tint
struct MetricOverlay {
    std::string metric;
    std::optional<std::string> run;      ///< Latest run when empty
};

struct DrawListOptions {
    float groupPadding = 16.0f;
    float canvasPadding = 20.0f;
    std::optional<MetricOverlay> metric;
};

/// Turns layout geometry plus interaction flags into a DrawList
class DrawListBuilder {
public:
    static DrawList build(const PipelineGraph& graph,
                          const LayoutResult& layout,
                          const InteractionFlags& flags,
                          const DrawListOptions& options = {});
};

}  // namespace pipeviz
