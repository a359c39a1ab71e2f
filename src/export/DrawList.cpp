#include "pipeviz/export/DrawList.h"
#include "pipeviz/layout/util/LayoutUtils.h"

#include <algorithm>

namespace pipeviz {

namespace {

template<typename Map>
std::vector<typename Map::key_type> sortedKeys(const Map& map) {
    std::vector<typename Map::key_type> keys;
    keys.reserve(map.size());
    for (const auto& [key, value] : map) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::optional<double> metricLevel(const PipelineGraph& graph, NodeId id,
                                  const MetricOverlay& overlay) {
    const RunMetricStore& store = graph.runMetrics();
    if (store.empty()) return std::nullopt;

    std::string run;
    if (overlay.run) {
        run = *overlay.run;
    } else {
        // Most recent run that recorded the metric for this node
        const auto& runs = store.runs();
        const std::string& key = graph.getNode(id).key;
        for (auto it = runs.rbegin(); it != runs.rend(); ++it) {
            if (store.find(key, overlay.metric, *it)) {
                run = *it;
                break;
            }
        }
        if (run.empty()) return std::nullopt;
    }
    return store.normalized(graph.getNode(id).key, overlay.metric, run);
}

}  // namespace

DrawList DrawListBuilder::build(const PipelineGraph& graph,
                                const LayoutResult& layout,
                                const InteractionFlags& flags,
                                const DrawListOptions& options) {
    DrawList list;

    // Groups: outer boxes first so inner ones paint on top
    auto groups = LayoutUtils::allGroupBounds(graph, layout, options.groupPadding);
    for (NodeId pipeline : sortedKeys(groups)) {
        GroupBox box;
        box.pipeline = pipeline;
        box.rect = groups.at(pipeline);
        box.label = graph.getNode(pipeline).label;
        box.depth = static_cast<int>(graph.membership(pipeline).size());
        list.groups.push_back(std::move(box));
    }
    std::stable_sort(list.groups.begin(), list.groups.end(),
                     [](const GroupBox& a, const GroupBox& b) { return a.depth < b.depth; });

    for (EdgeId id : sortedKeys(layout.edgeLayouts())) {
        const EdgeLayout& edge = layout.edgeLayouts().at(id);
        PathPrimitive path;
        path.edge = id;
        path.points = edge.allPoints();
        path.synthetic = edge.synthetic;
        if (const EdgeFlags* edgeFlags = flags.edge(id)) {
            path.highlighted = edgeFlags->highlighted;
            path.faded = edgeFlags->faded;
        }
        list.paths.push_back(std::move(path));
    }

    for (NodeId id : sortedKeys(layout.nodeLayouts())) {
        const NodeLayout& node = layout.nodeLayouts().at(id);
        RectPrimitive rect;
        rect.node = id;
        rect.rect = node.bounds();
        rect.kind = node.kind;
        if (const NodeFlags* nodeFlags = flags.node(id)) {
            rect.highlighted = nodeFlags->highlighted;
            rect.focused = nodeFlags->focused;
            rect.faded = nodeFlags->faded;
            rect.selected = nodeFlags->selected;
        }
        if (options.metric && graph.hasNode(id) && !graph.isPipeline(id)) {
            rect.metricLevel = metricLevel(graph, id, *options.metric);
        }

        if (graph.hasNode(id)) {
            LabelPrimitive label;
            label.node = id;
            label.anchor = node.center();
            label.text = graph.getNode(id).label;
            label.faded = rect.faded;
            list.labels.push_back(std::move(label));
        }
        list.rects.push_back(std::move(rect));
    }

    list.bounds = layout.computeBounds(options.canvasPadding);
    for (const GroupBox& group : list.groups) {
        list.bounds = list.bounds.united(group.rect.expanded(options.canvasPadding));
    }
    return list;
}

}  // namespace pipeviz
