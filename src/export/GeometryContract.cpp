#include "pipeviz/export/GeometryContract.h"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace pipeviz {

namespace {
    bool finite(const Point& p) {
        return std::isfinite(p.x) && std::isfinite(p.y);
    }
}

ContractReport GeometryContract::validate(const EffectiveGraph& graph,
                                          const LayoutResult& layout,
                                          float tolerance) {
    ContractReport report;
    auto fail = [&report](std::string message) {
        report.ok = false;
        report.violations.push_back(std::move(message));
    };

    for (const EffectiveNode& node : graph.nodes()) {
        const NodeLayout* box = layout.getNodeLayout(node.id);
        if (!box) {
            fail(fmt::format("node '{}' has no coordinates", node.key));
            continue;
        }
        if (!finite(box->position) || !(box->size.width > 0.0f) || !(box->size.height > 0.0f)) {
            fail(fmt::format("node '{}' has an invalid box", node.key));
        }
    }

    for (const EffectiveEdge& edge : graph.edges()) {
        const EdgeLayout* path = layout.getEdgeLayout(edge.id);
        if (!path) {
            fail(fmt::format("edge {} has no points", edge.id));
            continue;
        }

        bool allFinite = finite(path->sourcePoint) && finite(path->targetPoint);
        for (const Point& p : path->bendPoints) {
            allFinite = allFinite && finite(p);
        }
        if (!allFinite) {
            fail(fmt::format("edge {} has a non-finite point", edge.id));
            continue;
        }

        const NodeLayout* source = layout.getNodeLayout(edge.from);
        const NodeLayout* target = layout.getNodeLayout(edge.to);
        if (source && !source->bounds().onBoundary(path->sourcePoint, tolerance)) {
            fail(fmt::format("edge {} does not start on its source boundary", edge.id));
        }
        if (target && !target->bounds().onBoundary(path->targetPoint, tolerance)) {
            fail(fmt::format("edge {} does not end on its target boundary", edge.id));
        }
    }

    return report;
}

}  // namespace pipeviz
