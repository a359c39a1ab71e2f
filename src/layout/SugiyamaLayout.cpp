#include "pipeviz/layout/SugiyamaLayout.h"
#include "pipeviz/common/Logger.h"
#include "pipeviz/layout/LayeredGraph.h"
#include "pipeviz/layout/api/ICoordinateAssignment.h"
#include "pipeviz/layout/api/ICrossingMinimization.h"
#include "pipeviz/layout/api/ILayerAssignment.h"
#include "pipeviz/layout/api/LayoutInternalError.h"
#include "sugiyama/phases/CoordinateAssignment.h"
#include "sugiyama/phases/CrossingMinimization.h"
#include "sugiyama/phases/LayerAssignment.h"
#include "sugiyama/routing/EdgeRouting.h"

#include <algorithm>
#include <tuple>

namespace pipeviz {

struct SugiyamaLayout::LayoutState {
    const EffectiveGraph* graph = nullptr;

    std::vector<Size> sizes;           // Per effective node
    std::vector<int> ranks;            // Per effective node
    LayeredGraph layered;
    std::vector<float> centerX;        // Per layered node
    RankGeometry geometry;

    LayoutResult result;
};

SugiyamaLayout::SugiyamaLayout()
    : SugiyamaLayout(LayoutOptions{}) {}

SugiyamaLayout::SugiyamaLayout(const LayoutOptions& options)
    : options_(options)
    , layerAssignment_(std::make_shared<LongestPathLayerAssignment>())
    , crossingMinimization_(std::make_shared<BarycenterCrossingMinimization>())
    , coordinateAssignment_(std::make_shared<RelaxationCoordinateAssignment>())
    , state_(std::make_unique<LayoutState>()) {}

SugiyamaLayout::~SugiyamaLayout() = default;

SugiyamaLayout::SugiyamaLayout(SugiyamaLayout&&) noexcept = default;
SugiyamaLayout& SugiyamaLayout::operator=(SugiyamaLayout&&) noexcept = default;

void SugiyamaLayout::setOptions(const LayoutOptions& options) {
    options_ = options;
}

void SugiyamaLayout::setLayerAssignment(std::shared_ptr<ILayerAssignment> impl) {
    if (impl) layerAssignment_ = std::move(impl);
}

void SugiyamaLayout::setCrossingMinimization(std::shared_ptr<ICrossingMinimization> impl) {
    if (impl) crossingMinimization_ = std::move(impl);
}

void SugiyamaLayout::setCoordinateAssignment(std::shared_ptr<ICoordinateAssignment> impl) {
    if (impl) coordinateAssignment_ = std::move(impl);
}

LayoutResult SugiyamaLayout::layout(const EffectiveGraph& graph, const LayoutResult* previous) {
    state_ = std::make_unique<LayoutState>();
    state_->graph = &graph;
    stats_ = LayoutStats{};

    if (graph.empty()) {
        return state_->result;
    }

    measureNodes();

    try {
        // Phase 1: Rank Assignment
        assignRanks();

        // Phase 2: Crossing Minimization
        seedOrder(previous);
        minimizeCrossings();

        // Phase 3 + 4: Coordinates
        assignCoordinates();

        // Phase 5: Edge Routing
        routeEdges();
    } catch (const LayoutInternalError& e) {
        LOG_ERROR("Layout failed, falling back to a single column: {}", e.what());
        LayoutStats failed;
        failed.fellBack = true;
        failed.layerCount = static_cast<int>(graph.nodeCount());
        failed.maxLayerWidth = 1;
        stats_ = failed;
        return fallbackLayout();
    }

    LOG_DEBUG("Layout: {} nodes, {} ranks, {} dummies, {} crossings, {} relaxation steps",
              graph.nodeCount(), stats_.layerCount, stats_.dummyNodes, stats_.edgeCrossings,
              stats_.relaxationIterations);
    return state_->result;
}

void SugiyamaLayout::measureNodes() {
    const auto& nodes = state_->graph->nodes();
    state_->sizes.reserve(nodes.size());
    float tallest = 0.0f;
    for (const auto& node : nodes) {
        Size size = options_.nodeSize(node.label, node.kind);
        tallest = std::max(tallest, size.height);
        state_->sizes.push_back(size);
    }
    state_->geometry.tallest = tallest;
    state_->geometry.rankHeight = tallest + options_.rankSeparation;
}

void SugiyamaLayout::assignRanks() {
    state_->ranks = layerAssignment_->assignRanks(*state_->graph);
    state_->layered = LayeredGraph::build(*state_->graph, state_->ranks, state_->sizes);

    stats_.layerCount = state_->layered.rankCount();
    stats_.dummyNodes = static_cast<int>(state_->layered.dummyCount());
    state_->result.setRankCount(stats_.layerCount);
}

void SugiyamaLayout::seedOrder(const LayoutResult* previous) {
    if (!previous || previous->empty()) {
        return;  // LayeredGraph::build already uses insertion order
    }

    LayeredGraph& layered = state_->layered;
    // (unseeded, previous order, insertion index)
    auto key = [&](size_t index) {
        const LayeredNode& node = layered.nodes[index];
        if (!node.dummy) {
            const NodeLayout* before = previous->getNodeLayout(node.id);
            if (before && before->rank == node.rank) {
                return std::make_tuple(0, before->order, index);
            }
        }
        return std::make_tuple(1, 0, index);
    };

    for (auto& rank : layered.ranks) {
        std::stable_sort(rank.begin(), rank.end(),
                         [&](size_t a, size_t b) { return key(a) < key(b); });
    }
}

void SugiyamaLayout::minimizeCrossings() {
    LayeredGraph& layered = state_->layered;
    auto result = crossingMinimization_->minimize(layered, layered.ranks,
                                                  options_.crossingStrategy,
                                                  options_.sweepPasses);

    layered.ranks = std::move(result.ranks);
    stats_.edgeCrossings = result.crossingCount;
    stats_.passes = result.passes;

    for (const auto& rank : layered.ranks) {
        int real = static_cast<int>(std::count_if(rank.begin(), rank.end(), [&](size_t i) {
            return !layered.nodes[i].dummy;
        }));
        stats_.maxLayerWidth = std::max(stats_.maxLayerWidth, real);
    }
}

void SugiyamaLayout::assignCoordinates() {
    const LayeredGraph& layered = state_->layered;
    auto result = coordinateAssignment_->assign(layered, options_);
    if (result.centerX.size() != layered.nodes.size()) {
        throw LayoutInternalError("Coordinate assignment returned the wrong node count");
    }

    state_->centerX = std::move(result.centerX);
    stats_.relaxationIterations = result.iterations;
    stats_.converged = result.converged;

    for (const auto& rank : layered.ranks) {
        int order = 0;
        for (size_t index : rank) {
            const LayeredNode& node = layered.nodes[index];
            if (node.dummy) continue;

            NodeLayout layout;
            layout.id = node.id;
            layout.kind = state_->graph->nodes()[index].kind;
            layout.size = node.size;
            layout.rank = node.rank;
            layout.order = order++;
            layout.position = {state_->centerX[index] - node.size.width / 2.0f,
                               state_->geometry.middle(node.rank) - node.size.height / 2.0f};
            state_->result.setNodeLayout(node.id, layout);
        }
    }
}

void SugiyamaLayout::routeEdges() {
    const auto& edges = state_->graph->edges();
    for (size_t e = 0; e < edges.size(); ++e) {
        EdgeLayout layout = EdgeRouting::route(edges[e], state_->layered.chains[e],
                                               state_->layered, state_->centerX,
                                               state_->result, state_->geometry, options_);
        state_->result.setEdgeLayout(layout.id, layout);
    }
}

LayoutResult SugiyamaLayout::fallbackLayout() const {
    LayoutResult result;
    const EffectiveGraph& graph = *state_->graph;
    const float step = state_->geometry.rankHeight;

    for (size_t i = 0; i < graph.nodeCount(); ++i) {
        NodeLayout layout;
        layout.id = graph.nodes()[i].id;
        layout.kind = graph.nodes()[i].kind;
        layout.size = state_->sizes[i];
        layout.rank = static_cast<int>(i);
        layout.order = 0;
        layout.position = {0.0f, static_cast<float>(i) * step};
        result.setNodeLayout(layout.id, layout);
    }
    result.setRankCount(static_cast<int>(graph.nodeCount()));

    for (const auto& edge : graph.edges()) {
        EdgeLayout layout = EdgeRouting::straight(edge, result);
        result.setEdgeLayout(layout.id, layout);
    }
    return result;
}

}  // namespace pipeviz
