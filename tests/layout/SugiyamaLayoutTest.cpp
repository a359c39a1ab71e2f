#include <gtest/gtest.h>
#include <pipeviz/pipeviz.h>
#include <pipeviz/common/Logger.h>
#include <pipeviz/layout/api/ILayerAssignment.h>

#include "layout/sugiyama/phases/LayerAssignment.h"
#include "support/TestSnapshots.h"

#include <algorithm>
#include <cmath>
#include <set>

using namespace pipeviz;

// ============================================================================
// SugiyamaLayoutTest - layered layout of effective graphs
// ============================================================================

namespace {

/// Ranker that puts every node on rank 0, which the layering step rejects
class FlatLayerAssignment : public ILayerAssignment {
public:
    std::vector<int> assignRanks(const EffectiveGraph& graph) const override {
        return std::vector<int>(graph.nodeCount(), 0);
    }
    const char* algorithmName() const override { return "Flat"; }
};

void expectNoOverlapWithinRanks(const LayoutResult& result, float separation) {
    for (int rank = 0; rank < result.rankCount(); ++rank) {
        std::vector<NodeId> nodes = result.nodesInRank(rank);
        for (size_t i = 1; i < nodes.size(); ++i) {
            const NodeLayout* left = result.getNodeLayout(nodes[i - 1]);
            const NodeLayout* right = result.getNodeLayout(nodes[i]);
            EXPECT_LE(left->bounds().right() + separation, right->bounds().left() + 0.05f)
                << "rank " << rank << " nodes " << left->id << ", " << right->id;
        }
    }
}

}  // namespace

// --- Basic Layout ---

TEST(SugiyamaLayoutTest, EmptyGraph_ReturnsEmptyResult) {
    EffectiveGraph graph;
    SugiyamaLayout layout;

    LayoutResult result = layout.layout(graph);

    EXPECT_EQ(result.nodeCount(), 0u);
    EXPECT_EQ(result.edgeCount(), 0u);
    EXPECT_FALSE(layout.lastStats().fellBack);
}

TEST(SugiyamaLayoutTest, Chain_StacksRanksAtFixedHeight) {
    EffectiveGraph graph = test::chainGraph(3);
    SugiyamaLayout layout;

    LayoutResult result = layout.layout(graph);

    ASSERT_EQ(result.nodeCount(), 3u);
    EXPECT_EQ(result.rankCount(), 3);
    for (NodeId id = 0; id < 3; ++id) {
        const NodeLayout* node = result.getNodeLayout(id);
        ASSERT_NE(node, nullptr);
        EXPECT_EQ(node->rank, static_cast<int>(id));
        EXPECT_EQ(node->order, 0);
        // Short labels clamp to the minimum width
        EXPECT_FLOAT_EQ(node->size.width, 60.0f);
        EXPECT_FLOAT_EQ(node->size.height, 36.0f);
        EXPECT_FLOAT_EQ(node->position.x, 0.0f);
        EXPECT_FLOAT_EQ(node->position.y, 100.0f * static_cast<float>(id));
    }

    const EdgeLayout* edge = result.getEdgeLayout(0);
    ASSERT_NE(edge, nullptr);
    EXPECT_FLOAT_EQ(edge->sourcePoint.x, 30.0f);
    EXPECT_FLOAT_EQ(edge->sourcePoint.y, 36.0f);
    EXPECT_FLOAT_EQ(edge->targetPoint.x, 30.0f);
    EXPECT_FLOAT_EQ(edge->targetPoint.y, 100.0f);
    EXPECT_TRUE(edge->bendPoints.empty());
}

TEST(SugiyamaLayoutTest, NodeSize_FollowsLabelAndKind) {
    EffectiveGraph graph;
    NodeId task = graph.addNode(std::string(20, 'x'));
    NodeId longTask = graph.addNode(std::string(100, 'x'));
    NodeId pipeline = graph.addNode("Data Processing", NodeKind::ModularPipeline);

    SugiyamaLayout layout;
    LayoutResult result = layout.layout(graph);

    EXPECT_FLOAT_EQ(result.getNodeLayout(task)->size.width, 24.0f + 7.0f * 20.0f);
    EXPECT_FLOAT_EQ(result.getNodeLayout(longTask)->size.width, 280.0f);
    EXPECT_FLOAT_EQ(result.getNodeLayout(pipeline)->size.height, 48.0f);
    EXPECT_EQ(result.getNodeLayout(pipeline)->kind, NodeKind::ModularPipeline);
}

TEST(SugiyamaLayoutTest, MixedHeights_ShareRankMiddle) {
    EffectiveGraph graph;
    NodeId task = graph.addNode("task");
    NodeId pipeline = graph.addNode("group", NodeKind::ModularPipeline);
    NodeId below = graph.addNode("below");
    graph.addEdge(task, below);
    graph.addEdge(pipeline, below);

    SugiyamaLayout layout;
    LayoutResult result = layout.layout(graph);

    // Rank height = tallest (48) + rank separation (64)
    EXPECT_FLOAT_EQ(result.getNodeLayout(task)->center().y, 24.0f);
    EXPECT_FLOAT_EQ(result.getNodeLayout(pipeline)->center().y, 24.0f);
    EXPECT_FLOAT_EQ(result.getNodeLayout(below)->center().y, 112.0f + 24.0f);
}

// --- Rank Assignment ---

TEST(SugiyamaLayoutTest, EveryEdgePointsToHigherRank) {
    PipelineGraph model = PipelineGraph::build(test::layeredDag(120, 6, 7));
    EffectiveGraph graph = model.effectiveGraph();

    SugiyamaLayout layout;
    LayoutResult result = layout.layout(graph);

    ASSERT_EQ(result.nodeCount(), graph.nodeCount());
    ASSERT_EQ(result.edgeCount(), graph.edgeCount());
    for (const auto& edge : graph.edges()) {
        EXPECT_LT(result.getNodeLayout(edge.from)->rank, result.getNodeLayout(edge.to)->rank);
    }
    EXPECT_EQ(layout.lastStats().layerCount, 6);
}

TEST(SugiyamaLayoutTest, LongEdge_RoutedThroughDummyRank) {
    EffectiveGraph graph;
    NodeId a = graph.addNode("a");
    NodeId b = graph.addNode("b");
    NodeId c = graph.addNode("c");
    graph.addEdge(a, b);
    graph.addEdge(b, c);
    EdgeId skip = graph.addEdge(a, c);

    SugiyamaLayout layout;
    LayoutResult result = layout.layout(graph);

    EXPECT_EQ(layout.lastStats().dummyNodes, 1);
    EXPECT_EQ(result.getNodeLayout(c)->rank, 2);

    const EdgeLayout* edge = result.getEdgeLayout(skip);
    ASSERT_NE(edge, nullptr);
    EXPECT_FALSE(edge->bendPoints.empty());
    EXPECT_FLOAT_EQ(edge->sourcePoint.y, result.getNodeLayout(a)->bounds().bottom());
    EXPECT_FLOAT_EQ(edge->targetPoint.y, result.getNodeLayout(c)->bounds().top());
}

// --- Placement ---

TEST(SugiyamaLayoutTest, SiblingsKeepSeparation) {
    PipelineGraph model = PipelineGraph::build(test::nestedProject());
    SugiyamaLayout layout;

    LayoutResult result = layout.layout(model.effectiveGraph());

    expectNoOverlapWithinRanks(result, layout.options().nodeSeparation);
}

TEST(SugiyamaLayoutTest, EdgesAttachToBottomAndTopCentres) {
    PipelineGraph model = PipelineGraph::build(test::nestedProject());
    EffectiveGraph graph = model.effectiveGraph();
    SugiyamaLayout layout;

    LayoutResult result = layout.layout(graph);

    for (const auto& edge : graph.edges()) {
        const EdgeLayout* routed = result.getEdgeLayout(edge.id);
        ASSERT_NE(routed, nullptr);
        Rect source = result.getNodeLayout(edge.from)->bounds();
        Rect target = result.getNodeLayout(edge.to)->bounds();
        EXPECT_FLOAT_EQ(routed->sourcePoint.x, source.center().x);
        EXPECT_FLOAT_EQ(routed->sourcePoint.y, source.bottom());
        EXPECT_FLOAT_EQ(routed->targetPoint.x, target.center().x);
        EXPECT_FLOAT_EQ(routed->targetPoint.y, target.top());
    }
}

TEST(SugiyamaLayoutTest, LargeLayeredGraph_DistinctPositionsWithinIterationCap) {
    PipelineGraph model = PipelineGraph::build(test::layeredDag(500, 4, 42));
    EffectiveGraph graph = model.effectiveGraph();
    SugiyamaLayout layout;

    LayoutResult result = layout.layout(graph);

    ASSERT_EQ(result.nodeCount(), 500u);
    EXPECT_EQ(result.rankCount(), 4);
    EXPECT_LE(layout.lastStats().relaxationIterations, layout.options().relaxationMaxIterations);
    EXPECT_FALSE(layout.lastStats().fellBack);

    std::set<std::pair<int, long>> seen;
    for (const auto& [id, node] : result.nodeLayouts()) {
        long x = std::lround(node.center().x * 10.0f);
        EXPECT_TRUE(seen.insert({node.rank, x}).second) << "node " << id;
    }
    // Dummies may sit between two nodes, each side keeping the edge separation
    expectNoOverlapWithinRanks(result, 2.0f * layout.options().edgeSeparation);
}

TEST(SugiyamaLayoutTest, SameInput_ProducesIdenticalLayout) {
    PipelineGraph model = PipelineGraph::build(test::layeredDag(200, 5, 3));
    EffectiveGraph graph = model.effectiveGraph();

    SugiyamaLayout first;
    SugiyamaLayout second;
    LayoutResult a = first.layout(graph);
    LayoutResult b = second.layout(graph);

    ASSERT_EQ(a.nodeCount(), b.nodeCount());
    for (const auto& [id, node] : a.nodeLayouts()) {
        const NodeLayout* other = b.getNodeLayout(id);
        ASSERT_NE(other, nullptr);
        EXPECT_EQ(node.position, other->position);
        EXPECT_EQ(node.order, other->order);
    }
    EXPECT_EQ(a.toJson(), b.toJson());
}

// --- Crossing Minimization ---

TEST(SugiyamaLayoutTest, CrossedPairs_AreUntangled) {
    EffectiveGraph graph;
    NodeId a = graph.addNode("a");
    NodeId b = graph.addNode("b");
    NodeId c = graph.addNode("c");
    NodeId d = graph.addNode("d");
    graph.addEdge(a, d);
    graph.addEdge(b, c);

    SugiyamaLayout layout;
    LayoutResult result = layout.layout(graph);

    EXPECT_EQ(layout.lastStats().edgeCrossings, 0);
    bool aLeft = result.getNodeLayout(a)->order < result.getNodeLayout(b)->order;
    bool dLeft = result.getNodeLayout(d)->order < result.getNodeLayout(c)->order;
    EXPECT_EQ(aLeft, dLeft);
}

TEST(SugiyamaLayoutTest, PreviousLayout_SeedsOrderWithinRank) {
    EffectiveGraph graph;
    NodeId x = graph.addNode("x");
    NodeId y = graph.addNode("y");

    LayoutResult previous;
    NodeLayout seededX;
    seededX.id = x;
    seededX.rank = 0;
    seededX.order = 1;
    NodeLayout seededY;
    seededY.id = y;
    seededY.rank = 0;
    seededY.order = 0;
    previous.setNodeLayout(x, seededX);
    previous.setNodeLayout(y, seededY);

    SugiyamaLayout layout;
    LayoutResult fresh = layout.layout(graph);
    LayoutResult seeded = layout.layout(graph, &previous);

    EXPECT_EQ(fresh.getNodeLayout(x)->order, 0);
    EXPECT_EQ(seeded.getNodeLayout(y)->order, 0);
    EXPECT_EQ(seeded.getNodeLayout(x)->order, 1);
    EXPECT_LT(seeded.getNodeLayout(y)->position.x, seeded.getNodeLayout(x)->position.x);
}

TEST(SugiyamaLayoutTest, ReLayoutWithOwnResult_KeepsOrder) {
    PipelineGraph model = PipelineGraph::build(test::nestedProject());
    EffectiveGraph graph = model.effectiveGraph();
    SugiyamaLayout layout;

    LayoutResult first = layout.layout(graph);
    LayoutResult second = layout.layout(graph, &first);

    for (const auto& [id, node] : first.nodeLayouts()) {
        EXPECT_EQ(second.getNodeLayout(id)->order, node.order);
        EXPECT_EQ(second.getNodeLayout(id)->rank, node.rank);
    }
}

// --- Failure Handling ---

TEST(SugiyamaLayoutTest, BrokenRanker_FallsBackToSingleColumn) {
    Logger::enableCapture(true);
    Logger::clearCapturedLogs();

    EffectiveGraph graph = test::chainGraph(3);
    SugiyamaLayout layout;
    layout.setLayerAssignment(std::make_shared<FlatLayerAssignment>());

    LayoutResult result = layout.layout(graph);

    EXPECT_TRUE(layout.lastStats().fellBack);
    ASSERT_EQ(result.nodeCount(), 3u);
    ASSERT_EQ(result.edgeCount(), 2u);
    for (NodeId id = 0; id < 3; ++id) {
        const NodeLayout* node = result.getNodeLayout(id);
        EXPECT_EQ(node->rank, static_cast<int>(id));
        EXPECT_FLOAT_EQ(node->position.x, 0.0f);
        EXPECT_FLOAT_EQ(node->position.y, 100.0f * static_cast<float>(id));
    }
    EXPECT_FALSE(Logger::getCapturedLogs("falling back").empty());

    Logger::enableCapture(false);
    Logger::clearCapturedLogs();
}

TEST(SugiyamaLayoutTest, CyclicInput_FallsBackInsteadOfThrowing) {
    EffectiveGraph graph;
    NodeId a = graph.addNode("a");
    NodeId b = graph.addNode("b");
    graph.addEdge(a, b);
    graph.addEdge(b, a);

    SugiyamaLayout layout;
    LayoutResult result;
    EXPECT_NO_THROW(result = layout.layout(graph));

    EXPECT_TRUE(layout.lastStats().fellBack);
    EXPECT_EQ(result.nodeCount(), 2u);
    const EdgeLayout* back = result.getEdgeLayout(1);
    ASSERT_NE(back, nullptr);
    // Upward edge leaves through the top of b
    EXPECT_FLOAT_EQ(back->sourcePoint.y, result.getNodeLayout(b)->bounds().top());
}

TEST(SugiyamaLayoutTest, RecoversAfterFallback) {
    SugiyamaLayout layout;
    layout.setLayerAssignment(std::make_shared<FlatLayerAssignment>());
    layout.layout(test::chainGraph(2));
    ASSERT_TRUE(layout.lastStats().fellBack);

    layout.setLayerAssignment(std::make_shared<LongestPathLayerAssignment>());
    layout.layout(test::chainGraph(2));
    EXPECT_FALSE(layout.lastStats().fellBack);
}

// --- Options ---

TEST(SugiyamaLayoutTest, Options_ChangeRankSpacing) {
    SugiyamaLayout layout;
    LayoutOptions options;
    options.setRankSeparation(100.0f);
    layout.setOptions(options);

    LayoutResult result = layout.layout(test::chainGraph(2));

    EXPECT_FLOAT_EQ(result.getNodeLayout(1)->position.y, 136.0f);
    EXPECT_FLOAT_EQ(layout.options().rankSeparation, 100.0f);
}
