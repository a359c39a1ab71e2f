#include <gtest/gtest.h>
#include <pipeviz/pipeviz.h>

#include "support/TestSnapshots.h"

#include <limits>

using namespace pipeviz;

namespace {

bool mentions(const ContractReport& report, const std::string& text) {
    for (const auto& violation : report.violations) {
        if (violation.find(text) != std::string::npos) return true;
    }
    return false;
}

}  // namespace

// --- Produced layouts ---

TEST(GeometryContractTest, SugiyamaOutput_Holds) {
    PipelineGraph graph = PipelineGraph::build(test::nestedProject());
    EffectiveGraph effective = graph.effectiveGraph();

    LayoutResult layout = SugiyamaLayout().layout(effective);
    ContractReport report = GeometryContract::validate(effective, layout);

    EXPECT_TRUE(report.ok);
    EXPECT_TRUE(report.violations.empty());
}

TEST(GeometryContractTest, CollapsedAndLargeGraphs_Hold) {
    PipelineGraph nested = PipelineGraph::build(test::nestedProject());
    nested.setCollapsed(nested.findNode("data_processing").value(), true);
    EffectiveGraph collapsed = nested.effectiveGraph();
    EXPECT_TRUE(GeometryContract::validate(collapsed, SugiyamaLayout().layout(collapsed)).ok);

    PipelineGraph large = PipelineGraph::build(test::layeredDag(200, 5, 3));
    EffectiveGraph effective = large.effectiveGraph();
    EXPECT_TRUE(GeometryContract::validate(effective, SugiyamaLayout().layout(effective)).ok);
}

TEST(GeometryContractTest, EmptyGraph_Holds) {
    EffectiveGraph graph;
    EXPECT_TRUE(GeometryContract::validate(graph, LayoutResult()).ok);
}

// --- Violations ---

TEST(GeometryContractTest, MissingNode_Reported) {
    EffectiveGraph graph = test::chainGraph(2);
    LayoutResult layout = SugiyamaLayout().layout(graph);
    EffectiveGraph bigger = test::chainGraph(3);

    ContractReport report = GeometryContract::validate(bigger, layout);

    EXPECT_FALSE(report.ok);
    EXPECT_TRUE(mentions(report, "node 'n2' has no coordinates"));
    EXPECT_TRUE(mentions(report, "edge 1 has no points"));
}

TEST(GeometryContractTest, NonFinitePoint_Reported) {
    EffectiveGraph graph = test::chainGraph(2);
    LayoutResult layout = SugiyamaLayout().layout(graph);
    layout.getEdgeLayout(0)->bendPoints.push_back(
        {std::numeric_limits<float>::quiet_NaN(), 10.0f});

    ContractReport report = GeometryContract::validate(graph, layout);

    EXPECT_FALSE(report.ok);
    EXPECT_TRUE(mentions(report, "non-finite"));
}

TEST(GeometryContractTest, EmptyBox_Reported) {
    EffectiveGraph graph = test::chainGraph(2);
    LayoutResult layout = SugiyamaLayout().layout(graph);
    layout.getNodeLayout(1)->size = {0.0f, 36.0f};

    ContractReport report = GeometryContract::validate(graph, layout);

    EXPECT_FALSE(report.ok);
    EXPECT_TRUE(mentions(report, "node 'n1' has an invalid box"));
}

TEST(GeometryContractTest, DetachedEndpoint_Reported) {
    EffectiveGraph graph = test::chainGraph(2);
    LayoutResult layout = SugiyamaLayout().layout(graph);
    layout.getEdgeLayout(0)->sourcePoint = {30.0f, 18.0f};
    layout.getEdgeLayout(0)->targetPoint = {500.0f, 500.0f};

    ContractReport report = GeometryContract::validate(graph, layout);

    EXPECT_FALSE(report.ok);
    EXPECT_TRUE(mentions(report, "edge 0 does not start on its source boundary"));
    EXPECT_TRUE(mentions(report, "edge 0 does not end on its target boundary"));
}

TEST(GeometryContractTest, ToleranceIsRespected) {
    EffectiveGraph graph = test::chainGraph(2);
    LayoutResult layout = SugiyamaLayout().layout(graph);
    // Node 0 spans y in [0, 36]
    layout.getEdgeLayout(0)->sourcePoint = {30.0f, 37.0f};

    EXPECT_FALSE(GeometryContract::validate(graph, layout, 0.5f).ok);
    EXPECT_TRUE(GeometryContract::validate(graph, layout, 2.0f).ok);
}
