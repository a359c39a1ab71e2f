#include <gtest/gtest.h>
#include <pipeviz/core/PipelineGraph.h>

#include "support/TestSnapshots.h"

using namespace pipeviz;
using pipeviz::test::node;

namespace {

LoadError::Kind buildErrorKind(const PipelineSnapshot& snapshot) {
    try {
        PipelineGraph::build(snapshot);
    } catch (const LoadError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "snapshot was accepted";
    return LoadError::Kind::MalformedSnapshot;
}

NodeId id(const PipelineGraph& graph, const std::string& key) {
    auto found = graph.findNode(key);
    EXPECT_TRUE(found.has_value()) << key;
    return found.value_or(INVALID_NODE);
}

}  // namespace

// --- Valid snapshots ---

TEST(PipelineGraphBuildTest, NodesThenPipelinesInSnapshotOrder) {
    PipelineGraph graph = PipelineGraph::build(test::nestedProject());

    EXPECT_EQ(graph.nodeCount(), 11u);
    EXPECT_EQ(graph.edgeCount(), 7u);
    EXPECT_EQ(id(graph, "raw"), 0u);
    EXPECT_EQ(id(graph, "data_processing"), 8u);
    EXPECT_EQ(graph.pipelines(), (std::vector<NodeId>{8, 9, 10}));
    EXPECT_EQ(graph.getNode(id(graph, "modelling")).label, "Modelling");
    EXPECT_EQ(graph.getNode(id(graph, "modelling")).kind, NodeKind::ModularPipeline);
}

TEST(PipelineGraphBuildTest, HierarchyQueries) {
    PipelineGraph graph = PipelineGraph::build(test::nestedProject());
    NodeId modelling = id(graph, "modelling");
    NodeId training = id(graph, "training");
    NodeId train = id(graph, "train");

    EXPECT_EQ(graph.topLevelPipelines(), (std::vector<NodeId>{id(graph, "data_processing"),
                                                              modelling}));
    EXPECT_EQ(graph.getParent(training), modelling);
    EXPECT_FALSE(graph.getParent(modelling).has_value());
    EXPECT_EQ(graph.membership(train), (std::vector<NodeId>{training, modelling}));
    EXPECT_TRUE(graph.membership(id(graph, "raw")).empty());
    EXPECT_TRUE(graph.isAncestorOf(modelling, train));
    EXPECT_FALSE(graph.isAncestorOf(train, modelling));

    // Pre-order over direct members
    EXPECT_EQ(graph.nodesInPipeline(modelling),
              (std::vector<NodeId>{training, train, id(graph, "model"), id(graph, "evaluate")}));
    EXPECT_EQ(graph.leavesOf(modelling),
              (std::vector<NodeId>{train, id(graph, "model"), id(graph, "evaluate")}));
}

TEST(PipelineGraphBuildTest, EdgeReachability) {
    PipelineGraph graph = PipelineGraph::build(test::nestedProject());
    NodeId train = id(graph, "train");

    auto in = graph.neighbors(train, EdgeDirection::In);
    EXPECT_EQ(in, (std::vector<NodeId>{id(graph, "features"), id(graph, "params")}));
    EXPECT_EQ(graph.neighbors(train, EdgeDirection::Out), std::vector<NodeId>{id(graph, "model")});
    EXPECT_EQ(graph.neighbors(train, EdgeDirection::Both).size(), 3u);

    EXPECT_EQ(graph.ancestors(train).size(), 4u);     // features, params, clean, raw
    EXPECT_EQ(graph.descendants(train).size(), 3u);   // model, evaluate, report

    // A pipeline's neighbours are the outside nodes touching its members
    NodeId dp = id(graph, "data_processing");
    EXPECT_EQ(graph.neighbors(dp, EdgeDirection::In), std::vector<NodeId>{id(graph, "raw")});
    EXPECT_EQ(graph.neighbors(dp, EdgeDirection::Out), std::vector<NodeId>{train});
}

TEST(PipelineGraphBuildTest, DefaultCollapseStateIsKept) {
    PipelineSnapshot snapshot = test::nestedProject();
    snapshot.modularPipelines[0].collapsed = true;

    PipelineGraph graph = PipelineGraph::build(snapshot);
    NodeId dp = id(graph, "data_processing");

    EXPECT_TRUE(graph.isCollapsed(dp));
    EXPECT_TRUE(graph.defaultCollapsed(dp));
    EXPECT_TRUE(graph.isVisible(dp));
    EXPECT_FALSE(graph.isVisible(id(graph, "clean")));
}

TEST(PipelineGraphBuildTest, RunMetricsOfUnknownNodesAreSkipped) {
    PipelineSnapshot snapshot = test::nestedProject();
    snapshot.runMetrics.push_back({"ghost", "accuracy", "r1", {1.0}});

    PipelineGraph graph = PipelineGraph::build(snapshot);
    EXPECT_EQ(graph.runMetrics().size(), 4u);
    EXPECT_EQ(graph.registeredPipelines().size(), 2u);
}

TEST(PipelineGraphBuildTest, EmptySnapshot) {
    PipelineGraph graph = PipelineGraph::build(PipelineSnapshot{});
    EXPECT_EQ(graph.nodeCount(), 0u);
    EXPECT_TRUE(graph.effectiveGraph().empty());
}

// --- Load errors ---

TEST(PipelineGraphBuildTest, DanglingEdge_Throws) {
    PipelineSnapshot snapshot = test::chainWithPipeline();
    snapshot.edges.push_back({"C", "ghost"});

    try {
        PipelineGraph::build(snapshot);
        FAIL() << "dangling edge accepted";
    } catch (const LoadError& e) {
        EXPECT_EQ(e.kind(), LoadError::Kind::DanglingEdge);
        EXPECT_EQ(e.subject(), "ghost");
    }
}

TEST(PipelineGraphBuildTest, EdgeToModularPipeline_IsDangling) {
    PipelineSnapshot snapshot = test::chainWithPipeline();
    snapshot.edges.push_back({"A", "M"});
    EXPECT_EQ(buildErrorKind(snapshot), LoadError::Kind::DanglingEdge);
}

TEST(PipelineGraphBuildTest, DuplicateIds_Throw) {
    PipelineSnapshot nodes = test::chainWithPipeline();
    nodes.nodes.push_back(node("A"));
    EXPECT_EQ(buildErrorKind(nodes), LoadError::Kind::DuplicateId);

    PipelineSnapshot nodeAndPipeline = test::chainWithPipeline();
    nodeAndPipeline.modularPipelines.push_back({"A", "A", {}, false});
    EXPECT_EQ(buildErrorKind(nodeAndPipeline), LoadError::Kind::DuplicateId);

    PipelineSnapshot pipelines = test::chainWithPipeline();
    pipelines.modularPipelines.push_back({"M", "M again", {}, false});
    EXPECT_EQ(buildErrorKind(pipelines), LoadError::Kind::DuplicateId);
}

TEST(PipelineGraphBuildTest, UnknownMember_Throws) {
    PipelineSnapshot snapshot = test::chainWithPipeline();
    snapshot.modularPipelines[0].members.push_back("ghost");
    EXPECT_EQ(buildErrorKind(snapshot), LoadError::Kind::UnknownMember);
}

TEST(PipelineGraphBuildTest, UnknownRegisteredPipeline_Throws) {
    PipelineSnapshot snapshot = test::nestedProject();
    snapshot.nodes[0].pipelines.push_back("nope");
    EXPECT_EQ(buildErrorKind(snapshot), LoadError::Kind::UnknownMember);
}

TEST(PipelineGraphBuildTest, MemberOfTwoPipelines_Throws) {
    PipelineSnapshot snapshot = test::chainWithPipeline();
    snapshot.modularPipelines.push_back({"N", "N", {"B"}, false});
    EXPECT_EQ(buildErrorKind(snapshot), LoadError::Kind::AmbiguousMembership);
}

TEST(PipelineGraphBuildTest, MembershipCycle_Throws) {
    PipelineSnapshot self = test::chainWithPipeline();
    self.modularPipelines[0].members.push_back("M");
    EXPECT_EQ(buildErrorKind(self), LoadError::Kind::MembershipCycle);

    PipelineSnapshot mutual = test::chainWithPipeline();
    mutual.modularPipelines[0].members.push_back("N");
    mutual.modularPipelines.push_back({"N", "N", {"M"}, false});
    EXPECT_EQ(buildErrorKind(mutual), LoadError::Kind::MembershipCycle);
}

TEST(PipelineGraphBuildTest, RawCycle_Throws) {
    PipelineSnapshot snapshot = test::chainWithPipeline();
    snapshot.edges.push_back({"C", "A"});
    EXPECT_EQ(buildErrorKind(snapshot), LoadError::Kind::GraphCycle);

    PipelineSnapshot selfLoop = test::chainWithPipeline();
    selfLoop.edges.push_back({"A", "A"});
    EXPECT_EQ(buildErrorKind(selfLoop), LoadError::Kind::GraphCycle);
}

TEST(PipelineGraphBuildTest, CycleAfterSingleCollapse_Throws) {
    // A -> B -> C with A and C grouped: collapsing M gives M -> B -> M
    PipelineSnapshot snapshot;
    snapshot.nodes = {node("A"), node("B"), node("C")};
    snapshot.edges = {{"A", "B"}, {"B", "C"}};
    snapshot.modularPipelines = {{"M", "M", {"A", "C"}, false}};

    EXPECT_EQ(buildErrorKind(snapshot), LoadError::Kind::GraphCycle);
}

TEST(PipelineGraphBuildTest, CycleOnlyUnderCombinedCollapse_IsAccepted) {
    EXPECT_NO_THROW(PipelineGraph::build(test::crossingGroups()));
}

TEST(PipelineGraphBuildTest, ModularPipelineKindOnNode_IsMalformed) {
    PipelineSnapshot snapshot = test::chainWithPipeline();
    snapshot.nodes.push_back(node("X", NodeKind::ModularPipeline));
    EXPECT_EQ(buildErrorKind(snapshot), LoadError::Kind::MalformedSnapshot);
}
