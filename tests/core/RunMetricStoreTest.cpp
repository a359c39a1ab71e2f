#include <gtest/gtest.h>
#include <pipeviz/core/PipelineGraph.h>
#include <pipeviz/core/RunMetricStore.h>

#include "support/TestSnapshots.h"

using namespace pipeviz;

namespace {

RunMetricStore projectMetrics() {
    RunMetricStore store;
    for (const auto& series : test::nestedProject().runMetrics) {
        store.add(series);
    }
    return store;
}

}  // namespace

TEST(RunMetricStoreTest, EmptyStore) {
    RunMetricStore store;
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(store.find("a", "m", "r"), nullptr);
    EXPECT_FALSE(store.latest("a", "m").has_value());
    EXPECT_FALSE(store.normalized("a", "m", "r").has_value());
}

TEST(RunMetricStoreTest, RunsKeepFirstSeenOrder) {
    RunMetricStore store = projectMetrics();
    EXPECT_EQ(store.size(), 4u);
    EXPECT_EQ(store.runs(), (std::vector<std::string>{"r1", "r2"}));
    EXPECT_EQ(store.metrics(), std::vector<std::string>{"accuracy"});
    EXPECT_EQ(store.metricsFor("train"), std::vector<std::string>{"accuracy"});
    EXPECT_TRUE(store.metricsFor("raw").empty());
}

TEST(RunMetricStoreTest, LatestUsesLastValueOfMostRecentRun) {
    RunMetricStore store = projectMetrics();
    EXPECT_DOUBLE_EQ(store.latest("train", "accuracy", "r1").value(), 0.80);
    EXPECT_DOUBLE_EQ(store.latest("train", "accuracy").value(), 0.85);
    EXPECT_FALSE(store.latest("train", "loss").has_value());
}

TEST(RunMetricStoreTest, LatestFallsBackToOlderRun) {
    RunMetricStore store = projectMetrics();
    store.add({"clean", "rows", "r1", {100.0}});
    EXPECT_DOUBLE_EQ(store.latest("clean", "rows").value(), 100.0);
}

TEST(RunMetricStoreTest, LaterSeriesReplacesEarlier) {
    RunMetricStore store = projectMetrics();
    store.add({"train", "accuracy", "r1", {0.5}});
    EXPECT_EQ(store.size(), 4u);
    EXPECT_DOUBLE_EQ(store.latest("train", "accuracy", "r1").value(), 0.5);
}

TEST(RunMetricStoreTest, NormalizedSpansRunRange) {
    RunMetricStore store = projectMetrics();
    EXPECT_DOUBLE_EQ(store.normalized("train", "accuracy", "r1").value(), 1.0);
    EXPECT_DOUBLE_EQ(store.normalized("evaluate", "accuracy", "r1").value(), 0.0);
    EXPECT_DOUBLE_EQ(store.normalized("train", "accuracy", "r2").value(), 0.0);
    EXPECT_DOUBLE_EQ(store.normalized("evaluate", "accuracy", "r2").value(), 1.0);
}

TEST(RunMetricStoreTest, DegenerateRangeMapsToMiddle) {
    RunMetricStore store;
    store.add({"a", "loss", "r1", {3.0}});
    EXPECT_DOUBLE_EQ(store.normalized("a", "loss", "r1").value(), 0.5);
}

TEST(RunMetricStoreTest, EmptySeriesHasNoValue) {
    RunMetricStore store;
    store.add({"a", "loss", "r1", {}});
    EXPECT_NE(store.find("a", "loss", "r1"), nullptr);
    EXPECT_FALSE(store.latest("a", "loss", "r1").has_value());
}

TEST(RunMetricStoreTest, DeltaBetweenRuns) {
    RunMetricStore store = projectMetrics();
    EXPECT_NEAR(store.delta("train", "accuracy", "r1", "r2").value(), 0.05, 1e-9);
    EXPECT_NEAR(store.delta("evaluate", "accuracy", "r1", "r2").value(), 0.30, 1e-9);
    EXPECT_FALSE(store.delta("train", "accuracy", "r1", "r9").has_value());
}

TEST(RunMetricStoreTest, ClearForgetsRuns) {
    RunMetricStore store = projectMetrics();
    store.clear();
    EXPECT_TRUE(store.empty());
    EXPECT_TRUE(store.runs().empty());
}

TEST(RunMetricStoreTest, ModelKeepsMetricsOfKnownNodes) {
    PipelineSnapshot snapshot = test::nestedProject();
    snapshot.runMetrics.push_back({"ghost", "accuracy", "r1", {1.0}});

    PipelineGraph graph = PipelineGraph::build(snapshot);
    EXPECT_EQ(graph.runMetrics().size(), 4u);
    EXPECT_EQ(graph.runMetrics().find("ghost", "accuracy", "r1"), nullptr);
}
