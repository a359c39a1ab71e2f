#include <gtest/gtest.h>
#include <pipeviz/core/LoadError.h>
#include <pipeviz/core/PipelineGraph.h>
#include <pipeviz/core/SnapshotReader.h>

#include "support/TestSnapshots.h"

#include <cstdio>
#include <fstream>

using namespace pipeviz;

namespace {

const char* kProjectJson = R"({
  "nodes": [
    {"id": "raw", "name": "Raw Data", "type": "dataset"},
    {"id": "clean", "name": "Clean", "type": "task", "tags": ["preprocessing"]},
    {"id": "params", "type": "parameters", "pipelines": ["__default__"]}
  ],
  "edges": [
    {"source": "raw", "target": "clean"},
    {"source": "params", "target": "clean"}
  ],
  "modular_pipelines": [
    {"id": "prep", "name": "Preparation", "members": ["clean"], "collapsed": true}
  ],
  "pipelines": [{"id": "__default__", "name": "Default"}],
  "run_metrics": [
    {"node": "clean", "metric": "rows", "run": "r1", "values": [10, 12]}
  ]
})";

LoadError::Kind errorKindOf(const std::string& json) {
    try {
        SnapshotReader::fromJson(json);
    } catch (const LoadError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "Expected LoadError for: " << json;
    return LoadError::Kind::GraphCycle;
}

}  // namespace

// --- Parsing ---

TEST(SnapshotReaderTest, ParsesAllSections) {
    PipelineSnapshot snapshot = SnapshotReader::fromJson(kProjectJson);

    ASSERT_EQ(snapshot.nodes.size(), 3u);
    EXPECT_EQ(snapshot.nodes[0].id, "raw");
    EXPECT_EQ(snapshot.nodes[0].name, "Raw Data");
    EXPECT_EQ(snapshot.nodes[0].kind, NodeKind::Dataset);
    EXPECT_EQ(snapshot.nodes[1].tags, std::vector<std::string>{"preprocessing"});
    EXPECT_EQ(snapshot.nodes[2].kind, NodeKind::Parameters);
    EXPECT_EQ(snapshot.nodes[2].pipelines, std::vector<std::string>{"__default__"});

    ASSERT_EQ(snapshot.edges.size(), 2u);
    EXPECT_EQ(snapshot.edges[1].source, "params");
    EXPECT_EQ(snapshot.edges[1].target, "clean");

    ASSERT_EQ(snapshot.modularPipelines.size(), 1u);
    EXPECT_EQ(snapshot.modularPipelines[0].name, "Preparation");
    EXPECT_TRUE(snapshot.modularPipelines[0].collapsed);

    ASSERT_EQ(snapshot.registeredPipelines.size(), 1u);
    ASSERT_EQ(snapshot.runMetrics.size(), 1u);
    EXPECT_EQ(snapshot.runMetrics[0].values, (std::vector<double>{10.0, 12.0}));
}

TEST(SnapshotReaderTest, OptionalFieldsDefault) {
    PipelineSnapshot snapshot = SnapshotReader::fromJson(R"({"nodes": [{"id": "a"}]})");

    ASSERT_EQ(snapshot.nodes.size(), 1u);
    EXPECT_EQ(snapshot.nodes[0].name, "a");
    EXPECT_EQ(snapshot.nodes[0].kind, NodeKind::Task);
    EXPECT_TRUE(snapshot.nodes[0].tags.empty());
    EXPECT_TRUE(snapshot.edges.empty());
    EXPECT_TRUE(snapshot.modularPipelines.empty());
    EXPECT_TRUE(snapshot.runMetrics.empty());
}

TEST(SnapshotReaderTest, AcceptsDataAsDatasetAlias) {
    PipelineSnapshot snapshot =
        SnapshotReader::fromJson(R"({"nodes": [{"id": "a", "type": "data"}]})");
    EXPECT_EQ(snapshot.nodes[0].kind, NodeKind::Dataset);
}

TEST(SnapshotReaderTest, ParsedSnapshotBuildsModel) {
    PipelineGraph graph = PipelineGraph::build(SnapshotReader::fromJson(kProjectJson));
    NodeId prep = graph.findNode("prep").value();

    EXPECT_TRUE(graph.isCollapsed(prep));
    EXPECT_TRUE(graph.isVisible(prep));
    EXPECT_FALSE(graph.isVisible(graph.findNode("clean").value()));
    EXPECT_EQ(graph.effectiveEdges().size(), 2u);
    EXPECT_EQ(graph.runMetrics().latest("clean", "rows"), std::optional<double>(12.0));
}

// --- Malformed input ---

TEST(SnapshotReaderTest, MalformedInput_RaisesMalformedSnapshot) {
    EXPECT_EQ(errorKindOf("not json"), LoadError::Kind::MalformedSnapshot);
    EXPECT_EQ(errorKindOf("[]"), LoadError::Kind::MalformedSnapshot);
    EXPECT_EQ(errorKindOf(R"({"edges": []})"), LoadError::Kind::MalformedSnapshot);
    EXPECT_EQ(errorKindOf(R"({"nodes": [{"name": "no id"}]})"),
              LoadError::Kind::MalformedSnapshot);
    EXPECT_EQ(errorKindOf(R"({"nodes": [{"id": 5}]})"), LoadError::Kind::MalformedSnapshot);
    EXPECT_EQ(errorKindOf(R"({"nodes": [{"id": "a", "type": "spaceship"}]})"),
              LoadError::Kind::MalformedSnapshot);
    EXPECT_EQ(errorKindOf(R"({"nodes": [{"id": "a", "type": "modularPipeline"}]})"),
              LoadError::Kind::MalformedSnapshot);
    EXPECT_EQ(errorKindOf(R"({"nodes": [{"id": "a"}], "edges": [{"source": "a"}]})"),
              LoadError::Kind::MalformedSnapshot);
}

TEST(SnapshotReaderTest, UnsupportedTypeNamesTheNode) {
    try {
        SnapshotReader::fromJson(R"({"nodes": [{"id": "odd", "type": "spaceship"}]})");
        FAIL() << "Expected LoadError";
    } catch (const LoadError& e) {
        EXPECT_EQ(e.subject(), "odd");
        EXPECT_NE(std::string(e.what()).find("spaceship"), std::string::npos);
    }
}

TEST(SnapshotReaderTest, MissingFile_RaisesMalformedSnapshot) {
    EXPECT_THROW(SnapshotReader::loadFromFile("/nonexistent/pipeviz/snapshot.json"), LoadError);
}

// --- Writing ---

TEST(SnapshotReaderTest, ToJsonReadsBackEquivalentSnapshot) {
    PipelineSnapshot original = test::nestedProject();
    PipelineSnapshot restored = SnapshotReader::fromJson(SnapshotReader::toJson(original));

    ASSERT_EQ(restored.nodes.size(), original.nodes.size());
    for (size_t i = 0; i < original.nodes.size(); ++i) {
        EXPECT_EQ(restored.nodes[i].id, original.nodes[i].id);
        EXPECT_EQ(restored.nodes[i].kind, original.nodes[i].kind);
        EXPECT_EQ(restored.nodes[i].tags, original.nodes[i].tags);
        EXPECT_EQ(restored.nodes[i].pipelines, original.nodes[i].pipelines);
    }
    EXPECT_EQ(restored.edges.size(), original.edges.size());
    ASSERT_EQ(restored.modularPipelines.size(), 3u);
    EXPECT_EQ(restored.modularPipelines[2].members,
              (std::vector<std::string>{"train", "model"}));
    EXPECT_EQ(restored.runMetrics.size(), original.runMetrics.size());
}

TEST(SnapshotReaderTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "pipeviz_snapshot_test.json";
    {
        std::ofstream out(path);
        out << kProjectJson;
    }

    PipelineSnapshot snapshot = SnapshotReader::loadFromFile(path);
    EXPECT_EQ(snapshot.nodes.size(), 3u);
    std::remove(path.c_str());
}
