#include "pipeviz/core/SnapshotReader.h"
#include "pipeviz/core/LoadError.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace pipeviz {

namespace {

std::vector<std::string> stringList(const json& j, const char* field) {
    if (!j.contains(field)) return {};
    return j.at(field).get<std::vector<std::string>>();
}

NodeSpec readNode(const json& j) {
    NodeSpec spec;
    spec.id = j.at("id").get<std::string>();
    spec.name = j.value("name", spec.id);

    std::string type = j.value("type", std::string("task"));
    auto kind = parseNodeKind(type);
    if (!kind || *kind == NodeKind::ModularPipeline) {
        throw LoadError(LoadError::Kind::MalformedSnapshot, spec.id,
                        "Node '" + spec.id + "' has unsupported type '" + type + "'");
    }
    spec.kind = *kind;
    spec.tags = stringList(j, "tags");
    spec.pipelines = stringList(j, "pipelines");
    return spec;
}

ModularPipelineSpec readModularPipeline(const json& j) {
    ModularPipelineSpec spec;
    spec.id = j.at("id").get<std::string>();
    spec.name = j.value("name", spec.id);
    spec.members = stringList(j, "members");
    spec.collapsed = j.value("collapsed", false);
    return spec;
}

}  // namespace

PipelineSnapshot SnapshotReader::fromJson(const std::string& text) {
    PipelineSnapshot snapshot;
    try {
        json j = json::parse(text);
        if (!j.is_object() || !j.contains("nodes")) {
            throw LoadError(LoadError::Kind::MalformedSnapshot, "",
                            "Snapshot must be an object with a 'nodes' array");
        }

        for (const auto& node : j.at("nodes")) {
            snapshot.nodes.push_back(readNode(node));
        }

        if (j.contains("edges")) {
            for (const auto& edge : j.at("edges")) {
                snapshot.edges.push_back(EdgeSpec{edge.at("source").get<std::string>(),
                                                  edge.at("target").get<std::string>()});
            }
        }

        if (j.contains("modular_pipelines")) {
            for (const auto& pipeline : j.at("modular_pipelines")) {
                snapshot.modularPipelines.push_back(readModularPipeline(pipeline));
            }
        }

        if (j.contains("pipelines")) {
            for (const auto& pipeline : j.at("pipelines")) {
                std::string id = pipeline.at("id").get<std::string>();
                snapshot.registeredPipelines.push_back(
                    RegisteredPipelineSpec{id, pipeline.value("name", id)});
            }
        }

        if (j.contains("run_metrics")) {
            for (const auto& metric : j.at("run_metrics")) {
                RunMetricSeries series;
                series.node = metric.at("node").get<std::string>();
                series.metric = metric.at("metric").get<std::string>();
                series.run = metric.at("run").get<std::string>();
                series.values = metric.at("values").get<std::vector<double>>();
                snapshot.runMetrics.push_back(std::move(series));
            }
        }
    } catch (const json::exception& e) {
        throw LoadError(LoadError::Kind::MalformedSnapshot, "",
                        std::string("Malformed snapshot: ") + e.what());
    }
    return snapshot;
}

PipelineSnapshot SnapshotReader::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw LoadError(LoadError::Kind::MalformedSnapshot, path,
                        "Cannot open snapshot file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

std::string SnapshotReader::toJson(const PipelineSnapshot& snapshot) {
    json j;

    json nodes = json::array();
    for (const auto& node : snapshot.nodes) {
        nodes.push_back({
            {"id", node.id},
            {"name", node.name},
            {"type", toString(node.kind)},
            {"tags", node.tags},
            {"pipelines", node.pipelines}
        });
    }
    j["nodes"] = nodes;

    json edges = json::array();
    for (const auto& edge : snapshot.edges) {
        edges.push_back({{"source", edge.source}, {"target", edge.target}});
    }
    j["edges"] = edges;

    json modular = json::array();
    for (const auto& pipeline : snapshot.modularPipelines) {
        modular.push_back({
            {"id", pipeline.id},
            {"name", pipeline.name},
            {"members", pipeline.members},
            {"collapsed", pipeline.collapsed}
        });
    }
    j["modular_pipelines"] = modular;

    json registered = json::array();
    for (const auto& pipeline : snapshot.registeredPipelines) {
        registered.push_back({{"id", pipeline.id}, {"name", pipeline.name}});
    }
    j["pipelines"] = registered;

    json metrics = json::array();
    for (const auto& series : snapshot.runMetrics) {
        metrics.push_back({
            {"node", series.node},
            {"metric", series.metric},
            {"run", series.run},
            {"values", series.values}
        });
    }
    j["run_metrics"] = metrics;

    return j.dump(2);
}

}  // namespace pipeviz
