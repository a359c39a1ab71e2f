#pragma once

#include "Types.h"

#include <string>
#include <vector>

namespace pipeviz {

/// Node entry of a backend snapshot (task, dataset or parameters)
struct NodeSpec {
    std::string id;
    std::string name;
    NodeKind kind = NodeKind::Task;
    std::vector<std::string> tags;
    /// Registered pipelines the node belongs to (empty = all of them)
    std::vector<std::string> pipelines;
};

struct EdgeSpec {
    std::string source;
    std::string target;
};

/// Modular pipeline entry; members are direct children (nodes or other modular pipelines)
struct ModularPipelineSpec {
    std::string id;
    std::string name;
    std::vector<std::string> members;
    bool collapsed = false;   ///< Default state on load
};

/// A top-level pipeline registered in the project (e.g. "__default__")
struct RegisteredPipelineSpec {
    std::string id;
    std::string name;
};

/// Recorded values of one metric of one node in one experiment run
struct RunMetricSeries {
    std::string node;
    std::string metric;
    std::string run;
    std::vector<double> values;
};

/// Immutable input of one load, as delivered by the backend collaborator
struct PipelineSnapshot {
    std::vector<NodeSpec> nodes;
    std::vector<EdgeSpec> edges;
    std::vector<ModularPipelineSpec> modularPipelines;
    std::vector<RegisteredPipelineSpec> registeredPipelines;
    std::vector<RunMetricSeries> runMetrics;
};

}  // namespace pipeviz
