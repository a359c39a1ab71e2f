#include "pipeviz/core/Types.h"

namespace pipeviz {

const char* toString(NodeKind kind) {
    switch (kind) {
        case NodeKind::Task: return "task";
        case NodeKind::Dataset: return "dataset";
        case NodeKind::Parameters: return "parameters";
        case NodeKind::ModularPipeline: return "modularPipeline";
    }
    return "task";
}

std::optional<NodeKind> parseNodeKind(const std::string& name) {
    if (name == "task") return NodeKind::Task;
    if (name == "dataset" || name == "data") return NodeKind::Dataset;
    if (name == "parameters" || name == "parameter") return NodeKind::Parameters;
    if (name == "modularPipeline") return NodeKind::ModularPipeline;
    return std::nullopt;
}

}  // namespace pipeviz
