#include "pipeviz/layout/util/LayoutSerializer.h"
#include "pipeviz/layout/config/LayoutResult.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace pipeviz {

namespace {

json pointToJson(const Point& p) {
    return {{"x", p.x}, {"y", p.y}};
}

Point pointFromJson(const json& j) {
    return {j.at("x").get<float>(), j.at("y").get<float>()};
}

template <typename Map>
std::vector<typename Map::key_type> sortedKeys(const Map& map) {
    std::vector<typename Map::key_type> keys;
    keys.reserve(map.size());
    for (const auto& [key, value] : map) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}  // namespace

std::string LayoutSerializer::toJson(const LayoutResult& result) {
    json j;
    j["version"] = 1;
    j["rankCount"] = result.rankCount();

    json nodeLayouts = json::array();
    for (NodeId id : sortedKeys(result.nodeLayouts())) {
        const NodeLayout& layout = result.nodeLayouts().at(id);
        nodeLayouts.push_back({
            {"id", id},
            {"kind", toString(layout.kind)},
            {"position", pointToJson(layout.position)},
            {"size", {{"width", layout.size.width}, {"height", layout.size.height}}},
            {"rank", layout.rank},
            {"order", layout.order}
        });
    }
    j["nodeLayouts"] = nodeLayouts;

    json edgeLayouts = json::array();
    for (EdgeId id : sortedKeys(result.edgeLayouts())) {
        const EdgeLayout& layout = result.edgeLayouts().at(id);
        json bendPoints = json::array();
        for (const auto& bp : layout.bendPoints) {
            bendPoints.push_back(pointToJson(bp));
        }
        edgeLayouts.push_back({
            {"id", id},
            {"from", layout.from},
            {"to", layout.to},
            {"synthetic", layout.synthetic},
            {"sourcePoint", pointToJson(layout.sourcePoint)},
            {"targetPoint", pointToJson(layout.targetPoint)},
            {"bendPoints", bendPoints}
        });
    }
    j["edgeLayouts"] = edgeLayouts;

    return j.dump(2);
}

LayoutResult LayoutSerializer::layoutResultFromJson(const std::string& jsonStr) {
    LayoutResult result;

    try {
        json j = json::parse(jsonStr);
        result.setRankCount(j.value("rankCount", 0));

        if (j.contains("nodeLayouts")) {
            for (const auto& nodeJson : j.at("nodeLayouts")) {
                NodeLayout layout;
                layout.id = nodeJson.at("id").get<NodeId>();
                layout.kind = parseNodeKind(nodeJson.value("kind", std::string("task")))
                                  .value_or(NodeKind::Task);
                layout.position = pointFromJson(nodeJson.at("position"));
                layout.size.width = nodeJson.at("size").at("width").get<float>();
                layout.size.height = nodeJson.at("size").at("height").get<float>();
                layout.rank = nodeJson.value("rank", 0);
                layout.order = nodeJson.value("order", 0);
                result.setNodeLayout(layout.id, layout);
            }
        }

        if (j.contains("edgeLayouts")) {
            for (const auto& edgeJson : j.at("edgeLayouts")) {
                EdgeLayout layout;
                layout.id = edgeJson.at("id").get<EdgeId>();
                layout.from = edgeJson.at("from").get<NodeId>();
                layout.to = edgeJson.at("to").get<NodeId>();
                layout.synthetic = edgeJson.value("synthetic", false);
                layout.sourcePoint = pointFromJson(edgeJson.at("sourcePoint"));
                layout.targetPoint = pointFromJson(edgeJson.at("targetPoint"));
                if (edgeJson.contains("bendPoints")) {
                    for (const auto& bp : edgeJson.at("bendPoints")) {
                        layout.bendPoints.push_back(pointFromJson(bp));
                    }
                }
                result.setEdgeLayout(layout.id, layout);
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse layout JSON: ") + e.what());
    }

    return result;
}

bool LayoutSerializer::saveToFile(const LayoutResult& result, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << toJson(result);
    return file.good();
}

LayoutResult LayoutSerializer::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open layout file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return layoutResultFromJson(buffer.str());
}

}  // namespace pipeviz
