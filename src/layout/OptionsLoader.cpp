#include "pipeviz/layout/util/OptionsLoader.h"
#include "pipeviz/common/Logger.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

using json = nlohmann::json;

namespace pipeviz {

namespace {

template <typename T>
void readField(const json& j, const char* key, T& field) {
    if (!j.contains(key)) return;
    const json& value = j.at(key);
    bool typeOk = false;
    if constexpr (std::is_same_v<T, bool>) {
        typeOk = value.is_boolean();
    } else if constexpr (std::is_integral_v<T>) {
        typeOk = value.is_number_integer();
    } else {
        typeOk = value.is_number();
    }
    if (!typeOk) {
        throw std::runtime_error(std::string("Layout option '") + key + "' has the wrong type");
    }
    field = value.get<T>();
}

std::optional<CrossingStrategy> parseStrategy(const std::string& name) {
    if (name == "none") return CrossingStrategy::None;
    if (name == "barycenter") return CrossingStrategy::Barycenter;
    if (name == "median") return CrossingStrategy::Median;
    return std::nullopt;
}

}  // namespace

std::optional<LayoutOptions> OptionsLoader::preset(const std::string& name) {
    if (name == "compact") return LayoutOptions::compact();
    if (name == "balanced") return LayoutOptions::balanced();
    if (name == "spacious") return LayoutOptions::spacious();
    return std::nullopt;
}

LayoutOptions OptionsLoader::fromJson(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid layout options JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Layout options must be a JSON object");
    }

    LayoutOptions options;
    if (j.contains("preset")) {
        if (!j.at("preset").is_string()) {
            throw std::runtime_error("Layout option 'preset' must be a string");
        }
        auto base = preset(j.at("preset").get<std::string>());
        if (!base) {
            throw std::runtime_error("Unknown layout preset '" +
                                     j.at("preset").get<std::string>() + "'");
        }
        options = *base;
    }

    readField(j, "nodeSeparation", options.nodeSeparation);
    readField(j, "edgeSeparation", options.edgeSeparation);
    readField(j, "rankSeparation", options.rankSeparation);
    readField(j, "nodeHeight", options.nodeHeight);
    readField(j, "pipelineNodeHeight", options.pipelineNodeHeight);
    readField(j, "charWidth", options.charWidth);
    readField(j, "labelPadding", options.labelPadding);
    readField(j, "minNodeWidth", options.minNodeWidth);
    readField(j, "maxNodeWidth", options.maxNodeWidth);
    readField(j, "sweepPasses", options.sweepPasses);
    readField(j, "relaxationMaxIterations", options.relaxationMaxIterations);
    readField(j, "relaxationTolerance", options.relaxationTolerance);
    readField(j, "edgeStubLength", options.edgeStubLength);
    readField(j, "smoothingIterations", options.smoothingIterations);
    readField(j, "groupPadding", options.groupPadding);

    if (j.contains("crossingStrategy")) {
        const json& value = j.at("crossingStrategy");
        auto strategy = value.is_string() ? parseStrategy(value.get<std::string>()) : std::nullopt;
        if (!strategy) {
            throw std::runtime_error("Layout option 'crossingStrategy' must be "
                                     "\"none\", \"barycenter\" or \"median\"");
        }
        options.crossingStrategy = *strategy;
    }

    if (options.sweepPasses < 0 || options.relaxationMaxIterations < 0 ||
        options.smoothingIterations < 0) {
        throw std::runtime_error("Layout iteration counts must not be negative");
    }

    LOG_DEBUG("Loaded layout options: {} passes, {} relaxation iterations",
              options.sweepPasses, options.relaxationMaxIterations);
    return options;
}

LayoutOptions OptionsLoader::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open layout options file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

std::string OptionsLoader::toJson(const LayoutOptions& options) {
    json j = {
        {"nodeSeparation", options.nodeSeparation},
        {"edgeSeparation", options.edgeSeparation},
        {"rankSeparation", options.rankSeparation},
        {"nodeHeight", options.nodeHeight},
        {"pipelineNodeHeight", options.pipelineNodeHeight},
        {"charWidth", options.charWidth},
        {"labelPadding", options.labelPadding},
        {"minNodeWidth", options.minNodeWidth},
        {"maxNodeWidth", options.maxNodeWidth},
        {"crossingStrategy", toString(options.crossingStrategy)},
        {"sweepPasses", options.sweepPasses},
        {"relaxationMaxIterations", options.relaxationMaxIterations},
        {"relaxationTolerance", options.relaxationTolerance},
        {"edgeStubLength", options.edgeStubLength},
        {"smoothingIterations", options.smoothingIterations},
        {"groupPadding", options.groupPadding}
    };
    return j.dump(2);
}

}  // namespace pipeviz
