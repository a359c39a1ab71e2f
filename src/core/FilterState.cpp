#include "pipeviz/core/FilterState.h"

#include <algorithm>
#include <cctype>

namespace pipeviz {

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
    return it != haystack.end();
}

bool FilterState::matchesTags(const NodeData& node) const {
    if (tags.empty()) return true;
    for (const auto& tag : node.tags) {
        if (tags.count(tag) > 0) {
            return true;
        }
    }
    return false;
}

bool FilterState::matchesSearch(const std::string& name) const {
    return containsIgnoreCase(name, search);
}

bool FilterState::matchesKind(NodeKind kind) const {
    return kinds.empty() || kinds.count(kind) > 0;
}

bool FilterState::matchesRegisteredPipeline(const std::vector<std::string>& pipelines) const {
    if (!registeredPipeline || pipelines.empty()) return true;
    return std::find(pipelines.begin(), pipelines.end(), *registeredPipeline) != pipelines.end();
}

}  // namespace pipeviz
