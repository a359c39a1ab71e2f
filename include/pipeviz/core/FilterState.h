#pragma once

#include "Graph.h"

#include <optional>
#include <set>
#include <string>

namespace pipeviz {

/// Active filters of the flowchart; empty members mean "no filter"
struct FilterState {
    std::set<std::string> tags;                  ///< Node must carry at least one of these
    std::string search;                          ///< Case-insensitive substring of the name
    std::set<NodeKind> kinds;                    ///< Node kind must be one of these
    std::optional<std::string> registeredPipeline;  ///< Node must belong to this pipeline

    bool hasTagFilter() const { return !tags.empty(); }
    bool hasSearch() const { return !search.empty(); }
    bool hasKindFilter() const { return !kinds.empty(); }
    bool isActive() const {
        return hasTagFilter() || hasSearch() || hasKindFilter() || registeredPipeline.has_value();
    }

    bool matchesTags(const NodeData& node) const;
    bool matchesSearch(const std::string& name) const;
    bool matchesKind(NodeKind kind) const;
    bool matchesRegisteredPipeline(const std::vector<std::string>& pipelines) const;
};

/// Case-insensitive substring test used by the search filter
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

}  // namespace pipeviz
