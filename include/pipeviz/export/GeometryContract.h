#pragma once

#include "../core/EffectiveGraph.h"
#include "../layout/config/LayoutResult.h"

#include <string>
#include <vector>

namespace pipeviz {

/// Outcome of GeometryContract::validate
struct ContractReport {
    bool ok = true;
    std::vector<std::string> violations;
};

/**
 * @brief Completeness check run before a layout is handed to a renderer
 *
 * Holds when every effective node has a finite box, every effective edge has
 * at least two finite points, and the first/last point lie on the boundary of
 * the source/target box.
 */
class GeometryContract {
public:
    static ContractReport validate(const EffectiveGraph& graph,
                                   const LayoutResult& layout,
                                   float tolerance = 0.5f);
};

}  // namespace pipeviz
