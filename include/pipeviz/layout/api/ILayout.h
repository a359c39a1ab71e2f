#pragma once

#include "../../core/EffectiveGraph.h"
#include "../config/LayoutOptions.h"
#include "../config/LayoutResult.h"

namespace pipeviz {

/// Abstract interface for effective-graph layout algorithms
class ILayout {
public:
    virtual ~ILayout() = default;

    virtual void setOptions(const LayoutOptions& options) = 0;
    virtual const LayoutOptions& options() const = 0;

    /**
     * @brief Lay out an effective graph
     * @param graph Immutable effective graph captured before the pass
     * @param previous Previous layout used to seed the ordering (nullptr on fresh load)
     */
    virtual LayoutResult layout(const EffectiveGraph& graph,
                                const LayoutResult* previous = nullptr) = 0;
};

}  // namespace pipeviz
