#pragma once

#include "../LayeredGraph.h"
#include "../config/LayoutOptions.h"

#include <vector>

namespace pipeviz {

/// Horizontal placement of a layered graph
struct CoordinateAssignmentResult {
    std::vector<float> centerX;   ///< Per layered node index
    int iterations = 0;
    bool converged = false;
};

/// Abstract interface for x-coordinate assignment
///
/// graph.ranks holds the final ordering; implementations must keep it and
/// keep at least the configured separation between neighbours of a rank.
class ICoordinateAssignment {
public:
    virtual ~ICoordinateAssignment() = default;

    virtual CoordinateAssignmentResult assign(const LayeredGraph& graph,
                                              const LayoutOptions& options) const = 0;

    virtual const char* algorithmName() const = 0;
};

}  // namespace pipeviz
