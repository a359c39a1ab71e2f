#pragma once

#include "pipeviz/layout/api/ICoordinateAssignment.h"

namespace pipeviz {

/// Default coordinate assignment: runs CoordinateRelaxation to convergence or its cap
class RelaxationCoordinateAssignment : public ICoordinateAssignment {
public:
    RelaxationCoordinateAssignment() = default;

    const char* algorithmName() const override { return "Relaxation"; }

    CoordinateAssignmentResult assign(const LayeredGraph& graph,
                                      const LayoutOptions& options) const override;
};

}  // namespace pipeviz
