#include "CoordinateAssignment.h"
#include "pipeviz/layout/CoordinateRelaxation.h"

namespace pipeviz {

CoordinateAssignmentResult RelaxationCoordinateAssignment::assign(
    const LayeredGraph& graph, const LayoutOptions& options) const {
    CoordinateRelaxation relaxation(graph, options);
    while (relaxation.next()) {
    }

    CoordinateAssignmentResult result;
    result.centerX = relaxation.normalizedCenters();
    result.iterations = relaxation.iterations();
    result.converged = relaxation.converged();
    return result;
}

}  // namespace pipeviz
