#pragma once

#include "LayeredGraph.h"
#include "config/LayoutOptions.h"

#include <vector>

namespace pipeviz {

/**
 * @brief Horizontal relaxation exposed as a bounded iterator
 *
 * Starts from each rank packed at minimum separation and centred on the
 * widest rank. Every next() performs one Gauss-Seidel sweep over the ranks
 * (alternating top-down and bottom-up): each rank is pulled towards the mean
 * centre of its neighbours, then projected back onto the minimum-separation
 * constraints with pool-adjacent-violators, which keeps the in-rank order.
 *
 * @code
 * CoordinateRelaxation relaxation(layered, options);
 * while (relaxation.next()) {}
 * auto xs = relaxation.normalizedCenters();
 * @endcode
 */
class CoordinateRelaxation {
public:
    CoordinateRelaxation(const LayeredGraph& graph, const LayoutOptions& options);

    /// Perform one sweep; returns false without doing work once finished
    bool next();

    bool done() const { return converged_ || iterations_ >= maxIterations_; }
    bool converged() const { return converged_; }
    int iterations() const { return iterations_; }

    /// Largest node movement of the last sweep
    float lastDisplacement() const { return lastDisplacement_; }

    /// Current centre x per layered node index
    const std::vector<float>& centers() const { return x_; }

    /// Centres shifted so the leftmost node edge is at x = 0
    std::vector<float> normalizedCenters() const;

private:
    void initialPlacement();
    float relaxRank(size_t rank);
    float gap(size_t left, size_t right) const;

    const LayeredGraph& graph_;
    float nodeSeparation_;
    float edgeSeparation_;
    float tolerance_;
    int maxIterations_;

    std::vector<float> x_;
    int iterations_ = 0;
    bool converged_ = false;
    float lastDisplacement_ = 0.0f;
};

}  // namespace pipeviz
