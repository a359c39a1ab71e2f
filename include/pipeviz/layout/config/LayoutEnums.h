#pragma once

namespace pipeviz {

/// Ordering heuristic used by the crossing-minimization sweeps
enum class CrossingStrategy {
    None,         ///< Keep the initial order
    Barycenter,   ///< Mean position of neighbours in the fixed rank
    Median        ///< Median position of neighbours in the fixed rank
};

inline const char* toString(CrossingStrategy strategy) {
    switch (strategy) {
        case CrossingStrategy::None: return "none";
        case CrossingStrategy::Barycenter: return "barycenter";
        case CrossingStrategy::Median: return "median";
    }
    return "barycenter";
}

}  // namespace pipeviz
