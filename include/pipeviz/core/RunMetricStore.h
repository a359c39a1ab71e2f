#pragma once

#include "PipelineSnapshot.h"

#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace pipeviz {

/// Read-only store of recorded experiment-run metrics, keyed by (node, metric, run)
///
/// Runs keep the order in which they first appear in the snapshot; that order
/// defines "latest run" for lookups without an explicit run id.
class RunMetricStore {
public:
    RunMetricStore() = default;

    /// Add a series; a later series with the same key replaces the earlier one
    void add(RunMetricSeries series);
    void clear();

    bool empty() const { return series_.empty(); }
    size_t size() const { return series_.size(); }

    const RunMetricSeries* find(const std::string& node, const std::string& metric,
                                const std::string& run) const;

    /// Run ids in first-seen order
    const std::vector<std::string>& runs() const { return runs_; }

    /// Metric names, sorted
    std::vector<std::string> metrics() const;

    /// Metric names recorded for one node, sorted
    std::vector<std::string> metricsFor(const std::string& node) const;

    /// Last value of the series
    std::optional<double> latest(const std::string& node, const std::string& metric,
                                 const std::string& run) const;

    /// Last value of the series in the most recent run that recorded it
    std::optional<double> latest(const std::string& node, const std::string& metric) const;

    /**
     * @brief Latest value mapped into [0, 1] over the metric's range in that run
     *
     * The range spans the latest values of every node for the same metric and
     * run. A degenerate range (single value) maps to 0.5.
     */
    std::optional<double> normalized(const std::string& node, const std::string& metric,
                                     const std::string& run) const;

    /// latest(toRun) - latest(fromRun); nullopt when either side is missing
    std::optional<double> delta(const std::string& node, const std::string& metric,
                                const std::string& fromRun, const std::string& toRun) const;

private:
    using Key = std::tuple<std::string, std::string, std::string>;  // node, metric, run

    std::map<Key, RunMetricSeries> series_;
    std::vector<std::string> runs_;
};

}  // namespace pipeviz
