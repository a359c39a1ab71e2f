#include "pipeviz/core/RunMetricStore.h"

#include <algorithm>
#include <set>

namespace pipeviz {

void RunMetricStore::add(RunMetricSeries series) {
    if (std::find(runs_.begin(), runs_.end(), series.run) == runs_.end()) {
        runs_.push_back(series.run);
    }
    Key key{series.node, series.metric, series.run};
    series_[key] = std::move(series);
}

void RunMetricStore::clear() {
    series_.clear();
    runs_.clear();
}

const RunMetricSeries* RunMetricStore::find(const std::string& node, const std::string& metric,
                                            const std::string& run) const {
    auto it = series_.find(Key{node, metric, run});
    return it != series_.end() ? &it->second : nullptr;
}

std::vector<std::string> RunMetricStore::metrics() const {
    std::set<std::string> names;
    for (const auto& [key, series] : series_) {
        names.insert(series.metric);
    }
    return {names.begin(), names.end()};
}

std::vector<std::string> RunMetricStore::metricsFor(const std::string& node) const {
    std::set<std::string> names;
    for (const auto& [key, series] : series_) {
        if (series.node == node) {
            names.insert(series.metric);
        }
    }
    return {names.begin(), names.end()};
}

std::optional<double> RunMetricStore::latest(const std::string& node, const std::string& metric,
                                             const std::string& run) const {
    const RunMetricSeries* series = find(node, metric, run);
    if (!series || series->values.empty()) {
        return std::nullopt;
    }
    return series->values.back();
}

std::optional<double> RunMetricStore::latest(const std::string& node,
                                             const std::string& metric) const {
    for (auto it = runs_.rbegin(); it != runs_.rend(); ++it) {
        if (auto value = latest(node, metric, *it)) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<double> RunMetricStore::normalized(const std::string& node,
                                                 const std::string& metric,
                                                 const std::string& run) const {
    auto value = latest(node, metric, run);
    if (!value) return std::nullopt;

    double lo = *value;
    double hi = *value;
    for (const auto& [key, series] : series_) {
        if (series.metric != metric || series.run != run || series.values.empty()) {
            continue;
        }
        lo = std::min(lo, series.values.back());
        hi = std::max(hi, series.values.back());
    }

    if (hi - lo <= 0.0) {
        return 0.5;
    }
    return (*value - lo) / (hi - lo);
}

std::optional<double> RunMetricStore::delta(const std::string& node, const std::string& metric,
                                            const std::string& fromRun,
                                            const std::string& toRun) const {
    auto from = latest(node, metric, fromRun);
    auto to = latest(node, metric, toRun);
    if (!from || !to) return std::nullopt;
    return *to - *from;
}

}  // namespace pipeviz
