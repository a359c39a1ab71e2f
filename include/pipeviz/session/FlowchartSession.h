#pragma once

#include "pipeviz/core/EffectiveGraph.h"
#include "pipeviz/core/LoadError.h"
#include "pipeviz/core/PipelineGraph.h"
#include "pipeviz/core/PipelineSnapshot.h"
#include "pipeviz/export/DrawList.h"
#include "pipeviz/interaction/CollapseController.h"
#include "pipeviz/interaction/SelectionModel.h"
#include "pipeviz/layout/SugiyamaLayout.h"

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace pipeviz {

/// Result of a load command
struct LoadOutcome {
    bool success = false;
    std::string message;
    std::optional<LoadError::Kind> errorKind;   ///< Set when a LoadError was raised

    static LoadOutcome ok(const std::string& message) {
        return {true, message, std::nullopt};
    }

    static LoadOutcome fail(const LoadError& error) {
        return {false, error.what(), error.kind()};
    }
};

/**
 * @brief Command surface of one flowchart view
 *
 * Owns the model of the current snapshot and everything derived from it.
 * All commands run synchronously on the caller's thread and take snapshot
 * ids; ids the current model does not know are ignored. The layout is
 * recomputed lazily, with the previous layout as seed, whenever the model
 * state moved since the last pass.
 *
 * Commands from other threads go through post(); the owning thread drains
 * them with processPending().
 *
 * Usage:
 *   FlowchartSession session;
 *   auto outcome = session.loadJson(json);
 *   session.toggleCollapse("data_processing");
 *   const LayoutResult& layout = session.getLayout();
 */
class FlowchartSession {
public:
    using Command = std::function<void(FlowchartSession&)>;

    explicit FlowchartSession(const LayoutOptions& options = LayoutOptions{});
    ~FlowchartSession();

    FlowchartSession(const FlowchartSession&) = delete;
    FlowchartSession& operator=(const FlowchartSession&) = delete;

    // =========================================================================
    // Loading
    // =========================================================================

    /// Replace the model; on failure the previous model stays current
    LoadOutcome load(const PipelineSnapshot& snapshot);
    LoadOutcome loadJson(const std::string& json);

    bool hasModel() const { return graph_ != nullptr; }

    // =========================================================================
    // Commands
    // =========================================================================

    void setTagFilter(std::set<std::string> tags);
    void setSearchFilter(std::string search);
    void setKindFilter(std::set<NodeKind> kinds);
    void selectRegisteredPipeline(std::optional<std::string> pipelineId);
    void setVisibility(const std::string& id, bool visible);

    ToggleOutcome toggleCollapse(const std::string& pipelineId);
    ToggleOutcome collapseAll();
    ToggleOutcome expandAll();
    ToggleOutcome resetCollapse();

    void setFocus(std::optional<std::string> id);
    void focusPipeline(std::optional<std::string> pipelineId);
    void select(std::optional<std::string> id);

    /// Tint nodes by a run metric in drawList() (nullopt turns it off)
    void setMetricOverlay(std::optional<MetricOverlay> overlay);

    void setLayoutOptions(const LayoutOptions& options);
    const LayoutOptions& layoutOptions() const { return layout_.options(); }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Current layout, recomputed if the model changed since the last pass
    const LayoutResult& getLayout();
    EffectiveGraph getVisibleGraph() const;
    InteractionFlags interactionFlags() const;
    DrawList drawList();
    HitResult hitTest(const Point& point);

    const LayoutStats& lastLayoutStats() const { return layout_.lastStats(); }

    /// Current model; throws std::logic_error before the first successful load
    const PipelineGraph& model() const;

    std::optional<NodeId> nodeId(const std::string& key) const;
    std::optional<std::string> focusKey() const;
    std::optional<std::string> selectionKey() const;

    // =========================================================================
    // Command queue
    // =========================================================================

    /// Queue a command; safe to call from any thread
    void post(Command command);

    /// Run queued commands in order, including ones they post; returns how many ran
    size_t processPending();

    size_t pendingCount() const;

private:
    std::optional<NodeId> resolve(const std::string& key, const char* command) const;
    std::optional<std::string> keyOf(std::optional<NodeId> id) const;
    ToggleOutcome noModelOutcome() const;

    std::unique_ptr<PipelineGraph> graph_;
    std::unique_ptr<CollapseController> collapse_;
    std::unique_ptr<SelectionModel> selection_;

    SugiyamaLayout layout_;
    LayoutResult current_;
    bool hasLayout_ = false;
    uint64_t layoutVersion_ = 0;
    std::optional<MetricOverlay> metric_;

    mutable std::mutex queueMutex_;
    std::deque<Command> queue_;
};

}  // namespace pipeviz
