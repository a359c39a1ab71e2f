#include "pipeviz/session/FlowchartSession.h"
#include "pipeviz/common/Logger.h"
#include "pipeviz/core/SnapshotReader.h"

#include <stdexcept>

namespace pipeviz {

FlowchartSession::FlowchartSession(const LayoutOptions& options)
    : layout_(options) {}

FlowchartSession::~FlowchartSession() = default;

// =============================================================================
// Loading
// =============================================================================

LoadOutcome FlowchartSession::load(const PipelineSnapshot& snapshot) {
    std::unique_ptr<PipelineGraph> graph;
    try {
        graph = std::make_unique<PipelineGraph>(PipelineGraph::build(snapshot));
    } catch (const LoadError& e) {
        LOG_WARN("Snapshot rejected ({}): {}", LoadError::kindName(e.kind()), e.what());
        return LoadOutcome::fail(e);
    }

    // Wholesale replacement: nothing derived from the previous model survives
    selection_.reset();
    collapse_.reset();
    graph_ = std::move(graph);
    collapse_ = std::make_unique<CollapseController>(*graph_);
    selection_ = std::make_unique<SelectionModel>(*graph_);
    current_.clear();
    hasLayout_ = false;
    metric_.reset();

    std::string message = fmt::format("Loaded {} nodes, {} edges, {} modular pipelines",
                                      snapshot.nodes.size(), snapshot.edges.size(),
                                      snapshot.modularPipelines.size());
    LOG_INFO("{}", message);
    return LoadOutcome::ok(message);
}

LoadOutcome FlowchartSession::loadJson(const std::string& json) {
    PipelineSnapshot snapshot;
    try {
        snapshot = SnapshotReader::fromJson(json);
    } catch (const LoadError& e) {
        LOG_WARN("Snapshot rejected ({}): {}", LoadError::kindName(e.kind()), e.what());
        return LoadOutcome::fail(e);
    }
    return load(snapshot);
}

const PipelineGraph& FlowchartSession::model() const {
    if (!graph_) {
        throw std::logic_error("No snapshot loaded");
    }
    return *graph_;
}

std::optional<NodeId> FlowchartSession::resolve(const std::string& key, const char* command) const {
    if (!graph_) {
        LOG_DEBUG("{}: no snapshot loaded", command);
        return std::nullopt;
    }
    auto id = graph_->findNode(key);
    if (!id) {
        LOG_DEBUG("{}: ignoring unknown id '{}'", command, key);
    }
    return id;
}

std::optional<NodeId> FlowchartSession::nodeId(const std::string& key) const {
    return graph_ ? graph_->findNode(key) : std::nullopt;
}

std::optional<std::string> FlowchartSession::keyOf(std::optional<NodeId> id) const {
    if (!id || !graph_ || !graph_->hasNode(*id)) return std::nullopt;
    return graph_->getNode(*id).key;
}

// =============================================================================
// Commands
// =============================================================================

void FlowchartSession::setTagFilter(std::set<std::string> tags) {
    if (!graph_) return;
    graph_->setTagFilter(std::move(tags));
}

void FlowchartSession::setSearchFilter(std::string search) {
    if (!graph_) return;
    graph_->setSearchFilter(std::move(search));
}

void FlowchartSession::setKindFilter(std::set<NodeKind> kinds) {
    if (!graph_) return;
    graph_->setKindFilter(std::move(kinds));
}

void FlowchartSession::selectRegisteredPipeline(std::optional<std::string> pipelineId) {
    if (!graph_) return;
    graph_->setRegisteredPipeline(std::move(pipelineId));
}

void FlowchartSession::setVisibility(const std::string& id, bool visible) {
    if (auto node = resolve(id, "setVisibility")) {
        graph_->setVisibility(*node, visible);
    }
}

ToggleOutcome FlowchartSession::noModelOutcome() const {
    return ToggleOutcome::refused(std::nullopt, {}, "no snapshot loaded");
}

ToggleOutcome FlowchartSession::toggleCollapse(const std::string& pipelineId) {
    auto pipeline = resolve(pipelineId, "toggleCollapse");
    if (!pipeline) {
        return graph_ ? ToggleOutcome::refused(std::nullopt, graph_->effectiveEdges(),
                                               "unknown pipeline id")
                      : noModelOutcome();
    }
    return collapse_->toggle(*pipeline, hasLayout_ ? &current_ : nullptr);
}

ToggleOutcome FlowchartSession::collapseAll() {
    if (!graph_) return noModelOutcome();
    return collapse_->collapseAll(hasLayout_ ? &current_ : nullptr);
}

ToggleOutcome FlowchartSession::expandAll() {
    if (!graph_) return noModelOutcome();
    return collapse_->expandAll(hasLayout_ ? &current_ : nullptr);
}

ToggleOutcome FlowchartSession::resetCollapse() {
    if (!graph_) return noModelOutcome();
    return collapse_->resetToDefaults(hasLayout_ ? &current_ : nullptr);
}

void FlowchartSession::setFocus(std::optional<std::string> id) {
    if (!graph_) return;
    if (!id) {
        selection_->setFocus(std::nullopt);
        return;
    }
    if (auto node = resolve(*id, "setFocus")) {
        selection_->setFocus(*node);
    }
}

void FlowchartSession::focusPipeline(std::optional<std::string> pipelineId) {
    if (!graph_) return;
    if (!pipelineId) {
        graph_->setFocusedPipeline(std::nullopt);
        return;
    }
    if (auto pipeline = resolve(*pipelineId, "focusPipeline")) {
        graph_->setFocusedPipeline(*pipeline);
    }
}

void FlowchartSession::select(std::optional<std::string> id) {
    if (!graph_) return;
    if (!id) {
        selection_->select(std::nullopt);
        return;
    }
    if (auto node = resolve(*id, "select")) {
        selection_->select(*node);
    }
}

void FlowchartSession::setMetricOverlay(std::optional<MetricOverlay> overlay) {
    metric_ = std::move(overlay);
}

void FlowchartSession::setLayoutOptions(const LayoutOptions& options) {
    layout_.setOptions(options);
    hasLayout_ = false;   // Keep no seed: sizes and spacing changed
    current_.clear();
}

// =============================================================================
// Queries
// =============================================================================

const LayoutResult& FlowchartSession::getLayout() {
    if (!graph_) {
        current_.clear();
        return current_;
    }
    if (hasLayout_ && layoutVersion_ == graph_->stateVersion()) {
        return current_;
    }

    // The pass works on a copy; commands posted meanwhile wait in the queue
    EffectiveGraph effective = graph_->effectiveGraph();
    LayoutResult next = layout_.layout(effective, hasLayout_ ? &current_ : nullptr);

    current_ = std::move(next);
    hasLayout_ = true;
    layoutVersion_ = graph_->stateVersion();
    return current_;
}

EffectiveGraph FlowchartSession::getVisibleGraph() const {
    return graph_ ? graph_->effectiveGraph() : EffectiveGraph{};
}

InteractionFlags FlowchartSession::interactionFlags() const {
    return selection_ ? selection_->deriveFlags() : InteractionFlags{};
}

DrawList FlowchartSession::drawList() {
    if (!graph_) return DrawList{};

    const LayoutResult& layout = getLayout();
    DrawListOptions options;
    options.groupPadding = layout_.options().groupPadding;
    options.metric = metric_;
    return DrawListBuilder::build(*graph_, layout, selection_->deriveFlags(), options);
}

HitResult FlowchartSession::hitTest(const Point& point) {
    if (!graph_) return HitResult{};
    return SelectionModel::hitTest(point, getLayout());
}

std::optional<std::string> FlowchartSession::focusKey() const {
    return selection_ ? keyOf(selection_->focus()) : std::nullopt;
}

std::optional<std::string> FlowchartSession::selectionKey() const {
    return selection_ ? keyOf(selection_->selection()) : std::nullopt;
}

// =============================================================================
// Command queue
// =============================================================================

void FlowchartSession::post(Command command) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    queue_.push_back(std::move(command));
}

size_t FlowchartSession::processPending() {
    size_t executed = 0;
    while (true) {
        Command command;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (queue_.empty()) break;
            command = std::move(queue_.front());
            queue_.pop_front();
        }
        command(*this);
        ++executed;
    }
    return executed;
}

size_t FlowchartSession::pendingCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

}  // namespace pipeviz
