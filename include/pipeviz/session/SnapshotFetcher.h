#pragma once

#include "pipeviz/core/PipelineSnapshot.h"
#include "pipeviz/core/TaskExecutor.h"
#include "FlowchartSession.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

namespace pipeviz {

/**
 * @brief Fetches snapshots off the UI thread and applies the newest one
 *
 * The fetch function runs on the executor. Its result is posted to the
 * session's command queue and applied by FlowchartSession::processPending().
 * Each fetch() starts a new generation; a result whose generation is no
 * longer the latest is dropped instead of applied.
 *
 * The session must outlive every fetch submitted through this object.
 */
class SnapshotFetcher {
public:
    using FetchFunction = std::function<PipelineSnapshot()>;
    using CompletionHandler = std::function<void(const LoadOutcome&)>;

    SnapshotFetcher(FlowchartSession& session, std::shared_ptr<ITaskExecutor> executor);

    /// Start a fetch; exceptions thrown by fetch become a failed LoadOutcome
    /// @return Generation of this fetch
    uint64_t fetch(FetchFunction fetch, CompletionHandler onComplete = nullptr);

    /// Drop every fetch started so far
    void cancelPending();

    uint64_t generation() const { return state_->generation.load(); }

    /// Fetch results dropped because a newer fetch had started
    uint64_t discardedCount() const { return state_->discarded.load(); }

private:
    struct State {
        std::atomic<uint64_t> generation{0};
        std::atomic<uint64_t> discarded{0};
    };

    FlowchartSession& session_;
    std::shared_ptr<ITaskExecutor> executor_;
    std::shared_ptr<State> state_;
};

}  // namespace pipeviz
