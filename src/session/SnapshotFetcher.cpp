#include "pipeviz/session/SnapshotFetcher.h"
#include "pipeviz/common/Logger.h"

#include <exception>
#include <optional>

namespace pipeviz {

SnapshotFetcher::SnapshotFetcher(FlowchartSession& session, std::shared_ptr<ITaskExecutor> executor)
    : session_(session)
    , executor_(executor ? std::move(executor) : std::make_shared<JThreadExecutor>())
    , state_(std::make_shared<State>()) {}

uint64_t SnapshotFetcher::fetch(FetchFunction fetch, CompletionHandler onComplete) {
    const uint64_t generation = ++state_->generation;
    LOG_DEBUG("Snapshot fetch {} started", generation);

    FlowchartSession& session = session_;
    std::shared_ptr<State> state = state_;

    executor_->submit([generation, state, &session,
                       fetch = std::move(fetch), onComplete = std::move(onComplete)]() {
        std::optional<PipelineSnapshot> snapshot;
        std::optional<LoadOutcome> failure;
        try {
            snapshot = fetch();
        } catch (const LoadError& e) {
            failure = LoadOutcome::fail(e);
        } catch (const std::exception& e) {
            failure = LoadOutcome{false, std::string("Snapshot fetch failed: ") + e.what(),
                                  std::nullopt};
        } catch (...) {
            failure = LoadOutcome{false, "Snapshot fetch failed: unknown error", std::nullopt};
        }

        if (generation != state->generation.load()) {
            state->discarded.fetch_add(1);
            LOG_DEBUG("Dropping stale snapshot fetch {}", generation);
            return;
        }

        session.post([generation, state, snapshot = std::move(snapshot),
                      failure = std::move(failure),
                      onComplete](FlowchartSession& target) {
            // A newer fetch may have started while this result sat in the queue
            if (generation != state->generation.load()) {
                state->discarded.fetch_add(1);
                LOG_DEBUG("Dropping stale snapshot fetch {}", generation);
                return;
            }

            LoadOutcome outcome = failure ? *failure : target.load(*snapshot);
            if (failure) {
                LOG_WARN("{}", failure->message);
            }
            if (onComplete) {
                onComplete(outcome);
            }
        });
    });

    return generation;
}

void SnapshotFetcher::cancelPending() {
    ++state_->generation;
}

}  // namespace pipeviz
