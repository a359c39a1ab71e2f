#include <gtest/gtest.h>
#include <pipeviz/pipeviz.h>
#include <pipeviz/session/SnapshotFetcher.h>

#include "support/TestSnapshots.h"

#include <chrono>
#include <deque>
#include <stdexcept>
#include <thread>

using namespace pipeviz;

namespace {

/// Holds tasks until the test runs them, in any order
class ManualExecutor : public ITaskExecutor {
public:
    void submit(std::function<void()> task) override {
        tasks.push_back(std::move(task));
    }
    void shutdown() override { tasks.clear(); }
    bool isRunning() const override { return true; }

    void runAt(size_t index) {
        auto task = std::move(tasks.at(index));
        tasks.erase(tasks.begin() + static_cast<std::ptrdiff_t>(index));
        task();
    }

    std::deque<std::function<void()>> tasks;
};

}  // namespace

class SnapshotFetcherTest : public ::testing::Test {
protected:
    FlowchartSession session_;
    std::shared_ptr<InlineExecutor> inline_ = std::make_shared<InlineExecutor>();
};

// --- Delivery ---

TEST_F(SnapshotFetcherTest, Result_AppliedOnProcessPending) {
    SnapshotFetcher fetcher(session_, inline_);
    std::optional<LoadOutcome> completed;

    uint64_t generation = fetcher.fetch([] { return test::nestedProject(); },
                                        [&completed](const LoadOutcome& o) { completed = o; });

    EXPECT_EQ(generation, 1u);
    EXPECT_FALSE(session_.hasModel());
    EXPECT_EQ(session_.pendingCount(), 1u);

    EXPECT_EQ(session_.processPending(), 1u);
    ASSERT_TRUE(completed.has_value());
    EXPECT_TRUE(completed->success);
    EXPECT_TRUE(session_.hasModel());
    EXPECT_EQ(session_.getVisibleGraph().nodeCount(), 8u);
}

TEST_F(SnapshotFetcherTest, NoCompletionHandler_StillApplies) {
    SnapshotFetcher fetcher(session_, inline_);
    fetcher.fetch([] { return test::chainWithPipeline(); });

    session_.processPending();

    EXPECT_TRUE(session_.hasModel());
    EXPECT_EQ(fetcher.discardedCount(), 0u);
}

// --- Stale results ---

TEST_F(SnapshotFetcherTest, OlderResultInQueue_Discarded) {
    SnapshotFetcher fetcher(session_, inline_);
    int completions = 0;
    auto count = [&completions](const LoadOutcome&) { ++completions; };

    fetcher.fetch([] { return test::nestedProject(); }, count);
    fetcher.fetch([] { return test::chainWithPipeline(); }, count);
    EXPECT_EQ(session_.pendingCount(), 2u);

    session_.processPending();

    EXPECT_EQ(completions, 1);
    EXPECT_EQ(fetcher.discardedCount(), 1u);
    EXPECT_EQ(fetcher.generation(), 2u);
    EXPECT_EQ(session_.getVisibleGraph().nodeCount(), 3u);
}

TEST_F(SnapshotFetcherTest, OlderResultFinishingLast_Discarded) {
    auto manual = std::make_shared<ManualExecutor>();
    SnapshotFetcher fetcher(session_, manual);

    fetcher.fetch([] { return test::nestedProject(); });
    fetcher.fetch([] { return test::chainWithPipeline(); });
    ASSERT_EQ(manual->tasks.size(), 2u);

    manual->runAt(1);   // newest finishes first
    manual->runAt(0);

    EXPECT_EQ(session_.pendingCount(), 1u);
    EXPECT_EQ(fetcher.discardedCount(), 1u);
    session_.processPending();
    EXPECT_EQ(session_.getVisibleGraph().nodeCount(), 3u);
}

TEST_F(SnapshotFetcherTest, CancelPending_DropsEverything) {
    auto manual = std::make_shared<ManualExecutor>();
    SnapshotFetcher fetcher(session_, manual);

    fetcher.fetch([] { return test::nestedProject(); });
    fetcher.cancelPending();
    manual->runAt(0);
    session_.processPending();

    EXPECT_FALSE(session_.hasModel());
    EXPECT_EQ(fetcher.discardedCount(), 1u);
}

// --- Failures ---

TEST_F(SnapshotFetcherTest, FetchThrowsLoadError_PreviousModelStays) {
    ASSERT_TRUE(session_.load(test::nestedProject()).success);
    SnapshotFetcher fetcher(session_, inline_);
    std::optional<LoadOutcome> completed;

    fetcher.fetch(
        []() -> PipelineSnapshot {
            throw LoadError(LoadError::Kind::MalformedSnapshot, "", "truncated payload");
        },
        [&completed](const LoadOutcome& o) { completed = o; });
    session_.processPending();

    ASSERT_TRUE(completed.has_value());
    EXPECT_FALSE(completed->success);
    EXPECT_EQ(completed->errorKind,
              std::optional<LoadError::Kind>(LoadError::Kind::MalformedSnapshot));
    EXPECT_EQ(completed->message, "truncated payload");
    EXPECT_EQ(session_.getVisibleGraph().nodeCount(), 8u);
}

TEST_F(SnapshotFetcherTest, FetchThrowsOtherError_ReportedAsFailure) {
    SnapshotFetcher fetcher(session_, inline_);
    std::optional<LoadOutcome> completed;

    fetcher.fetch([]() -> PipelineSnapshot { throw std::runtime_error("connection reset"); },
                  [&completed](const LoadOutcome& o) { completed = o; });
    session_.processPending();

    ASSERT_TRUE(completed.has_value());
    EXPECT_FALSE(completed->success);
    EXPECT_FALSE(completed->errorKind.has_value());
    EXPECT_EQ(completed->message, "Snapshot fetch failed: connection reset");
    EXPECT_FALSE(session_.hasModel());
}

TEST_F(SnapshotFetcherTest, FetchThrowsNonStandard_ReportedAsFailure) {
    SnapshotFetcher fetcher(session_, inline_);
    std::optional<LoadOutcome> completed;

    fetcher.fetch([]() -> PipelineSnapshot { throw 42; },
                  [&completed](const LoadOutcome& o) { completed = o; });
    session_.processPending();

    ASSERT_TRUE(completed.has_value());
    EXPECT_FALSE(completed->success);
    EXPECT_FALSE(completed->errorKind.has_value());
    EXPECT_EQ(completed->message, "Snapshot fetch failed: unknown error");
    EXPECT_FALSE(session_.hasModel());
}

TEST_F(SnapshotFetcherTest, InvalidSnapshot_RejectedBySession) {
    ASSERT_TRUE(session_.load(test::nestedProject()).success);
    SnapshotFetcher fetcher(session_, inline_);
    std::optional<LoadOutcome> completed;

    fetcher.fetch(
        [] {
            PipelineSnapshot snapshot = test::chainWithPipeline();
            snapshot.edges.push_back({"C", "A"});
            return snapshot;
        },
        [&completed](const LoadOutcome& o) { completed = o; });
    session_.processPending();

    ASSERT_TRUE(completed.has_value());
    EXPECT_EQ(completed->errorKind, std::optional<LoadError::Kind>(LoadError::Kind::GraphCycle));
    EXPECT_EQ(session_.getVisibleGraph().nodeCount(), 8u);
}

// --- Background thread ---

TEST_F(SnapshotFetcherTest, WorkerThread_ResultWaitsForOwner) {
    auto executor = std::make_shared<JThreadExecutor>();
    SnapshotFetcher fetcher(session_, executor);

    fetcher.fetch([] { return test::layeredDag(60, 4, 9); });
    executor->shutdown();   // joins the worker

    EXPECT_FALSE(session_.hasModel());
    EXPECT_EQ(session_.processPending(), 1u);
    EXPECT_TRUE(session_.hasModel());
    EXPECT_EQ(session_.getLayout().nodeCount(), 60u);
}

TEST_F(SnapshotFetcherTest, RepeatedFetches_LatestAppliedAndThreadsReleased) {
    auto executor = std::make_shared<JThreadExecutor>();
    SnapshotFetcher fetcher(session_, executor);

    for (int i = 0; i < 40; ++i) {
        fetcher.fetch([] { return test::nestedProject(); });
    }
    fetcher.fetch([] { return test::chainWithPipeline(); });

    // Each fetch finishes by either queueing its result or dropping it
    auto settled = [&] {
        return session_.pendingCount() + fetcher.discardedCount() >= 41u;
    };
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!settled() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::yield();
    }
    ASSERT_TRUE(settled());

    session_.processPending();
    EXPECT_EQ(fetcher.discardedCount(), 40u);
    EXPECT_EQ(session_.getVisibleGraph().nodeCount(), 3u);

    deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (executor->activeCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::yield();
    }
    EXPECT_EQ(executor->activeCount(), 0u);
}
