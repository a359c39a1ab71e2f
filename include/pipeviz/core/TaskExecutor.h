#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace pipeviz {

/// Where background work (snapshot fetches) runs
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;

    /// Run the task; may return before it completes
    virtual void submit(std::function<void()> task) = 0;

    /// Stop accepting tasks and wait for the running ones
    virtual void shutdown() = 0;

    virtual bool isRunning() const = 0;
};

/// One std::jthread per task; finished threads are joined on the next submit
class JThreadExecutor : public ITaskExecutor {
public:
    JThreadExecutor() = default;

    ~JThreadExecutor() override {
        shutdown();
    }

    JThreadExecutor(const JThreadExecutor&) = delete;
    JThreadExecutor& operator=(const JThreadExecutor&) = delete;

    void submit(std::function<void()> task) override {
        if (!running_.load()) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        reapFinished();

        auto done = std::make_shared<std::atomic<bool>>(false);
        workers_.push_back(Worker{done, std::jthread([task = std::move(task), done]() {
            task();
            done->store(true);
        })});
    }

    void shutdown() override {
        running_.store(false);
        std::lock_guard<std::mutex> lock(mutex_);
        workers_.clear();
    }

    bool isRunning() const override {
        return running_.load();
    }

    /// Joins finished threads and returns how many are still held
    size_t activeCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        reapFinished();
        return workers_.size();
    }

private:
    struct Worker {
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };

    // Caller holds mutex_
    void reapFinished() {
        std::erase_if(workers_, [](const Worker& w) { return w.done->load(); });
    }

    std::vector<Worker> workers_;
    std::mutex mutex_;
    std::atomic<bool> running_{true};
};

/// Runs each task on the calling thread before submit() returns
class InlineExecutor : public ITaskExecutor {
public:
    void submit(std::function<void()> task) override {
        if (running_) {
            task();
        }
    }

    void shutdown() override { running_ = false; }
    bool isRunning() const override { return running_; }

private:
    bool running_ = true;
};

}  // namespace pipeviz
