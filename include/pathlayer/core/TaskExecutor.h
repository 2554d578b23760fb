#pragma once

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace pathlayer {

/// Interface for task execution strategies.
/// Sampling code only submits and waits, so inline and threaded execution
/// are interchangeable.
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;

    /// Submit a task for execution
    virtual void submit(std::function<void()> task) = 0;

    /// Block until every submitted task has finished
    virtual void wait() = 0;

    /// Stop accepting tasks and wait for pending ones
    virtual void shutdown() = 0;

    virtual bool isRunning() const = 0;
};

/// Runs each task immediately on the calling thread
class InlineExecutor : public ITaskExecutor {
public:
    void submit(std::function<void()> task) override {
        if (running_) {
            task();
        }
    }

    void wait() override {}

    void shutdown() override { running_ = false; }

    bool isRunning() const override { return running_; }

private:
    bool running_ = true;
};

/// One std::jthread per submitted task, joined by wait()
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
        threads_.emplace_back(std::move(task));
    }

    void wait() override {
        std::vector<std::jthread> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending.swap(threads_);
        }
        pending.clear();  // joins
    }

    void shutdown() override {
        running_.store(false);
        wait();
    }

    bool isRunning() const override {
        return running_.load();
    }

private:
    std::vector<std::jthread> threads_;
    std::mutex mutex_;
    std::atomic<bool> running_{true};
};

/// Executor for a worker count (<= 1 runs inline)
inline std::unique_ptr<ITaskExecutor> makeExecutor(size_t numThreads) {
    if (numThreads <= 1) {
        return std::make_unique<InlineExecutor>();
    }
    return std::make_unique<JThreadExecutor>();
}

/// Run body(i) for every i in [0, count) on `workers` tasks of executor.
///
/// Worker w handles indices w, w + workers, w + 2 * workers, ... so each
/// index is visited exactly once and body may write to slot i without
/// locking. The first exception thrown by any worker (in worker order) is
/// rethrown here once all workers have stopped. If submit() itself throws,
/// the tasks already started are waited for before the exception propagates.
inline void stridedFor(ITaskExecutor& executor, size_t count, size_t workers,
                       const std::function<void(size_t)>& body) {
    if (count == 0) {
        return;
    }
    if (workers < 1) workers = 1;
    if (workers > count) workers = count;

    std::vector<std::exception_ptr> errors(workers);

    try {
        for (size_t w = 0; w < workers; ++w) {
            executor.submit([&, w]() {
                try {
                    for (size_t i = w; i < count; i += workers) {
                        body(i);
                    }
                } catch (...) {
                    errors[w] = std::current_exception();
                }
            });
        }
    } catch (...) {
        executor.wait();
        throw;
    }
    executor.wait();

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
}

/// stridedFor on a fresh executor sized for `workers`
inline void stridedFor(size_t count, size_t workers, const std::function<void(size_t)>& body) {
    if (count == 0) {
        return;
    }
    auto executor = makeExecutor(std::min(std::max<size_t>(workers, 1), count));
    stridedFor(*executor, count, workers, body);
}

}  // namespace pathlayer
