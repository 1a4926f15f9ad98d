// ============================================================================
// coalesce/io/thread_pool_executor.hpp - Multi-Threaded Callback Executor
// ============================================================================
//
// ThreadPoolExecutor runs posted callbacks across a fixed set of worker
// threads. Downloads use it to move completion handlers off the network
// job's delivery thread.
//
// KEY CONCEPTS:
// -------------
// 1. WORKER THREADS: A fixed number of threads that pull work from a shared queue
// 2. FIFO QUEUE: Mutex-protected; callbacks start in posting order
// 3. IDLE WAIT: WaitIdle() blocks until the queue drains and no callback runs
// 4. DRAINING STOP: Stop() refuses new work but runs what is already queued
//
// USAGE:
// ------
//   ThreadPoolExecutor::Options opts;
//   opts.num_threads = 4;
//   opts.thread_name_prefix = "fetch-cb";
//   ThreadPoolExecutor executor(opts);
//
//   executor.Post([] { ... });
//   executor.WaitIdle();
//
// ============================================================================

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "coalesce/io/executor.hpp"

namespace coalesce {

// ============================================================================
// ThreadPoolExecutor
// ============================================================================
class ThreadPoolExecutor : public Executor {
   public:
    // ========================================================================
    // Options
    // ========================================================================
    struct Options {
        // Number of worker threads (default: hardware_concurrency)
        size_t num_threads = std::thread::hardware_concurrency();

        // Thread name prefix (workers named "prefix-0", "prefix-1", etc.)
        std::string thread_name_prefix = "coalesce-cb";

        Options() = default;
    };

    // Create with default options
    ThreadPoolExecutor();

    // Create with specified number of threads (convenience)
    explicit ThreadPoolExecutor(size_t num_threads);

    // Create with full options
    explicit ThreadPoolExecutor(const Options& options);

    ~ThreadPoolExecutor() override;

    // Non-copyable, non-movable
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    // Post a callback to run on a worker thread. Dropped after Stop().
    void Post(std::function<void()> callback) override;

    // Refuse new callbacks. Workers finish everything already queued before
    // they exit, so a posted completion handler is never lost.
    void Stop();

    [[nodiscard]] bool IsRunning() const { return !stopping_.load(); }

    // Block until the queue is empty and no callback is running. Must not be
    // called from a worker thread.
    void WaitIdle();

    [[nodiscard]] size_t NumThreads() const { return workers_.size(); }

    [[nodiscard]] size_t PendingTasks() const;

   private:
    void WorkerLoop(size_t worker_index);

    void InitWorkers();

    Options options_;

    std::vector<std::thread> workers_;

    std::queue<std::function<void()>> work_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;

    std::atomic<bool> stopping_{false};
    size_t active_tasks_{0};  // guarded by queue_mutex_
};

}  // namespace coalesce
