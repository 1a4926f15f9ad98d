// ============================================================================
// ThreadPoolExecutor Implementation
// ============================================================================

#include "coalesce/io/thread_pool_executor.hpp"

#include <pthread.h>

namespace coalesce {

namespace {

void SetThreadName(const std::string& name) {
    // Linux limits thread names to 15 chars + null terminator
    std::string truncated = name.substr(0, 15);
    pthread_setname_np(pthread_self(), truncated.c_str());
}

}  // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

ThreadPoolExecutor::ThreadPoolExecutor() : ThreadPoolExecutor(Options{}) {}

ThreadPoolExecutor::ThreadPoolExecutor(size_t num_threads) {
    options_.num_threads = num_threads;
    if (options_.num_threads == 0) {
        options_.num_threads = 1;
    }
    InitWorkers();
}

ThreadPoolExecutor::ThreadPoolExecutor(const Options& options)
    : options_(options) {
    if (options_.num_threads == 0) {
        options_.num_threads = 1;
    }
    InitWorkers();
}

void ThreadPoolExecutor::InitWorkers() {
    workers_.reserve(options_.num_threads);
    for (size_t i = 0; i < options_.num_threads; ++i) {
        workers_.emplace_back([this, i] { WorkerLoop(i); });
    }
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    Stop();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

// ============================================================================
// Executor Interface
// ============================================================================

void ThreadPoolExecutor::Post(std::function<void()> callback) {
    if (!callback) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return;
        }
        work_queue_.push(std::move(callback));
    }
    work_available_.notify_one();
}

void ThreadPoolExecutor::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    work_available_.notify_all();
}

void ThreadPoolExecutor::WaitIdle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_.wait(lock, [this] {
        return work_queue_.empty() && active_tasks_ == 0;
    });
}

size_t ThreadPoolExecutor::PendingTasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return work_queue_.size();
}

// ============================================================================
// Worker Thread
// ============================================================================

void ThreadPoolExecutor::WorkerLoop(size_t worker_index) {
    SetCurrentExecutor(this);

    if (!options_.thread_name_prefix.empty()) {
        SetThreadName(options_.thread_name_prefix + "-" + std::to_string(worker_index));
    }

    while (true) {
        std::function<void()> callback;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            work_available_.wait(lock, [this] {
                return stopping_ || !work_queue_.empty();
            });

            // Exit only once stopped and drained
            if (work_queue_.empty()) {
                break;
            }

            callback = std::move(work_queue_.front());
            work_queue_.pop();
            // Counted under the lock so WaitIdle() never sees an empty queue
            // with the callback not yet marked active.
            active_tasks_++;
        }

        // Execute outside the lock
        callback();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_tasks_--;
        }
        idle_.notify_all();
    }

    SetCurrentExecutor(nullptr);
}

}  // namespace coalesce
