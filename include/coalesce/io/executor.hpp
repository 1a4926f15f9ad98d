// ============================================================================
// coalesce/io/executor.hpp - Callback Delivery Interface
// ============================================================================
//
// An Executor decides WHERE a completion handler runs. The transfer core never
// calls caller code while holding its own lock, but it still has to hand each
// outcome to some thread; that thread is chosen per callback through
// RequestOptions::callback_executor.
//
// IMPLEMENTATIONS:
// ----------------
// - InlineExecutor:     run immediately on the posting thread
// - ThreadPoolExecutor: hand off to a fixed pool of worker threads
//
// USAGE:
// ------
//   ThreadPoolExecutor pool(4);
//   RequestOptions options;
//   options.callback_executor = &pool;
//
//   // Inside a handler, find out which executor is running it
//   Executor* exec = GetCurrentExecutor();
//
// ============================================================================

#pragma once

#include <functional>

namespace coalesce {

// ============================================================================
// Executor - Abstract Callback Sink
// ============================================================================
class Executor {
   public:
    virtual ~Executor() = default;

    // Run the callback at some point, on a thread of the executor's choosing
    virtual void Post(std::function<void()> callback) = 0;
};

// ============================================================================
// InlineExecutor - Runs work on the calling thread
// ============================================================================
class InlineExecutor : public Executor {
   public:
    void Post(std::function<void()> callback) override;

    // Process-wide instance
    static InlineExecutor& Instance();
};

// ============================================================================
// Thread-Local Executor Access
// ============================================================================

// Get the current thread's executor (nullptr if none set)
[[nodiscard]] Executor* GetCurrentExecutor();

// Set the current thread's executor (used by worker threads)
void SetCurrentExecutor(Executor* executor);

// RAII guard for setting/restoring current executor
class ExecutorGuard {
   public:
    explicit ExecutorGuard(Executor* executor);
    ~ExecutorGuard();

    ExecutorGuard(const ExecutorGuard&) = delete;
    ExecutorGuard& operator=(const ExecutorGuard&) = delete;

   private:
    Executor* previous_;
};

}  // namespace coalesce
