// ============================================================================
// coalesce/io/executor.cpp - Executor Implementation
// ============================================================================

#include "coalesce/io/executor.hpp"

namespace coalesce {

// Thread-local storage for the current executor
static thread_local Executor* g_current_executor = nullptr;

void InlineExecutor::Post(std::function<void()> callback) {
    if (!callback) return;
    ExecutorGuard guard(this);
    callback();
}

InlineExecutor& InlineExecutor::Instance() {
    static InlineExecutor instance;
    return instance;
}

Executor* GetCurrentExecutor() {
    return g_current_executor;
}

void SetCurrentExecutor(Executor* executor) {
    g_current_executor = executor;
}

ExecutorGuard::ExecutorGuard(Executor* executor)
    : previous_(g_current_executor) {
    g_current_executor = executor;
}

ExecutorGuard::~ExecutorGuard() {
    g_current_executor = previous_;
}

}  // namespace coalesce
