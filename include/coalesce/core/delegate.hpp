// ============================================================================
// coalesce/core/delegate.hpp - Single-Observer Notification Slot
// ============================================================================
//
// Delegate<Args...> holds at most one observer function. The owner fires it
// with Call(); whoever wired the slot decides what the notification means
// (evict a transfer, release a placeholder, log).
//
// THREAD SAFETY:
// --------------
// Set/Reset/Call may race freely. Call() copies the observer out under the
// lock and invokes it after the lock is released, so an observer may call
// back into the owner (or Reset the slot) without deadlocking.
//
// USAGE:
// ------
//   Delegate<CancelToken, const TransferCallback&> on_cancelled;
//   on_cancelled.Set([](CancelToken token, const TransferCallback& cb) { ... });
//   on_cancelled.Call(token, callback);
//
// ============================================================================

#pragma once

#include <functional>
#include <mutex>
#include <utility>

namespace coalesce {

template <typename... Args>
class Delegate {
   public:
    using Function = std::function<void(Args...)>;

    Delegate() = default;

    // Non-copyable, non-movable
    Delegate(const Delegate&) = delete;
    Delegate& operator=(const Delegate&) = delete;

    // Install the observer, replacing any previous one
    void Set(Function fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        fn_ = std::move(fn);
    }

    void Reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        fn_ = nullptr;
    }

    [[nodiscard]] bool IsSet() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<bool>(fn_);
    }

    // Invoke the observer if one is installed. No-op otherwise.
    void Call(Args... args) const {
        Function fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fn = fn_;
        }
        if (fn) {
            fn(std::forward<Args>(args)...);
        }
    }

   private:
    mutable std::mutex mutex_;
    Function fn_;
};

}  // namespace coalesce
