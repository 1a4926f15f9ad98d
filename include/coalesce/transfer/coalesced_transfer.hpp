// ============================================================================
// coalesce/transfer/coalesced_transfer.hpp - One Network Job, Many Callers
// ============================================================================
//
// A CoalescedTransfer wraps exactly one NetworkJob and the set of callers
// waiting on it. Callers register a callback and get back a CancelToken; the
// job's delivery channel feeds data chunks and finally one terminal outcome,
// which is fanned out to every callback still registered at that moment.
//
// STATE MACHINE:
// --------------
//   Created --Start()--> Started --data--> Running --OnJobFinished()--> Terminal
//
// Start() is idempotent. Callbacks can be withdrawn with Cancel(token) in any
// state. Withdrawing every callback does NOT stop the job: whoever observes
// on_callback_cancelled decides that, and calls CancelJob().
//
// LOCKING:
// --------
// All mutable state sits behind one mutex owned by the transfer. No caller
// code (completion handlers, delegates) and no job operation runs while that
// mutex is held.
//
// USAGE:
// ------
//   auto transfer = std::make_shared<CoalescedTransfer>(job);
//   transfer->on_callback_cancelled.Set([](CancelToken t, const TransferCallback& cb) { ... });
//
//   CancelToken token = transfer->Register({handler, options});
//   transfer->Start();
//   ...
//   transfer->Cancel(token);  // only this caller loses interest
//
// ============================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "coalesce/core/delegate.hpp"
#include "coalesce/io/executor.hpp"
#include "coalesce/transfer/network_job.hpp"

namespace coalesce {

// Identifies one registration within one transfer. Issued in strictly
// increasing order starting at 0 and never reused.
using CancelToken = std::uint64_t;

using CompletionHandler = std::function<void(const TransferOutcome&)>;

// Per-caller options
struct RequestOptions {
    // Where the completion handler runs. nullptr = on the delivering thread.
    Executor* callback_executor = nullptr;

    // Applied to the job only by the caller that causes it to be created
    JobPriority priority = JobPriority::Default;

    // Free-form tag for logs and observers
    std::string label;
};

struct TransferCallback {
    CompletionHandler on_completed;
    RequestOptions options;
};

// Run the callback's handler with the outcome on the callback's executor.
// A callback without a handler is skipped.
void DeliverOutcome(const TransferCallback& callback, std::shared_ptr<const TransferOutcome> outcome);

// ============================================================================
// CoalescedTransfer
// ============================================================================
class CoalescedTransfer {
   public:
    explicit CoalescedTransfer(std::shared_ptr<NetworkJob> job);

    // Non-copyable, non-movable
    CoalescedTransfer(const CoalescedTransfer&) = delete;
    CoalescedTransfer& operator=(const CoalescedTransfer&) = delete;

    // ========================================================================
    // Caller / Dispatcher Facing
    // ========================================================================

    // Always succeeds, even after the terminal outcome. A callback registered
    // after OnJobFinished() is never completed by this transfer; the registry
    // does not route callers to finished transfers.
    CancelToken Register(TransferCallback callback);

    // Remove the callback for token and fire on_callback_cancelled with it.
    // Unknown or already removed tokens are ignored.
    void Cancel(CancelToken token);

    // Cancel every token registered at the time of the call
    void ForceCancelAll();

    // Tell the job to begin. Only the first call has an effect.
    void Start();

    // Abort the underlying job. Start() becomes a no-op afterwards.
    void CancelJob();

    [[nodiscard]] bool ContainsCallbacks() const;

    [[nodiscard]] size_t CallbackCount() const;

    // Snapshot of the currently registered callbacks
    [[nodiscard]] std::vector<TransferCallback> Callbacks() const;

    // Remove and return every callback without notifying anyone
    std::vector<TransferCallback> RemoveAllCallbacks();

    // ========================================================================
    // Network Job Facing
    // ========================================================================

    void OnDataReceived(std::span<const std::uint8_t> chunk);

    void OnMetricsCollected(const TransferMetrics& metrics);

    // Terminal transition. Captures the buffered body (or the failure) and the
    // registered callbacks, clears the callbacks, fires on_job_finished, then
    // delivers the outcome to each captured callback exactly once.
    void OnJobFinished(JobOutcome outcome);

    // ========================================================================
    // Observers
    // ========================================================================

    // Captured at construction; later changes to the job's target do not
    // affect it
    [[nodiscard]] const ResourceKey& OriginalKey() const { return original_key_; }

    [[nodiscard]] NetworkJob& Job() const { return *job_; }

    [[nodiscard]] Bytes Data() const;

    [[nodiscard]] std::optional<TransferMetrics> Metrics() const;

    [[nodiscard]] bool IsStarted() const;

    [[nodiscard]] bool IsFinished() const;

    // ========================================================================
    // Outward Notifications
    // ========================================================================

    // Outcome plus the callbacks it is about to be delivered to
    Delegate<const TransferOutcome&, const std::vector<TransferCallback>&> on_job_finished;

    // Token and the callback that was removed
    Delegate<CancelToken, const TransferCallback&> on_callback_cancelled;

   private:
    const std::shared_ptr<NetworkJob> job_;
    const ResourceKey original_key_;

    mutable std::mutex mutex_;
    Bytes data_;
    std::map<CancelToken, TransferCallback> callbacks_;
    CancelToken next_token_ = 0;
    bool started_ = false;
    bool job_cancelled_ = false;
    bool finished_ = false;
    std::optional<TransferMetrics> metrics_;
};

}  // namespace coalesce
