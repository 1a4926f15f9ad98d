// ============================================================================
// coalesce/transfer/transfer_registry.hpp - Resource Key -> Live Transfer
// ============================================================================
//
// The registry guarantees at most one live CoalescedTransfer per resource
// key and decides when a transfer leaves the map. It is also the delegate of
// every job it creates, so it routes data, metrics and completion to the
// owning transfer.
//
// SERIALIZATION:
// --------------
// One registry mutex covers lookup, creation, registration onto an existing
// transfer, and eviction. Two callers racing on the same key therefore see
// exactly one creator; a caller racing an eviction either keeps the transfer
// alive (its callback is counted) or lands on a fresh transfer.
//
// Completion evicts the transfer before its outcome snapshot is taken, so a
// registration that wins the registry lock first is part of the fan-out and
// one that loses it is routed to a new transfer.
//
// SHUTDOWN:
// ---------
// The destructor cancels every live job and then blocks until completions
// already running on job threads have delivered their outcome. It must not
// run on a thread that is inside one of those completions.
//
// USAGE:
// ------
//   TransferRegistry::Options opts;
//   opts.on_callback_cancelled = [&](auto transfer, CancelToken, const TransferCallback&) {
//       registry.RemoveIfIdle(transfer);
//   };
//   TransferRegistry registry(opts);
//
//   auto reg = registry.AddOrAppend(key, callback, [&](NetworkJobDelegate& d) {
//       return factory.CreateJob(key, {}, d);
//   });
//
// ============================================================================

#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "coalesce/transfer/coalesced_transfer.hpp"
#include "coalesce/transfer/network_job.hpp"

namespace coalesce {

// ============================================================================
// TransferRegistry
// ============================================================================
class TransferRegistry : public NetworkJobDelegate {
   public:
    // Returns an empty Error to accept the response
    using ResponseValidator = std::function<Error(const ResponseMetadata&)>;

    using JobCreator = std::function<Result<std::shared_ptr<NetworkJob>, Error>(NetworkJobDelegate&)>;

    using CallbackCancelledHandler = std::function<void(const std::shared_ptr<CoalescedTransfer>&, CancelToken,
                                                        const TransferCallback&)>;

    using JobFinishedHandler = std::function<void(const std::shared_ptr<CoalescedTransfer>&, const TransferOutcome&,
                                                  const std::vector<TransferCallback>&)>;

    // ========================================================================
    // Options
    // ========================================================================
    struct Options {
        // Accepts status 200..399 by default
        ResponseValidator response_validator;

        // Wired into every transfer the registry creates
        CallbackCancelledHandler on_callback_cancelled;
        JobFinishedHandler on_job_finished;

        Options() = default;
    };

    struct Registration {
        std::shared_ptr<CoalescedTransfer> transfer;
        CancelToken token = 0;
        bool created = false;
    };

    TransferRegistry();
    explicit TransferRegistry(Options options);
    ~TransferRegistry() override;

    // Non-copyable, non-movable
    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    // Register onto the live transfer for key, or create one with create_job
    // (called under the registry lock) and register onto that. Finished
    // transfers are never reused. Fails with Errc::Shutdown once destruction
    // has begun.
    Result<Registration, Error> AddOrAppend(const ResourceKey& key, TransferCallback callback,
                                            const JobCreator& create_job);

    [[nodiscard]] std::shared_ptr<CoalescedTransfer> Find(const ResourceKey& key) const;

    [[nodiscard]] bool Contains(const ResourceKey& key) const;

    [[nodiscard]] size_t Size() const;

    // Evict transfer and cancel its job if it is still the live transfer for
    // its key and has no callbacks left. Returns true if it was evicted.
    bool RemoveIfIdle(const std::shared_ptr<CoalescedTransfer>& transfer);

    // ForceCancelAll() on every live transfer
    void CancelAll();

    // ForceCancelAll() on the live transfer for key, if any
    void Cancel(const ResourceKey& key);

    static Error DefaultResponseValidator(const ResponseMetadata& response);

    // ========================================================================
    // NetworkJobDelegate
    // ========================================================================

    void OnJobData(NetworkJob& job, std::span<const std::uint8_t> chunk) override;

    void OnJobMetrics(NetworkJob& job, const TransferMetrics& metrics) override;

    void OnJobFinished(NetworkJob& job, JobOutcome outcome) override;

   private:
    // Requires mutex_
    std::shared_ptr<CoalescedTransfer> FindByJobLocked(const NetworkJob& job) const;

    // Requires mutex_
    void EraseLocked(const std::shared_ptr<CoalescedTransfer>& transfer);

    void Wire(const std::shared_ptr<CoalescedTransfer>& transfer);

    static void Unwire(const std::shared_ptr<CoalescedTransfer>& transfer);

    JobOutcome Validate(const ResourceKey& key, JobOutcome outcome) const;

    Options options_;

    mutable std::mutex mutex_;
    std::unordered_map<ResourceKey, std::shared_ptr<CoalescedTransfer>> transfers_;
    std::unordered_map<const NetworkJob*, ResourceKey> keys_by_job_;
    bool closing_ = false;
    size_t running_completions_ = 0;
    std::condition_variable completions_drained_;
};

}  // namespace coalesce
