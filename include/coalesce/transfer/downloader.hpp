// ============================================================================
// coalesce/transfer/downloader.hpp - Coalescing Download Dispatcher
// ============================================================================
//
// Downloader is the caller-facing entry point. Every Download() for a key
// that already has a live transfer joins it instead of starting a second
// network job; each caller gets its own DownloadTask and can withdraw
// independently.
//
// CANCELLATION:
// -------------
// DownloadTask::Cancel() withdraws one caller. That caller's handler receives
// Errc::Cancelled. When the last caller of a transfer withdraws, the transfer
// is evicted and its network job is cancelled.
//
// USAGE:
// ------
//   MyJobFactory factory;
//   ThreadPoolExecutor callbacks(2);
//
//   Downloader::Options opts;
//   opts.default_callback_executor = &callbacks;
//   Downloader downloader(factory, opts);
//
//   auto task = downloader.Download("https://example.com/a.png", {},
//       [](const TransferOutcome& outcome) {
//           if (outcome.IsOk()) Use(outcome.Value().data);
//       });
//   if (task.IsOk()) {
//       task.Value().Cancel();
//   }
//
// ============================================================================

#pragma once

#include <atomic>
#include <memory>

#include "coalesce/io/executor.hpp"
#include "coalesce/transfer/coalesced_transfer.hpp"
#include "coalesce/transfer/network_job.hpp"
#include "coalesce/transfer/transfer_registry.hpp"

namespace coalesce {

// ============================================================================
// DownloadTask - One caller's interest in one transfer
// ============================================================================
class DownloadTask {
   public:
    DownloadTask(std::shared_ptr<CoalescedTransfer> transfer, CancelToken token)
        : transfer_(std::move(transfer)), token_(token) {}

    // Withdraw this caller only. Safe to call more than once.
    void Cancel() const { transfer_->Cancel(token_); }

    [[nodiscard]] CancelToken Token() const { return token_; }

    [[nodiscard]] const ResourceKey& Key() const { return transfer_->OriginalKey(); }

    [[nodiscard]] const std::shared_ptr<CoalescedTransfer>& Transfer() const { return transfer_; }

   private:
    std::shared_ptr<CoalescedTransfer> transfer_;
    CancelToken token_;
};

// ============================================================================
// DownloaderObserver - Optional lifecycle hooks
// ============================================================================
// Called on the thread that triggered the event. Must not block.
class DownloaderObserver {
   public:
    virtual ~DownloaderObserver() = default;

    // A new network job is about to be started for key
    virtual void OnWillStart(const ResourceKey& /*key*/) {}

    // A transfer reached its terminal outcome
    virtual void OnFinished(const ResourceKey& /*key*/, const TransferOutcome& /*outcome*/) {}

    // One caller withdrew
    virtual void OnCallbackCancelled(const ResourceKey& /*key*/, CancelToken /*token*/) {}
};

// ============================================================================
// Downloader
// ============================================================================
class Downloader {
   public:
    // ========================================================================
    // Options
    // ========================================================================
    struct Options {
        // Used for callers whose RequestOptions leave callback_executor unset.
        // nullptr = deliver on the network job's thread.
        Executor* default_callback_executor = nullptr;

        // Empty = TransferRegistry::DefaultResponseValidator
        TransferRegistry::ResponseValidator response_validator;

        // Not owned; must outlive the downloader
        DownloaderObserver* observer = nullptr;

        Options() = default;
    };

    explicit Downloader(NetworkJobFactory& factory);
    Downloader(NetworkJobFactory& factory, Options options);

    // Cancels everything still in flight, then waits for completions already
    // running on job threads. Must not be called from a completion handler.
    ~Downloader();

    // Non-copyable, non-movable
    Downloader(const Downloader&) = delete;
    Downloader& operator=(const Downloader&) = delete;

    // Join or create the transfer for key and start it. On error the handler
    // is not called.
    Result<DownloadTask, Error> Download(const ResourceKey& key, RequestOptions options, CompletionHandler handler);

    // Withdraw every caller of every live transfer
    void CancelAll();

    // Withdraw every caller of the transfer for key
    void Cancel(const ResourceKey& key);

    [[nodiscard]] size_t ActiveTransfers() const { return registry_.Size(); }

    [[nodiscard]] TransferRegistry& Registry() { return registry_; }

   private:
    TransferRegistry::Options MakeRegistryOptions();

    void HandleCallbackCancelled(const std::shared_ptr<CoalescedTransfer>& transfer, CancelToken token,
                                 const TransferCallback& callback);

    void HandleJobFinished(const std::shared_ptr<CoalescedTransfer>& transfer, const TransferOutcome& outcome);

    NetworkJobFactory& factory_;
    Options options_;
    std::atomic<bool> shutting_down_{false};
    TransferRegistry registry_;
};

}  // namespace coalesce
