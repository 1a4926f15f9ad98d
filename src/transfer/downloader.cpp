// ============================================================================
// coalesce/transfer/downloader.cpp - Downloader Implementation
// ============================================================================

#include "coalesce/transfer/downloader.hpp"

#include "coalesce/core/logging.hpp"

namespace coalesce {

// ============================================================================
// Construction / Destruction
// ============================================================================

Downloader::Downloader(NetworkJobFactory& factory) : Downloader(factory, Options{}) {}

Downloader::Downloader(NetworkJobFactory& factory, Options options)
    : factory_(factory), options_(std::move(options)), registry_(MakeRegistryOptions()) {}

Downloader::~Downloader() {
    shutting_down_ = true;
    CancelAll();
}

TransferRegistry::Options Downloader::MakeRegistryOptions() {
    TransferRegistry::Options opts;
    opts.response_validator = options_.response_validator;
    opts.on_callback_cancelled = [this](const std::shared_ptr<CoalescedTransfer>& transfer, CancelToken token,
                                        const TransferCallback& callback) {
        HandleCallbackCancelled(transfer, token, callback);
    };
    opts.on_job_finished = [this](const std::shared_ptr<CoalescedTransfer>& transfer, const TransferOutcome& outcome,
                                  const std::vector<TransferCallback>& /*callbacks*/) {
        HandleJobFinished(transfer, outcome);
    };
    return opts;
}

// ============================================================================
// Dispatch
// ============================================================================

Result<DownloadTask, Error> Downloader::Download(const ResourceKey& key, RequestOptions options,
                                                 CompletionHandler handler) {
    if (shutting_down_) {
        return Err(make_error_code(Errc::Shutdown));
    }
    if (key.empty()) {
        return Err(make_error_code(Errc::InvalidKey));
    }

    if (options.callback_executor == nullptr) {
        options.callback_executor = options_.default_callback_executor;
    }

    JobParameters params;
    params.priority = options.priority;

    auto reg = registry_.AddOrAppend(key, TransferCallback{std::move(handler), std::move(options)},
                                     [this, &key, &params](NetworkJobDelegate& delegate) {
                                         return factory_.CreateJob(key, params, delegate);
                                     });
    if (reg.IsErr()) {
        return Err(std::move(reg).Error());
    }

    auto& registration = reg.Value();
    if (registration.created) {
        COALESCE_LOG_DEBUG("starting job for {} (priority {})", key, JobPriorityToString(params.priority));
        if (options_.observer) {
            options_.observer->OnWillStart(key);
        }
    }
    registration.transfer->Start();

    return Ok(DownloadTask(registration.transfer, registration.token));
}

void Downloader::CancelAll() {
    registry_.CancelAll();
}

void Downloader::Cancel(const ResourceKey& key) {
    registry_.Cancel(key);
}

// ============================================================================
// Transfer Notifications
// ============================================================================

void Downloader::HandleCallbackCancelled(const std::shared_ptr<CoalescedTransfer>& transfer, CancelToken token,
                                         const TransferCallback& callback) {
    COALESCE_LOG_DEBUG("callback {} of {} cancelled", token, transfer->OriginalKey());

    DeliverOutcome(callback, std::make_shared<const TransferOutcome>(Err(make_error_code(Errc::Cancelled))));

    if (options_.observer) {
        options_.observer->OnCallbackCancelled(transfer->OriginalKey(), token);
    }

    // No-op unless this was the last interested caller
    registry_.RemoveIfIdle(transfer);
}

void Downloader::HandleJobFinished(const std::shared_ptr<CoalescedTransfer>& transfer,
                                   const TransferOutcome& outcome) {
    if (options_.observer) {
        options_.observer->OnFinished(transfer->OriginalKey(), outcome);
    }
}

}  // namespace coalesce
