// ============================================================================
// coalesce/transfer/transfer_registry.cpp - TransferRegistry Implementation
// ============================================================================

#include "coalesce/transfer/transfer_registry.hpp"

#include "coalesce/core/logging.hpp"

namespace coalesce {

// ============================================================================
// Construction / Destruction
// ============================================================================

TransferRegistry::TransferRegistry() : TransferRegistry(Options{}) {}

TransferRegistry::TransferRegistry(Options options) : options_(std::move(options)) {}

TransferRegistry::~TransferRegistry() {
    std::vector<std::shared_ptr<CoalescedTransfer>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing_ = true;
        live.reserve(transfers_.size());
        for (auto& [key, transfer] : transfers_) {
            live.push_back(transfer);
        }
        transfers_.clear();
        keys_by_job_.clear();
    }

    // Jobs hold a reference to this delegate; none may outlive it
    for (auto& transfer : live) {
        Unwire(transfer);
        transfer->CancelJob();
    }

    // A job that finished before the cancel still runs validation and its
    // notifications against this registry
    std::unique_lock<std::mutex> lock(mutex_);
    if (running_completions_ != 0) {
        COALESCE_LOG_DEBUG("waiting for {} running completions", running_completions_);
    }
    completions_drained_.wait(lock, [this] { return running_completions_ == 0; });
}

// ============================================================================
// Registration
// ============================================================================

Result<TransferRegistry::Registration, Error> TransferRegistry::AddOrAppend(const ResourceKey& key,
                                                                           TransferCallback callback,
                                                                           const JobCreator& create_job) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closing_) {
        return Err(make_error_code(Errc::Shutdown));
    }

    auto it = transfers_.find(key);
    if (it != transfers_.end()) {
        if (!it->second->IsFinished()) {
            Registration reg;
            reg.transfer = it->second;
            reg.token = reg.transfer->Register(std::move(callback));
            COALESCE_LOG_DEBUG("appended callback {} to transfer {}", reg.token, key);
            return Ok(std::move(reg));
        }
        EraseLocked(it->second);
    }

    auto job = create_job(*this);
    if (job.IsErr()) {
        Error error = job.Error() ? job.Error() : make_error_code(Errc::JobCreationFailed);
        COALESCE_LOG_WARNING("failed to create job for {}: {}", key, error.message());
        return Err(error);
    }
    if (!job.Value()) {
        COALESCE_LOG_WARNING("job factory returned no job for {}", key);
        return Err(make_error_code(Errc::JobCreationFailed));
    }

    Registration reg;
    reg.transfer = std::make_shared<CoalescedTransfer>(std::move(job).Value());
    reg.created = true;
    Wire(reg.transfer);
    reg.token = reg.transfer->Register(std::move(callback));

    keys_by_job_[&reg.transfer->Job()] = key;
    transfers_[key] = reg.transfer;
    COALESCE_LOG_DEBUG("created transfer {} ({} live)", key, transfers_.size());
    return Ok(std::move(reg));
}

std::shared_ptr<CoalescedTransfer> TransferRegistry::Find(const ResourceKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(key);
    if (it == transfers_.end()) {
        return nullptr;
    }
    return it->second;
}

bool TransferRegistry::Contains(const ResourceKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.count(key) != 0;
}

size_t TransferRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.size();
}

// ============================================================================
// Eviction / Cancellation
// ============================================================================

bool TransferRegistry::RemoveIfIdle(const std::shared_ptr<CoalescedTransfer>& transfer) {
    if (!transfer) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (FindByJobLocked(transfer->Job()) != transfer) {
            return false;
        }
        // Counted from the callback map, never from the job's run state
        if (transfer->ContainsCallbacks()) {
            return false;
        }
        EraseLocked(transfer);
    }

    COALESCE_LOG_DEBUG("evicting idle transfer {}", transfer->OriginalKey());
    transfer->CancelJob();
    return true;
}

void TransferRegistry::CancelAll() {
    std::vector<std::shared_ptr<CoalescedTransfer>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live.reserve(transfers_.size());
        for (auto& [key, transfer] : transfers_) {
            live.push_back(transfer);
        }
    }
    COALESCE_LOG_DEBUG("cancelling {} live transfers", live.size());
    for (auto& transfer : live) {
        transfer->ForceCancelAll();
    }
}

void TransferRegistry::Cancel(const ResourceKey& key) {
    auto transfer = Find(key);
    if (transfer) {
        transfer->ForceCancelAll();
    }
}

Error TransferRegistry::DefaultResponseValidator(const ResponseMetadata& response) {
    if (response.status_code >= 200 && response.status_code < 400) {
        return {};
    }
    return make_error_code(Errc::InvalidResponse);
}

// ============================================================================
// NetworkJobDelegate
// ============================================================================

void TransferRegistry::OnJobData(NetworkJob& job, std::span<const std::uint8_t> chunk) {
    std::shared_ptr<CoalescedTransfer> transfer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transfer = FindByJobLocked(job);
    }
    if (transfer) {
        transfer->OnDataReceived(chunk);
    }
}

void TransferRegistry::OnJobMetrics(NetworkJob& job, const TransferMetrics& metrics) {
    std::shared_ptr<CoalescedTransfer> transfer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transfer = FindByJobLocked(job);
    }
    if (transfer) {
        transfer->OnMetricsCollected(metrics);
    }
}

void TransferRegistry::OnJobFinished(NetworkJob& job, JobOutcome outcome) {
    std::shared_ptr<CoalescedTransfer> transfer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transfer = FindByJobLocked(job);
        if (!transfer) {
            COALESCE_LOG_DEBUG("ignoring completion of an evicted job for {}", job.CurrentKey());
            return;
        }
        // Out of the map before the snapshot: late callers get a new transfer
        EraseLocked(transfer);
        running_completions_++;
    }

    const ResourceKey& key = transfer->OriginalKey();
    outcome = Validate(key, std::move(outcome));
    if (outcome.IsOk()) {
        COALESCE_LOG_DEBUG("transfer {} finished with status {}", key, outcome.Value().status_code);
    } else {
        COALESCE_LOG_DEBUG("transfer {} failed: {}", key, outcome.Error().message());
    }
    transfer->OnJobFinished(std::move(outcome));

    // Notify under the lock: the destructor may free this registry as soon
    // as it observes zero
    std::lock_guard<std::mutex> lock(mutex_);
    if (--running_completions_ == 0) {
        completions_drained_.notify_all();
    }
}

// ============================================================================
// Internals
// ============================================================================

std::shared_ptr<CoalescedTransfer> TransferRegistry::FindByJobLocked(const NetworkJob& job) const {
    auto key_it = keys_by_job_.find(&job);
    if (key_it == keys_by_job_.end()) {
        return nullptr;
    }
    auto it = transfers_.find(key_it->second);
    if (it == transfers_.end() || &it->second->Job() != &job) {
        return nullptr;
    }
    return it->second;
}

void TransferRegistry::EraseLocked(const std::shared_ptr<CoalescedTransfer>& transfer) {
    auto key_it = keys_by_job_.find(&transfer->Job());
    if (key_it == keys_by_job_.end()) {
        return;
    }
    auto it = transfers_.find(key_it->second);
    if (it != transfers_.end() && it->second == transfer) {
        transfers_.erase(it);
    }
    keys_by_job_.erase(key_it);
}

void TransferRegistry::Wire(const std::shared_ptr<CoalescedTransfer>& transfer) {
    std::weak_ptr<CoalescedTransfer> weak = transfer;

    if (options_.on_callback_cancelled) {
        transfer->on_callback_cancelled.Set(
            [handler = options_.on_callback_cancelled, weak](CancelToken token, const TransferCallback& callback) {
                if (auto strong = weak.lock()) {
                    handler(strong, token, callback);
                }
            });
    }

    if (options_.on_job_finished) {
        transfer->on_job_finished.Set([handler = options_.on_job_finished, weak](
                                          const TransferOutcome& outcome,
                                          const std::vector<TransferCallback>& callbacks) {
            if (auto strong = weak.lock()) {
                handler(strong, outcome, callbacks);
            }
        });
    }
}

void TransferRegistry::Unwire(const std::shared_ptr<CoalescedTransfer>& transfer) {
    transfer->on_callback_cancelled.Reset();
    transfer->on_job_finished.Reset();
}

JobOutcome TransferRegistry::Validate(const ResourceKey& key, JobOutcome outcome) const {
    return std::move(outcome).AndThen([&](ResponseMetadata&& response) -> JobOutcome {
        if (response.status_code == 0) {
            COALESCE_LOG_WARNING("transfer {} finished without a response", key);
            return Err(make_error_code(Errc::NoResponse));
        }
        Error error = options_.response_validator ? options_.response_validator(response)
                                                  : DefaultResponseValidator(response);
        if (error) {
            COALESCE_LOG_WARNING("transfer {} rejected status {}: {}", key, response.status_code, error.message());
            return Err(error);
        }
        return Ok(std::move(response));
    });
}

}  // namespace coalesce
