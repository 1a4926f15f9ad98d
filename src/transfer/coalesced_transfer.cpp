// ============================================================================
// coalesce/transfer/coalesced_transfer.cpp - CoalescedTransfer Implementation
// ============================================================================

#include "coalesce/transfer/coalesced_transfer.hpp"

#include "coalesce/core/check.hpp"
#include "coalesce/core/logging.hpp"

namespace coalesce {

void DeliverOutcome(const TransferCallback& callback, std::shared_ptr<const TransferOutcome> outcome) {
    if (!callback.on_completed) {
        return;
    }
    if (callback.options.callback_executor == nullptr) {
        callback.on_completed(*outcome);
        return;
    }
    callback.options.callback_executor->Post(
        [handler = callback.on_completed, outcome = std::move(outcome)] { handler(*outcome); });
}

// ============================================================================
// Construction
// ============================================================================

CoalescedTransfer::CoalescedTransfer(std::shared_ptr<NetworkJob> job)
    : job_(std::move(job)), original_key_(job_ ? job_->CurrentKey() : ResourceKey{}) {
    COALESCE_CHECK(job_ != nullptr, "CoalescedTransfer requires a network job");
}

// ============================================================================
// Caller / Dispatcher Facing
// ============================================================================

CancelToken CoalescedTransfer::Register(TransferCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    CancelToken token = next_token_++;
    callbacks_.emplace(token, std::move(callback));
    return token;
}

void CoalescedTransfer::Cancel(CancelToken token) {
    std::optional<TransferCallback> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = callbacks_.find(token);
        if (it == callbacks_.end()) {
            return;
        }
        removed = std::move(it->second);
        callbacks_.erase(it);
    }
    on_callback_cancelled.Call(token, *removed);
}

void CoalescedTransfer::ForceCancelAll() {
    std::vector<CancelToken> tokens;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tokens.reserve(callbacks_.size());
        for (const auto& [token, callback] : callbacks_) {
            tokens.push_back(token);
        }
    }
    for (CancelToken token : tokens) {
        Cancel(token);
    }
}

void CoalescedTransfer::Start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            return;
        }
        started_ = true;
    }
    // The job may deliver synchronously from Start(); the lock must be free
    job_->Start();
}

void CoalescedTransfer::CancelJob() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (job_cancelled_) {
            return;
        }
        job_cancelled_ = true;
        started_ = true;
    }
    job_->Cancel();
}

bool CoalescedTransfer::ContainsCallbacks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !callbacks_.empty();
}

size_t CoalescedTransfer::CallbackCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return callbacks_.size();
}

std::vector<TransferCallback> CoalescedTransfer::Callbacks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferCallback> result;
    result.reserve(callbacks_.size());
    for (const auto& [token, callback] : callbacks_) {
        result.push_back(callback);
    }
    return result;
}

std::vector<TransferCallback> CoalescedTransfer::RemoveAllCallbacks() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferCallback> result;
    result.reserve(callbacks_.size());
    for (auto& [token, callback] : callbacks_) {
        result.push_back(std::move(callback));
    }
    callbacks_.clear();
    return result;
}

// ============================================================================
// Network Job Facing
// ============================================================================

void CoalescedTransfer::OnDataReceived(std::span<const std::uint8_t> chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
        COALESCE_LOG_WARNING("dropping {} bytes delivered after completion of {}", chunk.size(), original_key_);
        return;
    }
    data_.insert(data_.end(), chunk.begin(), chunk.end());
}

void CoalescedTransfer::OnMetricsCollected(const TransferMetrics& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (metrics_.has_value()) {
        return;
    }
    metrics_ = metrics;
}

void CoalescedTransfer::OnJobFinished(JobOutcome outcome) {
    std::vector<TransferCallback> to_notify;
    Bytes data;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            COALESCE_LOG_WARNING("ignoring second completion of {}", original_key_);
            return;
        }
        finished_ = true;
        to_notify.reserve(callbacks_.size());
        for (auto& [token, callback] : callbacks_) {
            to_notify.push_back(std::move(callback));
        }
        callbacks_.clear();
        if (outcome.IsOk()) {
            data = data_;
        }
    }

    if (outcome.IsErr() && !outcome.Error()) {
        outcome = Err(make_error_code(Errc::JobFailed));
    }
    auto shared = std::make_shared<const TransferOutcome>(
        std::move(outcome).Map([&data](ResponseMetadata&& response) {
            return TransferPayload{std::move(data), std::move(response)};
        }));

    on_job_finished.Call(*shared, to_notify);

    for (const auto& callback : to_notify) {
        DeliverOutcome(callback, shared);
    }
}

// ============================================================================
// Observers
// ============================================================================

Bytes CoalescedTransfer::Data() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

std::optional<TransferMetrics> CoalescedTransfer::Metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

bool CoalescedTransfer::IsStarted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

bool CoalescedTransfer::IsFinished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

}  // namespace coalesce
