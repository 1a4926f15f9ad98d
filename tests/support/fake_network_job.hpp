// ============================================================================
// Scripted NetworkJob for tests
// ============================================================================
//
// FakeNetworkJob does nothing on its own. Tests drive its delivery channel
// from the test thread (or any thread) through Deliver*/Finish*, and inspect
// how often Start()/Cancel() were invoked.
//
// ============================================================================

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "coalesce/transfer/network_job.hpp"

namespace coalesce::test {

class FakeNetworkJob : public NetworkJob {
   public:
    explicit FakeNetworkJob(ResourceKey key, NetworkJobDelegate* delegate = nullptr)
        : key_(std::move(key)), delegate_(delegate) {}

    void Start() override { start_count_++; }

    void Cancel() override { cancel_count_++; }

    ResourceKey CurrentKey() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return key_;
    }

    // Simulate the job retargeting itself (e.g. a redirect)
    void Redirect(ResourceKey key) {
        std::lock_guard<std::mutex> lock(mutex_);
        key_ = std::move(key);
    }

    void DeliverData(const std::string& chunk) {
        delegate_->OnJobData(*this, {reinterpret_cast<const std::uint8_t*>(chunk.data()), chunk.size()});
    }

    void DeliverMetrics(const TransferMetrics& metrics) { delegate_->OnJobMetrics(*this, metrics); }

    void FinishOk(int status_code = 200) {
        ResponseMetadata response;
        response.status_code = status_code;
        delegate_->OnJobFinished(*this, Ok(std::move(response)));
    }

    void FinishErr(Error error) { delegate_->OnJobFinished(*this, Err(error)); }

    int StartCount() const { return start_count_.load(); }
    int CancelCount() const { return cancel_count_.load(); }

   private:
    mutable std::mutex mutex_;
    ResourceKey key_;
    NetworkJobDelegate* delegate_;
    std::atomic<int> start_count_{0};
    std::atomic<int> cancel_count_{0};
};

// Records every job it creates so tests can drive them
class FakeJobFactory : public NetworkJobFactory {
   public:
    Result<std::shared_ptr<NetworkJob>, Error> CreateJob(const ResourceKey& key, const JobParameters& params,
                                                         NetworkJobDelegate& delegate) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_with_) {
            return Err(fail_with_);
        }
        auto job = std::make_shared<FakeNetworkJob>(key, &delegate);
        jobs_.push_back(job);
        priorities_.push_back(params.priority);
        return Ok(std::static_pointer_cast<NetworkJob>(job));
    }

    void FailWith(Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_with_ = error;
    }

    size_t JobCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

    std::shared_ptr<FakeNetworkJob> Job(size_t index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.at(index);
    }

    JobPriority Priority(size_t index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return priorities_.at(index);
    }

   private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<FakeNetworkJob>> jobs_;
    std::vector<JobPriority> priorities_;
    Error fail_with_;
};

}  // namespace coalesce::test
