// ============================================================================
// Example 01: Coalesced Downloads
// ============================================================================
//
// This example demonstrates request coalescing with a simulated network.
// It shows:
// 1. Three callers asking for the same URL sharing one network job
// 2. One caller withdrawing without affecting the others
// 3. A transfer abandoned by its only caller having its job cancelled
//
// RUN:
//   cd build && ./examples/01_coalesced_download
//
// ============================================================================

#include "coalesce/coalesce.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace coalesce;
using namespace std::chrono_literals;

// A job that "downloads" its URL on a worker thread in a few chunks
class SimulatedJob : public NetworkJob {
   public:
    SimulatedJob(ResourceKey key, NetworkJobDelegate& delegate) : key_(std::move(key)), delegate_(delegate) {}

    ~SimulatedJob() override {
        if (worker_.joinable()) worker_.join();
    }

    void Start() override {
        std::lock_guard<std::mutex> lock(delivery_mutex_);
        if (cancelled_ || worker_.joinable()) return;
        worker_ = std::thread([this] { Run(); });
    }

    void Cancel() override {
        cancelled_ = true;
        // Wait out an in-flight delivery unless we are inside one
        if (std::this_thread::get_id() != worker_.get_id()) {
            std::lock_guard<std::mutex> lock(delivery_mutex_);
        }
    }

    ResourceKey CurrentKey() const override { return key_; }

   private:
    void Run() {
        const std::string body = "<contents of " + key_ + ">";
        const size_t chunk_size = 8;

        for (size_t offset = 0; offset < body.size(); offset += chunk_size) {
            std::this_thread::sleep_for(20ms);
            std::lock_guard<std::mutex> lock(delivery_mutex_);
            if (cancelled_) return;
            std::string chunk = body.substr(offset, chunk_size);
            delegate_.OnJobData(*this, {reinterpret_cast<const std::uint8_t*>(chunk.data()), chunk.size()});
        }

        std::lock_guard<std::mutex> lock(delivery_mutex_);
        if (cancelled_) return;
        ResponseMetadata response;
        response.status_code = 200;
        response.headers["Content-Length"] = std::to_string(body.size());
        delegate_.OnJobFinished(*this, Ok(std::move(response)));
    }

    const ResourceKey key_;
    NetworkJobDelegate& delegate_;
    std::mutex delivery_mutex_;
    std::atomic<bool> cancelled_{false};
    std::thread worker_;
};

// Keeps every job alive until the network itself goes away
class SimulatedNetwork : public NetworkJobFactory {
   public:
    Result<std::shared_ptr<NetworkJob>, Error> CreateJob(const ResourceKey& key, const JobParameters& params,
                                                         NetworkJobDelegate& delegate) override {
        std::cout << "[network] new job for " << key << " (priority " << JobPriorityToString(params.priority)
                  << ")" << std::endl;
        auto job = std::make_shared<SimulatedJob>(key, delegate);
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(job);
        return Ok(std::static_pointer_cast<NetworkJob>(job));
    }

    size_t JobsCreated() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

   private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<SimulatedJob>> jobs_;
};

CompletionHandler Printer(const std::string& who) {
    return [who](const TransferOutcome& outcome) {
        if (outcome.IsOk()) {
            const auto& data = outcome.Value().data;
            std::cout << "[" << who << "] got " << data.size() << " bytes: " << std::string(data.begin(), data.end())
                      << std::endl;
        } else {
            std::cout << "[" << who << "] failed: " << outcome.Error().message() << std::endl;
        }
    };
}

int main() {
    std::cout << "=== Coalesce Example 01: Coalesced Downloads ===" << std::endl;
    std::cout << std::endl;

    SetLogLevel(LogLevel::Info);

    SimulatedNetwork network;
    ThreadPoolExecutor callbacks(2);

    Downloader::Options opts;
    opts.default_callback_executor = &callbacks;
    Downloader downloader(network, opts);

    // Example 1: Three callers, one job
    std::cout << "--- Example 1: Shared Transfer ---" << std::endl;
    RequestOptions urgent;
    urgent.priority = JobPriority::High;
    auto a = downloader.Download("https://example.com/logo.png", urgent, Printer("alice"));
    auto b = downloader.Download("https://example.com/logo.png", {}, Printer("bob"));
    auto c = downloader.Download("https://example.com/logo.png", {}, Printer("carol"));
    std::cout << "jobs created: " << network.JobsCreated() << std::endl;

    // Example 2: Bob changes his mind
    std::cout << "--- Example 2: One Caller Withdraws ---" << std::endl;
    if (b.IsOk()) b.Value().Cancel();

    std::this_thread::sleep_for(300ms);
    callbacks.WaitIdle();
    std::cout << std::endl;

    // Example 3: Only caller withdraws, job is cancelled
    std::cout << "--- Example 3: Abandoned Transfer ---" << std::endl;
    auto d = downloader.Download("https://example.com/huge.iso", {}, Printer("dave"));
    std::this_thread::sleep_for(30ms);
    if (d.IsOk()) d.Value().Cancel();
    callbacks.WaitIdle();
    std::cout << "active transfers: " << downloader.ActiveTransfers() << std::endl;

    std::cout << std::endl;
    std::cout << "=== Done ===" << std::endl;
    return 0;
}
