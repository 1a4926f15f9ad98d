// ============================================================================
// Concurrency Stress Tests
// ============================================================================
//
// Many callers download and withdraw the same handful of keys while another
// thread completes jobs. Every accepted Download() must see exactly one
// outcome, and nothing may be left registered once all jobs are done.
//
// ============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "coalesce/io/thread_pool_executor.hpp"
#include "coalesce/transfer/downloader.hpp"
#include "support/fake_network_job.hpp"

using namespace coalesce;
using coalesce::test::FakeJobFactory;

namespace {

// Finish every job that has not been cancelled, starting at index from
size_t FinishPending(FakeJobFactory& factory, size_t from) {
    size_t count = factory.JobCount();
    for (size_t i = from; i < count; ++i) {
        auto job = factory.Job(i);
        if (job->CancelCount() == 0) {
            job->DeliverData("payload");
            job->FinishOk();
        }
    }
    return count;
}

}  // namespace

TEST(StressTest, DownloadCancelAndFinishRace) {
    constexpr int kThreads = 8;
    constexpr int kIterations = 500;
    const std::vector<std::string> keys = {"a", "b", "c", "d"};

    FakeJobFactory factory;
    std::atomic<int> accepted{0};
    std::atomic<int> delivered{0};
    std::atomic<int> cancelled{0};
    std::atomic<bool> stop{false};
    Downloader downloader(factory);

    std::thread finisher([&] {
        size_t next = 0;
        while (!stop.load()) {
            next = FinishPending(factory, next);
            std::this_thread::yield();
        }
    });

    std::vector<std::thread> callers;
    for (int t = 0; t < kThreads; ++t) {
        callers.emplace_back([&, t] {
            std::mt19937 rng(static_cast<unsigned>(t));
            for (int i = 0; i < kIterations; ++i) {
                const auto& key = keys[rng() % keys.size()];
                auto task = downloader.Download(key, {}, [&](const TransferOutcome& outcome) {
                    delivered++;
                    if (outcome.IsErr() && outcome.Error() == Errc::Cancelled) cancelled++;
                });
                ASSERT_TRUE(task.IsOk());
                accepted++;
                if (rng() % 2 == 0) {
                    task.Value().Cancel();
                }
            }
        });
    }
    for (auto& t : callers) t.join();

    stop = true;
    finisher.join();

    // Complete whatever was created after the finisher's last pass
    FinishPending(factory, 0);

    EXPECT_EQ(delivered.load(), accepted.load());
    EXPECT_LE(cancelled.load(), accepted.load());
    EXPECT_EQ(downloader.ActiveTransfers(), 0u);
}

TEST(StressTest, ConcurrentCallersShareOneJob) {
    constexpr int kThreads = 16;

    FakeJobFactory factory;
    std::atomic<int> ok{0};
    ThreadPoolExecutor callbacks(4);
    Downloader::Options opts;
    opts.default_callback_executor = &callbacks;
    Downloader downloader(factory, opts);

    std::vector<std::thread> callers;
    for (int t = 0; t < kThreads; ++t) {
        callers.emplace_back([&] {
            auto task = downloader.Download("shared", {}, [&](const TransferOutcome& outcome) {
                if (outcome.IsOk() && outcome.Value().data.size() == 4) ok++;
            });
            ASSERT_TRUE(task.IsOk());
        });
    }
    for (auto& t : callers) t.join();

    ASSERT_EQ(factory.JobCount(), 1u);
    factory.Job(0)->DeliverData("data");
    factory.Job(0)->FinishOk();
    callbacks.WaitIdle();

    EXPECT_EQ(ok.load(), kThreads);
    EXPECT_EQ(factory.Job(0)->StartCount(), 1);
}
