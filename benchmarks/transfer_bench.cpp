// ============================================================================
// Transfer Core Benchmarks
// ============================================================================
//
// Measures the bookkeeping cost of coalescing: registering and withdrawing
// callers, appending body chunks, fanning one outcome out to N callers, and
// a full Download() round-trip through the registry.
//
// ============================================================================

#include <benchmark/benchmark.h>

#include <memory>
#include <vector>

#include "coalesce/transfer/coalesced_transfer.hpp"
#include "coalesce/transfer/downloader.hpp"

using namespace coalesce;

namespace {

class NullJob : public NetworkJob {
   public:
    void Start() override {}
    void Cancel() override {}
    ResourceKey CurrentKey() const override { return "bench"; }
};

class NullJobFactory : public NetworkJobFactory {
   public:
    Result<std::shared_ptr<NetworkJob>, Error> CreateJob(const ResourceKey& /*key*/, const JobParameters& /*params*/,
                                                         NetworkJobDelegate& delegate) override {
        auto job = std::make_shared<NullJob>();
        last_job = job.get();
        last_delegate = &delegate;
        return Ok(std::static_pointer_cast<NetworkJob>(job));
    }

    NullJob* last_job = nullptr;
    NetworkJobDelegate* last_delegate = nullptr;
};

}  // namespace

// ============================================================================
// CoalescedTransfer Benchmarks
// ============================================================================

static void BM_RegisterCancel(benchmark::State& state) {
    CoalescedTransfer transfer(std::make_shared<NullJob>());
    for (auto _ : state) {
        CancelToken token = transfer.Register(TransferCallback{});
        transfer.Cancel(token);
    }
}
BENCHMARK(BM_RegisterCancel);

static void BM_AppendChunk(benchmark::State& state) {
    std::vector<std::uint8_t> chunk(static_cast<size_t>(state.range(0)), 0x5a);
    for (auto _ : state) {
        state.PauseTiming();
        CoalescedTransfer transfer(std::make_shared<NullJob>());
        state.ResumeTiming();
        for (int i = 0; i < 64; ++i) {
            transfer.OnDataReceived(chunk);
        }
    }
    state.SetBytesProcessed(state.iterations() * 64 * state.range(0));
}
BENCHMARK(BM_AppendChunk)->Arg(256)->Arg(4096)->Arg(65536);

static void BM_FanOut(benchmark::State& state) {
    const auto callers = static_cast<int>(state.range(0));
    int delivered = 0;
    for (auto _ : state) {
        state.PauseTiming();
        CoalescedTransfer transfer(std::make_shared<NullJob>());
        for (int i = 0; i < callers; ++i) {
            transfer.Register(TransferCallback{[&delivered](const TransferOutcome&) { delivered++; }, {}});
        }
        state.ResumeTiming();

        ResponseMetadata response;
        response.status_code = 200;
        transfer.OnJobFinished(Ok(std::move(response)));
    }
    benchmark::DoNotOptimize(delivered);
    state.SetItemsProcessed(state.iterations() * callers);
}
BENCHMARK(BM_FanOut)->Arg(1)->Arg(8)->Arg(64)->Arg(512);

// ============================================================================
// Downloader Benchmarks
// ============================================================================

// One creating caller plus N-1 joining callers, then completion
static void BM_DownloadCoalesced(benchmark::State& state) {
    const auto callers = static_cast<int>(state.range(0));
    NullJobFactory factory;
    Downloader downloader(factory);
    int delivered = 0;

    for (auto _ : state) {
        for (int i = 0; i < callers; ++i) {
            auto task = downloader.Download("bench", {}, [&delivered](const TransferOutcome&) { delivered++; });
            benchmark::DoNotOptimize(task);
        }
        ResponseMetadata response;
        response.status_code = 200;
        factory.last_delegate->OnJobFinished(*factory.last_job, Ok(std::move(response)));
    }
    benchmark::DoNotOptimize(delivered);
    state.SetItemsProcessed(state.iterations() * callers);
}
BENCHMARK(BM_DownloadCoalesced)->Arg(1)->Arg(16)->Arg(128);

static void BM_DownloadCancel(benchmark::State& state) {
    NullJobFactory factory;
    Downloader downloader(factory);
    for (auto _ : state) {
        auto task = downloader.Download("bench", {}, nullptr);
        task.Value().Cancel();
    }
}
BENCHMARK(BM_DownloadCancel);
