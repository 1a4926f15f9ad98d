// ============================================================================
// coalesce/transfer/network_job.hpp - Network Job Collaborator Interfaces
// ============================================================================
//
// The transfer core never talks to a transport. It wraps an opaque
// NetworkJob that somebody else knows how to run, and it is fed by whoever
// receives that job's events (the NetworkJobDelegate, normally the
// TransferRegistry).
//
// JOB CONTRACT:
// -------------
// - Start() begins the transfer. It is called at most once per job.
// - Cancel() aborts it. Start() after Cancel() must not begin a transfer.
// - Events arrive on the delegate as zero or more OnJobData() calls, at most
//   one OnJobMetrics(), then exactly one OnJobFinished(). Once Cancel() has
//   returned, no further event is delivered.
// - CurrentKey() is the job's own view of its target and may change while
//   it runs (redirects). Routing never relies on it.
//
// ============================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "coalesce/core/error.hpp"
#include "coalesce/core/result.hpp"

namespace coalesce {

// Identity of the fetched resource (typically a URL)
using ResourceKey = std::string;

using Bytes = std::vector<std::uint8_t>;

// ============================================================================
// Value Types
// ============================================================================

struct ResponseMetadata {
    // 0 means the job finished without ever receiving a response
    int status_code = 0;
    std::map<std::string, std::string> headers;
};

struct TransferMetrics {
    std::chrono::steady_clock::duration duration{};
    size_t bytes_received = 0;
    int redirect_count = 0;
};

// Successful result handed to every registered caller
struct TransferPayload {
    Bytes data;
    ResponseMetadata response;
};

using TransferOutcome = Result<TransferPayload, Error>;

// What a job reports when it terminates. The body is not part of it: the
// transfer has been accumulating it chunk by chunk.
using JobOutcome = Result<ResponseMetadata, Error>;

enum class JobPriority { Low, Default, High };

const char* JobPriorityToString(JobPriority priority) noexcept;

struct JobParameters {
    JobPriority priority = JobPriority::Default;
};

// ============================================================================
// NetworkJob - One startable, cancellable transfer
// ============================================================================
class NetworkJob {
   public:
    virtual ~NetworkJob() = default;

    virtual void Start() = 0;

    virtual void Cancel() = 0;

    [[nodiscard]] virtual ResourceKey CurrentKey() const = 0;
};

// ============================================================================
// NetworkJobDelegate - Receives a job's delivery channel
// ============================================================================
class NetworkJobDelegate {
   public:
    virtual ~NetworkJobDelegate() = default;

    virtual void OnJobData(NetworkJob& job, std::span<const std::uint8_t> chunk) = 0;

    virtual void OnJobMetrics(NetworkJob& job, const TransferMetrics& metrics) = 0;

    virtual void OnJobFinished(NetworkJob& job, JobOutcome outcome) = 0;
};

// ============================================================================
// NetworkJobFactory - Creates jobs bound to a delegate
// ============================================================================
class NetworkJobFactory {
   public:
    virtual ~NetworkJobFactory() = default;

    // The returned job must not report anything before Start() is called
    virtual Result<std::shared_ptr<NetworkJob>, Error> CreateJob(const ResourceKey& key,
                                                                 const JobParameters& params,
                                                                 NetworkJobDelegate& delegate) = 0;
};

}  // namespace coalesce
