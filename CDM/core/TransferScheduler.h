#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "utils.h"
#include "DownloadWorker.h"
#include "HookPipeline.h"

class TransferState;
class ConnectionPool;
class CancellationToken;
class ProgressTracker;
class Logger;

struct SchedulerOptions {
    std::size_t concurrency = 1;
    RetryPolicy retry;

    std::string hookCommand;
    std::size_t hookConcurrency = 0;

    // Polled by the monitor loop; true raises cancellation.
    std::function<bool()> shouldStop;
    std::chrono::milliseconds progressInterval{ 1000 };
};

struct SchedulerStats {
    std::size_t transferred = 0;
    std::size_t skipped = 0;
    std::size_t hooksSucceeded = 0;
    std::size_t hooksFailed = 0;
    std::size_t hooksDropped = 0;
};

// Runs every unfinished chunk of a TransferState through a bounded worker
// pool. The first fatal chunk error cancels all peers and is returned once
// every worker has unwound.
class TransferScheduler {
public:
    TransferScheduler(TransferState& state,
        ConnectionPool& connections,
        ProgressTracker& progress,
        Logger& logger);

    Error run(const SchedulerOptions& options, CancellationToken& cancel);

    SchedulerStats stats() const;

private:
    void onWorkerReport(const WorkerReport& report, CancellationToken& cancel);
    void logProgress();

private:
    TransferState& state;
    ConnectionPool& connections;
    ProgressTracker& progress;
    Logger& logger;

    std::unique_ptr<HookPipeline> hooks;

    std::mutex errorMutex;
    Error firstError;

    std::atomic<std::size_t> transferred{ 0 };
    std::atomic<std::size_t> skipped{ 0 };
    SchedulerStats hookStats;
};
