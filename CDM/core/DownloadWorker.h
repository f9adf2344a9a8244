#pragma once
#include <chrono>
#include <functional>
#include <string>

#include "utils.h"
#include "ChunkQueue.h"
#include "ConnectionPool.h"

class TransferState;
class CancellationToken;
class ProgressTracker;
class Logger;

struct RetryPolicy {
    int maxRetries = 10;
    std::chrono::milliseconds baseDelay{ 1000 };
    std::chrono::milliseconds maxDelay{ 60000 };

    // min(2^attempt * baseDelay, maxDelay)
    std::chrono::milliseconds delayFor(std::int64_t attempt) const;
};

// Pulls chunk indices off the queue and brings each one to a complete .part
// artifact, resuming from whatever the .tmp file already holds.
class DownloadWorker {
public:
    using ReportCallback = std::function<void(const WorkerReport&)>;

    DownloadWorker(ChunkQueue& queue,
        TransferState& state,
        ConnectionPool& pool,
        const RetryPolicy& retry,
        CancellationToken& cancel,
        ProgressTracker& progress,
        Logger& logger,
        ReportCallback cb);

    void run();

private:
    Error downloadChunk(int index, WorkerReport& rep);

private:
    ChunkQueue& chunkQueue;
    TransferState& state;
    ConnectionPool& connectionPool;
    const RetryPolicy& retry;
    CancellationToken& cancel;
    ProgressTracker& progress;
    Logger& logger;
    ReportCallback report;
};
