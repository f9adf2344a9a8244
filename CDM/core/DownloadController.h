#pragma once
#include <atomic>
#include <memory>
#include <csignal>
#include <chrono>

#include "utils.h"
#include "CancellationToken.h"
#include "ConnectionPool.h"
#include "TransferScheduler.h"
#include "TransferState.h"
#include "../monitor/ProgressTracker.h"
#include "../monitor/Logger.h"

// Last path segment of the URL without query or fragment; "download" if empty.
std::string namePrefixFromUrl(const std::string& url);

class DownloadController {
public:
    // `factory` overrides the libcurl transport (tests).
    DownloadController(const DownloadConfig& config,
        Logger& logger,
        volatile std::sig_atomic_t* externalStop = nullptr,
        ConnectionPool::Factory factory = {});

    Error run();
    // Raises cancellation from another thread.
    void stop();

    TransferState* state() const { return transferState.get(); }
    SchedulerStats stats() const { return lastStats; }

private:
    Error initState();
    Error probeTotalSize(std::int64_t& totalSize);
    bool stopRequested() const;
    void logBanner() const;
    void logSummary(double seconds) const;

private:
    const DownloadConfig& cfg;
    Logger& logger;
    volatile std::sig_atomic_t* externalStopSignal{ nullptr };

    CancellationToken cancelToken;
    std::chrono::steady_clock::time_point deadline;
    bool hasDeadline{ false };

    std::unique_ptr<ConnectionPool> connectionPool;
    std::unique_ptr<TransferState> transferState;
    std::string namePrefix;

    ProgressTracker progress;
    SchedulerStats lastStats;
};
