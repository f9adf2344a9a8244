#include "TransferScheduler.h"
#include "CancellationToken.h"
#include "ChunkQueue.h"
#include "ThreadPool.h"
#include "TransferState.h"
#include "../monitor/Logger.h"
#include "../monitor/ProgressTracker.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <thread>
#include <vector>

namespace {
const std::size_t kDefaultHookWorkers = 10;
}

TransferScheduler::TransferScheduler(TransferState& st,
    ConnectionPool& pool,
    ProgressTracker& tracker,
    Logger& log)
    : state(st),
    connections(pool),
    progress(tracker),
    logger(log) {
}

Error TransferScheduler::run(const SchedulerOptions& options, CancellationToken& cancel) {
    const TransferSnapshot snap = state.snapshot();
    const bool hookEnabled = !options.hookCommand.empty();

    std::vector<int> pending;
    std::vector<int> hookOnly;
    for (const auto& c : snap.chunks) {
        if (!c.transferComplete)
            pending.push_back(c.index);
        else if (hookEnabled && !c.hookComplete)
            hookOnly.push_back(c.index);
    }

    if (hookEnabled) {
        const std::size_t hookWorkers = options.hookConcurrency == 0 ? kDefaultHookWorkers : options.hookConcurrency;
        // Room for every chunk, so a submit from a download worker never waits
        hooks = std::make_unique<HookPipeline>(options.hookCommand, hookWorkers,
            snap.chunks.size(), state, logger);
        hooks->start();

        for (int index : hookOnly) {
            logger.info("Retrying post-part for chunk " + std::to_string(index));
            hooks->submit(index);
        }
    }

    ChunkQueue queue(pending, cancel);
    ThreadPool pool;

    std::size_t workerCount = std::max<std::size_t>(options.concurrency, 1);
    workerCount = std::min(workerCount, pending.size());

    std::atomic<std::size_t> active{ workerCount };

    auto workerFn = [&]() {
        DownloadWorker worker(
            queue,
            state,
            connections,
            options.retry,
            cancel,
            progress,
            logger,
            [&](const WorkerReport& rep) {
                onWorkerReport(rep, cancel);
            });

        worker.run();
        active.fetch_sub(1);
    };

    pool.start(workerCount, workerFn);

    // Watch for external stop requests and log progress until workers exit
    auto lastProgressLog = std::chrono::steady_clock::now();
    while (active.load() > 0) {
        if (!cancel.isCancelled() && options.shouldStop && options.shouldStop())
            cancel.cancel("interrupted");

        auto now = std::chrono::steady_clock::now();
        if (now - lastProgressLog >= options.progressInterval) {
            logProgress();
            lastProgressLog = now;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    pool.join();

    Error fatal;
    {
        std::lock_guard<std::mutex> lock(errorMutex);
        fatal = firstError;
    }
    const bool interrupted = cancel.isCancelled() && !fatal;

    if (hooks) {
        if (!interrupted)
            logger.info("Waiting for post-part commands to complete...");
        hooks->finish(!interrupted);

        hookStats.hooksSucceeded = hooks->succeeded();
        hookStats.hooksFailed = hooks->failed();
        hookStats.hooksDropped = hooks->dropped();
        hooks.reset();
    }

    // Snapshot as of the stop point, so the next run resumes from here
    Error saveErr = state.save();
    if (saveErr)
        logger.error("failed to save state: " + saveErr.message);

    if (fatal)
        return fatal;
    if (interrupted)
        return { ErrorCode::Cancelled, cancel.reason() };
    if (saveErr)
        return saveErr;

    return {};
}

void TransferScheduler::onWorkerReport(const WorkerReport& report, CancellationToken& cancel) {
    if (report.success) {
        if (report.skipped)
            ++skipped;
        else
            ++transferred;

        std::ostringstream os;
        os << "[" << state.completedCount() << "/" << state.chunkCount() << "] chunk "
            << report.chunkIndex << (report.skipped ? " already on disk" : " completed");
        logger.info(os.str());

        if (hooks && !hooks->submit(report.chunkIndex))
            logger.warn("post-part queue refused chunk " + std::to_string(report.chunkIndex));
        return;
    }

    if (report.error.code == ErrorCode::Cancelled) {
        logger.debug("chunk " + std::to_string(report.chunkIndex) + " stopped: " + report.error.message);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(errorMutex);
        if (!firstError)
            firstError = report.error;
    }
    logger.error(report.error.message);
    cancel.cancel("chunk " + std::to_string(report.chunkIndex) + " failed");
}

void TransferScheduler::logProgress() {
    const auto downloaded = progress.downloaded();
    const double pct = std::min(progress.progress(), 1.0) * 100.0;

    std::ostringstream os;
    os << "Progress: [" << state.completedCount() << "/" << state.chunkCount() << "] "
        << formatBytes(static_cast<std::int64_t>(downloaded)) << "/" << formatBytes(state.totalSize())
        << " (" << std::fixed << std::setprecision(1) << pct << "%) @ "
        << formatBytes(static_cast<std::int64_t>(progress.speedBytesPerSec())) << "/s";

    logger.info(os.str());
}

SchedulerStats TransferScheduler::stats() const {
    SchedulerStats s = hookStats;
    s.transferred = transferred.load();
    s.skipped = skipped.load();
    return s;
}
