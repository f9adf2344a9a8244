#include "DownloadController.h"
#include "../io/ChunkMerger.h"

#include <algorithm>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace {
// Backslash-escapes glob metacharacters so a path matches literally.
std::string escapeGlob(const std::string& s) {
    std::string out;
    for (char ch : s) {
        if (ch == '*' || ch == '?' || ch == '[' || ch == ']' || ch == '\\')
            out += '\\';
        out += ch;
    }
    return out;
}
}

std::string namePrefixFromUrl(const std::string& url) {
    std::string base = url;

    auto special = base.find_first_of("?#");
    if (special != std::string::npos)
        base = base.substr(0, special);

    while (!base.empty() && base.back() == '/')
        base.pop_back();

    auto slash = base.find_last_of('/');
    std::string name = (slash == std::string::npos) ? base : base.substr(slash + 1);

    // "https:" left over from a bare scheme is not a file name
    if (name.empty() || name.find(':') != std::string::npos)
        name = "download";

    return name;
}

DownloadController::DownloadController(const DownloadConfig& config,
    Logger& log,
    volatile std::sig_atomic_t* externalStop,
    ConnectionPool::Factory factory)
    : cfg(config),
    logger(log),
    externalStopSignal(externalStop),
    progress(0)
{
    if (!factory) {
        HttpOptions opts;
        opts.proxy = cfg.proxy;
        opts.connectTimeoutSec = cfg.connectTimeoutSec;
        opts.readTimeoutSec = cfg.readTimeoutSec;
        factory = [opts]() { return std::make_unique<HttpClient>(opts); };
    }

    connectionPool = std::make_unique<ConnectionPool>(std::move(factory),
        std::max<std::size_t>(cfg.concurrency, 1));
}

void DownloadController::stop() {
    cancelToken.cancel("stopped");
}

bool DownloadController::stopRequested() const {
    return externalStopSignal && *externalStopSignal != 0;
}

Error DownloadController::run() {
    if (cfg.timeoutSec > 0) {
        hasDeadline = true;
        deadline = std::chrono::steady_clock::now() + std::chrono::seconds(cfg.timeoutSec);
    }

    if (Error err = initState())
        return err;

    logBanner();
    progress.reset(static_cast<std::uint64_t>(transferState->totalSize()),
        static_cast<std::uint64_t>(transferState->bytesOnDisk()));

    SchedulerOptions opts;
    opts.concurrency = cfg.concurrency;
    opts.retry.maxRetries = cfg.maxRetries;
    opts.retry.baseDelay = std::chrono::milliseconds(cfg.retryBaseDelayMs);
    opts.hookCommand = cfg.hookCommand;
    opts.hookConcurrency = cfg.hookConcurrency;
    opts.shouldStop = [this]() {
        if (hasDeadline && std::chrono::steady_clock::now() >= deadline) {
            cancelToken.cancel("timeout after " + std::to_string(cfg.timeoutSec) + "s");
            return true;
        }
        if (stopRequested()) {
            cancelToken.cancel("interrupted");
            return true;
        }
        return false;
    };

    TransferScheduler scheduler(*transferState, *connectionPool, progress, logger);
    Error err = scheduler.run(opts, cancelToken);
    lastStats = scheduler.stats();

    if (err) {
        if (err.code == ErrorCode::Cancelled) {
            logger.info("Download stopped (" + err.message + "); " +
                std::to_string(transferState->completedCount()) + "/" +
                std::to_string(transferState->chunkCount()) + " chunks saved in " + transferState->statePath());
        }
        return err;
    }

    if (!transferState->allTransfersComplete())
        return { ErrorCode::ChunkFailed, "download finished with incomplete chunks" };

    logSummary(progress.elapsedSeconds());

    std::vector<int> pendingHooks;
    if (!cfg.hookCommand.empty())
        pendingHooks = transferState->pendingHooks();

    if (!pendingHooks.empty()) {
        logger.warn(std::to_string(pendingHooks.size()) + " post-part commands did not succeed; keeping " +
            transferState->statePath() + " so the next run retries them");
    }
    else if (Error rmErr = transferState->remove()) {
        return rmErr;
    }

    if (cfg.mergeAfter) {
        logger.info("Merging chunks...");

        MergeConfig mc;
        mc.pattern = escapeGlob((fs::path(transferState->directory()) /
            transferState->namePrefix()).string()) + ".*.part";

        ChunkMerger merger(mc, logger);
        if (Error mergeErr = merger.merge())
            return mergeErr;
    }

    return {};
}

Error DownloadController::probeTotalSize(std::int64_t& totalSize) {
    PooledConnection conn(*connectionPool);
    if (!conn)
        return { ErrorCode::Transfer, "no transport available" };

    HttpHeadResult head;
    std::string why;
    if (!conn->head(cfg.url, head, why))
        return { ErrorCode::Transfer, "failed to get content length: " + why };

    if (head.status != 200)
        return { ErrorCode::Transfer, "HEAD request returned status " + std::to_string(head.status) };

    if (head.contentLength <= 0)
        return { ErrorCode::Transfer, "server did not provide content length" };

    if (!head.acceptRanges)
        logger.debug("server did not advertise Accept-Ranges: bytes");

    totalSize = head.contentLength;
    return {};
}

Error DownloadController::initState() {
    namePrefix = namePrefixFromUrl(cfg.url);

    std::error_code ec;
    fs::create_directories(cfg.outputDir, ec);
    if (ec)
        return { ErrorCode::Io, "failed to create " + cfg.outputDir + ": " + ec.message() };

    Error err;
    std::unique_ptr<TransferState> previous = TransferState::load(namePrefix, cfg.outputDir, err);
    if (err) {
        if (!cfg.forceRestart)
            return { err.code, err.message + " (use --force to restart)" };
        logger.warn("discarding unreadable state: " + err.message);
    }

    std::int64_t totalSize = cfg.totalSize;
    if (totalSize <= 0) {
        if (cfg.skipHead)
            return { ErrorCode::Usage, "--no-head requires --size" };
        if (Error probeErr = probeTotalSize(totalSize))
            return probeErr;
    }

    if (previous && !cfg.forceRestart) {
        if (!previous->matches(cfg.url, totalSize)) {
            std::ostringstream os;
            os << "existing state " << previous->statePath() << " is for " << previous->url()
                << " (" << previous->totalSize() << " bytes), not " << cfg.url
                << " (" << totalSize << " bytes); use --force to restart";
            return { ErrorCode::StateMismatch, os.str() };
        }

        if (previous->chunkSize() != cfg.chunkSize) {
            logger.warn("resuming with the saved chunk size of " + formatBytes(previous->chunkSize()) +
                " instead of " + formatBytes(cfg.chunkSize));
        }

        transferState = std::move(previous);
        logger.info("Resuming: " + std::to_string(transferState->completedCount()) + "/" +
            std::to_string(transferState->chunkCount()) + " chunks already complete");
        return {};
    }

    // Complete artifacts survive a forced restart only if they belong to the same plan
    const bool samePlan = previous &&
        previous->matches(cfg.url, totalSize) &&
        previous->chunkSize() == cfg.chunkSize;
    const bool dropComplete = cfg.forceRestart && previous && !samePlan;

    transferState = TransferState::create(cfg.url, totalSize, cfg.chunkSize, namePrefix, cfg.outputDir, err);
    if (!transferState)
        return err;

    if (cfg.forceRestart) {
        const std::size_t tmpRemoved = transferState->cleanupTempFiles();
        const std::size_t partRemoved = dropComplete ? transferState->removeArtifacts("part") : 0;
        if (tmpRemoved + partRemoved > 0) {
            logger.info("Discarded " + std::to_string(tmpRemoved) + " partial and " +
                std::to_string(partRemoved) + " complete chunk files from the previous plan");
        }
    }

    return transferState->save();
}

void DownloadController::logBanner() const {
    std::ostringstream os;
    os << "URL        : " << cfg.url << '\n'
        << "File       : " << transferState->namePrefix() << '\n'
        << "Size       : " << formatBytes(transferState->totalSize()) << '\n'
        << "Chunk size : " << formatBytes(transferState->chunkSize()) << '\n'
        << "Chunks     : " << transferState->chunkCount() << '\n'
        << "Jobs       : " << std::max<std::size_t>(cfg.concurrency, 1);
    if (!cfg.hookCommand.empty())
        os << '\n' << "Post-part  : " << cfg.hookCommand;
    logger.info(os.str());
}

void DownloadController::logSummary(double seconds) const {
    const double avgSpeed = progress.speedBytesPerSec();

    std::ostringstream os;
    os << "Download complete: " << formatBytes(transferState->totalSize())
        << " in " << formatDuration(seconds)
        << " (avg " << formatBytes(static_cast<std::int64_t>(avgSpeed)) << "/s"
        << ", " << lastStats.transferred << " fetched, " << lastStats.skipped << " already on disk)";
    logger.info(os.str());
}
