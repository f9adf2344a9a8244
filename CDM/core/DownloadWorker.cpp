#include "DownloadWorker.h"
#include "CancellationToken.h"
#include "RangeFetcher.h"
#include "TransferState.h"
#include "../io/ChunkFile.h"
#include "../monitor/Logger.h"
#include "../monitor/ProgressTracker.h"

#include <algorithm>

std::chrono::milliseconds RetryPolicy::delayFor(std::int64_t attempt) const {
    const auto exponent = std::clamp<std::int64_t>(attempt, 0, 30);
    const auto factor = static_cast<std::int64_t>(1) << exponent;
    const std::int64_t ms = baseDelay.count() * factor;
    if (baseDelay.count() > 0 && ms / baseDelay.count() != factor)
        return maxDelay;
    return std::min(std::chrono::milliseconds(ms), maxDelay);
}

DownloadWorker::DownloadWorker(ChunkQueue& queue,
    TransferState& st,
    ConnectionPool& pool,
    const RetryPolicy& policy,
    CancellationToken& token,
    ProgressTracker& tracker,
    Logger& log,
    ReportCallback cb)
    : chunkQueue(queue),
    state(st),
    connectionPool(pool),
    retry(policy),
    cancel(token),
    progress(tracker),
    logger(log),
    report(std::move(cb)) {
}

void DownloadWorker::run() {
    while (!cancel.isCancelled()) {

        auto next = chunkQueue.getNext();
        if (!next.has_value())
            return;

        WorkerReport rep{};
        rep.chunkIndex = *next;
        rep.bytesDownloaded = 0;
        rep.skipped = false;
        rep.success = false;

        rep.error = downloadChunk(rep.chunkIndex, rep);
        rep.success = rep.error.ok();

        report(rep);

        if (!rep.success)
            return;
    }
}

Error DownloadWorker::downloadChunk(int index, WorkerReport& rep) {
    const ChunkDescriptor chunk = state.chunk(index);
    const std::int64_t length = chunk.length();

    ChunkFile file(state.tmpPath(index), state.partPath(index));
    Error lastErr;

    for (std::int64_t attempt = 0; attempt <= retry.maxRetries; ++attempt) {
        if (attempt > 0) {
            const auto delay = retry.delayFor(attempt);
            logger.debug("chunk " + std::to_string(index) + ": retry " + std::to_string(attempt) +
                "/" + std::to_string(retry.maxRetries) + " in " + std::to_string(delay.count()) + "ms");
            if (cancel.waitFor(delay))
                return { ErrorCode::Cancelled, "cancelled during backoff" };
        }

        if (cancel.isCancelled())
            return { ErrorCode::Cancelled, "cancelled" };

        // .part on disk wins over whatever the state file says
        if (file.isComplete()) {
            rep.skipped = true;
            rep.bytesDownloaded = 0;
            progress.add(static_cast<std::uint64_t>(std::max<std::int64_t>(length - chunk.downloadedBytes, 0)));
            lastErr = {};
            break;
        }

        if (Error err = file.open()) {
            lastErr = err;
            logger.warn("chunk " + std::to_string(index) + ": " + err.message);
            continue;
        }

        std::int64_t have = file.size();
        if (have > length) {
            logger.warn("chunk " + std::to_string(index) + ": partial file holds " + std::to_string(have) +
                " bytes, more than the chunk's " + std::to_string(length) + "; restarting it");
            if (Error err = file.reset()) {
                lastErr = err;
                continue;
            }
            have = 0;
        }

        state.recordProgress(index, have);

        if (have < length) {
            if (have > 0)
                logger.debug("chunk " + std::to_string(index) + ": resuming at byte " + std::to_string(chunk.start + have));

            PooledConnection conn(connectionPool);
            if (!conn) {
                file.close();
                lastErr = { ErrorCode::Transfer, "no transport available" };
                continue;
            }

            RangeFetcher fetcher(*conn);
            Error err = fetcher.fetch(state.url(), chunk.start + have, chunk.end,
                [&](const char* data, std::size_t size) {
                    if (!file.write(data, size))
                        return false;
                    progress.add(size);
                    return true;
                },
                &cancel);

            rep.bytesDownloaded += fetcher.lastWritten();

            if (err) {
                file.close();
                state.recordProgress(index, file.size());
                if (err.code == ErrorCode::Cancelled || cancel.isCancelled())
                    return { ErrorCode::Cancelled, "cancelled" };

                lastErr = err;
                logger.warn("chunk " + std::to_string(index) + ": attempt " + std::to_string(attempt + 1) +
                    " failed: " + err.message);
                continue;
            }
        }

        if (Error err = file.finalize()) {
            lastErr = err;
            logger.warn("chunk " + std::to_string(index) + ": " + err.message);
            continue;
        }

        lastErr = {};
        break;
    }

    if (lastErr) {
        return { ErrorCode::ChunkFailed, "chunk " + std::to_string(index) + ": download failed after " +
            std::to_string(retry.maxRetries) + " retries: " + lastErr.message };
    }

    state.markTransferComplete(index, length);
    if (Error err = state.save())
        return { ErrorCode::ChunkFailed, "chunk " + std::to_string(index) + ": failed to save state: " + err.message };

    return {};
}
