#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <utility>

struct DownloadConfig {
    std::string url;
    std::string outputDir = ".";

    std::int64_t chunkSize = 100LL * 1000 * 1000;
    std::int64_t totalSize = 0; // 0 = probe with HEAD

    std::size_t concurrency = 1;
    int maxRetries = 10;
    bool forceRestart = false;
    bool skipHead = false;
    bool mergeAfter = false;

    std::string hookCommand;
    std::size_t hookConcurrency = 0; // 0 = default pool size

    std::string proxy;
    long connectTimeoutSec = 30;
    long readTimeoutSec = 60;
    long retryBaseDelayMs = 1000;
    long timeoutSec = 0; // 0 = no deadline

    bool verbose = false;
};

struct MergeConfig {
    std::string outputName;
    std::string pattern = "*.part";
    bool deleteAfter = false;
    bool strictOutputMatch = false;
};

enum class ErrorCode {
    None,
    Usage,
    Planning,
    StateMismatch,
    Transfer,
    IncompleteTransfer,
    ChunkFailed,
    Cancelled,
    Hook,
    Merge,
    Io
};

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {
    }

    bool ok() const { return code == ErrorCode::None; }
    explicit operator bool() const { return code != ErrorCode::None; }

    // Transfer-level failures a chunk attempt may retry.
    bool transient() const {
        return code == ErrorCode::Transfer || code == ErrorCode::IncompleteTransfer;
    }
};

const char* errorCodeName(ErrorCode code);

struct ChunkRange {
    std::int64_t start;
    std::int64_t end; // inclusive
};

struct ChunkDescriptor {
    int index = 0;
    std::int64_t start = 0;
    std::int64_t end = 0; // inclusive
    std::int64_t downloadedBytes = 0;
    bool transferComplete = false;
    bool hookComplete = false;

    std::int64_t length() const { return end - start + 1; }
};

struct TransferSnapshot {
    std::string url;
    std::int64_t totalSize = 0;
    std::int64_t chunkSize = 0;
    std::string namePrefix;

    std::vector<ChunkDescriptor> chunks;
    int completedCount = 0;
};

struct WorkerReport {
    int chunkIndex;
    std::int64_t bytesDownloaded;
    bool skipped;
    bool success;
    Error error;
};
