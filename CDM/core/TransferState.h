#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "utils.h"
#include "../io/MetadataStore.h"

// Durable progress of one transfer. Every mutation is serialized by a single
// mutex; save() persists under the same lock so snapshots are never torn.
class TransferState {
public:
    // Fresh plan for (url, totalSize, chunkSize). Returns nullptr and sets err
    // on invalid sizes.
    static std::unique_ptr<TransferState> create(const std::string& url,
        std::int64_t totalSize,
        std::int64_t chunkSize,
        const std::string& namePrefix,
        const std::string& dir,
        Error& err);

    // nullptr with an empty err means no state file exists for the prefix.
    static std::unique_ptr<TransferState> load(const std::string& namePrefix,
        const std::string& dir,
        Error& err);

    // Returns true only on the first completion of the chunk.
    bool markTransferComplete(int index, std::int64_t downloadedBytes);
    void markHookComplete(int index, bool success);
    // Monotonic: smaller values are ignored.
    void recordProgress(int index, std::int64_t downloadedBytes);

    Error save();
    Error remove();

    bool matches(const std::string& url, std::int64_t totalSize) const;

    TransferSnapshot snapshot() const;
    ChunkDescriptor chunk(int index) const;
    std::size_t chunkCount() const;
    int completedCount() const;
    bool allTransfersComplete() const;
    // Chunks whose transfer is done but whose hook has not succeeded.
    std::vector<int> pendingHooks() const;
    std::int64_t bytesOnDisk() const;

    const std::string& url() const { return data.url; }
    std::int64_t totalSize() const { return data.totalSize; }
    std::int64_t chunkSize() const { return data.chunkSize; }
    const std::string& namePrefix() const { return data.namePrefix; }
    const std::string& directory() const { return dirPath; }
    const std::string& statePath() const { return store.path(); }

    std::string partPath(int index) const;
    std::string tmpPath(int index) const;

    // Removes every <prefix>.NNNNNN.<suffix> in the state's directory.
    std::size_t removeArtifacts(const std::string& suffix) const;
    std::size_t cleanupTempFiles() const { return removeArtifacts("tmp"); }

private:
    TransferState(TransferSnapshot snapshot, const std::string& dir);

    bool validIndex(int index) const;

private:
    TransferSnapshot data;
    std::string dirPath;
    MetadataStore store;
    mutable std::mutex mtx;
};

std::string chunkFileName(const std::string& prefix, int index, const char* suffix);
