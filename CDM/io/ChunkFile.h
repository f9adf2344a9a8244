#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

#include "../core/utils.h"

// One chunk's on-disk artifacts: the appendable partial file (.tmp) and the
// complete file (.part) it is renamed to once every byte is present.
class ChunkFile
{
public:
    ChunkFile(const std::string& tmpPath, const std::string& partPath);
    ~ChunkFile();

    ChunkFile(const ChunkFile&) = delete;
    ChunkFile& operator=(const ChunkFile&) = delete;

    // True if the complete artifact exists.
    bool isComplete() const;

    // Opens the partial file for appending; size() reports its length.
    Error open();
    // Drops any partial bytes and reopens empty.
    Error reset();

    bool write(const char* data, std::size_t size);
    std::int64_t size() const { return currentSize; }

    // fsync, close, and rename the partial file over the complete one.
    Error finalize();
    void close();

    const std::string& tmpPath() const { return partialPath; }
    const std::string& partPath() const { return completePath; }

private:
    std::string partialPath;
    std::string completePath;

    int fileHandle = -1;
    std::int64_t currentSize = 0;
};
