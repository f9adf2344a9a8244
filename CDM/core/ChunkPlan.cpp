#include "ChunkPlan.h"

#include <algorithm>
#include <string>

std::int64_t chunkCount(std::int64_t totalSize, std::int64_t chunkSize) {
    if (totalSize <= 0 || chunkSize <= 0)
        return 0;
    return totalSize / chunkSize + (totalSize % chunkSize != 0 ? 1 : 0);
}

Error planChunks(std::int64_t totalSize,
    std::int64_t chunkSize,
    std::vector<ChunkRange>& out) {
    out.clear();

    if (totalSize <= 0)
        return { ErrorCode::Planning, "total size must be positive, got " + std::to_string(totalSize) };
    if (chunkSize <= 0)
        return { ErrorCode::Planning, "chunk size must be positive, got " + std::to_string(chunkSize) };

    const std::int64_t count = chunkCount(totalSize, chunkSize);
    if (count > kMaxChunkCount) {
        return { ErrorCode::Planning, std::to_string(count) + " chunks exceed the limit of " +
            std::to_string(kMaxChunkCount) + "; use a larger chunk size" };
    }

    out.reserve(static_cast<std::size_t>(count));

    std::int64_t offset = 0;
    while (offset < totalSize) {
        std::int64_t size = std::min<std::int64_t>(chunkSize, totalSize - offset);
        out.push_back({ offset, offset + size - 1 });
        offset += size;
    }

    return {};
}
