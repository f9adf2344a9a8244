#pragma once
#include <vector>
#include <cstdint>

#include "utils.h"

// Chunk artifacts carry a six-digit index; merge order relies on the fixed width.
constexpr std::int64_t kMaxChunkCount = 999999;

// Splits [0, totalSize) into ceil(totalSize / chunkSize) contiguous inclusive
// ranges. Both sizes must be positive and the plan at most kMaxChunkCount long.
Error planChunks(std::int64_t totalSize,
    std::int64_t chunkSize,
    std::vector<ChunkRange>& out);

std::int64_t chunkCount(std::int64_t totalSize, std::int64_t chunkSize);
