#include "ChunkQueue.h"
#include "CancellationToken.h"

#include <algorithm>

ChunkQueue::ChunkQueue(std::vector<int> indices, const CancellationToken& cancel)
    : pending(std::move(indices)), cancelToken(cancel) {
    std::sort(pending.begin(), pending.end());
}

std::optional<int> ChunkQueue::getNext() {
    std::lock_guard<std::mutex> lock(mtx);
    if (cancelToken.isCancelled() || cursor >= pending.size())
        return std::nullopt;
    return pending[cursor++];
}

std::size_t ChunkQueue::dispatched() const {
    std::lock_guard<std::mutex> lock(mtx);
    return cursor;
}

std::size_t ChunkQueue::total() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pending.size();
}
