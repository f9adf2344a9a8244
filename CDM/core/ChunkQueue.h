#pragma once
#include <vector>
#include <mutex>
#include <optional>

class CancellationToken;

// Hands out chunk indices strictly in ascending order. Stops handing out
// work once the run is cancelled.
class ChunkQueue {
public:
    ChunkQueue(std::vector<int> indices, const CancellationToken& cancel);

    std::optional<int> getNext();

    std::size_t dispatched() const;
    std::size_t total() const;

private:
    std::vector<int> pending;
    std::size_t cursor{ 0 };
    const CancellationToken& cancelToken;
    mutable std::mutex mtx;
};
