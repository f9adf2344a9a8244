#include "CancellationToken.h"

void CancellationToken::cancel(const std::string& why) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (cancelled.load())
            return;
        cancelReason = why;
        cancelled.store(true);
    }
    cv.notify_all();
}

bool CancellationToken::isCancelled() const {
    return cancelled.load(std::memory_order_relaxed);
}

std::string CancellationToken::reason() const {
    std::lock_guard<std::mutex> lock(mtx);
    return cancelReason;
}

bool CancellationToken::waitFor(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_for(lock, d, [this]() {
        return cancelled.load();
        });
}
