#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

// Shared stop signal for every worker of one run.
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // First caller wins; later reasons are ignored.
    void cancel(const std::string& why);
    bool isCancelled() const;
    std::string reason() const;

    // Sleeps up to `d`; returns true if the token fired meanwhile.
    bool waitFor(std::chrono::milliseconds d) const;

private:
    std::atomic<bool> cancelled{ false };
    std::string cancelReason;
    mutable std::mutex mtx;
    mutable std::condition_variable cv;
};
