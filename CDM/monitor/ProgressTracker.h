#pragma once
#include <atomic>
#include <cstdint>
#include <chrono>
#include <string>

class ProgressTracker {
public:
    explicit ProgressTracker(std::uint64_t totalBytes);

    void add(std::uint64_t bytes);
    std::uint64_t downloaded() const;
    double progress() const;
    double speedBytesPerSec() const;
    double elapsedSeconds() const;
    void reset(std::uint64_t totalBytes, std::uint64_t alreadyOnDisk = 0);

private:
    std::uint64_t total;
    std::atomic<std::uint64_t> current{ 0 };
    // Bytes present before this run; excluded from speed.
    std::uint64_t baseline{ 0 };
    std::chrono::steady_clock::time_point start;
};

// 1500 -> "1.5 KB" (decimal units).
std::string formatBytes(std::int64_t bytes);
std::string formatDuration(double seconds);
