#include "ProgressTracker.h"

#include <iomanip>
#include <sstream>

ProgressTracker::ProgressTracker(std::uint64_t totalBytes)
    : total(totalBytes),
    start(std::chrono::steady_clock::now()) {
}

void ProgressTracker::add(std::uint64_t bytes) {
    current.fetch_add(bytes, std::memory_order_relaxed);
}

std::uint64_t ProgressTracker::downloaded() const {
    return current.load(std::memory_order_relaxed);
}

double ProgressTracker::progress() const {
    return total == 0 ? 0.0 : (double)downloaded() / (double)total;
}

double ProgressTracker::elapsedSeconds() const {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    return elapsed.count();
}

double ProgressTracker::speedBytesPerSec() const {
    const double secs = elapsedSeconds();
    const std::uint64_t now = downloaded();
    const std::uint64_t fresh = now > baseline ? now - baseline : 0;
    return secs > 0 ? fresh / secs : 0.0;
}

void ProgressTracker::reset(std::uint64_t totalBytes, std::uint64_t alreadyOnDisk) {
    total = totalBytes;
    baseline = alreadyOnDisk;
    current.store(alreadyOnDisk, std::memory_order_relaxed);
    start = std::chrono::steady_clock::now();
}

std::string formatBytes(std::int64_t bytes) {
    const std::int64_t unit = 1000;
    if (bytes < unit)
        return std::to_string(bytes) + " B";

    std::int64_t div = unit;
    int exp = 0;
    for (std::int64_t n = bytes / unit; n >= unit && exp < 3; n /= unit) {
        div *= unit;
        ++exp;
    }

    static const char* units[] = { "KB", "MB", "GB", "TB" };
    std::ostringstream os;
    os << std::fixed << std::setprecision(1)
        << static_cast<double>(bytes) / static_cast<double>(div)
        << " " << units[exp];
    return os.str();
}

std::string formatDuration(double seconds) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1);
    if (seconds < 60.0)
        os << seconds << "s";
    else if (seconds < 3600.0)
        os << seconds / 60.0 << "m";
    else
        os << seconds / 3600.0 << "h";
    return os.str();
}
