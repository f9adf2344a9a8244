#pragma once
#include <cstdint>
#include <functional>
#include <string>

#include "utils.h"
#include "../net/HttpClient.h"

class CancellationToken;

// Append-only destination for fetched bytes; return false on write failure.
using ByteSink = std::function<bool(const char* data, std::size_t size)>;

// One attempt at delivering exactly [start, end] into a sink. Retrying and
// resume offsets are the caller's business.
class RangeFetcher {
public:
    explicit RangeFetcher(Transport& transport);

    // Transfer / IncompleteTransfer on transient failures, Cancelled when the
    // token fired before every byte arrived.
    Error fetch(const std::string& url,
        std::int64_t start,
        std::int64_t end,
        const ByteSink& sink,
        const CancellationToken* cancel = nullptr);

    // Bytes handed to the sink by the last fetch().
    std::int64_t lastWritten() const { return written; }

private:
    Transport& transport;
    std::int64_t written = 0;
};

inline bool isAcceptedStatus(long status) {
    return status == 206 || status == 200;
}
