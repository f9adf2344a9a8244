#include "RangeFetcher.h"
#include "CancellationToken.h"

#include <algorithm>

RangeFetcher::RangeFetcher(Transport& t)
    : transport(t) {
}

Error RangeFetcher::fetch(const std::string& url,
    std::int64_t start,
    std::int64_t end,
    const ByteSink& sink,
    const CancellationToken* cancel) {
    written = 0;

    if (start < 0 || end < start)
        return { ErrorCode::Transfer, "invalid range " + std::to_string(start) + "-" + std::to_string(end) };

    const std::int64_t expected = end - start + 1;

    // -1 until the first body slice tells us whether the server honored Range
    std::int64_t skip = -1;
    long badStatus = 0;
    bool sinkFailed = false;

    auto onBody = [&](long status, const char* data, std::size_t size) -> bool {
        if (cancel && cancel->isCancelled())
            return false;

        if (!isAcceptedStatus(status)) {
            badStatus = status;
            return false;
        }

        // 200 means the whole resource; drop everything before `start`
        if (skip < 0)
            skip = (status == 200) ? start : 0;

        if (skip > 0) {
            const std::size_t dropped = static_cast<std::size_t>(std::min<std::int64_t>(skip, static_cast<std::int64_t>(size)));
            data += dropped;
            size -= dropped;
            skip -= static_cast<std::int64_t>(dropped);
            if (size == 0)
                return true;
        }

        const std::size_t n = static_cast<std::size_t>(
            std::min<std::int64_t>(static_cast<std::int64_t>(size), expected - written));

        if (n > 0 && !sink(data, n)) {
            sinkFailed = true;
            return false;
        }

        written += static_cast<std::int64_t>(n);
        return written < expected;
    };

    HttpTransferResult res = transport.getRange(url, start, end, onBody, cancel);

    if (written == expected)
        return {};

    if (cancel && cancel->isCancelled())
        return { ErrorCode::Cancelled, "transfer cancelled" };

    if (sinkFailed)
        return { ErrorCode::Transfer, "write to chunk file failed" };

    if (badStatus != 0)
        return { ErrorCode::Transfer, "unexpected status code: " + std::to_string(badStatus) };

    // Only cancellation is left to make the body callback stop early
    if (res.cancelled || res.stoppedByCallback)
        return { ErrorCode::Cancelled, "transfer cancelled" };

    if (!res.error.empty())
        return { ErrorCode::Transfer, "request failed: " + res.error };

    if (!isAcceptedStatus(res.status))
        return { ErrorCode::Transfer, "unexpected status code: " + std::to_string(res.status) };

    return { ErrorCode::IncompleteTransfer,
        "incomplete transfer: received " + std::to_string(written) +
        " of " + std::to_string(expected) + " bytes" };
}
