#pragma once
#include <string>
#include <functional>
#include <cstdint>
#include <cstddef>

class CancellationToken;

struct HttpHeadResult {
    long status = 0;
    std::int64_t contentLength = -1;
    bool acceptRanges = false;
};

struct HttpTransferResult {
    long status = 0;
    // The body callback asked to stop; not a transport failure by itself.
    bool stoppedByCallback = false;
    bool cancelled = false;
    // Empty on a clean end of stream.
    std::string error;
};

struct HttpOptions {
    std::string proxy;
    long connectTimeoutSec = 30;
    // Abort when no byte arrives for this long.
    long readTimeoutSec = 60;
};

// Receives the response status with every body slice; return false to stop.
using BodyCallback = std::function<bool(long status, const char* data, std::size_t size)>;

class Transport {
public:
    virtual ~Transport() = default;

    virtual bool head(const std::string& url, HttpHeadResult& out, std::string& error) = 0;

    // GET with "Range: bytes=<start>-<end>".
    virtual HttpTransferResult getRange(const std::string& url,
        std::int64_t start,
        std::int64_t end,
        const BodyCallback& onBody,
        const CancellationToken* cancel) = 0;
};

class HttpClient : public Transport {
public:
    explicit HttpClient(const HttpOptions& options = HttpOptions());
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    static void globalInit();
    static void globalCleanup();

    bool head(const std::string& url, HttpHeadResult& out, std::string& error) override;
    HttpTransferResult getRange(const std::string& url,
        std::int64_t start,
        std::int64_t end,
        const BodyCallback& onBody,
        const CancellationToken* cancel) override;

private:
    void applyCommonOptions(void* handle, const std::string& url) const;

private:
    void* curl;
    HttpOptions opts;
};
