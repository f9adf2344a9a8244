#include "HttpClient.h"
#include "../core/CancellationToken.h"

#include <curl/curl.h>
#include <cctype>
#include <sstream>

namespace {
struct WriteContext {
    CURL* handle;
    const BodyCallback* onBody;
    bool stopped;
};

struct ProgressContext {
    const CancellationToken* cancel;
};

bool startsWithNoCase(const std::string& s, const char* prefix) {
    std::size_t i = 0;
    for (; prefix[i] != '\0'; ++i) {
        if (i >= s.size())
            return false;
        if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i])))
            return false;
    }
    return true;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    std::size_t total = size * nmemb;

    long status = 0;
    curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &status);

    if (!(*ctx->onBody)(status, ptr, total)) {
        ctx->stopped = true;
        return 0;
    }
    return total;
}

int progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<ProgressContext*>(userdata);
    return (ctx->cancel && ctx->cancel->isCancelled()) ? 1 : 0;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* result = static_cast<HttpHeadResult*>(userdata);

    std::string header(buffer, total);

    // A new status line starts a new response (redirects)
    if (startsWithNoCase(header, "HTTP/")) {
        result->acceptRanges = false;
    }
    else if (startsWithNoCase(header, "Accept-Ranges:")) {
        if (header.find("bytes") != std::string::npos)
            result->acceptRanges = true;
    }

    return total;
}
}

void HttpClient::globalInit() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpClient::globalCleanup() {
    curl_global_cleanup();
}

HttpClient::HttpClient(const HttpOptions& options)
    : curl(curl_easy_init()), opts(options) {
}

HttpClient::~HttpClient() {
    if (curl)
        curl_easy_cleanup(static_cast<CURL*>(curl));
}

void HttpClient::applyCommonOptions(void* handle, const std::string& url) const {
    CURL* c = static_cast<CURL*>(handle);

    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, opts.connectTimeoutSec);

    if (opts.readTimeoutSec > 0) {
        curl_easy_setopt(c, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(c, CURLOPT_LOW_SPEED_TIME, opts.readTimeoutSec);
    }

    if (!opts.proxy.empty())
        curl_easy_setopt(c, CURLOPT_PROXY, opts.proxy.c_str());
}

bool HttpClient::head(const std::string& url, HttpHeadResult& out, std::string& error) {
    CURL* c = static_cast<CURL*>(curl);
    if (!c) {
        error = "curl handle unavailable";
        return false;
    }

    curl_easy_reset(c);
    applyCommonOptions(c, url);

    out = HttpHeadResult{};
    curl_easy_setopt(c, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(c, CURLOPT_HEADERDATA, &out);

    CURLcode res = curl_easy_perform(c);
    if (res != CURLE_OK) {
        error = std::string("HEAD request failed: ") + curl_easy_strerror(res);
        return false;
    }

    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &out.status);

    curl_off_t length = -1;
    if (curl_easy_getinfo(c, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK)
        out.contentLength = static_cast<std::int64_t>(length);

    return true;
}

HttpTransferResult HttpClient::getRange(const std::string& url,
    std::int64_t start,
    std::int64_t end,
    const BodyCallback& onBody,
    const CancellationToken* cancel) {
    HttpTransferResult result;

    CURL* c = static_cast<CURL*>(curl);
    if (!c) {
        result.error = "curl handle unavailable";
        return result;
    }

    curl_easy_reset(c);
    applyCommonOptions(c, url);

    std::ostringstream range;
    range << start << "-" << end;
    const std::string rangeStr = range.str();

    WriteContext writeCtx{ c, &onBody, false };
    ProgressContext progressCtx{ cancel };

    curl_easy_setopt(c, CURLOPT_RANGE, rangeStr.c_str());
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &writeCtx);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(c, CURLOPT_XFERINFODATA, &progressCtx);
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(c);
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &result.status);

    if (res == CURLE_OK)
        return result;

    if (res == CURLE_WRITE_ERROR && writeCtx.stopped) {
        result.stoppedByCallback = true;
        return result;
    }

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        result.cancelled = true;
        result.error = "transfer cancelled";
        return result;
    }

    result.error = curl_easy_strerror(res);
    return result;
}
