#include <catch2/catch.hpp>

#include "TestHelpers.h"
#include "core/RangeFetcher.h"

namespace {
const std::string kUrl = "http://example.com/data.bin";

struct Collected {
    std::string bytes;
    ByteSink sink() {
        return [this](const char* data, std::size_t size) {
            bytes.append(data, size);
            return true;
        };
    }
};
}

TEST_CASE("Fetcher delivers exactly the requested range", "[fetcher]") {
    auto server = std::make_shared<FakeServer>();
    server->body = patternBytes(2500);
    FakeTransport transport(server);
    RangeFetcher fetcher(transport);
    Collected out;

    REQUIRE(fetcher.fetch(kUrl, 1000, 1999, out.sink()).ok());
    CHECK(out.bytes == server->body.substr(1000, 1000));
    CHECK(fetcher.lastWritten() == 1000);

    auto log = server->requestLog();
    REQUIRE(log.size() == 1);
    CHECK(log[0].first == 1000);
    CHECK(log[0].second == 1999);
}

TEST_CASE("Fetcher discards the prefix when the server ignores Range", "[fetcher]") {
    auto server = std::make_shared<FakeServer>();
    server->body = patternBytes(2500);
    server->ignoreRange = true;
    FakeTransport transport(server);
    RangeFetcher fetcher(transport);
    Collected out;

    REQUIRE(fetcher.fetch(kUrl, 1300, 1999, out.sink()).ok());
    CHECK(out.bytes == server->body.substr(1300, 700));
}

TEST_CASE("Fetcher reports a short body as incomplete", "[fetcher]") {
    auto server = std::make_shared<FakeServer>();
    server->body = patternBytes(2500);
    server->truncateAfter = 400;
    FakeTransport transport(server);
    RangeFetcher fetcher(transport);
    Collected out;

    Error err = fetcher.fetch(kUrl, 0, 999, out.sink());
    CHECK(err.code == ErrorCode::Transfer);
    CHECK(err.transient());
    CHECK(fetcher.lastWritten() == 400);
    CHECK(out.bytes == server->body.substr(0, 400));
}

TEST_CASE("Fetcher reports a clean short stream as IncompleteTransfer", "[fetcher]") {
    auto server = std::make_shared<FakeServer>();
    // Resource is shorter than the range asked for
    server->body = patternBytes(1500);
    FakeTransport transport(server);
    RangeFetcher fetcher(transport);
    Collected out;

    Error err = fetcher.fetch(kUrl, 1000, 1999, out.sink());
    CHECK(err.code == ErrorCode::IncompleteTransfer);
    CHECK(err.transient());
    CHECK(fetcher.lastWritten() == 500);
}

TEST_CASE("Fetcher rejects unexpected status codes", "[fetcher]") {
    auto server = std::make_shared<FakeServer>();
    server->body = "<html>not found</html>";
    server->forcedStatus = 404;
    FakeTransport transport(server);
    RangeFetcher fetcher(transport);
    Collected out;

    Error err = fetcher.fetch(kUrl, 0, 9, out.sink());
    CHECK(err.code == ErrorCode::Transfer);
    CHECK(err.message == "unexpected status code: 404");
    CHECK(out.bytes.empty());
}

TEST_CASE("Fetcher surfaces transport errors as transient", "[fetcher]") {
    auto server = std::make_shared<FakeServer>();
    server->body = patternBytes(100);
    server->failures[0] = 1;
    FakeTransport transport(server);
    RangeFetcher fetcher(transport);
    Collected out;

    Error err = fetcher.fetch(kUrl, 0, 99, out.sink());
    CHECK(err.code == ErrorCode::Transfer);
    CHECK_THAT(err.message, Catch::Contains("connection reset"));

    // Second attempt is served
    REQUIRE(fetcher.fetch(kUrl, 0, 99, out.sink()).ok());
    CHECK(out.bytes == server->body);
}

TEST_CASE("Fetcher stops when the sink fails", "[fetcher]") {
    auto server = std::make_shared<FakeServer>();
    server->body = patternBytes(1000);
    FakeTransport transport(server);
    RangeFetcher fetcher(transport);

    Error err = fetcher.fetch(kUrl, 0, 999, [](const char*, std::size_t) { return false; });
    CHECK(err.code == ErrorCode::Transfer);
    CHECK(fetcher.lastWritten() == 0);
}

TEST_CASE("Fetcher returns Cancelled once the token fires", "[fetcher]") {
    auto server = std::make_shared<FakeServer>();
    server->body = patternBytes(1000);
    server->hangs.insert(0);
    FakeTransport transport(server);
    RangeFetcher fetcher(transport);
    CancellationToken token;
    Collected out;

    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel("test");
    });

    Error err = fetcher.fetch(kUrl, 0, 999, out.sink(), &token);
    canceller.join();

    CHECK(err.code == ErrorCode::Cancelled);
    CHECK_FALSE(err.transient());
}

TEST_CASE("Fetcher rejects an inverted range without a request", "[fetcher]") {
    auto server = std::make_shared<FakeServer>();
    server->body = patternBytes(10);
    FakeTransport transport(server);
    RangeFetcher fetcher(transport);
    Collected out;

    CHECK(fetcher.fetch(kUrl, 5, 4, out.sink()).code == ErrorCode::Transfer);
    CHECK(server->requestCount() == 0);
}

TEST_CASE("Fetcher treats a transfer stopped by its callback as cancelled", "[fetcher]") {
    struct StoppedTransport : Transport {
        bool head(const std::string&, HttpHeadResult&, std::string&) override { return false; }
        HttpTransferResult getRange(const std::string&, std::int64_t, std::int64_t,
            const BodyCallback&, const CancellationToken*) override {
            HttpTransferResult res;
            res.status = 206;
            res.stoppedByCallback = true;
            return res;
        }
    };

    StoppedTransport transport;
    RangeFetcher fetcher(transport);
    Collected out;

    Error err = fetcher.fetch(kUrl, 0, 99, out.sink());
    CHECK(err.code == ErrorCode::Cancelled);
    CHECK(out.bytes.empty());
}
