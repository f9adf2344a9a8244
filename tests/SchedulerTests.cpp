#include <catch2/catch.hpp>

#include "TestHelpers.h"
#include "core/DownloadController.h"
#include "core/TransferState.h"
#include "monitor/Logger.h"

#include <algorithm>

namespace {
const std::string kUrl = "http://example.com/files/data.bin?token=abc";

struct DownloadFixture {
    TempDir dir;
    std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();
    std::ostringstream logOut, logErr;
    Logger logger{ logOut, logErr };
    DownloadConfig cfg;

    DownloadFixture() {
        cfg.url = kUrl;
        cfg.outputDir = dir.path();
        cfg.chunkSize = 1000;
        cfg.maxRetries = 3;
        cfg.retryBaseDelayMs = 1;
    }

    std::string part(int index) const { return dir.file(chunkFileName("data.bin", index, "part")); }
    std::string tmp(int index) const { return dir.file(chunkFileName("data.bin", index, "tmp")); }
    std::string statePath() const { return dir.file(".data.bin-state.json"); }

    std::size_t requestsStartingAt(std::int64_t start) {
        auto log = server->requestLog();
        return static_cast<std::size_t>(std::count_if(log.begin(), log.end(),
            [start](const std::pair<std::int64_t, std::int64_t>& r) { return r.first == start; }));
    }

    void waitForRequests(std::size_t n) {
        for (int i = 0; i < 400 && server->requestCount() < n; ++i)
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
};
}

TEST_CASE("Name prefix comes from the last path segment", "[controller]") {
    CHECK(namePrefixFromUrl("https://example.com/files/ubuntu.iso") == "ubuntu.iso");
    CHECK(namePrefixFromUrl("https://example.com/files/data.bin?token=abc#frag") == "data.bin");
    CHECK(namePrefixFromUrl("https://example.com/dir/") == "dir");
    CHECK(namePrefixFromUrl("") == "download");
    CHECK(namePrefixFromUrl("https://") == "download");
}

TEST_CASE_METHOD(DownloadFixture, "A fresh download fetches every chunk and merges", "[scheduler]") {
    server->body = patternBytes(2500);
    cfg.concurrency = 2;
    cfg.mergeAfter = true;

    DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
    REQUIRE(controller.run().ok());

    CHECK(server->headRequests == 1);
    CHECK(readFile(dir.file("data.bin")) == server->body);
    CHECK_FALSE(fs::exists(statePath()));

    auto log = server->requestLog();
    std::sort(log.begin(), log.end());
    REQUIRE(log.size() == 3);
    CHECK(log[0] == std::make_pair<std::int64_t, std::int64_t>(0, 999));
    CHECK(log[1] == std::make_pair<std::int64_t, std::int64_t>(1000, 1999));
    CHECK(log[2] == std::make_pair<std::int64_t, std::int64_t>(2000, 2499));

    CHECK(controller.stats().transferred == 3);
    CHECK_THAT(logOut.str(), Catch::Contains("[3/3] chunk"));
}

TEST_CASE_METHOD(DownloadFixture, "Merging works in a directory with glob characters", "[scheduler]") {
    server->body = patternBytes(2500);
    cfg.totalSize = 2500;
    cfg.outputDir = dir.file("out[1]*");
    cfg.mergeAfter = true;
    // A sibling the unescaped pattern would also pick up
    fs::create_directories(dir.file("out1x"));
    writeFile(dir.file("out1x/data.bin.000000.part"), "stray");

    DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
    REQUIRE(controller.run().ok());

    const std::string outDir = cfg.outputDir;
    CHECK(readFile((fs::path(outDir) / "data.bin").string()) == server->body);
    CHECK_FALSE(fs::exists(dir.file("out1x/data.bin")));
}

TEST_CASE_METHOD(DownloadFixture, "Resume skips complete chunks and continues partial ones", "[scheduler]") {
    server->body = patternBytes(2500);
    cfg.totalSize = 2500;
    cfg.skipHead = true;
    cfg.mergeAfter = true;

    {
        Error err;
        auto previous = TransferState::create(kUrl, 2500, 1000, "data.bin", dir.path(), err);
        REQUIRE(previous != nullptr);
        REQUIRE(previous->save().ok());
    }
    // Chunk 0 finished but its completion was never recorded; chunk 1 is 300 bytes in
    writeFile(part(0), server->body.substr(0, 1000));
    writeFile(tmp(1), server->body.substr(1000, 300));

    DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
    REQUIRE(controller.run().ok());

    CHECK(server->headRequests == 0);
    auto log = server->requestLog();
    REQUIRE(log.size() == 2);
    CHECK(log[0] == std::make_pair<std::int64_t, std::int64_t>(1300, 1999));
    CHECK(log[1] == std::make_pair<std::int64_t, std::int64_t>(2000, 2499));

    CHECK(controller.stats().skipped == 1);
    CHECK(controller.stats().transferred == 2);
    CHECK(readFile(dir.file("data.bin")) == server->body);
    CHECK_THAT(logOut.str(), Catch::Contains("chunk 0 already on disk"));
}

TEST_CASE_METHOD(DownloadFixture, "Chunks recorded as complete make no requests", "[scheduler]") {
    server->body = patternBytes(2500);
    cfg.totalSize = 2500;

    {
        Error err;
        auto previous = TransferState::create(kUrl, 2500, 1000, "data.bin", dir.path(), err);
        REQUIRE(previous != nullptr);
        previous->markTransferComplete(0, 1000);
        previous->markTransferComplete(2, 500);
        REQUIRE(previous->save().ok());
    }
    writeFile(part(0), server->body.substr(0, 1000));
    writeFile(part(2), server->body.substr(2000));

    DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
    REQUIRE(controller.run().ok());

    auto log = server->requestLog();
    REQUIRE(log.size() == 1);
    CHECK(log[0].first == 1000);
    CHECK(readFile(part(1)) == server->body.substr(1000, 1000));
}

TEST_CASE_METHOD(DownloadFixture, "Interrupted bodies resume from the bytes already written", "[scheduler]") {
    server->body = patternBytes(2000);
    server->truncateAfter = 600;
    cfg.totalSize = 2000;

    DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
    REQUIRE(controller.run().ok());

    CHECK(requestsStartingAt(600) == 1);
    CHECK(requestsStartingAt(1600) == 1);
    CHECK(readFile(part(0)) == server->body.substr(0, 1000));
    CHECK(readFile(part(1)) == server->body.substr(1000, 1000));
    CHECK_FALSE(fs::exists(tmp(0)));
}

TEST_CASE_METHOD(DownloadFixture, "Transient failures are retried", "[scheduler]") {
    server->body = patternBytes(2000);
    server->failures[1000] = 2;
    cfg.totalSize = 2000;

    DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
    REQUIRE(controller.run().ok());

    CHECK(requestsStartingAt(1000) == 3);
    CHECK(readFile(part(1)) == server->body.substr(1000));
}

TEST_CASE_METHOD(DownloadFixture, "No more chunks are fetched at once than the job count", "[scheduler]") {
    server->body = patternBytes(6000);
    server->rangeDelay = std::chrono::milliseconds(30);
    cfg.totalSize = 6000;
    cfg.concurrency = 2;

    DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
    REQUIRE(controller.run().ok());

    CHECK(server->requestCount() == 6);
    CHECK(server->peakInFlight.load() <= 2);
    CHECK(server->peakInFlight.load() == 2);
    CHECK(server->inFlight.load() == 0);
}

TEST_CASE_METHOD(DownloadFixture, "A chunk out of retries aborts the run and keeps its peers", "[scheduler]") {
    server->body = patternBytes(4000);
    server->failures[2000] = -1;
    server->delays[2000] = std::chrono::milliseconds(100);
    cfg.totalSize = 4000;
    cfg.concurrency = 4;
    cfg.maxRetries = 1;

    DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
    Error err = controller.run();

    CHECK(err.code == ErrorCode::ChunkFailed);
    CHECK_THAT(err.message, Catch::Contains("chunk 2"));
    CHECK(requestsStartingAt(2000) == 2);

    CHECK(fs::exists(part(0)));
    CHECK(fs::exists(part(1)));
    CHECK(fs::exists(part(3)));
    CHECK_FALSE(fs::exists(part(2)));

    REQUIRE(fs::exists(statePath()));
    Error loadErr;
    auto saved = TransferState::load("data.bin", dir.path(), loadErr);
    REQUIRE(saved != nullptr);
    CHECK(saved->completedCount() == 3);
    CHECK_FALSE(saved->chunk(2).transferComplete);
}

TEST_CASE_METHOD(DownloadFixture, "Stopping the run keeps resumable state", "[scheduler]") {
    server->body = patternBytes(2000);
    server->hangs.insert(0);
    cfg.totalSize = 2000;

    DownloadController controller(cfg, logger, nullptr, fakeFactory(server));

    Error err;
    std::thread runner([&]() { err = controller.run(); });
    waitForRequests(1);
    controller.stop();
    runner.join();

    CHECK(err.code == ErrorCode::Cancelled);
    CHECK(requestsStartingAt(1000) == 0);
    CHECK_FALSE(fs::exists(part(0)));
    CHECK(fs::exists(statePath()));
}

TEST_CASE_METHOD(DownloadFixture, "An external stop flag cancels the run", "[scheduler]") {
    server->body = patternBytes(2000);
    server->hangs.insert(0);
    cfg.totalSize = 2000;

    volatile std::sig_atomic_t flag = 0;
    DownloadController controller(cfg, logger, &flag, fakeFactory(server));

    Error err;
    std::thread runner([&]() { err = controller.run(); });
    waitForRequests(1);
    flag = 1;
    runner.join();

    CHECK(err.code == ErrorCode::Cancelled);
    CHECK(err.message == "interrupted");
    CHECK(fs::exists(statePath()));
}

TEST_CASE_METHOD(DownloadFixture, "A saved state for another resource is refused", "[scheduler]") {
    server->body = patternBytes(3000);
    cfg.totalSize = 3000;

    {
        Error err;
        auto previous = TransferState::create(kUrl, 2500, 1000, "data.bin", dir.path(), err);
        REQUIRE(previous != nullptr);
        previous->markTransferComplete(0, 1000);
        REQUIRE(previous->save().ok());
    }
    writeFile(part(0), std::string(1000, 'z'));

    SECTION("without force") {
        DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
        Error err = controller.run();
        CHECK(err.code == ErrorCode::StateMismatch);
        CHECK(server->requestCount() == 0);
        CHECK(readFile(part(0)) == std::string(1000, 'z'));
    }

    SECTION("with force") {
        cfg.forceRestart = true;
        cfg.mergeAfter = true;
        DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
        REQUIRE(controller.run().ok());
        CHECK(server->requestCount() == 3);
        CHECK(readFile(dir.file("data.bin")) == server->body);
    }
}

TEST_CASE_METHOD(DownloadFixture, "Size probing failures stop before any state exists", "[scheduler]") {
    server->body = patternBytes(100);

    SECTION("HEAD without a length") {
        server->headReportsLength = false;
        DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
        CHECK(controller.run().code == ErrorCode::Transfer);
    }

    SECTION("HEAD with an error status") {
        server->headStatus = 404;
        DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
        CHECK(controller.run().code == ErrorCode::Transfer);
    }

    SECTION("no HEAD and no size") {
        cfg.skipHead = true;
        DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
        CHECK(controller.run().code == ErrorCode::Usage);
        CHECK(server->headRequests == 0);
    }

    CHECK_FALSE(fs::exists(statePath()));
    CHECK(server->requestCount() == 0);
}

TEST_CASE_METHOD(DownloadFixture, "Failed hooks keep the state and rerun on resume", "[scheduler][hooks]") {
    server->body = patternBytes(2500);
    cfg.totalSize = 2500;
    cfg.hookCommand = "exit 1";

    {
        DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
        REQUIRE(controller.run().ok());
        CHECK(controller.stats().hooksFailed == 3);
    }

    REQUIRE(fs::exists(statePath()));
    {
        Error err;
        auto saved = TransferState::load("data.bin", dir.path(), err);
        REQUIRE(saved != nullptr);
        CHECK(saved->allTransfersComplete());
        CHECK(saved->pendingHooks().size() == 3);
    }

    const std::size_t requestsBefore = server->requestCount();
    cfg.hookCommand = "touch " + dir.path() + "/hook-{idx}";
    {
        DownloadController controller(cfg, logger, nullptr, fakeFactory(server));
        REQUIRE(controller.run().ok());
        CHECK(controller.stats().hooksSucceeded == 3);
    }

    CHECK(server->requestCount() == requestsBefore);
    CHECK(fs::exists(dir.file("hook-0")));
    CHECK(fs::exists(dir.file("hook-2")));
    CHECK_FALSE(fs::exists(statePath()));
}
