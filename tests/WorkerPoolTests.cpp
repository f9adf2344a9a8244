#include <catch2/catch.hpp>

#include "TestHelpers.h"
#include "core/ChunkQueue.h"
#include "core/DownloadWorker.h"
#include "core/ThreadPool.h"
#include "monitor/Logger.h"
#include "monitor/ProgressTracker.h"

TEST_CASE("Chunk queue hands out indices in ascending order", "[queue]") {
    CancellationToken token;
    ChunkQueue queue({ 4, 1, 3, 0 }, token);

    CHECK(queue.total() == 4);
    CHECK(*queue.getNext() == 0);
    CHECK(*queue.getNext() == 1);
    CHECK(queue.dispatched() == 2);
    CHECK(*queue.getNext() == 3);
    CHECK(*queue.getNext() == 4);
    CHECK_FALSE(queue.getNext().has_value());
}

TEST_CASE("Chunk queue stops after cancellation", "[queue]") {
    CancellationToken token;
    ChunkQueue queue({ 0, 1, 2 }, token);

    CHECK(queue.getNext().has_value());
    token.cancel("stop");
    CHECK_FALSE(queue.getNext().has_value());
    CHECK(queue.dispatched() == 1);
}

TEST_CASE("Concurrent workers never receive the same chunk", "[queue]") {
    CancellationToken token;
    std::vector<int> indices(500);
    for (int i = 0; i < 500; ++i)
        indices[i] = i;
    ChunkQueue queue(indices, token);

    std::mutex mtx;
    std::vector<int> seen;
    ThreadPool pool;
    pool.start(8, [&]() {
        while (auto next = queue.getNext()) {
            std::lock_guard<std::mutex> lock(mtx);
            seen.push_back(*next);
        }
    });
    pool.join();

    std::sort(seen.begin(), seen.end());
    CHECK(seen == indices);
}

TEST_CASE("Cancellation keeps the first reason and wakes sleepers", "[cancel]") {
    CancellationToken token;
    CHECK_FALSE(token.isCancelled());
    CHECK_FALSE(token.waitFor(std::chrono::milliseconds(1)));

    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        token.cancel("timeout");
    });

    const auto begin = std::chrono::steady_clock::now();
    CHECK(token.waitFor(std::chrono::seconds(10)));
    CHECK(std::chrono::steady_clock::now() - begin < std::chrono::seconds(5));
    canceller.join();

    token.cancel("later");
    CHECK(token.reason() == "timeout");
}

TEST_CASE("Backoff doubles per attempt up to the cap", "[retry]") {
    RetryPolicy policy;
    CHECK(policy.delayFor(0) == std::chrono::milliseconds(1000));
    CHECK(policy.delayFor(1) == std::chrono::milliseconds(2000));
    CHECK(policy.delayFor(3) == std::chrono::milliseconds(8000));
    CHECK(policy.delayFor(6) == std::chrono::milliseconds(60000));
    CHECK(policy.delayFor(1000) == std::chrono::milliseconds(60000));

    policy.baseDelay = std::chrono::milliseconds(1);
    CHECK(policy.delayFor(2) == std::chrono::milliseconds(4));
}

TEST_CASE("Connection pool reuses released transports", "[pool]") {
    auto server = std::make_shared<FakeServer>();
    int created = 0;
    ConnectionPool pool([&]() {
        ++created;
        return std::make_unique<FakeTransport>(server);
    }, 1);

    {
        PooledConnection a(pool);
        PooledConnection b(pool);
        CHECK(static_cast<bool>(a));
        CHECK(static_cast<bool>(b));
    }
    CHECK(created == 2);
    // Only one fits back into the pool
    CHECK(pool.idle() == 1);

    {
        PooledConnection c(pool);
        CHECK(pool.idle() == 0);
    }
    CHECK(created == 2);
}

TEST_CASE("Progress excludes bytes already on disk from speed", "[progress]") {
    ProgressTracker tracker(0);
    tracker.reset(1000, 400);
    CHECK(tracker.downloaded() == 400);
    CHECK(tracker.progress() == Approx(0.4));

    tracker.add(100);
    CHECK(tracker.downloaded() == 500);
    CHECK(tracker.speedBytesPerSec() >= 0.0);

    CHECK(formatBytes(999) == "999 B");
    CHECK(formatBytes(1500) == "1.5 KB");
    CHECK(formatBytes(100000000) == "100.0 MB");
}

TEST_CASE("Logger filters by level and routes warnings to the error stream", "[logger]") {
    std::ostringstream out, err;
    Logger logger(out, err);

    logger.debug("hidden");
    logger.info("shown");
    logger.warn("careful");
    logger.error("broken");

    CHECK(out.str() == "shown\n");
    CHECK(err.str() == "[warn] careful\n[error] broken\n");

    logger.setLevel(LogLevel::Debug);
    logger.start();
    logger.debug("verbose");
    logger.stop();
    CHECK_THAT(out.str(), Catch::Contains("[debug] verbose"));
}
