#include <catch2/catch.hpp>

#include "core/ChunkPlan.h"

#include <limits>

TEST_CASE("Chunk plan splits the resource into contiguous ranges", "[plan]") {
    std::vector<ChunkRange> ranges;

    SECTION("short last chunk") {
        REQUIRE(planChunks(2500, 1000, ranges).ok());
        REQUIRE(ranges.size() == 3);
        CHECK(ranges[0].start == 0);
        CHECK(ranges[0].end == 999);
        CHECK(ranges[1].start == 1000);
        CHECK(ranges[1].end == 1999);
        CHECK(ranges[2].start == 2000);
        CHECK(ranges[2].end == 2499);
    }

    SECTION("exact multiple") {
        REQUIRE(planChunks(3000, 1000, ranges).ok());
        REQUIRE(ranges.size() == 3);
        CHECK(ranges.back().end == 2999);
    }

    SECTION("chunk larger than the resource") {
        REQUIRE(planChunks(10, 1000, ranges).ok());
        REQUIRE(ranges.size() == 1);
        CHECK(ranges[0].start == 0);
        CHECK(ranges[0].end == 9);
    }

    SECTION("single byte chunks") {
        REQUIRE(planChunks(5, 1, ranges).ok());
        REQUIRE(ranges.size() == 5);
        for (std::size_t i = 0; i < ranges.size(); ++i) {
            CHECK(ranges[i].start == static_cast<std::int64_t>(i));
            CHECK(ranges[i].end == static_cast<std::int64_t>(i));
        }
    }
}

TEST_CASE("Chunk plan covers every byte exactly once", "[plan]") {
    const std::int64_t total = GENERATE(1, 999, 1000, 1001, 123457);
    const std::int64_t chunk = GENERATE(1, 7, 1000, 4096);

    std::vector<ChunkRange> ranges;
    REQUIRE(planChunks(total, chunk, ranges).ok());
    REQUIRE(static_cast<std::int64_t>(ranges.size()) == chunkCount(total, chunk));

    std::int64_t expectedStart = 0;
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        CHECK(ranges[i].start == expectedStart);
        const std::int64_t len = ranges[i].end - ranges[i].start + 1;
        if (i + 1 < ranges.size())
            CHECK(len == chunk);
        else
            CHECK((len > 0 && len <= chunk));
        expectedStart = ranges[i].end + 1;
    }
    CHECK(expectedStart == total);
}

TEST_CASE("Chunk plan rejects non-positive sizes", "[plan]") {
    std::vector<ChunkRange> ranges{ { 0, 1 } };

    Error err = planChunks(0, 1000, ranges);
    CHECK(err.code == ErrorCode::Planning);
    CHECK(ranges.empty());

    CHECK(planChunks(-5, 1000, ranges).code == ErrorCode::Planning);
    CHECK(planChunks(1000, 0, ranges).code == ErrorCode::Planning);
    CHECK(planChunks(1000, -1, ranges).code == ErrorCode::Planning);

    CHECK(chunkCount(0, 10) == 0);
    CHECK(chunkCount(10, 0) == 0);
}

TEST_CASE("Chunk plan keeps indices within six digits", "[plan]") {
    std::vector<ChunkRange> ranges;

    REQUIRE(planChunks(kMaxChunkCount, 1, ranges).ok());
    CHECK(static_cast<std::int64_t>(ranges.size()) == kMaxChunkCount);

    Error err = planChunks(kMaxChunkCount + 1, 1, ranges);
    CHECK(err.code == ErrorCode::Planning);
    CHECK(ranges.empty());
}

TEST_CASE("Chunk count does not overflow near the size limit", "[plan]") {
    const std::int64_t maxSize = std::numeric_limits<std::int64_t>::max();
    CHECK(chunkCount(maxSize, maxSize) == 1);
    CHECK(chunkCount(maxSize, maxSize - 1) == 2);

    std::vector<ChunkRange> ranges;
    REQUIRE(planChunks(maxSize, maxSize / 2 + 1, ranges).ok());
    REQUIRE(ranges.size() == 2);
    CHECK(ranges[1].end == maxSize - 1);

    CHECK(planChunks(maxSize, 1, ranges).code == ErrorCode::Planning);
}
