#include <catch2/catch.hpp>

#include "core/RangePlanner.hpp"
#include "core/DownloadError.hpp"

TEST_CASE("RangePlanner splits 1000 bytes into four inclusive ranges", "[planner]")
{
    RangePlanner planner(1000, 4);
    auto segments = planner.plan();

    REQUIRE(planner.getPartitionSize() == 250);
    REQUIRE(segments.size() == 4);

    CHECK(segments[0].id == 1);
    CHECK(segments[0].start == 0);
    CHECK(segments[0].end == 250);
    CHECK(segments[1].start == 251);
    CHECK(segments[1].end == 500);
    CHECK(segments[2].start == 501);
    CHECK(segments[2].end == 750);
    CHECK(segments[3].id == 4);
    CHECK(segments[3].start == 751);
    CHECK(segments[3].end == 1000);

    for (const auto &segment : segments)
    {
        CHECK(segment.lastOffset == 0);
        CHECK(segment.state == SegmentState::PENDING);
    }
}

TEST_CASE("RangePlanner drops the truncated remainder", "[planner]")
{
    RangePlanner planner(1003, 4);
    auto segments = planner.plan();

    REQUIRE(planner.getPartitionSize() == 250);
    CHECK(segments.back().end == 1000);
}

TEST_CASE("RangePlanner ranges are ordered and never overlap", "[planner]")
{
    for (ByteOffset totalSize = 1; totalSize <= 300; ++totalSize)
    {
        for (int count = 1; count <= 12 && count <= totalSize; ++count)
        {
            RangePlanner planner(totalSize, count);
            auto segments = planner.plan();
            ByteOffset partition = totalSize / count;

            REQUIRE(segments.size() == static_cast<size_t>(count));
            CHECK(segments.front().start == 0);

            for (size_t k = 0; k < segments.size(); ++k)
            {
                CHECK(segments[k].id == static_cast<int>(k + 1));
                CHECK(segments[k].end == static_cast<ByteOffset>(k + 1) * partition);
                CHECK(segments[k].start <= segments[k].end);

                if (k > 0)
                {
                    CHECK(segments[k].start > segments[k - 1].start);
                    CHECK(segments[k].start == segments[k - 1].end + 1);
                }
            }
        }
    }
}

TEST_CASE("RangePlanner rejects unusable configurations", "[planner]")
{
    auto kindOf = [](ByteOffset totalSize, int count)
    {
        try
        {
            RangePlanner planner(totalSize, count);
        }
        catch (const DownloadError &e)
        {
            return e.getKind();
        }
        FAIL("no DownloadError thrown");
        return ErrorKind::NETWORK;
    };

    SECTION("Zero segments")
    {
        CHECK(kindOf(1000, 0) == ErrorKind::INVALID_CONFIGURATION);
    }

    SECTION("Negative segments")
    {
        CHECK(kindOf(1000, -3) == ErrorKind::INVALID_CONFIGURATION);
    }

    SECTION("Unknown size")
    {
        CHECK(kindOf(-1, 4) == ErrorKind::INVALID_CONFIGURATION);
        CHECK(kindOf(0, 4) == ErrorKind::INVALID_CONFIGURATION);
    }

    SECTION("More segments than bytes")
    {
        CHECK(kindOf(3, 4) == ErrorKind::INVALID_CONFIGURATION);
    }
}

TEST_CASE("RangePlanner exposes planned bounds per segment", "[planner]")
{
    RangePlanner planner(1000, 4);

    CHECK(planner.plannedStart(1) == 0);
    CHECK(planner.plannedStart(3) == 501);
    CHECK(planner.plannedEnd(3) == 750);
}
