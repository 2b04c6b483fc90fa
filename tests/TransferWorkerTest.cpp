#include <catch2/catch.hpp>

#include "core/TransferWorker.hpp"
#include "FakeHttpClient.hpp"
#include "TestHelpers.hpp"

namespace
{
    const std::string URL = "http://example.com/data.bin";

    Segment segmentFor(int id, ByteOffset start, ByteOffset end)
    {
        Segment segment;
        segment.id = id;
        segment.start = start;
        segment.end = end;
        return segment;
    }
}

TEST_CASE("TransferWorker fetches a whole segment", "[worker]")
{
    TempDir dir;
    std::string body = makeBody(1000);
    FakeHttpClient client(body);
    ProgressLedger ledger;
    CancellationToken cancel;
    ledger.reset({2}, nullptr);

    TransferWorker worker(client, ledger, cancel, URL, dir.file("seg2"), 1000, false);
    SegmentResult result = worker.run(segmentFor(2, 251, 500), 251, 500, 0);

    CHECK(result.isComplete());
    CHECK(result.reason.empty());
    CHECK(readFile(dir.file("seg2")) == body.substr(251, 250));
    CHECK(ledger.getState(2) == SegmentState::COMPLETE);
    CHECK(ledger.getPosition(2) == 250);
    CHECK(ledger.getOutstanding() == 0);
}

TEST_CASE("TransferWorker marks a failed transfer incomplete", "[worker]")
{
    TempDir dir;
    std::string body = makeBody(1000);
    FakeHttpClient client(body);
    client.failingStarts = {501};
    ProgressLedger ledger;
    CancellationToken cancel;
    ledger.reset({3}, nullptr);

    TransferWorker worker(client, ledger, cancel, URL, dir.file("seg3"), 1000, false);
    SegmentResult result = worker.run(segmentFor(3, 501, 750), 501, 750, 0);

    CHECK_FALSE(result.isComplete());
    CHECK_FALSE(result.reason.empty());
    CHECK(ledger.getState(3) == SegmentState::INCOMPLETE);
    CHECK(ledger.getPosition(3) == 100);
    CHECK(readFile(dir.file("seg3")) == body.substr(501, 100));
}

TEST_CASE("TransferWorker stops when cancelled", "[worker]")
{
    TempDir dir;
    FakeHttpClient client(makeBody(1000));
    ProgressLedger ledger;
    CancellationToken cancel;
    ledger.reset({1}, nullptr);
    cancel.requestCancel();

    TransferWorker worker(client, ledger, cancel, URL, dir.file("seg1"), 1000, false);
    SegmentResult result = worker.run(segmentFor(1, 0, 250), 0, 250, 0);

    CHECK_FALSE(result.isComplete());
    CHECK(result.reason.find("interrupted") != std::string::npos);
    CHECK(ledger.getPosition(1) == static_cast<ByteOffset>(client.chunkSize));
}

TEST_CASE("TransferWorker appends when resuming", "[worker]")
{
    TempDir dir;
    std::string body = makeBody(1000);
    FakeHttpClient client(body);
    ProgressLedger ledger;
    CancellationToken cancel;
    ledger.reset({1}, nullptr);

    writeFile(dir.file("seg1"), body.substr(0, 100));

    Segment segment = segmentFor(1, 100, 250);
    segment.lastOffset = 100;
    TransferWorker worker(client, ledger, cancel, URL, dir.file("seg1"), 1000, true);
    SegmentResult result = worker.run(segment, 100, 250, 100);

    CHECK(result.isComplete());
    CHECK(readFile(dir.file("seg1")) == body.substr(0, 251));
    CHECK(ledger.getPosition(1) == 151);
}

TEST_CASE("TransferWorker does not complete a segment whose bytes never reach the disk", "[worker]")
{
    FakeHttpClient client(makeBody(1000));
    ProgressLedger ledger;
    CancellationToken cancel;
    ledger.reset({1}, nullptr);

    // Every write to /dev/full fails once the buffer is flushed
    TransferWorker worker(client, ledger, cancel, URL, "/dev/full", 1000, false);
    SegmentResult result = worker.run(segmentFor(1, 0, 250), 0, 250, 0);

    CHECK_FALSE(result.isComplete());
    CHECK(result.reason.find("failed writing") != std::string::npos);
    CHECK(ledger.getState(1) == SegmentState::INCOMPLETE);
}

TEST_CASE("TransferWorker keeps only the requested bytes when the server ignores the range", "[worker]")
{
    TempDir dir;
    std::string body = makeBody(1000);
    FakeHttpClient client(body);
    client.ignoresRanges = true;
    ProgressLedger ledger;
    CancellationToken cancel;
    ledger.reset({1}, nullptr);

    TransferWorker worker(client, ledger, cancel, URL, dir.file("seg1"), 1000, false);
    SegmentResult result = worker.run(segmentFor(1, 0, 250), 0, 250, 0);

    CHECK(result.isComplete());
    CHECK(readFile(dir.file("seg1")) == body.substr(0, 251));
    CHECK(ledger.getPosition(1) == 251);
}

TEST_CASE("TransferWorker completes an empty range without fetching", "[worker]")
{
    TempDir dir;
    FakeHttpClient client(makeBody(1000));
    ProgressLedger ledger;
    CancellationToken cancel;
    ledger.reset({4}, nullptr);

    TransferWorker worker(client, ledger, cancel, URL, dir.file("seg4"), 1000, true);
    SegmentResult result = worker.run(segmentFor(4, 1000, 1000), 1000, 1000, 1000);

    CHECK(result.isComplete());
    CHECK(client.fetches().empty());
}

TEST_CASE("TransferWorker clamps the expected size to the resource", "[worker]")
{
    CHECK(TransferWorker::expectedBytes(751, 1000, 1000) == 249);
    CHECK(TransferWorker::expectedBytes(0, 250, 1000) == 251);
    CHECK(TransferWorker::expectedBytes(1000, 1000, 1000) == 0);
    CHECK(TransferWorker::expectedBytes(751, 1000, 1003) == 250);
}
