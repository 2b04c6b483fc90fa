#include <catch2/catch.hpp>

#include <atomic>
#include <thread>
#include <vector>

#include "core/ProgressLedger.hpp"

TEST_CASE("ProgressLedger counts each terminal segment once", "[ledger]")
{
    ProgressLedger ledger;
    int flushes = 0;
    ledger.reset({1, 2, 3}, [&flushes](const LedgerSnapshot &)
                 { ++flushes; });

    REQUIRE(ledger.getOutstanding() == 3);

    CHECK(ledger.reportTerminal(2, SegmentState::COMPLETE));
    CHECK_FALSE(ledger.reportTerminal(2, SegmentState::COMPLETE));
    CHECK_FALSE(ledger.reportTerminal(2, SegmentState::COMPLETE));
    CHECK(ledger.getOutstanding() == 2);
    CHECK(flushes == 0);

    SECTION("The first terminal state wins")
    {
        CHECK_FALSE(ledger.reportTerminal(2, SegmentState::INCOMPLETE));
        CHECK(ledger.getState(2) == SegmentState::COMPLETE);
        CHECK(ledger.getOutstanding() == 2);
    }

    SECTION("The last report flushes exactly once")
    {
        CHECK(ledger.reportTerminal(1, SegmentState::INCOMPLETE));
        CHECK(flushes == 0);
        CHECK(ledger.reportTerminal(3, SegmentState::COMPLETE));
        CHECK(flushes == 1);

        CHECK_FALSE(ledger.reportTerminal(3, SegmentState::COMPLETE));
        CHECK_FALSE(ledger.reportTerminal(1, SegmentState::COMPLETE));
        CHECK(flushes == 1);
        CHECK(ledger.getOutstanding() == 0);
        CHECK_FALSE(ledger.allComplete());
    }
}

TEST_CASE("ProgressLedger hands the final state to the flush", "[ledger]")
{
    ProgressLedger ledger;
    LedgerSnapshot flushed;
    ledger.reset({1, 2}, [&flushed](const LedgerSnapshot &snapshot)
                 { flushed = snapshot; });

    ledger.reportProgress(1, 40);
    ledger.reportProgress(2, 250);
    ledger.reportTerminal(2, SegmentState::COMPLETE);
    ledger.reportProgress(1, 75);
    ledger.reportTerminal(1, SegmentState::INCOMPLETE);

    REQUIRE(flushed.states.size() == 2);
    CHECK(flushed.positions.at(1) == 75);
    CHECK(flushed.positions.at(2) == 250);
    CHECK(flushed.states.at(1) == SegmentState::INCOMPLETE);
    CHECK(flushed.states.at(2) == SegmentState::COMPLETE);
}

TEST_CASE("ProgressLedger ignores unknown ids and non-terminal states", "[ledger]")
{
    ProgressLedger ledger;
    ledger.reset({1}, nullptr);

    CHECK_FALSE(ledger.reportTerminal(7, SegmentState::COMPLETE));
    CHECK_FALSE(ledger.reportTerminal(1, SegmentState::IN_PROGRESS));
    CHECK(ledger.getOutstanding() == 1);

    ledger.reportProgress(7, 100);
    CHECK(ledger.getPosition(7) == 0);

    CHECK(ledger.getState(1) == SegmentState::PENDING);
    ledger.reportProgress(1, 10);
    CHECK(ledger.getState(1) == SegmentState::IN_PROGRESS);
    CHECK(ledger.getPosition(1) == 10);
}

TEST_CASE("ProgressLedger reset starts a new attempt from zero", "[ledger]")
{
    ProgressLedger ledger;
    ledger.reset({1, 2}, nullptr);
    ledger.reportProgress(1, 99);
    ledger.reportTerminal(1, SegmentState::COMPLETE);

    ledger.reset({2}, nullptr);
    CHECK(ledger.getOutstanding() == 1);
    CHECK(ledger.getPosition(2) == 0);
    CHECK(ledger.getState(2) == SegmentState::PENDING);
    CHECK(ledger.snapshot().states.count(1) == 0);
}

TEST_CASE("ProgressLedger flushes once under concurrent reports", "[ledger]")
{
    const int segmentCount = 64;
    std::vector<int> ids;
    for (int id = 1; id <= segmentCount; ++id)
    {
        ids.push_back(id);
    }

    ProgressLedger ledger;
    std::atomic<int> flushes{0};
    ledger.reset(ids, [&flushes](const LedgerSnapshot &)
                 { ++flushes; });

    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back([&, t]()
                             {
                                 for (int round = 0; round < 3; ++round)
                                 {
                                     for (int id = 1; id <= segmentCount; ++id)
                                     {
                                         ledger.reportProgress(id, round * 10 + t);
                                         SegmentState state = (id + t) % 2 ? SegmentState::COMPLETE : SegmentState::INCOMPLETE;
                                         if (ledger.reportTerminal(id, state))
                                         {
                                             ++accepted;
                                         }
                                     }
                                 }
                             });
    }

    for (auto &thread : threads)
    {
        thread.join();
    }

    CHECK(flushes.load() == 1);
    CHECK(accepted.load() == segmentCount);
    CHECK(ledger.getOutstanding() == 0);
}
