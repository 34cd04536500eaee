// Tests for arbitration, optimistic concurrency and revision accounting.
#include "sync/playback_state.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

using Transfer = PlaybackState::Transfer;
using PositionUpdate = PlaybackState::PositionUpdate;

TEST(PlaybackStateTest, StartsOnLocalAtRevisionZero) {
    PlaybackState state("local", fromMillis(0));

    EXPECT_EQ(state.activeDevice(), "local");
    EXPECT_EQ(state.revision(), 0u);
    EXPECT_FALSE(state.frame(fromMillis(0)).snapshot.trackId);
}

TEST(PlaybackStateTest, MaterialReportsBumpRevisionDriftDoesNot) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackState state("local", t0);

    EXPECT_TRUE(state.applyEngineReport(playingReport("t1", 0), t0));
    EXPECT_EQ(state.revision(), 1u);

    // Regular ticks
    for (int i = 1; i <= 10; ++i) {
        EXPECT_FALSE(state.applyEngineReport(playingReport("t1", i * 200 + 30), t0 + i * 200ms));
    }
    EXPECT_EQ(state.revision(), 1u);
    // The snapshot still follows the latest report
    EXPECT_EQ(state.frame(t0 + 2000ms).snapshot.positionMs, 2030);

    // Seek
    EXPECT_TRUE(state.applyEngineReport(playingReport("t1", 90000), t0 + 2200ms));
    EXPECT_EQ(state.revision(), 2u);

    // Track change
    EXPECT_TRUE(state.applyEngineReport(playingReport("t2", 0), t0 + 2400ms));
    EXPECT_EQ(state.revision(), 3u);
}

TEST(PlaybackStateTest, TransferFreezesPositionAndBumpsRevision) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackState state("local", t0);
    state.applyEngineReport(playingReport("t1", 50000), t0);

    Transfer transfer = state.transfer("web:abc", state.revision(), t0 + 1200ms);

    EXPECT_EQ(transfer.outcome, Transfer::Outcome::APPLIED);
    EXPECT_EQ(transfer.revision, 2u);
    EXPECT_EQ(transfer.previousDevice, "local");
    EXPECT_EQ(transfer.activeDevice, "web:abc");
    EXPECT_EQ(transfer.handoffPositionMs, 51200);
    EXPECT_TRUE(transfer.wasPlaying);

    StateFrame frame = state.frame(t0 + 1200ms);
    EXPECT_EQ(frame.activeDevice, "web:abc");
    EXPECT_EQ(frame.revision, 2u);
    EXPECT_EQ(frame.snapshot.positionMs, 51200);
    EXPECT_EQ(frame.snapshot.takenAt, t0 + 1200ms);
}

TEST(PlaybackStateTest, StaleTransferIsRejectedWithoutChange) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackState state("local", t0);
    state.applyEngineReport(playingReport("t1", 0), t0);
    ASSERT_EQ(state.transfer("web:a", std::nullopt, t0).outcome, Transfer::Outcome::APPLIED);

    Transfer transfer = state.transfer("web:b", 1, t0);

    EXPECT_EQ(transfer.outcome, Transfer::Outcome::CONFLICT);
    EXPECT_EQ(transfer.revision, 2u);
    EXPECT_EQ(transfer.activeDevice, "web:a");
    EXPECT_EQ(state.activeDevice(), "web:a");
    EXPECT_EQ(state.revision(), 2u);
}

TEST(PlaybackStateTest, TransferWithoutOrWithZeroRevisionIsUnconditional) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackState state("local", t0);
    state.applyEngineReport(playingReport("t1", 0), t0);

    EXPECT_EQ(state.transfer("web:a", std::nullopt, t0).outcome, Transfer::Outcome::APPLIED);
    EXPECT_EQ(state.transfer("web:b", 0, t0).outcome, Transfer::Outcome::APPLIED);
    EXPECT_EQ(state.activeDevice(), "web:b");
    EXPECT_EQ(state.revision(), 3u);
}

TEST(PlaybackStateTest, ConcurrentTransfersHaveOneWinner) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackState state("local", t0);
    state.applyEngineReport(playingReport("t1", 0), t0);
    Revision const seen = state.revision();

    constexpr int contenders = 16;
    std::atomic_int applied(0);
    std::vector<std::string> winners(contenders);
    std::vector<std::thread> threads;
    for (int i = 0; i < contenders; ++i) {
        threads.emplace_back([&, i]() {
            std::string device = "web:" + std::to_string(i);
            if (state.transfer(device, seen, t0).outcome == Transfer::Outcome::APPLIED) {
                ++applied;
                winners[i] = device;
            }
        });
    }
    for (std::thread & thread : threads) thread.join();

    EXPECT_EQ(applied.load(), 1);
    EXPECT_EQ(state.revision(), seen + 1);
    int matching = 0;
    for (std::string const & winner : winners) {
        if (!winner.empty()) {
            EXPECT_EQ(winner, state.activeDevice());
            ++matching;
        }
    }
    EXPECT_EQ(matching, 1);
}

TEST(PlaybackStateTest, OnlyTheActiveDeviceMayReportPosition) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackState state("local", t0);
    state.applyEngineReport(playingReport("t1", 50000), t0);
    state.transfer("web:abc", std::nullopt, t0);
    Revision const revision = state.revision();

    PositionUpdate update = state.applyRemotePosition("local", 99999, std::nullopt, t0 + 1s);
    EXPECT_EQ(update.outcome, PositionUpdate::Outcome::NOT_ACTIVE);
    EXPECT_EQ(update.activeDevice, "web:abc");

    update = state.applyRemotePosition("web:other", 99999, revision, t0 + 1s);
    EXPECT_EQ(update.outcome, PositionUpdate::Outcome::NOT_ACTIVE);

    EXPECT_EQ(state.frame(t0 + 1s).snapshot.positionMs, 50000);
    EXPECT_EQ(state.revision(), revision);
}

TEST(PlaybackStateTest, AcceptedPositionDoesNotBumpRevision) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackState state("local", t0);
    state.applyEngineReport(playingReport("t1", 50000), t0);
    state.transfer("web:abc", std::nullopt, t0);
    Revision const revision = state.revision();

    PositionUpdate update = state.applyRemotePosition("web:abc", 51200, revision, t0 + 1s);

    EXPECT_EQ(update.outcome, PositionUpdate::Outcome::ACCEPTED);
    EXPECT_EQ(update.revision, revision);
    StateFrame frame = state.frame(t0 + 1s);
    EXPECT_EQ(frame.revision, revision);
    EXPECT_EQ(frame.snapshot.positionMs, 51200);
    EXPECT_EQ(frame.snapshot.takenAt, t0 + 1s);
}

TEST(PlaybackStateTest, PositionWithStaleRevisionConflicts) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackState state("local", t0);
    state.transfer("web:abc", std::nullopt, t0);
    Revision const revision = state.revision();

    PositionUpdate update = state.applyRemotePosition("web:abc", 5000, revision + 1, t0);
    EXPECT_EQ(update.outcome, PositionUpdate::Outcome::CONFLICT);
    EXPECT_EQ(update.revision, revision);

    // Unlike transfers, a zero revision is compared like any other
    update = state.applyRemotePosition("web:abc", 5000, 0, t0);
    EXPECT_EQ(update.outcome, PositionUpdate::Outcome::CONFLICT);
}

TEST(PlaybackStateTest, ReleasingTheActiveDeviceReturnsToLocal) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackState state("local", t0);
    state.applyEngineReport(playingReport("t1", 50000), t0);
    state.transfer("web:abc", std::nullopt, t0);
    Revision const revision = state.revision();

    std::optional<int64_t> handoff = state.releaseDevice("web:abc", t0 + 3s);

    ASSERT_TRUE(handoff);
    EXPECT_EQ(*handoff, 53000);
    EXPECT_EQ(state.activeDevice(), "local");
    EXPECT_EQ(state.revision(), revision + 1);
}

TEST(PlaybackStateTest, ReleasingAnInactiveDeviceChangesNothing) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackState state("local", t0);
    state.transfer("web:abc", std::nullopt, t0);
    Revision const revision = state.revision();

    EXPECT_FALSE(state.releaseDevice("web:other", t0));
    EXPECT_FALSE(state.releaseDevice("local", t0));
    EXPECT_EQ(state.activeDevice(), "web:abc");
    EXPECT_EQ(state.revision(), revision);
}

TEST(PlaybackStateTest, SameRevisionMeansSameMaterialState) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackState state("local", t0);

    std::atomic_bool done(false);
    std::thread writer([&]() {
        for (int i = 0; i < 2000; ++i) {
            EngineReport report;
            report.trackId = "t" + std::to_string(i / 10);
            report.queue = {*report.trackId};
            state.applyEngineReport(report, t0);
            if (i % 100 == 50) state.transfer(i % 200 == 50 ? "web:a" : "local", std::nullopt, t0);
        }
        done = true;
    });

    std::map<Revision, std::pair<std::string, std::string>> seen; // Revision -> track, device
    while (!done) {
        StateFrame frame = state.frame(t0);
        auto entry = std::make_pair(frame.snapshot.trackId.value_or(""), frame.activeDevice);
        auto [iter, inserted] = seen.emplace(frame.revision, entry);
        if (!inserted) {
            EXPECT_EQ(iter->second, entry) << "at revision " << frame.revision;
        }
    }
    writer.join();
}

TEST(PlaybackStateTest, StoppedReportEndsExtrapolation) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackState state("local", t0);
    state.applyEngineReport(playingReport("t1", 199000), t0);
    Revision const revision = state.revision();

    EXPECT_TRUE(state.applyEngineReport(EngineReport::stopped({"t1"}, false, RepeatMode::OFF),
                                        t0 + 1s));

    StateFrame frame = state.frame(t0 + 1h);
    EXPECT_EQ(frame.revision, revision + 1);
    EXPECT_FALSE(frame.snapshot.trackId);
    EXPECT_FALSE(frame.snapshot.isPlaying);
    EXPECT_EQ(frame.snapshot.effectivePosition(t0 + 1h), 0);

    // Staying stopped is not a change
    EXPECT_FALSE(state.applyEngineReport(EngineReport::stopped({"t1"}, false, RepeatMode::OFF),
                                         t0 + 2s));
}
