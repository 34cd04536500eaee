// Tests for position extrapolation, the materiality rule and the state frame's wire shape.
#include "sync/playback_snapshot.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace {

PlaybackSnapshot playingAt(int64_t positionMs, Clock::time_point takenAt,
                           int64_t durationMs = 200000) {
    return PlaybackSnapshot::fromReport(playingReport("t1", positionMs, durationMs), takenAt);
}

}  // namespace

TEST(PlaybackSnapshotTest, PlayingPositionAdvancesWithTime) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackSnapshot snapshot = playingAt(10000, t0);

    EXPECT_EQ(snapshot.effectivePosition(t0), 10000);
    EXPECT_EQ(snapshot.effectivePosition(t0 + 2500ms), 12500);
}

TEST(PlaybackSnapshotTest, PausedPositionStaysPut) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackSnapshot snapshot = playingAt(10000, t0);
    snapshot.isPlaying = false;

    EXPECT_EQ(snapshot.effectivePosition(t0 + 2500ms), 10000);
    EXPECT_EQ(snapshot.effectivePosition(t0 + 1h), 10000);
}

TEST(PlaybackSnapshotTest, PlaybackRateScalesElapsedTime) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackSnapshot snapshot = playingAt(10000, t0);
    snapshot.playbackRate = 1.5;

    EXPECT_EQ(snapshot.effectivePosition(t0 + 2000ms), 13000);
}

TEST(PlaybackSnapshotTest, PositionIsClampedToDuration) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackSnapshot snapshot = playingAt(199000, t0);

    EXPECT_EQ(snapshot.effectivePosition(t0 + 5s), 200000);
}

TEST(PlaybackSnapshotTest, UnknownDurationIsNotClamped) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackSnapshot snapshot = playingAt(199000, t0, 0);

    EXPECT_EQ(snapshot.effectivePosition(t0 + 5s), 204000);
}

TEST(PlaybackSnapshotTest, ClockSteppingBackDoesNotRewind) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackSnapshot snapshot = playingAt(10000, t0);

    EXPECT_EQ(snapshot.effectivePosition(t0 - 3s), 10000);
}

TEST(PlaybackSnapshotTest, DriftWithinThresholdIsNotMaterial) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackSnapshot snapshot = playingAt(10000, t0);

    // 2s later the engine reports 2s further, give or take the threshold
    EXPECT_FALSE(snapshot.materiallyDiffers(playingReport("t1", 12000), t0 + 2s));
    EXPECT_FALSE(snapshot.materiallyDiffers(playingReport("t1", 13500), t0 + 2s));
    EXPECT_FALSE(snapshot.materiallyDiffers(playingReport("t1", 10500), t0 + 2s));
}

TEST(PlaybackSnapshotTest, JumpBeyondThresholdIsMaterial) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackSnapshot snapshot = playingAt(10000, t0);

    EXPECT_TRUE(snapshot.materiallyDiffers(playingReport("t1", 13501), t0 + 2s));
    EXPECT_TRUE(snapshot.materiallyDiffers(playingReport("t1", 10499), t0 + 2s));
    EXPECT_TRUE(snapshot.materiallyDiffers(playingReport("t1", 60000), t0 + 2s));
}

TEST(PlaybackSnapshotTest, EveryMaterialFieldCounts) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    PlaybackSnapshot const snapshot = playingAt(10000, t0);
    EngineReport const base = playingReport("t1", 10000);
    ASSERT_FALSE(snapshot.materiallyDiffers(base, t0));

    EngineReport report = base;
    report.trackId = "t2";
    EXPECT_TRUE(snapshot.materiallyDiffers(report, t0));

    report = base;
    report.trackId.reset();
    EXPECT_TRUE(snapshot.materiallyDiffers(report, t0));

    report = base;
    report.isPlaying = false;
    EXPECT_TRUE(snapshot.materiallyDiffers(report, t0));

    report = base;
    report.queue.push_back("t2");
    EXPECT_TRUE(snapshot.materiallyDiffers(report, t0));

    report = base;
    report.shuffle = true;
    EXPECT_TRUE(snapshot.materiallyDiffers(report, t0));

    report = base;
    report.repeat = RepeatMode::ONE;
    EXPECT_TRUE(snapshot.materiallyDiffers(report, t0));

    report = base;
    report.playbackRate = 2.0;
    EXPECT_TRUE(snapshot.materiallyDiffers(report, t0));

    report = base;
    report.durationMs = 180000;
    EXPECT_TRUE(snapshot.materiallyDiffers(report, t0));
}

TEST(PlaybackSnapshotTest, StateFrameWireShape) {
    Clock::time_point const t0 = fromMillis(1'000'000);
    EngineReport report = playingReport("t1", 10000);
    report.repeat = RepeatMode::ALL;
    StateFrame frame{PlaybackSnapshot::fromReport(report, t0), 7, "web:abc", t0 + 300ms};

    nlohmann::json json = frame;
    EXPECT_EQ(json["trackId"], "t1");
    EXPECT_EQ(json["isPlaying"], true);
    EXPECT_EQ(json["positionMs"], 10000);
    EXPECT_EQ(json["positionAgeMs"], 300);
    EXPECT_EQ(json["serverNowMs"], 1'000'300);
    EXPECT_EQ(json["totalDurationMs"], 200000);
    EXPECT_EQ(json["playbackSpeed"], 1.0);
    EXPECT_EQ(json["stateRevision"], 7);
    EXPECT_EQ(json["activeDevice"], "web:abc");
    EXPECT_EQ(json["shuffleEnabled"], false);
    EXPECT_EQ(json["repeatMode"], "all");
    EXPECT_EQ(json["queue"], nlohmann::json::array({"t1"}));
}

TEST(PlaybackSnapshotTest, NothingLoadedSerializesNullTrack) {
    StateFrame frame{PlaybackSnapshot{}, 0, "local", fromMillis(5000)};
    frame.snapshot.takenAt = fromMillis(6000); // Clock skew must not give a negative age

    nlohmann::json json = frame;
    EXPECT_TRUE(json["trackId"].is_null());
    EXPECT_EQ(json["positionAgeMs"], 0);
    EXPECT_EQ(json["repeatMode"], "off");
}
