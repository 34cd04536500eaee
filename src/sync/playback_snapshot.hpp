#ifndef SYNC_PLAYBACK_SNAPSHOT_HPP
#define SYNC_PLAYBACK_SNAPSHOT_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "clock.hpp"


using Revision = uint64_t;

enum class RepeatMode { OFF, ONE, ALL };

NLOHMANN_JSON_SERIALIZE_ENUM(RepeatMode, {
    {RepeatMode::OFF, "off"},
    {RepeatMode::ONE, "one"},
    {RepeatMode::ALL, "all"}
})


// What the playback engine tells us on each report
struct EngineReport {
    std::optional<std::string> trackId;
    bool isPlaying = false;
    int64_t positionMs = 0;
    int64_t durationMs = 0;
    std::vector<std::string> queue;
    bool shuffle = false;
    RepeatMode repeat = RepeatMode::OFF;
    double playbackRate = 1.0;

    // Nothing loaded any more (queue finished, or the track failed to load)
    static EngineReport stopped(std::vector<std::string> const & queue, bool shuffle,
                                RepeatMode repeat);
};


// The "now playing" state at one point in time. Never ticks by itself: the live position is
// derived from `positionMs` and `takenAt` on every read.
struct PlaybackSnapshot {
    // A reported position further than this from the extrapolated one is a seek
    static int64_t const seekThresholdMs;

    std::optional<std::string> trackId;
    bool isPlaying = false;
    int64_t positionMs = 0; // Position at the time the snapshot was taken
    Clock::time_point takenAt;
    int64_t durationMs = 0; // 0 means unknown (e.g. a live stream)
    std::vector<std::string> queue;
    bool shuffle = false;
    RepeatMode repeat = RepeatMode::OFF;
    double playbackRate = 1.0;

    int64_t effectivePosition(Clock::time_point now) const;
    bool materiallyDiffers(EngineReport const & report, Clock::time_point now) const;

    static PlaybackSnapshot fromReport(EngineReport const & report, Clock::time_point now);
};

// Serializes everything but the timestamp, which is rendered relative to "now" by the state frame
void to_json(nlohmann::json & json, PlaybackSnapshot const & snapshot);


// The single wire shape for the current state, shared by polling reads and pushed frames
struct StateFrame {
    PlaybackSnapshot snapshot;
    Revision revision = 0;
    std::string activeDevice;
    Clock::time_point renderedAt;
};

void to_json(nlohmann::json & json, StateFrame const & frame);


#endif
