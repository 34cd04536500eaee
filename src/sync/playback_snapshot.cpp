#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "playback_snapshot.hpp"


int64_t const PlaybackSnapshot::seekThresholdMs = 1500;


EngineReport EngineReport::stopped(std::vector<std::string> const & queue, bool shuffle,
                                   RepeatMode repeat) {
    EngineReport report;
    report.queue = queue;
    report.shuffle = shuffle;
    report.repeat = repeat;
    return report;
}


int64_t PlaybackSnapshot::effectivePosition(Clock::time_point now) const {
    int64_t position = positionMs;
    if (isPlaying) {
        // A clock stepping backwards must not rewind playback
        int64_t elapsed = std::max<int64_t>(0, millisBetween(takenAt, now));
        position += std::llround(static_cast<double>(elapsed) * playbackRate);
    }

    position = std::max<int64_t>(0, position);
    if (durationMs > 0) position = std::min(position, durationMs);
    return position;
}

bool PlaybackSnapshot::materiallyDiffers(EngineReport const & report, Clock::time_point now) const {
    if (trackId != report.trackId
     || isPlaying != report.isPlaying
     || queue != report.queue
     || shuffle != report.shuffle
     || repeat != report.repeat
     || playbackRate != report.playbackRate
     || durationMs != report.durationMs) {
        return true;
    }

    return std::llabs(report.positionMs - effectivePosition(now)) > seekThresholdMs;
}

PlaybackSnapshot PlaybackSnapshot::fromReport(EngineReport const & report, Clock::time_point now) {
    PlaybackSnapshot snapshot;
    snapshot.trackId = report.trackId;
    snapshot.isPlaying = report.isPlaying;
    snapshot.positionMs = report.positionMs;
    snapshot.takenAt = now;
    snapshot.durationMs = report.durationMs;
    snapshot.queue = report.queue;
    snapshot.shuffle = report.shuffle;
    snapshot.repeat = report.repeat;
    snapshot.playbackRate = report.playbackRate;
    return snapshot;
}


void to_json(nlohmann::json & json, PlaybackSnapshot const & snapshot) {
    json = nlohmann::json{
        {"trackId",         snapshot.trackId ? nlohmann::json(*snapshot.trackId) : nlohmann::json()},
        {"isPlaying",       snapshot.isPlaying},
        {"positionMs",      snapshot.positionMs},
        {"totalDurationMs", snapshot.durationMs},
        {"playbackSpeed",   snapshot.playbackRate},
        {"shuffleEnabled",  snapshot.shuffle},
        {"repeatMode",      snapshot.repeat},
        {"queue",           snapshot.queue}
    };
}

void to_json(nlohmann::json & json, StateFrame const & frame) {
    json = frame.snapshot;
    // Clients add the age to their own receipt time, so skew between clocks does not matter
    json["positionAgeMs"] = std::max<int64_t>(0, millisBetween(frame.snapshot.takenAt, frame.renderedAt));
    json["serverNowMs"] = toMillis(frame.renderedAt);
    json["stateRevision"] = frame.revision;
    json["activeDevice"] = frame.activeDevice;
}
