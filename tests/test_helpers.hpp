#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "engine/playback_engine.hpp"
#include "sync/broadcaster.hpp"
#include "sync/clock.hpp"


// A clock that only moves when told to
class ManualClock : public Clock {
private:
    mutable std::mutex _mutex;
    time_point _now;

public:
    ManualClock(time_point start = fromMillis(1'700'000'000'000)) : _now(start) {}

    time_point now() const override {
        std::lock_guard lock(_mutex);
        return _now;
    }
    void advance(std::chrono::milliseconds by) {
        std::lock_guard lock(_mutex);
        _now += by;
    }
};


// Records every command it receives, as "name" or "name:argument"
class RecordingEngine : public PlaybackEngine {
private:
    mutable std::mutex _mutex;
    std::vector<std::string> _calls;

    void record(std::string const & call) {
        std::lock_guard lock(_mutex);
        _calls.push_back(call);
    }

public:
    std::vector<std::string> calls() const {
        std::lock_guard lock(_mutex);
        return _calls;
    }

    void play(std::optional<std::string> const & trackId) override {
        record(trackId ? "play:" + *trackId : "play");
    }
    void pause() override { record("pause"); }
    void next() override { record("next"); }
    void prev() override { record("prev"); }
    void seek(int64_t positionMs) override { record("seek:" + std::to_string(positionMs)); }
    void toggleShuffle() override { record("shuffle"); }
    void cycleRepeat() override { record("repeat"); }
    void enqueue(std::string const & trackId) override { record("enqueue:" + trackId); }
    void resumeLocal(int64_t positionMs) override {
        record("resumeLocal:" + std::to_string(positionMs));
    }
    void pauseLocal() override { record("pauseLocal"); }
};


// Keeps what it was sent; can be told to start failing
class MemorySink : public EventSink {
private:
    mutable std::mutex _mutex;
    std::vector<std::string> _writes;
    bool _failing;

public:
    MemorySink(bool failing = false) : _failing(failing) {}

    bool write(std::string const & data) override {
        std::lock_guard lock(_mutex);
        if (_failing) return false;
        _writes.push_back(data);
        return true;
    }

    void setFailing(bool failing) {
        std::lock_guard lock(_mutex);
        _failing = failing;
    }
    std::vector<std::string> writes() const {
        std::lock_guard lock(_mutex);
        return _writes;
    }
};


inline EngineReport playingReport(std::string const & trackId, int64_t positionMs,
                                  int64_t durationMs = 200000) {
    EngineReport report;
    report.trackId = trackId;
    report.isPlaying = true;
    report.positionMs = positionMs;
    report.durationMs = durationMs;
    report.queue = {trackId};
    return report;
}


#endif
