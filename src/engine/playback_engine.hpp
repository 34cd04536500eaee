#ifndef ENGINE_PLAYBACK_ENGINE_HPP
#define ENGINE_PLAYBACK_ENGINE_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "../sync/playback_snapshot.hpp"


// The thing that actually produces audio. Not thread-safe: only ever called from the
// `EngineDispatcher`'s thread.
/* abstract */ class PlaybackEngine {
public:
    using ReportCallback = std::function<void(EngineReport const &)>;

    virtual ~PlaybackEngine() = default;

    virtual void play(std::optional<std::string> const & trackId) = 0;
    virtual void pause() = 0;
    virtual void next() = 0;
    virtual void prev() = 0;
    virtual void seek(int64_t positionMs) = 0;
    virtual void toggleShuffle() = 0;
    virtual void cycleRepeat() = 0;
    virtual void enqueue(std::string const & trackId) = 0;

    // Device handoff: resume where the remote device left off (playing only if we were playing
    // when the handoff away happened), or pause and stop reporting while a remote drives
    virtual void resumeLocal(int64_t positionMs) = 0;
    virtual void pauseLocal() = 0;
};


#endif
