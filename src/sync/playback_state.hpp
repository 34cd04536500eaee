#ifndef SYNC_PLAYBACK_STATE_HPP
#define SYNC_PLAYBACK_STATE_HPP

#include <mutex>
#include <optional>
#include <string>

#include "playback_snapshot.hpp"


// The snapshot, its revision and the active device, always read and written together
class PlaybackState {
public:
    struct Transfer {
        enum class Outcome { APPLIED, CONFLICT };

        Outcome outcome;
        Revision revision; // The revision after the call, applied or not
        std::string previousDevice;
        std::string activeDevice;
        // Live position and playing flag at the instant of the handoff
        int64_t handoffPositionMs = 0;
        bool wasPlaying = false;
    };

    struct PositionUpdate {
        enum class Outcome { ACCEPTED, NOT_ACTIVE, CONFLICT };

        Outcome outcome;
        Revision revision;
        std::string activeDevice;
    };

private:
    mutable std::mutex _mutex;

    PlaybackSnapshot _snapshot;
    Revision _revision;
    std::string const _localDevice;
    std::string _activeDevice;

public:
    PlaybackState(std::string const & localDevice, Clock::time_point now);

    std::string const & localDevice() const { return _localDevice; }

    StateFrame frame(Clock::time_point now) const;
    Revision revision() const;
    std::string activeDevice() const;

    // Returns true if the report bumped the revision
    bool applyEngineReport(EngineReport const & report, Clock::time_point now);
    PositionUpdate applyRemotePosition(std::string const & device, int64_t positionMs,
                                       std::optional<Revision> expected, Clock::time_point now);
    Transfer transfer(std::string const & target, std::optional<Revision> expected,
                      Clock::time_point now);
    // Hands playback back to the local device if `device` was driving it, returning the live
    // position at the handoff
    std::optional<int64_t> releaseDevice(std::string const & device, Clock::time_point now);
};


#endif
