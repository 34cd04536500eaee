#include "playback_state.hpp"


PlaybackState::PlaybackState(std::string const & localDevice, Clock::time_point now)
 : _snapshot(), _revision(0), _localDevice(localDevice), _activeDevice(localDevice) {
    _snapshot.takenAt = now;
}


StateFrame PlaybackState::frame(Clock::time_point now) const {
    std::lock_guard lock(_mutex);
    return StateFrame{_snapshot, _revision, _activeDevice, now};
}

Revision PlaybackState::revision() const {
    std::lock_guard lock(_mutex);
    return _revision;
}

std::string PlaybackState::activeDevice() const {
    std::lock_guard lock(_mutex);
    return _activeDevice;
}


bool PlaybackState::applyEngineReport(EngineReport const & report, Clock::time_point now) {
    std::lock_guard lock(_mutex);

    bool material = _snapshot.materiallyDiffers(report, now);
    _snapshot = PlaybackSnapshot::fromReport(report, now);
    if (material) ++_revision;
    return material;
}

PlaybackState::PositionUpdate PlaybackState::applyRemotePosition(std::string const & device,
                                                                 int64_t positionMs,
                                                                 std::optional<Revision> expected,
                                                                 Clock::time_point now) {
    std::lock_guard lock(_mutex);

    if (device != _activeDevice) {
        return {PositionUpdate::Outcome::NOT_ACTIVE, _revision, _activeDevice};
    }
    if (expected && *expected != _revision) {
        return {PositionUpdate::Outcome::CONFLICT, _revision, _activeDevice};
    }

    // Drift from the driving device is not a material change: no revision bump
    _snapshot.positionMs = positionMs;
    _snapshot.takenAt = now;
    return {PositionUpdate::Outcome::ACCEPTED, _revision, _activeDevice};
}

PlaybackState::Transfer PlaybackState::transfer(std::string const & target,
                                                std::optional<Revision> expected,
                                                Clock::time_point now) {
    std::lock_guard lock(_mutex);

    // A zero revision means the caller never saw any state, so it cannot be stale
    if (expected && *expected != 0 && *expected != _revision) {
        return {Transfer::Outcome::CONFLICT, _revision, _activeDevice, _activeDevice};
    }

    Transfer result{Transfer::Outcome::APPLIED, 0, _activeDevice, target};
    result.handoffPositionMs = _snapshot.effectivePosition(now);
    result.wasPlaying = _snapshot.isPlaying;

    // Freeze the extrapolated position into the snapshot, the new driver continues from there
    _snapshot.positionMs = result.handoffPositionMs;
    _snapshot.takenAt = now;

    _activeDevice = target;
    result.revision = ++_revision;
    return result;
}

std::optional<int64_t> PlaybackState::releaseDevice(std::string const & device,
                                                    Clock::time_point now) {
    std::lock_guard lock(_mutex);

    if (device == _localDevice || device != _activeDevice) return std::nullopt;

    _snapshot.positionMs = _snapshot.effectivePosition(now);
    _snapshot.takenAt = now;
    _activeDevice = _localDevice;
    ++_revision;
    return _snapshot.positionMs;
}
