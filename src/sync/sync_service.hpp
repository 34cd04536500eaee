#ifndef SYNC_SYNC_SERVICE_HPP
#define SYNC_SYNC_SERVICE_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "broadcaster.hpp"
#include "clock.hpp"
#include "device_registry.hpp"
#include "playback_state.hpp"
#include "session_store.hpp"


class ConfigManager;
class EngineDispatcher;


struct SyncSettings {
    std::string localDevice = "local";
    std::string localDeviceName = "Player";
    std::string sessionFile; // Empty disables session persistence
    std::chrono::milliseconds livenessTimeout{15000};
    std::chrono::milliseconds keepAliveInterval{15000};
    std::chrono::milliseconds sweepInterval{1000};
    std::chrono::milliseconds pairingTimeout{5 * 60 * 1000};
    std::chrono::milliseconds sessionLifetime{30LL * 24 * 60 * 60 * 1000};

    static SyncSettings fromConfig(ConfigManager const & config);
};


// The one object holding all shared sync state: devices, the playback state and its revision,
// the subscriptions, and the sessions. Request handlers get it by reference.
class SyncService {
public:
    using Transfer = PlaybackState::Transfer;
    using PositionUpdate = PlaybackState::PositionUpdate;

    struct TransferResult {
        Transfer transfer;
        StateFrame frame; // The state right after the call
    };

private:
    SyncSettings const _settings;
    Clock const & _clock;
    EngineDispatcher & _engine;

    DeviceRegistry _registry;
    PlaybackState _state;
    Broadcaster _broadcaster;
    SessionStore _sessions;

public:
    SyncService(SyncSettings const & settings, Clock const & clock, EngineDispatcher & engine);

    SyncSettings const & settings() const { return _settings; }
    Clock const & clock() const { return _clock; }
    EngineDispatcher & engine() { return _engine; }
    SessionStore & sessions() { return _sessions; }
    std::string const & localDevice() const { return _settings.localDevice; }

    // Device registry
    DeviceInfo registerDevice(std::string const & device);
    void heartbeat(std::string const & device);
    std::vector<DeviceInfo> listLive();
    void sweep();

    // Arbitration and position model
    TransferResult requestTransfer(std::string const & target, std::optional<Revision> expected);
    void applyEngineReport(EngineReport const & report);
    PositionUpdate applyRemotePosition(std::string const & device, int64_t positionMs,
                                       std::optional<Revision> expected);
    StateFrame currentState() const;
    std::string activeDevice() const { return _state.activeDevice(); }
    Revision revision() const { return _state.revision(); }

    // Fan-out
    std::shared_ptr<Subscription> subscribe(std::string const & device,
                                            std::shared_ptr<EventSink> sink);
    void unsubscribe(Subscription & subscription);
    void broadcast();
    void keepAlive();
    std::size_t subscriberCount() { return _broadcaster.size(); }

private:
    void resumeLocal(int64_t positionMs);
    void pauseLocal();
};


#endif
