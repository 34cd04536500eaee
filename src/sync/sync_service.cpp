#include <spdlog/spdlog.h>

#include "../config_manager.hpp"
#include "../engine/engine_dispatcher.hpp"
#include "sync_service.hpp"


SyncSettings SyncSettings::fromConfig(ConfigManager const & config) {
    using std::chrono::milliseconds;

    SyncSettings settings;
    settings.localDevice       = config.getStr("local_device_id");
    settings.localDeviceName   = config.getStr("local_device_name");
    settings.sessionFile       = config.getStr("session_file");
    settings.livenessTimeout   = milliseconds(config.getInt("liveness_timeout_ms"));
    settings.keepAliveInterval = milliseconds(config.getInt("keepalive_interval_ms"));
    settings.sweepInterval     = milliseconds(config.getInt("sweep_interval_ms"));
    settings.pairingTimeout    = std::chrono::seconds(config.getInt("pairing_timeout_s"));
    settings.sessionLifetime   = std::chrono::hours(24 * config.getInt("session_lifetime_days"));
    return settings;
}


SyncService::SyncService(SyncSettings const & settings, Clock const & clock,
                         EngineDispatcher & engine)
 : _settings(settings), _clock(clock), _engine(engine),
   _registry(settings.localDevice, settings.localDeviceName, settings.livenessTimeout, clock.now()),
   _state(settings.localDevice, clock.now()),
   _broadcaster(),
   _sessions(settings.sessionFile, settings.pairingTimeout, settings.sessionLifetime, clock.now()) {}


DeviceInfo SyncService::registerDevice(std::string const & device) {
    sweep();
    DeviceInfo info = _registry.registerDevice(device, _clock.now());
    info.isActive = info.id == _state.activeDevice();
    return info;
}

void SyncService::heartbeat(std::string const & device) {
    _registry.heartbeat(device, _clock.now());
}

std::vector<DeviceInfo> SyncService::listLive() {
    sweep();

    std::vector<DeviceInfo> devices = _registry.devices();
    std::string const active = _state.activeDevice();
    for (DeviceInfo & device : devices) {
        device.isActive = device.id == active;
    }
    return devices;
}

void SyncService::sweep() {
    Clock::time_point const now = _clock.now();

    // Holding the event stream open counts as being alive
    for (std::string const & device : _broadcaster.listeningDevices()) {
        _registry.heartbeat(device, now);
    }

    for (std::string const & device : _registry.purgeExpired(now)) {
        _broadcaster.closeDevice(device);

        // Never leave an active device that is not live
        std::optional<int64_t> handoff = _state.releaseDevice(device, now);
        if (handoff) {
            spdlog::get("logger")->info("Active device \"{}\" expired, playback back on \"{}\"",
                                        device, localDevice());
            resumeLocal(*handoff);
            broadcast();
        }
    }
}


SyncService::TransferResult SyncService::requestTransfer(std::string const & target,
                                                         std::optional<Revision> expected) {
    // The target may not have completed its first heartbeat yet
    _registry.registerDevice(target, _clock.now());

    Transfer transfer = _state.transfer(target, expected, _clock.now());
    if (transfer.outcome == Transfer::Outcome::CONFLICT) {
        spdlog::get("logger")->warn("Transfer to \"{}\" rejected: expected revision {}, at {}",
                                    target, expected.value_or(0), transfer.revision);
        return {transfer, currentState()};
    }

    spdlog::get("logger")->info("Active device \"{}\" -> \"{}\" (revision {})",
                                transfer.previousDevice, target, transfer.revision);
    if (target == localDevice() && transfer.previousDevice != localDevice()) {
        resumeLocal(transfer.handoffPositionMs);
    } else if (target != localDevice() && transfer.previousDevice == localDevice()) {
        pauseLocal();
    }

    broadcast();
    return {transfer, currentState()};
}

void SyncService::applyEngineReport(EngineReport const & report) {
    Clock::time_point const now = _clock.now();

    if (_state.applyEngineReport(report, now)) {
        spdlog::get("logger")->trace("Engine report changed the state, revision {}", _state.revision());
    }
    _registry.heartbeat(localDevice(), now);
    broadcast();
}

SyncService::PositionUpdate SyncService::applyRemotePosition(std::string const & device,
                                                             int64_t positionMs,
                                                             std::optional<Revision> expected) {
    Clock::time_point const now = _clock.now();

    PositionUpdate update = _state.applyRemotePosition(device, positionMs, expected, now);
    switch (update.outcome) {
        case PositionUpdate::Outcome::ACCEPTED:
            _registry.heartbeat(device, now);
            break;
        case PositionUpdate::Outcome::NOT_ACTIVE:
            spdlog::get("logger")->debug("Position from \"{}\" rejected, \"{}\" is active",
                                         device, update.activeDevice);
            break;
        case PositionUpdate::Outcome::CONFLICT:
            spdlog::get("logger")->warn("Position from \"{}\" rejected: expected revision {}, at {}",
                                        device, expected.value_or(0), update.revision);
            break;
    }
    return update;
}

StateFrame SyncService::currentState() const {
    return _state.frame(_clock.now());
}


std::shared_ptr<Subscription> SyncService::subscribe(std::string const & device,
                                                     std::shared_ptr<EventSink> sink) {
    registerDevice(device);

    // Subscribe before reading the state, so no change can slip between the two
    std::shared_ptr<Subscription> subscription = _broadcaster.subscribe(device, std::move(sink));
    StateFrame frame = currentState();
    if (!subscription->sendFrame(frame.revision, nlohmann::json(frame).dump())) {
        _broadcaster.unsubscribe(*subscription);
    }
    return subscription;
}

void SyncService::unsubscribe(Subscription & subscription) {
    _broadcaster.unsubscribe(subscription);
}

void SyncService::broadcast() {
    if (_broadcaster.size() == 0) return;

    // Serialized once for everyone
    StateFrame frame = currentState();
    _broadcaster.broadcast(frame.revision, nlohmann::json(frame).dump());
}

void SyncService::keepAlive() {
    Clock::time_point const now = _clock.now();
    for (std::string const & device : _broadcaster.keepAlive()) {
        _registry.heartbeat(device, now);
    }
}


void SyncService::resumeLocal(int64_t positionMs) {
    _engine.post("resume-local", [positionMs](PlaybackEngine & engine) {
        engine.resumeLocal(positionMs);
    });
}

void SyncService::pauseLocal() {
    _engine.post("pause-local", [](PlaybackEngine & engine) {
        engine.pauseLocal();
    });
}
