#include <spdlog/spdlog.h>

#include "device_registry.hpp"


char const * const DeviceRegistry::remoteDeviceName = "Browser";


void to_json(nlohmann::json & json, DeviceInfo const & device) {
    json = nlohmann::json{
        {"id",       device.id},
        {"name",     device.name},
        {"type",     device.kind},
        {"isActive", device.isActive}
    };
}


DeviceRegistry::DeviceRegistry(std::string const & localDevice, std::string const & localName,
                               std::chrono::milliseconds livenessTimeout, Clock::time_point now)
 : _devices(), _localDevice(localDevice), _livenessTimeout(livenessTimeout) {
    _devices.emplace(localDevice, DeviceInfo{localDevice, localName, DeviceKind::LOCAL, now});
}


DeviceInfo DeviceRegistry::registerDevice(std::string const & id, Clock::time_point now) {
    std::lock_guard lock(_mutex);

    auto iter = _devices.find(id);
    if (iter == _devices.end()) {
        spdlog::get("logger")->info("New device \"{}\"", id);
        iter = _devices.emplace(id, DeviceInfo{id, remoteDeviceName, DeviceKind::REMOTE, now}).first;
    }
    iter->second.lastSeen = now;
    return iter->second;
}

void DeviceRegistry::heartbeat(std::string const & id, Clock::time_point now) {
    registerDevice(id, now);
}

bool DeviceRegistry::contains(std::string const & id) const {
    std::lock_guard lock(_mutex);
    return _devices.find(id) != _devices.cend();
}


std::vector<std::string> DeviceRegistry::purgeExpired(Clock::time_point now) {
    std::vector<std::string> expired;
    std::lock_guard lock(_mutex);

    auto iter = _devices.begin();
    while (iter != _devices.end()) {
        DeviceInfo const & device = iter->second;
        if (device.kind == DeviceKind::REMOTE && now - device.lastSeen > _livenessTimeout) {
            spdlog::get("logger")->info("Device \"{}\" timed out", device.id);
            expired.push_back(device.id);
            iter = _devices.erase(iter);
        } else {
            ++iter;
        }
    }
    return expired;
}

std::vector<DeviceInfo> DeviceRegistry::devices() const {
    std::vector<DeviceInfo> devices;
    std::lock_guard lock(_mutex);

    devices.reserve(_devices.size());
    for (auto const & [id, device] : _devices) {
        devices.push_back(device);
    }
    return devices;
}
