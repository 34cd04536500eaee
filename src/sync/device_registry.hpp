#ifndef SYNC_DEVICE_REGISTRY_HPP
#define SYNC_DEVICE_REGISTRY_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "clock.hpp"


enum class DeviceKind { LOCAL, REMOTE };

NLOHMANN_JSON_SERIALIZE_ENUM(DeviceKind, {
    {DeviceKind::LOCAL,  "local"},
    {DeviceKind::REMOTE, "remote"}
})

struct DeviceInfo {
    std::string id;
    std::string name;
    DeviceKind kind = DeviceKind::REMOTE;
    Clock::time_point lastSeen;
    bool isActive = false; // Filled in by whoever knows the active device
};

void to_json(nlohmann::json & json, DeviceInfo const & device);


// Every participant we know of. The local device is always present; remote ones are created on
// first contact and expire once they go quiet for longer than the liveness timeout.
class DeviceRegistry {
public:
    static char const * const remoteDeviceName;

private:
    mutable std::mutex _mutex;
    std::map<std::string, DeviceInfo> _devices;

    std::string const _localDevice;
    std::chrono::milliseconds const _livenessTimeout;

public:
    DeviceRegistry(std::string const & localDevice, std::string const & localName,
                   std::chrono::milliseconds livenessTimeout, Clock::time_point now);

    std::string const & localDevice() const { return _localDevice; }

    // Idempotent; unknown ids are created on demand
    DeviceInfo registerDevice(std::string const & id, Clock::time_point now);
    void heartbeat(std::string const & id, Clock::time_point now);
    bool contains(std::string const & id) const;

    // Removes remote devices that went quiet, returning their ids
    std::vector<std::string> purgeExpired(Clock::time_point now);
    std::vector<DeviceInfo> devices() const;
};


#endif
