#include <cerrno>
#include <cstring>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <random>
#include <spdlog/spdlog.h>

#include "session_store.hpp"


SessionStore::SessionStore(std::string const & path, std::chrono::milliseconds pairingTimeout,
                           std::chrono::milliseconds sessionLifetime, Clock::time_point now)
 : _pending(), _sessions(), _path(path),
   _pairingTimeout(pairingTimeout), _sessionLifetime(sessionLifetime) {
    if (!_path.empty()) load(now);
}


std::string SessionStore::generateToken() {
    static char const digits[] = "0123456789abcdef";
    std::random_device device; // Backed by the OS entropy pool

    std::string token;
    token.reserve(32);
    for (unsigned i = 0; i < 4; ++i) {
        uint32_t chunk = device();
        for (unsigned j = 0; j < 8; ++j) {
            token += digits[chunk & 15];
            chunk >>= 4;
        }
    }
    return token;
}


std::string SessionStore::issuePairingToken(Clock::time_point now) {
    std::string token = generateToken();

    std::lock_guard lock(_mutex);
    purgeLocked(now);
    _pending.emplace(token, now);
    spdlog::get("logger")->debug("Issued pairing token ({} pending)", _pending.size());
    return token;
}

bool SessionStore::confirm(std::string const & token, Clock::time_point now) {
    std::lock_guard lock(_mutex);
    purgeLocked(now);

    auto iter = _pending.find(token);
    if (iter == _pending.end()) {
        spdlog::get("logger")->warn("Rejected confirmation of an unknown or expired pairing token");
        return false;
    }
    _pending.erase(iter);
    _sessions.insert_or_assign(token, now);
    spdlog::get("logger")->info("Pairing confirmed, {} session(s) active", _sessions.size());

    saveLocked();
    return true;
}

bool SessionStore::isAuthorized(std::string const & token, Clock::time_point now) {
    if (token.empty()) return false;

    std::lock_guard lock(_mutex);
    purgeLocked(now);
    return _sessions.find(token) != _sessions.cend();
}

std::size_t SessionStore::sessionCount() {
    std::lock_guard lock(_mutex);
    return _sessions.size();
}


void SessionStore::purgeLocked(Clock::time_point now) {
    for (auto iter = _pending.begin(); iter != _pending.end(); ) {
        iter = now - iter->second > _pairingTimeout ? _pending.erase(iter) : std::next(iter);
    }

    bool expired = false;
    for (auto iter = _sessions.begin(); iter != _sessions.end(); ) {
        if (now - iter->second > _sessionLifetime) {
            iter = _sessions.erase(iter);
            expired = true;
        } else {
            ++iter;
        }
    }
    if (expired) {
        spdlog::get("logger")->info("Expired sessions purged, {} left", _sessions.size());
        saveLocked();
    }
}

void SessionStore::saveLocked() const {
    if (_path.empty()) return;

    nlohmann::json document{{"sessions", nlohmann::json::array()}};
    for (auto const & [token, issuedAt] : _sessions) {
        document["sessions"].push_back({{"token", token}, {"issuedAtMs", toMillis(issuedAt)}});
    }

    // Write aside then rename, so a crash never leaves a truncated file behind
    std::string const tmpPath = _path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::trunc);
        file << document.dump(4) << '\n';
        if (!file) {
            spdlog::get("logger")->warn("Failed to write session file {}", tmpPath);
            return;
        }
    }
    if (std::rename(tmpPath.c_str(), _path.c_str()) != 0) {
        spdlog::get("logger")->warn("Failed to replace session file {}: {}", _path, strerror(errno));
    }
}

void SessionStore::load(Clock::time_point now) {
    std::ifstream file(_path);
    if (file.fail()) {
        spdlog::get("logger")->info("No session file at {}, starting without sessions", _path);
        return;
    }

    try {
        nlohmann::json document = nlohmann::json::parse(file);
        for (auto const & entry : document.at("sessions")) {
            Clock::time_point issuedAt = fromMillis(entry.at("issuedAtMs").get<int64_t>());
            if (now - issuedAt <= _sessionLifetime) {
                _sessions.emplace(entry.at("token").get<std::string>(), issuedAt);
            }
        }
    } catch (nlohmann::json::exception const & e) {
        spdlog::get("logger")->warn("Ignoring malformed session file {}: {}", _path, e.what());
        _sessions.clear();
        return;
    }

    spdlog::get("logger")->info("Loaded {} session(s) from {}", _sessions.size(), _path);
}
