#ifndef SYNC_SESSION_STORE_HPP
#define SYNC_SESSION_STORE_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <string>

#include "clock.hpp"


// Pairing gate: short-lived pairing tokens, promoted to long-lived sessions once the local side
// confirms them. Sessions survive restarts through `path` (no persistence if it is empty).
class SessionStore {
private:
    std::mutex _mutex;

    std::map<std::string, Clock::time_point> _pending;  // Token -> issue time
    std::map<std::string, Clock::time_point> _sessions; // Token -> confirmation time

    std::string const _path;
    std::chrono::milliseconds const _pairingTimeout;
    std::chrono::milliseconds const _sessionLifetime;

public:
    SessionStore(std::string const & path, std::chrono::milliseconds pairingTimeout,
                 std::chrono::milliseconds sessionLifetime, Clock::time_point now);

    static std::string generateToken();

    std::string issuePairingToken(Clock::time_point now);
    // Succeeds at most once per token, and only before the token expires
    bool confirm(std::string const & token, Clock::time_point now);
    bool isAuthorized(std::string const & token, Clock::time_point now);

    std::size_t sessionCount();

private:
    // Both expect `_mutex` to be held
    void purgeLocked(Clock::time_point now);
    void saveLocked() const;
    void load(Clock::time_point now);
};


#endif
