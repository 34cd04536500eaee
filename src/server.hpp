#ifndef SERVER_HPP
#define SERVER_HPP

#include <atomic>
#include <chrono>
#include <mutex>
#include <list>
#include <queue>
#include <string>

#include "api/v1.hpp"


class ClientConnection;
class ConfigManager;
class SyncService;

struct addrinfo;

class Server {
public:
    // Only needs to be unique among live connections
    using ConnectionID = unsigned long long;


private:
    int _socket; // File descriptor for the listener socket

    std::atomic_bool _running; // Set to false when the server recieves SIGTERM

    std::mutex _closingReqMutex; // Mutex for modifying what's below
    std::queue<ConnectionID> _closingRequests; // The IDs of the connections wishing to die
    ConnectionID _nextConnectionID; // The ID of the next connection to be generated
    std::list<ClientConnection> _connections;

    SyncService & _sync;
    v1Router _router;

    // Periodic maintenance
    std::chrono::steady_clock::time_point _nextSweep;
    std::chrono::steady_clock::time_point _nextKeepAlive;

    void tryConnectSocket(std::string const & port, struct addrinfo const * hints,
                          char const * protocol);
public:
    Server(ConfigManager & config, SyncService & sync);
    ~Server();

    void run(); // Loops infinitely until stopped, handling incoming connections
    void stop(); // Signals the server to stop, but doesn't kill it immediately
    void addWishToDie(ConnectionID id); // Call to request a ClientConnection's destruction
private:
    void handleNewConnection(int socket); // Accepts a connection on the given socket
    void handleClosingConnection(ConnectionID id); // Destroy a connection object from its ID
    void runMaintenance(); // Device sweep and SSE keepalives, when due

public:
    SyncService & sync() { return _sync; }
    v1Router & router() { return _router; }
};


#endif
