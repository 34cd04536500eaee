#ifndef CLIENT_CONNECTION_HPP
#define CLIENT_CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "http/request.hpp"
#include "http/response.hpp"
#include "server.hpp"
#include "sync/broadcaster.hpp"


struct pollfd; // Forward-declared because it's sufficient, over `#include <poll.h>`


// Writes event-stream frames straight to a client's socket, giving up instead of blocking
class SocketEventSink : public EventSink {
private:
    int _socket;

public:
    SocketEventSink(int socket) : _socket(socket) {}
    bool write(std::string const & data) override;
};


// Manages one HTTP connection with a client, which may turn into an event stream
class ClientConnection {
public:
    static std::chrono::steady_clock::duration const timeout;


private:
    int _socket;
    Server & _server;
    Server::ConnectionID _id;
    std::string const _peer;
    bool const _loopback;

    RequestParser _parser;
    std::chrono::steady_clock::time_point _lastActive;
    std::shared_ptr<Subscription> _subscription; // Set once this is an event stream

    std::atomic_bool _destructing; // Set to true when the object is being destructed
    std::atomic_bool _running; // Set to false when the thread stops
    std::atomic_bool _stopping; // Set to true when the thread should stop (but it may still be running)
    // Must be last, so it gets initialized last
    std::thread _thread; // The thread managing the connection

public:
    ClientConnection(int socket, Server & server, Server::ConnectionID id,
                     std::string const & peer, bool loopback);
    ~ClientConnection();

    Server::ConnectionID id() const { return _id; }
    void stop();
    bool running() const { return _running; }
private:
    void run();
    void requestDestruction();

    void handleConnection(struct pollfd const &);
    void handleRequest(Request & request);
    void startEventStream(Response const & response);
    bool hasTimedOut() const {
        // An event stream stays open for as long as the client listens
        return !_subscription && std::chrono::steady_clock::now() - _lastActive > timeout;
    }

    bool sendAll(std::string const & data);
};


#endif
