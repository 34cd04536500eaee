#include <sys/socket.h>
#include <sys/types.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <array>
#include <spdlog/spdlog.h>
#include <stdexcept>

#include "client_connection.hpp"
#include "sync/sync_service.hpp"


using namespace std::literals::chrono_literals;
std::chrono::steady_clock::duration const ClientConnection::timeout = 10s;


bool SocketEventSink::write(std::string const & data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t size = send(_socket, data.data() + sent, data.size() - sent,
                            MSG_NOSIGNAL | MSG_DONTWAIT);
        if (size == -1) {
            if (errno == EINTR) continue;
            // EAGAIN included: a client that can't keep up is dropped, it will reconnect
            return false;
        }
        sent += size;
    }
    return true;
}


ClientConnection::ClientConnection(int socket, Server & server, Server::ConnectionID id,
                                   std::string const & peer, bool loopback)
 : _socket(socket), _server(server), _id(id), _peer(peer), _loopback(loopback),
   _parser(), _lastActive(std::chrono::steady_clock::now()), _subscription(),
   _destructing(false), _running(true), _stopping(false), _thread([this](){run();}) {}

ClientConnection::~ClientConnection() {
    _destructing = true;

    spdlog::get("logger")->trace("Stopping connection {}...", _id);

    stop();
    _thread.join();

    // Nothing may write to the socket once it's closed, or it could hit a reused descriptor
    if (_subscription) _server.sync().unsubscribe(*_subscription);
    close(_socket);

    spdlog::get("logger")->trace("~ClientConnection({}) done.", _id);
}


void ClientConnection::stop() {
    _stopping = true;
}


void ClientConnection::run() {
    std::array pollfds{
        (struct pollfd){ .fd = _socket, .events = POLLIN | POLLRDHUP, .revents = 0 }
    };
    std::array<void (ClientConnection::*)(struct pollfd const &), pollfds.size()> handlers{
        &ClientConnection::handleConnection
    };
    while (!_stopping) {
        try {
            switch (poll(pollfds.data(), pollfds.size(), 100)) {
                case -1:
                    if (errno != EINTR) {
                        spdlog::get("logger")->error("ClientConnection[{}].run() poll() error: {}",
                                                     _id, strerror(errno));
                    }
                    break;

                case 0:
                    break;

                default:
                    for (unsigned i = 0; i < pollfds.size(); ++i) {
                        if (pollfds[i].revents & POLLERR) {
                            spdlog::get("logger")->error("ClientConnection[{}].run(): file descr {} [pollfd index {}] returned error", _id, pollfds[i].fd, i);
                        }
                        if (pollfds[i].revents & (pollfds[i].events | POLLHUP | POLLERR)) {
                            (this->*handlers[i])(pollfds[i]);
                        }
                    }
            }

            // The broadcaster dropped us (failed write, or our device expired)
            if (_subscription && !_subscription->open()) {
                spdlog::get("logger")->debug("ClientConnection[{}] event stream closed", _id);
                stop();
            }

            // Terminate ourselves if we timed out
            if (hasTimedOut()) {
                stop();
            }

        } catch (std::exception const & e) {
            spdlog::get("logger")->error("ClientConnection[{}].run(): Exception at top level: {}", _id, e.what());
            stop();
        }
    }
    _running = false;

    if (_subscription) _server.sync().unsubscribe(*_subscription);
    requestDestruction();
}

void ClientConnection::requestDestruction() {
    // Do not register for destruction if we're already destructing
    if (!_destructing) {
        _server.addWishToDie(_id);
    }
}

void ClientConnection::handleConnection(struct pollfd const & fd) {
    bool terminate = false; // Set this to request closing the connection

    if (fd.revents & POLLIN) { // Incoming data!
        std::array<char, BUFSIZ> buffer;
        ssize_t size = recv(_socket, buffer.data(), buffer.size(), 0);
        if (size == -1) {
            spdlog::get("logger")->error("ClientConnection[{}] recv() error: {}", _id,
                                         strerror(errno));
            terminate = true;
        } else if (size == 0) { // Happens when connection gets closed
            terminate = true;
        } else if (!_subscription) { // Event stream clients have nothing left to say
            _parser.feed(std::string_view(buffer.data(), size));
            _lastActive = std::chrono::steady_clock::now();

            while (!_stopping && !_subscription) {
                std::optional<Request> request;
                try {
                    request = _parser.next();
                } catch (BadRequest const & e) {
                    // The request was consumed, the connection can go on
                    sendAll(Response::json(400, {{"error", e.what()}}).serialize(true));
                    continue;
                } catch (RequestParser::Malformed const & e) {
                    spdlog::get("logger")->debug("ClientConnection[{}] sent a malformed request: {}",
                                                 _id, e.what());
                    sendAll(Response::json(400, {{"error", e.what()}}).serialize(false));
                    terminate = true;
                    break;
                }
                if (!request) break;
                handleRequest(*request);
            }
        }
    }

    if (fd.revents & (POLLRDHUP | POLLHUP | POLLERR)) {
        // Peer closed connection
        spdlog::get("logger")->debug("ClientConnection[{}] closed by peer", _id);
        terminate = true;
    }

    if (terminate) {
        stop();
    }
}

void ClientConnection::handleRequest(Request & request) {
    request.peer = _peer;
    request.fromLoopback = _loopback;

    Response response = _server.router().handle(request);
    spdlog::get("logger")->debug("ClientConnection[{}] {} {} -> {}", _id, request.method,
                                 request.path, response.status);

    if (response.eventStreamDevice) {
        startEventStream(response);
        return;
    }

    bool keepAlive = request.keepAlive();
    if (!sendAll(response.serialize(keepAlive)) || !keepAlive) {
        stop();
    }
}

void ClientConnection::startEventStream(Response const & response) {
    if (!sendAll(response.serializeStreamHead())) {
        stop();
        return;
    }

    // From here on, only the subscription writes to the socket
    _subscription = _server.sync().subscribe(*response.eventStreamDevice,
                                             std::make_shared<SocketEventSink>(_socket));
    spdlog::get("logger")->info("ClientConnection[{}] streaming events to device \"{}\"",
                                _id, _subscription->device());
}


bool ClientConnection::sendAll(std::string const & data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t size = send(_socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (size == -1) {
            if (errno == EINTR) continue;
            spdlog::get("logger")->warn("ClientConnection[{}] send() error: {}", _id,
                                        strerror(errno));
            return false;
        }
        sent += size;
    }
    return true;
}
