#include <sys/socket.h>
#include <sys/types.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <algorithm>
#include <array>
#include <spdlog/spdlog.h>
#include <stdexcept>

#include "client_connection.hpp"
#include "config_manager.hpp"
#include "server.hpp"
#include "sync/sync_service.hpp"


// The signals we stop the server on
static std::array const handledSignals = {SIGINT, SIGTERM};
static std::array<struct sigaction, handledSignals.size()> oldact;

static Server * serverInstance = nullptr;


static int const queue_length = 32;
void Server::tryConnectSocket(std::string const & port, struct addrinfo const * hints,
                              char const * protocol) {
    struct addrinfo * result;

    int gai_errno = getaddrinfo(NULL, port.c_str(), hints, &result);
    if (gai_errno) {
        spdlog::get("logger")->warn("Failure to init {} socket: {}", protocol,
                                    gai_strerror(gai_errno));
    } else {
        unsigned nbAttempts = 0;
        // We now have a list of possible addrinfo structs, try `bind`ing until one succeeds
        for (struct addrinfo * ptr = result; ptr; ptr = ptr->ai_next) {
            nbAttempts++;
            _socket = socket(ptr->ai_family, ptr->ai_socktype, ptr->ai_protocol);
            // A failure is not a problem
            if (_socket == -1) {
                spdlog::get("logger")->debug("Attempt to create {} socket failed, trying next: {}",
                                             protocol, strerror(errno));
                continue;
            }
            // Restarting the daemon must not wait for old connections to leave TIME_WAIT
            int one = 1;
            if (setsockopt(_socket, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) == -1) {
                spdlog::get("logger")->warn("Failed to set SO_REUSEADDR: {}", strerror(errno));
            }
            // If it's an IPv6 socket, try making it dual-stack
            if (ptr->ai_family == AF_INET6) {
                int zero = 0;
                if (setsockopt(_socket, IPPROTO_IPV6, IPV6_V6ONLY, &zero, sizeof(zero)) == -1) {
                    spdlog::get("logger")->warn("Failed to make IPv6 socket dual-stack: {}", strerror(errno));
                }
            }
            // First address that binds and listens wins
            if (bind(_socket, ptr->ai_addr, ptr->ai_addrlen) == 0
             && listen(_socket, queue_length) == 0) break;
            spdlog::get("logger")->debug("Attempt to open {} socket failed, trying next: {}",
                                         protocol, strerror(errno));
            close(_socket); // Clean up the socket we opened
            _socket = -1; // Revert back to failure state
        }
        freeaddrinfo(result);

        if (_socket == -1) {
            spdlog::get("logger")->warn("Failure to init {} socket : exhausted all {} options",
                                        protocol, nbAttempts);
        }
    }
}

Server::Server(ConfigManager & config, SyncService & sync)
 : _socket(-1), _running(true), _nextConnectionID(0), _sync(sync), _router(sync),
   _nextSweep(std::chrono::steady_clock::now()), _nextKeepAlive(std::chrono::steady_clock::now()) {
    if (serverInstance) {
        // Signal handlers stop a single instance; a second one would never be told to stop
        spdlog::get("logger")->critical("A server is already running, this one will ignore SIGINT/SIGTERM");
    } else {
        // Register this server instance
        spdlog::get("logger")->trace("Registering signal handlers...");

        struct sigaction action;
        action.sa_handler = [](int){ serverInstance->stop(); };
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        for (unsigned i = 0; i < handledSignals.size(); i++) {
            sigaction(handledSignals[i], &action, &oldact[i]);
        }

        serverInstance = this;
    }

    std::string port = std::to_string(config.getInt("port"));
    spdlog::get("logger")->trace("Opening listener on port {}", port);

    // Try making an IPv6 socket
    struct addrinfo hints = {};
    hints.ai_family = AF_INET6;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;
    tryConnectSocket(port, &hints, "IPv6");

    if (_socket == -1) {
        // Now try again for IPv4
        spdlog::get("logger")->warn("Couldn't set up IPv6 socket, falling back to IPv4");
        hints.ai_family = AF_INET;
        tryConnectSocket(port, &hints, "IPv4");
    }

    // Without a listener the daemon is useless
    if (_socket == -1) {
        throw std::runtime_error("Could not open IPv4 or IPv6 socket");
    }
}

Server::~Server() {
    // Connections must be gone before the service they point into
    spdlog::get("logger")->trace("Dropping {} connections", _connections.size());
    _connections.clear();

    if (serverInstance == this) {
        spdlog::get("logger")->trace("Deregistering signal handlers...");

        for (unsigned i = 0; i < handledSignals.size(); i++) {
            sigaction(handledSignals[i], &oldact[i], NULL);
        }

        serverInstance = nullptr;
    }

    spdlog::get("logger")->trace("Closing listener");
    if (_socket != -1) close(_socket);
}


void Server::run() {
    // Short timeout so maintenance ticks run even when nobody connects
    struct timespec const timeout = { .tv_sec = 0, .tv_nsec = 100000000 };
    std::array pollfds = {
        (struct pollfd){ .fd = _socket, .events = POLLIN, .revents = 0 }
    };
    // To avoid a race condition, signals being caught need to be blocked during polling
    sigset_t blockedSignals;
    sigemptyset(&blockedSignals);
    for (auto const & signal : handledSignals) {
        sigaddset(&blockedSignals, signal);
    }

    spdlog::get("logger")->info("Accepting connections");

    while (_running) {
        switch (ppoll(pollfds.data(), pollfds.size(), &timeout, &blockedSignals)) {
            case -1:
                if (errno != EINTR) {
                    spdlog::get("logger")->error("Listener ppoll() failed: {}", strerror(errno));
                }
                break;

            case 0: // Nothing to do
                break;

            default:
                if (pollfds[0].revents & POLLERR) {
                    spdlog::get("logger")->error("Listener socket {} reported an error", _socket);
                }
                if (pollfds[0].revents & POLLIN) {
                    handleNewConnection(_socket);
                }
        }

        runMaintenance();

        // Check if any connections wish to die
        {
            std::lock_guard<std::mutex> lock(_closingReqMutex);
            while (!_closingRequests.empty()) {
                handleClosingConnection(_closingRequests.front());
                _closingRequests.pop();
            }
        }
    }

    spdlog::get("logger")->info("Stopping {} connections", _connections.size());
    for (ClientConnection & connection : _connections) {
        connection.stop();
    }

    spdlog::get("logger")->trace("Server loop exited");
}

void Server::stop() {
    _running = false;
}


void Server::addWishToDie(ConnectionID id) {
    std::lock_guard<std::mutex> lock(_closingReqMutex);
    _closingRequests.push(id);
}


void Server::handleNewConnection(int socket) {
    struct sockaddr_storage addr;
    socklen_t addr_size = sizeof(addr);
    int new_socket = accept(socket, reinterpret_cast<struct sockaddr *>(&addr), &addr_size);
    if (new_socket == -1) {
        spdlog::get("logger")->error("accept() error: {}", strerror(errno));
        return;
    }

    std::array<char, INET6_ADDRSTRLEN> text{};
    bool loopback = false;
    if (addr.ss_family == AF_INET) {
        struct sockaddr_in const * addrv4 = reinterpret_cast<struct sockaddr_in *>(&addr);
        inet_ntop(AF_INET, &addrv4->sin_addr, text.data(), text.size());
        loopback = (ntohl(addrv4->sin_addr.s_addr) >> 24) == 127;
    } else if (addr.ss_family == AF_INET6) {
        struct sockaddr_in6 const * addrv6 = reinterpret_cast<struct sockaddr_in6 *>(&addr);
        inet_ntop(AF_INET6, &addrv6->sin6_addr, text.data(), text.size());
        // Dual-stack sockets see IPv4 peers as ::ffff:a.b.c.d
        loopback = IN6_IS_ADDR_LOOPBACK(&addrv6->sin6_addr)
                || (IN6_IS_ADDR_V4MAPPED(&addrv6->sin6_addr) && addrv6->sin6_addr.s6_addr[12] == 127);
    } else {
        spdlog::get("logger")->warn("Accepted connection {} of unknown type {}", _nextConnectionID, addr.ss_family);
    }
    std::string peer(text.data());
    spdlog::get("logger")->debug("Accepted connection {} from {}", _nextConnectionID, peer);

    _connections.emplace(_connections.begin(), new_socket, *this, _nextConnectionID, peer, loopback);
    ++_nextConnectionID;
}


void Server::handleClosingConnection(ConnectionID id) {
    _connections.remove_if([&id](ClientConnection const & connection) {
        return connection.id() == id;
    });
}


void Server::runMaintenance() {
    auto now = std::chrono::steady_clock::now();

    // Keepalives first: a dead stream is noticed before its device's liveness is refreshed
    if (now >= _nextKeepAlive) {
        _sync.keepAlive();
        _nextKeepAlive = now + _sync.settings().keepAliveInterval;
    }
    if (now >= _nextSweep) {
        _sync.sweep();
        _nextSweep = now + _sync.settings().sweepInterval;
    }
}
