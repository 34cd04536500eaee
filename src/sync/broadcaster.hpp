#ifndef SYNC_BROADCASTER_HPP
#define SYNC_BROADCASTER_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "playback_snapshot.hpp"


// Where a subscription's bytes go (a socket in production)
/* abstract */ class EventSink {
public:
    virtual ~EventSink() = default;
    // Must not block; returns false if the data could not be written in full
    virtual bool write(std::string const & data) = 0;
};


// One open push channel to one device
class Subscription {
public:
    using ID = unsigned long long;

private:
    ID const _id;
    std::string const _device;
    std::shared_ptr<EventSink> const _sink;

    std::mutex _writeMutex; // Serializes writes, and guards closing against in-flight writes
    bool _open;
    Revision _lastRevision; // Revision of the last frame sent
    bool _sentFrame;

public:
    Subscription(ID id, std::string const & device, std::shared_ptr<EventSink> sink);

    ID id() const { return _id; }
    std::string const & device() const { return _device; }
    bool open();
    Revision lastRevision();

    // Both return false once the channel is dead; a failed write closes it
    bool sendFrame(Revision revision, std::string const & data);
    bool sendKeepAlive();
    // After this returns, the sink is never written to again
    void close();

private:
    bool writeLocked(std::string const & data);
};


// Fans frames out to every live subscription
class Broadcaster {
public:
    using List = std::vector<std::shared_ptr<Subscription>>;

    static char const * const keepAliveFrame;

private:
    std::mutex _mutex; // Guards replacing `_subscriptions`, never held while writing
    std::shared_ptr<List const> _subscriptions; // Copied on write, iterated without the lock
    std::atomic<Subscription::ID> _nextID;

public:
    Broadcaster();

    static std::string formatFrame(Revision revision, std::string const & data);

    std::shared_ptr<Subscription> subscribe(std::string const & device,
                                            std::shared_ptr<EventSink> sink);
    void unsubscribe(Subscription & subscription);
    // Closes every subscription of an expired device
    void closeDevice(std::string const & device);

    void broadcast(Revision revision, std::string const & data);
    // Returns the devices whose channel is still alive
    std::vector<std::string> keepAlive();
    // Devices with an open channel, without writing anything
    std::vector<std::string> listeningDevices();

    std::shared_ptr<List const> subscriptions();
    std::size_t size();

private:
    void removeClosed(std::vector<Subscription::ID> const & ids);
};


#endif
