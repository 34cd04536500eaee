#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

#include "broadcaster.hpp"


Subscription::Subscription(ID id, std::string const & device, std::shared_ptr<EventSink> sink)
 : _id(id), _device(device), _sink(std::move(sink)),
   _open(true), _lastRevision(0), _sentFrame(false) {}

bool Subscription::open() {
    std::lock_guard lock(_writeMutex);
    return _open;
}

Revision Subscription::lastRevision() {
    std::lock_guard lock(_writeMutex);
    return _lastRevision;
}


bool Subscription::sendFrame(Revision revision, std::string const & data) {
    std::lock_guard lock(_writeMutex);
    if (!_open) return false;

    // Frames built concurrently may arrive out of order; never step a client back in time
    if (_sentFrame && revision < _lastRevision) {
        spdlog::get("logger")->trace("Subscription {} skipping stale frame {} (sent {})",
                                     _id, revision, _lastRevision);
        return true;
    }

    if (!writeLocked(Broadcaster::formatFrame(revision, data))) return false;
    _lastRevision = revision;
    _sentFrame = true;
    return true;
}

bool Subscription::sendKeepAlive() {
    std::lock_guard lock(_writeMutex);
    if (!_open) return false;
    return writeLocked(Broadcaster::keepAliveFrame);
}

void Subscription::close() {
    std::lock_guard lock(_writeMutex);
    _open = false;
}

bool Subscription::writeLocked(std::string const & data) {
    if (_sink->write(data)) return true;

    spdlog::get("logger")->debug("Subscription {} (device \"{}\") write failed, dropping it",
                                 _id, _device);
    _open = false;
    return false;
}


char const * const Broadcaster::keepAliveFrame = ": keepalive\n\n";

Broadcaster::Broadcaster()
 : _subscriptions(std::make_shared<List>()), _nextID(0) {}


std::string Broadcaster::formatFrame(Revision revision, std::string const & data) {
    return "id: " + std::to_string(revision) + "\nretry: 3000\ndata: " + data + "\n\n";
}


std::shared_ptr<Subscription> Broadcaster::subscribe(std::string const & device,
                                                     std::shared_ptr<EventSink> sink) {
    auto subscription = std::make_shared<Subscription>(_nextID++, device, std::move(sink));

    std::lock_guard lock(_mutex);
    auto list = std::make_shared<List>(*_subscriptions);
    list->push_back(subscription);
    _subscriptions = std::move(list);

    spdlog::get("logger")->debug("Subscription {} opened for device \"{}\" ({} live)",
                                 subscription->id(), device, _subscriptions->size());
    return subscription;
}

void Broadcaster::unsubscribe(Subscription & subscription) {
    subscription.close();
    removeClosed({subscription.id()});
}

void Broadcaster::closeDevice(std::string const & device) {
    std::vector<Subscription::ID> closed;
    for (auto const & subscription : *subscriptions()) {
        if (subscription->device() == device) {
            subscription->close();
            closed.push_back(subscription->id());
        }
    }
    if (!closed.empty()) removeClosed(closed);
}


void Broadcaster::broadcast(Revision revision, std::string const & data) {
    std::vector<Subscription::ID> dead;

    // Iterate over a snapshot of the list; dead subscriptions are removed afterwards
    for (auto const & subscription : *subscriptions()) {
        if (!subscription->sendFrame(revision, data)) {
            dead.push_back(subscription->id());
        }
    }

    if (!dead.empty()) removeClosed(dead);
}

std::vector<std::string> Broadcaster::keepAlive() {
    std::vector<std::string> alive;
    std::vector<Subscription::ID> dead;

    for (auto const & subscription : *subscriptions()) {
        if (subscription->sendKeepAlive()) {
            alive.push_back(subscription->device());
        } else {
            dead.push_back(subscription->id());
        }
    }

    if (!dead.empty()) removeClosed(dead);
    return alive;
}


std::vector<std::string> Broadcaster::listeningDevices() {
    std::vector<std::string> devices;
    for (auto const & subscription : *subscriptions()) {
        if (subscription->open()) devices.push_back(subscription->device());
    }
    return devices;
}


std::shared_ptr<Broadcaster::List const> Broadcaster::subscriptions() {
    std::lock_guard lock(_mutex);
    return _subscriptions;
}

std::size_t Broadcaster::size() {
    return subscriptions()->size();
}

void Broadcaster::removeClosed(std::vector<Subscription::ID> const & ids) {
    std::lock_guard lock(_mutex);
    auto list = std::make_shared<List>();
    list->reserve(_subscriptions->size());
    std::copy_if(_subscriptions->begin(), _subscriptions->end(), std::back_inserter(*list),
                 [&ids](std::shared_ptr<Subscription> const & subscription) {
        return std::find(ids.begin(), ids.end(), subscription->id()) == ids.end();
    });
    _subscriptions = std::move(list);
}
