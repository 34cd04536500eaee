#include <algorithm>
#include <spdlog/spdlog.h>

#include "../engine/engine_dispatcher.hpp"
#include "pages.hpp"
#include "v1.hpp"


char const * const v1Router::sessionCookie = "session_token";
int const v1Router::sessionCookieMaxAge = 30 * 24 * 60 * 60;


std::map<v1Router::RouteKey, std::pair<v1Router::Access, v1Router::Handler>> const v1Router::_routes{
    {{"GET",  "/"},                {Access::PUBLIC,  &v1Router::serveIndex}},
    {{"GET",  "/login"},           {Access::PUBLIC,  &v1Router::serveLogin}},
    {{"GET",  "/check-session"},   {Access::PUBLIC,  &v1Router::checkSession}},
    {{"GET",  "/app"},             {Access::SESSION, &v1Router::serveApp}},

    {{"GET",  "/player/state"},    {Access::SESSION, &v1Router::serveState}},
    {{"POST", "/player/play"},     {Access::SESSION, &v1Router::handlePlay}},
    {{"POST", "/player/pause"},    {Access::SESSION, &v1Router::handlePause}},
    {{"POST", "/player/next"},     {Access::SESSION, &v1Router::handleNext}},
    {{"POST", "/player/prev"},     {Access::SESSION, &v1Router::handlePrev}},
    {{"POST", "/player/seek"},     {Access::SESSION, &v1Router::handleSeek}},
    {{"POST", "/player/shuffle"},  {Access::SESSION, &v1Router::handleShuffle}},
    {{"POST", "/player/repeat"},   {Access::SESSION, &v1Router::handleRepeat}},
    {{"POST", "/player/enqueue"},  {Access::SESSION, &v1Router::handleEnqueue}},

    {{"GET",  "/player/devices"},  {Access::SESSION, &v1Router::serveDevices}},
    {{"POST", "/player/transfer"}, {Access::SESSION, &v1Router::handleTransfer}},
    {{"GET",  "/player/events"},   {Access::SESSION, &v1Router::serveEvents}},
    {{"POST", "/player/heartbeat"},{Access::SESSION, &v1Router::handleHeartbeat}},
    {{"POST", "/player/position"}, {Access::SESSION, &v1Router::handlePosition}}
};

std::map<v1Router::RouteKey, std::pair<v1Router::Access, v1Router::Handler>> const v1Router::_prefixRoutes{
    // Checks its own, looser, access rule
    {{"POST", "/verify/"}, {Access::PUBLIC, &v1Router::handleVerify}}
};


v1Router::v1Router(SyncService & sync)
 : _sync(sync) {}


Response v1Router::handle(Request const & request) try {
    spdlog::get("logger")->trace("{} {} from {}", request.method, request.path, request.peer);

    auto route = _routes.find({request.method, request.path});
    if (route == _routes.end()) {
        route = std::find_if(_prefixRoutes.begin(), _prefixRoutes.end(), [&request](auto const & entry) {
            auto const & [method, prefix] = entry.first;
            return method == request.method && request.path.size() > prefix.size()
                && request.path.compare(0, prefix.size(), prefix) == 0;
        });
        if (route == _prefixRoutes.end()) {
            return Response::text(404, "Not Found");
        }
    }

    auto const & [access, handler] = route->second;
    if (access == Access::SESSION && !authorized(request)) {
        return unauthorized();
    }
    return (this->*handler)(request);

} catch (BadRequest const & e) {
    spdlog::get("logger")->debug("Rejected {} {}: {}", request.method, request.path, e.what());
    return Response::json(400, {{"error", e.what()}});
} catch (nlohmann::json::exception const & e) {
    spdlog::get("logger")->debug("Rejected {} {}: {}", request.method, request.path, e.what());
    return Response::json(400, {{"error", e.what()}});
} catch (std::exception const & e) {
    spdlog::get("logger")->error("Error serving {} {}: {}", request.method, request.path, e.what());
    return Response::json(500, {{"error", "internal error"}});
}


bool v1Router::authorized(Request const & request) {
    std::optional<std::string> token = request.cookie(sessionCookie);
    return token && _sync.sessions().isAuthorized(*token, _sync.clock().now());
}

Response v1Router::unauthorized() {
    // Says nothing about why: no cookie, unknown cookie and expired session all look alike
    return Response::json(401, {{"error", "unauthorized"}});
}

Response v1Router::success() {
    return Response::json(200, {{"success", true}});
}

Response v1Router::conflict(Revision current) {
    return Response::json(409, {{"conflict", true}, {"currentRevision", current}});
}


std::string v1Router::requireParam(Request const & request, std::string const & name) {
    std::optional<std::string> value = request.param(name);
    if (!value || value->empty()) throw BadRequest(name + " required");
    return *value;
}

std::optional<int64_t> v1Router::intParam(Request const & request, std::string const & name) {
    std::optional<std::string> value = request.param(name);
    if (!value || value->empty()) return std::nullopt;

    std::size_t end;
    int64_t number;
    try {
        number = std::stoll(*value, &end);
    } catch (std::logic_error const &) {
        throw BadRequest(name + " must be an integer");
    }
    if (end != value->size()) throw BadRequest(name + " must be an integer");
    return number;
}

int64_t v1Router::requireIntParam(Request const & request, std::string const & name) {
    std::optional<int64_t> value = intParam(request, name);
    if (!value) throw BadRequest(name + " required");
    return *value;
}


Response v1Router::serveIndex(Request const & request) {
    return authorized(request) ? serveApp(request) : serveLogin(request);
}

Response v1Router::serveLogin(Request const &) {
    std::string token = _sync.sessions().issuePairingToken(_sync.clock().now());

    Response response = Response::html(pages::pairing(token));
    response.headers.emplace_back("Set-Cookie", std::string(sessionCookie) + "=" + token
                                  + "; Path=/; Max-Age=" + std::to_string(sessionCookieMaxAge));
    return response;
}

Response v1Router::serveApp(Request const &) {
    return Response::html(pages::app(_sync.localDevice()));
}

Response v1Router::checkSession(Request const & request) {
    return Response::json(200, {{"verified", authorized(request)}});
}

Response v1Router::handleVerify(Request const & request) {
    // Only the player host itself, or an already-paired client, may vouch for a new one
    if (!request.fromLoopback && !authorized(request)) {
        return unauthorized();
    }

    std::string token = request.path.substr(std::string("/verify/").size());
    if (!_sync.sessions().confirm(token, _sync.clock().now())) {
        return Response::json(400, {{"success", false}});
    }
    return success();
}


Response v1Router::serveState(Request const &) {
    return Response::json(200, _sync.currentState());
}

Response v1Router::handlePlay(Request const & request) {
    std::optional<std::string> trackId = request.param("songId");
    if (trackId && trackId->empty()) trackId.reset();

    _sync.engine().post("play", [trackId](PlaybackEngine & engine) { engine.play(trackId); });
    return success();
}

Response v1Router::handlePause(Request const &) {
    _sync.engine().post("pause", [](PlaybackEngine & engine) { engine.pause(); });
    return success();
}

Response v1Router::handleNext(Request const &) {
    _sync.engine().post("next", [](PlaybackEngine & engine) { engine.next(); });
    return success();
}

Response v1Router::handlePrev(Request const &) {
    _sync.engine().post("prev", [](PlaybackEngine & engine) { engine.prev(); });
    return success();
}

Response v1Router::handleSeek(Request const & request) {
    int64_t position = requireIntParam(request, "position");
    if (position < 0) throw BadRequest("position must not be negative");

    _sync.engine().post("seek", [position](PlaybackEngine & engine) { engine.seek(position); });
    return success();
}

Response v1Router::handleShuffle(Request const &) {
    _sync.engine().post("shuffle", [](PlaybackEngine & engine) { engine.toggleShuffle(); });
    return success();
}

Response v1Router::handleRepeat(Request const &) {
    _sync.engine().post("repeat", [](PlaybackEngine & engine) { engine.cycleRepeat(); });
    return success();
}

Response v1Router::handleEnqueue(Request const & request) {
    std::string trackId = requireParam(request, "songId");

    _sync.engine().post("enqueue", [trackId](PlaybackEngine & engine) { engine.enqueue(trackId); });
    return success();
}


Response v1Router::serveDevices(Request const & request) {
    if (std::optional<std::string> device = request.param("deviceId"); device && !device->empty()) {
        _sync.registerDevice(*device);
    }

    // Listing purges expired devices, so read the active device afterwards
    std::vector<DeviceInfo> devices = _sync.listLive();
    return Response::json(200, {
        {"activeDevice", _sync.activeDevice()},
        {"devices", devices}
    });
}

Response v1Router::handleTransfer(Request const & request) {
    std::string target = requireParam(request, "device");
    std::optional<int64_t> expected = intParam(request, "ifRevision");
    if (expected && *expected < 0) throw BadRequest("ifRevision must not be negative");

    SyncService::TransferResult result = _sync.requestTransfer(
        target, expected ? std::optional<Revision>(*expected) : std::nullopt);
    if (result.transfer.outcome == SyncService::Transfer::Outcome::CONFLICT) {
        return conflict(result.transfer.revision);
    }

    return Response::json(200, {
        {"success", true},
        {"activeDevice", result.frame.activeDevice},
        {"stateRevision", result.frame.revision},
        {"state", result.frame}
    });
}

Response v1Router::serveEvents(Request const & request) {
    std::string device = requireParam(request, "deviceId");
    if (std::optional<std::string> lastEventID = request.header("last-event-id")) {
        // Every frame is the full state, so there is nothing to replay
        spdlog::get("logger")->debug("Device \"{}\" resuming events after {}", device, *lastEventID);
    }
    return Response::eventStream(device);
}

Response v1Router::handleHeartbeat(Request const & request) {
    std::string device = requireParam(request, "deviceId");
    _sync.registerDevice(device);
    return Response::json(200, {{"success", true}, {"activeDevice", _sync.activeDevice()}});
}

Response v1Router::handlePosition(Request const & request) {
    std::string device = requireParam(request, "deviceId");
    int64_t position = requireIntParam(request, "position");
    if (position < 0) throw BadRequest("position must not be negative");
    std::optional<int64_t> expected = intParam(request, "revision");
    if (expected && *expected < 0) throw BadRequest("revision must not be negative");

    SyncService::PositionUpdate update = _sync.applyRemotePosition(
        device, position, expected ? std::optional<Revision>(*expected) : std::nullopt);
    switch (update.outcome) {
        case SyncService::PositionUpdate::Outcome::NOT_ACTIVE:
            return Response::json(403, {{"error", "not active device"},
                                        {"activeDevice", update.activeDevice}});
        case SyncService::PositionUpdate::Outcome::CONFLICT:
            return conflict(update.revision);
        case SyncService::PositionUpdate::Outcome::ACCEPTED:
            break;
    }
    return Response::json(200, {{"success", true}, {"revision", update.revision}});
}
