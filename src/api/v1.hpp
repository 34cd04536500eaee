#ifndef API_V1_HPP
#define API_V1_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>

#include "../http/request.hpp"
#include "../http/response.hpp"
#include "../sync/sync_service.hpp"


// Maps the browser-facing HTTP API onto the sync service
class v1Router {
public:
    static char const * const sessionCookie;
    static int const sessionCookieMaxAge;

private:
    using Handler = Response (v1Router::*)(Request const &);

    enum class Access {
        PUBLIC,
        SESSION // Requires a confirmed session cookie
    };

    using RouteKey = std::pair<std::string, std::string>; // Method, path
    static std::map<RouteKey, std::pair<Access, Handler>> const _routes;
    // Routes taking the rest of the path as their argument
    static std::map<RouteKey, std::pair<Access, Handler>> const _prefixRoutes;

    SyncService & _sync;

public:
    v1Router(SyncService & sync);

    // Never throws: every failure becomes an error response
    Response handle(Request const & request);

private:
    bool authorized(Request const & request);
    static Response unauthorized();
    static Response success();
    static Response conflict(Revision current);

    static std::string requireParam(Request const & request, std::string const & name);
    static std::optional<int64_t> intParam(Request const & request, std::string const & name);
    static int64_t requireIntParam(Request const & request, std::string const & name);

    // Pairing
    Response serveIndex(Request const & request);
    Response serveLogin(Request const & request);
    Response serveApp(Request const & request);
    Response checkSession(Request const & request);
    Response handleVerify(Request const & request);

    // Playback control, all queued to the engine
    Response serveState(Request const & request);
    Response handlePlay(Request const & request);
    Response handlePause(Request const & request);
    Response handleNext(Request const & request);
    Response handlePrev(Request const & request);
    Response handleSeek(Request const & request);
    Response handleShuffle(Request const & request);
    Response handleRepeat(Request const & request);
    Response handleEnqueue(Request const & request);

    // Device sync
    Response serveDevices(Request const & request);
    Response handleTransfer(Request const & request);
    Response serveEvents(Request const & request);
    Response handleHeartbeat(Request const & request);
    Response handlePosition(Request const & request);
};


#endif
