#include "response.hpp"


Response Response::json(int status, nlohmann::json const & body) {
    return Response{status, "application/json", body.dump(), {}, std::nullopt};
}

Response Response::html(std::string const & body) {
    return Response{200, "text/html; charset=utf-8", body, {}, std::nullopt};
}

Response Response::text(int status, std::string const & body) {
    return Response{status, "text/plain; charset=utf-8", body, {}, std::nullopt};
}

Response Response::eventStream(std::string const & device) {
    return Response{200, "text/event-stream", "", {
        {"Cache-Control", "no-cache"},
        {"X-Accel-Buffering", "no"} // Keep reverse proxies from sitting on frames
    }, device};
}


char const * Response::reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 409: return "Conflict";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}


std::string Response::serialize(bool keepAlive) const {
    std::string data = "HTTP/1.1 " + std::to_string(status) + " " + reason(status) + "\r\n";
    data += "Content-Type: " + contentType + "\r\n";
    data += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    data += keepAlive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    for (auto const & [name, value] : headers) {
        data += name + ": " + value + "\r\n";
    }
    data += "\r\n";
    data += body;
    return data;
}

std::string Response::serializeStreamHead() const {
    std::string data = "HTTP/1.1 " + std::to_string(status) + " " + reason(status) + "\r\n";
    data += "Content-Type: " + contentType + "\r\n";
    data += "Connection: keep-alive\r\n";
    for (auto const & [name, value] : headers) {
        data += name + ": " + value + "\r\n";
    }
    data += "\r\n";
    return data;
}
