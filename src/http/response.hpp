#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>


struct Response {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    // Set when the connection should turn into an event stream for this device
    std::optional<std::string> eventStreamDevice;

    static Response json(int status, nlohmann::json const & body);
    static Response html(std::string const & body);
    static Response text(int status, std::string const & body);
    static Response eventStream(std::string const & device);

    static char const * reason(int status);

    std::string serialize(bool keepAlive) const;
    // Only the head: an event stream's body never ends
    std::string serializeStreamHead() const;
};


#endif
