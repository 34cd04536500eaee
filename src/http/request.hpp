#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>


// The request could not be served as sent; the message is shown to the client
class BadRequest : public std::runtime_error {
public:
    BadRequest(std::string const & what) : std::runtime_error(what) {}
};


struct Request {
    std::string method;
    std::string path; // Decoded, without the query string
    std::map<std::string, std::string> headers; // Names are lowercased
    std::string body;
    // Query string, form body and JSON object body, merged in that order
    std::map<std::string, std::string> params;

    std::string peer;
    bool fromLoopback = false;

    std::optional<std::string> header(std::string const & name) const;
    std::optional<std::string> cookie(std::string const & name) const;
    std::optional<std::string> param(std::string const & name) const;
    bool keepAlive() const;
};


std::string urlDecode(std::string_view str);
void parseUrlEncoded(std::string_view str, std::map<std::string, std::string> & into);


// Accumulates bytes off a connection and cuts them into requests
class RequestParser {
public:
    static std::size_t const maxHeadSize;
    static std::size_t const maxBodySize;

    // Thrown when the stream itself is broken; the connection cannot continue
    class Malformed : public std::runtime_error {
    public:
        Malformed(std::string const & what) : std::runtime_error(what) {}
    };

private:
    std::string _pending; // Partial requests are stored here

public:
    void feed(std::string_view data) { _pending.append(data); }
    bool empty() const { return _pending.empty(); }

    // Returns the next complete request, if any; throws `BadRequest` for a complete request whose
    // body cannot be parsed (the request is consumed)
    std::optional<Request> next();

private:
    static void parseParams(Request & request);
};


#endif
