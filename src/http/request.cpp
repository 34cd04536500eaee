#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "request.hpp"


std::size_t const RequestParser::maxHeadSize = 16 * 1024;
std::size_t const RequestParser::maxBodySize = 1024 * 1024;


static std::string toLower(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return lower;
}

static std::string_view trim(std::string_view str) {
    while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) str.remove_prefix(1);
    while (!str.empty() && (str.back() == ' ' || str.back() == '\t' || str.back() == '\r')) {
        str.remove_suffix(1);
    }
    return str;
}


std::optional<std::string> Request::header(std::string const & name) const {
    auto iter = headers.find(toLower(name));
    if (iter == headers.end()) return std::nullopt;
    return iter->second;
}

std::optional<std::string> Request::cookie(std::string const & name) const {
    std::optional<std::string> cookies = header("cookie");
    if (!cookies) return std::nullopt;

    std::string_view remaining(*cookies);
    while (!remaining.empty()) {
        auto end = remaining.find(';');
        std::string_view pair = trim(remaining.substr(0, end));
        remaining = end == remaining.npos ? std::string_view() : remaining.substr(end + 1);

        auto equals = pair.find('=');
        if (equals != pair.npos && trim(pair.substr(0, equals)) == name) {
            return std::string(trim(pair.substr(equals + 1)));
        }
    }
    return std::nullopt;
}

std::optional<std::string> Request::param(std::string const & name) const {
    auto iter = params.find(name);
    if (iter == params.end()) return std::nullopt;
    return iter->second;
}

bool Request::keepAlive() const {
    // HTTP/1.1 defaults to persistent connections
    std::optional<std::string> connection = header("connection");
    return !connection || toLower(*connection) != "close";
}


std::string urlDecode(std::string_view str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '+') {
            decoded += ' ';
        } else if (str[i] == '%' && i + 2 < str.size()
                && std::isxdigit(static_cast<unsigned char>(str[i + 1]))
                && std::isxdigit(static_cast<unsigned char>(str[i + 2]))) {
            decoded += static_cast<char>(std::stoi(std::string(str.substr(i + 1, 2)), nullptr, 16));
            i += 2;
        } else {
            decoded += str[i];
        }
    }
    return decoded;
}

void parseUrlEncoded(std::string_view str, std::map<std::string, std::string> & into) {
    while (!str.empty()) {
        auto end = str.find('&');
        std::string_view pair = str.substr(0, end);
        str = end == str.npos ? std::string_view() : str.substr(end + 1);
        if (pair.empty()) continue;

        auto equals = pair.find('=');
        if (equals == pair.npos) {
            into.insert_or_assign(urlDecode(pair), "");
        } else {
            into.insert_or_assign(urlDecode(pair.substr(0, equals)), urlDecode(pair.substr(equals + 1)));
        }
    }
}


std::optional<Request> RequestParser::next() {
    auto headEnd = _pending.find("\r\n\r\n");
    if (headEnd == _pending.npos) {
        if (_pending.size() > maxHeadSize) throw Malformed("request head too large");
        return std::nullopt;
    }

    Request request;
    std::string_view head(_pending.data(), headEnd);

    // Request line
    auto lineEnd = head.find("\r\n");
    std::string_view requestLine = head.substr(0, lineEnd);
    auto firstSpace = requestLine.find(' ');
    auto lastSpace = requestLine.rfind(' ');
    if (firstSpace == requestLine.npos || lastSpace == firstSpace) {
        throw Malformed("bad request line");
    }
    request.method = std::string(requestLine.substr(0, firstSpace));
    std::string_view target = requestLine.substr(firstSpace + 1, lastSpace - firstSpace - 1);
    if (requestLine.substr(lastSpace + 1).substr(0, 5) != "HTTP/") {
        throw Malformed("bad protocol version");
    }

    auto queryStart = target.find('?');
    request.path = urlDecode(target.substr(0, queryStart));
    if (queryStart != target.npos) parseUrlEncoded(target.substr(queryStart + 1), request.params);

    // Header lines
    std::string_view lines = lineEnd == head.npos ? std::string_view() : head.substr(lineEnd + 2);
    while (!lines.empty()) {
        auto end = lines.find("\r\n");
        std::string_view line = lines.substr(0, end);
        lines = end == lines.npos ? std::string_view() : lines.substr(end + 2);

        auto colon = line.find(':');
        if (colon == line.npos) throw Malformed("bad header line");
        request.headers.insert_or_assign(toLower(trim(line.substr(0, colon))),
                                         std::string(trim(line.substr(colon + 1))));
    }

    std::size_t bodySize = 0;
    if (std::optional<std::string> length = request.header("content-length")) {
        // Digits only: stoul would also take signs, whitespace and trailing junk
        if (length->empty() || length->find_first_not_of("0123456789") != std::string::npos) {
            throw Malformed("bad Content-Length");
        }
        try {
            bodySize = std::stoul(*length);
        } catch (std::out_of_range const &) {
            throw Malformed("bad Content-Length");
        }
        if (bodySize > maxBodySize) throw Malformed("request body too large");
    } else if (request.header("transfer-encoding")) {
        throw Malformed("chunked request bodies are not supported");
    }

    std::size_t const total = headEnd + 4 + bodySize;
    if (_pending.size() < total) return std::nullopt; // Body still incoming

    request.body = _pending.substr(headEnd + 4, bodySize);
    _pending.erase(0, total);

    parseParams(request);
    return request;
}

void RequestParser::parseParams(Request & request) {
    if (request.body.empty()) return;

    std::string contentType = toLower(request.header("content-type").value_or(""));
    if (contentType.rfind("application/x-www-form-urlencoded", 0) == 0) {
        parseUrlEncoded(request.body, request.params);

    } else if (contentType.rfind("application/json", 0) == 0) {
        nlohmann::json body;
        try {
            body = nlohmann::json::parse(request.body);
        } catch (nlohmann::json::parse_error const & e) {
            throw BadRequest(std::string("malformed JSON body: ") + e.what());
        }
        if (!body.is_object()) throw BadRequest("JSON body must be an object");

        for (auto const & [key, value] : body.items()) {
            if (value.is_null()) continue;
            request.params.insert_or_assign(key, value.is_string() ? value.get<std::string>()
                                                                   : value.dump());
        }
    }
}
