#pragma once

#include <chrono>
#include <string>

namespace meshirc::networking {

struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;
    std::string target;   // path + query, at least "/"
};

// Throws std::invalid_argument for anything that is not http(s)://host[:port][/path].
Url parse_url(const std::string& url);

// Percent-encodes a query-string component.
std::string url_encode(const std::string& value);

struct HttpResponse {
    unsigned status = 0;
    std::string body;
};

// Blocking GET with an overall deadline. Network and TLS failures throw
// boost::system::system_error; non-2xx statuses are returned, not thrown.
HttpResponse http_get(const std::string& url,
                      std::chrono::seconds timeout,
                      const std::string& user_agent);

} // namespace meshirc::networking
