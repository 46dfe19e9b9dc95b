#pragma once

#include "soapx/http.hpp"
#include <string>

namespace soapx {

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;  // path and query, at least "/"

    bool secure() const { return scheme == "https"; }
};

// Throws ConfigurationError for anything but http(s)://host[:port][/path]
ParsedUrl parse_url(const std::string& url);

// Synchronous HTTP/1.1 client on Boost.Beast, TLS through Boost.Asio SSL.
// One connection per exchange.
class BeastHttpAdapter : public HttpAdapter {
public:
    std::string name() const override { return DEFAULT_ADAPTER; }

    HttpResponse execute(HttpMethod method, const HttpRequest& request) override;
};

} // namespace soapx
