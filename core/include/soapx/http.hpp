#pragma once

#include "soapx/options.hpp"
#include "soapx/types.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace soapx {

struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

// Cookies collected from responses, merged by name
class CookieStore {
public:
    void add(const Cookie& cookie);
    void add(const std::vector<Cookie>& cookies);

    // "name=value; other=value" or empty
    std::string fetch() const;

    std::optional<Cookie> find(const std::string& name) const;
    const std::vector<Cookie>& all() const { return cookies_; }
    bool empty() const { return cookies_.empty(); }

private:
    std::vector<Cookie> cookies_;
};

struct HttpResponse {
    int code = 0;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    // First value of the header, case-insensitive
    std::optional<std::string> header(const std::string& name) const;
    std::vector<Cookie> cookies() const;
    bool error() const { return code < 200 || code >= 300; }
};

// Transport-ready request. A plain value: copies share nothing.
struct HttpRequest {
    std::string url;
    HttpHeaders headers;
    std::string body;
    std::chrono::milliseconds open_timeout{0};  // 0 = no limit
    std::chrono::milliseconds read_timeout{0};
    std::optional<BasicAuth> basic_auth;
    bool ssl_verify = true;
    std::optional<std::string> ssl_ca_cert_file;
    CookieStore cookies;

    // Merge response cookies and rewrite the Cookie header
    void set_cookies(const HttpResponse& response);
    void set_cookies(const std::vector<Cookie>& cookies);

    static HttpRequest from_options(const GlobalOptions& globals);
};

// Executes HTTP exchanges. Implementations are selected by name through the
// adapter registry; "beast" is always registered.
class HttpAdapter {
public:
    using Factory = std::function<std::shared_ptr<HttpAdapter>()>;

    static constexpr const char* DEFAULT_ADAPTER = "beast";

    virtual ~HttpAdapter() = default;

    virtual std::string name() const = 0;

    // Blocks until the exchange completes. Throws TransportError.
    virtual HttpResponse execute(HttpMethod method, const HttpRequest& request) = 0;

    // Create a registered adapter, throws ConfigurationError for unknown names
    static std::shared_ptr<HttpAdapter> create(const std::string& name = DEFAULT_ADAPTER);

    static void register_adapter(const std::string& name, Factory factory);
    static bool is_registered(const std::string& name);
};

std::string to_string(HttpMethod method);

} // namespace soapx
