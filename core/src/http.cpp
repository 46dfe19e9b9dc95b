#include "soapx/http.hpp"
#include "soapx/errors.hpp"
#include "beast_http_adapter.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <unordered_map>

namespace soapx {

namespace {

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

struct AdapterRegistry {
    std::mutex mutex;
    std::unordered_map<std::string, HttpAdapter::Factory> factories;

    AdapterRegistry() {
        factories[HttpAdapter::DEFAULT_ADAPTER] = []() {
            return std::make_shared<BeastHttpAdapter>();
        };
    }
};

AdapterRegistry& registry() {
    static AdapterRegistry instance;
    return instance;
}

} // namespace

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
}

std::optional<Cookie> Cookie::parse(const std::string& set_cookie_header) {
    Cookie cookie;
    size_t start = 0;
    bool first = true;

    while (start <= set_cookie_header.size()) {
        size_t end = set_cookie_header.find(';', start);
        if (end == std::string::npos) {
            end = set_cookie_header.size();
        }
        std::string part = trim(set_cookie_header.substr(start, end - start));
        start = end + 1;

        if (part.empty()) {
            if (first) {
                return std::nullopt;
            }
            continue;
        }

        auto eq = part.find('=');
        if (first) {
            if (eq == std::string::npos || eq == 0) {
                return std::nullopt;
            }
            cookie.name = trim(part.substr(0, eq));
            cookie.value = trim(part.substr(eq + 1));
            first = false;
        } else if (eq == std::string::npos) {
            cookie.attributes[lowercase(part)] = "";
        } else {
            cookie.attributes[lowercase(trim(part.substr(0, eq)))] = trim(part.substr(eq + 1));
        }
    }

    if (first) {
        return std::nullopt;
    }
    return cookie;
}

void CookieStore::add(const Cookie& cookie) {
    auto it = std::find_if(cookies_.begin(), cookies_.end(),
                           [&cookie](const Cookie& existing) { return existing.name == cookie.name; });
    if (it != cookies_.end()) {
        *it = cookie;
    } else {
        cookies_.push_back(cookie);
    }
}

void CookieStore::add(const std::vector<Cookie>& cookies) {
    for (const auto& cookie : cookies) {
        add(cookie);
    }
}

std::string CookieStore::fetch() const {
    std::string header;
    for (const auto& cookie : cookies_) {
        if (!header.empty()) {
            header += "; ";
        }
        header += cookie.name_and_value();
    }
    return header;
}

std::optional<Cookie> CookieStore::find(const std::string& name) const {
    for (const auto& cookie : cookies_) {
        if (cookie.name == name) {
            return cookie;
        }
    }
    return std::nullopt;
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    CaseInsensitiveLess less;
    for (const auto& [key, value] : headers) {
        if (!less(key, name) && !less(name, key)) {
            return value;
        }
    }
    return std::nullopt;
}

std::vector<Cookie> HttpResponse::cookies() const {
    std::vector<Cookie> result;
    for (const auto& [key, value] : headers) {
        if (lowercase(key) != "set-cookie") {
            continue;
        }
        auto cookie = Cookie::parse(value);
        if (cookie) {
            result.push_back(*cookie);
        } else {
            LOG(WARNING) << "Ignoring malformed Set-Cookie header: " << value;
        }
    }
    return result;
}

void HttpRequest::set_cookies(const HttpResponse& response) {
    set_cookies(response.cookies());
}

void HttpRequest::set_cookies(const std::vector<Cookie>& new_cookies) {
    if (new_cookies.empty()) {
        return;
    }
    cookies.add(new_cookies);
    headers["Cookie"] = cookies.fetch();
}

HttpRequest HttpRequest::from_options(const GlobalOptions& globals) {
    HttpRequest request;
    for (const auto& [name, value] : globals.headers) {
        request.headers[name] = value;
    }
    if (globals.open_timeout) {
        request.open_timeout = *globals.open_timeout;
    }
    if (globals.read_timeout) {
        request.read_timeout = *globals.read_timeout;
    }
    request.basic_auth = globals.basic_auth;
    request.ssl_verify = globals.ssl_verify;
    request.ssl_ca_cert_file = globals.ssl_ca_cert_file;
    return request;
}

std::shared_ptr<HttpAdapter> HttpAdapter::create(const std::string& name) {
    Factory factory;
    {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        auto it = reg.factories.find(name);
        if (it == reg.factories.end()) {
            throw ConfigurationError("Unknown HTTP adapter: " + name);
        }
        factory = it->second;
    }
    VLOG(1) << "Creating HTTP adapter: " << name;
    return factory();
}

void HttpAdapter::register_adapter(const std::string& name, Factory factory) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.factories[name] = std::move(factory);
    LOG(INFO) << "Registered HTTP adapter: " << name;
}

bool HttpAdapter::is_registered(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.factories.count(name) > 0;
}

std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
    }
    return "POST";
}

} // namespace soapx
