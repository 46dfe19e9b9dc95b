#include "beast_http_adapter.hpp"
#include "crypto_utils.hpp"
#include "soapx/errors.hpp"
#include <glog/logging.h>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <algorithm>
#include <cctype>
#include <chrono>

namespace soapx {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr std::uint64_t MAX_RESPONSE_BODY = 64 * 1024 * 1024;
constexpr const char* USER_AGENT = "soapx/0.1";

// Run the handlers queued on the context until the pending operation is done
void run_pending(net::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

void arm_timer(beast::tcp_stream& stream, std::chrono::milliseconds timeout) {
    if (timeout.count() > 0) {
        stream.expires_after(timeout);
    } else {
        stream.expires_never();
    }
}

void check(const beast::error_code& ec, const std::string& step, const ParsedUrl& url) {
    if (!ec) {
        return;
    }
    std::string reason = ec == beast::error::timeout ? "timed out" : ec.message();
    LOG(ERROR) << "HTTP " << step << " failed for " << url.host << ":" << url.port << ": " << reason;
    throw TransportError("HTTP " + step + " to " + url.host + ":" + url.port + " failed: " + reason);
}

http::request<http::string_body> make_request(HttpMethod method,
                                              const HttpRequest& request,
                                              const ParsedUrl& url) {
    http::request<http::string_body> req{
        method == HttpMethod::GET ? http::verb::get : http::verb::post, url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, USER_AGENT);
    req.set(http::field::connection, "close");

    if (request.basic_auth) {
        req.set(http::field::authorization,
                "Basic " + crypto::base64_encode(request.basic_auth->username + ":" +
                                                 request.basic_auth->password));
    }
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (method == HttpMethod::POST || !request.body.empty()) {
        req.body() = request.body;
        req.prepare_payload();
    }
    return req;
}

template <typename Stream>
HttpResponse exchange(net::io_context& ioc,
                      Stream& stream,
                      http::request<http::string_body>& req,
                      const HttpRequest& request,
                      const ParsedUrl& url) {
    beast::error_code ec;
    auto& lowest = beast::get_lowest_layer(stream);

    arm_timer(lowest, request.read_timeout);
    http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
    run_pending(ioc);
    check(ec, "write", url);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_RESPONSE_BODY);
    arm_timer(lowest, request.read_timeout);
    http::async_read(stream, buffer, parser, [&ec](beast::error_code e, std::size_t) { ec = e; });
    run_pending(ioc);
    check(ec, "read", url);

    auto& res = parser.get();
    HttpResponse response;
    response.code = static_cast<int>(res.result_int());
    for (const auto& field : res) {
        auto name = field.name_string();
        auto value = field.value();
        response.headers.emplace_back(std::string(name.data(), name.size()),
                                      std::string(value.data(), value.size()));
    }
    response.body = res.body();
    return response;
}

void close_socket(tcp::socket& socket) {
    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        VLOG(2) << "Socket shutdown: " << ec.message();
    }
}

} // namespace

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl parsed;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw ConfigurationError("Invalid URL (missing scheme): " + url);
    }
    parsed.scheme = url.substr(0, scheme_end);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw ConfigurationError("Unsupported URL scheme: " + parsed.scheme);
    }

    std::string rest = url.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    parsed.target = path_start == std::string::npos ? "/" : rest.substr(path_start);
    if (parsed.target[0] == '?') {
        parsed.target = "/" + parsed.target;
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw ConfigurationError("Invalid URL host: " + url);
        }
        parsed.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            parsed.port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        parsed.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            parsed.port = authority.substr(colon + 1);
        }
    }

    if (parsed.host.empty()) {
        throw ConfigurationError("Invalid URL (missing host): " + url);
    }
    if (parsed.port.empty()) {
        parsed.port = parsed.secure() ? "443" : "80";
    }
    return parsed;
}

HttpResponse BeastHttpAdapter::execute(HttpMethod method, const HttpRequest& request) {
    ParsedUrl url = parse_url(request.url);
    VLOG(1) << to_string(method) << " " << url.scheme << "://" << url.host << ":" << url.port << url.target;

    net::io_context ioc;
    beast::error_code ec;

    tcp::resolver resolver(ioc);
    auto endpoints = resolver.resolve(url.host, url.port, ec);
    check(ec, "resolve", url);

    auto req = make_request(method, request, url);

    if (!url.secure()) {
        beast::tcp_stream stream(ioc);
        arm_timer(stream, request.open_timeout);
        stream.async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        run_pending(ioc);
        check(ec, "connect", url);

        HttpResponse response = exchange(ioc, stream, req, request, url);
        close_socket(stream.socket());
        return response;
    }

    ssl::context context(ssl::context::tls_client);
    if (request.ssl_verify) {
        context.set_verify_mode(ssl::verify_peer);
        if (request.ssl_ca_cert_file) {
            context.load_verify_file(*request.ssl_ca_cert_file, ec);
            check(ec, "loading CA file " + *request.ssl_ca_cert_file, url);
        } else {
            context.set_default_verify_paths(ec);
            check(ec, "loading default CA paths", url);
        }
    } else {
        context.set_verify_mode(ssl::verify_none);
    }

    beast::ssl_stream<beast::tcp_stream> stream(ioc, context);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        throw TransportError("Failed to set SNI host name " + url.host);
    }
    if (request.ssl_verify && SSL_set1_host(stream.native_handle(), url.host.c_str()) != 1) {
        throw TransportError("Failed to enable host name verification for " + url.host);
    }

    auto& lowest = beast::get_lowest_layer(stream);
    arm_timer(lowest, request.open_timeout);
    lowest.async_connect(endpoints, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    run_pending(ioc);
    check(ec, "connect", url);

    arm_timer(lowest, request.open_timeout);
    stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) { ec = e; });
    run_pending(ioc);
    check(ec, "TLS handshake", url);

    HttpResponse response = exchange(ioc, stream, req, request, url);
    close_socket(lowest.socket());
    return response;
}

} // namespace soapx
