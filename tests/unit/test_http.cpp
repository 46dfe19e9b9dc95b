#include <gtest/gtest.h>
#include "soapx/errors.hpp"
#include "soapx/http.hpp"
#include "beast_http_adapter.hpp"
#include "test_helpers.hpp"
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace soapx;

TEST(CookieTest, ParseNameValueAndAttributes) {
    auto cookie = Cookie::parse("SESSION=abc123; Path=/; HttpOnly; Max-Age=3600");
    ASSERT_TRUE(cookie.has_value());
    EXPECT_EQ(cookie->name, "SESSION");
    EXPECT_EQ(cookie->value, "abc123");
    EXPECT_EQ(cookie->attributes.at("path"), "/");
    EXPECT_EQ(cookie->attributes.at("max-age"), "3600");
    EXPECT_TRUE(cookie->attributes.count("httponly"));
    EXPECT_EQ(cookie->name_and_value(), "SESSION=abc123");
}

TEST(CookieTest, RejectMalformedHeaders) {
    EXPECT_FALSE(Cookie::parse("").has_value());
    EXPECT_FALSE(Cookie::parse("no-pair-here").has_value());
    EXPECT_FALSE(Cookie::parse("=value").has_value());
}

TEST(CookieTest, EmptyValueIsAllowed) {
    auto cookie = Cookie::parse("cleared=; Path=/");
    ASSERT_TRUE(cookie.has_value());
    EXPECT_EQ(cookie->value, "");
}

TEST(CookieStoreTest, MergeByName) {
    CookieStore store;
    store.add(*Cookie::parse("a=1"));
    store.add(*Cookie::parse("b=2"));
    store.add(*Cookie::parse("a=3"));

    EXPECT_EQ(store.all().size(), 2u);
    EXPECT_EQ(store.fetch(), "a=3; b=2");
    EXPECT_EQ(store.find("a")->value, "3");
    EXPECT_FALSE(store.find("c").has_value());
}

TEST(HttpResponseTest, HeadersAreCaseInsensitive) {
    HttpResponse response;
    response.headers = {{"Content-Type", "text/xml"}, {"set-cookie", "a=1"}, {"Set-Cookie", "b=2; Path=/"}};

    EXPECT_EQ(response.header("content-type"), "text/xml");
    EXPECT_FALSE(response.header("SOAPAction").has_value());

    auto cookies = response.cookies();
    ASSERT_EQ(cookies.size(), 2u);
    EXPECT_EQ(cookies[0].name, "a");
    EXPECT_EQ(cookies[1].name, "b");
}

TEST(HttpResponseTest, ErrorOutsideSuccessRange) {
    HttpResponse response;
    response.code = 200;
    EXPECT_FALSE(response.error());
    response.code = 302;
    EXPECT_TRUE(response.error());
    response.code = 500;
    EXPECT_TRUE(response.error());
}

TEST(HttpRequestTest, SetCookiesRewritesCookieHeader) {
    HttpRequest request;
    HttpResponse first;
    first.headers = {{"Set-Cookie", "session=1"}};
    request.set_cookies(first);
    EXPECT_EQ(request.headers["cookie"], "session=1");

    HttpResponse second;
    second.headers = {{"Set-Cookie", "session=2"}, {"Set-Cookie", "lang=en"}};
    request.set_cookies(second);
    EXPECT_EQ(request.headers["Cookie"], "session=2; lang=en");
}

TEST(HttpRequestTest, CopiesAreIndependent) {
    HttpRequest original;
    original.headers["X-Trace"] = "1";
    original.set_cookies(std::vector<Cookie>{*Cookie::parse("a=1")});

    HttpRequest copy = original;
    copy.headers["X-Trace"] = "2";
    copy.set_cookies(std::vector<Cookie>{*Cookie::parse("b=2")});

    EXPECT_EQ(original.headers["X-Trace"], "1");
    EXPECT_EQ(original.cookies.fetch(), "a=1");
    EXPECT_EQ(copy.cookies.fetch(), "a=1; b=2");
}

TEST(HttpRequestTest, SeededFromOptions) {
    GlobalOptions options;
    options.headers["X-Client"] = "soapx";
    options.open_timeout = std::chrono::seconds(2);
    options.read_timeout = std::chrono::seconds(10);
    options.basic_auth = BasicAuth{"admin", "secret"};
    options.ssl_verify = false;

    auto request = HttpRequest::from_options(options);
    EXPECT_EQ(request.headers["x-client"], "soapx");
    EXPECT_EQ(request.open_timeout, std::chrono::milliseconds(2000));
    EXPECT_EQ(request.read_timeout, std::chrono::milliseconds(10000));
    ASSERT_TRUE(request.basic_auth.has_value());
    EXPECT_EQ(request.basic_auth->username, "admin");
    EXPECT_FALSE(request.ssl_verify);
}

TEST(HttpMethodTest, Names) {
    EXPECT_EQ(to_string(HttpMethod::GET), "GET");
    EXPECT_EQ(to_string(HttpMethod::POST), "POST");
}

TEST(ErrorKindTest, EveryKindHasDistinctName) {
    const std::vector<std::pair<ErrorKind, std::string>> expected = {
        {ErrorKind::LEGACY_CALL_SHAPE, "legacy_call_shape"},
        {ErrorKind::INSUFFICIENT_CONFIGURATION, "insufficient_configuration"},
        {ErrorKind::MISSING_CONTRACT, "missing_contract"},
        {ErrorKind::INVALID_ARGUMENT, "invalid_argument"},
        {ErrorKind::NO_PENDING_INVOCATION, "no_pending_invocation"},
        {ErrorKind::VERIFICATION_FAILED, "verification_failed"},
        {ErrorKind::UNKNOWN_OPERATION, "unknown_operation"},
        {ErrorKind::CONTRACT_INVALID, "contract_invalid"},
        {ErrorKind::CONFIGURATION_INVALID, "configuration_invalid"},
        {ErrorKind::TRANSPORT_FAILED, "transport_failed"},
        {ErrorKind::SOAP_FAULT, "soap_fault"},
        {ErrorKind::HTTP_ERROR, "http_error"},
    };
    std::set<std::string> names;
    for (const auto& entry : expected) {
        EXPECT_EQ(error_kind_name(entry.first), entry.second);
        names.insert(error_kind_name(entry.first));
    }
    EXPECT_EQ(names.size(), expected.size());
    EXPECT_EQ(names.count("unknown"), 0u);
}

TEST(HttpAdapterTest, DefaultAdapterIsRegistered) {
    EXPECT_TRUE(HttpAdapter::is_registered("beast"));
    auto adapter = HttpAdapter::create();
    ASSERT_NE(adapter, nullptr);
    EXPECT_EQ(adapter->name(), "beast");
}

TEST(HttpAdapterTest, UnknownAdapterRaisesConfigurationError) {
    try {
        HttpAdapter::create("carrier-pigeon");
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CONFIGURATION_INVALID);
    }
}

TEST(HttpAdapterTest, RegisterCustomAdapter) {
    HttpAdapter::register_adapter("fake", []() { return std::make_shared<soapx_test::FakeHttpAdapter>(); });
    EXPECT_TRUE(HttpAdapter::is_registered("fake"));
    EXPECT_EQ(HttpAdapter::create("fake")->name(), "fake");
}

TEST(ParseUrlTest, SplitComponents) {
    auto url = parse_url("http://svc.example:8080/soap/v1?wsdl");
    EXPECT_EQ(url.scheme, "http");
    EXPECT_EQ(url.host, "svc.example");
    EXPECT_EQ(url.port, "8080");
    EXPECT_EQ(url.target, "/soap/v1?wsdl");
    EXPECT_FALSE(url.secure());
}

TEST(ParseUrlTest, DefaultPortsAndTarget) {
    auto https = parse_url("HTTPS://svc.example");
    EXPECT_EQ(https.scheme, "https");
    EXPECT_EQ(https.port, "443");
    EXPECT_EQ(https.target, "/");
    EXPECT_TRUE(https.secure());

    EXPECT_EQ(parse_url("http://svc.example?x=1").target, "/?x=1");
}

TEST(ParseUrlTest, Ipv6AndUserInfo) {
    auto url = parse_url("http://user:pw@[::1]:9000/soap");
    EXPECT_EQ(url.host, "::1");
    EXPECT_EQ(url.port, "9000");
}

TEST(ParseUrlTest, RejectInvalidUrls) {
    EXPECT_THROW(parse_url("svc.example/soap"), ConfigurationError);
    EXPECT_THROW(parse_url("ftp://svc.example/"), ConfigurationError);
    EXPECT_THROW(parse_url("http:///soap"), ConfigurationError);
}
