#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace soapx {

// SOAP protocol version used for envelopes and content types
enum class SoapVersion {
    SOAP_11 = 1,
    SOAP_12 = 2
};

// Tag conversion applied to request keys and response tags
enum class KeyConversion {
    NONE,
    LOWER_CAMELCASE,
    CAMELCASE,
    SNAKECASE,
    UPCASE
};

enum class HttpMethod {
    GET,
    POST
};

struct BasicAuth {
    std::string username;
    std::string password;
};

// WS-Security UsernameToken credentials
struct WsseCredentials {
    std::string username;
    std::string password;
    bool digest = false;
};

// HTTP cookie as received in a Set-Cookie header
struct Cookie {
    std::string name;
    std::string value;
    std::map<std::string, std::string> attributes;  // path, domain, expires, ...

    std::string name_and_value() const { return name + "=" + value; }

    // Parse a Set-Cookie header value; empty when no name=value pair is present
    static std::optional<Cookie> parse(const std::string& set_cookie_header);
};

// Operation metadata extracted from a service description
struct OperationInfo {
    std::string name;
    std::string soap_action;
    std::string input_tag;
    std::string input_namespace;
    std::string output_tag;
};

// Outcome of a response signature check
struct VerificationResult {
    bool valid = true;
    std::vector<std::string> errors;
};

} // namespace soapx
