#pragma once

#include "soapx/wsse.hpp"
#include <libxml/tree.h>
#include <chrono>
#include <string>

namespace soapx {
namespace wsse {

constexpr const char* SECEXT_NS =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-secext-1.0.xsd";
constexpr const char* UTILITY_NS =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-utility-1.0.xsd";
constexpr const char* PASSWORD_TEXT =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-username-token-profile-1.0#PasswordText";
constexpr const char* PASSWORD_DIGEST =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-username-token-profile-1.0#PasswordDigest";
constexpr const char* BASE64_ENCODING =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-soap-message-security-1.0#Base64Binary";

constexpr std::chrono::seconds TIMESTAMP_TTL{60};

// Base64(SHA1(nonce + created + password)) with the raw nonce bytes
std::string password_digest(const std::string& nonce,
                            const std::string& created,
                            const std::string& password);

// xsd:dateTime in UTC, e.g. 2024-01-31T12:00:00Z
std::string format_timestamp(std::chrono::system_clock::time_point time);

// Append wsse:Security to an env:Header element
void append_security_header(xmlNode* header, xmlNs* env_ns, const WsseSettings& wsse);

} // namespace wsse
} // namespace soapx
