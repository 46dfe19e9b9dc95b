#pragma once

#include "soapx/options.hpp"
#include "soapx/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace soapx {

// WS-Security settings applied to outgoing envelopes and incoming responses
struct WsseSettings {
    std::optional<WsseCredentials> credentials;
    bool timestamp = false;
    bool verify_response = false;

    // Whether a wsse:Security header has to be written
    bool has_header() const { return credentials.has_value() || timestamp; }

    static WsseSettings from_options(const GlobalOptions& globals);
};

// Checks the XML digital signature carried by a response body
class SignatureVerifier {
public:
    virtual ~SignatureVerifier() = default;

    // XML-DSig verifier for wsse:Security signatures (libxml2 + OpenSSL)
    static std::unique_ptr<SignatureVerifier> create();

    virtual VerificationResult verify(const std::string& response_body) const = 0;
};

namespace xmldsig {

constexpr const char* NS = "http://www.w3.org/2000/09/xmldsig#";
constexpr const char* EXC_C14N = "http://www.w3.org/2001/10/xml-exc-c14n#";
constexpr const char* C14N = "http://www.w3.org/TR/2001/REC-xml-c14n-20010315";
constexpr const char* RSA_SHA1 = "http://www.w3.org/2000/09/xmldsig#rsa-sha1";
constexpr const char* RSA_SHA256 = "http://www.w3.org/2001/04/xmldsig-more#rsa-sha256";
constexpr const char* SHA1 = "http://www.w3.org/2000/09/xmldsig#sha1";
constexpr const char* SHA256 = "http://www.w3.org/2001/04/xmlenc#sha256";

// Exclusive canonical form of the first element with the given local name and
// namespace, in document order. Prefixes in inclusive_prefixes are rendered as
// in inclusive canonicalization. Throws VerificationError when the document
// cannot be parsed or the element is missing.
std::string canonicalize_element(const std::string& document,
                                 const std::string& local_name,
                                 const std::string& namespace_uri,
                                 const std::vector<std::string>& inclusive_prefixes = {});

} // namespace xmldsig

} // namespace soapx
