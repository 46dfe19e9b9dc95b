#pragma once

#include "soapx/options.hpp"
#include "soapx/types.hpp"
#include "soapx/wsse.hpp"
#include <string>

namespace soapx {

constexpr const char* SOAP11_ENVELOPE_NS = "http://schemas.xmlsoap.org/soap/envelope/";
constexpr const char* SOAP12_ENVELOPE_NS = "http://www.w3.org/2003/05/soap-envelope";

const char* envelope_namespace(SoapVersion version);

// Serializes the SOAP envelope for one request
class EnvelopeBuilder {
public:
    EnvelopeBuilder(const GlobalOptions& globals, const LocalOptions& locals, const WsseSettings& wsse);

    void set_target_namespace(std::string namespace_uri) { target_namespace_ = std::move(namespace_uri); }
    void set_input(std::string tag, std::string namespace_uri);
    void set_element_form_default(std::string form) { element_form_default_ = std::move(form); }
    void set_soap_version(SoapVersion version) { soap_version_ = version; }

    // locals.xml verbatim when given, the generated envelope otherwise
    std::string to_xml() const;

private:
    const GlobalOptions& globals_;
    const LocalOptions& locals_;
    const WsseSettings& wsse_;

    std::string target_namespace_;
    std::string input_tag_;
    std::string input_namespace_;
    std::string element_form_default_ = "unqualified";
    SoapVersion soap_version_;
};

} // namespace soapx
