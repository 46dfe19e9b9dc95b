#include "soapx/response.hpp"
#include "xml_utils.hpp"
#include <glog/logging.h>

namespace soapx {

namespace {

struct FaultDetails {
    std::string code;
    std::string reason;
};

xmlNode* find_fault(xmlDoc* doc) {
    xmlNode* root = xmlDocGetRootElement(doc);
    if (!xml::is_element(root, "Envelope")) {
        return nullptr;
    }
    return xml::first_child(xml::first_child(root, "Body"), "Fault");
}

// SOAP 1.2 Code/Value and Reason/Text or SOAP 1.1 faultcode/faultstring.
// Servers answering in the other version's format are accepted.
FaultDetails fault_details(xmlNode* fault, SoapVersion version) {
    FaultDetails details;
    xmlNode* code12 = xml::first_child(fault, "Code");
    xmlNode* code11 = xml::first_child(fault, "faultcode");
    if (code12 && (version == SoapVersion::SOAP_12 || !code11)) {
        details.code = xml::text(xml::first_child(code12, "Value"));
        details.reason = xml::text(xml::first_child(xml::first_child(fault, "Reason"), "Text"));
        return details;
    }
    details.code = xml::text(code11);
    details.reason = xml::text(xml::first_child(fault, "faultstring"));
    return details;
}

std::string http_error_message(const HttpResponse& http) {
    std::string message = "HTTP error (" + std::to_string(http.code) + ")";
    if (!http.body.empty()) {
        message += ": " + http.body;
    }
    return message;
}

} // namespace

SoapFault::SoapFault(HttpResponse http, std::string fault_code, std::string fault_reason)
    : Error(ErrorKind::SOAP_FAULT, "(" + fault_code + ") " + fault_reason),
      http_(std::move(http)),
      fault_code_(std::move(fault_code)),
      fault_reason_(std::move(fault_reason)) {}

HttpError::HttpError(HttpResponse http)
    : Error(ErrorKind::HTTP_ERROR, http_error_message(http)),
      http_(std::move(http)) {}

Response::Response(HttpResponse http, const GlobalOptions& globals)
    : http_(std::move(http)),
      soap_version_(globals.soap_version),
      strip_namespaces_(globals.strip_namespaces),
      convert_tags_to_(globals.convert_response_tags_to) {
    if (globals.raise_errors) {
        raise_errors();
    }
}

bool Response::soap_fault() const {
    if (http_.body.find("Fault>") == std::string::npos) {
        return false;
    }
    auto doc = xml::parse(http_.body);
    return doc && find_fault(doc.get()) != nullptr;
}

bool Response::http_error() const {
    return http_.error();
}

void Response::raise_errors() const {
    if (soap_fault()) {
        auto doc = xml::parse(http_.body);
        FaultDetails details = fault_details(find_fault(doc.get()), soap_version_);
        LOG(WARNING) << "SOAP fault (" << details.code << "): " << details.reason;
        throw SoapFault(http_, details.code, details.reason);
    }
    if (http_error()) {
        LOG(WARNING) << "HTTP error " << http_.code << " for SOAP request";
        throw HttpError(http_);
    }
}

nlohmann::json Response::hash() const {
    auto doc = xml::parse(http_.body);
    if (!doc) {
        if (!http_.body.empty()) {
            LOG(WARNING) << "Response body is not well-formed XML";
        }
        return nlohmann::json::object();
    }
    xmlNode* root = xmlDocGetRootElement(doc.get());
    nlohmann::json result = nlohmann::json::object();
    result[xml::json_key(root, strip_namespaces_, convert_tags_to_)] =
        xml::to_json(root, strip_namespaces_, convert_tags_to_);
    return result;
}

nlohmann::json Response::header() const {
    return envelope_section("Header");
}

nlohmann::json Response::body() const {
    return envelope_section("Body");
}

nlohmann::json Response::envelope_section(const std::string& local_name) const {
    auto doc = xml::parse(http_.body);
    if (!doc) {
        return nlohmann::json::object();
    }
    xmlNode* section = xml::first_child(xmlDocGetRootElement(doc.get()), local_name.c_str());
    if (!section) {
        return nlohmann::json::object();
    }
    nlohmann::json value = xml::to_json(section, strip_namespaces_, convert_tags_to_);
    return value.is_object() ? value : nlohmann::json::object();
}

} // namespace soapx
