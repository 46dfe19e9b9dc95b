#pragma once

#include "soapx/types.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace soapx {

// Client-wide options. Every recognized option is an explicit field; the
// optional ones are only applied when they were actually set.
struct GlobalOptions {
    // Contract resolution
    std::optional<std::string> wsdl;           // path, URL or inline XML
    std::optional<std::string> endpoint;
    std::optional<std::string> namespace_uri;
    std::optional<std::string> adapter;

    // Envelope
    SoapVersion soap_version = SoapVersion::SOAP_11;
    std::string env_namespace = "env";
    std::string namespace_identifier = "wsdl";
    std::map<std::string, std::string> namespaces;  // "xmlns:foo" -> uri
    std::optional<std::string> element_form_default;
    nlohmann::json soap_header;
    KeyConversion convert_request_keys_to = KeyConversion::LOWER_CAMELCASE;
    KeyConversion convert_response_tags_to = KeyConversion::SNAKECASE;
    bool strip_namespaces = true;
    std::string encoding = "UTF-8";

    // HTTP
    std::map<std::string, std::string> headers;
    std::optional<std::chrono::seconds> open_timeout;
    std::optional<std::chrono::seconds> read_timeout;
    std::optional<BasicAuth> basic_auth;
    bool ssl_verify = true;
    std::optional<std::string> ssl_ca_cert_file;

    // WS-Security
    std::optional<WsseCredentials> wsse_auth;
    bool wsse_timestamp = false;
    bool wsse_verify_response = false;

    // Behaviour
    bool raise_errors = true;
    bool log = false;
    std::vector<std::string> filters;
    bool pretty_print_xml = false;

    // Build options from a YAML mapping. A scalar or sequence node is the
    // pre-2.0 calling convention and raises LegacyInitializationError.
    static GlobalOptions from_yaml(const YAML::Node& node);
    static GlobalOptions from_yaml_file(const std::string& file_path);
};

// Per-call options
struct LocalOptions {
    nlohmann::json message;
    std::optional<std::string> message_tag;
    std::map<std::string, std::string> attributes;
    std::optional<std::string> soap_action;
    nlohmann::json soap_header;
    std::vector<Cookie> cookies;
    std::optional<std::string> xml;
    std::map<std::string, std::string> headers;
};

// Evaluated against the options before they are validated
using OptionsCustomizer = std::function<void(GlobalOptions&)>;

KeyConversion parse_key_conversion(const std::string& name);
std::string convert_key(const std::string& key, KeyConversion conversion);

} // namespace soapx
