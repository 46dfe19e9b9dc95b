#include "soapx/options.hpp"
#include "soapx/errors.hpp"
#include <yaml-cpp/yaml.h>
#include <glog/logging.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace soapx {

namespace {

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (auto it = node.begin(); it != node.end(); ++it) {
                object[it->first.as<std::string>()] = yaml_to_json(it->second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(yaml_to_json(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar: {
            // Keep the YAML scalar typing: booleans and numbers stay typed
            bool flag;
            if (YAML::convert<bool>::decode(node, flag)) {
                return flag;
            }
            long long integer;
            if (YAML::convert<long long>::decode(node, integer)) {
                return integer;
            }
            double number;
            if (YAML::convert<double>::decode(node, number)) {
                return number;
            }
            return node.as<std::string>();
        }
        default:
            return nullptr;
    }
}

std::map<std::string, std::string> yaml_to_string_map(const YAML::Node& node, const std::string& key) {
    if (!node.IsMap()) {
        throw ConfigurationError("Option '" + key + "' expects a mapping");
    }
    std::map<std::string, std::string> result;
    for (auto it = node.begin(); it != node.end(); ++it) {
        result[it->first.as<std::string>()] = it->second.as<std::string>();
    }
    return result;
}

BasicAuth parse_basic_auth(const YAML::Node& node) {
    BasicAuth auth;
    if (node.IsSequence() && node.size() == 2) {
        auth.username = node[0].as<std::string>();
        auth.password = node[1].as<std::string>();
    } else if (node.IsMap()) {
        auth.username = node["username"].as<std::string>();
        auth.password = node["password"].as<std::string>("");
    } else {
        throw ConfigurationError("Option 'basic_auth' expects [username, password]");
    }
    return auth;
}

WsseCredentials parse_wsse_auth(const YAML::Node& node) {
    WsseCredentials credentials;
    if (node.IsSequence() && (node.size() == 2 || node.size() == 3)) {
        credentials.username = node[0].as<std::string>();
        credentials.password = node[1].as<std::string>();
        if (node.size() == 3) {
            credentials.digest = node[2].as<std::string>() == "digest";
        }
    } else if (node.IsMap()) {
        credentials.username = node["username"].as<std::string>();
        credentials.password = node["password"].as<std::string>("");
        credentials.digest = node["digest"].as<bool>(false);
    } else {
        throw ConfigurationError("Option 'wsse_auth' expects [username, password] or [username, password, digest]");
    }
    return credentials;
}

std::vector<std::string> split_words(const std::string& key) {
    std::vector<std::string> words;
    std::string current;
    for (char c : key) {
        if (c == '_' || c == '-') {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

std::string camelcase(const std::string& key) {
    std::string result;
    for (auto word : split_words(key)) {
        word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
        result += word;
    }
    return result;
}

std::string snakecase(const std::string& key) {
    std::string result;
    for (size_t i = 0; i < key.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(key[i]);
        if (std::isupper(c) && i > 0) {
            unsigned char prev = static_cast<unsigned char>(key[i - 1]);
            bool next_lower = i + 1 < key.size() &&
                              std::islower(static_cast<unsigned char>(key[i + 1]));
            // "fooBar" -> foo_bar, "HTTPServer" -> http_server
            if (std::islower(prev) || std::isdigit(prev) || (std::isupper(prev) && next_lower)) {
                result += '_';
            }
        }
        if (c == '-' || c == '.') {
            result += '_';
        } else {
            result += static_cast<char>(std::tolower(c));
        }
    }
    return result;
}

} // namespace

KeyConversion parse_key_conversion(const std::string& name) {
    if (name == "none") return KeyConversion::NONE;
    if (name == "lower_camelcase") return KeyConversion::LOWER_CAMELCASE;
    if (name == "camelcase") return KeyConversion::CAMELCASE;
    if (name == "snakecase") return KeyConversion::SNAKECASE;
    if (name == "upcase") return KeyConversion::UPCASE;
    throw ConfigurationError("Unknown key conversion: " + name);
}

std::string convert_key(const std::string& key, KeyConversion conversion) {
    if (key.empty()) {
        return key;
    }
    switch (conversion) {
        case KeyConversion::NONE:
            return key;
        case KeyConversion::LOWER_CAMELCASE: {
            std::string result = camelcase(key);
            if (!result.empty()) {
                result[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(result[0])));
            }
            return result;
        }
        case KeyConversion::CAMELCASE:
            return camelcase(key);
        case KeyConversion::SNAKECASE:
            return snakecase(key);
        case KeyConversion::UPCASE: {
            std::string result = key;
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return result;
        }
    }
    return key;
}

GlobalOptions GlobalOptions::from_yaml(const YAML::Node& node) {
    GlobalOptions options;
    if (!node.IsDefined()) {
        return options;
    }
    if (!node.IsMap()) {
        std::ostringstream shown;
        if (node.IsNull()) {
            shown << "null";
        } else {
            shown << YAML::Dump(node);
        }
        const char* shape = node.IsSequence() ? "sequence" : node.IsNull() ? "null" : "scalar";
        throw LegacyInitializationError(
            "Some code tries to initialize the client with " + shown.str() +
            " (" + shape + ")\n"
            "The client expects a mapping of options for creating a new client and executing requests.\n"
            "Pass {wsdl: <location>} or {endpoint: <url>, namespace: <uri>} instead.");
    }

    try {
        for (auto it = node.begin(); it != node.end(); ++it) {
            const std::string key = it->first.as<std::string>();
            const YAML::Node& value = it->second;

            if (key == "wsdl") {
                options.wsdl = value.as<std::string>();
            } else if (key == "endpoint") {
                options.endpoint = value.as<std::string>();
            } else if (key == "namespace") {
                options.namespace_uri = value.as<std::string>();
            } else if (key == "adapter") {
                options.adapter = value.as<std::string>();
            } else if (key == "soap_version") {
                int version = value.as<int>();
                if (version != 1 && version != 2) {
                    throw ConfigurationError("Invalid soap_version " + std::to_string(version) +
                                             ", expected 1 or 2");
                }
                options.soap_version = static_cast<SoapVersion>(version);
            } else if (key == "env_namespace") {
                options.env_namespace = value.as<std::string>();
            } else if (key == "namespace_identifier") {
                options.namespace_identifier = value.as<std::string>();
            } else if (key == "namespaces") {
                options.namespaces = yaml_to_string_map(value, key);
            } else if (key == "element_form_default") {
                options.element_form_default = value.as<std::string>();
            } else if (key == "soap_header") {
                options.soap_header = yaml_to_json(value);
            } else if (key == "convert_request_keys_to") {
                options.convert_request_keys_to = parse_key_conversion(value.as<std::string>());
            } else if (key == "convert_response_tags_to") {
                options.convert_response_tags_to = parse_key_conversion(value.as<std::string>());
            } else if (key == "strip_namespaces") {
                options.strip_namespaces = value.as<bool>();
            } else if (key == "encoding") {
                options.encoding = value.as<std::string>();
            } else if (key == "headers") {
                options.headers = yaml_to_string_map(value, key);
            } else if (key == "open_timeout") {
                options.open_timeout = std::chrono::seconds(value.as<int>());
            } else if (key == "read_timeout") {
                options.read_timeout = std::chrono::seconds(value.as<int>());
            } else if (key == "basic_auth") {
                options.basic_auth = parse_basic_auth(value);
            } else if (key == "ssl_verify") {
                options.ssl_verify = value.as<bool>();
            } else if (key == "ssl_ca_cert_file") {
                options.ssl_ca_cert_file = value.as<std::string>();
            } else if (key == "wsse_auth") {
                options.wsse_auth = parse_wsse_auth(value);
            } else if (key == "wsse_timestamp") {
                options.wsse_timestamp = value.as<bool>();
            } else if (key == "wsse_verify_response") {
                options.wsse_verify_response = value.as<bool>();
            } else if (key == "raise_errors") {
                options.raise_errors = value.as<bool>();
            } else if (key == "log") {
                options.log = value.as<bool>();
            } else if (key == "filters") {
                options.filters = value.as<std::vector<std::string>>();
            } else if (key == "pretty_print_xml") {
                options.pretty_print_xml = value.as<bool>();
            } else {
                LOG(WARNING) << "Ignoring unknown client option: " << key;
            }
        }
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to read client options: " << e.what();
        throw ConfigurationError("Invalid client options: " + std::string(e.what()));
    }

    return options;
}

GlobalOptions GlobalOptions::from_yaml_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open file: " + file_path);
    }

    try {
        YAML::Node document = YAML::Load(file);
        // An empty file sets no options
        if (document.IsNull()) {
            return GlobalOptions{};
        }
        return from_yaml(document);
    } catch (const YAML::ParserException& e) {
        throw ConfigurationError("Invalid YAML in " + file_path + ": " + e.what());
    }
}

} // namespace soapx
