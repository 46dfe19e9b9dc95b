#include "soapx/wsdl.hpp"
#include "soapx/errors.hpp"
#include "xml_utils.hpp"
#include <glog/logging.h>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace soapx {

namespace {

constexpr const char* WSDL_NS = "http://schemas.xmlsoap.org/wsdl/";
constexpr const char* SOAP11_BINDING_NS = "http://schemas.xmlsoap.org/wsdl/soap/";
constexpr const char* SOAP12_BINDING_NS = "http://schemas.xmlsoap.org/wsdl/soap12/";
constexpr const char* XSD_NS = "http://www.w3.org/2001/XMLSchema";

std::string strip_prefix(const std::string& qname) {
    auto colon = qname.find(':');
    return colon == std::string::npos ? qname : qname.substr(colon + 1);
}

// Namespace bound to the prefix of a qualified name in the scope of node
std::string resolve_namespace(xmlDoc* doc, xmlNode* node, const std::string& qname) {
    auto colon = qname.find(':');
    const xmlChar* prefix = nullptr;
    std::string prefix_str;
    if (colon != std::string::npos) {
        prefix_str = qname.substr(0, colon);
        prefix = reinterpret_cast<const xmlChar*>(prefix_str.c_str());
    }
    xmlNs* ns = xmlSearchNs(doc, node, prefix);
    return ns && ns->href ? reinterpret_cast<const char*>(ns->href) : "";
}

} // namespace

class WsdlParserImpl : public WsdlParser {
public:
    explicit WsdlParserImpl(const std::string& wsdl_xml)
        : wsdl_xml_(wsdl_xml) {
        doc_ = xml::parse(wsdl_xml);
        if (!doc_) {
            LOG(ERROR) << "Failed to parse WSDL document";
            throw ContractError("Invalid WSDL document: not well-formed XML");
        }
        xmlNode* root = xmlDocGetRootElement(doc_.get());
        if (!xml::is_element(root, "definitions", WSDL_NS)) {
            throw ContractError("Invalid WSDL document: root element is not wsdl:definitions");
        }
        parse_definitions(root);
    }

    std::string get_service_name() const override {
        return service_name_;
    }

    std::string get_target_namespace() const override {
        return target_namespace_;
    }

    std::string get_endpoint() const override {
        return endpoint_;
    }

    std::string get_element_form_default() const override {
        return element_form_default_;
    }

    std::optional<SoapVersion> get_soap_version() const override {
        return soap_version_;
    }

    std::vector<std::string> get_operation_names() const override {
        std::vector<std::string> names;
        for (const auto& operation : operations_) {
            names.push_back(operation.name);
        }
        return names;
    }

    bool has_operation(const std::string& operation_name) const override {
        for (const auto& operation : operations_) {
            if (operation.name == operation_name) {
                return true;
            }
        }
        return false;
    }

    OperationInfo get_operation(const std::string& operation_name) const override {
        for (const auto& operation : operations_) {
            if (operation.name == operation_name) {
                return operation;
            }
        }
        throw UnknownOperationError("Operation not found: " + operation_name);
    }

    std::vector<OperationInfo> get_all_operations() const override {
        return operations_;
    }

    std::string get_wsdl_xml() const override {
        return wsdl_xml_;
    }

private:
    struct MessageElement {
        std::string tag;
        std::string namespace_uri;
    };

    void parse_definitions(xmlNode* root) {
        target_namespace_ = xml::attribute(root, "targetNamespace");

        for (xmlNode* types : xml::child_elements(root)) {
            if (!xml::is_element(types, "types", WSDL_NS)) {
                continue;
            }
            for (xmlNode* schema : xml::child_elements(types)) {
                std::string form = xml::attribute(schema, "elementFormDefault");
                if (xml::is_element(schema, "schema", XSD_NS) && !form.empty()) {
                    element_form_default_ = form;
                    break;
                }
            }
        }

        parse_messages(root);
        parse_port_types(root);
        parse_bindings(root);
        parse_service(root);

        VLOG(1) << "Parsed WSDL for service '" << service_name_ << "' with "
                << operations_.size() << " operations";
    }

    void parse_messages(xmlNode* root) {
        for (xmlNode* message : xml::child_elements(root)) {
            if (!xml::is_element(message, "message", WSDL_NS)) {
                continue;
            }
            xmlNode* part = xml::first_child(message, "part", WSDL_NS);
            if (!part) {
                continue;
            }
            std::string element = xml::attribute(part, "element");
            if (element.empty()) {
                // rpc style part, the operation name becomes the tag
                continue;
            }
            messages_[xml::attribute(message, "name")] = {
                strip_prefix(element), resolve_namespace(doc_.get(), part, element)};
        }
    }

    void parse_port_types(xmlNode* root) {
        for (xmlNode* port_type : xml::child_elements(root)) {
            if (!xml::is_element(port_type, "portType", WSDL_NS)) {
                continue;
            }
            for (xmlNode* operation : xml::child_elements(port_type)) {
                if (!xml::is_element(operation, "operation", WSDL_NS)) {
                    continue;
                }
                std::string name = xml::attribute(operation, "name");
                if (name.empty() || port_type_operations_.count(name)) {
                    continue;
                }
                OperationInfo info;
                info.name = name;
                info.input_tag = name;
                info.input_namespace = target_namespace_;

                auto input = lookup_message(xml::first_child(operation, "input", WSDL_NS));
                if (input) {
                    info.input_tag = input->tag;
                    info.input_namespace = input->namespace_uri;
                }
                auto output = lookup_message(xml::first_child(operation, "output", WSDL_NS));
                info.output_tag = output ? output->tag : name + "Response";

                port_type_operations_[name] = info;
                port_type_order_.push_back(name);
            }
        }
    }

    std::optional<MessageElement> lookup_message(xmlNode* io) const {
        if (!io) {
            return std::nullopt;
        }
        auto it = messages_.find(strip_prefix(xml::attribute(io, "message")));
        if (it == messages_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void parse_bindings(xmlNode* root) {
        for (xmlNode* binding : xml::child_elements(root)) {
            if (!xml::is_element(binding, "binding", WSDL_NS)) {
                continue;
            }
            const char* binding_ns = nullptr;
            if (xml::first_child(binding, "binding", SOAP11_BINDING_NS)) {
                binding_ns = SOAP11_BINDING_NS;
            } else if (xml::first_child(binding, "binding", SOAP12_BINDING_NS)) {
                binding_ns = SOAP12_BINDING_NS;
            } else {
                VLOG(1) << "Skipping non-SOAP binding " << xml::attribute(binding, "name");
                continue;
            }
            if (!soap_version_) {
                soap_version_ = binding_ns == SOAP12_BINDING_NS ? SoapVersion::SOAP_12 : SoapVersion::SOAP_11;
            }

            for (xmlNode* operation : xml::child_elements(binding)) {
                if (!xml::is_element(operation, "operation", WSDL_NS)) {
                    continue;
                }
                std::string name = xml::attribute(operation, "name");
                if (name.empty() || has_operation(name)) {
                    continue;
                }
                OperationInfo info;
                auto it = port_type_operations_.find(name);
                if (it != port_type_operations_.end()) {
                    info = it->second;
                } else {
                    info.name = name;
                    info.input_tag = name;
                    info.input_namespace = target_namespace_;
                    info.output_tag = name + "Response";
                }
                info.soap_action = xml::attribute(xml::first_child(operation, "operation", binding_ns),
                                                  "soapAction");
                operations_.push_back(info);
            }
        }

        // Abstract-only documents still expose their operations
        if (operations_.empty()) {
            for (const auto& name : port_type_order_) {
                operations_.push_back(port_type_operations_.at(name));
            }
        }
    }

    void parse_service(xmlNode* root) {
        xmlNode* service = xml::first_child(root, "service", WSDL_NS);
        if (!service) {
            service_name_ = xml::attribute(root, "name");
            return;
        }
        service_name_ = xml::attribute(service, "name");

        std::string soap12_location;
        for (xmlNode* port : xml::child_elements(service)) {
            if (!xml::is_element(port, "port", WSDL_NS)) {
                continue;
            }
            if (xmlNode* address = xml::first_child(port, "address", SOAP11_BINDING_NS)) {
                endpoint_ = xml::attribute(address, "location");
                return;
            }
            if (xmlNode* address = xml::first_child(port, "address", SOAP12_BINDING_NS)) {
                if (soap12_location.empty()) {
                    soap12_location = xml::attribute(address, "location");
                }
            }
        }
        endpoint_ = soap12_location;
    }

    std::string wsdl_xml_;
    xml::XmlDocPtr doc_;

    // Parsed data
    std::string service_name_;
    std::string target_namespace_;
    std::string endpoint_;
    std::string element_form_default_ = "unqualified";
    std::optional<SoapVersion> soap_version_;
    std::vector<OperationInfo> operations_;
    std::unordered_map<std::string, MessageElement> messages_;
    std::unordered_map<std::string, OperationInfo> port_type_operations_;
    std::vector<std::string> port_type_order_;
};

// Factory methods
std::unique_ptr<WsdlParser> WsdlParser::create(const std::string& wsdl_xml) {
    return std::make_unique<WsdlParserImpl>(wsdl_xml);
}

std::unique_ptr<WsdlParser> WsdlParser::create_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ContractError("Failed to open WSDL file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return create(buffer.str());
}

} // namespace soapx
