#include "envelope_builder.hpp"
#include "soapx/errors.hpp"
#include "wsse_header.hpp"
#include "xml_utils.hpp"
#include <glog/logging.h>
#include <libxml/parser.h>

namespace soapx {

namespace {

constexpr const char* XSD_NS = "http://www.w3.org/2001/XMLSchema";
constexpr const char* XSI_NS = "http://www.w3.org/2001/XMLSchema-instance";

const xmlChar* xml_str(const std::string& value) {
    return reinterpret_cast<const xmlChar*>(value.c_str());
}

std::string scalar_text(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

// Writes JSON as XML elements. Elements are created detached and then
// appended so an unqualified child does not inherit its parent's namespace.
class TreeWriter {
public:
    TreeWriter(xmlDoc* doc, xmlNs* xsi, KeyConversion conversion)
        : doc_(doc), xsi_(xsi), conversion_(conversion) {}

    xmlNode* element(xmlNode* parent, xmlNs* ns, const std::string& name) const {
        xmlNode* node = xmlNewDocNode(doc_, ns, xml_str(name), nullptr);
        xmlAddChild(parent, node);
        return node;
    }

    void write_object(xmlNode* parent, const nlohmann::json& object, xmlNs* ns) const {
        for (auto it = object.begin(); it != object.end(); ++it) {
            const std::string& key = it.key();
            const auto& value = it.value();

            if (!key.empty() && key[0] == '@') {
                xmlNewProp(parent, xml_str(key.substr(1)), xml_str(scalar_text(value)));
            } else if (key == "#text") {
                xmlNodeAddContent(parent, xml_str(scalar_text(value)));
            } else if (value.is_array()) {
                for (const auto& item : value) {
                    write_value(parent, key, item, ns);
                }
            } else {
                write_value(parent, key, value, ns);
            }
        }
    }

private:
    void write_value(xmlNode* parent, const std::string& key, const nlohmann::json& value, xmlNs* ns) const {
        xmlNode* node = keyed_element(parent, key, ns);
        if (value.is_null()) {
            xmlNewNsProp(node, xsi_, reinterpret_cast<const xmlChar*>("nil"),
                         reinterpret_cast<const xmlChar*>("true"));
        } else if (value.is_object()) {
            write_object(node, value, ns);
        } else if (value.is_array()) {
            xmlNodeAddContent(node, xml_str(value.dump()));
        } else {
            xmlNodeAddContent(node, xml_str(scalar_text(value)));
        }
    }

    // "prefix:name" keys use a namespace declared on the envelope
    xmlNode* keyed_element(xmlNode* parent, const std::string& key, xmlNs* ns) const {
        auto colon = key.find(':');
        if (colon == std::string::npos) {
            return element(parent, ns, convert_key(key, conversion_));
        }
        std::string prefix = key.substr(0, colon);
        std::string local = convert_key(key.substr(colon + 1), conversion_);
        xmlNs* declared = xmlSearchNs(doc_, parent, xml_str(prefix));
        if (!declared) {
            VLOG(1) << "Namespace prefix '" << prefix << "' is not declared, writing " << key << " as is";
            return element(parent, nullptr, prefix + ":" + local);
        }
        return element(parent, declared, local);
    }

    xmlDoc* doc_;
    xmlNs* xsi_;
    KeyConversion conversion_;
};

void append_raw_xml(xmlNode* parent, const std::string& fragment) {
    xmlNode* list = nullptr;
    xmlParserErrors status = xmlParseInNodeContext(parent, fragment.data(), static_cast<int>(fragment.size()),
                                                   XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING,
                                                   &list);
    if (status != XML_ERR_OK) {
        if (list) {
            xmlFreeNodeList(list);
        }
        throw InvocationArgumentError("Message is not a well-formed XML fragment");
    }
    if (list) {
        xmlAddChildList(parent, list);
    }
}

} // namespace

const char* envelope_namespace(SoapVersion version) {
    return version == SoapVersion::SOAP_12 ? SOAP12_ENVELOPE_NS : SOAP11_ENVELOPE_NS;
}

EnvelopeBuilder::EnvelopeBuilder(const GlobalOptions& globals,
                                 const LocalOptions& locals,
                                 const WsseSettings& wsse)
    : globals_(globals),
      locals_(locals),
      wsse_(wsse),
      soap_version_(globals.soap_version) {}

void EnvelopeBuilder::set_input(std::string tag, std::string namespace_uri) {
    input_tag_ = std::move(tag);
    input_namespace_ = std::move(namespace_uri);
}

std::string EnvelopeBuilder::to_xml() const {
    if (locals_.xml) {
        return *locals_.xml;
    }

    auto doc = xml::make_document("Envelope");
    xmlNode* root = xmlDocGetRootElement(doc.get());

    xmlNs* env_ns = xmlNewNs(root, reinterpret_cast<const xmlChar*>(envelope_namespace(soap_version_)),
                             xml_str(globals_.env_namespace));
    xmlSetNs(root, env_ns);
    xmlNewNs(root, reinterpret_cast<const xmlChar*>(XSD_NS), reinterpret_cast<const xmlChar*>("xsd"));
    xmlNs* xsi_ns = xmlNewNs(root, reinterpret_cast<const xmlChar*>(XSI_NS),
                             reinterpret_cast<const xmlChar*>("xsi"));

    xmlNs* target_ns = nullptr;
    if (!target_namespace_.empty()) {
        target_ns = xmlNewNs(root, xml_str(target_namespace_), xml_str(globals_.namespace_identifier));
    }
    for (const auto& [key, uri] : globals_.namespaces) {
        std::string prefix = key.rfind("xmlns:", 0) == 0 ? key.substr(6) : key;
        const xmlChar* prefix_ptr = prefix == "xmlns" || prefix.empty() ? nullptr : xml_str(prefix);
        if (!xmlNewNs(root, xml_str(uri), prefix_ptr)) {
            LOG(WARNING) << "Ignoring duplicate namespace declaration " << key;
        }
    }

    TreeWriter writer(doc.get(), xsi_ns, globals_.convert_request_keys_to);

    nlohmann::json header = globals_.soap_header.is_object() ? globals_.soap_header : nlohmann::json::object();
    if (locals_.soap_header.is_object()) {
        header.update(locals_.soap_header);
    }
    if (!header.empty() || wsse_.has_header()) {
        xmlNode* header_node = writer.element(root, env_ns, "Header");
        writer.write_object(header_node, header, nullptr);
        if (wsse_.has_header()) {
            wsse::append_security_header(header_node, env_ns, wsse_);
        }
    }

    xmlNode* body = writer.element(root, env_ns, "Body");

    xmlNs* input_ns = target_ns;
    if (!input_namespace_.empty() && input_namespace_ != target_namespace_) {
        input_ns = xmlNewNs(root, xml_str(input_namespace_), reinterpret_cast<const xmlChar*>("ins0"));
    }
    xmlNode* input = writer.element(body, input_ns, input_tag_);
    for (const auto& [name, value] : locals_.attributes) {
        xmlNewProp(input, xml_str(name), xml_str(value));
    }

    xmlNs* child_ns = element_form_default_ == "qualified" ? input_ns : nullptr;
    const auto& message = locals_.message;
    if (message.is_object()) {
        writer.write_object(input, message, child_ns);
    } else if (message.is_string()) {
        append_raw_xml(input, message.get<std::string>());
    } else if (message.is_array()) {
        throw InvocationArgumentError("Message must be an object or an XML string");
    } else if (!message.is_null()) {
        xmlNodeAddContent(input, xml_str(scalar_text(message)));
    }

    return xml::dump(doc.get(), false, globals_.encoding);
}

} // namespace soapx
