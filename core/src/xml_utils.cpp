#include "xml_utils.hpp"
#include "soapx/options.hpp"
#include <libxml/parser.h>
#include <glog/logging.h>
#include <algorithm>
#include <cctype>
#include <cstring>

namespace soapx {
namespace xml {

namespace {

constexpr const char* XSI_NS = "http://www.w3.org/2001/XMLSchema-instance";
constexpr const char* FILTERED = "***FILTERED***";

const char* str(const xmlChar* value) {
    return reinterpret_cast<const char*>(value);
}

bool is_blank(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

void filter_node(xmlNode* node, const std::vector<std::string>& filters) {
    for (xmlNode* child = node; child != nullptr; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) {
            continue;
        }
        if (std::find(filters.begin(), filters.end(), local_name(child)) != filters.end()) {
            xmlNodeSetContent(child, reinterpret_cast<const xmlChar*>(FILTERED));
            continue;
        }
        filter_node(child->children, filters);
    }
}

} // namespace

XmlLib::XmlLib() {
    xmlInitParser();
    VLOG(1) << "libxml2 initialized";
}

XmlLib::~XmlLib() {
    xmlCleanupParser();
}

void XmlDocDeleter::operator()(xmlDoc* doc) const {
    if (doc) {
        xmlFreeDoc(doc);
    }
}

XmlDocPtr parse(const std::string& content) {
    XmlLib::Instance();
    xmlDoc* doc = xmlReadMemory(content.data(), static_cast<int>(content.size()), nullptr, nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
    return XmlDocPtr(doc);
}

XmlDocPtr make_document(const std::string& root_name) {
    XmlLib::Instance();
    XmlDocPtr doc(xmlNewDoc(reinterpret_cast<const xmlChar*>("1.0")));
    xmlNode* root = xmlNewNode(nullptr, reinterpret_cast<const xmlChar*>(root_name.c_str()));
    xmlDocSetRootElement(doc.get(), root);
    return doc;
}

std::string local_name(const xmlNode* node) {
    return node && node->name ? str(node->name) : "";
}

std::string namespace_uri(const xmlNode* node) {
    return node && node->ns && node->ns->href ? str(node->ns->href) : "";
}

bool is_element(const xmlNode* node, const char* local, const char* ns) {
    if (!node || node->type != XML_ELEMENT_NODE || std::strcmp(str(node->name), local) != 0) {
        return false;
    }
    return ns == nullptr || namespace_uri(node) == ns;
}

std::vector<xmlNode*> child_elements(const xmlNode* node) {
    std::vector<xmlNode*> elements;
    if (!node) {
        return elements;
    }
    for (xmlNode* child = node->children; child != nullptr; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            elements.push_back(child);
        }
    }
    return elements;
}

xmlNode* first_child(const xmlNode* node, const char* local, const char* ns) {
    for (xmlNode* child : child_elements(node)) {
        if (is_element(child, local, ns)) {
            return child;
        }
    }
    return nullptr;
}

xmlNode* find_descendant(xmlNode* node, const char* local, const char* ns) {
    if (!node) {
        return nullptr;
    }
    if (is_element(node, local, ns)) {
        return node;
    }
    for (xmlNode* child : child_elements(node)) {
        if (xmlNode* found = find_descendant(child, local, ns)) {
            return found;
        }
    }
    return nullptr;
}

std::string attribute(const xmlNode* node, const char* name) {
    if (!node) {
        return "";
    }
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) {
        return "";
    }
    std::string result = str(value);
    xmlFree(value);
    return result;
}

std::string text(const xmlNode* node) {
    if (!node) {
        return "";
    }
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) {
        return "";
    }
    std::string result = str(content);
    xmlFree(content);
    return result;
}

std::string dump(xmlDoc* doc, bool pretty, const std::string& encoding) {
    xmlChar* memory = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc, &memory, &size, encoding.c_str(), pretty ? 1 : 0);
    if (!memory) {
        return "";
    }
    std::string result(str(memory), static_cast<size_t>(size));
    xmlFree(memory);
    return result;
}

std::string json_key(const xmlNode* node, bool strip_namespaces, KeyConversion conversion) {
    std::string name = local_name(node);
    if (!strip_namespaces && node->ns && node->ns->prefix) {
        return std::string(str(node->ns->prefix)) + ":" + convert_key(name, conversion);
    }
    return convert_key(name, conversion);
}

nlohmann::json to_json(const xmlNode* node, bool strip_namespaces, KeyConversion conversion) {
    nlohmann::json attributes = nlohmann::json::object();
    bool nil = false;
    for (xmlAttr* attr = node->properties; attr != nullptr; attr = attr->next) {
        std::string name = str(attr->name);
        xmlChar* value = xmlNodeListGetString(node->doc, attr->children, 1);
        std::string content = value ? str(value) : "";
        xmlFree(value);

        if (name == "nil" && attr->ns && std::strcmp(str(attr->ns->href), XSI_NS) == 0) {
            nil = content == "true" || content == "1";
            continue;
        }
        if (!strip_namespaces && attr->ns && attr->ns->prefix) {
            name = std::string(str(attr->ns->prefix)) + ":" + name;
        }
        attributes["@" + name] = content;
    }

    if (nil) {
        return nullptr;
    }

    auto children = child_elements(node);
    if (children.empty()) {
        std::string content = text(node);
        if (attributes.empty()) {
            return content;
        }
        if (!content.empty()) {
            attributes["#text"] = content;
        }
        return attributes;
    }

    nlohmann::json object = nlohmann::json::object();
    for (xmlNode* child : children) {
        std::string key = json_key(child, strip_namespaces, conversion);
        nlohmann::json value = to_json(child, strip_namespaces, conversion);
        if (!object.contains(key)) {
            object[key] = std::move(value);
        } else if (object[key].is_array()) {
            object[key].push_back(std::move(value));
        } else {
            nlohmann::json array = nlohmann::json::array();
            array.push_back(std::move(object[key]));
            array.push_back(std::move(value));
            object[key] = std::move(array);
        }
    }
    for (auto it = attributes.begin(); it != attributes.end(); ++it) {
        object[it.key()] = it.value();
    }

    // Mixed content: keep the significant text beside the children
    std::string mixed;
    for (xmlNode* child = node->children; child != nullptr; child = child->next) {
        if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
            mixed += text(child);
        }
    }
    if (!is_blank(mixed)) {
        object["#text"] = mixed;
    }
    return object;
}

std::string filtered(const std::string& content, const std::vector<std::string>& filters, bool pretty) {
    if (filters.empty() && !pretty) {
        return content;
    }
    auto doc = parse(content);
    if (!doc) {
        return content;
    }
    if (!filters.empty()) {
        filter_node(xmlDocGetRootElement(doc.get()), filters);
    }
    return dump(doc.get(), pretty);
}

} // namespace xml
} // namespace soapx
