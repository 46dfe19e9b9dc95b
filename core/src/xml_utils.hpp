#pragma once

#include "soapx/types.hpp"
#include <libxml/tree.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace soapx {
namespace xml {

/// RAII wrapper for libxml2 initialization
/// Ensures xmlInitParser/xmlCleanupParser are called exactly once
class XmlLib {
public:
    static XmlLib& Instance() {
        static XmlLib instance;
        return instance;
    }

    XmlLib(const XmlLib&) = delete;
    XmlLib& operator=(const XmlLib&) = delete;

private:
    XmlLib();
    ~XmlLib();
};

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const;
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

/// Parse a document without network access or entity expansion.
/// Whitespace is preserved. Returns nullptr on malformed input.
XmlDocPtr parse(const std::string& content);

/// Empty document with the given root element (no namespace yet)
XmlDocPtr make_document(const std::string& root_name);

std::string local_name(const xmlNode* node);
std::string namespace_uri(const xmlNode* node);

bool is_element(const xmlNode* node, const char* local, const char* ns = nullptr);
std::vector<xmlNode*> child_elements(const xmlNode* node);
xmlNode* first_child(const xmlNode* node, const char* local, const char* ns = nullptr);

/// Depth-first search including the node itself
xmlNode* find_descendant(xmlNode* node, const char* local, const char* ns = nullptr);

/// Attribute value regardless of its namespace, empty when absent
std::string attribute(const xmlNode* node, const char* name);
std::string text(const xmlNode* node);

std::string dump(xmlDoc* doc, bool pretty, const std::string& encoding = "UTF-8");

/// Element content as JSON: attributes become "@name", text next to
/// attributes "#text", repeated children arrays, xsi:nil elements null
nlohmann::json to_json(const xmlNode* node, bool strip_namespaces, KeyConversion conversion);
std::string json_key(const xmlNode* node, bool strip_namespaces, KeyConversion conversion);

/// Copy of the document for logging, with the text of the named elements
/// replaced. Unparsable input is returned unchanged.
std::string filtered(const std::string& content, const std::vector<std::string>& filters, bool pretty);

} // namespace xml
} // namespace soapx
