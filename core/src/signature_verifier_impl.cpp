#include "soapx/wsse.hpp"
#include "soapx/errors.hpp"
#include "crypto_utils.hpp"
#include "wsse_header.hpp"
#include "xml_utils.hpp"
#include <glog/logging.h>
#include <libxml/c14n.h>
#include <libxml/xmlIO.h>
#include <sstream>

namespace soapx {

namespace {

constexpr const char* ENVELOPED_SIGNATURE = "http://www.w3.org/2000/09/xmldsig#enveloped-signature";

struct OutputBufferCloser {
    void operator()(xmlOutputBuffer* buffer) const {
        if (buffer) {
            xmlOutputBufferClose(buffer);
        }
    }
};

using OutputBufferPtr = std::unique_ptr<xmlOutputBuffer, OutputBufferCloser>;

// Visible nodes are the target element, its descendants, their attributes
// and their namespace declarations
int is_in_subtree(void* user_data, xmlNodePtr node, xmlNodePtr parent) {
    auto* target = static_cast<xmlNode*>(user_data);
    xmlNode* current = node;
    if (node == nullptr || node->type == XML_NAMESPACE_DECL || node->type == XML_ATTRIBUTE_NODE) {
        current = parent;
    }
    for (; current != nullptr; current = current->parent) {
        if (current == target) {
            return 1;
        }
    }
    return 0;
}

std::string canonicalize(xmlDoc* doc,
                         xmlNode* element,
                         bool exclusive,
                         const std::vector<std::string>& inclusive_prefixes) {
    std::vector<xmlChar*> prefixes;
    for (const auto& prefix : inclusive_prefixes) {
        prefixes.push_back(const_cast<xmlChar*>(reinterpret_cast<const xmlChar*>(prefix.c_str())));
    }
    prefixes.push_back(nullptr);

    OutputBufferPtr buffer(xmlAllocOutputBuffer(nullptr));
    if (!buffer) {
        throw VerificationError("Failed to allocate canonicalization buffer");
    }
    int status = xmlC14NExecute(doc, is_in_subtree, element,
                                exclusive ? XML_C14N_EXCLUSIVE_1_0 : XML_C14N_1_0,
                                exclusive ? prefixes.data() : nullptr, 0, buffer.get());
    if (status < 0) {
        throw VerificationError("Failed to canonicalize element " + xml::local_name(element));
    }
    const xmlChar* content = xmlOutputBufferGetContent(buffer.get());
    size_t size = xmlOutputBufferGetSize(buffer.get());
    return std::string(reinterpret_cast<const char*>(content), size);
}

std::optional<crypto::Digest> digest_algorithm(const std::string& uri) {
    if (uri == xmldsig::SHA1) {
        return crypto::Digest::SHA1;
    }
    if (uri == xmldsig::SHA256) {
        return crypto::Digest::SHA256;
    }
    return std::nullopt;
}

std::optional<crypto::Digest> signature_algorithm(const std::string& uri) {
    if (uri == xmldsig::RSA_SHA1) {
        return crypto::Digest::SHA1;
    }
    if (uri == xmldsig::RSA_SHA256) {
        return crypto::Digest::SHA256;
    }
    return std::nullopt;
}

bool is_exclusive(const std::string& uri) {
    return uri.rfind(xmldsig::EXC_C14N, 0) == 0;
}

bool is_inclusive(const std::string& uri) {
    return uri.rfind(xmldsig::C14N, 0) == 0;
}

std::vector<std::string> split_prefixes(const std::string& list) {
    std::vector<std::string> prefixes;
    std::istringstream in(list);
    std::string prefix;
    while (in >> prefix) {
        prefixes.push_back(prefix);
    }
    return prefixes;
}

// Element whose wsu:Id, Id, ID or id attribute equals id
xmlNode* find_by_id(xmlNode* node, const std::string& id) {
    if (!node) {
        return nullptr;
    }
    for (const char* name : {"Id", "ID", "id"}) {
        if (xml::attribute(node, name) == id) {
            return node;
        }
    }
    for (xmlNode* child : xml::child_elements(node)) {
        if (xmlNode* found = find_by_id(child, id)) {
            return found;
        }
    }
    return nullptr;
}

class XmlDsigVerifier : public SignatureVerifier {
public:
    VerificationResult verify(const std::string& response_body) const override {
        VerificationResult result;
        auto doc = xml::parse(response_body);
        if (!doc) {
            fail(result, "Response is not well-formed XML");
            return result;
        }
        xmlNode* root = xmlDocGetRootElement(doc.get());
        xmlNode* security = xml::find_descendant(root, "Security", wsse::SECEXT_NS);
        xmlNode* signature = xml::find_descendant(security ? security : root, "Signature", xmldsig::NS);
        if (!signature) {
            fail(result, "No XML signature found in response");
            return result;
        }
        xmlNode* signed_info = xml::first_child(signature, "SignedInfo", xmldsig::NS);
        if (!signed_info) {
            fail(result, "Signature has no SignedInfo");
            return result;
        }

        try {
            check_references(doc.get(), signed_info, result);
            check_signature_value(doc.get(), security, signature, signed_info, result);
        } catch (const VerificationError& e) {
            fail(result, e.what());
        } catch (const std::runtime_error& e) {
            fail(result, std::string("Cryptographic failure: ") + e.what());
        }

        if (result.valid) {
            VLOG(1) << "Response signature verified";
        }
        return result;
    }

private:
    static void fail(VerificationResult& result, const std::string& error) {
        LOG(WARNING) << "Signature verification: " << error;
        result.valid = false;
        result.errors.push_back(error);
    }

    void check_references(xmlDoc* doc, xmlNode* signed_info, VerificationResult& result) const {
        bool any = false;
        for (xmlNode* reference : xml::child_elements(signed_info)) {
            if (!xml::is_element(reference, "Reference", xmldsig::NS)) {
                continue;
            }
            any = true;
            std::string uri = xml::attribute(reference, "URI");
            if (uri.size() < 2 || uri[0] != '#') {
                fail(result, "Unsupported reference URI '" + uri + "'");
                continue;
            }
            xmlNode* target = find_by_id(xmlDocGetRootElement(doc), uri.substr(1));
            if (!target) {
                fail(result, "Referenced element " + uri + " not found");
                continue;
            }

            bool exclusive = false;
            std::vector<std::string> prefixes;
            xmlNode* transforms = xml::first_child(reference, "Transforms", xmldsig::NS);
            for (xmlNode* transform : xml::child_elements(transforms)) {
                std::string algorithm = xml::attribute(transform, "Algorithm");
                if (is_exclusive(algorithm)) {
                    exclusive = true;
                    xmlNode* inclusive = xml::first_child(transform, "InclusiveNamespaces");
                    prefixes = split_prefixes(xml::attribute(inclusive, "PrefixList"));
                } else if (algorithm == ENVELOPED_SIGNATURE) {
                    fail(result, "Enveloped signature transform is not supported for " + uri);
                } else if (!is_inclusive(algorithm)) {
                    fail(result, "Unsupported transform " + algorithm);
                }
            }

            std::string method = xml::attribute(xml::first_child(reference, "DigestMethod", xmldsig::NS),
                                                "Algorithm");
            auto algorithm = digest_algorithm(method);
            if (!algorithm) {
                fail(result, "Unsupported digest method '" + method + "'");
                continue;
            }
            auto expected = crypto::base64_decode(
                xml::text(xml::first_child(reference, "DigestValue", xmldsig::NS)));
            if (!expected) {
                fail(result, "Malformed digest value for " + uri);
                continue;
            }
            std::string actual = crypto::digest(*algorithm, canonicalize(doc, target, exclusive, prefixes));
            if (actual != *expected) {
                fail(result, "Digest mismatch for reference " + uri);
            }
        }
        if (!any) {
            fail(result, "SignedInfo contains no references");
        }
    }

    void check_signature_value(xmlDoc* doc,
                               xmlNode* security,
                               xmlNode* signature,
                               xmlNode* signed_info,
                               VerificationResult& result) const {
        xmlNode* canonicalization = xml::first_child(signed_info, "CanonicalizationMethod", xmldsig::NS);
        std::string c14n_method = xml::attribute(canonicalization, "Algorithm");
        if (!is_exclusive(c14n_method) && !is_inclusive(c14n_method)) {
            fail(result, "Unsupported canonicalization method '" + c14n_method + "'");
            return;
        }
        std::vector<std::string> prefixes;
        if (is_exclusive(c14n_method)) {
            xmlNode* inclusive = xml::first_child(canonicalization, "InclusiveNamespaces");
            prefixes = split_prefixes(xml::attribute(inclusive, "PrefixList"));
        }
        std::string method = xml::attribute(
            xml::first_child(signed_info, "SignatureMethod", xmldsig::NS), "Algorithm");
        auto algorithm = signature_algorithm(method);
        if (!algorithm) {
            fail(result, "Unsupported signature method '" + method + "'");
            return;
        }
        auto value = crypto::base64_decode(
            xml::text(xml::first_child(signature, "SignatureValue", xmldsig::NS)));
        if (!value || value->empty()) {
            fail(result, "Missing or malformed signature value");
            return;
        }
        auto certificate = find_certificate(doc, security, signature);
        if (!certificate) {
            fail(result, "No signing certificate found");
            return;
        }

        std::string canonical = canonicalize(doc, signed_info, is_exclusive(c14n_method), prefixes);
        if (!crypto::verify_signature(*algorithm, *certificate, canonical, *value)) {
            fail(result, "Signature value does not match SignedInfo");
        }
    }

    // DER bytes from the referenced BinarySecurityToken, the first token in
    // the Security header or ds:X509Certificate in KeyInfo
    std::optional<std::string> find_certificate(xmlDoc* doc, xmlNode* security, xmlNode* signature) const {
        xmlNode* key_info = xml::first_child(signature, "KeyInfo", xmldsig::NS);
        xmlNode* token = nullptr;

        xmlNode* token_reference = xml::find_descendant(key_info, "Reference", wsse::SECEXT_NS);
        std::string uri = xml::attribute(token_reference, "URI");
        if (uri.size() > 1 && uri[0] == '#') {
            token = find_by_id(xmlDocGetRootElement(doc), uri.substr(1));
        }
        if (!token && security) {
            token = xml::first_child(security, "BinarySecurityToken", wsse::SECEXT_NS);
        }
        if (!token) {
            token = xml::find_descendant(key_info, "X509Certificate", xmldsig::NS);
        }
        if (!token) {
            return std::nullopt;
        }
        return crypto::base64_decode(xml::text(token));
    }
};

} // namespace

std::unique_ptr<SignatureVerifier> SignatureVerifier::create() {
    xml::XmlLib::Instance();
    return std::make_unique<XmlDsigVerifier>();
}

namespace xmldsig {

std::string canonicalize_element(const std::string& document,
                                 const std::string& local_name,
                                 const std::string& namespace_uri,
                                 const std::vector<std::string>& inclusive_prefixes) {
    auto doc = xml::parse(document);
    if (!doc) {
        throw VerificationError("Document is not well-formed XML");
    }
    xmlNode* element = xml::find_descendant(xmlDocGetRootElement(doc.get()), local_name.c_str(),
                                            namespace_uri.empty() ? nullptr : namespace_uri.c_str());
    if (!element) {
        throw VerificationError("Element " + local_name + " not found");
    }
    return canonicalize(doc.get(), element, true, inclusive_prefixes);
}

} // namespace xmldsig

} // namespace soapx
