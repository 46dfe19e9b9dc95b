#include "soapx/wsse.hpp"
#include "crypto_utils.hpp"
#include "wsse_header.hpp"
#include <glog/logging.h>
#include <ctime>

namespace soapx {

WsseSettings WsseSettings::from_options(const GlobalOptions& globals) {
    WsseSettings settings;
    settings.credentials = globals.wsse_auth;
    settings.timestamp = globals.wsse_timestamp;
    settings.verify_response = globals.wsse_verify_response;
    return settings;
}

namespace wsse {

namespace {

const xmlChar* xml_str(const char* value) {
    return reinterpret_cast<const xmlChar*>(value);
}

xmlNode* add_child(xmlNode* parent, xmlNs* ns, const char* name, const std::string& content = "") {
    return xmlNewTextChild(parent, ns, xml_str(name), content.empty() ? nullptr : xml_str(content.c_str()));
}

} // namespace

std::string password_digest(const std::string& nonce,
                            const std::string& created,
                            const std::string& password) {
    return crypto::base64_encode(crypto::digest(crypto::Digest::SHA1, nonce + created + password));
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

void append_security_header(xmlNode* header, xmlNs* env_ns, const WsseSettings& wsse) {
    xmlNode* security = xmlNewChild(header, nullptr, xml_str("Security"), nullptr);
    xmlNs* wsse_ns = xmlNewNs(security, xml_str(SECEXT_NS), xml_str("wsse"));
    xmlNs* wsu_ns = xmlNewNs(security, xml_str(UTILITY_NS), xml_str("wsu"));
    xmlSetNs(security, wsse_ns);
    xmlNewNsProp(security, env_ns, xml_str("mustUnderstand"), xml_str("1"));

    auto now = std::chrono::system_clock::now();
    std::string created = format_timestamp(now);

    if (wsse.timestamp) {
        xmlNode* timestamp = add_child(security, wsu_ns, "Timestamp");
        xmlNewNsProp(timestamp, wsu_ns, xml_str("Id"), xml_str("Timestamp-1"));
        add_child(timestamp, wsu_ns, "Created", created);
        add_child(timestamp, wsu_ns, "Expires", format_timestamp(now + TIMESTAMP_TTL));
    }

    if (!wsse.credentials) {
        return;
    }
    const auto& credentials = *wsse.credentials;
    xmlNode* token = add_child(security, wsse_ns, "UsernameToken");
    xmlNewNsProp(token, wsu_ns, xml_str("Id"), xml_str("UsernameToken-1"));
    add_child(token, wsse_ns, "Username", credentials.username);

    if (!credentials.digest) {
        xmlNode* password = add_child(token, wsse_ns, "Password", credentials.password);
        xmlNewProp(password, xml_str("Type"), xml_str(PASSWORD_TEXT));
        return;
    }

    std::string nonce = crypto::random_bytes(16);
    xmlNode* password = add_child(token, wsse_ns, "Password",
                                  password_digest(nonce, created, credentials.password));
    xmlNewProp(password, xml_str("Type"), xml_str(PASSWORD_DIGEST));
    xmlNode* nonce_node = add_child(token, wsse_ns, "Nonce", crypto::base64_encode(nonce));
    xmlNewProp(nonce_node, xml_str("EncodingType"), xml_str(BASE64_ENCODING));
    add_child(token, wsu_ns, "Created", created);
    VLOG(2) << "Added digest UsernameToken for " << credentials.username;
}

} // namespace wsse
} // namespace soapx
