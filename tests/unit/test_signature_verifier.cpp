#include <gtest/gtest.h>
#include "soapx/errors.hpp"
#include "soapx/wsse.hpp"
#include "crypto_utils.hpp"
#include "wsse_header.hpp"
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace soapx;

namespace {

constexpr const char* SOAP11_NS = "http://schemas.xmlsoap.org/soap/envelope/";

struct KeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct KeyContextDeleter {
    void operator()(EVP_PKEY_CTX* context) const { EVP_PKEY_CTX_free(context); }
};
struct CertificateDeleter {
    void operator()(X509* certificate) const { X509_free(certificate); }
};
struct MdContextDeleter {
    void operator()(EVP_MD_CTX* context) const { EVP_MD_CTX_free(context); }
};

using KeyPtr = std::unique_ptr<EVP_PKEY, KeyDeleter>;
using CertificatePtr = std::unique_ptr<X509, CertificateDeleter>;

// Throwaway RSA key with a self-signed certificate
class SigningIdentity {
public:
    SigningIdentity() {
        std::unique_ptr<EVP_PKEY_CTX, KeyContextDeleter> context(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
        EVP_PKEY* generated = nullptr;
        if (!context || EVP_PKEY_keygen_init(context.get()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_keygen_bits(context.get(), 2048) <= 0 ||
            EVP_PKEY_keygen(context.get(), &generated) <= 0) {
            throw std::runtime_error("RSA key generation failed");
        }
        key_.reset(generated);

        certificate_.reset(X509_new());
        X509_set_version(certificate_.get(), 2);
        ASN1_INTEGER_set(X509_get_serialNumber(certificate_.get()), 1);
        X509_gmtime_adj(X509_getm_notBefore(certificate_.get()), 0);
        X509_gmtime_adj(X509_getm_notAfter(certificate_.get()), 3600);
        X509_set_pubkey(certificate_.get(), key_.get());
        X509_NAME* name = X509_get_subject_name(certificate_.get());
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("soapx-test"), -1, -1, 0);
        X509_set_issuer_name(certificate_.get(), name);
        if (X509_sign(certificate_.get(), key_.get(), EVP_sha256()) <= 0) {
            throw std::runtime_error("Certificate signing failed");
        }
    }

    std::string certificate_der() const {
        int length = i2d_X509(certificate_.get(), nullptr);
        std::string der(static_cast<size_t>(length), '\0');
        auto* out = reinterpret_cast<unsigned char*>(&der[0]);
        i2d_X509(certificate_.get(), &out);
        return der;
    }

    std::string sign(const std::string& data) const {
        std::unique_ptr<EVP_MD_CTX, MdContextDeleter> context(EVP_MD_CTX_new());
        size_t length = 0;
        if (EVP_DigestSignInit(context.get(), nullptr, EVP_sha256(), nullptr, key_.get()) != 1 ||
            EVP_DigestSignUpdate(context.get(), data.data(), data.size()) != 1 ||
            EVP_DigestSignFinal(context.get(), nullptr, &length) != 1) {
            throw std::runtime_error("Signing failed");
        }
        std::string signature(length, '\0');
        if (EVP_DigestSignFinal(context.get(), reinterpret_cast<unsigned char*>(&signature[0]), &length) != 1) {
            throw std::runtime_error("Signing failed");
        }
        signature.resize(length);
        return signature;
    }

private:
    KeyPtr key_;
    CertificatePtr certificate_;
};

void replace(std::string& text, const std::string& placeholder, const std::string& value) {
    auto pos = text.find(placeholder);
    if (pos != std::string::npos) {
        text.replace(pos, placeholder.size(), value);
    }
}

const std::string SIGNED_TEMPLATE = std::string(
    "<soap:Envelope xmlns:soap=\"http://schemas.xmlsoap.org/soap/envelope/\" "
    "xmlns:wsse=\"") + wsse::SECEXT_NS + "\" xmlns:wsu=\"" + wsse::UTILITY_NS + "\">"
    "<soap:Header><wsse:Security soap:mustUnderstand=\"1\">"
    "<wsse:BinarySecurityToken wsu:Id=\"X509Token\" "
    "EncodingType=\"http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-soap-message-security-1.0#Base64Binary\" "
    "ValueType=\"http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-x509-token-profile-1.0#X509v3\">"
    "__CERT__</wsse:BinarySecurityToken>"
    "<ds:Signature xmlns:ds=\"http://www.w3.org/2000/09/xmldsig#\"><ds:SignedInfo>"
    "<ds:CanonicalizationMethod Algorithm=\"http://www.w3.org/2001/10/xml-exc-c14n#\"/>"
    "<ds:SignatureMethod Algorithm=\"__METHOD__\"/>"
    "<ds:Reference URI=\"#Body\"><ds:Transforms>"
    "<ds:Transform Algorithm=\"http://www.w3.org/2001/10/xml-exc-c14n#\"/></ds:Transforms>"
    "<ds:DigestMethod Algorithm=\"http://www.w3.org/2001/04/xmlenc#sha256\"/>"
    "<ds:DigestValue>__DIGEST__</ds:DigestValue></ds:Reference>"
    "</ds:SignedInfo><ds:SignatureValue>__SIGNATURE__</ds:SignatureValue>"
    "<ds:KeyInfo><wsse:SecurityTokenReference><wsse:Reference URI=\"#X509Token\"/>"
    "</wsse:SecurityTokenReference></ds:KeyInfo></ds:Signature>"
    "</wsse:Security></soap:Header>"
    "<soap:Body wsu:Id=\"Body\"><tns:PingResponse xmlns:tns=\"urn:example:ping\">"
    "<tns:payload>pong</tns:payload></tns:PingResponse></soap:Body></soap:Envelope>";

} // namespace

class SignatureVerifierTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        signer_ = new SigningIdentity();
        other_ = new SigningIdentity();
    }

    static void TearDownTestSuite() {
        delete signer_;
        delete other_;
        signer_ = nullptr;
        other_ = nullptr;
    }

    // Response signed by `key` carrying the certificate of `certificate_owner`
    // SignedInfo is canonicalized with signed_info_prefixes rendered inclusively
    static std::string signed_response(const SigningIdentity& key,
                                       const SigningIdentity& certificate_owner,
                                       const std::string& method = xmldsig::RSA_SHA256,
                                       const std::string& document_template = SIGNED_TEMPLATE,
                                       const std::vector<std::string>& signed_info_prefixes = {}) {
        std::string document = document_template;
        replace(document, "__METHOD__", method);
        std::string body = xmldsig::canonicalize_element(document, "Body", SOAP11_NS);
        replace(document, "__DIGEST__", crypto::base64_encode(crypto::digest(crypto::Digest::SHA256, body)));

        std::string signed_info =
            xmldsig::canonicalize_element(document, "SignedInfo", xmldsig::NS, signed_info_prefixes);
        replace(document, "__SIGNATURE__", crypto::base64_encode(key.sign(signed_info)));
        replace(document, "__CERT__", crypto::base64_encode(certificate_owner.certificate_der()));
        return document;
    }

    bool has_error(const VerificationResult& result, const std::string& fragment) {
        for (const auto& error : result.errors) {
            if (error.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::unique_ptr<SignatureVerifier> verifier_ = SignatureVerifier::create();

    static SigningIdentity* signer_;
    static SigningIdentity* other_;
};

SigningIdentity* SignatureVerifierTest::signer_ = nullptr;
SigningIdentity* SignatureVerifierTest::other_ = nullptr;

TEST_F(SignatureVerifierTest, ValidSignature) {
    auto result = verifier_->verify(signed_response(*signer_, *signer_));

    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(SignatureVerifierTest, SignedInfoPrefixListIsHonored) {
    std::string document_template = SIGNED_TEMPLATE;
    replace(document_template,
            "<ds:CanonicalizationMethod Algorithm=\"http://www.w3.org/2001/10/xml-exc-c14n#\"/>",
            "<ds:CanonicalizationMethod Algorithm=\"http://www.w3.org/2001/10/xml-exc-c14n#\">"
            "<ec:InclusiveNamespaces xmlns:ec=\"http://www.w3.org/2001/10/xml-exc-c14n#\" PrefixList=\"soap wsse\"/>"
            "</ds:CanonicalizationMethod>");

    std::string plain = xmldsig::canonicalize_element(document_template, "SignedInfo", xmldsig::NS);
    std::string listed =
        xmldsig::canonicalize_element(document_template, "SignedInfo", xmldsig::NS, {"soap", "wsse"});
    ASSERT_NE(plain, listed);
    EXPECT_NE(listed.find("xmlns:wsse=\""), std::string::npos);

    auto result = verifier_->verify(
        signed_response(*signer_, *signer_, xmldsig::RSA_SHA256, document_template, {"soap", "wsse"}));

    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(SignatureVerifierTest, TamperedBodyFailsDigest) {
    std::string document = signed_response(*signer_, *signer_);
    replace(document, "<tns:payload>pong", "<tns:payload>p0ng");

    auto result = verifier_->verify(document);

    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(has_error(result, "Digest mismatch for reference #Body"));
}

TEST_F(SignatureVerifierTest, ForeignCertificateFailsSignature) {
    auto result = verifier_->verify(signed_response(*signer_, *other_));

    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(has_error(result, "Signature value does not match SignedInfo"));
}

TEST_F(SignatureVerifierTest, UnsupportedSignatureMethod) {
    auto result = verifier_->verify(
        signed_response(*signer_, *signer_, "http://www.w3.org/2000/09/xmldsig#hmac-sha1"));

    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(has_error(result, "Unsupported signature method"));
}

TEST_F(SignatureVerifierTest, UnsignedResponse) {
    auto result = verifier_->verify(
        "<soap:Envelope xmlns:soap=\"http://schemas.xmlsoap.org/soap/envelope/\">"
        "<soap:Body><Ok/></soap:Body></soap:Envelope>");

    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(has_error(result, "No XML signature found"));
}

TEST_F(SignatureVerifierTest, MalformedResponse) {
    auto result = verifier_->verify("<soap:Envelope");

    EXPECT_FALSE(result.valid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0], "Response is not well-formed XML");
}

TEST_F(SignatureVerifierTest, CanonicalizeElementErrors) {
    EXPECT_THROW(xmldsig::canonicalize_element("<broken", "Body", SOAP11_NS), VerificationError);
    EXPECT_THROW(xmldsig::canonicalize_element("<a/>", "Body", SOAP11_NS), VerificationError);
    EXPECT_EQ(xmldsig::canonicalize_element("<a><b  x='1'/></a>", "b", ""), "<b x=\"1\"></b>");
}
