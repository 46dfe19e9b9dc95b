#include "crypto_utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/x509.h>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <memory>
#include <stdexcept>

namespace soapx {
namespace crypto {

namespace {

struct MdContextDeleter {
    void operator()(EVP_MD_CTX* context) const { EVP_MD_CTX_free(context); }
};

using MdContextPtr = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

struct CertificateDeleter {
    void operator()(X509* certificate) const { X509_free(certificate); }
};

using CertificatePtr = std::unique_ptr<X509, CertificateDeleter>;

struct PublicKeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

using PublicKeyPtr = std::unique_ptr<EVP_PKEY, PublicKeyDeleter>;

const EVP_MD* message_digest(Digest algorithm) {
    switch (algorithm) {
        case Digest::SHA1: return EVP_sha1();
        case Digest::SHA256: return EVP_sha256();
    }
    return EVP_sha256();
}

} // namespace

std::string base64_encode(const std::string& data) {
    if (data.empty()) {
        return "";
    }
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                 reinterpret_cast<const unsigned char*>(data.data()),
                                 static_cast<int>(data.size()));
    encoded.resize(static_cast<size_t>(length));
    return encoded;
}

std::optional<std::string> base64_decode(const std::string& encoded) {
    std::string compact;
    compact.reserve(encoded.size());
    std::copy_if(encoded.begin(), encoded.end(), std::back_inserter(compact),
                 [](unsigned char c) { return !std::isspace(c); });
    if (compact.empty()) {
        return std::string();
    }
    if (compact.size() % 4 != 0) {
        return std::nullopt;
    }

    std::string decoded(3 * compact.size() / 4, '\0');
    int length = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&decoded[0]),
                                 reinterpret_cast<const unsigned char*>(compact.data()),
                                 static_cast<int>(compact.size()));
    if (length < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock keeps the bytes produced by '=' padding
    size_t padding = 0;
    if (compact[compact.size() - 1] == '=') ++padding;
    if (compact[compact.size() - 2] == '=') ++padding;
    decoded.resize(static_cast<size_t>(length) - padding);
    return decoded;
}

std::string digest(Digest algorithm, const std::string& data) {
    MdContextPtr context(EVP_MD_CTX_new());
    unsigned char value[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    if (!context ||
        EVP_DigestInit_ex(context.get(), message_digest(algorithm), nullptr) != 1 ||
        EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(context.get(), value, &length) != 1) {
        throw std::runtime_error("Failed to compute message digest");
    }
    return std::string(reinterpret_cast<const char*>(value), length);
}

std::string random_bytes(std::size_t size) {
    std::string buffer(size, '\0');
    if (size > 0 && RAND_bytes(reinterpret_cast<unsigned char*>(&buffer[0]), static_cast<int>(size)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return buffer;
}

bool verify_signature(Digest algorithm,
                      const std::string& der_certificate,
                      const std::string& data,
                      const std::string& signature) {
    const auto* der = reinterpret_cast<const unsigned char*>(der_certificate.data());
    CertificatePtr certificate(d2i_X509(nullptr, &der, static_cast<long>(der_certificate.size())));
    if (!certificate) {
        throw std::runtime_error("Failed to decode X.509 certificate");
    }
    PublicKeyPtr key(X509_get_pubkey(certificate.get()));
    if (!key) {
        throw std::runtime_error("Certificate carries no usable public key");
    }

    MdContextPtr context(EVP_MD_CTX_new());
    if (!context ||
        EVP_DigestVerifyInit(context.get(), nullptr, message_digest(algorithm), nullptr, key.get()) != 1 ||
        EVP_DigestVerifyUpdate(context.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to initialize signature verification");
    }
    return EVP_DigestVerifyFinal(context.get(),
                                 reinterpret_cast<const unsigned char*>(signature.data()),
                                 signature.size()) == 1;
}

} // namespace crypto
} // namespace soapx
