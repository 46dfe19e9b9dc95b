#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace soapx {
namespace crypto {

enum class Digest {
    SHA1,
    SHA256
};

std::string base64_encode(const std::string& data);

// Whitespace in the input is ignored. Empty on malformed input.
std::optional<std::string> base64_decode(const std::string& encoded);

std::string digest(Digest algorithm, const std::string& data);

std::string random_bytes(std::size_t size);

// Check an RSA PKCS#1 v1.5 signature with the public key of a DER encoded
// X.509 certificate. Throws std::runtime_error when the certificate is unusable.
bool verify_signature(Digest algorithm,
                      const std::string& der_certificate,
                      const std::string& data,
                      const std::string& signature);

} // namespace crypto
} // namespace soapx
