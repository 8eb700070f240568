/**
 * @file hashing.cpp
 * @brief OpenSSL EVP digests
 */

#include "hashing.hpp"

#include <openssl/evp.h>

#include <stdexcept>
#include <string>

namespace cellar {

namespace {

Key::Bytes digest(const EVP_MD* md, std::span<const uint8_t> input) {
    Key::Bytes out{};
    unsigned int len = 0;
    if (EVP_Digest(input.data(), input.size(), out.data(), &len, md, nullptr) != 1) {
        throw std::runtime_error(std::string("EVP_Digest failed for ") + EVP_MD_get0_name(md));
    }
    if (len != out.size()) {
        throw std::runtime_error("unexpected digest length " + std::to_string(len));
    }
    return out;
}

} // namespace

Key::Bytes Sha2x256::hash(std::span<const uint8_t> input) {
    return digest(EVP_sha256(), input);
}

Key::Bytes Sha3x256::hash(std::span<const uint8_t> input) {
    return digest(EVP_sha3_256(), input);
}

} // namespace cellar
