#include "digest.hpp"
#include <ethash/keccak.hpp>
#include <openssl/evp.h>
#include <cstring>
#include <stdexcept>

namespace digest {

void keccak_256(const uint8_t* data, size_t len, uint8_t out[32]) {
    const auto hash = ethash::keccak256(data, len);
    std::memcpy(out, hash.bytes, 32);
}

Bytes keccak_256(const Bytes& data) {
    Bytes out(32);
    keccak_256(data.data(), data.size(), out.data());
    return out;
}

Bytes keccak_256(const std::string& data) {
    Bytes out(32);
    keccak_256(reinterpret_cast<const uint8_t*>(data.data()), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    return hex::encode(md, md_len, false);
}

} // namespace digest
