#pragma once

#include "hex.hpp"
#include <string>

namespace digest {
    // Ethereum Keccak-256 (ethash), not FIPS-202 SHA3-256.
    void keccak_256(const uint8_t* data, size_t len, uint8_t out[32]);
    Bytes keccak_256(const Bytes& data);
    Bytes keccak_256(const std::string& data);

    std::string sha256_hex(const std::string& data);
}
