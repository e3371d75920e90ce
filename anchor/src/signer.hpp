#pragma once

#include "hex.hpp"
#include <string>
#include <openssl/ec.h>

// Legacy (type 0) transaction signed under EIP-155 replay protection.
struct UnsignedTransaction {
    uint64_t nonce = 0;
    uint64_t gas_price = 0;
    uint64_t gas_limit = 0;
    std::string to;
    uint64_t value = 0;
    Bytes data;
    uint64_t chain_id = 0;
};

struct Signature {
    Bytes r;  // 32 bytes, big-endian
    Bytes s;  // 32 bytes, big-endian, low-s form
    int recovery_id = 0;
};

struct SignedTransaction {
    Bytes raw;
    std::string raw_hex;
    std::string hash;  // keccak256(raw), 0x-prefixed
    uint64_t v = 0;
};

// Holds a secp256k1 private key and signs locally; the key never leaves the process.
class Signer {
public:
    explicit Signer(const std::string& private_key_hex);
    ~Signer();

    Signer(const Signer&) = delete;
    Signer& operator=(const Signer&) = delete;

    // EIP-55 checksummed account address
    const std::string& address() const { return address_; }

    Signature sign_hash(const Bytes& hash32) const;
    SignedTransaction sign(const UnsignedTransaction& tx) const;

    // RLP([nonce, gasPrice, gas, to, value, data, chainId, 0, 0])
    static Bytes signing_payload(const UnsignedTransaction& tx);
    static Bytes signing_hash(const UnsignedTransaction& tx);

    // Address (checksummed) that produced sig over hash32, empty if recovery fails.
    static std::string recover_address(const Bytes& hash32, const Signature& sig);

    static std::string to_checksum_address(const std::string& address);

private:
    EC_KEY* key_;
    std::string address_;
};
