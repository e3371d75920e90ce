#pragma once

#include <string>
#include <vector>
#include <cstdint>

using Bytes = std::vector<uint8_t>;

namespace hex {
    std::string encode(const uint8_t* data, size_t len, bool prefix = true);
    std::string encode(const Bytes& bytes, bool prefix = true);

    // Accepts an optional 0x prefix and odd-length input. Throws ValidationError on bad digits.
    Bytes decode(const std::string& hex);

    bool has_prefix(const std::string& s);
    std::string strip_prefix(const std::string& s);

    // JSON-RPC quantities ("0x1a")
    uint64_t parse_quantity(const std::string& quantity);
    long double parse_quantity_ld(const std::string& quantity);
    std::string quantity(uint64_t value);

    // Arbitrary width, e.g. wei balances above 2^64
    std::string quantity_to_decimal(const std::string& quantity);

    // Big-endian bytes without leading zeros; empty for 0.
    Bytes minimal_be(uint64_t value);
}
