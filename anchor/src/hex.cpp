#include "hex.hpp"
#include "errors.hpp"
#include <algorithm>

namespace {

int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

} // namespace

namespace hex {

std::string encode(const uint8_t* data, size_t len, bool prefix) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2 + 2);
    if (prefix) out += "0x";
    for (size_t i = 0; i < len; i++) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

std::string encode(const Bytes& bytes, bool prefix) {
    return encode(bytes.data(), bytes.size(), prefix);
}

bool has_prefix(const std::string& s) {
    return s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

std::string strip_prefix(const std::string& s) {
    return has_prefix(s) ? s.substr(2) : s;
}

Bytes decode(const std::string& hex) {
    std::string s = strip_prefix(hex);
    if (s.size() % 2 == 1) s = "0" + s;

    Bytes out;
    out.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2) {
        int hi = nibble(s[i]);
        int lo = nibble(s[i + 1]);
        if (hi < 0 || lo < 0) {
            throw ValidationError("Invalid hex string: " + hex.substr(0, 16));
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

uint64_t parse_quantity(const std::string& quantity) {
    std::string s = strip_prefix(quantity);
    if (s.empty()) {
        throw ValidationError("Empty hex quantity");
    }

    size_t first = s.find_first_not_of('0');
    if (first == std::string::npos) return 0;
    if (s.size() - first > 16) {
        throw ValidationError("Hex quantity exceeds 64 bits: " + quantity);
    }

    uint64_t v = 0;
    for (size_t i = first; i < s.size(); i++) {
        int d = nibble(s[i]);
        if (d < 0) {
            throw ValidationError("Invalid hex quantity: " + quantity);
        }
        v = (v << 4) | static_cast<uint64_t>(d);
    }
    return v;
}

long double parse_quantity_ld(const std::string& quantity) {
    std::string s = strip_prefix(quantity);
    long double v = 0.0L;
    for (char c : s) {
        int d = nibble(c);
        if (d < 0) {
            throw ValidationError("Invalid hex quantity: " + quantity);
        }
        v = v * 16.0L + static_cast<long double>(d);
    }
    return v;
}

std::string quantity_to_decimal(const std::string& quantity) {
    Bytes digits = decode(quantity);
    std::string out;

    // Repeated long division by 10 over the big-endian bytes
    while (std::any_of(digits.begin(), digits.end(), [](uint8_t b) { return b != 0; })) {
        int rem = 0;
        for (auto& b : digits) {
            int cur = (rem << 8) | b;
            b = static_cast<uint8_t>(cur / 10);
            rem = cur % 10;
        }
        out += static_cast<char>('0' + rem);
    }

    if (out.empty()) return "0";
    std::reverse(out.begin(), out.end());
    return out;
}

std::string quantity(uint64_t value) {
    if (value == 0) return "0x0";
    static const char digits[] = "0123456789abcdef";
    std::string out;
    while (value > 0) {
        out += digits[value & 0x0f];
        value >>= 4;
    }
    std::reverse(out.begin(), out.end());
    return "0x" + out;
}

Bytes minimal_be(uint64_t value) {
    Bytes be;
    while (value > 0) {
        be.push_back(static_cast<uint8_t>(value & 0xff));
        value >>= 8;
    }
    std::reverse(be.begin(), be.end());
    return be;
}

} // namespace hex
