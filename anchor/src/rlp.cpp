#include "rlp.hpp"

namespace {

void append_header(uint8_t short_base, uint8_t long_base, size_t len, Bytes& out) {
    if (len <= 55) {
        out.push_back(static_cast<uint8_t>(short_base + len));
        return;
    }
    Bytes len_be = hex::minimal_be(static_cast<uint64_t>(len));
    out.push_back(static_cast<uint8_t>(long_base + len_be.size()));
    out.insert(out.end(), len_be.begin(), len_be.end());
}

} // namespace

namespace rlp {

Bytes encode_bytes(const Bytes& data) {
    Bytes out;
    if (data.size() == 1 && data[0] < 0x80) {
        out.push_back(data[0]);
        return out;
    }
    append_header(0x80, 0xb7, data.size(), out);
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

Bytes encode_uint(uint64_t value) {
    return encode_bytes(hex::minimal_be(value));
}

Bytes encode_list(const std::vector<Bytes>& items) {
    size_t payload_len = 0;
    for (const auto& item : items) payload_len += item.size();

    Bytes out;
    append_header(0xc0, 0xf7, payload_len, out);
    for (const auto& item : items) {
        out.insert(out.end(), item.begin(), item.end());
    }
    return out;
}

} // namespace rlp
