#pragma once

#include "hex.hpp"
#include <vector>

namespace rlp {
    Bytes encode_bytes(const Bytes& data);
    Bytes encode_uint(uint64_t value);
    // Items must already be RLP-encoded.
    Bytes encode_list(const std::vector<Bytes>& items);
}
