#include "abi.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>

namespace {

Bytes word_u64(uint64_t v) {
    Bytes w(32, 0);
    for (int i = 0; i < 8; i++) {
        w[31 - i] = static_cast<uint8_t>((v >> (8 * i)) & 0xff);
    }
    return w;
}

Bytes left_pad(const Bytes& b) {
    Bytes w(32 - b.size(), 0);
    w.insert(w.end(), b.begin(), b.end());
    return w;
}

Bytes right_pad(const Bytes& b) {
    Bytes out = b;
    out.resize(((b.size() + 31) / 32) * 32, 0);
    return out;
}

bool is_dynamic(const std::string& type) {
    return type == "string" || type == "bytes";
}

Bytes encode_uint(const nlohmann::json& v, const std::string& type) {
    if (v.is_number_unsigned()) {
        return word_u64(v.get<uint64_t>());
    }
    if (v.is_number_integer()) {
        auto i = v.get<int64_t>();
        if (i < 0) throw ValidationError(type + " argument must not be negative");
        return word_u64(static_cast<uint64_t>(i));
    }
    if (v.is_string()) {
        auto s = v.get<std::string>();
        if (hex::has_prefix(s)) {
            Bytes b = hex::decode(s);
            auto first = std::find_if(b.begin(), b.end(), [](uint8_t x) { return x != 0; });
            b.erase(b.begin(), first);
            if (b.size() > 32) throw ValidationError(type + " argument exceeds 256 bits");
            return left_pad(b);
        }
        if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw ValidationError("Invalid " + type + " argument: " + s);
        }
        try {
            return word_u64(std::stoull(s));
        } catch (const std::out_of_range&) {
            throw ValidationError(type + " decimal argument exceeds 64 bits, pass it as hex");
        }
    }
    throw ValidationError("Invalid " + type + " argument: " + v.dump());
}

Bytes encode_address(const nlohmann::json& v) {
    if (!v.is_string()) throw ValidationError("address argument must be a hex string");
    Bytes b = hex::decode(v.get<std::string>());
    if (b.size() != 20) throw ValidationError("address argument must be 20 bytes: " + v.get<std::string>());
    return left_pad(b);
}

Bytes encode_bool(const nlohmann::json& v) {
    if (v.is_boolean()) return word_u64(v.get<bool>() ? 1 : 0);
    if (v.is_number_integer() && (v.get<int64_t>() == 0 || v.get<int64_t>() == 1)) {
        return word_u64(static_cast<uint64_t>(v.get<int64_t>()));
    }
    throw ValidationError("Invalid bool argument: " + v.dump());
}

Bytes encode_static(const std::string& type, const nlohmann::json& v) {
    if (type == "address") return encode_address(v);
    if (type == "bool") return encode_bool(v);
    if (type.rfind("uint", 0) == 0) return encode_uint(v, type);
    if (type == "bytes32") {
        if (!v.is_string()) throw ValidationError("bytes32 argument must be a hex string");
        Bytes b = hex::decode(v.get<std::string>());
        if (b.size() > 32) throw ValidationError("bytes32 argument longer than 32 bytes");
        return right_pad(b);
    }
    throw ValidationError("Unsupported ABI type: " + type);
}

Bytes encode_dynamic(const std::string& type, const nlohmann::json& v) {
    Bytes data;
    if (type == "string") {
        if (!v.is_string()) throw ValidationError("string argument expected");
        auto s = v.get<std::string>();
        data.assign(s.begin(), s.end());
    } else {
        if (!v.is_string()) throw ValidationError("bytes argument must be a hex string");
        data = hex::decode(v.get<std::string>());
    }

    Bytes out = word_u64(data.size());
    Bytes padded = right_pad(data);
    out.insert(out.end(), padded.begin(), padded.end());
    return out;
}

Bytes result_bytes(const std::string& result_hex, size_t min_len) {
    Bytes b = hex::decode(result_hex);
    if (b.size() < min_len) {
        throw ValidationError("ABI result too short: " + std::to_string(b.size()) + " bytes");
    }
    return b;
}

uint64_t word_to_u64(const Bytes& b, size_t offset) {
    for (size_t i = offset; i < offset + 24; i++) {
        if (b[i] != 0) throw ValidationError("ABI word exceeds 64 bits");
    }
    uint64_t v = 0;
    for (size_t i = offset + 24; i < offset + 32; i++) {
        v = (v << 8) | b[i];
    }
    return v;
}

} // namespace

namespace abi {

Bytes selector(const std::string& signature) {
    Bytes h = digest::keccak_256(signature);
    return Bytes(h.begin(), h.begin() + 4);
}

std::vector<std::string> parameter_types(const std::string& signature) {
    auto open = signature.find('(');
    auto close = signature.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open || open == 0) {
        throw ValidationError("Invalid function signature: " + signature);
    }

    std::vector<std::string> types;
    for (const auto& t : util::split(signature.substr(open + 1, close - open - 1), ',')) {
        if (t.find(' ') != std::string::npos || t.find('[') != std::string::npos ||
            t.find('(') != std::string::npos) {
            throw ValidationError("Unsupported parameter type in signature: " + t);
        }
        types.push_back(t);
    }
    return types;
}

Bytes encode_call(const std::string& signature, const nlohmann::json& args) {
    auto types = parameter_types(signature);
    nlohmann::json values = args.is_null() ? nlohmann::json::array() : args;
    if (!values.is_array() || values.size() != types.size()) {
        throw ValidationError("Expected " + std::to_string(types.size()) +
                              " arguments for " + signature);
    }

    const size_t head_size = 32 * types.size();
    Bytes head;
    Bytes tail;
    for (size_t i = 0; i < types.size(); i++) {
        if (is_dynamic(types[i])) {
            Bytes offset = word_u64(head_size + tail.size());
            head.insert(head.end(), offset.begin(), offset.end());
            Bytes enc = encode_dynamic(types[i], values[i]);
            tail.insert(tail.end(), enc.begin(), enc.end());
        } else {
            Bytes enc = encode_static(types[i], values[i]);
            head.insert(head.end(), enc.begin(), enc.end());
        }
    }

    Bytes out = selector(signature);
    out.insert(out.end(), head.begin(), head.end());
    out.insert(out.end(), tail.begin(), tail.end());
    return out;
}

std::string encode_call_hex(const std::string& signature, const nlohmann::json& args) {
    return hex::encode(encode_call(signature, args));
}

uint64_t decode_uint64(const std::string& result_hex, size_t word) {
    Bytes b = result_bytes(result_hex, (word + 1) * 32);
    return word_to_u64(b, word * 32);
}

std::string decode_address(const std::string& result_hex, size_t word) {
    Bytes b = result_bytes(result_hex, (word + 1) * 32);
    return hex::encode(b.data() + word * 32 + 12, 20);
}

std::string decode_string(const std::string& result_hex) {
    Bytes b = result_bytes(result_hex, 64);
    uint64_t offset = word_to_u64(b, 0);
    if (offset > b.size() - 32) throw ValidationError("ABI string offset out of range");
    uint64_t len = word_to_u64(b, offset);
    if (len > b.size() - offset - 32) throw ValidationError("ABI string length out of range");
    return std::string(b.begin() + offset + 32, b.begin() + offset + 32 + len);
}

nlohmann::json decode_result(const std::string& result_hex, const std::string& type) {
    if (type == "string") {
        return decode_string(result_hex);
    }
    if (type == "address") {
        return decode_address(result_hex);
    }
    if (type == "bool") {
        return decode_uint64(result_hex) != 0;
    }
    if (type.rfind("uint", 0) == 0) {
        return decode_uint64(result_hex);
    }
    throw ValidationError("Unsupported return type: " + type);
}

} // namespace abi
