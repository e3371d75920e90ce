#pragma once

#include "hex.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Solidity ABI encoding for contract calls. Supported argument types: address, uint<N>,
// bool, bytes32, string, bytes. Tuples and arrays are not supported.
namespace abi {
    // "configurarURIEstado(uint8,string)" -> first four bytes of keccak256
    Bytes selector(const std::string& signature);

    std::vector<std::string> parameter_types(const std::string& signature);

    // args must be a JSON array with one element per parameter type.
    Bytes encode_call(const std::string& signature, const nlohmann::json& args);
    std::string encode_call_hex(const std::string& signature, const nlohmann::json& args);

    // Decoders for eth_call results
    uint64_t decode_uint64(const std::string& result_hex, size_t word = 0);
    std::string decode_address(const std::string& result_hex, size_t word = 0);
    std::string decode_string(const std::string& result_hex);

    // Single return value of type string, address, bool or uint<N> (up to 64 bits).
    nlohmann::json decode_result(const std::string& result_hex, const std::string& type);
}
