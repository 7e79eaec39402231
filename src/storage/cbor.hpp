#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace quorumkv::storage {

    using json = nlohmann::json;

    inline json to_binary(const std::string& bytes) {
        return json::binary(std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
    }

    // Accepts both binary and text values. Throws json::type_error otherwise.
    inline std::string from_binary(const json& value) {
        if (value.is_binary()) {
            const auto& bin = value.get_binary();
            return std::string(bin.begin(), bin.end());
        }
        return value.get<std::string>();
    }

    inline std::string to_cbor_string(const json& j) {
        std::vector<std::uint8_t> bytes = json::to_cbor(j);
        return std::string(bytes.begin(), bytes.end());
    }

    // Throws json::parse_error on malformed input.
    inline json from_cbor_string(const std::string& data) {
        return json::from_cbor(data.begin(), data.end());
    }

}
