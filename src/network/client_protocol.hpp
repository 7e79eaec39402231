#pragma once
#include "../storage/cbor.hpp"
#include <stdexcept>
#include <string>

namespace quorumkv::network {

    // Client frames reuse the peer framing: [u32 big-endian length][CBOR map].
    //   request:  {"op": "set" | "get" | "delete", "key": bytes, "value": bytes}
    //   response: {"success": bool, "error": text, "found": bool, "value": bytes}

    struct ClientRequest {
        std::string op;
        std::string key;
        std::string value;
    };

    struct ClientResponse {
        bool success = false;
        std::string error;
        bool found = false;
        std::string value;
    };

    inline std::string encode_request(const ClientRequest& request) {
        storage::json j;
        j["op"] = request.op;
        j["key"] = storage::to_binary(request.key);
        if (request.op == "set") {
            j["value"] = storage::to_binary(request.value);
        }
        return storage::to_cbor_string(j);
    }

    // Throws std::invalid_argument
    inline ClientRequest decode_request(const std::string& payload) {
        try {
            storage::json j = storage::from_cbor_string(payload);
            ClientRequest request;
            request.op = j.at("op").get<std::string>();
            request.key = storage::from_binary(j.at("key"));
            if (j.contains("value")) {
                request.value = storage::from_binary(j["value"]);
            }
            return request;
        }
        catch (const storage::json::exception& e) {
            throw std::invalid_argument(std::string("malformed request: ") + e.what());
        }
    }

    inline std::string encode_response(const ClientResponse& response) {
        storage::json j;
        j["success"] = response.success;
        j["error"] = response.error;
        j["found"] = response.found;
        j["value"] = storage::to_binary(response.value);
        return storage::to_cbor_string(j);
    }

    // Throws std::invalid_argument
    inline ClientResponse decode_response(const std::string& payload) {
        try {
            storage::json j = storage::from_cbor_string(payload);
            ClientResponse response;
            response.success = j.at("success").get<bool>();
            response.error = j.at("error").get<std::string>();
            response.found = j.at("found").get<bool>();
            response.value = storage::from_binary(j.at("value"));
            return response;
        }
        catch (const storage::json::exception& e) {
            throw std::invalid_argument(std::string("malformed response: ") + e.what());
        }
    }

}
