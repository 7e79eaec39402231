#pragma once
#include "client_protocol.hpp"
#include <cstdint>
#include <string>

namespace quorumkv::network {

    // Blocking client for a node's client endpoint. One connection, opened lazily
    // and reopened after an I/O failure. Not thread-safe.
    class KvClient {
    public:
        explicit KvClient(const std::string& address, uint32_t timeout_ms = 5000);
        ~KvClient();

        KvClient(const KvClient&) = delete;
        KvClient& operator=(const KvClient&) = delete;

        // Throws std::runtime_error when the node cannot be reached
        ClientResponse request(const ClientRequest& request);
        ClientResponse set(const std::string& key, const std::string& value);
        ClientResponse get(const std::string& key);
        ClientResponse remove(const std::string& key);

        // Sends `payload` as one frame and returns the raw response payload.
        // Throws std::runtime_error.
        std::string round_trip(const std::string& payload);

        void disconnect();

    private:
        std::string address_;
        uint32_t timeout_ms_;
        int fd_ = -1;
    };

}
