#include "kv_client.hpp"
#include "socket_io.hpp"
#include "../storage/record_log.hpp"
#include <stdexcept>
#include <unistd.h>

namespace quorumkv::network {

    KvClient::KvClient(const std::string& address, uint32_t timeout_ms)
        : address_(address)
        , timeout_ms_(timeout_ms)
    {
    }

    KvClient::~KvClient() {
        disconnect();
    }

    void KvClient::disconnect() {
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
    }

    std::string KvClient::round_trip(const std::string& payload) {
        if (fd_ < 0) {
            std::string error;
            fd_ = connect_with_timeout(address_, timeout_ms_, error);
            if (fd_ < 0) {
                throw std::runtime_error("Cannot reach " + address_ + ": " + error);
            }
            set_io_timeout(fd_, SO_SNDTIMEO, timeout_ms_);
            set_io_timeout(fd_, SO_RCVTIMEO, timeout_ms_);
        }

        std::string frame = storage::encode_record(payload);
        char header[4];
        if (!send_all(fd_, frame.data(), frame.size()) || recv_exact(fd_, header, sizeof(header)) != 1) {
            disconnect();
            throw std::runtime_error("Connection to " + address_ + " failed");
        }

        uint32_t size = storage::decode_record_length(header);
        if (size > storage::MAX_RECORD_SIZE) {
            disconnect();
            throw std::runtime_error("Response from " + address_ + " is too large");
        }
        std::string response(size, '\0');
        if (size > 0 && recv_exact(fd_, &response[0], size) != 1) {
            disconnect();
            throw std::runtime_error("Connection to " + address_ + " closed mid-response");
        }
        return response;
    }

    ClientResponse KvClient::request(const ClientRequest& request) {
        std::string payload = round_trip(encode_request(request));
        try {
            return decode_response(payload);
        }
        catch (const std::invalid_argument& e) {
            disconnect();
            throw std::runtime_error(e.what());
        }
    }

    ClientResponse KvClient::set(const std::string& key, const std::string& value) {
        return request(ClientRequest{ "set", key, value });
    }

    ClientResponse KvClient::get(const std::string& key) {
        return request(ClientRequest{ "get", key, "" });
    }

    ClientResponse KvClient::remove(const std::string& key) {
        return request(ClientRequest{ "delete", key, "" });
    }

}
