#pragma once
#include "../../include/quorumkv/config/options.hpp"
#include "../../include/quorumkv/kv/service.hpp"
#include "client_protocol.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

namespace quorumkv::network {

    // Serves set/get/delete for remote clients on the node's client address.
    // Each connection carries any number of request/response frames.
    class ClientServer {
    public:
        ClientServer(uint64_t node_id, const std::string& listen_address,
            std::shared_ptr<kv::KvService> service, const config::NodeOptions& options);
        ~ClientServer();

        // Throws std::runtime_error
        void start();
        void stop();

        ClientResponse handle(const ClientRequest& request);

        uint16_t bound_port() const { return bound_port_; }

    private:
        void listen_loop();
        void handle_connection(int fd);

        uint64_t node_id_;
        std::string listen_address_;
        std::shared_ptr<kv::KvService> service_;
        uint32_t send_timeout_ms_;
        uint32_t max_frame_bytes_;

        std::atomic<bool> running_{ false };
        int listen_fd_ = -1;
        uint16_t bound_port_ = 0;
        std::thread listener_thread_;

        std::mutex connections_mutex_;
        std::condition_variable connections_cv_;
        std::set<int> connections_;
        size_t active_handlers_ = 0;
    };

}
