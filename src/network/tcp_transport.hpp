#pragma once
#include "../../include/quorumkv/raft/types.hpp"
#include "../../include/quorumkv/config/options.hpp"
#include "../raft/serializer.hpp"
#include "peer_table.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace quorumkv::network {

    // One frame per connection: [u32 big-endian length][CBOR message].
    // send() only queues; a fixed pool of sender threads does the I/O.
    class TcpTransport : public raft::INetworkTransport {
    public:
        TcpTransport(uint64_t node_id, const std::string& listen_address,
            const config::NodeOptions& options);
        ~TcpTransport();

        bool send(const raft::Message& msg) override;
        void set_message_handler(MessageHandler handler) override;

        // Binds the listen address. Throws std::runtime_error.
        void start() override;
        void stop() override;

        void update_peer(uint64_t node_id, const std::string& address) override;
        void remove_peer(uint64_t node_id) override;

        const PeerTable& peers() const { return peers_; }
        uint16_t bound_port() const { return bound_port_; }
        size_t queued() const;
        uint64_t dropped() const { return dropped_; }

    private:
        struct Outbound {
            uint64_t to;
            std::string frame;
        };

        void listen_loop();
        void handle_connection(int fd);
        void sender_loop();
        bool deliver(const Outbound& out);
        void report_failure(uint64_t to, const std::string& address, const std::string& reason);

        uint64_t node_id_;
        std::string listen_address_;
        uint32_t send_timeout_ms_;
        uint32_t sender_threads_;
        size_t queue_limit_;
        uint32_t max_frame_bytes_;

        PeerTable peers_;
        raft::Serializer serializer_;

        std::mutex handler_mutex_;
        MessageHandler handler_;

        mutable std::mutex queue_mutex_;
        std::condition_variable queue_cv_;
        std::deque<Outbound> queue_;

        std::atomic<bool> running_{ false };
        std::atomic<uint64_t> dropped_{ 0 };
        int listen_fd_ = -1;
        uint16_t bound_port_ = 0;
        std::thread listener_thread_;
        std::vector<std::thread> senders_;

        // Inbound connections run on detached threads; stop() waits for them
        std::mutex connections_mutex_;
        std::condition_variable connections_cv_;
        std::set<int> connections_;
        size_t active_handlers_ = 0;

        std::mutex unreachable_mutex_;
        std::set<uint64_t> unreachable_;
    };

}
