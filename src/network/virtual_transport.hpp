#pragma once
#include "../../include/quorumkv/raft/types.hpp"
#include "peer_table.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <utility>

namespace quorumkv::network {

    // In-process hub connecting any number of nodes. Delivery is synchronous:
    // send() runs the recipient's handler on the sender's thread.
    // Links can be cut and nodes isolated to inject faults.
    class VirtualNetwork {
    public:
        using MessageHandler = raft::INetworkTransport::MessageHandler;

        void register_node(uint64_t node_id, MessageHandler handler);
        void unregister_node(uint64_t node_id);

        bool deliver(const raft::Message& msg);

        // Drops all traffic to and from the node
        void isolate(uint64_t node_id);
        void heal(uint64_t node_id);

        // Drops traffic between a and b in both directions
        void cut(uint64_t a, uint64_t b);
        void restore(uint64_t a, uint64_t b);
        void restore_all();

        bool is_registered(uint64_t node_id) const;
        uint64_t delivered_count() const { return delivered_; }
        uint64_t dropped_count() const { return dropped_; }

    private:
        bool reachable_locked(uint64_t from, uint64_t to) const;

        // Deliveries to one node are serialized; unregister closes the slot so a
        // delivery racing with it never reaches a stopped transport
        struct Endpoint {
            std::mutex mutex;
            bool open = true;
            MessageHandler handler;
        };

        mutable std::mutex mutex_;
        std::map<uint64_t, std::shared_ptr<Endpoint>> endpoints_;
        std::set<uint64_t> isolated_;
        std::set<std::pair<uint64_t, uint64_t>> cut_links_;

        std::atomic<uint64_t> delivered_{ 0 };
        std::atomic<uint64_t> dropped_{ 0 };
    };

    // Per-node view of a VirtualNetwork
    class VirtualTransport : public raft::INetworkTransport {
    public:
        VirtualTransport(uint64_t node_id, std::shared_ptr<VirtualNetwork> network);
        ~VirtualTransport();

        bool send(const raft::Message& msg) override;
        void set_message_handler(MessageHandler handler) override;

        void start() override;
        void stop() override;

        void update_peer(uint64_t node_id, const std::string& address) override;
        void remove_peer(uint64_t node_id) override;

        const PeerTable& peers() const { return peers_; }
        uint64_t sent_count() const { return sent_; }

    private:
        void dispatch(const raft::Message& msg);

        uint64_t node_id_;
        std::shared_ptr<VirtualNetwork> network_;
        PeerTable peers_;

        std::mutex handler_mutex_;
        MessageHandler handler_;

        std::atomic<bool> running_{ false };
        std::atomic<uint64_t> sent_{ 0 };
    };

}
