#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace quorumkv::config {

    // Settings for one node. Everything except id and peers has a default.
    struct NodeOptions {
        uint64_t id = 0;
        std::map<uint64_t, std::string> peers;   // id -> host:port, includes this node
        std::string storage_path;                // empty: data_<id>
        std::string listen_address;              // empty: peers[id]
        std::string client_address;              // empty: listen host, port client_port_base + id
        uint32_t client_port_base = 50050;

        uint32_t tick_interval_ms = 100;
        uint32_t election_tick = 10;
        uint32_t heartbeat_tick = 2;
        uint64_t snapshot_threshold = 1000;
        uint64_t wal_compaction_threshold = 10000;
        uint32_t max_pending_proposals = 1024;
        uint32_t max_pending_messages = 4096;
        uint32_t max_uncommitted_entries = 4096;
        uint32_t proposal_timeout_ms = 5000;
        uint32_t send_timeout_ms = 500;
        uint32_t sender_threads = 2;
        uint32_t outbound_queue_limit = 4096;
        uint32_t max_frame_bytes = 64 * 1024 * 1024;

        // quorumkv_node <node_id> <peer1,peer2,...> [--data-dir DIR] [--config FILE]
        // A peer is "host:port" (id = position + 1) or "id=host:port".
        // Throws std::invalid_argument.
        static NodeOptions from_args(int argc, char* argv[]);

        // Overrides fields present in `j`; unknown keys are ignored.
        // Throws std::invalid_argument.
        void from_json(const nlohmann::json& j);
        void load_file(const std::string& path);
        nlohmann::json to_json() const;

        // Fills derived defaults and checks ranges. Throws std::invalid_argument.
        void validate();

        std::string effective_storage_path() const;
        std::string effective_listen_address() const;
        std::string effective_client_address() const;

        static std::map<uint64_t, std::string> parse_peers(const std::string& list);
    };

    // Splits "host:port". Throws std::invalid_argument.
    void parse_address(const std::string& address, std::string& host, uint16_t& port);

    std::string usage(const std::string& program);

}
