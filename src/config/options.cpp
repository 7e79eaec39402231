#include "../../include/quorumkv/config/options.hpp"
#include <fstream>
#include <vector>
#include <sstream>
#include <stdexcept>

namespace quorumkv::config {

    using json = nlohmann::json;

    namespace {

        uint64_t parse_id(const std::string& text, const std::string& what) {
            if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
                throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
            }
            try {
                return std::stoull(text);
            }
            catch (const std::out_of_range&) {
                throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
            }
        }

        template <typename T>
        void read_field(const json& j, const char* key, T& field) {
            if (!j.contains(key)) {
                return;
            }
            try {
                field = j.at(key).get<T>();
            }
            catch (const json::exception& e) {
                throw std::invalid_argument(std::string("Invalid value for '") + key + "': " + e.what());
            }
        }

    }

    void parse_address(const std::string& address, std::string& host, uint16_t& port) {
        size_t colon = address.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
            throw std::invalid_argument("Address must be host:port: '" + address + "'");
        }

        std::string port_text = address.substr(colon + 1);
        uint64_t value = parse_id(port_text, "port");
        if (value == 0 || value > 65535) {
            throw std::invalid_argument("Port out of range: '" + address + "'");
        }

        host = address.substr(0, colon);
        port = static_cast<uint16_t>(value);
    }

    std::map<uint64_t, std::string> NodeOptions::parse_peers(const std::string& list) {
        std::map<uint64_t, std::string> peers;

        std::stringstream ss(list);
        std::string item;
        uint64_t position = 0;
        while (std::getline(ss, item, ',')) {
            ++position;
            if (item.empty()) {
                throw std::invalid_argument("Empty peer entry at position " + std::to_string(position));
            }

            uint64_t id = position;
            std::string address = item;
            size_t eq = item.find('=');
            if (eq != std::string::npos) {
                id = parse_id(item.substr(0, eq), "peer id");
                address = item.substr(eq + 1);
            }

            if (id == 0) {
                throw std::invalid_argument("Peer id must be positive: '" + item + "'");
            }
            if (!peers.emplace(id, address).second) {
                throw std::invalid_argument("Duplicate peer id " + std::to_string(id));
            }
        }
        return peers;
    }

    NodeOptions NodeOptions::from_args(int argc, char* argv[]) {
        std::string config_file;
        std::string data_dir;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--data-dir" || arg == "--config") {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Missing value for " + arg);
                }
                (arg == "--data-dir" ? data_dir : config_file) = argv[++i];
            }
            else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
                throw std::invalid_argument("Unknown option " + arg);
            }
            else {
                positional.push_back(arg);
            }
        }

        NodeOptions options;
        if (!config_file.empty()) {
            options.load_file(config_file);
        }

        if (positional.size() > 2) {
            throw std::invalid_argument("Too many arguments");
        }
        if (!positional.empty()) {
            options.id = parse_id(positional[0], "node id");
        }
        if (positional.size() == 2) {
            options.peers = parse_peers(positional[1]);
        }
        if (!data_dir.empty()) {
            options.storage_path = data_dir;
        }

        options.validate();
        return options;
    }

    void NodeOptions::from_json(const json& j) {
        if (!j.is_object()) {
            throw std::invalid_argument("Configuration must be a JSON object");
        }

        read_field(j, "id", id);
        read_field(j, "storage_path", storage_path);
        read_field(j, "listen_address", listen_address);
        read_field(j, "client_address", client_address);
        read_field(j, "client_port_base", client_port_base);
        read_field(j, "tick_interval_ms", tick_interval_ms);
        read_field(j, "election_tick", election_tick);
        read_field(j, "heartbeat_tick", heartbeat_tick);
        read_field(j, "snapshot_threshold", snapshot_threshold);
        read_field(j, "wal_compaction_threshold", wal_compaction_threshold);
        read_field(j, "max_pending_proposals", max_pending_proposals);
        read_field(j, "max_pending_messages", max_pending_messages);
        read_field(j, "max_uncommitted_entries", max_uncommitted_entries);
        read_field(j, "proposal_timeout_ms", proposal_timeout_ms);
        read_field(j, "send_timeout_ms", send_timeout_ms);
        read_field(j, "sender_threads", sender_threads);
        read_field(j, "outbound_queue_limit", outbound_queue_limit);
        read_field(j, "max_frame_bytes", max_frame_bytes);

        if (j.contains("peers")) {
            const json& p = j["peers"];
            if (p.is_string()) {
                peers = parse_peers(p.get<std::string>());
            }
            else if (p.is_object()) {
                std::map<uint64_t, std::string> parsed;
                for (auto it = p.begin(); it != p.end(); ++it) {
                    if (!it.value().is_string()) {
                        throw std::invalid_argument("Peer address must be a string: '" + it.key() + "'");
                    }
                    parsed[parse_id(it.key(), "peer id")] = it.value().get<std::string>();
                }
                peers = parsed;
            }
            else {
                throw std::invalid_argument("'peers' must be an object or a comma separated string");
            }
        }
    }

    void NodeOptions::load_file(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            throw std::invalid_argument("Cannot open config file: " + path);
        }

        json j;
        try {
            j = json::parse(file);
        }
        catch (const json::exception& e) {
            throw std::invalid_argument("Failed to parse config file " + path + ": " + e.what());
        }
        from_json(j);
    }

    json NodeOptions::to_json() const {
        json j;
        j["id"] = id;
        json p = json::object();
        for (const auto& [peer_id, address] : peers) {
            p[std::to_string(peer_id)] = address;
        }
        j["peers"] = p;
        j["storage_path"] = effective_storage_path();
        j["listen_address"] = effective_listen_address();
        j["client_address"] = effective_client_address();
        j["client_port_base"] = client_port_base;
        j["tick_interval_ms"] = tick_interval_ms;
        j["election_tick"] = election_tick;
        j["heartbeat_tick"] = heartbeat_tick;
        j["snapshot_threshold"] = snapshot_threshold;
        j["wal_compaction_threshold"] = wal_compaction_threshold;
        j["max_pending_proposals"] = max_pending_proposals;
        j["max_pending_messages"] = max_pending_messages;
        j["max_uncommitted_entries"] = max_uncommitted_entries;
        j["proposal_timeout_ms"] = proposal_timeout_ms;
        j["send_timeout_ms"] = send_timeout_ms;
        j["sender_threads"] = sender_threads;
        j["outbound_queue_limit"] = outbound_queue_limit;
        j["max_frame_bytes"] = max_frame_bytes;
        return j;
    }

    void NodeOptions::validate() {
        if (id == 0) {
            throw std::invalid_argument("Node id must be a positive integer");
        }
        if (peers.empty()) {
            throw std::invalid_argument("Peer list is empty");
        }
        if (peers.find(id) == peers.end()) {
            throw std::invalid_argument("Node id " + std::to_string(id) + " is not in the peer list");
        }
        for (const auto& [peer_id, address] : peers) {
            std::string host;
            uint16_t port = 0;
            parse_address(address, host, port);
        }
        if (!listen_address.empty()) {
            std::string host;
            uint16_t port = 0;
            parse_address(listen_address, host, port);
        }
        if (!client_address.empty()) {
            std::string host;
            uint16_t port = 0;
            parse_address(client_address, host, port);
        }
        else if (client_port_base == 0 || client_port_base + id > 65535) {
            throw std::invalid_argument("client_port_base + id must be a valid port");
        }

        if (tick_interval_ms == 0) throw std::invalid_argument("tick_interval_ms must be positive");
        if (election_tick == 0) throw std::invalid_argument("election_tick must be positive");
        if (heartbeat_tick == 0) throw std::invalid_argument("heartbeat_tick must be positive");
        if (heartbeat_tick >= election_tick) {
            throw std::invalid_argument("heartbeat_tick must be smaller than election_tick");
        }
        if (snapshot_threshold == 0) throw std::invalid_argument("snapshot_threshold must be positive");
        if (wal_compaction_threshold == 0) throw std::invalid_argument("wal_compaction_threshold must be positive");
        if (max_pending_proposals == 0) throw std::invalid_argument("max_pending_proposals must be positive");
        if (max_pending_messages == 0) throw std::invalid_argument("max_pending_messages must be positive");
        if (max_uncommitted_entries == 0) throw std::invalid_argument("max_uncommitted_entries must be positive");
        if (proposal_timeout_ms == 0) throw std::invalid_argument("proposal_timeout_ms must be positive");
        if (send_timeout_ms == 0) throw std::invalid_argument("send_timeout_ms must be positive");
        if (sender_threads == 0) throw std::invalid_argument("sender_threads must be positive");
        if (outbound_queue_limit == 0) throw std::invalid_argument("outbound_queue_limit must be positive");
        if (max_frame_bytes < 1024) throw std::invalid_argument("max_frame_bytes must be at least 1024");
    }

    std::string NodeOptions::effective_storage_path() const {
        if (!storage_path.empty()) {
            return storage_path;
        }
        return "data_" + std::to_string(id);
    }

    std::string NodeOptions::effective_listen_address() const {
        if (!listen_address.empty()) {
            return listen_address;
        }
        auto it = peers.find(id);
        return it == peers.end() ? std::string() : it->second;
    }

    std::string NodeOptions::effective_client_address() const {
        if (!client_address.empty()) {
            return client_address;
        }

        std::string host = "127.0.0.1";
        std::string listen = effective_listen_address();
        size_t colon = listen.rfind(':');
        if (colon != std::string::npos && colon > 0) {
            host = listen.substr(0, colon);
        }
        return host + ":" + std::to_string(client_port_base + id);
    }

    std::string usage(const std::string& program) {
        return "Usage: " + program + " <node_id> <peer1,peer2,...> [--data-dir DIR] [--config FILE]\n"
            "  peer: host:port (id = position) or id=host:port";
    }

}
