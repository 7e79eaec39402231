#pragma once
#include "../../include/quorumkv/raft/types.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace quorumkv::raft {

    class Serializer {
    public:
        // Protocol messages, CBOR encoded
        std::string serialize_message(const Message& msg);
        bool deserialize_message(const std::string& data, Message& msg);

        // Membership changes, JSON text carried in CONFIG_CHANGE entries
        std::string serialize_conf_change(const ConfChange& cc);
        bool deserialize_conf_change(const std::string& data, ConfChange& cc);

        // Shared with RaftStorage. The from_json variants throw nlohmann::json::exception;
        // entry_from_json also throws std::out_of_range for an unknown entry type.
        static nlohmann::json entry_to_json(const LogEntry& entry);
        static LogEntry entry_from_json(const nlohmann::json& j);

        static nlohmann::json snapshot_metadata_to_json(const SnapshotMetadata& meta);
        static SnapshotMetadata snapshot_metadata_from_json(const nlohmann::json& j);

        static nlohmann::json hard_state_to_json(const HardState& hs);
        static HardState hard_state_from_json(const nlohmann::json& j);
    };

}
