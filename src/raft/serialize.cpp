#include "serializer.hpp"
#include "../storage/cbor.hpp"
#include <iostream>
#include <stdexcept>

namespace quorumkv::raft {

    using json = nlohmann::json;

    json Serializer::entry_to_json(const LogEntry& entry) {
        json j;
        j["index"] = entry.index;
        j["term"] = entry.term;
        j["type"] = static_cast<uint8_t>(entry.type);
        j["data"] = storage::to_binary(entry.data);
        return j;
    }

    LogEntry Serializer::entry_from_json(const json& j) {
        LogEntry entry;
        entry.index = j.at("index").get<uint64_t>();
        entry.term = j.at("term").get<uint64_t>();
        // Read wide so an out-of-range code is not narrowed into a valid one
        uint64_t type = j.at("type").get<uint64_t>();
        if (type > static_cast<uint64_t>(EntryType::CONFIG_CHANGE)) {
            throw std::out_of_range("unknown entry type " + std::to_string(type));
        }
        entry.type = static_cast<EntryType>(static_cast<uint8_t>(type));
        entry.data = storage::from_binary(j.at("data"));
        return entry;
    }

    json Serializer::snapshot_metadata_to_json(const SnapshotMetadata& meta) {
        json j;
        j["index"] = meta.index;
        j["term"] = meta.term;
        j["voters"] = meta.voters;
        return j;
    }

    SnapshotMetadata Serializer::snapshot_metadata_from_json(const json& j) {
        SnapshotMetadata meta;
        meta.index = j.at("index").get<uint64_t>();
        meta.term = j.at("term").get<uint64_t>();
        meta.voters = j.at("voters").get<std::vector<uint64_t>>();
        return meta;
    }

    json Serializer::hard_state_to_json(const HardState& hs) {
        json j;
        j["term"] = hs.term;
        j["vote"] = hs.vote;
        j["commit"] = hs.commit;
        return j;
    }

    HardState Serializer::hard_state_from_json(const json& j) {
        HardState hs;
        hs.term = j.at("term").get<uint64_t>();
        hs.vote = j.at("vote").get<uint64_t>();
        hs.commit = j.at("commit").get<uint64_t>();
        return hs;
    }

    std::string Serializer::serialize_message(const Message& msg) {
        json j;
        j["type"] = static_cast<uint8_t>(msg.type);
        j["from"] = msg.from;
        j["to"] = msg.to;
        j["term"] = msg.term;
        j["log_term"] = msg.log_term;
        j["index"] = msg.index;
        j["commit"] = msg.commit;
        j["reject"] = msg.reject;
        j["reject_hint"] = msg.reject_hint;

        json entries_array = json::array();
        for (const auto& entry : msg.entries) {
            entries_array.push_back(entry_to_json(entry));
        }
        j["entries"] = entries_array;

        if (!msg.snapshot.empty()) {
            json snap;
            snap["metadata"] = snapshot_metadata_to_json(msg.snapshot.metadata);
            snap["data"] = storage::to_binary(msg.snapshot.data);
            j["snapshot"] = snap;
        }

        return storage::to_cbor_string(j);
    }

    bool Serializer::deserialize_message(const std::string& data, Message& msg) {
        try {
            json j = storage::from_cbor_string(data);

            uint64_t type = j.at("type").get<uint64_t>();
            if (type > static_cast<uint64_t>(MessageType::INSTALL_SNAPSHOT)) {
                std::cerr << "[Serializer] Unknown message type: " << type << std::endl;
                return false;
            }

            Message decoded;
            decoded.type = static_cast<MessageType>(static_cast<uint8_t>(type));
            decoded.from = j.at("from").get<uint64_t>();
            decoded.to = j.at("to").get<uint64_t>();
            decoded.term = j.at("term").get<uint64_t>();
            decoded.log_term = j.at("log_term").get<uint64_t>();
            decoded.index = j.at("index").get<uint64_t>();
            decoded.commit = j.at("commit").get<uint64_t>();
            decoded.reject = j.at("reject").get<bool>();
            decoded.reject_hint = j.at("reject_hint").get<uint64_t>();

            if (j.contains("entries") && j["entries"].is_array()) {
                for (const auto& entry_json : j["entries"]) {
                    decoded.entries.push_back(entry_from_json(entry_json));
                }
            }

            if (j.contains("snapshot")) {
                const json& snap = j["snapshot"];
                decoded.snapshot.metadata = snapshot_metadata_from_json(snap.at("metadata"));
                decoded.snapshot.data = storage::from_binary(snap.at("data"));
            }

            msg = std::move(decoded);
            return true;
        }
        catch (const json::exception& e) {
            std::cerr << "[Serializer] Failed to parse Message: " << e.what() << std::endl;
            return false;
        }
        catch (const std::out_of_range& e) {
            std::cerr << "[Serializer] Invalid Message: " << e.what() << std::endl;
            return false;
        }
    }

    std::string Serializer::serialize_conf_change(const ConfChange& cc) {
        json j;
        j["type"] = cc.type == ConfChangeType::ADD_NODE ? "add" : "remove";
        j["node_id"] = cc.node_id;
        j["address"] = cc.address;
        return j.dump();
    }

    bool Serializer::deserialize_conf_change(const std::string& data, ConfChange& cc) {
        try {
            json j = json::parse(data);

            std::string type = j.at("type").get<std::string>();
            if (type == "add") {
                cc.type = ConfChangeType::ADD_NODE;
            }
            else if (type == "remove") {
                cc.type = ConfChangeType::REMOVE_NODE;
            }
            else {
                std::cerr << "[Serializer] Unknown conf change type: " << type << std::endl;
                return false;
            }
            cc.node_id = j.at("node_id").get<uint64_t>();
            cc.address = j.value("address", "");
            return true;
        }
        catch (const json::exception& e) {
            std::cerr << "[Serializer] Failed to parse ConfChange: " << e.what() << std::endl;
            return false;
        }
    }

}
