#include "raft_storage.hpp"
#include "serializer.hpp"
#include "../storage/cbor.hpp"
#include <iostream>

namespace quorumkv::raft {

    using json = nlohmann::json;
    using storage::StorageError;
    using storage::StorageFatalError;

    RaftStorage::RaftStorage(const std::string& path)
        : snapshot_path_(path + "/raft.snapshot")
    {
        storage::ensure_directory(path);

        load_snapshot_file();

        wal_ = std::make_unique<storage::RecordLog>(path + "/raft.wal",
            [this](const std::string& payload) { replay_record(payload); });

        initial_.hard_state = hard_state_;
        initial_.entries = entries_;
    }

    void RaftStorage::load_snapshot_file() {
        std::string contents;
        if (!storage::read_file(snapshot_path_, contents)) {
            return;
        }

        try {
            json j = storage::from_cbor_string(contents);
            initial_.snapshot.metadata = Serializer::snapshot_metadata_from_json(j.at("metadata"));
            initial_.snapshot.data = storage::from_binary(j.at("data"));
            snapshot_meta_ = initial_.snapshot.metadata;
        }
        catch (const json::exception& e) {
            throw StorageFatalError("Corrupt snapshot file " + snapshot_path_ + ": " + e.what());
        }
    }

    void RaftStorage::replay_record(const std::string& payload) {
        try {
            json record = storage::from_cbor_string(payload);

            if (record.contains("hs")) {
                hard_state_ = Serializer::hard_state_from_json(record["hs"]);
            }
            if (record.contains("ents")) {
                std::vector<LogEntry> entries;
                for (const auto& entry_json : record["ents"]) {
                    entries.push_back(Serializer::entry_from_json(entry_json));
                }
                apply_entries(entries);
            }
        }
        catch (const json::exception& e) {
            throw StorageFatalError(std::string("Corrupt raft log record: ") + e.what());
        }
        catch (const std::out_of_range& e) {
            throw StorageFatalError(std::string("Corrupt raft log record: ") + e.what());
        }
    }

    // Entries at or below the snapshot are already covered by it. A batch that
    // starts inside the persisted range replaces everything from that index on.
    void RaftStorage::apply_entries(const std::vector<LogEntry>& entries) {
        bool truncated = false;
        for (const auto& entry : entries) {
            if (entry.index <= snapshot_meta_.index) {
                continue;
            }
            if (!truncated) {
                while (!entries_.empty() && entries_.back().index >= entry.index) {
                    entries_.pop_back();
                }
                truncated = true;
            }
            entries_.push_back(entry);
        }
    }

    std::string RaftStorage::hard_state_record(const HardState& hs) const {
        json record;
        record["hs"] = Serializer::hard_state_to_json(hs);
        return storage::to_cbor_string(record);
    }

    std::string RaftStorage::entries_record(const std::vector<LogEntry>& entries) const {
        json ents = json::array();
        for (const auto& entry : entries) {
            ents.push_back(Serializer::entry_to_json(entry));
        }
        json record;
        record["ents"] = std::move(ents);
        return storage::to_cbor_string(record);
    }

    void RaftStorage::save_hard_state(const HardState& hs) {
        wal_->append(hard_state_record(hs));
        hard_state_ = hs;
    }

    void RaftStorage::append_entries(const std::vector<LogEntry>& entries) {
        if (entries.empty()) {
            return;
        }
        wal_->append(entries_record(entries));
        apply_entries(entries);
    }

    void RaftStorage::save_snapshot(const Snapshot& snapshot) {
        if (snapshot.metadata.index <= snapshot_meta_.index) {
            return;
        }

        json j;
        j["metadata"] = Serializer::snapshot_metadata_to_json(snapshot.metadata);
        j["data"] = storage::to_binary(snapshot.data);
        storage::write_file_atomically(snapshot_path_, storage::to_cbor_string(j));

        // The suffix survives only if the log agrees with the snapshot at its index
        bool keep_suffix = false;
        for (const auto& entry : entries_) {
            if (entry.index == snapshot.metadata.index) {
                keep_suffix = entry.term == snapshot.metadata.term;
                break;
            }
        }

        snapshot_meta_ = snapshot.metadata;

        std::vector<LogEntry> remaining;
        bool discards_suffix = false;
        for (const auto& entry : entries_) {
            if (entry.index > snapshot_meta_.index) {
                if (keep_suffix) {
                    remaining.push_back(entry);
                }
                else {
                    discards_suffix = true;
                }
            }
        }
        entries_.swap(remaining);

        std::vector<std::string> records;
        records.push_back(hard_state_record(hard_state_));
        if (!entries_.empty()) {
            records.push_back(entries_record(entries_));
        }

        try {
            wal_->rewrite(records);
        }
        catch (const StorageError& e) {
            std::cerr << "[RaftStorage] Failed to rewrite log after snapshot at index "
                << snapshot_meta_.index << ": " << e.what() << std::endl;
            // Replay skips entries covered by the snapshot. Entries after it that
            // conflict with the snapshot would come back, so that case is fatal.
            if (discards_suffix) {
                throw StorageFatalError("Log still holds entries that conflict with the snapshot at index "
                    + std::to_string(snapshot_meta_.index) + ": " + e.what());
            }
        }
    }

    uint64_t RaftStorage::last_index() const {
        if (entries_.empty()) {
            return snapshot_meta_.index;
        }
        return entries_.back().index;
    }

}
