#pragma once
#include "../../include/quorumkv/raft/types.hpp"
#include "../storage/record_log.hpp"
#include <memory>
#include <string>
#include <vector>

namespace quorumkv::raft {

    // Durable raft state under a node's storage path:
    //   raft.wal       CBOR records {"hs": HardState} and {"ents": [LogEntry...]}
    //   raft.snapshot  CBOR {"metadata", "data"} of the latest snapshot
    //
    // Only the driving thread uses it.
    class RaftStorage {
    public:
        struct State {
            HardState hard_state;
            Snapshot snapshot;
            std::vector<LogEntry> entries;   // first index is snapshot.metadata.index + 1
        };

        // Throws storage::StorageFatalError
        explicit RaftStorage(const std::string& path);

        // Everything replayed at open time
        const State& initial_state() const { return initial_; }

        // Both throw storage::StorageError
        void save_hard_state(const HardState& hs);
        void append_entries(const std::vector<LogEntry>& entries);

        // Writes the snapshot file, then rewrites the log to hold only the
        // entries after the snapshot. Throws storage::StorageFatalError.
        void save_snapshot(const Snapshot& snapshot);

        uint64_t last_index() const;
        const HardState& hard_state() const { return hard_state_; }
        const SnapshotMetadata& snapshot_metadata() const { return snapshot_meta_; }
        size_t wal_records() const { return wal_->record_count(); }

    private:
        void load_snapshot_file();
        void replay_record(const std::string& payload);
        void apply_entries(const std::vector<LogEntry>& entries);

        std::string hard_state_record(const HardState& hs) const;
        std::string entries_record(const std::vector<LogEntry>& entries) const;

        std::string snapshot_path_;
        State initial_;

        // Mirror of what is on disk, kept so the log can be rewritten on compaction
        HardState hard_state_;
        SnapshotMetadata snapshot_meta_;
        std::vector<LogEntry> entries_;

        std::unique_ptr<storage::RecordLog> wal_;
    };

}
