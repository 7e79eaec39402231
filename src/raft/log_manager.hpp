#pragma once
#include "../../include/quorumkv/raft/types.hpp"
#include <vector>
#include <mutex>
#include <cstdint>

namespace quorumkv::raft {

    // In-memory raft log. Slot 0 is a dummy entry carrying the index and term
    // of the latest snapshot, so entries_[i] holds log index offset() + i.
    class LogManager {
    public:
        LogManager();

        // Replaces the whole log with the snapshot's dummy entry
        void restore(const Snapshot& snapshot);

        // Drops entries up to snapshot.metadata.index and keeps the snapshot
        bool compact(const Snapshot& snapshot);

        // Basic operations
        void append(const LogEntry& entry);
        void append(const std::vector<LogEntry>& entries);
        bool get_entry(uint64_t index, LogEntry& entry) const;
        uint64_t get_first_index() const;
        uint64_t get_last_index() const;
        uint64_t get_last_term() const;

        // Term of `index`; false when compacted away or past the end
        bool term(uint64_t index, uint64_t& term) const;

        // Replication: [lo, hi)
        std::vector<LogEntry> entries(uint64_t lo, uint64_t hi, size_t max_count = SIZE_MAX) const;
        void truncate_from(uint64_t start_index);

        // Consistency check
        bool check_consistency(uint64_t prev_log_index, uint64_t prev_log_term) const;

        // Index of the first entry in `entries` that is missing or differs in term; 0 if none
        uint64_t find_conflict(const std::vector<LogEntry>& entries) const;

        bool is_up_to_date(uint64_t last_index, uint64_t last_term) const;

        Snapshot get_snapshot() const;

        // Stats
        size_t size() const;
        void clear();

    private:
        uint64_t offset() const { return entries_.front().index; }
        bool term_locked(uint64_t index, uint64_t& term) const;

        mutable std::mutex mutex_;
        std::vector<LogEntry> entries_;
        Snapshot snapshot_;
    };

}
