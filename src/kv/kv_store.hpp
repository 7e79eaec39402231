#pragma once
#include "../../include/quorumkv/kv/store.hpp"
#include "../storage/record_log.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace quorumkv::kv {

    // Key space held in memory, made durable by a write-ahead record log
    // (kv.wal) that is periodically folded into a snapshot file (kv.snapshot).
    //
    // Every WAL record carries the generation of the snapshot file it follows.
    // Records of an older generation were already folded into the snapshot
    // and are skipped on replay.
    class KvStoreImpl : public IKvStore {
    public:
        KvStoreImpl(const std::string& path, size_t compaction_threshold);

        void set(const std::string& key, const std::string& value) override;
        bool get(const std::string& key, std::string& value) const override;
        void remove(const std::string& key) override;

        std::string snapshot() const override;
        void load_snapshot(const std::string& data) override;

        bool apply(uint64_t index, const Command& cmd) override;
        void mark_applied(uint64_t index) override;
        uint64_t last_applied() const override;

        void clear() override;
        size_t size() const override;

        void print_all() const override;
        std::vector<std::string> get_all_keys() const override;

        uint64_t generation() const;
        size_t wal_records() const;

    private:
        using DataMap = std::unordered_map<std::string, std::string>;

        void load_snapshot_file();
        void replay_record(const std::string& payload);

        void write_record(nlohmann::json record);
        void maybe_compact();
        void write_snapshot_file(const std::string& blob);

        std::string encode_snapshot() const;
        static void decode_snapshot(const std::string& blob, DataMap& data, uint64_t& last_applied);

        std::string path_;
        std::string snapshot_path_;
        size_t compaction_threshold_;

        mutable std::mutex mutex_;
        DataMap data_;
        uint64_t last_applied_ = 0;
        uint64_t generation_ = 0;
        std::unique_ptr<storage::RecordLog> wal_;
    };

}
