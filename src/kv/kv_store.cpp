#include "kv_store.hpp"
#include "../storage/cbor.hpp"
#include <algorithm>
#include <iostream>

namespace quorumkv::kv {

    using json = nlohmann::json;
    using storage::StorageError;
    using storage::StorageFatalError;

    KvStoreImpl::KvStoreImpl(const std::string& path, size_t compaction_threshold)
        : path_(path)
        , snapshot_path_(path + "/kv.snapshot")
        , compaction_threshold_(compaction_threshold)
    {
        storage::ensure_directory(path_);

        load_snapshot_file();

        wal_ = std::make_unique<storage::RecordLog>(path_ + "/kv.wal",
            [this](const std::string& payload) { replay_record(payload); });

        std::cout << "[KvStore] Opened " << path_ << ": " << data_.size()
            << " keys, last applied " << last_applied_ << ", generation " << generation_
            << ", " << wal_->record_count() << " log records" << std::endl;
    }

    void KvStoreImpl::load_snapshot_file() {
        std::string contents;
        if (!storage::read_file(snapshot_path_, contents)) {
            return;
        }

        try {
            json j = storage::from_cbor_string(contents);
            generation_ = j.at("generation").get<uint64_t>();
            decode_snapshot(storage::from_binary(j.at("snapshot")), data_, last_applied_);
        }
        catch (const json::exception& e) {
            throw StorageFatalError("Corrupt snapshot file " + snapshot_path_ + ": " + e.what());
        }
    }

    void KvStoreImpl::replay_record(const std::string& payload) {
        try {
            json record = storage::from_cbor_string(payload);
            if (record.at("g").get<uint64_t>() != generation_) {
                return;
            }

            std::string op = record.at("op").get<std::string>();
            std::string key = storage::from_binary(record.at("k"));
            if (op == "set") {
                data_[key] = storage::from_binary(record.at("v"));
            }
            else if (op == "del") {
                data_.erase(key);
            }
            else {
                throw StorageFatalError("Unknown operation '" + op + "' in " + path_ + "/kv.wal");
            }

            if (record.contains("i")) {
                last_applied_ = std::max(last_applied_, record["i"].get<uint64_t>());
            }
        }
        catch (const json::exception& e) {
            throw StorageFatalError("Corrupt record in " + path_ + "/kv.wal: " + e.what());
        }
    }

    void KvStoreImpl::write_record(json record) {
        record["g"] = generation_;
        wal_->append(storage::to_cbor_string(record));
    }

    void KvStoreImpl::maybe_compact() {
        if (compaction_threshold_ == 0 || wal_->record_count() < compaction_threshold_) {
            return;
        }

        try {
            write_snapshot_file(encode_snapshot());
            wal_->reset();
        }
        catch (const std::runtime_error& e) {
            // the log keeps growing; the next write retries
            std::cerr << "[KvStore] Compaction failed: " << e.what() << std::endl;
        }
    }

    void KvStoreImpl::write_snapshot_file(const std::string& blob) {
        json j;
        j["generation"] = generation_ + 1;
        j["snapshot"] = storage::to_binary(blob);
        storage::write_file_atomically(snapshot_path_, storage::to_cbor_string(j));

        // From here on older log records are covered by the file
        ++generation_;
    }

    void KvStoreImpl::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);

        json record;
        record["op"] = "set";
        record["k"] = storage::to_binary(key);
        record["v"] = storage::to_binary(value);
        write_record(record);

        data_[key] = value;
        maybe_compact();
    }

    bool KvStoreImpl::get(const std::string& key, std::string& value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it != data_.end()) {
            value = it->second;
            return true;
        }
        return false;
    }

    void KvStoreImpl::remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (data_.find(key) == data_.end()) {
            return;
        }

        json record;
        record["op"] = "del";
        record["k"] = storage::to_binary(key);
        write_record(record);

        data_.erase(key);
        maybe_compact();
    }

    bool KvStoreImpl::apply(uint64_t index, const Command& cmd) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index <= last_applied_) {
            return false;
        }

        json record;
        record["op"] = cmd.type == CommandType::SET ? "set" : "del";
        record["k"] = storage::to_binary(cmd.key);
        if (cmd.type == CommandType::SET) {
            record["v"] = storage::to_binary(cmd.value);
        }
        record["i"] = index;
        write_record(record);

        if (cmd.type == CommandType::SET) {
            data_[cmd.key] = cmd.value;
        }
        else {
            data_.erase(cmd.key);
        }
        last_applied_ = index;

        maybe_compact();
        return true;
    }

    void KvStoreImpl::mark_applied(uint64_t index) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_applied_ = std::max(last_applied_, index);
    }

    uint64_t KvStoreImpl::last_applied() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_applied_;
    }

    std::string KvStoreImpl::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            return encode_snapshot();
        }
        catch (const json::exception& e) {
            throw StorageFatalError(std::string("Failed to encode snapshot: ") + e.what());
        }
    }

    void KvStoreImpl::load_snapshot(const std::string& data) {
        DataMap loaded;
        uint64_t loaded_applied = 0;
        try {
            decode_snapshot(data, loaded, loaded_applied);
        }
        catch (const json::exception& e) {
            throw StorageFatalError(std::string("Corrupt snapshot: ") + e.what());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        write_snapshot_file(data);

        data_.swap(loaded);
        last_applied_ = loaded_applied;

        try {
            wal_->reset();
        }
        catch (const StorageError& e) {
            std::cerr << "[KvStore] Failed to reset log after snapshot load: " << e.what() << std::endl;
        }

        std::cout << "[KvStore] Loaded snapshot: " << data_.size() << " keys, last applied "
            << last_applied_ << std::endl;
    }

    void KvStoreImpl::clear() {
        std::lock_guard<std::mutex> lock(mutex_);

        DataMap saved;
        saved.swap(data_);
        try {
            write_snapshot_file(encode_snapshot());
        }
        catch (const StorageFatalError& e) {
            data_.swap(saved);
            throw StorageError(e.what());
        }

        wal_->reset();
    }

    size_t KvStoreImpl::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    void KvStoreImpl::print_all() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::string> keys;
        keys.reserve(data_.size());
        for (const auto& [key, _] : data_) {
            keys.push_back(key);
        }
        std::sort(keys.begin(), keys.end());

        std::cout << "\n KV Store (" << data_.size() << " items, last applied "
            << last_applied_ << ")" << std::endl;
        for (const auto& key : keys) {
            std::cout << "  " << key << " = " << data_.at(key) << std::endl;
        }
    }

    std::vector<std::string> KvStoreImpl::get_all_keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> keys;
        keys.reserve(data_.size());

        for (const auto& [key, _] : data_) {
            keys.push_back(key);
        }
        std::sort(keys.begin(), keys.end());

        return keys;
    }

    uint64_t KvStoreImpl::generation() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return generation_;
    }

    size_t KvStoreImpl::wal_records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return wal_->record_count();
    }

    // {last_applied, data: [[key, value], ...]} with keys in ascending order,
    // so equal key spaces produce equal blobs
    std::string KvStoreImpl::encode_snapshot() const {
        std::vector<std::pair<std::string, std::string>> sorted(data_.begin(), data_.end());
        std::sort(sorted.begin(), sorted.end());

        json pairs = json::array();
        for (const auto& [key, value] : sorted) {
            pairs.push_back(json::array({ storage::to_binary(key), storage::to_binary(value) }));
        }

        json j;
        j["last_applied"] = last_applied_;
        j["data"] = std::move(pairs);
        return storage::to_cbor_string(j);
    }

    void KvStoreImpl::decode_snapshot(const std::string& blob, DataMap& data, uint64_t& last_applied) {
        json j = storage::from_cbor_string(blob);

        DataMap decoded;
        for (const auto& pair : j.at("data")) {
            decoded[storage::from_binary(pair.at(0))] = storage::from_binary(pair.at(1));
        }

        last_applied = j.at("last_applied").get<uint64_t>();
        data.swap(decoded);
    }

    std::shared_ptr<IKvStore> open_kv_store(const std::string& path, size_t compaction_threshold) {
        return std::make_shared<KvStoreImpl>(path, compaction_threshold);
    }

}
