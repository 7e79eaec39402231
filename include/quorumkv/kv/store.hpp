#pragma once
#include "command.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace quorumkv::kv {

    class IKvStore {
    public:
        virtual ~IKvStore() = default;

        // Durable before returning. Throw storage::StorageError on I/O failure.
        virtual void set(const std::string& key, const std::string& value) = 0;
        virtual bool get(const std::string& key, std::string& value) const = 0;
        virtual void remove(const std::string& key) = 0;

        // Opaque blob of the whole key space and the last applied index.
        // Both throw storage::StorageFatalError; a failed load leaves the store untouched.
        virtual std::string snapshot() const = 0;
        virtual void load_snapshot(const std::string& data) = 0;

        // Applies the command carried by log entry `index`. Indexes at or below
        // last_applied() are skipped and return false.
        virtual bool apply(uint64_t index, const Command& cmd) = 0;
        virtual void mark_applied(uint64_t index) = 0;
        virtual uint64_t last_applied() const = 0;

        virtual void clear() = 0;
        virtual size_t size() const = 0;

        virtual void print_all() const = 0;
        virtual std::vector<std::string> get_all_keys() const = 0;
    };

    // Opens (or creates) the store under `path`. Throws storage::StorageFatalError.
    std::shared_ptr<IKvStore> open_kv_store(const std::string& path,
        size_t compaction_threshold = 10000);

}
