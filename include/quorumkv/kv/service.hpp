#pragma once
#include "store.hpp"
#include "../raft/node.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace quorumkv::kv {

    struct SetResponse {
        bool success = false;
        std::string error;
    };

    struct GetResponse {
        bool found = false;
        std::string value;
    };

    // Client-facing API of one node. Writes go through consensus and are
    // acknowledged once applied locally; reads are served from the local
    // store with no read barrier and may be stale on a follower.
    class KvService {
    public:
        KvService(std::shared_ptr<raft::IRaftNode> node,
            std::shared_ptr<IKvStore> store,
            std::chrono::milliseconds timeout);

        SetResponse set(const std::string& key, const std::string& value);
        SetResponse remove(const std::string& key);

        // Throws storage::StorageError
        GetResponse get(const std::string& key) const;

    private:
        SetResponse submit(const Command& cmd);

        std::shared_ptr<raft::IRaftNode> node_;
        std::shared_ptr<IKvStore> store_;
        std::chrono::milliseconds timeout_;
    };

}
