#include "../../include/quorumkv/kv/service.hpp"
#include <iostream>

namespace quorumkv::kv {

    KvService::KvService(std::shared_ptr<raft::IRaftNode> node,
        std::shared_ptr<IKvStore> store,
        std::chrono::milliseconds timeout)
        : node_(std::move(node))
        , store_(std::move(store))
        , timeout_(timeout)
    {
    }

    SetResponse KvService::set(const std::string& key, const std::string& value) {
        return submit(Command(CommandType::SET, key, value));
    }

    SetResponse KvService::remove(const std::string& key) {
        return submit(Command(CommandType::DELETE, key));
    }

    GetResponse KvService::get(const std::string& key) const {
        GetResponse response;
        response.found = store_->get(key, response.value);
        return response;
    }

    SetResponse KvService::submit(const Command& cmd) {
        SetResponse response;

        if (!cmd.is_valid()) {
            response.error = "invalid command: keys and values must be non-empty and contain no whitespace";
            return response;
        }

        raft::ProposeStatus status = node_->propose_and_wait(cmd.serialize(), timeout_);
        if (status == raft::ProposeStatus::APPLIED) {
            response.success = true;
            return response;
        }

        response.error = raft::propose_status_to_string(status);
        if (status == raft::ProposeStatus::NOT_LEADER) {
            uint64_t leader = node_->get_leader_id();
            if (leader != 0) {
                response.error += " (leader is node " + std::to_string(leader) + ")";
            }
        }

        std::cerr << "[KvService " << node_->get_id() << "] " << cmd.to_string()
            << " failed: " << response.error << std::endl;
        return response;
    }

}
