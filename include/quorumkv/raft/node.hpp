#pragma once
#include "types.hpp"
#include "../kv/store.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace quorumkv::config {
    struct NodeOptions;
}

namespace quorumkv::raft {

    enum class Lifecycle {
        INITIALIZED,
        RUNNING,
        STOPPED
    };

    inline std::string lifecycle_to_string(Lifecycle lifecycle) {
        switch (lifecycle) {
        case Lifecycle::INITIALIZED: return "INITIALIZED";
        case Lifecycle::RUNNING: return "RUNNING";
        case Lifecycle::STOPPED: return "STOPPED";
        default: return "UNKNOWN";
        }
    }

    enum class ProposeStatus {
        APPLIED,        // committed and applied to the local store
        NOT_LEADER,
        DROPPED,        // the index was overwritten by another leader's entry
        OVERLOADED,
        TIMEOUT,
        STOPPED,
        STORAGE_ERROR   // committed, but the local store failed to apply it
    };

    inline std::string propose_status_to_string(ProposeStatus status) {
        switch (status) {
        case ProposeStatus::APPLIED: return "APPLIED";
        case ProposeStatus::NOT_LEADER: return "NOT_LEADER";
        case ProposeStatus::DROPPED: return "DROPPED";
        case ProposeStatus::OVERLOADED: return "OVERLOADED";
        case ProposeStatus::TIMEOUT: return "TIMEOUT";
        case ProposeStatus::STOPPED: return "STOPPED";
        case ProposeStatus::STORAGE_ERROR: return "STORAGE_ERROR";
        default: return "UNKNOWN";
        }
    }

    class IRaftNode {
    public:
        virtual ~IRaftNode() = default;

        virtual void start() = 0;
        virtual void stop() = 0;

        virtual NodeState get_state() const = 0;
        virtual uint64_t get_current_term() const = 0;
        virtual uint64_t get_id() const = 0;
        virtual bool is_leader() const = 0;
        virtual uint64_t get_leader_id() const = 0;
        virtual Lifecycle get_lifecycle() const = 0;

        // Fire-and-forget. False only when not running or the mailbox is full.
        virtual bool propose(const std::string& command_data) = 0;

        // Blocks until the entry is applied locally, rejected or `timeout` passes
        virtual ProposeStatus propose_and_wait(const std::string& command_data,
            std::chrono::milliseconds timeout) = 0;

        // Inbound protocol message. Never throws.
        virtual bool step(const Message& msg) = 0;

        // Membership changes, one at a time
        virtual ProposeStatus add_node(uint64_t node_id, const std::string& address,
            std::chrono::milliseconds timeout) = 0;
        virtual ProposeStatus remove_node(uint64_t node_id, std::chrono::milliseconds timeout) = 0;

        virtual void print_status() const = 0;
        virtual uint64_t get_commit_index() const = 0;
        virtual uint64_t get_last_applied() const = 0;
        virtual std::vector<uint64_t> get_voters() const = 0;
    };

    // Restores raft state from options.storage_path. Throws storage::StorageFatalError.
    std::unique_ptr<IRaftNode> create_raft_node(
        const config::NodeOptions& options,
        std::shared_ptr<INetworkTransport> transport,
        std::shared_ptr<kv::IKvStore> store
    );

}
