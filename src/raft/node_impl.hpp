#pragma once
#include "../../include/quorumkv/raft/node.hpp"
#include "../../include/quorumkv/config/options.hpp"
#include "consensus.hpp"
#include "log_manager.hpp"
#include "raft_storage.hpp"
#include "serializer.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace quorumkv::raft {

    // Drives a ConsensusEngine from a single thread. Callers talk to it only
    // through the mailbox; the loop thread is the only one touching the core,
    // the raft storage and the pending proposal table.
    class RaftNodeImpl : public IRaftNode {
    public:
        RaftNodeImpl(const config::NodeOptions& options,
            std::shared_ptr<INetworkTransport> transport,
            std::shared_ptr<kv::IKvStore> store);

        ~RaftNodeImpl();

        void start() override;
        void stop() override;

        NodeState get_state() const override;
        uint64_t get_current_term() const override;
        uint64_t get_id() const override { return options_.id; }
        bool is_leader() const override;
        uint64_t get_leader_id() const override;
        Lifecycle get_lifecycle() const override { return lifecycle_; }

        bool propose(const std::string& command_data) override;
        ProposeStatus propose_and_wait(const std::string& command_data,
            std::chrono::milliseconds timeout) override;
        bool step(const Message& msg) override;

        ProposeStatus add_node(uint64_t node_id, const std::string& address,
            std::chrono::milliseconds timeout) override;
        ProposeStatus remove_node(uint64_t node_id, std::chrono::milliseconds timeout) override;

        void print_status() const override;
        uint64_t get_commit_index() const override;
        uint64_t get_last_applied() const override;
        std::vector<uint64_t> get_voters() const override;

    private:
        using Waiter = std::shared_ptr<std::promise<ProposeStatus>>;

        struct Request {
            enum class Kind { PROPOSAL, CONF_CHANGE, MESSAGE };

            Kind kind = Kind::PROPOSAL;
            std::string data;
            ConfChange conf_change;
            Message message;
            Waiter waiter;   // null for fire-and-forget
        };

        struct PendingProposal {
            uint64_t term;
            Waiter waiter;
        };

        bool enqueue(Request req);
        ProposeStatus wait(std::future<ProposeStatus>& future, std::chrono::milliseconds timeout);

        void restore_membership();
        void update_peer_table(const ConfChange& cc);

        void run_loop();
        void handle_request(Request& req);
        bool process_ready();
        void apply_entry(const LogEntry& entry);
        void maybe_compact();

        void resolve(uint64_t index, uint64_t term, ProposeStatus status);
        void expire_proposals(uint64_t up_to, ProposeStatus status);
        void release_all(ProposeStatus status);

        config::NodeOptions options_;
        std::shared_ptr<INetworkTransport> transport_;
        std::shared_ptr<kv::IKvStore> store_;

        std::unique_ptr<RaftStorage> storage_;
        std::shared_ptr<LogManager> log_manager_;
        std::shared_ptr<Serializer> serializer_;
        std::unique_ptr<ConsensusEngine> consensus_;

        // Mailbox
        std::mutex mailbox_mutex_;
        std::condition_variable mailbox_cv_;
        std::deque<Request> proposals_;
        std::deque<Request> messages_;
        bool stop_requested_ = false;

        std::mutex lifecycle_mutex_;
        std::atomic<Lifecycle> lifecycle_{ Lifecycle::INITIALIZED };
        std::thread worker_thread_;

        // Loop thread only
        std::map<uint64_t, PendingProposal> pending_;
        uint64_t snapshot_index_ = 0;
    };

}
