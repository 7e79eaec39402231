#pragma once
#include "../../include/quorumkv/raft/types.hpp"
#include "log_manager.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

namespace quorumkv::raft {

    class Serializer;

    // Tick-driven raft state machine. It performs no I/O and owns no threads:
    // the caller feeds it ticks, proposals and inbound messages, then drains
    // the resulting work with ready() and acknowledges it with advance().
    //
    // Only one thread may drive it. Getters are safe from any thread.
    class ConsensusEngine {
    public:
        struct Config {
            uint64_t node_id = 0;
            std::vector<uint64_t> voters;
            uint32_t election_tick = 10;
            uint32_t heartbeat_tick = 2;
            size_t max_uncommitted_entries = 4096;
            size_t max_entries_per_message = 256;
            uint64_t applied = 0;
        };

        enum class ProposeResult {
            ACCEPTED,
            NOT_LEADER,
            OVERLOADED,
            CONF_CHANGE_PENDING
        };

        // `log` must already hold the restored snapshot and entries
        ConsensusEngine(const Config& config,
            std::shared_ptr<LogManager> log,
            std::shared_ptr<Serializer> serializer,
            const HardState& hard_state = HardState());

        ~ConsensusEngine();

        void tick();

        // Never throws; invalid or stale messages are dropped
        void step(const Message& msg);

        ProposeResult propose(const std::string& data, uint64_t& index);
        ProposeResult propose_conf_change(const ConfChange& cc, uint64_t& index);

        // Called once a CONFIG_CHANGE entry is committed
        void apply_conf_change(const ConfChange& cc);

        // Folds the log up to `index` (at most the applied index) into a snapshot
        bool compact(uint64_t index, const std::string& data, Snapshot& snapshot);

        bool has_ready() const;
        Ready ready();
        void advance(const Ready& rd);

        NodeState get_state() const { return state_; }
        uint64_t get_current_term() const { return current_term_; }
        uint64_t get_commit_index() const { return commit_index_; }
        uint64_t get_last_applied() const { return last_applied_; }
        uint64_t get_id() const { return config_.node_id; }
        bool is_leader() const { return state_ == NodeState::LEADER; }
        std::vector<uint64_t> get_voters() const;
        HardState get_hard_state() const;

        uint64_t get_leader_id() const {
            return (state_ == NodeState::LEADER) ? config_.node_id : leader_id_.load();
        }

    private:
        struct Progress {
            uint64_t match = 0;
            uint64_t next = 1;
        };

        void reset(uint64_t term);
        void reset_randomized_election_timeout();
        bool promotable() const;
        size_t quorum() const;

        void become_follower(uint64_t term, uint64_t leader_id = 0);
        void become_candidate();
        void become_leader();

        void campaign();
        void send(Message msg);
        void send_vote_requests();
        void send_heartbeats();
        void send_append_entries_to(uint64_t follower_id);
        void bcast_append();

        uint64_t append_entry(const std::string& data, EntryType type);
        bool update_commit_index();

        void handle_vote_request(const Message& msg);
        void handle_vote_response(const Message& msg);
        void handle_append_entries(const Message& msg);
        void handle_append_entries_response(const Message& msg);
        void handle_install_snapshot(const Message& msg);

        Config config_;
        std::shared_ptr<LogManager> log_;
        std::shared_ptr<Serializer> serializer_;

        std::atomic<uint64_t> current_term_{ 0 };
        std::atomic<uint64_t> voted_for_{ 0 };  // 0 = not voted

        std::atomic<NodeState> state_{ NodeState::FOLLOWER };
        std::atomic<uint64_t> commit_index_{ 0 };
        std::atomic<uint64_t> last_applied_{ 0 };
        std::atomic<uint64_t> leader_id_{ 0 };

        std::vector<uint64_t> voters_;
        mutable std::mutex voters_mutex_;

        // Leader state
        std::map<uint64_t, Progress> progress_;
        uint64_t pending_conf_index_ = 0;

        // Election state
        std::map<uint64_t, bool> votes_;

        // Timers, in ticks
        uint32_t election_elapsed_ = 0;
        uint32_t heartbeat_elapsed_ = 0;
        uint32_t randomized_election_timeout_ = 0;
        std::mt19937 rng_;

        // Ready bookkeeping
        std::vector<Message> msgs_;
        uint64_t stabled_ = 0;
        HardState prev_hard_state_;
        Snapshot pending_snapshot_;
    };

}
