#include "consensus.hpp"
#include "serializer.hpp"
#include <algorithm>
#include <functional>
#include <iostream>

namespace quorumkv::raft {

    ConsensusEngine::ConsensusEngine(const Config& config,
        std::shared_ptr<LogManager> log,
        std::shared_ptr<Serializer> serializer,
        const HardState& hard_state)
        : config_(config)
        , log_(std::move(log))
        , serializer_(std::move(serializer))
        , voters_(config.voters)
        , rng_(std::random_device{}())
    {
        std::sort(voters_.begin(), voters_.end());
        voters_.erase(std::unique(voters_.begin(), voters_.end()), voters_.end());

        uint64_t snapshot_index = log_->get_first_index() - 1;
        uint64_t last_index = log_->get_last_index();

        current_term_ = hard_state.term;
        voted_for_ = hard_state.vote;
        commit_index_ = std::min(std::max(hard_state.commit, snapshot_index), last_index);
        last_applied_ = std::min(std::max(config_.applied, snapshot_index), commit_index_.load());

        stabled_ = last_index;
        prev_hard_state_ = get_hard_state();

        reset_randomized_election_timeout();
    }

    ConsensusEngine::~ConsensusEngine() {}

    std::vector<uint64_t> ConsensusEngine::get_voters() const {
        std::lock_guard<std::mutex> lock(voters_mutex_);
        return voters_;
    }

    HardState ConsensusEngine::get_hard_state() const {
        HardState hs;
        hs.term = current_term_;
        hs.vote = voted_for_;
        hs.commit = commit_index_;
        return hs;
    }

    void ConsensusEngine::reset_randomized_election_timeout() {
        std::uniform_int_distribution<uint32_t> dist(config_.election_tick, 2 * config_.election_tick - 1);
        randomized_election_timeout_ = dist(rng_);
    }

    bool ConsensusEngine::promotable() const {
        return std::find(voters_.begin(), voters_.end(), config_.node_id) != voters_.end();
    }

    size_t ConsensusEngine::quorum() const {
        return voters_.size() / 2 + 1;
    }

    void ConsensusEngine::tick() {
        if (state_ == NodeState::LEADER) {
            ++heartbeat_elapsed_;
            if (heartbeat_elapsed_ >= config_.heartbeat_tick) {
                heartbeat_elapsed_ = 0;
                send_heartbeats();
            }
            return;
        }

        ++election_elapsed_;
        if (election_elapsed_ >= randomized_election_timeout_ && promotable()) {
            election_elapsed_ = 0;
            campaign();
        }
    }

    void ConsensusEngine::step(const Message& msg) {
        try {
            if (msg.from == 0 || msg.from == config_.node_id) {
                std::cerr << "[Node " << config_.node_id << "] Dropping message with invalid sender "
                    << msg.from << std::endl;
                return;
            }
            if (msg.to != config_.node_id) {
                std::cerr << "[Node " << config_.node_id << "] Dropping message addressed to "
                    << msg.to << std::endl;
                return;
            }

            if (msg.term > current_term_) {
                if (msg.type == MessageType::APPEND_ENTRIES || msg.type == MessageType::INSTALL_SNAPSHOT) {
                    become_follower(msg.term, msg.from);
                }
                else {
                    become_follower(msg.term, 0);
                }
            }
            else if (msg.term < current_term_) {
                // Let a stale leader or candidate learn the newer term
                if (msg.type == MessageType::APPEND_ENTRIES || msg.type == MessageType::INSTALL_SNAPSHOT) {
                    Message resp(MessageType::APPEND_ENTRIES_RESPONSE, config_.node_id, msg.from, current_term_);
                    resp.reject = true;
                    resp.index = msg.index;
                    resp.reject_hint = log_->get_last_index();
                    send(std::move(resp));
                }
                else if (msg.type == MessageType::VOTE_REQUEST) {
                    Message resp(MessageType::VOTE_RESPONSE, config_.node_id, msg.from, current_term_);
                    resp.reject = true;
                    send(std::move(resp));
                }
                return;
            }

            switch (msg.type) {
            case MessageType::VOTE_REQUEST:
                handle_vote_request(msg);
                break;
            case MessageType::VOTE_RESPONSE:
                handle_vote_response(msg);
                break;
            case MessageType::APPEND_ENTRIES:
                handle_append_entries(msg);
                break;
            case MessageType::APPEND_ENTRIES_RESPONSE:
                handle_append_entries_response(msg);
                break;
            case MessageType::INSTALL_SNAPSHOT:
                handle_install_snapshot(msg);
                break;
            default:
                std::cerr << "[Node " << config_.node_id << "] Unknown message type: "
                    << static_cast<int>(msg.type) << std::endl;
                break;
            }
        }
        catch (const std::exception& e) {
            std::cerr << "[Node " << config_.node_id << "] Failed to handle message from "
                << msg.from << " type " << message_type_to_string(msg.type) << ": " << e.what() << std::endl;
        }
    }

    ConsensusEngine::ProposeResult ConsensusEngine::propose(const std::string& data, uint64_t& index) {
        if (state_ != NodeState::LEADER) {
            return ProposeResult::NOT_LEADER;
        }
        if (log_->get_last_index() - commit_index_ >= config_.max_uncommitted_entries) {
            return ProposeResult::OVERLOADED;
        }

        index = append_entry(data, EntryType::NORMAL);
        return ProposeResult::ACCEPTED;
    }

    ConsensusEngine::ProposeResult ConsensusEngine::propose_conf_change(const ConfChange& cc, uint64_t& index) {
        if (state_ != NodeState::LEADER) {
            return ProposeResult::NOT_LEADER;
        }
        if (pending_conf_index_ > last_applied_) {
            return ProposeResult::CONF_CHANGE_PENDING;
        }
        if (log_->get_last_index() - commit_index_ >= config_.max_uncommitted_entries) {
            return ProposeResult::OVERLOADED;
        }

        index = append_entry(serializer_->serialize_conf_change(cc), EntryType::CONFIG_CHANGE);
        pending_conf_index_ = index;
        return ProposeResult::ACCEPTED;
    }

    void ConsensusEngine::apply_conf_change(const ConfChange& cc) {
        {
            std::lock_guard<std::mutex> lock(voters_mutex_);
            auto it = std::find(voters_.begin(), voters_.end(), cc.node_id);
            if (cc.type == ConfChangeType::ADD_NODE) {
                if (it == voters_.end()) {
                    voters_.push_back(cc.node_id);
                    std::sort(voters_.begin(), voters_.end());
                }
            }
            else if (it != voters_.end()) {
                voters_.erase(it);
            }
        }

        std::cout << "[Node " << config_.node_id << "] Applied conf change: "
            << (cc.type == ConfChangeType::ADD_NODE ? "add " : "remove ") << cc.node_id << std::endl;

        if (state_ != NodeState::LEADER) {
            return;
        }

        if (cc.type == ConfChangeType::ADD_NODE) {
            if (progress_.find(cc.node_id) == progress_.end()) {
                Progress pr;
                pr.next = log_->get_last_index() + 1;
                progress_[cc.node_id] = pr;
                send_append_entries_to(cc.node_id);
            }
            return;
        }

        progress_.erase(cc.node_id);
        if (cc.node_id == config_.node_id) {
            std::cout << "[Node " << config_.node_id << "] Removed from the cluster, stepping down" << std::endl;
            become_follower(current_term_, 0);
            return;
        }

        // The quorum may have shrunk
        if (update_commit_index()) {
            bcast_append();
        }
    }

    bool ConsensusEngine::compact(uint64_t index, const std::string& data, Snapshot& snapshot) {
        if (index > last_applied_ || index < log_->get_first_index()) {
            return false;
        }

        uint64_t term = 0;
        if (!log_->term(index, term)) {
            return false;
        }

        Snapshot snap;
        snap.metadata.index = index;
        snap.metadata.term = term;
        snap.metadata.voters = get_voters();
        snap.data = data;

        if (!log_->compact(snap)) {
            return false;
        }
        snapshot = std::move(snap);
        return true;
    }

    bool ConsensusEngine::has_ready() const {
        if (!msgs_.empty() || !pending_snapshot_.empty()) {
            return true;
        }
        if (log_->get_last_index() > stabled_) {
            return true;
        }
        if (commit_index_ > last_applied_) {
            return true;
        }
        return get_hard_state() != prev_hard_state_;
    }

    Ready ConsensusEngine::ready() {
        Ready rd;

        rd.messages.swap(msgs_);

        uint64_t last_index = log_->get_last_index();
        if (last_index > stabled_) {
            rd.entries = log_->entries(stabled_ + 1, last_index + 1);
        }

        rd.snapshot = pending_snapshot_;

        uint64_t apply_from = std::max(last_applied_.load(), pending_snapshot_.metadata.index) + 1;
        if (commit_index_ >= apply_from) {
            rd.committed_entries = log_->entries(apply_from, commit_index_ + 1);
        }

        HardState hs = get_hard_state();
        if (hs != prev_hard_state_) {
            rd.hard_state = hs;
            rd.has_hard_state = true;
        }

        return rd;
    }

    void ConsensusEngine::advance(const Ready& rd) {
        if (!rd.snapshot.empty()) {
            uint64_t index = rd.snapshot.metadata.index;
            last_applied_ = std::max(last_applied_.load(), index);
            stabled_ = std::max(stabled_, index);
            if (pending_snapshot_.metadata.index == index) {
                pending_snapshot_ = Snapshot();
            }
        }
        if (!rd.entries.empty()) {
            stabled_ = std::max(stabled_, rd.entries.back().index);
        }
        if (!rd.committed_entries.empty()) {
            last_applied_ = std::max(last_applied_.load(), rd.committed_entries.back().index);
        }
        if (rd.has_hard_state) {
            prev_hard_state_ = rd.hard_state;
        }
    }

    void ConsensusEngine::reset(uint64_t term) {
        if (term != current_term_) {
            current_term_ = term;
            voted_for_ = 0;
        }
        leader_id_ = 0;
        election_elapsed_ = 0;
        heartbeat_elapsed_ = 0;
        reset_randomized_election_timeout();
        votes_.clear();
        progress_.clear();
    }

    void ConsensusEngine::become_follower(uint64_t term, uint64_t leader_id) {
        reset(term);
        state_ = NodeState::FOLLOWER;
        leader_id_ = leader_id;
    }

    void ConsensusEngine::become_candidate() {
        reset(current_term_ + 1);
        state_ = NodeState::CANDIDATE;
        voted_for_ = config_.node_id;
        votes_[config_.node_id] = true;

        std::cout << "[Node " << config_.node_id << "] Became CANDIDATE in term "
            << current_term_ << std::endl;
    }

    void ConsensusEngine::become_leader() {
        reset(current_term_);
        state_ = NodeState::LEADER;
        leader_id_ = config_.node_id;

        uint64_t next_log_index = log_->get_last_index() + 1;
        for (uint64_t id : voters_) {
            Progress pr;
            pr.next = next_log_index;
            progress_[id] = pr;
        }

        // Conf changes wait until everything from earlier terms is applied
        pending_conf_index_ = log_->get_last_index();

        std::cout << "[Node " << config_.node_id << "] Became LEADER in term "
            << current_term_ << std::endl;

        // Commits entries of earlier terms once it is replicated
        append_entry("", EntryType::NORMAL);
    }

    void ConsensusEngine::campaign() {
        become_candidate();

        if (votes_.size() >= quorum()) {
            become_leader();
            return;
        }
        send_vote_requests();
    }

    void ConsensusEngine::send(Message msg) {
        msgs_.push_back(std::move(msg));
    }

    void ConsensusEngine::send_vote_requests() {
        uint64_t last_index = log_->get_last_index();
        uint64_t last_term = log_->get_last_term();

        for (uint64_t id : voters_) {
            if (id == config_.node_id) {
                continue;
            }
            Message req(MessageType::VOTE_REQUEST, config_.node_id, id, current_term_);
            req.index = last_index;
            req.log_term = last_term;
            send(std::move(req));
        }
    }

    void ConsensusEngine::send_heartbeats() {
        bcast_append();
    }

    void ConsensusEngine::bcast_append() {
        for (const auto& entry : progress_) {
            if (entry.first != config_.node_id) {
                send_append_entries_to(entry.first);
            }
        }
    }

    void ConsensusEngine::send_append_entries_to(uint64_t follower_id) {
        auto it = progress_.find(follower_id);
        if (it == progress_.end()) {
            return;
        }
        Progress& pr = it->second;

        uint64_t last_index = log_->get_last_index();
        pr.next = std::min(pr.next, last_index + 1);

        uint64_t prev_log_index = pr.next - 1;
        uint64_t prev_log_term = 0;
        if (!log_->term(prev_log_index, prev_log_term)) {
            // The entries the follower needs were compacted away
            Snapshot snapshot = log_->get_snapshot();
            if (snapshot.empty()) {
                std::cerr << "[Leader " << config_.node_id << "] No snapshot for follower "
                    << follower_id << " at index " << prev_log_index << std::endl;
                return;
            }

            Message msg(MessageType::INSTALL_SNAPSHOT, config_.node_id, follower_id, current_term_);
            msg.snapshot = snapshot;
            msg.commit = commit_index_;
            send(std::move(msg));

            std::cout << "[Leader " << config_.node_id << "] Sent snapshot at index "
                << snapshot.metadata.index << " to " << follower_id << std::endl;
            pr.next = snapshot.metadata.index + 1;
            return;
        }

        Message msg(MessageType::APPEND_ENTRIES, config_.node_id, follower_id, current_term_);
        msg.index = prev_log_index;
        msg.log_term = prev_log_term;
        msg.commit = commit_index_;
        msg.entries = log_->entries(pr.next, last_index + 1, config_.max_entries_per_message);

        if (!msg.entries.empty()) {
            pr.next = msg.entries.back().index + 1;
        }
        send(std::move(msg));
    }

    uint64_t ConsensusEngine::append_entry(const std::string& data, EntryType type) {
        uint64_t index = log_->get_last_index() + 1;
        log_->append(LogEntry(index, current_term_, data, type));

        Progress& self = progress_[config_.node_id];
        self.match = index;
        self.next = index + 1;

        update_commit_index();
        bcast_append();
        return index;
    }

    bool ConsensusEngine::update_commit_index() {
        if (state_ != NodeState::LEADER || voters_.empty()) {
            return false;
        }

        std::vector<uint64_t> matches;
        for (uint64_t id : voters_) {
            auto it = progress_.find(id);
            matches.push_back(it == progress_.end() ? 0 : it->second.match);
        }
        std::sort(matches.begin(), matches.end(), std::greater<uint64_t>());
        uint64_t new_commit_index = matches[quorum() - 1];

        if (new_commit_index > commit_index_) {
            uint64_t term = 0;
            if (log_->term(new_commit_index, term) && term == current_term_) {
                commit_index_ = new_commit_index;
                return true;
            }
        }
        return false;
    }

    void ConsensusEngine::handle_vote_request(const Message& msg) {
        Message resp(MessageType::VOTE_RESPONSE, config_.node_id, msg.from, current_term_);

        bool can_vote = voted_for_ == msg.from || (voted_for_ == 0 && leader_id_ == 0);
        if (can_vote && log_->is_up_to_date(msg.index, msg.log_term)) {
            voted_for_ = msg.from;
            election_elapsed_ = 0;
        }
        else {
            resp.reject = true;
            std::cout << "[Node " << config_.node_id << "] Vote denied to " << msg.from
                << " in term " << current_term_ << std::endl;
        }

        send(std::move(resp));
    }

    void ConsensusEngine::handle_vote_response(const Message& msg) {
        if (state_ != NodeState::CANDIDATE) {
            return;
        }

        votes_[msg.from] = !msg.reject;

        size_t granted = 0;
        size_t rejected = 0;
        for (uint64_t id : voters_) {
            auto it = votes_.find(id);
            if (it == votes_.end()) continue;
            if (it->second) ++granted;
            else ++rejected;
        }

        if (granted >= quorum()) {
            become_leader();
        }
        else if (rejected >= quorum()) {
            become_follower(current_term_, 0);
        }
    }

    void ConsensusEngine::handle_append_entries(const Message& msg) {
        // Entries must follow msg.index without gaps; the log stores them by position
        for (size_t i = 0; i < msg.entries.size(); ++i) {
            if (msg.entries[i].index != msg.index + 1 + i) {
                std::cerr << "[Node " << config_.node_id << "] Dropping append from " << msg.from
                    << ": entry " << msg.entries[i].index << " at position " << i
                    << " does not follow index " << msg.index << std::endl;
                return;
            }
        }

        if (state_ != NodeState::FOLLOWER) {
            become_follower(current_term_, msg.from);
        }
        leader_id_ = msg.from;
        election_elapsed_ = 0;

        Message resp(MessageType::APPEND_ENTRIES_RESPONSE, config_.node_id, msg.from, current_term_);

        if (msg.index < commit_index_) {
            // Everything up to the commit index is known to match
            resp.index = commit_index_;
            send(std::move(resp));
            return;
        }

        if (!log_->check_consistency(msg.index, msg.log_term)) {
            resp.reject = true;
            resp.index = msg.index;
            resp.reject_hint = msg.index == 0 ? 0 : std::min(msg.index - 1, log_->get_last_index());
            send(std::move(resp));
            return;
        }

        uint64_t conflict = log_->find_conflict(msg.entries);
        if (conflict != 0) {
            if (conflict <= commit_index_) {
                std::cerr << "[Node " << config_.node_id << "] Entry " << conflict
                    << " conflicts with committed entry, ignoring append from " << msg.from << std::endl;
                return;
            }

            log_->truncate_from(conflict);
            stabled_ = std::min(stabled_, conflict - 1);

            std::vector<LogEntry> fresh;
            for (const auto& entry : msg.entries) {
                if (entry.index >= conflict) {
                    fresh.push_back(entry);
                }
            }
            log_->append(fresh);
        }

        uint64_t last_new_index = msg.index + msg.entries.size();
        commit_index_ = std::max(commit_index_.load(), std::min(msg.commit, last_new_index));

        resp.index = last_new_index;
        send(std::move(resp));
    }

    void ConsensusEngine::handle_append_entries_response(const Message& msg) {
        if (state_ != NodeState::LEADER) {
            return;
        }

        auto it = progress_.find(msg.from);
        if (it == progress_.end()) {
            return;
        }
        Progress& pr = it->second;

        if (msg.reject) {
            // Stale when next already moved below the rejected index
            if (msg.index >= pr.next || msg.index <= pr.match) {
                return;
            }
            pr.next = std::max(pr.match + 1, std::min(msg.index, msg.reject_hint + 1));
            send_append_entries_to(msg.from);
            return;
        }

        if (msg.index > pr.match) {
            pr.match = msg.index;
        }
        pr.next = std::max(pr.next, msg.index + 1);

        if (update_commit_index()) {
            bcast_append();
        }
        else if (pr.next <= log_->get_last_index()) {
            send_append_entries_to(msg.from);
        }
    }

    void ConsensusEngine::handle_install_snapshot(const Message& msg) {
        if (state_ != NodeState::FOLLOWER) {
            become_follower(current_term_, msg.from);
        }
        leader_id_ = msg.from;
        election_elapsed_ = 0;

        const SnapshotMetadata& meta = msg.snapshot.metadata;
        Message resp(MessageType::APPEND_ENTRIES_RESPONSE, config_.node_id, msg.from, current_term_);

        if (meta.index <= commit_index_) {
            resp.index = commit_index_;
            send(std::move(resp));
            return;
        }

        uint64_t term = 0;
        if (log_->term(meta.index, term) && term == meta.term) {
            // Already holds the entries, only the commit index moves
            commit_index_ = meta.index;
            resp.index = meta.index;
            send(std::move(resp));
            return;
        }

        std::cout << "[Node " << config_.node_id << "] Restoring snapshot at index " << meta.index
            << " term " << meta.term << " from " << msg.from << std::endl;

        log_->restore(msg.snapshot);
        stabled_ = std::min(stabled_, meta.index);
        commit_index_ = meta.index;
        pending_snapshot_ = msg.snapshot;

        if (!meta.voters.empty()) {
            std::lock_guard<std::mutex> lock(voters_mutex_);
            voters_ = meta.voters;
            std::sort(voters_.begin(), voters_.end());
        }

        resp.index = meta.index;
        send(std::move(resp));
    }

}
