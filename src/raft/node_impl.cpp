#include "node_impl.hpp"
#include "../../include/quorumkv/kv/command.hpp"
#include "../../include/quorumkv/storage/exceptions.hpp"
#include <algorithm>
#include <iostream>

namespace quorumkv::raft {

    using storage::StorageError;
    using storage::StorageFatalError;

    RaftNodeImpl::RaftNodeImpl(const config::NodeOptions& options,
        std::shared_ptr<INetworkTransport> transport,
        std::shared_ptr<kv::IKvStore> store)
        : options_(options)
        , transport_(std::move(transport))
        , store_(std::move(store))
    {
        storage_ = std::make_unique<RaftStorage>(options_.effective_storage_path());
        const RaftStorage::State& state = storage_->initial_state();

        log_manager_ = std::make_shared<LogManager>();
        serializer_ = std::make_shared<Serializer>();

        if (!state.snapshot.empty()) {
            log_manager_->restore(state.snapshot);
            snapshot_index_ = state.snapshot.metadata.index;

            // The store may have lost the state the snapshot already covers
            if (store_->last_applied() < snapshot_index_) {
                std::cout << "[Node " << options_.id << "] Loading raft snapshot at index "
                    << snapshot_index_ << " into the store" << std::endl;
                store_->load_snapshot(state.snapshot.data);
            }
        }
        log_manager_->append(state.entries);

        ConsensusEngine::Config config;
        config.node_id = options_.id;
        if (!state.snapshot.metadata.voters.empty()) {
            config.voters = state.snapshot.metadata.voters;
        }
        else {
            for (const auto& [id, address] : options_.peers) {
                config.voters.push_back(id);
            }
        }
        config.election_tick = options_.election_tick;
        config.heartbeat_tick = options_.heartbeat_tick;
        config.max_uncommitted_entries = options_.max_uncommitted_entries;
        config.applied = store_->last_applied();

        consensus_ = std::make_unique<ConsensusEngine>(
            config, log_manager_, serializer_, state.hard_state
        );

        for (const auto& [id, address] : options_.peers) {
            if (id != options_.id) {
                transport_->update_peer(id, address);
            }
        }
        restore_membership();

        transport_->set_message_handler([this](const Message& msg) { step(msg); });

        std::cout << "[Node " << options_.id << "] Restored term " << state.hard_state.term
            << ", commit " << consensus_->get_commit_index()
            << ", applied " << consensus_->get_last_applied()
            << ", " << state.entries.size() << " log entries" << std::endl;
    }

    RaftNodeImpl::~RaftNodeImpl() {
        stop();
        transport_->set_message_handler(nullptr);
    }

    // Membership changes between the snapshot and the applied index are
    // not replayed through ready(), so they are applied here.
    void RaftNodeImpl::restore_membership() {
        std::vector<LogEntry> applied = log_manager_->entries(snapshot_index_ + 1,
            consensus_->get_last_applied() + 1);

        for (const auto& entry : applied) {
            if (entry.type != EntryType::CONFIG_CHANGE) {
                continue;
            }
            ConfChange cc;
            if (serializer_->deserialize_conf_change(entry.data, cc)) {
                consensus_->apply_conf_change(cc);
                update_peer_table(cc);
            }
        }
    }

    void RaftNodeImpl::update_peer_table(const ConfChange& cc) {
        if (cc.node_id == options_.id) {
            return;
        }
        if (cc.type == ConfChangeType::ADD_NODE) {
            if (!cc.address.empty()) {
                transport_->update_peer(cc.node_id, cc.address);
            }
        }
        else {
            transport_->remove_peer(cc.node_id);
        }
    }

    void RaftNodeImpl::start() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (lifecycle_ != Lifecycle::INITIALIZED) {
            std::cerr << "[Node " << options_.id << "] Cannot start from state "
                << lifecycle_to_string(lifecycle_) << std::endl;
            return;
        }

        lifecycle_ = Lifecycle::RUNNING;
        worker_thread_ = std::thread(&RaftNodeImpl::run_loop, this);
        std::cout << "[Node " << options_.id << "] Started" << std::endl;
    }

    void RaftNodeImpl::stop() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (lifecycle_ == Lifecycle::STOPPED && !worker_thread_.joinable()) {
            return;
        }

        {
            std::lock_guard<std::mutex> mailbox_lock(mailbox_mutex_);
            stop_requested_ = true;
        }
        mailbox_cv_.notify_all();

        if (worker_thread_.joinable()) {
            worker_thread_.join();
        }
        lifecycle_ = Lifecycle::STOPPED;

        // The loop thread is gone; whatever is left belongs to us now
        release_all(ProposeStatus::STOPPED);
        std::cout << "[Node " << options_.id << "] Stopped" << std::endl;
    }

    bool RaftNodeImpl::enqueue(Request req) {
        {
            std::lock_guard<std::mutex> lock(mailbox_mutex_);
            if (stop_requested_ || lifecycle_ != Lifecycle::RUNNING) {
                return false;
            }

            if (req.kind == Request::Kind::MESSAGE) {
                if (messages_.size() >= options_.max_pending_messages) {
                    return false;
                }
                messages_.push_back(std::move(req));
            }
            else {
                if (proposals_.size() >= options_.max_pending_proposals) {
                    return false;
                }
                proposals_.push_back(std::move(req));
            }
        }
        mailbox_cv_.notify_one();
        return true;
    }

    ProposeStatus RaftNodeImpl::wait(std::future<ProposeStatus>& future, std::chrono::milliseconds timeout) {
        if (future.wait_for(timeout) != std::future_status::ready) {
            return ProposeStatus::TIMEOUT;
        }
        return future.get();
    }

    bool RaftNodeImpl::propose(const std::string& command_data) {
        Request req;
        req.kind = Request::Kind::PROPOSAL;
        req.data = command_data;
        if (!enqueue(std::move(req))) {
            std::cerr << "[Node " << options_.id << "] Proposal rejected: "
                << (lifecycle_ == Lifecycle::RUNNING ? "mailbox full" : "not running") << std::endl;
            return false;
        }
        return true;
    }

    ProposeStatus RaftNodeImpl::propose_and_wait(const std::string& command_data,
        std::chrono::milliseconds timeout) {
        Request req;
        req.kind = Request::Kind::PROPOSAL;
        req.data = command_data;
        req.waiter = std::make_shared<std::promise<ProposeStatus>>();

        std::future<ProposeStatus> future = req.waiter->get_future();
        if (!enqueue(std::move(req))) {
            return lifecycle_ == Lifecycle::RUNNING ? ProposeStatus::OVERLOADED : ProposeStatus::STOPPED;
        }
        return wait(future, timeout);
    }

    bool RaftNodeImpl::step(const Message& msg) {
        try {
            Request req;
            req.kind = Request::Kind::MESSAGE;
            req.message = msg;
            return enqueue(std::move(req));
        }
        catch (const std::exception& e) {
            std::cerr << "[Node " << options_.id << "] Failed to enqueue message from "
                << msg.from << ": " << e.what() << std::endl;
            return false;
        }
    }

    ProposeStatus RaftNodeImpl::add_node(uint64_t node_id, const std::string& address,
        std::chrono::milliseconds timeout) {
        Request req;
        req.kind = Request::Kind::CONF_CHANGE;
        req.conf_change = ConfChange(ConfChangeType::ADD_NODE, node_id, address);
        req.waiter = std::make_shared<std::promise<ProposeStatus>>();

        std::future<ProposeStatus> future = req.waiter->get_future();
        if (!enqueue(std::move(req))) {
            return lifecycle_ == Lifecycle::RUNNING ? ProposeStatus::OVERLOADED : ProposeStatus::STOPPED;
        }
        return wait(future, timeout);
    }

    ProposeStatus RaftNodeImpl::remove_node(uint64_t node_id, std::chrono::milliseconds timeout) {
        Request req;
        req.kind = Request::Kind::CONF_CHANGE;
        req.conf_change = ConfChange(ConfChangeType::REMOVE_NODE, node_id);
        req.waiter = std::make_shared<std::promise<ProposeStatus>>();

        std::future<ProposeStatus> future = req.waiter->get_future();
        if (!enqueue(std::move(req))) {
            return lifecycle_ == Lifecycle::RUNNING ? ProposeStatus::OVERLOADED : ProposeStatus::STOPPED;
        }
        return wait(future, timeout);
    }

    void RaftNodeImpl::run_loop() {
        using namespace std::chrono;

        const milliseconds tick_interval(options_.tick_interval_ms);
        steady_clock::time_point next_tick = steady_clock::now() + tick_interval;

        while (true) {
            std::deque<Request> messages;
            std::deque<Request> proposals;
            {
                std::unique_lock<std::mutex> lock(mailbox_mutex_);
                mailbox_cv_.wait_until(lock, next_tick, [this] {
                    return stop_requested_ || !messages_.empty() || !proposals_.empty();
                });
                if (stop_requested_) {
                    break;
                }
                messages.swap(messages_);
                proposals.swap(proposals_);
            }

            for (auto& req : messages) {
                consensus_->step(req.message);
            }
            for (auto& req : proposals) {
                handle_request(req);
            }

            steady_clock::time_point now = steady_clock::now();
            if (now >= next_tick) {
                consensus_->tick();
                next_tick += tick_interval;
                if (next_tick <= now) {
                    next_tick = now + tick_interval;
                }
            }

            if (!process_ready()) {
                std::cerr << "[Node " << options_.id << "] Driving loop stopped after a fatal storage error"
                    << std::endl;
                lifecycle_ = Lifecycle::STOPPED;
                release_all(ProposeStatus::STOPPED);
                break;
            }
        }
    }

    void RaftNodeImpl::handle_request(Request& req) {
        uint64_t index = 0;
        ConsensusEngine::ProposeResult result;
        if (req.kind == Request::Kind::CONF_CHANGE) {
            result = consensus_->propose_conf_change(req.conf_change, index);
        }
        else {
            result = consensus_->propose(req.data, index);
        }

        ProposeStatus failure = ProposeStatus::OVERLOADED;
        switch (result) {
        case ConsensusEngine::ProposeResult::ACCEPTED:
            if (req.waiter) {
                // An unresolved waiter on this index lost its entry to a new leader
                resolve(index, 0, ProposeStatus::DROPPED);
                pending_[index] = PendingProposal{ consensus_->get_current_term(), req.waiter };
            }
            return;
        case ConsensusEngine::ProposeResult::NOT_LEADER:
            std::cerr << "[Node " << options_.id << "] Not leader, cannot propose (leader is "
                << consensus_->get_leader_id() << ")" << std::endl;
            failure = ProposeStatus::NOT_LEADER;
            break;
        case ConsensusEngine::ProposeResult::OVERLOADED:
            std::cerr << "[Node " << options_.id << "] Too many uncommitted entries, proposal dropped" << std::endl;
            break;
        case ConsensusEngine::ProposeResult::CONF_CHANGE_PENDING:
            std::cerr << "[Node " << options_.id << "] Another membership change is in progress" << std::endl;
            break;
        }

        if (req.waiter) {
            req.waiter->set_value(failure);
        }
    }

    bool RaftNodeImpl::process_ready() {
        while (consensus_->has_ready()) {
            Ready rd = consensus_->ready();

            if (!rd.snapshot.empty()) {
                try {
                    storage_->save_snapshot(rd.snapshot);
                    store_->load_snapshot(rd.snapshot.data);
                }
                catch (const StorageFatalError& e) {
                    std::cerr << "[Node " << options_.id << "] Failed to install snapshot at index "
                        << rd.snapshot.metadata.index << ": " << e.what() << std::endl;
                    return false;
                }
                snapshot_index_ = rd.snapshot.metadata.index;
                // Whether these made it into the snapshot is unknown
                expire_proposals(snapshot_index_, ProposeStatus::TIMEOUT);
            }

            try {
                storage_->append_entries(rd.entries);
                if (rd.has_hard_state) {
                    storage_->save_hard_state(rd.hard_state);
                }
            }
            catch (const StorageError& e) {
                std::cerr << "[Node " << options_.id << "] Failed to persist raft state: " << e.what() << std::endl;
                return false;
            }

            for (const auto& msg : rd.messages) {
                transport_->send(msg);
            }

            for (const auto& entry : rd.committed_entries) {
                apply_entry(entry);
            }

            consensus_->advance(rd);
            maybe_compact();
        }
        return true;
    }

    void RaftNodeImpl::apply_entry(const LogEntry& entry) {
        ProposeStatus status = ProposeStatus::APPLIED;

        try {
            if (entry.type == EntryType::NORMAL) {
                kv::Command cmd;
                if (!entry.data.empty() && kv::Command::deserialize(entry.data, cmd)) {
                    store_->apply(entry.index, cmd);
                }
                else {
                    store_->mark_applied(entry.index);
                }
            }
            else {
                ConfChange cc;
                if (serializer_->deserialize_conf_change(entry.data, cc)) {
                    consensus_->apply_conf_change(cc);
                    update_peer_table(cc);
                }
                store_->mark_applied(entry.index);
            }
        }
        catch (const StorageError& e) {
            std::cerr << "[Node " << options_.id << "] Failed to apply entry " << entry.index
                << ": " << e.what() << std::endl;
            status = ProposeStatus::STORAGE_ERROR;
        }

        resolve(entry.index, entry.term, status);
    }

    void RaftNodeImpl::maybe_compact() {
        uint64_t applied = std::min(consensus_->get_last_applied(), store_->last_applied());
        if (applied <= snapshot_index_ || applied - snapshot_index_ < options_.snapshot_threshold) {
            return;
        }

        std::string data;
        try {
            data = store_->snapshot();
        }
        catch (const StorageFatalError& e) {
            std::cerr << "[Node " << options_.id << "] Failed to take snapshot: " << e.what() << std::endl;
            return;
        }

        // The blob reflects the store's own applied index
        uint64_t index = std::min(store_->last_applied(), consensus_->get_last_applied());
        Snapshot snapshot;
        if (!consensus_->compact(index, data, snapshot)) {
            return;
        }
        snapshot_index_ = index;

        try {
            storage_->save_snapshot(snapshot);
        }
        catch (const StorageFatalError& e) {
            std::cerr << "[Node " << options_.id << "] Failed to persist snapshot at index " << index
                << ": " << e.what() << std::endl;
            return;
        }

        std::cout << "[Node " << options_.id << "] Compacted log up to index " << index << std::endl;
    }

    // `term` 0 resolves regardless of the entry's term
    void RaftNodeImpl::resolve(uint64_t index, uint64_t term, ProposeStatus status) {
        auto it = pending_.find(index);
        if (it == pending_.end()) {
            return;
        }

        if (term != 0 && it->second.term != term) {
            status = ProposeStatus::DROPPED;
        }
        it->second.waiter->set_value(status);
        pending_.erase(it);
    }

    void RaftNodeImpl::expire_proposals(uint64_t up_to, ProposeStatus status) {
        while (!pending_.empty() && pending_.begin()->first <= up_to) {
            pending_.begin()->second.waiter->set_value(status);
            pending_.erase(pending_.begin());
        }
    }

    void RaftNodeImpl::release_all(ProposeStatus status) {
        for (auto& [index, proposal] : pending_) {
            proposal.waiter->set_value(status);
        }
        pending_.clear();

        std::deque<Request> leftover;
        {
            std::lock_guard<std::mutex> lock(mailbox_mutex_);
            leftover.swap(proposals_);
            messages_.clear();
        }
        for (auto& req : leftover) {
            if (req.waiter) {
                req.waiter->set_value(status);
            }
        }
    }

    NodeState RaftNodeImpl::get_state() const {
        return consensus_->get_state();
    }

    uint64_t RaftNodeImpl::get_current_term() const {
        return consensus_->get_current_term();
    }

    bool RaftNodeImpl::is_leader() const {
        return consensus_->is_leader();
    }

    uint64_t RaftNodeImpl::get_leader_id() const {
        return consensus_->get_leader_id();
    }

    void RaftNodeImpl::print_status() const {
        std::cout << "  Node: " << options_.id << std::endl;
        std::cout << "  Lifecycle: " << lifecycle_to_string(lifecycle_) << std::endl;
        std::cout << "  State: " << node_state_to_string(get_state()) << std::endl;
        std::cout << "  Term: " << get_current_term() << std::endl;
        std::cout << "  Leader: " << get_leader_id() << std::endl;
        std::cout << "  Commit index: " << get_commit_index() << std::endl;
        std::cout << "  Last applied: " << get_last_applied() << std::endl;
        std::cout << "  Log size: " << log_manager_->size() << std::endl;

        std::cout << "  Voters:";
        for (uint64_t id : get_voters()) {
            std::cout << " " << id;
        }
        std::cout << std::endl;
    }

    uint64_t RaftNodeImpl::get_commit_index() const {
        return consensus_->get_commit_index();
    }

    uint64_t RaftNodeImpl::get_last_applied() const {
        return consensus_->get_last_applied();
    }

    std::vector<uint64_t> RaftNodeImpl::get_voters() const {
        return consensus_->get_voters();
    }

    std::unique_ptr<IRaftNode> create_raft_node(
        const config::NodeOptions& options,
        std::shared_ptr<INetworkTransport> transport,
        std::shared_ptr<kv::IKvStore> store) {

        return std::make_unique<RaftNodeImpl>(options, transport, store);
    }

}
