#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <functional>

namespace quorumkv::raft {

    enum class NodeState {
        FOLLOWER,
        CANDIDATE,
        LEADER
    };

    inline std::string node_state_to_string(NodeState state) {
        switch (state) {
        case NodeState::FOLLOWER: return "FOLLOWER";
        case NodeState::CANDIDATE: return "CANDIDATE";
        case NodeState::LEADER: return "LEADER";
        default: return "UNKNOWN";
        }
    }

    enum class EntryType : uint8_t {
        NORMAL = 0,
        CONFIG_CHANGE = 1
    };

    struct LogEntry {
        uint64_t index;
        uint64_t term;
        EntryType type;
        std::string data;

        LogEntry() : index(0), term(0), type(EntryType::NORMAL) {}
        LogEntry(uint64_t i, uint64_t t, const std::string& d, EntryType ty = EntryType::NORMAL)
            : index(i), term(t), type(ty), data(d) {
        }
    };

    enum class MessageType : uint8_t {
        VOTE_REQUEST = 0,
        VOTE_RESPONSE = 1,
        APPEND_ENTRIES = 2,
        APPEND_ENTRIES_RESPONSE = 3,
        INSTALL_SNAPSHOT = 4
    };

    inline std::string message_type_to_string(MessageType type) {
        switch (type) {
        case MessageType::VOTE_REQUEST: return "VoteRequest";
        case MessageType::VOTE_RESPONSE: return "VoteResponse";
        case MessageType::APPEND_ENTRIES: return "AppendEntries";
        case MessageType::APPEND_ENTRIES_RESPONSE: return "AppendEntriesResponse";
        case MessageType::INSTALL_SNAPSHOT: return "InstallSnapshot";
        default: return "Unknown";
        }
    }

    struct SnapshotMetadata {
        uint64_t index = 0;
        uint64_t term = 0;
        std::vector<uint64_t> voters;
    };

    struct Snapshot {
        SnapshotMetadata metadata;
        std::string data;

        bool empty() const { return metadata.index == 0; }
    };

    // Persistent raft state, written before any message of the same ready is sent
    struct HardState {
        uint64_t term = 0;
        uint64_t vote = 0;
        uint64_t commit = 0;

        bool operator==(const HardState& other) const {
            return term == other.term && vote == other.vote && commit == other.commit;
        }
        bool operator!=(const HardState& other) const { return !(*this == other); }
    };

    // One protocol message. Field meaning depends on the type:
    //   VOTE_REQUEST            index/log_term = candidate's last log position
    //   APPEND_ENTRIES          index/log_term = position preceding `entries`
    //   APPEND_ENTRIES_RESPONSE index = match index, or the rejected index with reject_hint
    //   INSTALL_SNAPSHOT        snapshot
    struct Message {
        MessageType type;
        uint64_t from;
        uint64_t to;
        uint64_t term;
        uint64_t log_term;
        uint64_t index;
        uint64_t commit;
        bool reject;
        uint64_t reject_hint;
        std::vector<LogEntry> entries;
        Snapshot snapshot;

        Message() : type(MessageType::APPEND_ENTRIES), from(0), to(0), term(0), log_term(0),
            index(0), commit(0), reject(false), reject_hint(0) {
        }
        Message(MessageType t, uint64_t f, uint64_t to_id, uint64_t tm)
            : type(t), from(f), to(to_id), term(tm), log_term(0),
            index(0), commit(0), reject(false), reject_hint(0) {
        }
    };

    enum class ConfChangeType : uint8_t {
        ADD_NODE = 0,
        REMOVE_NODE = 1
    };

    struct ConfChange {
        ConfChangeType type;
        uint64_t node_id;
        std::string address;

        ConfChange() : type(ConfChangeType::ADD_NODE), node_id(0) {}
        ConfChange(ConfChangeType t, uint64_t id, const std::string& addr = "")
            : type(t), node_id(id), address(addr) {
        }
    };

    // Work harvested from the consensus core in one driving-loop iteration
    struct Ready {
        std::vector<Message> messages;
        std::vector<LogEntry> entries;            // newly appended, must be persisted
        std::vector<LogEntry> committed_entries;  // ascending index, ready to apply
        Snapshot snapshot;                        // to install when non-empty
        HardState hard_state;
        bool has_hard_state = false;

        bool empty() const {
            return messages.empty() && entries.empty() && committed_entries.empty()
                && snapshot.empty() && !has_hard_state;
        }
    };

    class INetworkTransport {
    public:
        using MessageHandler = std::function<void(const Message&)>;

        virtual ~INetworkTransport() = default;

        // Best effort; false when the message was dropped before leaving this node.
        virtual bool send(const Message& msg) = 0;

        virtual void set_message_handler(MessageHandler handler) = 0;

        virtual void start() = 0;
        virtual void stop() = 0;

        virtual void update_peer(uint64_t node_id, const std::string& address) = 0;
        virtual void remove_peer(uint64_t node_id) = 0;
    };

}
