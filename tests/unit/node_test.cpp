#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include "../../src/raft/node_impl.hpp"
#include "../utils/test_utils.hpp"

using namespace quorumkv;
using namespace quorumkv::raft;
using quorumkv::test::TempDir;
using quorumkv::test::makeOptions;
using quorumkv::test::waitFor;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::AtLeast;
using ::testing::Field;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;

class MockTransport : public INetworkTransport {
public:
    MOCK_METHOD(bool, send, (const Message& msg), (override));
    MOCK_METHOD(void, set_message_handler, (MessageHandler handler), (override));
    MOCK_METHOD(void, start, (), (override));
    MOCK_METHOD(void, stop, (), (override));
    MOCK_METHOD(void, update_peer, (uint64_t node_id, const std::string& address), (override));
    MOCK_METHOD(void, remove_peer, (uint64_t node_id), (override));
};

class MockKvStore : public kv::IKvStore {
public:
    MOCK_METHOD(void, set, (const std::string& key, const std::string& value), (override));
    MOCK_METHOD(bool, get, (const std::string& key, std::string& value), (const, override));
    MOCK_METHOD(void, remove, (const std::string& key), (override));
    MOCK_METHOD(std::string, snapshot, (), (const, override));
    MOCK_METHOD(void, load_snapshot, (const std::string& data), (override));
    MOCK_METHOD(bool, apply, (uint64_t index, const kv::Command& cmd), (override));
    MOCK_METHOD(void, mark_applied, (uint64_t index), (override));
    MOCK_METHOD(uint64_t, last_applied, (), (const, override));
    MOCK_METHOD(void, clear, (), (override));
    MOCK_METHOD(size_t, size, (), (const, override));
    MOCK_METHOD(void, print_all, (), (const, override));
    MOCK_METHOD(std::vector<std::string>, get_all_keys, (), (const, override));

    // Forwards everything to `real` unless a test says otherwise
    void delegateTo(const std::shared_ptr<kv::IKvStore>& real) {
        ON_CALL(*this, get(_, _)).WillByDefault([real](const std::string& k, std::string& v) { return real->get(k, v); });
        ON_CALL(*this, snapshot()).WillByDefault([real] { return real->snapshot(); });
        ON_CALL(*this, load_snapshot(_)).WillByDefault([real](const std::string& d) { real->load_snapshot(d); });
        ON_CALL(*this, apply(_, _)).WillByDefault([real](uint64_t i, const kv::Command& c) { return real->apply(i, c); });
        ON_CALL(*this, mark_applied(_)).WillByDefault([real](uint64_t i) { real->mark_applied(i); });
        ON_CALL(*this, last_applied()).WillByDefault([real] { return real->last_applied(); });
        ON_CALL(*this, size()).WillByDefault([real] { return real->size(); });
    }
};

class RaftNodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<NiceMock<MockTransport>>();
        ON_CALL(*transport, send(_)).WillByDefault(Return(true));
    }

    void TearDown() override {
        if (node) {
            node->stop();
        }
    }

    void open(const std::map<uint64_t, std::string>& peers, uint64_t snapshot_threshold = 1000) {
        config::NodeOptions options = makeOptions(1, peers, dir.sub("node"));
        options.snapshot_threshold = snapshot_threshold;
        store = kv::open_kv_store(options.effective_storage_path());
        node = create_raft_node(options, transport, store);
    }

    void openSingle(uint64_t snapshot_threshold = 1000) {
        open({ { 1, "127.0.0.1:7001" } }, snapshot_threshold);
    }

    ProposeStatus set(const std::string& key, const std::string& value) {
        return node->propose_and_wait(kv::Command(kv::CommandType::SET, key, value).serialize(),
            std::chrono::milliseconds(3000));
    }

    std::string get(const std::string& key) {
        std::string value;
        store->get(key, value);
        return value;
    }

    TempDir dir;
    std::shared_ptr<NiceMock<MockTransport>> transport;
    std::shared_ptr<kv::IKvStore> store;
    std::unique_ptr<IRaftNode> node;
};

TEST_F(RaftNodeTest, SingleNodeAppliesProposals) {
    openSingle();
    EXPECT_EQ(node->get_lifecycle(), Lifecycle::INITIALIZED);
    node->start();
    EXPECT_EQ(node->get_lifecycle(), Lifecycle::RUNNING);

    ASSERT_TRUE(waitFor([&] { return node->is_leader(); }));
    EXPECT_EQ(node->get_leader_id(), 1u);

    EXPECT_EQ(set("foo", "bar"), ProposeStatus::APPLIED);
    EXPECT_EQ(get("foo"), "bar");

    EXPECT_EQ(node->propose_and_wait("DELETE foo", std::chrono::milliseconds(3000)), ProposeStatus::APPLIED);
    std::string value;
    EXPECT_FALSE(store->get("foo", value));
    EXPECT_EQ(store->last_applied(), node->get_last_applied());
}

TEST_F(RaftNodeTest, MalformedCommandIsCommittedButIgnored) {
    openSingle();
    node->start();
    ASSERT_TRUE(waitFor([&] { return node->is_leader(); }));

    EXPECT_EQ(node->propose_and_wait("SET onlytoken", std::chrono::milliseconds(3000)), ProposeStatus::APPLIED);
    EXPECT_EQ(store->size(), 0u);
    EXPECT_EQ(store->last_applied(), node->get_last_applied());
}

TEST_F(RaftNodeTest, FireAndForgetPropose) {
    openSingle();
    EXPECT_FALSE(node->propose("SET a 1"));

    node->start();
    ASSERT_TRUE(waitFor([&] { return node->is_leader(); }));
    EXPECT_TRUE(node->propose("SET a 1"));
    EXPECT_TRUE(waitFor([&] { return get("a") == "1"; }));
}

TEST_F(RaftNodeTest, StoppedNodeRejectsWork) {
    openSingle();
    node->start();
    node->stop();
    node->stop();

    EXPECT_EQ(node->get_lifecycle(), Lifecycle::STOPPED);
    EXPECT_FALSE(node->propose("SET a 1"));
    EXPECT_EQ(set("a", "1"), ProposeStatus::STOPPED);
    EXPECT_FALSE(node->step(Message(MessageType::APPEND_ENTRIES, 2, 1, 1)));

    // No restart from STOPPED
    node->start();
    EXPECT_EQ(node->get_lifecycle(), Lifecycle::STOPPED);
}

TEST_F(RaftNodeTest, FollowerWithoutQuorumReportsNotLeader) {
    EXPECT_CALL(*transport, update_peer(2, "127.0.0.1:7002"));
    EXPECT_CALL(*transport, update_peer(3, "127.0.0.1:7003"));
    EXPECT_CALL(*transport, send(Field(&Message::type, MessageType::VOTE_REQUEST)))
        .Times(AtLeast(2))
        .WillRepeatedly(Return(false));

    open({ { 1, "127.0.0.1:7001" }, { 2, "127.0.0.1:7002" }, { 3, "127.0.0.1:7003" } });
    node->start();

    ASSERT_TRUE(waitFor([&] { return node->get_current_term() >= 1; }));
    EXPECT_FALSE(node->is_leader());
    EXPECT_EQ(set("a", "1"), ProposeStatus::NOT_LEADER);
    EXPECT_EQ(node->get_lifecycle(), Lifecycle::RUNNING);
}

TEST_F(RaftNodeTest, StepNeverThrows) {
    MockTransport::MessageHandler handler;
    EXPECT_CALL(*transport, set_message_handler(_))
        .WillOnce(SaveArg<0>(&handler))
        .WillRepeatedly(Return());

    open({ { 1, "127.0.0.1:7001" }, { 2, "127.0.0.1:7002" }, { 3, "127.0.0.1:7003" } });
    node->start();
    ASSERT_TRUE(handler);

    for (uint8_t type = 0; type <= 5; type++) {
        Message msg(static_cast<MessageType>(type), 2, 1, 3);
        msg.index = 77;
        msg.log_term = 2;
        msg.commit = 100;
        msg.entries.push_back(LogEntry(78, 3, "SET x y"));
        EXPECT_NO_THROW(handler(msg));
        msg.to = 9;
        EXPECT_NO_THROW(node->step(msg));
        msg.from = 0;
        EXPECT_NO_THROW(node->step(msg));
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(node->get_lifecycle(), Lifecycle::RUNNING);
}

TEST_F(RaftNodeTest, RestartRestoresState) {
    openSingle();
    node->start();
    ASSERT_TRUE(waitFor([&] { return node->is_leader(); }));
    ASSERT_EQ(set("a", "1"), ProposeStatus::APPLIED);
    ASSERT_EQ(set("b", "2"), ProposeStatus::APPLIED);
    uint64_t term = node->get_current_term();
    uint64_t commit = node->get_commit_index();
    node->stop();
    node.reset();
    store.reset();

    openSingle();
    EXPECT_EQ(get("a"), "1");
    EXPECT_EQ(get("b"), "2");
    EXPECT_EQ(node->get_current_term(), term);
    EXPECT_EQ(node->get_commit_index(), commit);

    node->start();
    ASSERT_TRUE(waitFor([&] { return node->is_leader(); }));
    EXPECT_GT(node->get_current_term(), term);
    ASSERT_EQ(set("c", "3"), ProposeStatus::APPLIED);
    EXPECT_EQ(get("a"), "1");
}

TEST_F(RaftNodeTest, SnapshotCompactionSurvivesRestart) {
    openSingle(5);
    node->start();
    ASSERT_TRUE(waitFor([&] { return node->is_leader(); }));

    for (int i = 0; i < 20; i++) {
        ASSERT_EQ(set("key" + std::to_string(i), "v" + std::to_string(i)), ProposeStatus::APPLIED);
    }
    node->stop();
    node.reset();
    store.reset();

    EXPECT_TRUE(std::filesystem::exists(dir.sub("node") + "/raft.snapshot"));

    // Losing the store's files falls back to the raft snapshot plus the log
    std::filesystem::remove(dir.sub("node") + "/kv.wal");
    std::filesystem::remove(dir.sub("node") + "/kv.snapshot");

    openSingle(5);
    node->start();
    ASSERT_TRUE(waitFor([&] { return get("key19") == "v19"; }));
    for (int i = 0; i < 20; i++) {
        EXPECT_EQ(get("key" + std::to_string(i)), "v" + std::to_string(i));
    }
}

TEST_F(RaftNodeTest, MembershipChangeUpdatesPeers) {
    openSingle();
    EXPECT_CALL(*transport, update_peer(4, "127.0.0.1:7004")).Times(1);
    node->start();
    ASSERT_TRUE(waitFor([&] { return node->is_leader(); }));

    // Node 4 never answers, so its entry can only commit once it is removed again
    EXPECT_EQ(node->add_node(4, "127.0.0.1:7004", std::chrono::milliseconds(3000)), ProposeStatus::APPLIED);
    EXPECT_EQ(node->get_voters(), (std::vector<uint64_t>{ 1, 4 }));
    EXPECT_EQ(node->propose_and_wait("SET a 1", std::chrono::milliseconds(300)), ProposeStatus::TIMEOUT);
}

TEST_F(RaftNodeTest, StoreFailureIsReportedAndLoopContinues) {
    auto real = kv::open_kv_store(dir.sub("kv"));
    auto failing = std::make_shared<NiceMock<MockKvStore>>();
    failing->delegateTo(real);
    EXPECT_CALL(*failing, apply(_, _)).Times(AnyNumber());
    EXPECT_CALL(*failing, apply(_, Field(&kv::Command::key, "bad")))
        .WillOnce(Throw(storage::StorageError("No space left on device")));

    store = failing;
    node = create_raft_node(makeOptions(1, { { 1, "127.0.0.1:7001" } }, dir.sub("node")), transport, store);
    node->start();
    ASSERT_TRUE(waitFor([&] { return node->is_leader(); }));

    EXPECT_EQ(node->propose_and_wait("SET bad 1", std::chrono::milliseconds(3000)), ProposeStatus::STORAGE_ERROR);
    EXPECT_EQ(node->get_lifecycle(), Lifecycle::RUNNING);

    EXPECT_EQ(set("good", "2"), ProposeStatus::APPLIED);
    EXPECT_EQ(get("good"), "2");
    std::string value;
    EXPECT_FALSE(real->get("bad", value));
}
