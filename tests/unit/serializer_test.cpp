#include <gtest/gtest.h>
#include "../../src/raft/serializer.hpp"
#include "../../src/storage/cbor.hpp"

using namespace quorumkv::raft;

class SerializerTest : public ::testing::Test {
protected:
    Serializer serializer;
};

TEST_F(SerializerTest, AppendEntriesMessage) {
    Message msg(MessageType::APPEND_ENTRIES, 1, 2, 5);
    msg.index = 10;
    msg.log_term = 4;
    msg.commit = 9;
    msg.entries.push_back(LogEntry(11, 5, "SET a 1"));
    msg.entries.push_back(LogEntry(12, 5, std::string("\x00\xff", 2), EntryType::CONFIG_CHANGE));

    Message decoded;
    ASSERT_TRUE(serializer.deserialize_message(serializer.serialize_message(msg), decoded));

    EXPECT_EQ(decoded.type, MessageType::APPEND_ENTRIES);
    EXPECT_EQ(decoded.from, 1u);
    EXPECT_EQ(decoded.to, 2u);
    EXPECT_EQ(decoded.term, 5u);
    EXPECT_EQ(decoded.index, 10u);
    EXPECT_EQ(decoded.log_term, 4u);
    EXPECT_EQ(decoded.commit, 9u);
    ASSERT_EQ(decoded.entries.size(), 2u);
    EXPECT_EQ(decoded.entries[0].data, "SET a 1");
    EXPECT_EQ(decoded.entries[1].type, EntryType::CONFIG_CHANGE);
    EXPECT_EQ(decoded.entries[1].data, std::string("\x00\xff", 2));
    EXPECT_TRUE(decoded.snapshot.empty());
}

TEST_F(SerializerTest, SnapshotMessage) {
    Message msg(MessageType::INSTALL_SNAPSHOT, 3, 1, 7);
    msg.snapshot.metadata.index = 100;
    msg.snapshot.metadata.term = 6;
    msg.snapshot.metadata.voters = { 1, 3, 4 };
    msg.snapshot.data = "snapshot-bytes";

    Message decoded;
    ASSERT_TRUE(serializer.deserialize_message(serializer.serialize_message(msg), decoded));
    EXPECT_EQ(decoded.type, MessageType::INSTALL_SNAPSHOT);
    EXPECT_EQ(decoded.snapshot.metadata.index, 100u);
    EXPECT_EQ(decoded.snapshot.metadata.voters, (std::vector<uint64_t>{ 1, 3, 4 }));
    EXPECT_EQ(decoded.snapshot.data, "snapshot-bytes");
}

TEST_F(SerializerTest, RejectsGarbage) {
    Message decoded(MessageType::VOTE_REQUEST, 9, 9, 9);
    EXPECT_FALSE(serializer.deserialize_message("", decoded));
    EXPECT_FALSE(serializer.deserialize_message("not cbor at all", decoded));

    // Well-formed CBOR with the wrong shape
    nlohmann::json j;
    j["type"] = 42;
    EXPECT_FALSE(serializer.deserialize_message(quorumkv::storage::to_cbor_string(j), decoded));

    j["type"] = "vote";
    EXPECT_FALSE(serializer.deserialize_message(quorumkv::storage::to_cbor_string(j), decoded));

    // Output is untouched on failure
    EXPECT_EQ(decoded.type, MessageType::VOTE_REQUEST);
    EXPECT_EQ(decoded.from, 9u);
}

TEST_F(SerializerTest, RejectsUnknownEntryType) {
    Message msg(MessageType::APPEND_ENTRIES, 1, 2, 1);
    msg.entries.push_back(LogEntry(1, 1, "x"));

    nlohmann::json j = quorumkv::storage::from_cbor_string(serializer.serialize_message(msg));
    j["entries"][0]["type"] = 9;

    Message decoded;
    EXPECT_FALSE(serializer.deserialize_message(quorumkv::storage::to_cbor_string(j), decoded));
}

TEST_F(SerializerTest, ConfChange) {
    ConfChange add(ConfChangeType::ADD_NODE, 4, "10.0.0.4:7000");
    ConfChange decoded;
    ASSERT_TRUE(serializer.deserialize_conf_change(serializer.serialize_conf_change(add), decoded));
    EXPECT_EQ(decoded.type, ConfChangeType::ADD_NODE);
    EXPECT_EQ(decoded.node_id, 4u);
    EXPECT_EQ(decoded.address, "10.0.0.4:7000");

    ConfChange remove(ConfChangeType::REMOVE_NODE, 2);
    ASSERT_TRUE(serializer.deserialize_conf_change(serializer.serialize_conf_change(remove), decoded));
    EXPECT_EQ(decoded.type, ConfChangeType::REMOVE_NODE);
    EXPECT_EQ(decoded.node_id, 2u);

    EXPECT_FALSE(serializer.deserialize_conf_change("{\"type\":\"swap\",\"node_id\":1}", decoded));
    EXPECT_FALSE(serializer.deserialize_conf_change("SET a b", decoded));
}

TEST_F(SerializerTest, HardState) {
    HardState hs;
    hs.term = 3;
    hs.vote = 2;
    hs.commit = 17;
    EXPECT_EQ(Serializer::hard_state_from_json(Serializer::hard_state_to_json(hs)), hs);
}

TEST_F(SerializerTest, WideTypeCodesAreNotNarrowed) {
    Message msg(MessageType::APPEND_ENTRIES, 1, 2, 1);
    msg.entries.push_back(LogEntry(1, 1, "x"));
    nlohmann::json j = quorumkv::storage::from_cbor_string(serializer.serialize_message(msg));

    // 258 and 257 would wrap to APPEND_ENTRIES and CONFIG_CHANGE as a byte
    nlohmann::json wide_message = j;
    wide_message["type"] = 258;
    Message decoded;
    EXPECT_FALSE(serializer.deserialize_message(quorumkv::storage::to_cbor_string(wide_message), decoded));

    nlohmann::json wide_entry = j;
    wide_entry["entries"][0]["type"] = 257;
    EXPECT_FALSE(serializer.deserialize_message(quorumkv::storage::to_cbor_string(wide_entry), decoded));
    EXPECT_THROW(Serializer::entry_from_json(wide_entry["entries"][0]), std::out_of_range);
}
