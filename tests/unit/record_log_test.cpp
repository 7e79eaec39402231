#include <gtest/gtest.h>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include "../../src/storage/record_log.hpp"
#include "../utils/test_utils.hpp"

using namespace quorumkv::storage;
using quorumkv::test::TempDir;

class RecordLogTest : public ::testing::Test {
protected:
    std::vector<std::string> replay(const std::string& path) {
        std::vector<std::string> records;
        RecordLog log(path, [&](const std::string& payload) { records.push_back(payload); });
        return records;
    }

    TempDir dir;
};

TEST_F(RecordLogTest, AppendedRecordsSurviveReopen) {
    std::string path = dir.sub("test.wal");
    {
        RecordLog log(path, [](const std::string&) {});
        log.append("first");
        log.append(std::vector<std::string>{ "second", "", "third" });
        EXPECT_EQ(log.record_count(), 4u);
    }

    std::vector<std::string> records = replay(path);
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0], "first");
    EXPECT_EQ(records[1], "second");
    EXPECT_EQ(records[2], "");
    EXPECT_EQ(records[3], "third");
}

TEST_F(RecordLogTest, BinaryPayloadIsPreserved) {
    std::string path = dir.sub("binary.wal");
    std::string payload("\x00\x01\xff\n\x00", 5);
    {
        RecordLog log(path, [](const std::string&) {});
        log.append(payload);
    }

    std::vector<std::string> records = replay(path);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], payload);
}

TEST_F(RecordLogTest, TornTailIsTruncated) {
    std::string path = dir.sub("torn.wal");
    {
        RecordLog log(path, [](const std::string&) {});
        log.append("complete");
    }
    uint64_t good_size = std::filesystem::file_size(path);

    {
        // A length header promising more bytes than were written
        std::ofstream out(path, std::ios::binary | std::ios::app);
        std::string torn = encode_record("this record was cut short");
        out.write(torn.data(), 10);
    }

    {
        std::vector<std::string> records;
        RecordLog log(path, [&](const std::string& payload) { records.push_back(payload); });
        ASSERT_EQ(records.size(), 1u);
        EXPECT_EQ(records[0], "complete");
        EXPECT_EQ(log.size_bytes(), good_size);
        log.append("after");
    }

    std::vector<std::string> records = replay(path);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1], "after");
}

TEST_F(RecordLogTest, ResetAndRewrite) {
    std::string path = dir.sub("rewrite.wal");
    {
        RecordLog log(path, [](const std::string&) {});
        log.append(std::vector<std::string>{ "a", "b", "c" });
        log.rewrite({ "x", "y" });
        EXPECT_EQ(log.record_count(), 2u);
        log.append("z");
    }
    std::vector<std::string> records = replay(path);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0], "x");
    EXPECT_EQ(records[2], "z");

    {
        RecordLog log(path, [](const std::string&) {});
        log.reset();
        EXPECT_EQ(log.record_count(), 0u);
        EXPECT_EQ(log.size_bytes(), 0u);
    }
    EXPECT_TRUE(replay(path).empty());
}

TEST_F(RecordLogTest, EncodeRecordIsBigEndian) {
    std::string record = encode_record(std::string(258, 'x'));
    ASSERT_EQ(record.size(), 262u);
    EXPECT_EQ(static_cast<unsigned char>(record[0]), 0u);
    EXPECT_EQ(static_cast<unsigned char>(record[1]), 0u);
    EXPECT_EQ(static_cast<unsigned char>(record[2]), 1u);
    EXPECT_EQ(static_cast<unsigned char>(record[3]), 2u);
}

TEST_F(RecordLogTest, AtomicWriteReplacesFile) {
    std::string path = dir.sub("file.bin");
    write_file_atomically(path, "one");
    write_file_atomically(path, "two");

    std::string data;
    ASSERT_TRUE(read_file(path, data));
    EXPECT_EQ(data, "two");
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
    EXPECT_FALSE(read_file(dir.sub("missing.bin"), data));
}

TEST_F(RecordLogTest, OpenFailsInMissingDirectory) {
    EXPECT_THROW(RecordLog(dir.sub("no/such/dir/x.wal"), [](const std::string&) {}), StorageFatalError);
}

// Fails every sync after `fail` is set
class FailingSyncLog : public RecordLog {
public:
    explicit FailingSyncLog(const std::string& path) : RecordLog(path, [](const std::string&) {}) {}

    bool fail = false;

protected:
    bool sync_data() override {
        if (fail) {
            errno = EIO;
            return false;
        }
        return RecordLog::sync_data();
    }
};

TEST_F(RecordLogTest, FailedSyncRollsBackTheBatch) {
    std::string path = dir.sub("sync.wal");
    {
        FailingSyncLog log(path);
        log.append("kept");
        uint64_t size = log.size_bytes();

        log.fail = true;
        EXPECT_THROW(log.append(std::vector<std::string>{ "lost1", "lost2" }), StorageError);
        EXPECT_EQ(log.size_bytes(), size);
        EXPECT_EQ(log.record_count(), 1u);
        EXPECT_EQ(std::filesystem::file_size(path), size);

        // The log keeps working once the disk recovers
        log.fail = false;
        log.append("after");
    }

    EXPECT_EQ(replay(path), (std::vector<std::string>{ "kept", "after" }));
}

TEST_F(RecordLogTest, DecodeLengthReadsHighBytesUnsigned) {
    std::string record = encode_record(std::string(0x80ff, 'x'));
    EXPECT_EQ(decode_record_length(record.data()), 0x80ffu);

    const char header[4] = { '\xff', '\x00', '\x80', '\x01' };
    EXPECT_EQ(decode_record_length(header), 0xff008001u);
}
