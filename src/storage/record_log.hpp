#pragma once
#include "../../include/quorumkv/storage/exceptions.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace quorumkv::storage {

    // Append-only file of [u32 big-endian length][payload] records.
    // Not thread-safe; owners serialize access.
    class RecordLog {
    public:
        using Visitor = std::function<void(const std::string& payload)>;

        // Replays every complete record through `replay`. A torn trailing record
        // is cut off. Throws StorageFatalError.
        RecordLog(const std::string& path, const Visitor& replay);
        virtual ~RecordLog();

        RecordLog(const RecordLog&) = delete;
        RecordLog& operator=(const RecordLog&) = delete;

        // fsync'd before returning. Throws StorageError.
        void append(const std::string& payload);
        void append(const std::vector<std::string>& payloads);

        // Truncates to zero length. Throws StorageError.
        void reset();

        // Atomically replaces the whole file with `payloads`. Throws StorageError.
        void rewrite(const std::vector<std::string>& payloads);

        size_t record_count() const { return record_count_; }
        uint64_t size_bytes() const { return size_bytes_; }
        const std::string& path() const { return path_; }

    protected:
        // fdatasync of the open file; false on failure with errno set
        virtual bool sync_data();

    private:
        void open_for_append();
        void roll_back();

        std::string path_;
        int fd_ = -1;
        size_t record_count_ = 0;
        uint64_t size_bytes_ = 0;
    };

    constexpr uint32_t MAX_RECORD_SIZE = 1u << 30;

    std::string encode_record(const std::string& payload);

    // Big-endian length prefix at `p`, which must hold at least 4 bytes
    uint32_t decode_record_length(const char* p);

    // temp file + fsync + rename + directory fsync. Throws StorageFatalError.
    void write_file_atomically(const std::string& path, const std::string& data);

    // False when the file does not exist. Throws StorageFatalError on read errors.
    bool read_file(const std::string& path, std::string& data);

    // Creates the directory tree. Throws StorageFatalError.
    void ensure_directory(const std::string& path);

}
