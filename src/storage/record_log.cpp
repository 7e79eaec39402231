#include "record_log.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace quorumkv::storage {

    namespace fs = std::filesystem;

    namespace {

        std::string errno_text(const std::string& what, const std::string& path) {
            return what + " '" + path + "': " + std::strerror(errno);
        }

        bool write_all(int fd, const char* data, size_t size) {
            while (size > 0) {
                ssize_t written = ::write(fd, data, size);
                if (written < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                data += written;
                size -= static_cast<size_t>(written);
            }
            return true;
        }

        void sync_directory(const std::string& path) {
            fs::path dir = fs::path(path).parent_path();
            if (dir.empty()) dir = ".";

            int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
            if (fd < 0) {
                return;
            }
            ::fsync(fd);
            ::close(fd);
        }

    }

    std::string encode_record(const std::string& payload) {
        uint32_t size = static_cast<uint32_t>(payload.size());
        std::string record;
        record.reserve(4 + payload.size());
        record.push_back(static_cast<char>((size >> 24) & 0xFF));
        record.push_back(static_cast<char>((size >> 16) & 0xFF));
        record.push_back(static_cast<char>((size >> 8) & 0xFF));
        record.push_back(static_cast<char>(size & 0xFF));
        record.append(payload);
        return record;
    }

    uint32_t decode_record_length(const char* p) {
        return (static_cast<uint32_t>(static_cast<unsigned char>(p[0])) << 24)
            | (static_cast<uint32_t>(static_cast<unsigned char>(p[1])) << 16)
            | (static_cast<uint32_t>(static_cast<unsigned char>(p[2])) << 8)
            | static_cast<uint32_t>(static_cast<unsigned char>(p[3]));
    }

    RecordLog::RecordLog(const std::string& path, const Visitor& replay)
        : path_(path)
    {
        std::string contents;
        read_file(path_, contents);

        size_t offset = 0;
        while (offset + 4 <= contents.size()) {
            uint32_t size = decode_record_length(contents.data() + offset);
            if (size > MAX_RECORD_SIZE || offset + 4 + size > contents.size()) {
                break;
            }
            replay(contents.substr(offset + 4, size));
            offset += 4 + size;
            ++record_count_;
        }

        if (offset != contents.size()) {
            std::cerr << "[RecordLog] Discarding " << (contents.size() - offset)
                << " trailing bytes of torn record in " << path_ << std::endl;
            if (::truncate(path_.c_str(), static_cast<off_t>(offset)) != 0) {
                throw StorageFatalError(errno_text("Failed to truncate", path_));
            }
        }
        size_bytes_ = offset;

        open_for_append();
    }

    RecordLog::~RecordLog() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    void RecordLog::open_for_append() {
        fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw StorageFatalError(errno_text("Failed to open", path_));
        }
        sync_directory(path_);
    }

    void RecordLog::append(const std::string& payload) {
        append(std::vector<std::string>{ payload });
    }

    void RecordLog::append(const std::vector<std::string>& payloads) {
        if (payloads.empty()) {
            return;
        }

        std::string buffer;
        for (const auto& payload : payloads) {
            if (payload.size() > MAX_RECORD_SIZE) {
                throw StorageError("Record too large for " + path_);
            }
            buffer.append(encode_record(payload));
        }

        if (!write_all(fd_, buffer.data(), buffer.size())) {
            std::string error = errno_text("Failed to write", path_);
            roll_back();
            throw StorageError(error);
        }
        if (!sync_data()) {
            std::string error = errno_text("Failed to sync", path_);
            roll_back();
            throw StorageError(error);
        }

        size_bytes_ += buffer.size();
        record_count_ += payloads.size();
    }

    bool RecordLog::sync_data() {
        return ::fdatasync(fd_) == 0;
    }

    // Drops whatever part of a failed batch made it to the file, so a replay
    // never resurrects a write that was reported as failed
    void RecordLog::roll_back() {
        if (::ftruncate(fd_, static_cast<off_t>(size_bytes_)) != 0) {
            std::cerr << "[RecordLog] " << errno_text("Failed to roll back", path_) << std::endl;
        }
    }

    void RecordLog::reset() {
        if (::ftruncate(fd_, 0) != 0) {
            throw StorageError(errno_text("Failed to truncate", path_));
        }
        if (::fsync(fd_) != 0) {
            throw StorageError(errno_text("Failed to sync", path_));
        }
        size_bytes_ = 0;
        record_count_ = 0;
    }

    void RecordLog::rewrite(const std::vector<std::string>& payloads) {
        std::string buffer;
        for (const auto& payload : payloads) {
            buffer.append(encode_record(payload));
        }

        try {
            write_file_atomically(path_, buffer);
        }
        catch (const StorageFatalError& e) {
            throw StorageError(e.what());
        }

        ::close(fd_);
        fd_ = -1;
        try {
            open_for_append();
        }
        catch (const StorageFatalError& e) {
            throw StorageError(e.what());
        }

        size_bytes_ = buffer.size();
        record_count_ = payloads.size();
    }

    void write_file_atomically(const std::string& path, const std::string& data) {
        std::string tmp_path = path + ".tmp";

        int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw StorageFatalError(errno_text("Failed to create", tmp_path));
        }

        if (!write_all(fd, data.data(), data.size()) || ::fsync(fd) != 0) {
            std::string error = errno_text("Failed to write", tmp_path);
            ::close(fd);
            ::unlink(tmp_path.c_str());
            throw StorageFatalError(error);
        }
        ::close(fd);

        if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
            std::string error = errno_text("Failed to rename", tmp_path);
            ::unlink(tmp_path.c_str());
            throw StorageFatalError(error);
        }
        sync_directory(path);
    }

    bool read_file(const std::string& path, std::string& data) {
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            if (errno == ENOENT) {
                data.clear();
                return false;
            }
            throw StorageFatalError(errno_text("Failed to open", path));
        }

        data.clear();
        char buffer[64 * 1024];
        while (true) {
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR) continue;
                std::string error = errno_text("Failed to read", path);
                ::close(fd);
                throw StorageFatalError(error);
            }
            if (n == 0) break;
            data.append(buffer, static_cast<size_t>(n));
        }
        ::close(fd);
        return true;
    }

    void ensure_directory(const std::string& path) {
        std::error_code ec;
        fs::create_directories(path, ec);
        if (ec) {
            throw StorageFatalError("Failed to create directory '" + path + "': " + ec.message());
        }
    }

}
