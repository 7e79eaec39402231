#include "log_manager.hpp"
#include <algorithm>

namespace quorumkv::raft {

    LogManager::LogManager() {
        entries_.emplace_back(0, 0, "");  // Index 0 is dummy
    }

    void LogManager::restore(const Snapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        entries_.emplace_back(snapshot.metadata.index, snapshot.metadata.term, "");
        snapshot_ = snapshot;
    }

    bool LogManager::compact(const Snapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex_);

        uint64_t index = snapshot.metadata.index;
        if (index <= offset()) {
            return false;
        }
        if (index > offset() + entries_.size() - 1) {
            return false;
        }

        entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(index - offset()));
        entries_.front().data.clear();
        entries_.front().type = EntryType::NORMAL;
        snapshot_ = snapshot;
        return true;
    }

    void LogManager::append(const LogEntry& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
    }

    void LogManager::append(const std::vector<LogEntry>& entries) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.insert(entries_.end(), entries.begin(), entries.end());
    }

    bool LogManager::get_entry(uint64_t index, LogEntry& entry) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index <= offset() || index - offset() >= entries_.size()) {
            return false;
        }
        entry = entries_[index - offset()];
        return true;
    }

    uint64_t LogManager::get_first_index() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return offset() + 1;
    }

    uint64_t LogManager::get_last_index() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return offset() + entries_.size() - 1;
    }

    uint64_t LogManager::get_last_term() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.back().term;
    }

    bool LogManager::term(uint64_t index, uint64_t& term) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return term_locked(index, term);
    }

    bool LogManager::term_locked(uint64_t index, uint64_t& term) const {
        if (index < offset() || index - offset() >= entries_.size()) {
            return false;
        }
        term = entries_[index - offset()].term;
        return true;
    }

    std::vector<LogEntry> LogManager::entries(uint64_t lo, uint64_t hi, size_t max_count) const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<LogEntry> result;
        uint64_t last = offset() + entries_.size() - 1;
        lo = std::max(lo, offset() + 1);
        hi = std::min(hi, last + 1);
        if (lo >= hi) {
            return result;
        }

        uint64_t count = std::min<uint64_t>(hi - lo, max_count);
        auto begin = entries_.begin() + static_cast<std::ptrdiff_t>(lo - offset());
        result.assign(begin, begin + static_cast<std::ptrdiff_t>(count));
        return result;
    }

    void LogManager::truncate_from(uint64_t start_index) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (start_index <= offset()) {
            return;
        }
        if (start_index - offset() < entries_.size()) {
            entries_.resize(start_index - offset());
        }
    }

    bool LogManager::check_consistency(uint64_t prev_log_index, uint64_t prev_log_term) const {
        std::lock_guard<std::mutex> lock(mutex_);

        uint64_t term = 0;
        if (!term_locked(prev_log_index, term)) {
            return false;
        }
        return term == prev_log_term;
    }

    uint64_t LogManager::find_conflict(const std::vector<LogEntry>& entries) const {
        std::lock_guard<std::mutex> lock(mutex_);

        for (const auto& entry : entries) {
            // Entries covered by the snapshot are committed and cannot conflict
            if (entry.index <= offset()) {
                continue;
            }
            uint64_t term = 0;
            if (!term_locked(entry.index, term) || term != entry.term) {
                return entry.index;
            }
        }
        return 0;
    }

    bool LogManager::is_up_to_date(uint64_t last_index, uint64_t last_term) const {
        std::lock_guard<std::mutex> lock(mutex_);

        uint64_t our_last_term = entries_.back().term;
        uint64_t our_last_index = offset() + entries_.size() - 1;

        if (last_term != our_last_term) {
            return last_term > our_last_term;
        }
        return last_index >= our_last_index;
    }

    Snapshot LogManager::get_snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshot_;
    }

    size_t LogManager::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size() - 1;  // Exclude dummy entry
    }

    void LogManager::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        entries_.emplace_back(0, 0, "");
        snapshot_ = Snapshot();
    }

}
