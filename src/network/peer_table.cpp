#include "peer_table.hpp"

namespace quorumkv::network {

    void PeerTable::update(uint64_t node_id, const std::string& address) {
        std::lock_guard<std::mutex> lock(mutex_);
        peers_[node_id] = address;
    }

    void PeerTable::remove(uint64_t node_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        peers_.erase(node_id);
    }

    bool PeerTable::lookup(uint64_t node_id, std::string& address) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = peers_.find(node_id);
        if (it == peers_.end()) {
            return false;
        }
        address = it->second;
        return true;
    }

    std::vector<uint64_t> PeerTable::ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<uint64_t> ids;
        ids.reserve(peers_.size());
        for (const auto& [id, _] : peers_) {
            ids.push_back(id);
        }
        return ids;
    }

    size_t PeerTable::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peers_.size();
    }

}
