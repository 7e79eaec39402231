#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace quorumkv::network {

    // Node id -> "host:port". Safe to use from any thread.
    class PeerTable {
    public:
        void update(uint64_t node_id, const std::string& address);
        void remove(uint64_t node_id);
        bool lookup(uint64_t node_id, std::string& address) const;

        std::vector<uint64_t> ids() const;
        size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::map<uint64_t, std::string> peers_;
    };

}
