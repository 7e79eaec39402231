#include "virtual_transport.hpp"
#include <iostream>

namespace quorumkv::network {

    void VirtualNetwork::register_node(uint64_t node_id, MessageHandler handler) {
        auto endpoint = std::make_shared<Endpoint>();
        endpoint->handler = std::move(handler);

        std::lock_guard<std::mutex> lock(mutex_);
        endpoints_[node_id] = endpoint;
    }

    void VirtualNetwork::unregister_node(uint64_t node_id) {
        std::shared_ptr<Endpoint> endpoint;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = endpoints_.find(node_id);
            if (it == endpoints_.end()) {
                return;
            }
            endpoint = it->second;
            endpoints_.erase(it);
        }

        // Waits for an in-flight delivery to finish
        std::lock_guard<std::mutex> lock(endpoint->mutex);
        endpoint->open = false;
    }

    bool VirtualNetwork::deliver(const raft::Message& msg) {
        std::shared_ptr<Endpoint> endpoint;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = endpoints_.find(msg.to);
            if (it == endpoints_.end() || !reachable_locked(msg.from, msg.to)) {
                ++dropped_;
                return false;
            }
            endpoint = it->second;
        }

        std::lock_guard<std::mutex> lock(endpoint->mutex);
        if (!endpoint->open || !endpoint->handler) {
            ++dropped_;
            return false;
        }
        endpoint->handler(msg);
        ++delivered_;
        return true;
    }

    bool VirtualNetwork::reachable_locked(uint64_t from, uint64_t to) const {
        if (isolated_.count(from) > 0 || isolated_.count(to) > 0) {
            return false;
        }
        return cut_links_.count(std::make_pair(from, to)) == 0;
    }

    void VirtualNetwork::isolate(uint64_t node_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        isolated_.insert(node_id);
    }

    void VirtualNetwork::heal(uint64_t node_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        isolated_.erase(node_id);
    }

    void VirtualNetwork::cut(uint64_t a, uint64_t b) {
        std::lock_guard<std::mutex> lock(mutex_);
        cut_links_.insert(std::make_pair(a, b));
        cut_links_.insert(std::make_pair(b, a));
    }

    void VirtualNetwork::restore(uint64_t a, uint64_t b) {
        std::lock_guard<std::mutex> lock(mutex_);
        cut_links_.erase(std::make_pair(a, b));
        cut_links_.erase(std::make_pair(b, a));
    }

    void VirtualNetwork::restore_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        isolated_.clear();
        cut_links_.clear();
    }

    bool VirtualNetwork::is_registered(uint64_t node_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return endpoints_.find(node_id) != endpoints_.end();
    }

    VirtualTransport::VirtualTransport(uint64_t node_id, std::shared_ptr<VirtualNetwork> network)
        : node_id_(node_id)
        , network_(std::move(network))
    {
    }

    VirtualTransport::~VirtualTransport() {
        stop();
    }

    bool VirtualTransport::send(const raft::Message& msg) {
        if (!running_) {
            return false;
        }

        std::string address;
        if (!peers_.lookup(msg.to, address)) {
            std::cerr << "[Network " << node_id_ << "] Attempt to send to unknown peer: " << msg.to << std::endl;
            return false;
        }

        ++sent_;
        return network_->deliver(msg);
    }

    void VirtualTransport::set_message_handler(MessageHandler handler) {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler_ = std::move(handler);
    }

    void VirtualTransport::dispatch(const raft::Message& msg) {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        if (handler_) {
            handler_(msg);
        }
    }

    void VirtualTransport::start() {
        if (running_.exchange(true)) {
            return;
        }
        network_->register_node(node_id_, [this](const raft::Message& msg) { dispatch(msg); });
    }

    void VirtualTransport::stop() {
        if (!running_.exchange(false)) {
            return;
        }
        network_->unregister_node(node_id_);
    }

    void VirtualTransport::update_peer(uint64_t node_id, const std::string& address) {
        peers_.update(node_id, address);
    }

    void VirtualTransport::remove_peer(uint64_t node_id) {
        peers_.remove(node_id);
    }

}
