#include "tcp_transport.hpp"
#include "socket_io.hpp"
#include "../storage/record_log.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace quorumkv::network {

    TcpTransport::TcpTransport(uint64_t node_id, const std::string& listen_address,
        const config::NodeOptions& options)
        : node_id_(node_id)
        , listen_address_(listen_address)
        , send_timeout_ms_(options.send_timeout_ms)
        , sender_threads_(options.sender_threads)
        , queue_limit_(options.outbound_queue_limit)
        , max_frame_bytes_(options.max_frame_bytes)
    {
    }

    TcpTransport::~TcpTransport() {
        stop();
    }

    void TcpTransport::set_message_handler(MessageHandler handler) {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler_ = std::move(handler);
    }

    void TcpTransport::update_peer(uint64_t node_id, const std::string& address) {
        peers_.update(node_id, address);
    }

    void TcpTransport::remove_peer(uint64_t node_id) {
        peers_.remove(node_id);
    }

    size_t TcpTransport::queued() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return queue_.size();
    }

    void TcpTransport::start() {
        if (running_) {
            return;
        }

        listen_fd_ = open_listener(listen_address_, 64, bound_port_);

        running_ = true;
        listener_thread_ = std::thread(&TcpTransport::listen_loop, this);
        for (uint32_t i = 0; i < sender_threads_; ++i) {
            senders_.emplace_back(&TcpTransport::sender_loop, this);
        }

        std::cout << "[Transport " << node_id_ << "] Listening on " << listen_address_ << std::endl;
    }

    void TcpTransport::stop() {
        if (!running_.exchange(false)) {
            return;
        }

        queue_cv_.notify_all();
        for (auto& sender : senders_) {
            if (sender.joinable()) {
                sender.join();
            }
        }
        senders_.clear();

        if (listener_thread_.joinable()) {
            listener_thread_.join();
        }

        {
            std::unique_lock<std::mutex> lock(connections_mutex_);
            for (int fd : connections_) {
                shutdown(fd, SHUT_RDWR);
            }
            connections_cv_.wait(lock, [this] { return active_handlers_ == 0; });
        }

        if (listen_fd_ >= 0) {
            close(listen_fd_);
            listen_fd_ = -1;
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            dropped_ += queue_.size();
            queue_.clear();
        }

        std::cout << "[Transport " << node_id_ << "] Stopped" << std::endl;
    }

    bool TcpTransport::send(const raft::Message& msg) {
        if (!running_) {
            return false;
        }

        std::string address;
        if (!peers_.lookup(msg.to, address)) {
            std::cerr << "[Transport " << node_id_ << "] Unknown peer " << msg.to
                << ", dropping " << raft::message_type_to_string(msg.type) << std::endl;
            ++dropped_;
            return false;
        }

        std::string payload = serializer_.serialize_message(msg);
        if (payload.size() > max_frame_bytes_) {
            std::cerr << "[Transport " << node_id_ << "] Message to " << msg.to << " exceeds frame limit ("
                << payload.size() << " bytes), dropping" << std::endl;
            ++dropped_;
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.size() >= queue_limit_) {
                ++dropped_;
                std::cerr << "[Transport " << node_id_ << "] Outbound queue full, dropping "
                    << raft::message_type_to_string(msg.type) << " to " << msg.to << std::endl;
                return false;
            }
            queue_.push_back(Outbound{ msg.to, storage::encode_record(payload) });
        }
        queue_cv_.notify_one();
        return true;
    }

    void TcpTransport::sender_loop() {
        while (true) {
            Outbound out;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                queue_cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
                if (!running_) {
                    return;
                }
                out = std::move(queue_.front());
                queue_.pop_front();
            }

            if (!deliver(out)) {
                ++dropped_;
            }
        }
    }

    bool TcpTransport::deliver(const Outbound& out) {
        std::string address;
        if (!peers_.lookup(out.to, address)) {
            // removed while queued
            return false;
        }

        std::string error;
        int fd = connect_with_timeout(address, send_timeout_ms_, error);
        if (fd < 0) {
            report_failure(out.to, address, error);
            return false;
        }

        set_io_timeout(fd, SO_SNDTIMEO, send_timeout_ms_);
        int nodelay = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

        bool ok = send_all(fd, out.frame.data(), out.frame.size());
        if (!ok) {
            error = std::string("write: ") + std::strerror(errno);
        }
        close(fd);

        if (!ok) {
            report_failure(out.to, address, error);
            return false;
        }

        std::lock_guard<std::mutex> lock(unreachable_mutex_);
        if (unreachable_.erase(out.to) > 0) {
            std::cout << "[Transport " << node_id_ << "] Peer " << out.to << " at " << address
                << " is reachable again" << std::endl;
        }
        return true;
    }

    // Logged once per outage; raft retransmits on its own
    void TcpTransport::report_failure(uint64_t to, const std::string& address, const std::string& reason) {
        std::lock_guard<std::mutex> lock(unreachable_mutex_);
        if (unreachable_.insert(to).second) {
            std::cerr << "[Transport " << node_id_ << "] Failed to send to peer " << to
                << " at " << address << ": " << reason << std::endl;
        }
    }

    void TcpTransport::listen_loop() {
        while (running_) {
            if (!wait_readable(listen_fd_, 100)) {
                continue;
            }

            int client = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client < 0) {
                if (running_) {
                    std::cerr << "[Transport " << node_id_ << "] Failed to accept connection: "
                        << std::strerror(errno) << std::endl;
                }
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                connections_.insert(client);
                ++active_handlers_;
            }
            std::thread(&TcpTransport::handle_connection, this, client).detach();
        }
    }

    void TcpTransport::handle_connection(int fd) {
        set_io_timeout(fd, SO_RCVTIMEO, send_timeout_ms_ * 4);

        while (running_) {
            char header[4];
            int rc = recv_exact(fd, header, sizeof(header));
            if (rc <= 0) {
                break;
            }

            uint32_t size = storage::decode_record_length(header);
            if (size > max_frame_bytes_) {
                std::cerr << "[Transport " << node_id_ << "] Frame of " << size
                    << " bytes exceeds limit, closing connection" << std::endl;
                break;
            }

            std::string payload(size, '\0');
            if (size > 0 && recv_exact(fd, &payload[0], size) != 1) {
                break;
            }

            raft::Message msg;
            if (!serializer_.deserialize_message(payload, msg)) {
                break;
            }

            std::lock_guard<std::mutex> lock(handler_mutex_);
            if (handler_) {
                handler_(msg);
            }
        }

        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.erase(fd);
        close(fd);
        --active_handlers_;
        connections_cv_.notify_all();
    }

}
