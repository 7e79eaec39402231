#include "client_server.hpp"
#include "socket_io.hpp"
#include "../storage/record_log.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sys/socket.h>
#include <unistd.h>

namespace quorumkv::network {

    ClientServer::ClientServer(uint64_t node_id, const std::string& listen_address,
        std::shared_ptr<kv::KvService> service, const config::NodeOptions& options)
        : node_id_(node_id)
        , listen_address_(listen_address)
        , service_(std::move(service))
        , send_timeout_ms_(options.send_timeout_ms)
        , max_frame_bytes_(options.max_frame_bytes)
    {
    }

    ClientServer::~ClientServer() {
        stop();
    }

    void ClientServer::start() {
        if (running_) {
            return;
        }

        listen_fd_ = open_listener(listen_address_, 64, bound_port_);
        running_ = true;
        listener_thread_ = std::thread(&ClientServer::listen_loop, this);

        std::cout << "[Client " << node_id_ << "] KV service running on " << listen_address_ << std::endl;
    }

    void ClientServer::stop() {
        if (!running_.exchange(false)) {
            return;
        }

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

        std::cout << "[Client " << node_id_ << "] Stopped" << std::endl;
    }

    ClientResponse ClientServer::handle(const ClientRequest& request) {
        ClientResponse response;
        if (request.key.empty()) {
            response.error = "key must not be empty";
            return response;
        }

        if (request.op == "set" || request.op == "delete") {
            kv::SetResponse result = request.op == "set"
                ? service_->set(request.key, request.value)
                : service_->remove(request.key);
            response.success = result.success;
            response.error = result.error;
        }
        else if (request.op == "get") {
            try {
                kv::GetResponse result = service_->get(request.key);
                response.success = true;
                response.found = result.found;
                response.value = result.value;
            }
            catch (const storage::StorageError& e) {
                response.error = e.what();
            }
        }
        else {
            response.error = "unknown op '" + request.op + "'";
        }
        return response;
    }

    void ClientServer::listen_loop() {
        while (running_) {
            if (!wait_readable(listen_fd_, 100)) {
                continue;
            }

            int client = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client < 0) {
                if (running_) {
                    std::cerr << "[Client " << node_id_ << "] Failed to accept connection: "
                        << std::strerror(errno) << std::endl;
                }
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                connections_.insert(client);
                ++active_handlers_;
            }
            std::thread(&ClientServer::handle_connection, this, client).detach();
        }
    }

    void ClientServer::handle_connection(int fd) {
        set_io_timeout(fd, SO_SNDTIMEO, send_timeout_ms_);

        while (running_) {
            char header[4];
            if (recv_exact(fd, header, sizeof(header)) <= 0) {
                break;
            }

            uint32_t size = storage::decode_record_length(header);
            if (size > max_frame_bytes_) {
                std::cerr << "[Client " << node_id_ << "] Request of " << size
                    << " bytes exceeds limit, closing connection" << std::endl;
                break;
            }

            std::string payload(size, '\0');
            if (size > 0 && recv_exact(fd, &payload[0], size) != 1) {
                break;
            }

            ClientResponse response;
            try {
                response = handle(decode_request(payload));
            }
            catch (const std::invalid_argument& e) {
                response.error = e.what();
            }

            std::string frame = storage::encode_record(encode_response(response));
            if (!send_all(fd, frame.data(), frame.size())) {
                break;
            }
        }

        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.erase(fd);
        close(fd);
        --active_handlers_;
        connections_cv_.notify_all();
    }

}
