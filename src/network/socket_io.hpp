#pragma once
#include <cstdint>
#include <string>
#include <sys/socket.h>

namespace quorumkv::network {

    // Blocking socket helpers shared by the peer transport and the client endpoint.

    void set_io_timeout(int fd, int option, uint32_t timeout_ms);

    bool resolve(const std::string& host, uint16_t port, bool passive,
        struct sockaddr_storage& addr, socklen_t& addr_len, std::string& error);

    // Non-blocking connect bounded by `timeout_ms`; returns a blocking socket or -1
    int connect_with_timeout(const std::string& address, uint32_t timeout_ms, std::string& error);

    bool send_all(int fd, const char* data, size_t size);

    // 1 when `size` bytes were read, 0 on clean EOF before the first byte, -1 otherwise
    int recv_exact(int fd, char* data, size_t size);

    // Bound and listening socket for "host:port". Port 0 picks a free one,
    // reported through `bound_port`. Throws std::runtime_error.
    int open_listener(const std::string& address, int backlog, uint16_t& bound_port);

    bool wait_readable(int fd, int timeout_ms);

}
