#include "socket_io.hpp"
#include "../../include/quorumkv/config/options.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace quorumkv::network {

    void set_io_timeout(int fd, int option, uint32_t timeout_ms) {
        struct timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
        setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv));
    }

    bool resolve(const std::string& host, uint16_t port, bool passive,
        struct sockaddr_storage& addr, socklen_t& addr_len, std::string& error) {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        if (passive) {
            hints.ai_flags = AI_PASSIVE;
        }

        struct addrinfo* result = nullptr;
        std::string service = std::to_string(port);
        int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
        if (rc != 0 || result == nullptr) {
            error = std::string("cannot resolve ") + host + ": " + gai_strerror(rc);
            return false;
        }

        std::memcpy(&addr, result->ai_addr, result->ai_addrlen);
        addr_len = result->ai_addrlen;
        freeaddrinfo(result);
        return true;
    }

    int connect_with_timeout(const std::string& address, uint32_t timeout_ms, std::string& error) {
        std::string host;
        uint16_t port = 0;
        try {
            config::parse_address(address, host, port);
        }
        catch (const std::invalid_argument& e) {
            error = e.what();
            return -1;
        }

        struct sockaddr_storage addr;
        socklen_t addr_len = 0;
        if (!resolve(host, port, false, addr, addr_len, error)) {
            return -1;
        }

        int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            error = std::string("socket: ") + std::strerror(errno);
            return -1;
        }

        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = connect(fd, reinterpret_cast<struct sockaddr*>(&addr), addr_len);
        if (rc < 0 && errno != EINPROGRESS) {
            error = std::string("connect: ") + std::strerror(errno);
            close(fd);
            return -1;
        }

        if (rc < 0) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;

            rc = poll(&pfd, 1, static_cast<int>(timeout_ms));
            if (rc <= 0) {
                error = rc == 0 ? "connect timed out" : std::string("poll: ") + std::strerror(errno);
                close(fd);
                return -1;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                error = std::string("connect: ") + std::strerror(so_error);
                close(fd);
                return -1;
            }
        }

        fcntl(fd, F_SETFL, flags);
        return fd;
    }

    bool send_all(int fd, const char* data, size_t size) {
        while (size > 0) {
            ssize_t sent = ::send(fd, data, size, MSG_NOSIGNAL);
            if (sent < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            data += sent;
            size -= static_cast<size_t>(sent);
        }
        return true;
    }

    int recv_exact(int fd, char* data, size_t size) {
        size_t received = 0;
        while (received < size) {
            ssize_t n = recv(fd, data + received, size - received, 0);
            if (n < 0) {
                if (errno == EINTR) continue;
                return -1;
            }
            if (n == 0) {
                return received == 0 ? 0 : -1;
            }
            received += static_cast<size_t>(n);
        }
        return 1;
    }

    int open_listener(const std::string& address, int backlog, uint16_t& bound_port) {
        std::string host;
        uint16_t port = 0;
        try {
            config::parse_address(address, host, port);
        }
        catch (const std::invalid_argument& e) {
            throw std::runtime_error(e.what());
        }

        struct sockaddr_storage addr;
        socklen_t addr_len = 0;
        std::string error;
        if (!resolve(host, port, true, addr, addr_len, error)) {
            throw std::runtime_error("Failed to resolve listen address: " + error);
        }

        int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            throw std::runtime_error("Failed to create socket");
        }

        int opt = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            close(fd);
            throw std::runtime_error("Failed to set socket options");
        }

        if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), addr_len) < 0) {
            std::string reason = std::strerror(errno);
            close(fd);
            throw std::runtime_error("Failed to bind " + address + ": " + reason);
        }
        if (listen(fd, backlog) < 0) {
            std::string reason = std::strerror(errno);
            close(fd);
            throw std::runtime_error("Failed to listen on " + address + ": " + reason);
        }

        struct sockaddr_in bound;
        socklen_t bound_len = sizeof(bound);
        bound_port = 0;
        if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
            bound_port = ntohs(bound.sin_port);
        }
        return fd;
    }

    bool wait_readable(int fd, int timeout_ms) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        return poll(&pfd, 1, timeout_ms) > 0;
    }

}
