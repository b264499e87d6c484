// src/transport.cpp
// TCP transport to the inspector.

#include "transport.hpp"
#include "framing.hpp"

#include <cerrno>
#include <cstring>

// POSIX sockets
#include <sys/time.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <poll.h>

namespace atlantis {

// --- CancelPipe ---

CancelPipe::CancelPipe() {
    if (::pipe(fds_) != 0) {
        fds_[0] = fds_[1] = -1;
        return;
    }
    for (int fd : fds_) {
        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
}

CancelPipe::~CancelPipe() {
    for (int fd : fds_) {
        if (fd >= 0) ::close(fd);
    }
}

void CancelPipe::signal() noexcept {
    if (fds_[1] < 0) return;
    uint8_t byte = 1;
    // Full pipe already means "signalled".
    ssize_t n = ::write(fds_[1], &byte, 1);
    (void)n;
}

void CancelPipe::reset() noexcept {
    if (fds_[0] < 0) return;
    uint8_t buf[64];
    while (::read(fds_[0], buf, sizeof(buf)) > 0) {}
}

// --- TcpTransport ---

TcpTransport::TcpTransport(std::chrono::milliseconds send_timeout)
    : send_timeout_(send_timeout) {}

TcpTransport::~TcpTransport() {
    close_connection();
}

void TcpTransport::close_connection() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

Status TcpTransport::connect(const std::string& host, uint16_t port,
                             std::chrono::milliseconds timeout, const CancelPipe* cancel) {
    close_connection();
    host_ = host;
    port_ = port;

    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    auto port_str = std::to_string(port);
    int err = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0 || res == nullptr) {
        return AtlantisError::connect("DNS resolution failed for " + host + ": " + ::gai_strerror(err));
    }

    std::string last_error = "no usable address";

    // Try each resolved address (IPv6/IPv4) until one connects.
    for (struct addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
        int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }

        int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0) {
            last_error = std::strerror(errno);
            ::close(fd);
            continue;
        }
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int ret = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
        if (ret != 0 && errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            ::close(fd);
            continue;
        }

        if (ret != 0) {
            // Wait for connection with timeout, or for cancellation.
            struct pollfd pfds[2]{};
            pfds[0].fd = fd;
            pfds[0].events = POLLOUT;
            nfds_t count = 1;
            if (cancel && cancel->valid()) {
                pfds[1].fd = cancel->read_fd();
                pfds[1].events = POLLIN;
                count = 2;
            }

            int poll_ret = ::poll(pfds, count, static_cast<int>(timeout.count()));
            if (count == 2 && (pfds[1].revents & POLLIN)) {
                ::close(fd);
                ::freeaddrinfo(res);
                return AtlantisError::connect("connect to " + host + ":" + port_str + " cancelled");
            }
            if (poll_ret <= 0) {
                last_error = poll_ret == 0 ? "timed out" : std::strerror(errno);
                ::close(fd);
                continue;
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                last_error = std::strerror(so_error);
                ::close(fd);
                continue;
            }
        }

        // Connected, restore blocking mode
        ::fcntl(fd, F_SETFL, flags);
        ::freeaddrinfo(res);
        configure_socket(fd);
        socket_fd_ = fd;
        return std::nullopt;
    }

    ::freeaddrinfo(res);
    return AtlantisError::connect("connect failed to " + host + ":" + port_str + ": " + last_error);
}

void TcpTransport::configure_socket(int fd) {
    int nodelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    int keepalive = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));

    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(send_timeout_.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((send_timeout_.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

Status TcpTransport::write_all(const uint8_t* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(socket_fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            std::string reason = n < 0 ? std::strerror(errno) : "connection closed";
            close_connection();
            return AtlantisError::io("wrote " + std::to_string(sent) + " of " +
                                     std::to_string(len) + " bytes: " + reason);
        }
        sent += static_cast<size_t>(n);
    }
    return std::nullopt;
}

Status TcpTransport::send_frame(const uint8_t* data, size_t len) {
    if (socket_fd_ < 0) {
        return AtlantisError::io("not connected");
    }

    auto frame = framing::encode_frame(data, len);
    if (!frame) {
        return AtlantisError::serialization(
            "payload of " + std::to_string(len) + " bytes exceeds the package size limit");
    }
    return write_all(frame->data(), frame->size());
}

} // namespace atlantis
