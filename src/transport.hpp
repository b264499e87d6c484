// src/transport.hpp
// TCP transport: one socket to the peer, one whole frame per write.

#pragma once

#include "atlantis/error.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace atlantis {

// Self-pipe used to abort a blocking connect from another thread.
class CancelPipe {
public:
    CancelPipe();
    ~CancelPipe();

    CancelPipe(const CancelPipe&) = delete;
    CancelPipe& operator=(const CancelPipe&) = delete;

    // Make read_fd() readable; any poll() on it returns immediately.
    void signal() noexcept;
    // Drain pending signals.
    void reset() noexcept;

    int read_fd() const noexcept { return fds_[0]; }
    bool valid() const noexcept { return fds_[0] >= 0; }

private:
    int fds_[2] = {-1, -1};
};

class TcpTransport {
public:
    explicit TcpTransport(std::chrono::milliseconds send_timeout);
    ~TcpTransport();

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // Resolve and connect, trying each address until one succeeds within
    // `timeout`. A signal on `cancel` aborts the attempt. Closes any
    // previous socket first.
    Status connect(const std::string& host, uint16_t port,
                   std::chrono::milliseconds timeout, const CancelPipe* cancel = nullptr);

    // Send [8 bytes LE length][payload] as one write. A short write closes
    // the socket and is reported as an Io error.
    Status send_frame(const uint8_t* data, size_t len);

    void close_connection();

    bool is_open() const noexcept { return socket_fd_ >= 0; }
    const std::string& host() const noexcept { return host_; }
    uint16_t port() const noexcept { return port_; }

private:
    void configure_socket(int fd);
    Status write_all(const uint8_t* data, size_t len);

    std::chrono::milliseconds send_timeout_;
    std::string host_;
    uint16_t port_ = 0;
    int socket_fd_ = -1;
};

} // namespace atlantis
