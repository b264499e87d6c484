// include/atlantis/transporter.hpp
// Streaming channel to the desktop inspector: discovery, connection,
// framing and buffering behind start/stop/send.

#pragma once

#include "config.hpp"
#include "discovery.hpp"
#include "message.hpp"
#include "types.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace atlantis {

// Connection lifecycle notifications. Delivered on the transporter's worker
// thread; keep them short.
class ConnectionListener {
public:
    virtual ~ConnectionListener() = default;

    virtual void on_connected(const std::string& host, uint16_t port) = 0;
    virtual void on_disconnected() = 0;
    virtual void on_connection_failed(const std::string& reason) = 0;
};

// Anything that accepts outbound messages. Implemented by Transporter;
// tests substitute a recorder.
class MessageSender {
public:
    virtual ~MessageSender() = default;
    virtual void send(Message message) = 0;
};

struct TransportStats {
    uint64_t connect_attempts = 0;
    uint64_t messages_sent = 0;
    uint64_t messages_dropped = 0;
};

// Builds the browser used in discovery mode.
using BrowserFactory = std::function<std::unique_ptr<ServiceBrowser>(const Configuration&)>;

// The Atlantis transporter.
//
// Example:
//   Transporter transporter;
//   transporter.set_connection_listener(&listener);
//   transporter.start(Configuration::defaults("com.example.app"));
//   transporter.send(Message::traffic(config.id(), package));
//   transporter.stop();
class Transporter : public MessageSender {
public:
    // Discovery mode uses the built-in multicast DNS browser.
    Transporter();
    explicit Transporter(BrowserFactory browser_factory);
    ~Transporter() override;

    Transporter(const Transporter&) = delete;
    Transporter& operator=(const Transporter&) = delete;

    // Begin discovery or direct connection. Returns immediately. A second
    // call while started is ignored, except after a terminal direct-mode
    // failure, where it re-arms the attempt budget.
    void start(const Configuration& config);

    // Cancel discovery, connect and retries, close the socket and clear the
    // queue. on_disconnected() has fired before this returns if a
    // connection was open. Safe to call from a ConnectionListener callback;
    // the worker then finishes after the callback returns.
    void stop();

    // Never blocks, never throws. Dropped unless started.
    void send(Message message) override;

    // Single slot; nullptr unregisters. Unregister before destroying the
    // listener.
    void set_connection_listener(ConnectionListener* listener);

    ConnectionState state() const;
    bool is_connected() const;
    bool is_started() const;

    // Messages waiting for a connection.
    size_t pending_count() const;

    // Counters for the current session; reset by start().
    TransportStats stats() const;

    // Reason for the last terminal direct-mode failure. Kept after stop()
    // and cleared by start().
    std::optional<std::string> failure_reason() const;

private:
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace atlantis
