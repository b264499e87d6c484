// src/connection_manager.hpp
// Worker thread owning the connection state machine. Everything else posts
// commands to its mailbox.

#pragma once

#include "atlantis/config.hpp"
#include "atlantis/discovery.hpp"
#include "atlantis/message.hpp"
#include "atlantis/transporter.hpp"
#include "pending_queue.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

namespace atlantis {

struct PeerFound {
    DiscoveredPeer peer;
};
struct PeerLost {
    std::string name;
};
struct DiscoveryFailed {
    AtlantisError error;
};
struct Outbound {
    Message message;
};
// Re-arm after a terminal direct-mode failure.
struct Restart {};

// Worker command: exactly one variant active at a time.
using Command = std::variant<PeerFound, PeerLost, DiscoveryFailed, Outbound, Restart>;

class ConnectionManager : public DiscoveryListener {
public:
    // `browser` may be null in direct mode. `pending` and `events` must
    // outlive the manager.
    ConnectionManager(Configuration config, PendingQueue<Message>& pending,
                      ConnectionListener& events, std::unique_ptr<ServiceBrowser> browser);
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void start();

    // Cancels discovery, connect and retries, then joins the worker. Called
    // from the worker itself (a listener callback), it only signals; the
    // worker unwinds once the callback returns and a later stop() or the
    // destructor joins it.
    void stop();

    // Non-blocking; written when connected, queued otherwise.
    void send(Message message);
    void restart();

    ConnectionState state() const noexcept { return state_.load(); }
    TransportStats stats() const;

    // Why the manager entered Failed; cleared by restart().
    std::optional<std::string> failure_reason() const;

    bool on_worker_thread() const noexcept;

    // DiscoveryListener: called on the browser thread, forwarded to the
    // mailbox.
    void on_service_found(const DiscoveredPeer& peer) override;
    void on_service_lost(const std::string& name) override;
    void on_discovery_error(int code, const std::string& message) override;

private:
    Status post(Command command);
    bool is_stopping();
    void run();
    void dispatch(Command& command);

    void dial(const std::string& host, uint16_t port);
    void connect_failed(const AtlantisError& error);
    void connection_lost(const AtlantisError& error);
    void flush_pending();
    void park(Message message);
    Status transmit(const Message& message);
    void set_state(ConnectionState state);

    Configuration config_;
    ConnectionMode mode_;
    PendingQueue<Message>& pending_;
    ConnectionListener& events_;
    std::unique_ptr<ServiceBrowser> browser_;
    TcpTransport transport_;
    CancelPipe cancel_;
    std::thread thread_;

    std::atomic<ConnectionState> state_{ConnectionState::Idle};
    std::atomic<bool> started_{false};
    std::atomic<std::thread::id> worker_id_{};

    // Mailbox
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Command> mailbox_;
    bool stopping_ = false;
    std::optional<std::string> failure_reason_;
    static constexpr size_t MAX_MAILBOX_SIZE = 10000;

    // Worker-only
    std::optional<std::chrono::steady_clock::time_point> retry_at_;
    uint32_t attempts_ = 0;

    std::atomic<uint64_t> connect_attempts_{0};
    std::atomic<uint64_t> messages_sent_{0};
    std::atomic<uint64_t> messages_dropped_{0};
};

} // namespace atlantis
