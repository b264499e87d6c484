// include/atlantis/atlantis.hpp
// Atlantis capture service: turns captured HTTP exchanges and WebSocket
// events into traffic messages for the inspector.

#pragma once

#include "config.hpp"
#include "message.hpp"
#include "packages.hpp"
#include "transporter.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace atlantis {

// Observer for captured packages. Called on the capturing thread before
// the message is handed to the transporter.
class TrafficDelegate {
public:
    virtual ~TrafficDelegate() = default;

    virtual void on_traffic_captured(const TrafficPackage& package) = 0;
    virtual void on_websocket_message_captured(const TrafficPackage& package) {}
};

// One finished HTTP exchange as the host's HTTP client saw it.
struct HttpExchange {
    Request request;
    std::optional<Response> response;
    std::vector<uint8_t> response_body;  // as received, possibly gzip
    std::optional<CustomError> error;
    double start_at = 0.0;
    std::optional<double> end_at;  // now when unset
};

// The Atlantis capture service.
//
// Owned by the host's composition root; there is no global instance.
//
// Example:
//   auto atlantis = Atlantis::create(Configuration::defaults("com.example.app"));
//   atlantis->start();
//   atlantis->capture_http(exchange);
//   atlantis->stop();
class Atlantis {
public:
    // Capture service streaming through its own Transporter.
    static std::unique_ptr<Atlantis> create(Configuration config);

    // Capture service handing messages to `sender`, which must outlive it.
    static std::unique_ptr<Atlantis> create_with_sender(Configuration config, MessageSender& sender);

    ~Atlantis();

    Atlantis(const Atlantis&) = delete;
    Atlantis& operator=(const Atlantis&) = delete;

    // --- Lifecycle ---

    void start();
    // Stops the transporter and forgets every open WebSocket.
    void stop();
    bool is_running() const;

    const Configuration& configuration() const noexcept;

    // --- HTTP ---

    // Responses with status 101 are WebSocket upgrades and are skipped.
    void capture_http(const HttpExchange& exchange);

    // --- WebSocket ---

    // Fresh id to key one WebSocket connection's events.
    static std::string new_connection_id();

    // Handshake started; frames arriving before on_websocket_open() wait.
    void on_websocket_connecting(const std::string& id, Request request);
    void on_websocket_open(const std::string& id, Request request, Response response);

    void on_websocket_send_text(const std::string& id, const std::string& text);
    void on_websocket_send_binary(const std::string& id, const std::vector<uint8_t>& data);
    void on_websocket_receive_text(const std::string& id, const std::string& text);
    void on_websocket_receive_binary(const std::string& id, const std::vector<uint8_t>& data);

    // Only the first of closing/closed for an id produces a close frame.
    void on_websocket_closing(const std::string& id, int code, const std::optional<std::string>& reason);
    void on_websocket_closed(const std::string& id, int code, const std::optional<std::string>& reason);
    void on_websocket_failure(const std::string& id, const std::string& message);

    // --- Observers ---

    // Single slot; nullptr unregisters.
    void set_delegate(TrafficDelegate* delegate);
    // Forwarded to the owned Transporter; ignored with an external sender.
    void set_connection_listener(ConnectionListener* listener);

private:
    struct Inner;
    explicit Atlantis(std::unique_ptr<Inner> inner);
    std::unique_ptr<Inner> inner_;
};

} // namespace atlantis
