// src/atlantis.cpp
// Capture service: builds traffic packages and keeps per-connection
// WebSocket state.

#include "atlantis/atlantis.hpp"
#include "log.hpp"

#include <atomic>
#include <exception>
#include <map>
#include <mutex>
#include <utility>

namespace atlantis {

namespace {

// Capture runs inside the host's traffic path: failures are logged, never
// rethrown.
template <typename F>
void guarded(const char* operation, F&& body) {
    try {
        body();
    } catch (const std::exception& e) {
        logger()->error("{} failed: {}", operation, e.what());
    }
}

} // namespace

struct Atlantis::Inner {
    Inner(Configuration config, std::unique_ptr<Transporter> transporter, MessageSender* external)
        : config(std::move(config)),
          transporter(std::move(transporter)),
          sender(external ? external : this->transporter.get()) {}

    Configuration config;
    std::unique_ptr<Transporter> transporter;  // null with an external sender
    MessageSender* sender;
    std::atomic<bool> running{false};

    std::recursive_mutex delegate_mutex;
    TrafficDelegate* delegate = nullptr;

    // WebSocket state, keyed by connection id.
    std::mutex ws_mutex;
    std::map<std::string, TrafficPackage> websocket_packages;
    std::map<std::string, std::vector<TrafficPackage>> waiting_packages;

    void notify_traffic(const TrafficPackage& package) {
        std::lock_guard<std::recursive_mutex> lock(delegate_mutex);
        if (delegate) delegate->on_traffic_captured(package);
    }

    void notify_websocket(const TrafficPackage& package) {
        std::lock_guard<std::recursive_mutex> lock(delegate_mutex);
        if (delegate) delegate->on_websocket_message_captured(package);
    }

    // Move frames waiting for `id` into `out`, filling in the response the
    // base record has by now. Caller holds ws_mutex.
    void take_waiting(const std::string& id, std::vector<Message>& out) {
        auto waiting = waiting_packages.find(id);
        if (waiting == waiting_packages.end()) return;

        std::optional<Response> base_response;
        auto base = websocket_packages.find(id);
        if (base != websocket_packages.end()) base_response = base->second.response();

        for (const auto& item : waiting->second) {
            if (!item.response() && base_response) {
                out.push_back(Message::websocket(config.id(), item.with_response(*base_response)));
            } else {
                out.push_back(Message::websocket(config.id(), item));
            }
        }
        waiting_packages.erase(waiting);
    }

    void send_all(std::vector<Message>& messages) {
        for (auto& message : messages) {
            sender->send(std::move(message));
        }
    }

    void websocket_frame(const std::string& id, WebsocketMessagePackage frame) {
        if (!running.load()) return;

        std::optional<TrafficPackage> snapshot;
        {
            std::lock_guard<std::mutex> lock(ws_mutex);
            auto it = websocket_packages.find(id);
            if (it == websocket_packages.end()) {
                logger()->debug("dropping frame for unknown websocket {}", id);
                return;
            }
            snapshot = it->second.with_websocket_message(std::move(frame));
        }
        notify_websocket(*snapshot);

        std::vector<Message> out;
        {
            std::lock_guard<std::mutex> lock(ws_mutex);
            if (!snapshot->response()) {
                waiting_packages[id].push_back(std::move(*snapshot));
                return;
            }
            take_waiting(id, out);
        }
        out.push_back(Message::websocket(config.id(), *snapshot));
        send_all(out);
    }
};

Atlantis::Atlantis(std::unique_ptr<Inner> inner) : inner_(std::move(inner)) {}

std::unique_ptr<Atlantis> Atlantis::create(Configuration config) {
    auto inner = std::make_unique<Inner>(std::move(config), std::make_unique<Transporter>(), nullptr);
    return std::unique_ptr<Atlantis>(new Atlantis(std::move(inner)));
}

std::unique_ptr<Atlantis> Atlantis::create_with_sender(Configuration config, MessageSender& sender) {
    auto inner = std::make_unique<Inner>(std::move(config), nullptr, &sender);
    return std::unique_ptr<Atlantis>(new Atlantis(std::move(inner)));
}

Atlantis::~Atlantis() {
    stop();
}

// --- Lifecycle ---

void Atlantis::start() {
    if (inner_->running.exchange(true)) {
        logger()->debug("atlantis is already running");
        return;
    }
    if (inner_->transporter) {
        inner_->transporter->start(inner_->config);
    }

    const auto& config = inner_->config;
    if (config.host_name()) {
        logger()->info("atlantis started for {}, looking for Proxyman on {}", config.package_name(),
                       *config.host_name());
    } else {
        logger()->info("atlantis started for {}, looking for any Proxyman on the network",
                       config.package_name());
    }
}

void Atlantis::stop() {
    if (!inner_->running.exchange(false)) return;

    if (inner_->transporter) {
        inner_->transporter->stop();
    }
    std::lock_guard<std::mutex> lock(inner_->ws_mutex);
    inner_->websocket_packages.clear();
    inner_->waiting_packages.clear();
}

bool Atlantis::is_running() const {
    return inner_->running.load();
}

const Configuration& Atlantis::configuration() const noexcept {
    return inner_->config;
}

// --- HTTP ---

void Atlantis::capture_http(const HttpExchange& exchange) {
    if (!inner_->running.load()) return;

    if (exchange.response && exchange.response->status_code == 101) {
        logger()->debug("skipping websocket upgrade for {}", exchange.request.url);
        return;
    }

    guarded("capture_http", [&] {
        double start_at = exchange.start_at > 0.0 ? exchange.start_at : now_seconds();
        TrafficPackage package(new_package_id(), start_at, exchange.request);

        if (exchange.response) {
            package = package.with_response(*exchange.response);
            if (!exchange.response_body.empty()) {
                package = package.with_response_body(capture_response_body(
                    exchange.response_body, exchange.response->header("Content-Encoding")));
            }
        }
        if (exchange.error) {
            package = package.with_error(*exchange.error);
        }
        package = package.with_end_at(exchange.end_at.value_or(now_seconds()));

        inner_->notify_traffic(package);
        inner_->sender->send(Message::traffic(inner_->config.id(), package));
    });
}

// --- WebSocket ---

std::string Atlantis::new_connection_id() {
    return new_package_id();
}

void Atlantis::on_websocket_connecting(const std::string& id, Request request) {
    if (!inner_->running.load()) return;

    guarded("on_websocket_connecting", [&] {
        TrafficPackage base(id, now_seconds(), std::move(request), PackageType::WebSocket);
        std::lock_guard<std::mutex> lock(inner_->ws_mutex);
        inner_->websocket_packages.emplace(id, std::move(base));
    });
}

void Atlantis::on_websocket_open(const std::string& id, Request request, Response response) {
    if (!inner_->running.load()) return;

    guarded("on_websocket_open", [&] {
        double now = now_seconds();
        auto base = TrafficPackage(id, now, std::move(request), PackageType::WebSocket)
                        .with_response(std::move(response))
                        .with_end_at(now);
        {
            std::lock_guard<std::mutex> lock(inner_->ws_mutex);
            inner_->websocket_packages.insert_or_assign(id, base);
        }

        // Registers the connection with the inspector before any frame.
        inner_->sender->send(Message::traffic(inner_->config.id(), base));

        std::vector<Message> waiting;
        {
            std::lock_guard<std::mutex> lock(inner_->ws_mutex);
            inner_->take_waiting(id, waiting);
        }
        inner_->send_all(waiting);
    });
}

void Atlantis::on_websocket_send_text(const std::string& id, const std::string& text) {
    guarded("on_websocket_send_text", [&] {
        inner_->websocket_frame(id, WebsocketMessagePackage::string_message(id, text, WebsocketMessageType::Send));
    });
}

void Atlantis::on_websocket_send_binary(const std::string& id, const std::vector<uint8_t>& data) {
    guarded("on_websocket_send_binary", [&] {
        inner_->websocket_frame(id, WebsocketMessagePackage::data_message(id, data, WebsocketMessageType::Send));
    });
}

void Atlantis::on_websocket_receive_text(const std::string& id, const std::string& text) {
    guarded("on_websocket_receive_text", [&] {
        inner_->websocket_frame(id, WebsocketMessagePackage::string_message(id, text, WebsocketMessageType::Receive));
    });
}

void Atlantis::on_websocket_receive_binary(const std::string& id, const std::vector<uint8_t>& data) {
    guarded("on_websocket_receive_binary", [&] {
        inner_->websocket_frame(id, WebsocketMessagePackage::data_message(id, data, WebsocketMessageType::Receive));
    });
}

void Atlantis::on_websocket_closing(const std::string& id, int code,
                                    const std::optional<std::string>& reason) {
    if (!inner_->running.load()) return;

    guarded("on_websocket_closing", [&] {
        std::optional<TrafficPackage> base;
        {
            // Removing the base makes later close events for this id no-ops.
            std::lock_guard<std::mutex> lock(inner_->ws_mutex);
            auto it = inner_->websocket_packages.find(id);
            if (it == inner_->websocket_packages.end()) return;
            base = std::move(it->second);
            inner_->websocket_packages.erase(it);
            inner_->waiting_packages.erase(id);
        }

        auto snapshot = base->with_websocket_message(WebsocketMessagePackage::close_message(id, code, reason));
        inner_->notify_websocket(snapshot);
        inner_->sender->send(Message::websocket(inner_->config.id(), snapshot));
    });
}

void Atlantis::on_websocket_closed(const std::string& id, int code,
                                   const std::optional<std::string>& reason) {
    on_websocket_closing(id, code, reason);
}

void Atlantis::on_websocket_failure(const std::string& id, const std::string& message) {
    if (!inner_->running.load()) return;

    logger()->error("websocket failure (id={}): {}", id, message);
    std::lock_guard<std::mutex> lock(inner_->ws_mutex);
    inner_->websocket_packages.erase(id);
    inner_->waiting_packages.erase(id);
}

// --- Observers ---

void Atlantis::set_delegate(TrafficDelegate* delegate) {
    std::lock_guard<std::recursive_mutex> lock(inner_->delegate_mutex);
    inner_->delegate = delegate;
}

void Atlantis::set_connection_listener(ConnectionListener* listener) {
    if (!inner_->transporter) {
        logger()->debug("connection listener ignored: messages go to an external sender");
        return;
    }
    inner_->transporter->set_connection_listener(listener);
}

} // namespace atlantis
