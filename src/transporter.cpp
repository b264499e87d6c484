// src/transporter.cpp
// Transporter: owns the outbound queue and the listener slot, runs one
// ConnectionManager per started session.

#include "atlantis/transporter.hpp"
#include "connection_manager.hpp"
#include "log.hpp"
#include "mdns_browser.hpp"
#include "pending_queue.hpp"

#include <mutex>
#include <shared_mutex>
#include <vector>

namespace atlantis {

namespace {

constexpr size_t DEFAULT_PENDING_CAPACITY = 50;

std::unique_ptr<ServiceBrowser> make_mdns_browser(const Configuration& config) {
    return std::make_unique<MdnsServiceBrowser>(config.service_type(), config.host_name(),
                                                config.discovery_query_interval());
}

} // namespace

struct Transporter::Inner : public ConnectionListener {
    explicit Inner(BrowserFactory factory)
        : browser_factory(std::move(factory)), pending(DEFAULT_PENDING_CAPACITY) {}

    BrowserFactory browser_factory;
    PendingQueue<Message> pending;

    // Serializes start() with taking the manager out in stop(); never held
    // while a worker is joined. Also guards `retired`.
    std::mutex lifecycle_mutex;

    // Managers stopped from one of their own callbacks. Their worker is
    // still on the stack, so they are destroyed later from another thread.
    std::vector<std::unique_ptr<ConnectionManager>> retired;

    // Guards `manager`; send() only takes it shared.
    mutable std::shared_mutex manager_mutex;
    std::unique_ptr<ConnectionManager> manager;
    TransportStats last_stats;
    std::optional<std::string> last_failure;

    // Joins and destroys retired managers, except one whose worker is the
    // calling thread.
    void reap_retired() {
        std::vector<std::unique_ptr<ConnectionManager>> done;
        {
            std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);
            for (auto it = retired.begin(); it != retired.end();) {
                if ((*it)->on_worker_thread()) {
                    ++it;
                } else {
                    done.push_back(std::move(*it));
                    it = retired.erase(it);
                }
            }
        }
        done.clear();
    }

    // Held while a callback runs, so replacing the listener waits for it.
    std::recursive_mutex listener_mutex;
    ConnectionListener* listener = nullptr;

    void on_connected(const std::string& host, uint16_t port) override {
        std::lock_guard<std::recursive_mutex> lock(listener_mutex);
        if (listener) listener->on_connected(host, port);
    }

    void on_disconnected() override {
        std::lock_guard<std::recursive_mutex> lock(listener_mutex);
        if (listener) listener->on_disconnected();
    }

    void on_connection_failed(const std::string& reason) override {
        std::lock_guard<std::recursive_mutex> lock(listener_mutex);
        if (listener) listener->on_connection_failed(reason);
    }
};

Transporter::Transporter() : Transporter(make_mdns_browser) {}

Transporter::Transporter(BrowserFactory browser_factory)
    : inner_(std::make_unique<Inner>(browser_factory ? std::move(browser_factory)
                                                     : BrowserFactory(make_mdns_browser))) {}

Transporter::~Transporter() {
    stop();
    inner_->reap_retired();
}

void Transporter::start(const Configuration& config) {
    inner_->reap_retired();

    std::lock_guard<std::mutex> lifecycle(inner_->lifecycle_mutex);
    std::unique_lock<std::shared_mutex> lock(inner_->manager_mutex);

    if (inner_->manager) {
        if (inner_->manager->state() == ConnectionState::Failed) {
            inner_->manager->restart();
        } else {
            logger()->debug("transporter already started");
        }
        return;
    }

    inner_->pending.clear();
    inner_->pending.set_capacity(config.max_pending_messages());
    inner_->last_failure.reset();

    std::unique_ptr<ServiceBrowser> browser;
    if (config.resolved_mode() == ConnectionMode::Discovery) {
        browser = inner_->browser_factory(config);
    }

    inner_->manager = std::make_unique<ConnectionManager>(config, inner_->pending, *inner_,
                                                          std::move(browser));
    inner_->manager->start();
}

void Transporter::stop() {
    std::unique_ptr<ConnectionManager> manager;
    {
        std::lock_guard<std::mutex> lifecycle(inner_->lifecycle_mutex);
        std::unique_lock<std::shared_mutex> lock(inner_->manager_mutex);
        manager = std::move(inner_->manager);
    }
    if (!manager) {
        inner_->reap_retired();
        return;
    }

    // Outside every lock: listener callbacks during shutdown may call
    // send(), start() or stop().
    manager->stop();
    {
        std::unique_lock<std::shared_mutex> lock(inner_->manager_mutex);
        inner_->last_stats = manager->stats();
        inner_->last_failure = manager->failure_reason();
        // A callback may already have started the next session.
        if (!inner_->manager) inner_->pending.clear();
    }

    if (manager->on_worker_thread()) {
        std::lock_guard<std::mutex> lifecycle(inner_->lifecycle_mutex);
        inner_->retired.push_back(std::move(manager));
    } else {
        manager.reset();
    }
    inner_->reap_retired();
    logger()->info("transporter stopped");
}

void Transporter::send(Message message) {
    std::shared_lock<std::shared_mutex> lock(inner_->manager_mutex);
    if (!inner_->manager) {
        logger()->debug("dropping {} message: {}", to_string(message.message_type()),
                        AtlantisError::closed().message());
        return;
    }
    inner_->manager->send(std::move(message));
}

void Transporter::set_connection_listener(ConnectionListener* listener) {
    std::lock_guard<std::recursive_mutex> lock(inner_->listener_mutex);
    inner_->listener = listener;
}

ConnectionState Transporter::state() const {
    std::shared_lock<std::shared_mutex> lock(inner_->manager_mutex);
    return inner_->manager ? inner_->manager->state() : ConnectionState::Idle;
}

bool Transporter::is_connected() const {
    return state() == ConnectionState::Connected;
}

bool Transporter::is_started() const {
    std::shared_lock<std::shared_mutex> lock(inner_->manager_mutex);
    return inner_->manager != nullptr;
}

size_t Transporter::pending_count() const {
    return inner_->pending.size();
}

TransportStats Transporter::stats() const {
    std::shared_lock<std::shared_mutex> lock(inner_->manager_mutex);
    return inner_->manager ? inner_->manager->stats() : inner_->last_stats;
}

std::optional<std::string> Transporter::failure_reason() const {
    std::shared_lock<std::shared_mutex> lock(inner_->manager_mutex);
    return inner_->manager ? inner_->manager->failure_reason() : inner_->last_failure;
}

} // namespace atlantis
