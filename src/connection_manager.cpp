// src/connection_manager.cpp
// Connection state machine: dial, send, retry, notify.

#include "connection_manager.hpp"
#include "log.hpp"

#include <utility>

namespace atlantis {

namespace {

const char* const DIRECT_FAILURE_REASON =
    "Could not connect to Proxyman. Make sure it's running on your Mac.";

} // namespace

ConnectionManager::ConnectionManager(Configuration config, PendingQueue<Message>& pending,
                                     ConnectionListener& events,
                                     std::unique_ptr<ServiceBrowser> browser)
    : config_(std::move(config)),
      mode_(config_.resolved_mode()),
      pending_(pending),
      events_(events),
      browser_(std::move(browser)),
      transport_(config_.send_timeout()) {}

ConnectionManager::~ConnectionManager() {
    stop();
}

void ConnectionManager::start() {
    if (started_.load()) return;

    // A worker stopped from its own callback is still unwinding.
    if (thread_.joinable()) {
        if (on_worker_thread()) {
            logger()->error("cannot restart the connection manager from its own callback");
            return;
        }
        thread_.join();
        worker_id_.store(std::thread::id());
    }
    if (started_.exchange(true)) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        mailbox_.clear();
        failure_reason_.reset();
    }
    cancel_.reset();
    attempts_ = 0;

    if (mode_ == ConnectionMode::Direct) {
        logger()->info("direct mode: connecting to {}:{}", config_.direct_host(), config_.direct_port());
        set_state(ConnectionState::Connecting);
        retry_at_ = std::chrono::steady_clock::now();
    } else {
        logger()->info("discovery mode: browsing for {}{}", config_.service_type(),
                       config_.host_name() ? " on " + *config_.host_name() : std::string());
        set_state(ConnectionState::Discovering);
        retry_at_.reset();
    }

    thread_ = std::thread(&ConnectionManager::run, this);

    if (mode_ == ConnectionMode::Discovery) {
        if (browser_) {
            browser_->start(*this);
        } else {
            logger()->error("discovery mode without a service browser");
        }
    }
}

void ConnectionManager::stop() {
    if (started_.exchange(false)) {
        // Browser first: its callbacks post into the mailbox.
        if (browser_) browser_->stop();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
            mailbox_.clear();
        }
        cv_.notify_one();
        cancel_.signal();
    }

    if (on_worker_thread()) {
        logger()->debug("stop requested from a listener callback, worker will exit");
        return;
    }
    if (!thread_.joinable()) return;

    thread_.join();
    worker_id_.store(std::thread::id());
    retry_at_.reset();
    attempts_ = 0;
    set_state(ConnectionState::Idle);
}

void ConnectionManager::send(Message message) {
    if (auto error = post(Outbound{std::move(message)})) {
        logger()->debug("dropping message: {}", error->message());
    }
}

void ConnectionManager::restart() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_reason_.reset();
    }
    if (auto error = post(Restart{})) {
        logger()->debug("ignoring restart: {}", error->message());
    }
}

TransportStats ConnectionManager::stats() const {
    TransportStats stats;
    stats.connect_attempts = connect_attempts_.load();
    stats.messages_sent = messages_sent_.load();
    stats.messages_dropped = messages_dropped_.load();
    return stats;
}

std::optional<std::string> ConnectionManager::failure_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_reason_;
}

bool ConnectionManager::on_worker_thread() const noexcept {
    return worker_id_.load() == std::this_thread::get_id();
}

// --- DiscoveryListener ---

void ConnectionManager::on_service_found(const DiscoveredPeer& peer) {
    if (auto error = post(PeerFound{peer})) {
        logger()->debug("ignoring peer {}: {}", peer.name, error->message());
    }
}

void ConnectionManager::on_service_lost(const std::string& name) {
    if (auto error = post(PeerLost{name})) {
        logger()->debug("ignoring loss of {}: {}", name, error->message());
    }
}

void ConnectionManager::on_discovery_error(int code, const std::string& message) {
    if (auto error = post(DiscoveryFailed{AtlantisError::discovery(code, message)})) {
        logger()->debug("ignoring discovery error {}: {}", code, error->message());
    }
}

// --- Worker ---

Status ConnectionManager::post(Command command) {
    bool was_empty;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || !started_.load()) {
            if (std::holds_alternative<Outbound>(command)) messages_dropped_++;
            return AtlantisError::closed();
        }
        was_empty = mailbox_.empty();
        if (mailbox_.size() >= MAX_MAILBOX_SIZE) {
            // Drop oldest
            if (std::holds_alternative<Outbound>(mailbox_.front())) messages_dropped_++;
            mailbox_.pop_front();
        }
        mailbox_.push_back(std::move(command));
    }
    if (was_empty) {
        cv_.notify_one();
    }
    return std::nullopt;
}

bool ConnectionManager::is_stopping() {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopping_;
}

void ConnectionManager::run() {
    worker_id_.store(std::this_thread::get_id());

    while (true) {
        std::deque<Command> local;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            auto ready = [this] { return !mailbox_.empty() || stopping_; };
            if (retry_at_) {
                cv_.wait_until(lock, *retry_at_, ready);
            } else {
                cv_.wait(lock, ready);
            }
            if (stopping_) break;
            std::swap(local, mailbox_);
        }

        for (auto& command : local) {
            // A listener may have stopped us from inside a callback.
            if (is_stopping()) break;
            dispatch(command);
        }
        if (is_stopping()) break;

        if (retry_at_ && std::chrono::steady_clock::now() >= *retry_at_) {
            retry_at_.reset();
            dial(config_.direct_host(), config_.direct_port());
        }
    }

    if (transport_.is_open()) {
        transport_.close_connection();
        if (state_.load() == ConnectionState::Connected) {
            logger()->info("disconnected from {}:{}", transport_.host(), transport_.port());
            set_state(ConnectionState::Disconnected);
            events_.on_disconnected();
        }
    }
    set_state(ConnectionState::Idle);
}

void ConnectionManager::dispatch(Command& command) {
    if (auto* out = std::get_if<Outbound>(&command)) {
        if (state_.load() != ConnectionState::Connected) {
            park(std::move(out->message));
            return;
        }
        if (auto error = transmit(out->message)) {
            pending_.put_back(std::move(out->message));
            connection_lost(*error);
        }
    } else if (auto* found = std::get_if<PeerFound>(&command)) {
        auto current = state_.load();
        if (mode_ != ConnectionMode::Discovery || current == ConnectionState::Connecting ||
            current == ConnectionState::Connected) {
            logger()->debug("ignoring peer {} while {}", found->peer.name, to_string(current));
            return;
        }
        logger()->info("found inspector {} at {}:{}", found->peer.name, found->peer.host, found->peer.port);
        dial(found->peer.host, found->peer.port);
    } else if (auto* lost = std::get_if<PeerLost>(&command)) {
        logger()->debug("inspector {} went away", lost->name);
    } else if (auto* failed = std::get_if<DiscoveryFailed>(&command)) {
        logger()->error("discovery error {}: {}", failed->error.code(), failed->error.message());
        events_.on_connection_failed("Discovery error: " + failed->error.message());
    } else if (std::holds_alternative<Restart>(command)) {
        if (state_.load() != ConnectionState::Failed) return;
        logger()->info("restarting direct connection attempts");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            failure_reason_.reset();
        }
        attempts_ = 0;
        set_state(ConnectionState::Connecting);
        retry_at_ = std::chrono::steady_clock::now();
    }
}

void ConnectionManager::dial(const std::string& host, uint16_t port) {
    set_state(ConnectionState::Connecting);
    connect_attempts_++;

    auto error = transport_.connect(host, port, config_.connect_timeout(), &cancel_);
    if (is_stopping()) return;
    if (error) {
        connect_failed(*error);
        return;
    }

    attempts_ = 0;
    set_state(ConnectionState::Connected);
    logger()->info("connected to inspector at {}:{}", host, port);
    events_.on_connected(host, port);
    if (is_stopping()) return;

    auto hello = Message::connection(config_.id(), ConnectionPackage(config_));
    if (auto send_error = transmit(hello)) {
        connection_lost(*send_error);
        return;
    }
    flush_pending();
}

void ConnectionManager::connect_failed(const AtlantisError& error) {
    if (mode_ == ConnectionMode::Direct) {
        attempts_++;
        if (attempts_ >= config_.max_emulator_attempts()) {
            logger()->error("giving up after {} attempts: {}", attempts_, error.message());
            {
                std::lock_guard<std::mutex> lock(mutex_);
                failure_reason_ = DIRECT_FAILURE_REASON;
            }
            set_state(ConnectionState::Failed);
            events_.on_connection_failed(DIRECT_FAILURE_REASON);
            return;
        }
        logger()->warn("{} (attempt {}/{}), retrying in {}ms", error.message(), attempts_,
                       config_.max_emulator_attempts(), config_.emulator_retry_delay().count());
        set_state(ConnectionState::Disconnected);
        retry_at_ = std::chrono::steady_clock::now() + config_.emulator_retry_delay();
        return;
    }

    logger()->error("{}", error.message());
    set_state(ConnectionState::Discovering);
    events_.on_connection_failed("Connection failed: " + error.message());
}

void ConnectionManager::connection_lost(const AtlantisError& error) {
    logger()->error("connection to {}:{} lost: {}", transport_.host(), transport_.port(), error.message());
    transport_.close_connection();
    set_state(ConnectionState::Disconnected);
    events_.on_disconnected();

    if (mode_ == ConnectionMode::Direct) {
        retry_at_ = std::chrono::steady_clock::now() + config_.emulator_retry_delay();
    } else {
        set_state(ConnectionState::Discovering);
    }
}

void ConnectionManager::flush_pending() {
    std::optional<AtlantisError> failure;
    size_t delivered = pending_.drain_into([this, &failure](const Message& message) {
        failure = transmit(message);
        return !failure.has_value();
    });
    if (delivered > 0) {
        logger()->debug("flushed {} pending messages", delivered);
    }
    if (failure) {
        connection_lost(*failure);
    }
}

void ConnectionManager::park(Message message) {
    size_t evicted = pending_.enqueue(std::move(message));
    if (evicted > 0) {
        messages_dropped_ += evicted;
        logger()->debug("pending queue full, dropped {} oldest message(s)", evicted);
    }
}

// Io errors are returned; oversize payloads are skipped here.
Status ConnectionManager::transmit(const Message& message) {
    auto payload = message.to_compressed_data();
    auto error = transport_.send_frame(payload.data(), payload.size());
    if (!error) {
        messages_sent_++;
        return std::nullopt;
    }
    if (error->kind() == ErrorKind::Serialization) {
        messages_dropped_++;
        logger()->warn("skipping {} message: {}", to_string(message.message_type()), error->message());
        return std::nullopt;
    }
    return error;
}

void ConnectionManager::set_state(ConnectionState state) {
    auto previous = state_.exchange(state);
    if (previous != state) {
        logger()->debug("connection state {} -> {}", to_string(previous), to_string(state));
    }
}

} // namespace atlantis
