// tests/transporter_test.cpp
// Transporter lifecycle, ordering and retry behaviour against a local
// inspector stand-in.

#include "atlantis/compression.hpp"
#include "atlantis/transporter.hpp"
#include "base64.hpp"
#include "framing.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace atlantis {
namespace {

using namespace std::chrono_literals;

// Polls `pred` until it holds or `timeout` passes.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

// Accepts connections on 127.0.0.1 and records each frame's envelope JSON.
class TestInspector {
public:
    TestInspector() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int reuse = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        EXPECT_EQ(::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        EXPECT_EQ(::listen(listen_fd_, 4), 0);

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread(&TestInspector::serve, this);
    }

    ~TestInspector() {
        running_ = false;
        if (thread_.joinable()) thread_.join();
        if (listen_fd_ >= 0) ::close(listen_fd_);
    }

    uint16_t port() const { return port_; }

    // Close the current client connection and stop reading from it.
    void drop_client() { drop_requested_ = true; }

    std::vector<std::string> messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    size_t connections() const { return connections_.load(); }

    bool wait_for_messages(size_t count, std::chrono::milliseconds timeout = 5000ms) {
        return eventually([&] { return messages().size() >= count; }, timeout);
    }

private:
    void serve() {
        int client = -1;
        framing::FrameDecoder decoder;
        std::vector<uint8_t> buf(64 * 1024);

        while (running_) {
            if (client >= 0 && drop_requested_.exchange(false)) {
                ::close(client);
                client = -1;
            }

            pollfd pfd{};
            pfd.fd = client >= 0 ? client : listen_fd_;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 20) <= 0) continue;

            if (client < 0) {
                client = ::accept(listen_fd_, nullptr, nullptr);
                if (client >= 0) {
                    connections_++;
                    decoder = framing::FrameDecoder();
                }
                continue;
            }

            ssize_t n = ::recv(client, buf.data(), buf.size(), 0);
            if (n <= 0) {
                ::close(client);
                client = -1;
                continue;
            }
            ASSERT_FALSE(decoder.feed(buf.data(), static_cast<size_t>(n)).has_value());
            while (auto frame = decoder.next()) {
                auto json = gzip::is_compressed(*frame) ? gzip::decompress(*frame) : frame;
                ASSERT_TRUE(json.has_value());
                std::lock_guard<std::mutex> lock(mutex_);
                messages_.emplace_back(json->begin(), json->end());
            }
        }
        if (client >= 0) ::close(client);
    }

    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
    std::atomic<bool> running_{true};
    std::atomic<bool> drop_requested_{false};
    std::atomic<size_t> connections_{0};
    std::mutex mutex_;
    std::vector<std::string> messages_;
};

// A loopback port with nothing listening on it.
uint16_t closed_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

class RecordingListener : public ConnectionListener {
public:
    void on_connected(const std::string& host, uint16_t port) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_++;
        last_host_ = host;
        last_port_ = port;
    }
    void on_disconnected() override {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnected_++;
    }
    void on_connection_failed(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.push_back(reason);
    }

    int connected() {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }
    int disconnected() {
        std::lock_guard<std::mutex> lock(mutex_);
        return disconnected_;
    }
    std::vector<std::string> failures() {
        std::lock_guard<std::mutex> lock(mutex_);
        return failures_;
    }
    uint16_t last_port() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_port_;
    }

private:
    std::mutex mutex_;
    int connected_ = 0;
    int disconnected_ = 0;
    std::vector<std::string> failures_;
    std::string last_host_;
    uint16_t last_port_ = 0;
};

// Stops the transporter from inside its callbacks.
class StoppingListener : public RecordingListener {
public:
    explicit StoppingListener(Transporter& transporter) : transporter_(transporter) {}

    void on_disconnected() override {
        RecordingListener::on_disconnected();
        transporter_.stop();
    }
    void on_connection_failed(const std::string& reason) override {
        RecordingListener::on_connection_failed(reason);
        transporter_.stop();
    }

private:
    Transporter& transporter_;
};

// Browser stand-in driven by the test.
struct FakeDiscovery {
    std::mutex mutex;
    DiscoveryListener* listener = nullptr;
    int starts = 0;

    void found(const std::string& host, uint16_t port, const std::string& name = "Proxyman-test.local") {
        std::lock_guard<std::mutex> lock(mutex);
        if (listener) listener->on_service_found(DiscoveredPeer{host, port, name});
    }
    void error(int code, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex);
        if (listener) listener->on_discovery_error(code, message);
    }
};

class FakeBrowser : public ServiceBrowser {
public:
    explicit FakeBrowser(std::shared_ptr<FakeDiscovery> discovery) : discovery_(std::move(discovery)) {}
    ~FakeBrowser() override { stop(); }

    void start(DiscoveryListener& listener) override {
        std::lock_guard<std::mutex> lock(discovery_->mutex);
        discovery_->listener = &listener;
        discovery_->starts++;
    }
    void stop() override {
        std::lock_guard<std::mutex> lock(discovery_->mutex);
        discovery_->listener = nullptr;
    }

private:
    std::shared_ptr<FakeDiscovery> discovery_;
};

DeviceInfo test_device() {
    DeviceInfo info;
    info.model = "Pixel 8";
    info.manufacturer = "Google";
    info.os_release = "14";
    return info;
}

Configuration discovery_config(size_t capacity = 50) {
    return Configuration::builder("com.example.app")
        .device_info(test_device())
        .mode(ConnectionMode::Discovery)
        .connect_timeout(1000ms)
        .max_pending_messages(capacity)
        .build();
}

Configuration direct_config(uint16_t port, uint32_t attempts = 5,
                            std::chrono::milliseconds delay = 20ms) {
    return Configuration::builder("com.example.app")
        .device_info(test_device())
        .mode(ConnectionMode::Direct)
        .direct_address("127.0.0.1", port)
        .connect_timeout(1000ms)
        .emulator_retry_delay(delay)
        .max_emulator_attempts(attempts)
        .build();
}

Message marker(const std::string& text) {
    // Content carries the marker so the wire order can be checked.
    return Message("com.example.app-Google_Pixel 8", MessageType::Traffic, base64::encode(text));
}

int64_t millis_since(std::chrono::steady_clock::time_point begin) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin)
        .count();
}

std::string content_of(const std::string& envelope) {
    auto start = envelope.find(R"("content":")");
    if (start == std::string::npos) return "";
    start += 11;
    auto end = envelope.find('"', start);
    auto decoded = base64::decode(envelope.substr(start, end - start));
    return decoded ? std::string(decoded->begin(), decoded->end()) : "";
}

bool is_connection_message(const std::string& envelope) {
    return envelope.find(R"("messageType":"connection")") != std::string::npos;
}

BrowserFactory fake_factory(std::shared_ptr<FakeDiscovery> discovery) {
    return [discovery](const Configuration&) { return std::make_unique<FakeBrowser>(discovery); };
}

// ==================== Lifecycle ====================

TEST(TransporterTest, InitialStateIsIdle) {
    Transporter transporter(fake_factory(std::make_shared<FakeDiscovery>()));
    EXPECT_EQ(transporter.state(), ConnectionState::Idle);
    EXPECT_FALSE(transporter.is_started());
    EXPECT_FALSE(transporter.is_connected());
}

TEST(TransporterTest, SendBeforeStartIsDropped) {
    Transporter transporter(fake_factory(std::make_shared<FakeDiscovery>()));
    transporter.send(marker("early"));
    EXPECT_EQ(transporter.pending_count(), 0u);
}

TEST(TransporterTest, StartIsIdempotent) {
    auto discovery = std::make_shared<FakeDiscovery>();
    Transporter transporter(fake_factory(discovery));

    transporter.start(discovery_config());
    transporter.start(discovery_config());

    EXPECT_TRUE(transporter.is_started());
    EXPECT_EQ(transporter.state(), ConnectionState::Discovering);
    EXPECT_EQ(discovery->starts, 1);
    transporter.stop();
}

TEST(TransporterTest, StopIsIdempotentAndClearsQueue) {
    auto discovery = std::make_shared<FakeDiscovery>();
    Transporter transporter(fake_factory(discovery));
    transporter.start(discovery_config());

    transporter.send(marker("one"));
    transporter.send(marker("two"));
    EXPECT_TRUE(eventually([&] { return transporter.pending_count() == 2; }));

    transporter.stop();
    transporter.stop();
    EXPECT_EQ(transporter.pending_count(), 0u);
    EXPECT_EQ(transporter.state(), ConnectionState::Idle);
    EXPECT_FALSE(transporter.is_started());

    transporter.send(marker("late"));
    EXPECT_EQ(transporter.pending_count(), 0u);
}

// ==================== Ordering ====================

TEST(TransporterTest, QueuedMessagesPrecedeLaterSends) {
    TestInspector inspector;
    auto discovery = std::make_shared<FakeDiscovery>();
    RecordingListener listener;
    Transporter transporter(fake_factory(discovery));
    transporter.set_connection_listener(&listener);
    transporter.start(discovery_config());

    transporter.send(marker("queued-1"));
    transporter.send(marker("queued-2"));
    transporter.send(marker("queued-3"));
    ASSERT_TRUE(eventually([&] { return transporter.pending_count() == 3; }));

    discovery->found("127.0.0.1", inspector.port());
    transporter.send(marker("live-1"));
    transporter.send(marker("live-2"));

    ASSERT_TRUE(inspector.wait_for_messages(6));
    auto messages = inspector.messages();

    EXPECT_TRUE(is_connection_message(messages[0]));
    EXPECT_EQ(content_of(messages[1]), "queued-1");
    EXPECT_EQ(content_of(messages[2]), "queued-2");
    EXPECT_EQ(content_of(messages[3]), "queued-3");
    EXPECT_EQ(content_of(messages[4]), "live-1");
    EXPECT_EQ(content_of(messages[5]), "live-2");

    EXPECT_TRUE(transporter.is_connected());
    EXPECT_EQ(listener.connected(), 1);
    EXPECT_EQ(listener.last_port(), inspector.port());
    EXPECT_EQ(transporter.pending_count(), 0u);

    transporter.stop();
    EXPECT_EQ(listener.disconnected(), 1);
    transporter.set_connection_listener(nullptr);
}

TEST(TransporterTest, QueueOverflowDropsOldest) {
    TestInspector inspector;
    auto discovery = std::make_shared<FakeDiscovery>();
    Transporter transporter(fake_factory(discovery));
    transporter.start(discovery_config(3));

    for (int i = 1; i <= 5; i++) transporter.send(marker("m" + std::to_string(i)));
    ASSERT_TRUE(eventually([&] { return transporter.stats().messages_dropped == 2; }));
    EXPECT_EQ(transporter.pending_count(), 3u);

    discovery->found("127.0.0.1", inspector.port());
    ASSERT_TRUE(inspector.wait_for_messages(4));
    auto messages = inspector.messages();
    EXPECT_EQ(content_of(messages[1]), "m3");
    EXPECT_EQ(content_of(messages[2]), "m4");
    EXPECT_EQ(content_of(messages[3]), "m5");
    transporter.stop();
}

TEST(TransporterTest, PeerResultsIgnoredWhileConnected) {
    TestInspector inspector;
    TestInspector other;
    auto discovery = std::make_shared<FakeDiscovery>();
    Transporter transporter(fake_factory(discovery));
    transporter.start(discovery_config());

    discovery->found("127.0.0.1", inspector.port());
    ASSERT_TRUE(eventually([&] { return transporter.is_connected(); }));

    discovery->found("127.0.0.1", other.port(), "Proxyman-other.local");
    transporter.send(marker("after"));
    ASSERT_TRUE(inspector.wait_for_messages(2));
    EXPECT_EQ(other.connections(), 0u);
    EXPECT_EQ(transporter.stats().connect_attempts, 1u);
    transporter.stop();
}

// ==================== Failures ====================

TEST(TransporterTest, DirectModeGivesUpAfterAttemptBudget) {
    RecordingListener listener;
    Transporter transporter(fake_factory(std::make_shared<FakeDiscovery>()));
    transporter.set_connection_listener(&listener);
    transporter.start(direct_config(closed_port(), 5, 20ms));

    ASSERT_TRUE(eventually([&] { return !listener.failures().empty(); }));
    EXPECT_EQ(transporter.state(), ConnectionState::Failed);
    EXPECT_EQ(transporter.failure_reason().value_or(""),
              "Could not connect to Proxyman. Make sure it's running on your Mac.");

    // No sixth attempt.
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(transporter.stats().connect_attempts, 5u);
    auto failures = listener.failures();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0], "Could not connect to Proxyman. Make sure it's running on your Mac.");

    // A new start() re-arms the budget.
    transporter.start(direct_config(closed_port(), 5, 20ms));
    EXPECT_FALSE(transporter.failure_reason().has_value());
    ASSERT_TRUE(eventually([&] { return listener.failures().size() == 2; }));
    EXPECT_EQ(transporter.stats().connect_attempts, 10u);

    transporter.stop();
    transporter.set_connection_listener(nullptr);
}

TEST(TransporterTest, FailureReasonOutlivesStopUntilNextStart) {
    Transporter transporter(fake_factory(std::make_shared<FakeDiscovery>()));
    EXPECT_FALSE(transporter.failure_reason().has_value());

    transporter.start(direct_config(closed_port(), 2, 20ms));
    ASSERT_TRUE(eventually([&] { return transporter.state() == ConnectionState::Failed; }));
    transporter.stop();
    EXPECT_EQ(transporter.failure_reason().value_or(""),
              "Could not connect to Proxyman. Make sure it's running on your Mac.");

    transporter.start(discovery_config());
    EXPECT_FALSE(transporter.failure_reason().has_value());
    transporter.stop();
    EXPECT_FALSE(transporter.failure_reason().has_value());
}

TEST(TransporterTest, DirectModeConnectsAndSendsConnectionMessage) {
    TestInspector inspector;
    RecordingListener listener;
    Transporter transporter;
    transporter.set_connection_listener(&listener);
    transporter.start(direct_config(inspector.port()));

    ASSERT_TRUE(inspector.wait_for_messages(1));
    EXPECT_TRUE(is_connection_message(inspector.messages()[0]));
    EXPECT_EQ(listener.connected(), 1);

    transporter.stop();
    transporter.set_connection_listener(nullptr);
}

TEST(TransporterTest, DiscoveryConnectFailureIsReported) {
    auto discovery = std::make_shared<FakeDiscovery>();
    RecordingListener listener;
    Transporter transporter(fake_factory(discovery));
    transporter.set_connection_listener(&listener);
    transporter.start(discovery_config());

    discovery->found("127.0.0.1", closed_port());
    ASSERT_TRUE(eventually([&] { return !listener.failures().empty(); }));
    EXPECT_EQ(listener.failures()[0].rfind("Connection failed: ", 0), 0u);
    EXPECT_TRUE(eventually([&] { return transporter.state() == ConnectionState::Discovering; }));

    transporter.stop();
    transporter.set_connection_listener(nullptr);
}

TEST(TransporterTest, DiscoveryErrorIsReported) {
    auto discovery = std::make_shared<FakeDiscovery>();
    RecordingListener listener;
    Transporter transporter(fake_factory(discovery));
    transporter.set_connection_listener(&listener);
    transporter.start(discovery_config());

    discovery->error(3, "socket unavailable");
    ASSERT_TRUE(eventually([&] { return !listener.failures().empty(); }));
    EXPECT_EQ(listener.failures()[0], "Discovery error: socket unavailable");
    EXPECT_EQ(transporter.state(), ConnectionState::Discovering);

    transporter.stop();
    transporter.set_connection_listener(nullptr);
}

TEST(TransporterTest, LostConnectionRequeuesAndReconnects) {
    TestInspector inspector;
    auto discovery = std::make_shared<FakeDiscovery>();
    RecordingListener listener;
    Transporter transporter(fake_factory(discovery));
    transporter.set_connection_listener(&listener);
    transporter.start(discovery_config());

    discovery->found("127.0.0.1", inspector.port());
    ASSERT_TRUE(inspector.wait_for_messages(1));

    inspector.drop_client();
    // Writes into a reset connection fail within a few attempts.
    ASSERT_TRUE(eventually([&] {
        transporter.send(marker("nudge"));
        return listener.disconnected() > 0;
    }));
    EXPECT_TRUE(eventually([&] { return transporter.state() == ConnectionState::Discovering; }));
    EXPECT_GE(transporter.pending_count(), 1u);

    discovery->found("127.0.0.1", inspector.port());
    EXPECT_TRUE(eventually([&] { return listener.connected() == 2; }));
    EXPECT_TRUE(eventually([&] { return transporter.pending_count() == 0; }));

    transporter.stop();
    transporter.set_connection_listener(nullptr);
}

// ==================== Stop ====================

TEST(TransporterTest, StopCancelsPendingRetry) {
    Transporter transporter(fake_factory(std::make_shared<FakeDiscovery>()));
    transporter.start(direct_config(closed_port(), 5, 15000ms));
    ASSERT_TRUE(eventually([&] {
        return transporter.stats().connect_attempts == 1 && transporter.state() == ConnectionState::Disconnected;
    }));

    auto begin = std::chrono::steady_clock::now();
    transporter.stop();
    EXPECT_LT(millis_since(begin), 1000);
    EXPECT_EQ(transporter.stats().connect_attempts, 1u);
    EXPECT_EQ(transporter.state(), ConnectionState::Idle);
}

TEST(TransporterTest, StopCancelsInFlightConnect) {
    // TEST-NET-1: never answers, so the connect sits in its timeout (or
    // fails at once where there is no route, leaving a retry pending).
    auto config = Configuration::builder("com.example.app")
                      .device_info(test_device())
                      .mode(ConnectionMode::Direct)
                      .direct_address("192.0.2.1", 10909)
                      .connect_timeout(10000ms)
                      .emulator_retry_delay(15000ms)
                      .build();
    Transporter transporter(fake_factory(std::make_shared<FakeDiscovery>()));
    transporter.start(config);
    ASSERT_TRUE(eventually([&] { return transporter.stats().connect_attempts >= 1; }));
    std::this_thread::sleep_for(50ms);

    auto begin = std::chrono::steady_clock::now();
    transporter.stop();
    EXPECT_LT(millis_since(begin), 1000);
    EXPECT_FALSE(transporter.is_started());
}

TEST(TransporterTest, StopFromFailureCallback) {
    Transporter transporter(fake_factory(std::make_shared<FakeDiscovery>()));
    StoppingListener listener(transporter);
    transporter.set_connection_listener(&listener);

    transporter.start(direct_config(closed_port(), 1, 20ms));
    ASSERT_TRUE(eventually([&] { return !listener.failures().empty(); }));
    EXPECT_TRUE(eventually([&] { return !transporter.is_started(); }));
    EXPECT_EQ(transporter.state(), ConnectionState::Idle);
    EXPECT_TRUE(eventually([&] {
        return transporter.failure_reason().value_or("") ==
               "Could not connect to Proxyman. Make sure it's running on your Mac.";
    }));

    // The retired session is reclaimed and a new one runs normally.
    transporter.start(direct_config(closed_port(), 1, 20ms));
    ASSERT_TRUE(eventually([&] { return listener.failures().size() == 2; }));
    EXPECT_TRUE(eventually([&] { return !transporter.is_started(); }));

    transporter.set_connection_listener(nullptr);
    transporter.stop();
}

TEST(TransporterTest, StopFromDisconnectCallbackWhileStopping) {
    TestInspector inspector;
    auto discovery = std::make_shared<FakeDiscovery>();
    Transporter transporter(fake_factory(discovery));
    StoppingListener listener(transporter);
    transporter.set_connection_listener(&listener);
    transporter.start(discovery_config());

    discovery->found("127.0.0.1", inspector.port());
    ASSERT_TRUE(eventually([&] { return listener.connected() == 1; }));

    // on_disconnected re-enters stop() while this thread waits for the worker.
    auto begin = std::chrono::steady_clock::now();
    transporter.stop();
    EXPECT_LT(millis_since(begin), 1000);
    EXPECT_EQ(listener.disconnected(), 1);
    EXPECT_FALSE(transporter.is_started());

    transporter.set_connection_listener(nullptr);
}

TEST(TransporterTest, StopFromDisconnectCallbackAfterLostConnection) {
    TestInspector inspector;
    auto discovery = std::make_shared<FakeDiscovery>();
    Transporter transporter(fake_factory(discovery));
    StoppingListener listener(transporter);
    transporter.set_connection_listener(&listener);
    transporter.start(discovery_config());

    discovery->found("127.0.0.1", inspector.port());
    ASSERT_TRUE(inspector.wait_for_messages(1));

    inspector.drop_client();
    ASSERT_TRUE(eventually([&] {
        transporter.send(marker("nudge"));
        return listener.disconnected() > 0;
    }));
    EXPECT_TRUE(eventually([&] { return !transporter.is_started(); }));
    EXPECT_EQ(transporter.state(), ConnectionState::Idle);
    EXPECT_TRUE(eventually([&] { return transporter.pending_count() == 0; }));

    transporter.set_connection_listener(nullptr);
    transporter.stop();
}

// ==================== Listener slot ====================

TEST(TransporterTest, ReplacingListenerDropsPrevious) {
    TestInspector inspector;
    auto discovery = std::make_shared<FakeDiscovery>();
    RecordingListener first;
    RecordingListener second;
    Transporter transporter(fake_factory(discovery));
    transporter.set_connection_listener(&first);
    transporter.set_connection_listener(&second);
    transporter.start(discovery_config());

    discovery->found("127.0.0.1", inspector.port());
    ASSERT_TRUE(eventually([&] { return second.connected() == 1; }));
    EXPECT_EQ(first.connected(), 0);

    transporter.set_connection_listener(nullptr);
    transporter.stop();
    EXPECT_EQ(second.disconnected(), 0);
}

TEST(TransporterTest, ConcurrentSendersAreAllDelivered) {
    TestInspector inspector;
    auto discovery = std::make_shared<FakeDiscovery>();
    Transporter transporter(fake_factory(discovery));
    transporter.start(discovery_config());
    discovery->found("127.0.0.1", inspector.port());
    ASSERT_TRUE(eventually([&] { return transporter.is_connected(); }));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&transporter, t] {
            for (int i = 0; i < 25; i++) {
                transporter.send(marker("t" + std::to_string(t) + "-" + std::to_string(i)));
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_TRUE(inspector.wait_for_messages(101));
    EXPECT_EQ(transporter.stats().messages_sent, 101u);
    transporter.stop();
}

} // namespace
} // namespace atlantis
