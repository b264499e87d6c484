// examples/sample.cpp
// Streams a few captured exchanges and a WebSocket session to Proxyman.
//
// Start Proxyman (or ./build/atlantis_inspector), then:
//
//   cmake -B build -DATLANTIS_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/atlantis_sample
//
// Connect to a fixed address instead of browsing:
//
//   ATLANTIS_DIRECT=127.0.0.1:10909 ./build/atlantis_sample

#include "atlantis/atlantis.hpp"
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace {

class PrintingListener : public atlantis::ConnectionListener {
public:
    void on_connected(const std::string& host, uint16_t port) override {
        std::cout << "  connected to " << host << ":" << port << std::endl;
    }
    void on_disconnected() override {
        std::cout << "  disconnected" << std::endl;
    }
    void on_connection_failed(const std::string& reason) override {
        std::cerr << "  !! " << reason << std::endl;
    }
};

class PrintingDelegate : public atlantis::TrafficDelegate {
public:
    void on_traffic_captured(const atlantis::TrafficPackage& package) override {
        std::cout << "  -> " << package.request().method << " " << package.request().url << std::endl;
    }
    void on_websocket_message_captured(const atlantis::TrafficPackage& package) override {
        std::cout << "  -> websocket frame on " << package.id() << std::endl;
    }
};

atlantis::HttpExchange exchange(const std::string& method, const std::string& url, int status,
                                const std::string& body) {
    atlantis::HttpExchange result;
    result.start_at = atlantis::now_seconds();
    result.request = atlantis::Request::make(url, method, {{"Accept", "application/json"}});
    result.response = atlantis::Response::make(status, {{"Content-Type", "application/json"}});
    result.response_body.assign(body.begin(), body.end());
    return result;
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::debug);

    try {
        auto builder = atlantis::Configuration::builder("com.example.sample");
        builder.project_name("Atlantis Sample").device_name("Sample device");
        if (const char* direct = std::getenv("ATLANTIS_DIRECT")) {
            std::string address = direct;
            auto colon = address.rfind(':');
            uint16_t port = 10909;
            if (colon != std::string::npos) {
                port = static_cast<uint16_t>(std::stoi(address.substr(colon + 1)));
                address = address.substr(0, colon);
            }
            builder.mode(atlantis::ConnectionMode::Direct).direct_address(address, port);
        } else {
            builder.mode(atlantis::ConnectionMode::Discovery);
        }

        PrintingListener listener;
        PrintingDelegate delegate;

        auto capture = atlantis::Atlantis::create(builder.build());
        capture->set_connection_listener(&listener);
        capture->set_delegate(&delegate);
        capture->start();

        // Captured before the connection is up: these wait in the queue.
        capture->capture_http(exchange("GET", "https://api.example.com/users", 200, R"([{"id":1}])"));
        capture->capture_http(exchange("POST", "https://api.example.com/login", 401,
                                        R"({"error":"bad credentials"})"));

        auto ws = atlantis::Atlantis::new_connection_id();
        auto ws_request = atlantis::Request::make("wss://echo.example.com/socket", "GET",
                                                  {{"Upgrade", "websocket"}});
        capture->on_websocket_connecting(ws, ws_request);
        capture->on_websocket_open(ws, ws_request,
                                    atlantis::Response::make(101, {{"Upgrade", "websocket"}}));
        capture->on_websocket_send_text(ws, R"({"type":"subscribe","channel":"prices"})");
        capture->on_websocket_receive_text(ws, R"({"type":"price","value":42.5})");
        capture->on_websocket_receive_binary(ws, {0xDE, 0xAD, 0xBE, 0xEF});
        capture->on_websocket_closing(ws, 1000, std::string("done"));
        capture->on_websocket_closed(ws, 1000, std::string("done"));

        std::this_thread::sleep_for(std::chrono::seconds(5));

        capture->set_connection_listener(nullptr);
        capture->stop();
        std::cout << "Sample finished." << std::endl;

    } catch (const atlantis::AtlantisError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
