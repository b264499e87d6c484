// examples/inspector.cpp
// Minimal stand-in for the desktop inspector: accepts one agent at a time
// and prints every envelope it receives.
//
//   ./build/atlantis_inspector            # listens on 0.0.0.0:10909
//   ./build/atlantis_inspector 12000      # custom port
//
// Pair with ATLANTIS_DIRECT=127.0.0.1:10909 ./build/atlantis_sample

#include "atlantis/compression.hpp"
#include "base64.hpp"
#include "framing.hpp"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

// Value of a top-level string field in the envelope JSON.
std::string field(const std::string& json, const std::string& name) {
    std::string key = "\"" + name + "\":\"";
    auto start = json.find(key);
    if (start == std::string::npos) return "";
    start += key.size();
    auto end = json.find('"', start);
    return end == std::string::npos ? "" : json.substr(start, end - start);
}

void print_envelope(const std::vector<uint8_t>& frame) {
    auto json = atlantis::gzip::is_compressed(frame) ? atlantis::gzip::decompress(frame)
                                                     : std::optional<std::vector<uint8_t>>(frame);
    if (!json) {
        spdlog::warn("dropping frame of {} bytes: gzip inflate failed", frame.size());
        return;
    }

    std::string envelope(json->begin(), json->end());
    std::cout << "<- " << field(envelope, "messageType") << " from " << field(envelope, "id") << std::endl;

    auto content = field(envelope, "content");
    if (content.empty()) return;
    auto decoded = atlantis::base64::decode(content);
    if (!decoded) {
        spdlog::warn("content is not valid base64");
        return;
    }
    std::cout << "   " << std::string(decoded->begin(), decoded->end()) << std::endl;
}

void serve(int client) {
    atlantis::framing::FrameDecoder decoder;
    std::vector<uint8_t> buf(64 * 1024);

    while (true) {
        ssize_t n = ::recv(client, buf.data(), buf.size(), 0);
        if (n == 0) {
            spdlog::info("agent disconnected");
            return;
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::error("recv failed: {}", std::strerror(errno));
            return;
        }
        if (auto error = decoder.feed(buf.data(), static_cast<size_t>(n))) {
            spdlog::error("bad frame: {}", error->what());
            return;
        }
        while (auto frame = decoder.next()) {
            print_envelope(*frame);
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    uint16_t port = 10909;
    if (argc > 1) port = static_cast<uint16_t>(std::atoi(argv[1]));

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        spdlog::critical("socket failed: {}", std::strerror(errno));
        return 1;
    }
    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd, 1) != 0) {
        spdlog::critical("cannot listen on port {}: {}", port, std::strerror(errno));
        ::close(fd);
        return 1;
    }
    spdlog::info("inspector listening on 0.0.0.0:{}", port);

    while (true) {
        sockaddr_in peer{};
        socklen_t len = sizeof(peer);
        int client = ::accept(fd, reinterpret_cast<sockaddr*>(&peer), &len);
        if (client < 0) {
            if (errno == EINTR) continue;
            spdlog::error("accept failed: {}", std::strerror(errno));
            break;
        }
        char host[INET_ADDRSTRLEN] = {};
        ::inet_ntop(AF_INET, &peer.sin_addr, host, sizeof(host));
        spdlog::info("agent connected from {}:{}", host, ntohs(peer.sin_port));
        serve(client);
        ::close(client);
    }

    ::close(fd);
    return 0;
}
