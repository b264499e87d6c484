// src/mdns_browser.hpp
// DNS-SD browser over multicast DNS on a POSIX UDP socket, one receive thread.

#pragma once

#include "atlantis/discovery.hpp"
#include "dns_message.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace atlantis {

class MdnsServiceBrowser : public ServiceBrowser {
public:
    MdnsServiceBrowser(std::string service_type, std::optional<std::string> host_filter,
                       std::chrono::milliseconds query_interval);
    ~MdnsServiceBrowser() override;

    MdnsServiceBrowser(const MdnsServiceBrowser&) = delete;
    MdnsServiceBrowser& operator=(const MdnsServiceBrowser&) = delete;

    void start(DiscoveryListener& listener) override;
    void stop() override;

    struct BrowseEvents {
        std::vector<DiscoveredPeer> found;
        std::vector<std::string> lost;
    };

    // Fold one received packet into the browse state. Returns instances
    // resolved by it and instances withdrawn (TTL 0). `sender` stands in for
    // a missing A record. The receive thread dispatches the result.
    BrowseEvents handle_packet(const dns::Packet& packet, const std::string& sender,
                               std::chrono::steady_clock::time_point now);

    // Forget instances not heard from within three query intervals and
    // return their names.
    std::vector<std::string> expire(std::chrono::steady_clock::time_point now);

private:
    struct Instance {
        std::string label;        // advertised instance name
        dns::Name full_name;      // <label>.<service domain>
        std::optional<dns::Name> target;
        uint16_t port = 0;
        std::string address;
        std::chrono::steady_clock::time_point last_seen;
    };

    void run();
    // One query per question. Returns the last send errno, or 0.
    int send_queries(int fd, const std::vector<dns::Question>& questions);
    std::vector<dns::Question> pending_resolution() const;

    std::string service_type_;
    dns::Name service_domain_;
    std::optional<std::string> host_filter_;
    std::chrono::milliseconds query_interval_;

    DiscoveryListener* listener_ = nullptr;
    std::atomic<bool> running_{false};
    std::thread thread_;
    CancelPipe cancel_;
    uint16_t query_id_ = 0;

    // Keyed by dns::to_key(full_name).
    mutable std::mutex mutex_;
    std::map<std::string, Instance> instances_;
    std::map<std::string, std::string> addresses_;  // host key -> address
};

} // namespace atlantis
