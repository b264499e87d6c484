// include/atlantis/discovery.hpp
// Peer discovery interfaces and the hostname filter.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace atlantis {

// A resolved inspector instance.
struct DiscoveredPeer {
    std::string host;
    uint16_t port = 0;
    std::string name;
};

// Callbacks from a ServiceBrowser. They arrive on the browser's own thread.
class DiscoveryListener {
public:
    virtual ~DiscoveryListener() = default;

    virtual void on_service_found(const DiscoveredPeer& peer) = 0;
    virtual void on_service_lost(const std::string& name) = 0;
    virtual void on_discovery_started() {}
    virtual void on_discovery_stopped() {}
    virtual void on_discovery_error(int code, const std::string& message) = 0;
};

// Local-network browser for the inspector's service type. Failures are
// reported through the listener; nothing throws out of start()/stop().
class ServiceBrowser {
public:
    virtual ~ServiceBrowser() = default;

    // Begin browsing. The listener must outlive the browser or stop().
    virtual void start(DiscoveryListener& listener) = 0;

    // Stop browsing. No callbacks are delivered after this returns.
    virtual void stop() = 0;
};

// True if an advertised instance passes the optional hostname filter:
// case-insensitive containment, with a trailing dot on the filter ignored.
// Example: filter "mac-mini.local" accepts "Proxyman-mac-mini.local".
bool matches_host_filter(const std::string& service_name,
                         const std::optional<std::string>& host_filter);

} // namespace atlantis
