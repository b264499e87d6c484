// include/atlantis/config.hpp
// Session configuration with builder pattern and presets.

#pragma once

#include "device.hpp"
#include "error.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace atlantis {

class ConfigurationBuilder;

// Identity of one capture session plus transport tunables. Immutable once
// built; held for the lifetime of the session.
class Configuration {
public:
    static ConfigurationBuilder builder(const std::string& package_name);

    // Presets: detected mode, and forced direct (emulator) mode.
    static Configuration defaults(const std::string& package_name);
    static Configuration emulator(const std::string& package_name);

    // Session id: "<package>-<manufacturer>_<model>".
    const std::string& id() const noexcept { return id_; }
    const std::string& project_name() const noexcept { return project_name_; }
    const std::string& device_name() const noexcept { return device_name_; }
    const std::string& package_name() const noexcept { return package_name_; }
    const std::optional<std::string>& host_name() const noexcept { return host_name_; }
    const std::optional<std::string>& app_icon() const noexcept { return app_icon_; }
    const DeviceInfo& device_info() const noexcept { return device_info_; }

    ConnectionMode mode() const noexcept { return mode_; }
    const std::string& direct_host() const noexcept { return direct_host_; }
    uint16_t direct_port() const noexcept { return direct_port_; }
    const std::string& service_type() const noexcept { return service_type_; }
    std::chrono::milliseconds connect_timeout() const noexcept { return connect_timeout_; }
    std::chrono::milliseconds send_timeout() const noexcept { return send_timeout_; }
    std::chrono::milliseconds emulator_retry_delay() const noexcept { return emulator_retry_delay_; }
    uint32_t max_emulator_attempts() const noexcept { return max_emulator_attempts_; }
    size_t max_pending_messages() const noexcept { return max_pending_messages_; }
    std::chrono::milliseconds discovery_query_interval() const noexcept { return discovery_query_interval_; }

    // Mode after resolving Auto against the device detection.
    ConnectionMode resolved_mode() const;

private:
    friend class ConfigurationBuilder;

    std::string id_;
    std::string project_name_;
    std::string device_name_;
    std::string package_name_;
    std::optional<std::string> host_name_;
    std::optional<std::string> app_icon_;
    DeviceInfo device_info_;

    ConnectionMode mode_ = ConnectionMode::Auto;
    std::string direct_host_ = "10.0.2.2";
    uint16_t direct_port_ = 10909;
    std::string service_type_ = "_Proxyman._tcp.";
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds send_timeout_{30000};
    std::chrono::milliseconds emulator_retry_delay_{15000};
    uint32_t max_emulator_attempts_ = 5;
    size_t max_pending_messages_ = 50;
    std::chrono::milliseconds discovery_query_interval_{5000};
};

// Fluent builder for Configuration.
class ConfigurationBuilder {
public:
    explicit ConfigurationBuilder(const std::string& package_name);

    ConfigurationBuilder& project_name(std::string name);
    ConfigurationBuilder& device_name(std::string name);
    ConfigurationBuilder& host_name(std::string host);
    ConfigurationBuilder& app_icon(std::string base64_png);
    ConfigurationBuilder& device_info(DeviceInfo info);
    ConfigurationBuilder& mode(ConnectionMode mode);
    ConfigurationBuilder& direct_address(std::string host, uint16_t port);
    ConfigurationBuilder& service_type(std::string type);
    ConfigurationBuilder& connect_timeout(std::chrono::milliseconds timeout);
    ConfigurationBuilder& send_timeout(std::chrono::milliseconds timeout);
    ConfigurationBuilder& emulator_retry_delay(std::chrono::milliseconds delay);
    ConfigurationBuilder& max_emulator_attempts(uint32_t attempts);
    ConfigurationBuilder& max_pending_messages(size_t capacity);
    ConfigurationBuilder& discovery_query_interval(std::chrono::milliseconds interval);

    // Build the config. Throws AtlantisError on invalid values.
    Configuration build() const;

private:
    std::string package_name_;
    bool has_device_info_ = false;
    Configuration config_;
};

} // namespace atlantis
