// src/config.cpp
// Configuration builder and presets.

#include "atlantis/config.hpp"
#include "validation.hpp"

namespace atlantis {

// --- Configuration presets ---

ConfigurationBuilder Configuration::builder(const std::string& package_name) {
    return ConfigurationBuilder(package_name);
}

Configuration Configuration::defaults(const std::string& package_name) {
    return Configuration::builder(package_name).build();
}

Configuration Configuration::emulator(const std::string& package_name) {
    return Configuration::builder(package_name)
        .mode(ConnectionMode::Direct)
        .build();
}

ConnectionMode Configuration::resolved_mode() const {
    if (mode_ != ConnectionMode::Auto) return mode_;
    return is_emulator(device_info_) ? ConnectionMode::Direct : ConnectionMode::Discovery;
}

// --- ConfigurationBuilder ---

ConfigurationBuilder::ConfigurationBuilder(const std::string& package_name)
    : package_name_(package_name) {}

ConfigurationBuilder& ConfigurationBuilder::project_name(std::string name) {
    config_.project_name_ = std::move(name);
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::device_name(std::string name) {
    config_.device_name_ = std::move(name);
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::host_name(std::string host) {
    config_.host_name_ = std::move(host);
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::app_icon(std::string base64_png) {
    config_.app_icon_ = std::move(base64_png);
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::device_info(DeviceInfo info) {
    config_.device_info_ = std::move(info);
    has_device_info_ = true;
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::mode(ConnectionMode mode) {
    config_.mode_ = mode;
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::direct_address(std::string host, uint16_t port) {
    config_.direct_host_ = std::move(host);
    config_.direct_port_ = port;
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::service_type(std::string type) {
    config_.service_type_ = std::move(type);
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::connect_timeout(std::chrono::milliseconds timeout) {
    config_.connect_timeout_ = timeout;
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::send_timeout(std::chrono::milliseconds timeout) {
    config_.send_timeout_ = timeout;
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::emulator_retry_delay(std::chrono::milliseconds delay) {
    config_.emulator_retry_delay_ = delay;
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::max_emulator_attempts(uint32_t attempts) {
    config_.max_emulator_attempts_ = attempts;
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::max_pending_messages(size_t capacity) {
    config_.max_pending_messages_ = capacity;
    return *this;
}

ConfigurationBuilder& ConfigurationBuilder::discovery_query_interval(std::chrono::milliseconds interval) {
    config_.discovery_query_interval_ = interval;
    return *this;
}

Configuration ConfigurationBuilder::build() const {
    validation::validate_package_name(package_name_);

    Configuration result = config_;
    result.package_name_ = package_name_;
    if (!has_device_info_) {
        result.device_info_ = DeviceInfo::current();
    }
    if (result.project_name_.empty()) {
        result.project_name_ = package_name_;
    }
    if (result.device_name_.empty()) {
        result.device_name_ = result.device_info_.model;
    }
    result.id_ = package_name_ + "-" + result.device_info_.manufacturer
               + "_" + result.device_info_.model;

    validation::validate_transport(result);
    return result;
}

} // namespace atlantis
