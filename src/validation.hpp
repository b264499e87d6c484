// src/validation.hpp
// Internal configuration and size-limit checks.

#pragma once

#include "atlantis/config.hpp"
#include "atlantis/error.hpp"
#include "atlantis/types.hpp"
#include <string>

namespace atlantis {
namespace validation {

inline void validate_package_name(const std::string& package_name) {
    if (package_name.empty()) {
        throw AtlantisError::configuration("packageName is required");
    }
    if (package_name.size() > 256) {
        throw AtlantisError::configuration(
            "packageName must be at most 256 characters, got " + std::to_string(package_name.size()));
    }
}

inline void validate_transport(const Configuration& config) {
    if (config.direct_host().empty()) {
        throw AtlantisError::configuration("direct host is required");
    }
    if (config.direct_port() == 0) {
        throw AtlantisError::configuration("direct port must be 1-65535");
    }
    if (config.service_type().empty()) {
        throw AtlantisError::configuration("service type is required");
    }
    if (config.connect_timeout().count() <= 0) {
        throw AtlantisError::configuration("connect timeout must be positive");
    }
    if (config.send_timeout().count() <= 0) {
        throw AtlantisError::configuration("send timeout must be positive");
    }
    if (config.emulator_retry_delay().count() < 0) {
        throw AtlantisError::configuration("emulator retry delay must not be negative");
    }
    if (config.max_emulator_attempts() == 0) {
        throw AtlantisError::configuration("max emulator attempts must be at least 1");
    }
    if (config.max_pending_messages() == 0) {
        throw AtlantisError::configuration("max pending messages must be at least 1");
    }
    if (config.discovery_query_interval().count() <= 0) {
        throw AtlantisError::configuration("discovery query interval must be positive");
    }
}

// Bodies and framed payloads up to and including 50 MB pass whole.
inline bool check_package_size(size_t len) {
    return len <= MAX_PACKAGE_SIZE;
}

} // namespace validation
} // namespace atlantis
