// include/atlantis/types.hpp
// Core enums and wire constants.

#pragma once

#include <cstddef>
#include <cstdint>

namespace atlantis {

// Must match the version the desktop inspector expects.
static constexpr const char* BUILD_VERSION = "1.0.0";

// Largest body or framed payload forwarded whole (50 MB).
static constexpr size_t MAX_PACKAGE_SIZE = 52428800;

// Envelope type.
enum class MessageType : uint8_t {
    Connection = 0,  // First message: project and device metadata
    Traffic    = 1,  // Request/response log
    WebSocket  = 2,  // WebSocket send/receive/close
};

enum class PackageType : uint8_t {
    Http      = 0,
    WebSocket = 1,
};

enum class WebsocketMessageType : uint8_t {
    PingPong         = 0,
    Send             = 1,
    Receive          = 2,
    SendCloseMessage = 3,
};

// Peer resolution strategy. Auto defers to the device detection.
enum class ConnectionMode : uint8_t {
    Auto      = 0,
    Direct    = 1,
    Discovery = 2,
};

enum class ConnectionState : uint8_t {
    Idle         = 0,
    Discovering  = 1,
    Connecting   = 2,
    Connected    = 3,
    Disconnected = 4,
    Failed       = 5,
};

inline const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::Connection: return "connection";
        case MessageType::Traffic:    return "traffic";
        case MessageType::WebSocket:  return "websocket";
    }
    return "traffic";
}

inline const char* to_string(PackageType type) {
    return type == PackageType::WebSocket ? "websocket" : "http";
}

inline const char* to_string(WebsocketMessageType type) {
    switch (type) {
        case WebsocketMessageType::PingPong:         return "pingPong";
        case WebsocketMessageType::Send:             return "send";
        case WebsocketMessageType::Receive:          return "receive";
        case WebsocketMessageType::SendCloseMessage: return "sendCloseMessage";
    }
    return "send";
}

inline const char* to_string(ConnectionMode mode) {
    switch (mode) {
        case ConnectionMode::Auto:      return "auto";
        case ConnectionMode::Direct:    return "direct";
        case ConnectionMode::Discovery: return "discovery";
    }
    return "auto";
}

inline const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle:         return "idle";
        case ConnectionState::Discovering:  return "discovering";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Failed:       return "failed";
    }
    return "idle";
}

} // namespace atlantis
