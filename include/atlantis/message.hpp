// include/atlantis/message.hpp
// Wire envelope for everything sent to the inspector.

#pragma once

#include "packages.hpp"
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace atlantis {

// Envelope: session id, type, Base64 of the inner JSON, build version.
// Immutable once built.
class Message {
public:
    Message(std::string id, MessageType type, std::optional<std::string> content,
            std::string build_version = BUILD_VERSION);

    static Message connection(const std::string& id, const ConnectionPackage& package);
    static Message traffic(const std::string& id, const TrafficPackage& package);
    static Message websocket(const std::string& id, const TrafficPackage& package);

    const std::string& id() const noexcept { return id_; }
    MessageType message_type() const noexcept { return message_type_; }
    const std::optional<std::string>& content() const noexcept { return content_; }
    const std::string& build_version() const noexcept { return build_version_; }

    // UTF-8 JSON of the envelope. "content" is omitted when absent.
    std::vector<uint8_t> to_json() const;

    // GZIP of to_json(), or the raw JSON when compression fails.
    std::vector<uint8_t> to_compressed_data() const;

private:
    std::string id_;
    MessageType message_type_;
    std::optional<std::string> content_;
    std::string build_version_;
};

} // namespace atlantis
