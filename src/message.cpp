// src/message.cpp
// Message envelope construction and encoding.

#include "atlantis/message.hpp"
#include "atlantis/compression.hpp"
#include "base64.hpp"
#include "json.hpp"

namespace atlantis {

namespace {

std::optional<std::string> encode_content(const std::vector<uint8_t>& json) {
    if (json.empty()) return std::nullopt;
    return base64::encode(json);
}

} // namespace

Message::Message(std::string id, MessageType type, std::optional<std::string> content,
                 std::string build_version)
    : id_(std::move(id)), message_type_(type), content_(std::move(content)),
      build_version_(std::move(build_version)) {}

Message Message::connection(const std::string& id, const ConnectionPackage& package) {
    return Message(id, MessageType::Connection, encode_content(package.to_json()));
}

Message Message::traffic(const std::string& id, const TrafficPackage& package) {
    return Message(id, MessageType::Traffic, encode_content(package.to_json()));
}

Message Message::websocket(const std::string& id, const TrafficPackage& package) {
    return Message(id, MessageType::WebSocket, encode_content(package.to_json()));
}

std::vector<uint8_t> Message::to_json() const {
    JsonWriter w;
    w.begin_object()
        .field("id", id_)
        .field("messageType", to_string(message_type_));
    if (content_) w.field("content", *content_);
    w.field("buildVersion", build_version_);
    w.end_object();
    return w.take();
}

std::vector<uint8_t> Message::to_compressed_data() const {
    auto raw = to_json();
    auto compressed = gzip::compress(raw);
    if (!compressed) return raw;
    return std::move(*compressed);
}

} // namespace atlantis
