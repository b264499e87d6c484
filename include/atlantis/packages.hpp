// include/atlantis/packages.hpp
// Capture data model: HTTP exchanges, WebSocket frames, session metadata.

#pragma once

#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace atlantis {

class Configuration;

struct Header {
    std::string key;
    std::string value;
};

using HeaderList = std::vector<Header>;

// Collapse repeated header names (case-insensitive) into one entry whose
// value joins all occurrences with ','. First-occurrence order and spelling
// are kept.
HeaderList join_headers(const std::vector<std::pair<std::string, std::string>>& headers);

// Random v4 UUID string, used for package and WebSocket connection ids.
std::string new_package_id();

// Wall clock as fractional epoch seconds.
double now_seconds();

struct Request {
    std::string url;
    std::string method;
    HeaderList headers;
    std::optional<std::string> body;  // Base64

    // Build from captured components. A gzip Content-Encoding body is
    // decompressed first; a body above MAX_PACKAGE_SIZE is dropped.
    static Request make(std::string url, std::string method,
                        const std::vector<std::pair<std::string, std::string>>& headers,
                        const std::optional<std::vector<uint8_t>>& body = std::nullopt);

    // Case-insensitive header lookup.
    std::optional<std::string> header(const std::string& name) const;
};

struct Response {
    int status_code = 0;
    HeaderList headers;

    static Response make(int status_code,
                         const std::vector<std::pair<std::string, std::string>>& headers);

    std::optional<std::string> header(const std::string& name) const;
};

// Base64 of a captured response body: gzip-decoded when the encoding says
// so, truncated to MAX_PACKAGE_SIZE. Empty input gives an empty string.
std::string capture_response_body(const std::vector<uint8_t>& body,
                                  const std::optional<std::string>& content_encoding);

struct CustomError {
    int code = -1;
    std::string message;
};

struct Device {
    std::string name;
    std::string model;
};

struct Project {
    std::string name;
    std::string bundle_identifier;
};

// First message payload: identifies the session to the inspector.
struct ConnectionPackage {
    Device device;
    Project project;
    std::optional<std::string> icon;  // Base64 PNG

    explicit ConnectionPackage(const Configuration& config);
    ConnectionPackage(Device device, Project project, std::optional<std::string> icon);

    std::vector<uint8_t> to_json() const;
};

// One WebSocket frame event. Carries either a string or a binary payload;
// close frames carry the close code as string and the reason as data.
class WebsocketMessagePackage {
public:
    static WebsocketMessagePackage string_message(std::string id, std::string text,
                                                  WebsocketMessageType type);
    static WebsocketMessagePackage data_message(std::string id, const std::vector<uint8_t>& data,
                                                WebsocketMessageType type);
    static WebsocketMessagePackage close_message(std::string id, int close_code,
                                                 const std::optional<std::string>& reason);

    const std::string& id() const noexcept { return id_; }
    double created_at() const noexcept { return created_at_; }
    WebsocketMessageType message_type() const noexcept { return message_type_; }
    const std::optional<std::string>& string_value() const noexcept { return string_value_; }
    const std::optional<std::string>& data_value() const noexcept { return data_value_; }

    std::vector<uint8_t> to_json() const;

private:
    WebsocketMessagePackage(std::string id, WebsocketMessageType type,
                            std::optional<std::string> string_value,
                            std::optional<std::string> data_value);

    std::string id_;
    double created_at_ = 0.0;
    WebsocketMessageType message_type_ = WebsocketMessageType::Send;
    std::optional<std::string> string_value_;
    std::optional<std::string> data_value_;
};

// One HTTP exchange, or one WebSocket connection's record. Values are never
// mutated after construction: with_*() returns an independent copy, so
// per-frame snapshots never alias the cached base record.
class TrafficPackage {
public:
    TrafficPackage(std::string id, double start_at, Request request,
                   PackageType package_type = PackageType::Http);

    // New package with a fresh id and the current time.
    static TrafficPackage create(Request request);
    static TrafficPackage create_websocket(Request request);

    const std::string& id() const noexcept { return id_; }
    double start_at() const noexcept { return start_at_; }
    const std::optional<double>& end_at() const noexcept { return end_at_; }
    const Request& request() const noexcept { return request_; }
    const std::optional<Response>& response() const noexcept { return response_; }
    const std::optional<CustomError>& error() const noexcept { return error_; }
    const std::string& response_body_data() const noexcept { return response_body_data_; }
    PackageType package_type() const noexcept { return package_type_; }
    const std::optional<WebsocketMessagePackage>& websocket_message_package() const noexcept {
        return websocket_message_package_;
    }

    TrafficPackage with_response(Response response) const;
    TrafficPackage with_error(CustomError error) const;
    TrafficPackage with_response_body(std::string base64_body) const;
    TrafficPackage with_end_at(double end_at) const;
    TrafficPackage with_websocket_message(WebsocketMessagePackage message) const;

    std::vector<uint8_t> to_json() const;

private:
    std::string id_;
    double start_at_ = 0.0;
    std::optional<double> end_at_;
    Request request_;
    std::optional<Response> response_;
    std::optional<CustomError> error_;
    std::string response_body_data_;
    PackageType package_type_ = PackageType::Http;
    std::optional<WebsocketMessagePackage> websocket_message_package_;
};

} // namespace atlantis
