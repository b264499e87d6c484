// src/packages.cpp
// Capture data model and its JSON encoding.

#include "atlantis/packages.hpp"
#include "atlantis/compression.hpp"
#include "atlantis/config.hpp"
#include "base64.hpp"
#include "json.hpp"
#include "validation.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <random>

namespace atlantis {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

std::optional<std::string> find_header(const HeaderList& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (iequals(h.key, name)) return h.value;
    }
    return std::nullopt;
}

bool is_gzip_encoding(const std::optional<std::string>& content_encoding) {
    return content_encoding && iequals(*content_encoding, "gzip");
}

// Decompress a gzip-encoded body for readability; keep the original bytes
// when it does not inflate.
std::vector<uint8_t> decode_body(const std::vector<uint8_t>& body,
                                 const std::optional<std::string>& content_encoding) {
    if (!is_gzip_encoding(content_encoding)) return body;
    auto inflated = gzip::decompress(body);
    return inflated ? std::move(*inflated) : body;
}

void write_headers(JsonWriter& w, const HeaderList& headers) {
    w.begin_array();
    for (const auto& h : headers) {
        w.begin_object().field("key", h.key).field("value", h.value).end_object();
    }
    w.end_array();
}

void write_optional_string(JsonWriter& w, const std::string& name,
                           const std::optional<std::string>& value) {
    if (value) w.field(name, *value);
    else w.null_field(name);
}

void write_request(JsonWriter& w, const Request& request) {
    w.begin_object()
        .field("url", request.url)
        .field("method", request.method);
    w.key("headers");
    write_headers(w, request.headers);
    write_optional_string(w, "body", request.body);
    w.end_object();
}

void write_response(JsonWriter& w, const Response& response) {
    w.begin_object().field("statusCode", response.status_code);
    w.key("headers");
    write_headers(w, response.headers);
    w.end_object();
}

void write_websocket_message(JsonWriter& w, const WebsocketMessagePackage& ws) {
    w.begin_object()
        .field("id", ws.id())
        .field("createdAt", ws.created_at())
        .field("messageType", to_string(ws.message_type()));
    write_optional_string(w, "stringValue", ws.string_value());
    write_optional_string(w, "dataValue", ws.data_value());
    w.end_object();
}

} // namespace

// --- Free helpers ---

HeaderList join_headers(const std::vector<std::pair<std::string, std::string>>& headers) {
    HeaderList joined;
    joined.reserve(headers.size());
    for (const auto& [name, value] : headers) {
        auto it = std::find_if(joined.begin(), joined.end(),
            [&name](const Header& h) { return iequals(h.key, name); });
        if (it == joined.end()) {
            joined.push_back(Header{name, value});
        } else {
            it->value += ",";
            it->value += value;
        }
    }
    return joined;
}

// Random v4 UUID, formatted 8-4-4-4-12.
std::string new_package_id() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    uint8_t bytes[16];
    uint64_t a = dist(gen);
    uint64_t b = dist(gen);
    std::memcpy(bytes, &a, 8);
    std::memcpy(bytes + 8, &b, 8);

    bytes[6] = (bytes[6] & 0x0F) | 0x40; // version 4
    bytes[8] = (bytes[8] & 0x3F) | 0x80; // variant 1

    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(hex[bytes[i] >> 4]);
        out.push_back(hex[bytes[i] & 0x0F]);
    }
    return out;
}

double now_seconds() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return static_cast<double>(ms) / 1000.0;
}

// --- Request / Response ---

Request Request::make(std::string url, std::string method,
                      const std::vector<std::pair<std::string, std::string>>& headers,
                      const std::optional<std::vector<uint8_t>>& body) {
    Request request;
    request.url = std::move(url);
    request.method = std::move(method);
    request.headers = join_headers(headers);

    if (body) {
        auto decoded = decode_body(*body, request.header("Content-Encoding"));
        if (validation::check_package_size(decoded.size())) {
            request.body = base64::encode(decoded);
        }
    }
    return request;
}

std::optional<std::string> Request::header(const std::string& name) const {
    return find_header(headers, name);
}

Response Response::make(int status_code,
                        const std::vector<std::pair<std::string, std::string>>& headers) {
    Response response;
    response.status_code = status_code;
    response.headers = join_headers(headers);
    return response;
}

std::optional<std::string> Response::header(const std::string& name) const {
    return find_header(headers, name);
}

std::string capture_response_body(const std::vector<uint8_t>& body,
                                  const std::optional<std::string>& content_encoding) {
    if (body.empty()) return std::string();
    auto decoded = decode_body(body, content_encoding);
    size_t len = std::min(decoded.size(), MAX_PACKAGE_SIZE);
    return base64::encode(decoded.data(), len);
}

// --- ConnectionPackage ---

ConnectionPackage::ConnectionPackage(const Configuration& config)
    : device{config.device_name(), config.device_info().full_model()},
      project{config.project_name(), config.package_name()},
      icon(config.app_icon()) {}

ConnectionPackage::ConnectionPackage(Device device, Project project, std::optional<std::string> icon)
    : device(std::move(device)), project(std::move(project)), icon(std::move(icon)) {}

std::vector<uint8_t> ConnectionPackage::to_json() const {
    JsonWriter w;
    w.begin_object();
    w.key("device").begin_object()
        .field("name", device.name)
        .field("model", device.model)
        .end_object();
    w.key("project").begin_object()
        .field("name", project.name)
        .field("bundleIdentifier", project.bundle_identifier)
        .end_object();
    write_optional_string(w, "icon", icon);
    w.end_object();
    return w.take();
}

// --- WebsocketMessagePackage ---

WebsocketMessagePackage::WebsocketMessagePackage(std::string id, WebsocketMessageType type,
                                                 std::optional<std::string> string_value,
                                                 std::optional<std::string> data_value)
    : id_(std::move(id)), created_at_(now_seconds()), message_type_(type),
      string_value_(std::move(string_value)), data_value_(std::move(data_value)) {}

WebsocketMessagePackage WebsocketMessagePackage::string_message(std::string id, std::string text,
                                                                WebsocketMessageType type) {
    return WebsocketMessagePackage(std::move(id), type, std::move(text), std::nullopt);
}

WebsocketMessagePackage WebsocketMessagePackage::data_message(std::string id,
                                                              const std::vector<uint8_t>& data,
                                                              WebsocketMessageType type) {
    return WebsocketMessagePackage(std::move(id), type, std::nullopt, base64::encode(data));
}

WebsocketMessagePackage WebsocketMessagePackage::close_message(std::string id, int close_code,
                                                               const std::optional<std::string>& reason) {
    std::optional<std::string> data;
    if (reason) data = base64::encode(*reason);
    return WebsocketMessagePackage(std::move(id), WebsocketMessageType::SendCloseMessage,
                                   std::to_string(close_code), std::move(data));
}

std::vector<uint8_t> WebsocketMessagePackage::to_json() const {
    JsonWriter w;
    write_websocket_message(w, *this);
    return w.take();
}

// --- TrafficPackage ---

TrafficPackage::TrafficPackage(std::string id, double start_at, Request request,
                               PackageType package_type)
    : id_(std::move(id)), start_at_(start_at), request_(std::move(request)),
      package_type_(package_type) {}

TrafficPackage TrafficPackage::create(Request request) {
    return TrafficPackage(new_package_id(), now_seconds(), std::move(request), PackageType::Http);
}

TrafficPackage TrafficPackage::create_websocket(Request request) {
    return TrafficPackage(new_package_id(), now_seconds(), std::move(request), PackageType::WebSocket);
}

TrafficPackage TrafficPackage::with_response(Response response) const {
    TrafficPackage copy = *this;
    copy.response_ = std::move(response);
    return copy;
}

TrafficPackage TrafficPackage::with_error(CustomError error) const {
    TrafficPackage copy = *this;
    copy.error_ = std::move(error);
    return copy;
}

TrafficPackage TrafficPackage::with_response_body(std::string base64_body) const {
    TrafficPackage copy = *this;
    copy.response_body_data_ = std::move(base64_body);
    return copy;
}

TrafficPackage TrafficPackage::with_end_at(double end_at) const {
    TrafficPackage copy = *this;
    copy.end_at_ = end_at;
    return copy;
}

TrafficPackage TrafficPackage::with_websocket_message(WebsocketMessagePackage message) const {
    TrafficPackage copy = *this;
    copy.websocket_message_package_ = std::move(message);
    return copy;
}

std::vector<uint8_t> TrafficPackage::to_json() const {
    JsonWriter w;
    w.begin_object()
        .field("id", id_)
        .field("startAt", start_at_);

    w.key("request");
    write_request(w, request_);

    w.key("response");
    if (response_) write_response(w, *response_);
    else w.null();

    w.key("error");
    if (error_) {
        w.begin_object()
            .field("code", error_->code)
            .field("message", error_->message)
            .end_object();
    } else {
        w.null();
    }

    w.field("responseBodyData", response_body_data_);

    w.key("endAt");
    if (end_at_) w.value(*end_at_);
    else w.null();

    w.field("packageType", to_string(package_type_));

    w.key("websocketMessagePackage");
    if (websocket_message_package_) write_websocket_message(w, *websocket_message_package_);
    else w.null();

    w.end_object();
    return w.take();
}

} // namespace atlantis
