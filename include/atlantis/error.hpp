// include/atlantis/error.hpp
// Error handling: single class with kind enum.

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace atlantis {

enum class ErrorKind {
    Configuration,  // Invalid config at construction
    Discovery,      // Service browser failure (non-fatal, discovery continues)
    Connect,        // Timeout, refused, unreachable
    Io,             // Broken pipe, reset, partial write
    Serialization,  // Encoding or size-limit failure (message skipped)
    Closed          // Transport already stopped
};

class AtlantisError : public std::exception {
public:
    AtlantisError(ErrorKind kind, std::string message, int code = 0)
        : kind_(kind), message_(std::move(message)), code_(code) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }
    int code() const noexcept { return code_; }

    static AtlantisError configuration(std::string msg) {
        return AtlantisError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static AtlantisError discovery(int code, std::string msg) {
        return AtlantisError(ErrorKind::Discovery, std::move(msg), code);
    }

    static AtlantisError connect(std::string msg) {
        return AtlantisError(ErrorKind::Connect, std::move(msg));
    }

    static AtlantisError io(std::string msg) {
        return AtlantisError(ErrorKind::Io, "io error: " + msg);
    }

    static AtlantisError serialization(std::string msg) {
        return AtlantisError(ErrorKind::Serialization, "serialization error: " + msg);
    }

    static AtlantisError closed() {
        return AtlantisError(ErrorKind::Closed, "transporter is stopped");
    }

private:
    ErrorKind kind_;
    std::string message_;
    int code_;
};

// Outcome of an internal operation: empty on success.
using Status = std::optional<AtlantisError>;

} // namespace atlantis
