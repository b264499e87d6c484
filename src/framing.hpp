// src/framing.hpp
// Frame layout: [u64 little-endian payload length][payload].

#pragma once

#include "atlantis/error.hpp"
#include "atlantis/types.hpp"
#include "validation.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <deque>
#include <optional>
#include <vector>

namespace atlantis {
namespace framing {

static constexpr size_t HEADER_LENGTH = 8;

inline void write_u64(std::vector<uint8_t>& buf, uint64_t value) {
    for (int i = 0; i < 8; i++) {
        buf.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

inline uint64_t read_u64(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; i--) {
        value = (value << 8) | data[i];
    }
    return value;
}

// Header and payload in one contiguous buffer so a frame goes out as a
// single write. Payloads above MAX_PACKAGE_SIZE are refused.
inline std::optional<std::vector<uint8_t>> encode_frame(const uint8_t* payload, size_t len) {
    if (!validation::check_package_size(len)) return std::nullopt;
    std::vector<uint8_t> frame;
    frame.reserve(HEADER_LENGTH + len);
    write_u64(frame, static_cast<uint64_t>(len));
    if (payload && len > 0) frame.insert(frame.end(), payload, payload + len);
    return frame;
}

inline std::optional<std::vector<uint8_t>> encode_frame(const std::vector<uint8_t>& payload) {
    return encode_frame(payload.data(), payload.size());
}

// Incremental receiver-side decoder. Feed arbitrary chunks; complete
// payloads come out of next() in arrival order.
class FrameDecoder {
public:
    explicit FrameDecoder(size_t max_payload = MAX_PACKAGE_SIZE)
        : max_payload_(max_payload) {}

    // Append received bytes. Returns an error once a header announces a
    // payload above the limit; the decoder is unusable afterwards.
    Status feed(const uint8_t* data, size_t len) {
        if (failed_) return AtlantisError::io("frame decoder is in error state");
        buffer_.insert(buffer_.end(), data, data + len);

        while (true) {
            if (buffer_.size() - offset_ < HEADER_LENGTH) break;
            uint64_t announced = read_u64(buffer_.data() + offset_);
            if (announced > max_payload_) {
                failed_ = true;
                return AtlantisError::serialization(
                    "frame length " + std::to_string(announced) + " exceeds limit");
            }
            size_t total = HEADER_LENGTH + static_cast<size_t>(announced);
            if (buffer_.size() - offset_ < total) break;

            const uint8_t* start = buffer_.data() + offset_ + HEADER_LENGTH;
            frames_.emplace_back(start, start + announced);
            offset_ += total;
        }

        // Compact consumed bytes.
        if (offset_ > 0) {
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
            offset_ = 0;
        }
        return std::nullopt;
    }

    std::optional<std::vector<uint8_t>> next() {
        if (frames_.empty()) return std::nullopt;
        auto frame = std::move(frames_.front());
        frames_.pop_front();
        return frame;
    }

    size_t buffered() const noexcept { return buffer_.size(); }

private:
    size_t max_payload_;
    std::vector<uint8_t> buffer_;
    size_t offset_ = 0;
    std::deque<std::vector<uint8_t>> frames_;
    bool failed_ = false;
};

} // namespace framing
} // namespace atlantis
