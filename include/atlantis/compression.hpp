// include/atlantis/compression.hpp
// Stateless GZIP helpers shared by the sender and inspector-side decoders.

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace atlantis {
namespace gzip {

// GZIP-encode. Empty input is returned as given; nullopt on zlib failure so
// callers can fall back to the uncompressed bytes.
std::optional<std::vector<uint8_t>> compress(const std::vector<uint8_t>& data);

// Inverse of compress(). Empty input is returned as given; nullopt on
// malformed or truncated input. Never throws.
std::optional<std::vector<uint8_t>> decompress(const std::vector<uint8_t>& data);

// True iff the buffer starts with the GZIP magic number 0x1F 0x8B.
bool is_compressed(const uint8_t* data, size_t len) noexcept;

inline bool is_compressed(const std::vector<uint8_t>& data) noexcept {
    return is_compressed(data.data(), data.size());
}

} // namespace gzip
} // namespace atlantis
