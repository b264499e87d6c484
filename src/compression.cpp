// src/compression.cpp
// GZIP encode/decode on top of zlib.

#include "atlantis/compression.hpp"

#include <climits>
#include <cstring>
#include <new>

#include <zlib.h>

namespace atlantis {
namespace gzip {

namespace {

// windowBits 15 + 16 selects the gzip wrapper instead of raw zlib.
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr size_t CHUNK = 64 * 1024;

} // namespace

std::optional<std::vector<uint8_t>> compress(const std::vector<uint8_t>& data) {
    if (data.empty()) return data;
    if (data.size() > UINT_MAX) return std::nullopt;

    z_stream stream{};
    if (::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                       GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    try {
        out.resize(::deflateBound(&stream, static_cast<uLong>(data.size())));
    } catch (const std::bad_alloc&) {
        ::deflateEnd(&stream);
        return std::nullopt;
    }

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    int ret = ::deflate(&stream, Z_FINISH);
    size_t produced = stream.total_out;
    ::deflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;
    out.resize(produced);
    return out;
}

std::optional<std::vector<uint8_t>> decompress(const std::vector<uint8_t>& data) {
    if (data.empty()) return data;
    if (data.size() > UINT_MAX) return std::nullopt;

    z_stream stream{};
    if (::inflateInit2(&stream, GZIP_WINDOW_BITS) != Z_OK) {
        return std::nullopt;
    }

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> out;
    uint8_t chunk[CHUNK];
    int ret = Z_OK;
    try {
        while (ret != Z_STREAM_END) {
            stream.next_out = chunk;
            stream.avail_out = sizeof(chunk);
            ret = ::inflate(&stream, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END) {
                ::inflateEnd(&stream);
                return std::nullopt;
            }
            size_t have = sizeof(chunk) - stream.avail_out;
            out.insert(out.end(), chunk, chunk + have);
            // Input exhausted before the gzip trailer: truncated stream.
            if (ret == Z_OK && stream.avail_in == 0 && have == 0) {
                ::inflateEnd(&stream);
                return std::nullopt;
            }
        }
    } catch (const std::bad_alloc&) {
        ::inflateEnd(&stream);
        return std::nullopt;
    }

    ::inflateEnd(&stream);
    return out;
}

bool is_compressed(const uint8_t* data, size_t len) noexcept {
    return data != nullptr && len >= 2 && data[0] == 0x1F && data[1] == 0x8B;
}

} // namespace gzip
} // namespace atlantis
