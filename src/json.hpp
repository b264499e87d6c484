// src/json.hpp
// Streaming JSON writer: appends bytes directly, no DOM.

#pragma once

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace atlantis {

// Appends JSON tokens to a byte buffer, tracking comma placement per
// nesting level. Keys and string values are escaped.
//
// Example:
//   JsonWriter w;
//   w.begin_object().field("id", "abc").key("headers").begin_array().end_array().end_object();
//   auto bytes = w.take();
class JsonWriter {
public:
    JsonWriter() { buf_.reserve(256); }

    JsonWriter& begin_object() {
        before_value();
        buf_.push_back('{');
        first_.push_back(true);
        return *this;
    }

    JsonWriter& end_object() {
        buf_.push_back('}');
        if (!first_.empty()) first_.pop_back();
        return *this;
    }

    JsonWriter& begin_array() {
        before_value();
        buf_.push_back('[');
        first_.push_back(true);
        return *this;
    }

    JsonWriter& end_array() {
        buf_.push_back(']');
        if (!first_.empty()) first_.pop_back();
        return *this;
    }

    JsonWriter& key(const std::string& name) {
        separate();
        buf_.push_back('"');
        write_escaped(name.data(), name.size());
        buf_.push_back('"');
        buf_.push_back(':');
        after_key_ = true;
        return *this;
    }

    JsonWriter& value(const std::string& v) {
        before_value();
        buf_.push_back('"');
        write_escaped(v.data(), v.size());
        buf_.push_back('"');
        return *this;
    }

    JsonWriter& value(const char* v) {
        before_value();
        buf_.push_back('"');
        write_escaped(v, std::strlen(v));
        buf_.push_back('"');
        return *this;
    }

    JsonWriter& value(int64_t v) {
        before_value();
        char tmp[24];
        int n = std::snprintf(tmp, sizeof(tmp), "%lld", static_cast<long long>(v));
        if (n > 0) buf_.insert(buf_.end(), tmp, tmp + n);
        return *this;
    }

    JsonWriter& value(int v) { return value(static_cast<int64_t>(v)); }

    // Epoch timestamps need full precision, so no "%g" here.
    JsonWriter& value(double v) {
        before_value();
        if (!std::isfinite(v)) {
            append_raw("0", 1);
            return *this;
        }
        char tmp[64];
        int n = std::snprintf(tmp, sizeof(tmp), "%.6f", v);
        if (n > 0) buf_.insert(buf_.end(), tmp, tmp + n);
        return *this;
    }

    JsonWriter& value(bool v) {
        before_value();
        if (v) append_raw("true", 4);
        else append_raw("false", 5);
        return *this;
    }

    JsonWriter& null() {
        before_value();
        append_raw("null", 4);
        return *this;
    }

    template <typename T>
    JsonWriter& field(const std::string& name, const T& v) {
        key(name);
        return value(v);
    }

    JsonWriter& null_field(const std::string& name) {
        key(name);
        return null();
    }

    const std::vector<uint8_t>& bytes() const noexcept { return buf_; }

    std::vector<uint8_t> take() {
        first_.clear();
        after_key_ = false;
        return std::move(buf_);
    }

private:
    std::vector<uint8_t> buf_;
    std::vector<bool> first_;
    bool after_key_ = false;

    void append_raw(const char* s, size_t n) {
        buf_.insert(buf_.end(), s, s + n);
    }

    void separate() {
        if (first_.empty()) return;
        if (first_.back()) {
            first_.back() = false;
        } else {
            buf_.push_back(',');
        }
    }

    // A value directly after a key needs no separator.
    void before_value() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        separate();
    }

    static bool needs_escape(char c) {
        return c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20;
    }

    // Length of the well-formed UTF-8 sequence at `s`, or 0 if it is not
    // one (RFC 3629: no overlongs, surrogates or code points past U+10FFFF).
    static size_t utf8_sequence_length(const unsigned char* s, size_t avail) {
        unsigned char c = s[0];
        size_t n = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            n = 2;
        } else if (c == 0xE0) {
            n = 3;
            lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            n = 3;
        } else if (c == 0xED) {
            n = 3;
            hi = 0x9F;
        } else if (c == 0xF0) {
            n = 4;
            lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            n = 4;
        } else if (c == 0xF4) {
            n = 4;
            hi = 0x8F;
        } else {
            return 0;
        }
        if (avail < n || s[1] < lo || s[1] > hi) return 0;
        for (size_t k = 2; k < n; k++) {
            if (s[k] < 0x80 || s[k] > 0xBF) return 0;
        }
        return n;
    }

    // Invalid UTF-8 bytes are written as U+FFFD, one per byte.
    void write_escaped(const char* s, size_t len) {
        static constexpr uint8_t REPLACEMENT[] = {0xEF, 0xBF, 0xBD};
        const auto* u = reinterpret_cast<const unsigned char*>(s);

        size_t i = 0;
        while (i < len) {
            // Fast path: bulk-copy runs of safe characters.
            size_t run_start = i;
            while (i < len) {
                if (u[i] < 0x80) {
                    if (needs_escape(s[i])) break;
                    ++i;
                    continue;
                }
                size_t n = utf8_sequence_length(u + i, len - i);
                if (n == 0) break;
                i += n;
            }

            if (i > run_start) {
                buf_.insert(buf_.end(), u + run_start, u + i);
            }
            if (i >= len) break;

            if (u[i] >= 0x80) {
                buf_.insert(buf_.end(), REPLACEMENT, REPLACEMENT + 3);
                ++i;
                continue;
            }

            char c = s[i];
            switch (c) {
                case '"':  buf_.push_back('\\'); buf_.push_back('"'); break;
                case '\\': buf_.push_back('\\'); buf_.push_back('\\'); break;
                case '\b': buf_.push_back('\\'); buf_.push_back('b'); break;
                case '\f': buf_.push_back('\\'); buf_.push_back('f'); break;
                case '\n': buf_.push_back('\\'); buf_.push_back('n'); break;
                case '\r': buf_.push_back('\\'); buf_.push_back('r'); break;
                case '\t': buf_.push_back('\\'); buf_.push_back('t'); break;
                default: {
                    char hex[7];
                    std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned char>(c));
                    buf_.insert(buf_.end(), hex, hex + 6);
                    break;
                }
            }
            ++i;
        }
    }
};

} // namespace atlantis
