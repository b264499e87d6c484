// src/dns_message.hpp
// DNS-SD message handling for multicast DNS browsing (RFC 6762/6763), on top
// of the libresolv message parser and query builder.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace atlantis {
namespace dns {

static constexpr uint16_t TYPE_A = 1;
static constexpr uint16_t TYPE_PTR = 12;
static constexpr uint16_t TYPE_TXT = 16;
static constexpr uint16_t TYPE_AAAA = 28;
static constexpr uint16_t TYPE_SRV = 33;
static constexpr uint16_t CLASS_IN = 1;

// Top bit of the class field: cache-flush on answers, unicast-response on
// questions.
static constexpr uint16_t CLASS_FLAG = 0x8000;

static constexpr const char* MDNS_GROUP = "224.0.0.251";
static constexpr uint16_t MDNS_PORT = 5353;

// A domain name as its labels. Instance labels may contain dots
// ("Proxyman-mac-mini.local"), so names are never split on '.' after
// decoding.
using Name = std::vector<std::string>;

struct Question {
    Name name;
    uint16_t type = TYPE_PTR;
};

struct Record {
    Name name;
    uint16_t type = 0;
    uint16_t rclass = CLASS_IN;
    uint32_t ttl = 0;

    Name target;           // PTR target, SRV target
    uint16_t port = 0;     // SRV
    std::string address;   // A / AAAA, presentation format
};

struct Packet {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<Question> questions;
    std::vector<Record> records;  // answers, authority and additional, in order

    bool is_response() const noexcept { return (flags & 0x8000) != 0; }
};

// "_Proxyman._tcp." -> {"_Proxyman", "_tcp", "local"}.
Name service_domain(const std::string& service_type);

// Case-insensitive label-wise comparison.
bool same_name(const Name& a, const Name& b);

// Lower-cased dotted form, for map keys and logging.
std::string to_key(const Name& name);

// Presentation form with '.' and '\\' inside labels escaped, as
// ns_name_pton expects. nullopt if a label is empty or too long.
std::optional<std::string> to_presentation(const Name& name);

// One-question legacy-unicast query (RD clear). nullopt if the name cannot
// be encoded.
std::optional<std::vector<uint8_t>> build_query(const Question& question, uint16_t id = 0);

// Decode a packet. Returns nullopt on truncation, bad pointers, loops or
// malformed rdata.
std::optional<Packet> parse(const uint8_t* data, size_t len);

} // namespace dns
} // namespace atlantis
