// src/dns_message.cpp
// DNS message decoding and query encoding for the mDNS browser.

#include "dns_message.hpp"

#include <cctype>
#include <climits>

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <netinet/in.h>
#include <resolv.h>

namespace atlantis {
namespace dns {

namespace {

// Uncompressed wire name to labels. `wire` comes from ns_name_pton or
// ns_name_unpack, so it is bounded and terminated.
Name labels_of(const u_char* wire) {
    Name name;
    while (*wire != 0) {
        size_t len = *wire++;
        name.emplace_back(reinterpret_cast<const char*>(wire), len);
        wire += len;
    }
    return name;
}

bool owner_name(const ns_rr& rr, Name& out) {
    u_char wire[NS_MAXCDNAME];
    if (::ns_name_pton(ns_rr_name(rr), wire, sizeof(wire)) < 0) return false;
    out = labels_of(wire);
    return true;
}

// Name at `src` inside the message, following compression pointers.
// Returns the bytes it occupies at `src`, or -1.
int unpack_name(const ns_msg& msg, const u_char* src, Name& out) {
    u_char wire[NS_MAXCDNAME];
    int used = ::ns_name_unpack(ns_msg_base(msg), ns_msg_end(msg), src, wire, sizeof(wire));
    if (used < 0) return -1;
    out = labels_of(wire);
    return used;
}

bool read_rdata(const ns_msg& msg, const ns_rr& rr, Record& rec) {
    const u_char* rdata = ns_rr_rdata(rr);
    int rdlen = ns_rr_rdlen(rr);

    switch (rec.type) {
        case TYPE_PTR: {
            int used = unpack_name(msg, rdata, rec.target);
            return used > 0 && used <= rdlen;
        }
        case TYPE_SRV: {
            // priority, weight, port, target
            if (rdlen < 3 * NS_INT16SZ + 1) return false;
            rec.port = static_cast<uint16_t>(::ns_get16(rdata + 2 * NS_INT16SZ));
            int used = unpack_name(msg, rdata + 3 * NS_INT16SZ, rec.target);
            return used > 0 && used <= rdlen - 3 * NS_INT16SZ;
        }
        case TYPE_A: {
            if (rdlen != NS_INADDRSZ) return false;
            char text[INET_ADDRSTRLEN] = {};
            if (::inet_ntop(AF_INET, rdata, text, sizeof(text)) == nullptr) return false;
            rec.address = text;
            return true;
        }
        case TYPE_AAAA: {
            if (rdlen != NS_IN6ADDRSZ) return false;
            char text[INET6_ADDRSTRLEN] = {};
            if (::inet_ntop(AF_INET6, rdata, text, sizeof(text)) == nullptr) return false;
            rec.address = text;
            return true;
        }
        default:
            return true;
    }
}

} // namespace

Name service_domain(const std::string& service_type) {
    Name name;
    size_t start = 0;
    while (start < service_type.size()) {
        size_t dot = service_type.find('.', start);
        if (dot == std::string::npos) dot = service_type.size();
        if (dot > start) name.push_back(service_type.substr(start, dot - start));
        start = dot + 1;
    }
    if (name.empty() || to_key(Name{name.back()}) != "local") {
        name.push_back("local");
    }
    return name;
}

bool same_name(const Name& a, const Name& b) {
    return to_key(a) == to_key(b);
}

std::string to_key(const Name& name) {
    std::string key;
    for (const auto& label : name) {
        for (char c : label) {
            key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        key.push_back('.');
    }
    return key;
}

std::optional<std::string> to_presentation(const Name& name) {
    u_char wire[NS_MAXCDNAME];
    size_t pos = 0;
    for (const auto& label : name) {
        if (label.empty() || label.size() > NS_MAXLABEL) return std::nullopt;
        if (pos + 1 + label.size() + 1 > sizeof(wire)) return std::nullopt;
        wire[pos++] = static_cast<u_char>(label.size());
        for (char c : label) wire[pos++] = static_cast<u_char>(c);
    }
    wire[pos] = 0;

    char text[NS_MAXDNAME];
    if (::ns_name_ntop(wire, text, sizeof(text)) < 0) return std::nullopt;
    return std::string(text);
}

std::optional<std::vector<uint8_t>> build_query(const Question& question, uint16_t id) {
    auto name = to_presentation(question.name);
    if (!name) return std::nullopt;

    std::vector<uint8_t> buf(NS_PACKETSZ);
    int len = ::res_mkquery(ns_o_query, name->c_str(), ns_c_in, question.type, nullptr, 0, nullptr,
                            buf.data(), static_cast<int>(buf.size()));
    if (len < 0) return std::nullopt;
    buf.resize(static_cast<size_t>(len));

    // mDNS queries carry no recursion bit; the id is ours, not the resolver's.
    auto* header = reinterpret_cast<HEADER*>(buf.data());
    header->rd = 0;
    header->id = htons(id);
    return buf;
}

std::optional<Packet> parse(const uint8_t* data, size_t len) {
    if (len > static_cast<size_t>(INT_MAX)) return std::nullopt;

    ns_msg msg;
    if (::ns_initparse(data, static_cast<int>(len), &msg) != 0) return std::nullopt;

    Packet packet;
    packet.id = static_cast<uint16_t>(ns_msg_id(msg));
    packet.flags = static_cast<uint16_t>(::ns_get16(data + NS_INT16SZ));

    for (int i = 0; i < ns_msg_count(msg, ns_s_qd); i++) {
        ns_rr rr;
        if (::ns_parserr(&msg, ns_s_qd, i, &rr) != 0) return std::nullopt;
        Question q;
        if (!owner_name(rr, q.name)) return std::nullopt;
        q.type = static_cast<uint16_t>(ns_rr_type(rr));
        packet.questions.push_back(std::move(q));
    }

    for (ns_sect section : {ns_s_an, ns_s_ns, ns_s_ar}) {
        for (int i = 0; i < ns_msg_count(msg, section); i++) {
            ns_rr rr;
            if (::ns_parserr(&msg, section, i, &rr) != 0) return std::nullopt;

            Record rec;
            if (!owner_name(rr, rec.name)) return std::nullopt;
            rec.type = static_cast<uint16_t>(ns_rr_type(rr));
            rec.rclass = static_cast<uint16_t>(ns_rr_class(rr) & ~CLASS_FLAG);
            rec.ttl = static_cast<uint32_t>(ns_rr_ttl(rr));
            if (!read_rdata(msg, rr, rec)) return std::nullopt;
            packet.records.push_back(std::move(rec));
        }
    }
    return packet;
}

} // namespace dns
} // namespace atlantis
