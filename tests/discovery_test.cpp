// tests/discovery_test.cpp
// DNS-SD message decoding, hostname filter and browse-state resolution.

#include <gtest/gtest.h>
#include "atlantis/discovery.hpp"
#include "dns_message.hpp"
#include "mdns_browser.hpp"

#include <chrono>
#include <string>

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <resolv.h>

using namespace atlantis;

namespace {

using Clock = std::chrono::steady_clock;

const dns::Name SERVICE = {"_Proxyman", "_tcp", "local"};

dns::Record ptr(const std::string& instance, uint32_t ttl = 120) {
    dns::Record rec;
    rec.name = SERVICE;
    rec.type = dns::TYPE_PTR;
    rec.ttl = ttl;
    rec.target = {instance, "_Proxyman", "_tcp", "local"};
    return rec;
}

dns::Record srv(const std::string& instance, const std::string& host, uint16_t port) {
    dns::Record rec;
    rec.name = {instance, "_Proxyman", "_tcp", "local"};
    rec.type = dns::TYPE_SRV;
    rec.ttl = 120;
    rec.port = port;
    rec.target = {host, "local"};
    return rec;
}

dns::Record a(const std::string& host, const std::string& address) {
    dns::Record rec;
    rec.name = {host, "local"};
    rec.type = dns::TYPE_A;
    rec.ttl = 120;
    rec.address = address;
    return rec;
}

// Responder side of the exchange: a response with every record in the
// answer section, names compressed against earlier ones.
std::vector<uint8_t> encode_response(const std::vector<dns::Record>& records) {
    std::vector<u_char> buf(4 * NS_PACKETSZ);
    u_char* const begin = buf.data();
    u_char* const end = begin + buf.size();
    const u_char* dnptrs[32] = {begin, nullptr};
    const u_char** lastdnptr = dnptrs + 32;

    auto put_name = [&](const dns::Name& name, u_char* at) -> u_char* {
        auto text = dns::to_presentation(name);
        int n = text ? ns_name_compress(text->c_str(), at, static_cast<size_t>(end - at), dnptrs, lastdnptr) : -1;
        EXPECT_GT(n, 0) << dns::to_key(name);
        return n > 0 ? at + n : at;
    };

    ns_put16(0, begin);
    ns_put16(0x8400, begin + 2);  // QR | AA
    ns_put16(0, begin + 4);
    ns_put16(static_cast<u_int>(records.size()), begin + 6);
    ns_put16(0, begin + 8);
    ns_put16(0, begin + 10);
    u_char* p = begin + NS_HFIXEDSZ;

    for (const auto& rec : records) {
        p = put_name(rec.name, p);
        ns_put16(rec.type, p);
        ns_put16(rec.rclass, p + 2);
        ns_put32(rec.ttl, p + 4);
        u_char* rdlength = p + 8;
        p += 10;
        u_char* rdata = p;

        if (rec.type == dns::TYPE_PTR) {
            p = put_name(rec.target, p);
        } else if (rec.type == dns::TYPE_SRV) {
            ns_put16(0, p);
            ns_put16(0, p + 2);
            ns_put16(rec.port, p + 4);
            p = put_name(rec.target, p + 6);
        } else if (rec.type == dns::TYPE_A) {
            EXPECT_EQ(inet_pton(AF_INET, rec.address.c_str(), p), 1) << rec.address;
            p += NS_INADDRSZ;
        }
        ns_put16(static_cast<u_int>(p - rdata), rdlength);
    }
    return std::vector<uint8_t>(begin, p);
}

dns::Packet response(std::vector<dns::Record> records) {
    auto wire = encode_response(records);
    auto packet = dns::parse(wire.data(), wire.size());
    EXPECT_TRUE(packet.has_value());
    return packet.value_or(dns::Packet{});
}

MdnsServiceBrowser make_browser(std::optional<std::string> filter = std::nullopt) {
    return MdnsServiceBrowser("_Proxyman._tcp.", std::move(filter), std::chrono::milliseconds(1000));
}

} // namespace

// ==================== Host filter ====================

TEST(HostFilterTest, NoFilterAcceptsEverything) {
    EXPECT_TRUE(matches_host_filter("Proxyman-imac.local", std::nullopt));
    EXPECT_TRUE(matches_host_filter("Proxyman-imac.local", std::string("")));
}

TEST(HostFilterTest, ContainmentIsCaseInsensitive) {
    EXPECT_TRUE(matches_host_filter("Proxyman-mac-mini.local", std::string("mac-mini.local")));
    EXPECT_TRUE(matches_host_filter("Proxyman-MAC-MINI.local", std::string("Mac-Mini.Local")));
    EXPECT_FALSE(matches_host_filter("Proxyman-imac.local", std::string("mac-mini.local")));
}

TEST(HostFilterTest, TrailingDotOnFilterIsIgnored) {
    EXPECT_TRUE(matches_host_filter("Proxyman-mac-mini.local", std::string("mac-mini.local.")));
}

// ==================== DNS codec ====================

TEST(DnsMessageTest, ServiceDomainAppendsLocal) {
    EXPECT_EQ(dns::service_domain("_Proxyman._tcp."), SERVICE);
    EXPECT_EQ(dns::service_domain("_Proxyman._tcp.local."), SERVICE);
}

TEST(DnsMessageTest, QueryEncodesQuestion) {
    auto wire = dns::build_query(dns::Question{SERVICE, dns::TYPE_PTR}, 7);
    ASSERT_TRUE(wire.has_value());
    auto packet = dns::parse(wire->data(), wire->size());
    ASSERT_TRUE(packet.has_value());

    EXPECT_EQ(packet->id, 7);
    EXPECT_FALSE(packet->is_response());
    EXPECT_EQ(packet->flags & 0x0100, 0);  // recursion not desired
    ASSERT_EQ(packet->questions.size(), 1u);
    EXPECT_TRUE(dns::same_name(packet->questions[0].name, SERVICE));
    EXPECT_EQ(packet->questions[0].type, dns::TYPE_PTR);
}

TEST(DnsMessageTest, DottedInstanceLabelSurvivesQuery) {
    dns::Name instance = {"Proxyman-mac-mini.local", "_Proxyman", "_tcp", "local"};
    EXPECT_EQ(dns::to_presentation(instance).value_or(""), "Proxyman-mac-mini\\.local._Proxyman._tcp.local");

    auto wire = dns::build_query(dns::Question{instance, dns::TYPE_SRV}, 1);
    ASSERT_TRUE(wire.has_value());
    auto packet = dns::parse(wire->data(), wire->size());
    ASSERT_TRUE(packet.has_value());
    ASSERT_EQ(packet->questions.size(), 1u);
    EXPECT_EQ(packet->questions[0].name, instance);
    EXPECT_EQ(packet->questions[0].type, dns::TYPE_SRV);
}

TEST(DnsMessageTest, OversizedLabelCannotBeQueried) {
    dns::Name name = {std::string(64, 'x'), "local"};
    EXPECT_FALSE(dns::to_presentation(name).has_value());
    EXPECT_FALSE(dns::build_query(dns::Question{name, dns::TYPE_A}).has_value());
}

TEST(DnsMessageTest, ResponseRecordsSurviveEncoding) {
    auto packet = response({ptr("Proxyman-mac-mini.local"), srv("Proxyman-mac-mini.local", "mac-mini", 10909),
                            a("mac-mini", "192.168.1.20")});

    EXPECT_TRUE(packet.is_response());
    ASSERT_EQ(packet.records.size(), 3u);
    EXPECT_EQ(packet.records[0].target.front(), "Proxyman-mac-mini.local");
    EXPECT_EQ(packet.records[1].port, 10909);
    EXPECT_EQ(dns::to_key(packet.records[1].target), "mac-mini.local.");
    EXPECT_EQ(packet.records[2].address, "192.168.1.20");
}

TEST(DnsMessageTest, FollowsCompressionPointers) {
    // Header, then PTR answer whose name is "_p._tcp.local" and whose rdata
    // points back at offset 12 after one new label.
    std::vector<uint8_t> wire = {
        0x00, 0x00, 0x84, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00,
        2, '_', 'p', 4, '_', 't', 'c', 'p', 5, 'l', 'o', 'c', 'a', 'l', 0,
        0x00, 0x0C, 0x80, 0x01, 0x00, 0x00, 0x00, 0x78, 0x00, 0x06,
        3, 'b', 'o', 'x', 0xC0, 0x0C,
    };
    auto packet = dns::parse(wire.data(), wire.size());
    ASSERT_TRUE(packet.has_value());
    ASSERT_EQ(packet->records.size(), 1u);

    const auto& rec = packet->records[0];
    EXPECT_EQ(rec.rclass, dns::CLASS_IN);  // cache-flush bit cleared
    EXPECT_EQ(rec.ttl, 120u);
    EXPECT_EQ(dns::to_key(rec.target), "box._p._tcp.local.");
}

TEST(DnsMessageTest, RejectsPointerLoops) {
    std::vector<uint8_t> wire = {
        0x00, 0x00, 0x84, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0xC0, 0x0C, 0x00, 0x0C, 0x00, 0x01,
    };
    EXPECT_FALSE(dns::parse(wire.data(), wire.size()).has_value());
}

TEST(DnsMessageTest, RejectsTruncatedPackets) {
    auto wire = encode_response({ptr("Proxyman-imac.local")});
    for (size_t len = 0; len < wire.size(); len++) {
        EXPECT_FALSE(dns::parse(wire.data(), len).has_value()) << "length " << len;
    }
}

// ==================== Browse state ====================

TEST(MdnsBrowserTest, FullAnswerResolvesPeer) {
    auto browser = make_browser();
    auto events = browser.handle_packet(
        response({ptr("Proxyman-mac-mini.local"), srv("Proxyman-mac-mini.local", "mac-mini", 10909),
                  a("mac-mini", "192.168.1.20")}),
        "192.168.1.20", Clock::now());

    ASSERT_EQ(events.found.size(), 1u);
    EXPECT_EQ(events.found[0].name, "Proxyman-mac-mini.local");
    EXPECT_EQ(events.found[0].host, "192.168.1.20");
    EXPECT_EQ(events.found[0].port, 10909);
    EXPECT_TRUE(events.lost.empty());
}

TEST(MdnsBrowserTest, ResolvesAcrossPackets) {
    auto browser = make_browser();
    auto now = Clock::now();

    auto events = browser.handle_packet(response({ptr("Proxyman-imac.local")}), "10.0.0.5", now);
    EXPECT_TRUE(events.found.empty());

    events = browser.handle_packet(response({srv("Proxyman-imac.local", "imac", 10909)}), "10.0.0.5", now);
    ASSERT_EQ(events.found.size(), 1u);
    // No A record yet: the responder's address stands in.
    EXPECT_EQ(events.found[0].host, "10.0.0.5");

    events = browser.handle_packet(response({a("imac", "10.0.0.9")}), "10.0.0.5", now);
    ASSERT_EQ(events.found.size(), 1u);
    EXPECT_EQ(events.found[0].host, "10.0.0.9");
}

TEST(MdnsBrowserTest, HostFilterSelectsMatchingInstance) {
    auto browser = make_browser(std::string("mac-mini.local"));
    auto events = browser.handle_packet(
        response({ptr("Proxyman-mac-mini.local"), srv("Proxyman-mac-mini.local", "mac-mini", 10909),
                  ptr("Proxyman-imac.local"), srv("Proxyman-imac.local", "imac", 10910),
                  a("mac-mini", "192.168.1.20"), a("imac", "192.168.1.21")}),
        "192.168.1.1", Clock::now());

    ASSERT_EQ(events.found.size(), 1u);
    EXPECT_EQ(events.found[0].name, "Proxyman-mac-mini.local");
    EXPECT_EQ(events.found[0].port, 10909);
}

TEST(MdnsBrowserTest, ZeroTtlReportsLoss) {
    auto browser = make_browser();
    auto now = Clock::now();
    browser.handle_packet(response({ptr("Proxyman-imac.local"), srv("Proxyman-imac.local", "imac", 10909)}),
                          "10.0.0.5", now);

    auto events = browser.handle_packet(response({ptr("Proxyman-imac.local", 0)}), "10.0.0.5", now);
    ASSERT_EQ(events.lost.size(), 1u);
    EXPECT_EQ(events.lost[0], "Proxyman-imac.local");

    // Unknown instance: nothing to report.
    events = browser.handle_packet(response({ptr("Proxyman-other.local", 0)}), "10.0.0.5", now);
    EXPECT_TRUE(events.lost.empty());
}

TEST(MdnsBrowserTest, SilentInstancesExpire) {
    auto browser = make_browser();
    auto now = Clock::now();
    browser.handle_packet(response({ptr("Proxyman-imac.local")}), "10.0.0.5", now);

    EXPECT_TRUE(browser.expire(now + std::chrono::seconds(2)).empty());
    auto lost = browser.expire(now + std::chrono::seconds(4));
    ASSERT_EQ(lost.size(), 1u);
    EXPECT_EQ(lost[0], "Proxyman-imac.local");
}

TEST(MdnsBrowserTest, QueriesAreIgnored) {
    auto browser = make_browser();
    auto wire = dns::build_query(dns::Question{SERVICE, dns::TYPE_PTR});
    ASSERT_TRUE(wire.has_value());
    auto packet = dns::parse(wire->data(), wire->size());
    ASSERT_TRUE(packet.has_value());

    auto events = browser.handle_packet(*packet, "10.0.0.5", Clock::now());
    EXPECT_TRUE(events.found.empty());
    EXPECT_TRUE(events.lost.empty());
}

TEST(MdnsBrowserTest, OtherServiceTypesAreIgnored) {
    auto browser = make_browser();
    dns::Record other = ptr("Printer.local");
    other.name = {"_ipp", "_tcp", "local"};
    other.target = {"Printer", "_ipp", "_tcp", "local"};

    auto events = browser.handle_packet(response({other}), "10.0.0.5", Clock::now());
    EXPECT_TRUE(events.found.empty());
}

TEST(MdnsBrowserTest, StartAndStopWithoutPeers) {
    struct Listener : DiscoveryListener {
        void on_service_found(const DiscoveredPeer&) override {}
        void on_service_lost(const std::string&) override {}
        void on_discovery_error(int, const std::string&) override {}
    } listener;

    auto browser = make_browser();
    browser.start(listener);
    browser.stop();
    browser.stop();
}
