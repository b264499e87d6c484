// src/mdns_browser.cpp
// DNS-SD browsing: periodic legacy-unicast PTR queries to the mDNS group,
// SRV/A follow-ups for instances that are not resolved yet.

#include "mdns_browser.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <set>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace atlantis {

namespace {

std::string lowercase(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

// Closes the UDP socket when the receive thread exits.
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) ::close(fd_);
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const noexcept { return fd_; }

private:
    int fd_;
};

constexpr size_t MAX_DATAGRAM = 9000;
constexpr int EXPIRY_INTERVALS = 3;

} // namespace

bool matches_host_filter(const std::string& service_name,
                         const std::optional<std::string>& host_filter) {
    if (!host_filter) return true;

    std::string filter = lowercase(*host_filter);
    if (!filter.empty() && filter.back() == '.') filter.pop_back();
    if (filter.empty()) return true;

    return lowercase(service_name).find(filter) != std::string::npos;
}

MdnsServiceBrowser::MdnsServiceBrowser(std::string service_type,
                                       std::optional<std::string> host_filter,
                                       std::chrono::milliseconds query_interval)
    : service_type_(std::move(service_type)),
      service_domain_(dns::service_domain(service_type_)),
      host_filter_(std::move(host_filter)),
      query_interval_(query_interval.count() > 0 ? query_interval : std::chrono::milliseconds(1000)) {}

MdnsServiceBrowser::~MdnsServiceBrowser() {
    stop();
}

void MdnsServiceBrowser::start(DiscoveryListener& listener) {
    if (running_.exchange(true)) {
        logger()->debug("service browser for {} already running", service_type_);
        return;
    }
    listener_ = &listener;
    cancel_.reset();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances_.clear();
        addresses_.clear();
    }
    thread_ = std::thread(&MdnsServiceBrowser::run, this);
}

void MdnsServiceBrowser::stop() {
    if (!running_.exchange(false)) return;
    cancel_.signal();
    if (thread_.joinable()) {
        thread_.join();
    }
    listener_ = nullptr;
}

void MdnsServiceBrowser::run() {
    DiscoveryListener& listener = *listener_;

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        int code = errno;
        listener.on_discovery_error(code, std::string("Failed to start discovery: ") + std::strerror(code));
        return;
    }
    SocketGuard guard(fd);

    // Ephemeral source port: responders answer by unicast (legacy mode).
    struct sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = 0;
    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&local), sizeof(local)) != 0) {
        int code = errno;
        listener.on_discovery_error(code, std::string("Failed to start discovery: ") + std::strerror(code));
        return;
    }

    unsigned char ttl = 255;
    ::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

    logger()->info("browsing for {} services", service_type_);
    listener.on_discovery_started();

    std::vector<uint8_t> buf(MAX_DATAGRAM);
    auto next_query = std::chrono::steady_clock::now();
    bool reported_send_error = false;

    while (running_.load()) {
        auto now = std::chrono::steady_clock::now();

        if (now >= next_query) {
            std::vector<dns::Question> questions{dns::Question{service_domain_, dns::TYPE_PTR}};
            auto follow_ups = pending_resolution();
            questions.insert(questions.end(), follow_ups.begin(), follow_ups.end());

            int code = send_queries(fd, questions);
            if (code != 0) {
                // Report once per outage; browsing continues.
                if (!reported_send_error) {
                    listener.on_discovery_error(code, std::string("Discovery query failed: ") + std::strerror(code));
                    reported_send_error = true;
                }
            } else {
                reported_send_error = false;
            }
            next_query = now + query_interval_;
        }

        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next_query - now);
        struct pollfd pfds[2]{};
        pfds[0].fd = fd;
        pfds[0].events = POLLIN;
        pfds[1].fd = cancel_.read_fd();
        pfds[1].events = POLLIN;
        nfds_t count = cancel_.valid() ? 2 : 1;

        int ret = ::poll(pfds, count, static_cast<int>(std::max<int64_t>(wait.count(), 0)));
        if (ret < 0 && errno != EINTR) {
            int code = errno;
            listener.on_discovery_error(code, std::string("Discovery receive failed: ") + std::strerror(code));
            break;
        }
        if (count == 2 && (pfds[1].revents & POLLIN)) break;

        if (ret > 0 && (pfds[0].revents & POLLIN)) {
            struct sockaddr_in from{};
            socklen_t from_len = sizeof(from);
            ssize_t n = ::recvfrom(fd, buf.data(), buf.size(), 0,
                                   reinterpret_cast<struct sockaddr*>(&from), &from_len);
            if (n > 0) {
                char sender[INET_ADDRSTRLEN] = {};
                ::inet_ntop(AF_INET, &from.sin_addr, sender, sizeof(sender));

                auto packet = dns::parse(buf.data(), static_cast<size_t>(n));
                if (!packet) {
                    logger()->debug("ignoring malformed mDNS packet from {}", sender);
                } else {
                    auto events = handle_packet(*packet, sender, std::chrono::steady_clock::now());
                    for (const auto& name : events.lost) {
                        listener.on_service_lost(name);
                    }
                    for (const auto& peer : events.found) {
                        listener.on_service_found(peer);
                    }
                }
            }
        }

        for (const auto& name : expire(std::chrono::steady_clock::now())) {
            listener.on_service_lost(name);
        }
    }

    logger()->info("stopped browsing for {} services", service_type_);
    listener.on_discovery_stopped();
}

int MdnsServiceBrowser::send_queries(int fd, const std::vector<dns::Question>& questions) {
    struct sockaddr_in group{};
    group.sin_family = AF_INET;
    group.sin_port = htons(dns::MDNS_PORT);
    ::inet_pton(AF_INET, dns::MDNS_GROUP, &group.sin_addr);

    int error = 0;
    for (const auto& question : questions) {
        auto packet = dns::build_query(question, ++query_id_);
        if (!packet) {
            logger()->debug("cannot encode query for {}", dns::to_key(question.name));
            continue;
        }
        ssize_t n = ::sendto(fd, packet->data(), packet->size(), 0,
                             reinterpret_cast<const struct sockaddr*>(&group), sizeof(group));
        if (n != static_cast<ssize_t>(packet->size())) error = n < 0 ? errno : EMSGSIZE;
    }
    return error;
}

std::vector<dns::Question> MdnsServiceBrowser::pending_resolution() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<dns::Question> questions;
    for (const auto& entry : instances_) {
        const Instance& inst = entry.second;
        if (!inst.target || inst.port == 0) {
            questions.push_back(dns::Question{inst.full_name, dns::TYPE_SRV});
        } else if (addresses_.count(dns::to_key(*inst.target)) == 0) {
            questions.push_back(dns::Question{*inst.target, dns::TYPE_A});
        }
    }
    return questions;
}

MdnsServiceBrowser::BrowseEvents MdnsServiceBrowser::handle_packet(
    const dns::Packet& packet, const std::string& sender,
    std::chrono::steady_clock::time_point now) {
    BrowseEvents events;
    if (!packet.is_response()) return events;

    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> touched;

    for (const auto& rec : packet.records) {
        if (rec.type == dns::TYPE_A && !rec.address.empty()) {
            auto key = dns::to_key(rec.name);
            if (rec.ttl == 0) {
                addresses_.erase(key);
            } else {
                addresses_[key] = rec.address;
            }
        }
    }

    for (const auto& rec : packet.records) {
        if (rec.type != dns::TYPE_PTR || !dns::same_name(rec.name, service_domain_)) continue;
        if (rec.target.empty()) continue;

        const std::string& label = rec.target.front();
        auto key = dns::to_key(rec.target);

        if (rec.ttl == 0) {
            if (instances_.erase(key) > 0) {
                events.lost.push_back(label);
            }
            continue;
        }
        if (!matches_host_filter(label, host_filter_)) {
            logger()->debug("skipping {}: does not match host filter", label);
            continue;
        }

        auto& inst = instances_[key];
        inst.label = label;
        inst.full_name = rec.target;
        inst.last_seen = now;
        touched.insert(key);
    }

    for (const auto& rec : packet.records) {
        if (rec.type != dns::TYPE_SRV) continue;
        auto key = dns::to_key(rec.name);
        auto it = instances_.find(key);
        if (it == instances_.end()) continue;

        if (rec.ttl == 0) {
            events.lost.push_back(it->second.label);
            instances_.erase(it);
            touched.erase(key);
            continue;
        }
        it->second.target = rec.target;
        it->second.port = rec.port;
        it->second.last_seen = now;
        touched.insert(key);
    }

    // Address-only answers complete instances resolved earlier.
    for (auto& entry : instances_) {
        const Instance& inst = entry.second;
        if (!inst.target) continue;
        for (const auto& rec : packet.records) {
            if (rec.type == dns::TYPE_A && dns::same_name(rec.name, *inst.target)) {
                touched.insert(entry.first);
            }
        }
    }

    for (const auto& key : touched) {
        Instance& inst = instances_[key];
        if (!inst.target || inst.port == 0) continue;

        auto addr = addresses_.find(dns::to_key(*inst.target));
        inst.address = addr != addresses_.end() ? addr->second : sender;
        if (inst.address.empty()) continue;

        events.found.push_back(DiscoveredPeer{inst.address, inst.port, inst.label});
    }
    return events;
}

std::vector<std::string> MdnsServiceBrowser::expire(std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> lost;
    auto limit = query_interval_ * EXPIRY_INTERVALS;
    for (auto it = instances_.begin(); it != instances_.end();) {
        if (now - it->second.last_seen > limit) {
            logger()->debug("service {} expired", it->second.label);
            lost.push_back(it->second.label);
            it = instances_.erase(it);
        } else {
            ++it;
        }
    }
    return lost;
}

} // namespace atlantis
