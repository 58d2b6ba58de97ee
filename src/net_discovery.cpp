// ============================================================================
// net_discovery.cpp — subnet expansion and TCP sweep
// ============================================================================

#include "net_discovery.hpp"
#include "link_io.hpp"
#include "meshlink/device_reader.hpp"
#include "meshlink/errors.hpp"
#include "meshlink/log.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <thread>

namespace meshlink {

// ---------- address helpers ----------

static bool parse_ipv4(const std::string& s, uint32_t& out) {
    in_addr a{};
    if (inet_pton(AF_INET, s.c_str(), &a) != 1) return false;
    out = ntohl(a.s_addr);
    return true;
}

static std::string format_ipv4(uint32_t v) {
    in_addr a{};
    a.s_addr = htonl(v);
    char buf[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &a, buf, sizeof(buf));
    return buf;
}

static bool skipped_address(uint32_t v) {
    return v == 0 || (v >> 24) == 127;
}

// "10.0.0.0/24" -> base, prefix. A bare address is /32.
static bool parse_cidr(const std::string& cidr, uint32_t& base, int& prefix) {
    const auto slash = cidr.find('/');
    const std::string addr = cidr.substr(0, slash);
    if (!parse_ipv4(addr, base)) return false;
    prefix = 32;
    if (slash != std::string::npos) {
        const std::string p = cidr.substr(slash + 1);
        const bool digits = std::all_of(p.begin(), p.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; });
        if (p.empty() || p.size() > 2 || !digits) return false;
        prefix = std::atoi(p.c_str());
        if (prefix < 0 || prefix > 32) return false;
    }
    return true;
}

static std::vector<std::string> hosts_of(uint32_t base, int prefix) {
    const uint32_t mask = prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
    const uint32_t net  = base & mask;
    const uint32_t last = net | ~mask;

    uint32_t first = net, end = last;
    if (prefix < 31) { first = net + 1; end = last - 1; }  // drop network + broadcast

    std::vector<std::string> out;
    for (uint64_t v = first; v <= end; ++v) {
        if (skipped_address(static_cast<uint32_t>(v))) continue;
        out.push_back(format_ipv4(static_cast<uint32_t>(v)));
    }
    return out;
}

std::vector<std::string> discovery_hosts(const std::optional<std::string>& subnet,
                                         const std::string& local_ip) {
    uint32_t base = 0;
    int prefix = 0;
    if (subnet && !subnet->empty()) {
        if (!parse_cidr(*subnet, base, prefix)) {
            log::warn("invalid_subnet").kv("subnet", *subnet);
            return {};
        }
        if (prefix < MIN_DISCOVERY_PREFIX) {
            log::warn("subnet_too_large").kv("subnet", *subnet).kv("min_prefix", MIN_DISCOVERY_PREFIX);
            return {};
        }
        return hosts_of(base, prefix);
    }
    if (!parse_ipv4(local_ip, base)) return {};
    return hosts_of(base, 24);
}

std::string local_ipv4() {
    // UDP connect sends nothing; it only makes the kernel pick a route and a source address.
    int s = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (s >= 0) {
        sockaddr_in dst{};
        dst.sin_family = AF_INET;
        dst.sin_port = htons(80);
        inet_pton(AF_INET, "8.8.8.8", &dst.sin_addr);
        if (::connect(s, reinterpret_cast<sockaddr*>(&dst), sizeof(dst)) == 0) {
            sockaddr_in self{};
            socklen_t len = sizeof(self);
            if (::getsockname(s, reinterpret_cast<sockaddr*>(&self), &len) == 0 &&
                self.sin_addr.s_addr != 0) {
                ::close(s);
                return format_ipv4(ntohl(self.sin_addr.s_addr));
            }
        }
        ::close(s);
    }

    char name[HOST_NAME_MAX + 1] = {0};
    if (::gethostname(name, sizeof(name) - 1) == 0) {
        addrinfo hints{};
        hints.ai_family = AF_INET;
        addrinfo* res = nullptr;
        if (::getaddrinfo(name, nullptr, &hints, &res) == 0 && res) {
            const auto* sin = reinterpret_cast<const sockaddr_in*>(res->ai_addr);
            std::string ip = format_ipv4(ntohl(sin->sin_addr.s_addr));
            ::freeaddrinfo(res);
            return ip;
        }
    }
    return "127.0.0.1";
}

// ---------- NetworkDiscoverer ----------

NetworkDiscoverer::NetworkDiscoverer(Connector& connector, TcpProbe probe)
: connector_(connector),
  probe_(probe ? std::move(probe) : TcpProbe(tcp_port_open)) {}

std::optional<DiscoveredTcpCandidate>
NetworkDiscoverer::probe_host(const std::string& host, uint16_t port, int timeout_ms) const {
    if (!probe_(host, port, timeout_ms)) return std::nullopt;
    try {
        DeviceSnapshot snap = read_device(connector_, ConnectionSpec::tcp(host, port));
        DiscoveredTcpCandidate c;
        c.host = host;
        c.port = port;
        c.node = snap.telemetry;
        log::info("discovered").kv("host", host).kv("port", port);
        return c;
    } catch (const MeshError&) {
        return std::nullopt;
    } catch (const std::exception& e) {
        log::debug("discovery_skip").kv("host", host).kv("reason", e.what());
        return std::nullopt;
    }
}

std::vector<DiscoveredTcpCandidate>
NetworkDiscoverer::scan_hosts(const std::vector<std::string>& hosts, uint16_t port,
                              int timeout_ms, std::size_t parallelism) const {
    std::vector<std::optional<DiscoveredTcpCandidate>> slots(hosts.size());

    const std::size_t workers = std::max<std::size_t>(1, std::min(parallelism, hosts.size()));
    if (workers == 1) {
        for (std::size_t i = 0; i < hosts.size(); ++i)
            slots[i] = probe_host(hosts[i], port, timeout_ms);
    } else {
        std::atomic<std::size_t> next{0};
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            pool.emplace_back([&] {
                for (std::size_t i = next++; i < hosts.size(); i = next++)
                    slots[i] = probe_host(hosts[i], port, timeout_ms);
            });
        }
        for (auto& t : pool) t.join();
    }

    std::vector<DiscoveredTcpCandidate> out;
    for (auto& s : slots)
        if (s) out.push_back(std::move(*s));
    return out;
}

std::vector<DiscoveredTcpCandidate>
NetworkDiscoverer::discover(uint16_t port, int timeout_ms,
                            const std::optional<std::string>& subnet,
                            std::size_t parallelism) const {
    const std::string local = (subnet && !subnet->empty()) ? std::string() : local_ipv4();
    const std::vector<std::string> hosts = discovery_hosts(subnet, local);
    log::debug("discovery_start").kv("hosts", hosts.size()).kv("port", port)
        .kv("parallel", parallelism);
    return scan_hosts(hosts, port, timeout_ms, parallelism);
}

} // namespace meshlink
