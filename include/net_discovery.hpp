/**
 * @file net_discovery.hpp
 * @brief TCP sweep for network-attached radios.
 *
 * @details
 * PURPOSE
 * -------
 * Finds radios listening on the radio TCP port somewhere on a subnet so the
 * operator does not have to know their addresses. Used by `meshlink --discover`.
 *
 * FLOW
 * ----
 *   hosts = subnet given ? every host of the CIDR
 *                        : every host of local_ipv4()/24
 *   for each host (loopback and 0.0.0.0 skipped):
 *       probe(host, port, timeout)        bare TCP connect
 *       open -> read_device() -> close    full device cycle
 *       -> DiscoveredTcpCandidate{host, port, telemetry}
 *
 * FAILURE POLICY
 * --------------
 * The scan never aborts. A typed MeshError on a host skips it silently (a
 * closed port, a non-radio service that fails the handshake); any other
 * exception skips it with a debug log line. An unparsable or oversized subnet
 * logs a warning and yields no hosts.
 *
 * PARALLELISM
 * -----------
 * Up to @c parallelism hosts are probed at once (default 1). Results keep
 * host order regardless of completion order.
 */
#pragma once

#include "meshlink/connector.hpp"
#include "meshlink/telemetry.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace meshlink {

/// Bare reachability probe: (host, port, timeout_ms) -> port open.
using TcpProbe = std::function<bool(const std::string&, uint16_t, int)>;

/// Smallest prefix length accepted for an explicit subnet (/16 = 65534 hosts).
constexpr int MIN_DISCOVERY_PREFIX = 16;

/**
 * @brief Candidate host addresses, in ascending order.
 *
 * With @p subnet, its usable hosts (network and broadcast excluded, except
 * for /31 and /32). Without, the /24 around @p local_ip. Loopback and
 * 0.0.0.0 are never returned.
 */
std::vector<std::string> discovery_hosts(const std::optional<std::string>& subnet,
                                         const std::string& local_ip);

/// Best-effort primary IPv4 of this host; "127.0.0.1" if nothing better is known.
std::string local_ipv4();

class NetworkDiscoverer {
public:
    explicit NetworkDiscoverer(Connector& connector, TcpProbe probe = TcpProbe());

    std::vector<DiscoveredTcpCandidate>
    discover(uint16_t port = DEFAULT_TCP_PORT,
             int timeout_ms = 500,
             const std::optional<std::string>& subnet = std::nullopt,
             std::size_t parallelism = 1) const;

    /// Sweep an explicit host list (discover() calls this after host expansion).
    std::vector<DiscoveredTcpCandidate>
    scan_hosts(const std::vector<std::string>& hosts, uint16_t port,
               int timeout_ms, std::size_t parallelism) const;

private:
    std::optional<DiscoveredTcpCandidate> probe_host(const std::string& host, uint16_t port,
                                                     int timeout_ms) const;

    Connector& connector_;
    TcpProbe   probe_;
};

} // namespace meshlink
