#pragma once
/**
 * @file connection.hpp
 * @brief How to reach a radio: connection kinds, specs, and the resolved transport address.
 *
 * @details
 * A ConnectionSpec identifies *how* to reach a radio, never *which* radio.
 * Identity comes from telemetry (the canonical node id). A spec is built
 * from configuration and stays fixed for the lifetime of a scheduler.
 *
 * ResolvedTransport is what the resolver actually used: the concrete serial
 * path picked for "auto", or the tcp host/port with the default port filled
 * in. It is echoed into every DeviceSnapshot.
 */

#include <cstdint>
#include <string>

namespace meshlink {

/// Conventional TCP port radios listen on.
static constexpr uint16_t DEFAULT_TCP_PORT = 4403;

/// Serial port value meaning "pick the first matching radio port".
static constexpr const char* AUTODETECT_SERIAL = "auto";

enum class ConnectionKind { Serial, Tcp };

/// "serial" / "tcp".
const char* connection_kind_name(ConnectionKind kind);

/**
 * @brief Parse a configuration string into a kind.
 * @throws MeshError(InvalidConnectionKind) for anything but "serial"/"tcp".
 */
ConnectionKind parse_connection_kind(const std::string& s);

struct ConnectionSpec {
    ConnectionKind kind{ConnectionKind::Serial};
    std::string    serial_port{AUTODETECT_SERIAL};  ///< Serial: device path or "auto".
    std::string    tcp_host;                        ///< Tcp: host name or address.
    uint16_t       tcp_port{DEFAULT_TCP_PORT};      ///< Tcp: 0 means DEFAULT_TCP_PORT.

    static ConnectionSpec serial(const std::string& port = AUTODETECT_SERIAL);
    static ConnectionSpec tcp(const std::string& host, uint16_t port = DEFAULT_TCP_PORT);

    bool is_autodetect() const;

    /// tcp_port with 0 mapped to the default.
    uint16_t effective_tcp_port() const;

    /// "serial:auto", "serial:/dev/ttyACM0", "tcp:10.0.0.5:4403".
    std::string describe() const;
};

struct ResolvedTransport {
    ConnectionKind kind{ConnectionKind::Serial};
    std::string    serial_port;  ///< Serial: path actually opened.
    std::string    tcp_host;
    uint16_t       tcp_port{0};

    /// Key naming the physical resource ("serial:/dev/ttyACM0", "tcp:host:port").
    std::string key() const;
};

} // namespace meshlink
