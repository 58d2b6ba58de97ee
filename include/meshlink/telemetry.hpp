#pragma once
/**
 * @file telemetry.hpp
 * @brief The normalized records the core publishes: USB port info, node telemetry, snapshots.
 *
 * @details
 * PURPOSE
 * -------
 * Radios report a nested, partially-populated structure whose field names
 * drifted across firmware versions. The normalizer (device_reader.hpp) turns
 * that into the flat records below, and everything downstream (schedulers,
 * CLI output, listeners) only ever sees these.
 *
 * ABSENT IS NOT ZERO
 * ------------------
 * Every telemetry field is std::optional. A radio that does not report its
 * battery has *no* battery level, not a battery level of 0. The JSON views
 * (to_json) omit absent fields, empty strings and empty lists entirely; they
 * never emit null placeholders.
 *
 * JSON KEYS
 * ---------
 * The key names are the wire names external consumers already know:
 *   firmware, node_num, hw_model, my_node_id, node_name, region, role,
 *   route_table_size, channel, channels, ble_mac, ble_name, rssi, snr,
 *   airtime_utilization, last_message, last_sender, last_gateway,
 *   last_message_type, last_message_time, battery_level, battery_voltage,
 *   temperature, uptime
 */

#include "meshlink/connection.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meshlink {

/**
 * @struct UsbPortInfo
 * @brief One serial port candidate found by the port enumerator.
 *
 * Recomputed on every enumeration; never cached beyond a single resolve.
 */
struct UsbPortInfo {
    std::string                device;         ///< Device path, e.g. "/dev/ttyACM0".
    std::optional<std::string> description;
    std::optional<std::string> hwid;
    std::optional<std::string> manufacturer;
    std::optional<std::string> product;
    std::optional<std::string> serial_number;
    std::optional<std::string> location;
    std::optional<uint16_t>    vid;
    std::optional<uint16_t>    pid;
};

/// vid/pid rendered as "0x1a86"; absent fields omitted.
nlohmann::json to_json(const UsbPortInfo& usb);

/**
 * @struct NodeTelemetry
 * @brief Normalized snapshot of what a node reports about itself.
 */
struct NodeTelemetry {
    // Identity
    std::optional<std::string> firmware;
    std::optional<int64_t>     node_num;
    std::optional<std::string> hw_model;
    std::optional<std::string> my_node_id;     ///< Canonical id, lower-cased ("!a1b2c3d4").
    std::optional<std::string> node_name;      ///< Long name, else short name.
    std::optional<std::string> region;
    std::optional<std::string> role;

    // Mesh
    std::optional<int64_t>     route_table_size;
    std::optional<std::string> channel;        ///< Primary channel: first of channels.
    std::vector<std::string>   channels;       ///< Empty means absent.

    // Bluetooth
    std::optional<std::string> ble_mac;
    std::optional<std::string> ble_name;

    // Radio metrics
    std::optional<double>      rssi;
    std::optional<double>      snr;
    std::optional<double>      airtime_utilization;

    // Last received packet
    std::optional<std::string> last_message;
    std::optional<std::string> last_sender;
    std::optional<std::string> last_gateway;
    std::optional<std::string> last_message_type;
    std::optional<int64_t>     last_message_time;

    // Device metrics
    std::optional<double>      battery_level;
    std::optional<double>      battery_voltage;
    std::optional<double>      temperature;
    std::optional<int64_t>     uptime;         ///< Seconds.

    bool operator==(const NodeTelemetry& o) const;
    bool operator!=(const NodeTelemetry& o) const { return !(*this == o); }
};

nlohmann::json to_json(const NodeTelemetry& node);

/**
 * @struct DeviceSnapshot
 * @brief One poll result for one configured connection.
 *
 * The scheduler never fills both telemetry and error: a failed poll sets
 * error and leaves telemetry empty. Each poll replaces the whole snapshot;
 * previous telemetry is not carried over.
 */
struct DeviceSnapshot {
    ConnectionSpec               spec;
    std::optional<ResolvedTransport> transport;  ///< Absent when resolution itself failed.
    std::optional<UsbPortInfo>   usb;            ///< Serial only.
    std::optional<NodeTelemetry> telemetry;
    std::optional<std::string>   error;

    bool ok() const { return !error.has_value(); }

    /**
     * @brief Stable identity across reconnects.
     *
     * Lower-cased canonical node id when telemetry has one; otherwise the
     * transport address ("serial:<path>", "tcp:<host>:<port>"); "unknown" if
     * nothing is known.
     */
    std::string identifier() const;

    /// "Relay One (!a1b2c3d4)", "Relay One", "!a1b2c3d4", "Serial /dev/ttyACM0", ...
    std::string display_name() const;
};

nlohmann::json to_json(const DeviceSnapshot& snap);

/**
 * @struct DiscoveredTcpCandidate
 * @brief A TCP radio found by network discovery. Used to populate a pick list only.
 */
struct DiscoveredTcpCandidate {
    std::string                  host;
    uint16_t                     port{DEFAULT_TCP_PORT};
    std::optional<NodeTelemetry> node;

    /// "Relay One (10.0.0.5:4403)" when the node is named, else "10.0.0.5:4403".
    std::string title() const;
};

nlohmann::json to_json(const DiscoveredTcpCandidate& c);

} // namespace meshlink
