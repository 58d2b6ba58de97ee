#pragma once
/**
 * @file device_reader.hpp
 * @brief Telemetry normalizer and one-shot device read.
 *
 * @details
 * normalize() flattens the weakly-typed state a RadioClient exposes into a
 * NodeTelemetry. Source blocks:
 *
 *   my_info        firmware_version, my_node_num, hw_model, my_node_id, region,
 *                  uptime, node_info.{user.{long_name,short_name}, role},
 *                  node_metrics, device_metrics, ble | ble_info
 *   radio_config   preferences.{region, role}
 *   nodes          mapping keyed by node number (or id): route table size and
 *                  the rx_rssi / rx_snr fallback for this node
 *   channels       list of blocks: settings.name, else name
 *   last_received  decoded.{text,payload,data,portnum,rx_time}, from, from_id,
 *                  gateway_id, rx_gateway, portnum, type, rx_time, time
 *
 * Every rule is "first non-absent wins" over the alias table in
 * field_tree.hpp. Missing blocks and wrong-typed values leave the field
 * absent; normalize() never throws. The canonical id is lower-cased.
 */

#include "meshlink/connection.hpp"
#include "meshlink/radio_client.hpp"
#include "meshlink/telemetry.hpp"

namespace meshlink {

class Connector;

NodeTelemetry normalize(const RadioClient& client);

/**
 * @brief Open, normalize, close.
 *
 * Typed open failures propagate unchanged; any other exception from the
 * lower layers is raised as ConnectionFailed(what). The transport is closed
 * on every path.
 */
DeviceSnapshot read_device(Connector& connector, const ConnectionSpec& spec);

} // namespace meshlink
