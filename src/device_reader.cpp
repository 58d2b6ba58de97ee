// ============================================================================
// device_reader.cpp — implementation for meshlink/device_reader.hpp
// ============================================================================

#include "meshlink/device_reader.hpp"
#include "meshlink/connector.hpp"
#include "meshlink/field_tree.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace meshlink {

using tree::json;
using tree::Field;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/// Known-node mapping entry for this node: by number first, then by id.
const json* own_node_entry(const json& nodes, const NodeTelemetry& t) {
    if (!nodes.is_object()) return nullptr;
    if (t.node_num) {
        if (const json* e = tree::child(&nodes, std::to_string(*t.node_num))) return e;
    }
    if (t.my_node_id) {
        if (const json* e = tree::child(&nodes, *t.my_node_id)) return e;
        // Ids arrive as "!A1B2C3D4" on some firmware; we keep them lower-cased.
        for (auto it = nodes.begin(); it != nodes.end(); ++it) {
            if (lower(it.key()) == *t.my_node_id && !it.value().is_null()) return &it.value();
        }
    }
    return nullptr;
}

std::vector<std::string> channel_names(const json& channels) {
    std::vector<std::string> out;
    if (!channels.is_array()) return out;
    for (const auto& block : channels) {
        std::optional<std::string> name = tree::first_of(
            tree::as_string(tree::at_path(&block, {"settings", "name"})),
            tree::as_string(tree::child(&block, "name")));
        if (name) out.push_back(*name);
    }
    return out;
}

} // namespace

NodeTelemetry normalize(const RadioClient& client) {
    NodeTelemetry t;

    const json* info   = &client.my_info();
    const json* prefs  = tree::child(&client.radio_config(), "preferences");
    const json& nodes  = client.nodes();
    const json* last   = &client.last_received();

    // ---- identity ----
    t.firmware  = tree::as_string(tree::child(info, "firmware_version"));
    t.node_num  = tree::as_integer(tree::child(info, "my_node_num"));
    t.hw_model  = tree::as_string(tree::child(info, "hw_model"));
    if (auto id = tree::as_string(tree::child(info, "my_node_id"))) t.my_node_id = lower(*id);

    const json* node_info = tree::child(info, "node_info");
    t.node_name = tree::pick_string(tree::child(node_info, "user"), Field::NodeName);
    t.region    = tree::first_of(tree::as_string(tree::child(info, "region")),
                                 tree::as_string(tree::child(prefs, "region")));
    t.role      = tree::first_of(tree::as_string(tree::child(prefs, "role")),
                                 tree::as_string(tree::child(node_info, "role")));

    // ---- mesh ----
    if (nodes.is_object() || nodes.is_array())
        t.route_table_size = static_cast<int64_t>(nodes.size());

    t.channels = channel_names(client.channels());
    if (!t.channels.empty()) t.channel = t.channels.front();

    // ---- bluetooth ----
    const json* ble = tree::first_child(info, tree::aliases(Field::BleBlock));
    if (ble && ble->is_object()) {
        t.ble_mac  = tree::pick_string(ble, Field::BleMac);
        t.ble_name = tree::pick_string(ble, Field::BleName);
    }

    // ---- radio metrics ----
    const json* metrics = tree::child(info, "node_metrics");
    t.rssi                = tree::pick_number(metrics, Field::Rssi);
    t.snr                 = tree::pick_number(metrics, Field::Snr);
    t.airtime_utilization = tree::pick_number(metrics, Field::AirtimeUtilization);

    if (!t.rssi || !t.snr) {
        if (const json* peer = own_node_entry(nodes, t)) {
            if (!t.rssi) t.rssi = tree::pick_number(peer, Field::PeerRssi);
            if (!t.snr)  t.snr  = tree::pick_number(peer, Field::PeerSnr);
        }
    }

    // ---- device metrics ----
    const json* dev = tree::child(info, "device_metrics");
    t.battery_level   = tree::pick_number(dev, Field::BatteryLevel);
    t.battery_voltage = tree::pick_number(dev, Field::BatteryVoltage);
    t.temperature     = tree::pick_number(dev, Field::Temperature);
    t.uptime          = tree::first_of(tree::as_integer(tree::child(info, "uptime")),
                                       tree::pick_integer(dev, Field::Uptime));

    // ---- last received packet ----
    const json* decoded = tree::child(last, "decoded");
    t.last_message      = tree::pick_string(decoded, Field::MessageText);
    t.last_sender       = tree::pick_string(last, Field::MessageSender);
    t.last_gateway      = tree::pick_string(last, Field::MessageGateway);
    t.last_message_type = tree::first_of(tree::as_string(tree::child(decoded, "portnum")),
                                         tree::pick_string(last, Field::MessageType));
    t.last_message_time = tree::first_of(tree::as_integer(tree::child(decoded, "rx_time")),
                                         tree::pick_integer(last, Field::MessageTime));
    return t;
}

DeviceSnapshot read_device(Connector& connector, const ConnectionSpec& spec) {
    DeviceSnapshot snap;
    snap.spec = spec;
    connector.with_transport(spec, [&](TransportHandle& h) {
        snap.transport = h.resolved();
        snap.usb       = h.usb();
        snap.telemetry = normalize(h.client());
    });
    return snap;
}

} // namespace meshlink
