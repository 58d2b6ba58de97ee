// ============================================================================
// telemetry.cpp — implementation for meshlink/telemetry.hpp
// ============================================================================

#include "meshlink/telemetry.hpp"

#include <cctype>
#include <cstdio>

namespace meshlink {

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// put()
// -----
// Add key=value to a JSON object only when the value is present. Strings
// and lists also count as absent when empty, so a view never shows "" or [].
// ---------------------------------------------------------------------------
template <typename T>
static void put(json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

static void put(json& j, const char* key, const std::optional<std::string>& v) {
    if (v && !v->empty()) j[key] = *v;
}

static void put(json& j, const char* key, const std::vector<std::string>& v) {
    if (!v.empty()) j[key] = v;
}

static std::string hex16(uint16_t v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%04x", (unsigned)v);
    return buf;
}

static std::string lower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

json to_json(const UsbPortInfo& usb) {
    json j = json::object();
    j["device"] = usb.device;
    put(j, "description",   usb.description);
    put(j, "hwid",          usb.hwid);
    put(j, "manufacturer",  usb.manufacturer);
    put(j, "product",       usb.product);
    put(j, "serial_number", usb.serial_number);
    put(j, "location",      usb.location);
    if (usb.vid) j["vid"] = hex16(*usb.vid);
    if (usb.pid) j["pid"] = hex16(*usb.pid);
    return j;
}

bool NodeTelemetry::operator==(const NodeTelemetry& o) const {
    return firmware == o.firmware && node_num == o.node_num && hw_model == o.hw_model
        && my_node_id == o.my_node_id && node_name == o.node_name
        && region == o.region && role == o.role
        && route_table_size == o.route_table_size
        && channel == o.channel && channels == o.channels
        && ble_mac == o.ble_mac && ble_name == o.ble_name
        && rssi == o.rssi && snr == o.snr
        && airtime_utilization == o.airtime_utilization
        && last_message == o.last_message && last_sender == o.last_sender
        && last_gateway == o.last_gateway
        && last_message_type == o.last_message_type
        && last_message_time == o.last_message_time
        && battery_level == o.battery_level && battery_voltage == o.battery_voltage
        && temperature == o.temperature && uptime == o.uptime;
}

json to_json(const NodeTelemetry& n) {
    json j = json::object();
    put(j, "firmware",            n.firmware);
    put(j, "node_num",            n.node_num);
    put(j, "hw_model",            n.hw_model);
    put(j, "my_node_id",          n.my_node_id);
    put(j, "node_name",           n.node_name);
    put(j, "region",              n.region);
    put(j, "role",                n.role);
    put(j, "route_table_size",    n.route_table_size);
    put(j, "channel",             n.channel);
    put(j, "channels",            n.channels);
    put(j, "ble_mac",             n.ble_mac);
    put(j, "ble_name",            n.ble_name);
    put(j, "rssi",                n.rssi);
    put(j, "snr",                 n.snr);
    put(j, "airtime_utilization", n.airtime_utilization);
    put(j, "last_message",        n.last_message);
    put(j, "last_sender",         n.last_sender);
    put(j, "last_gateway",        n.last_gateway);
    put(j, "last_message_type",   n.last_message_type);
    put(j, "last_message_time",   n.last_message_time);
    put(j, "battery_level",       n.battery_level);
    put(j, "battery_voltage",     n.battery_voltage);
    put(j, "temperature",         n.temperature);
    put(j, "uptime",              n.uptime);
    return j;
}

std::string DeviceSnapshot::identifier() const {
    if (telemetry && telemetry->my_node_id && !telemetry->my_node_id->empty())
        return lower(*telemetry->my_node_id);
    if (transport) {
        if (transport->kind == ConnectionKind::Serial && !transport->serial_port.empty())
            return transport->key();
        if (transport->kind == ConnectionKind::Tcp && !transport->tcp_host.empty())
            return transport->key();
    }
    // Resolution never happened; use the configured address if it is concrete.
    if (spec.kind == ConnectionKind::Serial && !spec.is_autodetect())
        return "serial:" + spec.serial_port;
    if (spec.kind == ConnectionKind::Tcp && !spec.tcp_host.empty())
        return spec.describe();
    return "unknown";
}

std::string DeviceSnapshot::display_name() const {
    const std::optional<std::string> name = telemetry ? telemetry->node_name : std::nullopt;
    const std::optional<std::string> id   = telemetry ? telemetry->my_node_id : std::nullopt;
    const bool has_name = name && !name->empty();
    const bool has_id   = id && !id->empty();

    if (has_name && has_id) return *name + " (" + *id + ")";
    if (has_name)           return *name;
    if (has_id)             return *id;

    if (spec.kind == ConnectionKind::Serial) {
        std::string path = transport ? transport->serial_port : std::string();
        if (path.empty() && !spec.is_autodetect()) path = spec.serial_port;
        if (!path.empty()) return "Serial " + path;
    } else if (spec.kind == ConnectionKind::Tcp && !spec.tcp_host.empty()) {
        return "TCP " + spec.tcp_host + ":" + std::to_string(spec.effective_tcp_port());
    }
    return "Meshtastic";
}

json to_json(const DeviceSnapshot& s) {
    json j = json::object();
    j["connection_type"] = connection_kind_name(s.spec.kind);
    if (s.transport) {
        if (!s.transport->serial_port.empty()) j["serial_port"] = s.transport->serial_port;
        if (!s.transport->tcp_host.empty())    j["tcp_host"]    = s.transport->tcp_host;
        if (s.transport->tcp_port)             j["tcp_port"]    = s.transport->tcp_port;
    }
    if (s.usb)       j["usb"]   = to_json(*s.usb);
    if (s.telemetry) j["node"]  = to_json(*s.telemetry);
    if (s.error && !s.error->empty()) j["error"] = *s.error;
    return j;
}

std::string DiscoveredTcpCandidate::title() const {
    const std::string addr = host + ":" + std::to_string(port);
    if (node) {
        if (node->node_name && !node->node_name->empty())
            return *node->node_name + " (" + addr + ")";
        if (node->my_node_id && !node->my_node_id->empty())
            return *node->my_node_id + " (" + addr + ")";
    }
    return addr;
}

json to_json(const DiscoveredTcpCandidate& c) {
    json j = json::object();
    j["host"]  = c.host;
    j["port"]  = c.port;
    j["title"] = c.title();
    if (c.node) j["node"] = to_json(*c.node);
    return j;
}

} // namespace meshlink
