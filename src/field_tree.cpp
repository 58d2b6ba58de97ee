// ============================================================================
// field_tree.cpp — implementation for meshlink/field_tree.hpp
// ============================================================================

#include "meshlink/field_tree.hpp"

#include <cmath>
#include <limits>
#include <map>

namespace meshlink {
namespace tree {

// ---------------------------------------------------------------------------
// Alias table.
// Order matters: the first key present in the source block wins. Older
// firmware used the later names; keep them, newer releases still omit
// fields they consider unchanged.
// ---------------------------------------------------------------------------
static const std::map<Field, AliasList>& table() {
    static const std::map<Field, AliasList> t = {
        {Field::NodeName,           {"long_name", "short_name"}},
        {Field::BleBlock,           {"ble", "ble_info"}},
        {Field::BleMac,             {"macaddr", "address", "mac"}},
        {Field::BleName,            {"name", "hostname"}},
        {Field::Rssi,               {"rssi", "rx_rssi", "last_heard_rssi"}},
        {Field::Snr,                {"snr", "rx_snr", "last_heard_snr"}},
        {Field::AirtimeUtilization, {"air_util_tx", "air_util", "airtime"}},
        {Field::PeerRssi,           {"rx_rssi"}},
        {Field::PeerSnr,            {"rx_snr"}},
        {Field::BatteryLevel,       {"battery_level"}},
        {Field::BatteryVoltage,     {"voltage", "battery_voltage"}},
        {Field::Temperature,        {"temperature"}},
        {Field::Uptime,             {"uptime", "uptime_seconds"}},
        {Field::MessageText,        {"text", "payload", "data"}},
        {Field::MessageSender,      {"from", "from_id"}},
        {Field::MessageGateway,     {"gateway_id", "rx_gateway"}},
        {Field::MessageType,        {"portnum", "type"}},
        {Field::MessageTime,        {"rx_time", "time"}},
    };
    return t;
}

const AliasList& aliases(Field f) {
    static const AliasList none;
    auto it = table().find(f);
    return it == table().end() ? none : it->second;
}

const json* child(const json* node, const std::string& key) {
    if (!node || !node->is_object()) return nullptr;
    auto it = node->find(key);
    if (it == node->end() || it->is_null()) return nullptr;
    return &*it;
}

const json* at_path(const json* root, std::initializer_list<const char*> keys) {
    const json* cur = root;
    for (const char* k : keys) {
        cur = child(cur, k);
        if (!cur) return nullptr;
    }
    return cur;
}

const json* first_child(const json* node, const AliasList& keys) {
    for (const auto& k : keys) {
        if (const json* v = child(node, k)) return v;
    }
    return nullptr;
}

std::optional<std::string> as_string(const json* v) {
    if (!v) return std::nullopt;
    if (v->is_string()) {
        const auto& s = v->get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        return s;
    }
    if (v->is_number_integer())  return std::to_string(v->get<int64_t>());
    if (v->is_number_unsigned()) return std::to_string(v->get<uint64_t>());
    if (v->is_number_float())    return v->dump();
    return std::nullopt;
}

std::optional<double> as_number(const json* v) {
    if (!v || !v->is_number()) return std::nullopt;
    return v->get<double>();
}

std::optional<int64_t> as_integer(const json* v) {
    if (!v || !v->is_number()) return std::nullopt;
    if (v->is_number_float()) {
        // int64 holds [-2^63, 2^63); both bounds are exact doubles.
        constexpr double lo = -9223372036854775808.0;
        constexpr double hi =  9223372036854775808.0;
        double d = v->get<double>();
        if (!std::isfinite(d) || d != std::floor(d) || d < lo || d >= hi) return std::nullopt;
        return static_cast<int64_t>(d);
    }
    if (v->is_number_unsigned()) {
        const uint64_t u = v->get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
        return static_cast<int64_t>(u);
    }
    return v->get<int64_t>();
}

// The pick_* helpers skip keys whose value has the wrong type instead of
// stopping there; a later alias with a usable value still wins.
std::optional<std::string> pick_string(const json* node, const AliasList& keys) {
    for (const auto& k : keys) {
        if (auto s = as_string(child(node, k))) return s;
    }
    return std::nullopt;
}

std::optional<double> pick_number(const json* node, const AliasList& keys) {
    for (const auto& k : keys) {
        if (auto d = as_number(child(node, k))) return d;
    }
    return std::nullopt;
}

std::optional<int64_t> pick_integer(const json* node, const AliasList& keys) {
    for (const auto& k : keys) {
        if (auto i = as_integer(child(node, k))) return i;
    }
    return std::nullopt;
}

} // namespace tree
} // namespace meshlink
