#pragma once
/**
 * @file field_tree.hpp
 * @brief Optional key-value tree lookups and the firmware field-alias table.
 *
 * @details
 * PURPOSE
 * -------
 * Radios hand back a nested, weakly-typed document: blocks may be missing,
 * values may be null or of an unexpected type, and the same datum has had
 * several key names across firmware releases. This header is the one place
 * that knows how to walk such a tree without ever failing:
 *
 *   - child()/at_path() return nullptr for anything absent, null, or not an object.
 *   - as_string()/as_number()/as_integer() return std::nullopt for wrong types.
 *   - pick_*() try an ordered alias list and return the first present value.
 *
 * ALIAS TABLE
 * -----------
 * Each canonical Field maps to an ordered list of accepted source keys.
 * Adding support for a renamed firmware field is a one-line edit to the
 * table in field_tree.cpp; nothing else changes.
 *
 * @note Empty strings count as absent. Numeric zero does not.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace meshlink {
namespace tree {

using json = nlohmann::json;

/// Canonical fields that have more than one accepted source key.
enum class Field {
    NodeName,
    BleBlock,
    BleMac,
    BleName,
    Rssi,
    Snr,
    AirtimeUtilization,
    PeerRssi,
    PeerSnr,
    BatteryLevel,
    BatteryVoltage,
    Temperature,
    Uptime,
    MessageText,
    MessageSender,
    MessageGateway,
    MessageType,
    MessageTime
};

using AliasList = std::vector<std::string>;

/// Ordered source keys for @p f, preferred first.
const AliasList& aliases(Field f);

/// Object member @p key of @p node; nullptr if node is not an object or the member is missing/null.
const json* child(const json* node, const std::string& key);

/// Nested lookup: at_path(root, {"node_info", "user"}).
const json* at_path(const json* root, std::initializer_list<const char*> keys);

/// First present member of @p node among @p keys (nullptr if none).
const json* first_child(const json* node, const AliasList& keys);

std::optional<std::string> as_string(const json* v);   ///< Strings (non-empty) and numbers as text.
std::optional<double>      as_number(const json* v);   ///< Any JSON number.
std::optional<int64_t>     as_integer(const json* v);  ///< Integers, or floats with an integral value.

std::optional<std::string> pick_string (const json* node, const AliasList& keys);
std::optional<double>      pick_number (const json* node, const AliasList& keys);
std::optional<int64_t>     pick_integer(const json* node, const AliasList& keys);

inline std::optional<std::string> pick_string (const json* node, Field f) { return pick_string(node, aliases(f)); }
inline std::optional<double>      pick_number (const json* node, Field f) { return pick_number(node, aliases(f)); }
inline std::optional<int64_t>     pick_integer(const json* node, Field f) { return pick_integer(node, aliases(f)); }

/// @p a if present, else @p b.
template <typename T>
std::optional<T> first_of(const std::optional<T>& a, const std::optional<T>& b) {
    return a ? a : b;
}

} // namespace tree
} // namespace meshlink
