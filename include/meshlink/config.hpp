#pragma once
/**
 * @file config.hpp
 * @brief JSON configuration file: poll interval, link timeout, port filter, connections.
 *
 * @details
 * Location: $XDG_CONFIG_HOME/meshlink/config.json, falling back to
 * $HOME/.config/meshlink/config.json.
 *
 *   {
 *     "scan_interval": 30,
 *     "io_timeout_ms": 5000,
 *     "ignored_port_prefixes": ["/dev/ttyS"],
 *     "connections": [
 *       {"id": "shack", "type": "serial", "serial_port": "auto"},
 *       {"id": "roof",  "type": "tcp", "tcp_host": "10.0.0.5", "tcp_port": 4403}
 *     ]
 *   }
 *
 * Every key is optional. A missing file yields the defaults and no
 * connections. Malformed JSON, wrong value types, out-of-range numbers and
 * duplicate ids raise MeshError(InvalidArgument, "config: ..."); an unknown
 * connection "type" raises MeshError(InvalidConnectionKind).
 */

#include "meshlink/connection.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace meshlink {

struct ConnectionConfig {
    std::string    id;     ///< Defaults to spec.describe() when the file omits it.
    ConnectionSpec spec;
};

struct Config {
    int scan_interval{30};
    int io_timeout_ms{5000};
    std::vector<std::string>      ignored_port_prefixes{"/dev/ttyS"};
    std::vector<ConnectionConfig> connections;
};

std::filesystem::path default_config_path();

Config parse_config(const nlohmann::json& doc);
Config parse_config_text(const std::string& text);

/// Missing file -> Config{}. @throws MeshError(InvalidArgument) if unreadable or malformed.
Config load_config(const std::filesystem::path& path);

} // namespace meshlink
