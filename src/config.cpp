// ============================================================================
// config.cpp — implementation for meshlink/config.hpp
// ============================================================================

#include "meshlink/config.hpp"
#include "meshlink/errors.hpp"
#include "meshlink/poll_scheduler.hpp"

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace meshlink {

namespace fs = std::filesystem;
using json = nlohmann::json;

// ---------- helpers ----------

[[noreturn]] static void bad(const std::string& what) {
    throw MeshError(ErrorCode::InvalidArgument, "config: " + what);
}

static int get_int(const json& obj, const char* key, int fallback, int lo, int hi) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (!it->is_number_integer()) bad(std::string(key) + " must be an integer");
    const long long v = it->get<long long>();
    if (v < lo || v > hi)
        bad(std::string(key) + " out of range [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
    return static_cast<int>(v);
}

static std::string get_string(const json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (!it->is_string()) bad(std::string(key) + " must be a string");
    return it->get<std::string>();
}

static ConnectionConfig parse_connection(const json& entry, std::size_t index) {
    if (!entry.is_object()) bad("connections[" + std::to_string(index) + "] must be an object");

    ConnectionConfig c;
    c.spec.kind = parse_connection_kind(get_string(entry, "type", "serial"));
    c.spec.serial_port = get_string(entry, "serial_port", AUTODETECT_SERIAL);
    c.spec.tcp_host    = get_string(entry, "tcp_host", "");
    c.spec.tcp_port    = static_cast<uint16_t>(get_int(entry, "tcp_port", DEFAULT_TCP_PORT, 1, 65535));
    if (c.spec.serial_port.empty()) c.spec.serial_port = AUTODETECT_SERIAL;

    c.id = get_string(entry, "id", "");
    if (c.id.empty()) c.id = c.spec.describe();
    return c;
}

// ---------- public ----------

fs::path default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return fs::path(xdg) / "meshlink" / "config.json";
    const char* home = std::getenv("HOME");
    fs::path base = (home && *home) ? fs::path(home) / ".config" : fs::path(".config");
    return base / "meshlink" / "config.json";
}

Config parse_config(const json& doc) {
    if (!doc.is_object()) bad("top level must be an object");

    Config cfg;
    cfg.scan_interval = get_int(doc, "scan_interval", DEFAULT_SCAN_INTERVAL_S,
                                MIN_SCAN_INTERVAL_S, MAX_SCAN_INTERVAL_S);
    cfg.io_timeout_ms = get_int(doc, "io_timeout_ms", cfg.io_timeout_ms, 100, 600000);

    if (auto it = doc.find("ignored_port_prefixes"); it != doc.end() && !it->is_null()) {
        if (!it->is_array()) bad("ignored_port_prefixes must be an array");
        cfg.ignored_port_prefixes.clear();
        for (const auto& p : *it) {
            if (!p.is_string()) bad("ignored_port_prefixes entries must be strings");
            cfg.ignored_port_prefixes.push_back(p.get<std::string>());
        }
    }

    if (auto it = doc.find("connections"); it != doc.end() && !it->is_null()) {
        if (!it->is_array()) bad("connections must be an array");
        std::set<std::string> seen;
        for (std::size_t i = 0; i < it->size(); ++i) {
            ConnectionConfig c = parse_connection((*it)[i], i);
            if (!seen.insert(c.id).second) bad("duplicate connection id: " + c.id);
            cfg.connections.push_back(std::move(c));
        }
    }
    return cfg;
}

Config parse_config_text(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        bad(e.what());
    }
    return parse_config(doc);
}

Config load_config(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return Config{};

    std::ifstream in(path);
    if (!in) bad("cannot read " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_config_text(ss.str());
}

} // namespace meshlink
