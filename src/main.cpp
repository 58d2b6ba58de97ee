/**
 * @file main.cpp
 * @brief meshlink CLI: list ports, discover TCP radios, read telemetry, watch, send commands.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); exactly one mode per invocation.
 *  - Load the JSON config; CLI flags override single-connection settings.
 *  - Pick the target connection (--dev / --host, else --entry, else the only
 *    configured one, else serial autodetect when nothing is configured).
 *  - Print results on stdout as one-line key=value summaries or JSON;
 *    errors go to stderr as `status=error reason=...`.
 *
 * Exit codes:
 *   0 ok, 1 connection/transport failure, 2 usage or invalid argument,
 *   3 not ready, 4 unsupported operation, 5 connection selector error.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "commands.hpp"
#include "meshlink/config.hpp"
#include "meshlink/connector.hpp"
#include "meshlink/device_reader.hpp"
#include "meshlink/errors.hpp"
#include "meshlink/link_client.hpp"
#include "meshlink/log.hpp"
#include "meshlink/poll_scheduler.hpp"
#include "meshlink/registry.hpp"
#include "net_discovery.hpp"
#include "port_enumerator.hpp"

using json = nlohmann::json;
using namespace meshlink;

// ---------- small utilities ----------

static std::atomic<bool> g_interrupted{false};

static void on_signal(int) { g_interrupted = true; }

static int exit_code_for(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidArgument:
    case ErrorCode::InvalidConnectionKind: return 2;
    case ErrorCode::NotReady:              return 3;
    case ErrorCode::UnsupportedOperation:  return 4;
    case ErrorCode::UnknownConnection:
    case ErrorCode::NoConnections:
    case ErrorCode::AmbiguousConnection:   return 5;
    default:                               return 1;
  }
}

// Scalar JSON values as bare text; arrays joined with ','.
static std::string flat(const json& v) {
  if (v.is_string()) return v.get<std::string>();
  if (v.is_array()) {
    std::string out;
    for (const auto& e : v) {
      if (!out.empty()) out += ',';
      out += flat(e);
    }
    return out;
  }
  return v.dump();
}

static std::string kv_line(const json& obj) {
  std::ostringstream os;
  bool first = true;
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    if (it->is_object()) continue;
    os << (first ? "" : " ") << it.key() << '=' << flat(*it);
    first = false;
  }
  return os.str();
}

static std::string snapshot_line(const DeviceSnapshot& s) {
  std::ostringstream os;
  os << "status=" << (s.ok() ? "ok" : "error")
     << " target=" << s.identifier()
     << " name=\"" << s.display_name() << "\"";
  if (s.error) os << " reason=" << *s.error;
  if (s.telemetry) {
    const std::string rest = kv_line(to_json(*s.telemetry));
    if (!rest.empty()) os << ' ' << rest;
  }
  return os.str();
}

struct Output {
  bool json_mode{false};
  std::mutex mu;

  void emit(const json& j, const std::string& pretty) {
    std::lock_guard<std::mutex> lk(mu);
    if (json_mode) std::cout << j.dump(2) << "\n";
    else           std::cout << pretty << "\n";
    std::cout.flush();
  }
};

// Single connection chosen for one-shot modes. Mirrors ConnectionRegistry::resolve().
static ConnectionConfig select_target(const std::vector<ConnectionConfig>& conns,
                                      const std::string& entry) {
  if (!entry.empty()) {
    for (const auto& c : conns)
      if (c.id == entry) return c;
    throw MeshError(ErrorCode::UnknownConnection, entry);
  }
  if (conns.empty()) throw MeshError(ErrorCode::NoConnections);
  if (conns.size() > 1) throw MeshError(ErrorCode::AmbiguousConnection);
  return conns.front();
}

// ---------- main ----------

int main(int argc, char** argv) {
  // modes
  bool do_ports = false, do_discover = false, do_read = false, do_watch = false;
  bool do_reboot = false, do_refresh = false;
  std::string send_text, set_channel_name;

  // discovery
  std::string subnet;
  int tcp_scan_port = DEFAULT_TCP_PORT;
  int probe_timeout_ms = 500;
  int parallel = 1;

  // targeting
  std::string dev, host, entry, to;
  int port = DEFAULT_TCP_PORT;

  // settings
  std::string config_path = default_config_path().string();
  std::string format = "pretty";
  int interval_s = 0, timeout_ms = 0;
  bool verbose = false, quiet = false;

  CLI::App app{"meshlink: mesh radio link, telemetry and commands"};

  app.add_flag("--ports",    do_ports,    "List serial ports that look like radios");
  app.add_flag("--discover", do_discover, "Scan a subnet for radios on the TCP port");
  app.add_flag("--read",     do_read,     "Read telemetry once and print it");
  app.add_flag("--watch",    do_watch,    "Poll configured connections until interrupted");
  app.add_option("--send",   send_text,   "Send a text message");
  app.add_flag("--reboot",   do_reboot,   "Reboot the radio");
  app.add_option("--set-channel", set_channel_name, "Rename the primary channel");
  app.add_flag("--refresh",  do_refresh,  "Set up the connection, force a poll, print the result");

  app.add_option("--subnet", subnet, "Discovery subnet in CIDR form (default: local /24)");
  app.add_option("--tcp-port", tcp_scan_port, "Discovery TCP port")->capture_default_str()
     ->check(CLI::Range(1, 65535));
  app.add_option("--probe-timeout", probe_timeout_ms, "Discovery connect timeout (ms)")
     ->capture_default_str()->check(CLI::Range(1, 60000));
  app.add_option("--parallel", parallel, "Concurrent discovery probes")->capture_default_str()
     ->check(CLI::Range(1, 256));

  CLI::Option* opt_dev  = app.add_option("--dev", dev, "Serial device path, or 'auto'");
  CLI::Option* opt_host = app.add_option("--host", host, "Radio TCP host");
  app.add_option("--port", port, "Radio TCP port")->capture_default_str()->check(CLI::Range(1, 65535));
  app.add_option("--entry", entry, "Configured connection id");
  app.add_option("--to", to, "With --send: destination node id (default broadcast)");
  opt_dev->excludes(opt_host);

  app.add_option("--config", config_path, "Config file")->capture_default_str();
  app.add_option("--format", format, "Output format: pretty|json")->check(CLI::IsMember({"pretty", "json"}));
  app.add_option("--interval", interval_s, "Poll interval in seconds [10, 3600]");
  app.add_option("--timeout", timeout_ms, "Link read timeout (ms)")->check(CLI::Range(100, 600000));
  app.add_flag("--verbose", verbose, "Debug logging on stderr");
  app.add_flag("--quiet", quiet, "Errors only on stderr");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  if (verbose)    log::set_level(log::Level::Debug);
  else if (quiet) log::set_level(log::Level::Error);

  // -------- choose exactly one mode --------
  int modes = 0;
  modes += do_ports ? 1 : 0;
  modes += do_discover ? 1 : 0;
  modes += do_read ? 1 : 0;
  modes += do_watch ? 1 : 0;
  modes += !send_text.empty() ? 1 : 0;
  modes += do_reboot ? 1 : 0;
  modes += !set_channel_name.empty() ? 1 : 0;
  modes += do_refresh ? 1 : 0;
  if (modes != 1) {
    std::cerr << "status=error reason=need_exactly_one_mode\n";
    return 2;
  }

  Output out;
  out.json_mode = (format == "json");

  try {
    Config cfg = load_config(config_path);
    if (interval_s != 0) {
      validate_scan_interval(interval_s);
      cfg.scan_interval = interval_s;
    }
    if (timeout_ms != 0) cfg.io_timeout_ms = timeout_ms;

    // CLI targeting replaces the configured connection list.
    if (opt_dev->count() > 0 || opt_host->count() > 0) {
      ConnectionConfig c;
      c.spec = opt_host->count() > 0 ? ConnectionSpec::tcp(host, static_cast<uint16_t>(port))
                                     : ConnectionSpec::serial(dev.empty() ? AUTODETECT_SERIAL : dev);
      c.id = "cli";
      cfg.connections = {c};
      if (!entry.empty() && entry != c.id) entry.clear();
    } else if (cfg.connections.empty()) {
      cfg.connections.push_back(ConnectionConfig{"auto", ConnectionSpec::serial()});
    }

    LinkOptions link;
    link.io_timeout_ms = cfg.io_timeout_ms;

    PortEnumerator ports(std::make_shared<SysfsPortBackend>(), cfg.ignored_port_prefixes);
    Connector connector(ports, std::make_shared<LinkDeviceLibrary>(link));

    // -------- ports --------
    if (do_ports) {
      std::vector<UsbPortInfo> found;
      try {
        found = ports.list_ports();
      } catch (const MeshError& e) {
        log::warn("port_listing_failed").kv("reason", e.what());
      }
      json arr = json::array();
      std::string lines;
      for (const auto& p : found) {
        arr.push_back(to_json(p));
        lines += (lines.empty() ? "" : "\n") + kv_line(to_json(p));
      }
      out.emit(arr, lines.empty() ? "status=ok ports=0" : lines);
      return 0;
    }

    // -------- discover --------
    if (do_discover) {
      NetworkDiscoverer discoverer(connector);
      auto found = discoverer.discover(static_cast<uint16_t>(tcp_scan_port), probe_timeout_ms,
                                       subnet.empty() ? std::nullopt : std::optional<std::string>(subnet),
                                       static_cast<std::size_t>(parallel));
      json arr = json::array();
      std::string lines;
      for (const auto& c : found) {
        arr.push_back(to_json(c));
        lines += (lines.empty() ? "" : "\n") + ("host=" + c.host + " port=" +
                 std::to_string(c.port) + " title=\"" + c.title() + "\"");
      }
      out.emit(arr, lines.empty() ? "status=ok candidates=0" : lines);
      return 0;
    }

    // -------- watch: every configured connection, until SIGINT/SIGTERM --------
    if (do_watch) {
      std::signal(SIGINT, on_signal);
      std::signal(SIGTERM, on_signal);

      ConnectionRegistry registry(connector);
      auto attach = [&](const std::string& id, const std::shared_ptr<const DeviceSnapshot>& first) {
        out.emit(to_json(*first), snapshot_line(*first));
        registry.resolve(id)->scheduler->add_listener([&out](const DeviceSnapshot& s) {
          out.emit(to_json(s), snapshot_line(s));
        });
      };

      bool matched = false;
      for (const auto& c : cfg.connections) {
        if (!entry.empty() && c.id != entry) continue;
        matched = true;
        if (auto first = registry.setup_or_defer(c.id, c.spec, cfg.scan_interval)) attach(c.id, first);
      }
      if (!matched) throw MeshError(ErrorCode::UnknownConnection, entry);
      // Parked radios are retried below, but something has to be up to start watching.
      if (registry.ids().empty()) throw MeshError(ErrorCode::NotReady, "no connection came up");

      using steady = std::chrono::steady_clock;
      const auto retry_every = std::chrono::seconds(cfg.scan_interval);
      auto next_retry = steady::now() + retry_every;
      while (!g_interrupted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (steady::now() < next_retry || registry.pending_ids().empty()) continue;
        for (const auto& up : registry.retry_pending()) attach(up.first, up.second);
        next_retry = steady::now() + retry_every;
      }
      registry.teardown_all();
      return 0;
    }

    const ConnectionConfig target = select_target(cfg.connections, entry);

    // -------- read --------
    if (do_read) {
      DeviceSnapshot snap = read_device(connector, target.spec);
      out.emit(to_json(snap), snapshot_line(snap));
      return 0;
    }

    // -------- refresh: through the registry's service table --------
    if (do_refresh) {
      ConnectionRegistry registry(connector);
      registry.setup(target.id, target.spec, cfg.scan_interval);
      json r = registry.call("refresh", json{{"entry_id", target.id}});
      auto conn = registry.resolve(target.id);
      const auto wait = std::chrono::milliseconds(2 * cfg.io_timeout_ms + 5000);
      if (!conn->scheduler->wait_for_generation(r["generation"].get<uint64_t>(), wait))
        throw MeshError(ErrorCode::ConnectionFailed, "refresh timed out");
      auto snap = conn->scheduler->latest();
      out.emit(to_json(*snap), snapshot_line(*snap));
      return snap->ok() ? 0 : 1;
    }

    // -------- commands --------
    if (!send_text.empty()) {
      send_message(connector, target.spec, send_text,
                   to.empty() ? std::nullopt : std::optional<std::string>(to));
    } else if (do_reboot) {
      reboot(connector, target.spec);
    } else {
      set_channel(connector, target.spec, set_channel_name);
    }
    out.emit(json{{"status", "ok"}, {"target", target.spec.describe()}},
             "status=ok target=" + target.spec.describe());
    return 0;

  } catch (const MeshError& e) {
    std::cerr << "status=error reason=" << e.what() << "\n";
    return exit_code_for(e.code());
  } catch (const std::exception& e) {
    std::cerr << "status=error reason=" << e.what() << "\n";
    return 1;
  }
}
