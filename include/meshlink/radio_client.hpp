#pragma once
/**
 * @file radio_client.hpp
 * @brief Narrow radio-client interface the core programs against, plus the library that opens clients.
 *
 * @details
 * The core never looks inside a radio protocol. It sees a client as a small
 * capability set:
 *
 *   state:    my_info, radio_config, nodes, channels, last_received
 *   commands: send_text, reboot, set_primary_channel (each optional)
 *   lifetime: close
 *
 * State blocks are JSON trees as the radio reported them (null when the
 * client has no such block). The telemetry normalizer walks them with the
 * helpers in field_tree.hpp.
 *
 * Two implementations exist: LinkRadioClient (link_client.hpp) over a real
 * serial/TCP link, and the in-memory fake in tests/fakes.hpp.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace meshlink {

enum class Capability : uint8_t { SendText, Reboot, SetPrimaryChannel };

/// "send_text", "reboot", "set_primary_channel".
const char* capability_name(Capability c);

/**
 * @brief One open session with a radio.
 *
 * Contract:
 *  - State accessors are cheap and never throw; they return what the client
 *    gathered when it opened.
 *  - Command methods may block on I/O and throw MeshError on failure.
 *    Call only when supports() says so.
 *  - close() releases the link. It may throw; callers (TransportHandle)
 *    treat that as best-effort.
 */
class RadioClient {
public:
  virtual ~RadioClient() = default;

  virtual const nlohmann::json& my_info() const = 0;
  virtual const nlohmann::json& radio_config() const = 0;
  virtual const nlohmann::json& nodes() const = 0;
  virtual const nlohmann::json& channels() const = 0;
  virtual const nlohmann::json& last_received() const = 0;

  virtual bool supports(Capability c) const = 0;

  /// @p destination absent means broadcast.
  virtual void send_text(const std::string& text, const std::optional<std::string>& destination) = 0;
  virtual void reboot() = 0;
  virtual void set_primary_channel(const std::string& name) = 0;

  virtual void close() = 0;
};

/**
 * @brief The client library: knows how to open a RadioClient over each transport.
 *
 * open_* throw MeshError(ConnectionFailed, detail) when the link cannot be
 * established (permission, timeout, refused, bad handshake).
 */
class DeviceLibrary {
public:
  virtual ~DeviceLibrary() = default;
  virtual std::unique_ptr<RadioClient> open_serial(const std::string& path) = 0;
  virtual std::unique_ptr<RadioClient> open_tcp(const std::string& host, uint16_t port) = 0;
  virtual const char* name() const = 0;
};

} // namespace meshlink
