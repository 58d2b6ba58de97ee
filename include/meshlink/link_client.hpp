#pragma once
/**
 * @file link_client.hpp
 * @brief Production RadioClient: SLIP-framed JSON documents over a serial or TCP link.
 *
 * @details
 * PROTOCOL
 * --------
 * One request, one reply, each a JSON object in its own SLIP frame.
 *
 *   -> {"op":"get_state"}
 *   <- {"my_info":{...}, "radio_config":{...}, "nodes":{...}, "channels":[...],
 *       "last_received":{...}, "capabilities":["send_text","reboot",...]}
 *
 *   -> {"op":"send_text","text":"hi","destination_id":"!a1b2c3d4"}   (destination optional)
 *   -> {"op":"reboot"}
 *   -> {"op":"set_primary_channel","name":"LongFast"}
 *   <- {"status":"ok"}  or  {"status":"error","reason":"..."}
 *
 * The state is fetched once when the client opens, the way a radio library
 * downloads its node database on connect; later accessors return that copy.
 * Frames that are not JSON objects (boot banners, log lines) are skipped while
 * waiting for a reply, until the read deadline passes.
 */

#include "meshlink/radio_client.hpp"

#include <string>

namespace meshlink {

struct LinkOptions {
    int baud          = 115200;
    int boot_delay_ms = 400;    ///< Serial only: settle time after open.
    int connect_ms    = 3000;   ///< TCP connect bound.
    int io_timeout_ms = 5000;   ///< Per request/reply exchange.
};

class LinkRadioClient : public RadioClient {
public:
  /// Takes ownership of @p fd and performs the get_state handshake.
  /// @throws MeshError(ConnectionFailed) if the handshake fails; the fd is closed.
  LinkRadioClient(int fd, std::string peer, const LinkOptions& opts);
  ~LinkRadioClient() override;

  LinkRadioClient(const LinkRadioClient&) = delete;
  LinkRadioClient& operator=(const LinkRadioClient&) = delete;

  const nlohmann::json& my_info() const override       { return my_info_; }
  const nlohmann::json& radio_config() const override  { return radio_config_; }
  const nlohmann::json& nodes() const override         { return nodes_; }
  const nlohmann::json& channels() const override      { return channels_; }
  const nlohmann::json& last_received() const override { return last_received_; }

  bool supports(Capability c) const override;

  void send_text(const std::string& text, const std::optional<std::string>& destination) override;
  void reboot() override;
  void set_primary_channel(const std::string& name) override;

  void close() override;

private:
  void           apply_state(const nlohmann::json& state);
  nlohmann::json exchange(const nlohmann::json& request);
  void           expect_ok(const nlohmann::json& request);

  int         fd_{-1};
  std::string peer_;
  LinkOptions opts_;

  nlohmann::json my_info_;
  nlohmann::json radio_config_;
  nlohmann::json nodes_;
  nlohmann::json channels_;
  nlohmann::json last_received_;
  uint8_t        caps_{0};
};

/**
 * @brief DeviceLibrary backed by LinkRadioClient.
 */
class LinkDeviceLibrary : public DeviceLibrary {
public:
  explicit LinkDeviceLibrary(LinkOptions opts = {}) : opts_(opts) {}

  std::unique_ptr<RadioClient> open_serial(const std::string& path) override;
  std::unique_ptr<RadioClient> open_tcp(const std::string& host, uint16_t port) override;
  const char* name() const override { return "slip-json-link"; }

private:
  LinkOptions opts_;
};

} // namespace meshlink
