// ============================================================================
// link_client.cpp — implementation for meshlink/link_client.hpp
// ============================================================================

#include "meshlink/link_client.hpp"
#include "meshlink/errors.hpp"
#include "meshlink/log.hpp"
#include "link_io.hpp"

#include <chrono>
#include <utility>

namespace meshlink {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

static uint8_t cap_bit(Capability c) { return uint8_t(1u << static_cast<uint8_t>(c)); }

// Member of a state document, or null when missing.
static json member(const json& doc, const char* key) {
    auto it = doc.find(key);
    return it == doc.end() ? json() : *it;
}

LinkRadioClient::LinkRadioClient(int fd, std::string peer, const LinkOptions& opts)
: fd_(fd), peer_(std::move(peer)), opts_(opts) {
    try {
        apply_state(exchange(json{{"op", "get_state"}}));
    } catch (const MeshError&) {
        close_link(fd_);
        fd_ = -1;
        throw;
    }
}

LinkRadioClient::~LinkRadioClient() {
    // Owners are expected to call close(); this only covers early unwinds.
    if (fd_ >= 0) close_link(fd_);
}

void LinkRadioClient::apply_state(const json& state) {
    if (!state.is_object())
        throw MeshError(ErrorCode::ConnectionFailed, peer_ + ": bad_state_document");

    my_info_       = member(state, "my_info");
    radio_config_  = member(state, "radio_config");
    nodes_         = member(state, "nodes");
    channels_      = member(state, "channels");
    last_received_ = member(state, "last_received");

    caps_ = 0;
    const json caps = member(state, "capabilities");
    if (caps.is_array()) {
        for (const auto& c : caps) {
            if (!c.is_string()) continue;
            const auto& name = c.get_ref<const std::string&>();
            if (name == "send_text")           caps_ |= cap_bit(Capability::SendText);
            if (name == "reboot")              caps_ |= cap_bit(Capability::Reboot);
            if (name == "set_primary_channel") caps_ |= cap_bit(Capability::SetPrimaryChannel);
        }
    }
}

bool LinkRadioClient::supports(Capability c) const {
    return (caps_ & cap_bit(c)) != 0;
}

// ---------------------------------------------------------------------------
// exchange()
// ----------
// Send one request document and wait for the first frame that parses as a
// JSON object. Other frames (debug text a bridge may print) are skipped.
// Everything shares one deadline so a chatty device cannot stretch the wait.
// ---------------------------------------------------------------------------
json LinkRadioClient::exchange(const json& request) {
    if (fd_ < 0) throw MeshError(ErrorCode::ConnectionFailed, peer_ + ": link_closed");

    const std::string text = request.dump();
    const std::vector<uint8_t> out(text.begin(), text.end());
    if (!write_frame(fd_, out, opts_.io_timeout_ms))
        throw MeshError(ErrorCode::ConnectionFailed, peer_ + ": write_failed");

    const auto deadline = Clock::now() + std::chrono::milliseconds(opts_.io_timeout_ms);
    std::vector<uint8_t> frame;
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (left <= 0 || !read_frame(fd_, frame, static_cast<int>(left)))
            throw MeshError(ErrorCode::ConnectionFailed, peer_ + ": timeout");

        json reply = json::parse(frame.begin(), frame.end(), nullptr, /*allow_exceptions*/false);
        if (reply.is_object()) return reply;
        log::debug("link_frame_skipped").kv("peer", peer_).kv("bytes", frame.size());
    }
}

void LinkRadioClient::expect_ok(const json& request) {
    const json reply = exchange(request);
    const json status = member(reply, "status");
    if (status.is_string() && status.get<std::string>() == "ok") return;

    std::string reason = "bad_reply";
    const json r = member(reply, "reason");
    if (r.is_string()) reason = r.get<std::string>();
    throw MeshError(ErrorCode::ConnectionFailed, peer_ + ": " + reason);
}

void LinkRadioClient::send_text(const std::string& text, const std::optional<std::string>& destination) {
    json req{{"op", "send_text"}, {"text", text}};
    if (destination) req["destination_id"] = *destination;
    expect_ok(req);
}

void LinkRadioClient::reboot() {
    expect_ok(json{{"op", "reboot"}});
}

void LinkRadioClient::set_primary_channel(const std::string& name) {
    expect_ok(json{{"op", "set_primary_channel"}, {"name", name}});
}

void LinkRadioClient::close() {
    int fd = fd_;
    fd_ = -1;
    if (!close_link(fd))
        throw MeshError(ErrorCode::ConnectionFailed, peer_ + ": close_failed");
}

std::unique_ptr<RadioClient> LinkDeviceLibrary::open_serial(const std::string& path) {
    std::string err;
    int fd = meshlink::open_serial(path, opts_.baud, opts_.boot_delay_ms, &err);
    if (fd < 0) throw MeshError(ErrorCode::ConnectionFailed, err);
    return std::make_unique<LinkRadioClient>(fd, path, opts_);
}

std::unique_ptr<RadioClient> LinkDeviceLibrary::open_tcp(const std::string& host, uint16_t port) {
    std::string err;
    int fd = meshlink::open_tcp(host, port, opts_.connect_ms, &err);
    if (fd < 0) throw MeshError(ErrorCode::ConnectionFailed, err);
    return std::make_unique<LinkRadioClient>(fd, host + ":" + std::to_string(port), opts_);
}

} // namespace meshlink
