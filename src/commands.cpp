#include "commands.hpp"   // Our own header: the three outbound commands

#include "meshlink/errors.hpp"
#include "meshlink/log.hpp"

#include <cctype>         // std::isspace for blank checks

#include <nlohmann/json.hpp>


namespace meshlink {
// ============================================================================
// Helpers
// ============================================================================

bool is_blank(const std::string& s) {
    for (unsigned char c : s)
        if (!std::isspace(c)) return false;
    return true;
}

// ---------------------------------------------------------------------------
// Text fields travel inside JSON documents on the link; a string that is not
// valid UTF-8 cannot be serialized there, so it is refused up front.
// ---------------------------------------------------------------------------
static void require_utf8(const std::string& s, const char* field) {
    try {
        (void)nlohmann::json(s).dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::type_error&) {
        throw MeshError(ErrorCode::InvalidArgument, std::string(field) + " is not valid UTF-8");
    }
}

// ---------------------------------------------------------------------------
// Capability gate. Runs with the transport open: capabilities are a property
// of the connected firmware, not of the configuration.
// ---------------------------------------------------------------------------
static void require(const RadioClient& client, Capability cap) {
    if (!client.supports(cap))
        throw MeshError(ErrorCode::UnsupportedOperation, capability_name(cap));
}

// ============================================================================
// Commands
// ============================================================================

void send_message(Connector& connector, const ConnectionSpec& spec,
                  const std::string& message,
                  const std::optional<std::string>& target) {
    if (is_blank(message))
        throw MeshError(ErrorCode::InvalidArgument, "message must not be empty");

    require_utf8(message, "message");

    std::optional<std::string> dest;
    if (target && !is_blank(*target)) dest = *target;
    if (dest) require_utf8(*dest, "target");

    connector.with_transport(spec, [&](TransportHandle& h) {
        require(h.client(), Capability::SendText);
        h.client().send_text(message, dest);
    });
    log::info("sent_text").kv("target", spec.describe()).kv("to", dest ? *dest : "broadcast");
}

void reboot(Connector& connector, const ConnectionSpec& spec) {
    connector.with_transport(spec, [&](TransportHandle& h) {
        require(h.client(), Capability::Reboot);
        h.client().reboot();
    });
    log::info("reboot_requested").kv("target", spec.describe());
}

void set_channel(Connector& connector, const ConnectionSpec& spec,
                 const std::string& channel_name) {
    if (is_blank(channel_name))
        throw MeshError(ErrorCode::InvalidArgument, "channel_name must not be empty");
    require_utf8(channel_name, "channel_name");

    connector.with_transport(spec, [&](TransportHandle& h) {
        require(h.client(), Capability::SetPrimaryChannel);
        h.client().set_primary_channel(channel_name);
    });
    log::info("channel_set").kv("target", spec.describe()).kv("name", channel_name);
}

} // namespace meshlink
