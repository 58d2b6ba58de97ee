// -----------------------------------------------------------------------------
// Implementation for command_dispatch.hpp
//
// Argument extraction, selector resolution and the switch onto commands.cpp.
// See command_dispatch.hpp for the service table.
// -----------------------------------------------------------------------------

#include "command_dispatch.hpp"  // matching header: service enum and dispatcher API
#include "commands.hpp"          // send_message / reboot / set_channel

#include "meshlink/errors.hpp"
#include "meshlink/registry.hpp"

#include <optional>

namespace meshlink {

using json = nlohmann::json;

// ---------- argument helpers ----------

static std::string required_string(const json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_string())
        throw MeshError(ErrorCode::InvalidArgument, std::string(key) + ": required string");
    return it->get<std::string>();
}

static std::optional<std::string> optional_string(const json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) return std::nullopt;
    if (!it->is_string())
        throw MeshError(ErrorCode::InvalidArgument, std::string(key) + ": must be a string");
    std::string v = it->get<std::string>();
    if (v.empty()) return std::nullopt;
    return v;
}

static const json& object_args(const json& args) {
    static const json empty = json::object();
    if (args.is_null()) return empty;
    if (!args.is_object())
        throw MeshError(ErrorCode::InvalidArgument, "service arguments must be an object");
    return args;
}

// ---------- name table ----------

const char* service_name(ServiceKind kind) {
    switch (kind) {
        case ServiceKind::SendMessage: return SERVICE_SEND_MESSAGE;
        case ServiceKind::Reboot:      return SERVICE_REBOOT;
        case ServiceKind::SetChannel:  return SERVICE_SET_CHANNEL;
        case ServiceKind::Refresh:     return SERVICE_REFRESH;
    }
    return "unknown";
}

bool name_to_kind(const std::string& name, ServiceKind& out) {
    if (name == SERVICE_SEND_MESSAGE) { out = ServiceKind::SendMessage; return true; }
    if (name == SERVICE_REBOOT)       { out = ServiceKind::Reboot;      return true; }
    if (name == SERVICE_SET_CHANNEL)  { out = ServiceKind::SetChannel;  return true; }
    if (name == SERVICE_REFRESH)      { out = ServiceKind::Refresh;     return true; }
    return false;
}

// ---------- dispatch ----------

json dispatch_service(ConnectionRegistry& registry, ServiceKind kind, const json& raw) {
    const json& args = object_args(raw);
    const std::optional<std::string> entry = optional_string(args, "entry_id");
    const json ok = {{"status", "ok"}};

    switch (kind) {
        case ServiceKind::SendMessage: {
            const std::string message = required_string(args, "message");
            const std::optional<std::string> target = optional_string(args, "target");
            auto conn = registry.resolve(entry);
            send_message(registry.connector(), conn->spec, message, target);
            return ok;
        }
        case ServiceKind::Reboot: {
            auto conn = registry.resolve(entry);
            reboot(registry.connector(), conn->spec);
            return ok;
        }
        case ServiceKind::SetChannel: {
            const std::string name = required_string(args, "channel_name");
            auto conn = registry.resolve(entry);
            set_channel(registry.connector(), conn->spec, name);
            return ok;
        }
        case ServiceKind::Refresh: {
            auto conn = registry.resolve(entry);
            const uint64_t gen = conn->scheduler->request_refresh();
            return json{{"entry_id", conn->id}, {"generation", gen}};
        }
    }
    throw MeshError(ErrorCode::InvalidArgument, "unknown service");
}

void install_services(ConnectionRegistry& registry) {
    for (ServiceKind kind : {ServiceKind::SendMessage, ServiceKind::Reboot,
                             ServiceKind::SetChannel, ServiceKind::Refresh}) {
        registry.register_service(service_name(kind),
            [kind](ConnectionRegistry& r, const json& args) {
                return dispatch_service(r, kind, args);
            });
    }
}

} // namespace meshlink
