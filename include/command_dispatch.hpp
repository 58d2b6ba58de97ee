#pragma once
/**
 * @page ml-command-dispatch meshlink Service Dispatcher
 * @file command_dispatch.hpp
 * @brief Service name + JSON arguments -> registry lookup -> command call.
 *
 * @details
 * PURPOSE
 * -------
 * The dispatcher is the glue between callers that speak in service names
 * (the CLI, a future control socket) and the typed command functions in
 * commands.hpp. It exists so that:
 *   - argument validation for every service lives in one place;
 *   - selector resolution (`entry_id`) is applied the same way everywhere;
 *   - main.cpp never needs to know which command backs which service.
 *
 * SERVICES
 * --------
 *   name           arguments                                  result
 *   -------------  -----------------------------------------  -----------------------
 *   send_message   message (req), target (opt), entry_id (opt) {"status":"ok"}
 *   reboot         entry_id (opt)                              {"status":"ok"}
 *   set_channel    channel_name (req), entry_id (opt)          {"status":"ok"}
 *   refresh        entry_id (opt)                              {"entry_id", "generation"}
 *
 * Arguments must be a JSON object. A required argument that is missing or
 * not a string is InvalidArgument; so is an unknown service name. Command
 * failures (connection, capability, validation) propagate unchanged.
 *
 * PROCESS FLOW
 * ------------
 * 1. ConnectionRegistry::setup() runs install_services() once.
 * 2. Caller: registry.call("set_channel", {"channel_name": "ops"}).
 * 3. Dispatcher: name_to_kind("set_channel") -> ServiceKind::SetChannel.
 * 4. Dispatcher: resolve(entry_id) -> connection -> set_channel(connector, spec, "ops").
 *
 * EXTENDING
 * ---------
 * Add an enum entry, a name in name_to_kind(), and a case in dispatch_service().
 */

#include <nlohmann/json.hpp>

#include <string>

namespace meshlink {

class ConnectionRegistry;

enum class ServiceKind { SendMessage, Reboot, SetChannel, Refresh };

/// Service names, as registered and as accepted by the CLI.
constexpr const char* SERVICE_SEND_MESSAGE = "send_message";
constexpr const char* SERVICE_REBOOT       = "reboot";
constexpr const char* SERVICE_SET_CHANNEL  = "set_channel";
constexpr const char* SERVICE_REFRESH      = "refresh";

const char* service_name(ServiceKind kind);

/// False if @p name is not a known service.
bool name_to_kind(const std::string& name, ServiceKind& out);

/// Run one service. @throws MeshError
nlohmann::json dispatch_service(ConnectionRegistry& registry, ServiceKind kind,
                                const nlohmann::json& args);

/// Register every ServiceKind on @p registry.
void install_services(ConnectionRegistry& registry);

} // namespace meshlink
